// Copyright (c) 2024 The WeFi developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <distribution/vesting_curve.h>
#include <distribution/distribution_params.h>
#include <test/test_wefi.h>

#include <boost/test/unit_test.hpp>

#include <limits>
#include <stdexcept>

using namespace wefi;

BOOST_FIXTURE_TEST_SUITE(vesting_curve_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(mainnet_half_duration)
{
    DistributionParams params = MainDistributionParams();
    VestingCurve curve(params.nReferralCap, params.nVestingDuration);

    BOOST_CHECK_EQUAL(curve.Unlocked(params.nVestingDuration / 2), params.nReferralCap / 2);
    BOOST_CHECK_EQUAL(curve.Unlocked(params.nVestingDuration / 2), 100000000 * COIN);
}

BOOST_AUTO_TEST_CASE(bounds)
{
    VestingCurve curve(10000 * COIN, 2000);

    BOOST_CHECK_EQUAL(curve.Unlocked(std::numeric_limits<int64_t>::min()), 0);
    BOOST_CHECK_EQUAL(curve.Unlocked(-1), 0);
    BOOST_CHECK_EQUAL(curve.Unlocked(0), 0);
    BOOST_CHECK_EQUAL(curve.Unlocked(1), 5 * COIN);
    BOOST_CHECK_EQUAL(curve.Unlocked(1999), 9995 * COIN);
    BOOST_CHECK_EQUAL(curve.Unlocked(2000), 10000 * COIN);
    BOOST_CHECK_EQUAL(curve.Unlocked(std::numeric_limits<int64_t>::max()), 10000 * COIN);
}

BOOST_AUTO_TEST_CASE(truncates_toward_zero)
{
    VestingCurve curve(10, 3);

    BOOST_CHECK_EQUAL(curve.Unlocked(1), 3);
    BOOST_CHECK_EQUAL(curve.Unlocked(2), 6);
    BOOST_CHECK_EQUAL(curve.Unlocked(3), 10);
}

BOOST_AUTO_TEST_CASE(wide_intermediate_product)
{
    // MAX_MONEY * duration does not fit in 64 bits
    const int64_t nDuration = 730 * 24 * 60 * 60;
    VestingCurve curve(MAX_MONEY, nDuration);

    BOOST_CHECK_EQUAL(curve.Unlocked(nDuration / 2), MAX_MONEY / 2);
    BOOST_CHECK_EQUAL(curve.Unlocked(nDuration - 1), MAX_MONEY - (MAX_MONEY + nDuration - 1) / nDuration);
    BOOST_CHECK_EQUAL(curve.Unlocked(nDuration / 3), 66666666666666666LL);

    VestingCurve longest(MAX_MONEY, MAX_VESTING_DURATION);
    BOOST_CHECK_EQUAL(longest.Unlocked(MAX_VESTING_DURATION / 2), MAX_MONEY / 2);
    BOOST_CHECK_EQUAL(longest.Unlocked(MAX_VESTING_DURATION - 1),
        MAX_MONEY - (MAX_MONEY + MAX_VESTING_DURATION - 1) / MAX_VESTING_DURATION);
}

BOOST_AUTO_TEST_CASE(monotonic_and_bounded)
{
    DistributionParams params = MainDistributionParams();
    VestingCurve curve(params.nReferralCap, params.nVestingDuration);
    FastRandomContext rand_ctx(true);

    for (int i = 0; i < 1000; i++) {
        int64_t t1 = rand_ctx.randrange(2 * params.nVestingDuration);
        int64_t t2 = t1 + rand_ctx.randrange(params.nVestingDuration);
        BOOST_CHECK(curve.Unlocked(t1) <= curve.Unlocked(t2));
        BOOST_CHECK(curve.Unlocked(t2) <= params.nReferralCap);
    }
}

BOOST_AUTO_TEST_CASE(constructor_rejects_bad_parameters)
{
    BOOST_CHECK_THROW(VestingCurve curve(-1, 100), std::runtime_error);
    BOOST_CHECK_THROW(VestingCurve curve(COIN, 0), std::runtime_error);
    BOOST_CHECK_THROW(VestingCurve curve(COIN, -1), std::runtime_error);
    BOOST_CHECK_THROW(VestingCurve curve(COIN, MAX_VESTING_DURATION + 1), std::runtime_error);

    VestingCurve empty(0, 100);
    BOOST_CHECK_EQUAL(empty.Unlocked(50), 0);
    BOOST_CHECK_EQUAL(empty.Unlocked(100), 0);
}

BOOST_AUTO_TEST_SUITE_END()
