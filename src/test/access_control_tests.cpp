// Copyright (c) 2024 The WeFi developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <distribution/access_control.h>
#include <test/test_wefi.h>

#include <boost/test/unit_test.hpp>

#include <stdexcept>

using namespace wefi;

BOOST_FIXTURE_TEST_SUITE(access_control_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(pause_and_unpause)
{
    uint160 owner = InsecureRandAccount();
    uint160 stranger = InsecureRandAccount();
    OwnerAccessControl access(owner);

    BOOST_CHECK(access.IsOwner(owner));
    BOOST_CHECK(!access.IsOwner(stranger));
    BOOST_CHECK(!access.IsOwner(uint160()));
    BOOST_CHECK(!access.IsPaused());

    LedgerResult result = access.Pause(stranger);
    BOOST_CHECK(!result.success);
    BOOST_CHECK_EQUAL(result.error, LedgerError::NOT_OWNER);
    BOOST_CHECK(!access.IsPaused());

    BOOST_CHECK(access.Pause(owner).success);
    BOOST_CHECK(access.IsPaused());
    // Pausing twice is harmless
    BOOST_CHECK(access.Pause(owner).success);

    BOOST_CHECK_EQUAL(access.Unpause(stranger).error, LedgerError::NOT_OWNER);
    BOOST_CHECK(access.IsPaused());
    BOOST_CHECK(access.Unpause(owner).success);
    BOOST_CHECK(!access.IsPaused());
}

BOOST_AUTO_TEST_CASE(transfer_ownership)
{
    uint160 owner = InsecureRandAccount();
    uint160 next = InsecureRandAccount();
    OwnerAccessControl access(owner, true);
    BOOST_CHECK(access.IsPaused());

    BOOST_CHECK_EQUAL(access.TransferOwnership(next, next).error, LedgerError::NOT_OWNER);
    BOOST_CHECK_EQUAL(access.TransferOwnership(owner, uint160()).error, LedgerError::INVALID_RECEIVER);
    BOOST_CHECK(access.GetOwner() == owner);

    BOOST_CHECK(access.TransferOwnership(owner, next).success);
    BOOST_CHECK(access.GetOwner() == next);
    BOOST_CHECK(!access.IsOwner(owner));
    BOOST_CHECK_EQUAL(access.Unpause(owner).error, LedgerError::NOT_OWNER);
    BOOST_CHECK(access.Unpause(next).success);
}

BOOST_AUTO_TEST_CASE(null_owner_rejected)
{
    BOOST_CHECK_THROW(OwnerAccessControl access(uint160()), std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END()
