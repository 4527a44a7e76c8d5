// Copyright (c) 2024 The WeFi developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#define BOOST_TEST_MODULE WeFi Test Suite

#include <test/test_wefi.h>

#include <utiltime.h>

#include <boost/test/unit_test.hpp>

#include <cstring>

FastRandomContext insecure_rand_ctx(true);

uint160 InsecureRandAccount()
{
    uint160 account;
    do {
        uint256 r = InsecureRand256();
        memcpy(account.begin(), r.begin(), account.size());
    } while (account.IsNull());
    return account;
}

/** Starts and stops the secp256k1 signing context once for the whole run */
struct ECCGlobalSetup {
    ECCGlobalSetup() { ECC_Start(); }
    ~ECCGlobalSetup() { ECC_Stop(); }
};

BOOST_GLOBAL_FIXTURE(ECCGlobalSetup);

BasicTestingSetup::BasicTestingSetup()
{
    fPrintToDebugLog = false;
    fPrintToConsole = false;
    SetMockTime(0);
    gArgs.ClearArgs();
    wefi::SelectDistributionParams(wefi::NETWORK_REGTEST);
}

BasicTestingSetup::~BasicTestingSetup()
{
    SetMockTime(0);
    gArgs.ClearArgs();
    wefi::SelectDistributionParams(wefi::NETWORK_MAIN);
}

const int64_t DistributionTestingSetup::LAUNCH_TIME;

DistributionTestingSetup::DistributionTestingSetup()
    : nNextNonce(1)
{
    params = wefi::RegtestDistributionParams();
    params.nLaunchTime = LAUNCH_TIME;
    params.fAllowImmediateStart = false;

    verifierKey.MakeNewKey(true);
    verifier = verifierKey.GetPubKey().GetID();
    owner = InsecureRandAccount();

    SetTime(LAUNCH_TIME - 100);
    ResetLedger();
}

void DistributionTestingSetup::ResetLedger()
{
    ledger.reset();
    tokens.SetBalances({});
    BOOST_REQUIRE(tokens.Credit(params.distributor, params.nMiningCap + params.nReferralCap));
    access = std::make_unique<wefi::OwnerAccessControl>(owner);
    ledger = std::make_unique<wefi::DistributionLedger>(params, verifier, tokens, *access);
}

wefi::ClaimVoucher DistributionTestingSetup::MakeVoucher(wefi::PoolKind pool, const uint160& receiver, CAmount amount,
                                                         int64_t validUntil, uint64_t nonce) const
{
    wefi::ClaimVoucher voucher(pool, receiver, amount, validUntil, nonce);
    BOOST_REQUIRE(voucher.Sign(verifierKey, ledger->GetAuthorizer().GetDomainSeparator()));
    return voucher;
}

wefi::ClaimVoucher DistributionTestingSetup::MakeVoucher(wefi::PoolKind pool, const uint160& receiver, CAmount amount)
{
    return MakeVoucher(pool, receiver, amount, GetTime() + 3600, nNextNonce++);
}

wefi::ClaimResult DistributionTestingSetup::DoClaim(wefi::PoolKind pool, const uint160& receiver, CAmount amount)
{
    return ledger->Claim(receiver, MakeVoucher(pool, receiver, amount));
}
