// Copyright (c) 2024 The WeFi developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <distribution/distribution_ledger.h>
#include <test/test_wefi.h>

#include <boost/test/unit_test.hpp>

#include <stdexcept>

using namespace wefi;

namespace {

/** Token ledger that can be told to refuse or throw on transfers */
class FaultyTokenLedger : public TokenLedger
{
public:
    enum class Mode { OK, REFUSE, THROW };

    MemoryTokenLedger inner;
    Mode mode;

    FaultyTokenLedger() : mode(Mode::OK) {}

    CAmount GetBalance(const uint160& account) const override { return inner.GetBalance(account); }

    bool Transfer(const uint160& from, const uint160& to, CAmount amount) override
    {
        if (mode == Mode::REFUSE) {
            return false;
        }
        if (mode == Mode::THROW) {
            throw std::runtime_error("token backend unavailable");
        }
        return inner.Transfer(from, to, amount);
    }
};

/** Token ledger that calls back into the distribution ledger while transferring */
class ReentrantTokenLedger : public TokenLedger
{
public:
    MemoryTokenLedger inner;
    DistributionLedger* ledger;
    ClaimVoucher voucher;
    uint160 owner;
    std::vector<LedgerError> vErrors;

    ReentrantTokenLedger() : ledger(nullptr) {}

    CAmount GetBalance(const uint160& account) const override { return inner.GetBalance(account); }

    bool Transfer(const uint160& from, const uint160& to, CAmount amount) override
    {
        if (ledger) {
            vErrors.push_back(ledger->Claim(voucher.receiver, voucher).error);
            vErrors.push_back(ledger->StartMigration(owner, GetTime() + 1000).error);
            vErrors.push_back(ledger->SweepRemaining(owner, to).error);
        }
        return inner.Transfer(from, to, amount);
    }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(distribution_ledger_tests, DistributionTestingSetup)

BOOST_AUTO_TEST_CASE(claim_moves_tokens)
{
    uint160 alice = InsecureRandAccount();
    SetTime(LAUNCH_TIME + 10);

    BOOST_CHECK_EQUAL(ledger->GetUnlockedMining(), 80 * COIN);
    BOOST_CHECK_EQUAL(ledger->GetUnlockedReferral(), 50 * COIN);
    BOOST_CHECK_EQUAL(ledger->GetClaimable(PoolKind::MINING, GetTime()), 80 * COIN);

    ClaimVoucher voucher = MakeVoucher(PoolKind::MINING, alice, 30 * COIN);
    ClaimResult result = ledger->Claim(alice, voucher);
    BOOST_REQUIRE(result.success);
    BOOST_CHECK_EQUAL(result.error, LedgerError::NONE);
    BOOST_CHECK_EQUAL(result.amount, 30 * COIN);
    BOOST_CHECK(result.claimKey == ledger->GetAuthorizer().GetSigningHash(voucher));

    BOOST_CHECK_EQUAL(ledger->GetDistributed(PoolKind::MINING), 30 * COIN);
    BOOST_CHECK_EQUAL(ledger->GetDistributed(PoolKind::REFERRAL), 0);
    BOOST_CHECK_EQUAL(ledger->GetClaimable(PoolKind::MINING, GetTime()), 50 * COIN);
    BOOST_CHECK_EQUAL(tokens.GetBalance(alice), 30 * COIN);
    BOOST_CHECK_EQUAL(tokens.GetBalance(params.distributor), params.nMiningCap + params.nReferralCap - 30 * COIN);

    BOOST_CHECK(ledger->IsClaimed(result.claimKey));
    BOOST_CHECK_EQUAL(ledger->GetClaimCount(), 1U);
    std::optional<ClaimRecord> record = ledger->GetClaimRecord(result.claimKey);
    BOOST_REQUIRE(record);
    BOOST_CHECK(record->receiver == alice);
    BOOST_CHECK(record->claimant == alice);
    BOOST_CHECK_EQUAL(record->amount, 30 * COIN);
    BOOST_CHECK_EQUAL(record->pool, PoolKind::MINING);
    BOOST_CHECK_EQUAL(record->timestamp, LAUNCH_TIME + 10);
    BOOST_CHECK_EQUAL(record->nonce, voucher.nonce);

    BOOST_CHECK(!ledger->GetClaimRecord(InsecureRand256()));
}

BOOST_AUTO_TEST_CASE(referral_pool_vests_linearly)
{
    uint160 alice = InsecureRandAccount();
    SetTime(LAUNCH_TIME + 1000);

    BOOST_CHECK_EQUAL(ledger->GetUnlockedReferral(), 5000 * COIN);
    BOOST_CHECK(DoClaim(PoolKind::REFERRAL, alice, 5000 * COIN).success);
    BOOST_CHECK_EQUAL(ledger->GetDistributed(PoolKind::REFERRAL), 5000 * COIN);
    BOOST_CHECK_EQUAL(ledger->GetDistributed(PoolKind::MINING), 0);
    BOOST_CHECK_EQUAL(DoClaim(PoolKind::REFERRAL, alice, 1).error, LedgerError::NO_REWARDS_AVAILABLE);

    // Mining is accounted separately
    BOOST_CHECK(DoClaim(PoolKind::MINING, alice, 8000 * COIN).success);
    BOOST_CHECK_EQUAL(tokens.GetBalance(alice), 13000 * COIN);
}

BOOST_AUTO_TEST_CASE(relayed_claim_pays_receiver)
{
    uint160 alice = InsecureRandAccount();
    uint160 relayer = InsecureRandAccount();
    SetTime(LAUNCH_TIME + 10);

    ClaimVoucher voucher = MakeVoucher(PoolKind::MINING, alice, 10 * COIN);
    ClaimResult result = ledger->Claim(relayer, voucher);
    BOOST_REQUIRE(result.success);
    BOOST_CHECK_EQUAL(tokens.GetBalance(alice), 10 * COIN);
    BOOST_CHECK_EQUAL(tokens.GetBalance(relayer), 0);
    BOOST_CHECK(ledger->GetClaimRecord(result.claimKey)->claimant == relayer);

    // Replaying through the receiver does not pay twice
    BOOST_CHECK_EQUAL(ledger->Claim(alice, voucher).error, LedgerError::CLAIM_ALREADY_EXISTS);
    BOOST_CHECK_EQUAL(tokens.GetBalance(alice), 10 * COIN);
}

BOOST_AUTO_TEST_CASE(claim_from_fields)
{
    uint160 alice = InsecureRandAccount();
    SetTime(LAUNCH_TIME + 10);

    ClaimVoucher voucher = MakeVoucher(PoolKind::REFERRAL, alice, 20 * COIN);
    ClaimResult result = ledger->Claim(alice, voucher.pool, voucher.receiver, voucher.amount,
                                       voucher.validUntil, voucher.nonce, voucher.vchSig);
    BOOST_CHECK(result.success);
    BOOST_CHECK_EQUAL(ledger->GetDistributed(PoolKind::REFERRAL), 20 * COIN);
}

BOOST_AUTO_TEST_CASE(replay_rejected)
{
    uint160 alice = InsecureRandAccount();
    SetTime(LAUNCH_TIME + 10);

    ClaimVoucher voucher = MakeVoucher(PoolKind::MINING, alice, 10 * COIN);
    BOOST_CHECK(ledger->Claim(alice, voucher).success);

    ClaimResult replay = ledger->Claim(alice, voucher);
    BOOST_CHECK(!replay.success);
    BOOST_CHECK_EQUAL(replay.error, LedgerError::CLAIM_ALREADY_EXISTS);
    BOOST_CHECK_EQUAL(ledger->GetDistributed(PoolKind::MINING), 10 * COIN);

    // Same fields with a fresh nonce is a different authorization
    ClaimVoucher again = MakeVoucher(PoolKind::MINING, alice, 10 * COIN, voucher.validUntil, voucher.nonce + 1000);
    BOOST_CHECK(ledger->Claim(alice, again).success);
    BOOST_CHECK_EQUAL(ledger->GetDistributed(PoolKind::MINING), 20 * COIN);
}

BOOST_AUTO_TEST_CASE(request_shape_rejections)
{
    uint160 alice = InsecureRandAccount();
    SetTime(LAUNCH_TIME + 10);

    BOOST_CHECK_EQUAL(DoClaim(static_cast<PoolKind>(2), alice, COIN).error, LedgerError::INVALID_POOL);
    BOOST_CHECK_EQUAL(DoClaim(PoolKind::MINING, alice, 0).error, LedgerError::INVALID_AMOUNT);
    BOOST_CHECK_EQUAL(DoClaim(PoolKind::MINING, alice, -COIN).error, LedgerError::INVALID_AMOUNT);
    BOOST_CHECK_EQUAL(DoClaim(PoolKind::MINING, uint160(), COIN).error, LedgerError::INVALID_RECEIVER);

    BOOST_CHECK_EQUAL(ledger->GetClaimCount(), 0U);
}

BOOST_AUTO_TEST_CASE(paused_rejects_everything)
{
    uint160 alice = InsecureRandAccount();
    SetTime(LAUNCH_TIME + 10);

    BOOST_REQUIRE(access->Pause(owner).success);
    BOOST_CHECK_EQUAL(DoClaim(PoolKind::MINING, alice, COIN).error, LedgerError::PAUSED);
    // Pause is checked before the request is inspected
    BOOST_CHECK_EQUAL(DoClaim(static_cast<PoolKind>(9), uint160(), 0).error, LedgerError::PAUSED);

    BOOST_REQUIRE(access->Unpause(owner).success);
    BOOST_CHECK(DoClaim(PoolKind::MINING, alice, COIN).success);
}

BOOST_AUTO_TEST_CASE(expiry)
{
    uint160 alice = InsecureRandAccount();
    const int64_t nNow = LAUNCH_TIME + 10;
    SetTime(nNow);

    ClaimVoucher expired = MakeVoucher(PoolKind::MINING, alice, COIN, nNow - 1, 1);
    BOOST_CHECK_EQUAL(ledger->Claim(alice, expired).error, LedgerError::CLAIM_EXPIRED);

    ClaimVoucher lastSecond = MakeVoucher(PoolKind::MINING, alice, COIN, nNow, 2);
    BOOST_CHECK(ledger->Claim(alice, lastSecond).success);
}

BOOST_AUTO_TEST_CASE(insufficient_distributor_balance)
{
    uint160 alice = InsecureRandAccount();
    SetTime(LAUNCH_TIME + 10);

    tokens.SetBalances({{params.distributor, 5 * COIN}});
    BOOST_CHECK_EQUAL(DoClaim(PoolKind::MINING, alice, 6 * COIN).error, LedgerError::INSUFFICIENT_BALANCE);
    BOOST_CHECK(DoClaim(PoolKind::MINING, alice, 5 * COIN).success);
    BOOST_CHECK_EQUAL(tokens.GetBalance(params.distributor), 0);
}

BOOST_AUTO_TEST_CASE(signature_rejections)
{
    uint160 alice = InsecureRandAccount();
    SetTime(LAUNCH_TIME + 10);

    CKey other;
    other.MakeNewKey(true);
    ClaimVoucher voucher(PoolKind::MINING, alice, COIN, GetTime() + 60, 77);
    BOOST_REQUIRE(voucher.Sign(other, ledger->GetAuthorizer().GetDomainSeparator()));

    ClaimResult result = ledger->Claim(alice, voucher);
    BOOST_CHECK_EQUAL(result.error, LedgerError::INVALID_SIGNATURE);
    BOOST_CHECK(result.errorMessage.find("UNAUTHORIZED") != std::string::npos);

    voucher.vchSig.clear();
    result = ledger->Claim(alice, voucher);
    BOOST_CHECK_EQUAL(result.error, LedgerError::INVALID_SIGNATURE);
    BOOST_CHECK(result.errorMessage.find("BAD_SIGNATURE") != std::string::npos);

    // Signed for a different chain
    ClaimVoucher foreign(PoolKind::MINING, alice, COIN, GetTime() + 60, 78);
    BOOST_REQUIRE(foreign.Sign(verifierKey, GetClaimDomainSeparator(params.nChainId + 1, params.distributor)));
    BOOST_CHECK_EQUAL(ledger->Claim(alice, foreign).error, LedgerError::INVALID_SIGNATURE);

    BOOST_CHECK_EQUAL(ledger->GetClaimCount(), 0U);
}

BOOST_AUTO_TEST_CASE(not_started)
{
    uint160 alice = InsecureRandAccount();

    BOOST_CHECK_EQUAL(DoClaim(PoolKind::MINING, alice, COIN).error, LedgerError::DISTRIBUTION_NOT_STARTED);
    SetTime(LAUNCH_TIME);
    BOOST_CHECK_EQUAL(DoClaim(PoolKind::REFERRAL, alice, COIN).error, LedgerError::DISTRIBUTION_NOT_STARTED);
    BOOST_CHECK_EQUAL(ledger->GetUnlockedMining(), 0);

    SetTime(LAUNCH_TIME + 1);
    BOOST_CHECK(DoClaim(PoolKind::MINING, alice, 8 * COIN).success);
}

BOOST_AUTO_TEST_CASE(claimable_limits)
{
    uint160 alice = InsecureRandAccount();
    SetTime(LAUNCH_TIME + 10);

    ClaimResult result = DoClaim(PoolKind::MINING, alice, 80 * COIN + 1);
    BOOST_CHECK_EQUAL(result.error, LedgerError::EXCEEDS_CLAIMABLE_REWARDS);
    BOOST_CHECK_EQUAL(ledger->GetDistributed(PoolKind::MINING), 0);
    BOOST_CHECK_EQUAL(tokens.GetBalance(alice), 0);

    BOOST_CHECK(DoClaim(PoolKind::MINING, alice, 80 * COIN).success);
    BOOST_CHECK_EQUAL(DoClaim(PoolKind::MINING, alice, 1).error, LedgerError::NO_REWARDS_AVAILABLE);
    BOOST_CHECK_EQUAL(ledger->GetClaimable(PoolKind::MINING, GetTime()), 0);

    SetTime(LAUNCH_TIME + 11);
    BOOST_CHECK_EQUAL(DoClaim(PoolKind::MINING, alice, 9 * COIN).error, LedgerError::EXCEEDS_CLAIMABLE_REWARDS);
    BOOST_CHECK(DoClaim(PoolKind::MINING, alice, 8 * COIN).success);
}

BOOST_AUTO_TEST_CASE(pool_cap_below_schedule)
{
    params.nMiningCap = 100 * COIN;
    ResetLedger();
    uint160 alice = InsecureRandAccount();
    SetTime(LAUNCH_TIME + 1000);

    BOOST_CHECK_EQUAL(DoClaim(PoolKind::MINING, alice, 101 * COIN).error, LedgerError::EXCEEDS_POOL_CAP);
    BOOST_CHECK(DoClaim(PoolKind::MINING, alice, 100 * COIN).success);
    BOOST_CHECK_EQUAL(DoClaim(PoolKind::MINING, alice, 1).error, LedgerError::EXCEEDS_POOL_CAP);
    BOOST_CHECK_EQUAL(ledger->GetPoolState(PoolKind::MINING, GetTime()), PoolState::DRAINED);
}

BOOST_AUTO_TEST_CASE(distributed_never_exceeds_unlocked)
{
    FastRandomContext rand_ctx(true);
    std::vector<uint160> accounts;
    for (int i = 0; i < 5; i++) {
        accounts.push_back(InsecureRandAccount());
    }

    int64_t nNow = LAUNCH_TIME;
    for (int i = 0; i < 300; i++) {
        nNow += rand_ctx.randrange(20);
        SetTime(nNow);
        PoolKind pool = rand_ctx.randbool() ? PoolKind::MINING : PoolKind::REFERRAL;
        CAmount amount = 1 + rand_ctx.randrange(100 * COIN);
        ClaimResult result = DoClaim(pool, accounts[rand_ctx.randrange(accounts.size())], amount);

        if (result.success) {
            BOOST_CHECK_EQUAL(result.amount, amount);
        } else {
            BOOST_CHECK(result.error == LedgerError::EXCEEDS_CLAIMABLE_REWARDS ||
                        result.error == LedgerError::NO_REWARDS_AVAILABLE ||
                        result.error == LedgerError::DISTRIBUTION_NOT_STARTED);
        }

        for (PoolKind p : {PoolKind::MINING, PoolKind::REFERRAL}) {
            BOOST_CHECK(ledger->GetDistributed(p) <= ledger->GetUnlocked(p, nNow));
            BOOST_CHECK(ledger->GetUnlocked(p, nNow) <= ledger->GetCap(p));
        }
    }

    CAmount nClaimed = 0;
    for (const auto& entry : ledger->GetSnapshot().claims) {
        nClaimed += entry.second.amount;
    }
    CAmount nReceived = 0;
    for (const uint160& account : accounts) {
        nReceived += tokens.GetBalance(account);
    }
    BOOST_CHECK_EQUAL(nClaimed, ledger->GetDistributed(PoolKind::MINING) + ledger->GetDistributed(PoolKind::REFERRAL));
    BOOST_CHECK_EQUAL(nReceived, nClaimed);
    BOOST_CHECK_EQUAL(tokens.GetTotalSupply(), params.nMiningCap + params.nReferralCap);
}

BOOST_AUTO_TEST_CASE(rejection_leaves_state_untouched)
{
    uint160 alice = InsecureRandAccount();
    SetTime(LAUNCH_TIME + 10);
    BOOST_REQUIRE(DoClaim(PoolKind::MINING, alice, 10 * COIN).success);

    const uint256 hashBefore = ledger->GetSnapshot().GetHash();
    const std::map<uint160, CAmount> balancesBefore = tokens.GetBalances();

    BOOST_CHECK(!DoClaim(PoolKind::MINING, alice, 1000 * COIN).success);
    BOOST_CHECK(!DoClaim(PoolKind::REFERRAL, uint160(), COIN).success);
    BOOST_CHECK(!ledger->Claim(alice, MakeVoucher(PoolKind::MINING, alice, COIN, GetTime() - 1, 999)).success);

    BOOST_CHECK(ledger->GetSnapshot().GetHash() == hashBefore);
    BOOST_CHECK(tokens.GetBalances() == balancesBefore);
}

BOOST_AUTO_TEST_CASE(failed_transfer_rolls_back)
{
    FaultyTokenLedger faulty;
    BOOST_REQUIRE(faulty.inner.Credit(params.distributor, params.nMiningCap + params.nReferralCap));
    DistributionLedger local(params, verifier, faulty, *access);
    uint160 alice = InsecureRandAccount();
    SetTime(LAUNCH_TIME + 10);

    const uint256 hashBefore = local.GetSnapshot().GetHash();

    faulty.mode = FaultyTokenLedger::Mode::REFUSE;
    ClaimVoucher voucher = MakeVoucher(PoolKind::MINING, alice, 10 * COIN);
    ClaimResult result = local.Claim(alice, voucher);
    BOOST_CHECK_EQUAL(result.error, LedgerError::TRANSFER_FAILED);
    BOOST_CHECK(local.GetSnapshot().GetHash() == hashBefore);
    BOOST_CHECK(local.GetClaimsForReceiver(alice).empty());

    faulty.mode = FaultyTokenLedger::Mode::THROW;
    BOOST_CHECK_EQUAL(local.Claim(alice, voucher).error, LedgerError::TRANSFER_FAILED);
    BOOST_CHECK(local.GetSnapshot().GetHash() == hashBefore);

    // The same voucher goes through once the backend recovers
    faulty.mode = FaultyTokenLedger::Mode::OK;
    BOOST_CHECK(local.Claim(alice, voucher).success);
    BOOST_CHECK_EQUAL(faulty.GetBalance(alice), 10 * COIN);
}

BOOST_AUTO_TEST_CASE(reentrant_calls_rejected)
{
    ReentrantTokenLedger reentrant;
    BOOST_REQUIRE(reentrant.inner.Credit(params.distributor, params.nMiningCap + params.nReferralCap));
    DistributionLedger local(params, verifier, reentrant, *access);
    uint160 alice = InsecureRandAccount();
    SetTime(LAUNCH_TIME + 10);

    reentrant.ledger = &local;
    reentrant.owner = owner;
    reentrant.voucher = MakeVoucher(PoolKind::MINING, alice, 5 * COIN);

    ClaimResult result = local.Claim(alice, MakeVoucher(PoolKind::MINING, alice, 10 * COIN));
    BOOST_CHECK(result.success);
    BOOST_REQUIRE_EQUAL(reentrant.vErrors.size(), 3U);
    for (LedgerError err : reentrant.vErrors) {
        BOOST_CHECK_EQUAL(err, LedgerError::REENTRANT_CALL);
    }

    BOOST_CHECK_EQUAL(local.GetDistributed(PoolKind::MINING), 10 * COIN);
    BOOST_CHECK_EQUAL(local.GetClaimCount(), 1U);
    BOOST_CHECK(!local.GetMigrationLock().IsActive());
}

BOOST_AUTO_TEST_CASE(claim_events)
{
    uint160 alice = InsecureRandAccount();
    uint160 relayer = InsecureRandAccount();
    SetTime(LAUNCH_TIME + 10);

    std::vector<ClaimEvent> events;
    std::vector<LedgerError> nested;
    ledger->RegisterClaimEventCallback([&events](const ClaimEvent& event) {
        events.push_back(event);
    });
    ledger->RegisterClaimEventCallback([](const ClaimEvent&) {
        throw std::runtime_error("listener failure");
    });
    ledger->RegisterClaimEventCallback([this, &nested, alice](const ClaimEvent&) {
        nested.push_back(ledger->Claim(alice, MakeVoucher(PoolKind::MINING, alice, COIN, GetTime() + 60, 4242)).error);
    });

    ClaimResult result = ledger->Claim(relayer, MakeVoucher(PoolKind::MINING, alice, 10 * COIN));
    BOOST_REQUIRE(result.success);
    BOOST_REQUIRE_EQUAL(events.size(), 1U);
    BOOST_CHECK(events[0].claimKey == result.claimKey);
    BOOST_CHECK(events[0].receiver == alice);
    BOOST_CHECK(events[0].claimant == relayer);
    BOOST_CHECK_EQUAL(events[0].amount, 10 * COIN);
    BOOST_CHECK_EQUAL(events[0].pool, PoolKind::MINING);

    BOOST_REQUIRE_EQUAL(nested.size(), 1U);
    BOOST_CHECK_EQUAL(nested[0], LedgerError::REENTRANT_CALL);

    // Rejected claims emit nothing
    BOOST_CHECK(!DoClaim(PoolKind::MINING, alice, 1000 * COIN).success);
    BOOST_CHECK_EQUAL(events.size(), 1U);
}

BOOST_AUTO_TEST_CASE(receiver_index)
{
    uint160 alice = InsecureRandAccount();
    uint160 bob = InsecureRandAccount();
    SetTime(LAUNCH_TIME + 100);

    ClaimResult first = DoClaim(PoolKind::MINING, alice, 3 * COIN);
    ClaimResult second = DoClaim(PoolKind::MINING, bob, 4 * COIN);
    SetTime(LAUNCH_TIME + 101);
    ClaimResult third = DoClaim(PoolKind::REFERRAL, alice, 5 * COIN);
    BOOST_REQUIRE(first.success && second.success && third.success);

    std::vector<ClaimRecord> aliceClaims = ledger->GetClaimsForReceiver(alice);
    BOOST_REQUIRE_EQUAL(aliceClaims.size(), 2U);
    BOOST_CHECK(aliceClaims[0].claimKey == first.claimKey);
    BOOST_CHECK(aliceClaims[1].claimKey == third.claimKey);
    BOOST_CHECK_EQUAL(ledger->GetClaimsForReceiver(bob).size(), 1U);
    BOOST_CHECK(ledger->GetClaimsForReceiver(InsecureRandAccount()).empty());
}

BOOST_AUTO_TEST_CASE(pool_states)
{
    BOOST_CHECK_EQUAL(ledger->GetPoolState(PoolKind::MINING, GetTime()), PoolState::BEFORE_LAUNCH);
    BOOST_CHECK_EQUAL(ledger->GetPoolState(PoolKind::MINING, LAUNCH_TIME), PoolState::BEFORE_LAUNCH);
    BOOST_CHECK_EQUAL(ledger->GetPoolState(PoolKind::MINING, LAUNCH_TIME + 1), PoolState::ACCRUING);

    SetTime(LAUNCH_TIME + 2000);
    uint160 alice = InsecureRandAccount();
    BOOST_CHECK(DoClaim(PoolKind::REFERRAL, alice, params.nReferralCap).success);
    BOOST_CHECK_EQUAL(ledger->GetPoolState(PoolKind::REFERRAL, GetTime()), PoolState::DRAINED);
    BOOST_CHECK_EQUAL(ledger->GetPoolState(PoolKind::MINING, GetTime()), PoolState::ACCRUING);

    BOOST_REQUIRE(ledger->StartMigration(owner, GetTime() + params.nMigrationGracePeriod).success);
    BOOST_CHECK_EQUAL(ledger->GetPoolState(PoolKind::MINING, GetTime()), PoolState::MIGRATION_LOCKED);
    BOOST_CHECK_EQUAL(ledger->GetPoolState(PoolKind::REFERRAL, GetTime()), PoolState::DRAINED);
}

BOOST_AUTO_TEST_CASE(invalid_pool_queries)
{
    PoolKind bad = static_cast<PoolKind>(5);
    BOOST_CHECK_EQUAL(ledger->GetCap(bad), 0);
    BOOST_CHECK_EQUAL(ledger->GetDistributed(bad), 0);
    BOOST_CHECK_EQUAL(ledger->GetUnlocked(bad, LAUNCH_TIME + 10), 0);
    BOOST_CHECK_EQUAL(ledger->GetClaimable(bad, LAUNCH_TIME + 10), 0);
    BOOST_CHECK_EQUAL(ledger->GetCap(PoolKind::MINING), params.nMiningCap);
    BOOST_CHECK_EQUAL(ledger->GetCap(PoolKind::REFERRAL), params.nReferralCap);
}

BOOST_AUTO_TEST_CASE(constructor_rejections)
{
    const int64_t nNow = LAUNCH_TIME - 100;

    DistributionParams past = params;
    past.nLaunchTime = nNow;
    BOOST_CHECK_THROW(DistributionLedger bad(past, verifier, tokens, *access, nNow), std::runtime_error);
    past.fAllowImmediateStart = true;
    BOOST_CHECK_NO_THROW(DistributionLedger ok(past, verifier, tokens, *access, nNow));

    DistributionParams noDistributor = params;
    noDistributor.distributor.SetNull();
    BOOST_CHECK_THROW(DistributionLedger bad(noDistributor, verifier, tokens, *access, nNow), std::runtime_error);

    DistributionParams badCap = params;
    badCap.nReferralCap = -1;
    BOOST_CHECK_THROW(DistributionLedger bad(badCap, verifier, tokens, *access, nNow), std::runtime_error);
    badCap.nReferralCap = MAX_MONEY + 1;
    BOOST_CHECK_THROW(DistributionLedger bad(badCap, verifier, tokens, *access, nNow), std::runtime_error);

    DistributionParams badGrace = params;
    badGrace.nMigrationGracePeriod = -1;
    BOOST_CHECK_THROW(DistributionLedger bad(badGrace, verifier, tokens, *access, nNow), std::runtime_error);

    DistributionParams badSchedule = params;
    badSchedule.vEmissionSchedule.clear();
    BOOST_CHECK_THROW(DistributionLedger bad(badSchedule, verifier, tokens, *access, nNow), std::runtime_error);

    DistributionParams badVesting = params;
    badVesting.nVestingDuration = 0;
    BOOST_CHECK_THROW(DistributionLedger bad(badVesting, verifier, tokens, *access, nNow), std::runtime_error);

    BOOST_CHECK_THROW(DistributionLedger bad(params, CKeyID(), tokens, *access, nNow), std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END()
