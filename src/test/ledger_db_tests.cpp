// Copyright (c) 2024 The WeFi developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <distribution/ledger_db.h>
#include <test/test_wefi.h>

#include <boost/test/unit_test.hpp>

using namespace wefi;

namespace {

struct LedgerDBTestingSetup : public DistributionTestingSetup {
    fs::path testDir;

    LedgerDBTestingSetup()
    {
        testDir = fs::temp_directory_path() / fs::unique_path("ledgerdb_test_%%%%-%%%%");
        fs::create_directories(testDir);
    }

    ~LedgerDBTestingSetup()
    {
        fs::remove_all(testDir);
    }

    fs::path DBPath() const { return testDir / "ledger"; }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(ledger_db_tests, LedgerDBTestingSetup)

BOOST_AUTO_TEST_CASE(empty_database)
{
    LedgerDB db(DBPath());

    BOOST_CHECK(!db.HasDeployment());
    DeploymentRecord deployment;
    BOOST_CHECK(!db.ReadDeployment(deployment));
    LedgerSnapshot snapshot;
    BOOST_CHECK(!db.ReadSnapshot(snapshot));
    AccessRecord accessRecord;
    BOOST_CHECK(!db.ReadAccess(accessRecord));

    std::map<uint160, CAmount> balances;
    BOOST_CHECK(db.ReadBalances(balances));
    BOOST_CHECK(balances.empty());
}

BOOST_AUTO_TEST_CASE(deployment_round_trip)
{
    DeploymentRecord deployment;
    deployment.strNetworkID = params.strNetworkID;
    deployment.nChainId = params.nChainId;
    deployment.nLaunchTime = params.nLaunchTime;
    deployment.nMigrationGracePeriod = params.nMigrationGracePeriod;
    deployment.verifier = verifier;
    deployment.owner = owner;
    deployment.nCreateTime = GetTime();

    {
        LedgerDB db(DBPath());
        BOOST_CHECK(db.WriteDeployment(deployment));
        BOOST_CHECK(db.HasDeployment());
    }

    LedgerDB db(DBPath());
    DeploymentRecord read;
    BOOST_REQUIRE(db.ReadDeployment(read));
    BOOST_CHECK_EQUAL(read.strNetworkID, "regtest");
    BOOST_CHECK_EQUAL(read.nChainId, params.nChainId);
    BOOST_CHECK_EQUAL(read.nLaunchTime, LAUNCH_TIME);
    BOOST_CHECK_EQUAL(read.nMigrationGracePeriod, params.nMigrationGracePeriod);
    BOOST_CHECK(read.verifier == verifier);
    BOOST_CHECK(read.owner == owner);
    BOOST_CHECK_EQUAL(read.nCreateTime, LAUNCH_TIME - 100);
}

BOOST_AUTO_TEST_CASE(state_survives_reopen)
{
    uint160 alice = InsecureRandAccount();
    uint160 bob = InsecureRandAccount();
    SetTime(LAUNCH_TIME + 100);
    BOOST_REQUIRE(DoClaim(PoolKind::MINING, alice, 100 * COIN).success);
    BOOST_REQUIRE(DoClaim(PoolKind::REFERRAL, bob, 50 * COIN).success);
    BOOST_REQUIRE(ledger->StartMigration(owner, GetTime() + 500).success);
    BOOST_REQUIRE(access->Pause(owner).success);

    const LedgerSnapshot snapshot = ledger->GetSnapshot();
    {
        LedgerDB db(DBPath());
        BOOST_CHECK(db.WriteState(snapshot, tokens.GetBalances(), AccessRecord(access->GetOwner(), access->IsPaused())));
    }

    LedgerDB db(DBPath());
    LedgerSnapshot read;
    BOOST_REQUIRE(db.ReadSnapshot(read));
    BOOST_CHECK(read == snapshot);
    BOOST_CHECK(read.GetHash() == snapshot.GetHash());
    BOOST_CHECK(read.migration.IsActive());

    std::map<uint160, CAmount> balances;
    BOOST_REQUIRE(db.ReadBalances(balances));
    BOOST_CHECK(balances == tokens.GetBalances());
    BOOST_CHECK_EQUAL(balances[alice], 100 * COIN);

    AccessRecord accessRecord;
    BOOST_REQUIRE(db.ReadAccess(accessRecord));
    BOOST_CHECK(accessRecord.owner == owner);
    BOOST_CHECK(accessRecord.fPaused);
}

BOOST_AUTO_TEST_CASE(stale_balances_erased)
{
    uint160 alice = InsecureRandAccount();
    uint160 bob = InsecureRandAccount();
    LedgerDB db(DBPath());

    std::map<uint160, CAmount> first;
    first[alice] = 5 * COIN;
    first[bob] = 7 * COIN;
    BOOST_REQUIRE(db.WriteState(LedgerSnapshot(), first, AccessRecord(owner, false)));

    std::map<uint160, CAmount> second;
    second[bob] = 12 * COIN;
    BOOST_REQUIRE(db.WriteState(LedgerSnapshot(), second, AccessRecord(owner, false)));

    std::map<uint160, CAmount> read;
    BOOST_REQUIRE(db.ReadBalances(read));
    BOOST_CHECK(read == second);
}

BOOST_AUTO_TEST_CASE(balances_do_not_leak_into_other_keys)
{
    LedgerDB db(DBPath());
    DeploymentRecord deployment;
    deployment.strNetworkID = "regtest";
    BOOST_REQUIRE(db.WriteDeployment(deployment));

    std::map<uint160, CAmount> balances;
    for (int i = 0; i < 20; i++) {
        balances[InsecureRandAccount()] = (i + 1) * COIN;
    }
    BOOST_REQUIRE(db.WriteState(LedgerSnapshot(), balances, AccessRecord(owner, false)));

    std::map<uint160, CAmount> read;
    BOOST_REQUIRE(db.ReadBalances(read));
    BOOST_CHECK_EQUAL(read.size(), 20U);
    BOOST_CHECK(read == balances);
    BOOST_CHECK(db.HasDeployment());
}

BOOST_AUTO_TEST_CASE(resume_ledger_from_disk)
{
    uint160 alice = InsecureRandAccount();
    SetTime(LAUNCH_TIME + 100);
    ClaimVoucher voucher = MakeVoucher(PoolKind::MINING, alice, 100 * COIN);
    BOOST_REQUIRE(ledger->Claim(alice, voucher).success);
    SetTime(LAUNCH_TIME + 200);
    BOOST_REQUIRE(DoClaim(PoolKind::MINING, alice, 20 * COIN).success);

    {
        LedgerDB db(DBPath());
        BOOST_REQUIRE(db.WriteState(ledger->GetSnapshot(), tokens.GetBalances(), AccessRecord(owner, false)));
    }

    // A fresh process: new token ledger and distribution ledger loaded from disk
    LedgerDB db(DBPath());
    std::map<uint160, CAmount> balances;
    LedgerSnapshot snapshot;
    BOOST_REQUIRE(db.ReadBalances(balances));
    BOOST_REQUIRE(db.ReadSnapshot(snapshot));

    MemoryTokenLedger resumedTokens;
    resumedTokens.SetBalances(balances);
    DistributionParams resumedParams = params;
    resumedParams.fAllowImmediateStart = true;
    DistributionLedger resumed(resumedParams, verifier, resumedTokens, *access);
    BOOST_REQUIRE(resumed.LoadSnapshot(snapshot));

    BOOST_CHECK_EQUAL(resumed.GetDistributed(PoolKind::MINING), 120 * COIN);
    BOOST_CHECK_EQUAL(resumed.GetClaimCount(), 2U);
    std::vector<ClaimRecord> claims = resumed.GetClaimsForReceiver(alice);
    BOOST_REQUIRE_EQUAL(claims.size(), 2U);
    BOOST_CHECK_EQUAL(claims[0].timestamp, LAUNCH_TIME + 100);
    BOOST_CHECK_EQUAL(claims[1].timestamp, LAUNCH_TIME + 200);

    // Replay protection survives the restart
    BOOST_CHECK_EQUAL(resumed.Claim(alice, voucher).error, LedgerError::CLAIM_ALREADY_EXISTS);
    BOOST_CHECK(resumed.GetSnapshot() == snapshot);
}

BOOST_AUTO_TEST_CASE(load_snapshot_rejections)
{
    uint160 alice = InsecureRandAccount();
    SetTime(LAUNCH_TIME + 100);
    BOOST_REQUIRE(DoClaim(PoolKind::MINING, alice, 100 * COIN).success);
    const LedgerSnapshot good = ledger->GetSnapshot();
    const uint256 hashBefore = good.GetHash();

    LedgerSnapshot overCap = good;
    overCap.nMiningDistributed = params.nMiningCap + 1;
    BOOST_CHECK(!ledger->LoadSnapshot(overCap));

    LedgerSnapshot negative = good;
    negative.nReferralDistributed = -1;
    BOOST_CHECK(!ledger->LoadSnapshot(negative));

    LedgerSnapshot foreignKey = good;
    ClaimRecord record = foreignKey.claims.begin()->second;
    foreignKey.claims.clear();
    foreignKey.claims[InsecureRand256()] = record;
    BOOST_CHECK(!ledger->LoadSnapshot(foreignKey));

    LedgerSnapshot badPool = good;
    badPool.claims.begin()->second.pool = static_cast<PoolKind>(4);
    BOOST_CHECK(!ledger->LoadSnapshot(badPool));

    LedgerSnapshot undercounted = good;
    undercounted.nMiningDistributed = 99 * COIN;
    BOOST_CHECK(!ledger->LoadSnapshot(undercounted));

    BOOST_CHECK(ledger->GetSnapshot().GetHash() == hashBefore);

    LedgerSnapshot uncovered = good;
    uncovered.nReferralDistributed = params.nReferralCap;
    BOOST_CHECK(!ledger->LoadSnapshot(uncovered));

    // Oversized records are rejected before they can be summed
    LedgerSnapshot oversized = good;
    oversized.nMiningDistributed = params.nMiningCap;
    for (int i = 0; i < 60; i++) {
        ClaimRecord huge = record;
        huge.claimKey = InsecureRand256();
        huge.amount = MAX_MONEY;
        oversized.claims[huge.claimKey] = huge;
    }
    BOOST_CHECK(!ledger->LoadSnapshot(oversized));

    LedgerSnapshot sweptInactive = good;
    sweptInactive.migration.MarkSwept(params.nMiningCap - 100 * COIN, params.nReferralCap);
    BOOST_CHECK(!ledger->LoadSnapshot(sweptInactive));

    LedgerSnapshot sweptShort = good;
    sweptShort.migration.Start(LAUNCH_TIME + 100, LAUNCH_TIME + 300);
    sweptShort.migration.MarkSwept(params.nMiningCap - 100 * COIN - 1, params.nReferralCap);
    BOOST_CHECK(!ledger->LoadSnapshot(sweptShort));

    BOOST_CHECK(ledger->GetSnapshot().GetHash() == hashBefore);

    // After a sweep the counters may exceed the recorded claims
    LedgerSnapshot swept = good;
    swept.nMiningDistributed = 800 * COIN;
    swept.nReferralDistributed = 500 * COIN;
    swept.migration.Start(LAUNCH_TIME + 100, LAUNCH_TIME + 300);
    swept.migration.MarkSwept(params.nMiningCap - 100 * COIN, params.nReferralCap);
    BOOST_CHECK(ledger->LoadSnapshot(swept));
    BOOST_CHECK_EQUAL(ledger->GetDistributed(PoolKind::REFERRAL), 500 * COIN);
    BOOST_CHECK_EQUAL(ledger->GetMigrationLock().GetSwept(PoolKind::MINING), params.nMiningCap - 100 * COIN);
}

BOOST_AUTO_TEST_SUITE_END()
