// Copyright (c) 2024 The WeFi developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <distribution/distribution_ledger.h>

#include <hash.h>
#include <util.h>
#include <utilstrencodings.h>
#include <utiltime.h>

#include <algorithm>
#include <stdexcept>

namespace wefi {

namespace {

/** Marks a state changing operation as running for the lifetime of the guard */
class ReentrancyGuard
{
public:
    explicit ReentrancyGuard(bool& fEntered) : fEntered_(fEntered) { fEntered_ = true; }
    ~ReentrancyGuard() { fEntered_ = false; }

    ReentrancyGuard(const ReentrancyGuard&) = delete;
    ReentrancyGuard& operator=(const ReentrancyGuard&) = delete;

private:
    bool& fEntered_;
};

size_t PoolIndex(PoolKind pool)
{
    return static_cast<size_t>(pool);
}

} // namespace

uint256 LedgerSnapshot::GetHash() const
{
    return SerializeHash(*this);
}

// ============================================================================
// Construction
// ============================================================================

DistributionLedger::DistributionLedger(const DistributionParams& params,
                                       const CKeyID& verifier,
                                       TokenLedger& tokens,
                                       AccessControl& access,
                                       int64_t nNow)
    : params_(params)
    , emission_(params.vEmissionSchedule)
    , vesting_(params.nReferralCap, params.nVestingDuration)
    , authorizer_(verifier, GetClaimDomainSeparator(params.nChainId, params.distributor))
    , tokens_(tokens)
    , access_(access)
    , fEntered_(false)
{
    nDistributed_[PoolIndex(PoolKind::MINING)] = 0;
    nDistributed_[PoolIndex(PoolKind::REFERRAL)] = 0;

    if (params_.distributor.IsNull()) {
        throw std::runtime_error("DistributionLedger: distributor account is null");
    }
    if (!MoneyRange(params_.nMiningCap) || !MoneyRange(params_.nReferralCap)) {
        throw std::runtime_error("DistributionLedger: pool cap out of range");
    }
    if (params_.nMigrationGracePeriod < 0) {
        throw std::runtime_error("DistributionLedger: negative migration grace period");
    }
    if (params_.nLaunchTime <= nNow && !params_.fAllowImmediateStart) {
        throw std::runtime_error(strprintf("DistributionLedger: launch time %d is not in the future (now %d)",
            params_.nLaunchTime, nNow));
    }
    if (emission_.GetTotalEmission() != params_.nMiningCap) {
        LogPrintf("WARNING: emission schedule releases %s but the mining pool cap is %s\n",
            FormatMoney(emission_.GetTotalEmission()), FormatMoney(params_.nMiningCap));
    }

    LogPrint(WLog::CLAIM, "DistributionLedger: network=%s launch=%d miningCap=%s referralCap=%s verifier=%s\n",
        params_.strNetworkID, params_.nLaunchTime, FormatMoney(params_.nMiningCap),
        FormatMoney(params_.nReferralCap), verifier.ToString());
}

DistributionLedger::DistributionLedger(const DistributionParams& params,
                                       const CKeyID& verifier,
                                       TokenLedger& tokens,
                                       AccessControl& access)
    : DistributionLedger(params, verifier, tokens, access, GetTime())
{
}

// ============================================================================
// Claims
// ============================================================================

ClaimResult DistributionLedger::Claim(const uint160& caller,
                                      PoolKind pool,
                                      const uint160& receiver,
                                      CAmount amount,
                                      int64_t validUntil,
                                      uint64_t nonce,
                                      const std::vector<unsigned char>& vchSig)
{
    ClaimVoucher voucher(pool, receiver, amount, validUntil, nonce);
    voucher.vchSig = vchSig;
    return Claim(caller, voucher);
}

ClaimResult DistributionLedger::Claim(const uint160& caller, const ClaimVoucher& voucher)
{
    LOCK(cs_ledger_);
    const int64_t nNow = GetTime();

    if (fEntered_) {
        return ClaimResult::Failure(LedgerError::REENTRANT_CALL, "reentrant call rejected");
    }
    ReentrancyGuard guard(fEntered_);

    if (access_.IsPaused()) {
        return ClaimResult::Failure(LedgerError::PAUSED, "distribution is paused");
    }
    if (!IsValidPoolKind(voucher.pool)) {
        return ClaimResult::Failure(LedgerError::INVALID_POOL, "unknown pool");
    }
    if (voucher.amount <= 0 || !MoneyRange(voucher.amount)) {
        return ClaimResult::Failure(LedgerError::INVALID_AMOUNT, "claim amount must be positive");
    }
    if (voucher.receiver.IsNull()) {
        return ClaimResult::Failure(LedgerError::INVALID_RECEIVER, "receiver is null");
    }

    const uint256 claimKey = authorizer_.GetSigningHash(voucher);
    if (claims_.count(claimKey)) {
        return ClaimResult::Failure(LedgerError::CLAIM_ALREADY_EXISTS, "voucher already claimed");
    }

    if (authorizer_.IsExpired(voucher, nNow)) {
        return ClaimResult::Failure(LedgerError::CLAIM_EXPIRED,
            strprintf("voucher expired at %d", voucher.validUntil));
    }

    if (tokens_.GetBalance(params_.distributor) < voucher.amount) {
        return ClaimResult::Failure(LedgerError::INSUFFICIENT_BALANCE, "distributor balance too low");
    }

    AuthResult auth = authorizer_.Verify(voucher);
    if (!auth.IsValid()) {
        return ClaimResult::Failure(LedgerError::INVALID_SIGNATURE,
            strprintf("voucher signature rejected: %s", AuthFailureToString(auth.failure)));
    }

    if (nNow <= params_.nLaunchTime) {
        return ClaimResult::Failure(LedgerError::DISTRIBUTION_NOT_STARTED, "distribution has not started");
    }

    const size_t idx = PoolIndex(voucher.pool);
    const CAmount nClaimable = UnlockedAt(voucher.pool, nNow) - nDistributed_[idx];
    if (nClaimable <= 0) {
        return ClaimResult::Failure(LedgerError::NO_REWARDS_AVAILABLE, "no rewards available");
    }
    if (voucher.amount > nClaimable) {
        return ClaimResult::Failure(LedgerError::EXCEEDS_CLAIMABLE_REWARDS,
            strprintf("amount %s exceeds claimable %s", FormatMoney(voucher.amount), FormatMoney(nClaimable)));
    }
    if (voucher.amount > CapOf(voucher.pool) - nDistributed_[idx]) {
        return ClaimResult::Failure(LedgerError::EXCEEDS_POOL_CAP, "amount exceeds pool cap");
    }

    // Commit, then move the tokens. Undo the bookkeeping if the transfer does not go through.
    const ClaimRecord record(claimKey, voucher, caller, nNow);
    AddClaim(record);
    nDistributed_[idx] += voucher.amount;

    bool fTransferred = false;
    try {
        fTransferred = tokens_.Transfer(params_.distributor, voucher.receiver, voucher.amount);
    } catch (const std::exception& e) {
        LogPrintf("DistributionLedger: token transfer threw: %s\n", e.what());
    }
    if (!fTransferred) {
        nDistributed_[idx] -= voucher.amount;
        RemoveClaim(record);
        return ClaimResult::Failure(LedgerError::TRANSFER_FAILED, "token transfer failed");
    }

    LogPrint(WLog::CLAIM, "Claim %s: %s %s to %s (claimant %s)\n",
        claimKey.ToString(), PoolKindToString(voucher.pool), FormatMoney(voucher.amount),
        voucher.receiver.ToString(), caller.ToString());

    EmitClaimEvent(record);
    return ClaimResult::Success(claimKey, voucher.amount);
}

// ============================================================================
// Migration
// ============================================================================

LedgerResult DistributionLedger::StartMigration(const uint160& caller, int64_t nTargetTime)
{
    LOCK(cs_ledger_);
    const int64_t nNow = GetTime();

    if (fEntered_) {
        return LedgerResult::Failure(LedgerError::REENTRANT_CALL, "reentrant call rejected");
    }
    ReentrancyGuard guard(fEntered_);

    if (!access_.IsOwner(caller)) {
        return LedgerResult::Failure(LedgerError::NOT_OWNER, "caller is not the owner");
    }

    LedgerError err = migration_.CheckStart(nNow, nTargetTime, params_.nMigrationGracePeriod);
    if (err == LedgerError::MIGRATION_ALREADY_STARTED) {
        return LedgerResult::Failure(err, "migration already started");
    }
    if (err != LedgerError::NONE) {
        return LedgerResult::Failure(err,
            strprintf("migration time %d is less than %d seconds away", nTargetTime, params_.nMigrationGracePeriod));
    }

    migration_.Start(nNow, nTargetTime);

    LogPrint(WLog::MIGRATION, "Migration started by %s: clock frozen at %d, sweep after %d\n",
        caller.ToString(), nNow, nTargetTime);
    return LedgerResult::Success();
}

SweepResult DistributionLedger::SweepRemaining(const uint160& caller, const uint160& destination)
{
    LOCK(cs_ledger_);
    const int64_t nNow = GetTime();

    if (fEntered_) {
        return SweepResult::Failure(LedgerError::REENTRANT_CALL, "reentrant call rejected");
    }
    ReentrancyGuard guard(fEntered_);

    if (!access_.IsOwner(caller)) {
        return SweepResult::Failure(LedgerError::NOT_OWNER, "caller is not the owner");
    }

    LedgerError err = migration_.CheckSweep(nNow);
    if (err == LedgerError::MIGRATION_NOT_STARTED) {
        return SweepResult::Failure(err, "migration not started");
    }
    if (err != LedgerError::NONE) {
        return SweepResult::Failure(err,
            strprintf("sweep not allowed until after %d", migration_.GetMigrationTime()));
    }

    if (destination.IsNull()) {
        return SweepResult::Failure(LedgerError::INVALID_RECEIVER, "destination is null");
    }

    if (migration_.IsSwept()) {
        return SweepResult::Failure(LedgerError::NO_REMAINING_TOKENS, "remaining tokens already swept");
    }

    const size_t mining = PoolIndex(PoolKind::MINING);
    const size_t referral = PoolIndex(PoolKind::REFERRAL);
    const CAmount nMiningRemaining = params_.nMiningCap - nDistributed_[mining];
    const CAmount nReferralRemaining = params_.nReferralCap - nDistributed_[referral];
    const CAmount nTotal = nMiningRemaining + nReferralRemaining;
    if (nTotal <= 0) {
        return SweepResult::Failure(LedgerError::NO_REMAINING_TOKENS, "no remaining tokens");
    }

    const MigrationLock prevMigration = migration_;
    const CAmount nPrevMining = nDistributed_[mining];
    const CAmount nPrevReferral = nDistributed_[referral];

    // Unclaimed but unlocked amounts leave with the sweep: the counters
    // catch up to the frozen curves, the locked tail is booked on the lock.
    nDistributed_[mining] = std::max(nPrevMining, UnlockedAt(PoolKind::MINING, nNow));
    nDistributed_[referral] = std::max(nPrevReferral, UnlockedAt(PoolKind::REFERRAL, nNow));
    migration_.MarkSwept(nMiningRemaining, nReferralRemaining);

    bool fTransferred = false;
    try {
        fTransferred = tokens_.Transfer(params_.distributor, destination, nTotal);
    } catch (const std::exception& e) {
        LogPrintf("DistributionLedger: sweep transfer threw: %s\n", e.what());
    }
    if (!fTransferred) {
        nDistributed_[mining] = nPrevMining;
        nDistributed_[referral] = nPrevReferral;
        migration_ = prevMigration;
        return SweepResult::Failure(LedgerError::TRANSFER_FAILED, "token transfer failed");
    }

    LogPrint(WLog::MIGRATION, "Swept %s (mining %s, referral %s) to %s\n",
        FormatMoney(nTotal), FormatMoney(nMiningRemaining), FormatMoney(nReferralRemaining),
        destination.ToString());
    return SweepResult::Success(nMiningRemaining, nReferralRemaining);
}

// ============================================================================
// Queries
// ============================================================================

CAmount DistributionLedger::UnlockedAt(PoolKind pool, int64_t nNow) const
{
    const int64_t nElapsed = migration_.GetEffectiveTime(nNow) - params_.nLaunchTime;
    if (pool == PoolKind::MINING) {
        return emission_.Unlocked(nElapsed);
    }
    return vesting_.Unlocked(nElapsed);
}

CAmount DistributionLedger::CapOf(PoolKind pool) const
{
    return pool == PoolKind::MINING ? params_.nMiningCap : params_.nReferralCap;
}

CAmount DistributionLedger::GetUnlockedMining(int64_t nNow) const
{
    LOCK(cs_ledger_);
    return UnlockedAt(PoolKind::MINING, nNow);
}

CAmount DistributionLedger::GetUnlockedMining() const
{
    return GetUnlockedMining(GetTime());
}

CAmount DistributionLedger::GetUnlockedReferral(int64_t nNow) const
{
    LOCK(cs_ledger_);
    return UnlockedAt(PoolKind::REFERRAL, nNow);
}

CAmount DistributionLedger::GetUnlockedReferral() const
{
    return GetUnlockedReferral(GetTime());
}

CAmount DistributionLedger::GetUnlocked(PoolKind pool, int64_t nNow) const
{
    if (!IsValidPoolKind(pool)) {
        return 0;
    }
    LOCK(cs_ledger_);
    return UnlockedAt(pool, nNow);
}

CAmount DistributionLedger::GetClaimable(PoolKind pool, int64_t nNow) const
{
    if (!IsValidPoolKind(pool)) {
        return 0;
    }
    LOCK(cs_ledger_);
    CAmount nClaimable = UnlockedAt(pool, nNow) - nDistributed_[PoolIndex(pool)];
    return nClaimable > 0 ? nClaimable : 0;
}

CAmount DistributionLedger::GetDistributed(PoolKind pool) const
{
    if (!IsValidPoolKind(pool)) {
        return 0;
    }
    LOCK(cs_ledger_);
    return nDistributed_[PoolIndex(pool)];
}

CAmount DistributionLedger::GetCap(PoolKind pool) const
{
    if (!IsValidPoolKind(pool)) {
        return 0;
    }
    return CapOf(pool);
}

PoolState DistributionLedger::GetPoolState(PoolKind pool, int64_t nNow) const
{
    LOCK(cs_ledger_);
    if (migration_.IsSwept() || (IsValidPoolKind(pool) && nDistributed_[PoolIndex(pool)] >= CapOf(pool))) {
        return PoolState::DRAINED;
    }
    if (migration_.IsActive()) {
        return PoolState::MIGRATION_LOCKED;
    }
    if (nNow <= params_.nLaunchTime) {
        return PoolState::BEFORE_LAUNCH;
    }
    return PoolState::ACCRUING;
}

std::optional<ClaimRecord> DistributionLedger::GetClaimRecord(const uint256& claimKey) const
{
    LOCK(cs_ledger_);
    auto it = claims_.find(claimKey);
    if (it == claims_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ClaimRecord> DistributionLedger::GetClaimsForReceiver(const uint160& receiver) const
{
    LOCK(cs_ledger_);
    std::vector<ClaimRecord> result;
    auto it = claimsByReceiver_.find(receiver);
    if (it != claimsByReceiver_.end()) {
        for (const uint256& key : it->second) {
            auto itClaim = claims_.find(key);
            if (itClaim != claims_.end()) {
                result.push_back(itClaim->second);
            }
        }
    }
    return result;
}

size_t DistributionLedger::GetClaimCount() const
{
    LOCK(cs_ledger_);
    return claims_.size();
}

bool DistributionLedger::IsClaimed(const uint256& claimKey) const
{
    LOCK(cs_ledger_);
    return claims_.count(claimKey) > 0;
}

MigrationLock DistributionLedger::GetMigrationLock() const
{
    LOCK(cs_ledger_);
    return migration_;
}

// ============================================================================
// Snapshots
// ============================================================================

LedgerSnapshot DistributionLedger::GetSnapshot() const
{
    LOCK(cs_ledger_);
    LedgerSnapshot snapshot;
    snapshot.nMiningDistributed = nDistributed_[PoolIndex(PoolKind::MINING)];
    snapshot.nReferralDistributed = nDistributed_[PoolIndex(PoolKind::REFERRAL)];
    snapshot.claims = claims_;
    snapshot.migration = migration_;
    return snapshot;
}

bool DistributionLedger::LoadSnapshot(const LedgerSnapshot& snapshot)
{
    LOCK(cs_ledger_);

    if (fEntered_) {
        return error("%s: reentrant call rejected", __func__);
    }
    if (snapshot.nMiningDistributed < 0 || snapshot.nMiningDistributed > params_.nMiningCap) {
        return error("%s: mining distributed %d outside [0, %d]", __func__,
            snapshot.nMiningDistributed, params_.nMiningCap);
    }
    if (snapshot.nReferralDistributed < 0 || snapshot.nReferralDistributed > params_.nReferralCap) {
        return error("%s: referral distributed %d outside [0, %d]", __func__,
            snapshot.nReferralDistributed, params_.nReferralCap);
    }

    const CAmount distributed[NUM_POOLS] = {snapshot.nMiningDistributed, snapshot.nReferralDistributed};
    CAmount nClaimed[NUM_POOLS] = {0, 0};
    for (const auto& entry : snapshot.claims) {
        const ClaimRecord& record = entry.second;
        if (entry.first != record.claimKey) {
            return error("%s: claim record stored under foreign key %s", __func__, entry.first.ToString());
        }
        if (!IsValidPoolKind(record.pool) || !MoneyRange(record.amount)) {
            return error("%s: malformed claim record %s", __func__, record.ToString());
        }
        const size_t idx = PoolIndex(record.pool);
        if (record.amount > distributed[idx] - nClaimed[idx]) {
            return error("%s: claim records exceed distributed totals", __func__);
        }
        nClaimed[idx] += record.amount;
    }

    const MigrationLock& migration = snapshot.migration;
    if (migration.IsSwept() && !migration.IsActive()) {
        return error("%s: sweep recorded without an active migration", __func__);
    }
    for (PoolKind pool : {PoolKind::MINING, PoolKind::REFERRAL}) {
        const size_t idx = PoolIndex(pool);
        const CAmount nSwept = migration.GetSwept(pool);
        if (!migration.IsSwept()) {
            if (nSwept != 0 || nClaimed[idx] != distributed[idx]) {
                return error("%s: %s distributed %d does not match its claims %d", __func__,
                    PoolKindToString(pool), distributed[idx], nClaimed[idx]);
            }
        } else if (nSwept != CapOf(pool) - nClaimed[idx]) {
            // No claim can succeed after a sweep, so claims and sweep add up to the cap
            return error("%s: %s swept %d does not complete its claims %d to the cap", __func__,
                PoolKindToString(pool), nSwept, nClaimed[idx]);
        }
    }

    nDistributed_[PoolIndex(PoolKind::MINING)] = snapshot.nMiningDistributed;
    nDistributed_[PoolIndex(PoolKind::REFERRAL)] = snapshot.nReferralDistributed;
    claims_.clear();
    claimsByReceiver_.clear();
    std::vector<const ClaimRecord*> ordered;
    for (const auto& entry : snapshot.claims) {
        ordered.push_back(&entry.second);
    }
    std::stable_sort(ordered.begin(), ordered.end(), [](const ClaimRecord* a, const ClaimRecord* b) {
        return a->timestamp < b->timestamp;
    });
    for (const ClaimRecord* record : ordered) {
        AddClaim(*record);
    }
    migration_ = snapshot.migration;

    LogPrint(WLog::DB, "DistributionLedger: loaded %u claims, mining=%s referral=%s\n",
        claims_.size(), FormatMoney(snapshot.nMiningDistributed), FormatMoney(snapshot.nReferralDistributed));
    return true;
}

// ============================================================================
// Internals
// ============================================================================

void DistributionLedger::AddClaim(const ClaimRecord& record)
{
    claims_.emplace(record.claimKey, record);
    claimsByReceiver_[record.receiver].push_back(record.claimKey);
}

void DistributionLedger::RemoveClaim(const ClaimRecord& record)
{
    claims_.erase(record.claimKey);
    auto it = claimsByReceiver_.find(record.receiver);
    if (it != claimsByReceiver_.end()) {
        std::vector<uint256>& keys = it->second;
        keys.erase(std::remove(keys.begin(), keys.end(), record.claimKey), keys.end());
        if (keys.empty()) {
            claimsByReceiver_.erase(it);
        }
    }
}

void DistributionLedger::RegisterClaimEventCallback(ClaimEventCallback callback)
{
    LOCK(cs_ledger_);
    claimEventCallbacks_.push_back(std::move(callback));
}

void DistributionLedger::EmitClaimEvent(const ClaimEvent& event)
{
    for (const auto& callback : claimEventCallbacks_) {
        try {
            callback(event);
        } catch (const std::exception& e) {
            LogPrintf("DistributionLedger: Exception in claim event callback: %s\n", e.what());
        }
    }
}

} // namespace wefi
