// Copyright (c) 2024 The WeFi developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WEFI_DISTRIBUTION_DISTRIBUTION_LEDGER_H
#define WEFI_DISTRIBUTION_DISTRIBUTION_LEDGER_H

/**
 * @file distribution_ledger.h
 * @brief Claim accounting for the mining and referral pools
 *
 * The ledger owns the per-pool distribution counters, the set of
 * redeemed vouchers and the migration lock. Every public operation is
 * atomic: it either commits completely or leaves state and token
 * balances untouched. A rejected operation reports why through its
 * result value and never throws.
 */

#include <amount.h>
#include <pubkey.h>
#include <serialize.h>
#include <sync.h>
#include <uint256.h>
#include <distribution/access_control.h>
#include <distribution/claim_authorizer.h>
#include <distribution/claim_voucher.h>
#include <distribution/distribution_common.h>
#include <distribution/distribution_params.h>
#include <distribution/emission_curve.h>
#include <distribution/migration_lock.h>
#include <distribution/token_ledger.h>
#include <distribution/vesting_curve.h>

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace wefi {

// ============================================================================
// LedgerSnapshot
// ============================================================================

/**
 * @brief All mutable ledger state as one serializable value
 */
struct LedgerSnapshot {
    CAmount nMiningDistributed;
    CAmount nReferralDistributed;

    /** Redeemed vouchers keyed by claim key */
    std::map<uint256, ClaimRecord> claims;

    MigrationLock migration;

    LedgerSnapshot() : nMiningDistributed(0), nReferralDistributed(0) {}

    /** Hash of the serialized snapshot */
    uint256 GetHash() const;

    ADD_SERIALIZE_METHODS;

    template <typename Stream, typename Operation>
    inline void SerializationOp(Stream& s, Operation ser_action) {
        READWRITE(nMiningDistributed);
        READWRITE(nReferralDistributed);
        READWRITE(claims);
        READWRITE(migration);
    }

    friend bool operator==(const LedgerSnapshot& a, const LedgerSnapshot& b) {
        return a.nMiningDistributed == b.nMiningDistributed &&
               a.nReferralDistributed == b.nReferralDistributed &&
               a.claims == b.claims &&
               a.migration == b.migration;
    }
};

// ============================================================================
// DistributionLedger
// ============================================================================

class DistributionLedger {
public:
    /** Callback type for claim event notifications */
    using ClaimEventCallback = std::function<void(const ClaimEvent&)>;

    /**
     * @brief Construct a ledger
     * @param params Pool caps, curves, launch time and distributor account
     * @param verifier Key id of the voucher signer
     * @param tokens Token ledger holding the distributor's allocation
     * @param access Owner and pause gate
     * @param nNow Construction time, checked against the launch time
     * @throws std::runtime_error on invalid configuration
     */
    DistributionLedger(const DistributionParams& params,
                       const CKeyID& verifier,
                       TokenLedger& tokens,
                       AccessControl& access,
                       int64_t nNow);

    /** Construct at the current time */
    DistributionLedger(const DistributionParams& params,
                       const CKeyID& verifier,
                       TokenLedger& tokens,
                       AccessControl& access);

    // ------------------------------------------------------------------------
    // State changing operations
    // ------------------------------------------------------------------------

    /**
     * @brief Redeem a voucher
     * @param caller Account submitting the claim (recorded as claimant)
     * @param voucher Signed voucher
     * @return ClaimResult with the claim key on success
     *
     * Checks, in order: reentrancy, pause, request shape, replay, expiry,
     * distributor balance, signature, launch, claimable amount, pool cap.
     * On success the voucher is recorded, the pool counter increases and
     * the amount is transferred from the distributor to the receiver. If
     * the transfer fails everything is rolled back and TRANSFER_FAILED is
     * returned.
     */
    ClaimResult Claim(const uint160& caller, const ClaimVoucher& voucher);

    ClaimResult Claim(const uint160& caller,
                      PoolKind pool,
                      const uint160& receiver,
                      CAmount amount,
                      int64_t validUntil,
                      uint64_t nonce,
                      const std::vector<unsigned char>& vchSig);

    /**
     * @brief Freeze both unlock curves at the current time
     * @param caller Must be the owner
     * @param nTargetTime Earliest (exclusive) sweep time, at least the
     *        grace period away from now
     */
    LedgerResult StartMigration(const uint160& caller, int64_t nTargetTime);

    /**
     * @brief Transfer everything not yet distributed to destination
     *
     * Only after the migration target time has passed. Moves cap - distributed
     * of each pool. The distributed counters catch up to the frozen unlocked
     * amounts and the transferred amounts are recorded on the migration lock,
     * so a second sweep fails with NO_REMAINING_TOKENS.
     */
    SweepResult SweepRemaining(const uint160& caller, const uint160& destination);

    // ------------------------------------------------------------------------
    // Queries
    // ------------------------------------------------------------------------

    CAmount GetUnlockedMining(int64_t nNow) const;
    CAmount GetUnlockedMining() const;
    CAmount GetUnlockedReferral(int64_t nNow) const;
    CAmount GetUnlockedReferral() const;
    CAmount GetUnlocked(PoolKind pool, int64_t nNow) const;

    /** Unlocked minus distributed, never negative */
    CAmount GetClaimable(PoolKind pool, int64_t nNow) const;

    CAmount GetDistributed(PoolKind pool) const;
    CAmount GetCap(PoolKind pool) const;
    PoolState GetPoolState(PoolKind pool, int64_t nNow) const;

    std::optional<ClaimRecord> GetClaimRecord(const uint256& claimKey) const;
    std::vector<ClaimRecord> GetClaimsForReceiver(const uint160& receiver) const;
    size_t GetClaimCount() const;
    bool IsClaimed(const uint256& claimKey) const;

    MigrationLock GetMigrationLock() const;
    const EmissionCurve& GetEmissionCurve() const { return emission_; }
    const VestingCurve& GetVestingCurve() const { return vesting_; }
    const ClaimAuthorizer& GetAuthorizer() const { return authorizer_; }
    const DistributionParams& GetParams() const { return params_; }

    LedgerSnapshot GetSnapshot() const;

    /**
     * @brief Replace the mutable state, e.g. when resuming from disk
     * @return false if the snapshot violates a pool invariant; state is then unchanged
     */
    bool LoadSnapshot(const LedgerSnapshot& snapshot);

    /**
     * @brief Register a callback for claim events
     * @param callback Function to call after a claim commits
     */
    void RegisterClaimEventCallback(ClaimEventCallback callback);

private:
    const DistributionParams params_;
    const EmissionCurve emission_;
    const VestingCurve vesting_;
    const ClaimAuthorizer authorizer_;

    TokenLedger& tokens_;
    AccessControl& access_;

    /** Distributed amount per pool, indexed by PoolKind */
    CAmount nDistributed_[NUM_POOLS];

    std::map<uint256, ClaimRecord> claims_;

    /** Index: receiver -> claim keys in claim order */
    std::map<uint160, std::vector<uint256>> claimsByReceiver_;

    MigrationLock migration_;

    std::vector<ClaimEventCallback> claimEventCallbacks_;

    /** Set while a state changing operation is in progress */
    bool fEntered_;

    mutable CCriticalSection cs_ledger_;

    CAmount UnlockedAt(PoolKind pool, int64_t nNow) const;
    CAmount CapOf(PoolKind pool) const;
    void AddClaim(const ClaimRecord& record);
    void RemoveClaim(const ClaimRecord& record);
    void EmitClaimEvent(const ClaimEvent& event);
};

} // namespace wefi

#endif // WEFI_DISTRIBUTION_DISTRIBUTION_LEDGER_H
