// Copyright (c) 2024 The WeFi developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WEFI_DISTRIBUTION_MIGRATION_LOCK_H
#define WEFI_DISTRIBUTION_MIGRATION_LOCK_H

/**
 * @file migration_lock.h
 * @brief Once-only freeze of the unlock clock ahead of a migration
 *
 * Starting the migration freezes both curves at the current time and
 * schedules the earliest moment (exclusive) at which the undistributed
 * remainder may be swept. A started migration can never be undone. The
 * lock also keeps what the sweep moved out of each pool, apart from the
 * pools' distributed counters.
 */

#include <amount.h>
#include <serialize.h>
#include <distribution/distribution_common.h>

#include <cstdint>
#include <string>

namespace wefi {

class MigrationLock {
public:
    MigrationLock()
        : fActive_(false)
        , nLockTime_(0)
        , nMigrationTime_(0)
        , fSwept_(false)
        , nMiningSwept_(0)
        , nReferralSwept_(0) {}

    bool IsActive() const { return fActive_; }
    int64_t GetLockTime() const { return nLockTime_; }
    int64_t GetMigrationTime() const { return nMigrationTime_; }
    bool IsSwept() const { return fSwept_; }
    /** Amount the sweep took out of pool, 0 before the sweep */
    CAmount GetSwept(PoolKind pool) const;

    /** Time fed to the unlock curves: nNow, frozen at the lock time once active */
    int64_t GetEffectiveTime(int64_t nNow) const;

    /**
     * @brief Validate a migration start
     * @return MIGRATION_ALREADY_STARTED, INVALID_MIGRATION_TIME if nTarget
     *         is earlier than nNow + nGracePeriod, NONE otherwise
     */
    LedgerError CheckStart(int64_t nNow, int64_t nTarget, int64_t nGracePeriod) const;

    /** Activate the lock. CheckStart() must have returned NONE. */
    void Start(int64_t nNow, int64_t nTarget);

    /**
     * @brief Validate the timing of a sweep
     * @return MIGRATION_NOT_STARTED, MIGRATION_PENDING while
     *         nNow <= migration time, NONE otherwise
     */
    LedgerError CheckSweep(int64_t nNow) const;

    /** Record a completed sweep and the per-pool amounts it transferred */
    void MarkSwept(CAmount nMining, CAmount nReferral);

    std::string ToString() const;

    ADD_SERIALIZE_METHODS;

    template <typename Stream, typename Operation>
    inline void SerializationOp(Stream& s, Operation ser_action) {
        READWRITE(fActive_);
        READWRITE(nLockTime_);
        READWRITE(nMigrationTime_);
        READWRITE(fSwept_);
        READWRITE(nMiningSwept_);
        READWRITE(nReferralSwept_);
    }

    friend bool operator==(const MigrationLock& a, const MigrationLock& b) {
        return a.fActive_ == b.fActive_ &&
               a.nLockTime_ == b.nLockTime_ &&
               a.nMigrationTime_ == b.nMigrationTime_ &&
               a.fSwept_ == b.fSwept_ &&
               a.nMiningSwept_ == b.nMiningSwept_ &&
               a.nReferralSwept_ == b.nReferralSwept_;
    }

private:
    bool fActive_;
    int64_t nLockTime_;
    int64_t nMigrationTime_;
    bool fSwept_;
    CAmount nMiningSwept_;
    CAmount nReferralSwept_;
};

} // namespace wefi

#endif // WEFI_DISTRIBUTION_MIGRATION_LOCK_H
