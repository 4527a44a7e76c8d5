// Copyright (c) 2024 The WeFi developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <distribution/migration_lock.h>

#include <util.h>

#include <algorithm>
#include <limits>

namespace wefi {

int64_t MigrationLock::GetEffectiveTime(int64_t nNow) const
{
    if (!fActive_) {
        return nNow;
    }
    return std::min(nNow, nLockTime_);
}

LedgerError MigrationLock::CheckStart(int64_t nNow, int64_t nTarget, int64_t nGracePeriod) const
{
    if (fActive_) {
        return LedgerError::MIGRATION_ALREADY_STARTED;
    }
    if (nGracePeriod > std::numeric_limits<int64_t>::max() - nNow) {
        return LedgerError::INVALID_MIGRATION_TIME;
    }
    if (nTarget < nNow + nGracePeriod) {
        return LedgerError::INVALID_MIGRATION_TIME;
    }
    return LedgerError::NONE;
}

void MigrationLock::Start(int64_t nNow, int64_t nTarget)
{
    fActive_ = true;
    nLockTime_ = nNow;
    nMigrationTime_ = nTarget;
}

LedgerError MigrationLock::CheckSweep(int64_t nNow) const
{
    if (!fActive_) {
        return LedgerError::MIGRATION_NOT_STARTED;
    }
    if (nNow <= nMigrationTime_) {
        return LedgerError::MIGRATION_PENDING;
    }
    return LedgerError::NONE;
}

CAmount MigrationLock::GetSwept(PoolKind pool) const
{
    switch (pool) {
    case PoolKind::MINING: return nMiningSwept_;
    case PoolKind::REFERRAL: return nReferralSwept_;
    }
    return 0;
}

void MigrationLock::MarkSwept(CAmount nMining, CAmount nReferral)
{
    fSwept_ = true;
    nMiningSwept_ = nMining;
    nReferralSwept_ = nReferral;
}

std::string MigrationLock::ToString() const
{
    return strprintf("MigrationLock(active=%d, lockTime=%d, migrationTime=%d, swept=%d, miningSwept=%d, referralSwept=%d)",
        fActive_, nLockTime_, nMigrationTime_, fSwept_, nMiningSwept_, nReferralSwept_);
}

} // namespace wefi
