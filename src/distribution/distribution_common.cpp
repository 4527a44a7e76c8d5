// Copyright (c) 2024 The WeFi developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <distribution/distribution_common.h>

namespace wefi {

const char* PoolKindToString(PoolKind pool) {
    switch (pool) {
        case PoolKind::MINING:   return "mining";
        case PoolKind::REFERRAL: return "referral";
    }
    return "unknown";
}

bool PoolKindFromString(const std::string& str, PoolKind& pool) {
    if (str == "mining" || str == "0") {
        pool = PoolKind::MINING;
        return true;
    }
    if (str == "referral" || str == "1") {
        pool = PoolKind::REFERRAL;
        return true;
    }
    return false;
}

const char* PoolStateToString(PoolState state) {
    switch (state) {
        case PoolState::BEFORE_LAUNCH:    return "before_launch";
        case PoolState::ACCRUING:         return "accruing";
        case PoolState::MIGRATION_LOCKED: return "migration_locked";
        case PoolState::DRAINED:          return "drained";
    }
    return "unknown";
}

const char* LedgerErrorToString(LedgerError error) {
    switch (error) {
        case LedgerError::NONE:                      return "NONE";
        case LedgerError::PAUSED:                    return "PAUSED";
        case LedgerError::REENTRANT_CALL:            return "REENTRANT_CALL";
        case LedgerError::NOT_OWNER:                 return "NOT_OWNER";
        case LedgerError::INVALID_POOL:              return "INVALID_POOL";
        case LedgerError::INVALID_AMOUNT:            return "INVALID_AMOUNT";
        case LedgerError::INVALID_RECEIVER:          return "INVALID_RECEIVER";
        case LedgerError::CLAIM_ALREADY_EXISTS:      return "CLAIM_ALREADY_EXISTS";
        case LedgerError::CLAIM_EXPIRED:             return "CLAIM_EXPIRED";
        case LedgerError::INVALID_SIGNATURE:         return "INVALID_SIGNATURE";
        case LedgerError::INSUFFICIENT_BALANCE:      return "INSUFFICIENT_BALANCE";
        case LedgerError::DISTRIBUTION_NOT_STARTED:  return "DISTRIBUTION_NOT_STARTED";
        case LedgerError::NO_REWARDS_AVAILABLE:      return "NO_REWARDS_AVAILABLE";
        case LedgerError::EXCEEDS_CLAIMABLE_REWARDS: return "EXCEEDS_CLAIMABLE_REWARDS";
        case LedgerError::EXCEEDS_POOL_CAP:          return "EXCEEDS_POOL_CAP";
        case LedgerError::TRANSFER_FAILED:           return "TRANSFER_FAILED";
        case LedgerError::MIGRATION_ALREADY_STARTED: return "MIGRATION_ALREADY_STARTED";
        case LedgerError::INVALID_MIGRATION_TIME:    return "INVALID_MIGRATION_TIME";
        case LedgerError::MIGRATION_NOT_STARTED:     return "MIGRATION_NOT_STARTED";
        case LedgerError::MIGRATION_PENDING:         return "MIGRATION_PENDING";
        case LedgerError::NO_REMAINING_TOKENS:       return "NO_REMAINING_TOKENS";
    }
    return "UNKNOWN";
}

const char* AuthFailureToString(AuthFailure failure) {
    switch (failure) {
        case AuthFailure::NONE:          return "NONE";
        case AuthFailure::BAD_SIGNATURE: return "BAD_SIGNATURE";
        case AuthFailure::UNAUTHORIZED:  return "UNAUTHORIZED";
        case AuthFailure::EXPIRED:       return "EXPIRED";
    }
    return "UNKNOWN";
}

std::ostream& operator<<(std::ostream& os, PoolKind pool) {
    return os << PoolKindToString(pool);
}

std::ostream& operator<<(std::ostream& os, PoolState state) {
    return os << PoolStateToString(state);
}

std::ostream& operator<<(std::ostream& os, LedgerError error) {
    return os << LedgerErrorToString(error);
}

std::ostream& operator<<(std::ostream& os, AuthFailure failure) {
    return os << AuthFailureToString(failure);
}

} // namespace wefi
