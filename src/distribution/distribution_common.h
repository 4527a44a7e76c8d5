// Copyright (c) 2024 The WeFi developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WEFI_DISTRIBUTION_DISTRIBUTION_COMMON_H
#define WEFI_DISTRIBUTION_DISTRIBUTION_COMMON_H

/**
 * @file distribution_common.h
 * @brief Shared types for the token distribution engine
 *
 * Pool identifiers, the error taxonomy returned by ledger operations,
 * and the result values that carry those errors back to callers.
 */

#include <amount.h>
#include <uint256.h>

#include <cstdint>
#include <ostream>
#include <string>

namespace wefi {

// ============================================================================
// Pools
// ============================================================================

/** The two independently unlocking allocations */
enum class PoolKind : uint8_t {
    MINING = 0,
    REFERRAL = 1,
};

static const unsigned int NUM_POOLS = 2;

inline bool IsValidPoolKind(PoolKind pool) {
    return pool == PoolKind::MINING || pool == PoolKind::REFERRAL;
}

/** Lifecycle of a pool, computed on every call from time and migration state */
enum class PoolState {
    BEFORE_LAUNCH,
    ACCRUING,
    MIGRATION_LOCKED,
    DRAINED,
};

// ============================================================================
// Errors
// ============================================================================

/**
 * @brief Reasons a ledger operation can be rejected
 *
 * A rejected operation never changes ledger state or token balances.
 */
enum class LedgerError {
    NONE = 0,
    // gates
    PAUSED,
    REENTRANT_CALL,
    NOT_OWNER,
    // malformed requests
    INVALID_POOL,
    INVALID_AMOUNT,
    INVALID_RECEIVER,
    // authorization
    CLAIM_ALREADY_EXISTS,
    CLAIM_EXPIRED,
    INVALID_SIGNATURE,
    // accounting
    INSUFFICIENT_BALANCE,
    DISTRIBUTION_NOT_STARTED,
    NO_REWARDS_AVAILABLE,
    EXCEEDS_CLAIMABLE_REWARDS,
    EXCEEDS_POOL_CAP,
    TRANSFER_FAILED,
    // migration lifecycle
    MIGRATION_ALREADY_STARTED,
    INVALID_MIGRATION_TIME,
    MIGRATION_NOT_STARTED,
    MIGRATION_PENDING,
    NO_REMAINING_TOKENS,
};

/** Voucher authorization failures reported by ClaimAuthorizer */
enum class AuthFailure {
    NONE = 0,
    BAD_SIGNATURE,
    UNAUTHORIZED,
    EXPIRED,
};

const char* PoolKindToString(PoolKind pool);
bool PoolKindFromString(const std::string& str, PoolKind& pool);
const char* PoolStateToString(PoolState state);
const char* LedgerErrorToString(LedgerError error);
const char* AuthFailureToString(AuthFailure failure);

std::ostream& operator<<(std::ostream& os, PoolKind pool);
std::ostream& operator<<(std::ostream& os, PoolState state);
std::ostream& operator<<(std::ostream& os, LedgerError error);
std::ostream& operator<<(std::ostream& os, AuthFailure failure);

// ============================================================================
// Result types
// ============================================================================

/**
 * @brief Outcome of an administrative ledger operation
 */
struct LedgerResult {
    bool success;
    LedgerError error;
    std::string errorMessage;

    LedgerResult() : success(false), error(LedgerError::NONE) {}

    static LedgerResult Success() {
        LedgerResult result;
        result.success = true;
        return result;
    }

    static LedgerResult Failure(LedgerError err, const std::string& message) {
        LedgerResult result;
        result.error = err;
        result.errorMessage = message;
        return result;
    }
};

/**
 * @brief Outcome of a claim
 *
 * On success carries the claim key under which the voucher was
 * recorded and the amount transferred to the receiver.
 */
struct ClaimResult {
    bool success;
    LedgerError error;
    std::string errorMessage;

    /** Signing hash of the redeemed voucher */
    uint256 claimKey;

    /** Amount transferred */
    CAmount amount;

    ClaimResult() : success(false), error(LedgerError::NONE), amount(0) {}

    static ClaimResult Success(const uint256& key, CAmount amt) {
        ClaimResult result;
        result.success = true;
        result.claimKey = key;
        result.amount = amt;
        return result;
    }

    static ClaimResult Failure(LedgerError err, const std::string& message) {
        ClaimResult result;
        result.error = err;
        result.errorMessage = message;
        return result;
    }
};

/**
 * @brief Outcome of a post-migration sweep
 */
struct SweepResult {
    bool success;
    LedgerError error;
    std::string errorMessage;

    /** Total amount transferred to the destination */
    CAmount amount;

    /** Per-pool share of the sweep */
    CAmount miningAmount;
    CAmount referralAmount;

    SweepResult() : success(false), error(LedgerError::NONE), amount(0), miningAmount(0), referralAmount(0) {}

    static SweepResult Success(CAmount mining, CAmount referral) {
        SweepResult result;
        result.success = true;
        result.miningAmount = mining;
        result.referralAmount = referral;
        result.amount = mining + referral;
        return result;
    }

    static SweepResult Failure(LedgerError err, const std::string& message) {
        SweepResult result;
        result.error = err;
        result.errorMessage = message;
        return result;
    }
};

} // namespace wefi

#endif // WEFI_DISTRIBUTION_DISTRIBUTION_COMMON_H
