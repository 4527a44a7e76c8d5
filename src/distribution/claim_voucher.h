// Copyright (c) 2024 The WeFi developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WEFI_DISTRIBUTION_CLAIM_VOUCHER_H
#define WEFI_DISTRIBUTION_CLAIM_VOUCHER_H

/**
 * @file claim_voucher.h
 * @brief Signed claim vouchers and the records left behind by redeemed ones
 *
 * A voucher is issued off-line by the verifier key. Its signature covers
 * a domain separated hash of (pool, receiver, amount, validUntil, nonce),
 * so a voucher issued for one deployment cannot be redeemed on another.
 * The signing hash doubles as the claim key under which a redeemed voucher
 * is recorded.
 */

#include <amount.h>
#include <serialize.h>
#include <uint256.h>
#include <distribution/distribution_common.h>

#include <cstdint>
#include <string>
#include <vector>

class CKey;

namespace wefi {

/** Tag hashed into every domain separator */
static const char* const CLAIM_DOMAIN_NAME = "WeFiDistribution";

/** Version of the voucher signing scheme */
static const uint32_t CLAIM_DOMAIN_VERSION = 1;

/**
 * @brief Bind vouchers to one deployment
 * @param nChainId Network identifier
 * @param distributor Account holding the pre-funded allocation
 * @return SHA256d("WeFiDistribution" || version || chainId || distributor)
 */
uint256 GetClaimDomainSeparator(uint32_t nChainId, const uint160& distributor);

/**
 * @brief A signed authorization to claim tokens from one pool
 */
struct ClaimVoucher {
    PoolKind pool;

    /** Account that receives the tokens */
    uint160 receiver;

    /** Amount in base units */
    CAmount amount;

    /** Last second (inclusive) at which the voucher may be redeemed */
    int64_t validUntil;

    /** Verifier chosen value distinguishing otherwise identical vouchers */
    uint64_t nonce;

    /** 65-byte compact recoverable signature */
    std::vector<unsigned char> vchSig;

    ClaimVoucher()
        : pool(PoolKind::MINING)
        , amount(0)
        , validUntil(0)
        , nonce(0) {}

    ClaimVoucher(PoolKind poolIn, const uint160& receiverIn, CAmount amountIn,
                 int64_t validUntilIn, uint64_t nonceIn)
        : pool(poolIn)
        , receiver(receiverIn)
        , amount(amountIn)
        , validUntil(validUntilIn)
        , nonce(nonceIn) {}

    /**
     * @brief Hash the verifier signs
     * @param domainSeparator Result of GetClaimDomainSeparator()
     */
    uint256 GetSigningHash(const uint256& domainSeparator) const;

    /**
     * @brief Sign this voucher in place with the verifier key
     * @return false if the key is invalid
     */
    bool Sign(const CKey& key, const uint256& domainSeparator);

    std::string ToString() const;

    ADD_SERIALIZE_METHODS;

    template <typename Stream, typename Operation>
    inline void SerializationOp(Stream& s, Operation ser_action) {
        uint8_t nPool = static_cast<uint8_t>(pool);
        READWRITE(nPool);
        if (ser_action.ForRead()) {
            pool = static_cast<PoolKind>(nPool);
        }
        READWRITE(receiver);
        READWRITE(amount);
        READWRITE(validUntil);
        READWRITE(nonce);
        READWRITE(vchSig);
    }
};

/**
 * @brief Record of a redeemed voucher
 *
 * Kept for every successful claim and never removed; its presence
 * under claimKey is what prevents the voucher from being redeemed twice.
 */
struct ClaimRecord {
    /** Signing hash of the redeemed voucher */
    uint256 claimKey;

    PoolKind pool;

    /** Account credited */
    uint160 receiver;

    /** Account that submitted the claim */
    uint160 claimant;

    CAmount amount;
    int64_t validUntil;
    uint64_t nonce;

    /** Time the claim was accepted */
    int64_t timestamp;

    ClaimRecord()
        : pool(PoolKind::MINING)
        , amount(0)
        , validUntil(0)
        , nonce(0)
        , timestamp(0) {}

    ClaimRecord(const uint256& key, const ClaimVoucher& voucher, const uint160& claimantIn, int64_t nTime)
        : claimKey(key)
        , pool(voucher.pool)
        , receiver(voucher.receiver)
        , claimant(claimantIn)
        , amount(voucher.amount)
        , validUntil(voucher.validUntil)
        , nonce(voucher.nonce)
        , timestamp(nTime) {}

    std::string ToString() const;

    ADD_SERIALIZE_METHODS;

    template <typename Stream, typename Operation>
    inline void SerializationOp(Stream& s, Operation ser_action) {
        READWRITE(claimKey);
        uint8_t nPool = static_cast<uint8_t>(pool);
        READWRITE(nPool);
        if (ser_action.ForRead()) {
            pool = static_cast<PoolKind>(nPool);
        }
        READWRITE(receiver);
        READWRITE(claimant);
        READWRITE(amount);
        READWRITE(validUntil);
        READWRITE(nonce);
        READWRITE(timestamp);
    }

    friend bool operator==(const ClaimRecord& a, const ClaimRecord& b) {
        return a.claimKey == b.claimKey &&
               a.pool == b.pool &&
               a.receiver == b.receiver &&
               a.claimant == b.claimant &&
               a.amount == b.amount &&
               a.validUntil == b.validUntil &&
               a.nonce == b.nonce &&
               a.timestamp == b.timestamp;
    }
};

/** A successful claim as delivered to event callbacks */
typedef ClaimRecord ClaimEvent;

} // namespace wefi

#endif // WEFI_DISTRIBUTION_CLAIM_VOUCHER_H
