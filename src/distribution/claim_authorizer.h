// Copyright (c) 2024 The WeFi developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WEFI_DISTRIBUTION_CLAIM_AUTHORIZER_H
#define WEFI_DISTRIBUTION_CLAIM_AUTHORIZER_H

/**
 * @file claim_authorizer.h
 * @brief Verification of claim voucher signatures against the verifier key
 *
 * The authorizer is a pure check: it never records anything. Replay
 * protection is the ledger's job.
 */

#include <pubkey.h>
#include <uint256.h>
#include <distribution/claim_voucher.h>
#include <distribution/distribution_common.h>

#include <vector>

namespace wefi {

/**
 * @brief Outcome of a signature check
 */
struct AuthResult {
    AuthFailure failure;

    /** Key id recovered from the signature, when one could be recovered */
    CKeyID signer;

    AuthResult() : failure(AuthFailure::NONE) {}
    explicit AuthResult(AuthFailure f) : failure(f) {}
    AuthResult(AuthFailure f, const CKeyID& id) : failure(f), signer(id) {}

    bool IsValid() const { return failure == AuthFailure::NONE; }
};

class ClaimAuthorizer {
public:
    /**
     * @param verifier Key id of the single trusted voucher signer
     * @param domainSeparator Deployment binding from GetClaimDomainSeparator()
     * @throws std::runtime_error if verifier is null
     */
    ClaimAuthorizer(const CKeyID& verifier, const uint256& domainSeparator);

    /**
     * @brief Check that the voucher was signed by the verifier
     * @param voucher Voucher whose fields are hashed
     * @param vchSig Compact signature to check
     * @return BAD_SIGNATURE for a malformed, unrecoverable or high-S
     *         signature, UNAUTHORIZED for a valid signature by another key
     */
    AuthResult Verify(const ClaimVoucher& voucher, const std::vector<unsigned char>& vchSig) const;

    /** Verify using the signature carried by the voucher */
    AuthResult Verify(const ClaimVoucher& voucher) const;

    /** True if the voucher can no longer be redeemed at nNow */
    bool IsExpired(const ClaimVoucher& voucher, int64_t nNow) const;

    /** Claim key of the voucher: its signing hash */
    uint256 GetSigningHash(const ClaimVoucher& voucher) const;

    const CKeyID& GetVerifier() const { return verifier_; }
    const uint256& GetDomainSeparator() const { return domainSeparator_; }

private:
    CKeyID verifier_;
    uint256 domainSeparator_;
};

} // namespace wefi

#endif // WEFI_DISTRIBUTION_CLAIM_AUTHORIZER_H
