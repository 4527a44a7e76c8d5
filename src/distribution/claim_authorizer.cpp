// Copyright (c) 2024 The WeFi developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <distribution/claim_authorizer.h>

#include <util.h>

#include <stdexcept>

namespace wefi {

ClaimAuthorizer::ClaimAuthorizer(const CKeyID& verifier, const uint256& domainSeparator)
    : verifier_(verifier)
    , domainSeparator_(domainSeparator)
{
    if (verifier_.IsNull()) {
        throw std::runtime_error("ClaimAuthorizer: verifier key id is null");
    }
}

uint256 ClaimAuthorizer::GetSigningHash(const ClaimVoucher& voucher) const
{
    return voucher.GetSigningHash(domainSeparator_);
}

AuthResult ClaimAuthorizer::Verify(const ClaimVoucher& voucher, const std::vector<unsigned char>& vchSig) const
{
    if (vchSig.size() != CPubKey::COMPACT_SIGNATURE_SIZE) {
        return AuthResult(AuthFailure::BAD_SIGNATURE);
    }

    // Only the normalized form is accepted so one authorization has one encoding
    if (!CPubKey::CheckLowSCompact(vchSig)) {
        return AuthResult(AuthFailure::BAD_SIGNATURE);
    }

    CPubKey pubkey;
    if (!pubkey.RecoverCompact(GetSigningHash(voucher), vchSig)) {
        return AuthResult(AuthFailure::BAD_SIGNATURE);
    }

    CKeyID signer = pubkey.GetID();
    if (signer != verifier_) {
        LogPrint(WLog::CLAIM, "ClaimAuthorizer: voucher signed by %s, expected %s\n",
            signer.ToString(), verifier_.ToString());
        return AuthResult(AuthFailure::UNAUTHORIZED, signer);
    }

    return AuthResult(AuthFailure::NONE, signer);
}

AuthResult ClaimAuthorizer::Verify(const ClaimVoucher& voucher) const
{
    return Verify(voucher, voucher.vchSig);
}

bool ClaimAuthorizer::IsExpired(const ClaimVoucher& voucher, int64_t nNow) const
{
    return voucher.validUntil < nNow;
}

} // namespace wefi
