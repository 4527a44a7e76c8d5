// Copyright (c) 2024 The WeFi developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <distribution/claim_voucher.h>

#include <hash.h>
#include <key.h>
#include <utilstrencodings.h>
#include <util.h>

namespace wefi {

uint256 GetClaimDomainSeparator(uint32_t nChainId, const uint160& distributor)
{
    CHashWriter ss(SER_GETHASH, 0);
    ss << std::string(CLAIM_DOMAIN_NAME);
    ss << CLAIM_DOMAIN_VERSION;
    ss << nChainId;
    ss << distributor;
    return ss.GetHash();
}

uint256 ClaimVoucher::GetSigningHash(const uint256& domainSeparator) const
{
    CHashWriter ss(SER_GETHASH, 0);
    ss << domainSeparator;
    ss << static_cast<uint8_t>(pool);
    ss << receiver;
    ss << amount;
    ss << validUntil;
    ss << nonce;
    return ss.GetHash();
}

bool ClaimVoucher::Sign(const CKey& key, const uint256& domainSeparator)
{
    return key.SignCompact(GetSigningHash(domainSeparator), vchSig);
}

std::string ClaimVoucher::ToString() const
{
    return strprintf("ClaimVoucher(pool=%s, receiver=%s, amount=%s, validUntil=%d, nonce=%u)",
        PoolKindToString(pool), receiver.ToString(), FormatMoney(amount), validUntil, nonce);
}

std::string ClaimRecord::ToString() const
{
    return strprintf("ClaimRecord(key=%s, pool=%s, receiver=%s, claimant=%s, amount=%s, time=%d)",
        claimKey.ToString(), PoolKindToString(pool), receiver.ToString(), claimant.ToString(),
        FormatMoney(amount), timestamp);
}

} // namespace wefi
