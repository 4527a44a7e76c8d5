// Copyright (c) 2024 The WeFi developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WEFI_DISTRIBUTION_TOKEN_LEDGER_H
#define WEFI_DISTRIBUTION_TOKEN_LEDGER_H

/**
 * @file token_ledger.h
 * @brief Fungible token balances consumed by the distribution ledger
 */

#include <amount.h>
#include <sync.h>
#include <uint256.h>

#include <map>

namespace wefi {

/**
 * Interface to the token the allocation is denominated in.
 */
class TokenLedger {
public:
    virtual ~TokenLedger() {}

    virtual CAmount GetBalance(const uint160& account) const = 0;

    /**
     * Move amount from one account to another.
     * @return false if the transfer was refused; balances are then unchanged
     */
    virtual bool Transfer(const uint160& from, const uint160& to, CAmount amount) = 0;
};

/**
 * In-memory token ledger used by the command line tool and the tests.
 */
class MemoryTokenLedger : public TokenLedger {
public:
    MemoryTokenLedger() {}

    CAmount GetBalance(const uint160& account) const override;
    bool Transfer(const uint160& from, const uint160& to, CAmount amount) override;

    /** Mint amount into account. Fails on non-positive amounts or overflow. */
    bool Credit(const uint160& account, CAmount amount);

    /** Sum of all balances */
    CAmount GetTotalSupply() const;

    std::map<uint160, CAmount> GetBalances() const;
    void SetBalances(const std::map<uint160, CAmount>& balances);

private:
    /** Balance lookup; caller holds cs_tokens_ */
    CAmount GetBalanceUnlocked(const uint160& account) const;

    std::map<uint160, CAmount> balances_;
    mutable CCriticalSection cs_tokens_;
};

} // namespace wefi

#endif // WEFI_DISTRIBUTION_TOKEN_LEDGER_H
