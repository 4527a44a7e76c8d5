// Copyright (c) 2024 The WeFi developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <distribution/token_ledger.h>

#include <util.h>
#include <utilstrencodings.h>

namespace wefi {

CAmount MemoryTokenLedger::GetBalance(const uint160& account) const
{
    LOCK(cs_tokens_);
    auto it = balances_.find(account);
    return it == balances_.end() ? 0 : it->second;
}

bool MemoryTokenLedger::Transfer(const uint160& from, const uint160& to, CAmount amount)
{
    LOCK(cs_tokens_);

    if (amount <= 0 || !MoneyRange(amount)) {
        return false;
    }
    if (to.IsNull()) {
        return false;
    }

    auto itFrom = balances_.find(from);
    if (itFrom == balances_.end() || itFrom->second < amount) {
        return false;
    }

    if (from == to) {
        return true;
    }

    CAmount nToBalance = GetBalanceUnlocked(to);
    if (!MoneyRange(nToBalance + amount)) {
        return false;
    }

    itFrom->second -= amount;
    if (itFrom->second == 0) {
        balances_.erase(itFrom);
    }
    balances_[to] = nToBalance + amount;
    return true;
}

bool MemoryTokenLedger::Credit(const uint160& account, CAmount amount)
{
    LOCK(cs_tokens_);

    if (account.IsNull() || amount <= 0 || !MoneyRange(amount)) {
        return false;
    }
    CAmount nBalance = GetBalanceUnlocked(account);
    if (!MoneyRange(nBalance + amount)) {
        return false;
    }
    balances_[account] = nBalance + amount;
    return true;
}

CAmount MemoryTokenLedger::GetTotalSupply() const
{
    LOCK(cs_tokens_);
    CAmount nTotal = 0;
    for (const auto& entry : balances_) {
        nTotal += entry.second;
    }
    return nTotal;
}

std::map<uint160, CAmount> MemoryTokenLedger::GetBalances() const
{
    LOCK(cs_tokens_);
    return balances_;
}

void MemoryTokenLedger::SetBalances(const std::map<uint160, CAmount>& balances)
{
    LOCK(cs_tokens_);
    balances_.clear();
    for (const auto& entry : balances) {
        if (entry.second > 0) {
            balances_.insert(entry);
        }
    }
}

CAmount MemoryTokenLedger::GetBalanceUnlocked(const uint160& account) const
{
    auto it = balances_.find(account);
    return it == balances_.end() ? 0 : it->second;
}

} // namespace wefi
