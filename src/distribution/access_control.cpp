// Copyright (c) 2024 The WeFi developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <distribution/access_control.h>

#include <util.h>

#include <stdexcept>

namespace wefi {

OwnerAccessControl::OwnerAccessControl(const uint160& owner, bool fPaused)
    : owner_(owner)
    , fPaused_(fPaused)
{
    if (owner_.IsNull()) {
        throw std::runtime_error("OwnerAccessControl: owner is null");
    }
}

bool OwnerAccessControl::IsOwner(const uint160& caller) const
{
    LOCK(cs_access_);
    return !caller.IsNull() && caller == owner_;
}

bool OwnerAccessControl::IsPaused() const
{
    LOCK(cs_access_);
    return fPaused_;
}

LedgerResult OwnerAccessControl::Pause(const uint160& caller)
{
    LOCK(cs_access_);
    if (caller != owner_) {
        return LedgerResult::Failure(LedgerError::NOT_OWNER, "caller is not the owner");
    }
    fPaused_ = true;
    LogPrintf("Distribution paused by %s\n", caller.ToString());
    return LedgerResult::Success();
}

LedgerResult OwnerAccessControl::Unpause(const uint160& caller)
{
    LOCK(cs_access_);
    if (caller != owner_) {
        return LedgerResult::Failure(LedgerError::NOT_OWNER, "caller is not the owner");
    }
    fPaused_ = false;
    LogPrintf("Distribution unpaused by %s\n", caller.ToString());
    return LedgerResult::Success();
}

LedgerResult OwnerAccessControl::TransferOwnership(const uint160& caller, const uint160& newOwner)
{
    LOCK(cs_access_);
    if (caller != owner_) {
        return LedgerResult::Failure(LedgerError::NOT_OWNER, "caller is not the owner");
    }
    if (newOwner.IsNull()) {
        return LedgerResult::Failure(LedgerError::INVALID_RECEIVER, "new owner is null");
    }
    LogPrintf("Ownership transferred from %s to %s\n", owner_.ToString(), newOwner.ToString());
    owner_ = newOwner;
    return LedgerResult::Success();
}

uint160 OwnerAccessControl::GetOwner() const
{
    LOCK(cs_access_);
    return owner_;
}

} // namespace wefi
