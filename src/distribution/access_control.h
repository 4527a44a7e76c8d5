// Copyright (c) 2024 The WeFi developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WEFI_DISTRIBUTION_ACCESS_CONTROL_H
#define WEFI_DISTRIBUTION_ACCESS_CONTROL_H

/**
 * @file access_control.h
 * @brief Owner and pause gate wrapped around the distribution ledger
 */

#include <sync.h>
#include <uint256.h>
#include <distribution/distribution_common.h>

namespace wefi {

class AccessControl {
public:
    virtual ~AccessControl() {}

    /** Whether caller may run administrative operations */
    virtual bool IsOwner(const uint160& caller) const = 0;

    /** Whether claims are currently suspended */
    virtual bool IsPaused() const = 0;
};

/**
 * Single-owner gate with a pause switch.
 */
class OwnerAccessControl : public AccessControl {
public:
    /** @throws std::runtime_error if owner is null */
    explicit OwnerAccessControl(const uint160& owner, bool fPaused = false);

    bool IsOwner(const uint160& caller) const override;
    bool IsPaused() const override;

    LedgerResult Pause(const uint160& caller);
    LedgerResult Unpause(const uint160& caller);

    /** Hand control to newOwner. The null account is refused. */
    LedgerResult TransferOwnership(const uint160& caller, const uint160& newOwner);

    uint160 GetOwner() const;

private:
    uint160 owner_;
    bool fPaused_;
    mutable CCriticalSection cs_access_;
};

} // namespace wefi

#endif // WEFI_DISTRIBUTION_ACCESS_CONTROL_H
