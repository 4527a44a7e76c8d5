// Copyright (c) 2024 The WeFi developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WEFI_DISTRIBUTION_VESTING_CURVE_H
#define WEFI_DISTRIBUTION_VESTING_CURVE_H

#include <amount.h>

#include <cstdint>

namespace wefi {

/** Longest supported vesting duration, so that duration squared fits in 64 bits */
static const int64_t MAX_VESTING_DURATION = 3000000000LL;

/**
 * Linear vesting of the referral pool:
 * unlocked = cap * min(elapsed, duration) / duration, truncated.
 * Reaches exactly cap once elapsed >= duration.
 */
class VestingCurve {
public:
    /** @throws std::runtime_error if cap < 0 or duration is outside [1, MAX_VESTING_DURATION] */
    VestingCurve(CAmount nCap, int64_t nDuration);

    CAmount Unlocked(int64_t nElapsed) const;

    CAmount GetCap() const { return nCap_; }
    int64_t GetDuration() const { return nDuration_; }

private:
    CAmount nCap_;
    int64_t nDuration_;
};

} // namespace wefi

#endif // WEFI_DISTRIBUTION_VESTING_CURVE_H
