// Copyright (c) 2024 The WeFi developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <distribution/vesting_curve.h>

#include <util.h>

#include <stdexcept>

namespace wefi {

VestingCurve::VestingCurve(CAmount nCap, int64_t nDuration)
    : nCap_(nCap)
    , nDuration_(nDuration)
{
    if (nCap_ < 0) {
        throw std::runtime_error(strprintf("VestingCurve: negative cap %d", nCap_));
    }
    if (nDuration_ <= 0) {
        throw std::runtime_error(strprintf("VestingCurve: non-positive duration %d", nDuration_));
    }
    if (nDuration_ > MAX_VESTING_DURATION) {
        throw std::runtime_error(strprintf("VestingCurve: duration %d exceeds %d", nDuration_, MAX_VESTING_DURATION));
    }
}

CAmount VestingCurve::Unlocked(int64_t nElapsed) const
{
    if (nElapsed <= 0) {
        return 0;
    }
    if (nElapsed >= nDuration_) {
        return nCap_;
    }
    // floor(cap * elapsed / duration) without forming cap * elapsed
    return nCap_ / nDuration_ * nElapsed + nCap_ % nDuration_ * nElapsed / nDuration_;
}

} // namespace wefi
