// Copyright (c) 2024 The WeFi developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <distribution/emission_curve.h>

#include <util.h>

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace wefi {

EmissionCurve::EmissionCurve(const std::vector<EmissionInterval>& intervals)
    : intervals_(intervals)
    , nTotalDuration_(0)
    , nTotalEmission_(0)
{
    if (intervals_.empty()) {
        throw std::runtime_error("EmissionCurve: empty emission schedule");
    }

    const int64_t nMax = std::numeric_limits<int64_t>::max();
    for (size_t i = 0; i < intervals_.size(); ++i) {
        const EmissionInterval& interval = intervals_[i];
        if (interval.nDuration <= 0) {
            throw std::runtime_error(strprintf("EmissionCurve: interval %u has non-positive duration %d", i, interval.nDuration));
        }
        if (interval.nRate < 0) {
            throw std::runtime_error(strprintf("EmissionCurve: interval %u has negative rate %d", i, interval.nRate));
        }
        if (interval.nRate > 0 && interval.nDuration > nMax / interval.nRate) {
            throw std::runtime_error(strprintf("EmissionCurve: interval %u emission overflows", i));
        }
        CAmount nEmission = interval.nRate * interval.nDuration;
        if (nTotalEmission_ > nMax - nEmission) {
            throw std::runtime_error("EmissionCurve: total emission overflows");
        }
        if (nTotalDuration_ > nMax - interval.nDuration) {
            throw std::runtime_error("EmissionCurve: total duration overflows");
        }
        nTotalEmission_ += nEmission;
        nTotalDuration_ += interval.nDuration;
    }
}

CAmount EmissionCurve::Unlocked(int64_t nElapsed) const
{
    if (nElapsed <= 0) {
        return 0;
    }

    CAmount nUnlocked = 0;
    int64_t nRemaining = nElapsed;
    for (const EmissionInterval& interval : intervals_) {
        if (nRemaining <= 0) {
            break;
        }
        int64_t nSpan = std::min(nRemaining, interval.nDuration);
        nUnlocked += interval.nRate * nSpan;
        nRemaining -= nSpan;
    }
    return nUnlocked;
}

CAmount EmissionCurve::GetRateAt(int64_t nElapsed) const
{
    if (nElapsed < 0) {
        return 0;
    }

    int64_t nStart = 0;
    for (const EmissionInterval& interval : intervals_) {
        if (nElapsed < nStart + interval.nDuration) {
            return interval.nRate;
        }
        nStart += interval.nDuration;
    }
    return 0;
}

} // namespace wefi
