// Copyright (c) 2024 The WeFi developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WEFI_DISTRIBUTION_EMISSION_CURVE_H
#define WEFI_DISTRIBUTION_EMISSION_CURVE_H

/**
 * @file emission_curve.h
 * @brief Piecewise-constant emission schedule of the mining pool
 */

#include <amount.h>
#include <serialize.h>

#include <cstdint>
#include <vector>

namespace wefi {

/**
 * One interval of the emission schedule: tokens are released at
 * nRate base units per second for nDuration seconds.
 */
struct EmissionInterval {
    CAmount nRate;
    int64_t nDuration;

    EmissionInterval() : nRate(0), nDuration(0) {}
    EmissionInterval(CAmount rate, int64_t duration) : nRate(rate), nDuration(duration) {}

    ADD_SERIALIZE_METHODS;

    template <typename Stream, typename Operation>
    inline void SerializationOp(Stream& s, Operation ser_action) {
        READWRITE(nRate);
        READWRITE(nDuration);
    }

    friend bool operator==(const EmissionInterval& a, const EmissionInterval& b) {
        return a.nRate == b.nRate && a.nDuration == b.nDuration;
    }
};

/**
 * @brief Cumulative mining pool unlock as a function of elapsed time
 *
 * Walks the ordered intervals accumulating rate * min(remaining, duration).
 * Time past the final interval adds nothing, so the curve saturates at
 * GetTotalEmission(). All arithmetic is exact 64-bit integer math; the
 * constructor rejects any schedule whose total could overflow.
 */
class EmissionCurve {
public:
    /**
     * @throws std::runtime_error if the schedule is empty, has a
     *         non-positive duration or a negative rate, or overflows
     */
    explicit EmissionCurve(const std::vector<EmissionInterval>& intervals);

    /** Tokens unlocked after the given number of seconds since launch */
    CAmount Unlocked(int64_t nElapsed) const;

    /** Emission rate in effect at the given elapsed time, 0 outside the schedule */
    CAmount GetRateAt(int64_t nElapsed) const;

    const std::vector<EmissionInterval>& GetIntervals() const { return intervals_; }
    int64_t GetTotalDuration() const { return nTotalDuration_; }
    CAmount GetTotalEmission() const { return nTotalEmission_; }

private:
    std::vector<EmissionInterval> intervals_;
    int64_t nTotalDuration_;
    CAmount nTotalEmission_;
};

} // namespace wefi

#endif // WEFI_DISTRIBUTION_EMISSION_CURVE_H
