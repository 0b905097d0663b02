#include "IntervalFuzzer.hpp"
#include <algorithm>
#include <cmath>
#include <utility>
#include <spdlog/spdlog.h>

IntervalFuzzer::IntervalFuzzer(FuzzCurve curve)
    : fuzzCurve(std::move(curve))
{
}

bool IntervalFuzzer::appliesTo(int intervalDays) const {
    return static_cast<double>(intervalDays) >= fuzzCurve.minInterval;
}

FuzzRange IntervalFuzzer::bounds(int intervalDays, int maxIntervalDays) const {
    if (!appliesTo(intervalDays)) {
        return FuzzRange{ intervalDays, intervalDays };
    }

    const double ivl = static_cast<double>(intervalDays);
    double delta = 0.0;
    for (const auto& band : fuzzCurve.bands) {
        delta += band.factor * std::max(0.0, std::min(ivl, band.end) - band.start);
    }

    const int cap = std::max(2, maxIntervalDays);
    int lo = static_cast<int>(std::round(ivl - delta));
    int hi = static_cast<int>(std::round(ivl + delta));
    lo = std::clamp(lo, 2, cap);
    hi = std::clamp(hi, lo, cap);
    return FuzzRange{ lo, hi };
}

int IntervalFuzzer::apply(int intervalDays, int maxIntervalDays, RandomSource& random) const {
    if (!appliesTo(intervalDays)) return intervalDays;

    FuzzRange range = bounds(intervalDays, maxIntervalDays);
    int fuzzed = random.uniform(range.min, range.max);
    fuzzed = std::clamp(fuzzed, range.min, range.max);

    spdlog::debug("Fuzzed interval {}d -> {}d (range {}..{})", intervalDays, fuzzed, range.min, range.max);
    return fuzzed;
}
