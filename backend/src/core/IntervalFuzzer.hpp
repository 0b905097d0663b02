#pragma once
#include <vector>
#include "RandomSource.hpp"

// Jitter applied to an interval inside [start, end) is factor * (overlap in days).
struct FuzzBand {
    double start;
    double end;
    double factor;
};

struct FuzzCurve {
    double minInterval = 2.5; // shorter intervals are never fuzzed
    std::vector<FuzzBand> bands = {
        { 2.5, 7.0, 0.15 },
        { 7.0, 20.0, 0.10 },
        { 20.0, 1e12, 0.05 },
    };
};

struct FuzzRange {
    int min;
    int max;
};

/*
  Spreads due dates of items that would otherwise land on the same day.
  The jitter is bounded by the curve; results never drop below 2 days or
  exceed the configured maximum interval.
*/
class IntervalFuzzer {
public:
    explicit IntervalFuzzer(FuzzCurve curve = FuzzCurve{});

    bool appliesTo(int intervalDays) const;
    FuzzRange bounds(int intervalDays, int maxIntervalDays) const;
    int apply(int intervalDays, int maxIntervalDays, RandomSource& random) const;

    const FuzzCurve& curve() const { return fuzzCurve; }

private:
    FuzzCurve fuzzCurve;
};
