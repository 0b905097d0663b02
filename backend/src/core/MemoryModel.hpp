#pragma once
#include <vector>
#include "FSRSConfig.hpp"

// Forgetting curve constants: R(t) = (1 + factor * t / S) ^ decay
struct CurveParams {
    double decay;
    double factor;
};

/*
  Power-law forgetting curve and its inverse.
    - v5 uses the fixed pair (-0.5, 19/81)
    - v6 derives both from w[20] so that R(S) == 0.9
*/
class MemoryModel {
public:
    static CurveParams curveParams(FSRSVersion version, const std::vector<double>& weights);
    static CurveParams curveParams(const FSRSConfig& config);

    // Probability of recall after elapsedDays; 0 for an item with no stability.
    static double retrievability(double stability, double elapsedDays, const CurveParams& curve);
    static double retrievabilityAt(double stability, double elapsedDays, const FSRSConfig& config);

    // Days until retrievability falls to the requested retention. Always >= 1 and <= maxIntervalDays.
    static int intervalDays(double stability, double requestedRetention, const CurveParams& curve, int maxIntervalDays);
    static int intervalDays(double stability, const FSRSConfig& config);
};
