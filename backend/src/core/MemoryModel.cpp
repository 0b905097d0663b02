#include "MemoryModel.hpp"
#include "WeightTable.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace {
constexpr double FSRS5_DECAY = -0.5;
constexpr double FSRS5_FACTOR = 19.0 / 81.0;
}

CurveParams MemoryModel::curveParams(FSRSVersion version, const std::vector<double>& weights) {
    if (version != FSRSVersion::V6 || weights.size() < 21) {
        return CurveParams{ FSRS5_DECAY, FSRS5_FACTOR };
    }

    // decay = -w[20]; a non-positive w[20] has no finite, falling curve.
    double decay = -weights[20];
    double factor = std::pow(0.9, 1.0 / decay) - 1.0;
    if (!(decay < 0.0) || !std::isfinite(factor) || !(factor > 0.0)) {
        spdlog::debug("FSRS-6 decay weight {} gives no usable curve, using {}", weights[20], FSRS6_DEFAULT_WEIGHTS[20]);
        decay = -FSRS6_DEFAULT_WEIGHTS[20];
        factor = std::pow(0.9, 1.0 / decay) - 1.0;
    }

    return CurveParams{ decay, factor };
}

CurveParams MemoryModel::curveParams(const FSRSConfig& config) {
    return curveParams(config.version, WeightTable::activeWeights(config));
}

double MemoryModel::retrievability(double stability, double elapsedDays, const CurveParams& curve) {
    if (stability <= 0.0) return 0.0;
    double t = std::max(0.0, elapsedDays);
    return std::pow(1.0 + curve.factor * t / stability, curve.decay);
}

double MemoryModel::retrievabilityAt(double stability, double elapsedDays, const FSRSConfig& config) {
    return retrievability(stability, elapsedDays, curveParams(config));
}

int MemoryModel::intervalDays(double stability, double requestedRetention, const CurveParams& curve, int maxIntervalDays) {
    if (stability <= 0.0) return 1;

    // Analytic inverse of retrievability(): solve R(t) == requestedRetention for t.
    double raw = (stability / curve.factor) * (std::pow(requestedRetention, 1.0 / curve.decay) - 1.0);
    if (!std::isfinite(raw)) {
        spdlog::warn("Interval for stability={} retention={} is not finite; using 1 day", stability, requestedRetention);
        return 1;
    }

    double cap = static_cast<double>(std::max(1, maxIntervalDays));
    double days = std::clamp(std::round(raw), 1.0, cap);
    return static_cast<int>(days);
}

int MemoryModel::intervalDays(double stability, const FSRSConfig& config) {
    return intervalDays(stability, config.requestedRetention, curveParams(config), config.maxIntervalDays);
}
