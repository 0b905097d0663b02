#include "FSRSConfig.hpp"
#include "WeightTable.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

std::string versionLabel(FSRSVersion v) {
    return v == FSRSVersion::V6 ? "FSRS-6" : "FSRS-5";
}

std::string versionKey(FSRSVersion v) {
    return v == FSRSVersion::V6 ? "fsrs6" : "fsrs5";
}

std::optional<FSRSVersion> parseVersion(const std::string& text) {
    if (text == "fsrs5") return FSRSVersion::V5;
    if (text == "fsrs6") return FSRSVersion::V6;
    return std::nullopt;
}

FSRSConfig ConfigNormalizer::defaults() {
    return FSRSConfig{};
}

FSRSConfig ConfigNormalizer::normalize(const RawFSRSConfig& raw) {
    FSRSConfig out;

    // Anything other than an explicit fsrs6 selects v5.
    out.version = (raw.version && *raw.version == "fsrs6") ? FSRSVersion::V6 : FSRSVersion::V5;
    if (raw.version && !parseVersion(*raw.version)) {
        spdlog::warn("Unknown FSRS version '{}', using {}", *raw.version, versionLabel(out.version));
    }

    out.requestedRetention = normalizeRetention(raw.requestedRetention);
    out.customWeights = normalizeWeights(out.version, raw.customWeights);

    out.maxIntervalDays = normalizeDays(raw.maxIntervalDays, DEFAULT_MAX_INTERVAL_DAYS,
        1, DEFAULT_MAX_INTERVAL_DAYS, "maxIntervalDays");
    out.againMinIntervalDays = normalizeDays(raw.againMinIntervalDays, 1,
        1, out.maxIntervalDays, "againMinIntervalDays");

    spdlog::debug("FSRS config normalized: {} retention={:.3f} custom_weights={} again_min={} max={}",
        versionLabel(out.version), out.requestedRetention, out.customWeights.has_value(),
        out.againMinIntervalDays, out.maxIntervalDays);
    return out;
}

FSRSConfig ConfigNormalizer::normalize(const FSRSConfig& config) {
    RawFSRSConfig raw;
    raw.version = versionKey(config.version);
    raw.requestedRetention = config.requestedRetention;
    raw.customWeights = config.customWeights;
    raw.againMinIntervalDays = config.againMinIntervalDays;
    raw.maxIntervalDays = config.maxIntervalDays;
    return normalize(raw);
}

double ConfigNormalizer::normalizeRetention(std::optional<double> value) {
    if (!value) return DEFAULT_REQUESTED_RETENTION;

    if (!std::isfinite(*value)) {
        spdlog::warn("Requested retention is not a finite number; using {:.2f}", DEFAULT_REQUESTED_RETENTION);
        return DEFAULT_REQUESTED_RETENTION;
    }

    double r = std::clamp(*value, MIN_REQUESTED_RETENTION, MAX_REQUESTED_RETENTION);
    if (r != *value) {
        spdlog::warn("Requested retention {} clamped to {}", *value, r);
    }
    return r;
}

std::optional<std::vector<double>> ConfigNormalizer::normalizeWeights(FSRSVersion version,
    const std::optional<std::vector<double>>& weights)
{
    if (!weights) return std::nullopt;

    const std::size_t expected = WeightTable::expectedArity(version);
    if (weights->size() != expected) {
        spdlog::warn("Custom weights rejected: {} expects {} values, got {}",
            versionLabel(version), expected, weights->size());
        return std::nullopt;
    }

    bool allFinite = std::all_of(weights->begin(), weights->end(),
        [](double w) { return std::isfinite(w); });
    if (!allFinite) {
        spdlog::warn("Custom weights rejected: non-finite value present");
        return std::nullopt;
    }

    return weights;
}

int ConfigNormalizer::normalizeDays(std::optional<double> value, int fallback, int lo, int hi, const char* field) {
    if (!value) return fallback;

    if (!std::isfinite(*value)) {
        spdlog::warn("{} is not a finite number; using {}", field, fallback);
        return fallback;
    }

    double rounded = std::round(*value);
    int days = static_cast<int>(std::clamp(rounded, static_cast<double>(lo), static_cast<double>(hi)));
    if (static_cast<double>(days) != *value) {
        spdlog::warn("{} {} adjusted to {}", field, *value, days);
    }
    return days;
}

bool usesCustomWeights(const FSRSConfig& config) {
    return config.customWeights.has_value();
}
