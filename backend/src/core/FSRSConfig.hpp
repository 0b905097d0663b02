#pragma once
#include <optional>
#include <string>
#include <vector>

enum class FSRSVersion {
    V5,
    V6
};

// Qualified configuration. Only ConfigNormalizer produces one the engine trusts.
struct FSRSConfig {
    FSRSVersion version = FSRSVersion::V5;
    double requestedRetention = 0.90;               // [0.01, 0.999]
    std::optional<std::vector<double>> customWeights; // arity == expectedArity(version)
    int againMinIntervalDays = 1;                  // [1, maxIntervalDays]
    int maxIntervalDays = 36500;                   // [1, 36500]
};

// Config as loaded from disk or edited by the user; any field may be missing or bogus.
struct RawFSRSConfig {
    std::optional<std::string> version;            // "fsrs5" | "fsrs6"
    std::optional<double> requestedRetention;
    std::optional<std::vector<double>> customWeights;
    std::optional<double> againMinIntervalDays;
    std::optional<double> maxIntervalDays;
};

constexpr double DEFAULT_REQUESTED_RETENTION = 0.90;
constexpr double MIN_REQUESTED_RETENTION = 0.01;
constexpr double MAX_REQUESTED_RETENTION = 0.999;
constexpr int DEFAULT_MAX_INTERVAL_DAYS = 36500;

std::string versionLabel(FSRSVersion v); // "FSRS-5"
std::string versionKey(FSRSVersion v);   // "fsrs5"
std::optional<FSRSVersion> parseVersion(const std::string& text);

/*
  Validates and clamps configuration. Never throws: out-of-range values are
  pulled to the nearest valid value and unusable weight vectors are dropped so
  the defaults apply. Every repair is logged at warn level.
*/
class ConfigNormalizer {
public:
    static FSRSConfig normalize(const RawFSRSConfig& raw);
    static FSRSConfig normalize(const FSRSConfig& config);
    static FSRSConfig defaults();

private:
    static double normalizeRetention(std::optional<double> value);
    static std::optional<std::vector<double>> normalizeWeights(FSRSVersion version,
        const std::optional<std::vector<double>>& weights);
    static int normalizeDays(std::optional<double> value, int fallback, int lo, int hi, const char* field);
};

bool usesCustomWeights(const FSRSConfig& config);
