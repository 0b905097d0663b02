#pragma once
#include <array>
#include <optional>
#include <spdlog/spdlog.h>
#include "Date.hpp"
#include "FSRSConfig.hpp"
#include "FSRSState.hpp"
#include "IntervalFuzzer.hpp"
#include "RandomSource.hpp"
#include "Rating.hpp"

struct ReviewOptions {
    std::optional<int> customElapsedDays; // overrides the lastReview -> today distance
    bool applyFuzzing = false;
    std::optional<Date> today;            // defaults to the local calendar day
};

struct ReviewOutcome {
    FSRSState newState;
    int intervalDays;                     // canonical, unfuzzed
    int scheduledDays;                    // what nextReview is based on
    std::optional<double> retrievability; // empty for the first review
};

struct RatingPreview {
    Rating rating;
    ReviewOutcome outcome;
};

/*
  Review facade over the FSRS engine:
   - elapsed days from lastReview (or the caller's override)
   - memory state transition
   - interval for the requested retention, bounded by the config
   - Again < Hard < Good < Easy kept strictly ordered in days
   - optional fuzzing of the scheduled day

  The config is normalized on the way in; states are taken by const reference
  and a fresh one is returned.
*/
class Scheduler {
public:
    explicit Scheduler(const FSRSConfig& config = FSRSConfig{}, RandomSource* random = nullptr,
        FuzzCurve fuzzCurve = FuzzCurve{});
    explicit Scheduler(const RawFSRSConfig& raw, RandomSource* random = nullptr,
        FuzzCurve fuzzCurve = FuzzCurve{});

    ReviewOutcome review(const FSRSState& state, Rating rating, const ReviewOptions& options = ReviewOptions{}) const;

    // What each rating would produce, without fuzzing. Pure.
    std::array<RatingPreview, 4> previewAllRatings(const FSRSState& state,
        std::optional<int> elapsedDaysOverride = std::nullopt,
        std::optional<Date> today = std::nullopt) const;

    // Estimated recall probability of an item right now (or on `today`).
    double currentRetrievability(const FSRSState& state, std::optional<Date> today = std::nullopt) const;

    const FSRSConfig& config() const { return cfg; }
    void setConfig(const FSRSConfig& config);
    void setConfig(const RawFSRSConfig& raw);

    void setRandomSource(RandomSource* random) { rng = random; }
    const IntervalFuzzer& fuzzer() const { return intervalFuzzer; }

    static int elapsedDaysSince(const FSRSState& state, const Date& today);

private:
    FSRSConfig cfg;
    RandomSource* rng;   // not owned; fuzzing is skipped when null
    IntervalFuzzer intervalFuzzer;

    int canonicalInterval(const FSRSState& state, Rating rating, int elapsedDays, double newStability) const;
};
