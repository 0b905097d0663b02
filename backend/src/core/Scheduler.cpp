#include "Scheduler.hpp"
#include "MemoryModel.hpp"
#include "StateTransition.hpp"
#include <algorithm>
#include <utility>

Scheduler::Scheduler(const FSRSConfig& config, RandomSource* random, FuzzCurve fuzzCurve)
    : cfg(ConfigNormalizer::normalize(config)),
    rng(random),
    intervalFuzzer(std::move(fuzzCurve))
{
    spdlog::info("Scheduler initialized: {} retention={:.2f} custom_weights={}",
        versionLabel(cfg.version), cfg.requestedRetention, usesCustomWeights(cfg));
}

Scheduler::Scheduler(const RawFSRSConfig& raw, RandomSource* random, FuzzCurve fuzzCurve)
    : Scheduler(ConfigNormalizer::normalize(raw), random, std::move(fuzzCurve))
{
}

void Scheduler::setConfig(const FSRSConfig& config) {
    cfg = ConfigNormalizer::normalize(config);
    spdlog::info("Scheduler config replaced: {} retention={:.2f} custom_weights={}",
        versionLabel(cfg.version), cfg.requestedRetention, usesCustomWeights(cfg));
}

void Scheduler::setConfig(const RawFSRSConfig& raw) {
    setConfig(ConfigNormalizer::normalize(raw));
}

int Scheduler::elapsedDaysSince(const FSRSState& state, const Date& today) {
    if (!state.lastReview) return 0;
    return static_cast<int>(std::max(0L, state.lastReview->daysUntil(today)));
}

/*
  Public API:
    - review(state, rating, options)
    - previewAllRatings(state, elapsed?, today?)
*/

ReviewOutcome Scheduler::review(const FSRSState& state, Rating rating, const ReviewOptions& options) const {
    const Date today = options.today ? *options.today : Date::today();
    const int elapsedDays = options.customElapsedDays
        ? std::max(0, *options.customElapsedDays)
        : elapsedDaysSince(state, today);

    TransitionResult t = StateTransition::transition(state, rating, cfg, elapsedDays);

    const int intervalDays = canonicalInterval(state, rating, elapsedDays, t.newStability);
    int scheduledDays = intervalDays;
    if (options.applyFuzzing) {
        if (rng) {
            scheduledDays = intervalFuzzer.apply(intervalDays, cfg.maxIntervalDays, *rng);
        }
        else {
            spdlog::warn("Fuzzing requested without a random source; keeping {}d", intervalDays);
        }
    }

    ReviewOutcome out;
    out.newState.difficulty = t.newDifficulty;
    out.newState.stability = t.newStability;
    out.newState.lastReview = today;
    out.newState.nextReview = today.addDays(scheduledDays);
    out.intervalDays = intervalDays;
    out.scheduledDays = scheduledDays;
    out.retrievability = t.retrievability;

    spdlog::info("Review rating={} elapsed={}d -> interval={}d scheduled={}d next={}",
        ratingLabel(rating), elapsedDays, intervalDays, scheduledDays, out.newState.nextReview->toIso());
    return out;
}

std::array<RatingPreview, 4> Scheduler::previewAllRatings(const FSRSState& state,
    std::optional<int> elapsedDaysOverride, std::optional<Date> today) const
{
    ReviewOptions options;
    options.customElapsedDays = elapsedDaysOverride;
    options.applyFuzzing = false;
    options.today = today ? *today : Date::today();

    std::array<RatingPreview, 4> previews{};
    const auto& ratings = allRatings();
    for (std::size_t i = 0; i < ratings.size(); ++i) {
        previews[i] = RatingPreview{ ratings[i], review(state, ratings[i], options) };
    }
    return previews;
}

double Scheduler::currentRetrievability(const FSRSState& state, std::optional<Date> today) const {
    if (state.isNew()) return 0.0;
    const Date day = today ? *today : Date::today();
    return MemoryModel::retrievabilityAt(state.stability, elapsedDaysSince(state, day), cfg);
}

/*
  Interval in whole days for the rating actually chosen.
  All four ratings are solved together so that the buttons always offer
  distinct, increasing intervals (the cap may collapse them):
    again >= againMinIntervalDays
    hard >= again + 1, hard <= good
    good >= hard + 1, easy >= good + 1
*/
int Scheduler::canonicalInterval(const FSRSState& state, Rating rating, int elapsedDays, double newStability) const {
    const int cap = cfg.maxIntervalDays;

    auto solve = [&](Rating r) {
        double s = (r == rating)
            ? newStability
            : StateTransition::transition(state, r, cfg, elapsedDays).newStability;
        return MemoryModel::intervalDays(s, cfg);
    };

    int again = std::min(cap, std::max(solve(Rating::AGAIN), cfg.againMinIntervalDays));
    int hard = solve(Rating::HARD);
    int good = solve(Rating::GOOD);
    int easy = solve(Rating::EASY);

    hard = std::min(hard, good);
    hard = std::min(cap, std::max(hard, again + 1));
    good = std::min(cap, std::max(good, hard + 1));
    easy = std::min(cap, std::max(easy, good + 1));

    switch (rating) {
    case Rating::AGAIN: return again;
    case Rating::HARD: return hard;
    case Rating::GOOD: return good;
    case Rating::EASY: return easy;
    }
    return good;
}
