#include "StateTransition.hpp"
#include "WeightTable.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace {

double round2(double v) {
    return std::round(v * 100.0) / 100.0;
}

double clampDifficulty(double d) {
    return std::clamp(d, StateTransition::MIN_DIFFICULTY, StateTransition::MAX_DIFFICULTY);
}

const char* branchName(bool first, int elapsedDays, Rating rating) {
    if (first) return "first";
    if (elapsedDays == 0) return "same-day";
    return rating == Rating::AGAIN ? "forgot" : "recalled";
}

} // namespace

TransitionResult StateTransition::transition(const FSRSState& current, Rating rating,
    const FSRSConfig& config, int elapsedDays)
{
    const std::vector<double> w = WeightTable::activeWeights(config);
    const int g = ratingValue(rating);
    elapsedDays = std::max(0, elapsedDays);

    TransitionResult out{ 0.0, 0.0, std::nullopt };

    if (current.isNew()) {
        // Nothing to forget yet: stability comes straight from the table.
        out.newStability = std::max(MIN_STABILITY, w[g - 1]);
        out.newDifficulty = round2(clampDifficulty(initialDifficulty(w, rating)));
    }
    else {
        const double r = MemoryModel::retrievability(current.stability, elapsedDays,
            MemoryModel::curveParams(config.version, w));
        out.retrievability = r;

        double d = nextDifficulty(w, current.difficulty, rating);
        double s = 0.0;
        if (elapsedDays == 0) {
            s = sameDayStability(w, config.version, current.stability, rating);
        }
        else if (rating == Rating::AGAIN) {
            s = forgetStability(w, d, current.stability, r);
        }
        else {
            s = recallStability(w, d, current.stability, r, rating);
        }

        out.newDifficulty = round2(d);
        out.newStability = std::max(MIN_STABILITY, round2(s));
    }

    spdlog::debug("FSRS transition [{}] rating={} elapsed={}d D {:.2f} -> {:.2f}, S {:.2f} -> {:.2f}",
        branchName(current.isNew(), elapsedDays, rating), g, elapsedDays,
        current.difficulty, out.newDifficulty, current.stability, out.newStability);

    return out;
}

double StateTransition::initialDifficulty(const std::vector<double>& w, Rating rating) {
    // D0(G) = w4 - exp(w5 * (G - 1)) + 1
    return w[4] - std::exp(w[5] * (ratingValue(rating) - 1)) + 1.0;
}

double StateTransition::nextDifficulty(const std::vector<double>& w, double difficulty, Rating rating) {
    const double delta = -w[6] * (ratingValue(rating) - 3);
    const double damped = difficulty + delta * (MAX_DIFFICULTY - difficulty) / 9.0;
    const double reverted = w[7] * initialDifficulty(w, Rating::EASY) + (1.0 - w[7]) * damped;
    return clampDifficulty(reverted);
}

double StateTransition::sameDayStability(const std::vector<double>& w, FSRSVersion version, double stability, Rating rating) {
    double increment = std::exp(w[17] * (ratingValue(rating) - 3 + w[18]));
    if (version == FSRSVersion::V6) {
        increment *= std::pow(stability, -w[19]);
    }

    // Good/Easy must never shrink stability within the same day.
    if (rating == Rating::GOOD || rating == Rating::EASY) {
        increment = std::max(increment, 1.0);
    }
    return stability * increment;
}

double StateTransition::forgetStability(const std::vector<double>& w, double difficulty, double stability, double retrievability) {
    return w[11]
        * std::pow(difficulty, -w[12])
        * (std::pow(stability + 1.0, w[13]) - 1.0)
        * std::exp(w[14] * (1.0 - retrievability));
}

double StateTransition::recallStability(const std::vector<double>& w, double difficulty, double stability,
    double retrievability, Rating rating)
{
    double sCurve = std::exp(w[8])
        * (11.0 - difficulty)
        * std::pow(stability, -w[9])
        * (std::exp(w[10] * (1.0 - retrievability)) - 1.0);

    if (rating == Rating::HARD) sCurve *= w[15];
    else if (rating == Rating::EASY) sCurve *= w[16];

    return stability * (1.0 + sCurve);
}
