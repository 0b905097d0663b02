#pragma once
#include <optional>
#include <vector>
#include "FSRSConfig.hpp"
#include "FSRSState.hpp"
#include "MemoryModel.hpp"
#include "Rating.hpp"

struct TransitionResult {
    double newDifficulty;
    double newStability;
    std::optional<double> retrievability; // empty for the first review
};

/*
  Memory state update for a single review.

  Branches:
    - first review:   S = w[G-1], D = D0(G)
    - same day:       short-term stability boost (never shrinks for Good/Easy)
    - forgot:         post-lapse stability, driven by how much had decayed
    - recalled:       stability growth, scaled down for Hard and up for Easy

  Difficulty always drifts by rating and mean-reverts toward D0(Easy).
*/
class StateTransition {
public:
    static TransitionResult transition(const FSRSState& current, Rating rating,
        const FSRSConfig& config, int elapsedDays);

    static double initialDifficulty(const std::vector<double>& w, Rating rating); // unclamped D0
    static double nextDifficulty(const std::vector<double>& w, double difficulty, Rating rating);
    static double sameDayStability(const std::vector<double>& w, FSRSVersion version, double stability, Rating rating);
    static double forgetStability(const std::vector<double>& w, double difficulty, double stability, double retrievability);
    static double recallStability(const std::vector<double>& w, double difficulty, double stability,
        double retrievability, Rating rating);

    static constexpr double MIN_DIFFICULTY = 1.0;
    static constexpr double MAX_DIFFICULTY = 10.0;
    static constexpr double MIN_STABILITY = 0.1;
};
