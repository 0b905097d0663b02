#pragma once
#include <array>
#include <cstddef>
#include <vector>
#include "FSRSConfig.hpp"

// Published reference parameters. Treated as data; never tuned here.
extern const std::array<double, 19> FSRS5_DEFAULT_WEIGHTS;
extern const std::array<double, 21> FSRS6_DEFAULT_WEIGHTS;

class WeightTable {
public:
    static std::size_t expectedArity(FSRSVersion version);
    static std::vector<double> defaultWeights(FSRSVersion version);

    // Custom weights when the config carries them, defaults otherwise.
    static std::vector<double> activeWeights(const FSRSConfig& config);
};
