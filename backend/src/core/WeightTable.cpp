#include "WeightTable.hpp"

const std::array<double, 19> FSRS5_DEFAULT_WEIGHTS = {
    0.40255, 1.18385, 3.173, 15.69105,
    7.1949, 0.5345,
    1.4604, 0.0046, 1.54575, 0.1192,
    1.01925, 1.9395, 0.11, 0.29605,
    2.2698, 0.2315, 2.9898,
    0.51655, 0.6621
};

const std::array<double, 21> FSRS6_DEFAULT_WEIGHTS = {
    0.212, 1.2931, 2.3065, 8.2956,
    6.4133, 0.8334,
    3.0194, 0.001, 1.8722, 0.1666,
    0.796, 1.4835, 0.0614, 0.2629,
    1.6483, 0.6014, 1.8729,
    0.5425, 0.0912, 0.0658,
    0.1542
};

std::size_t WeightTable::expectedArity(FSRSVersion version) {
    return version == FSRSVersion::V6 ? FSRS6_DEFAULT_WEIGHTS.size() : FSRS5_DEFAULT_WEIGHTS.size();
}

std::vector<double> WeightTable::defaultWeights(FSRSVersion version) {
    if (version == FSRSVersion::V6)
        return std::vector<double>(FSRS6_DEFAULT_WEIGHTS.begin(), FSRS6_DEFAULT_WEIGHTS.end());
    return std::vector<double>(FSRS5_DEFAULT_WEIGHTS.begin(), FSRS5_DEFAULT_WEIGHTS.end());
}

std::vector<double> WeightTable::activeWeights(const FSRSConfig& config) {
    if (config.customWeights && config.customWeights->size() == expectedArity(config.version))
        return *config.customWeights;
    return defaultWeights(config.version);
}
