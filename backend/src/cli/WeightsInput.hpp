#pragma once
#include <string>
#include <vector>

// Free-form weight text from the settings menu. The engine never sees raw text.
class WeightsInput {
public:
    // Splits on commas and whitespace; tokens that are not finite numbers are dropped.
    static std::vector<double> parse(const std::string& text);

    // "w0, w1, ..." using the shortest round-trippable form of each value.
    static std::string format(const std::vector<double>& weights);
};
