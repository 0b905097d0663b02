#include "WeightsInput.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <spdlog/fmt/fmt.h>

std::vector<double> WeightsInput::parse(const std::string& text) {
    std::vector<double> out;
    std::string token;

    auto flush = [&]() {
        if (token.empty()) return;
        char* end = nullptr;
        double v = std::strtod(token.c_str(), &end);
        if (end && *end == '\0' && std::isfinite(v)) {
            out.push_back(v);
        }
        token.clear();
    };

    for (char c : text) {
        if (c == ',' || std::isspace(static_cast<unsigned char>(c))) flush();
        else token.push_back(c);
    }
    flush();

    return out;
}

std::string WeightsInput::format(const std::vector<double>& weights) {
    std::ostringstream oss;
    for (size_t i = 0; i < weights.size(); ++i) {
        if (i) oss << ", ";
        oss << fmt::format("{}", weights[i]);
    }
    return oss.str();
}
