#pragma once
#include <array>
#include <optional>
#include <string>

// Integer values are used directly in the memory model arithmetic (grade - 3, grade - 1).
enum class Rating {
    AGAIN = 1,
    HARD = 2,
    GOOD = 3,
    EASY = 4
};

inline int ratingValue(Rating r) {
    return static_cast<int>(r);
}

inline std::optional<Rating> ratingFromInt(int value) {
    if (value < 1 || value > 4) return std::nullopt;
    return static_cast<Rating>(value);
}

inline std::string ratingLabel(Rating r) {
    switch (r) {
    case Rating::AGAIN: return "Again";
    case Rating::HARD: return "Hard";
    case Rating::GOOD: return "Good";
    case Rating::EASY: return "Easy";
    }
    return "Again";
}

inline const std::array<Rating, 4>& allRatings() {
    static const std::array<Rating, 4> ratings = {
        Rating::AGAIN, Rating::HARD, Rating::GOOD, Rating::EASY
    };
    return ratings;
}
