#pragma once
#include <optional>
#include <string>
#include "Date.hpp"
#include "Rating.hpp"

enum class ReviewUrgency {
    NONE,
    OVERDUE,
    TODAY,
    TOMORROW,
    SOON,
    NORMAL
};

struct ReviewStatus {
    std::string text;
    ReviewUrgency urgency;
    bool withinWeek; // due in 7 days or less (overdue counts)
};

struct DifficultyLabel {
    std::string text;
    int bucket; // 1 (very easy) .. 5 (very hard)
};

// Signed day distance from today; negative means overdue.
std::optional<int> daysUntilReview(const std::optional<Date>& nextReview, const Date& today = Date::today());

bool isReviewDue(const std::optional<Date>& nextReview, const Date& today = Date::today());

ReviewStatus reviewStatus(const std::optional<Date>& nextReview, const Date& today = Date::today());

std::string urgencyName(ReviewUrgency urgency);

DifficultyLabel difficultyLabel(double difficulty);

// Accuracy on practice questions mapped to a rating; none when nothing was answered.
std::optional<Rating> suggestRatingFromPerformance(int questionsTotal, int questionsCorrect);
