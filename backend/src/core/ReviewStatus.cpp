#include "ReviewStatus.hpp"
#include <cstdlib>

std::optional<int> daysUntilReview(const std::optional<Date>& nextReview, const Date& today) {
    if (!nextReview) return std::nullopt;
    return static_cast<int>(today.daysUntil(*nextReview));
}

bool isReviewDue(const std::optional<Date>& nextReview, const Date& today) {
    return nextReview && *nextReview <= today;
}

ReviewStatus reviewStatus(const std::optional<Date>& nextReview, const Date& today) {
    std::optional<int> d = daysUntilReview(nextReview, today);
    if (!d) return ReviewStatus{ "No review", ReviewUrgency::NONE, false };

    const int days = *d;
    if (days < 0) return ReviewStatus{ "Overdue (" + std::to_string(std::abs(days)) + "d)", ReviewUrgency::OVERDUE, true };
    if (days == 0) return ReviewStatus{ "Today!", ReviewUrgency::TODAY, true };
    if (days == 1) return ReviewStatus{ "Tomorrow", ReviewUrgency::TOMORROW, true };

    const std::string text = "In " + std::to_string(days) + " days";
    if (days <= 3) return ReviewStatus{ text, ReviewUrgency::SOON, true };
    return ReviewStatus{ text, ReviewUrgency::NORMAL, days <= 7 };
}

std::string urgencyName(ReviewUrgency urgency) {
    switch (urgency) {
    case ReviewUrgency::NONE: return "none";
    case ReviewUrgency::OVERDUE: return "overdue";
    case ReviewUrgency::TODAY: return "today";
    case ReviewUrgency::TOMORROW: return "tomorrow";
    case ReviewUrgency::SOON: return "soon";
    case ReviewUrgency::NORMAL: return "normal";
    }
    return "none";
}

DifficultyLabel difficultyLabel(double difficulty) {
    if (difficulty <= 2.0) return DifficultyLabel{ "Very easy", 1 };
    if (difficulty <= 4.0) return DifficultyLabel{ "Easy", 2 };
    if (difficulty <= 6.0) return DifficultyLabel{ "Medium", 3 };
    if (difficulty <= 8.0) return DifficultyLabel{ "Hard", 4 };
    return DifficultyLabel{ "Very hard", 5 };
}

std::optional<Rating> suggestRatingFromPerformance(int questionsTotal, int questionsCorrect) {
    if (questionsTotal <= 0) return std::nullopt;

    const double accuracy = static_cast<double>(questionsCorrect) / static_cast<double>(questionsTotal);
    if (accuracy >= 0.9) return Rating::EASY;
    if (accuracy >= 0.7) return Rating::GOOD;
    if (accuracy >= 0.5) return Rating::HARD;
    return Rating::AGAIN;
}
