#include <gtest/gtest.h>
#include "ReviewStatus.hpp"

namespace {
const Date today = Date::fromYmd(2026, 2, 14);
}

TEST(ReviewStatusTest, DaysUntilReviewIsSigned) {
    EXPECT_FALSE(daysUntilReview(std::nullopt, today).has_value());
    EXPECT_EQ(*daysUntilReview(today.addDays(5), today), 5);
    EXPECT_EQ(*daysUntilReview(today.addDays(-2), today), -2);
    EXPECT_EQ(*daysUntilReview(today, today), 0);
}

TEST(ReviewStatusTest, DueWhenTodayOrEarlier) {
    EXPECT_FALSE(isReviewDue(std::nullopt, today));
    EXPECT_TRUE(isReviewDue(today, today));
    EXPECT_TRUE(isReviewDue(today.addDays(-3), today));
    EXPECT_FALSE(isReviewDue(today.addDays(1), today));
}

TEST(ReviewStatusTest, ClassifiesByDayBoundaries) {
    ReviewStatus none = reviewStatus(std::nullopt, today);
    EXPECT_EQ(none.urgency, ReviewUrgency::NONE);
    EXPECT_EQ(none.text, "No review");

    ReviewStatus overdue = reviewStatus(today.addDays(-4), today);
    EXPECT_EQ(overdue.urgency, ReviewUrgency::OVERDUE);
    EXPECT_EQ(overdue.text, "Overdue (4d)");

    ReviewStatus dueToday = reviewStatus(today, today);
    EXPECT_EQ(dueToday.urgency, ReviewUrgency::TODAY);
    EXPECT_EQ(dueToday.text, "Today!");

    ReviewStatus tomorrow = reviewStatus(today.addDays(1), today);
    EXPECT_EQ(tomorrow.urgency, ReviewUrgency::TOMORROW);
    EXPECT_EQ(tomorrow.text, "Tomorrow");

    EXPECT_EQ(reviewStatus(today.addDays(2), today).urgency, ReviewUrgency::SOON);
    ReviewStatus three = reviewStatus(today.addDays(3), today);
    EXPECT_EQ(three.urgency, ReviewUrgency::SOON);
    EXPECT_EQ(three.text, "In 3 days");

    ReviewStatus four = reviewStatus(today.addDays(4), today);
    EXPECT_EQ(four.urgency, ReviewUrgency::NORMAL);
    EXPECT_TRUE(four.withinWeek);

    ReviewStatus seven = reviewStatus(today.addDays(7), today);
    EXPECT_EQ(seven.urgency, ReviewUrgency::NORMAL);
    EXPECT_TRUE(seven.withinWeek);

    ReviewStatus eight = reviewStatus(today.addDays(8), today);
    EXPECT_EQ(eight.urgency, ReviewUrgency::NORMAL);
    EXPECT_FALSE(eight.withinWeek);
    EXPECT_EQ(eight.text, "In 8 days");
}

TEST(ReviewStatusTest, UrgencyNames) {
    EXPECT_EQ(urgencyName(ReviewUrgency::OVERDUE), "overdue");
    EXPECT_EQ(urgencyName(ReviewUrgency::SOON), "soon");
    EXPECT_EQ(urgencyName(ReviewUrgency::NONE), "none");
}

TEST(DifficultyLabelTest, FiveBuckets) {
    EXPECT_EQ(difficultyLabel(1.0).bucket, 1);
    EXPECT_EQ(difficultyLabel(2.0).bucket, 1);
    EXPECT_EQ(difficultyLabel(2.01).bucket, 2);
    EXPECT_EQ(difficultyLabel(4.0).bucket, 2);
    EXPECT_EQ(difficultyLabel(4.5).bucket, 3);
    EXPECT_EQ(difficultyLabel(6.0).bucket, 3);
    EXPECT_EQ(difficultyLabel(8.0).bucket, 4);
    EXPECT_EQ(difficultyLabel(8.01).bucket, 5);
    EXPECT_EQ(difficultyLabel(10.0).text, "Very hard");
    EXPECT_EQ(difficultyLabel(5.0).text, "Medium");
}

TEST(SuggestRatingTest, AccuracyThresholds) {
    EXPECT_FALSE(suggestRatingFromPerformance(0, 0).has_value());
    EXPECT_EQ(*suggestRatingFromPerformance(10, 9), Rating::EASY);
    EXPECT_EQ(*suggestRatingFromPerformance(10, 10), Rating::EASY);
    EXPECT_EQ(*suggestRatingFromPerformance(10, 8), Rating::GOOD);
    EXPECT_EQ(*suggestRatingFromPerformance(10, 7), Rating::GOOD);
    EXPECT_EQ(*suggestRatingFromPerformance(10, 6), Rating::HARD);
    EXPECT_EQ(*suggestRatingFromPerformance(10, 5), Rating::HARD);
    EXPECT_EQ(*suggestRatingFromPerformance(10, 4), Rating::AGAIN);
    EXPECT_EQ(*suggestRatingFromPerformance(3, 0), Rating::AGAIN);
}

TEST(RatingTest, IntegerValuesAndLabels) {
    EXPECT_EQ(ratingValue(Rating::AGAIN), 1);
    EXPECT_EQ(ratingValue(Rating::EASY), 4);
    EXPECT_EQ(ratingLabel(Rating::HARD), "Hard");
    EXPECT_FALSE(ratingFromInt(0).has_value());
    EXPECT_FALSE(ratingFromInt(5).has_value());
    EXPECT_EQ(*ratingFromInt(3), Rating::GOOD);
}
