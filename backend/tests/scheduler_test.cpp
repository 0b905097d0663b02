#include <gtest/gtest.h>
#include "MemoryModel.hpp"
#include "Scheduler.hpp"
#include "WeightTable.hpp"

namespace {

class PickHigh : public RandomSource {
public:
    int uniform(int lo, int hi) override { (void)lo; return hi; }
};

Date day(const char* iso) {
    return *Date::parse(iso);
}

FSRSState stateOf(double difficulty, double stability, const char* last, const char* next) {
    FSRSState s;
    s.difficulty = difficulty;
    s.stability = stability;
    s.lastReview = day(last);
    s.nextReview = day(next);
    return s;
}

ReviewOptions on(const char* today, std::optional<int> elapsed = std::nullopt, bool fuzz = false) {
    ReviewOptions o;
    o.today = day(today);
    o.customElapsedDays = elapsed;
    o.applyFuzzing = fuzz;
    return o;
}

Scheduler v6Scheduler(RandomSource* random = nullptr) {
    RawFSRSConfig raw;
    raw.version = "fsrs6";
    return Scheduler(raw, random);
}

} // namespace

TEST(SchedulerTest, NewItemRatedGoodEndToEnd) {
    Scheduler scheduler;
    ReviewOutcome out = scheduler.review(FSRSState{}, Rating::GOOD, on("2026-02-14"));

    EXPECT_DOUBLE_EQ(out.newState.stability, FSRS5_DEFAULT_WEIGHTS[2]);
    EXPECT_DOUBLE_EQ(out.newState.difficulty, 5.28);
    EXPECT_FALSE(out.retrievability.has_value());

    int expected = MemoryModel::intervalDays(out.newState.stability, scheduler.config());
    EXPECT_EQ(out.intervalDays, expected);
    EXPECT_EQ(out.intervalDays, 3);
    EXPECT_GE(out.intervalDays, 1);
    EXPECT_EQ(out.scheduledDays, out.intervalDays);

    ASSERT_TRUE(out.newState.lastReview.has_value());
    ASSERT_TRUE(out.newState.nextReview.has_value());
    EXPECT_EQ(out.newState.lastReview->toIso(), "2026-02-14");
    EXPECT_EQ(out.newState.nextReview->toIso(), "2026-02-17");
}

TEST(SchedulerTest, FirstReviewStabilityMatchesWeightForEveryRating) {
    Scheduler scheduler = v6Scheduler();
    for (Rating r : allRatings()) {
        ReviewOutcome out = scheduler.review(FSRSState{}, r, on("2026-02-14"));
        EXPECT_DOUBLE_EQ(out.newState.stability, FSRS6_DEFAULT_WEIGHTS[ratingValue(r) - 1]);
    }
}

TEST(SchedulerTest, ElapsedDaysComeFromLastReview) {
    Scheduler scheduler;
    FSRSState s = stateOf(6.0, 2.0, "2026-02-18", "2026-02-19");

    ReviewOutcome implicit = scheduler.review(s, Rating::GOOD, on("2026-02-20"));
    ReviewOutcome explicitDays = scheduler.review(s, Rating::GOOD, on("2026-02-20", 2));

    EXPECT_EQ(implicit.newState.stability, explicitDays.newState.stability);
    EXPECT_EQ(implicit.newState.difficulty, explicitDays.newState.difficulty);
    EXPECT_EQ(implicit.intervalDays, explicitDays.intervalDays);
    ASSERT_TRUE(implicit.retrievability.has_value());
    EXPECT_NEAR(*implicit.retrievability, 0.9, 1e-9);
}

TEST(SchedulerTest, InjectedTodayBecomesLastReview) {
    Scheduler scheduler;
    FSRSState s = stateOf(6.0, 2.0, "2026-02-18", "2026-02-19");
    ReviewOutcome out = scheduler.review(s, Rating::GOOD, on("2026-02-20"));
    EXPECT_EQ(out.newState.lastReview->toIso(), "2026-02-20");
    EXPECT_EQ(out.newState.nextReview->toIso(), day("2026-02-20").addDays(out.scheduledDays).toIso());
}

TEST(SchedulerTest, ReviewBeforeLastReviewCountsAsSameDay) {
    Scheduler scheduler;
    FSRSState s = stateOf(5.0, 10.0, "2026-03-01", "2026-03-11");
    ReviewOutcome backdated = scheduler.review(s, Rating::GOOD, on("2026-02-20"));
    ReviewOutcome sameDay = scheduler.review(s, Rating::GOOD, on("2026-02-20", 0));
    EXPECT_EQ(backdated.newState.stability, sameDay.newState.stability);
}

TEST(SchedulerTest, NegativeElapsedOverrideClampedToZero) {
    Scheduler scheduler;
    FSRSState s = stateOf(5.0, 10.0, "2026-02-10", "2026-02-20");
    ReviewOutcome neg = scheduler.review(s, Rating::EASY, on("2026-02-20", -5));
    ReviewOutcome zero = scheduler.review(s, Rating::EASY, on("2026-02-20", 0));
    EXPECT_EQ(neg.newState.stability, zero.newState.stability);
}

TEST(SchedulerTest, RecallIntervalsAfterOneStability) {
    Scheduler scheduler;
    FSRSState s = stateOf(5.0, 10.0, "2026-02-10", "2026-02-20");
    EXPECT_EQ(scheduler.review(s, Rating::AGAIN, on("2026-02-20")).intervalDays, 2);
    EXPECT_EQ(scheduler.review(s, Rating::HARD, on("2026-02-20")).intervalDays, 15);
    EXPECT_EQ(scheduler.review(s, Rating::GOOD, on("2026-02-20")).intervalDays, 33);
    EXPECT_EQ(scheduler.review(s, Rating::EASY, on("2026-02-20")).intervalDays, 88);
}

TEST(SchedulerTest, PreviewIsStrictlyOrdered) {
    Scheduler scheduler;
    FSRSState s = stateOf(7.0, 0.4, "2026-02-14", "2026-02-15");
    auto previews = scheduler.previewAllRatings(s, 1, day("2026-02-15"));

    ASSERT_EQ(previews[1].rating, Rating::HARD);
    ASSERT_EQ(previews[2].rating, Rating::GOOD);
    ASSERT_EQ(previews[3].rating, Rating::EASY);
    EXPECT_LT(previews[1].outcome.scheduledDays, previews[2].outcome.scheduledDays);
    EXPECT_GT(previews[3].outcome.scheduledDays, previews[2].outcome.scheduledDays);
}

TEST(SchedulerTest, OrderingSeparatesCollidingIntervals) {
    // Raw v6 intervals for this state are Hard 2, Good 3, Easy 3.
    Scheduler scheduler = v6Scheduler();
    FSRSState s = stateOf(10.0, 2.0, "2026-02-14", "2026-02-16");
    auto previews = scheduler.previewAllRatings(s, 1, day("2026-02-15"));

    EXPECT_EQ(previews[1].outcome.intervalDays, 2);
    EXPECT_EQ(previews[2].outcome.intervalDays, 3);
    EXPECT_EQ(previews[3].outcome.intervalDays, 4);
}

TEST(SchedulerTest, HardIsScheduledAfterAgain) {
    // Raw v5 intervals for this state are Again 1, Hard 1, Good 2, Easy 7.
    Scheduler scheduler;
    FSRSState s = stateOf(7.0, 0.4, "2026-02-14", "2026-02-15");

    ReviewOutcome forgot = scheduler.review(s, Rating::AGAIN, on("2026-02-15", 1));
    ReviewOutcome hard = scheduler.review(s, Rating::HARD, on("2026-02-15", 1));
    EXPECT_GE(forgot.scheduledDays, 0);
    EXPECT_GT(hard.scheduledDays, forgot.scheduledDays);

    auto previews = scheduler.previewAllRatings(s, 1, day("2026-02-15"));
    EXPECT_EQ(previews[0].outcome.intervalDays, 1);
    EXPECT_EQ(previews[1].outcome.intervalDays, 2);
    EXPECT_EQ(previews[2].outcome.intervalDays, 3);
    EXPECT_EQ(previews[3].outcome.intervalDays, 7);
}

TEST(SchedulerTest, NewItemHardIsScheduledAfterAgain) {
    for (Scheduler scheduler : { Scheduler(), v6Scheduler() }) {
        auto previews = scheduler.previewAllRatings(FSRSState{}, std::nullopt, day("2026-02-14"));
        EXPECT_LT(previews[0].outcome.scheduledDays, previews[1].outcome.scheduledDays);
        EXPECT_LT(previews[1].outcome.scheduledDays, previews[2].outcome.scheduledDays);
    }
}

TEST(SchedulerTest, AgainMinimumPushesHardLater) {
    RawFSRSConfig raw;
    raw.againMinIntervalDays = 20;
    Scheduler scheduler(raw);
    FSRSState s = stateOf(5.0, 10.0, "2026-02-10", "2026-02-20");
    auto previews = scheduler.previewAllRatings(s, std::nullopt, day("2026-02-20"));

    EXPECT_EQ(previews[0].outcome.intervalDays, 20);
    EXPECT_EQ(previews[1].outcome.intervalDays, 21);
    EXPECT_EQ(previews[2].outcome.intervalDays, 33);
}

TEST(SchedulerTest, PreviewOrderingHoldsAcrossStates) {
    for (Scheduler scheduler : { Scheduler(), v6Scheduler() }) {
        for (double d : { 1.0, 4.0, 7.0, 10.0 }) {
            for (double st : { 0.1, 0.4, 1.0, 3.0, 12.0, 90.0 }) {
                for (int elapsed : { 0, 1, 2, 7, 40 }) {
                    FSRSState s = stateOf(d, st, "2026-01-01", "2026-01-02");
                    auto p = scheduler.previewAllRatings(s, elapsed, day("2026-02-15"));
                    EXPECT_LT(p[0].outcome.scheduledDays, p[1].outcome.scheduledDays);
                    EXPECT_LT(p[1].outcome.scheduledDays, p[2].outcome.scheduledDays);
                    EXPECT_LT(p[2].outcome.scheduledDays, p[3].outcome.scheduledDays);
                }
            }
        }
    }
}

TEST(SchedulerTest, PreviewMatchesUnfuzzedReview) {
    Scheduler scheduler;
    FSRSState s = stateOf(7.0, 0.4, "2026-02-14", "2026-02-15");
    auto previews = scheduler.previewAllRatings(s, 1, day("2026-02-15"));

    for (const auto& p : previews) {
        ReviewOutcome out = scheduler.review(s, p.rating, on("2026-02-15", 1));
        EXPECT_EQ(out.scheduledDays, p.outcome.scheduledDays);
        EXPECT_EQ(out.intervalDays, p.outcome.intervalDays);
        EXPECT_EQ(out.newState.stability, p.outcome.newState.stability);
        EXPECT_EQ(out.newState.nextReview, p.outcome.newState.nextReview);
    }
}

TEST(SchedulerTest, DeterministicWithoutFuzzing) {
    SodiumRandom random;
    Scheduler scheduler(FSRSConfig{}, &random);
    FSRSState s = stateOf(5.0, 10.0, "2026-02-10", "2026-02-20");

    ReviewOutcome a = scheduler.review(s, Rating::GOOD, on("2026-02-20"));
    ReviewOutcome b = scheduler.review(s, Rating::GOOD, on("2026-02-20"));
    EXPECT_EQ(a.newState.difficulty, b.newState.difficulty);
    EXPECT_EQ(a.newState.stability, b.newState.stability);
    EXPECT_EQ(a.newState.nextReview, b.newState.nextReview);
    EXPECT_EQ(a.intervalDays, b.intervalDays);
    EXPECT_EQ(a.scheduledDays, b.scheduledDays);
    EXPECT_EQ(a.retrievability, b.retrievability);
}

TEST(SchedulerTest, FuzzingMovesScheduledButNotCanonicalInterval) {
    PickHigh high;
    Scheduler scheduler(FSRSConfig{}, &high);
    FSRSState s = stateOf(5.0, 10.0, "2026-02-10", "2026-02-20");

    ReviewOutcome out = scheduler.review(s, Rating::GOOD, on("2026-02-20", std::nullopt, true));
    EXPECT_EQ(out.intervalDays, 33);
    EXPECT_EQ(out.scheduledDays, 36);
    EXPECT_EQ(out.newState.nextReview->toIso(), day("2026-02-20").addDays(36).toIso());
}

TEST(SchedulerTest, FuzzingStaysWithinBoundsWithRealRandomness) {
    SeededRandom random(2026);
    Scheduler scheduler(FSRSConfig{}, &random);
    FSRSState s = stateOf(5.0, 10.0, "2026-02-10", "2026-02-20");

    for (int i = 0; i < 20; ++i) {
        ReviewOutcome out = scheduler.review(s, Rating::GOOD, on("2026-02-20", std::nullopt, true));
        EXPECT_EQ(out.intervalDays, 33);
        EXPECT_GE(out.scheduledDays, 30);
        EXPECT_LE(out.scheduledDays, 36);
    }
}

TEST(SchedulerTest, FuzzingWithoutRandomSourceIsIdentity) {
    Scheduler scheduler;
    FSRSState s = stateOf(5.0, 10.0, "2026-02-10", "2026-02-20");
    ReviewOutcome out = scheduler.review(s, Rating::GOOD, on("2026-02-20", std::nullopt, true));
    EXPECT_EQ(out.scheduledDays, out.intervalDays);
}

TEST(SchedulerTest, AgainHonoursMinimumInterval) {
    RawFSRSConfig raw;
    raw.againMinIntervalDays = 5;
    Scheduler scheduler(raw);
    FSRSState s = stateOf(5.0, 10.0, "2026-02-10", "2026-02-20");

    ReviewOutcome again = scheduler.review(s, Rating::AGAIN, on("2026-02-20"));
    EXPECT_EQ(again.intervalDays, 5);

    // The floor only applies to Again.
    ReviewOutcome hard = scheduler.review(s, Rating::HARD, on("2026-02-20"));
    EXPECT_EQ(hard.intervalDays, 15);
}

TEST(SchedulerTest, IntervalsRespectMaximum) {
    RawFSRSConfig raw;
    raw.maxIntervalDays = 30;
    PickHigh high;
    Scheduler scheduler(raw, &high);
    FSRSState s = stateOf(5.0, 10.0, "2026-02-10", "2026-02-20");

    for (Rating r : allRatings()) {
        ReviewOutcome out = scheduler.review(s, r, on("2026-02-20", std::nullopt, true));
        EXPECT_LE(out.intervalDays, 30);
        EXPECT_LE(out.scheduledDays, 30);
    }
}

TEST(SchedulerTest, SameDayGoodNeverShrinksStability) {
    for (Scheduler scheduler : { Scheduler(), v6Scheduler() }) {
        for (double st : { 0.5, 5.0, 100.0, 2000.0 }) {
            FSRSState s = stateOf(5.0, st, "2026-02-20", "2026-02-21");
            for (Rating r : { Rating::GOOD, Rating::EASY }) {
                ReviewOutcome out = scheduler.review(s, r, on("2026-02-20"));
                EXPECT_GE(out.newState.stability, st);
            }
        }
    }
}

TEST(SchedulerTest, ConfigIsNormalizedOnReplace) {
    Scheduler scheduler;
    FSRSConfig cfg;
    cfg.requestedRetention = 5.0;
    cfg.version = FSRSVersion::V6;
    cfg.customWeights = WeightTable::defaultWeights(FSRSVersion::V5);
    scheduler.setConfig(cfg);

    EXPECT_DOUBLE_EQ(scheduler.config().requestedRetention, 0.999);
    EXPECT_EQ(scheduler.config().version, FSRSVersion::V6);
    EXPECT_FALSE(scheduler.config().customWeights.has_value());
}

TEST(SchedulerTest, CurrentRetrievabilityUsesToday) {
    Scheduler scheduler;
    FSRSState s = stateOf(5.0, 10.0, "2026-02-10", "2026-02-20");
    EXPECT_NEAR(scheduler.currentRetrievability(s, day("2026-02-20")), 0.9, 1e-9);
    EXPECT_DOUBLE_EQ(scheduler.currentRetrievability(s, day("2026-02-10")), 1.0);
    EXPECT_DOUBLE_EQ(scheduler.currentRetrievability(FSRSState{}, day("2026-02-10")), 0.0);
}
