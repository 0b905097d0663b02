#include "Item.hpp"
#include "RandomSource.hpp"
#include "ReviewStatus.hpp"
#include <algorithm>

Item::Item(const std::string& t, const std::string& n)
    : title(t), notes(n)
{
    id = generateID();
    spdlog::info("Created Item: ID={}, Title={}", id, title);
}

ReviewOutcome Item::applyReview(Rating rating, const Scheduler& scheduler, const ReviewOptions& options) {
    ReviewOptions opts = options;
    if (!opts.today) opts.today = Date::today();

    const FSRSState before = fsrs;
    ReviewOutcome outcome = scheduler.review(before, rating, opts);
    const FSRSConfig& cfg = scheduler.config();

    ReviewEntry entry;
    entry.id = generateReviewId();
    entry.reviewNumber = static_cast<int>(reviewHistory.size()) + 1;
    entry.date = *opts.today;
    entry.rating = rating;
    entry.ratingLabel = ratingLabel(rating);
    entry.difficultyBefore = before.difficulty;
    entry.difficultyAfter = outcome.newState.difficulty;
    entry.stabilityBefore = before.stability;
    entry.stabilityAfter = outcome.newState.stability;
    entry.intervalDays = outcome.intervalDays;
    entry.scheduledDays = outcome.scheduledDays;
    entry.retrievability = outcome.retrievability;
    entry.performanceScore = performanceScore();
    entry.questionsTotal = questionsTotal;
    entry.questionsCorrect = questionsCorrect;
    entry.algorithmVersion = cfg.version;
    entry.requestedRetention = cfg.requestedRetention;
    entry.usedCustomWeights = usesCustomWeights(cfg);

    reviewHistory.push_back(entry);
    fsrs = outcome.newState;

    spdlog::info("Item ID={} review #{} {}: next_review={}",
        id, entry.reviewNumber, entry.ratingLabel, fsrs.nextReview->toIso());
    return outcome;
}

void Item::recordQuestions(int answered, int correct) {
    if (answered <= 0) return;
    correct = std::clamp(correct, 0, answered);

    questionsTotal += answered;
    questionsCorrect += correct;
    spdlog::debug("Item ID={} questions {}/{} (total {}/{})",
        id, correct, answered, questionsCorrect, questionsTotal);
}

std::optional<double> Item::performanceScore() const {
    if (questionsTotal <= 0) return std::nullopt;
    return static_cast<double>(questionsCorrect) / static_cast<double>(questionsTotal);
}

std::optional<Rating> Item::suggestedRating() const {
    return suggestRatingFromPerformance(questionsTotal, questionsCorrect);
}

bool Item::isDue(const Date& today) const {
    return isReviewDue(fsrs.nextReview, today);
}

std::string Item::generateID() {
    return randomHexId("item_");
}

std::vector<Item*> dueItems(std::vector<Item>& items, const Date& today) {
    std::vector<Item*> due;
    due.reserve(items.size() / 4 + 8);

    for (auto& item : items) {
        if (item.isDue(today)) {
            due.push_back(&item);
        }
    }

    std::stable_sort(due.begin(), due.end(),
        [](const Item* a, const Item* b) {
            return *a->fsrs.nextReview < *b->fsrs.nextReview;
        });

    return due;
}
