#pragma once
#include <optional>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include "Date.hpp"
#include "FSRSConfig.hpp"
#include "FSRSState.hpp"
#include "Rating.hpp"
#include "Scheduler.hpp"

// One line of an item's review log. Written once, never edited.
struct ReviewEntry {
    std::string id;
    int reviewNumber = 0;          // history size before the review + 1
    Date date;
    Rating rating = Rating::AGAIN;
    std::string ratingLabel;
    double difficultyBefore = 0.0;
    double difficultyAfter = 0.0;
    double stabilityBefore = 0.0;
    double stabilityAfter = 0.0;
    int intervalDays = 0;
    int scheduledDays = 0;
    std::optional<double> retrievability;
    std::optional<double> performanceScore; // question accuracy at review time
    int questionsTotal = 0;
    int questionsCorrect = 0;

    // Config in force when the review happened, kept for reproducibility.
    FSRSVersion algorithmVersion = FSRSVersion::V5;
    double requestedRetention = 0.0;
    bool usedCustomWeights = false;
};

class Item {
public:
    Item() = default;
    Item(const std::string& title, const std::string& notes = "");

    // Basic fields
    std::string id;          // Auto-generated
    std::string title;
    std::string notes;

    // Practice question counters
    int questionsTotal = 0;
    int questionsCorrect = 0;

    // Scheduler state
    FSRSState fsrs;

    const std::vector<ReviewEntry>& history() const { return reviewHistory; }

    // Runs the scheduler, appends one history entry and replaces fsrs.
    ReviewOutcome applyReview(Rating rating, const Scheduler& scheduler,
        const ReviewOptions& options = ReviewOptions{});

    void recordQuestions(int answered, int correct);
    std::optional<double> performanceScore() const;
    std::optional<Rating> suggestedRating() const;

    bool isDue(const Date& today) const;

    // Utility
    static std::string generateID();

private:
    std::vector<ReviewEntry> reviewHistory; // append-only
};

// Items due on or before today, oldest due date first.
std::vector<Item*> dueItems(std::vector<Item>& items, const Date& today);
