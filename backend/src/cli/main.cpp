#include <iostream>
#include <iomanip>
#include <vector>
#include <string>
#include <sodium.h>
#include <limits>
#include <optional>
#include <sstream>

#include "../utils/logging.hpp"
#include "../core/Item.hpp"
#include "../core/RandomSource.hpp"
#include "../core/ReviewStatus.hpp"
#include "../core/Scheduler.hpp"
#include "../core/WeightTable.hpp"
#include "WeightsInput.hpp"

namespace {

void discardLine() {
    std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
}

std::optional<int> readInt() {
    int v;
    if (std::cin >> v) {
        discardLine();
        return v;
    }
    std::cin.clear();
    discardLine();
    return std::nullopt;
}

std::optional<double> readDouble() {
    double v;
    if (std::cin >> v) {
        discardLine();
        return v;
    }
    std::cin.clear();
    discardLine();
    return std::nullopt;
}

std::string formatPercent(double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << v * 100.0 << "%";
    return oss.str();
}

std::string formatDate(const std::optional<Date>& d) {
    return d ? d->toIso() : std::string("-");
}

void printHistory(const Item& it) {
    std::cout << "   Review History:\n";
    if (it.history().empty()) {
        std::cout << "      (no history)\n";
        return;
    }

    for (const auto& r : it.history()) {
        std::cout << "      #" << r.reviewNumber << " " << r.date.toIso()
            << " | " << r.ratingLabel
            << " | D " << r.difficultyBefore << " -> " << r.difficultyAfter
            << " | S " << r.stabilityBefore << " -> " << r.stabilityAfter
            << " | interval=" << r.intervalDays << "d";
        if (r.scheduledDays != r.intervalDays)
            std::cout << " (scheduled " << r.scheduledDays << "d)";
        if (r.retrievability)
            std::cout << " | R=" << formatPercent(*r.retrievability);
        if (r.performanceScore)
            std::cout << " | score=" << formatPercent(*r.performanceScore)
                << " (" << r.questionsCorrect << "/" << r.questionsTotal << ")";
        std::cout << " | " << versionLabel(r.algorithmVersion)
            << " @" << formatPercent(r.requestedRetention)
            << (r.usedCustomWeights ? " custom" : "") << "\n";
    }
}

void listAllItems(const std::vector<Item>& items, const Scheduler& scheduler, const Date& today) {
    std::cout << "\n===== ALL ITEMS =====\n";

    if (items.empty()) {
        std::cout << "No items stored.\n";
        return;
    }

    for (size_t i = 0; i < items.size(); i++) {
        const Item& it = items[i];
        std::cout << i + 1 << ". " << it.title << "\n";
        if (!it.notes.empty()) std::cout << "   Notes: " << it.notes << "\n";

        if (it.fsrs.isNew()) {
            std::cout << "   New (never reviewed)\n";
        }
        else {
            std::cout << "   Difficulty: " << it.fsrs.difficulty
                << " (" << difficultyLabel(it.fsrs.difficulty).text << ")\n";
            std::cout << "   Stability: " << it.fsrs.stability << " days\n";
            std::cout << "   Estimated retention: "
                << formatPercent(scheduler.currentRetrievability(it.fsrs, today)) << "\n";
        }
        std::cout << "   Last review: " << formatDate(it.fsrs.lastReview) << "\n";
        std::cout << "   Next review: " << formatDate(it.fsrs.nextReview)
            << " [" << reviewStatus(it.fsrs.nextReview, today).text << "]\n";

        if (auto score = it.performanceScore())
            std::cout << "   Questions: " << it.questionsCorrect << "/" << it.questionsTotal
                << " (" << formatPercent(*score) << ")\n";

        printHistory(it);
        std::cout << "-----------------------------\n";
    }
}

int chooseItemIndex(const std::vector<Item>& items, const Scheduler& scheduler, const Date& today) {
    if (items.empty()) {
        std::cout << "No items available.\n";
        return -1;
    }
    listAllItems(items, scheduler, today);
    std::cout << "Choose item number: ";

    auto sel = readInt();
    if (!sel || *sel < 1 || static_cast<size_t>(*sel) > items.size()) {
        std::cout << "Invalid selection.\n";
        return -1;
    }
    return *sel - 1;
}

Rating askRating(const Item& item, const Scheduler& scheduler, const Date& today) {
    auto previews = scheduler.previewAllRatings(item.fsrs, std::nullopt, today);
    std::optional<Rating> suggested = item.suggestedRating();

    while (true) {
        std::cout << "\nHow well did you recall it?\n";
        for (const auto& p : previews) {
            std::cout << " " << ratingValue(p.rating) << " = " << std::left << std::setw(6) << ratingLabel(p.rating)
                << std::right << " -> " << p.outcome.scheduledDays << "d ("
                << p.outcome.newState.nextReview->toIso() << ")";
            if (suggested && *suggested == p.rating) std::cout << "  <- suggested";
            std::cout << "\n";
        }
        std::cout << "> ";

        auto q = readInt();
        if (q) {
            if (auto r = ratingFromInt(*q)) return *r;
        }
        std::cout << "Invalid input.\n";
    }
}

void reviewOne(Item& item, const Scheduler& scheduler, bool fuzz, const Date& today) {
    std::cout << "\nReviewing: " << item.title << "\n";
    if (!item.notes.empty()) std::cout << "Notes: " << item.notes << "\n";
    std::cout << "Status: " << reviewStatus(item.fsrs.nextReview, today).text << "\n";

    Rating r = askRating(item, scheduler, today);

    ReviewOptions opts;
    opts.applyFuzzing = fuzz;
    opts.today = today;
    ReviewOutcome outcome = item.applyReview(r, scheduler, opts);

    std::cout << "Next review in " << outcome.scheduledDays << " day(s): "
        << outcome.newState.nextReview->toIso() << "\n";
}

void settingsMenu(Scheduler& scheduler, bool& fuzz) {
    while (true) {
        const FSRSConfig& cfg = scheduler.config();
        std::cout << "\n=== FSRS SETTINGS ===\n"
            "Version: " << versionLabel(cfg.version) << "\n"
            "Requested retention: " << formatPercent(cfg.requestedRetention) << "\n"
            "Weights: " << (usesCustomWeights(cfg) ? "custom" : "default") << "\n"
            "Again minimum interval: " << cfg.againMinIntervalDays << "d\n"
            "Maximum interval: " << cfg.maxIntervalDays << "d\n"
            "Fuzzing: " << (fuzz ? "on" : "off") << "\n"
            "1. Switch version\n"
            "2. Set requested retention\n"
            "3. Set custom weights\n"
            "4. Reset to default weights\n"
            "5. Show active weights\n"
            "6. Set interval bounds\n"
            "7. Toggle fuzzing\n"
            "8. Back\n> ";

        auto t = readInt();
        if (!t) continue;

        if (*t == 1) {
            FSRSConfig next = cfg;
            next.version = cfg.version == FSRSVersion::V5 ? FSRSVersion::V6 : FSRSVersion::V5;
            // arity differs between versions
            next.customWeights.reset();
            scheduler.setConfig(next);
        }

        else if (*t == 2) {
            std::cout << "Enter retention (0.01 - 0.999): ";
            auto v = readDouble();
            if (!v) { std::cout << "Invalid.\n"; continue; }
            FSRSConfig next = cfg;
            next.requestedRetention = *v;
            scheduler.setConfig(next);
        }

        else if (*t == 3) {
            const size_t expected = WeightTable::expectedArity(cfg.version);
            std::cout << "Enter " << expected << " weights (comma or space separated):\n> ";
            std::string line; std::getline(std::cin, line);
            std::vector<double> parsed = WeightsInput::parse(line);
            if (parsed.size() != expected) {
                std::cout << versionLabel(cfg.version) << " requires " << expected
                    << " weights, got " << parsed.size() << ".\n";
                continue;
            }
            FSRSConfig next = cfg;
            next.customWeights = parsed;
            scheduler.setConfig(next);
        }

        else if (*t == 4) {
            FSRSConfig next = cfg;
            next.customWeights.reset();
            scheduler.setConfig(next);
        }

        else if (*t == 5) {
            std::cout << WeightsInput::format(WeightTable::activeWeights(cfg)) << "\n";
        }

        else if (*t == 6) {
            std::cout << "Again minimum interval (days): ";
            auto lo = readInt();
            std::cout << "Maximum interval (days): ";
            auto hi = readInt();
            if (!lo || !hi) { std::cout << "Invalid.\n"; continue; }

            RawFSRSConfig raw;
            raw.version = versionKey(cfg.version);
            raw.requestedRetention = cfg.requestedRetention;
            raw.customWeights = cfg.customWeights;
            raw.againMinIntervalDays = *lo;
            raw.maxIntervalDays = *hi;
            scheduler.setConfig(raw);
        }

        else if (*t == 7) {
            fuzz = !fuzz;
        }

        else if (*t == 8)
            break;

        else std::cout << "Invalid.\n";
    }
}

} // namespace

int main() {
    if (sodium_init() < 0) {
        std::cerr << "Failed to initialize libsodium\n";
        return 1;
    }

    Log::init();

    SodiumRandom random;
    Scheduler scheduler(ConfigNormalizer::defaults(), &random);
    std::vector<Item> items;
    bool fuzz = false;

    // MAIN LOOP
    while (true) {
        const Date today = Date::today();
        const size_t dueCount = dueItems(items, today).size();

        std::cout << "\n===== MAIN MENU =====\n"
            "Today: " << today.toIso() << " | due: " << dueCount << "\n"
            "1. Add Item\n"
            "2. Record Practice Questions\n"
            "3. Review Due Items\n"
            "4. Review an Item\n"
            "5. List All Items\n"
            "6. FSRS Settings\n"
            "7. Exit\n> ";

        auto choice = readInt();
        if (!choice) continue;

        if (*choice == 1) {
            std::string title, notes;
            std::cout << "Enter title: "; std::getline(std::cin, title);
            if (title.empty()) { std::cout << "Title required.\n"; continue; }

            std::cout << "Enter notes: "; std::getline(std::cin, notes);

            items.emplace_back(title, notes);
            std::cout << "Item added.\n";
        }

        else if (*choice == 2) {
            int idx = chooseItemIndex(items, scheduler, today); if (idx < 0) continue;
            std::cout << "Questions answered: ";
            auto answered = readInt();
            std::cout << "Questions correct: ";
            auto correct = readInt();
            if (!answered || !correct || *answered <= 0) { std::cout << "Invalid.\n"; continue; }
            items[idx].recordQuestions(*answered, *correct);

            if (auto s = items[idx].suggestedRating())
                std::cout << "Suggested rating: " << ratingLabel(*s) << "\n";
        }

        else if (*choice == 3) {
            auto due = dueItems(items, today);
            if (due.empty()) { std::cout << "No items due.\n"; continue; }

            for (auto* item : due) {
                reviewOne(*item, scheduler, fuzz, today);
            }
        }

        else if (*choice == 4) {
            int idx = chooseItemIndex(items, scheduler, today); if (idx < 0) continue;
            reviewOne(items[idx], scheduler, fuzz, today);
        }

        else if (*choice == 5) {
            listAllItems(items, scheduler, today);
        }

        else if (*choice == 6) {
            settingsMenu(scheduler, fuzz);
        }

        else if (*choice == 7) {
            std::cout << "Goodbye!\n";
            break;
        }
    }

    return 0;
}
