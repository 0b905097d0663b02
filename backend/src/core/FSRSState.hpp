#pragma once
#include <optional>
#include "Date.hpp"

// Per-item memory state. Replaced wholesale after every review, never patched.
struct FSRSState {
    double difficulty = 0.0;          // [1, 10] once reviewed
    double stability = 0.0;           // 0 == never reviewed, >= 0.1 afterwards
    std::optional<Date> lastReview;
    std::optional<Date> nextReview;

    bool isNew() const { return stability <= 0.0; }
};
