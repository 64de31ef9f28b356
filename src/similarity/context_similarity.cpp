// File: src/similarity/context_similarity.cpp
#include "similarity/context_similarity.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace aase {

ContextSimilarity::ContextSimilarity()
    : weights_() {
}

ContextSimilarity::ContextSimilarity(const Weights& weights)
    : weights_(weights) {
}

float ContextSimilarity::Compute(const ContextSnapshot& a, const ContextSnapshot& b) const {
    return Compute(a, a.situation, b, b.situation);
}

float ContextSimilarity::Compute(const ContextSnapshot& a, const std::string& situation_a,
                                 const ContextSnapshot& b, const std::string& situation_b) const {
    float score = 0.0f;

    // Time of day, with partial credit for nearby hours across a bucket edge
    if (a.time_of_day == b.time_of_day) {
        score += weights_.time_of_day;
    } else if (HourDistance(a.hour, b.hour) <= weights_.hour_window) {
        score += weights_.hour_proximity;
    }

    if (a.day_of_week == b.day_of_week) {
        score += weights_.day_of_week;
    }

    if (a.is_weekend == b.is_weekend) {
        score += weights_.weekend;
    }

    if (a.battery_percent && b.battery_percent) {
        float diff = static_cast<float>(std::abs(*a.battery_percent - *b.battery_percent));
        score += weights_.battery * std::max(0.0f, 1.0f - diff / 100.0f);
    }

    if (!situation_a.empty() && situation_a == situation_b) {
        score += weights_.situation;
    }

    return std::clamp(score, 0.0f, 1.0f);
}

int ContextSimilarity::HourDistance(int h1, int h2) {
    int diff = std::abs(h1 - h2) % 24;
    return std::min(diff, 24 - diff);
}

} // namespace aase
