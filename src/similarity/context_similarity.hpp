// File: src/similarity/context_similarity.hpp
#pragma once

#include "core/context_snapshot.hpp"
#include <string>

namespace aase {

/// Weighted similarity between two context snapshots
///
/// Each signal contributes its weight when it matches:
///   time-of-day match        0.30 (else hours within 2h: 0.15)
///   day-of-week match        0.20
///   weekend flag match       0.10
///   battery closeness        0.10 x (1 - |a - b| / 100), both readings known
///   situation match          0.30
///
/// The weights are not normalised; a full match scores 1.0 with the
/// defaults, and the result is capped at 1.0 for other weightings.
class ContextSimilarity {
public:
    struct Weights {
        Weights() = default;

        float time_of_day{0.3f};
        float hour_proximity{0.15f};
        float day_of_week{0.2f};
        float weekend{0.1f};
        float battery{0.1f};
        float situation{0.3f};

        /// Maximum hour distance (circular) that earns hour_proximity
        int hour_window{2};
    };

    ContextSimilarity();
    explicit ContextSimilarity(const Weights& weights);

    /// Similarity of two snapshots using their own situation fields
    float Compute(const ContextSnapshot& a, const ContextSnapshot& b) const;

    /// Similarity where the situations are supplied explicitly
    /// (the stored situation of a record may differ from its snapshot's)
    float Compute(const ContextSnapshot& a, const std::string& situation_a,
                  const ContextSnapshot& b, const std::string& situation_b) const;

    /// Circular distance between two hours (0-12)
    static int HourDistance(int h1, int h2);

    const Weights& GetWeights() const { return weights_; }

private:
    Weights weights_;
};

} // namespace aase
