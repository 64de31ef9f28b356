// File: src/learning/meta_learner.hpp
#pragma once

#include "core/types.hpp"
#include "storage/event_store.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace aase {

/// Bootstraps predictions for unfamiliar situations from related ones
///
/// Situations are related when their '_'-delimited label tokens overlap
/// (Jaccard). Only situations with enough successful history take part.
/// The best actions of the closest related situation are carried over with
/// a capped confidence, and each carry-over is logged in the store.
class MetaLearner {
public:
    struct Config {
        Config() = default;

        /// Minimum label similarity of a related situation
        float min_similarity{0.7f};

        /// Successful records a source situation needs
        size_t min_source_successes{3};

        /// Source actions must beat this success rate ...
        double min_success_rate{0.7};

        /// ... and have been taken at least this often
        size_t min_frequency{2};

        /// Actions carried over per transfer
        size_t max_transfers{3};

        /// Hard ceiling on transferred confidence
        float max_confidence{0.9f};
    };

    /// A related situation and its label similarity
    struct SimilarSituation {
        std::string situation;
        float similarity{0.0f};
        size_t successes{0};
    };

    struct Stats {
        size_t total_transfers{0};
        size_t unique_targets{0};
        double avg_confidence{0.0};
    };

    /// @throws std::invalid_argument on a null store or bad config
    MetaLearner(std::shared_ptr<EventStore> store, const Config& config);
    explicit MetaLearner(std::shared_ptr<EventStore> store);

    /// Related situations, most similar first
    std::vector<SimilarSituation> FindSimilarSituations(const std::string& target);

    /// Carry the best actions of `source` over to `target`
    /// @return Predictions ordered by source success rate, then frequency
    std::vector<Prediction> Transfer(const std::string& source, const std::string& target);

    /// Top transferred prediction from the closest related situation
    std::optional<Prediction> Bootstrap(const std::string& new_situation);

    /// Confidence of a carried-over action
    float TransferConfidence(float success_rate, size_t frequency) const;

    Stats GetStats();
    const Config& GetConfig() const { return config_; }

private:
    std::shared_ptr<EventStore> store_;
    Config config_;
};

} // namespace aase
