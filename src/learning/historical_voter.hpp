// File: src/learning/historical_voter.hpp
#pragma once

#include "core/context_snapshot.hpp"
#include "core/types.hpp"
#include "similarity/context_similarity.hpp"
#include "storage/event_store.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace aase {

/// k-nearest-neighbour vote over past actions in similar contexts
///
/// Each candidate record is scored
///   similarity(context, record) * recency * outcome_sign
/// where recency = 1 / (1 + days_ago / 30). The k best-scoring records
/// vote for their action with their score; the winner's confidence is its
/// total divided by the number of votes cast.
///
/// Also detects short action workflows in recent history and picks the
/// usual parameters of an action for a context.
class HistoricalVoter {
public:
    struct Config {
        Config() = default;

        /// Neighbours that vote
        size_t k{10};

        /// Minimum winning confidence
        float min_confidence{0.7f};

        /// Fewer candidate records than this means no prediction
        size_t min_records{3};

        /// Days over which recency weight halves
        double recency_days{30.0};

        // Workflow detection
        size_t workflow_history{100};
        int64_t workflow_gap_seconds{600};
        size_t workflow_min_sequence{3};
        size_t workflow_min_occurrences{5};

        // Parameter optimisation
        size_t param_history{20};
        size_t param_min_records{3};
        float param_min_similarity{0.6f};

        ContextSimilarity::Weights weights;
    };

    /// Action that usually follows the last two actions
    struct WorkflowSuggestion {
        std::vector<std::string> pattern;
        std::string next_action;
        float confidence{0.0f};
        size_t occurrences{0};   ///< Times next_action followed the pattern
        size_t matches{0};       ///< Times the pattern was followed at all
    };

    /// @throws std::invalid_argument on a null store or k == 0
    HistoricalVoter(std::shared_ptr<EventStore> store, const Config& config);
    explicit HistoricalVoter(std::shared_ptr<EventStore> store);

    /// Vote among records of `situation` similar to `context`
    std::optional<Prediction> Predict(const std::string& situation,
                                      const ContextSnapshot& context);

    /// Suggest the next action after `recent_actions` (oldest first)
    std::optional<WorkflowSuggestion> DetectWorkflow(const std::vector<std::string>& recent_actions);

    /// Usual parameters of `action` in contexts like `context`, else `defaults`
    ActionParams OptimizeParameters(const std::string& action,
                                    const ContextSnapshot& context,
                                    const ActionParams& defaults);

    /// Per key, the most frequent value; the first seen wins ties
    static ActionParams ModeParams(const std::vector<ActionParams>& param_list);

    const Config& GetConfig() const { return config_; }

private:
    std::shared_ptr<EventStore> store_;
    Config config_;
    ContextSimilarity similarity_;
};

} // namespace aase
