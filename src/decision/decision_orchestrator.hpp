// File: src/decision/decision_orchestrator.hpp
#pragma once

#include "decision/decision_strategy.hpp"
#include "learning/active_learner.hpp"
#include "learning/few_shot_matcher.hpp"
#include "learning/historical_voter.hpp"
#include "learning/meta_learner.hpp"
#include "learning/reinforcement_learner.hpp"
#include "storage/event_store.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace aase {

/// Runs the strategies in a fixed order and returns the first confident one
///
/// Default order and gates (a prediction wins when its confidence is
/// strictly above the gate):
///   1. reinforcement   0.80
///   2. few-shot        0.75
///   3. meta transfer   0.70
///   4. historical      0.70
/// If nothing clears its gate, the sub-threshold predictions go to the
/// active learner: when it wants to ask, the best one is returned flagged
/// ask_user with the options to show; otherwise the best one is returned
/// as is. No predictions at all yields std::nullopt.
///
/// A strategy that throws is logged and skipped. Once the request deadline
/// has passed no further strategy is started.
class DecisionOrchestrator {
public:
    struct Config {
        Config() = default;

        float reinforcement_gate{0.8f};
        float few_shot_gate{0.75f};
        float meta_gate{0.7f};
        float historical_gate{0.7f};

        /// Budget of one SelectAction when the caller gives no deadline;
        /// 0 means unbounded
        std::chrono::milliseconds decision_timeout{0};
    };

    /// A strategy with the confidence it must beat
    struct Stage {
        std::shared_ptr<DecisionStrategy> strategy;
        float gate{0.0f};
    };

    struct Stats {
        uint64_t decisions{0};
        uint64_t no_prediction{0};
        uint64_t asked_user{0};
        uint64_t below_gate{0};          ///< Best sub-threshold prediction used
        uint64_t strategy_errors{0};
        uint64_t deadline_cutoffs{0};
        std::map<std::string, uint64_t> wins_by_strategy;
    };

    /// What LearnFromOutcome managed to do
    struct LearningReport {
        bool recorded{false};
        bool value_updated{false};
        bool exemplar_stored{false};
    };

    /// Learners other than `store` and `active` may be null; their stage is
    /// then left out
    /// @throws std::invalid_argument on a null store or active learner
    DecisionOrchestrator(std::shared_ptr<EventStore> store,
                         std::shared_ptr<ReinforcementLearner> reinforcement,
                         std::shared_ptr<FewShotMatcher> few_shot,
                         std::shared_ptr<MetaLearner> meta,
                         std::shared_ptr<HistoricalVoter> historical,
                         std::shared_ptr<ActiveLearner> active,
                         const Config& config);

    /// Replace the default pipeline
    void SetStages(std::vector<Stage> stages);
    const std::vector<Stage>& GetStages() const { return stages_; }

    std::optional<Prediction> SelectAction(const DecisionRequest& request);

    std::optional<Prediction> SelectAction(const std::string& situation,
                                           const ContextSnapshot& context,
                                           const std::vector<std::string>& candidate_actions,
                                           const std::string& user_text = "",
                                           Deadline deadline = Deadline::Never());

    /// Feed an executed action back into every learner
    ///
    /// Writes one history record, updates the value table and, on success
    /// with non-empty text, stores a few-shot example. The steps are
    /// independent; a failing one is logged and the rest still run.
    LearningReport LearnFromOutcome(const std::string& user_text,
                                    const std::string& situation,
                                    const ContextSnapshot& context,
                                    const std::string& action,
                                    const ActionParams& params,
                                    ActionOutcome outcome,
                                    std::chrono::milliseconds duration);

    std::string FormatDisambiguationPrompt(const std::string& situation,
                                           const std::vector<Prediction>& options) const;

    std::optional<Prediction> ApplyUserChoice(const std::string& situation,
                                              const ContextSnapshot& context,
                                              const std::vector<Prediction>& options,
                                              const std::string& choice);

    const Stats& GetStats() const { return stats_; }
    const Config& GetConfig() const { return config_; }

private:
    std::shared_ptr<EventStore> store_;
    std::shared_ptr<ReinforcementLearner> reinforcement_;
    std::shared_ptr<FewShotMatcher> few_shot_;
    std::shared_ptr<ActiveLearner> active_;
    Config config_;

    std::vector<Stage> stages_;
    Stats stats_;

    std::optional<Prediction> Fallback(const std::string& situation,
                                       std::vector<Prediction>& pending);
};

} // namespace aase
