// File: src/engine/hybrid_engine.hpp
#pragma once

#include "config/engine_config.hpp"
#include "core/context_provider.hpp"
#include "decision/decision_orchestrator.hpp"
#include "embedding/embedding_provider.hpp"
#include "learning/active_learner.hpp"
#include "learning/few_shot_matcher.hpp"
#include "learning/historical_voter.hpp"
#include "learning/meta_learner.hpp"
#include "learning/reinforcement_learner.hpp"
#include "storage/event_store.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace aase {

/// Combined statistics of every learner
struct EngineStats {
    LearningStats history;
    ReinforcementLearner::Stats reinforcement;
    std::optional<FewShotMatcher::Stats> few_shot;   ///< Unset when disabled
    MetaLearner::Stats meta;
    DecisionOrchestrator::Stats decisions;

    std::string ToString() const;
};

/// The decision engine as a host embeds it
///
/// Wires one event store into every learner and the orchestrator according
/// to an EngineConfig. Collaborators may be injected; otherwise the engine
/// opens a SqliteEventStore, uses the built-in hashing embedding provider
/// (when few_shot.enabled) and reads context from the local system.
///
/// Example:
/// @code
///   auto config = EngineConfig::Default();
///   config.storage.sqlite.db_path = "assistant.db";
///   HybridEngine engine(config);
///
///   auto ctx = engine.CaptureContext("tired");
///   auto pred = engine.SelectAction("tired", ctx, {"dnd.on", "music.play"}, "i'm exhausted");
///   if (pred && !pred->ask_user) {
///       // run pred->action, then
///       engine.LearnFromOutcome("i'm exhausted", "tired", ctx, pred->action,
///                               pred->params, ActionOutcome::SUCCESS,
///                               std::chrono::milliseconds(120));
///   }
/// @endcode
class HybridEngine {
public:
    /// @throws std::runtime_error if the database cannot be opened
    /// @throws std::invalid_argument on an invalid configuration
    explicit HybridEngine(const EngineConfig& config);

    /// @param provider May be null; few-shot matching is then disabled
    /// @throws std::invalid_argument on a null store or context provider
    HybridEngine(const EngineConfig& config,
                 std::shared_ptr<EventStore> store,
                 std::shared_ptr<EmbeddingProvider> provider,
                 std::shared_ptr<ContextProvider> context_provider);

    /// Snapshot of the current context for `situation`
    ContextSnapshot CaptureContext(const std::string& situation,
                                   std::optional<float> detection_confidence = std::nullopt,
                                   const std::vector<std::string>& recent_actions = {});

    std::optional<Prediction> SelectAction(const std::string& situation,
                                           const ContextSnapshot& context,
                                           const std::vector<std::string>& candidate_actions,
                                           const std::string& user_text = "",
                                           Deadline deadline = Deadline::Never());

    DecisionOrchestrator::LearningReport LearnFromOutcome(const std::string& user_text,
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

    bool TeachAction(const std::string& situation,
                     const ContextSnapshot& context,
                     const std::string& action,
                     const ActionParams& params = {});

    std::optional<HistoricalVoter::WorkflowSuggestion> DetectWorkflow(
        const std::vector<std::string>& recent_actions);

    ActionParams OptimizeParameters(const std::string& action,
                                    const ContextSnapshot& context,
                                    const ActionParams& defaults);

    std::vector<ActionRecord> RecentActions(size_t limit);

    EngineStats GetStats();

    /// Delete history older than `retention_days`
    /// (storage.retention_days when unset)
    size_t Prune(std::optional<int> retention_days = std::nullopt);

    /// Forget all learned values
    bool ResetValues();

    const EngineConfig& GetConfig() const { return config_; }
    std::shared_ptr<EventStore> GetStore() const { return store_; }
    DecisionOrchestrator& GetOrchestrator() { return *orchestrator_; }

private:
    EngineConfig config_;

    std::shared_ptr<EventStore> store_;
    std::shared_ptr<EmbeddingProvider> embedding_provider_;
    std::shared_ptr<ContextProvider> context_provider_;

    std::shared_ptr<ReinforcementLearner> reinforcement_;
    std::shared_ptr<FewShotMatcher> few_shot_;
    std::shared_ptr<MetaLearner> meta_;
    std::shared_ptr<HistoricalVoter> historical_;
    std::shared_ptr<ActiveLearner> active_;
    std::unique_ptr<DecisionOrchestrator> orchestrator_;

    void Wire();
};

} // namespace aase
