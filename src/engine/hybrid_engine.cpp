// File: src/engine/hybrid_engine.cpp
#include "engine/hybrid_engine.hpp"
#include "core/logging.hpp"
#include "embedding/hashing_embedding_provider.hpp"
#include "storage/sqlite_event_store.hpp"
#include <sstream>
#include <stdexcept>

namespace aase {

// ============================================================================
// EngineStats
// ============================================================================

std::string EngineStats::ToString() const {
    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss.precision(2);

    oss << "History:\n"
        << "  actions:        " << history.total_actions << "\n"
        << "  situations:     " << history.unique_situations << "\n"
        << "  distinct acts:  " << history.unique_actions << "\n"
        << "  success rate:   " << history.success_rate * 100.0f << "%\n"
        << "  avg duration:   " << history.avg_duration_ms << " ms\n";

    oss << "Reinforcement:\n"
        << "  table size:     " << reinforcement.table_size << "\n"
        << "  updates:        " << reinforcement.updates << "\n"
        << "  explorations:   " << reinforcement.explorations << "\n"
        << "  exploitations:  " << reinforcement.exploitations << "\n";

    if (few_shot) {
        oss << "Few-shot:\n"
            << "  examples:       " << few_shot->exemplars << "\n"
            << "  situations:     " << few_shot->situations << "\n"
            << "  total uses:     " << few_shot->total_uses << "\n"
            << "  provider fails: " << few_shot->provider_failures << "\n";
    } else {
        oss << "Few-shot: disabled\n";
    }

    oss << "Meta:\n"
        << "  transfers:      " << meta.total_transfers << "\n"
        << "  targets:        " << meta.unique_targets << "\n"
        << "  avg confidence: " << meta.avg_confidence << "\n";

    oss << "Decisions:\n"
        << "  total:          " << decisions.decisions << "\n"
        << "  asked user:     " << decisions.asked_user << "\n"
        << "  no prediction:  " << decisions.no_prediction << "\n"
        << "  errors:         " << decisions.strategy_errors << "\n";
    for (const auto& entry : decisions.wins_by_strategy) {
        oss << "  won by " << entry.first << ": " << entry.second << "\n";
    }
    return oss.str();
}

// ============================================================================
// Construction
// ============================================================================

namespace {

const EngineConfig& CheckedConfig(const EngineConfig& config) {
    auto errors = config.GetValidationErrors();
    if (!errors.empty()) {
        throw std::invalid_argument("Invalid engine configuration: " + errors.front());
    }
    return config;
}

std::shared_ptr<EmbeddingProvider> DefaultProvider(const EngineConfig& config) {
    if (!config.few_shot.enabled) {
        return nullptr;
    }
    HashingEmbeddingProvider::Config provider_config;
    provider_config.dimension = config.few_shot.embedding_dimension;
    return std::make_shared<HashingEmbeddingProvider>(provider_config);
}

} // namespace

HybridEngine::HybridEngine(const EngineConfig& config)
    : HybridEngine(CheckedConfig(config),
                   std::make_shared<SqliteEventStore>(config.storage.sqlite),
                   DefaultProvider(config),
                   std::make_shared<SystemContextProvider>()) {
}

HybridEngine::HybridEngine(const EngineConfig& config,
                           std::shared_ptr<EventStore> store,
                           std::shared_ptr<EmbeddingProvider> provider,
                           std::shared_ptr<ContextProvider> context_provider)
    : config_(CheckedConfig(config)),
      store_(std::move(store)),
      embedding_provider_(std::move(provider)),
      context_provider_(std::move(context_provider)) {

    if (!store_) {
        throw std::invalid_argument("HybridEngine requires non-null store");
    }
    if (!context_provider_) {
        throw std::invalid_argument("HybridEngine requires non-null context provider");
    }

    if (!log::SetLevel(config_.logging.level)) {
        log::Get()->warn("Unknown log level '{}'", config_.logging.level);
    }

    Wire();
}

void HybridEngine::Wire() {
    reinforcement_ = std::make_shared<ReinforcementLearner>(store_, config_.reinforcement);
    if (config_.few_shot.enabled && embedding_provider_) {
        few_shot_ = std::make_shared<FewShotMatcher>(store_, embedding_provider_,
                                                     config_.few_shot.matcher);
    }
    meta_ = std::make_shared<MetaLearner>(store_, config_.meta);
    historical_ = std::make_shared<HistoricalVoter>(store_, config_.historical);
    active_ = std::make_shared<ActiveLearner>(store_, config_.active);

    orchestrator_ = std::make_unique<DecisionOrchestrator>(
        store_, reinforcement_, few_shot_, meta_, historical_, active_, config_.orchestrator);

    log::Get()->info("Engine ready ({} strategies, few-shot {})",
                     orchestrator_->GetStages().size(), few_shot_ ? "on" : "off");
}

// ============================================================================
// Pass-through Operations
// ============================================================================

ContextSnapshot HybridEngine::CaptureContext(const std::string& situation,
                                             std::optional<float> detection_confidence,
                                             const std::vector<std::string>& recent_actions) {
    return context_provider_->Current(situation, detection_confidence, recent_actions);
}

std::optional<Prediction> HybridEngine::SelectAction(const std::string& situation,
                                                     const ContextSnapshot& context,
                                                     const std::vector<std::string>& candidate_actions,
                                                     const std::string& user_text,
                                                     Deadline deadline) {
    return orchestrator_->SelectAction(situation, context, candidate_actions, user_text, deadline);
}

DecisionOrchestrator::LearningReport HybridEngine::LearnFromOutcome(
        const std::string& user_text,
        const std::string& situation,
        const ContextSnapshot& context,
        const std::string& action,
        const ActionParams& params,
        ActionOutcome outcome,
        std::chrono::milliseconds duration) {
    return orchestrator_->LearnFromOutcome(user_text, situation, context, action,
                                           params, outcome, duration);
}

std::string HybridEngine::FormatDisambiguationPrompt(const std::string& situation,
                                                     const std::vector<Prediction>& options) const {
    return orchestrator_->FormatDisambiguationPrompt(situation, options);
}

std::optional<Prediction> HybridEngine::ApplyUserChoice(const std::string& situation,
                                                        const ContextSnapshot& context,
                                                        const std::vector<Prediction>& options,
                                                        const std::string& choice) {
    return orchestrator_->ApplyUserChoice(situation, context, options, choice);
}

bool HybridEngine::TeachAction(const std::string& situation,
                               const ContextSnapshot& context,
                               const std::string& action,
                               const ActionParams& params) {
    return active_->TeachAction(situation, context, action, params);
}

std::optional<HistoricalVoter::WorkflowSuggestion> HybridEngine::DetectWorkflow(
        const std::vector<std::string>& recent_actions) {
    return historical_->DetectWorkflow(recent_actions);
}

ActionParams HybridEngine::OptimizeParameters(const std::string& action,
                                              const ContextSnapshot& context,
                                              const ActionParams& defaults) {
    return historical_->OptimizeParameters(action, context, defaults);
}

std::vector<ActionRecord> HybridEngine::RecentActions(size_t limit) {
    return store_->RecentActions(limit);
}

EngineStats HybridEngine::GetStats() {
    EngineStats stats;
    stats.history = store_->GetLearningStats();
    stats.reinforcement = reinforcement_->GetStats();
    if (few_shot_) {
        stats.few_shot = few_shot_->GetStats();
    }
    stats.meta = meta_->GetStats();
    stats.decisions = orchestrator_->GetStats();
    return stats;
}

size_t HybridEngine::Prune(std::optional<int> retention_days) {
    return store_->Prune(retention_days.value_or(config_.storage.retention_days));
}

bool HybridEngine::ResetValues() {
    return reinforcement_->Reset();
}

} // namespace aase
