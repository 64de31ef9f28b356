// File: src/decision/decision_orchestrator.cpp
#include "decision/decision_orchestrator.hpp"
#include "core/logging.hpp"
#include "decision/learner_strategies.hpp"
#include <algorithm>
#include <stdexcept>

namespace aase {

DecisionOrchestrator::DecisionOrchestrator(std::shared_ptr<EventStore> store,
                                           std::shared_ptr<ReinforcementLearner> reinforcement,
                                           std::shared_ptr<FewShotMatcher> few_shot,
                                           std::shared_ptr<MetaLearner> meta,
                                           std::shared_ptr<HistoricalVoter> historical,
                                           std::shared_ptr<ActiveLearner> active,
                                           const Config& config)
    : store_(std::move(store)),
      reinforcement_(std::move(reinforcement)),
      few_shot_(std::move(few_shot)),
      active_(std::move(active)),
      config_(config) {

    if (!store_) {
        throw std::invalid_argument("DecisionOrchestrator requires non-null store");
    }
    if (!active_) {
        throw std::invalid_argument("DecisionOrchestrator requires non-null active learner");
    }

    if (reinforcement_) {
        stages_.push_back({std::make_shared<ReinforcementStrategy>(reinforcement_),
                           config_.reinforcement_gate});
    }
    if (few_shot_) {
        stages_.push_back({std::make_shared<FewShotStrategy>(few_shot_), config_.few_shot_gate});
    }
    if (meta) {
        stages_.push_back({std::make_shared<MetaTransferStrategy>(meta), config_.meta_gate});
    }
    if (historical) {
        stages_.push_back({std::make_shared<HistoricalVoteStrategy>(historical),
                           config_.historical_gate});
    }
}

void DecisionOrchestrator::SetStages(std::vector<Stage> stages) {
    for (const auto& stage : stages) {
        if (!stage.strategy) {
            throw std::invalid_argument("Stage requires non-null strategy");
        }
    }
    stages_ = std::move(stages);
}

// ============================================================================
// Decision
// ============================================================================

std::optional<Prediction> DecisionOrchestrator::SelectAction(
        const std::string& situation,
        const ContextSnapshot& context,
        const std::vector<std::string>& candidate_actions,
        const std::string& user_text,
        Deadline deadline) {
    DecisionRequest request;
    request.situation = situation;
    request.user_text = user_text;
    request.context = context;
    request.context.situation = situation;
    request.candidate_actions = candidate_actions;
    request.deadline = deadline;
    return SelectAction(request);
}

std::optional<Prediction> DecisionOrchestrator::SelectAction(const DecisionRequest& input) {
    ++stats_.decisions;

    DecisionRequest request = input;
    if (request.deadline.IsUnbounded() && config_.decision_timeout.count() > 0) {
        request.deadline = Deadline::After(config_.decision_timeout);
    }

    std::vector<Prediction> pending;

    for (const auto& stage : stages_) {
        if (request.deadline.Expired()) {
            ++stats_.deadline_cutoffs;
            log::Get()->warn("Decision deadline passed before '{}' ran", stage.strategy->Name());
            break;
        }

        std::optional<Prediction> pred;
        try {
            pred = stage.strategy->Propose(request);
        } catch (const std::exception& e) {
            ++stats_.strategy_errors;
            log::Get()->warn("Strategy '{}' failed: {}", stage.strategy->Name(), e.what());
            continue;
        }

        if (!pred) {
            continue;
        }
        pred->confidence = ClampConfidence(pred->confidence);

        if (pred->confidence > stage.gate) {
            log::Get()->info("Using {}: {} ({:.0f}%)", stage.strategy->Name(),
                             pred->action, pred->confidence * 100.0f);
            ++stats_.wins_by_strategy[stage.strategy->Name()];
            pred->ask_user = false;
            return pred;
        }
        pending.push_back(std::move(*pred));
    }

    return Fallback(request.situation, pending);
}

std::optional<Prediction> DecisionOrchestrator::Fallback(const std::string& situation,
                                                         std::vector<Prediction>& pending) {
    if (pending.empty()) {
        ++stats_.no_prediction;
        log::Get()->debug("No prediction for '{}'", situation);
        return std::nullopt;
    }

    // First of the highest confidence keeps pipeline order on ties
    auto best = pending.begin();
    for (auto it = pending.begin(); it != pending.end(); ++it) {
        if (it->confidence > best->confidence) {
            best = it;
        }
    }
    Prediction result = *best;

    auto query = active_->ShouldAsk(pending);
    if (query.should_ask) {
        ++stats_.asked_user;
        log::Get()->info("Uncertain about '{}' (best {:.0f}%); asking user",
                         situation, result.confidence * 100.0f);
        result.ask_user = true;
        result.options = std::move(query.options);
        return result;
    }

    ++stats_.below_gate;
    log::Get()->info("Using best prediction for '{}': {} ({:.0f}%)",
                     situation, result.action, result.confidence * 100.0f);
    result.ask_user = false;
    return result;
}

// ============================================================================
// Learning
// ============================================================================

DecisionOrchestrator::LearningReport DecisionOrchestrator::LearnFromOutcome(
        const std::string& user_text,
        const std::string& situation,
        const ContextSnapshot& context,
        const std::string& action,
        const ActionParams& params,
        ActionOutcome outcome,
        std::chrono::milliseconds duration) {
    LearningReport report;

    ContextSnapshot ctx = context;
    ctx.situation = situation;

    try {
        report.recorded = store_->Record(ctx, action, params, outcome, duration).has_value();
    } catch (const std::exception& e) {
        log::Get()->warn("Recording '{}' failed: {}", action, e.what());
    }

    if (reinforcement_) {
        try {
            reinforcement_->Update(ctx, situation, action, outcome);
            report.value_updated = true;
        } catch (const std::exception& e) {
            log::Get()->warn("Value update for '{}' failed: {}", action, e.what());
        }
    }

    if (few_shot_ && outcome == ActionOutcome::SUCCESS && !user_text.empty()) {
        try {
            report.exemplar_stored = few_shot_->StoreExample(user_text, action, situation);
        } catch (const std::exception& e) {
            log::Get()->warn("Storing example for '{}' failed: {}", action, e.what());
        }
    }

    log::Get()->debug("Learned {} -> {} ({})", situation, action, ToString(outcome));
    return report;
}

std::string DecisionOrchestrator::FormatDisambiguationPrompt(
        const std::string& situation,
        const std::vector<Prediction>& options) const {
    return active_->FormatQuery(situation, options);
}

std::optional<Prediction> DecisionOrchestrator::ApplyUserChoice(
        const std::string& situation,
        const ContextSnapshot& context,
        const std::vector<Prediction>& options,
        const std::string& choice) {
    try {
        return active_->ApplyChoice(situation, context, options, choice);
    } catch (const std::exception& e) {
        log::Get()->warn("Applying user choice failed: {}", e.what());
        return std::nullopt;
    }
}

} // namespace aase
