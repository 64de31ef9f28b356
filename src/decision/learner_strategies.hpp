// File: src/decision/learner_strategies.hpp
#pragma once

#include "decision/decision_strategy.hpp"
#include "learning/few_shot_matcher.hpp"
#include "learning/historical_voter.hpp"
#include "learning/meta_learner.hpp"
#include "learning/reinforcement_learner.hpp"
#include <memory>

namespace aase {

// ============================================================================
// Adapters exposing each learner as a DecisionStrategy
// ============================================================================

class ReinforcementStrategy : public DecisionStrategy {
public:
    explicit ReinforcementStrategy(std::shared_ptr<ReinforcementLearner> learner);

    std::optional<Prediction> Propose(const DecisionRequest& request) override;
    std::string Name() const override { return "reinforcement"; }

private:
    std::shared_ptr<ReinforcementLearner> learner_;
};

/// Matches request.user_text; abstains on empty text
class FewShotStrategy : public DecisionStrategy {
public:
    explicit FewShotStrategy(std::shared_ptr<FewShotMatcher> matcher);

    std::optional<Prediction> Propose(const DecisionRequest& request) override;
    std::string Name() const override { return "few_shot"; }

private:
    std::shared_ptr<FewShotMatcher> matcher_;
};

class MetaTransferStrategy : public DecisionStrategy {
public:
    explicit MetaTransferStrategy(std::shared_ptr<MetaLearner> learner);

    std::optional<Prediction> Propose(const DecisionRequest& request) override;
    std::string Name() const override { return "meta"; }

private:
    std::shared_ptr<MetaLearner> learner_;
};

class HistoricalVoteStrategy : public DecisionStrategy {
public:
    explicit HistoricalVoteStrategy(std::shared_ptr<HistoricalVoter> voter);

    std::optional<Prediction> Propose(const DecisionRequest& request) override;
    std::string Name() const override { return "historical"; }

private:
    std::shared_ptr<HistoricalVoter> voter_;
};

} // namespace aase
