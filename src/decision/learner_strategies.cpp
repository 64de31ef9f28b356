// File: src/decision/learner_strategies.cpp
#include "decision/learner_strategies.hpp"
#include <sstream>
#include <stdexcept>

namespace aase {

ReinforcementStrategy::ReinforcementStrategy(std::shared_ptr<ReinforcementLearner> learner)
    : learner_(std::move(learner)) {
    if (!learner_) {
        throw std::invalid_argument("ReinforcementStrategy requires non-null learner");
    }
}

std::optional<Prediction> ReinforcementStrategy::Propose(const DecisionRequest& request) {
    auto pred = learner_->SelectAction(request.context, request.situation,
                                       request.candidate_actions);
    if (pred && pred->value) {
        std::ostringstream reason;
        reason.precision(3);
        reason << std::fixed << "learned value " << *pred->value
               << (pred->explored ? " (exploring)" : "");
        pred->reason = reason.str();
    }
    return pred;
}

FewShotStrategy::FewShotStrategy(std::shared_ptr<FewShotMatcher> matcher)
    : matcher_(std::move(matcher)) {
    if (!matcher_) {
        throw std::invalid_argument("FewShotStrategy requires non-null matcher");
    }
}

std::optional<Prediction> FewShotStrategy::Propose(const DecisionRequest& request) {
    if (request.user_text.empty()) {
        return std::nullopt;
    }
    std::optional<std::string> situation;
    if (!request.situation.empty()) {
        situation = request.situation;
    }
    return matcher_->Predict(request.user_text, situation, request.deadline);
}

MetaTransferStrategy::MetaTransferStrategy(std::shared_ptr<MetaLearner> learner)
    : learner_(std::move(learner)) {
    if (!learner_) {
        throw std::invalid_argument("MetaTransferStrategy requires non-null learner");
    }
}

std::optional<Prediction> MetaTransferStrategy::Propose(const DecisionRequest& request) {
    if (request.situation.empty()) {
        return std::nullopt;
    }
    return learner_->Bootstrap(request.situation);
}

HistoricalVoteStrategy::HistoricalVoteStrategy(std::shared_ptr<HistoricalVoter> voter)
    : voter_(std::move(voter)) {
    if (!voter_) {
        throw std::invalid_argument("HistoricalVoteStrategy requires non-null voter");
    }
}

std::optional<Prediction> HistoricalVoteStrategy::Propose(const DecisionRequest& request) {
    return voter_->Predict(request.situation, request.context);
}

} // namespace aase
