// File: src/learning/active_learner.cpp
#include "learning/active_learner.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace aase {

ActiveLearner::ActiveLearner(std::shared_ptr<EventStore> store, const Config& config)
    : store_(std::move(store)), config_(config) {

    if (!store_) {
        throw std::invalid_argument("ActiveLearner requires non-null store");
    }
    if (config_.max_options == 0 || config_.max_options > 25) {
        throw std::invalid_argument("max_options must be in range [1, 25]");
    }
}

ActiveLearner::ActiveLearner(std::shared_ptr<EventStore> store)
    : ActiveLearner(std::move(store), Config{}) {
}

ActiveLearner::QueryDecision ActiveLearner::ShouldAsk(
        const std::vector<Prediction>& predictions) const {
    QueryDecision decision;
    if (predictions.empty()) {
        return decision;
    }

    std::vector<Prediction> sorted = predictions;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const Prediction& a, const Prediction& b) {
                         return a.confidence > b.confidence;
                     });

    if (sorted.front().confidence < config_.uncertainty_threshold) {
        decision.should_ask = true;
        if (sorted.size() > config_.max_options) {
            sorted.resize(config_.max_options);
        }
        decision.options = std::move(sorted);
    }
    return decision;
}

std::string ActiveLearner::FormatQuery(const std::string& situation,
                                       const std::vector<Prediction>& options) const {
    if (options.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << "I'm not sure what to do for '" << situation << "'. Should I:\n";

    char letter = 'A';
    for (const auto& opt : options) {
        long percent = std::lround(static_cast<double>(opt.confidence) * 100.0);
        oss << "  " << letter << ") " << opt.action
            << " (confidence: " << percent << "%)\n";
        ++letter;
    }
    oss << "  " << letter << ") Something else\n";
    oss << "Your choice (A/B/C...):";
    return oss.str();
}

std::optional<Prediction> ActiveLearner::ApplyChoice(const std::string& situation,
                                                     const ContextSnapshot& context,
                                                     const std::vector<Prediction>& options,
                                                     const std::string& choice) {
    auto begin = std::find_if_not(choice.begin(), choice.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(choice.rbegin(), choice.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    if (begin >= end || std::distance(begin, end) != 1) {
        return std::nullopt;
    }

    unsigned char c = static_cast<unsigned char>(*begin);
    if (!std::isalpha(c)) {
        return std::nullopt;
    }
    size_t index = static_cast<size_t>(std::toupper(c) - 'A');
    if (index >= options.size()) {
        return std::nullopt;
    }

    const Prediction& selected = options[index];
    if (!RecordTaught(situation, context, selected.action, selected.params)) {
        log::Get()->warn("User choice '{}' for '{}' not recorded", selected.action, situation);
    }
    log::Get()->info("User taught: {} -> {}", situation, selected.action);

    Prediction pred;
    pred.action = selected.action;
    pred.params = selected.params;
    pred.confidence = config_.taught_confidence;
    pred.source = PredictionSource::USER_TAUGHT;
    pred.reason = "chosen by user";
    return pred;
}

bool ActiveLearner::TeachAction(const std::string& situation,
                                const ContextSnapshot& context,
                                const std::string& action,
                                const ActionParams& params) {
    if (action.empty()) {
        return false;
    }
    bool ok = RecordTaught(situation, context, action, params);
    if (ok) {
        log::Get()->info("New teaching: {} -> {}", situation, action);
    }
    return ok;
}

bool ActiveLearner::RecordTaught(const std::string& situation,
                                 const ContextSnapshot& context,
                                 const std::string& action,
                                 const ActionParams& params) {
    ContextSnapshot ctx = context;
    ctx.situation = situation;
    return store_->Record(ctx, action, params, ActionOutcome::SUCCESS,
                          std::chrono::milliseconds(0)).has_value();
}

} // namespace aase
