// File: src/learning/reinforcement_learner.cpp
#include "learning/reinforcement_learner.hpp"
#include "core/hash.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace aase {

namespace {

const char* BatteryTier(int battery) {
    if (battery > 70) return "high";
    if (battery < 30) return "low";
    return "medium";
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

ReinforcementLearner::ReinforcementLearner(std::shared_ptr<EventStore> store,
                                           const Config& config)
    : store_(std::move(store)), config_(config) {

    if (!store_) {
        throw std::invalid_argument("ReinforcementLearner requires non-null store");
    }
    if (config_.learning_rate <= 0.0 || config_.learning_rate > 1.0) {
        throw std::invalid_argument("learning_rate must be in range (0.0, 1.0]");
    }
    if (config_.discount < 0.0 || config_.discount > 1.0) {
        throw std::invalid_argument("discount must be in range [0.0, 1.0]");
    }
    if (config_.epsilon < 0.0 || config_.epsilon > 1.0) {
        throw std::invalid_argument("epsilon must be in range [0.0, 1.0]");
    }

    if (config_.seed) {
        rng_.seed(*config_.seed);
    } else {
        std::random_device rd;
        rng_.seed(rd());
    }
}

ReinforcementLearner::ReinforcementLearner(std::shared_ptr<EventStore> store)
    : ReinforcementLearner(std::move(store), Config{}) {
}

// ============================================================================
// State
// ============================================================================

std::string ReinforcementLearner::Fingerprint(const ContextSnapshot& context,
                                              const std::string& situation) {
    std::ostringstream oss;
    oss << situation
        << '|' << ToString(context.time_of_day)
        << '|' << context.day_of_week
        << '|' << (context.is_charging.value_or(false) ? "charging" : "battery")
        << '|' << BatteryTier(context.BatteryOrDefault());
    return ToHex64(Fnv1a64(oss.str()));
}

void ReinforcementLearner::EnsureLoaded() {
    if (loaded_) {
        return;
    }
    for (auto& entry : store_->LoadValueTable()) {
        values_[{entry.fingerprint, entry.action}] = entry.value;
    }
    loaded_ = true;
    log::Get()->debug("Loaded {} value entries", values_.size());
}

double ReinforcementLearner::Lookup(const std::string& fingerprint,
                                    const std::string& action) const {
    auto it = values_.find({fingerprint, action});
    return it != values_.end() ? it->second : 0.0;
}

double ReinforcementLearner::GetValue(const std::string& fingerprint,
                                      const std::string& action) {
    EnsureLoaded();
    return Lookup(fingerprint, action);
}

double ReinforcementLearner::RewardFor(ActionOutcome outcome) const {
    switch (outcome) {
        case ActionOutcome::SUCCESS: return config_.success_reward;
        case ActionOutcome::FAILURE: return config_.failure_reward;
        case ActionOutcome::CANCELED: return config_.canceled_reward;
    }
    return config_.failure_reward;
}

// ============================================================================
// Selection and Learning
// ============================================================================

std::optional<Prediction> ReinforcementLearner::SelectAction(
        const ContextSnapshot& context,
        const std::string& situation,
        const std::vector<std::string>& candidates) {
    if (candidates.empty()) {
        return std::nullopt;
    }
    EnsureLoaded();

    const std::string fp = Fingerprint(context, situation);

    Prediction pred;
    pred.source = PredictionSource::REINFORCEMENT;

    std::uniform_real_distribution<double> coin(0.0, 1.0);
    if (coin(rng_) < config_.epsilon) {
        std::uniform_int_distribution<size_t> pick(0, candidates.size() - 1);
        pred.action = candidates[pick(rng_)];
        pred.explored = true;
        pred.reason = "exploring";
        ++stats_.explorations;
    } else {
        // Strict > keeps the first candidate on ties
        size_t best = 0;
        double best_value = Lookup(fp, candidates[0]);
        for (size_t i = 1; i < candidates.size(); ++i) {
            double v = Lookup(fp, candidates[i]);
            if (v > best_value) {
                best_value = v;
                best = i;
            }
        }
        pred.action = candidates[best];
        pred.reason = "highest learned value";
        ++stats_.exploitations;
    }

    double value = Lookup(fp, pred.action);
    pred.value = value;
    pred.confidence = ClampConfidence(static_cast<float>(std::min(std::fabs(value), 1.0)));
    return pred;
}

double ReinforcementLearner::Update(const ContextSnapshot& context,
                                    const std::string& situation,
                                    const std::string& action,
                                    ActionOutcome outcome,
                                    const std::optional<ContextSnapshot>& next_context,
                                    const std::vector<std::string>& next_candidates) {
    EnsureLoaded();

    const std::string fp = Fingerprint(context, situation);
    const std::string next_fp = next_context ? Fingerprint(*next_context, situation) : fp;

    double max_next = 0.0;
    if (next_candidates.empty()) {
        max_next = Lookup(next_fp, action);
    } else {
        max_next = Lookup(next_fp, next_candidates[0]);
        for (size_t i = 1; i < next_candidates.size(); ++i) {
            max_next = std::max(max_next, Lookup(next_fp, next_candidates[i]));
        }
    }

    double old_value = Lookup(fp, action);
    double reward = RewardFor(outcome);
    double new_value = old_value +
        config_.learning_rate * (reward + config_.discount * max_next - old_value);

    values_[{fp, action}] = new_value;
    ++stats_.updates;

    if (!store_->UpsertValue(fp, action, new_value)) {
        ++stats_.failed_writes;
        log::Get()->warn("Value for '{}' in '{}' kept in memory only", action, situation);
    }

    log::Get()->debug("Value {} / {}: {:.4f} -> {:.4f} (reward {})",
                      situation, action, old_value, new_value, reward);
    return new_value;
}

bool ReinforcementLearner::Reset() {
    values_.clear();
    loaded_ = true;
    return store_->ResetValueTable();
}

ReinforcementLearner::Stats ReinforcementLearner::GetStats() {
    EnsureLoaded();
    Stats stats = stats_;
    stats.table_size = values_.size();
    return stats;
}

} // namespace aase
