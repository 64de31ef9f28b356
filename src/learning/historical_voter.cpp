// File: src/learning/historical_voter.cpp
#include "learning/historical_voter.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <chrono>
#include <map>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace aase {

namespace {

struct Vote {
    std::string action;
    ActionParams params;
    float score{0.0f};
};

} // namespace

HistoricalVoter::HistoricalVoter(std::shared_ptr<EventStore> store, const Config& config)
    : store_(std::move(store)), config_(config), similarity_(config.weights) {

    if (!store_) {
        throw std::invalid_argument("HistoricalVoter requires non-null store");
    }
    if (config_.k == 0) {
        throw std::invalid_argument("k must be positive");
    }
    if (config_.recency_days <= 0.0) {
        throw std::invalid_argument("recency_days must be positive");
    }
    if (config_.min_records == 0) {
        throw std::invalid_argument("min_records must be positive");
    }
    if (config_.workflow_min_occurrences == 0) {
        throw std::invalid_argument("workflow_min_occurrences must be positive");
    }
}

HistoricalVoter::HistoricalVoter(std::shared_ptr<EventStore> store)
    : HistoricalVoter(std::move(store), Config{}) {
}

// ============================================================================
// k-NN Vote
// ============================================================================

std::optional<Prediction> HistoricalVoter::Predict(const std::string& situation,
                                                   const ContextSnapshot& context) {
    auto records = store_->QuerySimilar(context, situation, config_.k * 2);
    if (records.size() < config_.min_records) {
        log::Get()->debug("Only {} similar records for '{}'", records.size(), situation);
        return std::nullopt;
    }

    Timestamp now = Timestamp::Now();
    std::vector<Vote> votes;
    votes.reserve(records.size());

    for (const auto& rec : records) {
        float sim = similarity_.Compute(context, situation, rec.context, rec.situation);
        int64_t days_ago = std::max<int64_t>(0, rec.timestamp.WholeDaysUntil(now));
        double recency = 1.0 / (1.0 + static_cast<double>(days_ago) / config_.recency_days);
        double sign = static_cast<double>(static_cast<int>(rec.outcome));

        votes.push_back({rec.action, rec.params, static_cast<float>(sim * recency * sign)});
    }

    std::stable_sort(votes.begin(), votes.end(),
                     [](const Vote& a, const Vote& b) { return a.score > b.score; });
    if (votes.size() > config_.k) {
        votes.resize(config_.k);
    }
    if (votes.empty()) {
        return std::nullopt;
    }

    // Tally in first-vote order so equal totals resolve to the best-ranked action
    std::vector<std::pair<std::string, float>> totals;
    for (const auto& v : votes) {
        auto it = std::find_if(totals.begin(), totals.end(),
                               [&](const std::pair<std::string, float>& t) { return t.first == v.action; });
        if (it == totals.end()) {
            totals.emplace_back(v.action, v.score);
        } else {
            it->second += v.score;
        }
    }

    auto winner = totals.begin();
    for (auto it = totals.begin(); it != totals.end(); ++it) {
        if (it->second > winner->second) {
            winner = it;
        }
    }

    const size_t k_eff = votes.size();
    float confidence = ClampConfidence(winner->second / static_cast<float>(k_eff));
    if (confidence < config_.min_confidence) {
        log::Get()->debug("Vote for '{}' too weak ({:.2f})", winner->first, confidence);
        return std::nullopt;
    }

    std::vector<ActionParams> winner_params;
    for (const auto& v : votes) {
        if (v.action == winner->first) {
            winner_params.push_back(v.params);
        }
    }

    Prediction pred;
    pred.action = winner->first;
    pred.confidence = confidence;
    pred.params = ModeParams(winner_params);
    pred.source = PredictionSource::HISTORICAL;
    pred.sample_size = winner_params.size();

    std::ostringstream reason;
    reason << "you did this " << winner_params.size() << "/" << k_eff
           << " times in similar contexts";
    pred.reason = reason.str();
    return pred;
}

ActionParams HistoricalVoter::ModeParams(const std::vector<ActionParams>& param_list) {
    // key -> values in first-seen order with their counts
    std::map<std::string, std::vector<std::pair<std::string, size_t>>> counts;
    for (const auto& params : param_list) {
        for (const auto& kv : params) {
            auto& values = counts[kv.first];
            auto it = std::find_if(values.begin(), values.end(),
                                   [&](const std::pair<std::string, size_t>& v) { return v.first == kv.second; });
            if (it == values.end()) {
                values.emplace_back(kv.second, 1);
            } else {
                ++it->second;
            }
        }
    }

    ActionParams result;
    for (const auto& entry : counts) {
        const auto* best = &entry.second.front();
        for (const auto& v : entry.second) {
            if (v.second > best->second) {
                best = &v;
            }
        }
        result[entry.first] = best->first;
    }
    return result;
}

// ============================================================================
// Workflows
// ============================================================================

std::optional<HistoricalVoter::WorkflowSuggestion> HistoricalVoter::DetectWorkflow(
        const std::vector<std::string>& recent_actions) {
    if (recent_actions.size() < 2) {
        return std::nullopt;
    }

    // Newest first from the store; walk it oldest first
    auto history = store_->SuccessfulHistory(config_.workflow_history);
    std::reverse(history.begin(), history.end());

    std::vector<std::vector<std::string>> sequences;
    std::vector<std::string> current;
    const auto max_gap = std::chrono::seconds(config_.workflow_gap_seconds);

    for (size_t i = 0; i < history.size(); ++i) {
        if (i > 0 && (history[i].timestamp - history[i - 1].timestamp) > max_gap) {
            if (current.size() >= config_.workflow_min_sequence) {
                sequences.push_back(current);
            }
            current.clear();
        }
        current.push_back(history[i].action);
    }
    if (current.size() >= config_.workflow_min_sequence) {
        sequences.push_back(current);
    }

    const std::string& first = recent_actions[recent_actions.size() - 2];
    const std::string& second = recent_actions.back();

    std::vector<std::string> followers;
    for (const auto& seq : sequences) {
        for (size_t i = 0; i + 2 < seq.size(); ++i) {
            if (seq[i] == first && seq[i + 1] == second) {
                followers.push_back(seq[i + 2]);
            }
        }
    }

    if (followers.empty() || followers.size() < config_.workflow_min_occurrences) {
        return std::nullopt;
    }

    std::vector<std::pair<std::string, size_t>> counts;
    for (const auto& f : followers) {
        auto it = std::find_if(counts.begin(), counts.end(),
                               [&](const std::pair<std::string, size_t>& c) { return c.first == f; });
        if (it == counts.end()) {
            counts.emplace_back(f, 1);
        } else {
            ++it->second;
        }
    }
    auto best = counts.begin();
    for (auto it = counts.begin(); it != counts.end(); ++it) {
        if (it->second > best->second) {
            best = it;
        }
    }

    WorkflowSuggestion suggestion;
    suggestion.pattern = {first, second};
    suggestion.next_action = best->first;
    suggestion.occurrences = best->second;
    suggestion.matches = followers.size();
    suggestion.confidence = static_cast<float>(best->second) / static_cast<float>(followers.size());
    return suggestion;
}

// ============================================================================
// Parameters
// ============================================================================

ActionParams HistoricalVoter::OptimizeParameters(const std::string& action,
                                                 const ContextSnapshot& context,
                                                 const ActionParams& defaults) {
    auto records = store_->SuccessfulRecordsForAction(action, config_.param_history);
    if (records.size() < config_.param_min_records) {
        return defaults;
    }

    std::vector<ActionParams> similar;
    for (const auto& rec : records) {
        float sim = similarity_.Compute(context, context.situation, rec.context, rec.situation);
        if (sim > config_.param_min_similarity) {
            similar.push_back(rec.params);
        }
    }

    if (similar.empty()) {
        return defaults;
    }
    return ModeParams(similar);
}

} // namespace aase
