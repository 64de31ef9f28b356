// File: src/learning/meta_learner.cpp
#include "learning/meta_learner.hpp"
#include "core/logging.hpp"
#include "similarity/vector_similarity.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace aase {

MetaLearner::MetaLearner(std::shared_ptr<EventStore> store, const Config& config)
    : store_(std::move(store)), config_(config) {

    if (!store_) {
        throw std::invalid_argument("MetaLearner requires non-null store");
    }
    if (config_.min_similarity < 0.0f || config_.min_similarity > 1.0f) {
        throw std::invalid_argument("min_similarity must be in range [0.0, 1.0]");
    }
    if (config_.max_confidence < 0.0f || config_.max_confidence > 1.0f) {
        throw std::invalid_argument("max_confidence must be in range [0.0, 1.0]");
    }
}

MetaLearner::MetaLearner(std::shared_ptr<EventStore> store)
    : MetaLearner(std::move(store), Config{}) {
}

std::vector<MetaLearner::SimilarSituation> MetaLearner::FindSimilarSituations(
        const std::string& target) {
    std::vector<SimilarSituation> similar;

    for (const auto& freq : store_->SituationFrequencies(target, config_.min_source_successes)) {
        float score = SituationSimilarity(target, freq.situation);
        if (score >= config_.min_similarity) {
            similar.push_back({freq.situation, score, freq.successes});
        }
    }

    std::stable_sort(similar.begin(), similar.end(),
                     [](const SimilarSituation& a, const SimilarSituation& b) {
                         return a.similarity > b.similarity;
                     });
    return similar;
}

float MetaLearner::TransferConfidence(float success_rate, size_t frequency) const {
    float freq_bonus = std::min(static_cast<float>(frequency) / 10.0f, 0.15f);
    return std::min(success_rate * 0.8f + freq_bonus, config_.max_confidence);
}

std::vector<Prediction> MetaLearner::Transfer(const std::string& source,
                                              const std::string& target) {
    std::vector<Prediction> transferred;

    auto top = store_->TopActions(source, config_.min_success_rate,
                                  config_.min_frequency, config_.max_transfers);
    for (const auto& stats : top) {
        Prediction pred;
        pred.action = stats.action;
        pred.confidence = ClampConfidence(TransferConfidence(stats.success_rate, stats.total));
        pred.source = PredictionSource::META;
        pred.transfer_source = source;
        pred.sample_size = stats.total;

        std::ostringstream reason;
        reason << "worked in '" << source << "' ("
               << static_cast<int>(stats.success_rate * 100.0f + 0.5f) << "% of "
               << stats.total << ")";
        pred.reason = reason.str();

        TransferRecord record;
        record.source_situation = source;
        record.target_situation = target;
        record.action = pred.action;
        record.confidence = pred.confidence;
        record.timestamp = Timestamp::Now();
        if (!store_->RecordTransfer(record)) {
            log::Get()->warn("Transfer {} -> {} of '{}' not logged", source, target, pred.action);
        }

        transferred.push_back(std::move(pred));
    }

    if (!transferred.empty()) {
        log::Get()->info("Transferred {} actions from '{}' to '{}'",
                         transferred.size(), source, target);
    }
    return transferred;
}

std::optional<Prediction> MetaLearner::Bootstrap(const std::string& new_situation) {
    auto similar = FindSimilarSituations(new_situation);
    if (similar.empty()) {
        log::Get()->debug("No situation related to '{}'", new_situation);
        return std::nullopt;
    }

    const SimilarSituation& closest = similar.front();
    auto transferred = Transfer(closest.situation, new_situation);
    if (transferred.empty()) {
        return std::nullopt;
    }

    Prediction pred = std::move(transferred.front());
    pred.meta_similarity = closest.similarity;
    return pred;
}

MetaLearner::Stats MetaLearner::GetStats() {
    TransferStats stored = store_->GetTransferStats();

    Stats stats;
    stats.total_transfers = stored.total_transfers;
    stats.unique_targets = stored.unique_targets;
    stats.avg_confidence = stored.avg_confidence;
    return stats;
}

} // namespace aase
