// File: src/learning/few_shot_matcher.cpp
#include "learning/few_shot_matcher.hpp"
#include "core/logging.hpp"
#include "similarity/vector_similarity.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace aase {

FewShotMatcher::FewShotMatcher(std::shared_ptr<EventStore> store,
                               std::shared_ptr<EmbeddingProvider> provider,
                               const Config& config)
    : store_(std::move(store)),
      provider_(std::move(provider)),
      config_(config),
      breaker_(config.breaker) {

    if (!store_) {
        throw std::invalid_argument("FewShotMatcher requires non-null store");
    }
    if (config_.similarity_threshold < 0.0f || config_.similarity_threshold > 1.0f) {
        throw std::invalid_argument("similarity_threshold must be in range [0.0, 1.0]");
    }
    if (config_.boost_divisor <= 0.0f) {
        throw std::invalid_argument("boost_divisor must be positive");
    }
    if (!provider_) {
        log::Get()->warn("No embedding provider; few-shot matching disabled");
    }
}

FewShotMatcher::FewShotMatcher(std::shared_ptr<EventStore> store,
                               std::shared_ptr<EmbeddingProvider> provider)
    : FewShotMatcher(std::move(store), std::move(provider), Config{}) {
}

bool FewShotMatcher::IsEnabled() const {
    return provider_ && provider_->IsAvailable() && !breaker_.IsOpen();
}

std::optional<std::vector<float>> FewShotMatcher::SafeEmbed(const std::string& text,
                                                            Deadline deadline) {
    if (!provider_) {
        return std::nullopt;
    }
    if (breaker_.IsOpen()) {
        log::Get()->debug("Embedding breaker open; skipping provider call");
        return std::nullopt;
    }
    if (!provider_->IsAvailable()) {
        log::Get()->warn("Embedding provider {} unavailable", provider_->Name());
        return std::nullopt;
    }

    Deadline bounded = deadline.Tightened(config_.embed_timeout);
    std::optional<std::vector<float>> vec;
    try {
        vec = provider_->Embed(text, bounded);
    } catch (const std::exception& e) {
        log::Get()->warn("Embedding provider {} failed: {}", provider_->Name(), e.what());
        vec.reset();
    }

    if (vec && bounded.Expired()) {
        log::Get()->warn("Embedding from {} arrived after the deadline; discarded",
                         provider_->Name());
        vec.reset();
    }
    if (vec && vec->empty()) {
        log::Get()->warn("Embedding provider {} returned an empty vector", provider_->Name());
        vec.reset();
    }

    if (!vec) {
        ++provider_failures_;
        breaker_.RecordFailure();
        if (breaker_.IsOpen()) {
            log::Get()->warn("Embedding provider {} failed {} times in a row; pausing calls",
                             provider_->Name(), breaker_.ConsecutiveFailures());
        }
        return std::nullopt;
    }

    breaker_.RecordSuccess();
    return vec;
}

bool FewShotMatcher::StoreExample(const std::string& text,
                                  const std::string& action,
                                  const std::string& situation,
                                  Deadline deadline) {
    if (!provider_) {
        return false;
    }

    if (auto existing = store_->FindExemplar(situation, action)) {
        return store_->IncrementExemplarSuccess(existing->id);
    }

    auto embedding = SafeEmbed(text, deadline);
    if (!embedding) {
        return false;
    }

    Exemplar ex;
    ex.text = text;
    ex.embedding = std::move(*embedding);
    ex.action = action;
    ex.situation = situation;
    ex.success_count = 1;
    ex.created = Timestamp::Now();

    auto id = store_->InsertExemplar(ex);
    if (id) {
        log::Get()->info("Learned example '{}' -> {} ({})", text, action, situation);
    }
    return id.has_value();
}

std::optional<Prediction> FewShotMatcher::Predict(const std::string& text,
                                                  const std::optional<std::string>& situation,
                                                  Deadline deadline) {
    if (text.empty()) {
        return std::nullopt;
    }

    auto query = SafeEmbed(text, deadline);
    if (!query) {
        return std::nullopt;
    }

    std::vector<Exemplar> exemplars = store_->LoadExemplars(situation);
    if (exemplars.empty()) {
        log::Get()->debug("No exemplars to match against");
        return std::nullopt;
    }

    const Exemplar* best = nullptr;
    float best_boosted = 0.0f;
    float best_raw = 0.0f;

    for (const auto& ex : exemplars) {
        float raw = CosineSimilarity(*query, ex.embedding);
        float boost = std::min(static_cast<float>(ex.success_count) / config_.boost_divisor,
                               config_.max_boost);
        float boosted = raw * (1.0f + boost);
        if (!best || boosted > best_boosted) {
            best = &ex;
            best_boosted = boosted;
            best_raw = raw;
        }
    }

    // Ranked by boosted score, gated by the raw one
    if (!best || !(best_raw >= config_.similarity_threshold)) {
        log::Get()->debug("Best example similarity {:.3f} below {:.2f}",
                          best_raw, config_.similarity_threshold);
        return std::nullopt;
    }

    Prediction pred;
    pred.action = best->action;
    pred.confidence = ClampConfidence(best_raw);
    pred.source = PredictionSource::FEW_SHOT;
    pred.sample_size = best->success_count;

    std::ostringstream reason;
    reason << "similar to '" << best->text << "'";
    pred.reason = reason.str();
    return pred;
}

FewShotMatcher::Stats FewShotMatcher::GetStats() {
    ExemplarStats stored = store_->GetExemplarStats();

    Stats stats;
    stats.exemplars = stored.total_examples;
    stats.situations = stored.unique_situations;
    stats.total_uses = stored.total_uses;
    stats.provider_failures = provider_failures_;
    stats.breaker_trips = breaker_.TimesOpened();
    return stats;
}

} // namespace aase
