// File: src/learning/few_shot_matcher.hpp
#pragma once

#include "core/deadline.hpp"
#include "core/types.hpp"
#include "embedding/embedding_circuit_breaker.hpp"
#include "embedding/embedding_provider.hpp"
#include "storage/event_store.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace aase {

/// Predicts an action from free text by nearest stored example
///
/// Every successful (text, action) pair becomes an exemplar with the text's
/// embedding; a repeated (situation, action) pair only bumps the success
/// counter of the first exemplar. Prediction ranks exemplars by cosine
/// similarity boosted by their success count, but gates and reports the
/// raw similarity:
///
///   boosted = raw * (1 + min(success_count / 10, 0.2))
///
/// The matcher has no opinion (std::nullopt / false) whenever the
/// embedding provider is missing, unavailable, throws, times out or
/// returns an empty vector. Repeated provider failures open a circuit
/// breaker so a dead provider is not called on every decision.
class FewShotMatcher {
public:
    struct Config {
        Config() = default;

        /// Minimum raw cosine similarity to predict
        float similarity_threshold{0.75f};

        /// Upper bound on one embedding call
        std::chrono::milliseconds embed_timeout{2000};

        /// success_count divisor and cap of the ranking boost
        float boost_divisor{10.0f};
        float max_boost{0.2f};

        EmbeddingCircuitBreaker::Config breaker;
    };

    struct Stats {
        size_t exemplars{0};
        size_t situations{0};
        uint64_t total_uses{0};
        uint64_t provider_failures{0};
        uint64_t breaker_trips{0};
    };

    /// @param provider May be null; the matcher is then disabled
    /// @throws std::invalid_argument on a null store or bad threshold
    FewShotMatcher(std::shared_ptr<EventStore> store,
                   std::shared_ptr<EmbeddingProvider> provider,
                   const Config& config);
    FewShotMatcher(std::shared_ptr<EventStore> store,
                   std::shared_ptr<EmbeddingProvider> provider);

    /// True when a provider is attached, reports available and the
    /// breaker is closed
    bool IsEnabled() const;

    /// Remember a successful (text, action) pair for `situation`
    /// @return false when nothing could be stored
    bool StoreExample(const std::string& text,
                      const std::string& action,
                      const std::string& situation,
                      Deadline deadline = Deadline::Never());

    /// Best matching action for `text`, optionally limited to `situation`
    std::optional<Prediction> Predict(const std::string& text,
                                      const std::optional<std::string>& situation = std::nullopt,
                                      Deadline deadline = Deadline::Never());

    Stats GetStats();
    const Config& GetConfig() const { return config_; }

private:
    std::shared_ptr<EventStore> store_;
    std::shared_ptr<EmbeddingProvider> provider_;
    Config config_;
    EmbeddingCircuitBreaker breaker_;
    uint64_t provider_failures_{0};

    /// Embed under the matcher's timeout, containing every provider failure
    std::optional<std::vector<float>> SafeEmbed(const std::string& text, Deadline deadline);
};

} // namespace aase
