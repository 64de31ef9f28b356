// File: src/learning/reinforcement_learner.hpp
#pragma once

#include "core/context_snapshot.hpp"
#include "core/types.hpp"
#include "storage/event_store.hpp"
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace aase {

/// Tabular value learner over (state fingerprint, action) pairs
///
/// The state fingerprint folds situation, time-of-day bucket, weekday,
/// charging state and battery tier into 16 hex digits, so contexts that
/// differ only in minutes or exact battery level share a value.
///
/// Action selection is ε-greedy: with probability ε a uniformly random
/// candidate is explored, otherwise the first candidate holding the highest
/// value is exploited. Unseen pairs count as 0.
///
/// Updates follow the one-step rule
///   new = old + α (reward + γ max_next - old)
/// and are written through to the store. A failed write is logged and the
/// in-memory value is kept.
class ReinforcementLearner {
public:
    struct Config {
        Config() = default;

        /// Step size α in (0, 1]
        double learning_rate{0.1};

        /// Discount γ in [0, 1]
        double discount{0.9};

        /// Exploration probability ε in [0, 1]
        double epsilon{0.2};

        /// Fixed seed for reproducible exploration; random when unset
        std::optional<uint32_t> seed;

        double success_reward{1.0};
        double failure_reward{-0.5};
        double canceled_reward{-1.0};
    };

    struct Stats {
        uint64_t explorations{0};
        uint64_t exploitations{0};
        uint64_t updates{0};
        uint64_t failed_writes{0};
        size_t table_size{0};
    };

    /// @throws std::invalid_argument on a null store or out-of-range config
    ReinforcementLearner(std::shared_ptr<EventStore> store, const Config& config);
    explicit ReinforcementLearner(std::shared_ptr<EventStore> store);

    /// Stable 16-hex-digit key of a (context, situation) state
    static std::string Fingerprint(const ContextSnapshot& context,
                                   const std::string& situation);

    /// Pick one of `candidates`; std::nullopt when there are none
    std::optional<Prediction> SelectAction(const ContextSnapshot& context,
                                           const std::string& situation,
                                           const std::vector<std::string>& candidates);

    /// Apply one learning step for an executed action
    /// @param next_context State the action led to; `context` when absent
    /// @param next_candidates Actions considered in the next state;
    ///        just `action` when empty
    /// @return The new value of the pair
    double Update(const ContextSnapshot& context,
                  const std::string& situation,
                  const std::string& action,
                  ActionOutcome outcome,
                  const std::optional<ContextSnapshot>& next_context = std::nullopt,
                  const std::vector<std::string>& next_candidates = {});

    /// Current value of a pair, 0 when unseen
    double GetValue(const std::string& fingerprint, const std::string& action);

    double RewardFor(ActionOutcome outcome) const;

    /// Drop every learned value, in memory and in the store
    bool Reset();

    Stats GetStats();
    const Config& GetConfig() const { return config_; }

private:
    using Key = std::pair<std::string, std::string>;

    std::shared_ptr<EventStore> store_;
    Config config_;
    std::mt19937 rng_;

    std::map<Key, double> values_;
    bool loaded_{false};

    Stats stats_;

    void EnsureLoaded();
    double Lookup(const std::string& fingerprint, const std::string& action) const;
};

} // namespace aase
