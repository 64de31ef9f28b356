// File: src/learning/active_learner.hpp
#pragma once

#include "core/context_snapshot.hpp"
#include "core/types.hpp"
#include "storage/event_store.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace aase {

/// Asks the user when no strategy is confident, and learns from the answer
///
/// A user's pick is written to the history as a successful action, so every
/// history-based strategy sees it on the next decision.
class ActiveLearner {
public:
    struct Config {
        Config() = default;

        /// Ask when the best confidence is below this
        float uncertainty_threshold{0.6f};

        /// Options offered in a question
        size_t max_options{3};

        /// Confidence of a user-chosen action
        float taught_confidence{0.95f};
    };

    /// Outcome of ShouldAsk
    struct QueryDecision {
        bool should_ask{false};
        std::vector<Prediction> options;   ///< Best first
    };

    /// @throws std::invalid_argument on a null store
    ActiveLearner(std::shared_ptr<EventStore> store, const Config& config);
    explicit ActiveLearner(std::shared_ptr<EventStore> store);

    QueryDecision ShouldAsk(const std::vector<Prediction>& predictions) const;

    /// Lettered multiple-choice question; empty when there are no options
    std::string FormatQuery(const std::string& situation,
                            const std::vector<Prediction>& options) const;

    /// Resolve a letter answer against `options` and record the pick
    /// @return The chosen action, or std::nullopt for anything that is not
    ///         the letter of an option (including "Something else")
    std::optional<Prediction> ApplyChoice(const std::string& situation,
                                          const ContextSnapshot& context,
                                          const std::vector<Prediction>& options,
                                          const std::string& choice);

    /// Record an action the user named directly
    /// @return false when the record could not be written
    bool TeachAction(const std::string& situation,
                     const ContextSnapshot& context,
                     const std::string& action,
                     const ActionParams& params = {});

    const Config& GetConfig() const { return config_; }

private:
    std::shared_ptr<EventStore> store_;
    Config config_;

    bool RecordTaught(const std::string& situation,
                      const ContextSnapshot& context,
                      const std::string& action,
                      const ActionParams& params);
};

} // namespace aase
