// File: src/decision/decision_strategy.hpp
#pragma once

#include "core/context_snapshot.hpp"
#include "core/deadline.hpp"
#include "core/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace aase {

/// Everything a strategy may look at for one decision
struct DecisionRequest {
    std::string situation;
    std::string user_text;                       ///< May be empty
    ContextSnapshot context;
    std::vector<std::string> candidate_actions;  ///< May be empty
    Deadline deadline;
};

/// One way of proposing an action
///
/// Implementations return std::nullopt when they have no opinion. They may
/// throw; the orchestrator contains the exception and moves on.
class DecisionStrategy {
public:
    virtual ~DecisionStrategy() = default;

    virtual std::optional<Prediction> Propose(const DecisionRequest& request) = 0;

    /// Short identifier for logs and statistics
    virtual std::string Name() const = 0;
};

} // namespace aase
