// File: include/config/engine_config.hpp
//
// YAML configuration of the decision engine
// One section per component; omitted keys keep their defaults.

#ifndef AASE_ENGINE_CONFIG_HPP
#define AASE_ENGINE_CONFIG_HPP

#include "decision/decision_orchestrator.hpp"
#include "learning/active_learner.hpp"
#include "learning/few_shot_matcher.hpp"
#include "learning/historical_voter.hpp"
#include "learning/meta_learner.hpp"
#include "learning/reinforcement_learner.hpp"
#include "storage/sqlite_event_store.hpp"
#include <optional>
#include <string>
#include <vector>

namespace aase {

/// Configuration of a HybridEngine
struct EngineConfig {
    // === Storage ===
    struct Storage {
        SqliteEventStore::Config sqlite;

        /// Records older than this are removed by Prune
        int retention_days = 90;
    } storage;

    // === Logging ===
    struct Logging {
        std::string level = "info";
    } logging;

    // === Learners ===
    ReinforcementLearner::Config reinforcement;

    struct FewShot {
        /// Attach the built-in hashing embedding provider
        bool enabled = true;
        size_t embedding_dimension = 256;
        FewShotMatcher::Config matcher;
    } few_shot;

    MetaLearner::Config meta;

    /// Context-similarity weights live in historical.weights
    /// (YAML section "similarity")
    HistoricalVoter::Config historical;

    ActiveLearner::Config active;

    // === Decision Pipeline ===
    DecisionOrchestrator::Config orchestrator;

    /// Load configuration from YAML file
    /// @return EngineConfig if successful, std::nullopt on error
    static std::optional<EngineConfig> LoadFromFile(const std::string& filepath);

    /// Load configuration from YAML string
    /// @return EngineConfig if successful, std::nullopt on error
    static std::optional<EngineConfig> LoadFromString(const std::string& yaml_content);

    /// Save configuration to YAML file
    bool SaveToFile(const std::string& filepath) const;

    /// YAML representation that LoadFromString reads back
    std::string ToYamlString() const;

    bool Validate() const;
    std::vector<std::string> GetValidationErrors() const;

    static EngineConfig Default();
};

} // namespace aase

#endif // AASE_ENGINE_CONFIG_HPP
