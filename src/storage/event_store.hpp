// File: src/storage/event_store.hpp
#pragma once

#include "core/context_snapshot.hpp"
#include "core/types.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace aase {

/// One executed action with the context it ran in. Immutable once stored.
struct ActionRecord {
    int64_t id{0};
    Timestamp timestamp;
    int hour{0};
    int day_of_week{0};
    bool is_weekend{false};
    TimeOfDay time_of_day{TimeOfDay::NIGHT};
    std::optional<int> battery_percent;
    std::string situation;
    std::string action;
    ActionParams params;
    ActionOutcome outcome{ActionOutcome::SUCCESS};
    int64_t duration_ms{0};
    ContextSnapshot context;
};

/// Aggregate outcome statistics for a (situation, action) pair
struct ActionStats {
    std::string action;
    size_t total{0};
    size_t successes{0};
    float success_rate{0.0f};
    double avg_duration_ms{0.0};   ///< Over successful runs only
};

/// Successful-record count of one situation
struct SituationFrequency {
    std::string situation;
    size_t successes{0};
};

/// Value-table row keyed by (state fingerprint, action)
struct ValueEntry {
    std::string fingerprint;
    std::string action;
    double value{0.0};
    uint32_t update_count{0};
    Timestamp last_updated;
};

/// Stored (text, action) example with its embedding
struct Exemplar {
    int64_t id{0};
    std::string text;
    std::vector<float> embedding;
    std::string action;
    std::string situation;
    uint32_t success_count{1};
    Timestamp created;
};

/// Audit entry of a meta-learner transfer
struct TransferRecord {
    std::string source_situation;
    std::string target_situation;
    std::string action;
    float confidence{0.0f};
    Timestamp timestamp;
};

/// Totals over the action history
struct LearningStats {
    size_t total_actions{0};
    size_t unique_situations{0};
    size_t unique_actions{0};
    size_t successful_actions{0};
    float success_rate{0.0f};
    double avg_duration_ms{0.0};
};

struct ExemplarStats {
    size_t total_examples{0};
    size_t unique_situations{0};
    uint64_t total_uses{0};
};

struct TransferStats {
    size_t total_transfers{0};
    size_t unique_targets{0};
    double avg_confidence{0.0};
};

/// Abstract interface for the engine's persistent state
///
/// Holds the append-only action history and the tables derived from it:
/// the reinforcement value table, few-shot exemplars and the transfer log.
/// Writes are durable when the call returns.
///
/// Error handling: no method throws once the store is constructed. Writes
/// report failure through their return value; reads return empty results.
/// Both log a warning.
///
/// Thread Safety: implementations serialise every statement on one store
/// handle, so a multi-threaded host may share one instance.
class EventStore {
public:
    virtual ~EventStore() = default;

    // ========================================================================
    // Action History
    // ========================================================================

    /// Append an action record
    /// The situation is taken from context.situation.
    /// @return Row id, or std::nullopt on storage failure
    virtual std::optional<int64_t> Record(
        const ContextSnapshot& context,
        const std::string& action,
        const ActionParams& params,
        ActionOutcome outcome,
        std::chrono::milliseconds duration) = 0;

    /// Successful records of `situation`, ranked by exact time-of-day match,
    /// then hour within 2h, then weekend match, then most recent first
    virtual std::vector<ActionRecord> QuerySimilar(
        const ContextSnapshot& context,
        const std::string& situation,
        size_t limit) = 0;

    /// Outcome statistics for a (situation, action) pair
    virtual ActionStats Aggregate(const std::string& situation,
                                  const std::string& action) = 0;

    /// Delete records older than `retention_days` and reclaim space
    /// @return Number of deleted records
    virtual size_t Prune(int retention_days) = 0;

    /// Most recent records, newest first
    virtual std::vector<ActionRecord> RecentActions(size_t limit) = 0;

    /// Successful occurrences of a pair within the last `window_days`
    virtual size_t PatternFrequency(const std::string& situation,
                                    const std::string& action,
                                    int window_days) = 0;

    /// Most recent successful records of any situation, newest first
    virtual std::vector<ActionRecord> SuccessfulHistory(size_t limit) = 0;

    /// Most recent successful records of one action, newest first
    virtual std::vector<ActionRecord> SuccessfulRecordsForAction(
        const std::string& action, size_t limit) = 0;

    /// Situations (other than `exclude`) with at least `min_successes`
    /// successful records
    virtual std::vector<SituationFrequency> SituationFrequencies(
        const std::string& exclude, size_t min_successes) = 0;

    /// Per-action stats of `situation` with success rate > `min_success_rate`
    /// and at least `min_frequency` records, best rate then frequency first
    virtual std::vector<ActionStats> TopActions(const std::string& situation,
                                                double min_success_rate,
                                                size_t min_frequency,
                                                size_t limit) = 0;

    virtual LearningStats GetLearningStats() = 0;

    // ========================================================================
    // Value Table
    // ========================================================================

    virtual std::vector<ValueEntry> LoadValueTable() = 0;

    /// Insert with update_count 1, or overwrite the value, bump the counter
    /// and refresh last_updated
    virtual bool UpsertValue(const std::string& fingerprint,
                             const std::string& action,
                             double value) = 0;

    virtual bool ResetValueTable() = 0;

    // ========================================================================
    // Exemplars
    // ========================================================================

    virtual std::optional<Exemplar> FindExemplar(const std::string& situation,
                                                 const std::string& action) = 0;

    /// @return Row id, or std::nullopt on storage failure
    virtual std::optional<int64_t> InsertExemplar(const Exemplar& exemplar) = 0;

    virtual bool IncrementExemplarSuccess(int64_t id) = 0;

    /// All exemplars, or those of one situation
    virtual std::vector<Exemplar> LoadExemplars(
        const std::optional<std::string>& situation = std::nullopt) = 0;

    virtual ExemplarStats GetExemplarStats() = 0;

    // ========================================================================
    // Transfer Log
    // ========================================================================

    virtual bool RecordTransfer(const TransferRecord& record) = 0;

    virtual TransferStats GetTransferStats() = 0;
};

} // namespace aase
