// File: src/storage/sqlite_event_store.hpp
#pragma once

#include "storage/event_store.hpp"
#include <mutex>
#include <string>
#include <sqlite3.h>

namespace aase {

/// Event store backed by a single SQLite database file
///
/// Tables:
/// - action_history: one row per executed action, context columns broken
///   out for ranking plus the full snapshot as a BLOB
/// - q_values: reinforcement value table, keyed by (state_hash, action)
/// - embeddings: few-shot exemplars, vectors stored as raw float BLOBs
/// - pattern_transfers: meta-learner audit log
///
/// Use ":memory:" as db_path for a private in-memory store.
class SqliteEventStore : public EventStore {
public:
    struct Config {
        Config() = default;

        /// Path to the SQLite database file
        std::string db_path{"aase.db"};

        /// Enable Write-Ahead Logging
        bool enable_wal{true};

        /// Milliseconds to wait on a locked database
        int busy_timeout_ms{5000};

        /// Synchronous mode: FULL, NORMAL, or OFF
        std::string synchronous{"NORMAL"};
    };

    /// @throws std::runtime_error if the database cannot be opened or the
    ///         schema cannot be created
    explicit SqliteEventStore(const Config& config);
    ~SqliteEventStore() override;

    SqliteEventStore(const SqliteEventStore&) = delete;
    SqliteEventStore& operator=(const SqliteEventStore&) = delete;

    // ========================================================================
    // EventStore Interface Implementation
    // ========================================================================

    std::optional<int64_t> Record(const ContextSnapshot& context,
                                  const std::string& action,
                                  const ActionParams& params,
                                  ActionOutcome outcome,
                                  std::chrono::milliseconds duration) override;

    std::vector<ActionRecord> QuerySimilar(const ContextSnapshot& context,
                                           const std::string& situation,
                                           size_t limit) override;

    ActionStats Aggregate(const std::string& situation,
                          const std::string& action) override;

    size_t Prune(int retention_days) override;

    std::vector<ActionRecord> RecentActions(size_t limit) override;

    size_t PatternFrequency(const std::string& situation,
                            const std::string& action,
                            int window_days) override;

    std::vector<ActionRecord> SuccessfulHistory(size_t limit) override;

    std::vector<ActionRecord> SuccessfulRecordsForAction(
        const std::string& action, size_t limit) override;

    std::vector<SituationFrequency> SituationFrequencies(
        const std::string& exclude, size_t min_successes) override;

    std::vector<ActionStats> TopActions(const std::string& situation,
                                        double min_success_rate,
                                        size_t min_frequency,
                                        size_t limit) override;

    LearningStats GetLearningStats() override;

    std::vector<ValueEntry> LoadValueTable() override;
    bool UpsertValue(const std::string& fingerprint,
                     const std::string& action,
                     double value) override;
    bool ResetValueTable() override;

    std::optional<Exemplar> FindExemplar(const std::string& situation,
                                         const std::string& action) override;
    std::optional<int64_t> InsertExemplar(const Exemplar& exemplar) override;
    bool IncrementExemplarSuccess(int64_t id) override;
    std::vector<Exemplar> LoadExemplars(
        const std::optional<std::string>& situation = std::nullopt) override;
    ExemplarStats GetExemplarStats() override;

    bool RecordTransfer(const TransferRecord& record) override;
    TransferStats GetTransferStats() override;

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
    sqlite3* db_{nullptr};
    mutable std::mutex mutex_;

    // ========================================================================
    // Helper Methods
    // ========================================================================

    void InitializeDatabase();
    void CreateTables();
    void CreateIndices();

    /// Execute SQL without results. Caller holds mutex_.
    bool ExecuteSQL(const std::string& sql);

    /// Prepare a statement, logging on failure. Caller holds mutex_.
    sqlite3_stmt* Prepare(const char* sql, const char* what);

    /// Step a prepared record query to completion and finalize it
    std::vector<ActionRecord> CollectRecords(sqlite3_stmt* stmt);

    static ActionRecord ReadRecord(sqlite3_stmt* stmt);
    static Exemplar ReadExemplar(sqlite3_stmt* stmt);
};

} // namespace aase
