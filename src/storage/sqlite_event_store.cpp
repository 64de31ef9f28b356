// File: src/storage/sqlite_event_store.cpp
#include "storage/sqlite_event_store.hpp"
#include "core/logging.hpp"
#include <cstring>
#include <sstream>
#include <stdexcept>

namespace aase {

namespace {

constexpr int64_t kMicrosPerDay = 86400LL * 1000000LL;

// Column list shared by every action_history query; ReadRecord depends on
// this order.
constexpr const char* kRecordColumns =
    "id, timestamp, hour, day_of_week, is_weekend, time_of_day, "
    "battery_percent, situation, action_taken, action_params, success, "
    "execution_time_ms, context_blob";

constexpr const char* kExemplarColumns =
    "id, text, embedding, action, situation, success_count, created_at";

std::string ColumnText(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

std::string SerializeParamsBlob(const ActionParams& params) {
    std::ostringstream oss(std::ios::binary);
    SerializeParams(params, oss);
    return oss.str();
}

int64_t CutoffMicros(int days) {
    return Timestamp::Now().ToMicros() - static_cast<int64_t>(days) * kMicrosPerDay;
}

} // namespace

// ============================================================================
// Constructor and Destructor
// ============================================================================

SqliteEventStore::SqliteEventStore(const Config& config)
    : config_(config) {

    int rc = sqlite3_open(config_.db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open database '" + config_.db_path + "': " + error);
    }

    try {
        InitializeDatabase();
    } catch (const std::exception&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }

    log::Get()->debug("Opened event store at {}", config_.db_path);
}

SqliteEventStore::~SqliteEventStore() {
    if (db_) {
        // close_v2 defers the close until outstanding statements are finalized
        int rc = sqlite3_close_v2(db_);
        if (rc != SQLITE_OK) {
            log::Get()->warn("Closing event store {} returned {}", config_.db_path, rc);
        }
        db_ = nullptr;
    }
}

// ============================================================================
// Database Initialization
// ============================================================================

void SqliteEventStore::InitializeDatabase() {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_busy_timeout(db_, config_.busy_timeout_ms);

    if (config_.enable_wal && config_.db_path != ":memory:") {
        ExecuteSQL("PRAGMA journal_mode=WAL;");
    }
    ExecuteSQL("PRAGMA synchronous=" + config_.synchronous + ";");

    CreateTables();
    CreateIndices();
}

void SqliteEventStore::CreateTables() {
    const char* action_history = R"(
        CREATE TABLE IF NOT EXISTS action_history (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp INTEGER NOT NULL,
            hour INTEGER NOT NULL,
            day_of_week INTEGER NOT NULL,
            is_weekend INTEGER NOT NULL,
            time_of_day TEXT NOT NULL,
            battery_percent INTEGER,
            situation TEXT NOT NULL,
            action_taken TEXT NOT NULL,
            action_params BLOB,
            success INTEGER NOT NULL DEFAULT 1,
            execution_time_ms INTEGER NOT NULL DEFAULT 0,
            context_blob BLOB
        );
    )";

    const char* q_values = R"(
        CREATE TABLE IF NOT EXISTS q_values (
            state_hash TEXT NOT NULL,
            action TEXT NOT NULL,
            q_value REAL NOT NULL,
            update_count INTEGER NOT NULL DEFAULT 1,
            last_updated INTEGER NOT NULL,
            PRIMARY KEY (state_hash, action)
        );
    )";

    const char* embeddings = R"(
        CREATE TABLE IF NOT EXISTS embeddings (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            text TEXT NOT NULL,
            embedding BLOB NOT NULL,
            action TEXT NOT NULL,
            situation TEXT NOT NULL,
            success_count INTEGER NOT NULL DEFAULT 1,
            created_at INTEGER NOT NULL
        );
    )";

    const char* pattern_transfers = R"(
        CREATE TABLE IF NOT EXISTS pattern_transfers (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            source_situation TEXT NOT NULL,
            target_situation TEXT NOT NULL,
            action TEXT NOT NULL,
            confidence REAL NOT NULL,
            created_at INTEGER NOT NULL
        );
    )";

    if (!ExecuteSQL(action_history)) {
        throw std::runtime_error("Failed to create action_history table");
    }
    if (!ExecuteSQL(q_values)) {
        throw std::runtime_error("Failed to create q_values table");
    }
    if (!ExecuteSQL(embeddings)) {
        throw std::runtime_error("Failed to create embeddings table");
    }
    if (!ExecuteSQL(pattern_transfers)) {
        throw std::runtime_error("Failed to create pattern_transfers table");
    }
}

void SqliteEventStore::CreateIndices() {
    ExecuteSQL("CREATE INDEX IF NOT EXISTS idx_history_situation ON action_history(situation);");
    ExecuteSQL("CREATE INDEX IF NOT EXISTS idx_history_hour ON action_history(hour);");
    ExecuteSQL("CREATE INDEX IF NOT EXISTS idx_history_day ON action_history(day_of_week);");
    ExecuteSQL("CREATE INDEX IF NOT EXISTS idx_history_timestamp ON action_history(timestamp);");
    ExecuteSQL("CREATE INDEX IF NOT EXISTS idx_history_pair ON action_history(situation, action_taken);");
    ExecuteSQL("CREATE INDEX IF NOT EXISTS idx_embeddings_pair ON embeddings(situation, action);");
    ExecuteSQL("CREATE INDEX IF NOT EXISTS idx_transfers_target ON pattern_transfers(target_situation);");
}

bool SqliteEventStore::ExecuteSQL(const std::string& sql) {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

    if (rc != SQLITE_OK) {
        log::Get()->warn("SQL failed ({}): {}", rc, error_msg ? error_msg : "unknown error");
        if (error_msg) {
            sqlite3_free(error_msg);
        }
        return false;
    }
    return true;
}

sqlite3_stmt* SqliteEventStore::Prepare(const char* sql, const char* what) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        log::Get()->warn("{}: prepare failed: {}", what, sqlite3_errmsg(db_));
        sqlite3_finalize(stmt);
        return nullptr;
    }
    return stmt;
}

// ============================================================================
// Row Decoding
// ============================================================================

ActionRecord SqliteEventStore::ReadRecord(sqlite3_stmt* stmt) {
    ActionRecord rec;
    rec.id = sqlite3_column_int64(stmt, 0);
    rec.timestamp = Timestamp::FromMicros(sqlite3_column_int64(stmt, 1));
    rec.hour = sqlite3_column_int(stmt, 2);
    rec.day_of_week = sqlite3_column_int(stmt, 3);
    rec.is_weekend = sqlite3_column_int(stmt, 4) != 0;
    try {
        rec.time_of_day = ParseTimeOfDay(ColumnText(stmt, 5));
    } catch (const std::invalid_argument&) {
        rec.time_of_day = TimeOfDayForHour(rec.hour);
    }
    if (sqlite3_column_type(stmt, 6) != SQLITE_NULL) {
        rec.battery_percent = sqlite3_column_int(stmt, 6);
    }
    rec.situation = ColumnText(stmt, 7);
    rec.action = ColumnText(stmt, 8);

    const void* params_data = sqlite3_column_blob(stmt, 9);
    int params_size = sqlite3_column_bytes(stmt, 9);
    if (params_data && params_size > 0) {
        try {
            std::string bytes(static_cast<const char*>(params_data), params_size);
            std::istringstream iss(bytes, std::ios::binary);
            rec.params = DeserializeParams(iss);
        } catch (const std::exception& e) {
            log::Get()->warn("Record {}: unreadable params: {}", rec.id, e.what());
        }
    }

    rec.outcome = ActionOutcomeFromCode(sqlite3_column_int(stmt, 10));
    rec.duration_ms = sqlite3_column_int64(stmt, 11);

    const void* ctx_data = sqlite3_column_blob(stmt, 12);
    int ctx_size = sqlite3_column_bytes(stmt, 12);
    bool have_context = false;
    if (ctx_data && ctx_size > 0) {
        try {
            rec.context = ContextSnapshot::FromBlob(ctx_data, static_cast<size_t>(ctx_size));
            have_context = true;
        } catch (const std::exception& e) {
            log::Get()->warn("Record {}: unreadable context: {}", rec.id, e.what());
        }
    }
    if (!have_context) {
        // Rebuild what the broken-out columns hold
        rec.context.timestamp = rec.timestamp;
        rec.context.hour = rec.hour;
        rec.context.day_of_week = rec.day_of_week;
        rec.context.is_weekend = rec.is_weekend;
        rec.context.time_of_day = rec.time_of_day;
        rec.context.battery_percent = rec.battery_percent;
        rec.context.situation = rec.situation;
    }
    return rec;
}

Exemplar SqliteEventStore::ReadExemplar(sqlite3_stmt* stmt) {
    Exemplar ex;
    ex.id = sqlite3_column_int64(stmt, 0);
    ex.text = ColumnText(stmt, 1);

    const void* data = sqlite3_column_blob(stmt, 2);
    int size = sqlite3_column_bytes(stmt, 2);
    if (data && size > 0) {
        ex.embedding.resize(static_cast<size_t>(size) / sizeof(float));
        std::memcpy(ex.embedding.data(), data, ex.embedding.size() * sizeof(float));
    }

    ex.action = ColumnText(stmt, 3);
    ex.situation = ColumnText(stmt, 4);
    ex.success_count = static_cast<uint32_t>(sqlite3_column_int(stmt, 5));
    ex.created = Timestamp::FromMicros(sqlite3_column_int64(stmt, 6));
    return ex;
}

std::vector<ActionRecord> SqliteEventStore::CollectRecords(sqlite3_stmt* stmt) {
    std::vector<ActionRecord> records;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        records.push_back(ReadRecord(stmt));
    }
    if (rc != SQLITE_DONE) {
        log::Get()->warn("History query failed: {}", sqlite3_errmsg(db_));
    }
    sqlite3_finalize(stmt);
    return records;
}

// ============================================================================
// Action History
// ============================================================================

std::optional<int64_t> SqliteEventStore::Record(const ContextSnapshot& context,
                                                const std::string& action,
                                                const ActionParams& params,
                                                ActionOutcome outcome,
                                                std::chrono::milliseconds duration) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string sql = std::string("INSERT INTO action_history (") +
        "timestamp, hour, day_of_week, is_weekend, time_of_day, battery_percent, "
        "situation, action_taken, action_params, success, execution_time_ms, context_blob"
        ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";
    sqlite3_stmt* stmt = Prepare(sql.c_str(), "Record");
    if (!stmt) {
        return std::nullopt;
    }

    Timestamp ts = context.timestamp.ToMicros() != 0 ? context.timestamp : Timestamp::Now();
    std::string params_blob = SerializeParamsBlob(params);
    std::string context_blob = context.ToBlob();

    sqlite3_bind_int64(stmt, 1, ts.ToMicros());
    sqlite3_bind_int(stmt, 2, context.hour);
    sqlite3_bind_int(stmt, 3, context.day_of_week);
    sqlite3_bind_int(stmt, 4, context.is_weekend ? 1 : 0);
    sqlite3_bind_text(stmt, 5, ToString(context.time_of_day), -1, SQLITE_TRANSIENT);
    if (context.battery_percent) {
        sqlite3_bind_int(stmt, 6, *context.battery_percent);
    } else {
        sqlite3_bind_null(stmt, 6);
    }
    sqlite3_bind_text(stmt, 7, context.situation.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 8, action.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_blob(stmt, 9, params_blob.data(), static_cast<int>(params_blob.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 10, static_cast<int>(outcome));
    sqlite3_bind_int64(stmt, 11, duration.count());
    sqlite3_bind_blob(stmt, 12, context_blob.data(), static_cast<int>(context_blob.size()), SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        log::Get()->warn("Failed to record '{}' in '{}': {}",
                         action, context.situation, sqlite3_errmsg(db_));
        return std::nullopt;
    }
    return sqlite3_last_insert_rowid(db_);
}

std::vector<ActionRecord> SqliteEventStore::QuerySimilar(const ContextSnapshot& context,
                                                         const std::string& situation,
                                                         size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Hour distance wraps around midnight
    std::string sql = std::string("SELECT ") + kRecordColumns +
        " FROM action_history WHERE situation = ?1 AND success = 1"
        " ORDER BY CASE"
        "   WHEN time_of_day = ?2 THEN 3"
        "   WHEN MIN(ABS(hour - ?3), 24 - ABS(hour - ?3)) <= 2 THEN 2"
        "   WHEN is_weekend = ?4 THEN 1"
        "   ELSE 0 END DESC, timestamp DESC, id DESC"
        " LIMIT ?5;";
    sqlite3_stmt* stmt = Prepare(sql.c_str(), "QuerySimilar");
    if (!stmt) {
        return {};
    }

    sqlite3_bind_text(stmt, 1, situation.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, ToString(context.time_of_day), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 3, context.hour);
    sqlite3_bind_int(stmt, 4, context.is_weekend ? 1 : 0);
    sqlite3_bind_int64(stmt, 5, static_cast<int64_t>(limit));

    return CollectRecords(stmt);
}

ActionStats SqliteEventStore::Aggregate(const std::string& situation,
                                        const std::string& action) {
    std::lock_guard<std::mutex> lock(mutex_);

    ActionStats stats;
    stats.action = action;

    const char* sql =
        "SELECT COUNT(*),"
        " SUM(CASE WHEN success = 1 THEN 1 ELSE 0 END),"
        " AVG(CASE WHEN success = 1 THEN execution_time_ms END)"
        " FROM action_history WHERE situation = ? AND action_taken = ?;";
    sqlite3_stmt* stmt = Prepare(sql, "Aggregate");
    if (!stmt) {
        return stats;
    }

    sqlite3_bind_text(stmt, 1, situation.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, action.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(stmt) == SQLITE_ROW) {
        stats.total = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
        stats.successes = static_cast<size_t>(sqlite3_column_int64(stmt, 1));
        stats.avg_duration_ms = sqlite3_column_double(stmt, 2);
        if (stats.total > 0) {
            stats.success_rate = static_cast<float>(stats.successes) / static_cast<float>(stats.total);
        }
    }
    sqlite3_finalize(stmt);
    return stats;
}

size_t SqliteEventStore::Prune(int retention_days) {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = Prepare("DELETE FROM action_history WHERE timestamp < ?;", "Prune");
    if (!stmt) {
        return 0;
    }
    sqlite3_bind_int64(stmt, 1, CutoffMicros(retention_days));

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        log::Get()->warn("Prune failed: {}", sqlite3_errmsg(db_));
        return 0;
    }

    size_t deleted = static_cast<size_t>(sqlite3_changes(db_));
    ExecuteSQL("VACUUM;");
    log::Get()->info("Pruned {} records older than {} days", deleted, retention_days);
    return deleted;
}

std::vector<ActionRecord> SqliteEventStore::RecentActions(size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string sql = std::string("SELECT ") + kRecordColumns +
        " FROM action_history ORDER BY timestamp DESC, id DESC LIMIT ?;";
    sqlite3_stmt* stmt = Prepare(sql.c_str(), "RecentActions");
    if (!stmt) {
        return {};
    }
    sqlite3_bind_int64(stmt, 1, static_cast<int64_t>(limit));
    return CollectRecords(stmt);
}

size_t SqliteEventStore::PatternFrequency(const std::string& situation,
                                          const std::string& action,
                                          int window_days) {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql =
        "SELECT COUNT(*) FROM action_history"
        " WHERE situation = ? AND action_taken = ? AND success = 1 AND timestamp >= ?;";
    sqlite3_stmt* stmt = Prepare(sql, "PatternFrequency");
    if (!stmt) {
        return 0;
    }

    sqlite3_bind_text(stmt, 1, situation.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, action.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3, CutoffMicros(window_days));

    size_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return count;
}

std::vector<ActionRecord> SqliteEventStore::SuccessfulHistory(size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string sql = std::string("SELECT ") + kRecordColumns +
        " FROM action_history WHERE success = 1 ORDER BY timestamp DESC, id DESC LIMIT ?;";
    sqlite3_stmt* stmt = Prepare(sql.c_str(), "SuccessfulHistory");
    if (!stmt) {
        return {};
    }
    sqlite3_bind_int64(stmt, 1, static_cast<int64_t>(limit));
    return CollectRecords(stmt);
}

std::vector<ActionRecord> SqliteEventStore::SuccessfulRecordsForAction(
        const std::string& action, size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string sql = std::string("SELECT ") + kRecordColumns +
        " FROM action_history WHERE action_taken = ? AND success = 1"
        " ORDER BY timestamp DESC, id DESC LIMIT ?;";
    sqlite3_stmt* stmt = Prepare(sql.c_str(), "SuccessfulRecordsForAction");
    if (!stmt) {
        return {};
    }
    sqlite3_bind_text(stmt, 1, action.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, static_cast<int64_t>(limit));
    return CollectRecords(stmt);
}

std::vector<SituationFrequency> SqliteEventStore::SituationFrequencies(
        const std::string& exclude, size_t min_successes) {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql =
        "SELECT situation, COUNT(*) AS n FROM action_history"
        " WHERE success = 1 AND situation != ? AND situation != ''"
        " GROUP BY situation HAVING n >= ? ORDER BY n DESC, situation ASC;";
    sqlite3_stmt* stmt = Prepare(sql, "SituationFrequencies");
    if (!stmt) {
        return {};
    }
    sqlite3_bind_text(stmt, 1, exclude.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, static_cast<int64_t>(min_successes));

    std::vector<SituationFrequency> result;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        SituationFrequency freq;
        freq.situation = ColumnText(stmt, 0);
        freq.successes = static_cast<size_t>(sqlite3_column_int64(stmt, 1));
        result.push_back(std::move(freq));
    }
    sqlite3_finalize(stmt);
    return result;
}

std::vector<ActionStats> SqliteEventStore::TopActions(const std::string& situation,
                                                      double min_success_rate,
                                                      size_t min_frequency,
                                                      size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql =
        "SELECT action_taken, COUNT(*) AS frequency,"
        " SUM(CASE WHEN success = 1 THEN 1 ELSE 0 END) AS successes,"
        " AVG(CASE WHEN success = 1 THEN 1.0 ELSE 0.0 END) AS success_rate,"
        " AVG(CASE WHEN success = 1 THEN execution_time_ms END)"
        " FROM action_history WHERE situation = ?"
        " GROUP BY action_taken"
        " HAVING success_rate > ? AND frequency >= ?"
        " ORDER BY success_rate DESC, frequency DESC, action_taken ASC"
        " LIMIT ?;";
    sqlite3_stmt* stmt = Prepare(sql, "TopActions");
    if (!stmt) {
        return {};
    }
    sqlite3_bind_text(stmt, 1, situation.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt, 2, min_success_rate);
    sqlite3_bind_int64(stmt, 3, static_cast<int64_t>(min_frequency));
    sqlite3_bind_int64(stmt, 4, static_cast<int64_t>(limit));

    std::vector<ActionStats> result;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ActionStats stats;
        stats.action = ColumnText(stmt, 0);
        stats.total = static_cast<size_t>(sqlite3_column_int64(stmt, 1));
        stats.successes = static_cast<size_t>(sqlite3_column_int64(stmt, 2));
        stats.success_rate = static_cast<float>(sqlite3_column_double(stmt, 3));
        stats.avg_duration_ms = sqlite3_column_double(stmt, 4);
        result.push_back(std::move(stats));
    }
    sqlite3_finalize(stmt);
    return result;
}

LearningStats SqliteEventStore::GetLearningStats() {
    std::lock_guard<std::mutex> lock(mutex_);

    LearningStats stats;
    const char* sql =
        "SELECT COUNT(*), COUNT(DISTINCT situation), COUNT(DISTINCT action_taken),"
        " SUM(CASE WHEN success = 1 THEN 1 ELSE 0 END),"
        " AVG(execution_time_ms)"
        " FROM action_history;";
    sqlite3_stmt* stmt = Prepare(sql, "GetLearningStats");
    if (!stmt) {
        return stats;
    }

    if (sqlite3_step(stmt) == SQLITE_ROW) {
        stats.total_actions = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
        stats.unique_situations = static_cast<size_t>(sqlite3_column_int64(stmt, 1));
        stats.unique_actions = static_cast<size_t>(sqlite3_column_int64(stmt, 2));
        stats.successful_actions = static_cast<size_t>(sqlite3_column_int64(stmt, 3));
        stats.avg_duration_ms = sqlite3_column_double(stmt, 4);
        if (stats.total_actions > 0) {
            stats.success_rate = static_cast<float>(stats.successful_actions) /
                                 static_cast<float>(stats.total_actions);
        }
    }
    sqlite3_finalize(stmt);
    return stats;
}

// ============================================================================
// Value Table
// ============================================================================

std::vector<ValueEntry> SqliteEventStore::LoadValueTable() {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = Prepare(
        "SELECT state_hash, action, q_value, update_count, last_updated FROM q_values;",
        "LoadValueTable");
    if (!stmt) {
        return {};
    }

    std::vector<ValueEntry> entries;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ValueEntry entry;
        entry.fingerprint = ColumnText(stmt, 0);
        entry.action = ColumnText(stmt, 1);
        entry.value = sqlite3_column_double(stmt, 2);
        entry.update_count = static_cast<uint32_t>(sqlite3_column_int(stmt, 3));
        entry.last_updated = Timestamp::FromMicros(sqlite3_column_int64(stmt, 4));
        entries.push_back(std::move(entry));
    }
    sqlite3_finalize(stmt);
    return entries;
}

bool SqliteEventStore::UpsertValue(const std::string& fingerprint,
                                   const std::string& action,
                                   double value) {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql =
        "INSERT INTO q_values (state_hash, action, q_value, update_count, last_updated)"
        " VALUES (?1, ?2, ?3, 1, ?4)"
        " ON CONFLICT(state_hash, action) DO UPDATE SET"
        "   q_value = excluded.q_value,"
        "   update_count = q_values.update_count + 1,"
        "   last_updated = excluded.last_updated;";
    sqlite3_stmt* stmt = Prepare(sql, "UpsertValue");
    if (!stmt) {
        return false;
    }

    sqlite3_bind_text(stmt, 1, fingerprint.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, action.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt, 3, value);
    sqlite3_bind_int64(stmt, 4, Timestamp::Now().ToMicros());

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        log::Get()->warn("Failed to persist value ({}, {}): {}",
                         fingerprint, action, sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

bool SqliteEventStore::ResetValueTable() {
    std::lock_guard<std::mutex> lock(mutex_);
    return ExecuteSQL("DELETE FROM q_values;");
}

// ============================================================================
// Exemplars
// ============================================================================

std::optional<Exemplar> SqliteEventStore::FindExemplar(const std::string& situation,
                                                       const std::string& action) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string sql = std::string("SELECT ") + kExemplarColumns +
        " FROM embeddings WHERE situation = ? AND action = ? ORDER BY id LIMIT 1;";
    sqlite3_stmt* stmt = Prepare(sql.c_str(), "FindExemplar");
    if (!stmt) {
        return std::nullopt;
    }
    sqlite3_bind_text(stmt, 1, situation.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, action.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<Exemplar> found;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        found = ReadExemplar(stmt);
    }
    sqlite3_finalize(stmt);
    return found;
}

std::optional<int64_t> SqliteEventStore::InsertExemplar(const Exemplar& exemplar) {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql =
        "INSERT INTO embeddings (text, embedding, action, situation, success_count, created_at)"
        " VALUES (?, ?, ?, ?, ?, ?);";
    sqlite3_stmt* stmt = Prepare(sql, "InsertExemplar");
    if (!stmt) {
        return std::nullopt;
    }

    Timestamp created = exemplar.created.ToMicros() != 0 ? exemplar.created : Timestamp::Now();

    sqlite3_bind_text(stmt, 1, exemplar.text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_blob(stmt, 2, exemplar.embedding.data(),
                      static_cast<int>(exemplar.embedding.size() * sizeof(float)),
                      SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, exemplar.action.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, exemplar.situation.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 5, static_cast<int>(exemplar.success_count));
    sqlite3_bind_int64(stmt, 6, created.ToMicros());

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        log::Get()->warn("Failed to store exemplar for '{}': {}",
                         exemplar.action, sqlite3_errmsg(db_));
        return std::nullopt;
    }
    return sqlite3_last_insert_rowid(db_);
}

bool SqliteEventStore::IncrementExemplarSuccess(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = Prepare(
        "UPDATE embeddings SET success_count = success_count + 1 WHERE id = ?;",
        "IncrementExemplarSuccess");
    if (!stmt) {
        return false;
    }
    sqlite3_bind_int64(stmt, 1, id);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        log::Get()->warn("Failed to update exemplar {}: {}", id, sqlite3_errmsg(db_));
        return false;
    }
    return sqlite3_changes(db_) > 0;
}

std::vector<Exemplar> SqliteEventStore::LoadExemplars(const std::optional<std::string>& situation) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string sql = std::string("SELECT ") + kExemplarColumns + " FROM embeddings";
    if (situation) {
        sql += " WHERE situation = ?";
    }
    sql += " ORDER BY id;";

    sqlite3_stmt* stmt = Prepare(sql.c_str(), "LoadExemplars");
    if (!stmt) {
        return {};
    }
    if (situation) {
        sqlite3_bind_text(stmt, 1, situation->c_str(), -1, SQLITE_TRANSIENT);
    }

    std::vector<Exemplar> exemplars;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        exemplars.push_back(ReadExemplar(stmt));
    }
    sqlite3_finalize(stmt);
    return exemplars;
}

ExemplarStats SqliteEventStore::GetExemplarStats() {
    std::lock_guard<std::mutex> lock(mutex_);

    ExemplarStats stats;
    sqlite3_stmt* stmt = Prepare(
        "SELECT COUNT(*), COUNT(DISTINCT situation), COALESCE(SUM(success_count), 0) FROM embeddings;",
        "GetExemplarStats");
    if (!stmt) {
        return stats;
    }
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        stats.total_examples = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
        stats.unique_situations = static_cast<size_t>(sqlite3_column_int64(stmt, 1));
        stats.total_uses = static_cast<uint64_t>(sqlite3_column_int64(stmt, 2));
    }
    sqlite3_finalize(stmt);
    return stats;
}

// ============================================================================
// Transfer Log
// ============================================================================

bool SqliteEventStore::RecordTransfer(const TransferRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql =
        "INSERT INTO pattern_transfers (source_situation, target_situation, action, confidence, created_at)"
        " VALUES (?, ?, ?, ?, ?);";
    sqlite3_stmt* stmt = Prepare(sql, "RecordTransfer");
    if (!stmt) {
        return false;
    }

    Timestamp ts = record.timestamp.ToMicros() != 0 ? record.timestamp : Timestamp::Now();
    sqlite3_bind_text(stmt, 1, record.source_situation.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, record.target_situation.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, record.action.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt, 4, record.confidence);
    sqlite3_bind_int64(stmt, 5, ts.ToMicros());

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        log::Get()->warn("Failed to log transfer {} -> {}: {}",
                         record.source_situation, record.target_situation, sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

TransferStats SqliteEventStore::GetTransferStats() {
    std::lock_guard<std::mutex> lock(mutex_);

    TransferStats stats;
    sqlite3_stmt* stmt = Prepare(
        "SELECT COUNT(*), COUNT(DISTINCT target_situation), COALESCE(AVG(confidence), 0)"
        " FROM pattern_transfers;",
        "GetTransferStats");
    if (!stmt) {
        return stats;
    }
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        stats.total_transfers = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
        stats.unique_targets = static_cast<size_t>(sqlite3_column_int64(stmt, 1));
        stats.avg_confidence = sqlite3_column_double(stmt, 2);
    }
    sqlite3_finalize(stmt);
    return stats;
}

} // namespace aase
