/**
 * @file session_ledger.cpp
 * @brief Implementation of the SQLite session ledger
 *
 * WPMan - WireProxy Profile Manager
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "wpman/session_ledger.hpp"
#include "wpman/utilities.hpp"

#include <sqlite3.h>
#include <stdexcept>

namespace wpman {

using namespace wpman::utilities;

std::string session_event_to_string(SessionEvent event) {
    switch (event) {
        case SessionEvent::STARTED:       return "started";
        case SessionEvent::LAUNCH_FAILED: return "launch_failed";
        case SessionEvent::STOPPED:       return "stopped";
        case SessionEvent::DIED:          return "died";
        default:                          return "unknown";
    }
}

std::optional<SessionEvent> string_to_session_event(const std::string& str) {
    if (str == "started") return SessionEvent::STARTED;
    if (str == "launch_failed") return SessionEvent::LAUNCH_FAILED;
    if (str == "stopped") return SessionEvent::STOPPED;
    if (str == "died") return SessionEvent::DIED;
    return std::nullopt;
}

namespace {

std::string column_text(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

template <typename T>
std::optional<T> column_optional(sqlite3_stmt* stmt, int column) {
    if (sqlite3_column_type(stmt, column) == SQLITE_NULL) {
        return std::nullopt;
    }
    return static_cast<T>(sqlite3_column_int64(stmt, column));
}

template <typename T>
void bind_optional(sqlite3_stmt* stmt, int index, const std::optional<T>& value) {
    if (value) {
        sqlite3_bind_int64(stmt, index, static_cast<sqlite3_int64>(*value));
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

} // namespace

// ============================================================================
// Constructor / Destructor
// ============================================================================

SessionLedger::SessionLedger(const std::string& database_path)
    : database_path_(database_path)
    , db_connection_(nullptr)
{
    sqlite3* db = nullptr;
    int rc = sqlite3_open(database_path_.c_str(), &db);

    if (rc != SQLITE_OK) {
        if (db) {
            sqlite3_close(db);
        }
        throw std::runtime_error("Failed to open session ledger database: " + database_path_);
    }

    db_connection_ = static_cast<void*>(db);

    // Auto-connect workers record concurrently with CLI reads
    sqlite3_busy_timeout(db, 2000);

    if (!initialize_database()) {
        sqlite3_close(db);
        db_connection_ = nullptr;
        throw std::runtime_error("Failed to initialize session ledger schema");
    }
}

SessionLedger::~SessionLedger() {
    if (db_connection_) {
        sqlite3* db = static_cast<sqlite3*>(db_connection_);
        sqlite3_close(db);
        db_connection_ = nullptr;
    }
}

// ============================================================================
// Database Initialization
// ============================================================================

bool SessionLedger::initialize_database() {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);
    char* error_msg = nullptr;

    const char* create_sessions_table = R"(
        CREATE TABLE IF NOT EXISTS sessions (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            profile_name TEXT NOT NULL,
            event TEXT NOT NULL,
            port INTEGER,
            pid INTEGER,
            exit_code INTEGER,
            config_sha256 TEXT NOT NULL DEFAULT '',
            detail TEXT NOT NULL DEFAULT '',
            timestamp INTEGER NOT NULL,
            CONSTRAINT valid_port CHECK (port IS NULL OR (port > 0 AND port <= 65535))
        );
        CREATE INDEX IF NOT EXISTS idx_sessions_profile ON sessions(profile_name);
        CREATE INDEX IF NOT EXISTS idx_sessions_timestamp ON sessions(timestamp);
    )";

    int rc = sqlite3_exec(db, create_sessions_table, nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        if (error_msg) {
            log_error(std::string("SessionLedger: Schema creation failed: ") + error_msg);
            sqlite3_free(error_msg);
        }
        return false;
    }

    return true;
}

// ============================================================================
// Recording
// ============================================================================

bool SessionLedger::record(const SessionRecord& record) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = R"(
        INSERT INTO sessions
        (profile_name, event, port, pid, exit_code, config_sha256, detail, timestamp)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?)
    )";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);

    if (rc != SQLITE_OK) {
        log_error(std::string("SessionLedger: Prepare failed: ") + sqlite3_errmsg(db));
        return false;
    }

    uint64_t timestamp = record.timestamp ? record.timestamp : current_timestamp();
    std::string event = session_event_to_string(record.event);

    sqlite3_bind_text(stmt, 1, record.profile_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, event.c_str(), -1, SQLITE_TRANSIENT);
    bind_optional(stmt, 3, record.port);
    bind_optional(stmt, 4, record.pid);
    bind_optional(stmt, 5, record.exit_code);
    sqlite3_bind_text(stmt, 6, record.config_sha256.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 7, record.detail.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 8, static_cast<sqlite3_int64>(timestamp));

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        log_error("SessionLedger: Failed to record " + event + " for '" + record.profile_name + "'");
        return false;
    }
    return true;
}

bool SessionLedger::record_started(const Profile& profile, uint16_t port, ProcessId pid) {
    SessionRecord entry;
    entry.profile_name = profile.name;
    entry.event = SessionEvent::STARTED;
    entry.port = port;
    entry.pid = pid;
    entry.config_sha256 = calculate_file_hash(profile.config_path).value_or("");
    return record(entry);
}

bool SessionLedger::record_launch_failed(
    const Profile& profile,
    uint16_t port,
    std::optional<int> exit_code,
    const std::string& detail
) {
    SessionRecord entry;
    entry.profile_name = profile.name;
    entry.event = SessionEvent::LAUNCH_FAILED;
    entry.port = port;
    entry.exit_code = exit_code;
    entry.config_sha256 = calculate_file_hash(profile.config_path).value_or("");
    entry.detail = detail;
    return record(entry);
}

bool SessionLedger::record_stopped(
    const std::string& profile_name,
    std::optional<uint16_t> port,
    std::optional<ProcessId> pid,
    SessionEvent event
) {
    SessionRecord entry;
    entry.profile_name = profile_name;
    entry.event = event;
    entry.port = port;
    entry.pid = pid;
    return record(entry);
}

// ============================================================================
// Queries
// ============================================================================

std::vector<SessionRecord> SessionLedger::get_history(const std::string& profile_name, size_t limit) const {
    const char* sql = R"(
        SELECT id, profile_name, event, port, pid, exit_code, config_sha256, detail, timestamp
        FROM sessions
        WHERE profile_name = ?
        ORDER BY timestamp DESC, id DESC
        LIMIT ?
    )";
    return query_records(sql, &profile_name, limit);
}

std::vector<SessionRecord> SessionLedger::get_recent(size_t limit) const {
    const char* sql = R"(
        SELECT id, profile_name, event, port, pid, exit_code, config_sha256, detail, timestamp
        FROM sessions
        ORDER BY timestamp DESC, id DESC
        LIMIT ?
    )";
    return query_records(sql, nullptr, limit);
}

size_t SessionLedger::count_launches(const std::string& profile_name) const {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = "SELECT COUNT(*) FROM sessions WHERE profile_name = ? AND event = 'started'";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }

    sqlite3_bind_text(stmt, 1, profile_name.c_str(), -1, SQLITE_TRANSIENT);

    size_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }

    sqlite3_finalize(stmt);
    return count;
}

bool SessionLedger::rename_profile(const std::string& old_name, const std::string& new_name) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = "UPDATE sessions SET profile_name = ? WHERE profile_name = ?";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        log_error(std::string("SessionLedger: Prepare failed: ") + sqlite3_errmsg(db));
        return false;
    }

    sqlite3_bind_text(stmt, 1, new_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, old_name.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    return rc == SQLITE_DONE;
}

// ============================================================================
// Private Helpers
// ============================================================================

std::vector<SessionRecord> SessionLedger::query_records(
    const char* sql,
    const std::string* profile_name,
    size_t limit
) const {
    std::lock_guard<std::mutex> lock(db_mutex_);

    std::vector<SessionRecord> records;

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);

    if (rc != SQLITE_OK) {
        log_error(std::string("SessionLedger: Prepare failed: ") + sqlite3_errmsg(db));
        return records;
    }

    int index = 1;
    if (profile_name) {
        sqlite3_bind_text(stmt, index++, profile_name->c_str(), -1, SQLITE_TRANSIENT);
    }
    sqlite3_bind_int64(stmt, index, static_cast<sqlite3_int64>(limit));

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        SessionRecord entry;
        entry.id = sqlite3_column_int64(stmt, 0);
        entry.profile_name = column_text(stmt, 1);
        entry.event = string_to_session_event(column_text(stmt, 2)).value_or(SessionEvent::STOPPED);
        entry.port = column_optional<uint16_t>(stmt, 3);
        entry.pid = column_optional<ProcessId>(stmt, 4);
        entry.exit_code = column_optional<int>(stmt, 5);
        entry.config_sha256 = column_text(stmt, 6);
        entry.detail = column_text(stmt, 7);
        entry.timestamp = static_cast<uint64_t>(sqlite3_column_int64(stmt, 8));

        records.push_back(entry);
    }

    sqlite3_finalize(stmt);

    return records;
}

} // namespace wpman
