/**
 * @file session_ledger.hpp
 * @brief SQLite history of proxy launches and stops
 *
 * WPMan - WireProxy Profile Manager
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Append-only record of process lifecycle events:
 * - One row per launch, launch failure and stop
 * - SHA-256 fingerprint of the WireGuard config used at launch
 * - Queries per profile and across profiles
 * - Thread-safe operations
 */

#pragma once

#include "wpman/profile.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace wpman {

/**
 * @brief Kind of ledger entry
 */
enum class SessionEvent {
    STARTED,        ///< Process launched and survived the grace interval
    LAUNCH_FAILED,  ///< Launch attempt did not produce a running process
    STOPPED,        ///< Process stopped on request
    DIED            ///< Process found dead by a liveness refresh
};

/**
 * @brief Convert event to its stored name
 */
std::string session_event_to_string(SessionEvent event);

/**
 * @brief Parse stored event name
 */
std::optional<SessionEvent> string_to_session_event(const std::string& str);

/**
 * @brief One ledger row
 */
struct SessionRecord {
    int64_t id = 0;
    std::string profile_name;
    SessionEvent event = SessionEvent::STARTED;
    std::optional<uint16_t> port;
    std::optional<ProcessId> pid;
    std::optional<int> exit_code;
    std::string config_sha256;      ///< Empty when not applicable
    std::string detail;
    uint64_t timestamp = 0;         ///< Unix timestamp (seconds)
};

/**
 * @brief SessionLedger - persistent launch/stop history
 */
class SessionLedger {
public:
    /**
     * @brief Open (or create) the ledger database
     * @param database_path Path to SQLite database file
     * @throws std::runtime_error if the database cannot be opened or initialized
     */
    explicit SessionLedger(const std::string& database_path);

    /**
     * @brief Destructor - closes database
     */
    ~SessionLedger();

    // Disable copy and move
    SessionLedger(const SessionLedger&) = delete;
    SessionLedger& operator=(const SessionLedger&) = delete;
    SessionLedger(SessionLedger&&) = delete;
    SessionLedger& operator=(SessionLedger&&) = delete;

    // ========================================================================
    // Recording
    // ========================================================================

    /**
     * @brief Append an event
     * @return true if recorded successfully, false otherwise
     */
    bool record(const SessionRecord& record);

    /**
     * @brief Record a successful launch with the config fingerprint
     */
    bool record_started(const Profile& profile, uint16_t port, ProcessId pid);

    /**
     * @brief Record a failed launch
     */
    bool record_launch_failed(
        const Profile& profile,
        uint16_t port,
        std::optional<int> exit_code,
        const std::string& detail
    );

    /**
     * @brief Record a stop (requested or detected)
     */
    bool record_stopped(const std::string& profile_name, std::optional<uint16_t> port,
                        std::optional<ProcessId> pid, SessionEvent event = SessionEvent::STOPPED);

    // ========================================================================
    // Queries
    // ========================================================================

    /**
     * @brief Events of one profile, newest first
     */
    std::vector<SessionRecord> get_history(const std::string& profile_name, size_t limit = 50) const;

    /**
     * @brief Events of all profiles, newest first
     */
    std::vector<SessionRecord> get_recent(size_t limit = 50) const;

    /**
     * @brief Number of successful launches of a profile
     */
    size_t count_launches(const std::string& profile_name) const;

    /**
     * @brief Rewrite profile_name on every row after a rename
     */
    bool rename_profile(const std::string& old_name, const std::string& new_name);

private:
    bool initialize_database();

    std::vector<SessionRecord> query_records(const char* sql, const std::string* profile_name, size_t limit) const;

    std::string database_path_;
    void* db_connection_;               ///< sqlite3* (opaque to keep sqlite3.h private)
    mutable std::mutex db_mutex_;
};

} // namespace wpman
