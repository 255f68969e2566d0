/**
 * @file manager_config.hpp
 * @brief Runtime constants, directory layout and name validation
 *
 * WPMan - WireProxy Profile Manager
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include <cstdint>
#include <chrono>
#include <string>
#include <filesystem>

namespace wpman {
namespace config {

// ============================================================================
// Port Space
// ============================================================================

/// First port of the base proxy port range
constexpr uint16_t PORT_RANGE_START = 60000;

/// Last port of the base proxy port range
constexpr uint16_t PORT_RANGE_END = 65535;

/// Default active connection limit for a fresh state file
constexpr uint32_t DEFAULT_PORT_LIMIT = 10;

/// Connection-attempt timeout of the host port probe
constexpr auto PORT_PROBE_TIMEOUT = std::chrono::milliseconds(500);

/// Loopback address every proxy binds to
constexpr const char* PROXY_BIND_HOST = "127.0.0.1";

// ============================================================================
// Process Supervision
// ============================================================================

/// Wait after spawn before checking for an immediate exit
constexpr auto LAUNCH_GRACE_PERIOD = std::chrono::milliseconds(250);

/// Time a process group gets after SIGTERM before SIGKILL
constexpr auto STOP_GRACE_PERIOD = std::chrono::milliseconds(1000);

/// Exit codes of reaped children a process backend remembers; older ones are forgotten
constexpr size_t MAX_REMEMBERED_EXIT_CODES = 256;

/// Per-profile process log size before rotation (2MB)
constexpr uintmax_t PROCESS_LOG_MAX_BYTES = 2000000;

/// Rotated per-profile process logs kept
constexpr int PROCESS_LOG_BACKUPS = 2;

// ============================================================================
// Auto-connect
// ============================================================================

/// Upper bound on concurrent auto-connect workers
constexpr size_t AUTO_CONNECT_MAX_WORKERS = 4;

/// Contended or busy ports a worker tries for one profile before giving up
constexpr size_t MAX_PORT_ATTEMPTS_PER_WORKER = 256;

/// Pause between two connections made by the same worker
constexpr auto AUTO_CONNECT_WORKER_PAUSE = std::chrono::milliseconds(100);

/// Re-check interval of a worker waiting for a slot held by a single connect
constexpr auto AUTO_CONNECT_SLOT_POLL = std::chrono::milliseconds(50);

// ============================================================================
// Files
// ============================================================================

/// Current state.json schema version
constexpr int STATE_VERSION = 3;

/// Maximum profile name length
constexpr size_t MAX_PROFILE_NAME_LENGTH = 64;

/// Extension of WireGuard source configurations
constexpr const char* PROFILE_EXTENSION = ".conf";

/// Suffix of derived launch configurations
constexpr const char* LAUNCH_CONFIG_SUFFIX = "_wireproxy.conf";

/// Executable names searched on PATH
constexpr const char* EXECUTABLE_NAME = "wireproxy";

// ============================================================================
// Directories
// ============================================================================

/**
 * @brief Get data directory from WPMAN_DATA_DIR or the per-user default
 * @return Filesystem path to data directory (created if missing)
 */
std::filesystem::path get_data_directory();

/**
 * @brief Get profile directory (WireGuard configs and launch configs)
 * @param data_dir Data directory
 */
std::filesystem::path get_profile_directory(const std::filesystem::path& data_dir);

/**
 * @brief Get log directory (application log and per-profile process logs)
 * @param data_dir Data directory
 */
std::filesystem::path get_log_directory(const std::filesystem::path& data_dir);

/**
 * @brief Get path of the persisted state file
 * @param data_dir Data directory
 */
std::filesystem::path get_state_file(const std::filesystem::path& data_dir);

/**
 * @brief Get path of the session ledger database
 * @param data_dir Data directory
 */
std::filesystem::path get_ledger_file(const std::filesystem::path& data_dir);

// ============================================================================
// Validation
// ============================================================================

/**
 * @brief Validate profile name (alphanumeric + underscore/hyphen only)
 * @param name Name to validate
 * @return true if valid, false otherwise
 */
bool validate_profile_name(const std::string& name);

/**
 * @brief Reduce arbitrary text to a valid profile name
 *
 * Keeps alphanumerics, '-' and '_'; falls back to @p fallback when nothing
 * is left. Result is truncated to MAX_PROFILE_NAME_LENGTH.
 */
std::string sanitize_profile_name(const std::string& hint, const std::string& fallback = "imported");

/**
 * @brief Check whether a name collides with the launch config naming scheme
 */
bool is_launch_config_name(const std::string& file_name);

} // namespace config
} // namespace wpman
