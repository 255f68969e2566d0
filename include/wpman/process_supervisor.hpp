/**
 * @file process_supervisor.hpp
 * @brief wireproxy process lifecycle
 *
 * WPMan - WireProxy Profile Manager
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Starts, probes and stops the external wireproxy executable for a
 * profile/port pair:
 * - Launch config generated per connect (<name>_wireproxy.conf)
 * - Immediate-exit detection after a fixed grace interval
 * - Per-profile process log with size-based rotation
 * - Tree termination through the platform ProcessBackend
 */

#pragma once

#include "wpman/manager_config.hpp"
#include "wpman/process_backend.hpp"
#include "wpman/profile.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <set>
#include <string>

namespace wpman {

/**
 * @brief Reason a launch did not produce a running process
 */
enum class LaunchError {
    NONE,
    EXECUTABLE_NOT_FOUND,   ///< No usable wireproxy binary configured
    CONFIG_MISSING,         ///< Profile's WireGuard config does not exist
    CONFIG_WRITE_FAILED,    ///< Launch config could not be written
    SPAWN_FAILED,           ///< OS could not create the process
    EXITED_IMMEDIATELY      ///< Process died within the grace interval
};

/**
 * @brief Convert launch error to a short description
 */
std::string launch_error_to_string(LaunchError error);

/**
 * @brief Outcome of ProcessSupervisor::start()
 */
struct LaunchResult {
    std::optional<ProcessId> pid;       ///< Set on success
    LaunchError error = LaunchError::NONE;
    std::optional<int> exit_code;       ///< For EXITED_IMMEDIATELY when known
    std::string message;                ///< Human-readable detail

    bool ok() const { return pid.has_value(); }
};

/**
 * @brief ExecutableLocator - resolves the wireproxy binary
 */
class ExecutableLocator {
public:
    /**
     * @brief Resolve the executable
     * @param configured Path from settings, used when it is an executable file
     * @return Configured path, else the first "wireproxy" on PATH, else nothing
     */
    static std::optional<std::filesystem::path> locate(
        const std::optional<std::filesystem::path>& configured
    );
};

/**
 * @brief ProcessSupervisor - spawns and terminates wireproxy processes
 *
 * Stateless apart from its directories: pids live in the profile records.
 * start() may be called concurrently for different profiles.
 */
class ProcessSupervisor {
public:
    /**
     * @brief Construct supervisor
     * @param backend Platform process backend
     * @param profile_dir Directory receiving launch configs
     * @param log_dir Directory receiving per-profile process logs
     * @param launch_grace Wait before the immediate-exit check
     * @param stop_grace Time a process tree gets to exit before force kill
     */
    ProcessSupervisor(
        ProcessBackend& backend,
        std::filesystem::path profile_dir,
        std::filesystem::path log_dir,
        std::chrono::milliseconds launch_grace = config::LAUNCH_GRACE_PERIOD,
        std::chrono::milliseconds stop_grace = config::STOP_GRACE_PERIOD
    );

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    // ========================================================================
    // Launch Configuration
    // ========================================================================

    /**
     * @brief Render the wireproxy config for a source config and port
     *
     * WGConfig = "<source>"
     *
     * [Socks5]            ([http] for HTTP)
     * BindAddress = 127.0.0.1:<port>
     */
    static std::string render_launch_config(
        const std::filesystem::path& source_config,
        uint16_t port,
        ProxyType proxy_type
    );

    /**
     * @brief Write the launch config file
     * @return true if written, false on I/O failure (logged)
     */
    bool generate_launch_config(
        const std::filesystem::path& source_config,
        uint16_t port,
        ProxyType proxy_type,
        const std::filesystem::path& output
    ) const;

    /**
     * @brief Path of the launch config derived from a profile name
     */
    std::filesystem::path launch_config_path(const std::string& profile_name) const;

    /**
     * @brief Path of the per-profile process log
     */
    std::filesystem::path process_log_path(const std::string& profile_name) const;

    /**
     * @brief Delete a profile's launch config if present
     * @return false only when the file exists and could not be removed
     */
    bool remove_launch_config(const std::string& profile_name) const;

    /**
     * @brief Delete every launch config except those of the given profiles
     * @param keep Profile names whose launch config must survive
     * @return Number of files removed
     */
    size_t cleanup_launch_configs(const std::set<std::string>& keep = {}) const;

    // ========================================================================
    // Process Lifecycle
    // ========================================================================

    /**
     * @brief Launch wireproxy for profile on port
     * @param profile Profile to serve (name and config_path are used)
     * @param port Port to bind
     * @param settings Global settings (executable, proxy type, logging)
     * @return Launch result with pid on success
     */
    LaunchResult start(const Profile& profile, uint16_t port, const GlobalConfig& settings);

    /**
     * @brief Liveness probe; false for an absent pid
     */
    bool is_running(std::optional<ProcessId> pid) const;

    /**
     * @brief Terminate a process and its descendants
     * @return true if nothing is running under pid afterwards
     */
    bool stop(std::optional<ProcessId> pid);

    /**
     * @brief Shift process.log -> .1 -> .2 once it exceeds max_bytes
     */
    static void rotate_log(
        const std::filesystem::path& log_path,
        uintmax_t max_bytes = config::PROCESS_LOG_MAX_BYTES,
        int backups = config::PROCESS_LOG_BACKUPS
    );

private:
    ProcessBackend& backend_;
    std::filesystem::path profile_dir_;
    std::filesystem::path log_dir_;
    std::chrono::milliseconds launch_grace_;
    std::chrono::milliseconds stop_grace_;
};

} // namespace wpman
