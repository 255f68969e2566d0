/**
 * @file proxy_manager.hpp
 * @brief Profile manager facade - integrates every WPMan component
 *
 * WPMan - WireProxy Profile Manager
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * ProxyManager coordinates all subsystems:
 * - Profile collection and its persistence (state.json)
 * - Configuration artifacts (import, edit, rename, delete)
 * - Port allocation and wireproxy process supervision
 * - Bulk auto-connect
 * - Session history (SQLite)
 * - Typed events for presentation layers
 */

#pragma once

#include "wpman/auto_connect.hpp"
#include "wpman/config_repository.hpp"
#include "wpman/events.hpp"
#include "wpman/manager_config.hpp"
#include "wpman/port_registry.hpp"
#include "wpman/process_backend.hpp"
#include "wpman/process_supervisor.hpp"
#include "wpman/profile.hpp"
#include "wpman/profile_store.hpp"
#include "wpman/session_ledger.hpp"
#include "wpman/state_store.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace wpman {

/**
 * @brief Outcome classification of a connect request
 */
enum class ConnectStatus {
    OK,
    PROFILE_NOT_FOUND,
    ALREADY_RUNNING,
    CONFIG_MISSING,         ///< Profile's .conf does not exist
    EXECUTABLE_NOT_FOUND,   ///< wireproxy not configured and not on PATH
    PORT_OUT_OF_RANGE,      ///< Requested port outside the allowed range
    PORT_CONTENDED,         ///< Another managed profile holds the port; retry with override
    PORT_BUSY_EXTERNAL,     ///< An unmanaged process holds the port; never overridden
    NO_PORT_AVAILABLE,      ///< Connection limit reached or no free port
    LAUNCH_FAILED           ///< Spawn failed or the process exited immediately
};

/**
 * @brief Convert connect status to a short description
 */
std::string connect_status_to_string(ConnectStatus status);

/**
 * @brief Result of connect() and toggle()
 */
struct ConnectOutcome {
    ConnectStatus status = ConnectStatus::OK;
    std::optional<uint16_t> port;       ///< Bound port on success
    std::optional<ProcessId> pid;       ///< Process on success
    std::optional<int> exit_code;       ///< LAUNCH_FAILED after an immediate exit
    std::string holder;                 ///< PORT_CONTENDED: profile holding the port
    std::string message;
    bool disconnected = false;          ///< toggle() stopped the profile instead

    bool ok() const { return status == ConnectStatus::OK; }
};

/**
 * @brief Construction options
 *
 * Null backend/probe select the platform process backend and a TCP probe.
 */
struct ManagerOptions {
    std::filesystem::path data_dir;                 ///< Empty: config::get_data_directory()
    std::unique_ptr<ProcessBackend> backend;
    std::unique_ptr<PortProbe> probe;
    std::chrono::milliseconds launch_grace = config::LAUNCH_GRACE_PERIOD;
    std::chrono::milliseconds stop_grace = config::STOP_GRACE_PERIOD;
    std::chrono::milliseconds worker_pause = config::AUTO_CONNECT_WORKER_PAUSE;
    bool enable_ledger = true;                      ///< Record sessions in sessions.db
};

/**
 * @brief ProxyManager - entry point for presentation layers
 *
 * Single-profile operations are serialized by an operation lock and run
 * synchronously; only host probes and the launch grace wait block.
 * Auto-connect runs in the background and may overlap them.
 *
 * Destruction cancels a running auto-connect but leaves wireproxy
 * processes running; call shutdown() to stop them.
 */
class ProxyManager {
public:
    /**
     * @brief Open the data directory, load state and reconcile it
     *
     * Dead pids are cleared, unknown .conf files in profiles/ are adopted,
     * stale launch configs of stopped profiles are removed.
     *
     * @throws std::runtime_error if the data directory cannot be created
     */
    explicit ProxyManager(ManagerOptions options = ManagerOptions());

    /**
     * @brief Destructor - cancels auto-connect, keeps processes running
     */
    ~ProxyManager();

    // Disable copy and move
    ProxyManager(const ProxyManager&) = delete;
    ProxyManager& operator=(const ProxyManager&) = delete;
    ProxyManager(ProxyManager&&) = delete;
    ProxyManager& operator=(ProxyManager&&) = delete;

    // ========================================================================
    // Profiles
    // ========================================================================

    /**
     * @brief Refreshed copy of every profile in row order
     */
    std::vector<Profile> profiles();

    std::optional<Profile> find_profile(const std::string& name) const;

    /**
     * @brief Recompute liveness; dead profiles become stopped
     * @return Names of profiles found dead
     */
    std::vector<std::string> refresh();

    /**
     * @brief Import a .conf file (profile name = file stem)
     */
    ImportResult import_file(const std::filesystem::path& file_path);

    /**
     * @brief Import pasted configuration text
     */
    ImportResult import_text(const std::string& name_hint, const std::string& content);

    /**
     * @brief Adopt .conf files dropped into profiles/
     * @return Number of profiles added
     */
    size_t scan_profiles();

    /**
     * @brief Stop if running, then delete the profile and its artifacts
     */
    StoreError delete_profile(const std::string& name);

    /**
     * @brief Rename a stopped profile and its .conf
     */
    StoreError rename_profile(const std::string& old_name, const std::string& new_name);

    /**
     * @brief Edit a stopped profile: optional rename plus new config text
     */
    StoreError update_profile(const std::string& name, const std::string& new_name, const std::string& content);

    /**
     * @brief Configuration text of a profile
     */
    std::optional<std::string> get_config(const std::string& name) const;

    /**
     * @brief Endpoint host of a profile (memoized until the next edit)
     */
    std::optional<std::string> endpoint_host(const std::string& name);

    // ========================================================================
    // Connections
    // ========================================================================

    /**
     * @brief Connect a profile
     * @param name Profile to connect
     * @param port Explicit port, or std::nullopt to pick one (last port first)
     * @param override_contended Stop another managed profile holding port
     */
    ConnectOutcome connect(
        const std::string& name,
        std::optional<uint16_t> port = std::nullopt,
        bool override_contended = false
    );

    /**
     * @brief Stop a profile's process
     * @return true if nothing runs for the profile afterwards
     */
    bool disconnect(const std::string& name);

    /**
     * @brief Disconnect when running, connect otherwise
     */
    ConnectOutcome toggle(const std::string& name);

    /**
     * @brief Stop every running profile
     * @return Number of profiles stopped
     */
    size_t stop_all();

    /**
     * @brief Cancel auto-connect, stop everything, remove launch configs
     */
    void shutdown();

    // ========================================================================
    // Auto-connect
    // ========================================================================

    /**
     * @brief Start a background auto-connect run
     * @return false if the executable cannot be resolved, a run is active,
     *         or the start port is outside the allowed range
     */
    bool auto_connect(const AutoConnectRequest& request = AutoConnectRequest::all());

    void cancel_auto_connect();
    void wait_auto_connect();
    bool is_auto_connect_running() const;

    // ========================================================================
    // Settings
    // ========================================================================

    GlobalConfig settings() const;

    /**
     * @brief Allowed port range for the current limit
     */
    PortRange allowed_range() const;

    bool set_port_limit(uint32_t limit);
    bool set_proxy_type(ProxyType type);

    /**
     * @brief Set the wireproxy executable
     * @return false if path is not an executable file
     */
    bool set_executable_path(const std::filesystem::path& path);

    bool set_process_logging(bool enabled);

    /**
     * @brief Configured executable, else PATH lookup (persisted when found)
     */
    std::optional<std::filesystem::path> resolve_executable();

    // ========================================================================
    // History and Events
    // ========================================================================

    /**
     * @brief Session history, newest first (all profiles when name is empty)
     */
    std::vector<SessionRecord> history(const std::string& name = "", size_t limit = 50) const;

    void add_observer(std::shared_ptr<ManagerObserver> observer);
    void remove_observer(const std::shared_ptr<ManagerObserver>& observer);

    const std::filesystem::path& data_directory() const { return data_dir_; }
    const std::filesystem::path& profile_directory() const { return profile_dir_; }

private:
    void load_state();
    bool persist();

    /// Refresh liveness and report deaths; caller holds operation_mutex_
    std::vector<std::string> refresh_locked();

    /// Stop one profile; caller holds operation_mutex_
    bool stop_profile_locked(const Profile& profile);

    StoreError rename_locked(const std::string& old_name, const std::string& new_name);

    ImportResult adopt_import(ImportResult result);

    void on_auto_connect_launch(const Profile& profile, uint16_t port, const LaunchResult& result);

    std::filesystem::path data_dir_;
    std::filesystem::path profile_dir_;
    std::filesystem::path log_dir_;

    std::unique_ptr<ProcessBackend> backend_;
    std::unique_ptr<PortProbe> probe_;

    GlobalConfig settings_;
    mutable std::mutex settings_mutex_;

    std::unique_ptr<StateStore> state_store_;
    std::unique_ptr<SessionLedger> ledger_;
    std::unique_ptr<ConfigRepository> repository_;
    std::unique_ptr<ProfileStore> store_;
    std::unique_ptr<PortRegistry> registry_;
    std::unique_ptr<ProcessSupervisor> supervisor_;
    EventDispatcher events_;
    std::unique_ptr<AutoConnectOrchestrator> orchestrator_;

    /// Serializes single-profile operations
    mutable std::mutex operation_mutex_;

    /// Keeps snapshot-then-save atomic across concurrent writers
    std::mutex persist_mutex_;
};

} // namespace wpman
