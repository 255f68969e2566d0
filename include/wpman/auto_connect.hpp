/**
 * @file auto_connect.hpp
 * @brief Bulk concurrent connection of stopped profiles
 *
 * WPMan - WireProxy Profile Manager
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Connects many profiles at once under the active connection limit:
 * - Bounded worker pool (at most AUTO_CONNECT_MAX_WORKERS)
 * - Port reservations and attempt slots shared with single connects
 *   through PortRegistry
 * - Optional monotonically increasing port counter ("from here" mode)
 * - Progress and finished events, cancellation
 */

#pragma once

#include "wpman/events.hpp"
#include "wpman/manager_config.hpp"
#include "wpman/port_registry.hpp"
#include "wpman/process_supervisor.hpp"
#include "wpman/profile_store.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace wpman {

/**
 * @brief Which profiles an auto-connect run considers
 */
struct AutoConnectRequest {
    enum class Scope {
        ALL,        ///< Every profile
        INDICES,    ///< Caller-supplied rows
        FROM_ROW    ///< Row from_row to the end
    };

    Scope scope = Scope::ALL;
    std::vector<size_t> indices;            ///< Rows for INDICES
    size_t from_row = 0;                    ///< First row for FROM_ROW
    std::optional<uint16_t> start_port;     ///< Seeds the shared port counter

    static AutoConnectRequest all();
    static AutoConnectRequest rows(std::vector<size_t> indices);
    static AutoConnectRequest from(size_t row, std::optional<uint16_t> start_port = std::nullopt);
};

/**
 * @brief AutoConnectOrchestrator - bounded worker pool for bulk connects
 *
 * Idle -> start() -> Running -> Idle (finished event). A start() while
 * Running is rejected. Each queued profile is attempted at most once per
 * run; failures are logged and reported through progress events only.
 */
class AutoConnectOrchestrator {
public:
    /// Invoked by a worker after every launch attempt, before its reservation is released
    using LaunchCallback = std::function<void(const Profile& profile, uint16_t port, const LaunchResult& result)>;

    /**
     * @brief Construct orchestrator
     * @param store Profile collection
     * @param registry Port decisions and host probe
     * @param supervisor Process launcher
     * @param events Event sink for started/progress/finished
     * @param worker_pause Pause between two connections of one worker
     */
    AutoConnectOrchestrator(
        ProfileStore& store,
        PortRegistry& registry,
        ProcessSupervisor& supervisor,
        EventDispatcher& events,
        std::chrono::milliseconds worker_pause = config::AUTO_CONNECT_WORKER_PAUSE
    );

    /**
     * @brief Destructor - cancels a running run and joins it
     */
    ~AutoConnectOrchestrator();

    // Disable copy and move
    AutoConnectOrchestrator(const AutoConnectOrchestrator&) = delete;
    AutoConnectOrchestrator& operator=(const AutoConnectOrchestrator&) = delete;
    AutoConnectOrchestrator(AutoConnectOrchestrator&&) = delete;
    AutoConnectOrchestrator& operator=(AutoConnectOrchestrator&&) = delete;

    /**
     * @brief Register the per-attempt callback (persistence, ledger)
     */
    void set_launch_callback(LaunchCallback callback);

    /**
     * @brief Begin a run in the background
     * @param request Profiles to consider
     * @param settings Settings snapshot used for the whole run
     * @return false if a run is already active or start_port is outside
     *         the allowed range
     */
    bool start(const AutoConnectRequest& request, const GlobalConfig& settings);

    /**
     * @brief Ask the active run to stop
     *
     * Workers finish the attempt in progress, take no new profile, and the
     * run ends with a finished event marked cancelled.
     */
    void cancel();

    /**
     * @brief Block until no run is active
     */
    void wait();

    bool is_running() const;

    /**
     * @brief Ports currently reserved by workers (empty when idle)
     */
    std::set<uint16_t> reserved_ports() const;

    /**
     * @brief Summary of the most recently finished run
     */
    std::optional<AutoConnectSummary> last_summary() const;

private:
    /// Shared state of one run, guarded by mutex_
    struct RunState {
        std::deque<std::string> queue;
        GlobalConfig settings;
        PortRange allowed{0, 0};
        bool sequential = false;            ///< "from here" mode
        uint32_t next_port = 0;             ///< Shared candidate counter when sequential
        size_t total = 0;
        size_t completed = 0;
        size_t started = 0;
        size_t failed = 0;
    };

    struct AttemptResult {
        bool success = false;
        std::optional<uint16_t> port;
        std::string message;
    };

    void run_manager(AutoConnectRequest request);
    void build_queue(const AutoConnectRequest& request);
    void worker_loop();
    AttemptResult attempt(const std::string& name, std::optional<uint16_t> first_candidate);

    /// Find a candidate and insert it into the reservation set
    std::optional<uint16_t> reserve_port(const Profile& profile, std::optional<uint16_t> first_candidate);

    /// Probe outside the lock, then claim in the registry; false if taken or busy
    bool try_reserve(uint16_t port, const std::set<uint16_t>& in_use);

    void release_port(uint16_t port);

    std::optional<uint16_t> take_counter_locked();

    /// Ports held by running managed profiles
    size_t count_used_ports() const;

    ProfileStore& store_;
    PortRegistry& registry_;
    ProcessSupervisor& supervisor_;
    EventDispatcher& events_;
    std::chrono::milliseconds worker_pause_;

    LaunchCallback launch_callback_;
    mutable std::mutex callback_mutex_;

    RunState run_;
    std::set<uint16_t> reserved_;           ///< This run's share of the registry reservations
    mutable std::mutex mutex_;
    std::condition_variable slot_cv_;

    std::atomic<bool> running_;
    std::atomic<bool> cancelled_;
    std::optional<AutoConnectSummary> last_summary_;
    std::condition_variable idle_cv_;

    std::thread manager_thread_;
    std::mutex control_mutex_;
};

} // namespace wpman
