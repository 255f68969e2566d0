/**
 * @file auto_connect.cpp
 * @brief Implementation of bulk concurrent connection
 *
 * WPMan - WireProxy Profile Manager
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "wpman/auto_connect.hpp"
#include "wpman/utilities.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace wpman {

using namespace wpman::utilities;

// ============================================================================
// AutoConnectRequest
// ============================================================================

AutoConnectRequest AutoConnectRequest::all() {
    return AutoConnectRequest();
}

AutoConnectRequest AutoConnectRequest::rows(std::vector<size_t> indices) {
    AutoConnectRequest request;
    request.scope = Scope::INDICES;
    request.indices = std::move(indices);
    return request;
}

AutoConnectRequest AutoConnectRequest::from(size_t row, std::optional<uint16_t> start_port) {
    AutoConnectRequest request;
    request.scope = Scope::FROM_ROW;
    request.from_row = row;
    request.start_port = start_port;
    return request;
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

AutoConnectOrchestrator::AutoConnectOrchestrator(
    ProfileStore& store,
    PortRegistry& registry,
    ProcessSupervisor& supervisor,
    EventDispatcher& events,
    std::chrono::milliseconds worker_pause
)
    : store_(store)
    , registry_(registry)
    , supervisor_(supervisor)
    , events_(events)
    , worker_pause_(worker_pause)
    , running_(false)
    , cancelled_(false)
{}

AutoConnectOrchestrator::~AutoConnectOrchestrator() {
    cancel();
    wait();

    std::lock_guard<std::mutex> control(control_mutex_);
    if (manager_thread_.joinable()) {
        manager_thread_.join();
    }
}

void AutoConnectOrchestrator::set_launch_callback(LaunchCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    launch_callback_ = std::move(callback);
}

// ============================================================================
// Run Control
// ============================================================================

bool AutoConnectOrchestrator::start(const AutoConnectRequest& request, const GlobalConfig& settings) {
    PortRange allowed = registry_.allowed_range(settings.port_limit);
    if (request.start_port && !allowed.contains(*request.start_port)) {
        log_warn("AutoConnect: Start port " + std::to_string(*request.start_port) + " is outside " +
                 std::to_string(allowed.low) + "-" + std::to_string(allowed.high));
        return false;
    }

    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        log_warn("AutoConnect: Auto-connect is already running");
        return false;
    }

    std::lock_guard<std::mutex> control(control_mutex_);

    // The previous manager thread has already cleared running_
    if (manager_thread_.joinable()) {
        manager_thread_.join();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        run_ = RunState();
        run_.settings = settings;
        run_.allowed = allowed;
        if (request.start_port) {
            run_.sequential = true;
            run_.next_port = *request.start_port;
        }
        reserved_.clear();
        cancelled_ = false;
    }

    try {
        manager_thread_ = std::thread(&AutoConnectOrchestrator::run_manager, this, request);
    } catch (const std::system_error& e) {
        log_error(std::string("AutoConnect: Failed to start manager thread: ") + e.what());
        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_ = false;
        }
        idle_cv_.notify_all();
        return false;
    }

    return true;
}

void AutoConnectOrchestrator::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        cancelled_ = true;
    }
    log_info("AutoConnect: Cancellation requested");
    slot_cv_.notify_all();
}

void AutoConnectOrchestrator::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return !running_.load(); });
}

bool AutoConnectOrchestrator::is_running() const {
    return running_.load();
}

std::set<uint16_t> AutoConnectOrchestrator::reserved_ports() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reserved_;
}

std::optional<AutoConnectSummary> AutoConnectOrchestrator::last_summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_summary_;
}

// ============================================================================
// Manager
// ============================================================================

void AutoConnectOrchestrator::run_manager(AutoConnectRequest request) {
    std::vector<std::thread> workers;

    try {
        build_queue(request);

        size_t worker_count = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            worker_count = std::min(config::AUTO_CONNECT_MAX_WORKERS, run_.queue.size());
            log_info("AutoConnect: Starting " + std::to_string(worker_count) + " workers for " +
                     std::to_string(run_.queue.size()) + " profiles, limit=" +
                     std::to_string(run_.settings.port_limit));
        }

        for (size_t i = 0; i < worker_count; ++i) {
            workers.emplace_back(&AutoConnectOrchestrator::worker_loop, this);
        }
    } catch (const std::exception& e) {
        log_error(std::string("AutoConnect: Run aborted: ") + e.what());
        cancel();
    }

    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    AutoConnectSummary summary;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (uint16_t port : reserved_) {
            registry_.release_port(port);
        }
        reserved_.clear();
        run_.queue.clear();
        summary.total = run_.total;
        summary.started = run_.started;
        summary.failed = run_.failed;
        summary.cancelled = cancelled_.load();
        last_summary_ = summary;
    }

    log_info("AutoConnect: Auto-connect process finished: " + std::to_string(summary.started) + " started, " +
             std::to_string(summary.failed) + " failed of " + std::to_string(summary.total) +
             (summary.cancelled ? " (cancelled)" : ""));
    events_.auto_connect_finished(summary);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    idle_cv_.notify_all();
}

void AutoConnectOrchestrator::build_queue(const AutoConnectRequest& request) {
    std::vector<Profile> profiles = store_.refreshed_snapshot();

    std::vector<size_t> rows;
    switch (request.scope) {
        case AutoConnectRequest::Scope::INDICES:
            rows = request.indices;
            break;
        case AutoConnectRequest::Scope::FROM_ROW:
            for (size_t i = request.from_row; i < profiles.size(); ++i) {
                rows.push_back(i);
            }
            break;
        case AutoConnectRequest::Scope::ALL:
        default:
            for (size_t i = 0; i < profiles.size(); ++i) {
                rows.push_back(i);
            }
            break;
    }

    std::deque<std::string> queue;
    std::set<std::string> seen;

    for (size_t row : rows) {
        if (row >= profiles.size()) {
            log_warn("AutoConnect: Ignoring row " + std::to_string(row) + ": out of range");
            continue;
        }

        const Profile& profile = profiles[row];
        if (profile.running || !seen.insert(profile.name).second) {
            continue;
        }

        std::error_code ec;
        if (!std::filesystem::is_regular_file(profile.config_path, ec)) {
            log_warn("AutoConnect: Skipping '" + profile.name + "': configuration file not found");
            continue;
        }

        queue.push_back(profile.name);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    run_.queue = std::move(queue);
    run_.total = run_.queue.size();
}

// ============================================================================
// Worker
// ============================================================================

void AutoConnectOrchestrator::worker_loop() {
    while (true) {
        std::string name;
        std::optional<uint16_t> first_candidate;

        {
            std::unique_lock<std::mutex> lock(mutex_);

            bool proceed = false;
            while (!cancelled_ && !run_.queue.empty()) {
                uint32_t limit = run_.settings.port_limit;

                // Attempts of single connects and of other workers count until they settle
                SlotStatus slot = registry_.begin_attempt(limit, [this] { return count_used_ports(); });
                if (slot == SlotStatus::ACQUIRED) {
                    proceed = true;
                    break;
                }
                if (slot == SlotStatus::LIMIT_REACHED) {
                    log_info("AutoConnect: Connection limit " + std::to_string(limit) + " reached");
                    break;
                }
                slot_cv_.wait_for(lock, config::AUTO_CONNECT_SLOT_POLL);
            }

            if (!proceed) {
                return;
            }

            name = run_.queue.front();
            run_.queue.pop_front();

            // Taken together with the pop so ports follow queue order
            if (run_.sequential) {
                first_candidate = take_counter_locked();
            }
        }

        AttemptResult result;
        try {
            result = attempt(name, first_candidate);
        } catch (const std::exception& e) {
            result.success = false;
            result.message = e.what();
            log_error("AutoConnect: Attempt for '" + name + "' failed: " + e.what());
        }
        registry_.end_attempt();

        AutoConnectProgress progress;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++run_.completed;
            if (result.success) {
                ++run_.started;
            } else {
                ++run_.failed;
            }

            progress.completed = run_.completed;
            progress.total = run_.total;
            progress.profile_name = name;
            progress.success = result.success;
            progress.port = result.port;
            progress.message = result.message;
        }
        slot_cv_.notify_all();

        events_.auto_connect_progress(progress);

        if (!cancelled_ && worker_pause_.count() > 0) {
            std::this_thread::sleep_for(worker_pause_);
        }
    }
}

AutoConnectOrchestrator::AttemptResult AutoConnectOrchestrator::attempt(
    const std::string& name,
    std::optional<uint16_t> first_candidate
) {
    AttemptResult result;

    auto profile = store_.find_by_name(name);
    if (!profile) {
        result.message = "profile was removed";
        return result;
    }

    if (supervisor_.is_running(profile->pid)) {
        result.message = "already running";
        return result;
    }

    auto port = reserve_port(*profile, first_candidate);
    if (!port) {
        result.message = "no free port available";
        log_warn("AutoConnect: No free port for '" + name + "'");
        return result;
    }
    result.port = port;

    LaunchResult launch;
    bool recorded = false;
    try {
        launch = supervisor_.start(*profile, *port, run_.settings);

        if (launch.ok()) {
            recorded = store_.mark_started(name, *launch.pid, *port);
            if (!recorded) {
                log_warn("AutoConnect: '" + name + "' was removed during launch, stopping pid=" +
                         std::to_string(*launch.pid));
                if (!supervisor_.stop(launch.pid)) {
                    log_error("AutoConnect: Failed to stop orphaned pid=" + std::to_string(*launch.pid));
                }
            }
        }

        LaunchCallback callback;
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            callback = launch_callback_;
        }
        if (callback && (recorded || !launch.ok())) {
            callback(store_.find_by_name(name).value_or(*profile), *port, launch);
        }
    } catch (...) {
        release_port(*port);
        throw;
    }

    release_port(*port);

    if (recorded) {
        result.success = true;
        auto started = store_.find_by_name(name);
        if (started) {
            events_.profile_started(*started);
        }
    } else if (launch.ok()) {
        result.message = "profile was removed during launch";
    } else {
        result.message = launch.message;
        log_warn("AutoConnect: Failed to connect '" + name + "' on port " + std::to_string(*port) +
                 ": " + launch.message);
    }

    return result;
}

// ============================================================================
// Port Reservation
// ============================================================================

std::optional<uint16_t> AutoConnectOrchestrator::reserve_port(
    const Profile& profile,
    std::optional<uint16_t> first_candidate
) {
    std::set<uint16_t> in_use = registry_.ports_in_use(store_.snapshot());
    const PortRange allowed = run_.allowed;
    size_t attempts = 0;

    if (run_.sequential) {
        std::optional<uint16_t> candidate = first_candidate;
        while (candidate && attempts < config::MAX_PORT_ATTEMPTS_PER_WORKER && !cancelled_) {
            if (try_reserve(*candidate, in_use)) {
                return candidate;
            }
            ++attempts;

            std::lock_guard<std::mutex> lock(mutex_);
            candidate = take_counter_locked();
        }
        return std::nullopt;
    }

    auto preferred = profile.preferred_port();
    if (preferred && allowed.contains(*preferred) && in_use.count(*preferred) == 0) {
        if (try_reserve(*preferred, in_use)) {
            return preferred;
        }
        ++attempts;
    }

    for (uint32_t port = allowed.low; port <= allowed.high; ++port) {
        if (attempts >= config::MAX_PORT_ATTEMPTS_PER_WORKER || cancelled_) {
            break;
        }
        if (in_use.count(static_cast<uint16_t>(port)) > 0 || (preferred && port == *preferred)) {
            continue;
        }
        if (try_reserve(static_cast<uint16_t>(port), in_use)) {
            return static_cast<uint16_t>(port);
        }
        ++attempts;
    }

    if (attempts >= config::MAX_PORT_ATTEMPTS_PER_WORKER) {
        log_warn("AutoConnect: Gave up on '" + profile.name + "' after " + std::to_string(attempts) +
                 " contended ports");
    }
    return std::nullopt;
}

bool AutoConnectOrchestrator::try_reserve(uint16_t port, const std::set<uint16_t>& in_use) {
    if (in_use.count(port) > 0 || registry_.is_reserved(port)) {
        return false;
    }

    if (!registry_.is_port_free_on_host(port)) {
        log_debug("AutoConnect: Port " + std::to_string(port) + " is busy on host");
        return false;
    }

    // A single connect or another worker may have claimed or even started on it during the probe
    bool claimed = registry_.reserve_port(port, [this](uint16_t candidate) {
        return store_.find_by_port(candidate).has_value();
    });
    if (!claimed) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    reserved_.insert(port);
    return true;
}

void AutoConnectOrchestrator::release_port(uint16_t port) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reserved_.erase(port);
    }
    registry_.release_port(port);
}

size_t AutoConnectOrchestrator::count_used_ports() const {
    return registry_.ports_in_use(store_.snapshot()).size();
}

std::optional<uint16_t> AutoConnectOrchestrator::take_counter_locked() {
    if (!run_.sequential || run_.next_port > run_.allowed.high) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(run_.next_port++);
}

} // namespace wpman
