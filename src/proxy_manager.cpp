/**
 * @file proxy_manager.cpp
 * @brief Implementation of the profile manager facade
 *
 * WPMan - WireProxy Profile Manager
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "wpman/proxy_manager.hpp"
#include "wpman/utilities.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

namespace wpman {

using namespace wpman::utilities;

namespace fs = std::filesystem;

std::string connect_status_to_string(ConnectStatus status) {
    switch (status) {
        case ConnectStatus::OK:                   return "connected";
        case ConnectStatus::PROFILE_NOT_FOUND:    return "profile not found";
        case ConnectStatus::ALREADY_RUNNING:      return "profile is already running";
        case ConnectStatus::CONFIG_MISSING:       return "configuration file missing";
        case ConnectStatus::EXECUTABLE_NOT_FOUND: return "wireproxy executable not found";
        case ConnectStatus::PORT_OUT_OF_RANGE:    return "port outside the allowed range";
        case ConnectStatus::PORT_CONTENDED:       return "port used by another profile";
        case ConnectStatus::PORT_BUSY_EXTERNAL:   return "port used by another process";
        case ConnectStatus::NO_PORT_AVAILABLE:    return "no port available";
        case ConnectStatus::LAUNCH_FAILED:        return "launch failed";
        default:                                  return "unknown";
    }
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

ProxyManager::ProxyManager(ManagerOptions options)
    : data_dir_(options.data_dir.empty() ? config::get_data_directory() : options.data_dir)
    , backend_(options.backend ? std::move(options.backend) : create_platform_process_backend())
    , probe_(options.probe ? std::move(options.probe) : std::make_unique<TcpPortProbe>())
{
    std::error_code ec;
    fs::create_directories(data_dir_, ec);
    if (ec) {
        throw std::runtime_error("Failed to create data directory " + data_dir_.string() + ": " + ec.message());
    }

    profile_dir_ = config::get_profile_directory(data_dir_);
    log_dir_ = config::get_log_directory(data_dir_);

    log_info("ProxyManager: Initializing in " + data_dir_.string());

    state_store_ = std::make_unique<StateStore>(config::get_state_file(data_dir_));

    if (options.enable_ledger) {
        try {
            ledger_ = std::make_unique<SessionLedger>(config::get_ledger_file(data_dir_).string());
        } catch (const std::runtime_error& e) {
            log_error(std::string("ProxyManager: Session history disabled: ") + e.what());
        }
    }

    repository_ = std::make_unique<ConfigRepository>(profile_dir_);

    ProcessBackend* backend = backend_.get();
    store_ = std::make_unique<ProfileStore>([backend](ProcessId pid) { return backend->is_alive(pid); });

    registry_ = std::make_unique<PortRegistry>(*backend_, *probe_);
    supervisor_ = std::make_unique<ProcessSupervisor>(
        *backend_, profile_dir_, log_dir_, options.launch_grace, options.stop_grace);

    orchestrator_ = std::make_unique<AutoConnectOrchestrator>(
        *store_, *registry_, *supervisor_, events_, options.worker_pause);
    orchestrator_->set_launch_callback([this](const Profile& profile, uint16_t port, const LaunchResult& result) {
        on_auto_connect_launch(profile, port, result);
    });

    load_state();
}

ProxyManager::~ProxyManager() {
    if (orchestrator_) {
        orchestrator_->cancel();
        orchestrator_->wait();
    }
    log_info("ProxyManager: Destroyed");
}

// ============================================================================
// State
// ============================================================================

void ProxyManager::load_state() {
    PersistedState state = state_store_->load();

    {
        std::lock_guard<std::mutex> lock(settings_mutex_);
        settings_ = state.settings;
    }

    for (auto& profile : state.profiles) {
        if (profile.config_path.empty()) {
            profile.config_path = repository_->config_path_for(profile.name);
        }
    }
    store_->load(std::move(state.profiles));

    std::lock_guard<std::mutex> lock(operation_mutex_);

    refresh_locked();

    for (auto& profile : repository_->scan_profiles(store_->names())) {
        std::string name = profile.name;
        if (store_->add(std::move(profile)) != StoreError::NONE) {
            log_warn("ProxyManager: Could not adopt discovered profile '" + name + "'");
        }
    }

    std::set<std::string> keep;
    for (const auto& profile : store_->snapshot()) {
        if (profile.running) {
            keep.insert(profile.name);
        }
    }

    size_t removed = supervisor_->cleanup_launch_configs(keep);
    if (removed > 0) {
        log_info("ProxyManager: Removed " + std::to_string(removed) + " stale launch configs");
    }

    if (!persist()) {
        log_warn("ProxyManager: Initial state could not be saved");
    }

    log_info("ProxyManager: Loaded " + std::to_string(store_->size()) + " profiles");
}

bool ProxyManager::persist() {
    std::lock_guard<std::mutex> lock(persist_mutex_);
    return state_store_->save(settings(), store_->snapshot());
}

// ============================================================================
// Profiles
// ============================================================================

std::vector<Profile> ProxyManager::profiles() {
    refresh();
    return store_->snapshot();
}

std::optional<Profile> ProxyManager::find_profile(const std::string& name) const {
    return store_->find_by_name(name);
}

std::vector<std::string> ProxyManager::refresh() {
    std::lock_guard<std::mutex> lock(operation_mutex_);
    return refresh_locked();
}

std::vector<std::string> ProxyManager::refresh_locked() {
    std::vector<std::string> died = store_->refresh();

    for (const auto& name : died) {
        auto profile = store_->find_by_name(name);
        log_warn("ProxyManager: WireProxy for '" + name + "' is no longer running");

        if (!supervisor_->remove_launch_config(name)) {
            log_warn("ProxyManager: Launch config of '" + name + "' left behind");
        }
        if (ledger_) {
            ledger_->record_stopped(name, profile ? profile->last_port : std::nullopt, std::nullopt, SessionEvent::DIED);
        }
        events_.profile_stopped(name, StopReason::DIED);
    }

    if (!died.empty() && !persist()) {
        log_error("ProxyManager: Failed to save state after liveness refresh");
    }

    return died;
}

ImportResult ProxyManager::import_file(const fs::path& file_path) {
    std::lock_guard<std::mutex> lock(operation_mutex_);
    return adopt_import(repository_->import_from_file(file_path, store_->names()));
}

ImportResult ProxyManager::import_text(const std::string& name_hint, const std::string& content) {
    std::lock_guard<std::mutex> lock(operation_mutex_);
    return adopt_import(repository_->import_from_text(name_hint, content, store_->names()));
}

ImportResult ProxyManager::adopt_import(ImportResult result) {
    if (!result.ok()) {
        log_warn("ProxyManager: Import failed: " + result.message);
        return result;
    }

    Profile profile = *result.profile;
    StoreError error = store_->add(profile);
    if (error != StoreError::NONE) {
        if (!repository_->delete_config(profile)) {
            log_warn("ProxyManager: Could not remove rejected import " + profile.config_path.string());
        }
        result.message = store_error_to_string(error);
        result.profile.reset();
        return result;
    }

    if (!persist()) {
        log_error("ProxyManager: Failed to save state after import");
    }
    events_.profile_added(profile);
    return result;
}

size_t ProxyManager::scan_profiles() {
    std::lock_guard<std::mutex> lock(operation_mutex_);

    size_t added = 0;
    for (auto& profile : repository_->scan_profiles(store_->names())) {
        Profile copy = profile;
        if (store_->add(std::move(profile)) == StoreError::NONE) {
            events_.profile_added(copy);
            ++added;
        }
    }

    if (added > 0 && !persist()) {
        log_error("ProxyManager: Failed to save state after scan");
    }
    return added;
}

StoreError ProxyManager::delete_profile(const std::string& name) {
    std::lock_guard<std::mutex> lock(operation_mutex_);
    refresh_locked();

    auto profile = store_->find_by_name(name);
    if (!profile) {
        return StoreError::NOT_FOUND;
    }

    if (supervisor_->is_running(profile->pid) && !stop_profile_locked(*profile)) {
        log_error("ProxyManager: Cannot delete '" + name + "': process could not be stopped");
        return StoreError::PROFILE_RUNNING;
    }

    if (!repository_->delete_config(*profile)) {
        return StoreError::IO_FAILED;
    }
    if (!supervisor_->remove_launch_config(name)) {
        log_warn("ProxyManager: Launch config of '" + name + "' left behind");
    }

    store_->remove(name);

    if (!persist()) {
        log_error("ProxyManager: Failed to save state after delete");
    }

    log_info("ProxyManager: Deleted profile '" + name + "'");
    events_.profile_removed(name);
    return StoreError::NONE;
}

StoreError ProxyManager::rename_profile(const std::string& old_name, const std::string& new_name) {
    std::lock_guard<std::mutex> lock(operation_mutex_);
    refresh_locked();
    return rename_locked(old_name, new_name);
}

StoreError ProxyManager::rename_locked(const std::string& old_name, const std::string& new_name) {
    auto profile = store_->find_by_name(old_name);
    if (!profile) {
        return StoreError::NOT_FOUND;
    }
    if (supervisor_->is_running(profile->pid)) {
        return StoreError::PROFILE_RUNNING;
    }
    if (old_name == new_name) {
        return StoreError::NONE;
    }
    if (!config::validate_profile_name(new_name)) {
        return StoreError::INVALID_NAME;
    }
    if (store_->contains(new_name) || repository_->artifact_exists(new_name)) {
        return StoreError::DUPLICATE_NAME;
    }

    StoreError error = store_->rename(old_name, new_name,
        [this](const Profile& current, const std::string& target) {
            return repository_->relocate(current, target);
        });
    if (error != StoreError::NONE) {
        log_warn("ProxyManager: Rename of '" + old_name + "' failed: " + store_error_to_string(error));
        return error;
    }

    if (!supervisor_->remove_launch_config(old_name)) {
        log_warn("ProxyManager: Launch config of '" + old_name + "' left behind");
    }
    if (ledger_ && !ledger_->rename_profile(old_name, new_name)) {
        log_warn("ProxyManager: Session history of '" + old_name + "' not renamed");
    }
    if (!persist()) {
        log_error("ProxyManager: Failed to save state after rename");
    }

    log_info("ProxyManager: Renamed '" + old_name + "' to '" + new_name + "'");
    events_.profile_renamed(old_name, new_name);
    return StoreError::NONE;
}

StoreError ProxyManager::update_profile(const std::string& name, const std::string& new_name, const std::string& content) {
    std::lock_guard<std::mutex> lock(operation_mutex_);
    refresh_locked();

    auto profile = store_->find_by_name(name);
    if (!profile) {
        return StoreError::NOT_FOUND;
    }
    if (supervisor_->is_running(profile->pid)) {
        return StoreError::PROFILE_RUNNING;
    }

    std::string target = trim_string(new_name);
    if (target.empty()) {
        target = name;
    }

    if (target != name) {
        StoreError error = rename_locked(name, target);
        if (error != StoreError::NONE) {
            return error;
        }
    }

    auto updated = store_->find_by_name(target);
    if (!updated || !repository_->update_config(*updated, content)) {
        log_error("ProxyManager: Failed to write configuration of '" + target + "'");
        return StoreError::IO_FAILED;
    }

    store_->set_host_cache(target, std::nullopt);

    if (!persist()) {
        log_error("ProxyManager: Failed to save state after edit");
    }
    return StoreError::NONE;
}

std::optional<std::string> ProxyManager::get_config(const std::string& name) const {
    std::lock_guard<std::mutex> lock(operation_mutex_);

    auto profile = store_->find_by_name(name);
    if (!profile) {
        return std::nullopt;
    }
    return repository_->get_source_config(*profile);
}

std::optional<std::string> ProxyManager::endpoint_host(const std::string& name) {
    std::lock_guard<std::mutex> lock(operation_mutex_);

    auto profile = store_->find_by_name(name);
    if (!profile) {
        return std::nullopt;
    }
    if (profile->host_cache) {
        return profile->host_cache;
    }

    auto host = repository_->extract_endpoint_host(*profile);
    if (host) {
        store_->set_host_cache(name, host);
    }
    return host;
}

// ============================================================================
// Connections
// ============================================================================

ConnectOutcome ProxyManager::connect(
    const std::string& name,
    std::optional<uint16_t> port,
    bool override_contended
) {
    std::lock_guard<std::mutex> lock(operation_mutex_);
    refresh_locked();

    ConnectOutcome outcome;
    auto fail = [&outcome, &name](ConnectStatus status, const std::string& message) {
        outcome.status = status;
        outcome.message = message;
        log_warn("ProxyManager: Cannot connect '" + name + "': " + message);
        return outcome;
    };

    auto profile = store_->find_by_name(name);
    if (!profile) {
        return fail(ConnectStatus::PROFILE_NOT_FOUND, "profile '" + name + "' does not exist");
    }
    if (supervisor_->is_running(profile->pid)) {
        outcome.port = profile->proxy_port;
        outcome.pid = profile->pid;
        return fail(ConnectStatus::ALREADY_RUNNING, "profile is already running");
    }
    if (!repository_->config_exists(*profile)) {
        return fail(ConnectStatus::CONFIG_MISSING, "configuration file not found: " + profile->config_path.string());
    }

    auto executable = resolve_executable();
    if (!executable) {
        return fail(ConnectStatus::EXECUTABLE_NOT_FOUND, "wireproxy executable is not configured and not in PATH");
    }

    GlobalConfig current = settings();
    current.executable_path = executable;
    uint32_t limit = current.port_limit;
    PortRange allowed = registry_->allowed_range(limit);

    // Holds an attempt slot and the chosen port until the launch is recorded or fails
    PortReservation reservation(*registry_);
    auto count_used = [this] { return registry_->ports_in_use(store_->snapshot()).size(); };
    auto is_held = [this](uint16_t candidate) { return store_->find_by_port(candidate).has_value(); };

    uint16_t chosen = 0;

    if (port) {
        if (!registry_->validate_requested_port(*port, limit)) {
            return fail(ConnectStatus::PORT_OUT_OF_RANGE,
                        "port " + std::to_string(*port) + " is outside the allowed range " +
                        std::to_string(allowed.low) + "-" + std::to_string(allowed.high));
        }
        if (registry_->is_reserved(*port)) {
            return fail(ConnectStatus::PORT_CONTENDED, "port " + std::to_string(*port) + " is being claimed by auto-connect");
        }

        auto holder = store_->find_by_port(*port);
        if (holder && holder->name != name) {
            if (!override_contended) {
                outcome.holder = holder->name;
                return fail(ConnectStatus::PORT_CONTENDED,
                            "port " + std::to_string(*port) + " is used by profile '" + holder->name + "'");
            }

            log_info("ProxyManager: Disconnecting '" + holder->name + "' to free port " + std::to_string(*port));
            if (!stop_profile_locked(*holder)) {
                outcome.holder = holder->name;
                return fail(ConnectStatus::PORT_CONTENDED, "could not disconnect profile '" + holder->name + "'");
            }

            // Still busy after the holder exited: an unmanaged process has it
            if (!registry_->is_port_free_on_host(*port)) {
                return fail(ConnectStatus::PORT_BUSY_EXTERNAL,
                            "port " + std::to_string(*port) + " is busy by another process");
            }
        } else {
            if (!registry_->is_port_free_on_host(*port)) {
                return fail(ConnectStatus::PORT_BUSY_EXTERNAL,
                            "port " + std::to_string(*port) + " is used by another process");
            }
            if (registry_->ports_in_use(store_->snapshot()).count(*port) > 0) {
                return fail(ConnectStatus::PORT_CONTENDED, "port " + std::to_string(*port) + " is in use");
            }
        }

        if (!reservation.acquire_slot(limit, count_used)) {
            return fail(ConnectStatus::NO_PORT_AVAILABLE,
                        "connection limit " + std::to_string(limit) + " reached");
        }
        if (!reservation.claim(*port, is_held)) {
            return fail(ConnectStatus::PORT_CONTENDED, "port " + std::to_string(*port) + " was claimed by another connection");
        }

        chosen = *port;
    } else {
        if (!reservation.acquire_slot(limit, count_used)) {
            return fail(ConnectStatus::NO_PORT_AVAILABLE, "no free port within the connection limit");
        }

        std::set<uint16_t> reserved;
        std::optional<uint16_t> picked;
        for (size_t attempts = 0; attempts < config::MAX_PORT_ATTEMPTS_PER_WORKER; ++attempts) {
            reserved = registry_->reserved_ports();
            picked = registry_->pick_port_for_profile(*profile, store_->snapshot(), limit, reserved);
            if (!picked || reservation.claim(*picked, is_held)) {
                break;
            }
            // Claimed by a worker between the probe and the reservation
            picked.reset();
        }

        if (!picked) {
            size_t used = registry_->ports_in_use(store_->snapshot()).size();
            bool capacity_left = used + reserved.size() < (limit > 0 ? std::min<size_t>(limit, allowed.size()) : allowed.size());
            if (capacity_left) {
                return fail(ConnectStatus::PORT_BUSY_EXTERNAL, "every free port in the allowed range is used by another process");
            }
            return fail(ConnectStatus::NO_PORT_AVAILABLE, "no free port within the connection limit");
        }

        chosen = *picked;
    }

    LaunchResult launch = supervisor_->start(*profile, chosen, current);
    if (!launch.ok()) {
        if (ledger_) {
            ledger_->record_launch_failed(*profile, chosen, launch.exit_code, launch.message);
        }

        outcome.exit_code = launch.exit_code;
        switch (launch.error) {
            case LaunchError::EXECUTABLE_NOT_FOUND:
                return fail(ConnectStatus::EXECUTABLE_NOT_FOUND, launch.message);
            case LaunchError::CONFIG_MISSING:
                return fail(ConnectStatus::CONFIG_MISSING, launch.message);
            default:
                return fail(ConnectStatus::LAUNCH_FAILED, launch.message);
        }
    }

    if (!store_->mark_started(name, *launch.pid, chosen)) {
        if (!supervisor_->stop(launch.pid)) {
            log_error("ProxyManager: Failed to stop orphaned pid=" + std::to_string(*launch.pid));
        }
        return fail(ConnectStatus::PROFILE_NOT_FOUND, "profile was removed during launch");
    }

    if (!persist()) {
        log_error("ProxyManager: Failed to save state after connect");
    }

    auto started = store_->find_by_name(name);
    if (ledger_ && started) {
        ledger_->record_started(*started, chosen, *launch.pid);
    }
    if (started) {
        events_.profile_started(*started);
    }

    outcome.port = chosen;
    outcome.pid = launch.pid;
    outcome.message = "connected on " + std::string(config::PROXY_BIND_HOST) + ":" + std::to_string(chosen);
    log_info("ProxyManager: Connected '" + name + "' on port " + std::to_string(chosen));
    return outcome;
}

bool ProxyManager::disconnect(const std::string& name) {
    std::lock_guard<std::mutex> lock(operation_mutex_);
    refresh_locked();

    auto profile = store_->find_by_name(name);
    if (!profile) {
        log_warn("ProxyManager: Cannot disconnect unknown profile '" + name + "'");
        return false;
    }
    if (!profile->pid) {
        return true;
    }
    return stop_profile_locked(*profile);
}

ConnectOutcome ProxyManager::toggle(const std::string& name) {
    bool running = false;
    {
        std::lock_guard<std::mutex> lock(operation_mutex_);
        refresh_locked();

        auto profile = store_->find_by_name(name);
        if (!profile) {
            ConnectOutcome outcome;
            outcome.status = ConnectStatus::PROFILE_NOT_FOUND;
            outcome.message = "profile '" + name + "' does not exist";
            return outcome;
        }
        running = profile->running;
    }

    if (!running) {
        return connect(name);
    }

    ConnectOutcome outcome;
    if (disconnect(name)) {
        outcome.disconnected = true;
        outcome.message = "disconnected";
    } else {
        outcome.status = ConnectStatus::ALREADY_RUNNING;
        outcome.message = "process could not be stopped";
    }
    return outcome;
}

bool ProxyManager::stop_profile_locked(const Profile& profile) {
    if (!supervisor_->stop(profile.pid)) {
        log_error("ProxyManager: Failed to stop WireProxy for '" + profile.name + "'");
        return false;
    }

    store_->mark_stopped(profile.name);

    if (!supervisor_->remove_launch_config(profile.name)) {
        log_warn("ProxyManager: Launch config of '" + profile.name + "' left behind");
    }
    if (!persist()) {
        log_error("ProxyManager: Failed to save state after disconnect");
    }
    if (ledger_) {
        ledger_->record_stopped(profile.name, profile.proxy_port, profile.pid);
    }

    log_info("ProxyManager: Disconnected '" + profile.name + "'");
    events_.profile_stopped(profile.name, StopReason::REQUESTED);
    return true;
}

size_t ProxyManager::stop_all() {
    std::lock_guard<std::mutex> lock(operation_mutex_);
    refresh_locked();

    size_t stopped = 0;
    for (const auto& profile : store_->snapshot()) {
        if (profile.pid && stop_profile_locked(profile)) {
            ++stopped;
        }
    }
    return stopped;
}

void ProxyManager::shutdown() {
    log_info("ProxyManager: Shutting down");

    orchestrator_->cancel();
    orchestrator_->wait();

    size_t stopped = stop_all();

    std::lock_guard<std::mutex> lock(operation_mutex_);
    size_t removed = supervisor_->cleanup_launch_configs();
    if (!persist()) {
        log_error("ProxyManager: Failed to save state on shutdown");
    }

    log_info("ProxyManager: Stopped " + std::to_string(stopped) + " profiles, removed " +
             std::to_string(removed) + " launch configs");
}

// ============================================================================
// Auto-connect
// ============================================================================

bool ProxyManager::auto_connect(const AutoConnectRequest& request) {
    auto executable = resolve_executable();
    if (!executable) {
        log_error("ProxyManager: Auto-connect needs the wireproxy executable; set it first");
        return false;
    }

    // Report deaths before the run builds its queue; an operation holding
    // the lock refreshes on its own
    {
        std::unique_lock<std::mutex> lock(operation_mutex_, std::try_to_lock);
        if (lock.owns_lock()) {
            refresh_locked();
        }
    }

    GlobalConfig current = settings();
    current.executable_path = executable;
    return orchestrator_->start(request, current);
}

void ProxyManager::cancel_auto_connect() {
    orchestrator_->cancel();
}

void ProxyManager::wait_auto_connect() {
    orchestrator_->wait();
}

bool ProxyManager::is_auto_connect_running() const {
    return orchestrator_->is_running();
}

void ProxyManager::on_auto_connect_launch(const Profile& profile, uint16_t port, const LaunchResult& result) {
    if (result.ok()) {
        if (!persist()) {
            log_error("ProxyManager: Failed to save state after auto-connect of '" + profile.name + "'");
        }
        if (ledger_) {
            ledger_->record_started(profile, port, *result.pid);
        }
    } else if (ledger_) {
        ledger_->record_launch_failed(profile, port, result.exit_code, result.message);
    }
}

// ============================================================================
// Settings
// ============================================================================

GlobalConfig ProxyManager::settings() const {
    std::lock_guard<std::mutex> lock(settings_mutex_);
    return settings_;
}

PortRange ProxyManager::allowed_range() const {
    return registry_->allowed_range(settings().port_limit);
}

bool ProxyManager::set_port_limit(uint32_t limit) {
    {
        std::lock_guard<std::mutex> lock(settings_mutex_);
        settings_.port_limit = limit;
    }
    log_info("ProxyManager: Connection limit set to " + (limit == 0 ? std::string("unlimited") : std::to_string(limit)));
    return persist();
}

bool ProxyManager::set_proxy_type(ProxyType type) {
    {
        std::lock_guard<std::mutex> lock(settings_mutex_);
        settings_.proxy_type = type;
    }
    log_info("ProxyManager: Proxy type set to " + proxy_type_to_string(type));
    return persist();
}

bool ProxyManager::set_executable_path(const fs::path& path) {
    if (!is_executable_file(path)) {
        log_warn("ProxyManager: Not an executable file: " + path.string());
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(settings_mutex_);
        settings_.executable_path = path;
    }
    log_info("ProxyManager: wireproxy executable set to " + path.string());
    return persist();
}

bool ProxyManager::set_process_logging(bool enabled) {
    {
        std::lock_guard<std::mutex> lock(settings_mutex_);
        settings_.process_logging = enabled;
    }
    log_info(std::string("ProxyManager: Process logging ") + (enabled ? "enabled" : "disabled"));
    return persist();
}

std::optional<fs::path> ProxyManager::resolve_executable() {
    std::optional<fs::path> configured;
    {
        std::lock_guard<std::mutex> lock(settings_mutex_);
        configured = settings_.executable_path;
    }

    auto found = ExecutableLocator::locate(configured);
    if (found && found != configured) {
        {
            std::lock_guard<std::mutex> lock(settings_mutex_);
            settings_.executable_path = found;
        }
        if (!persist()) {
            log_warn("ProxyManager: Resolved executable path not saved");
        }
    }
    return found;
}

// ============================================================================
// History and Events
// ============================================================================

std::vector<SessionRecord> ProxyManager::history(const std::string& name, size_t limit) const {
    if (!ledger_) {
        return {};
    }
    return name.empty() ? ledger_->get_recent(limit) : ledger_->get_history(name, limit);
}

void ProxyManager::add_observer(std::shared_ptr<ManagerObserver> observer) {
    events_.add_observer(std::move(observer));
}

void ProxyManager::remove_observer(const std::shared_ptr<ManagerObserver>& observer) {
    events_.remove_observer(observer);
}

} // namespace wpman
