/**
 * @file process_supervisor.cpp
 * @brief Implementation of wireproxy process lifecycle
 *
 * WPMan - WireProxy Profile Manager
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "wpman/process_supervisor.hpp"
#include "wpman/utilities.hpp"

#include <fstream>
#include <sstream>
#include <thread>

namespace wpman {

using namespace wpman::utilities;

namespace fs = std::filesystem;

std::string launch_error_to_string(LaunchError error) {
    switch (error) {
        case LaunchError::NONE:                 return "none";
        case LaunchError::EXECUTABLE_NOT_FOUND: return "wireproxy executable not found";
        case LaunchError::CONFIG_MISSING:       return "profile configuration missing";
        case LaunchError::CONFIG_WRITE_FAILED:  return "cannot write launch configuration";
        case LaunchError::SPAWN_FAILED:         return "cannot start process";
        case LaunchError::EXITED_IMMEDIATELY:   return "process exited immediately";
        default:                                return "unknown";
    }
}

// ============================================================================
// ExecutableLocator
// ============================================================================

std::optional<fs::path> ExecutableLocator::locate(const std::optional<fs::path>& configured) {
    if (configured && !configured->empty()) {
        if (is_executable_file(*configured)) {
            return configured;
        }
        log_warn("ExecutableLocator: Configured executable not usable: " + configured->string());
    }

    auto found = find_on_path(config::EXECUTABLE_NAME);
    if (found) {
        log_info("ExecutableLocator: Found wireproxy in PATH: " + found->string());
    }
    return found;
}

// ============================================================================
// Constructor
// ============================================================================

ProcessSupervisor::ProcessSupervisor(
    ProcessBackend& backend,
    fs::path profile_dir,
    fs::path log_dir,
    std::chrono::milliseconds launch_grace,
    std::chrono::milliseconds stop_grace
)
    : backend_(backend)
    , profile_dir_(std::move(profile_dir))
    , log_dir_(std::move(log_dir))
    , launch_grace_(launch_grace)
    , stop_grace_(stop_grace)
{}

// ============================================================================
// Launch Configuration
// ============================================================================

std::string ProcessSupervisor::render_launch_config(
    const fs::path& source_config,
    uint16_t port,
    ProxyType proxy_type
) {
    const char* section = proxy_type == ProxyType::HTTP ? "http" : "Socks5";

    std::ostringstream oss;
    oss << "WGConfig = \"" << source_config.string() << "\"\n\n";
    oss << "[" << section << "]\n";
    oss << "BindAddress = " << config::PROXY_BIND_HOST << ":" << port << "\n";
    return oss.str();
}

bool ProcessSupervisor::generate_launch_config(
    const fs::path& source_config,
    uint16_t port,
    ProxyType proxy_type,
    const fs::path& output
) const {
    // wireproxy resolves WGConfig relative to its own cwd, so pin it down
    std::error_code ec;
    fs::path absolute_source = fs::absolute(source_config, ec);
    if (ec) {
        absolute_source = source_config;
    }

    if (!write_file(output, render_launch_config(absolute_source, port, proxy_type))) {
        log_error("ProcessSupervisor: Failed to write launch config " + output.string());
        return false;
    }

    log_debug("ProcessSupervisor: Generated launch config for port " + std::to_string(port) +
              ", type=" + proxy_type_to_string(proxy_type));
    return true;
}

fs::path ProcessSupervisor::launch_config_path(const std::string& profile_name) const {
    return profile_dir_ / (profile_name + config::LAUNCH_CONFIG_SUFFIX);
}

fs::path ProcessSupervisor::process_log_path(const std::string& profile_name) const {
    return log_dir_ / ("wireproxy_" + config::sanitize_profile_name(profile_name, "profile") + ".log");
}

bool ProcessSupervisor::remove_launch_config(const std::string& profile_name) const {
    fs::path path = launch_config_path(profile_name);
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        log_error("ProcessSupervisor: Failed to delete launch config " + path.string() + ": " + ec.message());
        return false;
    }
    return true;
}

size_t ProcessSupervisor::cleanup_launch_configs(const std::set<std::string>& keep) const {
    size_t removed = 0;
    std::error_code ec;

    if (!fs::is_directory(profile_dir_, ec)) {
        return 0;
    }

    for (const auto& entry : fs::directory_iterator(profile_dir_, ec)) {
        std::string file_name = entry.path().filename().string();
        if (!config::is_launch_config_name(file_name)) {
            continue;
        }

        std::string owner = file_name.substr(0, file_name.size() - std::string(config::LAUNCH_CONFIG_SUFFIX).size());
        if (keep.count(owner) > 0) {
            continue;
        }

        std::error_code remove_ec;
        if (fs::remove(entry.path(), remove_ec)) {
            ++removed;
        } else if (remove_ec) {
            log_warn("ProcessSupervisor: Cannot delete " + entry.path().string() + ": " + remove_ec.message());
        }
    }

    if (ec) {
        log_warn("ProcessSupervisor: Listing " + profile_dir_.string() + " failed: " + ec.message());
    }

    return removed;
}

void ProcessSupervisor::rotate_log(const fs::path& log_path, uintmax_t max_bytes, int backups) {
    std::error_code ec;
    if (!fs::exists(log_path, ec) || fs::file_size(log_path, ec) <= max_bytes || ec) {
        return;
    }

    for (int i = backups - 1; i >= 1; --i) {
        fs::path src = log_path.string() + "." + std::to_string(i);
        fs::path dst = log_path.string() + "." + std::to_string(i + 1);
        if (fs::exists(src, ec)) {
            fs::rename(src, dst, ec);
        }
    }

    if (backups > 0) {
        fs::rename(log_path, log_path.string() + ".1", ec);
    } else {
        fs::remove(log_path, ec);
    }

    if (ec) {
        log_error("ProcessSupervisor: Failed to rotate log file " + log_path.string() + ": " + ec.message());
    }
}

// ============================================================================
// Process Lifecycle
// ============================================================================

LaunchResult ProcessSupervisor::start(const Profile& profile, uint16_t port, const GlobalConfig& settings) {
    LaunchResult result;

    if (!settings.executable_path || !is_executable_file(*settings.executable_path)) {
        result.error = LaunchError::EXECUTABLE_NOT_FOUND;
        result.message = "wireproxy executable is not configured";
        log_error("ProcessSupervisor: Cannot start '" + profile.name + "': " + result.message);
        return result;
    }

    std::error_code ec;
    if (profile.config_path.empty() || !fs::exists(profile.config_path, ec)) {
        result.error = LaunchError::CONFIG_MISSING;
        result.message = "configuration file not found: " + profile.config_path.string();
        log_error("ProcessSupervisor: Cannot start '" + profile.name + "': " + result.message);
        return result;
    }

    fs::path launch_config = launch_config_path(profile.name);
    if (!generate_launch_config(profile.config_path, port, settings.proxy_type, launch_config)) {
        result.error = LaunchError::CONFIG_WRITE_FAILED;
        result.message = "cannot write " + launch_config.string();
        return result;
    }

    SpawnRequest request;
    request.executable = *settings.executable_path;
    request.arguments = {"-c", launch_config.string()};

    fs::path log_path = process_log_path(profile.name);
    if (settings.process_logging) {
        rotate_log(log_path);
        std::ofstream banner(log_path, std::ios::app);
        if (banner.is_open()) {
            banner << "\n=== Launching WireProxy at " << format_current_time() << " ===\n";
            banner << "Cmd: " << request.executable.string() << " -c " << launch_config.string() << "\n";
        } else {
            log_warn("ProcessSupervisor: Cannot open process log " + log_path.string());
        }
        request.output_log = log_path;
    }

    SpawnResult spawned = backend_.spawn(request);
    if (!spawned.pid) {
        result.error = LaunchError::SPAWN_FAILED;
        result.message = spawned.error;
        log_error("ProcessSupervisor: Failed to start WireProxy for '" + profile.name + "': " + spawned.error);
        return result;
    }

    // A broken config makes wireproxy exit right away
    std::this_thread::sleep_for(launch_grace_);
    if (!backend_.is_alive(*spawned.pid)) {
        result.error = LaunchError::EXITED_IMMEDIATELY;
        result.exit_code = backend_.exit_code(*spawned.pid);
        result.message = "WireProxy exited immediately";
        if (result.exit_code) {
            result.message += " with code " + std::to_string(*result.exit_code);
        }
        log_error("ProcessSupervisor: " + result.message + " for '" + profile.name + "'" +
                  (settings.process_logging ? ". See log: " + log_path.string() : std::string()));
        return result;
    }

    result.pid = spawned.pid;
    log_info("ProcessSupervisor: WireProxy started: pid=" + std::to_string(*spawned.pid) +
             ", profile='" + profile.name + "', port=" + std::to_string(port));
    return result;
}

bool ProcessSupervisor::is_running(std::optional<ProcessId> pid) const {
    if (!pid) {
        return false;
    }
    return backend_.is_alive(*pid);
}

bool ProcessSupervisor::stop(std::optional<ProcessId> pid) {
    if (!pid) {
        return true;
    }

    switch (backend_.terminate_tree(*pid, stop_grace_)) {
        case TerminateResult::TERMINATED:
            log_info("ProcessSupervisor: Terminated process tree of pid=" + std::to_string(*pid));
            return true;
        case TerminateResult::ALREADY_EXITED:
            log_debug("ProcessSupervisor: pid=" + std::to_string(*pid) + " already stopped");
            return true;
        case TerminateResult::FAILED:
        default:
            log_error("ProcessSupervisor: Failed to terminate pid=" + std::to_string(*pid));
            return false;
    }
}

} // namespace wpman
