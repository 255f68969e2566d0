/**
 * @file profile_store.cpp
 * @brief Implementation of the thread-safe profile collection
 *
 * WPMan - WireProxy Profile Manager
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "wpman/profile_store.hpp"
#include "wpman/manager_config.hpp"
#include "wpman/utilities.hpp"

#include <algorithm>
#include <stdexcept>

namespace wpman {

using namespace wpman::utilities;

std::string store_error_to_string(StoreError error) {
    switch (error) {
        case StoreError::NONE:              return "none";
        case StoreError::INVALID_NAME:      return "invalid profile name";
        case StoreError::DUPLICATE_NAME:    return "a profile with this name already exists";
        case StoreError::NOT_FOUND:         return "profile not found";
        case StoreError::RELOCATION_FAILED: return "cannot move profile configuration";
        case StoreError::PROFILE_RUNNING:   return "profile is running, disconnect it first";
        case StoreError::IO_FAILED:         return "cannot write profile configuration";
        default:                            return "unknown";
    }
}

// ============================================================================
// Constructor
// ============================================================================

ProfileStore::ProfileStore(LivenessCheck is_alive)
    : is_alive_(std::move(is_alive))
{
    if (!is_alive_) {
        throw std::invalid_argument("ProfileStore requires a liveness check");
    }
}

// ============================================================================
// Bulk Access
// ============================================================================

void ProfileStore::load(std::vector<Profile> profiles) {
    std::lock_guard<std::mutex> lock(mutex_);

    profiles_.clear();
    std::set<std::string> seen;

    for (auto& profile : profiles) {
        if (!seen.insert(profile.name).second) {
            log_warn("ProfileStore: Dropping duplicate profile '" + profile.name + "'");
            continue;
        }
        profiles_.push_back(std::move(profile));
    }
}

std::vector<Profile> ProfileStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return profiles_;
}

std::vector<Profile> ProfileStore::refreshed_snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<Profile> copy = profiles_;
    for (auto& profile : copy) {
        refresh_locked(profile);
    }
    return copy;
}

std::vector<std::string> ProfileStore::refresh() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> died;
    for (auto& profile : profiles_) {
        if (refresh_locked(profile)) {
            died.push_back(profile.name);
        }
    }
    return died;
}

size_t ProfileStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return profiles_.size();
}

std::set<std::string> ProfileStore::names() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::set<std::string> result;
    for (const auto& profile : profiles_) {
        result.insert(profile.name);
    }
    return result;
}

// ============================================================================
// Lookups
// ============================================================================

std::optional<Profile> ProfileStore::at(size_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index >= profiles_.size()) {
        return std::nullopt;
    }
    return profiles_[index];
}

std::optional<Profile> ProfileStore::find_by_name(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Profile* profile = find_locked(name);
    if (!profile) {
        return std::nullopt;
    }
    return *profile;
}

std::optional<size_t> ProfileStore::index_of(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t i = 0; i < profiles_.size(); ++i) {
        if (profiles_[i].name == name) {
            return i;
        }
    }
    return std::nullopt;
}

bool ProfileStore::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return find_locked(name) != nullptr;
}

std::optional<Profile> ProfileStore::find_by_port(uint16_t port) const {
    std::lock_guard<std::mutex> lock(mutex_);

    for (const auto& profile : profiles_) {
        if (profile.proxy_port != port) {
            continue;
        }
        Profile copy = profile;
        refresh_locked(copy);
        if (copy.running) {
            return copy;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Mutation
// ============================================================================

StoreError ProfileStore::add(Profile profile) {
    if (!config::validate_profile_name(profile.name)) {
        return StoreError::INVALID_NAME;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (find_locked(profile.name)) {
        return StoreError::DUPLICATE_NAME;
    }

    profiles_.push_back(std::move(profile));
    return StoreError::NONE;
}

std::optional<Profile> ProfileStore::remove(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = std::find_if(profiles_.begin(), profiles_.end(),
        [&name](const Profile& p) { return p.name == name; });
    if (it == profiles_.end()) {
        return std::nullopt;
    }

    Profile removed = std::move(*it);
    profiles_.erase(it);
    return removed;
}

StoreError ProfileStore::rename(const std::string& old_name, const std::string& new_name, const Relocator& relocate) {
    if (!config::validate_profile_name(new_name)) {
        return StoreError::INVALID_NAME;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    Profile* profile = find_locked(old_name);
    if (!profile) {
        return StoreError::NOT_FOUND;
    }
    if (old_name == new_name) {
        return StoreError::NONE;
    }
    if (find_locked(new_name)) {
        return StoreError::DUPLICATE_NAME;
    }

    std::optional<std::filesystem::path> new_path = relocate ? relocate(*profile, new_name)
                                                             : std::optional<std::filesystem::path>(profile->config_path);
    if (!new_path) {
        return StoreError::RELOCATION_FAILED;
    }

    profile->name = new_name;
    profile->config_path = *new_path;
    profile->host_cache.reset();
    return StoreError::NONE;
}

bool ProfileStore::mark_started(const std::string& name, ProcessId pid, uint16_t port) {
    std::lock_guard<std::mutex> lock(mutex_);

    Profile* profile = find_locked(name);
    if (!profile) {
        return false;
    }

    profile->pid = pid;
    profile->proxy_port = port;
    profile->last_port = port;
    profile->running = true;
    return true;
}

bool ProfileStore::mark_stopped(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);

    Profile* profile = find_locked(name);
    if (!profile) {
        return false;
    }

    clear_runtime(*profile);
    return true;
}

bool ProfileStore::set_host_cache(const std::string& name, std::optional<std::string> host) {
    std::lock_guard<std::mutex> lock(mutex_);

    Profile* profile = find_locked(name);
    if (!profile) {
        return false;
    }

    profile->host_cache = std::move(host);
    return true;
}

// ============================================================================
// Private Helpers
// ============================================================================

bool ProfileStore::refresh_locked(Profile& profile) const {
    bool alive = profile.pid && is_alive_(*profile.pid);

    if (alive) {
        profile.running = true;
        return false;
    }

    bool believed_running = profile.running || profile.pid.has_value();
    clear_runtime(profile);
    return believed_running;
}

Profile* ProfileStore::find_locked(const std::string& name) {
    for (auto& profile : profiles_) {
        if (profile.name == name) {
            return &profile;
        }
    }
    return nullptr;
}

const Profile* ProfileStore::find_locked(const std::string& name) const {
    for (const auto& profile : profiles_) {
        if (profile.name == name) {
            return &profile;
        }
    }
    return nullptr;
}

void ProfileStore::clear_runtime(Profile& profile) {
    if (profile.proxy_port) {
        profile.last_port = profile.proxy_port;
    }
    profile.pid.reset();
    profile.proxy_port.reset();
    profile.running = false;
}

} // namespace wpman
