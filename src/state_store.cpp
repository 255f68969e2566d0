/**
 * @file state_store.cpp
 * @brief Implementation of state.json persistence
 *
 * WPMan - WireProxy Profile Manager
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "wpman/state_store.hpp"
#include "wpman/manager_config.hpp"
#include "wpman/utilities.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <limits>
#include <stdexcept>

using json = nlohmann::json;

namespace wpman {

using namespace wpman::utilities;

namespace fs = std::filesystem;

namespace {

std::optional<uint16_t> port_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_integer()) {
        return std::nullopt;
    }
    int64_t value = it->get<int64_t>();
    if (value <= 0 || value > std::numeric_limits<uint16_t>::max()) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(value);
}

std::optional<ProcessId> pid_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_integer()) {
        return std::nullopt;
    }
    int64_t value = it->get<int64_t>();
    if (value <= 0) {
        return std::nullopt;
    }
    return value;
}

std::string string_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return std::string();
    }
    return it->get<std::string>();
}

template <typename T>
json optional_to_json(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

int version_of(const json& j) {
    auto it = j.find("version");
    if (it == j.end() || !it->is_number_integer()) {
        return 0;
    }
    return it->get<int>();
}

/// Upgrade an older document step by step to STATE_VERSION
void migrate_document(json& j) {
    int current = version_of(j);

    while (current < config::STATE_VERSION) {
        if (current < 1) {
            current = 1;
        } else if (current < 2) {
            if (!j.contains("proxy_type")) {
                j["proxy_type"] = "socks";
            }
            current = 2;
        } else if (current < 3) {
            if (!j.contains("logging_enabled")) {
                j["logging_enabled"] = true;
            }
            current = 3;
        }
    }

    j["version"] = config::STATE_VERSION;
}

PersistedState state_from_document(const json& j) {
    PersistedState state;
    state.version = version_of(j);

    auto limit = j.find("port_limit");
    if (limit != j.end() && limit->is_number_integer()) {
        int64_t value = limit->get<int64_t>();
        state.settings.port_limit = value < 0 ? 0 : static_cast<uint32_t>(
            std::min<int64_t>(value, std::numeric_limits<uint32_t>::max()));
    }

    std::string proxy_type = string_field(j, "proxy_type");
    if (!proxy_type.empty()) {
        auto parsed = string_to_proxy_type(proxy_type);
        if (parsed) {
            state.settings.proxy_type = *parsed;
        } else {
            log_warn("StateStore: Unknown proxy_type '" + proxy_type + "', using socks");
        }
    }

    std::string exe = string_field(j, "wireproxy_path");
    if (!exe.empty()) {
        state.settings.executable_path = fs::path(exe);
    }

    auto logging = j.find("logging_enabled");
    if (logging != j.end() && logging->is_boolean()) {
        state.settings.process_logging = logging->get<bool>();
    }

    auto profiles = j.find("profiles");
    if (profiles != j.end() && profiles->is_array()) {
        for (const auto& entry : *profiles) {
            if (!entry.is_object()) {
                continue;
            }

            std::string name = string_field(entry, "name");
            if (name.empty()) {
                log_warn("StateStore: Skipping profile entry without a name");
                continue;
            }

            Profile profile(name, fs::path(string_field(entry, "conf_path")));
            profile.proxy_port = port_field(entry, "proxy_port");
            profile.last_port = port_field(entry, "last_port");
            profile.pid = pid_field(entry, "pid");

            auto running = entry.find("running");
            profile.running = running != entry.end() && running->is_boolean() && running->get<bool>();

            state.profiles.push_back(std::move(profile));
        }
    }

    return state;
}

} // namespace

PersistedState::PersistedState()
    : version(config::STATE_VERSION)
{}

// ============================================================================
// Constructor
// ============================================================================

StateStore::StateStore(fs::path state_file)
    : state_file_(std::move(state_file))
{
    if (state_file_.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(state_file_.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("Failed to create state directory " +
                                     state_file_.parent_path().string() + ": " + ec.message());
        }
    }
}

// ============================================================================
// Load / Save
// ============================================================================

PersistedState StateStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    if (!fs::exists(state_file_, ec)) {
        log_info("StateStore: No state file at " + state_file_.string() + ", using defaults");
        return PersistedState();
    }

    auto content = read_file(state_file_);
    if (!content) {
        log_error("StateStore: Cannot read " + state_file_.string() + ", using defaults");
        return PersistedState();
    }

    try {
        json j = json::parse(*content);

        if (!j.is_object()) {
            log_warn("StateStore: " + state_file_.string() + " is not an object, using defaults");
            return PersistedState();
        }

        if (version_of(j) < config::STATE_VERSION) {
            log_info("StateStore: Migrating state.json from version " +
                     std::to_string(version_of(j)) + " to " + std::to_string(config::STATE_VERSION));
            backup_state_file();
            migrate_document(j);
            if (!write_locked(j.dump(2))) {
                log_error("StateStore: Failed to save migrated state");
            }
        }

        PersistedState state = state_from_document(j);
        log_debug("StateStore: State loaded: port_limit=" + std::to_string(state.settings.port_limit) +
                  ", proxy_type=" + proxy_type_to_string(state.settings.proxy_type) +
                  ", profiles=" + std::to_string(state.profiles.size()));
        return state;

    } catch (const std::exception& e) {
        log_error("StateStore: Error reading " + state_file_.string() + ": " + e.what() + ". Using defaults");
        return PersistedState();
    }
}

bool StateStore::save(const GlobalConfig& settings, const std::vector<Profile>& profiles) {
    std::string content;
    try {
        content = serialize(settings, profiles);
    } catch (const std::exception& e) {
        log_error(std::string("StateStore: Failed to serialize state: ") + e.what());
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    return write_locked(content);
}

std::string StateStore::serialize(const GlobalConfig& settings, const std::vector<Profile>& profiles) {
    json j;
    j["version"] = config::STATE_VERSION;
    j["port_limit"] = settings.port_limit;
    j["proxy_type"] = proxy_type_to_string(settings.proxy_type);
    j["wireproxy_path"] = settings.executable_path ? json(settings.executable_path->string()) : json(nullptr);
    j["logging_enabled"] = settings.process_logging;

    json entries = json::array();
    for (const auto& profile : profiles) {
        json entry;
        entry["name"] = profile.name;
        entry["conf_path"] = profile.config_path.empty() ? json(nullptr) : json(profile.config_path.string());
        entry["proxy_port"] = optional_to_json(profile.proxy_port);
        entry["pid"] = optional_to_json(profile.pid);
        entry["running"] = profile.running;
        entry["last_port"] = optional_to_json(profile.last_port);
        entries.push_back(std::move(entry));
    }
    j["profiles"] = std::move(entries);

    return j.dump(2);
}

std::optional<PersistedState> StateStore::parse(const std::string& text) {
    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            return std::nullopt;
        }
        return state_from_document(j);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// Private Helpers
// ============================================================================

bool StateStore::backup_state_file() const {
    fs::path backup = state_file_.string() + ".bak-" + format_timestamp(current_timestamp(), "%Y%m%d-%H%M%S");

    std::error_code ec;
    fs::copy_file(state_file_, backup, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        log_error("StateStore: Failed to create state backup during migration: " + ec.message());
        return false;
    }

    log_info("StateStore: Backed up state to " + backup.string());
    return true;
}

bool StateStore::write_locked(const std::string& content) {
    fs::path temp_file = state_file_.string() + ".tmp";

    if (!write_file(temp_file, content)) {
        log_error("StateStore: Failed to save state to " + state_file_.string());
        return false;
    }

    std::error_code ec;
    fs::rename(temp_file, state_file_, ec);
    if (ec) {
        log_error("StateStore: Failed to replace " + state_file_.string() + ": " + ec.message());
        fs::remove(temp_file, ec);
        return false;
    }
    return true;
}

} // namespace wpman
