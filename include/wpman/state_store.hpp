/**
 * @file state_store.hpp
 * @brief Persistent state file (state.json)
 *
 * WPMan - WireProxy Profile Manager
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * JSON persistence of global settings and profile records:
 * - Defaults for every missing field
 * - Fallback to defaults on a malformed file
 * - Schema versioning with migration and timestamped backup
 * - Atomic replace on save
 */

#pragma once

#include "wpman/profile.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace wpman {

/**
 * @brief Everything state.json holds
 */
struct PersistedState {
    int version;
    GlobalConfig settings;
    std::vector<Profile> profiles;

    PersistedState();
};

/**
 * @brief StateStore - load and save state.json
 *
 * Thread-safe: concurrent save() calls are serialized.
 */
class StateStore {
public:
    /**
     * @brief Construct store for a state file
     * @param state_file Path of state.json (parent directory created if missing)
     * @throws std::runtime_error if the parent directory cannot be created
     */
    explicit StateStore(std::filesystem::path state_file);

    StateStore(const StateStore&) = delete;
    StateStore& operator=(const StateStore&) = delete;

    const std::filesystem::path& path() const { return state_file_; }

    /**
     * @brief Load state, migrating older schema versions in place
     *
     * A missing or malformed file yields defaults. A file with an older
     * version is backed up to state.json.bak-YYYYmmdd-HHMMSS, upgraded and
     * written back before being returned.
     */
    PersistedState load();

    /**
     * @brief Write settings and profiles
     * @return true if the file was replaced
     */
    bool save(const GlobalConfig& settings, const std::vector<Profile>& profiles);

    /**
     * @brief Serialize state to JSON text (indent 2)
     */
    static std::string serialize(const GlobalConfig& settings, const std::vector<Profile>& profiles);

    /**
     * @brief Parse JSON text without migrating
     * @return Parsed state, or std::nullopt if the text is not a JSON object
     */
    static std::optional<PersistedState> parse(const std::string& text);

private:
    /// Copy the current file aside before a migration rewrites it
    bool backup_state_file() const;

    bool write_locked(const std::string& content);

    std::filesystem::path state_file_;
    std::mutex mutex_;
};

} // namespace wpman
