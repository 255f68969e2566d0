/**
 * @file config_repository.hpp
 * @brief WireGuard configuration artifacts of profiles
 *
 * WPMan - WireProxy Profile Manager
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Owns the <profiles>/<name>.conf files:
 * - Import from an existing file or pasted text
 * - Read, rewrite, relocate and delete
 * - Discovery of configs dropped into the directory
 * - Endpoint host extraction
 */

#pragma once

#include "wpman/profile.hpp"

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace wpman {

/**
 * @brief Outcome of an import
 */
struct ImportResult {
    std::optional<Profile> profile;     ///< New record on success (not yet stored)
    std::string message;                ///< Success or failure description

    bool ok() const { return profile.has_value(); }
};

/**
 * @brief ConfigRepository - profile configuration files on disk
 *
 * Not synchronized: callers serialize mutations (ProxyManager holds its
 * operation lock around every call).
 */
class ConfigRepository {
public:
    /**
     * @brief Construct repository rooted at a profile directory
     * @param profile_dir Directory holding <name>.conf files (created if missing)
     */
    explicit ConfigRepository(std::filesystem::path profile_dir);

    const std::filesystem::path& profile_directory() const { return profile_dir_; }

    /**
     * @brief Path a profile named name would use
     */
    std::filesystem::path config_path_for(const std::string& name) const;

    /**
     * @brief Whether <name>.conf already exists
     */
    bool artifact_exists(const std::string& name) const;

    /**
     * @brief Whether the profile's configuration file exists
     */
    bool config_exists(const Profile& profile) const;

    /**
     * @brief Read the profile's configuration text
     */
    std::optional<std::string> get_source_config(const Profile& profile) const;

    /**
     * @brief Rewrite the profile's configuration text
     */
    bool update_config(const Profile& profile, const std::string& content) const;

    /**
     * @brief Copy a .conf file into the profile directory
     * @param file_path Source file; its stem becomes the profile name
     * @param existing_names Names already in use
     */
    ImportResult import_from_file(const std::filesystem::path& file_path, const std::set<std::string>& existing_names) const;

    /**
     * @brief Create a profile from pasted configuration text
     *
     * The text must contain an [Interface] section. The name hint is
     * sanitized and suffixed with _1, _2, ... until unique.
     */
    ImportResult import_from_text(
        const std::string& name_hint,
        const std::string& content,
        const std::set<std::string>& existing_names
    ) const;

    /**
     * @brief Move a profile's config to <new_name>.conf
     * @return New path, or std::nullopt on collision or I/O failure
     */
    std::optional<std::filesystem::path> relocate(const Profile& profile, const std::string& new_name) const;

    /**
     * @brief Delete a profile's configuration file
     * @return false only if the file exists and could not be removed
     */
    bool delete_config(const Profile& profile) const;

    /**
     * @brief Profiles for .conf files in the directory not yet known
     * @param known_names Names already in the store
     */
    std::vector<Profile> scan_profiles(const std::set<std::string>& known_names) const;

    /**
     * @brief Endpoint host of a profile, read from its config
     */
    std::optional<std::string> extract_endpoint_host(const Profile& profile) const;

    /**
     * @brief Endpoint host from configuration text
     *
     * First "Endpoint = host:port" line; comments stripped, [IPv6]
     * unwrapped, port removed.
     */
    static std::optional<std::string> parse_endpoint_host(const std::string& content);

    /**
     * @brief Minimal plausibility check of WireGuard config text
     */
    static bool looks_like_wireguard_config(const std::string& content);

private:
    std::filesystem::path profile_dir_;
};

} // namespace wpman
