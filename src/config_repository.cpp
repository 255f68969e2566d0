/**
 * @file config_repository.cpp
 * @brief Implementation of profile configuration artifacts
 *
 * WPMan - WireProxy Profile Manager
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "wpman/config_repository.hpp"
#include "wpman/manager_config.hpp"
#include "wpman/utilities.hpp"

#include <algorithm>
#include <sstream>

namespace wpman {

using namespace wpman::utilities;

namespace fs = std::filesystem;

ConfigRepository::ConfigRepository(fs::path profile_dir)
    : profile_dir_(std::move(profile_dir))
{
    std::error_code ec;
    fs::create_directories(profile_dir_, ec);
    if (ec) {
        throw std::runtime_error("Failed to create profile directory " + profile_dir_.string() + ": " + ec.message());
    }
}

fs::path ConfigRepository::config_path_for(const std::string& name) const {
    return profile_dir_ / (name + config::PROFILE_EXTENSION);
}

bool ConfigRepository::artifact_exists(const std::string& name) const {
    std::error_code ec;
    return fs::exists(config_path_for(name), ec);
}

bool ConfigRepository::config_exists(const Profile& profile) const {
    std::error_code ec;
    return !profile.config_path.empty() && fs::is_regular_file(profile.config_path, ec);
}

std::optional<std::string> ConfigRepository::get_source_config(const Profile& profile) const {
    if (!config_exists(profile)) {
        return std::nullopt;
    }
    return read_file(profile.config_path);
}

bool ConfigRepository::update_config(const Profile& profile, const std::string& content) const {
    if (profile.config_path.empty()) {
        return false;
    }
    return write_file(profile.config_path, content);
}

// ============================================================================
// Import
// ============================================================================

ImportResult ConfigRepository::import_from_file(
    const fs::path& file_path,
    const std::set<std::string>& existing_names
) const {
    ImportResult result;
    std::error_code ec;

    if (!fs::is_regular_file(file_path, ec)) {
        result.message = "File not found: " + file_path.string();
        return result;
    }

    std::string name = file_path.stem().string();
    if (!config::validate_profile_name(name)) {
        result.message = "'" + name + "' is not a valid profile name.";
        return result;
    }

    if (existing_names.count(name) > 0) {
        result.message = "Profile '" + name + "' already exists.";
        return result;
    }

    fs::path dest_path = config_path_for(name);
    if (fs::exists(dest_path, ec)) {
        result.message = "A file named '" + dest_path.filename().string() + "' already exists in profiles/.";
        return result;
    }

    fs::copy_file(file_path, dest_path, ec);
    if (ec) {
        result.message = "Failed to copy file: " + ec.message();
        log_error("ConfigRepository: " + result.message);
        return result;
    }

    result.profile = Profile(name, dest_path);
    result.message = "Profile '" + name + "' imported successfully.";
    log_info("ConfigRepository: Imported " + file_path.string() + " as '" + name + "'");
    return result;
}

ImportResult ConfigRepository::import_from_text(
    const std::string& name_hint,
    const std::string& content,
    const std::set<std::string>& existing_names
) const {
    ImportResult result;

    if (!looks_like_wireguard_config(content)) {
        result.message = "Text does not look like a WireGuard config.";
        return result;
    }

    std::string base_name = config::sanitize_profile_name(name_hint);
    std::string name = base_name;

    // Both the store and the directory must be free of the name
    for (int suffix = 1; existing_names.count(name) > 0 || artifact_exists(name); ++suffix) {
        name = base_name + "_" + std::to_string(suffix);
    }

    fs::path dest_path = config_path_for(name);
    if (!write_file(dest_path, content)) {
        result.message = "Failed to create profile file " + dest_path.string();
        return result;
    }

    result.profile = Profile(name, dest_path);
    result.message = "Profile '" + name + "' imported successfully.";
    log_info("ConfigRepository: Created profile '" + name + "' from text");
    return result;
}

// ============================================================================
// Relocation and Deletion
// ============================================================================

std::optional<fs::path> ConfigRepository::relocate(const Profile& profile, const std::string& new_name) const {
    fs::path new_path = config_path_for(new_name);
    std::error_code ec;

    if (fs::exists(new_path, ec)) {
        log_warn("ConfigRepository: Cannot rename '" + profile.name + "': " + new_path.string() + " exists");
        return std::nullopt;
    }

    fs::rename(profile.config_path, new_path, ec);
    if (ec) {
        log_error("ConfigRepository: Failed to rename " + profile.config_path.string() +
                  " to " + new_path.string() + ": " + ec.message());
        return std::nullopt;
    }

    return new_path;
}

bool ConfigRepository::delete_config(const Profile& profile) const {
    if (profile.config_path.empty()) {
        return true;
    }

    std::error_code ec;
    fs::remove(profile.config_path, ec);
    if (ec) {
        log_error("ConfigRepository: Failed to delete conf file " + profile.config_path.string() + ": " + ec.message());
        return false;
    }
    return true;
}

std::vector<Profile> ConfigRepository::scan_profiles(const std::set<std::string>& known_names) const {
    std::vector<Profile> discovered;
    std::error_code ec;

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(profile_dir_, ec)) {
        std::string file_name = entry.path().filename().string();
        if (!entry.is_regular_file() || entry.path().extension() != config::PROFILE_EXTENSION) {
            continue;
        }
        if (config::is_launch_config_name(file_name)) {
            continue;
        }
        files.push_back(entry.path());
    }
    if (ec) {
        log_warn("ConfigRepository: Listing " + profile_dir_.string() + " failed: " + ec.message());
    }

    // directory_iterator order is unspecified
    std::sort(files.begin(), files.end());

    for (const auto& path : files) {
        std::string name = path.stem().string();
        if (known_names.count(name) > 0) {
            continue;
        }
        if (!config::validate_profile_name(name)) {
            log_warn("ConfigRepository: Ignoring " + path.filename().string() + ": invalid profile name");
            continue;
        }
        discovered.emplace_back(name, path);
        log_info("ConfigRepository: Discovered new profile from disk: " + name);
    }

    return discovered;
}

// ============================================================================
// Endpoint Host
// ============================================================================

std::optional<std::string> ConfigRepository::extract_endpoint_host(const Profile& profile) const {
    auto content = get_source_config(profile);
    if (!content) {
        return std::nullopt;
    }
    return parse_endpoint_host(*content);
}

std::optional<std::string> ConfigRepository::parse_endpoint_host(const std::string& content) {
    std::istringstream stream(content);
    std::string line;

    while (std::getline(stream, line)) {
        auto eq = line.find('=');
        if (eq == std::string::npos || to_lowercase(trim_string(line.substr(0, eq))) != "endpoint") {
            continue;
        }

        std::string value = line.substr(eq + 1);
        value = trim_string(value.substr(0, value.find('#')));
        value = trim_string(value.substr(0, value.find(';')));

        std::string host;
        if (starts_with(value, "[")) {
            auto close = value.find(']');
            host = value.substr(1, close == std::string::npos ? std::string::npos : close - 1);
        } else if (std::count(value.begin(), value.end(), ':') > 1) {
            // Bare IPv6 address without a port
            host = value;
        } else {
            auto colon = value.rfind(':');
            host = colon == std::string::npos ? value : value.substr(0, colon);
        }

        host = trim_string(host);
        if (host.empty()) {
            return std::nullopt;
        }
        return host;
    }

    return std::nullopt;
}

bool ConfigRepository::looks_like_wireguard_config(const std::string& content) {
    return content.find("[Interface]") != std::string::npos;
}

} // namespace wpman
