/**
 * @file manager_config.cpp
 * @brief Implementation of directory layout and name validation
 *
 * WPMan - WireProxy Profile Manager
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "wpman/manager_config.hpp"
#include "wpman/utilities.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>

namespace wpman {
namespace config {

namespace {
    std::filesystem::path ensure_directory(const std::filesystem::path& dir) {
        if (!std::filesystem::exists(dir)) {
            std::filesystem::create_directories(dir);
        }
        return dir;
    }
}

// ============================================================================
// Directories
// ============================================================================

std::filesystem::path get_data_directory() {
    // Check for environment variable WPMAN_DATA_DIR
    const char* env_data_dir = std::getenv("WPMAN_DATA_DIR");

    if (env_data_dir != nullptr && std::strlen(env_data_dir) > 0) {
        return ensure_directory(std::filesystem::path(env_data_dir));
    }

#ifdef _WIN32
    std::string app_data = utilities::get_env("APPDATA", "C:\\ProgramData");
    std::filesystem::path default_dir = std::filesystem::path(app_data) / "wpman";
#else
    std::string xdg_data = utilities::get_env("XDG_DATA_HOME");
    std::filesystem::path default_dir;
    if (!xdg_data.empty()) {
        default_dir = std::filesystem::path(xdg_data) / "wpman";
    } else {
        default_dir = std::filesystem::path(utilities::get_env("HOME", "/tmp")) / ".local" / "share" / "wpman";
    }
#endif

    return ensure_directory(default_dir);
}

std::filesystem::path get_profile_directory(const std::filesystem::path& data_dir) {
    return ensure_directory(data_dir / "profiles");
}

std::filesystem::path get_log_directory(const std::filesystem::path& data_dir) {
    return ensure_directory(data_dir / "logs");
}

std::filesystem::path get_state_file(const std::filesystem::path& data_dir) {
    return data_dir / "state.json";
}

std::filesystem::path get_ledger_file(const std::filesystem::path& data_dir) {
    return data_dir / "sessions.db";
}

// ============================================================================
// Validation
// ============================================================================

bool validate_profile_name(const std::string& name) {
    if (name.empty() || name.length() > MAX_PROFILE_NAME_LENGTH) {
        return false;
    }

    // Names become file names, so only a portable subset is allowed
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') {
            return false;
        }
    }

    // "<name>.conf" must never look like a launch config
    return !is_launch_config_name(name + PROFILE_EXTENSION);
}

std::string sanitize_profile_name(const std::string& hint, const std::string& fallback) {
    std::string sanitized;
    std::string trimmed = utilities::trim_string(hint);

    std::copy_if(trimmed.begin(), trimmed.end(), std::back_inserter(sanitized),
        [](char c) {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
        });

    if (sanitized.empty()) {
        sanitized = fallback;
    }

    if (sanitized.length() > MAX_PROFILE_NAME_LENGTH) {
        sanitized = sanitized.substr(0, MAX_PROFILE_NAME_LENGTH);
    }

    // Strip a trailing "_wireproxy" so the artifact cannot be mistaken for a launch config
    const std::string reserved = "_wireproxy";
    while (utilities::ends_with(sanitized, reserved)) {
        sanitized.erase(sanitized.length() - reserved.length());
    }
    if (sanitized.empty()) {
        sanitized = fallback;
    }

    return sanitized;
}

bool is_launch_config_name(const std::string& file_name) {
    return utilities::ends_with(file_name, LAUNCH_CONFIG_SUFFIX);
}

} // namespace config
} // namespace wpman
