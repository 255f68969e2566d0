/**
 * @file profile.hpp
 * @brief Profile record and global settings
 *
 * WPMan - WireProxy Profile Manager
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * A profile pairs a WireGuard configuration with the runtime state of the
 * wireproxy process serving it on a local port.
 */

#pragma once

#include <cstdint>
#include <string>
#include <optional>
#include <filesystem>

namespace wpman {

/// OS process identifier (pid on POSIX, process id on Windows)
using ProcessId = int64_t;

/**
 * @brief Proxy protocol served by the external process
 */
enum class ProxyType {
    SOCKS5,     ///< [Socks5] section
    HTTP        ///< [http] section
};

/**
 * @brief Convert proxy type to its persisted name ("socks" / "http")
 */
std::string proxy_type_to_string(ProxyType type);

/**
 * @brief Parse proxy type, accepting "socks", "socks5" and "http" in any case
 * @return Parsed type or std::nullopt if unknown
 */
std::optional<ProxyType> string_to_proxy_type(const std::string& str);

/**
 * @brief Profile record
 *
 * Every optional field is empty on construction. running is a cache of the
 * last liveness check of pid and is never trusted on its own.
 */
struct Profile {
    std::string name;                       ///< Unique key, also names the .conf artifact
    std::filesystem::path config_path;      ///< WireGuard source configuration
    std::optional<uint16_t> proxy_port;     ///< Port bound while running
    std::optional<uint16_t> last_port;      ///< Most recently used port
    std::optional<ProcessId> pid;           ///< Process believed running
    bool running = false;                   ///< Cached liveness of pid
    std::optional<std::string> host_cache;  ///< Memoized Endpoint host

    Profile() = default;
    Profile(std::string profile_name, std::filesystem::path config)
        : name(std::move(profile_name))
        , config_path(std::move(config))
    {}

    /**
     * @brief Port a reconnect should try first
     *
     * last_port, or a leftover proxy_port when last_port was never recorded.
     */
    std::optional<uint16_t> preferred_port() const {
        return last_port ? last_port : proxy_port;
    }
};

/**
 * @brief Global settings shared by every profile
 */
struct GlobalConfig {
    uint32_t port_limit;                                    ///< 0 = unlimited
    ProxyType proxy_type = ProxyType::SOCKS5;
    std::optional<std::filesystem::path> executable_path;   ///< wireproxy binary
    bool process_logging = true;                            ///< Capture child output

    GlobalConfig();
};

} // namespace wpman
