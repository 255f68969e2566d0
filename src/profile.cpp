/**
 * @file profile.cpp
 * @brief Profile record helpers
 *
 * WPMan - WireProxy Profile Manager
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "wpman/profile.hpp"
#include "wpman/manager_config.hpp"
#include "wpman/utilities.hpp"

namespace wpman {

std::string proxy_type_to_string(ProxyType type) {
    switch (type) {
        case ProxyType::SOCKS5: return "socks";
        case ProxyType::HTTP:   return "http";
        default:                return "socks";
    }
}

std::optional<ProxyType> string_to_proxy_type(const std::string& str) {
    std::string lower = utilities::to_lowercase(utilities::trim_string(str));
    if (lower == "socks" || lower == "socks5") return ProxyType::SOCKS5;
    if (lower == "http") return ProxyType::HTTP;
    return std::nullopt;
}

GlobalConfig::GlobalConfig()
    : port_limit(config::DEFAULT_PORT_LIMIT)
{}

} // namespace wpman
