/**
 * @file port_registry.cpp
 * @brief Implementation of proxy port space decisions
 *
 * WPMan - WireProxy Profile Manager
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "wpman/port_registry.hpp"
#include "wpman/utilities.hpp"

#include <asio.hpp>
#include <algorithm>
#include <stdexcept>

namespace wpman {

using namespace wpman::utilities;

// ============================================================================
// TcpPortProbe
// ============================================================================

TcpPortProbe::TcpPortProbe(std::chrono::milliseconds timeout)
    : timeout_(timeout)
{}

bool TcpPortProbe::is_port_free(uint16_t port) {
    try {
        asio::io_context io_context;
        asio::ip::tcp::socket socket(io_context);
        asio::steady_timer timer(io_context);

        asio::ip::tcp::endpoint endpoint(asio::ip::make_address(config::PROXY_BIND_HOST), port);
        asio::error_code connect_result = asio::error::would_block;

        socket.async_connect(endpoint, [&](const asio::error_code& error) {
            connect_result = error;
            timer.cancel();
        });

        // A silent port (dropped SYN) counts as free once the timer fires
        timer.expires_after(timeout_);
        timer.async_wait([&](const asio::error_code& error) {
            if (!error) {
                asio::error_code ignored;
                socket.close(ignored);
            }
        });

        io_context.run();

        if (!connect_result) {
            asio::error_code ignored;
            socket.close(ignored);
            return false;
        }
        return true;

    } catch (const std::exception& e) {
        log_warn("TcpPortProbe: Probe of port " + std::to_string(port) + " failed: " + e.what());
        return true;
    }
}

// ============================================================================
// PortRegistry
// ============================================================================

PortRegistry::PortRegistry(
    ProcessBackend& processes,
    PortProbe& probe,
    uint16_t base_start,
    uint16_t base_end
)
    : processes_(processes)
    , probe_(probe)
    , base_{base_start, base_end}
    , attempts_(0)
{
    if (base_start == 0 || base_start > base_end) {
        throw std::invalid_argument("base port range must be non-empty and start above 0");
    }
}

PortRange PortRegistry::base_range() const {
    return base_;
}

PortRange PortRegistry::allowed_range(uint32_t limit) const {
    if (limit == 0 || limit >= base_.size()) {
        return base_;
    }

    uint32_t end = std::min<uint32_t>(static_cast<uint32_t>(base_.low) + limit - 1, base_.high);
    return PortRange{base_.low, static_cast<uint16_t>(end)};
}

bool PortRegistry::validate_requested_port(uint32_t port, uint32_t limit) const {
    return allowed_range(limit).contains(port);
}

std::set<uint16_t> PortRegistry::ports_in_use(const std::vector<Profile>& profiles) const {
    std::set<uint16_t> used;

    for (const auto& profile : profiles) {
        if (profile.proxy_port && profile.pid && processes_.is_alive(*profile.pid)) {
            used.insert(*profile.proxy_port);
        }
    }

    return used;
}

bool PortRegistry::is_port_free_on_host(uint16_t port) const {
    return probe_.is_port_free(port);
}

std::optional<uint16_t> PortRegistry::find_free_port(
    const std::vector<Profile>& profiles,
    uint32_t limit,
    const std::set<uint16_t>& excluded
) const {
    std::set<uint16_t> used = ports_in_use(profiles);

    // Capacity reached: no point probing the host
    if (limit > 0 && used.size() >= limit) {
        log_debug("PortRegistry: Connection limit " + std::to_string(limit) + " reached");
        return std::nullopt;
    }

    PortRange range = allowed_range(limit);
    for (uint32_t port = range.low; port <= range.high; ++port) {
        uint16_t candidate = static_cast<uint16_t>(port);
        if (used.count(candidate) > 0 || excluded.count(candidate) > 0) {
            continue;
        }
        if (is_port_free_on_host(candidate)) {
            return candidate;
        }
        log_debug("PortRegistry: Port " + std::to_string(candidate) + " busy on host");
    }

    return std::nullopt;
}

std::optional<uint16_t> PortRegistry::pick_port_for_profile(
    const Profile& profile,
    const std::vector<Profile>& profiles,
    uint32_t limit,
    const std::set<uint16_t>& excluded
) const {
    std::optional<uint16_t> preferred = profile.preferred_port();

    if (preferred && validate_requested_port(*preferred, limit) && excluded.count(*preferred) == 0) {
        std::set<uint16_t> used = ports_in_use(profiles);
        bool under_limit = limit == 0 || used.size() < limit;

        if (under_limit && used.count(*preferred) == 0 && is_port_free_on_host(*preferred)) {
            return preferred;
        }
    }

    return find_free_port(profiles, limit, excluded);
}

// ============================================================================
// In-flight Launches
// ============================================================================

SlotStatus PortRegistry::begin_attempt(uint32_t limit, const UsageCount& count_used) {
    std::lock_guard<std::mutex> lock(reservation_mutex_);

    if (limit > 0 && count_used() + attempts_ >= limit) {
        return attempts_ > 0 ? SlotStatus::PENDING : SlotStatus::LIMIT_REACHED;
    }

    ++attempts_;
    return SlotStatus::ACQUIRED;
}

void PortRegistry::end_attempt() {
    std::lock_guard<std::mutex> lock(reservation_mutex_);
    if (attempts_ > 0) {
        --attempts_;
    }
}

size_t PortRegistry::attempts_in_flight() const {
    std::lock_guard<std::mutex> lock(reservation_mutex_);
    return attempts_;
}

bool PortRegistry::reserve_port(uint16_t port, const HolderCheck& is_held) {
    std::lock_guard<std::mutex> lock(reservation_mutex_);

    if (reserved_.count(port) > 0 || (is_held && is_held(port))) {
        return false;
    }

    reserved_.insert(port);
    return true;
}

void PortRegistry::release_port(uint16_t port) {
    std::lock_guard<std::mutex> lock(reservation_mutex_);
    reserved_.erase(port);
}

bool PortRegistry::is_reserved(uint16_t port) const {
    std::lock_guard<std::mutex> lock(reservation_mutex_);
    return reserved_.count(port) > 0;
}

std::set<uint16_t> PortRegistry::reserved_ports() const {
    std::lock_guard<std::mutex> lock(reservation_mutex_);
    return reserved_;
}

// ============================================================================
// PortReservation
// ============================================================================

PortReservation::PortReservation(PortRegistry& registry)
    : registry_(registry)
    , has_slot_(false)
{}

PortReservation::~PortReservation() {
    if (port_) {
        registry_.release_port(*port_);
    }
    if (has_slot_) {
        registry_.end_attempt();
    }
}

bool PortReservation::acquire_slot(uint32_t limit, const PortRegistry::UsageCount& count_used) {
    if (has_slot_) {
        return true;
    }
    has_slot_ = registry_.begin_attempt(limit, count_used) == SlotStatus::ACQUIRED;
    return has_slot_;
}

bool PortReservation::claim(uint16_t port, const PortRegistry::HolderCheck& is_held) {
    if (port_) {
        registry_.release_port(*port_);
        port_.reset();
    }
    if (!registry_.reserve_port(port, is_held)) {
        return false;
    }
    port_ = port;
    return true;
}

} // namespace wpman
