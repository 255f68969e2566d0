/**
 * @file port_registry.hpp
 * @brief Proxy port space decisions
 *
 * WPMan - WireProxy Profile Manager
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Decides which local ports a profile may bind:
 * - Allowed range derived from the active connection limit
 * - Ports in use, recomputed from live processes on every call
 * - Host probe for ports held by unmanaged processes
 * - Free port search and last-port preference
 * - In-flight launch attempts and port reservations shared by every
 *   connection path
 */

#pragma once

#include "wpman/manager_config.hpp"
#include "wpman/process_backend.hpp"
#include "wpman/profile.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

namespace wpman {

/**
 * @brief Inclusive port interval
 */
struct PortRange {
    uint16_t low;
    uint16_t high;

    size_t size() const {
        return static_cast<size_t>(high) - static_cast<size_t>(low) + 1;
    }

    bool contains(uint32_t port) const {
        return port >= low && port <= high;
    }
};

/**
 * @brief PortProbe - point-in-time check whether something listens on a port
 */
class PortProbe {
public:
    virtual ~PortProbe() = default;

    /**
     * @brief Probe 127.0.0.1:port
     * @return false if a connection was accepted (busy), true otherwise
     */
    virtual bool is_port_free(uint16_t port) = 0;
};

/**
 * @brief TcpPortProbe - TCP connect with a bounded timeout (Asio)
 */
class TcpPortProbe : public PortProbe {
public:
    explicit TcpPortProbe(std::chrono::milliseconds timeout = config::PORT_PROBE_TIMEOUT);

    bool is_port_free(uint16_t port) override;

private:
    std::chrono::milliseconds timeout_;
};

/**
 * @brief Answer of PortRegistry::begin_attempt()
 */
enum class SlotStatus {
    ACQUIRED,       ///< Attempt registered; end_attempt() when settled
    PENDING,        ///< Limit reached, but other attempts may still fail
    LIMIT_REACHED   ///< Limit reached with nothing in flight
};

/**
 * @brief PortRegistry - allocation decisions over the proxy port space
 *
 * Ports in use are derived from the profile snapshot it is given plus
 * fresh liveness and host probes. The only state it keeps is the set of
 * launches in flight: an attempt counts against the connection limit and
 * its port stays reserved until the launch has been recorded or has
 * failed. Thread-safe as long as the probe and backend are.
 */
class PortRegistry {
public:
    /// Number of ports held by running managed profiles
    using UsageCount = std::function<size_t()>;

    /// True if a running managed profile holds the port
    using HolderCheck = std::function<bool(uint16_t port)>;

    /**
     * @brief Construct registry
     * @param processes Backend used for pid liveness checks
     * @param probe Host port probe
     * @param base_start First port of the base range (default: 60000)
     * @param base_end Last port of the base range (default: 65535)
     */
    PortRegistry(
        ProcessBackend& processes,
        PortProbe& probe,
        uint16_t base_start = config::PORT_RANGE_START,
        uint16_t base_end = config::PORT_RANGE_END
    );

    PortRegistry(const PortRegistry&) = delete;
    PortRegistry& operator=(const PortRegistry&) = delete;

    /**
     * @brief Base port range before any limit is applied
     */
    PortRange base_range() const;

    /**
     * @brief Allowed ports for a connection limit
     * @param limit Active connection limit (0 = unlimited)
     * @return First min(limit, base size) ports of the base range, or all of it
     */
    PortRange allowed_range(uint32_t limit) const;

    /**
     * @brief Check an explicitly requested port against the allowed range
     *
     * Out-of-range ports are rejected, never clamped.
     */
    bool validate_requested_port(uint32_t port, uint32_t limit) const;

    /**
     * @brief Ports held by profiles whose process is alive right now
     * @param profiles Profile snapshot
     */
    std::set<uint16_t> ports_in_use(const std::vector<Profile>& profiles) const;

    /**
     * @brief Probe the host for a listener on port
     * @return true if nothing accepted a connection
     */
    bool is_port_free_on_host(uint16_t port) const;

    /**
     * @brief Lowest allowed port not in use and free on host
     * @param profiles Profile snapshot
     * @param limit Active connection limit (0 = unlimited)
     * @param excluded Ports to skip without probing (in-flight reservations)
     * @return Port, or std::nullopt when the limit is reached or nothing is free
     */
    std::optional<uint16_t> find_free_port(
        const std::vector<Profile>& profiles,
        uint32_t limit,
        const std::set<uint16_t>& excluded = {}
    ) const;

    /**
     * @brief Port for (re)connecting a profile
     *
     * The profile's preferred port wins when it is allowed, unused and free
     * on host; otherwise find_free_port() decides.
     */
    std::optional<uint16_t> pick_port_for_profile(
        const Profile& profile,
        const std::vector<Profile>& profiles,
        uint32_t limit,
        const std::set<uint16_t>& excluded = {}
    ) const;

    // ========================================================================
    // In-flight Launches
    // ========================================================================

    /**
     * @brief Register a launch attempt under the connection limit
     *
     * count_used is evaluated under the reservation lock, so a launch that
     * settles concurrently is counted either as in use or as in flight.
     *
     * @param limit Active connection limit (0 = unlimited)
     * @param count_used Ports held by running managed profiles
     */
    SlotStatus begin_attempt(uint32_t limit, const UsageCount& count_used);

    /**
     * @brief Settle an attempt; call after the launch is recorded or failed
     */
    void end_attempt();

    size_t attempts_in_flight() const;

    /**
     * @brief Claim a port for an in-flight launch
     * @param port Port to claim
     * @param is_held Checked under the reservation lock
     * @return false if already reserved or held by a running profile
     */
    bool reserve_port(uint16_t port, const HolderCheck& is_held);

    void release_port(uint16_t port);

    bool is_reserved(uint16_t port) const;
    std::set<uint16_t> reserved_ports() const;

private:
    ProcessBackend& processes_;
    PortProbe& probe_;
    PortRange base_;

    size_t attempts_;
    std::set<uint16_t> reserved_;
    mutable std::mutex reservation_mutex_;
};

/**
 * @brief PortReservation - scoped launch attempt of a single connect
 *
 * Releases its port and its attempt slot on destruction.
 */
class PortReservation {
public:
    explicit PortReservation(PortRegistry& registry);
    ~PortReservation();

    // Disable copy and move
    PortReservation(const PortReservation&) = delete;
    PortReservation& operator=(const PortReservation&) = delete;
    PortReservation(PortReservation&&) = delete;
    PortReservation& operator=(PortReservation&&) = delete;

    /**
     * @brief Take an attempt slot
     * @return false if the connection limit is reached
     */
    bool acquire_slot(uint32_t limit, const PortRegistry::UsageCount& count_used);

    /**
     * @brief Reserve port for this attempt
     * @return false if another attempt or a running profile has it
     */
    bool claim(uint16_t port, const PortRegistry::HolderCheck& is_held);

    std::optional<uint16_t> port() const { return port_; }

private:
    PortRegistry& registry_;
    bool has_slot_;
    std::optional<uint16_t> port_;
};

} // namespace wpman
