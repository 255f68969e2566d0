/**
 * @file events.hpp
 * @brief Typed manager events and their dispatch to observers
 *
 * WPMan - WireProxy Profile Manager
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Presentation layers subscribe a ManagerObserver instead of polling.
 * Events may be delivered from auto-connect worker threads.
 */

#pragma once

#include "wpman/profile.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace wpman {

/**
 * @brief Why a profile stopped
 */
enum class StopReason {
    REQUESTED,      ///< disconnect, delete, override or shutdown
    DIED            ///< process found dead by a liveness refresh
};

/**
 * @brief One finished auto-connect attempt
 */
struct AutoConnectProgress {
    size_t completed = 0;               ///< Attempts finished so far, this one included
    size_t total = 0;                   ///< Profiles queued for the run
    std::string profile_name;
    bool success = false;
    std::optional<uint16_t> port;       ///< Bound port on success
    std::string message;                ///< Failure detail
};

/**
 * @brief Result of an auto-connect run
 */
struct AutoConnectSummary {
    size_t total = 0;
    size_t started = 0;
    size_t failed = 0;
    bool cancelled = false;
};

/**
 * @brief ManagerObserver - receives manager events
 *
 * Every handler defaults to a no-op. Handlers must not call back into the
 * manager operation that raised them on the same thread.
 */
class ManagerObserver {
public:
    virtual ~ManagerObserver() = default;

    virtual void on_profile_added(const Profile& /*profile*/) {}
    virtual void on_profile_removed(const std::string& /*name*/) {}
    virtual void on_profile_renamed(const std::string& /*old_name*/, const std::string& /*new_name*/) {}
    virtual void on_profile_started(const Profile& /*profile*/) {}
    virtual void on_profile_stopped(const std::string& /*name*/, StopReason /*reason*/) {}
    virtual void on_auto_connect_progress(const AutoConnectProgress& /*progress*/) {}
    virtual void on_auto_connect_finished(const AutoConnectSummary& /*summary*/) {}
};

/**
 * @brief EventDispatcher - fans events out to registered observers
 *
 * Thread-safe. Observers are invoked outside the registration lock, and an
 * exception thrown by one observer is logged without affecting the others.
 */
class EventDispatcher {
public:
    EventDispatcher() = default;

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    void add_observer(std::shared_ptr<ManagerObserver> observer);
    void remove_observer(const std::shared_ptr<ManagerObserver>& observer);
    size_t observer_count() const;

    void profile_added(const Profile& profile) const;
    void profile_removed(const std::string& name) const;
    void profile_renamed(const std::string& old_name, const std::string& new_name) const;
    void profile_started(const Profile& profile) const;
    void profile_stopped(const std::string& name, StopReason reason) const;
    void auto_connect_progress(const AutoConnectProgress& progress) const;
    void auto_connect_finished(const AutoConnectSummary& summary) const;

private:
    template <typename Handler>
    void dispatch(const char* event_name, Handler&& handler) const;

    std::vector<std::shared_ptr<ManagerObserver>> observers_;
    mutable std::mutex callback_mutex_;
};

} // namespace wpman
