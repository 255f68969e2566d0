/**
 * @file events.cpp
 * @brief Implementation of manager event dispatch
 *
 * WPMan - WireProxy Profile Manager
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "wpman/events.hpp"
#include "wpman/utilities.hpp"

#include <algorithm>

namespace wpman {

using namespace wpman::utilities;

void EventDispatcher::add_observer(std::shared_ptr<ManagerObserver> observer) {
    if (!observer) {
        return;
    }
    std::lock_guard<std::mutex> lock(callback_mutex_);
    observers_.push_back(std::move(observer));
}

void EventDispatcher::remove_observer(const std::shared_ptr<ManagerObserver>& observer) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    observers_.erase(std::remove(observers_.begin(), observers_.end(), observer), observers_.end());
}

size_t EventDispatcher::observer_count() const {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    return observers_.size();
}

template <typename Handler>
void EventDispatcher::dispatch(const char* event_name, Handler&& handler) const {
    std::vector<std::shared_ptr<ManagerObserver>> observers;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        observers = observers_;
    }

    for (const auto& observer : observers) {
        try {
            handler(*observer);
        } catch (const std::exception& e) {
            log_error(std::string("EventDispatcher: Observer failed in ") + event_name + ": " + e.what());
        }
    }
}

void EventDispatcher::profile_added(const Profile& profile) const {
    dispatch("on_profile_added", [&](ManagerObserver& o) { o.on_profile_added(profile); });
}

void EventDispatcher::profile_removed(const std::string& name) const {
    dispatch("on_profile_removed", [&](ManagerObserver& o) { o.on_profile_removed(name); });
}

void EventDispatcher::profile_renamed(const std::string& old_name, const std::string& new_name) const {
    dispatch("on_profile_renamed", [&](ManagerObserver& o) { o.on_profile_renamed(old_name, new_name); });
}

void EventDispatcher::profile_started(const Profile& profile) const {
    dispatch("on_profile_started", [&](ManagerObserver& o) { o.on_profile_started(profile); });
}

void EventDispatcher::profile_stopped(const std::string& name, StopReason reason) const {
    dispatch("on_profile_stopped", [&](ManagerObserver& o) { o.on_profile_stopped(name, reason); });
}

void EventDispatcher::auto_connect_progress(const AutoConnectProgress& progress) const {
    dispatch("on_auto_connect_progress", [&](ManagerObserver& o) { o.on_auto_connect_progress(progress); });
}

void EventDispatcher::auto_connect_finished(const AutoConnectSummary& summary) const {
    dispatch("on_auto_connect_finished", [&](ManagerObserver& o) { o.on_auto_connect_finished(summary); });
}

} // namespace wpman
