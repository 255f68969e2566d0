/**
 * @file profile_store.hpp
 * @brief Thread-safe profile collection
 *
 * WPMan - WireProxy Profile Manager
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Single ownership point for profile records:
 * - Lookups by name, index and port
 * - Name uniqueness on add and rename
 * - Running state recomputed from pid liveness on demand
 * - Insertion order preserved (rows of the presentation layer)
 */

#pragma once

#include "wpman/profile.hpp"

#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace wpman {

/**
 * @brief Outcome of a mutating store operation
 */
enum class StoreError {
    NONE,
    INVALID_NAME,       ///< Name fails validation
    DUPLICATE_NAME,     ///< Another profile already uses the name
    NOT_FOUND,          ///< No profile with that name
    RELOCATION_FAILED,  ///< Backing artifact could not be moved
    PROFILE_RUNNING,    ///< Operation requires a stopped profile
    IO_FAILED           ///< Backing artifact could not be written or removed
};

/**
 * @brief Convert store error to a short description
 */
std::string store_error_to_string(StoreError error);

/**
 * @brief ProfileStore - authoritative in-memory profile collection
 *
 * Every accessor takes the internal lock and returns copies, so callers
 * never hold references into the collection. The store never pushes
 * updates: callers refresh() before making allocation decisions.
 */
class ProfileStore {
public:
    /// Liveness check used to recompute running flags
    using LivenessCheck = std::function<bool(ProcessId)>;

    /// Moves the backing artifact for a rename; returns the new config path
    using Relocator = std::function<std::optional<std::filesystem::path>(const Profile& profile, const std::string& new_name)>;

    /**
     * @brief Construct store
     * @param is_alive Liveness check for pids
     */
    explicit ProfileStore(LivenessCheck is_alive);

    ProfileStore(const ProfileStore&) = delete;
    ProfileStore& operator=(const ProfileStore&) = delete;

    // ========================================================================
    // Bulk Access
    // ========================================================================

    /**
     * @brief Replace the collection (state load)
     *
     * Later duplicates of a name are dropped with a warning.
     */
    void load(std::vector<Profile> profiles);

    /**
     * @brief Copy of every profile in insertion order
     */
    std::vector<Profile> snapshot() const;

    /**
     * @brief Copy of every profile with running recomputed from pid
     *
     * Dead profiles appear stopped in the copy only; the collection keeps
     * them until refresh() reports the death.
     */
    std::vector<Profile> refreshed_snapshot() const;

    /**
     * @brief Recompute running from pid for every profile
     *
     * Profiles whose process has died are moved to the stopped state
     * (pid and proxy_port cleared, last_port kept).
     *
     * @return Names of profiles found dead
     */
    std::vector<std::string> refresh();

    size_t size() const;
    std::set<std::string> names() const;

    // ========================================================================
    // Lookups
    // ========================================================================

    std::optional<Profile> at(size_t index) const;
    std::optional<Profile> find_by_name(const std::string& name) const;
    std::optional<size_t> index_of(const std::string& name) const;
    bool contains(const std::string& name) const;

    /**
     * @brief Running profile bound to port
     *
     * Liveness of matching profiles is re-checked before answering.
     * Does not modify the collection.
     */
    std::optional<Profile> find_by_port(uint16_t port) const;

    // ========================================================================
    // Mutation
    // ========================================================================

    /**
     * @brief Append a profile
     * @return DUPLICATE_NAME instead of overwriting an existing profile
     */
    StoreError add(Profile profile);

    /**
     * @brief Remove a profile
     * @return Removed record, or std::nullopt if unknown
     */
    std::optional<Profile> remove(const std::string& name);

    /**
     * @brief Rename a profile and relocate its artifact
     *
     * Validates the new name and its uniqueness, then calls relocate while
     * holding the lock so no concurrent add can claim the name.
     */
    StoreError rename(const std::string& old_name, const std::string& new_name, const Relocator& relocate);

    /**
     * @brief Record a successful launch
     * @return false if the profile no longer exists
     */
    bool mark_started(const std::string& name, ProcessId pid, uint16_t port);

    /**
     * @brief Record a stop; proxy_port moves to last_port
     * @return false if the profile no longer exists
     */
    bool mark_stopped(const std::string& name);

    /**
     * @brief Set or clear the memoized endpoint host
     */
    bool set_host_cache(const std::string& name, std::optional<std::string> host);

private:
    /// Recompute one record; returns true if it was running and has died
    bool refresh_locked(Profile& profile) const;

    Profile* find_locked(const std::string& name);
    const Profile* find_locked(const std::string& name) const;

    static void clear_runtime(Profile& profile);

    LivenessCheck is_alive_;
    std::vector<Profile> profiles_;
    mutable std::mutex mutex_;
};

} // namespace wpman
