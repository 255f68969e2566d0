/**
 * @file process_backend.hpp
 * @brief Platform process primitives behind a single interface
 *
 * WPMan - WireProxy Profile Manager
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * The implementation is chosen at build time:
 * - process_backend_posix.cpp: fork/exec into a new process group,
 *   signal-zero liveness, SIGTERM/SIGKILL of the group
 * - process_backend_win32.cpp: CreateProcess, exit-code liveness,
 *   Toolhelp descendant walk + TerminateProcess
 */

#pragma once

#include "wpman/profile.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace wpman {

/**
 * @brief Parameters of a process launch
 */
struct SpawnRequest {
    std::filesystem::path executable;                   ///< Program to run
    std::vector<std::string> arguments;                 ///< argv[1..]
    std::optional<std::filesystem::path> output_log;    ///< Append stdout/stderr here, discard if empty
};

/**
 * @brief Outcome of a spawn attempt
 */
struct SpawnResult {
    std::optional<ProcessId> pid;   ///< Set when the process was created
    std::string error;              ///< OS error description otherwise
};

/**
 * @brief Outcome of a termination request
 */
enum class TerminateResult {
    TERMINATED,         ///< Process (tree) was running and is gone now
    ALREADY_EXITED,     ///< Nothing was running under that id
    FAILED              ///< OS refused or the process survived
};

/**
 * @brief ProcessBackend - OS process operations used by the supervisor
 *
 * Implementations must be safe to call from several threads at once.
 */
class ProcessBackend {
public:
    virtual ~ProcessBackend() = default;

    /**
     * @brief Start a process detached from the caller's console
     * @param request Executable, arguments and output destination
     * @return Spawn result with pid or error text
     */
    virtual SpawnResult spawn(const SpawnRequest& request) = 0;

    /**
     * @brief Non-destructive liveness probe
     * @param pid Process id
     * @return true while the process exists and has not exited
     */
    virtual bool is_alive(ProcessId pid) = 0;

    /**
     * @brief Exit code of a process started by this backend
     * @param pid Process id
     * @return Exit code once the process has exited, std::nullopt while it
     *         runs or when the code is unknown (not our child)
     */
    virtual std::optional<int> exit_code(ProcessId pid) = 0;

    /**
     * @brief Terminate a process together with its descendants
     * @param pid Process id (group leader on POSIX)
     * @param grace Time allowed for a graceful exit before force killing
     */
    virtual TerminateResult terminate_tree(ProcessId pid, std::chrono::milliseconds grace) = 0;
};

/**
 * @brief Create the backend for the platform this library was built for
 */
std::unique_ptr<ProcessBackend> create_platform_process_backend();

} // namespace wpman
