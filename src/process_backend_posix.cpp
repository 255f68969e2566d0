/**
 * @file process_backend_posix.cpp
 * @brief POSIX process backend (fork/exec, process groups, signals)
 *
 * WPMan - WireProxy Profile Manager
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "wpman/process_backend.hpp"
#include "wpman/manager_config.hpp"
#include "wpman/utilities.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <deque>
#include <map>
#include <mutex>
#include <set>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace wpman {

using namespace wpman::utilities;

namespace {

constexpr auto POLL_INTERVAL = std::chrono::milliseconds(20);
constexpr auto KILL_SETTLE_TIMEOUT = std::chrono::milliseconds(1000);

int decode_wait_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

void close_quietly(int fd) {
    if (fd >= 0) {
        ::close(fd);
    }
}

bool set_cloexec(int fd) {
    int flags = ::fcntl(fd, F_GETFD);
    return flags != -1 && ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC) != -1;
}

/**
 * @brief PosixProcessBackend - fork/exec with one process group per child
 *
 * Every child becomes the leader of a new process group so that the whole
 * tree it spawns can be signalled with kill(-pgid). Children are reaped
 * lazily from is_alive()/exit_code(); the exit codes of the most recent
 * MAX_REMEMBERED_EXIT_CODES are remembered.
 */
class PosixProcessBackend : public ProcessBackend {
public:
    SpawnResult spawn(const SpawnRequest& request) override;
    bool is_alive(ProcessId pid) override;
    std::optional<int> exit_code(ProcessId pid) override;
    TerminateResult terminate_tree(ProcessId pid, std::chrono::milliseconds grace) override;

private:
    /// Reap pid if it is our child; returns true when it has exited
    bool reap_locked(pid_t pid);

    /// Record an exit code, forgetting the oldest beyond the cap
    void remember_exit_locked(pid_t pid, int code);

    /// Wait until pid is gone or timeout expires
    bool wait_for_exit(pid_t pid, std::chrono::milliseconds timeout);

    std::set<pid_t> children_;
    std::map<pid_t, int> exit_codes_;
    std::deque<pid_t> reaped_order_;
    std::mutex mutex_;
};

SpawnResult PosixProcessBackend::spawn(const SpawnRequest& request) {
    SpawnResult result;

    // Everything the child needs is prepared before fork()
    std::string executable = request.executable.string();
    std::vector<std::string> args;
    args.reserve(request.arguments.size() + 1);
    args.push_back(executable);
    args.insert(args.end(), request.arguments.begin(), request.arguments.end());

    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::string output = request.output_log ? request.output_log->string() : std::string("/dev/null");
    int output_fd = ::open(output.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
    if (output_fd < 0) {
        result.error = "cannot open " + output + ": " + std::strerror(errno);
        return result;
    }
    set_cloexec(output_fd);

    int input_fd = ::open("/dev/null", O_RDONLY);
    if (input_fd < 0) {
        result.error = std::string("cannot open /dev/null: ") + std::strerror(errno);
        close_quietly(output_fd);
        return result;
    }
    set_cloexec(input_fd);

    // exec() failures are reported back through a close-on-exec pipe
    int error_pipe[2];
    if (::pipe(error_pipe) != 0) {
        result.error = std::string("pipe failed: ") + std::strerror(errno);
        close_quietly(output_fd);
        close_quietly(input_fd);
        return result;
    }
    set_cloexec(error_pipe[0]);
    set_cloexec(error_pipe[1]);

    pid_t pid = ::fork();
    if (pid < 0) {
        result.error = std::string("fork failed: ") + std::strerror(errno);
        close_quietly(output_fd);
        close_quietly(input_fd);
        close_quietly(error_pipe[0]);
        close_quietly(error_pipe[1]);
        return result;
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        ::setpgid(0, 0);
        ::dup2(input_fd, STDIN_FILENO);
        ::dup2(output_fd, STDOUT_FILENO);
        ::dup2(output_fd, STDERR_FILENO);
        ::execv(argv[0], argv.data());

        int exec_errno = errno;
        ssize_t ignored = ::write(error_pipe[1], &exec_errno, sizeof(exec_errno));
        (void)ignored;
        ::_exit(127);
    }

    // Parent: also set the group to close the race with the child's setpgid
    ::setpgid(pid, pid);
    close_quietly(output_fd);
    close_quietly(input_fd);
    close_quietly(error_pipe[1]);

    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(error_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_quietly(error_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        result.error = "exec " + executable + " failed: " + std::strerror(exec_errno);
        return result;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        children_.insert(pid);
        exit_codes_.erase(pid);
        reaped_order_.erase(std::remove(reaped_order_.begin(), reaped_order_.end(), pid), reaped_order_.end());
    }

    result.pid = static_cast<ProcessId>(pid);
    return result;
}

bool PosixProcessBackend::reap_locked(pid_t pid) {
    if (exit_codes_.count(pid) > 0) {
        return true;
    }
    if (children_.count(pid) == 0) {
        return false;
    }

    int status = 0;
    pid_t r = ::waitpid(pid, &status, WNOHANG);
    if (r == pid) {
        children_.erase(pid);
        remember_exit_locked(pid, decode_wait_status(status));
        return true;
    }
    if (r < 0 && errno == ECHILD) {
        // Reaped elsewhere; exit code is lost
        children_.erase(pid);
        remember_exit_locked(pid, -1);
        return true;
    }
    return false;
}

void PosixProcessBackend::remember_exit_locked(pid_t pid, int code) {
    exit_codes_[pid] = code;
    reaped_order_.push_back(pid);

    while (reaped_order_.size() > config::MAX_REMEMBERED_EXIT_CODES) {
        exit_codes_.erase(reaped_order_.front());
        reaped_order_.pop_front();
    }
}

bool PosixProcessBackend::is_alive(ProcessId id) {
    if (id <= 0) {
        return false;
    }
    pid_t pid = static_cast<pid_t>(id);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (children_.count(pid) > 0 || exit_codes_.count(pid) > 0) {
            return !reap_locked(pid);
        }
    }

    // Not started by this process: signal 0 only checks existence
    if (::kill(pid, 0) == 0) {
        return true;
    }
    return errno == EPERM;
}

std::optional<int> PosixProcessBackend::exit_code(ProcessId id) {
    if (id <= 0) {
        return std::nullopt;
    }
    pid_t pid = static_cast<pid_t>(id);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!reap_locked(pid)) {
        return std::nullopt;
    }
    int code = exit_codes_[pid];
    if (code < 0) {
        return std::nullopt;
    }
    return code;
}

bool PosixProcessBackend::wait_for_exit(pid_t pid, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (is_alive(pid)) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(POLL_INTERVAL);
    }
    return true;
}

TerminateResult PosixProcessBackend::terminate_tree(ProcessId id, std::chrono::milliseconds grace) {
    if (!is_alive(id)) {
        return TerminateResult::ALREADY_EXITED;
    }
    pid_t pid = static_cast<pid_t>(id);

    // Whole group first; a pid that does not lead a group falls back to a single kill
    bool group = ::kill(-pid, SIGTERM) == 0;
    if (!group) {
        if (errno == EPERM) {
            log_error("ProcessBackend: Not permitted to signal process group " + std::to_string(pid));
            return TerminateResult::FAILED;
        }
        log_debug("ProcessBackend: pid " + std::to_string(pid) + " leads no process group, killing it alone");
        if (::kill(pid, SIGKILL) != 0) {
            if (errno == ESRCH) {
                return TerminateResult::ALREADY_EXITED;
            }
            log_error("ProcessBackend: kill(" + std::to_string(pid) + ") failed: " + std::strerror(errno));
            return TerminateResult::FAILED;
        }
        return wait_for_exit(pid, KILL_SETTLE_TIMEOUT) ? TerminateResult::TERMINATED
                                                        : TerminateResult::FAILED;
    }

    bool exited = wait_for_exit(pid, grace);

    // Sweep descendants that ignored SIGTERM or outlived the leader
    if (::kill(-pid, SIGKILL) != 0 && errno != ESRCH) {
        log_warn("ProcessBackend: SIGKILL to group " + std::to_string(pid) + " failed: " + std::strerror(errno));
    }

    if (!exited) {
        log_warn("ProcessBackend: pid " + std::to_string(pid) + " ignored SIGTERM, force killed");
        exited = wait_for_exit(pid, KILL_SETTLE_TIMEOUT);
    }

    return exited ? TerminateResult::TERMINATED : TerminateResult::FAILED;
}

} // namespace

std::unique_ptr<ProcessBackend> create_platform_process_backend() {
    return std::make_unique<PosixProcessBackend>();
}

} // namespace wpman
