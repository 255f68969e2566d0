/**
 * @file process_backend_win32.cpp
 * @brief Windows process backend (CreateProcess, exit codes, Toolhelp tree)
 *
 * WPMan - WireProxy Profile Manager
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "wpman/process_backend.hpp"
#include "wpman/manager_config.hpp"
#include "wpman/utilities.hpp"

#include <map>
#include <mutex>
#include <thread>

#ifndef WIN32_LEAN_AND_MEAN
    #define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#include <tlhelp32.h>

namespace wpman {

using namespace wpman::utilities;

namespace {

constexpr auto POLL_INTERVAL = std::chrono::milliseconds(20);

std::string last_error_message() {
    DWORD code = ::GetLastError();
    char* buffer = nullptr;
    DWORD length = ::FormatMessageA(
        FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
        nullptr, code, 0, reinterpret_cast<LPSTR>(&buffer), 0, nullptr);
    std::string message = length ? trim_string(std::string(buffer, length)) : "error " + std::to_string(code);
    if (buffer) {
        ::LocalFree(buffer);
    }
    return message;
}

std::string quote_argument(const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\"") == std::string::npos) {
        return arg;
    }
    std::string quoted = "\"";
    size_t backslashes = 0;
    for (char c : arg) {
        if (c == '\\') {
            ++backslashes;
        } else if (c == '"') {
            quoted.append(backslashes * 2 + 1, '\\');
            quoted += c;
            backslashes = 0;
        } else {
            quoted.append(backslashes, '\\');
            quoted += c;
            backslashes = 0;
        }
    }
    quoted.append(backslashes * 2, '\\');
    quoted += '"';
    return quoted;
}

/**
 * @brief Win32ProcessBackend - CreateProcess with handles kept for exit codes
 */
class Win32ProcessBackend : public ProcessBackend {
public:
    ~Win32ProcessBackend() override;

    SpawnResult spawn(const SpawnRequest& request) override;
    bool is_alive(ProcessId pid) override;
    std::optional<int> exit_code(ProcessId pid) override;
    TerminateResult terminate_tree(ProcessId pid, std::chrono::milliseconds grace) override;

private:
    std::map<DWORD, HANDLE> children_;
    std::mutex mutex_;
};

Win32ProcessBackend::~Win32ProcessBackend() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [pid, handle] : children_) {
        ::CloseHandle(handle);
    }
    children_.clear();
}

SpawnResult Win32ProcessBackend::spawn(const SpawnRequest& request) {
    SpawnResult result;

    std::string command_line = quote_argument(request.executable.string());
    for (const auto& arg : request.arguments) {
        command_line += " " + quote_argument(arg);
    }

    SECURITY_ATTRIBUTES inherit{};
    inherit.nLength = sizeof(inherit);
    inherit.bInheritHandle = TRUE;

    std::string output = request.output_log ? request.output_log->string() : std::string("NUL");
    HANDLE output_handle = ::CreateFileA(output.c_str(), FILE_APPEND_DATA,
        FILE_SHARE_READ | FILE_SHARE_WRITE, &inherit, OPEN_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (output_handle == INVALID_HANDLE_VALUE) {
        result.error = "cannot open " + output + ": " + last_error_message();
        return result;
    }

    STARTUPINFOA startup{};
    startup.cb = sizeof(startup);
    startup.dwFlags = STARTF_USESTDHANDLES;
    startup.hStdInput = nullptr;
    startup.hStdOutput = output_handle;
    startup.hStdError = output_handle;

    PROCESS_INFORMATION info{};
    std::vector<char> mutable_command(command_line.begin(), command_line.end());
    mutable_command.push_back('\0');

    BOOL created = ::CreateProcessA(nullptr, mutable_command.data(), nullptr, nullptr, TRUE,
        CREATE_NO_WINDOW | CREATE_NEW_PROCESS_GROUP, nullptr, nullptr, &startup, &info);
    ::CloseHandle(output_handle);

    if (!created) {
        result.error = "CreateProcess failed: " + last_error_message();
        return result;
    }

    ::CloseHandle(info.hThread);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = children_.find(info.dwProcessId);
        if (it != children_.end()) {
            ::CloseHandle(it->second);
        }
        children_[info.dwProcessId] = info.hProcess;

        // Forget exited children once the table outgrows the cap
        if (children_.size() > config::MAX_REMEMBERED_EXIT_CODES) {
            for (auto child = children_.begin(); child != children_.end();) {
                DWORD code = 0;
                if (child->first != info.dwProcessId && ::GetExitCodeProcess(child->second, &code) &&
                    code != STILL_ACTIVE) {
                    ::CloseHandle(child->second);
                    child = children_.erase(child);
                } else {
                    ++child;
                }
            }
        }
    }

    result.pid = static_cast<ProcessId>(info.dwProcessId);
    return result;
}

bool Win32ProcessBackend::is_alive(ProcessId id) {
    if (id <= 0) {
        return false;
    }

    HANDLE handle = ::OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, static_cast<DWORD>(id));
    if (!handle) {
        return false;
    }

    DWORD code = 0;
    bool alive = ::GetExitCodeProcess(handle, &code) && code == STILL_ACTIVE;
    ::CloseHandle(handle);
    return alive;
}

std::optional<int> Win32ProcessBackend::exit_code(ProcessId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = children_.find(static_cast<DWORD>(id));
    if (it == children_.end()) {
        return std::nullopt;
    }

    DWORD code = 0;
    if (!::GetExitCodeProcess(it->second, &code) || code == STILL_ACTIVE) {
        return std::nullopt;
    }
    return static_cast<int>(code);
}

TerminateResult Win32ProcessBackend::terminate_tree(ProcessId id, std::chrono::milliseconds grace) {
    if (!is_alive(id)) {
        return TerminateResult::ALREADY_EXITED;
    }
    DWORD root = static_cast<DWORD>(id);

    // Collect descendants breadth-first from one snapshot
    std::vector<DWORD> tree{root};
    HANDLE snapshot = ::CreateToolhelp32Snapshot(TH32CS_SNAPPROCESS, 0);
    if (snapshot != INVALID_HANDLE_VALUE) {
        std::multimap<DWORD, DWORD> children_of;
        PROCESSENTRY32 entry{};
        entry.dwSize = sizeof(entry);
        if (::Process32First(snapshot, &entry)) {
            do {
                children_of.emplace(entry.th32ParentProcessID, entry.th32ProcessID);
            } while (::Process32Next(snapshot, &entry));
        }
        ::CloseHandle(snapshot);

        for (size_t i = 0; i < tree.size(); ++i) {
            auto range = children_of.equal_range(tree[i]);
            for (auto it = range.first; it != range.second; ++it) {
                if (it->second != root) {
                    tree.push_back(it->second);
                }
            }
        }
    } else {
        log_warn("ProcessBackend: Process snapshot unavailable, terminating pid " +
                 std::to_string(root) + " alone");
    }

    // Leaves first so parents cannot respawn them
    bool failed = false;
    for (auto it = tree.rbegin(); it != tree.rend(); ++it) {
        HANDLE handle = ::OpenProcess(PROCESS_TERMINATE, FALSE, *it);
        if (!handle) {
            continue;
        }
        if (!::TerminateProcess(handle, 1) && *it == root) {
            log_error("ProcessBackend: TerminateProcess(" + std::to_string(root) + ") failed: " +
                      last_error_message());
            failed = true;
        }
        ::CloseHandle(handle);
    }

    auto deadline = std::chrono::steady_clock::now() + grace;
    while (is_alive(id)) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return TerminateResult::FAILED;
        }
        std::this_thread::sleep_for(POLL_INTERVAL);
    }
    return failed ? TerminateResult::FAILED : TerminateResult::TERMINATED;
}

} // namespace

std::unique_ptr<ProcessBackend> create_platform_process_backend() {
    return std::make_unique<Win32ProcessBackend>();
}

} // namespace wpman
