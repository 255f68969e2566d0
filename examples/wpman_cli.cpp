/**
 * @file wpman_cli.cpp
 * @brief Interactive command line front end for ProxyManager
 *
 * WPMan - WireProxy Profile Manager
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Demonstrates ProxyManager usage:
 * - Import and edit WireGuard profiles
 * - Connect, disconnect and toggle profiles
 * - Bulk auto-connect with progress output
 * - Settings and session history
 */

#include "wpman/proxy_manager.hpp"
#include "wpman/utilities.hpp"

#include <atomic>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#ifndef _WIN32
#include <signal.h>
#endif

using namespace wpman;
using namespace wpman::utilities;

static std::atomic<bool> g_shutdown(false);

// Signal handler for graceful shutdown
void signal_handler(int signal) {
    (void)signal;
    g_shutdown = true;
}

// Prints manager events as they arrive
class ConsoleObserver : public ManagerObserver {
public:
    void on_profile_stopped(const std::string& name, StopReason reason) override {
        if (reason == StopReason::DIED) {
            std::cout << "\n>>> WireProxy for '" << name << "' exited\n";
        }
    }

    void on_auto_connect_progress(const AutoConnectProgress& progress) override {
        std::cout << "\n>>> [" << progress.completed << "/" << progress.total << "] " << progress.profile_name;
        if (progress.success && progress.port) {
            std::cout << " connected on port " << *progress.port << "\n";
        } else {
            std::cout << " failed: " << progress.message << "\n";
        }
        std::cout.flush();
    }

    void on_auto_connect_finished(const AutoConnectSummary& summary) override {
        std::cout << "\n>>> Auto-connect " << (summary.cancelled ? "cancelled" : "finished") << ": "
                  << summary.started << " started, " << summary.failed << " failed of "
                  << summary.total << "\n> ";
        std::cout.flush();
    }
};

// Print usage information
void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [data_dir]\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  data_dir    Data directory (optional, default: $WPMAN_DATA_DIR or ~/.local/share/wpman)\n\n";
}

// Print help menu
void print_help() {
    std::cout << "\nCommands:\n";
    std::cout << "  help                               Show this help menu\n";
    std::cout << "  list                               List profiles\n";
    std::cout << "  import <file.conf>                 Import a configuration file\n";
    std::cout << "  paste <name> <file>                Import configuration text from a file\n";
    std::cout << "  scan                               Adopt .conf files dropped into profiles/\n";
    std::cout << "  connect <name> [port] [--force]    Connect a profile\n";
    std::cout << "  disconnect <name>                  Disconnect a profile\n";
    std::cout << "  toggle <name>                      Connect or disconnect a profile\n";
    std::cout << "  delete <name>                      Delete a profile\n";
    std::cout << "  rename <old> <new>                 Rename a stopped profile\n";
    std::cout << "  show <name>                        Print a profile's configuration\n";
    std::cout << "  host <name>                        Print a profile's endpoint host\n";
    std::cout << "  auto [rows...]                     Auto-connect all or selected rows\n";
    std::cout << "  auto-from <row> [start_port]       Auto-connect from a row onwards\n";
    std::cout << "  cancel                             Cancel auto-connect\n";
    std::cout << "  settings                           Show settings\n";
    std::cout << "  limit <n>                          Set connection limit (0 = unlimited)\n";
    std::cout << "  type <socks5|http>                 Set proxy type\n";
    std::cout << "  exe <path>                         Set wireproxy executable\n";
    std::cout << "  logging <on|off>                   Capture wireproxy output\n";
    std::cout << "  loglevel <level>                   Set log level (debug, info, warn, error)\n";
    std::cout << "  history [name]                     Show session history\n";
    std::cout << "  stop-all                           Disconnect every profile\n";
    std::cout << "  detach                             Exit and leave proxies running\n";
    std::cout << "  quit / exit                        Disconnect everything and exit\n\n";
}

// List profiles
void list_profiles(ProxyManager& manager) {
    auto profiles = manager.profiles();

    if (profiles.empty()) {
        std::cout << "No profiles. Use 'import' to add one.\n";
        return;
    }

    GlobalConfig settings = manager.settings();
    std::string scheme = settings.proxy_type == ProxyType::HTTP ? "http" : "socks5";

    std::cout << "\n";
    std::cout << std::left << std::setw(5) << "Row" << std::setw(34) << "Profile"
              << std::setw(10) << "Status" << "Proxy\n";

    for (size_t i = 0; i < profiles.size(); ++i) {
        const auto& profile = profiles[i];
        std::cout << std::left << std::setw(5) << i << std::setw(34) << profile.name
                  << std::setw(10) << (profile.running ? "running" : "stopped");
        if (profile.running && profile.proxy_port) {
            std::cout << scheme << "://" << config::PROXY_BIND_HOST << ":" << *profile.proxy_port;
        } else if (profile.last_port) {
            std::cout << "(last " << *profile.last_port << ")";
        }
        std::cout << "\n";
    }
    std::cout << "\n";
}

void show_settings(ProxyManager& manager) {
    GlobalConfig settings = manager.settings();
    PortRange range = manager.allowed_range();

    std::cout << "Connection limit: " << (settings.port_limit == 0 ? std::string("unlimited") : std::to_string(settings.port_limit)) << "\n";
    std::cout << "Allowed ports:    " << range.low << "-" << range.high << "\n";
    std::cout << "Proxy type:       " << proxy_type_to_string(settings.proxy_type) << "\n";
    std::cout << "Executable:       " << (settings.executable_path ? settings.executable_path->string() : std::string("(PATH lookup)")) << "\n";
    std::cout << "Process logging:  " << (settings.process_logging ? "on" : "off") << "\n";
    std::cout << "Data directory:   " << manager.data_directory().string() << "\n";
}

void show_history(ProxyManager& manager, const std::string& name) {
    auto records = manager.history(name, 20);
    if (records.empty()) {
        std::cout << "No sessions recorded.\n";
        return;
    }

    for (const auto& record : records) {
        std::cout << format_timestamp(record.timestamp) << "  " << std::left << std::setw(14)
                  << session_event_to_string(record.event) << std::setw(30) << record.profile_name;
        if (record.port) {
            std::cout << " port " << *record.port;
        }
        if (record.exit_code) {
            std::cout << " exit " << *record.exit_code;
        }
        if (!record.detail.empty()) {
            std::cout << " " << record.detail;
        }
        std::cout << "\n";
    }
}

std::optional<uint32_t> parse_number(const std::string& text) {
    try {
        size_t consumed = 0;
        unsigned long value = std::stoul(text, &consumed);
        if (consumed != text.size() || value > 0xFFFFFFFFUL) {
            return std::nullopt;
        }
        return static_cast<uint32_t>(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

void print_connect(const std::string& name, const ConnectOutcome& outcome) {
    if (outcome.ok()) {
        std::cout << "[OK] " << name << ": " << outcome.message << "\n";
    } else if (outcome.disconnected) {
        std::cout << "[OK] " << name << " disconnected\n";
    } else {
        std::cout << "[FAIL] " << name << ": " << connect_status_to_string(outcome.status)
                  << " (" << outcome.message << ")\n";
    }
}

enum class LoopAction { CONTINUE, QUIT, DETACH };

// Process user command
LoopAction handle_command(ProxyManager& manager, const std::string& line) {
    std::istringstream iss(line);
    std::string cmd;
    iss >> cmd;

    if (cmd.empty()) {
        return LoopAction::CONTINUE;
    }

    std::vector<std::string> args;
    std::string arg;
    while (iss >> arg) {
        args.push_back(arg);
    }

    if (cmd == "help") {
        print_help();
    }
    else if (cmd == "list") {
        list_profiles(manager);
    }
    else if (cmd == "import" && args.size() == 1) {
        auto result = manager.import_file(args[0]);
        std::cout << (result.ok() ? "[OK] " : "[FAIL] ") << result.message << "\n";
    }
    else if (cmd == "paste" && args.size() == 2) {
        auto content = read_file(args[1]);
        if (!content) {
            std::cout << "[FAIL] Cannot read " << args[1] << "\n";
        } else {
            auto result = manager.import_text(args[0], *content);
            std::cout << (result.ok() ? "[OK] " : "[FAIL] ") << result.message << "\n";
        }
    }
    else if (cmd == "scan") {
        std::cout << "Added " << manager.scan_profiles() << " profiles\n";
    }
    else if (cmd == "connect" && !args.empty()) {
        std::optional<uint16_t> port;
        bool force = false;
        for (size_t i = 1; i < args.size(); ++i) {
            if (args[i] == "--force") {
                force = true;
            } else if (auto number = parse_number(args[i]); number && *number <= 65535) {
                port = static_cast<uint16_t>(*number);
            } else {
                std::cout << "Invalid port: " << args[i] << "\n";
                return LoopAction::CONTINUE;
            }
        }

        ConnectOutcome outcome = manager.connect(args[0], port, force);
        print_connect(args[0], outcome);
        if (outcome.status == ConnectStatus::PORT_CONTENDED && !outcome.holder.empty()) {
            std::cout << "       Use 'connect " << args[0] << " " << *port << " --force' to disconnect '"
                      << outcome.holder << "' and take the port\n";
        }
    }
    else if (cmd == "disconnect" && args.size() == 1) {
        std::cout << (manager.disconnect(args[0]) ? "[OK] Disconnected " : "[FAIL] Could not disconnect ") << args[0] << "\n";
    }
    else if (cmd == "toggle" && args.size() == 1) {
        print_connect(args[0], manager.toggle(args[0]));
    }
    else if (cmd == "delete" && args.size() == 1) {
        StoreError error = manager.delete_profile(args[0]);
        std::cout << (error == StoreError::NONE ? "[OK] Deleted " + args[0] : "[FAIL] " + store_error_to_string(error)) << "\n";
    }
    else if (cmd == "rename" && args.size() == 2) {
        StoreError error = manager.rename_profile(args[0], args[1]);
        std::cout << (error == StoreError::NONE ? "[OK] Renamed to " + args[1] : "[FAIL] " + store_error_to_string(error)) << "\n";
    }
    else if (cmd == "show" && args.size() == 1) {
        auto content = manager.get_config(args[0]);
        std::cout << (content ? *content : "[FAIL] Configuration not available\n");
    }
    else if (cmd == "host" && args.size() == 1) {
        auto host = manager.endpoint_host(args[0]);
        std::cout << (host ? *host : std::string("(no endpoint)")) << "\n";
    }
    else if (cmd == "auto") {
        AutoConnectRequest request = AutoConnectRequest::all();
        if (!args.empty()) {
            std::vector<size_t> rows;
            for (const auto& text : args) {
                auto row = parse_number(text);
                if (!row) {
                    std::cout << "Invalid row: " << text << "\n";
                    return LoopAction::CONTINUE;
                }
                rows.push_back(*row);
            }
            request = AutoConnectRequest::rows(std::move(rows));
        }
        if (!manager.auto_connect(request)) {
            std::cout << "[FAIL] Auto-connect not started\n";
        }
    }
    else if (cmd == "auto-from" && !args.empty()) {
        auto row = parse_number(args[0]);
        std::optional<uint16_t> start_port;
        if (args.size() > 1) {
            auto number = parse_number(args[1]);
            if (!number || *number > 65535) {
                std::cout << "Invalid port: " << args[1] << "\n";
                return LoopAction::CONTINUE;
            }
            start_port = static_cast<uint16_t>(*number);
        }
        if (!row || !manager.auto_connect(AutoConnectRequest::from(*row, start_port))) {
            std::cout << "[FAIL] Auto-connect not started\n";
        }
    }
    else if (cmd == "cancel") {
        manager.cancel_auto_connect();
    }
    else if (cmd == "settings") {
        show_settings(manager);
    }
    else if (cmd == "limit" && args.size() == 1) {
        auto limit = parse_number(args[0]);
        if (!limit) {
            std::cout << "Invalid limit: " << args[0] << "\n";
        } else {
            manager.set_port_limit(*limit);
            PortRange range = manager.allowed_range();
            std::cout << "[OK] Allowed ports " << range.low << "-" << range.high << "\n";
        }
    }
    else if (cmd == "type" && args.size() == 1) {
        auto type = string_to_proxy_type(args[0]);
        if (!type) {
            std::cout << "Unknown proxy type: " << args[0] << "\n";
        } else {
            manager.set_proxy_type(*type);
        }
    }
    else if (cmd == "exe" && args.size() == 1) {
        std::cout << (manager.set_executable_path(args[0]) ? "[OK] Executable set\n" : "[FAIL] Not an executable file\n");
    }
    else if (cmd == "logging" && args.size() == 1 && (args[0] == "on" || args[0] == "off")) {
        manager.set_process_logging(args[0] == "on");
    }
    else if (cmd == "loglevel" && args.size() == 1) {
        if (auto level = parse_log_level(args[0])) {
            set_log_level(*level);
        } else {
            std::cout << "[FAIL] Unknown log level: " << args[0] << "\n";
        }
    }
    else if (cmd == "history") {
        show_history(manager, args.empty() ? "" : args[0]);
    }
    else if (cmd == "stop-all") {
        std::cout << "Stopped " << manager.stop_all() << " profiles\n";
    }
    else if (cmd == "detach") {
        return LoopAction::DETACH;
    }
    else if (cmd == "quit" || cmd == "exit") {
        return LoopAction::QUIT;
    }
    else {
        std::cout << "Unknown command or wrong arguments: " << line << "\n";
        std::cout << "Type 'help' for available commands\n";
    }

    return LoopAction::CONTINUE;
}

int main(int argc, char* argv[]) {
    if (argc > 2) {
        print_usage(argv[0]);
        return 1;
    }

    LogLevel level = LogLevel::INFO;
    if (auto configured = parse_log_level(get_env("WPMAN_LOG_LEVEL"))) {
        level = *configured;
    }

    try {
        ManagerOptions options;
        if (argc == 2) {
            options.data_dir = argv[1];
        }
        std::filesystem::path data_dir = options.data_dir.empty() ? config::get_data_directory() : options.data_dir;
        initialize_logging((config::get_log_directory(data_dir) / "wpman.log").string(), level);

        ProxyManager manager(std::move(options));
        manager.add_observer(std::make_shared<ConsoleObserver>());

#ifdef _WIN32
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
#else
        // Without SA_RESTART the signal interrupts the read blocked at the prompt
        struct sigaction interrupt = {};
        interrupt.sa_handler = signal_handler;
        sigemptyset(&interrupt.sa_mask);
        interrupt.sa_flags = 0;
        if (sigaction(SIGINT, &interrupt, nullptr) != 0 || sigaction(SIGTERM, &interrupt, nullptr) != 0) {
            log_warn("wpman_cli: Could not install signal handlers");
        }
#endif

        std::cout << "WPMan - WireProxy Profile Manager\n";
        std::cout << "Type 'help' for available commands\n";

        LoopAction action = LoopAction::QUIT;
        std::string line;
        while (!g_shutdown && std::cout << "> " && std::getline(std::cin, line)) {
            action = handle_command(manager, line);
            if (action != LoopAction::CONTINUE) {
                break;
            }
        }

        if (action == LoopAction::DETACH) {
            manager.cancel_auto_connect();
            manager.wait_auto_connect();
            std::cout << "Leaving proxies running\n";
        } else {
            std::cout << "\nDisconnecting all profiles...\n";
            manager.shutdown();
        }

    } catch (const std::exception& e) {
        log_critical(std::string("wpman_cli: ") + e.what());
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
