/**
 * @file utilities.cpp
 * @brief Implementation of common utility functions for WPMan
 *
 * WPMan - WireProxy Profile Manager
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "wpman/utilities.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <fstream>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <mutex>

#ifndef _WIN32
    #include <unistd.h>
#endif

// OpenSSL for SHA-256
#include <openssl/evp.h>

namespace wpman {
namespace utilities {

namespace {
    // Global logger instance
    std::shared_ptr<spdlog::logger> g_logger;
    std::mutex g_logger_mutex;

    // Convert LogLevel to spdlog level
    spdlog::level::level_enum to_spdlog_level(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG:    return spdlog::level::debug;
            case LogLevel::INFO:     return spdlog::level::info;
            case LogLevel::WARN:     return spdlog::level::warn;
            case LogLevel::ERROR:    return spdlog::level::err;
            case LogLevel::CRITICAL: return spdlog::level::critical;
            default:                 return spdlog::level::info;
        }
    }

    std::shared_ptr<spdlog::logger> logger() {
        {
            std::lock_guard<std::mutex> lock(g_logger_mutex);
            if (g_logger) {
                return g_logger;
            }
        }
        initialize_logging();
        std::lock_guard<std::mutex> lock(g_logger_mutex);
        return g_logger;
    }
}

// ============================================================================
// LOGGING FUNCTIONS
// ============================================================================

void initialize_logging(const std::string& log_file, LogLevel level) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        // Console sink (colored)
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(to_spdlog_level(level));
        sinks.push_back(console_sink);

        // File sink (rotating, 10MB per file, 3 files max)
        if (!log_file.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, 1024 * 1024 * 10, 3);
            file_sink->set_level(to_spdlog_level(level));
            sinks.push_back(file_sink);
        }

        auto new_logger = std::make_shared<spdlog::logger>("wpman", sinks.begin(), sinks.end());
        new_logger->set_level(to_spdlog_level(level));
        new_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

        std::lock_guard<std::mutex> lock(g_logger_mutex);
        g_logger = new_logger;

        // Register as default logger
        spdlog::set_default_logger(g_logger);

    } catch (const spdlog::spdlog_ex& ex) {
        fprintf(stderr, "Log initialization failed: %s\n", ex.what());
    }
}

void set_log_level(LogLevel level) {
    auto active = logger();
    if (!active) {
        return;
    }
    active->set_level(to_spdlog_level(level));
    for (auto& sink : active->sinks()) {
        sink->set_level(to_spdlog_level(level));
    }
}

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string lower = to_lowercase(trim_string(name));
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "critical") return LogLevel::CRITICAL;
    return std::nullopt;
}

void log(LogLevel level, const std::string& message) {
    auto active = logger();
    if (!active) {
        fprintf(stderr, "%s\n", message.c_str());
        return;
    }

    switch (level) {
        case LogLevel::DEBUG:    active->debug(message); break;
        case LogLevel::INFO:     active->info(message); break;
        case LogLevel::WARN:     active->warn(message); break;
        case LogLevel::ERROR:    active->error(message); break;
        case LogLevel::CRITICAL: active->critical(message); break;
    }
}

void log_debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void log_info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void log_warn(const std::string& message) {
    log(LogLevel::WARN, message);
}

void log_error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void log_critical(const std::string& message) {
    log(LogLevel::CRITICAL, message);
}

// ============================================================================
// TIME FORMATTING FUNCTIONS
// ============================================================================

std::string format_timestamp(uint64_t timestamp, const char* format) {
    std::time_t time = static_cast<std::time_t>(timestamp);
    std::tm tm_buf;

#ifdef _WIN32
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, format);
    return oss.str();
}

std::string format_current_time() {
    return format_timestamp(current_timestamp());
}

uint64_t current_timestamp() {
    auto now = std::chrono::system_clock::now();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count());
}

// ============================================================================
// FILE I/O FUNCTIONS
// ============================================================================

std::optional<std::string> read_file(const std::filesystem::path& file_path) {
    try {
        std::ifstream file(file_path, std::ios::in | std::ios::binary);
        if (!file.is_open()) {
            log_error("Failed to open file for reading: " + file_path.string());
            return std::nullopt;
        }

        std::ostringstream content;
        content << file.rdbuf();
        return content.str();

    } catch (const std::exception& ex) {
        log_error("Exception reading file " + file_path.string() + ": " + ex.what());
        return std::nullopt;
    }
}

bool write_file(const std::filesystem::path& file_path, const std::string& content) {
    try {
        // Create parent directories if needed
        if (file_path.has_parent_path()) {
            std::filesystem::create_directories(file_path.parent_path());
        }

        std::ofstream file(file_path, std::ios::out | std::ios::trunc | std::ios::binary);
        if (!file.is_open()) {
            log_error("Failed to open file for writing: " + file_path.string());
            return false;
        }

        file << content;
        file.flush();
        return file.good();

    } catch (const std::exception& ex) {
        log_error("Exception writing file " + file_path.string() + ": " + ex.what());
        return false;
    }
}

std::optional<std::string> calculate_file_hash(const std::filesystem::path& file_path) {
    auto content = read_file(file_path);
    if (!content) {
        return std::nullopt;
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_length = 0;

    if (EVP_Digest(content->data(), content->size(), hash, &hash_length,
                   EVP_sha256(), nullptr) != 1) {
        log_error("SHA-256 digest failed for " + file_path.string());
        return std::nullopt;
    }

    std::ostringstream oss;
    for (unsigned int i = 0; i < hash_length; i++) {
        oss << std::hex << std::setw(2) << std::setfill('0')
            << static_cast<int>(hash[i]);
    }

    return oss.str();
}

// ============================================================================
// STRING MANIPULATION FUNCTIONS
// ============================================================================

std::vector<std::string> split_string(const std::string& str, char delimiter) {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;

    while (std::getline(ss, item, delimiter)) {
        result.push_back(item);
    }

    return result;
}

std::string trim_string(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
        [](unsigned char ch) { return std::isspace(ch); });

    auto end = std::find_if_not(str.rbegin(), str.rend(),
        [](unsigned char ch) { return std::isspace(ch); }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

std::string to_lowercase(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    if (prefix.length() > str.length()) {
        return false;
    }
    return str.compare(0, prefix.length(), prefix) == 0;
}

bool ends_with(const std::string& str, const std::string& suffix) {
    if (suffix.length() > str.length()) {
        return false;
    }
    return str.compare(str.length() - suffix.length(), suffix.length(), suffix) == 0;
}

// ============================================================================
// ENVIRONMENT FUNCTIONS
// ============================================================================

std::string get_env(const std::string& name, const std::string& default_value) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : default_value;
}

bool is_executable_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return false;
    }
#ifdef _WIN32
    return true;
#else
    return ::access(path.c_str(), X_OK) == 0;
#endif
}

std::optional<std::filesystem::path> find_on_path(const std::string& name) {
#ifdef _WIN32
    const char separator = ';';
    const std::vector<std::string> candidates = {name + ".exe", name};
#else
    const char separator = ':';
    const std::vector<std::string> candidates = {name};
#endif

    for (const auto& dir : split_string(get_env("PATH"), separator)) {
        if (dir.empty()) {
            continue;
        }
        for (const auto& candidate : candidates) {
            std::filesystem::path full = std::filesystem::path(dir) / candidate;
            if (is_executable_file(full)) {
                return full;
            }
        }
    }

    return std::nullopt;
}

} // namespace utilities
} // namespace wpman
