/**
 * @file utilities.hpp
 * @brief Common utility functions for WPMan
 *
 * WPMan - WireProxy Profile Manager
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Utility functions used throughout WPMan:
 * - Logging and error reporting
 * - Time formatting
 * - String manipulation
 * - File I/O helpers
 * - Environment and PATH lookup
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <optional>
#include <filesystem>

namespace wpman {
namespace utilities {

/**
 * @brief Log levels for WPMan logging
 */
enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/**
 * @brief Initialize logging system
 * @param log_file Path to log file (empty for stdout only)
 * @param level Minimum log level to output
 */
void initialize_logging(const std::string& log_file = "", LogLevel level = LogLevel::INFO);

/**
 * @brief Change the minimum level of the active logger
 * @param level New minimum level
 */
void set_log_level(LogLevel level);

/**
 * @brief Parse a level name ("debug", "info", "warn", "error", "critical")
 * @return Parsed level or std::nullopt if unknown
 */
std::optional<LogLevel> parse_log_level(const std::string& name);

/**
 * @brief Log a message with specified level
 * @param level Log level
 * @param message Message to log
 */
void log(LogLevel level, const std::string& message);

void log_debug(const std::string& message);
void log_info(const std::string& message);
void log_warn(const std::string& message);
void log_error(const std::string& message);
void log_critical(const std::string& message);

/**
 * @brief Format timestamp in local time
 * @param timestamp Unix timestamp (seconds since epoch)
 * @param format std::put_time format (default "YYYY-MM-DD HH:MM:SS")
 */
std::string format_timestamp(uint64_t timestamp, const char* format = "%Y-%m-%d %H:%M:%S");

/**
 * @brief Format timestamp for current time
 */
std::string format_current_time();

/**
 * @brief Current Unix timestamp in seconds
 */
uint64_t current_timestamp();

/**
 * @brief Read entire file into string
 * @param file_path Path to file
 * @return File contents or std::nullopt if error
 */
std::optional<std::string> read_file(const std::filesystem::path& file_path);

/**
 * @brief Write string to file, creating parent directories
 * @param file_path Path to file
 * @param content Content to write
 * @return true if successful, false otherwise
 */
bool write_file(const std::filesystem::path& file_path, const std::string& content);

/**
 * @brief Calculate SHA-256 hash of file
 * @param file_path Path to file
 * @return SHA-256 hash as hex string, or std::nullopt if error
 */
std::optional<std::string> calculate_file_hash(const std::filesystem::path& file_path);

/**
 * @brief Split string by delimiter
 */
std::vector<std::string> split_string(const std::string& str, char delimiter);

/**
 * @brief Trim whitespace from string
 */
std::string trim_string(const std::string& str);

/**
 * @brief Convert string to lowercase
 */
std::string to_lowercase(const std::string& str);

bool starts_with(const std::string& str, const std::string& prefix);
bool ends_with(const std::string& str, const std::string& suffix);

/**
 * @brief Get environment variable value
 * @param name Environment variable name
 * @param default_value Default value if not set
 * @return Environment variable value or default
 */
std::string get_env(const std::string& name, const std::string& default_value = "");

/**
 * @brief Search PATH for an executable
 * @param name Executable name without extension
 * @return Full path of the first match or std::nullopt
 */
std::optional<std::filesystem::path> find_on_path(const std::string& name);

/**
 * @brief Check whether a path names an executable regular file
 */
bool is_executable_file(const std::filesystem::path& path);

} // namespace utilities
} // namespace wpman
