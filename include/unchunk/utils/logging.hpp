#pragma once

#include <spdlog/spdlog.h>
#include <string>

namespace unchunk::utils {

// Log levels
enum class LogLevel {
    TRACE,
    DEBUG,
    INFO,
    WARN,
    ERROR,
    CRITICAL,
    OFF
};

// Initialize logging (stderr, so stdout stays free for tool output)
void init_logging(LogLevel level = LogLevel::INFO, const std::string& pattern = "");

// Set log level
void set_log_level(LogLevel level);

// Get current log level
LogLevel get_log_level();

// Convert log level to string
const char* log_level_to_string(LogLevel level);

// Convert string to log level, falls back to INFO for unknown names
LogLevel string_to_log_level(const std::string& str);

// Same as above but reports whether the name was recognized
bool try_parse_log_level(const std::string& str, LogLevel& out);

}  // namespace unchunk::utils
