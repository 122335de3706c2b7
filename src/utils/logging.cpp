#include "unchunk/utils/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <cctype>

namespace unchunk::utils {

namespace {
LogLevel current_level = LogLevel::INFO;

spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
        case LogLevel::OFF: return spdlog::level::off;
    }
    return spdlog::level::info;
}
}  // namespace

void init_logging(LogLevel level, const std::string& pattern) {
    current_level = level;

    // Re-initialization keeps the already registered logger
    auto console = spdlog::get("unchunk");
    if (!console) {
        console = spdlog::stderr_color_mt("unchunk");
    }
    spdlog::set_default_logger(console);
    spdlog::set_level(to_spdlog_level(level));

    if (!pattern.empty()) {
        spdlog::set_pattern(pattern);
    } else {
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    }
}

void set_log_level(LogLevel level) {
    current_level = level;
    spdlog::set_level(to_spdlog_level(level));
}

LogLevel get_log_level() {
    return current_level;
}

const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "trace";
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO: return "info";
        case LogLevel::WARN: return "warn";
        case LogLevel::ERROR: return "error";
        case LogLevel::CRITICAL: return "critical";
        case LogLevel::OFF: return "off";
    }
    return "info";
}

bool try_parse_log_level(const std::string& str, LogLevel& out) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "trace") { out = LogLevel::TRACE; return true; }
    if (lower == "debug") { out = LogLevel::DEBUG; return true; }
    if (lower == "info") { out = LogLevel::INFO; return true; }
    if (lower == "warn" || lower == "warning") { out = LogLevel::WARN; return true; }
    if (lower == "error" || lower == "err") { out = LogLevel::ERROR; return true; }
    if (lower == "critical" || lower == "fatal") { out = LogLevel::CRITICAL; return true; }
    if (lower == "off" || lower == "none") { out = LogLevel::OFF; return true; }

    return false;
}

LogLevel string_to_log_level(const std::string& str) {
    LogLevel level = LogLevel::INFO;
    try_parse_log_level(str, level);
    return level;
}

}  // namespace unchunk::utils
