#pragma once

#include <string>

enum class LogLevel {
    Debug = 0,
    Info,
    Warn,
    Error,
    Fatal,
};

// Log file: $HOPSSH_LOG, or <tmp>/hopssh_debug.log
const std::string& hopssh_log_path();
void set_log_path(const std::string& path);

// Threshold: $HOPSSH_LOG_LEVEL (debug/info/warn/error/fatal), default info
LogLevel log_level();
void set_log_level(LogLevel level);
bool log_enabled(LogLevel level);

// Parse "debug", "info", ... Returns fallback on anything else.
LogLevel parse_log_level(const std::string& name, LogLevel fallback = LogLevel::Info);

// Append a timestamped line: [HH:MM:SS.mmm] LEVEL msg
void hopssh_log(LogLevel level, const std::string& msg);

// Append data as-is (no timestamp, no newline). Used for stream banners
// and raw remote output.
void hopssh_log_raw(LogLevel level, const std::string& data);

