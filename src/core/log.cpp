#include "log.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>

namespace {

std::string& log_path_storage() {
    static std::string path = [] {
        const char* env = std::getenv("HOPSSH_LOG");
        if (env && *env) return std::string(env);
        return (platform::temp_dir() / LOG_FILE_NAME).string();
    }();
    return path;
}

LogLevel& level_storage() {
    static LogLevel level = [] {
        const char* env = std::getenv("HOPSSH_LOG_LEVEL");
        return env ? parse_log_level(env) : LogLevel::Info;
    }();
    return level;
}

const char* level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Fatal: return "FATAL";
    }
    return "?";
}

} // namespace

const std::string& hopssh_log_path() {
    return log_path_storage();
}

void set_log_path(const std::string& path) {
    log_path_storage() = path;
}

LogLevel log_level() {
    return level_storage();
}

void set_log_level(LogLevel level) {
    level_storage() = level;
}

bool log_enabled(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(level_storage());
}

LogLevel parse_log_level(const std::string& name, LogLevel fallback) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info")  return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "fatal") return LogLevel::Fatal;
    return fallback;
}

void hopssh_log(LogLevel level, const std::string& msg) {
    if (!log_enabled(level)) return;

    std::ofstream out(hopssh_log_path(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    out << fmt::format("[{:02d}:{:02d}:{:02d}.{:03d}] {:<5} {}\n",
                       tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                       static_cast<int>(ms.count()), level_name(level), msg);
}

void hopssh_log_raw(LogLevel level, const std::string& data) {
    if (!log_enabled(level)) return;

    std::ofstream out(hopssh_log_path(), std::ios::app | std::ios::binary);
    if (!out) return;
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
}
