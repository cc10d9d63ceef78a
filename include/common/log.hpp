/*
 * File: include/common/log.hpp
 * Project: Presence Bridge
 * Purpose: Timestamped diagnostic lines on stderr
 * Notes:
 *  - See SPEC_FULL.md and DESIGN.md
 *  - One mutex serializes lines written by the dispatch threads
 * Last updated: 2026-10-19
 */

#pragma once
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

enum class LogLevel
{
    debug = 0,
    info = 1,
    warn = 2,
    error = 3
};

inline std::atomic<int> &log_threshold()
{
    static std::atomic<int> level{static_cast<int>(LogLevel::info)};
    return level;
}

inline void set_log_level(LogLevel level) { log_threshold().store(static_cast<int>(level)); }

inline bool log_enabled(LogLevel level) { return static_cast<int>(level) >= log_threshold().load(); }

// RFC3339 UTC with milliseconds (e.g., 2026-10-19T14:59:01.234Z)
inline std::string iso8601_now_ms()
{
    using namespace std::chrono;
    auto now = time_point_cast<milliseconds>(system_clock::now());
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t tt = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&tt, &tm);

    char base[32];
    std::strftime(base, sizeof(base), "%Y-%m-%dT%H:%M:%S", &tm);

    std::ostringstream oss;
    oss << base << '.' << std::setw(3) << std::setfill('0') << ms.count() << 'Z';
    return oss.str();
}

inline const char *log_level_name(LogLevel level)
{
    switch (level)
    {
    case LogLevel::debug:
        return "DEBUG";
    case LogLevel::info:
        return "INFO";
    case LogLevel::warn:
        return "WARN";
    case LogLevel::error:
        return "ERROR";
    }
    return "?";
}

inline void log_line(LogLevel level, const std::string &component, const std::string &message)
{
    if (!log_enabled(level))
        return;
    static std::mutex mtx;
    const std::string ts = iso8601_now_ms();
    std::scoped_lock lk(mtx);
    std::cerr << ts << ' ' << log_level_name(level) << " [" << component << "] " << message << '\n';
}
