/*
 * File: src/watch_log.hpp
 * Project: Channel Watch
 * Purpose: Tagged, timestamped log lines ([POLL], [WS], [ALERT], ...)
 * Notes:
 *  - info -> stdout, failures -> stderr
 *  - one mutex so lines from different threads never interleave
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

// RFC3339 UTC with milliseconds (e.g., 2025-09-12T14:59:01.234Z)
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

inline std::mutex &log_mutex()
{
    static std::mutex m;
    return m;
}

inline std::atomic<bool> &log_verbose()
{
    static std::atomic<bool> v{false};
    return v;
}

inline void log_line(std::ostream &os, const std::string &tag, const std::string &msg)
{
    const std::string line = iso8601_now_ms() + " [" + tag + "] " + msg + "\n";
    std::scoped_lock lk(log_mutex());
    os << line << std::flush;
}

inline void log_info(const std::string &tag, const std::string &msg) { log_line(std::cout, tag, msg); }
inline void log_error(const std::string &tag, const std::string &msg) { log_line(std::cerr, tag, msg); }

inline void log_debug(const std::string &tag, const std::string &msg)
{
    if (log_verbose().load(std::memory_order_relaxed))
        log_line(std::cout, tag, msg);
}
