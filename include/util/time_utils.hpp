#pragma once

/**
 * Time utilities for the desk
 *
 * Monotonic timestamps for TTL bookkeeping plus the expiry-string helpers
 * shared by the preloader and the roll-order description.
 */

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <string>

namespace rolldesk {
namespace util {

using SteadyClock = std::chrono::steady_clock;
using Millis = std::chrono::milliseconds;

/**
 * Returns current time in nanoseconds since steady_clock epoch.
 *
 * Note: steady_clock is monotonic (never goes backwards) and suitable for
 * measuring elapsed time. Not suitable for wall-clock time.
 */
inline uint64_t now_ns() {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        now.time_since_epoch()
    ).count();
}

/**
 * Returns current wall-clock time in nanoseconds since Unix epoch.
 * Use for timestamps that need to correlate with external systems.
 */
inline uint64_t wall_clock_ns() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        now.time_since_epoch()
    ).count();
}

inline int64_t elapsed_ms(SteadyClock::time_point since) {
    return std::chrono::duration_cast<Millis>(SteadyClock::now() - since).count();
}

/**
 * True for a gateway expiry string of the form YYYYMMDD.
 */
inline bool is_valid_expiry(const std::string& expiry) {
    if (expiry.size() != 8) return false;
    for (char c : expiry) {
        if (c < '0' || c > '9') return false;
    }
    int month = std::atoi(expiry.substr(4, 2).c_str());
    int day = std::atoi(expiry.substr(6, 2).c_str());
    return month >= 1 && month <= 12 && day >= 1 && day <= 31;
}

/**
 * "20260307" -> "Mar7". Unparseable input is returned unchanged.
 */
inline std::string format_expiry_short(const std::string& expiry) {
    static const char* MONTHS[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                   "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
    if (!is_valid_expiry(expiry)) return expiry;

    int month = std::atoi(expiry.substr(4, 2).c_str());
    int day = std::atoi(expiry.substr(6, 2).c_str());
    return std::string(MONTHS[month - 1]) + std::to_string(day);
}

/**
 * Daily bar date "20260307" -> "2026-03-07". Intraday stamps are returned
 * unchanged.
 */
inline std::string format_bar_date(const std::string& time) {
    if (!is_valid_expiry(time)) return time;
    return time.substr(0, 4) + "-" + time.substr(4, 2) + "-" + time.substr(6, 2);
}

/**
 * Today's local date as YYYYMMDD, the gateway's expiry format.
 */
inline std::string today_yyyymmdd() {
    std::time_t t = std::time(nullptr);
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d%02d%02d", tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday);
    return buf;
}

}  // namespace util
}  // namespace rolldesk
