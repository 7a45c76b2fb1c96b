#pragma once

/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, watchdog_system contributors
All rights reserved.
*****************************************************************************/

/**
 * @file clock.h
 * @brief Wall-clock abstraction shared by the time-dependent components
 *
 * Cooldowns, flap windows and persisted timestamps are wall-clock values, so
 * they use system_clock. Components take a time_provider so tests can move
 * time forward without sleeping.
 */

#include <chrono>
#include <cstdint>
#include <ctime>
#include <functional>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

namespace kcenon { namespace watchdog {

using wall_clock = std::chrono::system_clock;
using time_point = wall_clock::time_point;
using time_provider = std::function<time_point()>;

inline time_provider system_time_provider() {
    return [] { return wall_clock::now(); };
}

inline std::int64_t to_epoch_ms(time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

/// Caller guarantees ms is representable; see checked_from_epoch_ms for input read from disk.
inline time_point from_epoch_ms(std::int64_t ms) {
    return time_point(std::chrono::duration_cast<wall_clock::duration>(std::chrono::milliseconds(ms)));
}

/**
 * @brief Convert epoch milliseconds, or nullopt when the value would
 *        overflow the wall clock's tick representation
 */
inline std::optional<time_point> checked_from_epoch_ms(std::int64_t ms) {
    using std::chrono::milliseconds;
    const auto lowest = std::chrono::duration_cast<milliseconds>(wall_clock::duration::min()).count();
    const auto highest = std::chrono::duration_cast<milliseconds>(wall_clock::duration::max()).count();
    if (ms < lowest || ms > highest) {
        return std::nullopt;
    }
    return from_epoch_ms(ms);
}

/**
 * @brief Format a time point as ISO-8601 UTC with millisecond precision
 */
inline std::string to_iso8601(time_point tp) {
    auto time = wall_clock::to_time_t(tp);
    std::tm tm_buf{};
#ifdef _WIN32
    gmtime_s(&tm_buf, &time);
#else
    gmtime_r(&time, &tm_buf);
#endif
    auto ms = to_epoch_ms(tp) % 1000;
    if (ms < 0) {
        ms += 1000;
    }
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << ms << 'Z';
    return oss.str();
}

} } // namespace kcenon::watchdog
