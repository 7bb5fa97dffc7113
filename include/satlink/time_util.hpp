/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATLINK_TIME_UTIL_HPP
#define __SATLINK_TIME_UTIL_HPP

#include <satlink/errors.hpp>
#include <satlink/types.hpp>

#include <cmath>
#include <format>
#include <string>
#include <string_view>

namespace satlink {

/**
 * Parse a UTC timestamp. Accepts "YYYY-MM-DDTHH:MM:SS", an optional
 * trailing "Z", and the space separated form "YYYY-MM-DD HH:MM:SS".
 *
 * @throws InvalidInputException if the text is not a timestamp
 */
time_point parseTimestamp(const std::string_view &text);

/**
 * Format a time point as ISO-8601 UTC with second resolution
 * (e.g. "2025-11-30T12:00:00Z").
 */
std::string formatTimestamp(time_point tp);

/**
 * Convert a number of seconds to the clock's duration type.
 *
 * @throws InvalidInputException if seconds is not finite or does not fit in
 *         the clock's duration (about 292 years at nanosecond resolution)
 */
inline std::chrono::system_clock::duration toDuration(double seconds) {
    using std::chrono::system_clock;

    const double limit = std::chrono::duration<double>(system_clock::duration::max()).count();
    if (!std::isfinite(seconds) || std::abs(seconds) >= limit) {
        throw InvalidInputException(std::format("Duration of {} s is out of range", seconds));
    }
    return std::chrono::duration_cast<system_clock::duration>(std::chrono::duration<double>(seconds));
}

/**
 * Seconds elapsed between two time points, as a double.
 */
inline double secondsBetween(time_point from, time_point to) {
    return std::chrono::duration<double>(to - from).count();
}

}

#endif
