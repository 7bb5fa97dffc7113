/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satlink/errors.hpp>
#include <satlink/time_util.hpp>

#include <sstream>

#include <date/date.h>

namespace satlink {

namespace {

bool tryParse(const std::string &text, const char *format, time_point &tp) {
    std::istringstream in(text);
    in >> date::parse(format, tp);
    if (in.fail()) {
        return false;
    }
    // Reject trailing garbage
    return in.peek() == std::char_traits<char>::eof();
}

}

time_point parseTimestamp(const std::string_view &text) {
    std::string value(text);
    if (!value.empty() && (value.back() == 'Z' || value.back() == 'z')) {
        value.pop_back();
    }

    time_point tp;
    if (tryParse(value, "%Y-%m-%dT%H:%M:%S", tp) || tryParse(value, "%Y-%m-%d %H:%M:%S", tp)) {
        return tp;
    }
    throw InvalidInputException("Invalid time format (expected YYYY-MM-DDTHH:MM:SSZ): " + std::string(text));
}

std::string formatTimestamp(time_point tp) {
    return date::format("%FT%TZ", std::chrono::floor<std::chrono::seconds>(tp));
}

}
