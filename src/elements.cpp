/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satlink/elements.hpp>
#include <satlink/errors.hpp>
#include <satlink/time_util.hpp>

#include <algorithm>
#include <charconv>
#include <chrono>
#include <format>
#include <fstream>
#include <iterator>
#include <ranges>
#include <sstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::warn;

namespace satlink {

namespace {

constexpr std::size_t TLE_LINE_LENGTH = 69;

// Helper function to trim leading spaces from a string_view
std::string_view trimLeft(const std::string_view &str) {
    auto pos = str.find_first_not_of(' ');
    return pos == std::string_view::npos ? "" : str.substr(pos);
}

// Helper function to trim trailing whitespace from a string_view
std::string_view trimRight(const std::string_view &str) {
    auto pos = str.find_last_not_of(" \t\r");
    return pos == std::string_view::npos ? "" : str.substr(0, pos + 1);
}

// Helper function to convert substring to numeric type
template <typename T>
inline T toNumber(const std::string_view &str, const char *field) {
    T value;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc() || ptr != str.data() + str.size()) {
        throw InvalidInputException(std::format("Invalid TLE {}: '{}'", field, str));
    }
    return value;
}

// Helper function to parse epoch from TLE format (YYDDD.DDDDDDDD)
time_point parseEpoch(const std::string_view &epochStr) {
    using namespace std::chrono;

    int y = toNumber<int>(trimLeft(epochStr.substr(0, 2)), "epoch year");
    double dayOfYear = toNumber<double>(trimLeft(epochStr.substr(2)), "epoch day");
    if (dayOfYear < 1.0 || dayOfYear >= 367.0) {
        throw InvalidInputException(std::format("Invalid TLE epoch day: {}", dayOfYear));
    }

    // Convert two-digit year to four-digit year
    if (y < 57) {
        y += 2000;
    } else {
        y += 1900;
    }

    int wholeDays = static_cast<int>(dayOfYear);
    double fracDays = dayOfYear - wholeDays;

    auto date = sys_days{year{y}/January/1} + days{wholeDays - 1};
    auto time = duration_cast<microseconds>(duration<double, std::ratio<86400>>{fracDays});

    return date + time;
}

void checkLine(const std::string_view &line, char number) {
    if (line.size() < TLE_LINE_LENGTH) {
        throw InvalidInputException(std::format("TLE line {} is too short ({} characters)", number, line.size()));
    }
    int expected = line[68] - '0';
    int actual = calculateChecksum(line);
    if (expected != actual) {
        warn("TLE line {} checksum mismatch (expected {}, computed {})", number, expected, actual);
    }
}

}

OrbitalElements OrbitalElements::fromTLE(const std::string_view &tle, std::optional<std::string> source) {
    OrbitalElements elements;
    elements.source = std::move(source);

    bool firstLineParsed = false;
    bool secondLineParsed = false;
    for (auto line : tle | std::views::split('\n')) {
        std::string lineStr;
        std::ranges::copy(line, std::back_inserter(lineStr));
        std::string_view lineView = trimLeft(trimRight(lineStr));
        if (lineView.starts_with("1 ")) {
            checkLine(lineView, '1');
            elements.line1 = std::string(lineView);
            // Catalog number is columns 3-7
            elements.catalogNumber = toNumber<int>(trimLeft(lineView.substr(2, 5)), "catalog number");
            // Epoch is columns 19-32
            elements.epoch = parseEpoch(lineView.substr(18, 14));
            firstLineParsed = true;
        } else if (lineView.starts_with("2 ")) {
            checkLine(lineView, '2');
            elements.line2 = std::string(lineView);
            // Inclination is columns 9-16
            elements.inclination = toNumber<double>(trimLeft(lineView.substr(8, 8)), "inclination");
            // Eccentricity is columns 27-33 (decimal implied)
            elements.eccentricity = toNumber<double>("0." + std::string(trimLeft(lineView.substr(26, 7))), "eccentricity");
            // Mean Motion is columns 53-63
            elements.meanMotion = toNumber<double>(trimLeft(lineView.substr(52, 11)), "mean motion");
            secondLineParsed = true;
        } else if (!firstLineParsed && !secondLineParsed && !lineView.empty()) {
            // If neither line has been parsed and this line is not empty, assume it's the name
            elements.name = std::string(lineView);
        }

        if (firstLineParsed && secondLineParsed) {
            break;
        }
    }

    if (!firstLineParsed || !secondLineParsed) {
        throw InvalidInputException("TLE text must contain both element lines");
    }

    int line2Catalog = toNumber<int>(trimLeft(std::string_view(elements.line2).substr(2, 5)), "catalog number");
    if (line2Catalog != elements.catalogNumber) {
        throw InvalidInputException(std::format("TLE catalog numbers differ between lines ({} and {})",
            elements.catalogNumber, line2Catalog));
    }
    if (elements.meanMotion <= 0.0) {
        throw InvalidInputException(std::format("Invalid TLE mean motion: {}", elements.meanMotion));
    }

    if (elements.name.empty()) {
        elements.name = std::to_string(elements.catalogNumber);
    }

    return elements;
}

double OrbitalElements::getOrbitalPeriodInSeconds() const {
    return 86400.0 / meanMotion;
}

double OrbitalElements::ageInDays(time_point now) const {
    using namespace std::chrono;
    return duration_cast<duration<double, days::period>>(now - epoch).count();
}

void OrbitalElements::printInfo(std::ostream &os, time_point now) const {
    os << "Satellite: " << name << std::endl;
    os << "  Catalog Number: " << catalogNumber << std::endl;
    os << "  Source: " << source.value_or("unknown") << std::endl;
    os << "  Epoch: " << formatTimestamp(epoch) << std::endl;
    os << "  Element Age: " << std::format("{:.2f}", ageInDays(now)) << " days" << std::endl;
    os << "  Inclination: " << inclination << " deg" << std::endl;
    os << "  Eccentricity: " << eccentricity << std::endl;
    os << "  Mean Motion: " << meanMotion << " rev/day" << std::endl;
    os << "  Period: " << std::format("{:.1f}", getOrbitalPeriodInSeconds() / 60.0) << " min" << std::endl;
}

ElementMetadata describeElements(const OrbitalElements &elements, time_point now) {
    return ElementMetadata{
        .catalogNumber = elements.getCatalogNumber(),
        .epoch = elements.getEpoch(),
        .ageInDays = elements.ageInDays(now),
        .source = elements.getSource()
    };
}

int calculateChecksum(const std::string_view &line) {
    int sum = 0;
    for (std::size_t i = 0; i < 68 && i < line.size(); ++i) {
        char c = line[i];
        if (c >= '0' && c <= '9') {
            sum += c - '0';
        } else if (c == '-') {
            sum += 1;
        }
    }
    return sum % 10;
}

void loadElements(const std::string &filepath, std::map<int, OrbitalElements> &database,
                  const std::optional<std::string> &source) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open TLE file: " + filepath);
    }
    loadElements(file, database, source.has_value() ? source : std::optional<std::string>(filepath));
}

void loadElements(std::istream &s, std::map<int, OrbitalElements> &database,
                  const std::optional<std::string> &source) {
    std::string line;
    std::ostringstream entry;
    int lineCount = 0;
    int loaded = 0;

    while (std::getline(s, line)) {
        std::string_view trimmed = trimLeft(trimRight(line));
        if (trimmed.empty()) {
            continue;
        }
        entry << trimmed << '\n';
        lineCount++;
        if (trimmed.starts_with("2 ")) {
            try {
                auto elements = OrbitalElements::fromTLE(entry.str(), source);
                database.insert_or_assign(elements.getCatalogNumber(), elements);
                loaded++;
            } catch (const InvalidInputException &err) {
                warn("Skipping TLE entry: {}", err.what());
            }
            entry.str("");
            entry.clear();
            lineCount = 0;
        } else if (lineCount > 3) {
            warn("Skipping unterminated TLE entry");
            entry.str("");
            entry.clear();
            lineCount = 0;
        }
    }

    debug("Loaded {} element sets", loaded);
}

}
