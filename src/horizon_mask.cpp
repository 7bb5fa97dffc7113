/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satlink/errors.hpp>
#include <satlink/horizon_mask.hpp>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <format>
#include <fstream>
#include <stdexcept>

namespace satlink {

HorizonMask::HorizonMask(const std::vector<double> &elevationsInDegrees) {
    if (elevationsInDegrees.size() != SIZE) {
        throw InvalidInputException(std::format("Horizon mask must have {} values (got {})",
            SIZE, elevationsInDegrees.size()));
    }
    for (std::size_t i = 0; i < SIZE; ++i) {
        double e = elevationsInDegrees[i];
        if (!std::isfinite(e) || e < 0.0 || e >= 90.0) {
            throw InvalidInputException(std::format("Horizon mask value at azimuth {} out of range: {}", i, e));
        }
        elevations[i] = e;
    }
}

HorizonMask HorizonMask::load(std::istream &s) {
    std::vector<double> values;
    std::string line;
    while (std::getline(s, line)) {
        auto hash = line.find('#');
        if (hash != std::string::npos) {
            line.erase(hash);
        }
        std::ranges::replace(line, ',', ' ');

        std::string_view rest = line;
        while (!rest.empty()) {
            auto begin = rest.find_first_not_of(" \t\r");
            if (begin == std::string_view::npos) {
                break;
            }
            rest.remove_prefix(begin);
            auto tokenEnd = rest.find_first_of(" \t\r");
            std::string_view token = rest.substr(0, tokenEnd);

            double value;
            auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
            if (ec != std::errc() || ptr != token.data() + token.size()) {
                throw InvalidInputException(std::format("Invalid horizon mask value: '{}'", token));
            }
            values.push_back(value);

            rest.remove_prefix(token.size());
        }
    }
    return HorizonMask(values);
}

HorizonMask HorizonMask::load(const std::string &filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open horizon mask file: " + filepath);
    }
    return load(file);
}

double HorizonMask::elevationAt(double azimuthInDegrees) const {
    long index = std::lround(azimuthInDegrees) % static_cast<long>(SIZE);
    if (index < 0) {
        index += SIZE;
    }
    return elevations[static_cast<std::size_t>(index)];
}

double HorizonMask::maximumElevation() const {
    return std::ranges::max(elevations);
}

}
