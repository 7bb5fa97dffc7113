/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATLINK_ELEMENTS_HPP
#define __SATLINK_ELEMENTS_HPP

#include <satlink/types.hpp>

#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace satlink {

/**
 * An immutable set of orbital elements in Two-Line Element form.
 *
 * The core only reads the identifying fields (catalog number, name, epoch)
 * and a handful of shape parameters; propagation itself is delegated to a
 * Propagator, which consumes the raw TLE lines.
 *
 * Usage:
 *   auto elements = OrbitalElements::fromTLE(tleText, "celestrak");
 *   double age = elements.ageInDays(std::chrono::system_clock::now());
 */
class OrbitalElements {
public:
    /**
     * Parse two- or three-line TLE text. A leading line that does not start
     * with "1 " or "2 " is taken as the satellite name.
     *
     * @param tle The TLE text, lines separated by '\n'
     * @param source Where the elements came from (e.g. "celestrak"), if known
     * @throws InvalidInputException if either element line is missing or malformed
     */
    static OrbitalElements fromTLE(const std::string_view &tle,
                                   std::optional<std::string> source = std::nullopt);

    int getCatalogNumber() const { return catalogNumber; }
    const std::string& getName() const { return name; }
    time_point getEpoch() const { return epoch; }
    const std::optional<std::string>& getSource() const { return source; }
    const std::string& getLine1() const { return line1; }
    const std::string& getLine2() const { return line2; }

    double getInclination() const { return inclination; }
    double getEccentricity() const { return eccentricity; }
    double getMeanMotion() const { return meanMotion; }

    /**
     * Nominal orbital period derived from the mean motion.
     */
    double getOrbitalPeriodInSeconds() const;

    /**
     * Element age (now - epoch) in days. Negative for elements whose epoch is
     * in the future.
     */
    double ageInDays(time_point now) const;

    /**
     * Print element information to a stream.
     */
    void printInfo(std::ostream &os, time_point now) const;

private:
    OrbitalElements() = default;

    std::string name;
    int catalogNumber = 0;
    time_point epoch;
    std::optional<std::string> source;
    std::string line1;
    std::string line2;

    // Second line, in degrees except eccentricity
    double inclination = 0.0;
    double eccentricity = 0.0;
    double meanMotion = 0.0;  // revolutions per day
};

/**
 * Epoch, age and provenance of the elements used for a computation.
 */
struct ElementMetadata {
    int catalogNumber;
    time_point epoch;
    double ageInDays;
    std::optional<std::string> source;
};

ElementMetadata describeElements(const OrbitalElements &elements, time_point now);

// ============================================================================
// TLE File Functions
// ============================================================================

void loadElements(std::istream &s, std::map<int, OrbitalElements> &database,
                  const std::optional<std::string> &source = std::nullopt);
void loadElements(const std::string &filepath, std::map<int, OrbitalElements> &database,
                  const std::optional<std::string> &source = std::nullopt);

/**
 * Modulo-10 checksum of the first 68 columns of a TLE line.
 */
int calculateChecksum(const std::string_view &line);

}

#endif
