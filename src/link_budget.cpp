/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satlink/errors.hpp>
#include <satlink/link_budget.hpp>
#include <satlink/types.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <format>

namespace satlink {

namespace {

struct BandInfo {
    Band band;
    std::string_view name;
    double frequencyInGHz;
};

constexpr BandInfo BANDS[] = {
    {Band::VHF, "VHF", 0.145},
    {Band::UHF, "UHF", 0.437},
    {Band::L,   "L",   1.6},
    {Band::S,   "S",   2.2},
    {Band::C,   "C",   4.0},
    {Band::X,   "X",   8.2},
    {Band::Ku,  "Ku",  12.0},
    {Band::Ka,  "Ka",  26.0},
};

const BandInfo& lookup(Band band) {
    for (const auto &info : BANDS) {
        if (info.band == band) {
            return info;
        }
    }
    throw InvalidInputException("Unknown band");
}

void requireFinite(double value, const char *field) {
    if (!std::isfinite(value)) {
        throw InvalidInputException(std::format("{} must be a finite number", field));
    }
}

void requireNonNegative(double value, const char *field) {
    requireFinite(value, field);
    if (value < 0.0) {
        throw InvalidInputException(std::format("{} must not be negative (got {})", field, value));
    }
}

void requirePositive(double value, const char *field) {
    requireFinite(value, field);
    if (value <= 0.0) {
        throw InvalidInputException(std::format("{} must be positive (got {})", field, value));
    }
}

}

double nominalFrequencyInGHz(Band band) {
    return lookup(band).frequencyInGHz;
}

std::string_view toString(Band band) {
    return lookup(band).name;
}

Band parseBand(std::string_view name) {
    auto equalsIgnoreCase = [](std::string_view a, std::string_view b) {
        return std::ranges::equal(a, b, [](char x, char y) {
            return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
        });
    };
    for (const auto &info : BANDS) {
        if (equalsIgnoreCase(info.name, name)) {
            return info.band;
        }
    }
    throw InvalidInputException(std::format("Unknown band: '{}'", name));
}

std::ostream& operator<<(std::ostream &os, const Band &band) {
    return os << toString(band);
}

AppliedLosses FixedLossModel::apply(double atmosphericLossInDb, double rainLossInDb,
                                    double /*elevationInDegrees*/) const {
    return {atmosphericLossInDb, rainLossInDb};
}

AppliedLosses SlantPathLossModel::apply(double atmosphericLossInDb, double rainLossInDb,
                                        double elevationInDegrees) const {
    double factor = lowElevationFactor;
    if (elevationInDegrees > minimumElevationInDegrees) {
        factor = 1.0 / std::sin(elevationInDegrees * DEGREES_TO_RADIANS);
    }
    return {atmosphericLossInDb * factor, rainLossInDb * factor};
}

void validate(const RFConfiguration &config) {
    lookup(config.band);
    requireFinite(config.txPowerInDbw, "Transmit power");
    requireFinite(config.txGainInDbi, "Transmit gain");
    requireFinite(config.rxGainInDbi, "Receive gain");
    requirePositive(config.bandwidthInHz, "Bandwidth");
    requirePositive(config.systemNoiseTempInKelvin, "System noise temperature");
    requireNonNegative(config.noiseFigureInDb, "Noise figure");
    requireNonNegative(config.atmosphericLossInDb, "Atmospheric loss");
    requireNonNegative(config.rainLossInDb, "Rain loss");
    requireNonNegative(config.pointingLossInDb, "Pointing loss");
    requireFinite(config.requiredSnrInDb, "Required SNR");
    if (!config.lossModel) {
        throw InvalidInputException("A loss model is required");
    }
}

LinkBudget computeMargin(const LinkGeometry &geometry, const RFConfiguration &config) {
    validate(config);
    requirePositive(geometry.rangeInKilometers, "Range");
    requireFinite(geometry.elevationInDegrees, "Elevation");

    double frequency = config.frequencyInGHz();
    AppliedLosses losses = config.lossModel->apply(config.atmosphericLossInDb, config.rainLossInDb,
                                                   geometry.elevationInDegrees);

    double fspl = FSPL_CONSTANT_DB + 20.0 * std::log10(frequency) + 20.0 * std::log10(geometry.rangeInKilometers);
    double eirp = config.txPowerInDbw + config.txGainInDbi;
    double received = eirp + config.rxGainInDbi - fspl
                      - losses.atmosphericInDb - losses.rainInDb - config.pointingLossInDb;
    double noise = BOLTZMANN_DBW + 10.0 * std::log10(config.systemNoiseTempInKelvin)
                   + 10.0 * std::log10(config.bandwidthInHz);
    double snr = received - (noise + config.noiseFigureInDb);

    return LinkBudget{
        .frequencyInGHz = frequency,
        .eirpInDbw = eirp,
        .freeSpaceLossInDb = fspl,
        .atmosphericLossInDb = losses.atmosphericInDb,
        .rainLossInDb = losses.rainInDb,
        .pointingLossInDb = config.pointingLossInDb,
        .receivedPowerInDbw = received,
        .noisePowerInDbw = noise,
        .snrInDb = snr,
        .marginInDb = snr - config.requiredSnrInDb
    };
}

}
