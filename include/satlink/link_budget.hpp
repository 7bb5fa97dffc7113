/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATLINK_LINK_BUDGET_HPP
#define __SATLINK_LINK_BUDGET_HPP

#include <iostream>
#include <memory>
#include <string>
#include <string_view>

namespace satlink {

// Boltzmann's constant in dBW/K/Hz
constexpr double BOLTZMANN_DBW = -228.6;

// Free-space path loss constant for frequency in GHz and range in km
constexpr double FSPL_CONSTANT_DB = 92.45;

/**
 * Radio frequency band of the downlink.
 */
enum class Band {
    VHF,
    UHF,
    L,
    S,
    C,
    X,
    Ku,
    Ka
};

/**
 * Nominal carrier frequency of a band in GHz.
 */
double nominalFrequencyInGHz(Band band);

std::string_view toString(Band band);

/**
 * Parse a band name (case-insensitive, e.g. "uhf", "Ku").
 *
 * @throws InvalidInputException for an unknown name
 */
Band parseBand(std::string_view name);

std::ostream& operator<<(std::ostream &os, const Band &band);

/**
 * Atmospheric and rain losses actually applied to a link.
 */
struct AppliedLosses {
    double atmosphericInDb;
    double rainInDb;
};

/**
 * Maps the configured atmospheric and rain losses to the losses applied at
 * a given elevation.
 */
class LossModel {
public:
    virtual ~LossModel() = default;
    virtual AppliedLosses apply(double atmosphericLossInDb, double rainLossInDb,
                                double elevationInDegrees) const = 0;
    virtual std::string name() const = 0;
};

/**
 * Applies the configured losses unchanged, whatever the elevation.
 */
class FixedLossModel : public LossModel {
public:
    AppliedLosses apply(double atmosphericLossInDb, double rainLossInDb,
                        double elevationInDegrees) const override;
    std::string name() const override { return "fixed"; }
};

/**
 * Scales the configured (zenith) losses by the slant-path length factor
 * 1/sin(el). Below minimumElevationInDegrees the factor is capped at
 * lowElevationFactor.
 */
class SlantPathLossModel : public LossModel {
public:
    explicit SlantPathLossModel(double minimumElevationInDegrees = 5.0, double lowElevationFactor = 10.0)
        : minimumElevationInDegrees(minimumElevationInDegrees), lowElevationFactor(lowElevationFactor) {}

    AppliedLosses apply(double atmosphericLossInDb, double rainLossInDb,
                        double elevationInDegrees) const override;
    std::string name() const override { return "slant-path"; }

private:
    double minimumElevationInDegrees;
    double lowElevationFactor;
};

/**
 * RF parameters of a downlink. Every field may be overridden independently.
 */
struct RFConfiguration {
    Band band = Band::UHF;
    double txPowerInDbw = 10.0;
    double txGainInDbi = 5.0;
    double rxGainInDbi = 20.0;
    double bandwidthInHz = 20000.0;
    double systemNoiseTempInKelvin = 290.0;
    double noiseFigureInDb = 2.0;
    double atmosphericLossInDb = 1.0;
    double rainLossInDb = 0.0;
    double pointingLossInDb = 0.5;
    double requiredSnrInDb = 3.0;
    std::shared_ptr<const LossModel> lossModel = std::make_shared<FixedLossModel>();

    double frequencyInGHz() const { return nominalFrequencyInGHz(band); }
};

/**
 * Check an RF configuration.
 *
 * @throws InvalidInputException if any field is non-finite, bandwidth or
 *         noise temperature is not positive, or a loss or the noise figure
 *         is negative
 */
void validate(const RFConfiguration &config);

/**
 * Geometry of the link at one instant.
 */
struct LinkGeometry {
    double rangeInKilometers;
    double elevationInDegrees;
};

/**
 * Full link budget breakdown, all values in dB, dBW or GHz.
 */
struct LinkBudget {
    double frequencyInGHz;
    double eirpInDbw;
    double freeSpaceLossInDb;
    double atmosphericLossInDb;
    double rainLossInDb;
    double pointingLossInDb;
    double receivedPowerInDbw;
    double noisePowerInDbw;     ///< kTB
    double snrInDb;
    double marginInDb;
};

/**
 * Compute SNR and margin of a downlink:
 *
 *   Lfs  = 92.45 + 20·log10(f_GHz) + 20·log10(R_km)
 *   EIRP = P_tx + G_tx
 *   Prx  = EIRP + G_rx - Lfs - L_atm - L_rain - L_point
 *   kTB  = -228.6 + 10·log10(T) + 10·log10(B)
 *   SNR  = Prx - (kTB + NF)
 *   margin = SNR - required SNR
 *
 * Pure: the same inputs always give bit-identical results.
 *
 * @throws InvalidInputException if range is not positive or config fails validate()
 */
LinkBudget computeMargin(const LinkGeometry &geometry, const RFConfiguration &config);

}

#endif
