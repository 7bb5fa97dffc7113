/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATLINK_CONFIG_HPP
#define __SATLINK_CONFIG_HPP

#include <satlink/link_budget.hpp>
#include <satlink/types.hpp>

#include <optional>
#include <string>

namespace satlink {

// Longest windows the CLI will request
constexpr int MAX_PASS_HOURS = 24 * 30;
constexpr int MAX_MARGIN_HOURS = 24 * 7;

class Config {
public:
    Config() = default;
    ~Config() = default;

    double getLongitude() const;
    void setLongitude(const double l);

    double getLatitude() const;
    void setLatitude(const double l);

    // Altitude above the ellipsoid in meters
    double getAltitude() const;
    void setAltitude(const double a);

    GroundStation getGroundStation() const;

    time_point getTime() const;
    void setTime(const time_point tp);

    int getHours() const;
    // Clamped to 1..maximum
    void setHours(const int hours, const int maximum = MAX_PASS_HOURS);

    double getMask() const;
    void setMask(const double degrees);

    double getStep() const;
    void setStep(const double seconds);

    int getMaxPasses() const;
    void setMaxPasses(const int passes);

    RFConfiguration& getRFConfiguration();
    const RFConfiguration& getRFConfiguration() const;

    bool hasHorizonMaskFile() const;
    std::string getHorizonMaskFile() const;
    void setHorizonMaskFile(const std::string &path);

    std::string getTLEFile() const;
    void setTLEFile(const std::string &path);

    bool getVisibleOnly() const;
    void setVisibleOnly(bool);

    bool getJSON() const;
    void setJSON(bool);

    bool getVerbose() const;
    void setVerbose(bool);

private:
    double longitude = 0.0;
    double latitude = 0.0;
    double altitude = 0.0;
    time_point time;
    int hours = 24;
    double mask = 10.0;
    double step = 10.0;
    int maxPasses = 20;
    RFConfiguration rf;
    std::optional<std::string> horizonMaskFile;
    std::string tleFile;
    bool visibleOnly = false;
    bool json = false;
    bool verbose = false;
};

}

#endif
