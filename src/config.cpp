/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satlink/config.hpp>

namespace satlink {

namespace {

constexpr int MAX_PASSES = 100;

}

double Config::getLatitude() const {
    return latitude;
}

void Config::setLatitude(const double l) {
    latitude = l;
}

double Config::getLongitude() const {
    return longitude;
}

void Config::setLongitude(const double l) {
    longitude = l;
}

double Config::getAltitude() const {
    return altitude;
}

void Config::setAltitude(const double a) {
    altitude = a;
}

GroundStation Config::getGroundStation() const {
    return GroundStation{
        .latitudeInDegrees = latitude,
        .longitudeInDegrees = longitude,
        .heightInKilometers = altitude / 1000.0
    };
}

time_point Config::getTime() const {
    return time;
}

void Config::setTime(const time_point tp) {
    time = tp;
}

int Config::getHours() const {
    return hours;
}

void Config::setHours(const int h, const int maximum) {
    if (h > 0 && h <= maximum) {
        hours = h;
    } else if (h > maximum) {
        hours = maximum;
    } else {
        hours = 1;
    }
}

double Config::getMask() const {
    return mask;
}

void Config::setMask(const double degrees) {
    mask = degrees;
}

double Config::getStep() const {
    return step;
}

void Config::setStep(const double seconds) {
    step = seconds;
}

int Config::getMaxPasses() const {
    return maxPasses;
}

void Config::setMaxPasses(const int passes) {
    if (passes > 0 && passes <= MAX_PASSES) {
        maxPasses = passes;
    } else if (passes > MAX_PASSES) {
        maxPasses = MAX_PASSES;
    } else {
        maxPasses = 1;
    }
}

RFConfiguration& Config::getRFConfiguration() {
    return rf;
}

const RFConfiguration& Config::getRFConfiguration() const {
    return rf;
}

bool Config::hasHorizonMaskFile() const {
    return horizonMaskFile.has_value();
}

std::string Config::getHorizonMaskFile() const {
    return horizonMaskFile.value_or("");
}

void Config::setHorizonMaskFile(const std::string &path) {
    horizonMaskFile = path;
}

std::string Config::getTLEFile() const {
    return tleFile;
}

void Config::setTLEFile(const std::string &path) {
    tleFile = path;
}

bool Config::getVisibleOnly() const {
    return visibleOnly;
}

void Config::setVisibleOnly(bool v) {
    visibleOnly = v;
}

bool Config::getJSON() const {
    return json;
}

void Config::setJSON(bool j) {
    json = j;
}

bool Config::getVerbose() const {
    return verbose;
}

void Config::setVerbose(bool v) {
    verbose = v;
}

}
