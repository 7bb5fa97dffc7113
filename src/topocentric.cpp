/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satlink/topocentric.hpp>

#include <chrono>
#include <cmath>
#include <numbers>

namespace satlink {

// Convert a time_point to Julian Date
double toJulianDate(time_point tp) {
    using namespace std::chrono;

    auto daysSinceEpoch = duration_cast<duration<double, days::period>>(
        tp.time_since_epoch()
    ).count();

    // Unix epoch (1970-01-01) in Julian Date is 2440587.5
    return 2440587.5 + daysSinceEpoch;
}

// Greenwich Mean Sidereal Time in radians
double gmst(double julianDate) {
    // Julian centuries since J2000.0
    double T = (julianDate - J2000_JD) / DAYS_PER_JULIAN_CENTURY;

    double gmstInDegrees = GMST_AT_J2000
                    + EARTH_SIDEREAL_RATE * (julianDate - J2000_JD)
                    + GMST_T2_COEFF * T * T
                    - T * T * T / GMST_T3_DIVISOR;

    // Normalize to [0, 360)
    gmstInDegrees = std::fmod(gmstInDegrees, 360.0);
    if (gmstInDegrees < 0) gmstInDegrees += 360.0;

    return gmstInDegrees * DEGREES_TO_RADIANS;
}

Vec3 eciToECEF(const Vec3 &eci, double gst) {
    double cosGST = std::cos(gst);
    double sinGST = std::sin(gst);

    return {
         eci.x * cosGST + eci.y * sinGST,
        -eci.x * sinGST + eci.y * cosGST,
         eci.z
    };
}

Vec3 GroundStation::toECEF() const {
    double lat = latitudeInDegrees * DEGREES_TO_RADIANS;
    double lon = longitudeInDegrees * DEGREES_TO_RADIANS;
    double sinLat = std::sin(lat);
    double cosLat = std::cos(lat);
    double sinLon = std::sin(lon);
    double cosLon = std::cos(lon);

    // Radius of curvature in the prime vertical
    double N = WGS84_A / std::sqrt(1.0 - WGS84_E2 * sinLat * sinLat);

    // The (1 - e²) factor in Z accounts for the ellipsoid's polar flattening
    return {
        (N + heightInKilometers) * cosLat * cosLon,
        (N + heightInKilometers) * cosLat * sinLon,
        (N * (1.0 - WGS84_E2) + heightInKilometers) * sinLat
    };
}

namespace {

// Rotate an ECEF difference vector into the station's ENU frame
Vec3 rotateToENU(const Vec3 &diff, const GroundStation &station) {
    double lat = station.latitudeInDegrees * DEGREES_TO_RADIANS;
    double lon = station.longitudeInDegrees * DEGREES_TO_RADIANS;
    double sinLat = std::sin(lat);
    double cosLat = std::cos(lat);
    double sinLon = std::sin(lon);
    double cosLon = std::cos(lon);

    double east  = -sinLon * diff.x + cosLon * diff.y;
    double north = -sinLat * cosLon * diff.x - sinLat * sinLon * diff.y + cosLat * diff.z;
    double up    =  cosLat * cosLon * diff.x + cosLat * sinLon * diff.y + sinLat * diff.z;

    return {east, north, up};
}

}

Vec3 ecefToENU(const Vec3 &targetECEF, const GroundStation &station) {
    return rotateToENU(targetECEF - station.toECEF(), station);
}

TopocentricSample toTopocentric(const Vec3 &position, const Vec3 &velocity, time_point timestamp,
                                const GroundStation &station, double maskInDegrees) {
    double gst = gmst(toJulianDate(timestamp));
    Vec3 satECEF = eciToECEF(position, gst);
    Vec3 enu = ecefToENU(satECEF, station);

    double range = enu.magnitude();
    double horizontal = std::hypot(enu.x, enu.y);

    double elevation = std::atan2(enu.z, horizontal) * RADIANS_TO_DEGREES;

    double azimuth = 0.0;
    if (horizontal >= AZIMUTH_EPSILON_KM) {
        // 0 = North, 90 = East, 180 = South, 270 = West
        azimuth = std::atan2(enu.x, enu.y) * RADIANS_TO_DEGREES;
        if (azimuth < 0.0) {
            azimuth += 360.0;
        }
        if (azimuth >= 360.0) {
            azimuth -= 360.0;
        }
    }

    // Earth-relative velocity in the inertial frame: v - ω × r
    Vec3 omega{0.0, 0.0, EARTH_ROTATION_RATE};
    Vec3 relativeVelocity = velocity - omega.cross(position);
    Vec3 velocityECEF = eciToECEF(relativeVelocity, gst);
    Vec3 velocityENU = rotateToENU(velocityECEF, station);

    double rangeRate = range > 0.0 ? velocityENU.dot(enu) / range : 0.0;

    return TopocentricSample{
        .timestamp = timestamp,
        .elevationInDegrees = elevation,
        .azimuthInDegrees = azimuth,
        .rangeInKilometers = range,
        .rangeRateInKmPerSecond = rangeRate,
        .visible = elevation >= maskInDegrees
    };
}

}
