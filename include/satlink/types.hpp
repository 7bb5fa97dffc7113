/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATLINK_TYPES_HPP
#define __SATLINK_TYPES_HPP

#include <chrono>
#include <cmath>
#include <numbers>

namespace satlink {

using time_point = std::chrono::system_clock::time_point;

// Degree-radian conversion factors
constexpr double DEGREES_TO_RADIANS = std::numbers::pi / 180.0;
constexpr double RADIANS_TO_DEGREES = 180.0 / std::numbers::pi;

// WGS84 ellipsoid constants
constexpr double WGS84_A = 6378.137;                  // Semi-major axis (km) - equatorial radius
constexpr double WGS84_F = 1.0 / 298.257223563;       // Flattening
constexpr double WGS84_E2 = WGS84_F * (2 - WGS84_F);  // Eccentricity squared ≈ 0.00669437999014

// Earth's rotation rate in the inertial frame (rad/s)
constexpr double EARTH_ROTATION_RATE = 7.2921150e-5;

// ============================================================================
// Basic Data Types
// ============================================================================

/**
 * 3D vector in Cartesian coordinates.
 */
struct Vec3 {
    double x, y, z;

    Vec3 operator+(const Vec3& other) const {
        return {x + other.x, y + other.y, z + other.z};
    }

    Vec3 operator-(const Vec3& other) const {
        return {x - other.x, y - other.y, z - other.z};
    }

    Vec3 operator*(double scalar) const {
        return {x * scalar, y * scalar, z * scalar};
    }

    double magnitude() const {
        return std::sqrt(x*x + y*y + z*z);
    }

    double dot(const Vec3& other) const {
        return x * other.x + y * other.y + z * other.z;
    }

    Vec3 cross(const Vec3& other) const {
        return {
            y * other.z - z * other.y,
            z * other.x - x * other.z,
            x * other.y - y * other.x
        };
    }
};

/**
 * A fixed observer on or near the Earth's surface.
 */
struct GroundStation {
    double latitudeInDegrees;     ///< Geodetic latitude, [-90, 90], positive = North
    double longitudeInDegrees;    ///< Longitude, [-180, 180], positive = East
    double heightInKilometers;    ///< Height above the WGS84 ellipsoid (may be negative)

    /**
     * Position of the station in Earth-Centered Earth-Fixed coordinates (km).
     */
    Vec3 toECEF() const;
};

/**
 * Inertial (TEME) state of a satellite at an instant.
 */
struct StateVector {
    time_point timestamp;
    Vec3 position;    ///< km
    Vec3 velocity;    ///< km/s
};

/**
 * Observer-relative view of a satellite at an instant.
 */
struct TopocentricSample {
    time_point timestamp;
    double elevationInDegrees;            ///< Angle above the local horizontal plane
    double azimuthInDegrees;              ///< Clockwise from north, [0, 360)
    double rangeInKilometers;             ///< Slant range
    double rangeRateInKmPerSecond;        ///< Positive when the satellite is receding
    bool visible;                         ///< elevation >= the mask used to build the sample
};

/**
 * A single visibility window above the elevation mask.
 */
struct PassWindow {
    time_point riseTime;
    time_point setTime;
    time_point maxElevationTime;
    double maxElevationInDegrees;
    double durationInSeconds;             ///< Exactly setTime - riseTime
    bool truncated = false;               ///< Clipped by the start or end of the search window
};

/**
 * Link quality at one instant of a margin series.
 */
struct MarginSample {
    time_point timestamp;
    double snrInDb;
    double marginInDb;
    double rangeInKilometers;
    double elevationInDegrees;
    double azimuthInDegrees;
};

}

#endif
