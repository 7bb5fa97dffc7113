/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATLINK_TOPOCENTRIC_HPP
#define __SATLINK_TOPOCENTRIC_HPP

#include <satlink/types.hpp>

namespace satlink {

// Time-related constants for sidereal time calculation
constexpr double J2000_JD = 2451545.0;                      // Julian Date of J2000.0 epoch
constexpr double DAYS_PER_JULIAN_CENTURY = 36525.0;         // Days in a Julian century
constexpr double GMST_AT_J2000 = 280.46061837;              // GMST at J2000.0 epoch (degrees)
constexpr double EARTH_SIDEREAL_RATE = 360.98564736629;     // Earth's rotation rate (deg/day)

// IAU 1982 GMST polynomial coefficients
constexpr double GMST_T2_COEFF = 0.000387933;   // Quadratic correction for precession (T² term)
constexpr double GMST_T3_DIVISOR = 38710000.0;  // Cubic correction divisor (T³ term)

// Below this horizontal distance (km) the azimuth is undefined and reported as 0
constexpr double AZIMUTH_EPSILON_KM = 1e-9;

/**
 * Convert a time point to a Julian Date.
 */
double toJulianDate(time_point tp);

/**
 * Greenwich Mean Sidereal Time in radians, [0, 2π).
 *
 * Uses the IAU 1982 polynomial only; polar motion, nutation and the
 * equation of the equinoxes are ignored. Accurate to a few arcseconds over
 * the planning horizons this library targets.
 *
 * @param julianDate Julian Date (UT1 ≈ UTC)
 */
double gmst(double julianDate);

/**
 * Rotate an inertial (TEME) vector into Earth-Centered Earth-Fixed
 * coordinates about the Z axis by the Greenwich sidereal angle.
 *
 * @param eci Inertial vector
 * @param gst Greenwich sidereal time in radians
 */
Vec3 eciToECEF(const Vec3 &eci, double gst);

/**
 * Transform an ECEF position into the East-North-Up frame of an observer.
 *
 * The ENU frame is a local tangent plane centered on the observer:
 *   - East:  tangent to the latitude circle, towards increasing longitude
 *   - North: tangent to the meridian, towards the pole
 *   - Up:    along the ellipsoid normal
 *
 * Rotation matrix (ECEF difference vector → ENU):
 *   ┌ E ┐   ┌ -sin(λ)          cos(λ)          0      ┐ ┌ Δx ┐
 *   │ N │ = │ -sin(φ)cos(λ)   -sin(φ)sin(λ)    cos(φ) │ │ Δy │
 *   └ U ┘   └  cos(φ)cos(λ)    cos(φ)sin(λ)    sin(φ) ┘ └ Δz ┘
 *
 * @param targetECEF Position of the target in ECEF (km)
 * @param station The observer
 * @return Vector from the observer to the target in ENU (km)
 */
Vec3 ecefToENU(const Vec3 &targetECEF, const GroundStation &station);

/**
 * Observer-relative view of a satellite.
 *
 * Elevation is atan2(up, horizontal) so the horizon and a zero-length line
 * of sight never divide by zero. Azimuth is clockwise from north and is
 * clamped to 0 when the satellite is (numerically) at the zenith. Range
 * rate projects the Earth-relative velocity onto the line of sight.
 *
 * @param position Inertial (TEME) position in km
 * @param velocity Inertial (TEME) velocity in km/s
 * @param timestamp Instant of the state vector
 * @param station The observer
 * @param maskInDegrees Elevation at or above which the sample is visible
 */
TopocentricSample toTopocentric(const Vec3 &position, const Vec3 &velocity, time_point timestamp,
                                const GroundStation &station, double maskInDegrees = 0.0);

inline TopocentricSample toTopocentric(const StateVector &state, const GroundStation &station,
                                       double maskInDegrees = 0.0) {
    return toTopocentric(state.position, state.velocity, state.timestamp, station, maskInDegrees);
}

}

#endif
