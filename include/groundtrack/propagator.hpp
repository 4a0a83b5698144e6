/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDTRACK_PROPAGATOR_HPP
#define __GROUNDTRACK_PROPAGATOR_HPP

#include <groundtrack/elements.hpp>
#include <groundtrack/sgp4.hpp>

#include <chrono>
#include <cmath>
#include <functional>

namespace groundtrack {

// Astronomical constants
constexpr double J2000_JD = 2451545.0;                      // Julian Date of J2000.0 epoch
constexpr double UNIX_EPOCH_JD = 2440587.5;                 // Julian Date of 1970-01-01 00:00 UTC
constexpr double DAYS_PER_JULIAN_CENTURY = 36525.0;         // Days in a Julian century
constexpr double GMST_AT_J2000 = 280.46061837;              // GMST at J2000.0 epoch (degrees)
constexpr double EARTH_SIDEREAL_RATE = 360.98564736629;     // Earth's rotation rate (deg/day)

// IAU polynomial correction coefficients for long-term variations in Earth's rotation
constexpr double GMST_T2_COEFF = 0.000387933;
constexpr double GMST_T3_DIVISOR = 38710000.0;

// Degree-radian conversion factors
constexpr double DEGREES_TO_RADIANS = M_PI / 180.0;
constexpr double RADIANS_TO_DEGREES = 180.0 / M_PI;

// ============================================================================
// Basic Data Types
// ============================================================================

/**
 * An absolute UTC instant.
 */
using TimeInstant = std::chrono::system_clock::time_point;

/**
 * Sub-satellite point in degrees.
 */
struct GroundPoint {
    double latitude;    ///< -90 to +90, positive = North
    double longitude;   ///< (-180, +180], positive = East

    bool operator==(const GroundPoint&) const = default;
};

/**
 * 3D vector in Cartesian coordinates.
 */
struct Vec3 {
    double x, y, z;

    double magnitude() const {
        return std::sqrt(x*x + y*y + z*z);
    }
};

/**
 * Geodetic coordinates representing a position on or above Earth's surface.
 */
struct Geodetic {
    double latInRadians;      ///< Geodetic latitude (-π/2 to +π/2, positive = North)
    double lonInRadians;      ///< Longitude (-π to +π, positive = East)
    double altInKilometers;   ///< Altitude above the WGS84 ellipsoid surface
};

/**
 * The propagation capability consumed by the sampler: the sub-satellite point
 * of an element set at an instant. Implementations throw PropagationException
 * (or a subclass) when the element set or instant is unusable.
 */
using PropagateFunction = std::function<GroundPoint(const ElementSet&, TimeInstant)>;

// ============================================================================
// Coordinate System Transformations and Time Functions
// ============================================================================

/**
 * Converts a time_point to Julian Date.
 */
double toJulianDate(TimeInstant tp);

/**
 * Computes Greenwich Mean Sidereal Time (GMST) for a given Julian Date.
 * @return GMST in radians, normalized to [0, 2π)
 */
double gmst(double julianDate);

/**
 * Rotates an Earth-Centered Inertial (TEME) position into the Earth-Centered Earth-Fixed frame.
 */
Vec3 eciToECEF(const Vec3 &eci, double gst);

/**
 * Converts ECEF coordinates to WGS84 geodetic coordinates.
 */
Geodetic ecefToGeodetic(const Vec3 &ecef);

/**
 * Converts geodetic radians to a GroundPoint in degrees with longitude in (-180, 180].
 */
GroundPoint toGroundPoint(const Geodetic &geo);

// ============================================================================
// SGP4 Propagator
// ============================================================================

/**
 * Sub-satellite point propagator backed by the near-earth SGP4 model.
 *
 * The propagator holds no per-satellite state, so a single instance can be
 * shared between threads and used as a PropagateFunction.
 */
class SGP4Propagator {
public:
    static constexpr std::chrono::hours DEFAULT_MAX_EPOCH_OFFSET{24 * 30};

    explicit SGP4Propagator(std::chrono::hours maxEpochOffset = DEFAULT_MAX_EPOCH_OFFSET)
        : maxEpochOffset(maxEpochOffset) {}

    /**
     * Get the sub-satellite point at the given time.
     * @throws EpochOutOfRangeException if the time is too far from the element set epoch
     * @throws InvalidOrbitException if the orbital elements are invalid or deep-space
     * @throws SatelliteDecayedException if the satellite has decayed
     */
    GroundPoint operator()(const ElementSet &elements, TimeInstant when) const;

    /**
     * Get the position in TEME coordinates (km).
     */
    Vec3 getECI(const ElementSet &elements, TimeInstant when) const;

    /**
     * Get geodetic location (latitude, longitude, altitude) at a given time.
     */
    Geodetic getGeodeticLocation(const ElementSet &elements, TimeInstant when) const;

    std::chrono::hours getMaxEpochOffset() const { return maxEpochOffset; }

private:
    std::chrono::hours maxEpochOffset;

    sgp4::Result propagate(const ElementSet &elements, TimeInstant when) const;
};

}

#endif
