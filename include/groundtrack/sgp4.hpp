/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 *
 * Near-earth SGP4 propagation.
 * Based on the Vallado reference implementation from CelesTrak.
 * See: https://celestrak.org/software/vallado-sw.php
 */

#ifndef __GROUNDTRACK_SGP4_HPP
#define __GROUNDTRACK_SGP4_HPP

#include <groundtrack/errors.hpp>

#include <cmath>

namespace groundtrack::sgp4 {

// WGS-72 constants used by SGP4
constexpr double RADIUS_EARTH_KM = 6378.135;       // Earth equatorial radius (km)
constexpr double J2 = 0.001082616;                 // Second gravitational zonal harmonic
constexpr double J3 = -0.00000253881;              // Third gravitational zonal harmonic
constexpr double J4 = -0.00000165597;              // Fourth gravitational zonal harmonic
constexpr double J3OJ2 = J3 / J2;
constexpr double XKE = 0.0743669161331734132;      // sqrt(GM) in Earth radii^1.5/min
constexpr double VKMPERSEC = 7.905366149846074;    // km/s per velocity unit
constexpr double TWO_PI = 2.0 * M_PI;
constexpr double X2O3 = 2.0 / 3.0;

// Orbits with a period at or above this need the deep-space (SDP4) model
constexpr double DEEP_SPACE_PERIOD_MINUTES = 225.0;

/**
 * Mean elements at epoch, in SGP4 units.
 */
struct Elements {
    double epochJD;            ///< Epoch as Julian Date
    double bstar;              ///< BSTAR drag term
    double inclination;        ///< Inclination (radians)
    double raan;               ///< Right ascension of ascending node (radians)
    double eccentricity;       ///< Eccentricity
    double argPerigee;         ///< Argument of perigee (radians)
    double meanAnomaly;        ///< Mean anomaly (radians)
    double meanMotion;         ///< Kozai mean motion (radians/minute)
};

/**
 * Coefficients precomputed from the mean elements.
 */
struct State {
    double epochJD = 0.0;

    bool isimp = false;           // Simplified drag model for perigee below 220 km

    double ecco = 0.0;
    double inclo = 0.0;
    double nodeo = 0.0;
    double argpo = 0.0;
    double mo = 0.0;
    double bstar = 0.0;
    double noUnkozai = 0.0;

    double aycof = 0.0;
    double con41 = 0.0;
    double cc1 = 0.0, cc4 = 0.0, cc5 = 0.0;
    double d2 = 0.0, d3 = 0.0, d4 = 0.0;
    double delmo = 0.0;
    double eta = 0.0;
    double argpdot = 0.0;
    double omgcof = 0.0;
    double sinmao = 0.0;
    double t2cof = 0.0, t3cof = 0.0, t4cof = 0.0, t5cof = 0.0;
    double x1mth2 = 0.0;
    double x7thm1 = 0.0;
    double mdot = 0.0;
    double nodedot = 0.0;
    double xlcof = 0.0;
    double xmcof = 0.0;
    double nodecf = 0.0;
};

/**
 * Position (km) and velocity (km/s) in the TEME frame.
 */
struct Result {
    double r[3];
    double v[3];
};

/**
 * Compute the propagation coefficients for a set of mean elements.
 *
 * @throws InvalidOrbitException if the elements are out of range or need the deep-space model
 * @throws SatelliteDecayedException if the perigee is below the Earth's surface
 */
State initialize(const Elements& elements);

/**
 * Propagate to a time offset from the epoch.
 *
 * @param tsince Minutes since epoch
 * @throws InvalidOrbitException if the perturbed elements become invalid
 * @throws SatelliteDecayedException if the satellite has decayed by that time
 */
Result propagate(const State& state, double tsince);

}

#endif
