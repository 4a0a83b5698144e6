/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundtrack/propagator.hpp>

#include <chrono>
#include <cmath>
#include <format>

#include <date/date.h>

namespace groundtrack {

// WGS84 ellipsoid constants
constexpr double WGS84_A = 6378.137;              // Semi-major axis (km) - equatorial radius
constexpr double WGS84_F = 1.0 / 298.257223563;   // Flattening
constexpr double WGS84_E2 = WGS84_F * (2 - WGS84_F);  // Eccentricity squared

double toJulianDate(TimeInstant tp) {
    using namespace std::chrono;

    auto daysSinceEpoch = duration_cast<duration<double, days::period>>(
        tp.time_since_epoch()
    ).count();

    return UNIX_EPOCH_JD + daysSinceEpoch;
}

double gmst(double julianDate) {
    // Julian centuries since J2000.0
    double T = (julianDate - J2000_JD) / DAYS_PER_JULIAN_CENTURY;

    double gmstInDegrees = GMST_AT_J2000
                    + EARTH_SIDEREAL_RATE * (julianDate - J2000_JD)
                    + GMST_T2_COEFF * T * T
                    - T * T * T / GMST_T3_DIVISOR;

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

Geodetic ecefToGeodetic(const Vec3 &ecef) {
    double x = ecef.x, y = ecef.y, z = ecef.z;
    double lon = std::atan2(y, x);
    double p = std::sqrt(x*x + y*y);

    // Iterative latitude calculation (Bowring's method)
    double lat = std::atan2(z, p * (1 - WGS84_E2));
    for (int i = 0; i < 10; ++i) {
        double sinLat = std::sin(lat);
        double N = WGS84_A / std::sqrt(1 - WGS84_E2 * sinLat * sinLat);
        lat = std::atan2(z + WGS84_E2 * N * sinLat, p);
    }

    double sinLat = std::sin(lat);
    double N = WGS84_A / std::sqrt(1 - WGS84_E2 * sinLat * sinLat);
    double alt = p / std::cos(lat) - N;

    return {lat, lon, alt};
}

GroundPoint toGroundPoint(const Geodetic &geo) {
    double lat = geo.latInRadians * RADIANS_TO_DEGREES;
    double lon = geo.lonInRadians * RADIANS_TO_DEGREES;
    if (lon <= -180.0) {
        lon += 360.0;
    } else if (lon > 180.0) {
        lon -= 360.0;
    }
    return {lat, lon};
}

sgp4::Result SGP4Propagator::propagate(const ElementSet &elements, TimeInstant when) const {
    auto offset = when - elements.getEpoch();
    if (offset > maxEpochOffset || offset < -maxEpochOffset) {
        auto epoch = std::chrono::floor<std::chrono::seconds>(elements.getEpoch());
        auto requested = std::chrono::floor<std::chrono::seconds>(when);
        throw EpochOutOfRangeException(std::format(
            "Requested time {} is more than {} days from the element set epoch {} of catalog id {}",
            date::format("%F %T UTC", requested), maxEpochOffset.count() / 24,
            date::format("%F %T UTC", epoch), elements.getCatalogId()));
    }

    sgp4::State state = sgp4::initialize({
        .epochJD = toJulianDate(elements.getEpoch()),
        .bstar = elements.getBstarDragTerm(),
        .inclination = elements.getInclination() * DEGREES_TO_RADIANS,
        .raan = elements.getRightAscensionOfAscendingNode() * DEGREES_TO_RADIANS,
        .eccentricity = elements.getEccentricity(),
        .argPerigee = elements.getArgumentOfPerigee() * DEGREES_TO_RADIANS,
        .meanAnomaly = elements.getMeanAnomaly() * DEGREES_TO_RADIANS,
        .meanMotion = elements.getMeanMotion() * sgp4::TWO_PI / 1440.0
    });

    double tsince = std::chrono::duration<double, std::ratio<60>>(offset).count();
    return sgp4::propagate(state, tsince);
}

Vec3 SGP4Propagator::getECI(const ElementSet &elements, TimeInstant when) const {
    auto result = propagate(elements, when);
    return {result.r[0], result.r[1], result.r[2]};
}

Geodetic SGP4Propagator::getGeodeticLocation(const ElementSet &elements, TimeInstant when) const {
    Vec3 eci = getECI(elements, when);
    Vec3 ecef = eciToECEF(eci, gmst(toJulianDate(when)));
    return ecefToGeodetic(ecef);
}

GroundPoint SGP4Propagator::operator()(const ElementSet &elements, TimeInstant when) const {
    return toGroundPoint(getGeodeticLocation(elements, when));
}

}
