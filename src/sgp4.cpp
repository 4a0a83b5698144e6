/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 *
 * Near-earth SGP4 propagation.
 * Based on the Vallado reference implementation from CelesTrak.
 * See: https://celestrak.org/software/vallado-sw.php
 */

#include <groundtrack/sgp4.hpp>

#include <cmath>
#include <format>

namespace groundtrack::sgp4 {

State initialize(const Elements& elements) {
    State state;
    state.epochJD = elements.epochJD;
    state.ecco = elements.eccentricity;
    state.inclo = elements.inclination;
    state.nodeo = elements.raan;
    state.argpo = elements.argPerigee;
    state.mo = elements.meanAnomaly;
    state.bstar = elements.bstar;

    if (elements.meanMotion <= 0.0) {
        throw InvalidOrbitException(std::format("Mean motion must be positive: {}", elements.meanMotion));
    }
    if (state.ecco >= 1.0 || state.ecco < 0.0) {
        throw InvalidOrbitException(std::format("Eccentricity out of range: {}", state.ecco));
    }

    // Recover the original (un-Kozai) mean motion and semi-major axis
    double cosio = std::cos(state.inclo);
    double sinio = std::sin(state.inclo);
    double cosio2 = cosio * cosio;
    double omeosq = 1.0 - state.ecco * state.ecco;
    double rteosq = std::sqrt(omeosq);

    double ak = std::pow(XKE / elements.meanMotion, X2O3);
    double d1 = 0.75 * J2 * (3.0 * cosio2 - 1.0) / (rteosq * omeosq);
    double del = d1 / (ak * ak);
    double adel = ak * (1.0 - del * del - del * (1.0 / 3.0 + 134.0 * del * del / 81.0));
    del = d1 / (adel * adel);
    state.noUnkozai = elements.meanMotion / (1.0 + del);

    if (TWO_PI / state.noUnkozai >= DEEP_SPACE_PERIOD_MINUTES) {
        throw InvalidOrbitException(std::format(
            "Deep-space orbits (period {:.1f} min) are not supported", TWO_PI / state.noUnkozai));
    }

    double ao = std::pow(XKE / state.noUnkozai, X2O3);
    double rp = ao * (1.0 - state.ecco);
    if (rp < 1.0) {
        throw SatelliteDecayedException();
    }

    state.isimp = rp < (220.0 / RADIUS_EARTH_KM + 1.0);

    // Atmospheric density parameters, adjusted for low perigees
    double sfour = 78.0 / RADIUS_EARTH_KM + 1.0;
    double qzms24 = std::pow((120.0 - 78.0) / RADIUS_EARTH_KM, 4);
    double perige = (rp - 1.0) * RADIUS_EARTH_KM;
    if (perige < 156.0) {
        double s = perige < 98.0 ? 20.0 : perige - 78.0;
        qzms24 = std::pow((120.0 - s) / RADIUS_EARTH_KM, 4);
        sfour = s / RADIUS_EARTH_KM + 1.0;
    }

    double po = ao * omeosq;
    double pinvsq = 1.0 / (po * po);
    double tsi = 1.0 / (ao - sfour);
    state.eta = ao * state.ecco * tsi;
    double etasq = state.eta * state.eta;
    double eeta = state.ecco * state.eta;
    double psisq = std::abs(1.0 - etasq);
    double coef = qzms24 * std::pow(tsi, 4);
    double coef1 = coef / std::pow(psisq, 3.5);

    state.con41 = 3.0 * cosio2 - 1.0;
    state.x1mth2 = 1.0 - cosio2;
    state.x7thm1 = 7.0 * cosio2 - 1.0;

    double cc2 = coef1 * state.noUnkozai
        * (ao * (1.0 + 1.5 * etasq + eeta * (4.0 + etasq))
           + 0.375 * J2 * tsi / psisq * state.con41 * (8.0 + 3.0 * etasq * (8.0 + etasq)));
    state.cc1 = state.bstar * cc2;
    double cc3 = 0.0;
    if (state.ecco > 1.0e-4) {
        cc3 = -2.0 * coef * tsi * J3OJ2 * state.noUnkozai * sinio / state.ecco;
    }
    state.cc4 = 2.0 * state.noUnkozai * coef1 * ao * omeosq
        * (state.eta * (2.0 + 0.5 * etasq) + state.ecco * (0.5 + 2.0 * etasq)
           - J2 * tsi / (ao * psisq)
             * (-3.0 * state.con41 * (1.0 - 2.0 * eeta + etasq * (1.5 - 0.5 * eeta))
                + 0.75 * state.x1mth2 * (2.0 * etasq - eeta * (1.0 + etasq)) * std::cos(2.0 * state.argpo)));
    state.cc5 = 2.0 * coef1 * ao * omeosq * (1.0 + 2.75 * (etasq + eeta) + eeta * etasq);

    // Secular rates
    double cosio4 = cosio2 * cosio2;
    double temp1 = 1.5 * J2 * pinvsq * state.noUnkozai;
    double temp2 = 0.5 * temp1 * J2 * pinvsq;
    double temp3 = -0.46875 * J4 * pinvsq * pinvsq * state.noUnkozai;
    state.mdot = state.noUnkozai + 0.5 * temp1 * rteosq * state.con41
        + 0.0625 * temp2 * rteosq * (13.0 - 78.0 * cosio2 + 137.0 * cosio4);
    state.argpdot = -0.5 * temp1 * (1.0 - 5.0 * cosio2)
        + 0.0625 * temp2 * (7.0 - 114.0 * cosio2 + 395.0 * cosio4)
        + temp3 * (3.0 - 36.0 * cosio2 + 49.0 * cosio4);
    double xhdot1 = -temp1 * cosio;
    state.nodedot = xhdot1 + (0.5 * temp2 * (4.0 - 19.0 * cosio2) + 2.0 * temp3 * (3.0 - 7.0 * cosio2)) * cosio;

    state.omgcof = state.bstar * cc3 * std::cos(state.argpo);
    if (state.ecco > 1.0e-4) {
        state.xmcof = -X2O3 * coef * state.bstar / eeta;
    }
    state.nodecf = 3.5 * omeosq * xhdot1 * state.cc1;
    state.t2cof = 1.5 * state.cc1;

    // Avoid a division by zero for inclinations of exactly 180 degrees
    double denom = std::abs(cosio + 1.0) > 1.5e-12 ? 1.0 + cosio : 1.5e-12;
    state.xlcof = -0.25 * J3OJ2 * sinio * (3.0 + 5.0 * cosio) / denom;
    state.aycof = -0.5 * J3OJ2 * sinio;

    state.delmo = std::pow(1.0 + state.eta * std::cos(state.mo), 3);
    state.sinmao = std::sin(state.mo);

    if (!state.isimp) {
        double cc1sq = state.cc1 * state.cc1;
        state.d2 = 4.0 * ao * tsi * cc1sq;
        double temp = state.d2 * tsi * state.cc1 / 3.0;
        state.d3 = (17.0 * ao + sfour) * temp;
        state.d4 = 0.5 * temp * ao * tsi * (221.0 * ao + 31.0 * sfour) * state.cc1;
        state.t3cof = state.d2 + 2.0 * cc1sq;
        state.t4cof = 0.25 * (3.0 * state.d3 + state.cc1 * (12.0 * state.d2 + 10.0 * cc1sq));
        state.t5cof = 0.2 * (3.0 * state.d4 + 12.0 * state.cc1 * state.d3
            + 6.0 * state.d2 * state.d2 + 15.0 * cc1sq * (2.0 * state.d2 + cc1sq));
    }

    return state;
}

Result propagate(const State& state, double tsince) {
    // Secular gravity and atmospheric drag
    double xmdf = state.mo + state.mdot * tsince;
    double argpdf = state.argpo + state.argpdot * tsince;
    double nodedf = state.nodeo + state.nodedot * tsince;
    double argpm = argpdf;
    double mm = xmdf;
    double t2 = tsince * tsince;
    double nodem = nodedf + state.nodecf * t2;
    double tempa = 1.0 - state.cc1 * tsince;
    double tempe = state.bstar * state.cc4 * tsince;
    double templ = state.t2cof * t2;

    if (!state.isimp) {
        double delomg = state.omgcof * tsince;
        double delm = state.xmcof * (std::pow(1.0 + state.eta * std::cos(xmdf), 3) - state.delmo);
        double temp = delomg + delm;
        mm = xmdf + temp;
        argpm = argpdf - temp;
        double t3 = t2 * tsince;
        double t4 = t3 * tsince;
        tempa = tempa - state.d2 * t2 - state.d3 * t3 - state.d4 * t4;
        tempe = tempe + state.bstar * state.cc5 * (std::sin(mm) - state.sinmao);
        templ = templ + state.t3cof * t3 + t4 * (state.t4cof + tsince * state.t5cof);
    }

    double am = std::pow(XKE / state.noUnkozai, X2O3) * tempa * tempa;
    double nm = XKE / std::pow(am, 1.5);
    double em = state.ecco - tempe;

    if (em >= 1.0 || em < -0.001) {
        throw InvalidOrbitException(std::format("Eccentricity out of range during propagation: {}", em));
    }
    if (em < 1.0e-6) {
        em = 1.0e-6;
    }

    mm = mm + state.noUnkozai * templ;
    double xlm = std::fmod(mm + argpm + nodem, TWO_PI);
    nodem = std::fmod(nodem, TWO_PI);
    argpm = std::fmod(argpm, TWO_PI);
    mm = std::fmod(xlm - argpm - nodem, TWO_PI);

    double sinip = std::sin(state.inclo);
    double cosip = std::cos(state.inclo);

    // Long period periodics
    double axnl = em * std::cos(argpm);
    double temp = 1.0 / (am * (1.0 - em * em));
    double aynl = em * std::sin(argpm) + temp * state.aycof;
    double xl = mm + argpm + nodem + temp * state.xlcof * axnl;

    // Solve Kepler's equation
    double u = std::fmod(xl - nodem, TWO_PI);
    double eo1 = u;
    double tem5 = 9999.9;
    double sineo1 = 0.0;
    double coseo1 = 0.0;
    for (int ktr = 1; std::abs(tem5) >= 1.0e-12 && ktr <= 10; ktr++) {
        sineo1 = std::sin(eo1);
        coseo1 = std::cos(eo1);
        tem5 = 1.0 - coseo1 * axnl - sineo1 * aynl;
        tem5 = (u - aynl * coseo1 + axnl * sineo1 - eo1) / tem5;
        if (std::abs(tem5) >= 0.95) {
            tem5 = tem5 > 0.0 ? 0.95 : -0.95;
        }
        eo1 = eo1 + tem5;
    }

    // Short period preliminary quantities
    double ecose = axnl * coseo1 + aynl * sineo1;
    double esine = axnl * sineo1 - aynl * coseo1;
    double el2 = axnl * axnl + aynl * aynl;
    double pl = am * (1.0 - el2);
    if (pl < 0.0) {
        throw InvalidOrbitException("Semi-latus rectum is negative");
    }

    double rl = am * (1.0 - ecose);
    double rdotl = std::sqrt(am) * esine / rl;
    double rvdotl = std::sqrt(pl) / rl;
    double betal = std::sqrt(1.0 - el2);
    temp = esine / (1.0 + betal);
    double sinu = am / rl * (sineo1 - aynl - axnl * temp);
    double cosu = am / rl * (coseo1 - axnl + aynl * temp);
    double su = std::atan2(sinu, cosu);
    double sin2u = (cosu + cosu) * sinu;
    double cos2u = 1.0 - 2.0 * sinu * sinu;
    temp = 1.0 / pl;
    double temp1 = 0.5 * J2 * temp;
    double temp2 = temp1 * temp;

    // Short period periodics
    double mrt = rl * (1.0 - 1.5 * temp2 * betal * state.con41) + 0.5 * temp1 * state.x1mth2 * cos2u;
    su = su - 0.25 * temp2 * state.x7thm1 * sin2u;
    double xnode = nodem + 1.5 * temp2 * cosip * sin2u;
    double xinc = state.inclo + 1.5 * temp2 * cosip * sinip * cos2u;
    double mvt = rdotl - nm * temp1 * state.x1mth2 * sin2u / XKE;
    double rvdot = rvdotl + nm * temp1 * (state.x1mth2 * cos2u + 1.5 * state.con41) / XKE;

    if (mrt < 1.0) {
        throw SatelliteDecayedException();
    }

    // Orientation vectors
    double sinsu = std::sin(su);
    double cossu = std::cos(su);
    double snod = std::sin(xnode);
    double cnod = std::cos(xnode);
    double sini = std::sin(xinc);
    double cosi = std::cos(xinc);
    double xmx = -snod * cosi;
    double xmy = cnod * cosi;
    double ux = xmx * sinsu + cnod * cossu;
    double uy = xmy * sinsu + snod * cossu;
    double uz = sini * sinsu;
    double vx = xmx * cossu - cnod * sinsu;
    double vy = xmy * cossu - snod * sinsu;
    double vz = sini * cossu;

    Result result;
    result.r[0] = mrt * ux * RADIUS_EARTH_KM;
    result.r[1] = mrt * uy * RADIUS_EARTH_KM;
    result.r[2] = mrt * uz * RADIUS_EARTH_KM;
    result.v[0] = (mvt * ux + rvdot * vx) * VKMPERSEC;
    result.v[1] = (mvt * uy + rvdot * vy) * VKMPERSEC;
    result.v[2] = (mvt * uz + rvdot * vz) * VKMPERSEC;
    return result;
}

}
