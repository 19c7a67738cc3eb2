/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <skyforge/swiss_ephemeris.hpp>
#include <skyforge/zodiac.hpp>

#include <swephexp.h>

#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::info;
using spdlog::warn;

namespace skyforge {

static int32 toSwissBody(Planet planet) {
    switch (planet) {
        case Planet::SUN: return SE_SUN;
        case Planet::MOON: return SE_MOON;
        case Planet::MERCURY: return SE_MERCURY;
        case Planet::VENUS: return SE_VENUS;
        case Planet::MARS: return SE_MARS;
        case Planet::JUPITER: return SE_JUPITER;
        case Planet::SATURN: return SE_SATURN;
        case Planet::URANUS: return SE_URANUS;
        case Planet::NEPTUNE: return SE_NEPTUNE;
        case Planet::PLUTO: return SE_PLUTO;
    }
    throw EphemerisException("Unsupported body for Swiss Ephemeris");
}

SwissEphemeris::SwissEphemeris(const std::string &ephemerisPath) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ephemerisPath.empty()) {
        // Use the library's compiled-in default search path
        swe_set_ephe_path(nullptr);
    } else {
        swe_set_ephe_path(ephemerisPath.c_str());
    }
    char version[AS_MAXCH];
    swe_version(version);
    info("Swiss Ephemeris {} initialized (path: '{}')", version, ephemerisPath);
}

SwissEphemeris::~SwissEphemeris() {
    std::lock_guard<std::mutex> lock(mutex_);
    swe_close();
}

std::string SwissEphemeris::getName() const {
    return "Swiss Ephemeris";
}

double SwissEphemeris::getLongitude(double julianDay, Planet body) const {
    double xx[6] = {0.0};
    char serr[AS_MAXCH] = {0};
    int32 flags = SEFLG_SWIEPH;

    int32 rc;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        rc = swe_calc_ut(julianDay, toSwissBody(body), flags, xx, serr);
    }

    if (rc < 0) {
        throw EphemerisException(std::string("swe_calc_ut failed for ") +
            std::string(planetName(body)) + " at JD " + std::to_string(julianDay) + ": " + serr);
    }
    if (serr[0] != '\0') {
        // Non-fatal: typically a fallback to the Moshier model
        bool first = false;
        std::call_once(diagnosticLogged_, [&first] { first = true; });
        if (first) {
            warn("Swiss Ephemeris: {}", serr);
        } else {
            debug("Swiss Ephemeris: {}", serr);
        }
    }

    double longitude = normalizeDegrees(xx[0]);
    debug("Swiss Ephemeris: {} at JD {:.1f} = {:.4f} deg", planetName(body), julianDay, longitude);
    return longitude;
}

} // namespace skyforge
