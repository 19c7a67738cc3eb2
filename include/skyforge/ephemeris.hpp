/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SKYFORGE_EPHEMERIS_HPP
#define __SKYFORGE_EPHEMERIS_HPP

#include <array>
#include <cmath>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <date/date.h>

namespace skyforge {

/** A calendar date (proleptic Gregorian). */
using Date = date::year_month_day;

// Astronomical constants
constexpr double J2000_JD = 2451545.0;          // Julian Date of 2000-01-01 12:00
constexpr double UNIX_EPOCH_JD = 2440587.5;     // Julian Date of 1970-01-01 00:00
constexpr double REFERENCE_HOUR = 12.0;         // Dates are evaluated at noon

// Degree-radian conversion factor
constexpr double DEGREES_TO_RADIANS = M_PI / 180.0;

// ============================================================================
// Ephemeris Exception Classes
// ============================================================================

/**
 * Thrown when a precise ephemeris backend fails to answer a query.
 */
class EphemerisException : public std::runtime_error {
public:
    explicit EphemerisException(const std::string& msg) : std::runtime_error(msg) {}
};

// ============================================================================
// Bodies
// ============================================================================

enum class Planet {
    SUN,
    MOON,
    MERCURY,
    VENUS,
    MARS,
    JUPITER,
    SATURN,
    URANUS,
    NEPTUNE,
    PLUTO
};

/** Every body the engine knows about, in report order. */
constexpr std::array<Planet, 10> ALL_PLANETS = {
    Planet::SUN, Planet::MOON, Planet::MERCURY, Planet::VENUS, Planet::MARS,
    Planet::JUPITER, Planet::SATURN, Planet::URANUS, Planet::NEPTUNE, Planet::PLUTO
};

std::string_view planetName(Planet planet);

/**
 * Looks up a planet by display name, ignoring case.
 * @return The planet, or std::nullopt if the name is not recognized
 */
std::optional<Planet> planetFromName(std::string_view name);

std::ostream& operator<<(std::ostream &os, const Planet &planet);

// ============================================================================
// Time Functions
// ============================================================================

/**
 * Converts a calendar date and UT hour to a Julian Day.
 */
double toJulianDay(const Date &d, double hour = REFERENCE_HOUR);

/**
 * Parses a date in YYYY-MM-DD format.
 * @throws std::invalid_argument if the string is not a valid date
 */
Date parseDate(const std::string &str);

/**
 * Returns the current UTC calendar date.
 */
Date today();

// ============================================================================
// Precise Ephemeris Backend
// ============================================================================

/**
 * A source of precise geocentric ecliptic longitudes.
 *
 * Implementations must be safe to call from multiple threads.
 */
class EphemerisBackend {
public:
    virtual ~EphemerisBackend() = default;

    /** Human readable backend name, used in logs. */
    virtual std::string getName() const = 0;

    /**
     * Returns the ecliptic longitude of a body in degrees.
     * @param julianDay Julian Day (UT)
     * @param body The body to query
     * @throws EphemerisException if the backend cannot compute the position
     */
    virtual double getLongitude(double julianDay, Planet body) const = 0;
};

/**
 * Acquires the process-wide precise ephemeris backend.
 *
 * The acquisition runs once per process. Later calls return the same handle
 * and ignore their argument. Returns nullptr when this build has no precise
 * backend, in which case callers run in degraded mode.
 *
 * @param ephemerisPath Directory holding ephemeris data files (may be empty)
 */
std::shared_ptr<const EphemerisBackend> acquireEphemerisBackend(const std::string &ephemerisPath = "");

} // namespace skyforge

#endif
