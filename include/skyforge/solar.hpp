/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 *
 * Low-accuracy solar position from the Astronomical Almanac.
 * See: https://aa.usno.navy.mil/faq/sun_approx
 */

#ifndef __SKYFORGE_SOLAR_HPP
#define __SKYFORGE_SOLAR_HPP

#include <skyforge/ephemeris.hpp>

namespace skyforge {

// Mean longitude of the Sun: L0 = L0_AT_J2000 + L0_RATE * d (degrees)
constexpr double SUN_MEAN_LONGITUDE_AT_J2000 = 280.46646;
constexpr double SUN_MEAN_LONGITUDE_RATE = 0.9856474;      // deg/day

// Mean anomaly of the Sun: M = M_AT_J2000 + M_RATE * d (degrees)
constexpr double SUN_MEAN_ANOMALY_AT_J2000 = 357.52911;
constexpr double SUN_MEAN_ANOMALY_RATE = 0.9856003;        // deg/day

// Equation of center coefficients for sin(M), sin(2M), sin(3M) (degrees)
constexpr double SUN_CENTER_C1 = 1.9146;
constexpr double SUN_CENTER_C2 = 0.0200;
constexpr double SUN_CENTER_C3 = 0.0003;

/**
 * Computes the Sun's ecliptic longitude at noon UT on a date using the
 * closed-form low-accuracy formula.
 *
 * Good to about one degree within a few centuries of J2000, degrading
 * slowly outside that range. Never fails.
 *
 * @return Longitude in degrees [0, 360)
 */
double approximateSunLongitude(const Date &d);

} // namespace skyforge

#endif
