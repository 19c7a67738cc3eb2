/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <skyforge/solar.hpp>
#include <skyforge/zodiac.hpp>

#include <cmath>

namespace skyforge {

double approximateSunLongitude(const Date &d) {
    // Days since J2000.0, anchored at noon so d is a whole number
    double days = toJulianDay(d, REFERENCE_HOUR) - J2000_JD;

    double meanLongitude = normalizeDegrees(
        SUN_MEAN_LONGITUDE_AT_J2000 + SUN_MEAN_LONGITUDE_RATE * days);

    double meanAnomaly = normalizeDegrees(
        SUN_MEAN_ANOMALY_AT_J2000 + SUN_MEAN_ANOMALY_RATE * days) * DEGREES_TO_RADIANS;

    double equationOfCenter = SUN_CENTER_C1 * std::sin(meanAnomaly)
                            + SUN_CENTER_C2 * std::sin(2.0 * meanAnomaly)
                            + SUN_CENTER_C3 * std::sin(3.0 * meanAnomaly);

    return normalizeDegrees(meanLongitude + equationOfCenter);
}

} // namespace skyforge
