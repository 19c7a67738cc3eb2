/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <skyforge/house.hpp>
#include <skyforge/zodiac.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>

namespace skyforge {

int houseForArc(double arcInDegrees) {
    double arc = normalizeDegrees(arcInDegrees);
    int house = static_cast<int>(arc / HOUSE_WIDTH) + 1;
    // An arc a hair under 360 can still divide out to 13
    return std::min(house, HOUSE_COUNT);
}

std::string_view houseTheme(int house) {
    if (house < 1 || house > HOUSE_COUNT) {
        throw std::out_of_range("House must be between 1 and 12: " + std::to_string(house));
    }
    return HOUSE_THEMES[house - 1];
}

} // namespace skyforge
