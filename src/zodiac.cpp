/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <skyforge/zodiac.hpp>

#include <cmath>

namespace skyforge {

std::ostream& operator<<(std::ostream &os, const Element &element) {
    switch (element) {
        case Element::FIRE:
            os << "Fire";
            break;
        case Element::EARTH:
            os << "Earth";
            break;
        case Element::AIR:
            os << "Air";
            break;
        case Element::WATER:
            os << "Water";
            break;
    }
    return os;
}

std::ostream& operator<<(std::ostream &os, const Modality &modality) {
    switch (modality) {
        case Modality::CARDINAL:
            os << "Cardinal";
            break;
        case Modality::FIXED:
            os << "Fixed";
            break;
        case Modality::MUTABLE:
            os << "Mutable";
            break;
    }
    return os;
}

double normalizeDegrees(double degrees) {
    double result = std::fmod(degrees, FULL_CIRCLE);
    if (result < 0) result += FULL_CIRCLE;
    // A tiny negative input can round up to exactly 360 after the shift
    if (result >= FULL_CIRCLE) result = 0.0;
    return result;
}

ZodiacSign signFor(double longitude) {
    auto index = static_cast<size_t>(normalizeDegrees(longitude) / SIGN_WIDTH);
    return ZODIAC_SIGNS[index % ZODIAC_SIGNS.size()];
}

double degreesInSign(double longitude) {
    return std::fmod(normalizeDegrees(longitude), SIGN_WIDTH);
}

} // namespace skyforge
