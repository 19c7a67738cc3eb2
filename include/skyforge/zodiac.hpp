/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SKYFORGE_ZODIAC_HPP
#define __SKYFORGE_ZODIAC_HPP

#include <array>
#include <iostream>
#include <string_view>

namespace skyforge {

constexpr double FULL_CIRCLE = 360.0;
constexpr double SIGN_WIDTH = 30.0;

enum class Element {
    FIRE,
    EARTH,
    AIR,
    WATER
};

std::ostream& operator<<(std::ostream &os, const Element &element);

enum class Modality {
    CARDINAL,
    FIXED,
    MUTABLE
};

std::ostream& operator<<(std::ostream &os, const Modality &modality);

/**
 * A zodiac sign with its classical element and modality.
 */
struct ZodiacSign {
    std::string_view name;
    Element element;
    Modality modality;
};

inline bool operator==(const ZodiacSign &a, const ZodiacSign &b) {
    return a.name == b.name;
}

/**
 * The twelve signs in ecliptic order, starting at 0 degrees.
 */
constexpr std::array<ZodiacSign, 12> ZODIAC_SIGNS = {{
    {"Aries",       Element::FIRE,  Modality::CARDINAL},
    {"Taurus",      Element::EARTH, Modality::FIXED},
    {"Gemini",      Element::AIR,   Modality::MUTABLE},
    {"Cancer",      Element::WATER, Modality::CARDINAL},
    {"Leo",         Element::FIRE,  Modality::FIXED},
    {"Virgo",       Element::EARTH, Modality::MUTABLE},
    {"Libra",       Element::AIR,   Modality::CARDINAL},
    {"Scorpio",     Element::WATER, Modality::FIXED},
    {"Sagittarius", Element::FIRE,  Modality::MUTABLE},
    {"Capricorn",   Element::EARTH, Modality::CARDINAL},
    {"Aquarius",    Element::AIR,   Modality::FIXED},
    {"Pisces",      Element::WATER, Modality::MUTABLE},
}};

/**
 * Wraps an angle in degrees into [0, 360).
 */
double normalizeDegrees(double degrees);

/**
 * Returns the sign occupied by an ecliptic longitude.
 * The longitude is normalized first, so any finite value is accepted.
 */
ZodiacSign signFor(double longitude);

/**
 * Returns the offset of a longitude within its sign, in [0, 30).
 */
double degreesInSign(double longitude);

} // namespace skyforge

#endif
