/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SKYFORGE_HOUSE_HPP
#define __SKYFORGE_HOUSE_HPP

#include <array>
#include <string_view>

namespace skyforge {

constexpr int HOUSE_COUNT = 12;
constexpr double HOUSE_WIDTH = 30.0;

constexpr std::array<std::string_view, HOUSE_COUNT> HOUSE_THEMES = {
    "Self & Identity",
    "Resources & Values",
    "Communication & Learning",
    "Home & Foundation",
    "Creativity & Joy",
    "Health & Service",
    "Partnerships & Relationships",
    "Transformation & Shared Resources",
    "Expansion & Philosophy",
    "Career & Public Image",
    "Community & Aspirations",
    "Spirituality & Release",
};

/**
 * Maps a solar arc (transit Sun minus natal Sun) to a house number.
 * The arc is normalized first; each house spans 30 degrees.
 * @return House number 1-12
 */
int houseForArc(double arcInDegrees);

/**
 * Returns the theme of a house.
 * @throws std::out_of_range if house is not in 1-12
 */
std::string_view houseTheme(int house);

} // namespace skyforge

#endif
