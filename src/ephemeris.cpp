/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <skyforge/ephemeris.hpp>

#ifdef SKYFORGE_HAVE_SWISSEPH
#include <skyforge/swiss_ephemeris.hpp>
#endif

#include <algorithm>
#include <cctype>
#include <chrono>
#include <sstream>

#include <spdlog/spdlog.h>

using spdlog::info;
using spdlog::warn;

namespace skyforge {

std::string_view planetName(Planet planet) {
    switch (planet) {
        case Planet::SUN: return "Sun";
        case Planet::MOON: return "Moon";
        case Planet::MERCURY: return "Mercury";
        case Planet::VENUS: return "Venus";
        case Planet::MARS: return "Mars";
        case Planet::JUPITER: return "Jupiter";
        case Planet::SATURN: return "Saturn";
        case Planet::URANUS: return "Uranus";
        case Planet::NEPTUNE: return "Neptune";
        case Planet::PLUTO: return "Pluto";
    }
    return "Unknown";
}

std::optional<Planet> planetFromName(std::string_view name) {
    auto equalsIgnoreCase = [](std::string_view a, std::string_view b) {
        return std::equal(a.begin(), a.end(), b.begin(), b.end(),
            [](char x, char y) {
                return std::tolower(static_cast<unsigned char>(x)) ==
                       std::tolower(static_cast<unsigned char>(y));
            });
    };
    for (auto planet : ALL_PLANETS) {
        if (equalsIgnoreCase(planetName(planet), name)) {
            return planet;
        }
    }
    return std::nullopt;
}

std::ostream& operator<<(std::ostream &os, const Planet &planet) {
    os << planetName(planet);
    return os;
}

double toJulianDay(const Date &d, double hour) {
    auto daysSinceEpoch = date::sys_days{d}.time_since_epoch().count();
    return UNIX_EPOCH_JD + static_cast<double>(daysSinceEpoch) + hour / 24.0;
}

Date parseDate(const std::string &str) {
    std::istringstream in(str);
    date::sys_days days;
    in >> date::parse("%Y-%m-%d", days);
    if (in.fail()) {
        throw std::invalid_argument("Invalid date format (expected YYYY-MM-DD): " + str);
    }
    return Date{days};
}

Date today() {
    return Date{date::floor<date::days>(std::chrono::system_clock::now())};
}

std::shared_ptr<const EphemerisBackend> acquireEphemerisBackend(const std::string &ephemerisPath) {
    static const std::shared_ptr<const EphemerisBackend> backend =
        [&ephemerisPath]() -> std::shared_ptr<const EphemerisBackend> {
#ifdef SKYFORGE_HAVE_SWISSEPH
            auto swiss = std::make_shared<SwissEphemeris>(ephemerisPath);
            info("Using {} backend", swiss->getName());
            return swiss;
#else
            warn("No precise ephemeris backend in this build, ignoring path '{}'; "
                 "positions are approximate and limited to the Sun", ephemerisPath);
            return nullptr;
#endif
        }();
    return backend;
}

} // namespace skyforge
