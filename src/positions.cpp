/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <skyforge/positions.hpp>
#include <skyforge/zodiac.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>

namespace skyforge {

PositionSet::PositionSet(std::initializer_list<PlanetPosition> positions) {
    for (const auto &p : positions) {
        insert(p.planet, p.longitude);
    }
}

void PositionSet::insert(Planet planet, double longitude) {
    double normalized = normalizeDegrees(longitude);
    auto it = std::find_if(positions_.begin(), positions_.end(),
        [planet](const PlanetPosition &p) { return p.planet == planet; });
    if (it != positions_.end()) {
        it->longitude = normalized;
        return;
    }
    positions_.push_back({planet, normalized});
}

bool PositionSet::contains(Planet planet) const {
    return std::any_of(positions_.begin(), positions_.end(),
        [planet](const PlanetPosition &p) { return p.planet == planet; });
}

double PositionSet::at(Planet planet) const {
    for (const auto &p : positions_) {
        if (p.planet == planet) {
            return p.longitude;
        }
    }
    throw std::out_of_range("No position for " + std::string(planetName(planet)));
}

PositionSet selectBodies(const PositionSet &positions, std::span<const Planet> bodies) {
    if (bodies.empty()) {
        return positions;
    }
    PositionSet selected;
    for (auto body : bodies) {
        if (positions.contains(body)) {
            selected.insert(body, positions.at(body));
        }
    }
    return selected;
}

} // namespace skyforge
