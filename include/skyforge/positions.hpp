/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SKYFORGE_POSITIONS_HPP
#define __SKYFORGE_POSITIONS_HPP

#include <skyforge/ephemeris.hpp>

#include <initializer_list>
#include <span>
#include <vector>

namespace skyforge {

/**
 * A body and its geocentric ecliptic longitude in degrees [0, 360).
 */
struct PlanetPosition {
    Planet planet;
    double longitude;
};

/**
 * Longitudes keyed by planet, in insertion order.
 *
 * Keys are unique: inserting a planet that is already present replaces its
 * longitude without moving it. Every stored longitude is normalized.
 * A set holding only the Sun is the normal result in degraded mode.
 */
class PositionSet {
public:
    using const_iterator = std::vector<PlanetPosition>::const_iterator;

    PositionSet() = default;
    PositionSet(std::initializer_list<PlanetPosition> positions);

    void insert(Planet planet, double longitude);

    bool contains(Planet planet) const;

    /**
     * @throws std::out_of_range if the planet is not in the set
     */
    double at(Planet planet) const;

    size_t size() const { return positions_.size(); }
    bool empty() const { return positions_.empty(); }

    /** True when every body in ALL_PLANETS is present. */
    bool isComplete() const { return positions_.size() == ALL_PLANETS.size(); }

    const_iterator begin() const { return positions_.begin(); }
    const_iterator end() const { return positions_.end(); }

    const PlanetPosition& operator[](size_t index) const { return positions_[index]; }

private:
    std::vector<PlanetPosition> positions_;
};

/**
 * Keeps only the requested bodies, in the order requested.
 * Bodies missing from the set are skipped; an empty request keeps everything.
 */
PositionSet selectBodies(const PositionSet &positions, std::span<const Planet> bodies);

} // namespace skyforge

#endif
