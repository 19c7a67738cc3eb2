/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SKYFORGE_SNAPSHOT_HPP
#define __SKYFORGE_SNAPSHOT_HPP

#include <skyforge/aspects.hpp>
#include <skyforge/gates.hpp>
#include <skyforge/positions.hpp>
#include <skyforge/sky.hpp>
#include <skyforge/zodiac.hpp>

#include <iostream>
#include <optional>
#include <span>
#include <vector>

namespace skyforge {

/**
 * The celestial state for one date, ready to be rendered into a report.
 */
struct CelestialSnapshot {
    Date date;
    bool precise;                           ///< Positions came from the precise backend
    PositionSet positions;
    double sunLongitude;
    ZodiacSign sunSign;
    std::vector<AspectMatch> aspects;       ///< Empty in degraded mode
    std::vector<GateActivation> gates;      ///< One per available body
    std::optional<int> house;               ///< Set when a birth date was given

    /** True when fewer than two bodies are available. */
    bool isDegraded() const;

    /**
     * Print the snapshot to a stream.
     * In degraded mode the aspects section is left out.
     */
    void printInfo(std::ostream &os) const;
};

/**
 * Computes the full snapshot for a date.
 * @throws EphemerisException if the precise backend fails
 */
CelestialSnapshot takeSnapshot(
    const Sky &sky,
    const Date &d,
    const std::optional<Date> &birthDate = std::nullopt,
    std::span<const AspectDefinition> definitions = MAJOR_ASPECTS);

} // namespace skyforge

#endif
