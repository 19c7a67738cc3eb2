/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SKYFORGE_SKY_HPP
#define __SKYFORGE_SKY_HPP

#include <skyforge/ephemeris.hpp>
#include <skyforge/positions.hpp>
#include <skyforge/zodiac.hpp>

#include <memory>

namespace skyforge {

/**
 * Computes body positions for calendar dates.
 *
 * A Sky is constructed with an optional precise backend. With a backend,
 * every query goes to it at noon UT on the requested date. Without one, the
 * Sky runs in degraded mode: the Sun comes from the closed-form formula and
 * no other body is reported.
 *
 * Usage:
 *   Sky sky{acquireEphemerisBackend()};
 *   PositionSet positions = sky.allPlanetPositions(date);
 *
 * Backend failures are not caught here. An EphemerisException from the
 * backend reaches the caller unchanged, so precision tiers are never mixed
 * within one result.
 *
 * All members are const and the backend is never replaced, so a Sky may be
 * shared between threads.
 */
class Sky {
public:
    explicit Sky(std::shared_ptr<const EphemerisBackend> backend = nullptr);
    ~Sky() = default;

    /** True when a precise backend is attached. */
    bool isPrecise() const;

    /**
     * Ecliptic longitude of the Sun at noon UT.
     * @return Degrees [0, 360)
     * @throws EphemerisException if the precise backend fails
     */
    double sunLongitude(const Date &d) const;

    /** Zodiac sign of the Sun on a date. */
    ZodiacSign sunSign(const Date &d) const;

    /**
     * Positions of all available bodies at noon UT.
     * @return Ten bodies in ALL_PLANETS order, or only the Sun in degraded mode
     * @throws EphemerisException if the precise backend fails
     */
    PositionSet allPlanetPositions(const Date &d) const;

    /**
     * House activated by the transiting Sun relative to the natal Sun.
     * @return House number 1-12
     * @throws EphemerisException if the precise backend fails
     */
    int houseFocus(const Date &target, const Date &birth) const;

private:
    std::shared_ptr<const EphemerisBackend> backend_;
};

} // namespace skyforge

#endif
