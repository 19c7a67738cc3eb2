/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <skyforge/sky.hpp>
#include <skyforge/house.hpp>
#include <skyforge/solar.hpp>

#include <spdlog/spdlog.h>

using spdlog::debug;

namespace skyforge {

Sky::Sky(std::shared_ptr<const EphemerisBackend> backend) : backend_(std::move(backend)) {
    if (backend_) {
        debug("Sky using precise backend: {}", backend_->getName());
    } else {
        debug("Sky running in degraded mode");
    }
}

bool Sky::isPrecise() const {
    return backend_ != nullptr;
}

double Sky::sunLongitude(const Date &d) const {
    if (backend_) {
        return normalizeDegrees(backend_->getLongitude(toJulianDay(d), Planet::SUN));
    }
    return approximateSunLongitude(d);
}

ZodiacSign Sky::sunSign(const Date &d) const {
    return signFor(sunLongitude(d));
}

PositionSet Sky::allPlanetPositions(const Date &d) const {
    PositionSet positions;
    if (!backend_) {
        positions.insert(Planet::SUN, approximateSunLongitude(d));
        debug("Degraded mode: only the Sun is available for {}", date::format("%F", d));
        return positions;
    }

    double julianDay = toJulianDay(d);
    for (auto planet : ALL_PLANETS) {
        positions.insert(planet, backend_->getLongitude(julianDay, planet));
    }
    return positions;
}

int Sky::houseFocus(const Date &target, const Date &birth) const {
    double natalSun = sunLongitude(birth);
    double transitSun = sunLongitude(target);
    int house = houseForArc(transitSun - natalSun);
    debug("House focus: natal {:.4f}, transit {:.4f}, house {}", natalSun, transitSun, house);
    return house;
}

} // namespace skyforge
