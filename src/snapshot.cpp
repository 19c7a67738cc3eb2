/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <skyforge/snapshot.hpp>
#include <skyforge/house.hpp>

#include <format>

namespace skyforge {

bool CelestialSnapshot::isDegraded() const {
    return positions.size() < 2;
}

void CelestialSnapshot::printInfo(std::ostream &os) const {
    os << "Sky for " << date::format("%F", date)
       << (precise ? "" : " (approximate)") << std::endl;
    os << "  Sun: " << std::format("{:.2f}", sunLongitude) << " deg, "
       << sunSign.name << " (" << sunSign.element << ", " << sunSign.modality << ")" << std::endl;
    if (house) {
        os << "  House Focus: " << *house << " - " << houseTheme(*house) << std::endl;
    }
    os << std::endl;

    if (isDegraded()) {
        os << "  Only the Sun is available; planetary aspects are omitted." << std::endl;
    } else {
        os << "Positions:" << std::endl;
        for (const auto &p : positions) {
            auto sign = signFor(p.longitude);
            os << std::format("  {:<8} {:>7.2f} deg  {:>5.2f} {}",
                planetName(p.planet), p.longitude, degreesInSign(p.longitude), sign.name) << std::endl;
        }
        os << std::endl;

        os << "Aspects:" << std::endl;
        if (aspects.empty()) {
            os << "  None" << std::endl;
        }
        for (const auto &aspect : aspects) {
            os << "  " << aspect.describe() << std::endl;
        }
    }
    os << std::endl;

    os << "Gates:" << std::endl;
    for (const auto &g : gates) {
        os << std::format("  {:<8} Gate {:>2}.{}", planetName(g.planet), g.gate, g.line) << std::endl;
    }
    os << std::endl;
}

CelestialSnapshot takeSnapshot(
    const Sky &sky,
    const Date &d,
    const std::optional<Date> &birthDate,
    std::span<const AspectDefinition> definitions) {

    auto positions = sky.allPlanetPositions(d);
    double sun = positions.at(Planet::SUN);

    CelestialSnapshot snapshot{
        .date = d,
        .precise = sky.isPrecise(),
        .positions = positions,
        .sunLongitude = sun,
        .sunSign = signFor(sun),
        .aspects = aspectsAmong(positions, definitions),
        .gates = gatesFor(positions),
        .house = std::nullopt
    };

    if (birthDate) {
        snapshot.house = sky.houseFocus(d, *birthDate);
    }

    return snapshot;
}

} // namespace skyforge
