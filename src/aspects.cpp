/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <skyforge/aspects.hpp>
#include <skyforge/zodiac.hpp>

#include <algorithm>
#include <cmath>
#include <sstream>

#include <spdlog/spdlog.h>

using spdlog::debug;

namespace skyforge {

std::string AspectMatch::describe() const {
    std::ostringstream os;
    os << planetName(first) << " " << aspect.symbol << " " << planetName(second)
       << " (" << aspect.name;
    if (!quality.empty()) {
        os << ", " << quality;
    }
    os << ")";
    return os.str();
}

double angularDistance(double a, double b) {
    double diff = std::fmod(std::fabs(a - b), FULL_CIRCLE);
    return std::min(diff, FULL_CIRCLE - diff);
}

std::string_view aspectQuality(std::string_view aspectName) {
    if (aspectName == "Conjunction") return "intensifying";
    if (aspectName == "Sextile") return "harmonious opportunity";
    if (aspectName == "Square") return "challenging tension";
    if (aspectName == "Trine") return "flowing harmony";
    if (aspectName == "Opposition") return "polarizing awareness";
    return "";
}

std::vector<AspectMatch> aspectsAmong(
    const PositionSet &positions,
    std::span<const AspectDefinition> definitions) {

    std::vector<AspectMatch> matches;
    if (positions.size() < 2) {
        return matches;
    }
    if (definitions.empty()) {
        definitions = MAJOR_ASPECTS;
    }

    for (size_t i = 0; i < positions.size(); i++) {
        for (size_t j = i + 1; j < positions.size(); j++) {
            const auto &a = positions[i];
            const auto &b = positions[j];
            double separation = angularDistance(a.longitude, b.longitude);

            // First definition in declared order wins
            for (const auto &definition : definitions) {
                if (std::fabs(separation - definition.angle) <= definition.orb) {
                    matches.push_back(AspectMatch{
                        .first = a.planet,
                        .second = b.planet,
                        .aspect = definition,
                        .separation = separation,
                        .quality = aspectQuality(definition.name)
                    });
                    break;
                }
            }
        }
    }

    debug("Found {} aspects among {} bodies", matches.size(), positions.size());
    return matches;
}

} // namespace skyforge
