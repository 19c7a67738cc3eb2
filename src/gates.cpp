/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <skyforge/gates.hpp>
#include <skyforge/zodiac.hpp>

#include <algorithm>
#include <cmath>

namespace skyforge {

GateLine gateAndLine(double longitude) {
    double lon = normalizeDegrees(longitude);

    auto segment = static_cast<size_t>(lon / GATE_WIDTH) % GATE_WHEEL.size();
    int gate = GATE_WHEEL[segment];

    double positionInGate = std::fmod(lon, GATE_WIDTH);
    int line = static_cast<int>(positionInGate / LINE_WIDTH) + 1;
    // Rounding at the top of a segment must not produce line 7
    line = std::min(line, LINES_PER_GATE);

    return {gate, line};
}

std::vector<GateActivation> gatesFor(const PositionSet &positions) {
    std::vector<GateActivation> activations;
    activations.reserve(positions.size());
    for (const auto &p : positions) {
        auto [gate, line] = gateAndLine(p.longitude);
        activations.push_back({p.planet, gate, line});
    }
    return activations;
}

} // namespace skyforge
