/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SKYFORGE_GATES_HPP
#define __SKYFORGE_GATES_HPP

#include <skyforge/positions.hpp>

#include <array>
#include <vector>

namespace skyforge {

constexpr int GATE_COUNT = 64;
constexpr int LINES_PER_GATE = 6;
constexpr double GATE_WIDTH = 360.0 / GATE_COUNT;          // 5.625 degrees
constexpr double LINE_WIDTH = GATE_WIDTH / LINES_PER_GATE;  // 0.9375 degrees

/**
 * Human Design gate wheel: segment index (0 at 0 degrees, one segment per
 * 5.625 degrees in ecliptic order) to gate number.
 */
constexpr std::array<int, GATE_COUNT> GATE_WHEEL = {
    41, 19, 13, 49, 30, 55, 37, 63,  // 0-45 degrees
    22, 36, 25, 17, 21, 51, 42,  3,  // 45-90
    27, 24,  2, 23,  8, 20, 16, 35,  // 90-135
    45, 12, 15, 52, 39, 53, 62, 56,  // 135-180
    31, 33,  7,  4, 29, 59, 40, 64,  // 180-225
    47,  6, 46, 18, 48, 57, 32, 50,  // 225-270
    28, 44,  1, 43, 14, 34,  9,  5,  // 270-315
    26, 11, 10, 58, 38, 54, 61, 60,  // 315-360
};

struct GateLine {
    int gate;   ///< 1-64
    int line;   ///< 1-6
};

inline bool operator==(const GateLine &a, const GateLine &b) {
    return a.gate == b.gate && a.line == b.line;
}

struct GateActivation {
    Planet planet;
    int gate;
    int line;
};

/**
 * Maps an ecliptic longitude to its gate and line.
 * Any finite longitude is accepted; it is normalized first.
 */
GateLine gateAndLine(double longitude);

/**
 * Maps every body in a position set to its activation, in set order.
 */
std::vector<GateActivation> gatesFor(const PositionSet &positions);

} // namespace skyforge

#endif
