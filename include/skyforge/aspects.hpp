/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SKYFORGE_ASPECTS_HPP
#define __SKYFORGE_ASPECTS_HPP

#include <skyforge/positions.hpp>

#include <array>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace skyforge {

/**
 * A named angular relationship and the tolerance (orb) within which a pair
 * of bodies is considered to form it.
 *
 * Names and symbols are views; they must outlive the definition.
 */
struct AspectDefinition {
    std::string_view name;
    double angle;       ///< Target separation in degrees [0, 180]
    double orb;         ///< Allowed deviation from angle in degrees
    std::string_view symbol;
};

/** The five major aspects, in matching order. */
constexpr std::array<AspectDefinition, 5> MAJOR_ASPECTS = {{
    {"Conjunction",   0.0, 8.0, "☌"},
    {"Sextile",      60.0, 6.0, "⚹"},
    {"Square",       90.0, 7.0, "□"},
    {"Trine",       120.0, 7.0, "△"},
    {"Opposition",  180.0, 8.0, "☍"},
}};

/**
 * An aspect formed between two bodies.
 */
struct AspectMatch {
    Planet first;
    Planet second;
    AspectDefinition aspect;
    double separation;          ///< Shortest angular distance between the bodies
    std::string_view quality;   ///< Qualitative descriptor, empty for custom aspects

    /** Display line, e.g. "Sun ☌ Moon (Conjunction, intensifying)". */
    std::string describe() const;
};

/**
 * Shortest angular distance between two longitudes.
 * Symmetric in its arguments.
 * @return Degrees [0, 180]
 */
double angularDistance(double a, double b);

/**
 * Returns the qualitative descriptor for an aspect name, or an empty view
 * for names outside the major aspects.
 */
std::string_view aspectQuality(std::string_view aspectName);

/**
 * Finds the aspects formed between every pair of bodies in a position set.
 *
 * Pairs are visited in insertion order (first body from the outer loop, the
 * bodies after it from the inner loop) and results keep that order. For
 * each pair the definitions are scanned in order and the first one whose
 * orb covers the separation is taken; later definitions are not considered
 * even if they would also match. An empty definition set means the major
 * aspects.
 *
 * @return Matches in pair order; empty when fewer than two bodies are given
 */
std::vector<AspectMatch> aspectsAmong(
    const PositionSet &positions,
    std::span<const AspectDefinition> definitions = MAJOR_ASPECTS);

} // namespace skyforge

#endif
