/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <skyforge/aspects.hpp>

#include <string>
#include <vector>

namespace skyforge {
namespace {

// ============================================================================
// angularDistance Tests
// ============================================================================

TEST(AngularDistanceTest, Simple) {
    EXPECT_DOUBLE_EQ(angularDistance(10.0, 40.0), 30.0);
}

TEST(AngularDistanceTest, WrapsAcrossZero) {
    EXPECT_DOUBLE_EQ(angularDistance(350.0, 10.0), 20.0);
    EXPECT_DOUBLE_EQ(angularDistance(10.0, 350.0), 20.0);
}

TEST(AngularDistanceTest, IdenticalIsZero) {
    EXPECT_DOUBLE_EQ(angularDistance(123.4, 123.4), 0.0);
}

TEST(AngularDistanceTest, Opposite) {
    EXPECT_DOUBLE_EQ(angularDistance(10.0, 190.0), 180.0);
}

TEST(AngularDistanceTest, SymmetricAndBounded) {
    for (double a = 0.0; a < 360.0; a += 7.3) {
        for (double b = 0.0; b < 360.0; b += 11.9) {
            double ab = angularDistance(a, b);
            EXPECT_DOUBLE_EQ(ab, angularDistance(b, a));
            EXPECT_GE(ab, 0.0);
            EXPECT_LE(ab, 180.0);
        }
    }
}

TEST(AngularDistanceTest, UnnormalizedInputs) {
    EXPECT_NEAR(angularDistance(-10.0, 730.0), 20.0, 1e-9);
}

// ============================================================================
// aspectQuality Tests
// ============================================================================

TEST(AspectQualityTest, MajorAspects) {
    EXPECT_EQ(aspectQuality("Conjunction"), "intensifying");
    EXPECT_EQ(aspectQuality("Sextile"), "harmonious opportunity");
    EXPECT_EQ(aspectQuality("Square"), "challenging tension");
    EXPECT_EQ(aspectQuality("Trine"), "flowing harmony");
    EXPECT_EQ(aspectQuality("Opposition"), "polarizing awareness");
}

TEST(AspectQualityTest, UnknownIsEmpty) {
    EXPECT_TRUE(aspectQuality("Quincunx").empty());
}

// ============================================================================
// MAJOR_ASPECTS Tests
// ============================================================================

TEST(MajorAspectsTest, DeclaredOrder) {
    ASSERT_EQ(MAJOR_ASPECTS.size(), 5u);
    EXPECT_EQ(MAJOR_ASPECTS[0].name, "Conjunction");
    EXPECT_EQ(MAJOR_ASPECTS[1].name, "Sextile");
    EXPECT_EQ(MAJOR_ASPECTS[2].name, "Square");
    EXPECT_EQ(MAJOR_ASPECTS[3].name, "Trine");
    EXPECT_EQ(MAJOR_ASPECTS[4].name, "Opposition");
}

TEST(MajorAspectsTest, AnglesAndOrbs) {
    const double angles[] = {0.0, 60.0, 90.0, 120.0, 180.0};
    const double orbs[] = {8.0, 6.0, 7.0, 7.0, 8.0};
    for (size_t i = 0; i < MAJOR_ASPECTS.size(); i++) {
        EXPECT_DOUBLE_EQ(MAJOR_ASPECTS[i].angle, angles[i]);
        EXPECT_DOUBLE_EQ(MAJOR_ASPECTS[i].orb, orbs[i]);
    }
}

// ============================================================================
// aspectsAmong Tests
// ============================================================================

TEST(AspectsAmongTest, EmptySet) {
    EXPECT_TRUE(aspectsAmong(PositionSet{}).empty());
}

TEST(AspectsAmongTest, SingleBodyIsEmpty) {
    PositionSet positions{{Planet::SUN, 42.0}};
    EXPECT_TRUE(aspectsAmong(positions).empty());
}

TEST(AspectsAmongTest, Opposition) {
    PositionSet positions{{Planet::SUN, 10.0}, {Planet::MOON, 190.0}};
    auto aspects = aspectsAmong(positions);
    ASSERT_EQ(aspects.size(), 1u);
    EXPECT_EQ(aspects[0].first, Planet::SUN);
    EXPECT_EQ(aspects[0].second, Planet::MOON);
    EXPECT_EQ(aspects[0].aspect.name, "Opposition");
    EXPECT_DOUBLE_EQ(aspects[0].aspect.angle, 180.0);
    EXPECT_DOUBLE_EQ(aspects[0].separation, 180.0);
    EXPECT_EQ(aspects[0].quality, "polarizing awareness");
}

TEST(AspectsAmongTest, ExactConjunctionIsSingleMatch) {
    PositionSet positions{{Planet::VENUS, 123.0}, {Planet::MARS, 123.0}};
    auto aspects = aspectsAmong(positions);
    ASSERT_EQ(aspects.size(), 1u);
    EXPECT_EQ(aspects[0].aspect.name, "Conjunction");
    EXPECT_DOUBLE_EQ(aspects[0].separation, 0.0);
}

TEST(AspectsAmongTest, EachMajorAspectAtExactAngle) {
    const char* expected[] = {"Conjunction", "Sextile", "Square", "Trine", "Opposition"};
    const double separations[] = {0.0, 60.0, 90.0, 120.0, 180.0};
    for (size_t i = 0; i < 5; i++) {
        PositionSet positions{{Planet::SUN, 5.0}, {Planet::MOON, 5.0 + separations[i]}};
        auto aspects = aspectsAmong(positions);
        ASSERT_EQ(aspects.size(), 1u) << expected[i];
        EXPECT_EQ(aspects[0].aspect.name, expected[i]);
    }
}

TEST(AspectsAmongTest, OrbEdgeIsInclusive) {
    // Square orb is 7: 97 matches, 97.5 does not
    PositionSet inside{{Planet::SUN, 0.0}, {Planet::MARS, 97.0}};
    auto aspects = aspectsAmong(inside);
    ASSERT_EQ(aspects.size(), 1u);
    EXPECT_EQ(aspects[0].aspect.name, "Square");

    PositionSet outside{{Planet::SUN, 0.0}, {Planet::MARS, 97.5}};
    EXPECT_TRUE(aspectsAmong(outside).empty());
}

TEST(AspectsAmongTest, NoAspectOutsideOrbs) {
    // 30 degrees is outside every major orb
    PositionSet positions{{Planet::SUN, 0.0}, {Planet::MOON, 30.0}};
    EXPECT_TRUE(aspectsAmong(positions).empty());
}

TEST(AspectsAmongTest, WrapAroundConjunction) {
    PositionSet positions{{Planet::SUN, 358.0}, {Planet::MERCURY, 3.0}};
    auto aspects = aspectsAmong(positions);
    ASSERT_EQ(aspects.size(), 1u);
    EXPECT_EQ(aspects[0].aspect.name, "Conjunction");
    EXPECT_NEAR(aspects[0].separation, 5.0, 1e-9);
}

TEST(AspectsAmongTest, FirstDeclaredDefinitionWins) {
    // Overlapping custom orbs: 75 degrees satisfies both, the first declared wins
    const AspectDefinition overlapping[] = {
        {"Wide", 60.0, 20.0, "W"},
        {"Square", 90.0, 20.0, "□"},
    };
    PositionSet positions{{Planet::SUN, 0.0}, {Planet::MOON, 75.0}};
    auto aspects = aspectsAmong(positions, overlapping);
    ASSERT_EQ(aspects.size(), 1u);
    EXPECT_EQ(aspects[0].aspect.name, "Wide");
    EXPECT_TRUE(aspects[0].quality.empty());

    // Reversing the declaration order flips the winner, even though 75 is
    // equally far from both targets
    const AspectDefinition reversed[] = {overlapping[1], overlapping[0]};
    aspects = aspectsAmong(positions, reversed);
    ASSERT_EQ(aspects.size(), 1u);
    EXPECT_EQ(aspects[0].aspect.name, "Square");
}

TEST(AspectsAmongTest, FirstMatchEvenWhenLaterIsCloser) {
    const AspectDefinition definitions[] = {
        {"Broad", 60.0, 30.0, "B"},
        {"Tight", 88.0, 1.0, "T"},
    };
    PositionSet positions{{Planet::SUN, 0.0}, {Planet::MOON, 88.0}};
    auto aspects = aspectsAmong(positions, definitions);
    ASSERT_EQ(aspects.size(), 1u);
    EXPECT_EQ(aspects[0].aspect.name, "Broad");
}

TEST(AspectsAmongTest, PairOrderFollowsInsertion) {
    // Three bodies all in conjunction: pairs (A,B), (A,C), (B,C)
    PositionSet positions{{Planet::MARS, 100.0}, {Planet::SUN, 101.0}, {Planet::MOON, 102.0}};
    auto aspects = aspectsAmong(positions);
    ASSERT_EQ(aspects.size(), 3u);
    EXPECT_EQ(aspects[0].first, Planet::MARS);
    EXPECT_EQ(aspects[0].second, Planet::SUN);
    EXPECT_EQ(aspects[1].first, Planet::MARS);
    EXPECT_EQ(aspects[1].second, Planet::MOON);
    EXPECT_EQ(aspects[2].first, Planet::SUN);
    EXPECT_EQ(aspects[2].second, Planet::MOON);
}

TEST(AspectsAmongTest, NotSortedByOrb) {
    // Sun-Moon is a loose trine, Sun-Venus an exact sextile; pair order is kept
    PositionSet positions{{Planet::SUN, 0.0}, {Planet::MOON, 126.0}, {Planet::VENUS, 60.0}};
    auto aspects = aspectsAmong(positions);
    ASSERT_EQ(aspects.size(), 3u);
    EXPECT_EQ(aspects[0].aspect.name, "Trine");
    EXPECT_EQ(aspects[0].second, Planet::MOON);
    EXPECT_EQ(aspects[1].aspect.name, "Sextile");
    EXPECT_EQ(aspects[1].second, Planet::VENUS);
    // Moon-Venus: 66 degrees, still a sextile
    EXPECT_EQ(aspects[2].aspect.name, "Sextile");
    EXPECT_EQ(aspects[2].first, Planet::MOON);
}

TEST(AspectsAmongTest, EmptyDefinitionsUseMajorAspects) {
    std::vector<AspectDefinition> none;

    PositionSet together{{Planet::SUN, 0.0}, {Planet::MOON, 0.0}};
    auto aspects = aspectsAmong(together, none);
    ASSERT_EQ(aspects.size(), 1u);
    EXPECT_EQ(aspects[0].aspect.name, "Conjunction");

    PositionSet opposed{{Planet::SUN, 10.0}, {Planet::MOON, 190.0}};
    aspects = aspectsAmong(opposed, none);
    ASSERT_EQ(aspects.size(), 1u);
    EXPECT_EQ(aspects[0].describe(), "Sun ☍ Moon (Opposition, polarizing awareness)");
}

// ============================================================================
// AspectMatch::describe Tests
// ============================================================================

TEST(AspectDescribeTest, MajorAspect) {
    PositionSet positions{{Planet::SUN, 0.0}, {Planet::MOON, 2.0}};
    auto aspects = aspectsAmong(positions);
    ASSERT_EQ(aspects.size(), 1u);
    EXPECT_EQ(aspects[0].describe(), "Sun ☌ Moon (Conjunction, intensifying)");
}

TEST(AspectDescribeTest, CustomAspectWithoutQuality) {
    const AspectDefinition definitions[] = {{"Quincunx", 150.0, 3.0, "⚻"}};
    PositionSet positions{{Planet::MARS, 0.0}, {Planet::SATURN, 150.0}};
    auto aspects = aspectsAmong(positions, definitions);
    ASSERT_EQ(aspects.size(), 1u);
    EXPECT_EQ(aspects[0].describe(), "Mars ⚻ Saturn (Quincunx)");
}

} // namespace
} // namespace skyforge
