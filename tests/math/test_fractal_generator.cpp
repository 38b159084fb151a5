/// @file tests/math/test_fractal_generator.cpp
/// @brief Unit tests for L-system expansion and turtle-string encoding.

#include <gtest/gtest.h>
#include "dwalk/math.hpp"
#include "dwalk/walk.hpp"

#include <algorithm>
#include <array>

using namespace dwalk;
using namespace dwalk::math;

// ─── Expansion ───────────────────────────────────────────────────────────────

TEST(FractalGenerator, DragonExpansion) {
    const auto& dragon = FractalGenerator::definition(Fractal::Dragon);
    EXPECT_EQ(FractalGenerator::expand(dragon, 0), "F");
    EXPECT_EQ(FractalGenerator::expand(dragon, 1), "F+G");
    EXPECT_EQ(FractalGenerator::expand(dragon, 2), "F+G+F-G");
}

TEST(FractalGenerator, SymbolsWithoutRuleAreCopied) {
    const auto& koch = FractalGenerator::definition(Fractal::Koch);
    EXPECT_EQ(FractalGenerator::expand(koch, 1),
              "F+F--F+F--F+F--F+F--F+F--F+F");
}

TEST(FractalGenerator, DragonGrowsWithDepth) {
    EXPECT_LT(FractalGenerator::generate(Fractal::Dragon, 1).size(),
              FractalGenerator::generate(Fractal::Dragon, 2).size());
}

// ─── Encoding ────────────────────────────────────────────────────────────────

TEST(FractalGenerator, NinetyDegreeTurnsEmitSixRotations) {
    const auto d = FractalGenerator::to_digits("F+G", 90);
    const DigitSequence expected{0, 10, 10, 10, 10, 10, 10, 0};
    EXPECT_EQ(d, expected);
}

TEST(FractalGenerator, SixtyDegreeTurnsEmitFourRotations) {
    const auto d = FractalGenerator::to_digits("-A", 60);
    const DigitSequence expected{11, 11, 11, 11, 0};
    EXPECT_EQ(d, expected);
}

TEST(FractalGenerator, SmallAnglesEmitAtLeastOneRotation) {
    EXPECT_EQ(FractalGenerator::to_digits("+", 5), (DigitSequence{10}));
}

TEST(FractalGenerator, UnknownCharactersIgnored) {
    EXPECT_EQ(FractalGenerator::to_digits("F[X]yF", 90), (DigitSequence{0, 0}));
}

TEST(FractalGenerator, NoDrawableCharactersFallsBackToZero) {
    EXPECT_EQ(FractalGenerator::to_digits("XYZ", 90), (DigitSequence{0}));
}

// ─── All fractals ────────────────────────────────────────────────────────────

TEST(FractalGenerator, AllDefaultsProduceValidDigits) {
    constexpr std::array<Fractal, 6> all{
        Fractal::Dragon, Fractal::Koch, Fractal::SierpinskiArrowhead,
        Fractal::Hilbert, Fractal::Peano, Fractal::Gosper,
    };
    for (auto f : all) {
        const auto d = FractalGenerator::generate(f);
        EXPECT_GT(d.size(), 1000u) << FractalGenerator::definition(f).name;
        EXPECT_TRUE(std::all_of(d.begin(), d.end(), [](Digit x) { return x < 12; }));
    }
}

TEST(FractalGenerator, DragonWalkStaysInXYPlane) {
    const auto d = FractalGenerator::generate(Fractal::Dragon, 8);
    const auto path = walk::TurtleWalk::walk(d, mapping::DigitMapping{},
                                             constants::UNLIMITED_POINTS);
    for (const auto& p : path) {
        ASSERT_NEAR(p.z(), 0.0, 1e-9);
    }
}

TEST(FractalGenerator, SquareOfRightTurnsCloses) {
    const auto d = FractalGenerator::to_digits("F+F+F+F", 90);
    const auto path = walk::TurtleWalk::walk(d, mapping::DigitMapping{});
    EXPECT_NEAR(path.back().norm(), 0.0, 1e-9);
}
