/// @file tests/math/test_math_source.cpp
/// @brief Unit tests for `math.<family>.<name>` key resolution.

#include <gtest/gtest.h>
#include "dwalk/math.hpp"

#include <algorithm>
#include <set>

using namespace dwalk;
using namespace dwalk::math;

TEST(MathSource, ResolvesEveryKnownKey) {
    for (const auto& key : MathSource::known_keys()) {
        const auto src = MathSource::from_key(key);
        ASSERT_TRUE(src.has_value()) << key;
        EXPECT_EQ(src->key(), key);
    }
}

TEST(MathSource, KnownKeysAreUnique) {
    const auto keys = MathSource::known_keys();
    const std::set<std::string> unique(keys.begin(), keys.end());
    EXPECT_EQ(unique.size(), keys.size());
    EXPECT_EQ(keys.size(), 5u + 6u + 8u + 6u + 6u);
}

TEST(MathSource, RejectsUnknownKeys) {
    EXPECT_FALSE(MathSource::from_key("math.constant.tau").has_value());
    EXPECT_FALSE(MathSource::from_key("math.fractal").has_value());
    EXPECT_FALSE(MathSource::from_key("math.").has_value());
    EXPECT_FALSE(MathSource::from_key("constant.pi").has_value());
    EXPECT_FALSE(MathSource::from_key("dna").has_value());
}

TEST(MathSource, ConstantKeyDelegatesToGenerator) {
    const auto src = MathSource::from_key("math.constant.pi");
    ASSERT_TRUE(src.has_value());
    EXPECT_EQ(src->generate(250), ConstantGenerator::pi(250));
    EXPECT_EQ(src->generate().size(), constants::DEFAULT_MATH_DIGITS);
}

TEST(MathSource, OrbitKeyUsesArgumentAsIterationCap) {
    const auto src = MathSource::from_key("math.mandelbrot.cardioid");
    ASSERT_TRUE(src.has_value());
    EXPECT_LE(src->generate(300).size(), 300u);
}

TEST(MathSource, FractalKeyIgnoresArgument) {
    const auto src = MathSource::from_key("math.fractal.koch");
    ASSERT_TRUE(src.has_value());
    EXPECT_EQ(src->generate(10), FractalGenerator::generate(Fractal::Koch));
}

TEST(MathSource, LogisticVariantsDiffer) {
    const auto chaos    = MathSource::from_key("math.sequence.logistic_chaos");
    const auto periodic = MathSource::from_key("math.sequence.logistic_periodic");
    ASSERT_TRUE(chaos && periodic);
    EXPECT_NE(chaos->generate(200), periodic->generate(200));
}

TEST(MathSource, CustomGenerator) {
    MathSource src("math.custom.ones", [](std::size_t n) { return DigitSequence(n, 1); });
    EXPECT_EQ(src.key(), "math.custom.ones");
    EXPECT_EQ(src.generate(3), (DigitSequence{1, 1, 1}));
}
