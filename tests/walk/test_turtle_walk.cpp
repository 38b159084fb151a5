/// @file tests/walk/test_turtle_walk.cpp
/// @brief Unit tests for Turtle, TurtleWalk::walk, walk4 and subsample.
///
/// Test categories:
///   - Reference identity walk [0,0,0] → (1,0,0),(2,0,0),(3,0,0)
///   - Each translation digit moves along its local axis
///   - Rotation digits emit a repeated point and turn the heading
///   - Rotations are applied in the world frame (left-multiplied)
///   - 24 identical rotations return to the identity orientation
///   - Mapping is applied before interpretation
///   - Empty input → [origin]
///   - Subsampling bound, final-point retention, max_points = 0
///   - walk4 lattice moves and revisit stacking

#include <gtest/gtest.h>
#include "dwalk/walk.hpp"

#include <cmath>
#include <numbers>
#include <vector>

using namespace dwalk;
using namespace dwalk::walk;
using dwalk::mapping::DigitMapping;
using dwalk::mapping::MappingPresets;

namespace {

constexpr double TOL = 1e-12;

void expect_point(const Point3& p, double x, double y, double z, const char* what = "") {
    EXPECT_NEAR(p.x(), x, TOL) << what;
    EXPECT_NEAR(p.y(), y, TOL) << what;
    EXPECT_NEAR(p.z(), z, TOL) << what;
}

} // namespace

// ─── Test 1: identity walk ───────────────────────────────────────────────────

TEST(TurtleWalk_Base12, ThreeForwardSteps) {
    const DigitSequence d{0, 0, 0};
    const auto path = TurtleWalk::walk(d, DigitMapping{}, 1000);
    ASSERT_EQ(path.size(), 3u);
    expect_point(path[0], 1, 0, 0);
    expect_point(path[1], 2, 0, 0);
    expect_point(path[2], 3, 0, 0);
}

TEST(TurtleWalk_Base12, EachTranslationDigitFollowsItsAxis) {
    const double expected[6][3] = {
        { 1, 0, 0}, {-1, 0, 0}, {0,  1, 0},
        { 0,-1, 0}, { 0, 0, 1}, {0,  0,-1},
    };
    for (Digit d = 0; d < 6; ++d) {
        const DigitSequence seq{d};
        const auto path = TurtleWalk::walk(seq, DigitMapping{});
        ASSERT_EQ(path.size(), 1u);
        expect_point(path[0], expected[d][0], expected[d][1], expected[d][2]);
    }
}

TEST(TurtleWalk_Base12, DigitsAreReducedModTwelve) {
    const DigitSequence a{12, 14, 16};
    const DigitSequence b{0, 2, 4};
    EXPECT_EQ(TurtleWalk::walk(a, DigitMapping{}), TurtleWalk::walk(b, DigitMapping{}));
}

// ─── Test 2: rotations ───────────────────────────────────────────────────────

TEST(TurtleWalk_Base12, RotationKeepsPositionThenTurnsHeading) {
    // +15° about world Y, then forward.
    const DigitSequence d{8, 0};
    const auto path = TurtleWalk::walk(d, DigitMapping{});
    ASSERT_EQ(path.size(), 2u);
    expect_point(path[0], 0, 0, 0, "rotation must not move the turtle");

    const double a = std::numbers::pi / 12.0;
    expect_point(path[1], std::cos(a), 0.0, -std::sin(a));
}

TEST(TurtleWalk_Base12, SixQuarterStepsAboutZTurnToPlusY) {
    DigitSequence d(6, 10);
    d.push_back(0);
    const auto path = TurtleWalk::walk(d, DigitMapping{});
    ASSERT_EQ(path.size(), 7u);
    expect_point(path.back(), 0, 1, 0);
}

TEST(TurtleWalk_Base12, OppositeRotationsCancel) {
    const DigitSequence d{6, 7, 8, 9, 10, 11, 0};
    const auto path = TurtleWalk::walk(d, DigitMapping{});
    expect_point(path.back(), 1, 0, 0);
}

TEST(TurtleWalk_Base12, RotationsComposeInWorldFrame) {
    // 90° about world Z (+X → +Y), then 90° about world X (+Y → +Z).
    // Right-multiplication would instead rotate about the turtle's local X,
    // leaving the heading at +Y.
    DigitSequence d(6, 10);
    d.insert(d.end(), 6, Digit{6});
    d.push_back(0);
    const auto path = TurtleWalk::walk(d, DigitMapping{});
    expect_point(path.back(), 0, 0, 1);
}

TEST(Turtle, FullTurnRestoresIdentity) {
    Turtle t;
    for (int i = 0; i < 24; ++i) t.step(8);
    EXPECT_TRUE(t.orientation().isApprox(Orientation::Identity(), 1e-10)
             || t.orientation().coeffs().isApprox(-Orientation::Identity().coeffs(), 1e-10));
    EXPECT_NEAR(t.orientation().norm(), 1.0, 1e-12);
    t.step(0);
    expect_point(t.position(), 1, 0, 0);
}

TEST(Turtle, OrientationStaysUnitOverManySteps) {
    Turtle t;
    for (int i = 0; i < 100000; ++i) {
        t.step(static_cast<Digit>(6 + (i * 7) % 6));
    }
    EXPECT_NEAR(t.orientation().norm(), 1.0, 1e-12);
}

TEST(TurtleWalk_Base12, TranslationStepsHaveUnitLength) {
    const DigitSequence d{0, 9, 2, 10, 4, 6, 1, 11, 3, 7, 5};
    const auto path = TurtleWalk::walk(d, DigitMapping{}, constants::UNLIMITED_POINTS);
    ASSERT_EQ(path.size(), d.size());
    Point3 prev = Point3::Zero();
    for (std::size_t i = 0; i < d.size(); ++i) {
        const double step = (path[i] - prev).norm();
        if (d[i] < 6) {
            EXPECT_NEAR(step, 1.0, 1e-12) << "digit index " << i;
        } else {
            EXPECT_NEAR(step, 0.0, 1e-12) << "digit index " << i;
        }
        prev = path[i];
    }
}

// ─── Test 3: mapping ─────────────────────────────────────────────────────────

TEST(TurtleWalk_Base12, MappingAppliedBeforeInterpretation) {
    // Stock-opt maps 0 → 1 (move −X).
    const DigitSequence d{0, 0};
    const auto path = TurtleWalk::walk(d, MappingPresets::named("Stock-opt"));
    expect_point(path.back(), -2, 0, 0);
}

TEST(TurtleWalk_Base12, UnknownMappingNameWalksAsIdentity) {
    const DigitSequence d{0, 3, 8, 4, 11, 0};
    EXPECT_EQ(TurtleWalk::walk(d, MappingPresets::named("bogus")),
              TurtleWalk::walk(d, DigitMapping{}));
}

// ─── Test 4: empty input and subsampling ─────────────────────────────────────

TEST(TurtleWalk_Base12, EmptyInputYieldsOrigin) {
    const auto path = TurtleWalk::walk({}, DigitMapping{});
    ASSERT_EQ(path.size(), 1u);
    expect_point(path[0], 0, 0, 0);
}

TEST(TurtleWalk_Base12, LengthEqualsDigitCountWhenUnbounded) {
    const DigitSequence d(5000, 2);
    EXPECT_EQ(TurtleWalk::walk(d, DigitMapping{}, constants::UNLIMITED_POINTS).size(), 5000u);
}

TEST(TurtleWalk_Base12, SubsampledWalkIsBounded) {
    DigitSequence d;
    for (int i = 0; i < 1000; ++i) d.push_back(static_cast<Digit>(i % 12));
    const auto path = TurtleWalk::walk(d, DigitMapping{}, 100);
    EXPECT_LE(path.size(), 101u);
}

TEST(TurtleWalk_Subsample, KeepsLastPoint) {
    Path full;
    for (int i = 0; i < 10; ++i) full.emplace_back(i, 0, 0);
    // step = ⌈10/3⌉ = 4 → indices 0, 4, 8, then 9 appended.
    const auto out = TurtleWalk::subsample(full, 3);
    ASSERT_EQ(out.size(), 4u);
    EXPECT_EQ(out[0].x(), 0.0);
    EXPECT_EQ(out[1].x(), 4.0);
    EXPECT_EQ(out[2].x(), 8.0);
    EXPECT_EQ(out[3].x(), 9.0);
}

TEST(TurtleWalk_Subsample, LastIndexOnStrideIsNotDuplicated) {
    Path full;
    for (int i = 0; i < 9; ++i) full.emplace_back(i, 0, 0);
    // step = ⌈9/3⌉ = 3 → indices 0, 3, 6; index 8 appended.
    auto out = TurtleWalk::subsample(full, 3);
    ASSERT_EQ(out.size(), 4u);
    EXPECT_EQ(out.back().x(), 8.0);

    Path seven;
    for (int i = 0; i < 7; ++i) seven.emplace_back(i, 0, 0);
    // step = ⌈7/3⌉ = 3 → indices 0, 3, 6; 6 is already last.
    out = TurtleWalk::subsample(seven, 3);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out.back().x(), 6.0);
}

TEST(TurtleWalk_Subsample, ZeroMaxPointsTreatedAsOne) {
    Path full;
    for (int i = 0; i < 5; ++i) full.emplace_back(i, 0, 0);
    const auto out = TurtleWalk::subsample(full, 0);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out.front().x(), 0.0);
    EXPECT_EQ(out.back().x(), 4.0);
}

TEST(TurtleWalk_Subsample, ShortPathUntouched) {
    Path full{Point3(1, 2, 3), Point3(4, 5, 6)};
    EXPECT_EQ(TurtleWalk::subsample(full, 2), full);
}

// ─── Test 5: base-4 walk ─────────────────────────────────────────────────────

TEST(TurtleWalk_Base4, DirectionsFollowDigits) {
    const DigitSequence d{0, 2, 1, 3};
    const auto path = TurtleWalk::walk4(d);
    ASSERT_EQ(path.size(), 4u);
    expect_point(path[0], 1, 0, 0);
    expect_point(path[1], 1, 1, 0);
    expect_point(path[2], 0, 1, 0);
    expect_point(path[3], 0, 0, 0);
}

TEST(TurtleWalk_Base4, RevisitsStackUpward) {
    const DigitSequence d{0, 1, 0};
    const auto path = TurtleWalk::walk4(d);
    ASSERT_EQ(path.size(), 3u);
    expect_point(path[0], 1, 0, 0);
    expect_point(path[1], 0, 0, 0);
    expect_point(path[2], 1, 0, 1);
}

TEST(TurtleWalk_Base4, BouncingRaisesHeightEachVisit) {
    DigitSequence d;
    for (int i = 0; i < 5; ++i) { d.push_back(0); d.push_back(1); }
    const auto path = TurtleWalk::walk4(d, constants::UNLIMITED_POINTS);
    ASSERT_EQ(path.size(), 10u);
    for (int i = 0; i < 5; ++i) {
        EXPECT_DOUBLE_EQ(path[2 * i].z(), static_cast<double>(i));
        EXPECT_DOUBLE_EQ(path[2 * i + 1].z(), static_cast<double>(i));
    }
}

TEST(TurtleWalk_Base4, DigitsReducedModFour) {
    const DigitSequence a{4, 6, 11};
    const DigitSequence b{0, 2, 3};
    EXPECT_EQ(TurtleWalk::walk4(a), TurtleWalk::walk4(b));
}

TEST(TurtleWalk_Base4, EmptyInputYieldsOrigin) {
    const auto path = TurtleWalk::walk4({});
    ASSERT_EQ(path.size(), 1u);
    expect_point(path[0], 0, 0, 0);
}

TEST(TurtleWalk_Base4, RevisitCountsDoNotLeakBetweenCalls) {
    const DigitSequence d{0, 1, 0};
    const auto first  = TurtleWalk::walk4(d);
    const auto second = TurtleWalk::walk4(d);
    EXPECT_EQ(first, second);
}
