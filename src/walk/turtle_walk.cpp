/// @file src/walk/turtle_walk.cpp
/// @brief Implementation of Turtle and TurtleWalk.

#include "dwalk/walk.hpp"

#include <array>
#include <cstdint>
#include <unordered_map>
#include <utility>

namespace dwalk::walk {

namespace {

/// Local translation axes for digits 0..5.
const std::array<Point3, constants::TRANSLATION_DIGITS> LOCAL_AXES{
    Point3( 1.0,  0.0,  0.0),
    Point3(-1.0,  0.0,  0.0),
    Point3( 0.0,  1.0,  0.0),
    Point3( 0.0, -1.0,  0.0),
    Point3( 0.0,  0.0,  1.0),
    Point3( 0.0,  0.0, -1.0),
};

/// Lattice steps for base-4 digits.
constexpr std::array<std::pair<int, int>, 4> LATTICE_STEPS{{
    { 1,  0},
    {-1,  0},
    { 0,  1},
    { 0, -1},
}};

/// Pack a lattice cell into one hash key.
std::uint64_t cell_key(std::int64_t x, std::int64_t y) noexcept {
    return (static_cast<std::uint64_t>(static_cast<std::uint32_t>(x)) << 32)
         | static_cast<std::uint64_t>(static_cast<std::uint32_t>(y));
}

} // anonymous namespace

// ─── Turtle ───────────────────────────────────────────────────────────────────

Turtle::Turtle() noexcept
    : position_(Point3::Zero())
    , orientation_(Orientation::Identity())
{}

Point3 Turtle::local_axis(Digit action) noexcept {
    return LOCAL_AXES[action % constants::TRANSLATION_DIGITS];
}

Orientation Turtle::rotation_for(Digit action) noexcept {
    const int k = (static_cast<int>(action) - constants::TRANSLATION_DIGITS) % 6;
    const double sign = (k % 2 == 0) ? 1.0 : -1.0;
    const Point3 axis = Point3::Unit(k / 2);
    return Orientation(Eigen::AngleAxisd(sign * constants::ROTATION_STEP_RADIANS, axis));
}

void Turtle::step(Digit action) noexcept {
    const Digit a = action % 12;
    if (a < constants::TRANSLATION_DIGITS) {
        position_ += orientation_ * local_axis(a);
        return;
    }
    orientation_ = rotation_for(a) * orientation_;
    orientation_.normalize();
}

// ─── TurtleWalk::subsample ────────────────────────────────────────────────────

Path TurtleWalk::subsample(Path path, std::size_t max_points) {
    if (max_points == 0) {
        max_points = 1;
    }
    if (path.size() <= max_points) {
        return path;
    }

    const std::size_t n    = path.size();
    const std::size_t step = (n + max_points - 1) / max_points;

    Path out;
    out.reserve(n / step + 2);
    for (std::size_t i = 0; i < n; i += step) {
        out.push_back(path[i]);
    }
    if ((n - 1) % step != 0) {
        out.push_back(path.back());
    }
    return out;
}

// ─── TurtleWalk::walk ─────────────────────────────────────────────────────────

Path TurtleWalk::walk(std::span<const Digit> digits,
                      const mapping::DigitMapping& mapping,
                      std::size_t max_points)
{
    if (digits.empty()) {
        return Path{Point3::Zero()};
    }

    Turtle turtle;
    Path path;
    path.reserve(digits.size());
    for (Digit d : digits) {
        turtle.step(mapping.apply(d));
        path.push_back(turtle.position());
    }
    return subsample(std::move(path), max_points);
}

// ─── TurtleWalk::walk4 ────────────────────────────────────────────────────────

Path TurtleWalk::walk4(std::span<const Digit> digits, std::size_t max_points) {
    if (digits.empty()) {
        return Path{Point3::Zero()};
    }

    std::unordered_map<std::uint64_t, std::uint32_t> visits;
    visits.reserve(digits.size());

    std::int64_t x = 0;
    std::int64_t y = 0;

    Path path;
    path.reserve(digits.size());
    for (Digit d : digits) {
        const auto [dx, dy] = LATTICE_STEPS[d % 4];
        x += dx;
        y += dy;
        const std::uint32_t count = ++visits[cell_key(x, y)];
        path.emplace_back(static_cast<double>(x),
                          static_cast<double>(y),
                          static_cast<double>(count - 1));
    }
    return subsample(std::move(path), max_points);
}

} // namespace dwalk::walk
