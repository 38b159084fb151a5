#pragma once

/// @file include/dwalk/types.hpp
/// @brief Shared primitive types for the dwalk digit-walk system.
///
/// Every module includes this file. It defines the digit and radix value
/// types and the Eigen-based geometry aliases used by the walk engine.

#include <Eigen/Dense>
#include <Eigen/Geometry>

#include <cstdint>
#include <vector>

namespace dwalk {

// ─── Digits ───────────────────────────────────────────────────────────────────

/// One walk instruction, an integer in [0, R) for the active radix R.
using Digit = std::uint8_t;

/// Ordered digit stream produced by a converter. Converters never emit an
/// empty sequence; insufficient input yields a documented fallback digit.
using DigitSequence = std::vector<Digit>;

/// The two radices the system supports.
enum class Radix : std::uint8_t {
    Base4  = 4,   ///< Planar lattice walk (nucleotides, coarse signals)
    Base12 = 12,  ///< Full 3-D turtle walk
};

/// Numeric value of a radix.
[[nodiscard]] constexpr int radix_value(Radix r) noexcept {
    return static_cast<int>(r);
}

/// Middle digit ⌊R/2⌋, the fallback for flat or undecidable input.
[[nodiscard]] constexpr Digit middle_digit(Radix r) noexcept {
    return static_cast<Digit>(radix_value(r) / 2);
}

// ─── Geometry Aliases ─────────────────────────────────────────────────────────

/// A position in walk space.
using Point3 = Eigen::Vector3d;

/// Polyline emitted by a walk, one point per consumed digit before
/// subsampling.
using Path = std::vector<Point3>;

/// Turtle heading as a unit quaternion. Identity means "facing +X".
using Orientation = Eigen::Quaterniond;

} // namespace dwalk
