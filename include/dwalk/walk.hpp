#pragma once

/// @file include/dwalk/walk.hpp
/// @brief Turtle walk engine: digit sequences → 3-D polylines.
///
/// # Module: TurtleWalk
///
/// ## Responsibility
/// Interpret each digit as one turtle instruction and record the turtle's
/// position after every instruction.
///
/// Base 12 (`walk`), after applying the digit mapping σ:
///
/// | d' | Action                                         |
/// |----|------------------------------------------------|
/// | 0  | move +X (local frame)                          |
/// | 1  | move −X                                        |
/// | 2  | move +Y                                        |
/// | 3  | move −Y                                        |
/// | 4  | move +Z                                        |
/// | 5  | move −Z                                        |
/// | 6  | rotate +15° about world X                      |
/// | 7  | rotate −15° about world X                      |
/// | 8  | rotate +15° about world Y                      |
/// | 9  | rotate −15° about world Y                      |
/// | 10 | rotate +15° about world Z                      |
/// | 11 | rotate −15° about world Z                      |
///
/// Rotations are left-multiplied onto the orientation (rot ← q · rot).
///
/// Base 4 (`walk4`): d mod 4 moves ±X / ±Y on an integer lattice; the Z
/// coordinate of each emitted point is (visits to that cell − 1).
///
/// ## Guarantees
/// - Before subsampling, one point per digit; empty input yields [origin]
/// - Subsampling keeps index 0, every ⌈len/max⌉-th point, and always the
///   final point
/// - Deterministic; no shared state between calls
///
/// ## NOT Responsible For
/// - Producing digits (see the converters)
/// - Rendering or serializing the path

#include "dwalk/constants.hpp"
#include "dwalk/mapping.hpp"
#include "dwalk/types.hpp"

#include <span>

namespace dwalk::walk {

// ─── Turtle ───────────────────────────────────────────────────────────────────

/// Position + orientation state machine for the base-12 walk.
class Turtle {
public:
    Turtle() noexcept;

    /// Execute one already-mapped action digit (reduced mod 12).
    void step(Digit action) noexcept;

    [[nodiscard]] const Point3&      position()    const noexcept { return position_; }
    [[nodiscard]] const Orientation& orientation() const noexcept { return orientation_; }

    /// Unit vector in the local frame for a translation digit (0..5).
    [[nodiscard]] static Point3 local_axis(Digit action) noexcept;

    /// Rotation for a rotation digit (6..11).
    [[nodiscard]] static Orientation rotation_for(Digit action) noexcept;

private:
    Point3      position_;
    Orientation orientation_;
};

// ─── TurtleWalk ───────────────────────────────────────────────────────────────

class TurtleWalk {
public:
    TurtleWalk() = delete;

    /// Base-12 walk through σ.
    ///
    /// # Arguments
    /// * `digits`     : any byte values; each is reduced mod 12
    /// * `mapping`    : applied before interpretation
    /// * `max_points` : subsampling bound; 0 is treated as 1
    [[nodiscard]] static Path walk(std::span<const Digit> digits,
                                   const mapping::DigitMapping& mapping,
                                   std::size_t max_points = constants::DEFAULT_MAX_POINTS);

    /// Base-4 lattice walk with revisit heights.
    [[nodiscard]] static Path walk4(std::span<const Digit> digits,
                                    std::size_t max_points = constants::DEFAULT_MAX_POINTS);

    /// Decimate `path` to roughly `max_points`, always keeping the last point.
    /// The result may hold max_points + 1 points.
    [[nodiscard]] static Path subsample(Path path, std::size_t max_points);
};

} // namespace dwalk::walk
