#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>

/// @file include/dwalk/constants.hpp
/// @brief Numeric constants shared by the converters and the walk engine.

namespace dwalk::constants {

// ─── Quantization ─────────────────────────────────────────────────────────────

/// Subtracted from the radix before flooring so a normalized value of
/// exactly 1.0 lands on R−1 rather than R.
static constexpr double QUANTIZE_MARGIN = 0.01;

// ─── Turtle Walk ──────────────────────────────────────────────────────────────

/// Digits below this value translate; the rest rotate.
static constexpr int TRANSLATION_DIGITS = 6;

/// Rotation per rotation digit (15°, so 24 steps make a full turn).
static constexpr double ROTATION_STEP_DEGREES = 15.0;

/// ROTATION_STEP_DEGREES in radians.
static constexpr double ROTATION_STEP_RADIANS = 3.14159265358979323846 / 12.0;

/// Default upper bound on emitted points before subsampling kicks in.
static constexpr std::size_t DEFAULT_MAX_POINTS = 10'000;

/// Sentinel for "never subsample".
static constexpr std::size_t UNLIMITED_POINTS = std::numeric_limits<std::size_t>::max();

// ─── Constant Generator ───────────────────────────────────────────────────────

/// Length of each authoritative base-12 digit table.
static constexpr std::size_t KNOWN_CONSTANT_DIGITS = 100;

/// Trailing digits folded into the filler seed.
static constexpr std::size_t FILLER_WINDOW = 10;

/// LCG used to extend π, e and ln 2.
static constexpr std::uint64_t SPIGOT_LCG_MULTIPLIER = 1103515245ULL;
static constexpr std::uint64_t SPIGOT_LCG_INCREMENT  = 12345ULL;

/// LCG used to extend √2 and φ.
static constexpr std::uint64_t NEWTON_LCG_MULTIPLIER = 6364136223846793005ULL;
static constexpr std::uint64_t NEWTON_LCG_INCREMENT  = 1ULL;

// ─── Orbits & Sequences ───────────────────────────────────────────────────────

/// Orbit iteration stops before recording an iterate with |z|² above this.
static constexpr double ESCAPE_RADIUS_SQ = 1e12;

/// Digit count requested from math sources when the caller gives none.
static constexpr std::size_t DEFAULT_MATH_DIGITS = 5'000;

/// Bits per sliding window when reading binary sequences as digits.
static constexpr std::size_t SEQUENCE_WINDOW_BITS = 4;

// ─── Genome ───────────────────────────────────────────────────────────────────

/// Base-4 symbols packed per chunk (4^5 = 1024 < 12^3).
static constexpr std::size_t GENOME_CHUNK_SYMBOLS = 5;

// ─── Audio ────────────────────────────────────────────────────────────────────

/// Samples per analysis frame.
static constexpr std::size_t FFT_SIZE = 2048;

/// Samples between successive frame starts.
static constexpr std::size_t FFT_HOP = 1024;

/// Lower and upper edge of the logarithmic frequency band.
static constexpr double AUDIO_MIN_FREQUENCY_HZ = 20.0;
static constexpr double AUDIO_MAX_FREQUENCY_HZ = 20'000.0;

} // namespace dwalk::constants
