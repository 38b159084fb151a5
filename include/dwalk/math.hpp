#pragma once

/// @file include/dwalk/math.hpp
/// @brief Mathematical digit sources: constants, L-system fractals,
///        Mandelbrot/Julia orbits and binary/chaotic sequences.
///
/// # Module: Math Converters
///
/// ## Responsibility
/// Generate base-12 digit sequences from purely mathematical constructs. No
/// input data is read; every generator is a deterministic function of its
/// parameters.
///
/// ## Guarantees
/// - Never throws for valid parameters; never returns an empty sequence
/// - Every emitted digit is in [0, 12)
/// - Output size is bounded by `n_digits`, `max_iter` or the fractal's
///   iteration count
///
/// ## NOT Responsible For
/// - Arbitrary-precision expansion of constants. Beyond the 100-digit
///   tables the ConstantGenerator emits a deterministic filler, not true
///   digits.

#include "dwalk/constants.hpp"
#include "dwalk/types.hpp"

#include <complex>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace dwalk::math {

using Complex = std::complex<double>;

// ─── ConstantGenerator ────────────────────────────────────────────────────────

enum class MathConstant { Pi, E, Sqrt2, Phi, Ln2 };

/// Which LCG continues a constant past its known prefix.
enum class FillerFamily { Spigot, Newton };

class ConstantGenerator {
public:
    ConstantGenerator() = delete;

    /// First `n_digits` base-12 digits of `c` (integer part first).
    /// `n_digits == 0` is raised to 1.
    [[nodiscard]] static DigitSequence digits(MathConstant c, std::size_t n_digits);

    [[nodiscard]] static DigitSequence pi(std::size_t n_digits)    { return digits(MathConstant::Pi, n_digits); }
    [[nodiscard]] static DigitSequence e(std::size_t n_digits)     { return digits(MathConstant::E, n_digits); }
    [[nodiscard]] static DigitSequence sqrt2(std::size_t n_digits) { return digits(MathConstant::Sqrt2, n_digits); }
    [[nodiscard]] static DigitSequence phi(std::size_t n_digits)   { return digits(MathConstant::Phi, n_digits); }
    [[nodiscard]] static DigitSequence ln2(std::size_t n_digits)   { return digits(MathConstant::Ln2, n_digits); }

    /// The authoritative 100-digit table for `c`.
    [[nodiscard]] static std::span<const Digit> known_prefix(MathConstant c) noexcept;

    [[nodiscard]] static FillerFamily filler_family(MathConstant c) noexcept;

    /// Next filler digit given the digits emitted so far.
    ///
    /// The last FILLER_WINDOW digits are read as a base-12 number (most
    /// recent digit least significant) and stepped once through the family's
    /// 64-bit wrapping LCG; the result mod 12 is returned.
    [[nodiscard]] static Digit filler_digit(std::span<const Digit> history,
                                            FillerFamily family) noexcept;
};

// ─── FractalGenerator ─────────────────────────────────────────────────────────

enum class Fractal { Dragon, Koch, SierpinskiArrowhead, Hilbert, Peano, Gosper };

/// One context-free rewriting rule.
struct LSystemRule {
    char             symbol;
    std::string_view replacement;
};

/// A complete L-system with its turn angle and default depth.
struct LSystem {
    std::string_view         name;
    std::string_view         axiom;
    std::vector<LSystemRule> rules;
    unsigned                 angle_degrees;
    unsigned                 iterations;
};

class FractalGenerator {
public:
    FractalGenerator() = delete;

    [[nodiscard]] static const LSystem& definition(Fractal f);

    /// Rewrite `system.axiom` `iterations` times. Symbols with no rule are
    /// copied unchanged.
    [[nodiscard]] static std::string expand(const LSystem& system, unsigned iterations);

    /// Turtle string → digits: F/G/A/B → 0, '+' → n×10, '-' → n×11 with
    /// n = max(1, angle/15). Other characters are ignored.
    [[nodiscard]] static DigitSequence to_digits(std::string_view commands,
                                                 unsigned angle_degrees);

    /// Digits at the fractal's default depth.
    [[nodiscard]] static DigitSequence generate(Fractal f);

    /// Digits at an explicit depth. Output grows geometrically with depth.
    [[nodiscard]] static DigitSequence generate(Fractal f, unsigned iterations);
};

// ─── OrbitGenerator ───────────────────────────────────────────────────────────

/// A named point of interest in the complex plane.
struct OrbitPreset {
    std::string_view name;
    Complex          c;
    Complex          z0;
};

class OrbitGenerator {
public:
    OrbitGenerator() = delete;

    /// Orbit of 0 under z ← z² + c.
    [[nodiscard]] static DigitSequence mandelbrot(Complex c, std::size_t max_iter);

    /// Orbit of z0 under z ← z² + c.
    ///
    /// Iteration stops before recording an iterate with |z|² above
    /// ESCAPE_RADIUS_SQ (or a non-finite iterate). Each recorded iterate
    /// contributes `angle_digit(z)`. An empty orbit yields `[0]`.
    [[nodiscard]] static DigitSequence julia(Complex c, Complex z0, std::size_t max_iter);

    /// ⌊((arg z + π) / 2π) · 11.99⌋, clamped to 11.
    [[nodiscard]] static Digit angle_digit(Complex z) noexcept;

    [[nodiscard]] static std::span<const OrbitPreset> mandelbrot_presets() noexcept;
    [[nodiscard]] static std::span<const OrbitPreset> julia_presets() noexcept;
};

// ─── SequenceGenerator ────────────────────────────────────────────────────────

class SequenceGenerator {
public:
    SequenceGenerator() = delete;

    /// Fibonacci word bits read through a 4-bit sliding window, mod 12.
    [[nodiscard]] static DigitSequence fibonacci_word(std::size_t n_digits);

    /// Thue–Morse bits read through a 4-bit sliding window, mod 12.
    [[nodiscard]] static DigitSequence thue_morse(std::size_t n_digits);

    /// Logistic map x ← r·x·(1−x); each iterate → ⌊x · 11.99⌋ in [0, 11].
    [[nodiscard]] static DigitSequence logistic_map(double r, double x0, std::size_t n_digits);

    /// Read a bit string through a sliding window of SEQUENCE_WINDOW_BITS,
    /// big-endian, mod 12. Emits at most `n_digits` digits.
    [[nodiscard]] static DigitSequence window_digits(std::span<const std::uint8_t> bits,
                                                     std::size_t n_digits);
};

// ─── MathSource ───────────────────────────────────────────────────────────────

/// A resolved `math.<family>.<name>` converter key.
///
/// ```cpp
/// auto src = MathSource::from_key("math.mandelbrot.spiral");
/// if (src) auto digits = src->generate(5000);
/// ```
class MathSource {
public:
    /// Generator callable; the argument is a digit count or iteration cap.
    using Generator = std::function<DigitSequence(std::size_t)>;

    MathSource(std::string key, Generator generator);

    /// Resolve a converter key; `nullopt` if the family or name is unknown.
    [[nodiscard]] static std::optional<MathSource> from_key(std::string_view key);

    /// All keys `from_key` accepts.
    [[nodiscard]] static std::vector<std::string> known_keys();

    /// Digits for constants and sequences, iteration cap for orbits,
    /// ignored by fractals.
    [[nodiscard]] DigitSequence generate(std::size_t n = constants::DEFAULT_MATH_DIGITS) const;

    [[nodiscard]] const std::string& key() const noexcept { return key_; }

private:
    std::string key_;
    Generator   generator_;
};

} // namespace dwalk::math
