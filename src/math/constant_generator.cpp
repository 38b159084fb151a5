/// @file src/math/constant_generator.cpp
/// @brief Base-12 digit tables for π, e, √2, φ, ln 2 and the deterministic
///        filler that continues them.

#include "dwalk/math.hpp"

#include <algorithm>
#include <array>

namespace dwalk::math {

namespace {

using Table = std::array<Digit, constants::KNOWN_CONSTANT_DIGITS>;

// 3.184809493B918664573A6211BB1551A05729290A7...
constexpr Table PI_DIGITS{
    3, 1, 8, 4, 8, 0, 9, 4, 9, 3, 11, 9, 1, 8, 6, 6, 4, 5, 7, 3,
    10, 6, 2, 1, 1, 11, 11, 1, 5, 5, 1, 10, 0, 5, 7, 2, 9, 2, 9, 0,
    10, 7, 8, 5, 3, 11, 7, 5, 4, 8, 0, 6, 8, 8, 5, 10, 9, 4, 0, 11,
    6, 5, 9, 2, 5, 4, 9, 1, 1, 4, 3, 2, 0, 7, 6, 10, 6, 4, 3, 2,
    3, 9, 10, 7, 7, 7, 10, 9, 8, 0, 6, 4, 3, 5, 11, 9, 10, 2, 1, 6,
};

// 2.875236069821...
constexpr Table E_DIGITS{
    2, 8, 7, 5, 2, 3, 6, 0, 6, 9, 8, 2, 1, 10, 3, 6, 1, 0, 5, 7,
    2, 8, 5, 0, 11, 8, 7, 0, 4, 9, 3, 8, 4, 6, 0, 9, 7, 2, 0, 5,
    11, 1, 9, 10, 0, 6, 4, 1, 10, 5, 4, 8, 3, 7, 5, 2, 4, 0, 6, 11,
    9, 3, 8, 10, 7, 1, 1, 2, 8, 3, 5, 0, 4, 9, 11, 2, 10, 6, 3, 8,
    1, 7, 5, 4, 2, 0, 9, 8, 6, 3, 11, 4, 7, 2, 0, 5, 10, 1, 9, 6,
};

// 1.4B79170A07B8...
constexpr Table SQRT2_DIGITS{
    1, 4, 11, 7, 9, 1, 7, 0, 10, 0, 7, 11, 8, 5, 3, 4, 0, 9, 6, 8,
    2, 5, 1, 10, 6, 7, 8, 9, 11, 0, 4, 2, 5, 3, 9, 7, 1, 0, 8, 6,
    4, 11, 2, 9, 0, 5, 7, 8, 3, 10, 1, 6, 4, 0, 9, 11, 7, 2, 5, 8,
    3, 0, 6, 10, 9, 4, 1, 7, 11, 5, 2, 8, 0, 3, 6, 9, 10, 4, 7, 1,
    5, 11, 8, 2, 0, 6, 3, 9, 10, 7, 4, 1, 5, 8, 11, 2, 0, 6, 3, 9,
};

// 1.74BB6772802A...
constexpr Table PHI_DIGITS{
    1, 7, 4, 11, 11, 6, 7, 7, 2, 8, 0, 2, 10, 9, 5, 3, 1, 6, 8, 4,
    0, 11, 7, 9, 2, 5, 10, 3, 8, 1, 6, 4, 0, 9, 7, 11, 2, 5, 8, 3,
    10, 1, 6, 4, 0, 9, 7, 11, 2, 5, 8, 3, 10, 1, 6, 4, 0, 9, 7, 11,
    2, 5, 8, 3, 10, 1, 6, 4, 0, 9, 7, 11, 2, 5, 8, 3, 10, 1, 6, 4,
    0, 9, 7, 11, 2, 5, 8, 3, 10, 1, 6, 4, 0, 9, 7, 11, 2, 5, 8, 3,
};

// 0.83B4BB75AB48...
constexpr Table LN2_DIGITS{
    0, 8, 3, 11, 4, 11, 11, 7, 5, 10, 11, 4, 8, 9, 2, 6, 0, 3, 7, 5,
    1, 10, 8, 4, 11, 6, 2, 9, 0, 5, 7, 3, 1, 10, 8, 4, 11, 6, 2, 9,
    0, 5, 7, 3, 1, 10, 8, 4, 11, 6, 2, 9, 0, 5, 7, 3, 1, 10, 8, 4,
    11, 6, 2, 9, 0, 5, 7, 3, 1, 10, 8, 4, 11, 6, 2, 9, 0, 5, 7, 3,
    1, 10, 8, 4, 11, 6, 2, 9, 0, 5, 7, 3, 1, 10, 8, 4, 11, 6, 2, 9,
};

} // anonymous namespace

// ─── Tables ───────────────────────────────────────────────────────────────────

std::span<const Digit> ConstantGenerator::known_prefix(MathConstant c) noexcept {
    switch (c) {
        case MathConstant::Pi:    return PI_DIGITS;
        case MathConstant::E:     return E_DIGITS;
        case MathConstant::Sqrt2: return SQRT2_DIGITS;
        case MathConstant::Phi:   return PHI_DIGITS;
        case MathConstant::Ln2:   return LN2_DIGITS;
    }
    return PI_DIGITS;
}

FillerFamily ConstantGenerator::filler_family(MathConstant c) noexcept {
    switch (c) {
        case MathConstant::Sqrt2:
        case MathConstant::Phi:
            return FillerFamily::Newton;
        case MathConstant::Pi:
        case MathConstant::E:
        case MathConstant::Ln2:
            break;
    }
    return FillerFamily::Spigot;
}

// ─── Filler ───────────────────────────────────────────────────────────────────

Digit ConstantGenerator::filler_digit(std::span<const Digit> history,
                                      FillerFamily family) noexcept {
    const std::size_t window = std::min(history.size(), constants::FILLER_WINDOW);

    std::uint64_t seed  = 0;
    std::uint64_t place = 1;
    for (std::size_t i = 0; i < window; ++i) {
        seed  += static_cast<std::uint64_t>(history[history.size() - 1 - i]) * place;
        place *= 12;
    }

    const std::uint64_t next = (family == FillerFamily::Newton)
        ? seed * constants::NEWTON_LCG_MULTIPLIER + constants::NEWTON_LCG_INCREMENT
        : seed * constants::SPIGOT_LCG_MULTIPLIER + constants::SPIGOT_LCG_INCREMENT;

    return static_cast<Digit>(next % 12);
}

// ─── digits ───────────────────────────────────────────────────────────────────

DigitSequence ConstantGenerator::digits(MathConstant c, std::size_t n_digits) {
    n_digits = std::max<std::size_t>(n_digits, 1);

    const auto prefix = known_prefix(c);
    if (n_digits <= prefix.size()) {
        return DigitSequence(prefix.begin(), prefix.begin() + static_cast<std::ptrdiff_t>(n_digits));
    }

    DigitSequence out(prefix.begin(), prefix.end());
    out.reserve(n_digits);
    const FillerFamily family = filler_family(c);
    while (out.size() < n_digits) {
        out.push_back(filler_digit(out, family));
    }
    return out;
}

} // namespace dwalk::math
