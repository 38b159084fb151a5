/// @file src/math/sequence_generator.cpp
/// @brief Fibonacci word, Thue–Morse and logistic-map digit streams.

#include "dwalk/math.hpp"

#include <algorithm>
#include <cmath>

namespace dwalk::math {

// ─── window_digits ────────────────────────────────────────────────────────────

DigitSequence SequenceGenerator::window_digits(std::span<const std::uint8_t> bits,
                                               std::size_t n_digits) {
    constexpr std::size_t W = constants::SEQUENCE_WINDOW_BITS;

    DigitSequence out;
    if (bits.size() >= W) {
        const std::size_t available = bits.size() - W + 1;
        const std::size_t n = std::min(available, n_digits);
        out.reserve(n);
        for (std::size_t i = 0; i < n; ++i) {
            unsigned value = 0;
            for (std::size_t k = 0; k < W; ++k) {
                value = (value << 1) | (bits[i + k] & 1u);
            }
            out.push_back(static_cast<Digit>(value % 12));
        }
    }

    if (out.empty()) {
        out.push_back(0);
    }
    return out;
}

// ─── fibonacci_word ───────────────────────────────────────────────────────────

DigitSequence SequenceGenerator::fibonacci_word(std::size_t n_digits) {
    const std::size_t needed = n_digits + constants::SEQUENCE_WINDOW_BITS - 1;

    // S(k) = S(k−1) S(k−2), with S(0) = "0", S(1) = "01".
    std::vector<std::uint8_t> prev{0};
    std::vector<std::uint8_t> word{0, 1};
    while (word.size() < needed) {
        std::vector<std::uint8_t> next;
        next.reserve(word.size() + prev.size());
        next.insert(next.end(), word.begin(), word.end());
        next.insert(next.end(), prev.begin(), prev.end());
        prev = std::move(word);
        word = std::move(next);
    }

    return window_digits(word, n_digits);
}

// ─── thue_morse ───────────────────────────────────────────────────────────────

DigitSequence SequenceGenerator::thue_morse(std::size_t n_digits) {
    const std::size_t needed = n_digits + constants::SEQUENCE_WINDOW_BITS - 1;

    std::vector<std::uint8_t> t{0};
    while (t.size() < needed) {
        const std::size_t n = t.size();
        t.reserve(2 * n);
        for (std::size_t i = 0; i < n; ++i) {
            t.push_back(static_cast<std::uint8_t>(1 - t[i]));
        }
    }

    return window_digits(t, n_digits);
}

// ─── logistic_map ─────────────────────────────────────────────────────────────

DigitSequence SequenceGenerator::logistic_map(double r, double x0, std::size_t n_digits) {
    n_digits = std::max<std::size_t>(n_digits, 1);

    DigitSequence out;
    out.reserve(n_digits);
    double x = x0;
    for (std::size_t i = 0; i < n_digits; ++i) {
        x = r * x * (1.0 - x);
        if (!std::isfinite(x)) {
            out.push_back(0);
            continue;
        }
        const double scaled = std::floor(x * (12.0 - constants::QUANTIZE_MARGIN));
        out.push_back(static_cast<Digit>(std::clamp(scaled, 0.0, 11.0)));
    }
    return out;
}

} // namespace dwalk::math
