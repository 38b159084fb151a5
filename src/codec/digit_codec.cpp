/// @file src/codec/digit_codec.cpp
/// @brief Implementation of DigitCodec.

#include "dwalk/digit_codec.hpp"
#include "dwalk/constants.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace dwalk::codec {

// ─── quantize_unit ────────────────────────────────────────────────────────────

Digit DigitCodec::quantize_unit(double unit, Radix radix) noexcept {
    const int r = radix_value(radix);
    if (std::isnan(unit)) {
        return 0;
    }
    const double scaled = std::floor(std::clamp(unit, 0.0, 1.0)
                                     * (static_cast<double>(r) - constants::QUANTIZE_MARGIN));
    const int d = std::clamp(static_cast<int>(scaled), 0, r - 1);
    return static_cast<Digit>(d);
}

// ─── normalize ────────────────────────────────────────────────────────────────

DigitSequence DigitCodec::normalize(std::span<const double> values, Radix radix) noexcept {
    if (values.empty()) {
        return DigitSequence{0};
    }

    double lo = std::numeric_limits<double>::infinity();
    double hi = -std::numeric_limits<double>::infinity();
    for (double v : values) {
        if (!std::isfinite(v)) continue;
        lo = std::min(lo, v);
        hi = std::max(hi, v);
    }

    const Digit mid = middle_digit(radix);

    // No finite values, or a flat series: everything sits in the middle.
    if (!(hi > lo)) {
        return DigitSequence(values.size(), mid);
    }

    // hi − lo can overflow for values near ±DBL_MAX; halve both operands then.
    const bool halve = !std::isfinite(hi - lo);
    const double range = halve ? (hi * 0.5 - lo * 0.5) : (hi - lo);

    DigitSequence out;
    out.reserve(values.size());
    for (double v : values) {
        if (!std::isfinite(v)) {
            out.push_back(mid);
            continue;
        }
        const double offset = halve ? (v * 0.5 - lo * 0.5) : (v - lo);
        out.push_back(quantize_unit(offset / range, radix));
    }
    return out;
}

// ─── repack_base4 ─────────────────────────────────────────────────────────────

DigitSequence DigitCodec::repack_base4(std::span<const Digit> symbols) noexcept {
    if (symbols.empty()) {
        return DigitSequence{0};
    }

    DigitSequence out;
    out.reserve(symbols.size() * 3 / constants::GENOME_CHUNK_SYMBOLS + 3);

    auto flush = [&out](std::uint32_t acc) {
        do {
            out.push_back(static_cast<Digit>(acc % 12));
            acc /= 12;
        } while (acc > 0);
    };

    std::uint32_t acc = 0;
    std::size_t in_chunk = 0;
    for (Digit s : symbols) {
        acc = acc * 4 + static_cast<std::uint32_t>(s % 4);
        if (++in_chunk == constants::GENOME_CHUNK_SYMBOLS) {
            flush(acc);
            acc = 0;
            in_chunk = 0;
        }
    }
    if (in_chunk > 0) {
        flush(acc);
    }

    return out;
}

// ─── reduce ───────────────────────────────────────────────────────────────────

Digit DigitCodec::reduce(std::int64_t value, Radix radix) noexcept {
    const std::int64_t r = radix_value(radix);
    return static_cast<Digit>(((value % r) + r) % r);
}

} // namespace dwalk::codec
