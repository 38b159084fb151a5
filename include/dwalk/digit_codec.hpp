#pragma once

/// @file include/dwalk/digit_codec.hpp
/// @brief Real-valued series → digits, and base-4 → base-12 repacking.
///
/// # Module: DigitCodec
///
/// ## Responsibility
/// The shared quantization primitives every converter funnels through:
///   - min-max normalization of a real series into [0, R)
///   - fixed-chunk repacking of a base-4 symbol stream into base 12
///   - reduction of an arbitrary integer into a radix
///
/// ## Guarantees
/// - Never throws; never divides by zero
/// - Output of `normalize` has the same length as its input (except the
///   empty-input fallback `[0]`)
/// - Every emitted digit is in [0, R)
///
/// ## NOT Responsible For
/// - Parsing raw bytes (see DataLoader)
/// - Domain-specific preprocessing such as price deltas (see SignalConverter)

#include "dwalk/types.hpp"

#include <cstdint>
#include <span>

namespace dwalk::codec {

class DigitCodec {
public:
    DigitCodec() = delete;

    /// Min-max normalize `values` into digits of radix `radix`.
    ///
    /// Each finite value v maps to ⌊(v − min)/(max − min) · (R − 0.01)⌋,
    /// clamped to [0, R−1], where min/max range over the finite values only.
    /// When every finite value is equal, or there are none, all elements map
    /// to ⌊R/2⌋. Non-finite elements map to ⌊R/2⌋.
    ///
    /// # Returns
    /// `[0]` for empty input; otherwise exactly `values.size()` digits.
    [[nodiscard]] static DigitSequence
    normalize(std::span<const double> values, Radix radix) noexcept;

    /// Quantize one value already scaled to [0, 1] into radix `radix`.
    /// Out-of-range input is clamped; NaN maps to 0.
    [[nodiscard]] static Digit
    quantize_unit(double unit, Radix radix) noexcept;

    /// Repack a base-4 symbol stream into base-12 digits.
    ///
    /// Symbols are grouped in chunks of GENOME_CHUNK_SYMBOLS, read big-endian
    /// into an accumulator, and the accumulator is emitted least-significant
    /// digit first. Every chunk, including a trailing partial one, emits at
    /// least one digit. Symbols above 3 are reduced mod 4.
    ///
    /// # Returns
    /// `[0]` for empty input.
    [[nodiscard]] static DigitSequence
    repack_base4(std::span<const Digit> symbols) noexcept;

    /// Non-negative remainder of `value` modulo the radix.
    [[nodiscard]] static Digit reduce(std::int64_t value, Radix radix) noexcept;
};

} // namespace dwalk::codec
