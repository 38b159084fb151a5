#pragma once

/// @file include/dwalk/genome.hpp
/// @brief Nucleotide sequences → base-4 symbols or packed base-12 digits.
///
/// # Module: GenomicCodec
///
/// ## Responsibility
/// Map A/C/G/T (either case) to 0/1/2/3 and, for base 12, pack the symbol
/// stream in fixed chunks of five (see `DigitCodec::repack_base4`).
///
/// ## Guarantees
/// - Ambiguity codes (N, R, Y, ...), gaps and whitespace are skipped, never
///   rejected
/// - Zero usable bases yields `[0]`
///
/// ## NOT Responsible For
/// - FASTA framing (see `DataLoader::parse_fasta`)

#include "dwalk/types.hpp"

#include <optional>
#include <string_view>

namespace dwalk::genome {

class GenomicCodec {
public:
    GenomicCodec() = delete;

    /// A/C/G/T → 0/1/2/3 (case-insensitive); `nullopt` for anything else.
    [[nodiscard]] static std::optional<Digit> nucleotide_value(char base) noexcept;

    /// Count of characters `nucleotide_value` accepts.
    [[nodiscard]] static std::size_t usable_bases(std::string_view sequence) noexcept;

    /// One base-4 symbol per usable base.
    [[nodiscard]] static DigitSequence to_base4(std::string_view sequence);

    /// Usable bases packed five at a time into base 12.
    [[nodiscard]] static DigitSequence to_base12(std::string_view sequence);

    /// Dispatch on radix.
    [[nodiscard]] static DigitSequence convert(std::string_view sequence, Radix radix);
};

} // namespace dwalk::genome
