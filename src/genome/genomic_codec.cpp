/// @file src/genome/genomic_codec.cpp
/// @brief Implementation of GenomicCodec.

#include "dwalk/genome.hpp"
#include "dwalk/digit_codec.hpp"

namespace dwalk::genome {

std::optional<Digit> GenomicCodec::nucleotide_value(char base) noexcept {
    switch (base) {
        case 'A': case 'a': return Digit{0};
        case 'C': case 'c': return Digit{1};
        case 'G': case 'g': return Digit{2};
        case 'T': case 't': return Digit{3};
        default:            return std::nullopt;
    }
}

std::size_t GenomicCodec::usable_bases(std::string_view sequence) noexcept {
    std::size_t n = 0;
    for (char c : sequence) {
        if (nucleotide_value(c)) ++n;
    }
    return n;
}

DigitSequence GenomicCodec::to_base4(std::string_view sequence) {
    DigitSequence out;
    out.reserve(sequence.size());
    for (char c : sequence) {
        if (const auto v = nucleotide_value(c)) {
            out.push_back(*v);
        }
    }
    if (out.empty()) {
        out.push_back(0);
    }
    return out;
}

DigitSequence GenomicCodec::to_base12(std::string_view sequence) {
    const DigitSequence symbols = to_base4(sequence);
    return codec::DigitCodec::repack_base4(symbols);
}

DigitSequence GenomicCodec::convert(std::string_view sequence, Radix radix) {
    return radix == Radix::Base4 ? to_base4(sequence) : to_base12(sequence);
}

} // namespace dwalk::genome
