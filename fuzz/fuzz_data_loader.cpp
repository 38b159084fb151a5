/**
 * @file  fuzz_data_loader.cpp
 * @brief libFuzzer target for the raw payload decoders.
 *
 * Build:
 *   cmake -DDWALK_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_data_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_data_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No decoder reads out of bounds (WAV chunk sizes are attacker-controlled).
 *   2. Decoders either return a result or throw ConversionFailed.
 *   3. Successful results are non-empty where the decoder promises it:
 *      a. FASTA sequence has at least one usable base
 *      b. strain, price CSV and price JSON return at least one value
 *      c. price CSV and JSON values are finite and positive
 *   4. A decoded WAV has at least one channel.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "dwalk/data_loader.hpp"
#include "dwalk/error.hpp"
#include "dwalk/genome.hpp"

using namespace dwalk;
using namespace dwalk::core;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{
        reinterpret_cast<const char*>(data), size
    };

    try {
        const auto seq = DataLoader::parse_fasta(input);
        assert(genome::GenomicCodec::usable_bases(seq) > 0);
    } catch (const ConversionFailed&) {
    }

    try {
        const auto strain = DataLoader::parse_strain_text(input);
        assert(!strain.empty());
    } catch (const ConversionFailed&) {
    }

    try {
        const auto prices = DataLoader::parse_price_csv(input);
        assert(!prices.empty());
        for (double p : prices) {
            assert(std::isfinite(p) && p > 0.0);
            (void)p;
        }
    } catch (const ConversionFailed&) {
    }

    try {
        const auto prices = DataLoader::parse_price_json(input);
        assert(!prices.empty());
        for (double p : prices) {
            assert(std::isfinite(p) && p > 0.0);
            (void)p;
        }
    } catch (const ConversionFailed&) {
    }

    try {
        const auto audio = DataLoader::decode_wav(input);
        assert(audio.channels > 0);
    } catch (const ConversionFailed&) {
    }

    return 0;
}
