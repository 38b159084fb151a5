/**
 * @file  fuzz_engine.cpp
 * @brief libFuzzer target for the full Engine pipeline (end-to-end)
 *
 * Build:
 *   cmake -DDWALK_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_engine
 *
 * Run for 60 seconds:
 *   ./fuzz_engine -max_total_time=60
 *
 * The first input byte selects the converter (dna, audio, finance, cosmos)
 * and the radix; the remaining bytes are the payload.
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. The only exception that escapes is ConversionFailed.
 *   3. If digits are returned:
 *      a. the sequence is non-empty
 *      b. every digit is below the configured radix
 *      c. the path is non-empty, finite and within max_points + 1
 */

#include <array>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "dwalk/engine.hpp"
#include "dwalk/error.hpp"

using namespace dwalk;
using namespace dwalk::core;

namespace {

constexpr std::array<std::string_view, 4> CONVERTERS{"dna", "audio", "finance", "cosmos"};
constexpr std::size_t FUZZ_MAX_POINTS = 256;

} // anonymous namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size == 0) {
        return 0;
    }

    const std::uint8_t selector = data[0];
    const std::string_view payload{
        reinterpret_cast<const char*>(data + 1), size - 1
    };

    const Radix radix = (selector & 0x80) ? Radix::Base4 : Radix::Base12;
    const Engine engine(EngineConfig{.radix = radix, .max_points = FUZZ_MAX_POINTS});

    Source source;
    source.id        = "fuzz";
    source.converter = std::string(CONVERTERS[selector % CONVERTERS.size()]);

    DigitSequence digits;
    try {
        digits = engine.convert(source, payload);
    } catch (const ConversionFailed&) {
        return 0;
    }

    // Invariant 3a
    assert(!digits.empty());

    // Invariant 3b
    for (Digit d : digits) {
        assert(d < radix_value(radix));
        (void)d;
    }

    // Invariant 3c
    const Path path = engine.walk(digits, mapping::DigitMapping{});
    assert(!path.empty());
    assert(path.size() <= FUZZ_MAX_POINTS + 1);
    for (const auto& p : path) {
        assert(p.allFinite());
        (void)p;
    }

    return 0;
}
