/**
 * @file  fuzz_artifact.cpp
 * @brief libFuzzer target for walk artifact JSON parsing.
 *
 * Build:
 *   cmake -DDWALK_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_artifact
 *
 * Safety invariants verified on every input:
 *   1. parse() either returns or throws ConversionFailed.
 *   2. A parsed artifact has a non-empty id and at least one digit < 12.
 *   3. to_json(parse(x)) parses again to the same id, name and digits.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "dwalk/artifact.hpp"
#include "dwalk/error.hpp"

using namespace dwalk;
using namespace dwalk::core;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{
        reinterpret_cast<const char*>(data), size
    };

    WalkArtifact artifact;
    try {
        artifact = ArtifactCodec::parse(input);
    } catch (const ConversionFailed&) {
        return 0;
    }

    // Invariant 2
    assert(!artifact.id.empty());
    assert(!artifact.digits.empty());
    for (Digit d : artifact.digits) {
        assert(d < 12);
        (void)d;
    }

    // Invariant 3
    const WalkArtifact again = ArtifactCodec::parse(ArtifactCodec::to_json(artifact));
    assert(again.id == artifact.id);
    assert(again.name == artifact.name);
    assert(again.digits == artifact.digits);
    (void)again;

    return 0;
}
