#pragma once

/// @file include/dwalk/artifact.hpp
/// @brief Persisted digit-sequence records (walk artifacts).
///
/// # Module: ArtifactCodec
///
/// ## Responsibility
/// Read and write the JSON form of a converted source:
/// ```json
/// {"id": "pi", "name": "Pi", "category": "math",
///  "subcategory": "Constants", "base12": [3, 1, 8, 4, 8, 0]}
/// ```
/// `digits` is accepted as an alias of `base12` when reading.
///
/// ## Guarantees
/// - Integer values outside [0, 12) are reduced mod 12, never rejected
/// - Integral floats (e.g. `3.0`) are accepted; strings are not digits
/// - Input must be strict JSON; YAML-only syntax is rejected
/// - Written documents round-trip through `parse`

#include "dwalk/error.hpp"
#include "dwalk/types.hpp"

#include <string>
#include <string_view>

namespace dwalk::core {

struct WalkArtifact {
    std::string   id;
    std::string   name;
    std::string   category;
    std::string   subcategory;
    DigitSequence digits;
};

class ArtifactCodec {
public:
    ArtifactCodec() = delete;

    /// # Throws
    /// `ConversionFailed` on unparseable JSON, a missing `id`, a missing
    /// digit array, or an entry that is not an integral number.
    [[nodiscard]] static WalkArtifact parse(std::string_view json);

    [[nodiscard]] static std::string to_json(const WalkArtifact& artifact);
};

} // namespace dwalk::core
