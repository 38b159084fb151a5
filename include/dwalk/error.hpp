#pragma once

/// @file include/dwalk/error.hpp
/// @brief Exception raised when raw input cannot be decoded at all.
///
/// Converters proper never throw: they fall back to sentinel digits. Only the
/// raw decoders (FASTA, strain text, price CSV/JSON, WAV, artifact JSON)
/// raise ConversionFailed, and only when the payload cannot be read as its
/// primitive type.

#include <stdexcept>
#include <string>

namespace dwalk {

class ConversionFailed : public std::runtime_error {
public:
    explicit ConversionFailed(const std::string& cause)
        : std::runtime_error("conversion failed: " + cause)
        , cause_(cause)
    {}

    /// The human-readable cause without the "conversion failed" prefix.
    [[nodiscard]] const std::string& cause() const noexcept { return cause_; }

private:
    std::string cause_;
};

} // namespace dwalk
