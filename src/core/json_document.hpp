#pragma once

/// @file src/core/json_document.hpp
/// @brief Internal helpers over Boost.JSON for price documents and artifacts.

#include <boost/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace dwalk::core {

/// Parse `text` as a strict JSON document.
///
/// # Throws
/// `ConversionFailed` naming `what` when the text is not valid JSON.
[[nodiscard]] boost::json::value load_json(std::string_view text, std::string_view what);

/// Numeric value of a JSON number; `std::nullopt` for every other kind,
/// strings included.
[[nodiscard]] std::optional<double> json_number(const boost::json::value& value) noexcept;

/// Copy of a JSON string member, or an empty string when absent or not a string.
[[nodiscard]] std::string json_text(const boost::json::object& object, std::string_view key);

} // namespace dwalk::core
