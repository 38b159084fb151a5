/// @file src/core/json_document.cpp
/// @brief Boost.JSON parsing helpers shared by the price and artifact readers.

#include "json_document.hpp"
#include "dwalk/error.hpp"

#include <fmt/core.h>

namespace dwalk::core {

boost::json::value load_json(std::string_view text, std::string_view what) {
    boost::json::error_code ec;
    boost::json::value root = boost::json::parse(
        boost::json::string_view(text.data(), text.size()), ec);
    if (ec) {
        throw ConversionFailed(fmt::format("{} is malformed: {}", what, ec.message()));
    }
    return root;
}

std::optional<double> json_number(const boost::json::value& value) noexcept {
    if (value.is_int64())  return static_cast<double>(value.get_int64());
    if (value.is_uint64()) return static_cast<double>(value.get_uint64());
    if (value.is_double()) return value.get_double();
    return std::nullopt;
}

std::string json_text(const boost::json::object& object, std::string_view key) {
    const boost::json::value* v = object.if_contains(boost::json::string_view(key.data(), key.size()));
    if (v == nullptr || !v->is_string()) {
        return {};
    }
    const boost::json::string& s = v->get_string();
    return std::string(s.data(), s.size());
}

} // namespace dwalk::core
