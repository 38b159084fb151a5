/// @file src/core/artifact.cpp
/// @brief Walk artifact JSON reading and writing through Boost.JSON.

#include "dwalk/artifact.hpp"
#include "dwalk/digit_codec.hpp"
#include "json_document.hpp"

#include <fmt/format.h>

#include <cmath>
#include <cstdint>
#include <utility>

namespace dwalk::core {

namespace {

boost::json::string json_string(std::string_view text) {
    return boost::json::string(text.data(), text.size());
}

} // anonymous namespace

// ─── parse ────────────────────────────────────────────────────────────────────

WalkArtifact ArtifactCodec::parse(std::string_view json) {
    const boost::json::value root = load_json(json, "artifact JSON");
    const boost::json::object* obj = root.if_object();
    if (obj == nullptr) {
        throw ConversionFailed("artifact JSON is not an object");
    }

    WalkArtifact artifact{
        .id          = json_text(*obj, "id"),
        .name        = json_text(*obj, "name"),
        .category    = json_text(*obj, "category"),
        .subcategory = json_text(*obj, "subcategory"),
        .digits      = {},
    };
    if (artifact.id.empty()) {
        throw ConversionFailed("artifact has no 'id'");
    }

    const boost::json::value* values = obj->if_contains("base12");
    if (values == nullptr) {
        values = obj->if_contains("digits");
    }
    if (values == nullptr || !values->is_array()) {
        throw ConversionFailed(fmt::format("artifact '{}' has no digit array", artifact.id));
    }

    const boost::json::array& entries = values->get_array();
    artifact.digits.reserve(entries.size());
    for (std::size_t i = 0; i < entries.size(); ++i) {
        const auto number = json_number(entries[i]);
        if (!number || !std::isfinite(*number) || std::trunc(*number) != *number) {
            throw ConversionFailed(fmt::format(
                "artifact '{}' entry {} is not an integer", artifact.id, i));
        }
        // fmod is exact for integral doubles.
        double r = std::fmod(*number, 12.0);
        if (r < 0.0) r += 12.0;
        artifact.digits.push_back(
            codec::DigitCodec::reduce(static_cast<std::int64_t>(r), Radix::Base12));
    }

    if (artifact.digits.empty()) {
        artifact.digits.push_back(0);
    }
    return artifact;
}

// ─── to_json ──────────────────────────────────────────────────────────────────

std::string ArtifactCodec::to_json(const WalkArtifact& artifact) {
    boost::json::array base12;
    base12.reserve(artifact.digits.size());
    for (Digit d : artifact.digits) {
        base12.emplace_back(static_cast<std::int64_t>(d));
    }

    boost::json::object root;
    root["id"]          = json_string(artifact.id);
    root["name"]        = json_string(artifact.name);
    root["category"]    = json_string(artifact.category);
    root["subcategory"] = json_string(artifact.subcategory);
    root["base12"]      = std::move(base12);
    return boost::json::serialize(root);
}

} // namespace dwalk::core
