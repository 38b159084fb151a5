/// @file src/core/source_catalog.cpp
/// @brief sources.yaml loading through yaml-cpp.

#include "dwalk/source_catalog.hpp"
#include "dwalk/math.hpp"

#include <fmt/core.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace dwalk::core {

namespace {

std::string scalar_or(const YAML::Node& node, const char* key, std::string fallback) {
    const YAML::Node value = node[key];
    if (value && value.IsScalar()) {
        return value.as<std::string>();
    }
    return fallback;
}

/// Readable title for a generated source id, e.g. "thue_morse" → "Thue Morse".
std::string title_case(std::string_view id) {
    std::string out;
    out.reserve(id.size());
    bool upper = true;
    for (char c : id) {
        if (c == '_' || c == '.') {
            out.push_back(' ');
            upper = true;
            continue;
        }
        out.push_back(upper ? static_cast<char>(std::toupper(static_cast<unsigned char>(c))) : c);
        upper = false;
    }
    return out;
}

} // anonymous namespace

// ─── Loading ──────────────────────────────────────────────────────────────────

SourceCatalog SourceCatalog::load(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open manifest: " + filepath);
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return from_yaml(contents.str());
}

SourceCatalog SourceCatalog::from_yaml(std::string_view text) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(text));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(fmt::format("Invalid manifest YAML: {}", e.msg));
    }

    SourceCatalog catalog;
    if (root.IsNull()) {
        return catalog;
    }
    if (!root.IsMap()) {
        throw std::runtime_error("Manifest root must be a mapping");
    }

    try {
        if (const YAML::Node mappings = root["mappings"]; mappings && mappings.IsMap()) {
            for (const auto& entry : mappings) {
                const auto name = entry.first.as<std::string>();
                std::vector<int> values;
                bool readable = entry.second.IsSequence();
                if (readable) {
                    for (const auto& v : entry.second) {
                        int parsed = -1;
                        if (!v.IsScalar() || !YAML::convert<int>::decode(v, parsed)) {
                            readable = false;
                            parsed = -1;
                        }
                        values.push_back(parsed);
                    }
                }

                auto m = mapping::DigitMapping::from_entries(values);
                if (!readable || values.size() != mapping::MAPPING_SIZE || !m.is_permutation()) {
                    catalog.warnings_.push_back(fmt::format(
                        "mapping '{}' is not a permutation of 0..11; invalid entries map to themselves",
                        name));
                }
                catalog.mappings_.insert_or_assign(name, m);
            }
        }

        if (const YAML::Node categories = root["categories"]; categories && categories.IsMap()) {
            for (const auto& entry : categories) {
                catalog.categories_[entry.first.as<std::string>()] = entry.second.as<std::string>();
            }
        }

        if (const YAML::Node converters = root["converters"]; converters && converters.IsMap()) {
            for (const auto& entry : converters) {
                catalog.converters_[entry.first.as<std::string>()] = entry.second.as<std::string>();
            }
        }

        if (const YAML::Node sources = root["sources"]; sources) {
            if (!sources.IsSequence()) {
                throw std::runtime_error("Manifest 'sources' must be a list");
            }
            std::size_t index = 0;
            for (const auto& node : sources) {
                ++index;
                if (!node.IsMap()) {
                    catalog.warnings_.push_back(fmt::format("source #{} is not a mapping; skipped", index));
                    continue;
                }
                Source s{
                    .id          = scalar_or(node, "id", ""),
                    .name        = scalar_or(node, "name", ""),
                    .category    = scalar_or(node, "category", ""),
                    .subcategory = scalar_or(node, "subcategory", ""),
                    .converter   = scalar_or(node, "converter", ""),
                    .mapping     = scalar_or(node, "mapping", std::string(mapping::MappingPresets::IDENTITY)),
                    .url         = scalar_or(node, "url", ""),
                };
                if (s.id.empty() || s.converter.empty()) {
                    catalog.warnings_.push_back(fmt::format(
                        "source #{} lacks an id or converter; skipped", index));
                    continue;
                }
                if (s.name.empty()) {
                    s.name = s.id;
                }
                catalog.add(std::move(s));
            }
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(fmt::format("Malformed manifest: {}", e.msg));
    }

    return catalog;
}

SourceCatalog SourceCatalog::defaults() {
    SourceCatalog catalog;
    catalog.categories_["math"] = "Mathematics";

    for (const auto& key : math::MathSource::known_keys()) {
        // key = "math.<family>.<name>"
        const std::string_view rest = std::string_view(key).substr(5);
        const auto dot = rest.find('.');
        const std::string family(rest.substr(0, dot));
        const std::string name(rest.substr(dot + 1));

        std::string id = (family == "constant" || family == "sequence") ? name : family + "_" + name;
        if (family == "fractal") {
            id = name + "_curve";
        }

        catalog.add(Source{
            .id          = id,
            .name        = title_case(id),
            .category    = "math",
            .subcategory = title_case(family),
            .converter   = key,
            .mapping     = std::string(mapping::MappingPresets::IDENTITY),
            .url         = "computed://" + family,
        });
    }
    return catalog;
}

// ─── Queries ──────────────────────────────────────────────────────────────────

mapping::DigitMapping SourceCatalog::resolve_mapping(std::string_view name) const noexcept {
    if (const auto it = mappings_.find(name); it != mappings_.end()) {
        return it->second;
    }
    return mapping::MappingPresets::named(name);
}

std::vector<std::string> SourceCatalog::mapping_names() const {
    std::vector<std::string> names = mapping::MappingPresets::names();
    for (const auto& [name, m] : mappings_) {
        if (std::find(names.begin(), names.end(), name) == names.end()) {
            names.push_back(name);
        }
    }
    return names;
}

std::optional<Source> SourceCatalog::find(std::string_view id) const {
    const auto it = std::find_if(sources_.begin(), sources_.end(),
                                 [id](const Source& s) { return s.id == id; });
    if (it == sources_.end()) {
        return std::nullopt;
    }
    return *it;
}

std::vector<Source> SourceCatalog::by_category(std::string_view category) const {
    std::vector<Source> out;
    std::copy_if(sources_.begin(), sources_.end(), std::back_inserter(out),
                 [category](const Source& s) { return s.category == category; });
    return out;
}

void SourceCatalog::add(Source source) {
    const auto it = std::find_if(sources_.begin(), sources_.end(),
                                 [&source](const Source& s) { return s.id == source.id; });
    if (it != sources_.end()) {
        *it = std::move(source);
        return;
    }
    sources_.push_back(std::move(source));
}

} // namespace dwalk::core
