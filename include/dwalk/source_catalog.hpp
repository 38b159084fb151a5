#pragma once

/// @file include/dwalk/source_catalog.hpp
/// @brief The sources.yaml manifest: mappings, categories and source
///        descriptors.
///
/// # Module: SourceCatalog
///
/// ## Responsibility
/// Load and query the data manifest. A manifest has four optional sections:
/// ```yaml
/// mappings:            # name → 12 integers
///   Optimal: [0, 1, 2, 3, 4, 5, 6, 7, 10, 9, 8, 11]
/// categories:          # key → display name
///   math: Mathematics
/// converters:          # converter key → description
///   math.constant.pi: Pi in base 12
/// sources:
///   - id: pi
///     name: Pi
///     category: math
///     subcategory: Constants
///     converter: math.constant.pi
///     mapping: Identity
///     url: computed://pi
/// ```
///
/// ## Guarantees
/// - `resolve_mapping()` never fails: manifest entry, then built-in preset, then
///   Identity
/// - Malformed mapping arrays are sanitized entry-wise and reported through
///   `warnings()`, not rejected
/// - Immutable after load; const access is thread-safe
///
/// ## NOT Responsible For
/// - Fetching the URLs a source names

#include "dwalk/mapping.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dwalk::core {

// ─── Source ───────────────────────────────────────────────────────────────────

/// Static description of one data source.
struct Source {
    std::string id;
    std::string name;
    std::string category;
    std::string subcategory;
    std::string converter;            ///< e.g. "math.constant.pi", "dna", "audio"
    std::string mapping = "Identity";
    std::string url;
};

// ─── SourceCatalog ────────────────────────────────────────────────────────────

class SourceCatalog {
public:
    /// An empty catalog: no sources, built-in presets only.
    SourceCatalog() = default;

    /// Load a manifest from disk.
    ///
    /// # Throws
    /// `std::runtime_error` if the file cannot be read or is not valid YAML.
    [[nodiscard]] static SourceCatalog load(const std::string& filepath);

    /// Parse a manifest held in memory.
    ///
    /// # Throws
    /// `std::runtime_error` if the text is not valid YAML or a section has
    /// the wrong shape.
    [[nodiscard]] static SourceCatalog from_yaml(std::string_view text);

    /// The built-in catalog: every math converter key as a source.
    [[nodiscard]] static SourceCatalog defaults();

    /// Resolve a mapping name: manifest first, then presets, then Identity.
    [[nodiscard]] mapping::DigitMapping resolve_mapping(std::string_view name) const noexcept;

    /// Mapping names defined by the manifest and the presets, deduplicated.
    [[nodiscard]] std::vector<std::string> mapping_names() const;

    [[nodiscard]] std::optional<Source> find(std::string_view id) const;

    [[nodiscard]] std::vector<Source> by_category(std::string_view category) const;

    [[nodiscard]] const std::vector<Source>& sources() const noexcept { return sources_; }

    [[nodiscard]] const std::map<std::string, std::string>& categories() const noexcept {
        return categories_;
    }

    [[nodiscard]] const std::map<std::string, std::string>& converters() const noexcept {
        return converters_;
    }

    /// Problems found while loading that did not prevent it.
    [[nodiscard]] const std::vector<std::string>& warnings() const noexcept { return warnings_; }

    /// Append a source, replacing any existing source with the same id.
    void add(Source source);

private:
    std::map<std::string, mapping::DigitMapping, std::less<>> mappings_;
    std::map<std::string, std::string>                       categories_;
    std::map<std::string, std::string>                       converters_;
    std::vector<Source>                                      sources_;
    std::vector<std::string>                                 warnings_;
};

} // namespace dwalk::core
