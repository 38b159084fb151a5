#pragma once

/// @file include/dwalk/mapping.hpp
/// @brief Digit permutations that reassign digit → turtle-action semantics.
///
/// # Module: DigitMapping
///
/// ## Responsibility
/// Hold a total table σ : {0..11} → {0..11} applied to every digit before the
/// turtle interprets it, and resolve named presets.
///
/// ## Guarantees
/// - A DigitMapping is always total: malformed input degrades entry-wise to
///   the identity, never to an error
/// - Unknown preset names resolve to Identity
/// - Immutable after construction; safe to share across threads

#include "dwalk/types.hpp"

#include <array>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace dwalk::mapping {

/// Number of entries in a base-12 mapping table.
static constexpr std::size_t MAPPING_SIZE = 12;

class MappingPresets;

// ─── DigitMapping ─────────────────────────────────────────────────────────────

class DigitMapping {
public:
    using Table = std::array<Digit, MAPPING_SIZE>;

    /// The identity mapping.
    DigitMapping() noexcept;

    /// Build a mapping from untrusted entries (config files, artifacts).
    ///
    /// Entry i is used when it exists and lies in [0, 12); otherwise digit i
    /// maps to itself. Extra entries beyond 12 are ignored. The result may
    /// not be a bijection; see `is_permutation`.
    [[nodiscard]] static DigitMapping
    from_entries(std::span<const int> entries) noexcept;

    /// σ(d mod 12).
    [[nodiscard]] Digit apply(Digit d) const noexcept {
        return table_[d % MAPPING_SIZE];
    }

    /// True when every digit 0..11 appears exactly once.
    [[nodiscard]] bool is_permutation() const noexcept;

    [[nodiscard]] bool is_identity() const noexcept;

    [[nodiscard]] const Table& table() const noexcept { return table_; }

    bool operator==(const DigitMapping&) const noexcept = default;

private:
    friend class MappingPresets;

    explicit DigitMapping(const Table& table) noexcept;

    Table table_;
};

// ─── Presets ──────────────────────────────────────────────────────────────────

/// Built-in named mappings.
///
/// | Name       | Table                              |
/// |------------|------------------------------------|
/// | Identity   | 0 1 2 3 4 5 6 7 8 9 10 11          |
/// | Optimal    | 0 1 2 3 4 5 6 7 10 9 8 11          |
/// | Spiral     | 0 2 4 6 8 10 1 3 5 7 9 11          |
/// | Stock-opt  | 1 0 2 4 10 5 6 9 8 7 3 11          |
/// | LCG        | 3 7 11 10 4 0 9 6 5 1 2 8          |
class MappingPresets {
public:
    MappingPresets() = delete;

    static constexpr std::string_view IDENTITY = "Identity";

    /// Look up a preset by exact name; `nullopt` if unknown.
    [[nodiscard]] static std::optional<DigitMapping>
    find(std::string_view name) noexcept;

    /// Look up a preset by name, falling back to Identity.
    [[nodiscard]] static DigitMapping named(std::string_view name) noexcept;

    /// All preset names in declaration order.
    [[nodiscard]] static std::vector<std::string> names();
};

} // namespace dwalk::mapping
