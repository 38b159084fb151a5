/// @file src/mapping/digit_mapping.cpp
/// @brief DigitMapping construction and the preset table.

#include "dwalk/mapping.hpp"

#include <algorithm>

namespace dwalk::mapping {

namespace {

struct Preset {
    std::string_view       name;
    DigitMapping::Table    table;
};

constexpr std::array<Preset, 5> PRESETS{{
    {"Identity",  {0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11}},
    {"Optimal",   {0, 1, 2, 3, 4, 5, 6, 7, 10, 9, 8, 11}},
    {"Spiral",    {0, 2, 4, 6, 8, 10, 1, 3, 5, 7, 9, 11}},
    {"Stock-opt", {1, 0, 2, 4, 10, 5, 6, 9, 8, 7, 3, 11}},
    {"LCG",       {3, 7, 11, 10, 4, 0, 9, 6, 5, 1, 2, 8}},
}};

DigitMapping::Table identity_table() noexcept {
    DigitMapping::Table t{};
    for (std::size_t i = 0; i < MAPPING_SIZE; ++i) {
        t[i] = static_cast<Digit>(i);
    }
    return t;
}

} // anonymous namespace

// ─── DigitMapping ─────────────────────────────────────────────────────────────

DigitMapping::DigitMapping() noexcept
    : table_(identity_table())
{}

DigitMapping::DigitMapping(const Table& table) noexcept
    : table_(table)
{}

DigitMapping DigitMapping::from_entries(std::span<const int> entries) noexcept {
    Table t = identity_table();
    const std::size_t n = std::min(entries.size(), MAPPING_SIZE);
    for (std::size_t i = 0; i < n; ++i) {
        const int v = entries[i];
        if (v >= 0 && v < static_cast<int>(MAPPING_SIZE)) {
            t[i] = static_cast<Digit>(v);
        }
    }
    return DigitMapping(t);
}

bool DigitMapping::is_permutation() const noexcept {
    std::array<bool, MAPPING_SIZE> seen{};
    for (Digit d : table_) {
        if (d >= MAPPING_SIZE || seen[d]) return false;
        seen[d] = true;
    }
    return true;
}

bool DigitMapping::is_identity() const noexcept {
    return table_ == identity_table();
}

// ─── MappingPresets ───────────────────────────────────────────────────────────

std::optional<DigitMapping> MappingPresets::find(std::string_view name) noexcept {
    for (const auto& p : PRESETS) {
        if (p.name == name) {
            return DigitMapping(p.table);
        }
    }
    return std::nullopt;
}

DigitMapping MappingPresets::named(std::string_view name) noexcept {
    return find(name).value_or(DigitMapping{});
}

std::vector<std::string> MappingPresets::names() {
    std::vector<std::string> out;
    out.reserve(PRESETS.size());
    for (const auto& p : PRESETS) {
        out.emplace_back(p.name);
    }
    return out;
}

} // namespace dwalk::mapping
