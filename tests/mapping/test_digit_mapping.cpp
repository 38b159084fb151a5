/// @file tests/mapping/test_digit_mapping.cpp
/// @brief Unit tests for DigitMapping and MappingPresets.

#include <gtest/gtest.h>
#include "dwalk/mapping.hpp"

#include <algorithm>
#include <vector>

using namespace dwalk;
using namespace dwalk::mapping;

// ─── Construction ────────────────────────────────────────────────────────────

TEST(DigitMapping, DefaultIsIdentity) {
    const DigitMapping m;
    EXPECT_TRUE(m.is_identity());
    EXPECT_TRUE(m.is_permutation());
    for (int d = 0; d < 12; ++d) {
        EXPECT_EQ(m.apply(static_cast<Digit>(d)), d);
    }
}

TEST(DigitMapping, ApplyReducesModTwelve) {
    const DigitMapping m = MappingPresets::named("Spiral");
    EXPECT_EQ(m.apply(13), m.apply(1));
    EXPECT_EQ(m.apply(255), m.apply(255 % 12));
}

TEST(DigitMapping, ShortArrayFillsWithIdentity) {
    const std::vector<int> entries{5, 4};
    const auto m = DigitMapping::from_entries(entries);
    EXPECT_EQ(m.apply(0), 5);
    EXPECT_EQ(m.apply(1), 4);
    EXPECT_EQ(m.apply(2), 2);
    EXPECT_EQ(m.apply(11), 11);
}

TEST(DigitMapping, OutOfRangeEntriesFallBackPerDigit) {
    const std::vector<int> entries{11, -1, 12, 99, 4, 5, 6, 7, 8, 9, 10, 0};
    const auto m = DigitMapping::from_entries(entries);
    EXPECT_EQ(m.apply(0), 11);
    EXPECT_EQ(m.apply(1), 1);
    EXPECT_EQ(m.apply(2), 2);
    EXPECT_EQ(m.apply(3), 3);
    EXPECT_EQ(m.apply(11), 0);
}

TEST(DigitMapping, ExtraEntriesIgnored) {
    std::vector<int> entries(20, 0);
    for (int i = 0; i < 12; ++i) entries[i] = 11 - i;
    const auto m = DigitMapping::from_entries(entries);
    EXPECT_TRUE(m.is_permutation());
    EXPECT_EQ(m.apply(0), 11);
}

TEST(DigitMapping, DuplicatesAreNotAPermutation) {
    const std::vector<int> entries{0, 0, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11};
    const auto m = DigitMapping::from_entries(entries);
    EXPECT_FALSE(m.is_permutation());
    EXPECT_EQ(m.apply(1), 0);
}

// ─── Presets ─────────────────────────────────────────────────────────────────

TEST(MappingPresets, AllPresetsArePermutations) {
    for (const auto& name : MappingPresets::names()) {
        const auto m = MappingPresets::find(name);
        ASSERT_TRUE(m.has_value()) << name;
        EXPECT_TRUE(m->is_permutation()) << name;
    }
}

TEST(MappingPresets, KnownTables) {
    const DigitMapping::Table optimal{0, 1, 2, 3, 4, 5, 6, 7, 10, 9, 8, 11};
    const DigitMapping::Table lcg{3, 7, 11, 10, 4, 0, 9, 6, 5, 1, 2, 8};
    EXPECT_EQ(MappingPresets::named("Optimal").table(), optimal);
    EXPECT_EQ(MappingPresets::named("LCG").table(), lcg);
}

TEST(MappingPresets, UnknownNameIsIdentity) {
    EXPECT_FALSE(MappingPresets::find("NoSuchMapping").has_value());
    EXPECT_TRUE(MappingPresets::named("NoSuchMapping").is_identity());
    EXPECT_TRUE(MappingPresets::named("").is_identity());
}

TEST(MappingPresets, NamesIncludeIdentityFirst) {
    const auto names = MappingPresets::names();
    ASSERT_FALSE(names.empty());
    EXPECT_EQ(names.front(), "Identity");
    EXPECT_NE(std::find(names.begin(), names.end(), "Stock-opt"), names.end());
}
