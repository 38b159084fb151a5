/// @file tests/integration/test_full_pipeline.cpp
/// @brief End-to-end tests for the digit-walk pipeline.
///
/// These tests exercise the complete path:
///   manifest → SourceCatalog → Engine::convert → ArtifactCodec →
///   Engine::walk → Path

#include "dwalk/artifact.hpp"
#include "dwalk/constants.hpp"
#include "dwalk/engine.hpp"
#include "dwalk/source_catalog.hpp"
#include "../core/wav_fixture.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <string>

using namespace dwalk;
using namespace dwalk::core;

namespace {

constexpr const char* MANIFEST = R"(
mappings:
  Shuffle: [1, 0, 3, 2, 5, 4, 7, 6, 9, 8, 11, 10]
sources:
  - id: lambda
    name: Lambda fragment
    category: dna
    converter: dna
    mapping: Shuffle
  - id: spy
    name: SPY closes
    category: finance
    converter: finance
    mapping: Stock-opt
  - id: tone
    name: Test tone
    category: audio
    converter: audio
  - id: gw150914
    name: GW150914 strain
    category: cosmos
    converter: cosmos
)";

bool all_finite(const Path& path) {
    return std::all_of(path.begin(), path.end(),
                       [](const Point3& p) { return p.allFinite(); });
}

} // anonymous namespace

// ─── Math sources ────────────────────────────────────────────────────────────

TEST(FullPipeline, EveryDefaultMathSourceWalks) {
    const Engine engine(EngineConfig{.max_points = 500, .math_digits = 400});
    const auto catalog = SourceCatalog::defaults();

    for (const auto& src : catalog.sources()) {
        const auto out = engine.run(src, "", catalog);
        EXPECT_FALSE(out.digits.empty()) << src.id;
        EXPECT_FALSE(out.points.empty()) << src.id;
        EXPECT_LE(out.points.size(), 501u) << src.id;
        EXPECT_TRUE(all_finite(out.points)) << src.id;
    }
}

TEST(FullPipeline, ArtifactReplayReproducesWalk) {
    const Engine engine(EngineConfig{.max_points = constants::UNLIMITED_POINTS,
                                     .math_digits = 1000});
    const auto catalog = SourceCatalog::defaults();
    const auto src = catalog.find("phi");
    ASSERT_TRUE(src.has_value());

    const auto direct = engine.run(*src, "", catalog);

    const WalkArtifact artifact{
        .id = src->id, .name = src->name, .category = src->category,
        .subcategory = src->subcategory, .digits = direct.digits,
    };
    const auto replayed = ArtifactCodec::parse(ArtifactCodec::to_json(artifact));
    const auto path = engine.walk(replayed.digits, catalog.resolve_mapping(src->mapping));

    ASSERT_EQ(path.size(), direct.points.size());
    for (std::size_t i = 0; i < path.size(); ++i) {
        ASSERT_TRUE(path[i].isApprox(direct.points[i])) << "point " << i;
    }
}

// ─── Raw payloads ────────────────────────────────────────────────────────────

TEST(FullPipeline, RawSourcesFromManifest) {
    const Engine engine;
    const auto catalog = SourceCatalog::from_yaml(MANIFEST);
    ASSERT_TRUE(catalog.warnings().empty());

    const auto dna = engine.run(*catalog.find("lambda"),
                                ">lambda\nGGGCGGCGACCTCGCGGGTTTTCGCTATTTATGAAAATTTTCCGG\n", catalog);
    EXPECT_EQ(dna.mapping_name, "Shuffle");
    EXPECT_TRUE(all_finite(dna.points));
    EXPECT_EQ(dna.points.size(), dna.digits.size());

    const auto spy = engine.run(*catalog.find("spy"),
                                R"({"prices": [410.2, 411.0, 409.8, 412.5, 413.1, 412.9]})",
                                catalog);
    EXPECT_EQ(spy.digits.size(), 5u);

    const auto tone = engine.run(*catalog.find("tone"),
                                 test_support::make_sine_wav(440.0, 44100, 44100), catalog);
    EXPECT_GT(tone.digits.size(), 1u);

    std::string strain = "# synthetic chirp\n";
    for (int i = 0; i < 256; ++i) {
        strain += std::to_string(std::sin(0.001 * i * i)) + "\n";
    }
    const auto gw = engine.run(*catalog.find("gw150914"), strain, catalog);
    EXPECT_EQ(gw.digits.size(), 256u);
}

TEST(FullPipeline, MappingOverrideChangesPathNotDigits) {
    const Engine engine;
    const auto catalog = SourceCatalog::defaults();
    const auto src = *catalog.find("pi");

    const auto identity = engine.run(src, "", catalog);
    const auto spiral   = engine.run(src, "", catalog, "Spiral");

    EXPECT_EQ(identity.digits, spiral.digits);
    EXPECT_NE(identity.points.back(), spiral.points.back());
}

TEST(FullPipeline, Base4ModeStaysOnLattice) {
    const Engine engine(EngineConfig{.radix = Radix::Base4,
                                     .max_points = constants::UNLIMITED_POINTS});
    const auto catalog = SourceCatalog::from_yaml(MANIFEST);
    const auto out = engine.run(*catalog.find("lambda"), "ACGTTGCAACGT", catalog);

    ASSERT_EQ(out.points.size(), 12u);
    for (const auto& p : out.points) {
        EXPECT_EQ(p.x(), std::round(p.x()));
        EXPECT_EQ(p.y(), std::round(p.y()));
        EXPECT_GE(p.z(), 0.0);
    }
}
