/**
 * @file  bench_runner.cpp
 * @brief Standalone micro-benchmark runner for the performance regression suite.
 *
 * Usage:
 *   ./bench_runner <benchmark_name>
 *
 * Outputs a single double: nanoseconds per operation, to stdout.
 * Returns 0 on success, 1 on unknown benchmark name.
 *
 * Each benchmark runs for at least 500ms of wall-clock time and divides the
 * total by the iteration count.
 */

#include <algorithm>
#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

#include "dwalk/artifact.hpp"
#include "dwalk/digit_codec.hpp"
#include "dwalk/engine.hpp"
#include "dwalk/genome.hpp"
#include "dwalk/math.hpp"
#include "dwalk/walk.hpp"

using namespace dwalk;
using namespace std::chrono;

// ── Timing harness ────────────────────────────────────────────────────────────

template<typename Fn>
double measure_ns_per_op(Fn&& fn, long min_iters = 100) {
    for (long i = 0; i < std::min(min_iters / 10L, 1000L); ++i) fn();

    long iters      = 0;
    double total_ns = 0.0;

    const auto deadline = steady_clock::now() + milliseconds(500);
    do {
        const auto t0 = steady_clock::now();
        fn(); fn(); fn(); fn(); fn();
        const auto t1 = steady_clock::now();
        total_ns += static_cast<double>(duration_cast<nanoseconds>(t1 - t0).count());
        iters += 5;
    } while (steady_clock::now() < deadline || iters < min_iters);

    return total_ns / static_cast<double>(iters);
}

// ── Benchmark implementations ─────────────────────────────────────────────────

double bench_turtle_step_1M() {
    walk::Turtle turtle;
    Digit d = 0;
    volatile double sink = 0.0;
    return measure_ns_per_op([&]() {
        turtle.step(d);
        d = static_cast<Digit>((d + 7) % 12);
        sink += turtle.position().x();
    }, 1'000'000);
}

double bench_quantize_1M() {
    double u = 0.0;
    volatile unsigned sink = 0;
    return measure_ns_per_op([&]() {
        sink += codec::DigitCodec::quantize_unit(u, Radix::Base12);
        u += 0.000123;
        if (u > 1.0) u = 0.0;
    }, 1'000'000);
}

double bench_walk_pi_5000() {
    const auto digits = math::ConstantGenerator::pi(5000);
    const mapping::DigitMapping identity;
    volatile std::size_t sink = 0;
    return measure_ns_per_op([&]() {
        sink += walk::TurtleWalk::walk(digits, identity).size();
    });
}

double bench_genome_base12_10k() {
    std::string genome(10'000, 'A');
    for (std::size_t i = 0; i < genome.size(); ++i) genome[i] = "ACGT"[(i * 7 + i / 3) % 4];
    volatile std::size_t sink = 0;
    return measure_ns_per_op([&]() {
        sink += genome::GenomicCodec::to_base12(genome).size();
    });
}

double bench_artifact_roundtrip_1k() {
    const core::WalkArtifact artifact{
        .id = "pi", .name = "Pi", .category = "math", .subcategory = "Constants",
        .digits = math::ConstantGenerator::pi(1000),
    };
    const std::string json = core::ArtifactCodec::to_json(artifact);
    volatile std::size_t sink = 0;
    return measure_ns_per_op([&]() {
        sink += core::ArtifactCodec::parse(json).digits.size();
    });
}

double bench_full_pipeline_finance() {
    const core::Engine engine;
    const auto catalog = core::SourceCatalog::defaults();
    core::Source source;
    source.id        = "bench";
    source.converter = "finance";
    const std::string json = R"({"prices": [100.0, 101.5, 102.0, 101.8, 103.0, 102.2, 104.1]})";
    volatile std::size_t sink = 0;
    return measure_ns_per_op([&]() {
        sink += engine.run(source, json, catalog).points.size();
    });
}

// ── Dispatch ──────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    if (argc < 2) {
        fmt::print(stderr, "Usage: {} <benchmark_name>\n", argv[0]);
        return 1;
    }

    const std::string_view name = argv[1];
    double result = -1.0;

    if (name == "turtle_step_1M")              result = bench_turtle_step_1M();
    else if (name == "quantize_1M")            result = bench_quantize_1M();
    else if (name == "walk_pi_5000")           result = bench_walk_pi_5000();
    else if (name == "genome_base12_10k")      result = bench_genome_base12_10k();
    else if (name == "artifact_roundtrip_1k")  result = bench_artifact_roundtrip_1k();
    else if (name == "full_pipeline_finance")  result = bench_full_pipeline_finance();
    else {
        fmt::print(stderr, "Unknown benchmark: {}\n", name);
        return 1;
    }

    fmt::print("{:.2f}\n", result);
    return 0;
}
