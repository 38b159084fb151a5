/**
 * @file  bench/bench_walk.cpp
 * @brief Google Benchmark suite for converters and the turtle walk.
 *
 * Benchmarks
 * ----------
 *   BM_Normalize             min-max quantization of a price-like series
 *   BM_RepackBase4           genome base-4 → base-12 repacking
 *   BM_TurtleWalk            12-symbol walk, unlimited points
 *   BM_TurtleWalk4           stacked lattice walk
 *   BM_ConstantDigits        table prefix + filler continuation
 *   BM_Fractal_Dragon        L-system expansion at default depth
 *   BM_AudioSpectrogram      Hann + FFT peak picking
 *
 * Build (CMake):
 *   cmake -DDWALK_BENCH=ON ..
 *   cmake --build build --target bench_walk
 *   ./build/bench_walk --benchmark_format=json
 *
 * Throughput units: items/second (digits, samples or bases processed).
 */

#include "benchmark/benchmark.h"

#include "dwalk/digit_codec.hpp"
#include "dwalk/genome.hpp"
#include "dwalk/math.hpp"
#include "dwalk/signal.hpp"
#include "dwalk/walk.hpp"

#include <cmath>
#include <cstddef>
#include <numbers>
#include <string>
#include <vector>

using namespace dwalk;

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// N samples of a slow random-looking walk around 100.
static std::vector<double> make_series(std::size_t n) {
    std::vector<double> v(n);
    double x = 100.0;
    for (std::size_t i = 0; i < n; ++i) {
        x += std::sin(static_cast<double>(i) * 0.37) + 0.3 * std::cos(static_cast<double>(i) * 1.91);
        v[i] = x;
    }
    return v;
}

/// N bases cycling through a fixed motif.
static std::string make_genome(std::size_t n) {
    static constexpr char motif[] = "GATTACACCGGTTAAGCTAGCTAGGATCCA";
    std::string s(n, 'A');
    for (std::size_t i = 0; i < n; ++i) {
        s[i] = motif[i % (sizeof(motif) - 1)];
    }
    return s;
}

// ── Codec ──────────────────────────────────────────────────────────────────────

static void BM_Normalize(benchmark::State& state) {
    const auto series = make_series(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto d = codec::DigitCodec::normalize(series, Radix::Base12);
        benchmark::DoNotOptimize(d.data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Normalize)->RangeMultiplier(8)->Range(64, 1 << 18);

static void BM_RepackBase4(benchmark::State& state) {
    const auto genome = make_genome(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto d = genome::GenomicCodec::to_base12(genome);
        benchmark::DoNotOptimize(d.data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_RepackBase4)->RangeMultiplier(8)->Range(64, 1 << 20);

// ── Walk ───────────────────────────────────────────────────────────────────────

static void BM_TurtleWalk(benchmark::State& state) {
    const auto digits = math::ConstantGenerator::pi(static_cast<std::size_t>(state.range(0)));
    const auto& m = mapping::MappingPresets::named("Optimal");
    for (auto _ : state) {
        auto path = walk::TurtleWalk::walk(digits, m, constants::UNLIMITED_POINTS);
        benchmark::DoNotOptimize(path.data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
    state.counters["Mdigits_per_sec"] = benchmark::Counter(
        static_cast<double>(state.iterations() * state.range(0)) / 1e6,
        benchmark::Counter::kIsRate);
}
BENCHMARK(BM_TurtleWalk)->RangeMultiplier(8)->Range(512, 1 << 18);

static void BM_TurtleWalk4(benchmark::State& state) {
    const auto digits = genome::GenomicCodec::to_base4(
        make_genome(static_cast<std::size_t>(state.range(0))));
    for (auto _ : state) {
        auto path = walk::TurtleWalk::walk4(digits, constants::UNLIMITED_POINTS);
        benchmark::DoNotOptimize(path.data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_TurtleWalk4)->RangeMultiplier(8)->Range(512, 1 << 18);

// ── Generators ─────────────────────────────────────────────────────────────────

static void BM_ConstantDigits(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    for (auto _ : state) {
        auto d = math::ConstantGenerator::e(n);
        benchmark::DoNotOptimize(d.data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_ConstantDigits)->Arg(100)->Arg(5000)->Arg(100000);

static void BM_Fractal_Dragon(benchmark::State& state) {
    for (auto _ : state) {
        auto d = math::FractalGenerator::generate(math::Fractal::Dragon);
        benchmark::DoNotOptimize(d.data());
    }
}
BENCHMARK(BM_Fractal_Dragon)->Unit(benchmark::kMillisecond);

// ── Signal ─────────────────────────────────────────────────────────────────────

static void BM_AudioSpectrogram(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    std::vector<float> samples(n);
    for (std::size_t i = 0; i < n; ++i) {
        samples[i] = static_cast<float>(std::sin(2.0 * std::numbers::pi * 440.0 * static_cast<double>(i) / 44100.0));
    }
    for (auto _ : state) {
        auto d = signal::AudioConverter::convert(samples, 44100);
        benchmark::DoNotOptimize(d.data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_AudioSpectrogram)->Arg(44100)->Arg(441000)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
