/// @file src/math/orbit_generator.cpp
/// @brief Mandelbrot/Julia orbit encoding and named complex-plane presets.

#include "dwalk/math.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <numbers>

namespace dwalk::math {

namespace {

const std::array<OrbitPreset, 8> MANDELBROT_PRESETS{{
    {"cardioid",      {0.25,    0.5},    {0.0, 0.0}},
    {"spiral",        {-0.75,   0.1},    {0.0, 0.0}},
    {"antenna",       {-1.75,   0.0},    {0.0, 0.0}},
    {"period3",       {-0.122,  0.745},  {0.0, 0.0}},
    {"seahorse",      {-0.75,   0.1},    {0.0, 0.0}},
    {"elephant",      {0.275,   0.0},    {0.0, 0.0}},
    {"double_spiral", {-0.925,  0.266},  {0.0, 0.0}},
    {"triple_spiral", {-0.1011, 0.9563}, {0.0, 0.0}},
}};

const std::array<OrbitPreset, 6> JULIA_PRESETS{{
    {"rabbit",    {-0.123, 0.745},  {0.0,  0.0}},
    {"dragon",    {-0.8,   0.156},  {0.0,  0.0}},
    {"spiral",    {-0.4,   0.6},    {0.0,  0.0}},
    {"siegel",    {-0.391, -0.587}, {0.0,  0.0}},
    {"dendrite",  {0.0,    1.0},    {0.01, 0.01}},
    {"san_marco", {-0.75,  0.0},    {0.1,  0.1}},
}};

} // anonymous namespace

// ─── angle_digit ──────────────────────────────────────────────────────────────

Digit OrbitGenerator::angle_digit(Complex z) noexcept {
    constexpr double pi = std::numbers::pi;
    const double unit   = (std::atan2(z.imag(), z.real()) + pi) / (2.0 * pi);
    const double scaled = std::floor(unit * (12.0 - constants::QUANTIZE_MARGIN));
    return static_cast<Digit>(std::clamp(static_cast<int>(scaled), 0, 11));
}

// ─── Orbits ───────────────────────────────────────────────────────────────────

DigitSequence OrbitGenerator::mandelbrot(Complex c, std::size_t max_iter) {
    return julia(c, Complex{0.0, 0.0}, max_iter);
}

DigitSequence OrbitGenerator::julia(Complex c, Complex z0, std::size_t max_iter) {
    DigitSequence orbit;
    orbit.reserve(std::min<std::size_t>(max_iter, 1 << 16));

    double re = z0.real();
    double im = z0.imag();
    for (std::size_t i = 0; i < max_iter; ++i) {
        const double next_re = re * re - im * im + c.real();
        const double next_im = 2.0 * re * im + c.imag();
        re = next_re;
        im = next_im;

        const double norm_sq = re * re + im * im;
        if (!std::isfinite(norm_sq) || norm_sq > constants::ESCAPE_RADIUS_SQ) {
            break;
        }
        orbit.push_back(angle_digit(Complex{re, im}));
    }

    if (orbit.empty()) {
        orbit.push_back(0);
    }
    return orbit;
}

// ─── Presets ──────────────────────────────────────────────────────────────────

std::span<const OrbitPreset> OrbitGenerator::mandelbrot_presets() noexcept {
    return MANDELBROT_PRESETS;
}

std::span<const OrbitPreset> OrbitGenerator::julia_presets() noexcept {
    return JULIA_PRESETS;
}

} // namespace dwalk::math
