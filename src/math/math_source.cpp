/// @file src/math/math_source.cpp
/// @brief Resolution of `math.<family>.<name>` converter keys.

#include "dwalk/math.hpp"

#include <array>
#include <utility>

namespace dwalk::math {

namespace {

constexpr std::string_view KEY_PREFIX = "math.";

struct NamedConstant {
    std::string_view name;
    MathConstant     constant;
};

constexpr std::array<NamedConstant, 5> CONSTANTS{{
    {"pi",    MathConstant::Pi},
    {"e",     MathConstant::E},
    {"sqrt2", MathConstant::Sqrt2},
    {"phi",   MathConstant::Phi},
    {"ln2",   MathConstant::Ln2},
}};

struct NamedFractal {
    std::string_view name;
    Fractal          fractal;
};

constexpr std::array<NamedFractal, 6> FRACTALS{{
    {"dragon",     Fractal::Dragon},
    {"koch",       Fractal::Koch},
    {"sierpinski", Fractal::SierpinskiArrowhead},
    {"hilbert",    Fractal::Hilbert},
    {"peano",      Fractal::Peano},
    {"gosper",     Fractal::Gosper},
}};

struct NamedLogistic {
    std::string_view name;
    double           r;
    double           x0;
};

constexpr std::array<NamedLogistic, 4> LOGISTIC{{
    {"logistic",          3.99,   0.5},
    {"logistic_chaos",    3.99,   0.5},
    {"logistic_periodic", 3.5,    0.5},
    {"logistic_period3",  3.8284, 0.5},
}};

/// Split "family.name" at the first dot.
std::pair<std::string_view, std::string_view> split_family(std::string_view rest) {
    const auto dot = rest.find('.');
    if (dot == std::string_view::npos) {
        return {rest, {}};
    }
    return {rest.substr(0, dot), rest.substr(dot + 1)};
}

std::optional<MathSource::Generator>
resolve(std::string_view family, std::string_view name) {
    if (family == "constant") {
        for (const auto& c : CONSTANTS) {
            if (c.name == name) {
                const MathConstant k = c.constant;
                return [k](std::size_t n) { return ConstantGenerator::digits(k, n); };
            }
        }
    } else if (family == "fractal") {
        for (const auto& f : FRACTALS) {
            if (f.name == name) {
                const Fractal k = f.fractal;
                return [k](std::size_t) { return FractalGenerator::generate(k); };
            }
        }
    } else if (family == "mandelbrot") {
        for (const auto& p : OrbitGenerator::mandelbrot_presets()) {
            if (p.name == name) {
                const Complex c = p.c;
                return [c](std::size_t n) { return OrbitGenerator::mandelbrot(c, n); };
            }
        }
    } else if (family == "julia") {
        for (const auto& p : OrbitGenerator::julia_presets()) {
            if (p.name == name) {
                const Complex c  = p.c;
                const Complex z0 = p.z0;
                return [c, z0](std::size_t n) { return OrbitGenerator::julia(c, z0, n); };
            }
        }
    } else if (family == "sequence") {
        if (name == "fibonacci") {
            return [](std::size_t n) { return SequenceGenerator::fibonacci_word(n); };
        }
        if (name == "thue_morse") {
            return [](std::size_t n) { return SequenceGenerator::thue_morse(n); };
        }
        for (const auto& l : LOGISTIC) {
            if (l.name == name) {
                const double r  = l.r;
                const double x0 = l.x0;
                return [r, x0](std::size_t n) { return SequenceGenerator::logistic_map(r, x0, n); };
            }
        }
    }
    return std::nullopt;
}

} // anonymous namespace

// ─── MathSource ───────────────────────────────────────────────────────────────

MathSource::MathSource(std::string key, Generator generator)
    : key_(std::move(key))
    , generator_(std::move(generator))
{}

std::optional<MathSource> MathSource::from_key(std::string_view key) {
    if (!key.starts_with(KEY_PREFIX)) {
        return std::nullopt;
    }

    const auto [family, name] = split_family(key.substr(KEY_PREFIX.size()));
    auto generator = resolve(family, name);
    if (!generator) {
        return std::nullopt;
    }
    return MathSource(std::string(key), std::move(*generator));
}

std::vector<std::string> MathSource::known_keys() {
    std::vector<std::string> keys;
    auto add = [&keys](std::string_view family, std::string_view name) {
        keys.push_back(std::string(KEY_PREFIX) + std::string(family) + "." + std::string(name));
    };

    for (const auto& c : CONSTANTS) add("constant", c.name);
    for (const auto& f : FRACTALS) add("fractal", f.name);
    for (const auto& p : OrbitGenerator::mandelbrot_presets()) add("mandelbrot", p.name);
    for (const auto& p : OrbitGenerator::julia_presets()) add("julia", p.name);
    add("sequence", "fibonacci");
    add("sequence", "thue_morse");
    for (const auto& l : LOGISTIC) add("sequence", l.name);

    return keys;
}

DigitSequence MathSource::generate(std::size_t n) const {
    return generator_(n);
}

} // namespace dwalk::math
