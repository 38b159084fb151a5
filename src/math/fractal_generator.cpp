/// @file src/math/fractal_generator.cpp
/// @brief L-system definitions, string rewriting and turtle-string encoding.

#include "dwalk/math.hpp"

#include <algorithm>
#include <array>

namespace dwalk::math {

namespace {

/// Default depths keep every fractal in the 10⁴–10⁵ digit range.
const std::array<LSystem, 6>& systems() {
    static const std::array<LSystem, 6> table{{
        {"dragon",     "F",       {{'F', "F+G"}, {'G', "F-G"}},                        90, 14},
        {"koch",       "F--F--F", {{'F', "F+F--F+F"}},                                 60,  5},
        {"sierpinski", "F",       {{'F', "G-F-G"}, {'G', "F+G+F"}},                    60,  9},
        {"hilbert",    "A",       {{'A', "-BF+AFA+FB-"}, {'B', "+AF-BFB-FA+"}},        90,  6},
        {"peano",      "F",       {{'F', "F+F-F-F-F+F+F+F-F"}},                        90,  4},
        {"gosper",     "A",       {{'A', "A-B--B+A++AA+B-"}, {'B', "+A-BB--B-A++A+B"}}, 60,  4},
    }};
    return table;
}

} // anonymous namespace

// ─── definition ───────────────────────────────────────────────────────────────

const LSystem& FractalGenerator::definition(Fractal f) {
    return systems()[static_cast<std::size_t>(f)];
}

// ─── expand ───────────────────────────────────────────────────────────────────

std::string FractalGenerator::expand(const LSystem& system, unsigned iterations) {
    std::string current(system.axiom);
    std::string next;

    for (unsigned it = 0; it < iterations; ++it) {
        next.clear();
        next.reserve(current.size() * 4);
        for (char c : current) {
            const auto rule = std::find_if(system.rules.begin(), system.rules.end(),
                [c](const LSystemRule& r) { return r.symbol == c; });
            if (rule != system.rules.end()) {
                next.append(rule->replacement);
            } else {
                next.push_back(c);
            }
        }
        current.swap(next);
    }

    return current;
}

// ─── to_digits ────────────────────────────────────────────────────────────────

DigitSequence FractalGenerator::to_digits(std::string_view commands, unsigned angle_degrees) {
    const std::size_t turns = std::max(1u, angle_degrees / 15u);

    DigitSequence out;
    out.reserve(commands.size() * 2);
    for (char c : commands) {
        switch (c) {
            case 'F':
            case 'G':
            case 'A':
            case 'B':
                out.push_back(0);
                break;
            case '+':
                out.insert(out.end(), turns, Digit{10});
                break;
            case '-':
                out.insert(out.end(), turns, Digit{11});
                break;
            default:
                break;
        }
    }

    if (out.empty()) {
        out.push_back(0);
    }
    return out;
}

// ─── generate ─────────────────────────────────────────────────────────────────

DigitSequence FractalGenerator::generate(Fractal f) {
    return generate(f, definition(f).iterations);
}

DigitSequence FractalGenerator::generate(Fractal f, unsigned iterations) {
    const LSystem& system = definition(f);
    return to_digits(expand(system, iterations), system.angle_degrees);
}

} // namespace dwalk::math
