/// @file src/core/engine.cpp
/// @brief Converter dispatch and the convert → walk pipeline.

#include "dwalk/engine.hpp"
#include "dwalk/data_loader.hpp"
#include "dwalk/genome.hpp"
#include "dwalk/math.hpp"
#include "dwalk/walk.hpp"

#include <algorithm>

namespace dwalk::core {

namespace {

constexpr std::string_view MATH_PREFIX = "math.";

bool looks_like_json(std::string_view payload) noexcept {
    const auto first = payload.find_first_not_of(" \t\r\n");
    return first != std::string_view::npos && payload[first] == '{';
}

} // anonymous namespace

// ─── Construction ─────────────────────────────────────────────────────────────

Engine::Engine(EngineConfig config) noexcept
    : config_(config)
{}

// ─── is_known_converter ───────────────────────────────────────────────────────

bool Engine::is_known_converter(std::string_view converter) {
    if (converter.starts_with(MATH_PREFIX)) {
        return math::MathSource::from_key(converter).has_value();
    }
    return converter == "dna" || converter == "audio"
        || converter == "finance" || converter == "cosmos";
}

// ─── convert ──────────────────────────────────────────────────────────────────

DigitSequence Engine::convert(const Source& source, std::string_view payload) const {
    const std::string_view converter = source.converter;
    const Radix radix = config_.radix;

    if (converter.starts_with(MATH_PREFIX)) {
        const auto generator = math::MathSource::from_key(converter);
        if (!generator) {
            return DigitSequence{0};
        }
        return generator->generate(std::max<std::size_t>(config_.math_digits, 1));
    }

    if (converter == "dna") {
        return genome::GenomicCodec::convert(DataLoader::parse_fasta(payload), radix);
    }

    if (converter == "audio") {
        const WavAudio audio = DataLoader::decode_wav(payload);
        return signal::AudioConverter::convert(audio.samples, audio.sample_rate,
                                               radix, config_.audio_scale);
    }

    if (converter == "finance") {
        const std::vector<double> prices = looks_like_json(payload)
            ? DataLoader::parse_price_json(payload)
            : DataLoader::parse_price_csv(payload);
        return signal::SeriesConverter::finance(prices, radix);
    }

    if (converter == "cosmos") {
        return signal::SeriesConverter::cosmos(DataLoader::parse_strain_text(payload), radix);
    }

    return DigitSequence{0};
}

// ─── walk ─────────────────────────────────────────────────────────────────────

Path Engine::walk(std::span<const Digit> digits, const mapping::DigitMapping& mapping) const {
    if (config_.radix == Radix::Base4) {
        return walk::TurtleWalk::walk4(digits, config_.max_points);
    }
    return walk::TurtleWalk::walk(digits, mapping, config_.max_points);
}

// ─── run ──────────────────────────────────────────────────────────────────────

WalkOutput Engine::run(const Source& source,
                       std::string_view payload,
                       const SourceCatalog& catalog,
                       std::optional<std::string_view> mapping_override) const
{
    WalkOutput out;
    out.mapping_name = std::string(mapping_override.value_or(source.mapping));
    out.digits = convert(source, payload);
    out.points = walk(out.digits, catalog.resolve_mapping(out.mapping_name));
    return out;
}

} // namespace dwalk::core
