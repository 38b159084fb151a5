#pragma once
/**
 * @file  engine.hpp
 * @brief Pipeline engine: source descriptor + payload → digits → path
 *
 * Module:  src/core/
 *
 * Responsibility
 * --------------
 * Route a Source to the converter its `converter` key names and feed the
 * resulting digits to the turtle walk:
 *
 *   payload → DataLoader → converter → DigitSequence
 *           → SourceCatalog::resolve_mapping → TurtleWalk → Path
 *
 * Converter keys:
 *
 *   math.<family>.<name>   MathSource (payload ignored)
 *   dna                    FASTA or bare sequence text
 *   audio                  RIFF/WAVE bytes
 *   finance                price JSON (payload starts with '{') or OHLCV CSV
 *   cosmos                 strain text
 *
 * Design Constraints
 * ------------------
 *   • Unknown converter keys yield the safe digit sequence [0].
 *   • Only undecodable payloads throw (ConversionFailed).
 *   • Stateless: `convert`, `walk` and `run` are const and thread-safe.
 *
 * NOT Responsible For
 * -------------------
 *   • Reading files or fetching URLs (caller provides the payload bytes)
 *   • Persisting artifacts (see ArtifactCodec)
 */

#include "dwalk/constants.hpp"
#include "dwalk/mapping.hpp"
#include "dwalk/signal.hpp"
#include "dwalk/source_catalog.hpp"
#include "dwalk/types.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace dwalk::core {

// ── EngineConfig ──────────────────────────────────────────────────────────────

struct EngineConfig {
    /// Output radix for data converters and choice of walk.
    Radix radix = Radix::Base12;

    /// Subsampling bound forwarded to the walk.
    std::size_t max_points = constants::DEFAULT_MAX_POINTS;

    /// Digit count (or orbit iteration cap) requested from math sources.
    std::size_t math_digits = constants::DEFAULT_MATH_DIGITS;

    /// Frequency scale for audio sources.
    signal::FrequencyScale audio_scale = signal::FrequencyScale::LogBand;
};

// ── WalkOutput ────────────────────────────────────────────────────────────────

struct WalkOutput {
    DigitSequence digits;        ///< Converter output
    Path          points;        ///< Walk after subsampling
    std::string   mapping_name;  ///< Mapping actually requested
};

// ── Engine ────────────────────────────────────────────────────────────────────

class Engine {
public:
    explicit Engine(EngineConfig config = EngineConfig{}) noexcept;

    /**
     * @brief Convert a payload to digits with the source's converter.
     *
     * @throws ConversionFailed if the payload cannot be decoded.
     * @return `[0]` for an unknown converter key.
     */
    [[nodiscard]] DigitSequence convert(const Source& source, std::string_view payload) const;

    /// Walk `digits` with `walk` (base 12) or `walk4` (base 4).
    [[nodiscard]] Path walk(std::span<const Digit> digits,
                            const mapping::DigitMapping& mapping) const;

    /**
     * @brief Convert and walk in one step.
     *
     * @param mapping_override  Mapping name to use instead of the source's.
     * @throws ConversionFailed if the payload cannot be decoded.
     */
    [[nodiscard]] WalkOutput run(const Source& source,
                                 std::string_view payload,
                                 const SourceCatalog& catalog,
                                 std::optional<std::string_view> mapping_override = std::nullopt) const;

    /// True when `converter` names a converter `convert` understands.
    [[nodiscard]] static bool is_known_converter(std::string_view converter);

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    EngineConfig config_;
};

} // namespace dwalk::core
