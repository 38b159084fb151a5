#pragma once

/// @file include/dwalk/data_loader.hpp
/// @brief Raw payload decoders: FASTA, strain text, price CSV/JSON, WAV.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Turn in-memory bytes into the primitive series the converters consume.
/// This is the only layer that rejects input: when a payload cannot be read
/// as its primitive type at all, a `ConversionFailed` with a human-readable
/// cause is thrown. Individually bad records inside an otherwise readable
/// payload (a malformed CSV row, a `null` price) are skipped.
///
/// ## Expected Price CSV Format
/// ```
/// timestamp,open,high,low,close,volume
/// 1,100.0,105.0,99.0,103.0,1000000
/// 2,103.0,107.0,102.0,106.5,1200000
/// ```
/// The first line is treated as a header and skipped.
///
/// ## Expected Price JSON Format
/// ```
/// {"symbol": "^GSPC", "prices": [4780.9, null, 4742.8], "timestamps": [...]}
/// ```
/// or a Yahoo chart document (`chart.result[0].indicators.quote[0].close`).
///
/// ## NOT Responsible For
/// - Fetching, caching or decompressing payloads

#include "dwalk/error.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace dwalk::core {

// ─── OHLCV ────────────────────────────────────────────────────────────────────

/// A single OHLCV bar of market data.
struct OHLCV {
    double timestamp;  ///< Bar index or Unix epoch seconds
    double open;       ///< Opening price
    double high;       ///< High price
    double low;        ///< Low price
    double close;      ///< Closing price
    double volume;     ///< Traded volume
};

// ─── WavAudio ─────────────────────────────────────────────────────────────────

/// Decoded PCM audio, down-mixed to mono in [-1, 1].
struct WavAudio {
    std::uint32_t      sample_rate;
    std::uint16_t      channels;     ///< Channel count before down-mixing
    std::uint16_t      bits_per_sample;
    std::vector<float> samples;
};

// ─── DataLoader ───────────────────────────────────────────────────────────────

class DataLoader {
public:
    DataLoader() = delete;

    /// Read a whole file as bytes. `nullopt` if it cannot be opened.
    [[nodiscard]] static std::optional<std::string>
    load_file(const std::string& filepath);

    /// FASTA or bare sequence text → concatenated sequence characters.
    ///
    /// Lines starting with '>' (headers) or ';' (comments) are dropped;
    /// whitespace is removed. Ambiguity codes are kept for the codec to skip.
    ///
    /// # Throws
    /// `ConversionFailed` when no A/C/G/T base remains.
    [[nodiscard]] static std::string parse_fasta(std::string_view text);

    /// Strain text → samples, one number per non-blank, non-'#' line.
    ///
    /// # Throws
    /// `ConversionFailed` on the first non-numeric line (cause names the
    /// line number) or when no sample is present.
    [[nodiscard]] static std::vector<double> parse_strain_text(std::string_view text);

    /// OHLCV CSV → closing prices. Malformed or inconsistent rows and
    /// non-positive closes are skipped.
    ///
    /// # Throws
    /// `ConversionFailed` when no valid row remains.
    [[nodiscard]] static std::vector<double> parse_price_csv(std::string_view csv);

    /// Parse OHLCV bars from a CSV string; never throws, empty on no rows.
    [[nodiscard]] static std::vector<OHLCV> parse_ohlcv(std::string_view csv);

    /// Price JSON → prices. `null`, non-finite and non-positive entries are
    /// skipped.
    ///
    /// # Throws
    /// `ConversionFailed` on invalid JSON, a missing price array, a
    /// non-numeric entry, or an empty result.
    [[nodiscard]] static std::vector<double> parse_price_json(std::string_view json);

    /// RIFF/WAVE bytes → mono samples.
    ///
    /// Supports PCM 8/16/24/32-bit, IEEE float 32/64-bit and the extensible
    /// format wrapping either.
    ///
    /// # Throws
    /// `ConversionFailed` on a truncated or unsupported file.
    [[nodiscard]] static WavAudio decode_wav(std::span<const std::byte> bytes);

    /// Convenience overload for payloads held in a string.
    [[nodiscard]] static WavAudio decode_wav(std::string_view bytes);

    /// A bar is valid if all fields are finite, low ≤ open, close ≤ high and
    /// volume ≥ 0.
    [[nodiscard]] static bool validate_bar(const OHLCV& bar) noexcept;

    /// Parse one complete token as a double (a leading '+' is allowed).
    /// "nan" and "inf" parse; callers decide whether to keep them.
    [[nodiscard]] static std::optional<double> parse_number(std::string_view token) noexcept;

private:
    [[nodiscard]] static std::optional<OHLCV> parse_row(std::string_view line) noexcept;
};

} // namespace dwalk::core
