#pragma once

/// @file include/dwalk/signal.hpp
/// @brief Numeric-series converters: audio spectrogram, price deltas and
///        gravitational-wave strain.
///
/// # Module: SignalConverter
///
/// ## Responsibility
/// Reduce a decoded numeric series to digits in base 12 or base 4:
///   - audio:   dominant FFT frequency per frame → log band or relative scale
///   - finance: relative price deltas → min-max normalization
///   - cosmos:  raw strain samples → min-max normalization
///
/// ## Guarantees
/// - Never throws on numeric content; non-finite samples are tolerated
/// - Never returns an empty sequence
///
/// ## NOT Responsible For
/// - Decoding WAV, CSV, JSON or strain text (see DataLoader)

#include "dwalk/types.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace dwalk::signal {

// ─── Audio ────────────────────────────────────────────────────────────────────

/// How dominant frequencies become digits.
enum class FrequencyScale {
    LogBand,   ///< Fixed 20 Hz – 20 kHz logarithmic band
    Relative,  ///< Min-max over the clip's own dominant frequencies
};

class AudioConverter {
public:
    AudioConverter() = delete;

    /// Periodic Hann window of length `n`: w[i] = ½(1 − cos(2πi/n)).
    [[nodiscard]] static std::vector<double> hann_window(std::size_t n);

    /// Dominant frequency (Hz) of each Hann-windowed frame of FFT_SIZE
    /// samples, frames advancing by FFT_HOP. The DC bin is excluded.
    ///
    /// # Returns
    /// Empty when `samples` is shorter than one frame.
    [[nodiscard]] static std::vector<double>
    dominant_frequencies(std::span<const float> samples, std::uint32_t sample_rate);

    /// Position of `frequency_hz` in the log band, in [0, 1].
    [[nodiscard]] static double log_band_position(double frequency_hz) noexcept;

    /// Audio → digits.
    ///
    /// # Returns
    /// `[⌊R/2⌋]` when `samples` is shorter than one frame.
    [[nodiscard]] static DigitSequence
    convert(std::span<const float> samples,
            std::uint32_t sample_rate,
            Radix radix = Radix::Base12,
            FrequencyScale scale = FrequencyScale::LogBand);
};

// ─── Finance / Cosmos ─────────────────────────────────────────────────────────

class SeriesConverter {
public:
    SeriesConverter() = delete;

    /// (p[i+1] − p[i]) / p[i] for each consecutive pair. A zero price yields a
    /// non-finite delta, which normalization maps to the middle digit.
    [[nodiscard]] static std::vector<double>
    relative_deltas(std::span<const double> prices);

    /// Price series → digits of its relative deltas.
    ///
    /// # Returns
    /// `[0]` for fewer than two prices; otherwise `prices.size() − 1` digits.
    [[nodiscard]] static DigitSequence
    finance(std::span<const double> prices, Radix radix = Radix::Base12);

    /// Strain samples → digits, one per sample.
    [[nodiscard]] static DigitSequence
    cosmos(std::span<const double> strain, Radix radix = Radix::Base12);
};

} // namespace dwalk::signal
