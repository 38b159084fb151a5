/// @file src/signal/audio_converter.cpp
/// @brief Spectrogram-based audio conversion using Eigen's FFT module.

#include "dwalk/signal.hpp"
#include "dwalk/constants.hpp"
#include "dwalk/digit_codec.hpp"

#include <unsupported/Eigen/FFT>

#include <algorithm>
#include <cmath>
#include <complex>
#include <numbers>

namespace dwalk::signal {

// ─── hann_window ──────────────────────────────────────────────────────────────

std::vector<double> AudioConverter::hann_window(std::size_t n) {
    std::vector<double> w(n);
    for (std::size_t i = 0; i < n; ++i) {
        w[i] = 0.5 * (1.0 - std::cos(2.0 * std::numbers::pi * static_cast<double>(i)
                                     / static_cast<double>(n)));
    }
    return w;
}

// ─── dominant_frequencies ─────────────────────────────────────────────────────

std::vector<double>
AudioConverter::dominant_frequencies(std::span<const float> samples, std::uint32_t sample_rate) {
    constexpr std::size_t N   = constants::FFT_SIZE;
    constexpr std::size_t HOP = constants::FFT_HOP;

    std::vector<double> out;
    if (samples.size() < N) {
        return out;
    }

    const std::vector<double> window = hann_window(N);

    Eigen::FFT<double> fft;
    fft.SetFlag(Eigen::FFT<double>::HalfSpectrum);

    std::vector<double>               frame(N);
    std::vector<std::complex<double>> spectrum;

    out.reserve((samples.size() - N) / HOP + 1);
    for (std::size_t start = 0; start + N <= samples.size(); start += HOP) {
        for (std::size_t i = 0; i < N; ++i) {
            const double s = static_cast<double>(samples[start + i]);
            frame[i] = std::isfinite(s) ? s * window[i] : 0.0;
        }
        fft.fwd(spectrum, frame);

        std::size_t best_bin = 1;
        double      best_mag = -1.0;
        const std::size_t half = std::min(N / 2, spectrum.size());
        for (std::size_t bin = 1; bin < half; ++bin) {
            const double mag = std::abs(spectrum[bin]);
            if (mag > best_mag) {
                best_mag = mag;
                best_bin = bin;
            }
        }

        out.push_back(static_cast<double>(best_bin) * static_cast<double>(sample_rate)
                      / static_cast<double>(N));
    }
    return out;
}

// ─── log_band_position ────────────────────────────────────────────────────────

double AudioConverter::log_band_position(double frequency_hz) noexcept {
    constexpr double lo = constants::AUDIO_MIN_FREQUENCY_HZ;
    constexpr double hi = constants::AUDIO_MAX_FREQUENCY_HZ;

    if (!(frequency_hz > lo)) {
        return 0.0;
    }
    const double pos = std::log(frequency_hz / lo) / std::log(hi / lo);
    return std::clamp(pos, 0.0, 1.0);
}

// ─── convert ──────────────────────────────────────────────────────────────────

DigitSequence AudioConverter::convert(std::span<const float> samples,
                                      std::uint32_t sample_rate,
                                      Radix radix,
                                      FrequencyScale scale) {
    const std::vector<double> freqs = dominant_frequencies(samples, sample_rate);
    if (freqs.empty()) {
        return DigitSequence{middle_digit(radix)};
    }

    if (scale == FrequencyScale::Relative) {
        return codec::DigitCodec::normalize(freqs, radix);
    }

    DigitSequence out;
    out.reserve(freqs.size());
    for (double f : freqs) {
        out.push_back(codec::DigitCodec::quantize_unit(log_band_position(f), radix));
    }
    return out;
}

} // namespace dwalk::signal
