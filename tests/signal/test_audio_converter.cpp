/// @file tests/signal/test_audio_converter.cpp
/// @brief Unit tests for spectrogram peak picking and frequency mapping.

#include <gtest/gtest.h>
#include "dwalk/signal.hpp"
#include "dwalk/constants.hpp"

#include <cmath>
#include <numbers>
#include <vector>

using namespace dwalk;
using namespace dwalk::signal;

namespace {

constexpr std::uint32_t RATE = 44100;

/// Sine exactly on FFT bin `bin`.
std::vector<float> bin_sine(std::size_t bin, std::size_t n) {
    const double f = static_cast<double>(bin) * RATE / constants::FFT_SIZE;
    std::vector<float> s(n);
    for (std::size_t i = 0; i < n; ++i) {
        s[i] = static_cast<float>(std::sin(2.0 * std::numbers::pi * f * i / RATE));
    }
    return s;
}

} // anonymous namespace

TEST(AudioConverter, HannWindowIsPeriodic) {
    const auto w = AudioConverter::hann_window(constants::FFT_SIZE);
    ASSERT_EQ(w.size(), constants::FFT_SIZE);
    EXPECT_DOUBLE_EQ(w[0], 0.0);
    EXPECT_NEAR(w[constants::FFT_SIZE / 2], 1.0, 1e-15);
    // Periodic form: w[n - i] == w[i], so the last sample is not zero.
    EXPECT_NEAR(w[constants::FFT_SIZE - 1], w[1], 1e-15);
    EXPECT_GT(w.back(), 0.0);

    const auto w4 = AudioConverter::hann_window(4);
    EXPECT_NEAR(w4[1], 0.5, 1e-15);
    EXPECT_NEAR(w4[2], 1.0, 1e-15);
    EXPECT_NEAR(w4[3], 0.5, 1e-15);
}

TEST(AudioConverter, FrameCount) {
    const auto s = bin_sine(64, 4096);
    // frames start at 0, 1024, 2048
    EXPECT_EQ(AudioConverter::dominant_frequencies(s, RATE).size(), 3u);
}

TEST(AudioConverter, DominantFrequencyOfPureTone) {
    const auto s = bin_sine(64, 4096);
    const double expected = 64.0 * RATE / constants::FFT_SIZE;
    for (double f : AudioConverter::dominant_frequencies(s, RATE)) {
        EXPECT_DOUBLE_EQ(f, expected);
    }
}

TEST(AudioConverter, LogBandPosition) {
    EXPECT_DOUBLE_EQ(AudioConverter::log_band_position(20.0), 0.0);
    EXPECT_NEAR(AudioConverter::log_band_position(20000.0), 1.0, 1e-12);
    EXPECT_NEAR(AudioConverter::log_band_position(std::sqrt(20.0 * 20000.0)), 0.5, 1e-12);
    EXPECT_DOUBLE_EQ(AudioConverter::log_band_position(5.0), 0.0);
    EXPECT_DOUBLE_EQ(AudioConverter::log_band_position(96000.0), 1.0);
    EXPECT_DOUBLE_EQ(AudioConverter::log_band_position(NAN), 0.0);
}

TEST(AudioConverter, PureToneLogBandDigits) {
    // 1378.125 Hz → log position ≈ 0.6128
    const auto s = bin_sine(64, 4096);
    EXPECT_EQ(AudioConverter::convert(s, RATE), DigitSequence(3, 7));
    EXPECT_EQ(AudioConverter::convert(s, RATE, Radix::Base4), DigitSequence(3, 2));
}

TEST(AudioConverter, RelativeScaleOfSteadyToneIsMiddle) {
    const auto s = bin_sine(100, 8192);
    const auto d = AudioConverter::convert(s, RATE, Radix::Base12, FrequencyScale::Relative);
    EXPECT_EQ(d, DigitSequence(d.size(), 6));
}

TEST(AudioConverter, RisingToneClimbsInRelativeScale) {
    std::vector<float> s = bin_sine(40, 2048);
    const auto high = bin_sine(400, 2048);
    s.insert(s.end(), high.begin(), high.end());
    const auto d = AudioConverter::convert(s, RATE, Radix::Base12, FrequencyScale::Relative);
    ASSERT_EQ(d.size(), 3u);
    EXPECT_EQ(d.front(), 0);
    EXPECT_EQ(d.back(), 11);
}

TEST(AudioConverter, ShortInputYieldsMiddleDigit) {
    const std::vector<float> s(100, 0.5f);
    EXPECT_EQ(AudioConverter::convert(s, RATE), (DigitSequence{6}));
    EXPECT_EQ(AudioConverter::convert(s, RATE, Radix::Base4), (DigitSequence{2}));
    EXPECT_TRUE(AudioConverter::dominant_frequencies(s, RATE).empty());
}
