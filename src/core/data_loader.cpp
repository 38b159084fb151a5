/// @file src/core/data_loader.cpp
/// @brief Raw payload decoders: FASTA, strain text, price CSV/JSON and WAV.

#include "dwalk/data_loader.hpp"
#include "dwalk/genome.hpp"
#include "json_document.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>

namespace dwalk::core {

namespace {

constexpr std::string_view WHITESPACE = " \t\r\n\v\f";

std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(WHITESPACE);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(WHITESPACE);
    return s.substr(first, last - first + 1);
}

/// Split `text` into lines, dropping a trailing '\r' from each.
template <typename Fn>
void for_each_line(std::string_view text, Fn&& fn) {
    std::size_t line_no = 0;
    while (!text.empty()) {
        const auto nl = text.find('\n');
        std::string_view line = text.substr(0, nl);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        fn(++line_no, line);
        if (nl == std::string_view::npos) break;
        text.remove_prefix(nl + 1);
    }
}

// ─── Little-endian readers for WAV ────────────────────────────────────────────

class ByteReader {
public:
    explicit ByteReader(std::span<const std::byte> bytes) noexcept : bytes_(bytes) {}

    [[nodiscard]] bool has(std::size_t offset, std::size_t n) const noexcept {
        return offset <= bytes_.size() && n <= bytes_.size() - offset;
    }

    [[nodiscard]] std::uint32_t u32(std::size_t offset) const noexcept {
        return static_cast<std::uint32_t>(byte(offset))
             | static_cast<std::uint32_t>(byte(offset + 1)) << 8
             | static_cast<std::uint32_t>(byte(offset + 2)) << 16
             | static_cast<std::uint32_t>(byte(offset + 3)) << 24;
    }

    [[nodiscard]] std::uint16_t u16(std::size_t offset) const noexcept {
        return static_cast<std::uint16_t>(byte(offset) | byte(offset + 1) << 8);
    }

    [[nodiscard]] bool tag(std::size_t offset, std::string_view expected) const noexcept {
        if (!has(offset, expected.size())) return false;
        return std::memcmp(bytes_.data() + offset, expected.data(), expected.size()) == 0;
    }

    [[nodiscard]] unsigned byte(std::size_t offset) const noexcept {
        return static_cast<unsigned>(std::to_integer<std::uint8_t>(bytes_[offset]));
    }

    [[nodiscard]] std::size_t size() const noexcept { return bytes_.size(); }

private:
    std::span<const std::byte> bytes_;
};

constexpr std::uint16_t WAVE_FORMAT_PCM        = 0x0001;
constexpr std::uint16_t WAVE_FORMAT_IEEE_FLOAT = 0x0003;
constexpr std::uint16_t WAVE_FORMAT_EXTENSIBLE = 0xFFFE;

/// Decode one sample at `offset` into [-1, 1].
double decode_sample(const ByteReader& r, std::size_t offset,
                     std::uint16_t format, std::uint16_t bits) noexcept {
    if (format == WAVE_FORMAT_IEEE_FLOAT) {
        if (bits == 32) {
            const std::uint32_t raw = r.u32(offset);
            float f = 0.0f;
            std::memcpy(&f, &raw, sizeof f);
            return static_cast<double>(f);
        }
        const std::uint64_t raw = static_cast<std::uint64_t>(r.u32(offset))
                                | static_cast<std::uint64_t>(r.u32(offset + 4)) << 32;
        double d = 0.0;
        std::memcpy(&d, &raw, sizeof d);
        return d;
    }

    switch (bits) {
        case 8:
            return (static_cast<double>(r.byte(offset)) - 128.0) / 128.0;
        case 16:
            return static_cast<double>(static_cast<std::int16_t>(r.u16(offset))) / 32768.0;
        case 24: {
            std::int32_t v = static_cast<std::int32_t>(r.byte(offset)
                                                       | r.byte(offset + 1) << 8
                                                       | r.byte(offset + 2) << 16);
            if (v & 0x800000) v -= 0x1000000;
            return static_cast<double>(v) / 8388608.0;
        }
        default:
            return static_cast<double>(static_cast<std::int32_t>(r.u32(offset))) / 2147483648.0;
    }
}

} // anonymous namespace

// ─── DataLoader::parse_number ─────────────────────────────────────────────────

std::optional<double> DataLoader::parse_number(std::string_view token) noexcept {
    token = trim(token);
    if (!token.empty() && token.front() == '+') {
        token.remove_prefix(1);
    }
    if (token.empty()) {
        return std::nullopt;
    }

    double value = 0.0;
    const auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
    if (ec != std::errc{} || ptr != token.data() + token.size()) {
        return std::nullopt;
    }
    return value;
}

// ─── DataLoader::load_file ────────────────────────────────────────────────────

std::optional<std::string> DataLoader::load_file(const std::string& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

// ─── DataLoader::parse_fasta ──────────────────────────────────────────────────

std::string DataLoader::parse_fasta(std::string_view text) {
    std::string sequence;
    sequence.reserve(text.size());

    for_each_line(text, [&sequence](std::size_t, std::string_view line) {
        line = trim(line);
        if (line.empty() || line.front() == '>' || line.front() == ';') {
            return;
        }
        for (char c : line) {
            if (WHITESPACE.find(c) == std::string_view::npos) {
                sequence.push_back(c);
            }
        }
    });

    if (genome::GenomicCodec::usable_bases(sequence) == 0) {
        throw ConversionFailed("sequence contains no A/C/G/T bases");
    }
    return sequence;
}

// ─── DataLoader::parse_strain_text ────────────────────────────────────────────

std::vector<double> DataLoader::parse_strain_text(std::string_view text) {
    std::vector<double> samples;
    samples.reserve(text.size() / 16);

    for_each_line(text, [&samples](std::size_t line_no, std::string_view line) {
        line = trim(line);
        if (line.empty() || line.front() == '#') {
            return;
        }
        const auto value = parse_number(line);
        if (!value) {
            throw ConversionFailed(fmt::format(
                "strain line {}: '{}' is not a number", line_no,
                line.substr(0, std::min<std::size_t>(line.size(), 40))));
        }
        samples.push_back(*value);
    });

    if (samples.empty()) {
        throw ConversionFailed("strain data contains no samples");
    }
    return samples;
}

// ─── DataLoader::validate_bar ─────────────────────────────────────────────────

bool DataLoader::validate_bar(const OHLCV& bar) noexcept {
    if (!std::isfinite(bar.timestamp) ||
        !std::isfinite(bar.open)      ||
        !std::isfinite(bar.high)      ||
        !std::isfinite(bar.low)       ||
        !std::isfinite(bar.close)     ||
        !std::isfinite(bar.volume)) {
        return false;
    }

    if (bar.high < bar.low)   return false;
    if (bar.open  > bar.high) return false;
    if (bar.open  < bar.low)  return false;
    if (bar.close > bar.high) return false;
    if (bar.close < bar.low)  return false;

    if (bar.volume < 0.0) return false;

    return true;
}

// ─── DataLoader::parse_row ────────────────────────────────────────────────────

std::optional<OHLCV> DataLoader::parse_row(std::string_view line) noexcept {
    if (line.empty() || line.front() == '#') {
        return std::nullopt;
    }

    std::array<double, 6> fields{};
    std::size_t count = 0;

    while (true) {
        const auto comma = line.find(',');
        const auto value = parse_number(line.substr(0, comma));
        if (!value || !std::isfinite(*value) || count == fields.size()) {
            return std::nullopt;
        }
        fields[count++] = *value;
        if (comma == std::string_view::npos) break;
        line.remove_prefix(comma + 1);
    }

    if (count != fields.size()) {
        return std::nullopt;
    }

    OHLCV bar{
        .timestamp = fields[0],
        .open      = fields[1],
        .high      = fields[2],
        .low       = fields[3],
        .close     = fields[4],
        .volume    = fields[5],
    };

    if (!validate_bar(bar)) {
        return std::nullopt;
    }
    return bar;
}

// ─── DataLoader::parse_ohlcv ──────────────────────────────────────────────────

std::vector<OHLCV> DataLoader::parse_ohlcv(std::string_view csv) {
    std::vector<OHLCV> bars;
    bool header_skipped = false;

    for_each_line(csv, [&](std::size_t, std::string_view line) {
        if (!header_skipped) {
            // First non-empty, non-comment line is the header.
            if (!line.empty() && line.front() != '#') {
                header_skipped = true;
            }
            return;
        }
        if (auto bar = parse_row(line)) {
            bars.push_back(*bar);
        }
    });

    return bars;
}

// ─── DataLoader::parse_price_csv ──────────────────────────────────────────────

std::vector<double> DataLoader::parse_price_csv(std::string_view csv) {
    std::vector<double> closes;
    for (const auto& bar : parse_ohlcv(csv)) {
        if (bar.close > 0.0) {
            closes.push_back(bar.close);
        }
    }
    if (closes.empty()) {
        throw ConversionFailed("price CSV contains no valid OHLCV rows");
    }
    return closes;
}

// ─── DataLoader::parse_price_json ─────────────────────────────────────────────

std::vector<double> DataLoader::parse_price_json(std::string_view json) {
    const boost::json::value root = load_json(json, "price JSON");

    // {"prices": [...]} or a Yahoo chart document.
    const boost::json::array* array = nullptr;
    if (const auto* obj = root.if_object()) {
        if (const auto* p = obj->if_contains("prices"); p && p->is_array()) {
            array = &p->get_array();
        } else if (const auto* chart = obj->if_contains("chart"); chart && chart->is_object()) {
            const auto* result = chart->get_object().if_contains("result");
            if (result && result->is_array() && !result->get_array().empty()
                    && result->get_array()[0].is_object()) {
                const auto* indicators = result->get_array()[0].get_object().if_contains("indicators");
                if (indicators && indicators->is_object()) {
                    const auto* quote = indicators->get_object().if_contains("quote");
                    if (quote && quote->is_array() && !quote->get_array().empty()
                            && quote->get_array()[0].is_object()) {
                        const auto* close = quote->get_array()[0].get_object().if_contains("close");
                        if (close && close->is_array()) {
                            array = &close->get_array();
                        }
                    }
                }
            }
        }
    }
    if (array == nullptr) {
        throw ConversionFailed("price JSON has no 'prices' array");
    }

    std::vector<double> prices;
    prices.reserve(array->size());
    for (std::size_t i = 0; i < array->size(); ++i) {
        const boost::json::value& entry = (*array)[i];
        if (entry.is_null()) {
            continue;
        }
        const auto value = json_number(entry);
        if (!value) {
            throw ConversionFailed(fmt::format("price entry {} is not a number", i));
        }
        if (std::isfinite(*value) && *value > 0.0) {
            prices.push_back(*value);
        }
    }

    if (prices.empty()) {
        throw ConversionFailed("price JSON contains no usable prices");
    }
    return prices;
}

// ─── DataLoader::decode_wav ───────────────────────────────────────────────────

WavAudio DataLoader::decode_wav(std::string_view bytes) {
    return decode_wav(std::as_bytes(std::span<const char>(bytes.data(), bytes.size())));
}

WavAudio DataLoader::decode_wav(std::span<const std::byte> bytes) {
    const ByteReader r(bytes);

    if (!r.tag(0, "RIFF") || !r.tag(8, "WAVE")) {
        throw ConversionFailed("audio is not a RIFF/WAVE file");
    }

    std::optional<std::size_t> fmt_offset;
    std::size_t data_offset = 0;
    std::size_t data_size   = 0;
    bool have_data = false;

    // Walk the chunk list; chunks are padded to even sizes.
    std::size_t offset = 12;
    while (r.has(offset, 8)) {
        const std::size_t size = r.u32(offset + 4);
        const std::size_t body = offset + 8;
        if (r.tag(offset, "fmt ")) {
            if (!r.has(body, 16)) {
                throw ConversionFailed("WAV 'fmt ' chunk is truncated");
            }
            fmt_offset = body;
        } else if (r.tag(offset, "data")) {
            data_offset = body;
            data_size   = std::min(size, r.size() - std::min(body, r.size()));
            have_data   = true;
            break;
        }
        if (size > r.size() - body) break;
        offset = body + size + (size & 1);
    }

    if (!fmt_offset) {
        throw ConversionFailed("WAV file has no 'fmt ' chunk");
    }
    if (!have_data) {
        throw ConversionFailed("WAV file has no 'data' chunk");
    }

    std::uint16_t format          = r.u16(*fmt_offset);
    const std::uint16_t channels  = r.u16(*fmt_offset + 2);
    const std::uint32_t rate      = r.u32(*fmt_offset + 4);
    const std::uint16_t bits      = r.u16(*fmt_offset + 14);

    if (format == WAVE_FORMAT_EXTENSIBLE) {
        // Sub-format GUID starts 24 bytes into the chunk; its first two bytes
        // carry the underlying format tag.
        if (!r.has(*fmt_offset + 24, 2)) {
            throw ConversionFailed("WAV extensible header is truncated");
        }
        format = r.u16(*fmt_offset + 24);
    }

    const bool pcm_ok   = format == WAVE_FORMAT_PCM
                       && (bits == 8 || bits == 16 || bits == 24 || bits == 32);
    const bool float_ok = format == WAVE_FORMAT_IEEE_FLOAT && (bits == 32 || bits == 64);
    if (!pcm_ok && !float_ok) {
        throw ConversionFailed(fmt::format(
            "unsupported WAV encoding (format {:#06x}, {} bits)", format, bits));
    }
    if (channels == 0) {
        throw ConversionFailed("WAV header declares zero channels");
    }

    const std::size_t sample_bytes = bits / 8;
    const std::size_t frame_bytes  = sample_bytes * channels;
    const std::size_t frames       = data_size / frame_bytes;

    WavAudio audio{
        .sample_rate     = rate,
        .channels        = channels,
        .bits_per_sample = bits,
        .samples         = {},
    };
    audio.samples.reserve(frames);

    for (std::size_t f = 0; f < frames; ++f) {
        const std::size_t base = data_offset + f * frame_bytes;
        double sum = 0.0;
        for (std::size_t ch = 0; ch < channels; ++ch) {
            sum += decode_sample(r, base + ch * sample_bytes, format, bits);
        }
        audio.samples.push_back(static_cast<float>(sum / static_cast<double>(channels)));
    }

    return audio;
}

} // namespace dwalk::core
