#include "voice_bridge/audio/codec.hpp"

#include <algorithm>
#include <array>
#include <climits>
#include <exception>
#include <stdexcept>
#include <vector>

#include <speex/speex_resampler.h>

#include "voice_bridge/logging.hpp"

namespace voice_bridge::audio {

namespace {

constexpr int kBias = 0x84;
constexpr int kClip = 8159;
constexpr std::array<int, 8> kSegmentEnd = {0x3F, 0x7F, 0xFF, 0x1FF,
                                            0x3FF, 0x7FF, 0xFFF, 0x1FFF};

int16_t read_sample(const std::string& pcm16, size_t index) {
    const auto lo = static_cast<uint8_t>(pcm16[index * 2]);
    const auto hi = static_cast<uint8_t>(pcm16[index * 2 + 1]);
    return static_cast<int16_t>(static_cast<uint16_t>(lo | (hi << 8)));
}

void write_sample(std::string& pcm16, size_t index, int16_t value) {
    const auto raw = static_cast<uint16_t>(value);
    pcm16[index * 2] = static_cast<char>(raw & 0xFF);
    pcm16[index * 2 + 1] = static_cast<char>((raw >> 8) & 0xFF);
}

const std::array<int16_t, 256>& decode_table() {
    static const std::array<int16_t, 256> table = []() {
        std::array<int16_t, 256> values{};
        for (int code = 0; code < 256; ++code) {
            values[code] = mulaw_to_linear(static_cast<uint8_t>(code));
        }
        return values;
    }();
    return table;
}

// Indexed by the 14-bit magnitude-with-sign value (sample >> 2) offset by 8192.
const std::vector<uint8_t>& encode_table() {
    static const std::vector<uint8_t> table = []() {
        std::vector<uint8_t> values(16384);
        for (int index = 0; index < 16384; ++index) {
            values[index] = linear_to_mulaw(static_cast<int16_t>((index - 8192) * 4));
        }
        return values;
    }();
    return table;
}

std::string decode_with_table(const std::string& companded) {
    const auto& table = decode_table();
    std::string pcm(companded.size() * 2, '\0');
    for (size_t i = 0; i < companded.size(); ++i) {
        write_sample(pcm, i, table[static_cast<uint8_t>(companded[i])]);
    }
    return pcm;
}

std::string decode_reference(const std::string& companded) {
    std::string pcm(companded.size() * 2, '\0');
    for (size_t i = 0; i < companded.size(); ++i) {
        write_sample(pcm, i, mulaw_to_linear(static_cast<uint8_t>(companded[i])));
    }
    return pcm;
}

std::string encode_with_table(const std::string& pcm16) {
    const auto& table = encode_table();
    const size_t samples = pcm16.size() / 2;
    std::string companded(samples, '\0');
    for (size_t i = 0; i < samples; ++i) {
        const int index = (read_sample(pcm16, i) >> 2) + 8192;
        companded[i] = static_cast<char>(table.at(static_cast<size_t>(index)));
    }
    return companded;
}

std::string encode_reference(const std::string& pcm16) {
    const size_t samples = pcm16.size() / 2;
    std::string companded(samples, '\0');
    for (size_t i = 0; i < samples; ++i) {
        companded[i] = static_cast<char>(linear_to_mulaw(read_sample(pcm16, i)));
    }
    return companded;
}

}

int16_t mulaw_to_linear(uint8_t code) {
    const int value = ~code & 0xFF;
    int magnitude = ((value & 0x0F) << 3) + kBias;
    magnitude <<= (value & 0x70) >> 4;
    return static_cast<int16_t>((value & 0x80) ? (kBias - magnitude) : (magnitude - kBias));
}

uint8_t linear_to_mulaw(int16_t sample) {
    int value = sample >> 2;
    int mask = 0xFF;
    if (value < 0) {
        value = -value;
        mask = 0x7F;
    }
    value = std::min(value, kClip);
    value += kBias >> 2;

    int segment = 0;
    while (segment < 8 && value > kSegmentEnd[segment]) {
        ++segment;
    }
    if (segment >= 8) {
        return static_cast<uint8_t>(0x7F ^ mask);
    }
    const int code = (segment << 4) | ((value >> (segment + 1)) & 0x0F);
    return static_cast<uint8_t>(code ^ mask);
}

std::string mulaw_decode(const std::string& companded) {
    if (companded.empty()) {
        return {};
    }
    try {
        return decode_with_table(companded);
    } catch (const std::exception& ex) {
        logging::warn(
            "Table mu-law decode failed, using reference decoder",
            {kv("error", ex.what()),
             kv("bytes", companded.size())});
    }
    try {
        return decode_reference(companded);
    } catch (const std::exception& ex) {
        logging::error(
            "Reference mu-law decode failed",
            {kv("error", ex.what()),
             kv("bytes", companded.size())});
    }
    return {};
}

std::string mulaw_encode(const std::string& pcm16) {
    if (pcm16.size() < 2) {
        return {};
    }
    try {
        return encode_with_table(pcm16);
    } catch (const std::exception& ex) {
        logging::warn(
            "Table mu-law encode failed, using reference encoder",
            {kv("error", ex.what()),
             kv("bytes", pcm16.size())});
    }
    try {
        return encode_reference(pcm16);
    } catch (const std::exception& ex) {
        logging::error(
            "Reference mu-law encode failed",
            {kv("error", ex.what()),
             kv("bytes", pcm16.size())});
    }
    return {};
}

std::string resample(const std::string& pcm16, int from_rate, int to_rate) {
    if (from_rate == to_rate || pcm16.empty()) {
        return pcm16;
    }
    if (from_rate <= 0 || to_rate <= 0) {
        logging::error(
            "Resample rejected invalid rate",
            {kv("from_rate", from_rate),
             kv("to_rate", to_rate)});
        return {};
    }
    const size_t in_samples = pcm16.size() / 2;
    if (in_samples == 0) {
        return {};
    }
    const auto scaled = static_cast<unsigned long long>(in_samples) *
                        static_cast<unsigned long long>(to_rate);
    const auto out_samples = static_cast<size_t>(
        (scaled + static_cast<unsigned long long>(from_rate) / 2) /
        static_cast<unsigned long long>(from_rate));
    if (out_samples == 0) {
        return {};
    }
    try {
        Resampler resampler(from_rate, to_rate);
        resampler.skip_zeros();
        auto out = resampler.process(pcm16);
        if (out.size() < out_samples * 2) {
            out += resampler.flush();
        }
        out.resize(out_samples * 2, '\0');
        return out;
    } catch (const std::exception& ex) {
        logging::error(
            "Resample failed",
            {kv("error", ex.what()),
             kv("from_rate", from_rate),
             kv("to_rate", to_rate)});
    }
    return {};
}

void Resampler::StateDeleter::operator()(SpeexResamplerState_* state) const {
    if (state) {
        speex_resampler_destroy(state);
    }
}

Resampler::Resampler(int from_rate, int to_rate, int quality)
    : from_rate_(from_rate),
      to_rate_(to_rate) {
    if (from_rate_ <= 0 || to_rate_ <= 0) {
        throw std::invalid_argument("Resampler rates must be positive");
    }
    int err = RESAMPLER_ERR_SUCCESS;
    state_.reset(speex_resampler_init(1, static_cast<spx_uint32_t>(from_rate_),
                                      static_cast<spx_uint32_t>(to_rate_), quality, &err));
    if (!state_ || err != RESAMPLER_ERR_SUCCESS) {
        throw std::runtime_error(std::string("Resampler init failed: ") +
                                 speex_resampler_strerror(err));
    }
}

Resampler::~Resampler() = default;

int Resampler::from_rate() const {
    return from_rate_;
}

int Resampler::to_rate() const {
    return to_rate_;
}

void Resampler::skip_zeros() {
    const int err = speex_resampler_skip_zeros(state_.get());
    if (err != RESAMPLER_ERR_SUCCESS) {
        throw std::runtime_error(std::string("Resampler skip failed: ") +
                                 speex_resampler_strerror(err));
    }
}

std::string Resampler::process(const std::string& pcm16) {
    const size_t in_samples = pcm16.size() / 2;
    if (in_samples == 0) {
        return {};
    }
    std::vector<int16_t> input(in_samples);
    for (size_t i = 0; i < in_samples; ++i) {
        input[i] = read_sample(pcm16, i);
    }
    return convert(input);
}

std::string Resampler::flush() {
    const int latency = speex_resampler_get_input_latency(state_.get());
    if (latency <= 0) {
        return {};
    }
    return convert(std::vector<int16_t>(static_cast<size_t>(latency), 0));
}

std::string Resampler::convert(const std::vector<int16_t>& input) {
    if (input.size() > UINT_MAX) {
        throw std::runtime_error("Too many samples to resample");
    }
    const auto capacity = static_cast<size_t>(
        static_cast<unsigned long long>(input.size()) * static_cast<unsigned long long>(to_rate_) /
            static_cast<unsigned long long>(from_rate_) + 16);
    std::vector<spx_int16_t> output(capacity);
    std::string out;
    out.reserve(capacity * 2);

    size_t consumed = 0;
    while (consumed < input.size()) {
        auto in_len = static_cast<spx_uint32_t>(input.size() - consumed);
        auto out_len = static_cast<spx_uint32_t>(output.size());
        const int err = speex_resampler_process_int(state_.get(), 0,
                                                    input.data() + consumed, &in_len,
                                                    output.data(), &out_len);
        if (err != RESAMPLER_ERR_SUCCESS) {
            throw std::runtime_error(std::string("Resampling failed: ") +
                                     speex_resampler_strerror(err));
        }
        if (in_len == 0 && out_len == 0) {
            throw std::runtime_error("Resampler made no progress");
        }
        consumed += in_len;
        const size_t offset = out.size() / 2;
        out.resize(out.size() + static_cast<size_t>(out_len) * 2);
        for (spx_uint32_t i = 0; i < out_len; ++i) {
            write_sample(out, offset + i, output[i]);
        }
    }
    return out;
}

}
