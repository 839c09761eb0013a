#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct SpeexResamplerState_;

namespace voice_bridge {
namespace audio {

// Byte buffers carry signed 16-bit little-endian mono PCM or 8-bit G.711
// mu-law samples. None of these functions throw.

std::string mulaw_decode(const std::string& companded);
std::string mulaw_encode(const std::string& pcm16);
std::string resample(const std::string& pcm16, int from_rate, int to_rate);

// speexdsp quality level, 0 (fastest) to 10 (best).
constexpr int kResampleQuality = 5;

// Streaming sample-rate converter for one mono PCM16 stream. Filter history
// carries over between process() calls, so consecutive chunks join without
// edge artifacts. process() and flush() throw std::runtime_error when
// speexdsp reports an error.
class Resampler {
public:
    Resampler(int from_rate, int to_rate, int quality = kResampleQuality);
    ~Resampler();

    Resampler(const Resampler&) = delete;
    Resampler& operator=(const Resampler&) = delete;

    int from_rate() const;
    int to_rate() const;

    // Drops the filter's leading delay from the next output.
    void skip_zeros();
    std::string process(const std::string& pcm16);
    // Pushes the samples still held in the filter out with trailing silence.
    std::string flush();

private:
    struct StateDeleter {
        void operator()(SpeexResamplerState_* state) const;
    };

    std::string convert(const std::vector<int16_t>& input);

    int from_rate_;
    int to_rate_;
    std::unique_ptr<SpeexResamplerState_, StateDeleter> state_;
};

// Per-sample reference implementations (ITU-T G.711 bit manipulation).
int16_t mulaw_to_linear(uint8_t code);
uint8_t linear_to_mulaw(int16_t sample);

}
}
