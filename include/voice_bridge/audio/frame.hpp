#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace voice_bridge {
namespace audio {

class Resampler;

constexpr int kTelephonySampleRate = 8000;
constexpr int kBackendInputSampleRate = 16000;
constexpr int kBackendOutputSampleRate = 24000;

// 16-bit mono PCM tagged with its sample rate. Conversions return new frames.
class AudioFrame {
public:
    AudioFrame(std::string pcm16, int sample_rate);

    static AudioFrame from_mulaw(const std::string& companded,
                                 int sample_rate = kTelephonySampleRate);

    const std::string& bytes() const;
    int sample_rate() const;
    size_t sample_count() const;
    bool empty() const;
    std::chrono::microseconds duration() const;

    AudioFrame resampled(int to_rate) const;
    // Streaming variant; the resampler must convert from this frame's rate.
    AudioFrame resampled(Resampler& resampler) const;
    std::string to_mulaw() const;

private:
    std::string pcm16_;
    int sample_rate_;
};

}
}
