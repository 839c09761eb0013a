#include "voice_bridge/audio/frame.hpp"

#include <stdexcept>
#include <utility>

#include "voice_bridge/audio/codec.hpp"

namespace voice_bridge::audio {

AudioFrame::AudioFrame(std::string pcm16, int sample_rate)
    : pcm16_(std::move(pcm16)),
      sample_rate_(sample_rate) {
    if (sample_rate_ <= 0) {
        throw std::invalid_argument("AudioFrame sample rate must be positive");
    }
    if (pcm16_.size() % 2 != 0) {
        pcm16_.pop_back();
    }
}

AudioFrame AudioFrame::from_mulaw(const std::string& companded, int sample_rate) {
    return AudioFrame(mulaw_decode(companded), sample_rate);
}

const std::string& AudioFrame::bytes() const {
    return pcm16_;
}

int AudioFrame::sample_rate() const {
    return sample_rate_;
}

size_t AudioFrame::sample_count() const {
    return pcm16_.size() / 2;
}

bool AudioFrame::empty() const {
    return pcm16_.empty();
}

std::chrono::microseconds AudioFrame::duration() const {
    return std::chrono::microseconds(
        static_cast<long long>(sample_count()) * 1000000LL / sample_rate_);
}

AudioFrame AudioFrame::resampled(int to_rate) const {
    if (to_rate == sample_rate_) {
        return *this;
    }
    return AudioFrame(resample(pcm16_, sample_rate_, to_rate), to_rate);
}

AudioFrame AudioFrame::resampled(Resampler& resampler) const {
    if (resampler.from_rate() != sample_rate_) {
        throw std::invalid_argument("Resampler input rate does not match the frame");
    }
    if (resampler.to_rate() == sample_rate_) {
        return *this;
    }
    return AudioFrame(resampler.process(pcm16_), resampler.to_rate());
}

std::string AudioFrame::to_mulaw() const {
    return mulaw_encode(pcm16_);
}

}
