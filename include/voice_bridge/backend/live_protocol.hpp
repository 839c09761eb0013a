#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace voice_bridge {
namespace backend {

class BackendError : public std::runtime_error {
public:
    explicit BackendError(const std::string& message) : std::runtime_error(message) {}
};

struct VadSettings {
    std::string start_sensitivity = "START_SENSITIVITY_HIGH";
    std::string end_sensitivity = "END_SENSITIVITY_HIGH";
    int prefix_padding_ms = 20;
    int silence_duration_ms = 250;
};

struct LiveSetup {
    std::string model;
    std::optional<std::string> voice;
    VadSettings vad;
    bool transcriptions = false;
};

struct AudioChunk {
    std::string pcm;
    int sample_rate = 24000;
};

struct ServerEvent {
    bool setup_complete = false;
    bool turn_complete = false;
    bool interrupted = false;
    bool go_away = false;
    std::vector<AudioChunk> audio;
    std::vector<std::string> text;
    std::optional<std::string> input_transcription;
    std::optional<std::string> output_transcription;
};

nlohmann::json build_setup_message(const LiveSetup& setup, const std::string& system_prompt);
nlohmann::json build_audio_message(const std::string& pcm16, int sample_rate);

// Throws BackendError when the payload is not a JSON object.
ServerEvent parse_server_event(const std::string& payload);
ServerEvent parse_server_event(const nlohmann::json& message);

int parse_rate(const std::string& mime_type, int fallback);

}
}
