#include "voice_bridge/backend/live_protocol.hpp"

#include <websocketpp/base64/base64.hpp>

namespace voice_bridge::backend {

namespace {

std::string qualified_model(const std::string& model) {
    if (model.rfind("models/", 0) == 0) {
        return model;
    }
    return "models/" + model;
}

}

nlohmann::json build_setup_message(const LiveSetup& setup, const std::string& system_prompt) {
    nlohmann::json generation_config{{"responseModalities", nlohmann::json::array({"AUDIO"})}};
    if (setup.voice) {
        generation_config["speechConfig"] = {
            {"voiceConfig", {{"prebuiltVoiceConfig", {{"voiceName", *setup.voice}}}}}};
    }

    nlohmann::json body;
    body["model"] = qualified_model(setup.model);
    body["generationConfig"] = generation_config;
    body["realtimeInputConfig"] = {
        {"automaticActivityDetection",
         {{"disabled", false},
          {"startOfSpeechSensitivity", setup.vad.start_sensitivity},
          {"endOfSpeechSensitivity", setup.vad.end_sensitivity},
          {"prefixPaddingMs", setup.vad.prefix_padding_ms},
          {"silenceDurationMs", setup.vad.silence_duration_ms}}}};
    if (!system_prompt.empty()) {
        body["systemInstruction"] = {
            {"parts", nlohmann::json::array({{{"text", system_prompt}}})}};
    }
    if (setup.transcriptions) {
        body["inputAudioTranscription"] = nlohmann::json::object();
        body["outputAudioTranscription"] = nlohmann::json::object();
    }
    return {{"setup", body}};
}

nlohmann::json build_audio_message(const std::string& pcm16, int sample_rate) {
    return {{"realtimeInput",
             {{"audio",
               {{"data", websocketpp::base64_encode(pcm16)},
                {"mimeType", "audio/pcm;rate=" + std::to_string(sample_rate)}}}}}};
}

int parse_rate(const std::string& mime_type, int fallback) {
    const auto pos = mime_type.find("rate=");
    if (pos == std::string::npos) {
        return fallback;
    }
    try {
        const int rate = std::stoi(mime_type.substr(pos + 5));
        return rate > 0 ? rate : fallback;
    } catch (const std::exception&) {
        return fallback;
    }
}

ServerEvent parse_server_event(const std::string& payload) {
    nlohmann::json message;
    try {
        message = nlohmann::json::parse(payload);
    } catch (const nlohmann::json::exception& ex) {
        throw BackendError(std::string("invalid backend message: ") + ex.what());
    }
    return parse_server_event(message);
}

ServerEvent parse_server_event(const nlohmann::json& message) {
    if (!message.is_object()) {
        throw BackendError("backend message is not an object");
    }
    ServerEvent event;
    event.setup_complete = message.contains("setupComplete");
    event.go_away = message.contains("goAway");

    const auto content_it = message.find("serverContent");
    if (content_it == message.end() || !content_it->is_object()) {
        return event;
    }
    const auto& content = *content_it;
    event.turn_complete = content.value("turnComplete", false);
    event.interrupted = content.value("interrupted", false);

    if (content.contains("inputTranscription") && content["inputTranscription"].is_object()) {
        const auto text = content["inputTranscription"].value("text", "");
        if (!text.empty()) {
            event.input_transcription = text;
        }
    }
    if (content.contains("outputTranscription") && content["outputTranscription"].is_object()) {
        const auto text = content["outputTranscription"].value("text", "");
        if (!text.empty()) {
            event.output_transcription = text;
        }
    }

    const auto turn_it = content.find("modelTurn");
    if (turn_it == content.end() || !turn_it->is_object()) {
        return event;
    }
    const auto parts_it = turn_it->find("parts");
    if (parts_it == turn_it->end() || !parts_it->is_array()) {
        return event;
    }
    for (const auto& part : *parts_it) {
        if (!part.is_object()) {
            continue;
        }
        if (part.contains("text") && part["text"].is_string()) {
            event.text.push_back(part["text"].get<std::string>());
        }
        const auto inline_it = part.find("inlineData");
        if (inline_it == part.end() || !inline_it->is_object()) {
            continue;
        }
        const auto data = inline_it->value("data", "");
        if (data.empty()) {
            continue;
        }
        AudioChunk chunk;
        chunk.pcm = websocketpp::base64_decode(data);
        chunk.sample_rate = parse_rate(inline_it->value("mimeType", ""), chunk.sample_rate);
        if (!chunk.pcm.empty()) {
            event.audio.push_back(std::move(chunk));
        }
    }
    return event;
}

}
