#include <catch2/catch_test_macros.hpp>

#include "voice_bridge/backend/live_protocol.hpp"

#include <string>

#include <nlohmann/json.hpp>
#include <websocketpp/base64/base64.hpp>

using namespace voice_bridge::backend;

TEST_CASE("setup message requests audio responses with activity detection") {
    LiveSetup setup;
    setup.model = "gemini-live-test";
    setup.vad.start_sensitivity = "START_SENSITIVITY_LOW";
    setup.vad.silence_duration_ms = 400;

    const auto message = build_setup_message(setup, "Be brief.");
    const auto& body = message.at("setup");
    REQUIRE(body.at("model") == "models/gemini-live-test");
    REQUIRE(body.at("generationConfig").at("responseModalities") ==
            nlohmann::json::array({"AUDIO"}));
    REQUIRE_FALSE(body.at("generationConfig").contains("speechConfig"));
    const auto& detection = body.at("realtimeInputConfig").at("automaticActivityDetection");
    REQUIRE(detection.at("disabled") == false);
    REQUIRE(detection.at("startOfSpeechSensitivity") == "START_SENSITIVITY_LOW");
    REQUIRE(detection.at("endOfSpeechSensitivity") == "END_SENSITIVITY_HIGH");
    REQUIRE(detection.at("prefixPaddingMs") == 20);
    REQUIRE(detection.at("silenceDurationMs") == 400);
    REQUIRE(body.at("systemInstruction").at("parts").at(0).at("text") == "Be brief.");
    REQUIRE_FALSE(body.contains("inputAudioTranscription"));
}

TEST_CASE("setup message keeps qualified model names and optional fields") {
    LiveSetup setup;
    setup.model = "models/already-qualified";
    setup.voice = "Puck";
    setup.transcriptions = true;

    const auto body = build_setup_message(setup, "").at("setup");
    REQUIRE(body.at("model") == "models/already-qualified");
    REQUIRE(body.at("generationConfig").at("speechConfig").at("voiceConfig")
                .at("prebuiltVoiceConfig").at("voiceName") == "Puck");
    REQUIRE_FALSE(body.contains("systemInstruction"));
    REQUIRE(body.contains("inputAudioTranscription"));
    REQUIRE(body.contains("outputAudioTranscription"));
}

TEST_CASE("audio message carries base64 PCM tagged with its rate") {
    const std::string pcm("\x01\x02\x03\x04", 4);
    const auto message = build_audio_message(pcm, 16000);
    const auto& audio = message.at("realtimeInput").at("audio");
    REQUIRE(audio.at("mimeType") == "audio/pcm;rate=16000");
    REQUIRE(websocketpp::base64_decode(audio.at("data").get<std::string>()) == pcm);
}

TEST_CASE("server event with inline audio and turn completion") {
    const std::string pcm("\x10\x00\x20\x00", 4);
    nlohmann::json message{
        {"serverContent",
         {{"modelTurn",
           {{"parts",
             nlohmann::json::array(
                 {{{"inlineData",
                    {{"mimeType", "audio/pcm;rate=24000"},
                     {"data", websocketpp::base64_encode(pcm)}}}},
                  {{"text", "hello"}}})}}},
          {"turnComplete", true}}}};

    const auto event = parse_server_event(message.dump());
    REQUIRE(event.turn_complete);
    REQUIRE_FALSE(event.interrupted);
    REQUIRE(event.audio.size() == 1);
    REQUIRE(event.audio.front().pcm == pcm);
    REQUIRE(event.audio.front().sample_rate == 24000);
    REQUIRE(event.text.size() == 1);
    REQUIRE(event.text.front() == "hello");
}

TEST_CASE("server event flags setup, interruption and transcriptions") {
    REQUIRE(parse_server_event(R"({"setupComplete":{}})").setup_complete);
    REQUIRE(parse_server_event(R"({"goAway":{"timeLeft":"10s"}})").go_away);

    const auto event = parse_server_event(
        R"({"serverContent":{"interrupted":true,)"
        R"("inputTranscription":{"text":"hi there"},"outputTranscription":{"text":""}}})");
    REQUIRE(event.interrupted);
    REQUIRE(event.input_transcription == std::string("hi there"));
    REQUIRE_FALSE(event.output_transcription.has_value());
    REQUIRE(event.audio.empty());
}

TEST_CASE("malformed backend messages raise BackendError") {
    REQUIRE_THROWS_AS(parse_server_event("{not json"), BackendError);
    REQUIRE_THROWS_AS(parse_server_event("[1,2,3]"), BackendError);
}

TEST_CASE("parse_rate reads the rate parameter or falls back") {
    REQUIRE(parse_rate("audio/pcm;rate=16000", 24000) == 16000);
    REQUIRE(parse_rate("audio/pcm", 24000) == 24000);
    REQUIRE(parse_rate("audio/pcm;rate=abc", 24000) == 24000);
}
