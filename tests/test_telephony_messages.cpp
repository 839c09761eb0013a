#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"

#include "voice_bridge/telephony/messages.hpp"

#include <string>

#include <nlohmann/json.hpp>
#include <websocketpp/base64/base64.hpp>

using namespace voice_bridge::telephony;

TEST_CASE("connected handshake is parsed") {
    const auto message = parse_inbound_message(fakes::connected_message());
    REQUIRE(message.type == EventType::Connected);
    REQUIRE(message.protocol == "Call");
    REQUIRE(message.version == "1.0.0");
}

TEST_CASE("start message carries identifiers, format and custom parameters") {
    const auto message = parse_inbound_message(fakes::start_message("MZ1", "CA1"));
    REQUIRE(message.type == EventType::Start);
    REQUIRE(message.start);
    REQUIRE(message.stream_sid == "MZ1");
    REQUIRE(message.sequence_number == "1");
    const auto& start = *message.start;
    REQUIRE(start.stream_sid == "MZ1");
    REQUIRE(start.call_sid == "CA1");
    REQUIRE(start.account_sid == "AC1");
    REQUIRE(start.tracks.size() == 1);
    REQUIRE(start.tracks.front() == "inbound");
    REQUIRE(start.media_format.encoding == "audio/x-mulaw");
    REQUIRE(start.media_format.sample_rate == 8000);
    REQUIRE(start.media_format.channels == 1);
    REQUIRE(start.custom_parameters.at("campaign") == "spring");
    REQUIRE(is_supported_format(start.media_format));
}

TEST_CASE("start message without a call id is rejected") {
    const std::string text =
        R"({"event":"start","start":{"streamSid":"MZ1","mediaFormat":)"
        R"({"encoding":"audio/x-mulaw","sampleRate":8000,"channels":1}}})";
    REQUIRE_THROWS_AS(parse_inbound_message(text), ProtocolError);
}

TEST_CASE("media payload is base64-decoded") {
    const std::string audio("\x7F\xFF\x00\x10", 4);
    const auto message = parse_inbound_message(fakes::media_message("MZ1", audio));
    REQUIRE(message.type == EventType::Media);
    REQUIRE(message.media);
    REQUIRE(message.media->audio == audio);
    REQUIRE(message.media->track == "inbound");
    REQUIRE(message.media->chunk == "1");
    REQUIRE(message.media->timestamp == "20");
}

TEST_CASE("numeric sequence fields are accepted") {
    const auto message = parse_inbound_message(
        R"({"event":"media","sequenceNumber":7,"media":{"chunk":3,"timestamp":60,"payload":""}})");
    REQUIRE(message.sequence_number == "7");
    REQUIRE(message.media->chunk == "3");
    REQUIRE(message.media->audio.empty());
}

TEST_CASE("stop, mark and unknown events are classified") {
    REQUIRE(parse_inbound_message(fakes::stop_message("MZ1")).type == EventType::Stop);
    const auto mark = parse_inbound_message(R"({"event":"mark","mark":{"name":"greeting"}})");
    REQUIRE(mark.type == EventType::Mark);
    REQUIRE(mark.mark_name == "greeting");
    const auto dtmf = parse_inbound_message(R"({"event":"dtmf","dtmf":{"digit":"5"}})");
    REQUIRE(dtmf.type == EventType::Dtmf);
    REQUIRE(dtmf.dtmf_digit == "5");
    REQUIRE(parse_inbound_message(R"({"event":"later"})").type == EventType::Unknown);
}

TEST_CASE("malformed inbound messages raise ProtocolError") {
    REQUIRE_THROWS_AS(parse_inbound_message("{oops"), ProtocolError);
    REQUIRE_THROWS_AS(parse_inbound_message("[]"), ProtocolError);
    REQUIRE_THROWS_AS(parse_inbound_message(R"({"streamSid":"MZ1"})"), ProtocolError);
    REQUIRE_THROWS_AS(parse_inbound_message(R"({"event":"media"})"), ProtocolError);
    REQUIRE_THROWS_AS(parse_inbound_message(R"({"event":"media","media":{"track":"x"}})"),
                      ProtocolError);
}

TEST_CASE("outbound media message wraps companded audio") {
    const std::string audio(80, '\xFF');
    const auto message = nlohmann::json::parse(make_media_message("MZ1", audio));
    REQUIRE(message.at("event") == "media");
    REQUIRE(message.at("streamSid") == "MZ1");
    REQUIRE(websocketpp::base64_decode(message.at("media").at("payload").get<std::string>()) ==
            audio);
}

TEST_CASE("only 8 kHz mono mu-law is supported") {
    MediaFormat format{"audio/x-mulaw", 8000, 1};
    REQUIRE(is_supported_format(format));
    format.channels = 2;
    REQUIRE_FALSE(is_supported_format(format));
    format = {"audio/x-alaw", 8000, 1};
    REQUIRE_FALSE(is_supported_format(format));
    format = {"audio/x-mulaw", 16000, 1};
    REQUIRE_FALSE(is_supported_format(format));
}
