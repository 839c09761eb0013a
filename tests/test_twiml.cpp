#include <catch2/catch_test_macros.hpp>

#include "voice_bridge/server/rest_server.hpp"
#include "voice_bridge/server/twiml.hpp"

#include <optional>
#include <string>

using namespace voice_bridge::server;

namespace {

bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

}

TEST_CASE("machine and fax answers hang up") {
    for (const char* answered_by : {"fax", "machine_start", "machine_end_beep",
                                    "machine_end_silence", "machine_end_other"}) {
        REQUIRE(is_machine_answer(answered_by));
        const auto twiml = stream_twiml(std::string(answered_by), "wss://host/media-stream",
                                        std::string("hello"));
        REQUIRE(contains(twiml, "<Hangup/>"));
        REQUIRE_FALSE(contains(twiml, "<Connect>"));
    }
}

TEST_CASE("humans and unknown answers are connected to the media stream") {
    REQUIRE_FALSE(is_machine_answer("human"));
    REQUIRE_FALSE(is_machine_answer("unknown"));

    const auto twiml = stream_twiml(std::nullopt, "wss://host/media-stream",
                                    std::string("Connecting you now, one moment please.."));
    REQUIRE(contains(twiml, "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"));
    REQUIRE(contains(twiml, "<Say>Connecting you now, one moment please..</Say>"));
    REQUIRE(contains(twiml, "<Stream url=\"wss://host/media-stream\"/>"));
    REQUIRE(twiml.find("<Say>") < twiml.find("<Connect>"));

    const auto human = stream_twiml(std::string("human"), "wss://host/media-stream",
                                    std::nullopt);
    REQUIRE(contains(human, "<Connect>"));
    REQUIRE_FALSE(contains(human, "<Say>"));
}

TEST_CASE("TwiML text and attributes are escaped") {
    REQUIRE(xml_escape("a<b>&\"c'") == "a&lt;b&gt;&amp;&quot;c&apos;");
    const auto twiml = connect_stream_twiml("wss://host/media?x=1&y=2", std::string("Tom & Jerry"));
    REQUIRE(contains(twiml, "url=\"wss://host/media?x=1&amp;y=2\""));
    REQUIRE(contains(twiml, "<Say>Tom &amp; Jerry</Say>"));
}

TEST_CASE("health body reports pool depth and active calls") {
    ServiceStatus status;
    status.pool_available = 2;
    status.pool_in_use = 1;
    status.active_calls = 1;
    const auto body = RestServer::health_body(status, "2026-01-01T00:00:00Z");
    REQUIRE(body.at("status") == "healthy");
    REQUIRE(body.at("timestamp") == "2026-01-01T00:00:00Z");
    REQUIRE(body.at("pool").at("available") == 2);
    REQUIRE(body.at("pool").at("in_use") == 1);
    REQUIRE(body.at("active_calls") == 1);
}
