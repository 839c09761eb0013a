#include <catch2/catch_test_macros.hpp>

#include "voice_bridge/backend/gemini_session.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

#include <boost/asio.hpp>

using voice_bridge::backend::GeminiLiveSession;
using voice_bridge::backend::GeminiOptions;
using voice_bridge::backend::LiveSession;
using voice_bridge::backend::ResponseStream;

namespace {

// Accepts TCP connections at the kernel level and never answers the TLS
// handshake, like a backend that hangs after the socket opens.
class SilentListener {
public:
    SilentListener()
        : acceptor_(io_, boost::asio::ip::tcp::endpoint(
                             boost::asio::ip::make_address("127.0.0.1"), 0)) {}

    unsigned short port() const { return acceptor_.local_endpoint().port(); }

private:
    boost::asio::io_context io_;
    boost::asio::ip::tcp::acceptor acceptor_;
};

GeminiOptions options_for(unsigned short port) {
    GeminiOptions options;
    options.ws_url = "wss://127.0.0.1:" + std::to_string(port) + "/ws";
    options.api_key = "test-key";
    options.setup.model = "models/test";
    options.connect_timeout = std::chrono::milliseconds(200);
    options.close_timeout = std::chrono::milliseconds(200);
    return options;
}

}

TEST_CASE("a session that was never connected closes immediately") {
    GeminiLiveSession session(options_for(1));
    const auto started = std::chrono::steady_clock::now();
    session.close();
    REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::milliseconds(500));
    REQUIRE(session.state() == LiveSession::State::Closed);
    REQUIRE_FALSE(session.send_audio(std::string(640, '\0'), 16000));
}

TEST_CASE("connect to an unresponsive backend gives up within the configured bounds") {
    SilentListener listener;
    GeminiLiveSession session(options_for(listener.port()));
    session.set_label("backend-test");

    const auto started = std::chrono::steady_clock::now();
    REQUIRE_FALSE(session.connect("You are a test assistant."));
    const auto elapsed = std::chrono::steady_clock::now() - started;

    // Connect timeout plus close timeout, well short of the transport's own
    // five second handshake timer.
    REQUIRE(elapsed >= std::chrono::milliseconds(200));
    REQUIRE(elapsed < std::chrono::seconds(3));
    REQUIRE_FALSE(session.connected());
}

TEST_CASE("a finished transport loop leaves the session closed") {
    SilentListener listener;
    GeminiLiveSession session(options_for(listener.port()));
    REQUIRE_FALSE(session.connect("You are a test assistant."));
    REQUIRE(session.state() == LiveSession::State::Closed);
    REQUIRE_FALSE(session.connect("You are a test assistant."));

    auto canceled = std::make_shared<std::atomic<bool>>(false);
    auto stream = session.receive_responses(canceled, std::chrono::milliseconds(20));
    const auto started = std::chrono::steady_clock::now();
    REQUIRE_FALSE(stream.next());
    REQUIRE(stream.end_reason() == ResponseStream::End::Closed);
    REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds(1));

    const auto close_started = std::chrono::steady_clock::now();
    session.close();
    REQUIRE(std::chrono::steady_clock::now() - close_started < std::chrono::milliseconds(500));
}
