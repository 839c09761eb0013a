#include <catch2/catch_test_macros.hpp>

#include "voice_bridge/utils/http.hpp"

#include <string>

TEST_CASE("url_encode escapes reserved characters") {
    const std::string input = "hello world!";
    const std::string expected = "hello%20world%21";
    REQUIRE(voice_bridge::utils::url_encode(input) == expected);
}

TEST_CASE("to_ws_url maps http schemes to websocket schemes") {
    REQUIRE(voice_bridge::utils::to_ws_url("https://example.com") == "wss://example.com");
    REQUIRE(voice_bridge::utils::to_ws_url("http://localhost:8080") == "ws://localhost:8080");
    REQUIRE(voice_bridge::utils::to_ws_url("wss://already") == "wss://already");
    REQUIRE(voice_bridge::utils::to_ws_url("bare.host") == "ws://bare.host");
}

TEST_CASE("append_query picks the right separator") {
    REQUIRE(voice_bridge::utils::append_query("wss://h/p", "key", "a b") ==
            "wss://h/p?key=a%20b");
    REQUIRE(voice_bridge::utils::append_query("wss://h/p?alt=1", "key", "k") ==
            "wss://h/p?alt=1&key=k");
}

TEST_CASE("path_of strips queries and trailing slashes") {
    REQUIRE(voice_bridge::utils::path_of("/media-stream?token=1") == "/media-stream");
    REQUIRE(voice_bridge::utils::path_of("/media-stream/") == "/media-stream");
    REQUIRE(voice_bridge::utils::path_of("") == "/");
    REQUIRE(voice_bridge::utils::path_of("/") == "/");
}
