#include <catch2/catch_test_macros.hpp>

#include "voice_bridge/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

// Sets environment variables for one test and restores them afterwards.
class ScopedEnv {
public:
    ~ScopedEnv() {
        for (const auto& item : saved_) {
            if (item.second) {
                setenv(item.first.c_str(), item.second->c_str(), 1);
            } else {
                unsetenv(item.first.c_str());
            }
        }
    }

    void set(const std::string& key, const std::string& value) {
        remember(key);
        setenv(key.c_str(), value.c_str(), 1);
    }

    void unset(const std::string& key) {
        remember(key);
        unsetenv(key.c_str());
    }

private:
    void remember(const std::string& key) {
        if (saved_.count(key)) {
            return;
        }
        const char* value = std::getenv(key.c_str());
        saved_[key] = value ? std::optional<std::string>(value) : std::nullopt;
    }

    std::map<std::string, std::optional<std::string>> saved_;
};

std::filesystem::path write_prompt(const std::string& name, const std::string& content) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream stream(path);
    stream << content;
    return path;
}

void set_required(ScopedEnv& env, const std::filesystem::path& prompt) {
    env.set("SERVER_BASE_URL", "https://bridge.example.com");
    env.set("GEMINI_API_KEY", "test-key");
    env.set("GEMINI_MODEL", "gemini-live-test");
    env.set("SYSTEM_PROMPT_FILE", prompt.string());
    for (const char* key : {"REST_API_PORT", "MEDIA_STREAM_PORT", "MEDIA_STREAM_PATH",
                            "MEDIA_STREAM_URL", "CONNECT_GREETING", "BACKEND_WS_URL",
                            "POOL_SIZE", "LOG_FILENAME", "BACKEND_VOICE"}) {
        env.unset(key);
    }
}

}

TEST_CASE("derive_media_stream_url switches to websocket schemes") {
    REQUIRE(voice_bridge::derive_media_stream_url("https://bridge.example.com/", "/media-stream") ==
            "wss://bridge.example.com/media-stream");
    REQUIRE(voice_bridge::derive_media_stream_url("http://localhost:8081", "ws") ==
            "ws://localhost:8081/ws");
}

TEST_CASE("load_system_prompt trims and rejects missing or empty files") {
    const auto prompt = write_prompt("voice_bridge_prompt_ok.txt", "\n  Be helpful.  \n");
    REQUIRE(voice_bridge::load_system_prompt(prompt) == "Be helpful.");

    const auto empty = write_prompt("voice_bridge_prompt_empty.txt", "   \n");
    REQUIRE_THROWS_AS(voice_bridge::load_system_prompt(empty), std::runtime_error);
    REQUIRE_THROWS_AS(voice_bridge::load_system_prompt("/nonexistent/voice_bridge_prompt.txt"),
                      std::runtime_error);
}

TEST_CASE("Config::load applies defaults and validates") {
    ScopedEnv env;
    const auto prompt = write_prompt("voice_bridge_prompt_cfg.txt", "You answer phones.");
    set_required(env, prompt);

    const auto config = voice_bridge::Config::load();
    REQUIRE_NOTHROW(config.validate());
    REQUIRE(config.rest_api_port == 8080);
    REQUIRE(config.media_stream_port == 8081);
    REQUIRE(config.media_stream_url == "wss://bridge.example.com/media-stream");
    REQUIRE(config.system_prompt == "You answer phones.");
    REQUIRE(config.pool_size == 2);
    REQUIRE(config.pool_maintenance_interval_sec == 30);
    REQUIRE(config.turn_gap_ms == 50);
    REQUIRE(config.vad_start_sensitivity == "START_SENSITIVITY_HIGH");
    REQUIRE(config.backend_ws_url.rfind("wss://", 0) == 0);
    REQUIRE(config.connect_greeting == std::string("Connecting you now, one moment please.."));
    REQUIRE_FALSE(config.backend_voice.has_value());
    REQUIRE_FALSE(config.log_filename.has_value());
}

TEST_CASE("Config::load honours overrides") {
    ScopedEnv env;
    const auto prompt = write_prompt("voice_bridge_prompt_override.txt", "Prompt");
    set_required(env, prompt);
    env.set("CONNECT_GREETING", "");
    env.set("POOL_SIZE", "5");
    env.set("MEDIA_STREAM_URL", "wss://proxy.example.com/stream");
    env.set("BACKEND_VOICE", "Puck");

    const auto config = voice_bridge::Config::load();
    REQUIRE_FALSE(config.connect_greeting.has_value());
    REQUIRE(config.pool_size == 5);
    REQUIRE(config.media_stream_url == "wss://proxy.example.com/stream");
    REQUIRE(config.backend_voice == std::string("Puck"));
}

TEST_CASE("Config::load rejects missing keys and bad numbers") {
    ScopedEnv env;
    const auto prompt = write_prompt("voice_bridge_prompt_missing.txt", "Prompt");
    set_required(env, prompt);

    env.unset("GEMINI_API_KEY");
    REQUIRE_THROWS_AS(voice_bridge::Config::load(), std::runtime_error);

    env.set("GEMINI_API_KEY", "test-key");
    env.set("POOL_SIZE", "many");
    REQUIRE_THROWS_AS(voice_bridge::Config::load(), std::runtime_error);
}

TEST_CASE("Config::validate rejects unsafe settings") {
    voice_bridge::Config config;
    config.server_base_url = "https://bridge.example.com";
    config.gemini_api_key = "key";
    config.gemini_model = "model";
    config.backend_ws_url = "wss://backend.example.com/ws";
    config.system_prompt = "prompt";
    REQUIRE_NOTHROW(config.validate());

    auto insecure = config;
    insecure.backend_ws_url = "ws://backend.example.com/ws";
    REQUIRE_THROWS_AS(insecure.validate(), std::runtime_error);

    auto same_ports = config;
    same_ports.media_stream_port = same_ports.rest_api_port;
    REQUIRE_THROWS_AS(same_ports.validate(), std::runtime_error);

    auto negative_pool = config;
    negative_pool.pool_size = -1;
    REQUIRE_THROWS_AS(negative_pool.validate(), std::runtime_error);

    auto zero_timeout = config;
    zero_timeout.backend_close_timeout = 0.0;
    REQUIRE_THROWS_AS(zero_timeout.validate(), std::runtime_error);
}
