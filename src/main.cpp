#include "voice_bridge/app.hpp"
#include "voice_bridge/config.hpp"
#include "voice_bridge/logging.hpp"

#include <string>

int main() {
    try {
        const auto config = voice_bridge::Config::load();
        config.validate();
        voice_bridge::logging::init(config);
        voice_bridge::info(
            "Starting voice-bridge",
            {voice_bridge::kv("model", config.gemini_model),
             voice_bridge::kv("rest_port", config.rest_api_port),
             voice_bridge::kv("media_port", config.media_stream_port),
             voice_bridge::kv("pool_size", config.pool_size)});
        voice_bridge::BridgeApp::install_signal_handlers();
        voice_bridge::BridgeApp app(config);
        app.init();
        app.run();
        app.stop();
    } catch (const std::exception& ex) {
        voice_bridge::error(
            "Startup failed",
            {voice_bridge::kv("error", ex.what())});
        return 1;
    }
    return 0;
}
