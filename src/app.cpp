#include "voice_bridge/app.hpp"

#include <chrono>
#include <csignal>
#include <thread>
#include <utility>

#include "voice_bridge/backend/gemini_session.hpp"
#include "voice_bridge/bridge/call_session.hpp"
#include "voice_bridge/logging.hpp"

namespace voice_bridge {

namespace {

std::atomic<bool> g_signal_received{false};

void handle_signal(int) {
    g_signal_received = true;
}

std::chrono::milliseconds seconds_to_ms(double seconds) {
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

}

BridgeApp::BridgeApp(Config config)
    : config_(std::move(config)) {}

BridgeApp::~BridgeApp() {
    stop();
}

void BridgeApp::install_signal_handlers() {
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
}

void BridgeApp::init() {
    backend::PoolOptions pool_options;
    pool_options.target_size = static_cast<size_t>(config_.pool_size);
    pool_options.maintenance_interval = std::chrono::seconds(config_.pool_maintenance_interval_sec);
    pool_options.creation_delay = std::chrono::milliseconds(config_.pool_creation_delay_ms);
    pool_options.max_idle = std::chrono::seconds(config_.pool_max_idle_sec);
    pool_options.system_prompt = config_.system_prompt;
    pool_ = std::make_unique<backend::ConnectionPool>(
        [this]() { return create_backend_session(); }, pool_options);
    pool_->start();

    telephony::MediaServerOptions media_options;
    media_options.port = config_.media_stream_port;
    media_options.path = config_.media_stream_path;
    media_options.close_timeout = seconds_to_ms(config_.transport_close_timeout);
    media_server_ = std::make_unique<telephony::MediaStreamServer>(
        media_options,
        [this](std::shared_ptr<telephony::MediaTransport> transport) {
            handle_call(std::move(transport));
        });
    media_server_->start();

    rest_server_ = std::make_unique<server::RestServer>(config_, [this]() { return status(); });
    rest_server_->start();

    logging::info(
        "Voice bridge ready",
        {kv("media_stream_url", config_.media_stream_url),
         kv("pool_available", pool_->available())});
}

void BridgeApp::run() {
    while (!quitting_ && !g_signal_received) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    if (g_signal_received) {
        logging::info("Shutdown signal received");
    }
}

void BridgeApp::stop() {
    quitting_ = true;
    if (stopped_.exchange(true)) {
        return;
    }
    if (rest_server_) {
        rest_server_->stop();
    }
    if (media_server_) {
        media_server_->stop();
    }
    if (pool_) {
        pool_->stop();
    }
    logging::info("Voice bridge stopped");
}

const Config& BridgeApp::config() const {
    return config_;
}

std::shared_ptr<backend::LiveSession> BridgeApp::create_backend_session() const {
    backend::GeminiOptions options;
    options.ws_url = config_.backend_ws_url;
    options.api_key = config_.gemini_api_key;
    options.setup.model = config_.gemini_model;
    options.setup.voice = config_.backend_voice;
    options.setup.transcriptions = config_.backend_transcriptions;
    options.setup.vad.start_sensitivity = config_.vad_start_sensitivity;
    options.setup.vad.end_sensitivity = config_.vad_end_sensitivity;
    options.setup.vad.prefix_padding_ms = config_.vad_prefix_padding_ms;
    options.setup.vad.silence_duration_ms = config_.vad_silence_duration_ms;
    options.connect_timeout = seconds_to_ms(config_.backend_connect_timeout);
    options.close_timeout = seconds_to_ms(config_.backend_close_timeout);
    return std::make_shared<backend::GeminiLiveSession>(std::move(options));
}

void BridgeApp::handle_call(std::shared_ptr<telephony::MediaTransport> transport) {
    bridge::BridgeOptions options;
    options.turn_gap = std::chrono::milliseconds(config_.turn_gap_ms);
    options.transport_close_timeout = seconds_to_ms(config_.transport_close_timeout);
    bridge::CallBridge call(std::move(transport), *pool_, options);
    call.run();
}

server::ServiceStatus BridgeApp::status() const {
    server::ServiceStatus status;
    if (pool_) {
        status.pool_available = pool_->available();
        status.pool_in_use = pool_->in_use();
    }
    if (media_server_) {
        status.active_calls = media_server_->active_calls();
    }
    return status;
}

}
