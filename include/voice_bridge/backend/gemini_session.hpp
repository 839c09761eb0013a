#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "voice_bridge/backend/live_session.hpp"

namespace voice_bridge {
namespace backend {

struct GeminiOptions {
    std::string ws_url;
    std::string api_key;
    LiveSetup setup;
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds close_timeout{5000};
};

class GeminiLiveSession : public LiveSession {
public:
    explicit GeminiLiveSession(GeminiOptions options);
    ~GeminiLiveSession() override;

    bool connect(const std::string& system_prompt) override;
    bool send_audio(const std::string& pcm16, int sample_rate) override;
    void close() override;
    State state() const override;

protected:
    std::optional<ServerEvent> next_event(std::chrono::milliseconds wait) override;

private:
    struct WsState;

    void run_loop();
    void handle_payload(const std::string& payload);
    void handle_remote_close(const std::string& reason);
    bool send_json(const nlohmann::json& payload);
    void shutdown_transport();
    std::string make_ws_url() const;

    static constexpr size_t kMaxQueuedEvents = 512;

    GeminiOptions options_;
    std::atomic<State> state_{State::Disconnected};

    std::mutex close_mutex_;
    std::mutex ws_mutex_;
    std::unique_ptr<WsState> ws_state_;
    std::thread worker_;

    mutable std::mutex events_mutex_;
    std::condition_variable events_cv_;
    std::deque<ServerEvent> events_;
    bool opened_ = false;
    bool setup_complete_ = false;
    bool transport_down_ = false;
    bool run_finished_ = false;
};

}
}
