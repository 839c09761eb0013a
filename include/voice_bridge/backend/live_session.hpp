#pragma once

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <optional>
#include <string>

#include "voice_bridge/backend/live_protocol.hpp"

namespace voice_bridge {
namespace backend {

using CancelFlag = std::shared_ptr<std::atomic<bool>>;

class LiveSession;

// One subscription to backend responses. Yields audio chunks in arrival order
// until the turn completes, the session closes or the flag is cancelled.
class ResponseStream {
public:
    enum class End {
        None,
        TurnComplete,
        Closed,
        Canceled
    };

    ResponseStream(LiveSession& session, CancelFlag canceled, std::chrono::milliseconds poll);

    std::optional<AudioChunk> next();
    End end_reason() const;
    size_t chunks() const;

private:
    bool is_canceled() const;
    void absorb(ServerEvent event);

    LiveSession& session_;
    CancelFlag canceled_;
    std::chrono::milliseconds poll_;
    std::deque<AudioChunk> pending_;
    bool turn_done_ = false;
    End end_ = End::None;
    size_t chunks_ = 0;
};

class LiveSession {
public:
    enum class State {
        Disconnected,
        Connected,
        Closed
    };

    virtual ~LiveSession() = default;

    virtual bool connect(const std::string& system_prompt) = 0;
    virtual bool send_audio(const std::string& pcm16, int sample_rate) = 0;
    virtual void close() = 0;
    virtual State state() const = 0;

    bool connected() const { return state() == State::Connected; }

    // Call again after each TurnComplete to keep listening.
    ResponseStream receive_responses(CancelFlag canceled,
                                     std::chrono::milliseconds poll = std::chrono::milliseconds(50));

    void set_label(std::string label) { label_ = std::move(label); }
    const std::string& label() const { return label_; }

protected:
    friend class ResponseStream;

    // Waits up to `wait` for the next backend event.
    virtual std::optional<ServerEvent> next_event(std::chrono::milliseconds wait) = 0;

private:
    std::string label_;
};

const char* to_string(LiveSession::State state);
const char* to_string(ResponseStream::End end);

}
}
