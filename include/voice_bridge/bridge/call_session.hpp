#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include "voice_bridge/audio/codec.hpp"
#include "voice_bridge/backend/connection_pool.hpp"
#include "voice_bridge/telephony/messages.hpp"
#include "voice_bridge/telephony/transport.hpp"

namespace voice_bridge {
namespace bridge {

// Phases only move forward.
enum class CallPhase {
    AwaitingHandshake,
    AwaitingStreamStart,
    Bridging,
    Draining,
    Closed
};

const char* to_string(CallPhase phase);

struct BridgeOptions {
    std::chrono::milliseconds turn_gap{50};
    std::chrono::milliseconds transport_close_timeout{5000};
    std::chrono::milliseconds response_poll{50};
    uint64_t summary_every = 50;
};

struct CallStats {
    uint64_t inbound_frames = 0;
    uint64_t inbound_bytes = 0;
    uint64_t backend_chunks = 0;
    uint64_t outbound_bytes = 0;
    uint64_t send_failures = 0;
    uint64_t skipped_frames = 0;
    uint64_t interruptions = 0;
};

// Owns one call: reads the telephony media stream, relays caller audio to a
// backend session and backend audio back to the caller until the stream ends.
class CallBridge {
public:
    CallBridge(std::shared_ptr<telephony::MediaTransport> transport,
               backend::ConnectionPool& pool,
               BridgeOptions options = {});
    ~CallBridge();

    CallBridge(const CallBridge&) = delete;
    CallBridge& operator=(const CallBridge&) = delete;

    // Runs the whole call on the calling thread and returns once it is Closed.
    void run();

    CallPhase phase() const;
    bool backend_speaking() const;
    const std::string& call_sid() const;
    const std::string& stream_sid() const;
    const std::string& outcome() const;
    CallStats stats() const;

private:
    struct Counters {
        std::atomic<uint64_t> inbound_frames{0};
        std::atomic<uint64_t> inbound_bytes{0};
        std::atomic<uint64_t> backend_chunks{0};
        std::atomic<uint64_t> outbound_bytes{0};
        std::atomic<uint64_t> send_failures{0};
        std::atomic<uint64_t> skipped_frames{0};
        std::atomic<uint64_t> interruptions{0};
    };

    bool await_handshake();
    bool await_stream_start();
    bool open_backend();
    void relay_telephony();
    void relay_backend(backend::CancelFlag canceled);
    void handle_media(const telephony::MediaPayload& media);
    void forward_to_telephony(const backend::AudioChunk& chunk);
    void stop_backend_relay();
    void release_backend();
    void cleanup();
    void set_phase(CallPhase next);
    void log_summary(const char* message) const;

    std::shared_ptr<telephony::MediaTransport> transport_;
    backend::ConnectionPool& pool_;
    BridgeOptions options_;

    std::atomic<CallPhase> phase_{CallPhase::AwaitingHandshake};
    std::atomic<bool> backend_speaking_{false};
    std::string call_sid_;
    std::string stream_sid_;
    std::string outcome_ = "aborted";

    std::shared_ptr<backend::LiveSession> session_;
    // Each is touched only by its own relay direction.
    std::unique_ptr<audio::Resampler> inbound_resampler_;
    std::unique_ptr<audio::Resampler> outbound_resampler_;
    backend::CancelFlag cancel_;
    std::thread backend_relay_;
    Counters counters_;
};

}
}
