#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace voice_bridge {
namespace telephony {

// One inbound media-stream connection from the telephony provider.
class MediaTransport {
public:
    virtual ~MediaTransport() = default;

    // Blocks until the next text frame arrives. Frames queued before the peer
    // closed are still delivered; nullopt means the stream has ended.
    virtual std::optional<std::string> receive_text() = 0;
    virtual bool send_text(const std::string& text) = 0;
    // Returns within `timeout` even if the peer never answers the close.
    virtual void close(std::chrono::milliseconds timeout) = 0;
    virtual std::string remote_endpoint() const = 0;
};

}
}
