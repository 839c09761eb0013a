#pragma once

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace voice_bridge {
namespace telephony {

class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class EventType {
    Connected,
    Start,
    Media,
    Stop,
    Mark,
    Dtmf,
    Unknown
};

struct MediaFormat {
    std::string encoding;
    int sample_rate = 0;
    int channels = 0;
};

struct StreamStart {
    std::string stream_sid;
    std::string account_sid;
    std::string call_sid;
    std::vector<std::string> tracks;
    MediaFormat media_format;
    std::map<std::string, std::string> custom_parameters;
};

struct MediaPayload {
    std::string track;
    std::string chunk;
    std::string timestamp;
    // Companded audio, already base64-decoded.
    std::string audio;
};

struct InboundMessage {
    EventType type = EventType::Unknown;
    std::string event;
    std::string stream_sid;
    std::string sequence_number;

    // connected
    std::string protocol;
    std::string version;

    std::optional<StreamStart> start;
    std::optional<MediaPayload> media;
    std::string mark_name;
    std::string dtmf_digit;
};

InboundMessage parse_inbound_message(const std::string& text);

std::string make_media_message(const std::string& stream_sid, const std::string& mulaw);

bool is_supported_format(const MediaFormat& format);

const char* to_string(EventType type);

}
}
