#include "voice_bridge/telephony/messages.hpp"

#include <nlohmann/json.hpp>
#include <websocketpp/base64/base64.hpp>

#include "voice_bridge/audio/frame.hpp"

namespace voice_bridge::telephony {

namespace {

EventType event_type(const std::string& event) {
    if (event == "connected") {
        return EventType::Connected;
    }
    if (event == "start") {
        return EventType::Start;
    }
    if (event == "media") {
        return EventType::Media;
    }
    if (event == "stop") {
        return EventType::Stop;
    }
    if (event == "mark") {
        return EventType::Mark;
    }
    if (event == "dtmf") {
        return EventType::Dtmf;
    }
    return EventType::Unknown;
}

// Sequence numbers, chunks and timestamps arrive as strings but are
// tolerated as numbers too.
std::string scalar_string(const nlohmann::json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return {};
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    if (it->is_number_integer()) {
        return std::to_string(it->get<long long>());
    }
    return it->dump();
}

int scalar_int(const nlohmann::json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end()) {
        return 0;
    }
    if (it->is_number_integer()) {
        return it->get<int>();
    }
    if (it->is_string()) {
        try {
            return std::stoi(it->get<std::string>());
        } catch (const std::exception&) {
            throw ProtocolError(std::string("field '") + key + "' is not an integer");
        }
    }
    throw ProtocolError(std::string("field '") + key + "' is not an integer");
}

const nlohmann::json& require_object(const nlohmann::json& message, const char* key) {
    auto it = message.find(key);
    if (it == message.end() || !it->is_object()) {
        throw ProtocolError(std::string("message is missing '") + key + "' object");
    }
    return *it;
}

StreamStart parse_start(const nlohmann::json& body) {
    StreamStart start;
    start.stream_sid = scalar_string(body, "streamSid");
    start.account_sid = scalar_string(body, "accountSid");
    start.call_sid = scalar_string(body, "callSid");
    if (start.call_sid.empty()) {
        throw ProtocolError("start message is missing callSid");
    }
    if (auto tracks = body.find("tracks"); tracks != body.end() && tracks->is_array()) {
        for (const auto& track : *tracks) {
            if (track.is_string()) {
                start.tracks.push_back(track.get<std::string>());
            }
        }
    }
    const auto& format = require_object(body, "mediaFormat");
    start.media_format.encoding = scalar_string(format, "encoding");
    start.media_format.sample_rate = scalar_int(format, "sampleRate");
    start.media_format.channels = scalar_int(format, "channels");
    if (auto params = body.find("customParameters");
        params != body.end() && params->is_object()) {
        for (const auto& item : params->items()) {
            start.custom_parameters[item.key()] =
                item.value().is_string() ? item.value().get<std::string>() : item.value().dump();
        }
    }
    return start;
}

MediaPayload parse_media(const nlohmann::json& body) {
    MediaPayload media;
    media.track = scalar_string(body, "track");
    media.chunk = scalar_string(body, "chunk");
    media.timestamp = scalar_string(body, "timestamp");
    auto payload = body.find("payload");
    if (payload == body.end() || !payload->is_string()) {
        throw ProtocolError("media message is missing payload");
    }
    media.audio = websocketpp::base64_decode(payload->get<std::string>());
    return media;
}

}

InboundMessage parse_inbound_message(const std::string& text) {
    nlohmann::json message;
    try {
        message = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& ex) {
        throw ProtocolError(std::string("invalid JSON: ") + ex.what());
    }
    if (!message.is_object()) {
        throw ProtocolError("message is not a JSON object");
    }
    auto event = message.find("event");
    if (event == message.end() || !event->is_string()) {
        throw ProtocolError("message has no event field");
    }

    InboundMessage inbound;
    inbound.event = event->get<std::string>();
    inbound.type = event_type(inbound.event);
    inbound.stream_sid = scalar_string(message, "streamSid");
    inbound.sequence_number = scalar_string(message, "sequenceNumber");

    switch (inbound.type) {
        case EventType::Connected:
            inbound.protocol = scalar_string(message, "protocol");
            inbound.version = scalar_string(message, "version");
            break;
        case EventType::Start:
            inbound.start = parse_start(require_object(message, "start"));
            if (inbound.start->stream_sid.empty()) {
                inbound.start->stream_sid = inbound.stream_sid;
            }
            if (inbound.start->stream_sid.empty()) {
                throw ProtocolError("start message is missing streamSid");
            }
            inbound.stream_sid = inbound.start->stream_sid;
            break;
        case EventType::Media:
            inbound.media = parse_media(require_object(message, "media"));
            break;
        case EventType::Mark:
            if (auto mark = message.find("mark"); mark != message.end() && mark->is_object()) {
                inbound.mark_name = scalar_string(*mark, "name");
            }
            break;
        case EventType::Dtmf:
            if (auto dtmf = message.find("dtmf"); dtmf != message.end() && dtmf->is_object()) {
                inbound.dtmf_digit = scalar_string(*dtmf, "digit");
            }
            break;
        case EventType::Stop:
        case EventType::Unknown:
            break;
    }
    return inbound;
}

std::string make_media_message(const std::string& stream_sid, const std::string& mulaw) {
    nlohmann::json message{
        {"event", "media"},
        {"streamSid", stream_sid},
        {"media", {{"payload", websocketpp::base64_encode(mulaw)}}}};
    return message.dump();
}

bool is_supported_format(const MediaFormat& format) {
    return format.encoding == "audio/x-mulaw" &&
           format.sample_rate == audio::kTelephonySampleRate &&
           format.channels == 1;
}

const char* to_string(EventType type) {
    switch (type) {
        case EventType::Connected:
            return "connected";
        case EventType::Start:
            return "start";
        case EventType::Media:
            return "media";
        case EventType::Stop:
            return "stop";
        case EventType::Mark:
            return "mark";
        case EventType::Dtmf:
            return "dtmf";
        case EventType::Unknown:
            return "unknown";
    }
    return "unknown";
}

}
