#include "voice_bridge/bridge/call_session.hpp"

#include <functional>
#include <utility>
#include <vector>

#include "voice_bridge/audio/codec.hpp"
#include "voice_bridge/audio/frame.hpp"
#include "voice_bridge/logging.hpp"
#include "voice_bridge/metrics.hpp"

namespace voice_bridge::bridge {

CallBridge::CallBridge(std::shared_ptr<telephony::MediaTransport> transport,
                       backend::ConnectionPool& pool,
                       BridgeOptions options)
    : transport_(std::move(transport)),
      pool_(pool),
      options_(options),
      cancel_(std::make_shared<std::atomic<bool>>(false)) {}

CallBridge::~CallBridge() {
    stop_backend_relay();
}

void CallBridge::run() {
    logging::info(
        "Media stream handler started",
        {kv("remote", transport_->remote_endpoint())});
    try {
        if (await_handshake() && await_stream_start() && open_backend()) {
            set_phase(CallPhase::Bridging);
            backend_relay_ = std::thread([this, canceled = cancel_]() { relay_backend(canceled); });
            relay_telephony();
            set_phase(CallPhase::Draining);
            stop_backend_relay();
            outcome_ = "completed";
        }
    } catch (const std::exception& ex) {
        logging::error(
            "Call bridge failed",
            {kv("error", ex.what()),
             kv("call_sid", call_sid_),
             kv("stream_sid", stream_sid_)});
        outcome_ = "error";
    }
    cleanup();
}

CallPhase CallBridge::phase() const {
    return phase_;
}

bool CallBridge::backend_speaking() const {
    return backend_speaking_;
}

const std::string& CallBridge::call_sid() const {
    return call_sid_;
}

const std::string& CallBridge::stream_sid() const {
    return stream_sid_;
}

const std::string& CallBridge::outcome() const {
    return outcome_;
}

CallStats CallBridge::stats() const {
    CallStats stats;
    stats.inbound_frames = counters_.inbound_frames;
    stats.inbound_bytes = counters_.inbound_bytes;
    stats.backend_chunks = counters_.backend_chunks;
    stats.outbound_bytes = counters_.outbound_bytes;
    stats.send_failures = counters_.send_failures;
    stats.skipped_frames = counters_.skipped_frames;
    stats.interruptions = counters_.interruptions;
    return stats;
}

bool CallBridge::await_handshake() {
    auto text = transport_->receive_text();
    if (!text) {
        logging::warn(
            "Media stream closed before handshake",
            {kv("remote", transport_->remote_endpoint())});
        outcome_ = "hangup";
        return false;
    }
    telephony::InboundMessage message;
    try {
        message = telephony::parse_inbound_message(*text);
    } catch (const telephony::ProtocolError& ex) {
        logging::error(
            "Malformed handshake message",
            {kv("error", ex.what()),
             kv("remote", transport_->remote_endpoint())});
        outcome_ = "protocol_error";
        return false;
    }
    if (message.type != telephony::EventType::Connected) {
        logging::error(
            "Expected connected event",
            {kv("event", message.event),
             kv("remote", transport_->remote_endpoint())});
        outcome_ = "protocol_error";
        return false;
    }
    logging::info(
        "Connected event received",
        {kv("protocol", message.protocol),
         kv("version", message.version)});
    set_phase(CallPhase::AwaitingStreamStart);
    return true;
}

bool CallBridge::await_stream_start() {
    auto text = transport_->receive_text();
    if (!text) {
        logging::warn(
            "Media stream closed before start",
            {kv("remote", transport_->remote_endpoint())});
        outcome_ = "hangup";
        return false;
    }
    telephony::InboundMessage message;
    try {
        message = telephony::parse_inbound_message(*text);
    } catch (const telephony::ProtocolError& ex) {
        logging::error(
            "Malformed start message",
            {kv("error", ex.what()),
             kv("remote", transport_->remote_endpoint())});
        outcome_ = "protocol_error";
        return false;
    }
    if (message.type != telephony::EventType::Start || !message.start) {
        logging::error(
            "Expected start event",
            {kv("event", message.event),
             kv("remote", transport_->remote_endpoint())});
        outcome_ = "protocol_error";
        return false;
    }

    const auto& start = *message.start;
    call_sid_ = start.call_sid;
    stream_sid_ = start.stream_sid;
    if (!telephony::is_supported_format(start.media_format)) {
        logging::error(
            "Unsupported media format",
            {kv("encoding", start.media_format.encoding),
             kv("sample_rate", start.media_format.sample_rate),
             kv("channels", start.media_format.channels),
             kv("call_sid", call_sid_),
             kv("stream_sid", stream_sid_)});
        outcome_ = "protocol_error";
        return false;
    }
    logging::info(
        "Media stream started",
        {kv("call_sid", call_sid_),
         kv("stream_sid", stream_sid_),
         kv("account_sid", start.account_sid),
         kv("tracks", start.tracks.size())});
    for (const auto& param : start.custom_parameters) {
        logging::debug(
            "Custom stream parameter",
            {kv("name", param.first),
             kv("value", param.second),
             kv("call_sid", call_sid_)});
    }
    return true;
}

bool CallBridge::open_backend() {
    const auto started = std::chrono::steady_clock::now();
    session_ = pool_.acquire(call_sid_);
    if (!session_) {
        logging::error(
            "No backend session for call, closing stream",
            {kv("call_sid", call_sid_),
             kv("stream_sid", stream_sid_)});
        outcome_ = "backend_unavailable";
        return false;
    }
    const auto elapsed = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - started).count();
    logging::info(
        "Backend session ready",
        {kv("call_sid", call_sid_),
         kv("session", session_->label()),
         kv("elapsed_sec", elapsed)});
    return true;
}

void CallBridge::relay_telephony() {
    while (true) {
        auto text = transport_->receive_text();
        if (!text) {
            logging::info(
                "Media stream closed by telephony side",
                {kv("call_sid", call_sid_),
                 kv("stream_sid", stream_sid_)});
            return;
        }
        telephony::InboundMessage message;
        try {
            message = telephony::parse_inbound_message(*text);
        } catch (const telephony::ProtocolError& ex) {
            ++counters_.skipped_frames;
            logging::warn(
                "Skipping malformed media stream frame",
                {kv("error", ex.what()),
                 kv("call_sid", call_sid_)});
            continue;
        }
        switch (message.type) {
            case telephony::EventType::Media:
                handle_media(*message.media);
                break;
            case telephony::EventType::Stop:
                logging::info(
                    "Received stop, closing stream",
                    {kv("call_sid", call_sid_),
                     kv("stream_sid", stream_sid_)});
                return;
            case telephony::EventType::Mark:
                logging::debug(
                    "Mark event",
                    {kv("name", message.mark_name),
                     kv("call_sid", call_sid_)});
                break;
            case telephony::EventType::Dtmf:
                logging::info(
                    "DTMF event",
                    {kv("digit", message.dtmf_digit),
                     kv("call_sid", call_sid_)});
                break;
            default:
                logging::debug(
                    "Ignoring media stream event",
                    {kv("event", message.event),
                     kv("call_sid", call_sid_)});
                break;
        }
    }
}

void CallBridge::handle_media(const telephony::MediaPayload& media) {
    if (backend_speaking_.exchange(false)) {
        ++counters_.interruptions;
        logging::info(
            "Caller interrupted backend",
            {kv("call_sid", call_sid_)});
    }
    const auto frames = ++counters_.inbound_frames;
    counters_.inbound_bytes += media.audio.size();
    Metrics::instance().add_audio("inbound", 1, media.audio.size());

    std::string converted;
    try {
        if (!inbound_resampler_) {
            inbound_resampler_ = std::make_unique<audio::Resampler>(
                audio::kTelephonySampleRate, audio::kBackendInputSampleRate);
        }
        converted = audio::AudioFrame::from_mulaw(media.audio)
                        .resampled(*inbound_resampler_)
                        .bytes();
    } catch (const std::exception& ex) {
        ++counters_.skipped_frames;
        logging::warn(
            "Dropping caller audio that could not be converted",
            {kv("error", ex.what()),
             kv("call_sid", call_sid_)});
    }
    const audio::AudioFrame pcm(std::move(converted), audio::kBackendInputSampleRate);
    if (!pcm.empty()) {
        if (session_->send_audio(pcm.bytes(), pcm.sample_rate())) {
            logging::trace(
                "Forwarded caller audio",
                {kv("bytes", pcm.bytes().size()),
                 kv("call_sid", call_sid_)});
        } else {
            ++counters_.send_failures;
            Metrics::instance().increment_send_failure("backend");
            logging::debug(
                "Failed to send audio chunk to backend",
                {kv("call_sid", call_sid_)});
        }
    }
    if (options_.summary_every > 0 && frames % options_.summary_every == 0) {
        log_summary("Call audio progress");
    }
}

void CallBridge::relay_backend(backend::CancelFlag canceled) {
    logging::debug("Backend relay started", {kv("call_sid", call_sid_)});
    try {
        while (!canceled->load()) {
            auto stream = session_->receive_responses(canceled, options_.response_poll);
            while (auto chunk = stream.next()) {
                backend_speaking_ = true;
                ++counters_.backend_chunks;
                forward_to_telephony(*chunk);
            }
            backend_speaking_ = false;

            const auto end = stream.end_reason();
            if (end == backend::ResponseStream::End::Canceled) {
                break;
            }
            if (end == backend::ResponseStream::End::Closed) {
                logging::warn(
                    "Backend session closed during call",
                    {kv("call_sid", call_sid_),
                     kv("session", session_->label())});
                break;
            }
            logging::debug(
                "Backend turn finished",
                {kv("chunks", stream.chunks()),
                 kv("call_sid", call_sid_)});
            if (options_.turn_gap.count() > 0) {
                std::this_thread::sleep_for(options_.turn_gap);
            }
        }
    } catch (const std::exception& ex) {
        logging::error(
            "Backend relay failed",
            {kv("error", ex.what()),
             kv("call_sid", call_sid_)});
    }
    backend_speaking_ = false;
    logging::debug("Backend relay stopped", {kv("call_sid", call_sid_)});
}

void CallBridge::forward_to_telephony(const backend::AudioChunk& chunk) {
    if (chunk.pcm.empty() || chunk.sample_rate <= 0) {
        return;
    }
    std::string mulaw;
    try {
        if (!outbound_resampler_ || outbound_resampler_->from_rate() != chunk.sample_rate) {
            outbound_resampler_ = std::make_unique<audio::Resampler>(
                chunk.sample_rate, audio::kTelephonySampleRate);
        }
        mulaw = audio::AudioFrame(chunk.pcm, chunk.sample_rate)
                    .resampled(*outbound_resampler_)
                    .to_mulaw();
    } catch (const std::exception& ex) {
        logging::warn(
            "Dropping backend audio that could not be converted",
            {kv("error", ex.what()),
             kv("rate", chunk.sample_rate),
             kv("call_sid", call_sid_)});
        return;
    }
    if (mulaw.empty()) {
        return;
    }
    if (!transport_->send_text(telephony::make_media_message(stream_sid_, mulaw))) {
        ++counters_.send_failures;
        Metrics::instance().increment_send_failure("telephony");
        logging::debug(
            "Failed to send audio to telephony",
            {kv("call_sid", call_sid_)});
        return;
    }
    counters_.outbound_bytes += mulaw.size();
    Metrics::instance().add_audio("outbound", 1, mulaw.size());
}

void CallBridge::stop_backend_relay() {
    cancel_->store(true);
    if (backend_relay_.joinable()) {
        backend_relay_.join();
    }
}

void CallBridge::release_backend() {
    if (!session_) {
        return;
    }
    session_.reset();
    pool_.release(call_sid_);
}

void CallBridge::cleanup() {
    const std::vector<std::pair<const char*, std::function<void()>>> steps{
        {"backend relay", [this]() { stop_backend_relay(); }},
        {"backend session", [this]() { release_backend(); }},
        {"media transport", [this]() { transport_->close(options_.transport_close_timeout); }},
    };
    for (const auto& step : steps) {
        try {
            step.second();
        } catch (const std::exception& ex) {
            logging::error(
                "Cleanup step failed",
                {kv("step", step.first),
                 kv("error", ex.what()),
                 kv("call_sid", call_sid_)});
        }
    }
    set_phase(CallPhase::Closed);
    Metrics::instance().increment_call(outcome_);
    log_summary("Call finished");
}

void CallBridge::set_phase(CallPhase next) {
    const auto current = phase_.load();
    if (static_cast<int>(next) <= static_cast<int>(current)) {
        logging::warn(
            "Ignoring backwards phase transition",
            {kv("from", to_string(current)),
             kv("to", to_string(next)),
             kv("call_sid", call_sid_)});
        return;
    }
    phase_ = next;
    logging::debug(
        "Call phase changed",
        {kv("from", to_string(current)),
         kv("to", to_string(next)),
         kv("call_sid", call_sid_)});
}

void CallBridge::log_summary(const char* message) const {
    logging::info(
        message,
        {kv("inbound_frames", counters_.inbound_frames.load()),
         kv("inbound_bytes", counters_.inbound_bytes.load()),
         kv("backend_chunks", counters_.backend_chunks.load()),
         kv("outbound_bytes", counters_.outbound_bytes.load()),
         kv("send_failures", counters_.send_failures.load()),
         kv("interruptions", counters_.interruptions.load()),
         kv("outcome", outcome_),
         kv("call_sid", call_sid_),
         kv("stream_sid", stream_sid_)});
}

const char* to_string(CallPhase phase) {
    switch (phase) {
        case CallPhase::AwaitingHandshake:
            return "awaiting_handshake";
        case CallPhase::AwaitingStreamStart:
            return "awaiting_stream_start";
        case CallPhase::Bridging:
            return "bridging";
        case CallPhase::Draining:
            return "draining";
        case CallPhase::Closed:
            return "closed";
    }
    return "unknown";
}

}
