#include "voice_bridge/backend/live_session.hpp"

#include <utility>

#include "voice_bridge/logging.hpp"

namespace voice_bridge::backend {

ResponseStream::ResponseStream(LiveSession& session,
                               CancelFlag canceled,
                               std::chrono::milliseconds poll)
    : session_(session),
      canceled_(std::move(canceled)),
      poll_(poll) {}

std::optional<AudioChunk> ResponseStream::next() {
    while (true) {
        if (is_canceled()) {
            end_ = End::Canceled;
            pending_.clear();
            return std::nullopt;
        }
        if (!pending_.empty()) {
            auto chunk = std::move(pending_.front());
            pending_.pop_front();
            ++chunks_;
            return chunk;
        }
        if (end_ != End::None) {
            return std::nullopt;
        }
        if (turn_done_) {
            end_ = End::TurnComplete;
            return std::nullopt;
        }
        auto event = session_.next_event(poll_);
        if (!event) {
            if (!session_.connected()) {
                end_ = End::Closed;
            }
            continue;
        }
        absorb(std::move(*event));
    }
}

ResponseStream::End ResponseStream::end_reason() const {
    return end_;
}

size_t ResponseStream::chunks() const {
    return chunks_;
}

bool ResponseStream::is_canceled() const {
    return canceled_ && canceled_->load();
}

void ResponseStream::absorb(ServerEvent event) {
    if (event.interrupted) {
        logging::info(
            "Backend response interrupted by caller",
            {kv("session", session_.label())});
        return;
    }
    if (event.input_transcription) {
        logging::info(
            "Caller said",
            {kv("text", *event.input_transcription),
             kv("session", session_.label())});
    }
    if (event.output_transcription) {
        logging::info(
            "Backend said",
            {kv("text", *event.output_transcription),
             kv("session", session_.label())});
    }
    for (const auto& text : event.text) {
        logging::info(
            "Backend text part",
            {kv("text", text),
             kv("session", session_.label())});
    }
    if (event.go_away) {
        logging::warn(
            "Backend announced session shutdown",
            {kv("session", session_.label())});
    }
    for (auto& chunk : event.audio) {
        logging::trace(
            "Backend audio chunk",
            {kv("bytes", chunk.pcm.size()),
             kv("rate", chunk.sample_rate),
             kv("session", session_.label())});
        pending_.push_back(std::move(chunk));
    }
    if (event.turn_complete) {
        logging::debug(
            "Backend turn complete",
            {kv("session", session_.label())});
        turn_done_ = true;
    }
}

ResponseStream LiveSession::receive_responses(CancelFlag canceled,
                                              std::chrono::milliseconds poll) {
    return ResponseStream(*this, std::move(canceled), poll);
}

const char* to_string(LiveSession::State state) {
    switch (state) {
        case LiveSession::State::Disconnected:
            return "disconnected";
        case LiveSession::State::Connected:
            return "connected";
        case LiveSession::State::Closed:
            return "closed";
    }
    return "unknown";
}

const char* to_string(ResponseStream::End end) {
    switch (end) {
        case ResponseStream::End::None:
            return "none";
        case ResponseStream::End::TurnComplete:
            return "turn_complete";
        case ResponseStream::End::Closed:
            return "closed";
        case ResponseStream::End::Canceled:
            return "canceled";
    }
    return "unknown";
}

}
