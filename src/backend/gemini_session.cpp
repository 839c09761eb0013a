#include "voice_bridge/backend/gemini_session.hpp"

#include <utility>

#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_client.hpp>

#include "voice_bridge/logging.hpp"
#include "voice_bridge/metrics.hpp"
#include "voice_bridge/utils/http.hpp"

namespace voice_bridge::backend {

namespace {

using WsClient = websocketpp::client<websocketpp::config::asio_tls_client>;
using SslContext = websocketpp::lib::asio::ssl::context;

}

struct GeminiLiveSession::WsState {
    std::shared_ptr<WsClient> client;
    websocketpp::connection_hdl connection;
};


GeminiLiveSession::GeminiLiveSession(GeminiOptions options)
    : options_(std::move(options)) {}

GeminiLiveSession::~GeminiLiveSession() {
    close();
}

bool GeminiLiveSession::connect(const std::string& system_prompt) {
    if (state_ != State::Disconnected) {
        logging::warn(
            "Backend connect skipped",
            {kv("state", to_string(state_)),
             kv("session", label())});
        return state_ == State::Connected;
    }
    const auto started = std::chrono::steady_clock::now();
    const auto url = make_ws_url();
    const std::string host = websocketpp::uri(url).get_host();

    auto client = std::make_shared<WsClient>();
    client->clear_access_channels(websocketpp::log::alevel::all);
    client->clear_error_channels(websocketpp::log::elevel::all);

    websocketpp::lib::error_code ec;
    client->init_asio(ec);
    if (ec) {
        logging::error(
            "Backend transport init failed",
            {kv("error", ec.message()),
             kv("session", label())});
        return false;
    }

    client->set_tls_init_handler([host](websocketpp::connection_hdl) {
        auto context = websocketpp::lib::make_shared<SslContext>(SslContext::tlsv12_client);
        context->set_options(SslContext::default_workarounds | SslContext::no_sslv2 |
                             SslContext::no_sslv3 | SslContext::single_dh_use);
        context->set_default_verify_paths();
        context->set_verify_mode(websocketpp::lib::asio::ssl::verify_peer);
        context->set_verify_callback(websocketpp::lib::asio::ssl::rfc2818_verification(host));
        return context;
    });
    client->set_open_handler([this](websocketpp::connection_hdl) {
        std::lock_guard<std::mutex> lock(events_mutex_);
        opened_ = true;
        events_cv_.notify_all();
    });
    client->set_message_handler([this](websocketpp::connection_hdl,
                                       WsClient::message_ptr msg) {
        handle_payload(msg->get_payload());
    });
    WsClient* raw_client = client.get();
    client->set_close_handler([this, raw_client](websocketpp::connection_hdl hdl) {
        std::string reason = "closed";
        websocketpp::lib::error_code con_ec;
        auto con = raw_client->get_con_from_hdl(hdl, con_ec);
        if (!con_ec && con) {
            reason = std::to_string(con->get_remote_close_code()) + " " +
                     con->get_remote_close_reason();
        }
        handle_remote_close(reason);
    });
    client->set_fail_handler([this, raw_client](websocketpp::connection_hdl hdl) {
        std::string reason = "connection failed";
        websocketpp::lib::error_code con_ec;
        auto con = raw_client->get_con_from_hdl(hdl, con_ec);
        if (!con_ec && con) {
            reason = con->get_ec().message();
        }
        handle_remote_close(reason);
    });

    auto conn = client->get_connection(url, ec);
    if (ec) {
        logging::error(
            "Backend connection setup failed",
            {kv("error", ec.message()),
             kv("session", label())});
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(ws_mutex_);
        ws_state_ = std::make_unique<WsState>();
        ws_state_->client = client;
        ws_state_->connection = conn->get_handle();
    }
    client->connect(conn);
    worker_ = std::thread([this]() { run_loop(); });

    const auto deadline = started + options_.connect_timeout;
    bool opened = false;
    {
        std::unique_lock<std::mutex> lock(events_mutex_);
        events_cv_.wait_until(lock, deadline, [this]() { return opened_ || transport_down_; });
        opened = opened_ && !transport_down_;
    }
    if (!opened) {
        logging::error(
            "Backend connection did not open",
            {kv("timeout_ms", options_.connect_timeout.count()),
             kv("session", label())});
        shutdown_transport();
        return false;
    }

    if (!send_json(build_setup_message(options_.setup, system_prompt))) {
        logging::error("Backend setup could not be sent", {kv("session", label())});
        shutdown_transport();
        return false;
    }

    bool ready = false;
    {
        std::unique_lock<std::mutex> lock(events_mutex_);
        events_cv_.wait_until(lock, deadline,
                              [this]() { return setup_complete_ || transport_down_; });
        ready = setup_complete_ && !transport_down_;
    }
    if (!ready) {
        logging::error(
            "Backend setup was not acknowledged",
            {kv("model", options_.setup.model),
             kv("session", label())});
        shutdown_transport();
        return false;
    }

    State expected = State::Disconnected;
    if (!state_.compare_exchange_strong(expected, State::Connected)) {
        shutdown_transport();
        return false;
    }
    const auto elapsed = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - started).count();
    Metrics::instance().observe_connect_time(elapsed);
    logging::info(
        "Backend session connected",
        {kv("model", options_.setup.model),
         kv("elapsed_sec", elapsed),
         kv("session", label())});
    return true;
}

bool GeminiLiveSession::send_audio(const std::string& pcm16, int sample_rate) {
    if (state_ != State::Connected) {
        logging::debug(
            "Backend audio dropped: not connected",
            {kv("state", to_string(state_)),
             kv("session", label())});
        return false;
    }
    return send_json(build_audio_message(pcm16, sample_rate));
}

void GeminiLiveSession::close() {
    std::lock_guard<std::mutex> close_lock(close_mutex_);
    const auto previous = state_.exchange(State::Closed);
    shutdown_transport();
    if (previous != State::Closed) {
        logging::debug(
            "Backend session closed",
            {kv("previous_state", to_string(previous)),
             kv("session", label())});
    }
}

LiveSession::State GeminiLiveSession::state() const {
    return state_;
}

std::optional<ServerEvent> GeminiLiveSession::next_event(std::chrono::milliseconds wait) {
    std::unique_lock<std::mutex> lock(events_mutex_);
    events_cv_.wait_for(lock, wait, [this]() { return !events_.empty() || transport_down_; });
    if (events_.empty()) {
        return std::nullopt;
    }
    auto event = std::move(events_.front());
    events_.pop_front();
    return event;
}

void GeminiLiveSession::run_loop() {
    std::shared_ptr<WsClient> client;
    {
        std::lock_guard<std::mutex> lock(ws_mutex_);
        if (ws_state_) {
            client = ws_state_->client;
        }
    }
    if (client) {
        try {
            client->run();
        } catch (const std::exception& ex) {
            logging::error(
                "Backend transport loop failed",
                {kv("error", ex.what()),
                 kv("session", label())});
        }
    }
    // The transport cannot deliver anything more once run() returns, even
    // when neither the close nor the fail handler fired.
    if (state_.exchange(State::Closed) == State::Connected) {
        logging::warn(
            "Backend transport loop ended while connected",
            {kv("session", label())});
    }
    std::lock_guard<std::mutex> lock(events_mutex_);
    run_finished_ = true;
    transport_down_ = true;
    events_cv_.notify_all();
}

void GeminiLiveSession::handle_payload(const std::string& payload) {
    ServerEvent event;
    try {
        event = parse_server_event(payload);
    } catch (const std::exception& ex) {
        logging::warn(
            "Ignoring malformed backend message",
            {kv("error", ex.what()),
             kv("session", label())});
        return;
    }
    std::lock_guard<std::mutex> lock(events_mutex_);
    if (event.setup_complete) {
        setup_complete_ = true;
    } else {
        if (events_.size() >= kMaxQueuedEvents) {
            events_.pop_front();
            logging::warn("Backend event queue full, dropping oldest", {kv("session", label())});
        }
        events_.push_back(std::move(event));
    }
    events_cv_.notify_all();
}

void GeminiLiveSession::handle_remote_close(const std::string& reason) {
    State expected = State::Connected;
    if (state_.compare_exchange_strong(expected, State::Closed)) {
        logging::warn(
            "Backend session closed by remote",
            {kv("reason", reason),
             kv("session", label())});
    } else {
        logging::debug(
            "Backend transport closed",
            {kv("reason", reason),
             kv("session", label())});
    }
    std::lock_guard<std::mutex> lock(events_mutex_);
    transport_down_ = true;
    events_cv_.notify_all();
}

bool GeminiLiveSession::send_json(const nlohmann::json& payload) {
    std::lock_guard<std::mutex> lock(ws_mutex_);
    if (!ws_state_ || !ws_state_->client || ws_state_->connection.expired()) {
        return false;
    }
    websocketpp::lib::error_code ec;
    ws_state_->client->send(ws_state_->connection, payload.dump(),
                            websocketpp::frame::opcode::text, ec);
    if (ec) {
        logging::warn(
            "Backend send failed",
            {kv("error", ec.message()),
             kv("session", label())});
        return false;
    }
    return true;
}

void GeminiLiveSession::shutdown_transport() {
    std::shared_ptr<WsClient> client;
    {
        std::lock_guard<std::mutex> lock(ws_mutex_);
        if (ws_state_ && ws_state_->client) {
            client = ws_state_->client;
            if (!ws_state_->connection.expired()) {
                websocketpp::lib::error_code ec;
                client->close(ws_state_->connection, websocketpp::close::status::going_away,
                              "session closed", ec);
            }
        }
    }
    if (worker_.joinable()) {
        bool finished = false;
        {
            std::unique_lock<std::mutex> lock(events_mutex_);
            finished = events_cv_.wait_for(lock, options_.close_timeout,
                                           [this]() { return run_finished_; });
        }
        if (!finished) {
            logging::warn(
                "Backend close timed out, stopping transport",
                {kv("timeout_ms", options_.close_timeout.count()),
                 kv("session", label())});
            if (client) {
                client->stop();
            }
        }
        worker_.join();
    }
    std::lock_guard<std::mutex> lock(ws_mutex_);
    ws_state_.reset();
}

std::string GeminiLiveSession::make_ws_url() const {
    return utils::append_query(options_.ws_url, "key", options_.api_key);
}

}
