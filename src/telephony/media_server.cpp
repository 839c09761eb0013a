#include "voice_bridge/telephony/media_server.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

#include "voice_bridge/logging.hpp"
#include "voice_bridge/metrics.hpp"
#include "voice_bridge/utils/http.hpp"

namespace voice_bridge::telephony {

class MediaStreamServer::WsTransport : public MediaTransport {
public:
    WsTransport(WsServer& server,
                websocketpp::connection_hdl hdl,
                std::string endpoint,
                size_t max_queued,
                std::function<void()> on_close_timeout)
        : server_(server),
          hdl_(std::move(hdl)),
          endpoint_(std::move(endpoint)),
          max_queued_(max_queued),
          on_close_timeout_(std::move(on_close_timeout)) {}

    std::optional<std::string> receive_text() override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return !inbox_.empty() || closed_; });
        if (inbox_.empty()) {
            return std::nullopt;
        }
        auto text = std::move(inbox_.front());
        inbox_.pop_front();
        return text;
    }

    bool send_text(const std::string& text) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || closing_) {
                return false;
            }
        }
        websocketpp::lib::error_code ec;
        server_.send(hdl_, text, websocketpp::frame::opcode::text, ec);
        if (ec) {
            logging::debug(
                "Media stream send failed",
                {kv("error", ec.message()),
                 kv("remote", endpoint_)});
            return false;
        }
        return true;
    }

    void close(std::chrono::milliseconds timeout) override {
        bool initiate = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return;
            }
            if (!closing_) {
                closing_ = true;
                initiate = true;
            }
        }
        if (initiate) {
            websocketpp::lib::error_code ec;
            server_.close(hdl_, websocketpp::close::status::normal, "call ended", ec);
            if (ec) {
                logging::debug(
                    "Media stream already closed",
                    {kv("error", ec.message()),
                     kv("remote", endpoint_)});
                mark_closed();
                return;
            }
        }
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (cv_.wait_for(lock, timeout, [this]() { return closed_; })) {
                return;
            }
            logging::warn(
                "Media stream close timed out",
                {kv("timeout_ms", timeout.count()),
                 kv("remote", endpoint_)});
            closed_ = true;
            cv_.notify_all();
        }
        if (on_close_timeout_) {
            on_close_timeout_();
        }
    }

    std::string remote_endpoint() const override {
        return endpoint_;
    }

    void push(std::string text) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        if (max_queued_ > 0 && inbox_.size() >= max_queued_) {
            inbox_.pop_front();
            if (++dropped_ == 1 || dropped_ % 100 == 0) {
                logging::warn(
                    "Media stream inbox full, dropping oldest frame",
                    {kv("dropped", dropped_),
                     kv("remote", endpoint_)});
            }
        }
        inbox_.push_back(std::move(text));
        cv_.notify_one();
    }

    void mark_closed() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        cv_.notify_all();
    }

private:
    WsServer& server_;
    websocketpp::connection_hdl hdl_;
    std::string endpoint_;
    size_t max_queued_;
    std::function<void()> on_close_timeout_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> inbox_;
    uint64_t dropped_ = 0;
    bool closing_ = false;
    bool closed_ = false;
};

MediaStreamServer::MediaStreamServer(MediaServerOptions options, CallHandler on_call)
    : options_(std::move(options)),
      on_call_(std::move(on_call)) {}

MediaStreamServer::~MediaStreamServer() {
    stop();
}

void MediaStreamServer::start() {
    server_ = std::make_unique<WsServer>();
    server_->clear_access_channels(websocketpp::log::alevel::all);
    server_->clear_error_channels(websocketpp::log::elevel::all);
    server_->init_asio();
    server_->set_reuse_addr(true);

    server_->set_validate_handler([this](websocketpp::connection_hdl hdl) {
        return validate(std::move(hdl));
    });
    server_->set_open_handler([this](websocketpp::connection_hdl hdl) {
        on_open(std::move(hdl));
    });
    server_->set_message_handler([this](websocketpp::connection_hdl hdl,
                                        WsServer::message_ptr msg) {
        on_message(std::move(hdl), std::move(msg));
    });
    server_->set_close_handler([this](websocketpp::connection_hdl hdl) {
        on_closed(std::move(hdl), "closed");
    });
    server_->set_fail_handler([this](websocketpp::connection_hdl hdl) {
        on_closed(std::move(hdl), "failed");
    });

    server_->listen(static_cast<uint16_t>(options_.port));
    server_->start_accept();
    running_ = true;

    server_thread_ = std::thread([this]() {
        logging::info(
            "Media stream server listening",
            {kv("port", options_.port),
             kv("path", options_.path)});
        try {
            server_->run();
        } catch (const std::exception& ex) {
            logging::error(
                "Media stream server loop failed",
                {kv("error", ex.what())});
        }
    });
}

void MediaStreamServer::stop() {
    {
        std::lock_guard<std::mutex> lock(calls_mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }

    // Still listening while calls drain, so late connections get a 503.
    std::vector<std::shared_ptr<WsTransport>> open;
    {
        std::lock_guard<std::mutex> lock(transports_mutex_);
        for (const auto& item : transports_) {
            open.push_back(item.second);
        }
    }
    for (const auto& transport : open) {
        transport->close(options_.close_timeout);
    }

    std::list<CallThread> calls;
    {
        std::lock_guard<std::mutex> lock(calls_mutex_);
        calls.swap(calls_);
    }
    for (auto& call : calls) {
        if (call.worker.joinable()) {
            call.worker.join();
        }
    }

    websocketpp::lib::error_code ec;
    server_->stop_listening(ec);
    if (ec) {
        logging::warn(
            "Media stream server could not stop listening",
            {kv("error", ec.message())});
    }
    server_->stop();
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
    logging::info(
        "Media stream server stopped",
        {kv("calls_joined", calls.size())});
}

size_t MediaStreamServer::active_calls() const {
    return active_calls_;
}

size_t MediaStreamServer::open_connections() const {
    std::lock_guard<std::mutex> lock(transports_mutex_);
    return transports_.size();
}

bool MediaStreamServer::validate(websocketpp::connection_hdl hdl) {
    websocketpp::lib::error_code ec;
    auto con = server_->get_con_from_hdl(hdl, ec);
    if (ec || !con) {
        return false;
    }
    if (!running_) {
        con->set_status(websocketpp::http::status_code::service_unavailable);
        return false;
    }
    const auto path = utils::path_of(con->get_resource());
    if (path != utils::path_of(options_.path)) {
        logging::warn(
            "Rejecting media stream on unknown path",
            {kv("path", path),
             kv("remote", con->get_remote_endpoint())});
        con->set_status(websocketpp::http::status_code::not_found);
        return false;
    }
    return true;
}

void MediaStreamServer::on_open(websocketpp::connection_hdl hdl) {
    websocketpp::lib::error_code ec;
    auto con = server_->get_con_from_hdl(hdl, ec);
    const std::string endpoint = (!ec && con) ? con->get_remote_endpoint() : "unknown";
    auto transport = std::make_shared<WsTransport>(
        *server_, hdl, endpoint, options_.max_queued_messages,
        [this, hdl]() { forget(hdl); });
    reap_finished_calls();

    std::lock_guard<std::mutex> lock(calls_mutex_);
    if (!running_) {
        logging::warn("Media stream opened during shutdown, closing", {kv("remote", endpoint)});
        websocketpp::lib::error_code close_ec;
        server_->close(hdl, websocketpp::close::status::going_away, "shutting down", close_ec);
        if (close_ec) {
            logging::debug(
                "Late media stream close failed",
                {kv("error", close_ec.message()),
                 kv("remote", endpoint)});
        }
        return;
    }
    {
        std::lock_guard<std::mutex> transports_lock(transports_mutex_);
        transports_[hdl] = transport;
    }
    logging::info("Media stream connected", {kv("remote", endpoint)});

    auto done = std::make_shared<std::atomic<bool>>(false);
    Metrics::instance().set_active_calls(++active_calls_);
    calls_.push_back(CallThread{
        std::thread([this, transport, done]() {
            try {
                on_call_(transport);
            } catch (const std::exception& ex) {
                logging::error(
                    "Call handler failed",
                    {kv("error", ex.what()),
                     kv("remote", transport->remote_endpoint())});
            }
            transport->close(options_.close_timeout);
            Metrics::instance().set_active_calls(--active_calls_);
            done->store(true);
        }),
        done});
}

void MediaStreamServer::on_message(websocketpp::connection_hdl hdl, WsServer::message_ptr msg) {
    auto transport = find_transport(hdl);
    if (!transport) {
        return;
    }
    if (msg->get_opcode() != websocketpp::frame::opcode::text) {
        logging::debug(
            "Ignoring binary media stream frame",
            {kv("remote", transport->remote_endpoint())});
        return;
    }
    transport->push(msg->get_payload());
}

void MediaStreamServer::on_closed(websocketpp::connection_hdl hdl, const std::string& reason) {
    std::shared_ptr<WsTransport> transport;
    {
        std::lock_guard<std::mutex> lock(transports_mutex_);
        auto it = transports_.find(hdl);
        if (it != transports_.end()) {
            transport = it->second;
            transports_.erase(it);
        }
    }
    if (!transport) {
        return;
    }
    transport->mark_closed();
    logging::info(
        "Media stream disconnected",
        {kv("reason", reason),
         kv("remote", transport->remote_endpoint())});
}

void MediaStreamServer::forget(websocketpp::connection_hdl hdl) {
    std::lock_guard<std::mutex> lock(transports_mutex_);
    transports_.erase(hdl);
}

std::shared_ptr<MediaStreamServer::WsTransport> MediaStreamServer::find_transport(
    websocketpp::connection_hdl hdl) {
    std::lock_guard<std::mutex> lock(transports_mutex_);
    auto it = transports_.find(hdl);
    return it == transports_.end() ? nullptr : it->second;
}

void MediaStreamServer::reap_finished_calls() {
    std::lock_guard<std::mutex> lock(calls_mutex_);
    for (auto it = calls_.begin(); it != calls_.end();) {
        if (it->done->load()) {
            if (it->worker.joinable()) {
                it->worker.join();
            }
            it = calls_.erase(it);
        } else {
            ++it;
        }
    }
}

}
