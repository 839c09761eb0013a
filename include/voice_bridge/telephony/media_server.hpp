#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "voice_bridge/telephony/transport.hpp"

namespace voice_bridge {
namespace telephony {

struct MediaServerOptions {
    int port = 8081;
    std::string path = "/media-stream";
    std::chrono::milliseconds close_timeout{5000};
    // Inbound frames held for a call that is not reading; oldest dropped first.
    size_t max_queued_messages = 500;
};

// Accepts telephony media-stream WebSocket connections and runs one call
// handler per connection on its own thread.
class MediaStreamServer {
public:
    using CallHandler = std::function<void(std::shared_ptr<MediaTransport>)>;

    MediaStreamServer(MediaServerOptions options, CallHandler on_call);
    ~MediaStreamServer();

    MediaStreamServer(const MediaStreamServer&) = delete;
    MediaStreamServer& operator=(const MediaStreamServer&) = delete;

    void start();
    void stop();

    size_t active_calls() const;
    size_t open_connections() const;

private:
    using WsServer = websocketpp::server<websocketpp::config::asio>;
    class WsTransport;

    struct CallThread {
        std::thread worker;
        std::shared_ptr<std::atomic<bool>> done;
    };

    bool validate(websocketpp::connection_hdl hdl);
    void on_open(websocketpp::connection_hdl hdl);
    void on_message(websocketpp::connection_hdl hdl, WsServer::message_ptr msg);
    void on_closed(websocketpp::connection_hdl hdl, const std::string& reason);
    std::shared_ptr<WsTransport> find_transport(websocketpp::connection_hdl hdl);
    void forget(websocketpp::connection_hdl hdl);
    void reap_finished_calls();

    MediaServerOptions options_;
    CallHandler on_call_;
    std::unique_ptr<WsServer> server_;
    std::thread server_thread_;
    std::atomic<bool> running_{false};

    mutable std::mutex transports_mutex_;
    std::map<websocketpp::connection_hdl, std::shared_ptr<WsTransport>,
             std::owner_less<websocketpp::connection_hdl>> transports_;

    std::mutex calls_mutex_;
    std::list<CallThread> calls_;
    std::atomic<size_t> active_calls_{0};
};

}
}
