#pragma once

#include <atomic>
#include <memory>

#include "voice_bridge/backend/connection_pool.hpp"
#include "voice_bridge/config.hpp"
#include "voice_bridge/server/rest_server.hpp"
#include "voice_bridge/telephony/media_server.hpp"

namespace voice_bridge {

class BridgeApp {
public:
    explicit BridgeApp(Config config);
    ~BridgeApp();

    void init();
    // Blocks until stop() is called or SIGINT/SIGTERM arrives.
    void run();
    void stop();
    const Config& config() const;

    static void install_signal_handlers();

private:
    std::shared_ptr<backend::LiveSession> create_backend_session() const;
    void handle_call(std::shared_ptr<telephony::MediaTransport> transport);
    server::ServiceStatus status() const;

    Config config_;
    std::unique_ptr<backend::ConnectionPool> pool_;
    std::unique_ptr<telephony::MediaStreamServer> media_server_;
    std::unique_ptr<server::RestServer> rest_server_;
    std::atomic<bool> quitting_{false};
    std::atomic<bool> stopped_{false};
};

}
