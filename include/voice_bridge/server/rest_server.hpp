#pragma once

#include <functional>
#include <memory>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "voice_bridge/config.hpp"

namespace voice_bridge {
namespace server {

struct ServiceStatus {
    size_t pool_available = 0;
    size_t pool_in_use = 0;
    size_t active_calls = 0;
};

// Control surface polled by the telephony provider and by operators.
class RestServer {
public:
    using StatusProvider = std::function<ServiceStatus()>;

    RestServer(const Config& config, StatusProvider status);

    void start();
    void stop();

    static nlohmann::json health_body(const ServiceStatus& status, const std::string& timestamp);

private:
    void handle_stream_twiml(const httplib::Request& req, httplib::Response& res) const;
    void handle_call_status(const httplib::Request& req, httplib::Response& res) const;

    const Config& config_;
    StatusProvider status_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
};

}
}
