#include "voice_bridge/server/rest_server.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <utility>

#include "voice_bridge/logging.hpp"
#include "voice_bridge/metrics.hpp"
#include "voice_bridge/server/twiml.hpp"

namespace voice_bridge::server {

namespace {

std::string utc_timestamp() {
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_value{};
    gmtime_r(&now, &tm_value);
    std::ostringstream stream;
    stream << std::put_time(&tm_value, "%Y-%m-%dT%H:%M:%SZ");
    return stream.str();
}

std::optional<std::string> form_value(const httplib::Request& req, const char* key) {
    if (!req.has_param(key)) {
        return std::nullopt;
    }
    auto value = req.get_param_value(key);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

}

RestServer::RestServer(const Config& config, StatusProvider status)
    : config_(config),
      status_(std::move(status)) {}

void RestServer::start() {
    server_ = std::make_unique<httplib::Server>();

    server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        const auto payload = health_body(status_(), utc_timestamp());
        res.set_content(payload.dump(), "application/json");
        logging::debug("Health check served");
    });

    server_->Get("/metrics", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(Metrics::instance().render_prometheus(),
                        "text/plain; version=0.0.4");
    });

    server_->Post("/twiml/stream", [this](const httplib::Request& req, httplib::Response& res) {
        handle_stream_twiml(req, res);
    });

    server_->Post("/call-status", [this](const httplib::Request& req, httplib::Response& res) {
        handle_call_status(req, res);
    });

    server_thread_ = std::thread([this]() {
        logging::info(
            "REST server listening",
            {kv("port", config_.rest_api_port)});
        if (!server_->listen("0.0.0.0", config_.rest_api_port)) {
            logging::error(
                "REST server failed to listen",
                {kv("port", config_.rest_api_port)});
        }
    });
}

void RestServer::stop() {
    if (server_) {
        server_->stop();
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

nlohmann::json RestServer::health_body(const ServiceStatus& status, const std::string& timestamp) {
    return {
        {"status", "healthy"},
        {"timestamp", timestamp},
        {"pool", {{"available", status.pool_available}, {"in_use", status.pool_in_use}}},
        {"active_calls", status.active_calls}};
}

void RestServer::handle_stream_twiml(const httplib::Request& req, httplib::Response& res) const {
    const auto answered_by = form_value(req, "AnsweredBy");
    const auto call_sid = form_value(req, "CallSid").value_or("");
    if (answered_by && is_machine_answer(*answered_by)) {
        logging::info(
            "Call answered by machine, hanging up",
            {kv("answered_by", *answered_by),
             kv("call_sid", call_sid)});
    } else {
        logging::info(
            "Connecting call to media stream",
            {kv("answered_by", answered_by.value_or("unknown")),
             kv("stream_url", config_.media_stream_url),
             kv("call_sid", call_sid)});
    }
    res.set_content(
        stream_twiml(answered_by, config_.media_stream_url, config_.connect_greeting),
        "application/xml");
}

void RestServer::handle_call_status(const httplib::Request& req, httplib::Response& res) const {
    const auto status = status_();
    logging::info(
        "Call status update",
        {kv("call_sid", form_value(req, "CallSid").value_or("")),
         kv("status", form_value(req, "CallStatus").value_or("unknown")),
         kv("answered_by", form_value(req, "AnsweredBy").value_or("")),
         kv("pool_available", status.pool_available),
         kv("pool_in_use", status.pool_in_use)});
    res.set_content(R"({"status":"received"})", "application/json");
}

}
