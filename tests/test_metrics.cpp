#include <catch2/catch_test_macros.hpp>

#include "voice_bridge/metrics.hpp"

#include <string>

namespace {

bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

}

TEST_CASE("metrics render call, audio and pool series") {
    auto& metrics = voice_bridge::Metrics::instance();
    metrics.reset();
    metrics.increment_call("completed");
    metrics.increment_call("completed");
    metrics.add_audio("inbound", 10, 1600);
    metrics.increment_pool_acquire("warm");
    metrics.set_pool_depth(2, 1);
    metrics.set_active_calls(1);
    metrics.observe_connect_time(0.4);

    const auto text = metrics.render_prometheus();
    REQUIRE(contains(text, "bridge_calls_total{outcome=\"completed\"} 2\n"));
    REQUIRE(contains(text, "bridge_audio_frames_total{direction=\"inbound\"} 10\n"));
    REQUIRE(contains(text, "bridge_audio_bytes_total{direction=\"inbound\"} 1600\n"));
    REQUIRE(contains(text, "pool_acquire_total{kind=\"warm\"} 1\n"));
    REQUIRE(contains(text, "pool_connections{state=\"available\"} 2\n"));
    REQUIRE(contains(text, "pool_connections{state=\"in_use\"} 1\n"));
    REQUIRE(contains(text, "bridge_active_calls 1\n"));
    REQUIRE(contains(text, "backend_connect_seconds_bucket{le=\"0.500000\"} 1\n"));
    REQUIRE(contains(text, "backend_connect_seconds_bucket{le=\"0.250000\"} 0\n"));
    REQUIRE(contains(text, "backend_connect_seconds_count 1\n"));
    metrics.reset();
}
