#include "voice_bridge/metrics.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace voice_bridge {

namespace {

template <typename Map>
std::vector<std::string> sorted_keys(const Map& map) {
    std::vector<std::string> keys;
    keys.reserve(map.size());
    for (const auto& item : map) {
        keys.push_back(item.first);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

}

Metrics& Metrics::instance() {
    static Metrics metrics;
    return metrics;
}

Metrics::Metrics() {
    histogram_bounds_ = {0.1, 0.25, 0.5, 0.75, 1.0, 1.5, 2.0, 3.0, 5.0, 10.0};
    connect_time_.buckets.assign(histogram_bounds_.size() + 1, 0);
}

void Metrics::increment_call(const std::string& outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++calls_[outcome];
}

void Metrics::add_audio(const std::string& direction, uint64_t frames, uint64_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& series = audio_[direction];
    series.frames += frames;
    series.bytes += bytes;
}

void Metrics::increment_send_failure(const std::string& direction) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++send_failures_[direction];
}

void Metrics::increment_pool_acquire(const std::string& kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++pool_acquires_[kind];
}

void Metrics::observe_connect_time(double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    connect_time_.count += 1;
    connect_time_.sum += seconds;
    for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
        if (seconds <= histogram_bounds_[i]) {
            connect_time_.buckets[i] += 1;
        }
    }
    connect_time_.buckets.back() += 1;
}

void Metrics::set_pool_depth(size_t available, size_t in_use) {
    std::lock_guard<std::mutex> lock(mutex_);
    pool_available_ = available;
    pool_in_use_ = in_use;
}

void Metrics::set_active_calls(size_t calls) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_calls_ = calls;
}

void Metrics::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    calls_.clear();
    audio_.clear();
    send_failures_.clear();
    pool_acquires_.clear();
    connect_time_ = HistogramSeries{};
    connect_time_.buckets.assign(histogram_bounds_.size() + 1, 0);
    pool_available_ = 0;
    pool_in_use_ = 0;
    active_calls_ = 0;
}

std::string Metrics::render_prometheus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream out;
    out.setf(std::ios::fixed);
    out << std::setprecision(6);

    out << "# HELP bridge_calls_total Calls finished, by outcome\n";
    out << "# TYPE bridge_calls_total counter\n";
    for (const auto& outcome : sorted_keys(calls_)) {
        out << "bridge_calls_total{outcome=\"" << outcome << "\"} "
            << calls_.at(outcome) << "\n";
    }

    out << "# HELP bridge_active_calls Calls currently bridged\n";
    out << "# TYPE bridge_active_calls gauge\n";
    out << "bridge_active_calls " << active_calls_ << "\n";

    out << "# HELP bridge_audio_frames_total Audio frames relayed\n";
    out << "# TYPE bridge_audio_frames_total counter\n";
    const auto directions = sorted_keys(audio_);
    for (const auto& direction : directions) {
        out << "bridge_audio_frames_total{direction=\"" << direction << "\"} "
            << audio_.at(direction).frames << "\n";
    }
    out << "# HELP bridge_audio_bytes_total Audio bytes relayed\n";
    out << "# TYPE bridge_audio_bytes_total counter\n";
    for (const auto& direction : directions) {
        out << "bridge_audio_bytes_total{direction=\"" << direction << "\"} "
            << audio_.at(direction).bytes << "\n";
    }

    out << "# HELP bridge_send_failures_total Frames that could not be sent\n";
    out << "# TYPE bridge_send_failures_total counter\n";
    for (const auto& direction : sorted_keys(send_failures_)) {
        out << "bridge_send_failures_total{direction=\"" << direction << "\"} "
            << send_failures_.at(direction) << "\n";
    }

    out << "# HELP pool_acquire_total Backend connection acquisitions, by kind\n";
    out << "# TYPE pool_acquire_total counter\n";
    for (const auto& kind : sorted_keys(pool_acquires_)) {
        out << "pool_acquire_total{kind=\"" << kind << "\"} "
            << pool_acquires_.at(kind) << "\n";
    }

    out << "# HELP pool_connections Backend connections held by the pool\n";
    out << "# TYPE pool_connections gauge\n";
    out << "pool_connections{state=\"available\"} " << pool_available_ << "\n";
    out << "pool_connections{state=\"in_use\"} " << pool_in_use_ << "\n";

    out << "# HELP backend_connect_seconds Time to open a backend session\n";
    out << "# TYPE backend_connect_seconds histogram\n";
    for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
        out << "backend_connect_seconds_bucket{le=\"" << histogram_bounds_[i] << "\"} "
            << connect_time_.buckets[i] << "\n";
    }
    out << "backend_connect_seconds_bucket{le=\"+Inf\"} "
        << connect_time_.buckets.back() << "\n";
    out << "backend_connect_seconds_count " << connect_time_.count << "\n";
    out << "backend_connect_seconds_sum " << connect_time_.sum << "\n";

    return out.str();
}

}
