#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace voice_bridge {

class Metrics {
public:
    static Metrics& instance();

    void increment_call(const std::string& outcome);
    void add_audio(const std::string& direction, uint64_t frames, uint64_t bytes);
    void increment_send_failure(const std::string& direction);
    void increment_pool_acquire(const std::string& kind);
    void observe_connect_time(double seconds);
    void set_pool_depth(size_t available, size_t in_use);
    void set_active_calls(size_t calls);
    std::string render_prometheus() const;

    void reset();

private:
    struct AudioSeries {
        uint64_t frames = 0;
        uint64_t bytes = 0;
    };

    struct HistogramSeries {
        uint64_t count = 0;
        double sum = 0.0;
        std::vector<uint64_t> buckets;
    };

    Metrics();

    mutable std::mutex mutex_;
    std::unordered_map<std::string, uint64_t> calls_;
    std::unordered_map<std::string, AudioSeries> audio_;
    std::unordered_map<std::string, uint64_t> send_failures_;
    std::unordered_map<std::string, uint64_t> pool_acquires_;
    HistogramSeries connect_time_;
    std::vector<double> histogram_bounds_;
    size_t pool_available_ = 0;
    size_t pool_in_use_ = 0;
    size_t active_calls_ = 0;
};

}
