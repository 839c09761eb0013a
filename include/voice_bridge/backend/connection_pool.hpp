#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "voice_bridge/backend/live_session.hpp"

namespace voice_bridge {
namespace backend {

struct PooledConnection {
    std::shared_ptr<LiveSession> session;
    std::chrono::steady_clock::time_point created_at;

    bool connected() const { return session && session->connected(); }
};

struct PoolOptions {
    size_t target_size = 2;
    std::chrono::milliseconds maintenance_interval{30000};
    std::chrono::milliseconds creation_delay{500};
    // Zero keeps warm connections regardless of age.
    std::chrono::seconds max_idle{600};
    std::string system_prompt;
};

// Keeps pre-connected backend sessions so calls do not pay the connect
// latency. Sessions are call-scoped: release() always closes them.
class ConnectionPool {
public:
    using SessionFactory = std::function<std::shared_ptr<LiveSession>()>;

    ConnectionPool(SessionFactory factory, PoolOptions options);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    void start();
    void stop();

    std::shared_ptr<LiveSession> acquire(const std::string& call_id);
    void release(const std::string& call_id);

    size_t available() const;
    size_t in_use() const;
    bool running() const;

    // One synchronous refill pass; exposed for the maintenance loop and tests.
    void refill();
    size_t evict_stale();

private:
    std::shared_ptr<LiveSession> create_connection();
    void close_connection(const std::shared_ptr<LiveSession>& session);
    void trigger_refill();
    void maintenance_loop();
    void publish_depth() const;

    SessionFactory factory_;
    PoolOptions options_;

    mutable std::mutex mutex_;
    std::deque<PooledConnection> available_;
    std::unordered_map<std::string, std::shared_ptr<LiveSession>> in_use_;

    std::atomic<bool> running_{false};
    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
    std::thread maintenance_;

    std::mutex refill_serial_mutex_;
    std::mutex background_mutex_;
    std::vector<std::future<void>> background_;
    std::atomic<uint64_t> created_{0};
};

}
}
