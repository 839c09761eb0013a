#include "voice_bridge/backend/connection_pool.hpp"

#include <algorithm>
#include <iterator>
#include <optional>
#include <utility>

#include "voice_bridge/logging.hpp"
#include "voice_bridge/metrics.hpp"
#include "voice_bridge/utils/async.hpp"

namespace voice_bridge::backend {

ConnectionPool::ConnectionPool(SessionFactory factory, PoolOptions options)
    : factory_(std::move(factory)),
      options_(std::move(options)) {}

ConnectionPool::~ConnectionPool() {
    stop();
}

void ConnectionPool::start() {
    if (running_.exchange(true)) {
        return;
    }
    logging::info(
        "Starting backend connection pool",
        {kv("target_size", options_.target_size),
         kv("interval_ms", options_.maintenance_interval.count())});
    refill();
    maintenance_ = std::thread([this]() { maintenance_loop(); });
    logging::info(
        "Backend connection pool started",
        {kv("available", available())});
}

void ConnectionPool::stop() {
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        running_ = false;
    }
    stop_cv_.notify_all();
    if (maintenance_.joinable()) {
        maintenance_.join();
    }

    std::vector<std::future<void>> background;
    {
        std::lock_guard<std::mutex> lock(background_mutex_);
        background.swap(background_);
    }
    for (auto& task : background) {
        task.wait();
    }

    std::deque<PooledConnection> idle;
    std::unordered_map<std::string, std::shared_ptr<LiveSession>> busy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        idle.swap(available_);
        busy.swap(in_use_);
    }
    if (idle.empty() && busy.empty()) {
        return;
    }
    for (const auto& connection : idle) {
        close_connection(connection.session);
    }
    for (const auto& entry : busy) {
        logging::warn(
            "Force-closing backend connection still in use",
            {kv("call_sid", entry.first)});
        close_connection(entry.second);
    }
    publish_depth();
    logging::info(
        "Backend connection pool stopped",
        {kv("closed_available", idle.size()),
         kv("closed_in_use", busy.size())});
}

std::shared_ptr<LiveSession> ConnectionPool::acquire(const std::string& call_id) {
    std::optional<PooledConnection> pooled;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!available_.empty()) {
            pooled = std::move(available_.front());
            available_.pop_front();
        }
    }

    std::shared_ptr<LiveSession> session;
    if (pooled && pooled->connected()) {
        session = pooled->session;
        Metrics::instance().increment_pool_acquire("warm");
        logging::info(
            "Acquired pre-warmed backend connection",
            {kv("call_sid", call_id),
             kv("session", session->label())});
    } else {
        if (pooled) {
            logging::warn(
                "Discarding stale pooled connection",
                {kv("call_sid", call_id),
                 kv("session", pooled->session ? pooled->session->label() : "")});
            close_connection(pooled->session);
        } else {
            logging::warn(
                "No pre-warmed connections available, creating new one",
                {kv("call_sid", call_id)});
        }
        session = create_connection();
        if (!session) {
            Metrics::instance().increment_pool_acquire("failed");
            logging::error(
                "Could not obtain a backend connection",
                {kv("call_sid", call_id)});
            trigger_refill();
            return nullptr;
        }
        Metrics::instance().increment_pool_acquire("cold");
        logging::info(
            "Created new backend connection for call",
            {kv("call_sid", call_id),
             kv("session", session->label())});
    }

    std::shared_ptr<LiveSession> replaced;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = in_use_[call_id];
        replaced = std::move(slot);
        slot = session;
    }
    if (replaced) {
        logging::warn(
            "Call already held a backend connection, closing the previous one",
            {kv("call_sid", call_id)});
        close_connection(replaced);
    }
    trigger_refill();
    publish_depth();
    return session;
}

void ConnectionPool::release(const std::string& call_id) {
    std::shared_ptr<LiveSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = in_use_.find(call_id);
        if (it != in_use_.end()) {
            session = std::move(it->second);
            in_use_.erase(it);
        }
    }
    if (!session) {
        logging::debug(
            "No backend connection to release",
            {kv("call_sid", call_id)});
        return;
    }
    close_connection(session);
    logging::info(
        "Released and closed backend connection",
        {kv("call_sid", call_id)});
    trigger_refill();
    publish_depth();
}

size_t ConnectionPool::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return available_.size();
}

size_t ConnectionPool::in_use() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_use_.size();
}

bool ConnectionPool::running() const {
    return running_;
}

void ConnectionPool::refill() {
    if (!running_) {
        return;
    }
    std::lock_guard<std::mutex> serial(refill_serial_mutex_);
    size_t current = 0;
    size_t busy = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current = available_.size();
        busy = in_use_.size();
    }
    const size_t held = current + busy;
    const size_t needed = options_.target_size > held ? options_.target_size - held : 0;
    if (needed == 0) {
        return;
    }
    logging::info(
        "Refilling backend connection pool",
        {kv("available", current),
         kv("in_use", busy),
         kv("needed", needed)});

    for (size_t i = 0; i < needed && running_; ++i) {
        auto session = create_connection();
        if (session) {
            bool added = false;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (running_) {
                    available_.push_back({session, std::chrono::steady_clock::now()});
                    added = true;
                }
            }
            if (added) {
                logging::info(
                    "Added connection to pool",
                    {kv("index", i + 1),
                     kv("needed", needed)});
            } else {
                close_connection(session);
            }
        }
        if (i + 1 < needed && options_.creation_delay.count() > 0) {
            if (utils::wait_until_stopped(stop_cv_, stop_mutex_, options_.creation_delay,
                                          [this]() { return !running_; })) {
                break;
            }
        }
    }
    publish_depth();
}

size_t ConnectionPool::evict_stale() {
    const auto now = std::chrono::steady_clock::now();
    std::vector<PooledConnection> evicted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto keep = std::stable_partition(
            available_.begin(), available_.end(), [&](const PooledConnection& connection) {
                if (!connection.connected()) {
                    return false;
                }
                return options_.max_idle.count() == 0 ||
                       now - connection.created_at <= options_.max_idle;
            });
        evicted.assign(std::make_move_iterator(keep),
                       std::make_move_iterator(available_.end()));
        available_.erase(keep, available_.end());
    }
    for (const auto& connection : evicted) {
        close_connection(connection.session);
    }
    if (!evicted.empty()) {
        logging::info(
            "Evicted stale pooled connections",
            {kv("count", evicted.size())});
        publish_depth();
    }
    return evicted.size();
}

std::shared_ptr<LiveSession> ConnectionPool::create_connection() {
    std::shared_ptr<LiveSession> session;
    try {
        session = factory_();
    } catch (const std::exception& ex) {
        logging::error(
            "Backend session factory failed",
            {kv("error", ex.what())});
        return nullptr;
    }
    if (!session) {
        return nullptr;
    }
    session->set_label("backend-" + std::to_string(++created_));

    bool connected = false;
    try {
        connected = session->connect(options_.system_prompt);
    } catch (const std::exception& ex) {
        logging::error(
            "Backend connect raised",
            {kv("error", ex.what()),
             kv("session", session->label())});
    }
    if (!connected) {
        logging::error(
            "Failed to create backend connection",
            {kv("session", session->label())});
        close_connection(session);
        return nullptr;
    }
    return session;
}

void ConnectionPool::close_connection(const std::shared_ptr<LiveSession>& session) {
    if (!session) {
        return;
    }
    try {
        session->close();
    } catch (const std::exception& ex) {
        logging::error(
            "Error closing backend connection",
            {kv("error", ex.what()),
             kv("session", session->label())});
    }
}

void ConnectionPool::trigger_refill() {
    if (!running_) {
        return;
    }
    std::lock_guard<std::mutex> lock(background_mutex_);
    background_.erase(
        std::remove_if(background_.begin(), background_.end(),
                       [](std::future<void>& task) {
                           return task.wait_for(std::chrono::seconds(0)) ==
                                  std::future_status::ready;
                       }),
        background_.end());
    background_.push_back(std::async(std::launch::async, [this]() {
        try {
            refill();
        } catch (const std::exception& ex) {
            logging::error(
                "Background pool refill failed",
                {kv("error", ex.what())});
        }
    }));
}

void ConnectionPool::maintenance_loop() {
    while (running_) {
        if (utils::wait_until_stopped(stop_cv_, stop_mutex_, options_.maintenance_interval,
                                      [this]() { return !running_; })) {
            break;
        }
        try {
            evict_stale();
            refill();
            logging::info(
                "Pool status",
                {kv("available", available()),
                 kv("in_use", in_use())});
        } catch (const std::exception& ex) {
            logging::error(
                "Error in pool maintenance",
                {kv("error", ex.what())});
        }
    }
    logging::debug("Pool maintenance stopped");
}

void ConnectionPool::publish_depth() const {
    Metrics::instance().set_pool_depth(available(), in_use());
}

}
