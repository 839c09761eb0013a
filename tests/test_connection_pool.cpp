#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"

#include <chrono>
#include <memory>

using voice_bridge::backend::ConnectionPool;
using voice_bridge::backend::PoolOptions;
using fakes::SessionRecorder;

namespace {

PoolOptions pool_options(size_t target) {
    PoolOptions options;
    options.target_size = target;
    options.maintenance_interval = std::chrono::hours(1);
    options.creation_delay = std::chrono::milliseconds(0);
    options.system_prompt = "You are a test assistant.";
    return options;
}

}

TEST_CASE("start fills the pool to its target size") {
    SessionRecorder recorder;
    ConnectionPool pool(recorder.factory(), pool_options(3));
    pool.start();
    REQUIRE(pool.available() == 3);
    REQUIRE(pool.in_use() == 0);
    REQUIRE(recorder.count() == 3);
    for (const auto& session : recorder.all()) {
        REQUIRE(session->prompt() == "You are a test assistant.");
        REQUIRE(session->connected());
    }
    pool.stop();
}

TEST_CASE("acquire hands out a pre-warmed connection") {
    SessionRecorder recorder;
    ConnectionPool pool(recorder.factory(), pool_options(1));
    pool.start();
    const auto warm = recorder.at(0);

    auto session = pool.acquire("CA1");
    REQUIRE(session == warm);
    REQUIRE(pool.in_use() == 1);
    REQUIRE(pool.available() == 0);
    pool.stop();
}

TEST_CASE("released connections are closed and never handed to another call") {
    SessionRecorder recorder;
    ConnectionPool pool(recorder.factory(), pool_options(1));
    pool.start();

    auto first = pool.acquire("CA1");
    REQUIRE(first);
    pool.release("CA1");
    auto* first_fake = static_cast<fakes::FakeLiveSession*>(first.get());
    REQUIRE(first_fake->close_calls() == 1);
    REQUIRE_FALSE(first->connected());

    auto second = pool.acquire("CA2");
    REQUIRE(second);
    REQUIRE(second != first);
    REQUIRE(second->connected());
    pool.stop();
}

TEST_CASE("release triggers a background refill") {
    SessionRecorder recorder;
    ConnectionPool pool(recorder.factory(), pool_options(2));
    pool.start();

    pool.acquire("CA1");
    pool.release("CA1");
    REQUIRE(fakes::wait_until([&]() { return pool.available() == 2; }));
    REQUIRE(pool.in_use() == 0);
    pool.stop();
}

TEST_CASE("acquire creates a connection when the pool is empty") {
    SessionRecorder recorder;
    ConnectionPool pool(recorder.factory(), pool_options(0));

    auto session = pool.acquire("CA1");
    REQUIRE(session);
    REQUIRE(session->connected());
    REQUIRE(recorder.count() == 1);
    REQUIRE(pool.in_use() == 1);
    pool.release("CA1");
    REQUIRE(pool.in_use() == 0);
}

TEST_CASE("a stale pooled connection is discarded on acquire") {
    SessionRecorder recorder;
    ConnectionPool pool(recorder.factory(), pool_options(1));
    pool.start();
    const auto stale = recorder.at(0);
    stale->drop();

    auto session = pool.acquire("CA1");
    REQUIRE(session);
    REQUIRE(session != stale);
    REQUIRE(session->connected());
    REQUIRE(stale->close_calls() == 1);
    pool.stop();
}

TEST_CASE("acquire returns null when no connection can be made") {
    SessionRecorder recorder;
    recorder.connect_ok = false;
    ConnectionPool pool(recorder.factory(), pool_options(0));

    REQUIRE_FALSE(pool.acquire("CA1"));
    REQUIRE(pool.in_use() == 0);
    REQUIRE(recorder.count() == 1);
    REQUIRE(recorder.at(0)->close_calls() == 1);
}

TEST_CASE("evict_stale drops disconnected connections") {
    SessionRecorder recorder;
    ConnectionPool pool(recorder.factory(), pool_options(2));
    pool.start();
    recorder.at(1)->drop();

    REQUIRE(pool.evict_stale() == 1);
    REQUIRE(pool.available() == 1);
    REQUIRE(recorder.at(1)->close_calls() == 1);

    pool.refill();
    REQUIRE(pool.available() == 2);
    pool.stop();
}

TEST_CASE("stop closes available and in-use connections despite close failures") {
    SessionRecorder recorder;
    ConnectionPool pool(recorder.factory(), pool_options(2));
    pool.start();
    recorder.at(0)->throw_on_close(true);
    auto busy = pool.acquire("CA1");
    REQUIRE(busy);

    pool.stop();
    REQUIRE_FALSE(pool.running());
    REQUIRE(pool.available() == 0);
    REQUIRE(pool.in_use() == 0);
    for (const auto& session : recorder.all()) {
        REQUIRE(session->close_calls() >= 1);
    }
}

TEST_CASE("maintenance cycle evicts a dropped connection and restores depth") {
    SessionRecorder recorder;
    auto options = pool_options(2);
    options.maintenance_interval = std::chrono::milliseconds(20);
    ConnectionPool pool(recorder.factory(), options);
    pool.start();
    const auto dropped = recorder.at(0);
    dropped->drop();

    REQUIRE(fakes::wait_until([&]() {
        return dropped->close_calls() == 1 && pool.available() == 2;
    }));
    REQUIRE(recorder.count() == 3);
    REQUIRE(pool.in_use() == 0);
    pool.stop();
}

TEST_CASE("maintenance cycle replaces connections past their idle age") {
    SessionRecorder recorder;
    auto options = pool_options(1);
    options.maintenance_interval = std::chrono::milliseconds(20);
    options.max_idle = std::chrono::seconds(1);
    ConnectionPool pool(recorder.factory(), options);
    pool.start();
    const auto first = recorder.at(0);

    REQUIRE(fakes::wait_until([&]() { return first->close_calls() == 1; },
                              std::chrono::milliseconds(4000)));
    REQUIRE(fakes::wait_until([&]() { return pool.available() == 1; }));
    REQUIRE(recorder.count() >= 2);
    auto session = pool.acquire("CA1");
    REQUIRE(session);
    REQUIRE(session != first);
    pool.stop();
}

TEST_CASE("stop ends the maintenance loop promptly") {
    SessionRecorder recorder;
    auto options = pool_options(1);
    options.maintenance_interval = std::chrono::milliseconds(20);
    ConnectionPool pool(recorder.factory(), options);
    pool.start();
    REQUIRE(pool.running());

    const auto started = std::chrono::steady_clock::now();
    pool.stop();
    REQUIRE_FALSE(pool.running());
    REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds(2));
    REQUIRE(pool.available() == 0);
}
