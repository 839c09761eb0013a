#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>

namespace voice_bridge {
namespace utils {

// Sleeps up to `timeout`; returns early (true) once `stop` reports true.
bool wait_until_stopped(std::condition_variable& cv,
                        std::mutex& mutex,
                        std::chrono::milliseconds timeout,
                        const std::function<bool()>& stop);

}
}
