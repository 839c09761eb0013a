#include "voice_bridge/utils/async.hpp"

namespace voice_bridge::utils {

bool wait_until_stopped(std::condition_variable& cv,
                        std::mutex& mutex,
                        std::chrono::milliseconds timeout,
                        const std::function<bool()>& stop) {
    std::unique_lock<std::mutex> lock(mutex);
    return cv.wait_for(lock, timeout, stop);
}

}
