#include "scheduler.hpp"
#include <algorithm>
#include <thread>

namespace epm {

void interruptible_sleep(std::chrono::milliseconds duration, const std::atomic<bool>& stop_requested) {
    constexpr auto slice = std::chrono::milliseconds(100);
    auto deadline = std::chrono::steady_clock::now() + duration;

    while (!stop_requested.load()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(slice, remaining));
    }
}

} // namespace epm
