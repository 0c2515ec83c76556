#include "rate_limiter.hpp"
#include <algorithm>
#include <thread>

namespace Harvest {
namespace Engine {

RateLimiter::RateLimiter(double requests_per_second)
    : rate_(requests_per_second), next_slot_(std::chrono::steady_clock::time_point::min()) {
    if (rate_ > 0) {
        interval_ = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::duration<double>(1.0 / rate_));
    }
}

void RateLimiter::acquire() {
    if (rate_ <= 0)
        return;

    std::chrono::steady_clock::time_point slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        slot       = std::max(std::chrono::steady_clock::now(), next_slot_);
        next_slot_ = slot + interval_;
    }

    std::this_thread::sleep_until(slot);
}

}  // namespace Engine
}  // namespace Harvest
