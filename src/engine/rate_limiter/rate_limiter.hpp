#pragma once

#include <chrono>
#include <mutex>

namespace Harvest {
namespace Engine {

// Pool-wide throttle: consecutive grants are at least 1/rate apart, no matter
// which thread asks. A rate <= 0 disables throttling.
class RateLimiter {
public:
    explicit RateLimiter(double requests_per_second);

    // Reserves the next free slot and sleeps until it arrives. Never fails.
    void acquire();

    double rate() const {
        return rate_;
    }
    std::chrono::steady_clock::duration interval() const {
        return interval_;
    }

private:
    double                                rate_;
    std::chrono::steady_clock::duration   interval_{0};
    std::mutex                            mutex_;
    std::chrono::steady_clock::time_point next_slot_;
};

}  // namespace Engine
}  // namespace Harvest
