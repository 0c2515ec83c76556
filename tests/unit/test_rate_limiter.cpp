#include <algorithm>
#include <gtest/gtest.h>
#include <mutex>
#include <thread>
#include <vector>
#include "../../src/engine/rate_limiter/rate_limiter.hpp"

using namespace Harvest::Engine;
using Clock = std::chrono::steady_clock;

TEST(RateLimiterTest, FirstAcquireIsImmediate) {
    RateLimiter limiter(1.0);
    auto        start = Clock::now();
    limiter.acquire();
    EXPECT_LT(Clock::now() - start, std::chrono::milliseconds(100));
}

TEST(RateLimiterTest, SpacesConsecutiveGrants) {
    RateLimiter limiter(10.0);  // 100 ms apart
    auto        start = Clock::now();
    for (int i = 0; i < 4; ++i)
        limiter.acquire();
    EXPECT_GE(Clock::now() - start, std::chrono::milliseconds(300));
}

TEST(RateLimiterTest, SharedAcrossThreads) {
    RateLimiter                    limiter(20.0);  // 50 ms apart
    std::mutex                     mutex;
    std::vector<Clock::time_point> grants;

    std::vector<std::thread> threads;
    for (int i = 0; i < 6; ++i) {
        threads.emplace_back([&]() {
            limiter.acquire();
            std::lock_guard<std::mutex> lock(mutex);
            grants.push_back(Clock::now());
        });
    }
    for (auto& t : threads)
        t.join();

    std::sort(grants.begin(), grants.end());
    ASSERT_EQ(grants.size(), 6u);
    EXPECT_GE(grants.back() - grants.front(), std::chrono::milliseconds(240));
}

TEST(RateLimiterTest, ZeroRateIsUnlimited) {
    RateLimiter limiter(0.0);
    auto        start = Clock::now();
    for (int i = 0; i < 1000; ++i)
        limiter.acquire();
    EXPECT_LT(Clock::now() - start, std::chrono::milliseconds(200));
    EXPECT_EQ(limiter.interval().count(), 0);
}

TEST(RateLimiterTest, IntervalMatchesRate) {
    RateLimiter limiter(4.0);
    EXPECT_DOUBLE_EQ(limiter.rate(), 4.0);
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::milliseconds>(limiter.interval()).count(),
              250);
}
