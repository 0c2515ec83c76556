#pragma once
#include <algorithm>
#include <chrono>

namespace Harvest {
namespace Core {

struct Constants {
    static constexpr int         DEFAULT_MIN_WORKERS    = 1;
    static constexpr int         DEFAULT_MAX_WORKERS    = 5;
    static constexpr int         DEFAULT_WORKERS        = 0;    // 0 = one per task
    static constexpr double      DEFAULT_RATE           = 1.0;  // requests per second
    static constexpr const char* DEFAULT_OUTPUT_DIR     = "data_output";
    static constexpr const char* VERSION                = "0.1.0";

    static constexpr int MAX_ATTEMPTS                = 3;
    static constexpr int MAX_ATTEMPTS_LIMIT          = 10;
    static constexpr int MAX_BACKOFF_DOUBLINGS       = 10;
    static constexpr int MAX_RETRY_BACKOFF_MS        = 60000;
    static constexpr int DEFAULT_RETRY_BACKOFF_MS    = 2000;
    static constexpr int DEFAULT_MONITOR_INTERVAL_MS = 4000;
    static constexpr int RESULT_POLL_INTERVAL_MS     = 100;

    static constexpr int         REQUEST_TIMEOUT_SECONDS = 10;
    static constexpr const char* USER_AGENT              = "Harvest-Scraper/0.1";

    static constexpr const char* DEFAULT_BLOG_URL = "https://techcrunch.com/";
    static constexpr const char* RSS_SEARCH_URL   = "https://news.google.com/rss/search?q=";
    static constexpr const char* RSS_SEARCH_SUFFIX = "&hl=en-US&gl=US&ceid=US:en";
    static constexpr const char* DEFAULT_RSS_TERM  = "news";
};

// Delay before retrying after failed attempt `attempt` (1-based): base, 2*base, 4*base...
// capped at MAX_RETRY_BACKOFF_MS.
inline std::chrono::milliseconds get_backoff_time(std::chrono::milliseconds base, int attempt) {
    if (attempt <= 0 || base.count() <= 0)
        return std::chrono::milliseconds(0);

    const std::chrono::milliseconds cap(Constants::MAX_RETRY_BACKOFF_MS);
    if (base >= cap)
        return cap;
    int doublings = std::min(attempt - 1, Constants::MAX_BACKOFF_DOUBLINGS);
    std::chrono::milliseconds delay = base * (1 << doublings);
    return std::min(delay, cap);
}

}  // namespace Core
}  // namespace Harvest
