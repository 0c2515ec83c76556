#pragma once
#include <atomic>
#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_set>
#include <vector>

#include "../../core/types/constants.hpp"
#include "../../scrapers/selector/scraper_selector.hpp"
#include "../channel/channel.hpp"
#include "../rate_limiter/rate_limiter.hpp"
#include "../stats/run_stats.hpp"
#include "../task/task.hpp"
#include "../task/task_queue.hpp"
#include "../worker/worker.hpp"

namespace Harvest {
namespace Engine {

using namespace Harvest::Core;

struct MasterConfig {
    int                       workers             = Constants::DEFAULT_WORKERS;
    double                    requests_per_second = Constants::DEFAULT_RATE;
    int                       max_attempts        = Constants::MAX_ATTEMPTS;
    std::chrono::milliseconds retry_backoff{Constants::DEFAULT_RETRY_BACKOFF_MS};
    std::chrono::milliseconds monitor_interval{Constants::DEFAULT_MONITOR_INTERVAL_MS};
    std::chrono::milliseconds poll_interval{Constants::RESULT_POLL_INTERVAL_MS};
    bool                      handle_signals = false;
};

struct PoolSnapshot {
    std::vector<WorkerStatus> workers;
    size_t                    queue_depth = 0;
    size_t                    completed   = 0;
    size_t                    succeeded   = 0;
    size_t                    total       = 0;
};

class Master {
public:
    Master(MasterConfig config, Scrapers::ScraperSelector& selector);
    virtual ~Master();

    Master(const Master&)            = delete;
    Master& operator=(const Master&) = delete;

    // Assigns ids in submission order and stages the tasks for run().
    // Throws ConfigurationError on an empty list, an unknown task type, or
    // once run() has been called.
    std::vector<TaskId> submit(std::vector<Task> tasks);

    // Runs every submitted task to exactly one Result. Throws
    // ConfigurationError for invalid bounds or no tasks, PoolExhaustionError
    // when fewer than min_workers threads start.
    RunStats run(int min_workers, int max_workers);

    // Cooperative: in-flight tasks finish, queued ones are recorded as Cancelled.
    void cancel();
    bool cancelled() const {
        return cancelled_;
    }

    // Safe to call from any thread while run() is in progress.
    PoolSnapshot snapshot() const;

    const std::vector<Result>& results() const {
        return results_;
    }
    std::vector<Result> take_results();

    static int plan_pool_size(int desired, int min_workers, int max_workers, size_t task_count);

protected:
    // Starts the thread running `worker`. Throws std::system_error when no
    // thread can be created.
    virtual std::thread launch(Worker& worker);

private:
    enum class Phase { Idle, Running, Finished };

    void validate_bounds(int min_workers, int max_workers) const;
    void spawn_workers(int target, int min_workers);
    void collect_results();
    void accept(Result result);
    void fail_stranded(FailureKind failure, const std::string& message);
    size_t live_workers() const;
    void shutdown();

    void init_io_services();
    void init_signals();
    void schedule_monitor();
    void report_progress() const;
    void stop_io_services();

    MasterConfig               config_;
    Scrapers::ScraperSelector& selector_;

    std::vector<Task> pending_;
    TaskQueue         tasks_;
    Channel<Result>   results_channel_;
    RateLimiter       limiter_;

    std::vector<std::unique_ptr<Worker>> workers_;
    std::vector<std::thread>             threads_;
    mutable std::mutex                   workers_mutex_;

    std::vector<Result>        results_;
    std::unordered_set<TaskId> seen_;
    StatsAggregator            aggregator_;

    TaskId              next_id_ = 0;
    Phase               phase_   = Phase::Idle;
    std::atomic<size_t> submitted_{0};
    std::atomic<size_t> completed_{0};
    std::atomic<size_t> succeeded_{0};
    std::atomic<bool>   cancelled_{false};
    std::atomic<bool>   monitoring_{false};

    boost::asio::io_context ioc_;
    std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
                              work_guard_;
    std::thread               io_thread_;
    boost::asio::signal_set   signals_{ioc_};
    boost::asio::steady_timer monitor_timer_{ioc_};
};

}  // namespace Engine
}  // namespace Harvest
