#pragma once
#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>

#include "../../core/types/constants.hpp"
#include "../../scrapers/selector/scraper_selector.hpp"
#include "../channel/channel.hpp"
#include "../rate_limiter/rate_limiter.hpp"
#include "../task/task.hpp"
#include "../task/task_queue.hpp"

namespace Harvest {
namespace Engine {

enum class WorkerState { Idle, Busy, Dead, Stopped };

const char* to_string(WorkerState state);

struct WorkerStatus {
    std::string           name;
    WorkerState           state = WorkerState::Idle;
    std::optional<TaskId> current_task;
    size_t                completed = 0;
    size_t                failed    = 0;
};

struct WorkerOptions {
    int                       max_attempts = Core::Constants::MAX_ATTEMPTS;
    std::chrono::milliseconds retry_backoff{Core::Constants::DEFAULT_RETRY_BACKOFF_MS};
};

class Worker {
public:
    Worker(std::string                 name,
           TaskQueue&                  tasks,
           Channel<Result>&            results,
           RateLimiter&                limiter,
           Scrapers::ScraperSelector& selector,
           WorkerOptions               options = {});

    Worker(const Worker&)            = delete;
    Worker& operator=(const Worker&) = delete;

    // Pops and executes tasks until the queue is closed. Publishes exactly one
    // Result per popped task, including the one in flight when a fault occurs.
    void run();

    // Resolves, rate-limits and fetches one task with bounded retries.
    // Exceptions thrown by the scraper propagate to the caller.
    Result execute(const Task& task);

    WorkerStatus       status() const;
    const std::string& name() const {
        return name_;
    }

private:
    void begin_task(TaskId id);
    void finish_task(bool success);
    void set_state(WorkerState state);
    void publish_fault(const Task& task, const std::string& what);

    std::string                name_;
    TaskQueue&                 tasks_;
    Channel<Result>&           results_;
    RateLimiter&               limiter_;
    Scrapers::ScraperSelector& selector_;
    WorkerOptions              options_;

    mutable std::mutex status_mutex_;
    WorkerStatus       status_;
};

}  // namespace Engine
}  // namespace Harvest
