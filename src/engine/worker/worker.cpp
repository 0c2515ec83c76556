#include "worker.hpp"
#include <thread>

#include "../../core/logger/logger.hpp"

namespace Harvest {
namespace Engine {

using namespace Harvest::Core;
using namespace Harvest::Scrapers;

namespace {

std::chrono::milliseconds elapsed_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now()
                                                                 - start);
}

}  // namespace

const char* to_string(WorkerState state) {
    switch (state) {
        case WorkerState::Idle: return "idle";
        case WorkerState::Busy: return "busy";
        case WorkerState::Dead: return "dead";
        case WorkerState::Stopped: return "stopped";
    }
    return "unknown";
}

Worker::Worker(std::string      name,
               TaskQueue&       tasks,
               Channel<Result>& results,
               RateLimiter&     limiter,
               ScraperSelector& selector,
               WorkerOptions    options)
    : name_(std::move(name)),
      tasks_(tasks),
      results_(results),
      limiter_(limiter),
      selector_(selector),
      options_(options) {
    if (options_.max_attempts < 1)
        options_.max_attempts = 1;
    status_.name = name_;
}

void Worker::run() {
    Logger::info("Worker " + name_ + " started");

    while (auto task = tasks_.pop()) {
        begin_task(task->id);
        Logger::info("Worker " + name_ + " started task " + std::to_string(task->id) + " ("
                     + task->type + ")");

        Result result;
        try {
            result = execute(*task);
        } catch (const std::exception& e) {
            publish_fault(*task, e.what());
            return;
        } catch (...) {
            publish_fault(*task, "unknown exception");
            return;
        }

        finish_task(result.success);
        results_.push(std::move(result));
    }

    set_state(WorkerState::Stopped);
    Logger::info("Worker " + name_ + " finished");
}

Result Worker::execute(const Task& task) {
    auto   started = std::chrono::steady_clock::now();
    Result result;
    result.task_id     = task.id;
    result.worker_name = name_;
    result.source_type = task.type;

    auto       kind       = parse_kind(task.type);
    Resolution resolution = kind ? selector_.resolve(*kind, task.search_word)
                                 : Resolution::failure("Unsupported task type: " + task.type);

    if (!resolution) {
        Logger::error("Task " + std::to_string(task.id) + " cannot be resolved: " + resolution.error);
        result.failure         = FailureKind::Resolution;
        result.error_message   = resolution.error;
        result.processing_time = elapsed_since(started);
        result.scraped_at      = std::chrono::system_clock::now();
        return result;
    }

    for (int attempt = 1; attempt <= options_.max_attempts; ++attempt) {
        limiter_.acquire();
        result.attempts = attempt;

        if (attempt > 1) {
            Logger::info("Task " + std::to_string(task.id) + " [Retry "
                         + std::to_string(attempt) + "/" + std::to_string(options_.max_attempts)
                         + "]");
        }

        FetchResponse res = resolution.scraper->fetch(task.url, task.search_word);
        if (res.success) {
            result.data    = std::move(res.records);
            result.success = true;
            result.failure = FailureKind::None;
            result.error_message.clear();
            break;
        }

        result.failure       = FailureKind::Fetch;
        result.error_message = res.error.empty() ? std::string(to_string(res.error_type))
                                                 : res.error;
        Logger::warn("Task " + std::to_string(task.id) + " attempt " + std::to_string(attempt)
                     + " failed [" + to_string(res.error_type) + "]: " + result.error_message);

        if (attempt < options_.max_attempts) {
            std::this_thread::sleep_for(get_backoff_time(options_.retry_backoff, attempt));
        }
    }

    result.processing_time = elapsed_since(started);
    result.scraped_at      = std::chrono::system_clock::now();

    if (result.success) {
        Logger::success("Task " + std::to_string(task.id) + " done by " + name_ + " ("
                        + std::to_string(result.data.size()) + " items, "
                        + std::to_string(result.processing_time.count()) + " ms)");
    }
    else {
        Logger::error("Task " + std::to_string(task.id) + " failed after "
                      + std::to_string(result.attempts) + " attempts: " + result.error_message);
    }
    return result;
}

WorkerStatus Worker::status() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return status_;
}

void Worker::begin_task(TaskId id) {
    std::lock_guard<std::mutex> lock(status_mutex_);
    status_.state        = WorkerState::Busy;
    status_.current_task = id;
}

void Worker::finish_task(bool success) {
    std::lock_guard<std::mutex> lock(status_mutex_);
    status_.state = WorkerState::Idle;
    status_.current_task.reset();
    if (success)
        ++status_.completed;
    else
        ++status_.failed;
}

void Worker::set_state(WorkerState state) {
    std::lock_guard<std::mutex> lock(status_mutex_);
    status_.state = state;
    if (state != WorkerState::Busy)
        status_.current_task.reset();
}

void Worker::publish_fault(const Task& task, const std::string& what) {
    Logger::error("Worker " + name_ + " crashed on task " + std::to_string(task.id) + ": " + what);

    Result result =
        make_failed_result(task, name_, FailureKind::WorkerFault, "Worker fault: " + what);
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        ++status_.failed;
        status_.state = WorkerState::Dead;
        status_.current_task.reset();
    }
    results_.push(std::move(result));
}

}  // namespace Engine
}  // namespace Harvest
