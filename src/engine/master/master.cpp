#include "master.hpp"
#include <algorithm>

#include "../../core/logger/logger.hpp"
#include "../../core/types/errors.hpp"

namespace Harvest {
namespace Engine {

using namespace Harvest::Core;
using namespace Harvest::Scrapers;

Master::Master(MasterConfig config, ScraperSelector& selector)
    : config_(config), selector_(selector), limiter_(config.requests_per_second) {
}

Master::~Master() {
    shutdown();
}

std::vector<TaskId> Master::submit(std::vector<Task> tasks) {
    if (phase_ != Phase::Idle)
        throw ConfigurationError("Tasks cannot be submitted after the run has started");
    if (tasks.empty())
        throw ConfigurationError("Task list is empty");

    for (auto& task : tasks) {
        auto kind = parse_kind(task.type);
        if (!kind)
            throw ConfigurationError("Unsupported task type: '" + task.type + "' (expected one of "
                                     + supported_kinds() + ")");
        task.type = to_string(*kind);
    }

    std::vector<TaskId> ids;
    ids.reserve(tasks.size());
    for (auto& task : tasks) {
        task.id = next_id_++;
        ids.push_back(task.id);
        pending_.push_back(std::move(task));
    }
    submitted_ = pending_.size();

    Logger::info("Added " + std::to_string(ids.size()) + " tasks");
    return ids;
}

int Master::plan_pool_size(int desired, int min_workers, int max_workers, size_t task_count) {
    long base = desired > 0 ? desired : static_cast<long>(task_count);
    return static_cast<int>(std::clamp<long>(base, min_workers, max_workers));
}

void Master::validate_bounds(int min_workers, int max_workers) const {
    if (min_workers < 1)
        throw ConfigurationError("min_workers must be at least 1");
    if (max_workers < min_workers)
        throw ConfigurationError("max_workers (" + std::to_string(max_workers)
                                 + ") is below min_workers (" + std::to_string(min_workers) + ")");
}

RunStats Master::run(int min_workers, int max_workers) {
    validate_bounds(min_workers, max_workers);
    if (phase_ != Phase::Idle)
        throw ConfigurationError("Master::run may only be called once");
    if (pending_.empty())
        throw ConfigurationError("No tasks submitted");

    phase_       = Phase::Running;
    auto started = std::chrono::steady_clock::now();

    int target = plan_pool_size(config_.workers, min_workers, max_workers, pending_.size());
    Logger::info("Starting " + std::to_string(target) + " workers (bounds "
                 + std::to_string(min_workers) + ".." + std::to_string(max_workers) + ") for "
                 + std::to_string(pending_.size()) + " tasks");

    spawn_workers(target, min_workers);

    tasks_.push_all(std::move(pending_));
    pending_.clear();

    init_io_services();
    try {
        collect_results();
    } catch (...) {
        shutdown();
        phase_ = Phase::Finished;
        throw;
    }
    shutdown();
    phase_ = Phase::Finished;

    auto wall = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    size_t pool_size;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        pool_size = workers_.size();
    }
    RunStats stats = aggregator_.finalize(wall, pool_size);
    for (const auto& line : StatsAggregator::describe(stats))
        Logger::info(line);
    return stats;
}

void Master::collect_results() {
    Logger::info("Collecting results");

    while (results_.size() < submitted_) {
        if (auto result = results_channel_.pop_for(config_.poll_interval)) {
            accept(std::move(*result));
        }

        if (cancelled_) {
            fail_stranded(FailureKind::Cancelled, "Run cancelled before the task started");
        }
        else if (live_workers() == 0 && !tasks_.empty()) {
            Logger::error("No live workers left, failing queued tasks");
            fail_stranded(FailureKind::WorkerFault, "No live worker left to run the task");
        }
    }
}

void Master::accept(Result result) {
    if (!seen_.insert(result.task_id).second) {
        Logger::error("Duplicate result for task " + std::to_string(result.task_id) + " ignored");
        return;
    }

    if (result.success) {
        ++succeeded_;
        Logger::info("Task " + std::to_string(result.task_id) + " completed successfully by "
                     + result.worker_name + " (" + std::to_string(result.data.size())
                     + " items)");
    }
    else {
        Logger::warn("Task " + std::to_string(result.task_id) + " failed: "
                     + result.error_message);
    }

    aggregator_.record(result);
    results_.push_back(std::move(result));
    ++completed_;
}

void Master::fail_stranded(FailureKind failure, const std::string& message) {
    for (const auto& task : tasks_.drain()) {
        accept(make_failed_result(task, "master", failure, message));
    }
}

size_t Master::live_workers() const {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    return static_cast<size_t>(
        std::count_if(workers_.begin(), workers_.end(), [](const std::unique_ptr<Worker>& w) {
            auto state = w->status().state;
            return state != WorkerState::Dead && state != WorkerState::Stopped;
        }));
}

void Master::cancel() {
    if (cancelled_.exchange(true))
        return;
    Logger::warn("Cancellation requested, in-flight tasks will finish");
    tasks_.close();
}

std::vector<Result> Master::take_results() {
    std::vector<Result> out = std::move(results_);
    results_.clear();
    return out;
}

}  // namespace Engine
}  // namespace Harvest
