#include "run_stats.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace Harvest {
namespace Engine {

double RunStats::success_rate() const {
    if (total_tasks == 0)
        return 0.0;
    return 100.0 * static_cast<double>(succeeded) / static_cast<double>(total_tasks);
}

void StatsAggregator::record(const Result& result) {
    ++count_;
    attempts_ += static_cast<size_t>(result.attempts);
    times_.push_back(result.processing_time);

    TypeStats& type = by_type_[result.source_type];
    ++type.total;

    if (result.success) {
        ++succeeded_;
        ++type.succeeded;
        records_ += result.data.size();
        type.records += result.data.size();
    }
    else {
        ++type.failed;
        ++failures_[to_string(result.failure)];
    }
}

RunStats StatsAggregator::finalize(std::chrono::milliseconds wall_time, size_t workers) const {
    RunStats stats;
    stats.total_tasks    = count_;
    stats.succeeded      = succeeded_;
    stats.failed         = count_ - succeeded_;
    stats.total_records  = records_;
    stats.total_attempts = attempts_;
    stats.workers        = workers;
    stats.wall_time      = wall_time;
    stats.by_type        = by_type_;
    stats.failures       = failures_;

    if (times_.empty())
        return stats;

    std::vector<std::chrono::milliseconds> sorted = times_;
    std::sort(sorted.begin(), sorted.end());

    for (const auto& t : sorted)
        stats.total_processing_time += t;

    stats.mean_processing_time =
        stats.total_processing_time / static_cast<std::chrono::milliseconds::rep>(sorted.size());
    stats.min_processing_time = sorted.front();
    stats.max_processing_time = sorted.back();

    size_t mid = sorted.size() / 2;
    stats.median_processing_time =
        (sorted.size() % 2 == 1) ? sorted[mid] : (sorted[mid - 1] + sorted[mid]) / 2;
    return stats;
}

std::vector<std::string> StatsAggregator::describe(const RunStats& stats) {
    std::vector<std::string> lines;
    std::ostringstream       rate;
    rate << std::fixed << std::setprecision(1) << stats.success_rate();

    lines.push_back("Tasks: " + std::to_string(stats.total_tasks) + " (succeeded "
                    + std::to_string(stats.succeeded) + ", failed "
                    + std::to_string(stats.failed) + ", " + rate.str() + "%)");
    lines.push_back("Records: " + std::to_string(stats.total_records) + ", attempts: "
                    + std::to_string(stats.total_attempts) + ", workers: "
                    + std::to_string(stats.workers));
    lines.push_back("Processing time (ms): mean " + std::to_string(stats.mean_processing_time.count())
                    + ", median " + std::to_string(stats.median_processing_time.count()) + ", min "
                    + std::to_string(stats.min_processing_time.count()) + ", max "
                    + std::to_string(stats.max_processing_time.count()));
    lines.push_back("Wall time: " + std::to_string(stats.wall_time.count()) + " ms");

    for (const auto& [type, t] : stats.by_type) {
        lines.push_back("  " + type + ": " + std::to_string(t.succeeded) + "/"
                        + std::to_string(t.total) + " ok, " + std::to_string(t.records)
                        + " records");
    }
    for (const auto& [kind, n] : stats.failures) {
        lines.push_back("  failures[" + kind + "]: " + std::to_string(n));
    }
    return lines;
}

}  // namespace Engine
}  // namespace Harvest
