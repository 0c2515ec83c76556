#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "../task/task.hpp"

namespace Harvest {
namespace Engine {

struct TypeStats {
    size_t total     = 0;
    size_t succeeded = 0;
    size_t failed    = 0;
    size_t records   = 0;
};

struct RunStats {
    size_t total_tasks    = 0;
    size_t succeeded      = 0;
    size_t failed         = 0;
    size_t total_records  = 0;
    size_t total_attempts = 0;
    size_t workers        = 0;

    std::chrono::milliseconds total_processing_time{0};
    std::chrono::milliseconds mean_processing_time{0};
    std::chrono::milliseconds min_processing_time{0};
    std::chrono::milliseconds max_processing_time{0};
    std::chrono::milliseconds median_processing_time{0};
    std::chrono::milliseconds wall_time{0};

    std::map<std::string, TypeStats> by_type;
    std::map<std::string, size_t>    failures;  // keyed by FailureKind name

    double success_rate() const;  // percent, 0 when no tasks
};

// Folds Results into RunStats. Order-independent: only sums, extrema and the
// sorted timing sample are kept.
class StatsAggregator {
public:
    void     record(const Result& result);
    RunStats finalize(std::chrono::milliseconds wall_time, size_t workers) const;

    size_t count() const {
        return count_;
    }
    size_t succeeded() const {
        return succeeded_;
    }
    size_t failed() const {
        return count_ - succeeded_;
    }

    static std::vector<std::string> describe(const RunStats& stats);

private:
    size_t                                 count_     = 0;
    size_t                                 succeeded_ = 0;
    size_t                                 records_   = 0;
    size_t                                 attempts_  = 0;
    std::vector<std::chrono::milliseconds> times_;
    std::map<std::string, TypeStats>       by_type_;
    std::map<std::string, size_t>          failures_;
};

}  // namespace Engine
}  // namespace Harvest
