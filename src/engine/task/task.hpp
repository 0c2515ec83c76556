#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "../../core/types/record.hpp"

namespace Harvest {
namespace Engine {

using TaskId = std::uint64_t;

struct Task {
    TaskId                     id       = 0;
    int                        priority = 0;  // higher runs sooner
    std::string                url;
    std::string                type;
    std::optional<std::string> search_word;
};

enum class FailureKind { None, Resolution, Fetch, WorkerFault, Cancelled };

const char* to_string(FailureKind kind);

struct Result {
    TaskId                                task_id = 0;
    std::string                           worker_name;
    std::string                           source_type;
    Core::Records                         data;
    bool                                  success = false;
    std::string                           error_message;
    std::chrono::milliseconds             processing_time{0};
    int                                   attempts = 0;
    FailureKind                           failure  = FailureKind::None;
    std::chrono::system_clock::time_point scraped_at;
};

// Failed Result for a task that never reached a scraper call.
Result make_failed_result(const Task&        task,
                          const std::string& worker_name,
                          FailureKind        failure,
                          const std::string& message);

}  // namespace Engine
}  // namespace Harvest
