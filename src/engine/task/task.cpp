#include "task.hpp"

namespace Harvest {
namespace Engine {

const char* to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::None: return "none";
        case FailureKind::Resolution: return "resolution";
        case FailureKind::Fetch: return "fetch";
        case FailureKind::WorkerFault: return "worker_fault";
        case FailureKind::Cancelled: return "cancelled";
    }
    return "unknown";
}

Result make_failed_result(const Task&        task,
                          const std::string& worker_name,
                          FailureKind        failure,
                          const std::string& message) {
    Result r;
    r.task_id       = task.id;
    r.worker_name   = worker_name;
    r.source_type   = task.type;
    r.success       = false;
    r.error_message = message;
    r.failure       = failure;
    r.scraped_at    = std::chrono::system_clock::now();
    return r;
}

}  // namespace Engine
}  // namespace Harvest
