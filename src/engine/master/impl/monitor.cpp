#include <iomanip>
#include <sstream>

#include "../../../core/logger/logger.hpp"
#include "../master.hpp"

namespace Harvest {
namespace Engine {

PoolSnapshot Master::snapshot() const {
    PoolSnapshot snap;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        snap.workers.reserve(workers_.size());
        for (const auto& worker : workers_)
            snap.workers.push_back(worker->status());
    }
    snap.queue_depth = tasks_.size();
    snap.completed   = completed_;
    snap.succeeded   = succeeded_;
    snap.total       = submitted_;
    return snap;
}

void Master::schedule_monitor() {
    if (config_.monitor_interval.count() <= 0 || !monitoring_)
        return;

    monitor_timer_.expires_after(config_.monitor_interval);
    monitor_timer_.async_wait([this](const boost::system::error_code& ec) {
        // A tick that already fired when stop was requested completes without an error.
        if (ec || !monitoring_)
            return;
        report_progress();
        schedule_monitor();
    });
}

void Master::report_progress() const {
    PoolSnapshot snap = snapshot();
    if (snap.total == 0)
        return;

    std::ostringstream pct;
    pct << std::fixed << std::setprecision(1)
        << 100.0 * static_cast<double>(snap.completed) / static_cast<double>(snap.total);

    Logger::info("Progress: " + pct.str() + "% completed (" + std::to_string(snap.completed) + "/"
                 + std::to_string(snap.total) + "), succeeded " + std::to_string(snap.succeeded)
                 + ", failed " + std::to_string(snap.completed - snap.succeeded) + ", queued "
                 + std::to_string(snap.queue_depth));

    for (const auto& w : snap.workers) {
        std::string line = "  " + w.name + ": " + to_string(w.state);
        if (w.current_task)
            line += " (task " + std::to_string(*w.current_task) + ")";
        line += ", done " + std::to_string(w.completed) + ", failed " + std::to_string(w.failed);
        Logger::info(line);
    }
}

}  // namespace Engine
}  // namespace Harvest
