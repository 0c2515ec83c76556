#include <csignal>
#include <system_error>

#include "../../../core/logger/logger.hpp"
#include "../../../core/types/errors.hpp"
#include "../master.hpp"

namespace Harvest {
namespace Engine {

std::thread Master::launch(Worker& worker) {
    return std::thread([&worker]() { worker.run(); });
}

void Master::spawn_workers(int target, int min_workers) {
    WorkerOptions options;
    options.max_attempts  = config_.max_attempts;
    options.retry_backoff = config_.retry_backoff;

    for (int i = 0; i < target; ++i) {
        auto worker = std::make_unique<Worker>(
            "worker-" + std::to_string(i), tasks_, results_channel_, limiter_, selector_, options);
        try {
            std::thread thread = launch(*worker);
            std::lock_guard<std::mutex> lock(workers_mutex_);
            workers_.push_back(std::move(worker));
            threads_.push_back(std::move(thread));
        } catch (const std::system_error& e) {
            Logger::warn("Could not start worker " + std::to_string(i) + ": " + e.what());
            break;
        }
    }

    int started = static_cast<int>(threads_.size());
    if (started < min_workers) {
        Logger::error("Worker pool exhausted: " + std::to_string(started) + "/"
                      + std::to_string(min_workers) + " workers started");
        shutdown();
        phase_ = Phase::Finished;
        throw PoolExhaustionError(started, min_workers);
    }

    if (started < target) {
        Logger::warn("Running with " + std::to_string(started) + " of " + std::to_string(target)
                     + " planned workers");
    }
}

void Master::init_io_services() {
    if (ioc_.stopped())
        ioc_.restart();
    work_guard_ =
        std::make_unique<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
            ioc_.get_executor());

    init_signals();
    monitoring_ = true;
    schedule_monitor();

    io_thread_ = std::thread([this]() {
        try {
            ioc_.run();
        } catch (const std::exception& e) {
            Logger::error("IO Thread Exception: " + std::string(e.what()));
        }
    });
}

void Master::init_signals() {
    if (!config_.handle_signals)
        return;

    signals_.add(SIGINT);
    signals_.add(SIGTERM);
    signals_.async_wait([this](const boost::system::error_code& error, int signal_number) {
        if (!error) {
            Logger::info("Signal " + std::to_string(signal_number) + " received. Cancelling run...");
            cancel();
        }
    });
}

void Master::stop_io_services() {
    if (!io_thread_.joinable())
        return;

    monitoring_ = false;
    boost::asio::post(ioc_, [this]() {
        monitor_timer_.cancel();
        signals_.cancel();
    });
    work_guard_.reset();

    if (io_thread_.get_id() != std::this_thread::get_id())
        io_thread_.join();
}

void Master::shutdown() {
    tasks_.close();

    bool joined = false;
    for (auto& t : threads_) {
        if (t.joinable()) {
            t.join();
            joined = true;
        }
    }

    stop_io_services();

    if (joined)
        Logger::success("All workers stopped.");
}

}  // namespace Engine
}  // namespace Harvest
