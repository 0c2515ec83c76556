#include <curl/curl.h>

#include "core/config/config.hpp"
#include "core/logger/logger.hpp"
#include "core/types/errors.hpp"
#include "engine/master/master.hpp"
#include "scrapers/selector/default_selector.hpp"
#include "storage/disk_storage.hpp"
#include "storage/result_writer.hpp"

namespace {

using namespace Harvest;

enum ExitCode { EXIT_ALL_SUCCEEDED = 0, EXIT_SETUP_FAILED = 1, EXIT_TASKS_FAILED = 2 };

std::vector<Engine::Task> build_tasks(const Core::Config& config) {
    std::vector<Engine::Task> tasks;
    tasks.reserve(config.tasks.size());
    for (const auto& entry : config.tasks) {
        Engine::Task task;
        task.priority    = entry.priority;
        task.url         = entry.url;
        task.type        = entry.type;
        task.search_word = entry.search_word;
        tasks.push_back(std::move(task));
    }
    return tasks;
}

int run_scraper(const Core::Config& config) {
    Scrapers::ScraperSettings settings;
    settings.user_agents = config.user_agents;
    settings.proxies     = config.proxies;
    settings.timeout     = std::chrono::seconds(config.request_timeout);
    Scrapers::DefaultScraperSelector selector(settings);

    Engine::MasterConfig master_config;
    master_config.workers             = config.workers;
    master_config.requests_per_second = config.rate;
    master_config.max_attempts        = config.max_attempts;
    master_config.retry_backoff       = std::chrono::milliseconds(config.retry_backoff_ms);
    master_config.monitor_interval    = std::chrono::milliseconds(config.monitor_interval_ms);
    master_config.handle_signals      = true;

    Engine::Master master(master_config, selector);
    master.submit(build_tasks(config));
    Engine::RunStats stats = master.run(config.min_workers, config.max_workers);

    Storage::DiskStorage  storage(config.output_dir);
    Storage::ResultWriter writer(storage);
    if (!writer.write(master.results(), stats))
        Core::Logger::warn("Some output files could not be written to " + config.output_dir);

    return stats.failed == 0 ? EXIT_ALL_SUCCEEDED : EXIT_TASKS_FAILED;
}

}  // namespace

int main(int argc, char* argv[]) {
    using Harvest::Core::Logger;

    try {
        auto config = Harvest::Core::Config::parse(argc, argv);

        if (config.quiet)
            Logger::set_level(Harvest::Core::LOG_WARN | Harvest::Core::LOG_ERROR);
        if (!config.log_file.empty() && !Logger::set_file(config.log_file))
            Logger::warn("Cannot open log file " + config.log_file);

        curl_global_init(CURL_GLOBAL_ALL);
        int code = run_scraper(config);
        curl_global_cleanup();
        return code;
    } catch (const Harvest::Core::ConfigurationError& e) {
        Logger::error("Configuration error: " + std::string(e.what()));
    } catch (const Harvest::Core::PoolExhaustionError& e) {
        Logger::error("Worker pool exhausted: " + std::string(e.what()));
    } catch (const std::exception& e) {
        Logger::error("Fatal error: " + std::string(e.what()));
    }
    curl_global_cleanup();
    return EXIT_SETUP_FAILED;
}
