#pragma once
#include <optional>
#include <string>
#include <vector>

#include "../types/constants.hpp"

namespace Harvest {
namespace Core {

struct TaskConfig {
    int                        priority = 0;
    std::string                url;
    std::string                type;
    std::optional<std::string> search_word;
};

struct Config {
    int         min_workers         = Constants::DEFAULT_MIN_WORKERS;
    int         max_workers         = Constants::DEFAULT_MAX_WORKERS;
    int         workers             = Constants::DEFAULT_WORKERS;
    double      rate                = Constants::DEFAULT_RATE;
    int         max_attempts        = Constants::MAX_ATTEMPTS;
    int         retry_backoff_ms    = Constants::DEFAULT_RETRY_BACKOFF_MS;
    int         request_timeout     = Constants::REQUEST_TIMEOUT_SECONDS;  // seconds
    int         monitor_interval_ms = Constants::DEFAULT_MONITOR_INTERVAL_MS;
    std::string output_dir          = Constants::DEFAULT_OUTPUT_DIR;
    std::string log_file;
    std::string config_path;
    bool        quiet = false;

    std::vector<std::string> user_agents;
    std::vector<std::string> proxies;
    std::vector<TaskConfig>  tasks;
    std::vector<std::string> only;  // task types to keep; empty keeps all

    // Parses the command line, loads --config when given and re-applies the
    // command line on top. Throws ConfigurationError.
    static Config parse(int argc, char* argv[]);
};

// Merges the YAML file at `path` into `config`. Throws ConfigurationError.
void load_yaml(Config& config, const std::string& path);

}  // namespace Core
}  // namespace Harvest
