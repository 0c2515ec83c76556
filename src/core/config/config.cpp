#include "config.hpp"
#include <CLI/CLI.hpp>
#include <algorithm>
#include <cstdlib>
#include <yaml-cpp/yaml.h>

#include "../../scrapers/selector/scraper_selector.hpp"
#include "../../utils/text/string_utils.hpp"
#include "../types/errors.hpp"

namespace Harvest {
namespace Core {

using Harvest::Utils::Text::to_lower;
using Harvest::Utils::Text::trim;

namespace {

void append_strings(std::vector<std::string>& out, const YAML::Node& node, const char* key) {
    if (!node)
        return;
    if (node.IsScalar()) {
        out.push_back(node.as<std::string>());
        return;
    }
    if (!node.IsSequence())
        throw ConfigurationError(std::string("'") + key + "' must be a string or a list");
    for (const auto& item : node)
        out.push_back(item.as<std::string>());
}

TaskConfig parse_task(const YAML::Node& node, size_t index) {
    std::string where = "tasks[" + std::to_string(index) + "]";
    if (!node.IsMap())
        throw ConfigurationError(where + " must be a mapping");
    if (!node["type"] || !node["type"].IsScalar())
        throw ConfigurationError(where + " is missing 'type'");

    TaskConfig task;
    task.type = node["type"].as<std::string>();
    if (node["priority"])
        task.priority = node["priority"].as<int>();
    if (node["url"] && !node["url"].IsNull())
        task.url = node["url"].as<std::string>();
    if (node["search_word"] && !node["search_word"].IsNull())
        task.search_word = node["search_word"].as<std::string>();
    return task;
}

void validate(const Config& config) {
    if (config.max_attempts < 1)
        throw ConfigurationError("max_attempts must be at least 1");
    if (config.max_attempts > Constants::MAX_ATTEMPTS_LIMIT)
        throw ConfigurationError("max_attempts must not exceed "
                                 + std::to_string(Constants::MAX_ATTEMPTS_LIMIT));
    if (config.request_timeout < 1)
        throw ConfigurationError("request_timeout must be at least 1 second");
    if (config.retry_backoff_ms < 0)
        throw ConfigurationError("retry_backoff_ms must not be negative");
    if (config.workers < 0)
        throw ConfigurationError("workers must not be negative");
}

}  // namespace

void load_yaml(Config& config, const std::string& path) {
    try {
        YAML::Node yaml = YAML::LoadFile(path);
        if (yaml.IsNull())
            return;
        if (!yaml.IsMap())
            throw ConfigurationError("Config file " + path + " must contain a mapping");

        if (yaml["min_workers"])
            config.min_workers = yaml["min_workers"].as<int>();
        if (yaml["max_workers"])
            config.max_workers = yaml["max_workers"].as<int>();
        if (yaml["workers"])
            config.workers = yaml["workers"].as<int>();
        if (yaml["rate"])
            config.rate = yaml["rate"].as<double>();
        if (yaml["max_attempts"])
            config.max_attempts = yaml["max_attempts"].as<int>();
        if (yaml["retry_backoff_ms"])
            config.retry_backoff_ms = yaml["retry_backoff_ms"].as<int>();
        if (yaml["request_timeout"])
            config.request_timeout = yaml["request_timeout"].as<int>();
        if (yaml["monitor_interval_ms"])
            config.monitor_interval_ms = yaml["monitor_interval_ms"].as<int>();
        if (yaml["output"])
            config.output_dir = yaml["output"].as<std::string>();
        if (yaml["output_dir"])
            config.output_dir = yaml["output_dir"].as<std::string>();
        if (yaml["log_file"])
            config.log_file = yaml["log_file"].as<std::string>();

        append_strings(config.user_agents, yaml["user_agent"], "user_agent");
        append_strings(config.user_agents, yaml["user_agents"], "user_agents");
        append_strings(config.user_agents, yaml["userAgents"], "userAgents");
        append_strings(config.proxies, yaml["proxies"], "proxies");

        if (YAML::Node tasks = yaml["tasks"]) {
            if (!tasks.IsSequence())
                throw ConfigurationError("'tasks' must be a list");
            for (size_t i = 0; i < tasks.size(); ++i)
                config.tasks.push_back(parse_task(tasks[i], i));
        }
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Error parsing config file: " + std::string(e.what()));
    }
}

Config Config::parse(int argc, char* argv[]) {
    Config   config;
    CLI::App app{"Harvest - concurrent news, RSS and blog scraper"};

    app.add_option("--config", config.config_path, "Path to YAML configuration file");
    app.add_option("-w,--workers", config.workers, "Pool size (0 = one per task)");
    app.add_option("--min-workers", config.min_workers, "Minimum pool size");
    app.add_option("--max-workers", config.max_workers, "Maximum pool size");
    app.add_option("--rate", config.rate, "Requests per second across the pool (0 = unlimited)");
    app.add_option("--max-attempts", config.max_attempts, "Fetch attempts per task");
    app.add_option("--retry-backoff", config.retry_backoff_ms, "Base retry backoff in ms");
    app.add_option("--timeout", config.request_timeout, "Request timeout in seconds");
    app.add_option("-o,--output", config.output_dir, "Output directory");
    app.add_option("--log-file", config.log_file, "Append log lines to this file");
    app.add_option("--only", config.only, "Run only tasks of this type (repeatable)");
    app.add_flag("-q,--quiet", config.quiet, "Only log warnings and errors");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit(app.exit(e));
    }

    if (!config.config_path.empty()) {
        load_yaml(config, config.config_path);

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            exit(app.exit(e));
        }
    }

    validate(config);

    if (!config.only.empty()) {
        std::vector<std::string> keep;
        for (const auto& type : config.only) {
            auto kind = Scrapers::parse_kind(type);
            if (!kind)
                throw ConfigurationError("Unknown type '" + type + "' in --only (expected one of "
                                         + Scrapers::supported_kinds() + ")");
            keep.push_back(Scrapers::to_string(*kind));
        }

        config.tasks.erase(std::remove_if(config.tasks.begin(),
                                          config.tasks.end(),
                                          [&](const TaskConfig& task) {
                                              return std::find(keep.begin(),
                                                               keep.end(),
                                                               to_lower(trim(task.type)))
                                                     == keep.end();
                                          }),
                           config.tasks.end());
    }

    return config;
}

}  // namespace Core
}  // namespace Harvest
