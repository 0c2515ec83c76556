#pragma once
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../engine/stats/run_stats.hpp"
#include "../engine/task/task.hpp"
#include "storage.hpp"

namespace Harvest {
namespace Storage {

// Serializes a finished run: results.json, <type>_data.json per source type,
// summary.csv and run_stats.json.
class ResultWriter {
public:
    explicit ResultWriter(Storage& storage);

    // Returns false if any file failed to save; the remaining files are still written.
    bool write(const std::vector<Engine::Result>& results, const Engine::RunStats& stats);

    static nlohmann::json to_json(const Engine::Result& result);
    static nlohmann::json to_json(const Engine::RunStats& stats);
    static std::string    to_csv(const std::vector<Engine::Result>& results);

private:
    Storage& storage_;
};

}  // namespace Storage
}  // namespace Harvest
