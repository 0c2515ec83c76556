#include "result_writer.hpp"
#include <ctime>
#include <iomanip>
#include <map>
#include <sstream>

namespace Harvest {
namespace Storage {

using nlohmann::json;

namespace {

std::string iso_time(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm     tm{};
    gmtime_r(&t, &tm);
    std::ostringstream os;
    os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return os.str();
}

std::string csv_field(const std::string& value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos)
        return value;
    std::string out = "\"";
    for (char c : value) {
        if (c == '"')
            out += '"';
        out += c;
    }
    return out + "\"";
}

// Scraped text is stored as fetched; invalid UTF-8 is written as U+FFFD.
std::string dump(const json& j) {
    return j.dump(2, ' ', false, json::error_handler_t::replace);
}

json records_json(const Core::Records& records) {
    json out = json::array();
    for (const auto& record : records)
        out.push_back(json(record));
    return out;
}

}  // namespace

ResultWriter::ResultWriter(Storage& storage) : storage_(storage) {
}

json ResultWriter::to_json(const Engine::Result& result) {
    json j = {{"task_id", result.task_id},
              {"worker_name", result.worker_name},
              {"source_type", result.source_type},
              {"success", result.success},
              {"processing_time", result.processing_time.count() / 1000.0},
              {"attempts", result.attempts},
              {"data_count", result.data.size()},
              {"data", records_json(result.data)},
              {"scraped_at", iso_time(result.scraped_at)}};
    if (!result.success) {
        j["error_message"] = result.error_message;
        j["failure"]       = Engine::to_string(result.failure);
    }
    return j;
}

json ResultWriter::to_json(const Engine::RunStats& stats) {
    json by_type = json::object();
    for (const auto& [type, s] : stats.by_type) {
        by_type[type] = {{"total", s.total},
                         {"succeeded", s.succeeded},
                         {"failed", s.failed},
                         {"records", s.records}};
    }

    return {{"total_tasks", stats.total_tasks},
            {"succeeded", stats.succeeded},
            {"failed", stats.failed},
            {"success_rate", stats.success_rate()},
            {"total_records", stats.total_records},
            {"total_attempts", stats.total_attempts},
            {"workers", stats.workers},
            {"processing_time_ms",
             {{"total", stats.total_processing_time.count()},
              {"mean", stats.mean_processing_time.count()},
              {"min", stats.min_processing_time.count()},
              {"max", stats.max_processing_time.count()},
              {"median", stats.median_processing_time.count()}}},
            {"wall_time_ms", stats.wall_time.count()},
            {"by_type", by_type},
            {"failures", json(stats.failures)}};
}

std::string ResultWriter::to_csv(const std::vector<Engine::Result>& results) {
    std::ostringstream os;
    os << "task_id,worker_name,source_type,success,processing_time,data_count,attempts,"
          "error_message\n";
    for (const auto& r : results) {
        os << r.task_id << ',' << csv_field(r.worker_name) << ',' << csv_field(r.source_type)
           << ',' << (r.success ? "true" : "false") << ',' << std::fixed << std::setprecision(3)
           << r.processing_time.count() / 1000.0 << ',' << r.data.size() << ',' << r.attempts
           << ',' << csv_field(r.error_message) << '\n';
    }
    return os.str();
}

bool ResultWriter::write(const std::vector<Engine::Result>& results,
                         const Engine::RunStats&            stats) {
    json                        all = json::array();
    std::map<std::string, json> by_type;
    for (const auto& result : results) {
        all.push_back(to_json(result));
        if (!result.success)
            continue;
        json& bucket = by_type[result.source_type];
        if (bucket.is_null())
            bucket = json::array();
        for (const auto& record : result.data)
            bucket.push_back(json(record));
    }

    bool ok = storage_.save("results.json", dump(all));
    for (const auto& [type, records] : by_type)
        ok = storage_.save(type + "_data.json", dump(records)) && ok;
    ok = storage_.save("summary.csv", to_csv(results)) && ok;
    ok = storage_.save("run_stats.json", dump(to_json(stats))) && ok;
    return ok;
}

}  // namespace Storage
}  // namespace Harvest
