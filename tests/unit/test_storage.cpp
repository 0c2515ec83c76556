#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <map>
#include <nlohmann/json.hpp>
#include <set>
#include "../../src/core/logger/logger.hpp"
#include "../../src/storage/disk_storage.hpp"
#include "../../src/storage/result_writer.hpp"

using namespace Harvest::Storage;
using namespace Harvest::Engine;
namespace fs = std::filesystem;

namespace {
std::string read_all(const fs::path& path) {
    std::ifstream file(path);
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

// Records every key; fails the ones listed.
class MemoryStorage : public Storage {
public:
    std::map<std::string, std::string> files;
    std::set<std::string>              failing;

    bool save(const std::string& key, const std::string& content) override {
        if (failing.count(key))
            return false;
        files[key] = content;
        return true;
    }
};

Result make_result(TaskId id, const std::string& type, bool success) {
    Result r;
    r.task_id         = id;
    r.worker_name     = "worker-" + std::to_string(id % 2);
    r.source_type     = type;
    r.success         = success;
    r.attempts        = success ? 1 : 3;
    r.processing_time = std::chrono::milliseconds(1500);
    r.scraped_at      = std::chrono::system_clock::time_point{};
    if (success) {
        r.data.push_back({{"title", "Story " + std::to_string(id)}, {"url", "http://x/" + type}});
    }
    else {
        r.failure       = FailureKind::Fetch;
        r.error_message = "HTTP 500, \"upstream\"";
    }
    return r;
}
}  // namespace

class StorageTest : public ::testing::Test {
protected:
    void SetUp() override {
        Harvest::Core::Logger::set_level(Harvest::Core::LOG_ERROR);
        if (fs::exists("test_storage_out"))
            fs::remove_all("test_storage_out");
    }

    void TearDown() override {
        if (fs::exists("test_storage_out"))
            fs::remove_all("test_storage_out");
        Harvest::Core::Logger::set_level(Harvest::Core::LOG_ALL);
    }
};

TEST_F(StorageTest, DiskStorageCreation) {
    DiskStorage storage("test_storage_out");
    EXPECT_TRUE(storage.save("test.txt", "Hello World"));

    EXPECT_TRUE(fs::exists("test_storage_out/test.txt"));
    EXPECT_EQ(read_all("test_storage_out/test.txt"), "Hello World");
}

TEST_F(StorageTest, NestedDirectoryCreation) {
    DiskStorage storage("test_storage_out");
    EXPECT_TRUE(storage.save("deep/path/to/file.json", "{}"));

    EXPECT_TRUE(fs::exists("test_storage_out/deep/path/to/file.json"));
}

TEST_F(StorageTest, OverwritesExistingFile) {
    DiskStorage storage("test_storage_out");
    storage.save("summary.csv", "a much longer first version");
    storage.save("summary.csv", "short");

    EXPECT_EQ(read_all("test_storage_out/summary.csv"), "short");
}

TEST_F(StorageTest, SaveIntoFileFails) {
    DiskStorage storage("test_storage_out");
    storage.save("blocker", "x");

    EXPECT_FALSE(storage.save("blocker/child.json", "{}"));
}

TEST_F(StorageTest, WriterProducesEveryFile) {
    MemoryStorage       storage;
    ResultWriter        writer(storage);
    std::vector<Result> results = {make_result(0, "news", true), make_result(1, "rss", true),
                                   make_result(2, "news", true), make_result(3, "blog", false)};

    StatsAggregator agg;
    for (const auto& r : results)
        agg.record(r);

    EXPECT_TRUE(writer.write(results, agg.finalize(std::chrono::milliseconds(3000), 2)));

    ASSERT_TRUE(storage.files.count("results.json"));
    ASSERT_TRUE(storage.files.count("news_data.json"));
    ASSERT_TRUE(storage.files.count("rss_data.json"));
    EXPECT_FALSE(storage.files.count("blog_data.json"));
    ASSERT_TRUE(storage.files.count("summary.csv"));
    ASSERT_TRUE(storage.files.count("run_stats.json"));

    auto all = nlohmann::json::parse(storage.files["results.json"]);
    ASSERT_EQ(all.size(), 4u);
    EXPECT_EQ(all[3]["failure"], "fetch");
    EXPECT_EQ(all[0]["data_count"], 1);
    EXPECT_DOUBLE_EQ(all[0]["processing_time"].get<double>(), 1.5);
    EXPECT_EQ(all[0]["scraped_at"], "1970-01-01T00:00:00Z");

    auto news = nlohmann::json::parse(storage.files["news_data.json"]);
    ASSERT_EQ(news.size(), 2u);
    EXPECT_EQ(news[1]["title"], "Story 2");

    auto stats = nlohmann::json::parse(storage.files["run_stats.json"]);
    EXPECT_EQ(stats["total_tasks"], 4);
    EXPECT_EQ(stats["failed"], 1);
    EXPECT_EQ(stats["by_type"]["news"]["records"], 2);
    EXPECT_EQ(stats["failures"]["fetch"], 1);
}

TEST_F(StorageTest, SummaryCsvQuotesFields) {
    std::string csv = ResultWriter::to_csv({make_result(7, "blog", false)});

    EXPECT_EQ(csv,
              "task_id,worker_name,source_type,success,processing_time,data_count,attempts,"
              "error_message\n"
              "7,worker-1,blog,false,1.500,0,3,\"HTTP 500, \"\"upstream\"\"\"\n");
}

TEST_F(StorageTest, WriterReportsFailedSaves) {
    MemoryStorage storage;
    storage.failing.insert("summary.csv");
    ResultWriter writer(storage);

    std::vector<Result> results = {make_result(0, "news", true)};
    EXPECT_FALSE(writer.write(results, RunStats{}));
    EXPECT_TRUE(storage.files.count("run_stats.json"));
}

TEST_F(StorageTest, InvalidUtf8IsReplacedNotFatal) {
    Result latin1 = make_result(0, "rss", true);
    latin1.data   = {{{"title", "Caf\xE9"}, {"summary", "na\xEFve \xC3"}}};

    MemoryStorage storage;
    ResultWriter  writer(storage);
    bool          ok = false;
    ASSERT_NO_THROW(ok = writer.write({latin1}, RunStats{}));
    EXPECT_TRUE(ok);

    auto results = nlohmann::json::parse(storage.files.at("results.json"));
    EXPECT_EQ(results[0]["data"][0]["title"], "Caf\xEF\xBF\xBD");

    auto feed = nlohmann::json::parse(storage.files.at("rss_data.json"));
    ASSERT_EQ(feed.size(), 1u);
    EXPECT_EQ(feed[0]["title"], "Caf\xEF\xBF\xBD");
}
