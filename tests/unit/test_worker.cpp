#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>
#include "../../src/core/logger/logger.hpp"
#include "../../src/engine/worker/worker.hpp"
#include "test_doubles.hpp"

using namespace Harvest::Engine;
using namespace Harvest::Scrapers;
using namespace Harvest::Testing;

class WorkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Harvest::Core::Logger::set_level(Harvest::Core::LOG_ERROR);
        options_.max_attempts  = 3;
        options_.retry_backoff = std::chrono::milliseconds(10);
    }

    void TearDown() override {
        Harvest::Core::Logger::set_level(Harvest::Core::LOG_ALL);
    }

    Task task(TaskId id, const std::string& type = "news") {
        Task t;
        t.id   = id;
        t.type = type;
        t.url  = "http://example.com/" + std::to_string(id);
        return t;
    }

    TaskQueue       queue_;
    Channel<Result> results_;
    RateLimiter     limiter_{0.0};
    FakeSelector    selector_;
    WorkerOptions   options_;
};

TEST_F(WorkerTest, RetriesUntilSuccess) {
    selector_.on(ScraperKind::News, [this]() {
        return selector_.logged([](const std::string& url, int call) {
            if (call < 3)
                return FetchResponse::failure(ErrorType::Network, "connection reset");
            return one_record(url);
        });
    });
    Worker worker("w", queue_, results_, limiter_, selector_, options_);

    Result r = worker.execute(task(7));

    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.attempts, 3);
    EXPECT_EQ(r.task_id, 7u);
    EXPECT_EQ(r.worker_name, "w");
    EXPECT_EQ(r.failure, FailureKind::None);
    EXPECT_TRUE(r.error_message.empty());
    EXPECT_EQ(r.data.size(), 1u);
    // Backoff after attempts 1 and 2: 10 ms + 20 ms.
    EXPECT_GE(r.processing_time.count(), 30);
    EXPECT_EQ(selector_.dispatched().size(), 3u);
}

TEST_F(WorkerTest, GivesUpAfterMaxAttempts) {
    selector_.on(ScraperKind::Rss, [this]() {
        return selector_.logged([](const std::string&, int call) {
            return FetchResponse::failure(ErrorType::Timeout, "timed out #" + std::to_string(call));
        });
    });
    Worker worker("w", queue_, results_, limiter_, selector_, options_);

    Result r = worker.execute(task(1, "rss"));

    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.attempts, 3);
    EXPECT_EQ(r.failure, FailureKind::Fetch);
    EXPECT_EQ(r.error_message, "timed out #3");
    EXPECT_TRUE(r.data.empty());
    EXPECT_EQ(selector_.dispatched().size(), 3u);
}

TEST_F(WorkerTest, SingleAttemptConfigured) {
    options_.max_attempts = 1;
    selector_.on(ScraperKind::Blog, [this]() {
        return selector_.logged(
            [](const std::string&, int) { return FetchResponse::failure(ErrorType::Http, "HTTP 503"); });
    });
    Worker worker("w", queue_, results_, limiter_, selector_, options_);

    Result r = worker.execute(task(1, "blog"));
    EXPECT_EQ(r.attempts, 1);
    EXPECT_EQ(r.error_message, "HTTP 503");
}

TEST_F(WorkerTest, ResolutionFailureIsNotRetried) {
    Worker worker("w", queue_, results_, limiter_, selector_, options_);

    Result r = worker.execute(task(2, "blog"));

    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.attempts, 0);
    EXPECT_EQ(r.failure, FailureKind::Resolution);
    EXPECT_NE(r.error_message.find("blog"), std::string::npos);
    EXPECT_EQ(selector_.resolutions(), 1);
}

TEST_F(WorkerTest, UnknownTypeNeverReachesSelector) {
    selector_.succeed_all();
    Worker worker("w", queue_, results_, limiter_, selector_, options_);

    Result r = worker.execute(task(3, "video"));

    EXPECT_EQ(r.failure, FailureKind::Resolution);
    EXPECT_EQ(r.attempts, 0);
    EXPECT_EQ(selector_.resolutions(), 0);
}

TEST_F(WorkerTest, RunPublishesOneResultPerTask) {
    selector_.succeed_all();
    queue_.push_all({task(0), task(1, "rss"), task(2, "blog")});

    Worker      worker("w", queue_, results_, limiter_, selector_, options_);
    std::thread thread([&]() { worker.run(); });

    std::vector<Result> collected;
    while (collected.size() < 3) {
        if (auto r = results_.pop_for(std::chrono::seconds(5)))
            collected.push_back(std::move(*r));
        else
            break;
    }
    queue_.close();
    thread.join();

    ASSERT_EQ(collected.size(), 3u);
    auto status = worker.status();
    EXPECT_EQ(status.state, WorkerState::Stopped);
    EXPECT_EQ(status.completed, 3u);
    EXPECT_EQ(status.failed, 0u);
    EXPECT_FALSE(status.current_task.has_value());
}

TEST_F(WorkerTest, ScraperExceptionKillsWorker) {
    selector_.on(ScraperKind::News, [this]() {
        return selector_.logged([](const std::string&, int) -> FetchResponse {
            throw std::runtime_error("parser exploded");
        });
    });
    queue_.push_all({task(0), task(1)});

    Worker worker("w", queue_, results_, limiter_, selector_, options_);
    worker.run();

    auto fault = results_.try_pop();
    ASSERT_TRUE(fault.has_value());
    EXPECT_EQ(fault->task_id, 0u);
    EXPECT_FALSE(fault->success);
    EXPECT_EQ(fault->failure, FailureKind::WorkerFault);
    EXPECT_NE(fault->error_message.find("parser exploded"), std::string::npos);

    EXPECT_FALSE(results_.try_pop().has_value());
    EXPECT_EQ(worker.status().state, WorkerState::Dead);
    EXPECT_EQ(worker.status().failed, 1u);
    EXPECT_EQ(queue_.size(), 1u);
}

TEST(BackoffTest, DoublesThenCaps) {
    using Harvest::Core::Constants;
    using Harvest::Core::get_backoff_time;
    using std::chrono::milliseconds;

    EXPECT_EQ(get_backoff_time(milliseconds(2000), 0), milliseconds(0));
    EXPECT_EQ(get_backoff_time(milliseconds(2000), 1), milliseconds(2000));
    EXPECT_EQ(get_backoff_time(milliseconds(2000), 3), milliseconds(8000));
    EXPECT_EQ(get_backoff_time(milliseconds(0), 5), milliseconds(0));

    const milliseconds cap(Constants::MAX_RETRY_BACKOFF_MS);
    EXPECT_EQ(get_backoff_time(milliseconds(2000), 31), cap);
    EXPECT_EQ(get_backoff_time(milliseconds(2000), 33), cap);
    EXPECT_EQ(get_backoff_time(milliseconds(2000), 1000), cap);
    EXPECT_EQ(get_backoff_time(milliseconds(10), 40), milliseconds(10 * 1024));
    EXPECT_EQ(get_backoff_time(milliseconds(90000), 1), cap);
}
