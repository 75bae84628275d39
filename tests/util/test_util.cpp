// VEIL - Util Module Tests
// Copyright (c) 2024 VEIL Developers
// MIT License

#include <gtest/gtest.h>

#include "veil/util/logging.h"
#include "veil/util/threadpool.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

namespace veil {
namespace util {
namespace {

// ============================================================================
// Logging Tests
// ============================================================================

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().EnableAllCategories();
        Logger::Instance().SetLevel(LogLevel::Info);
    }

    void TearDown() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().EnableAllCategories();
        Logger::Instance().SetLevel(LogLevel::Info);
    }

    std::shared_ptr<CallbackSink> Capture(std::vector<LogEntry>& out) {
        auto sink = std::make_shared<CallbackSink>(
            [&out](const LogEntry& entry) { out.push_back(entry); });
        Logger::Instance().AddSink(sink);
        return sink;
    }
};

TEST_F(LoggingTest, LogLevelToString) {
    EXPECT_STREQ(LogLevelToString(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(LogLevelToString(LogLevel::Debug), "DEBUG");
    EXPECT_STREQ(LogLevelToString(LogLevel::Info), "INFO");
    EXPECT_STREQ(LogLevelToString(LogLevel::Warn), "WARN");
    EXPECT_STREQ(LogLevelToString(LogLevel::Error), "ERROR");
}

TEST_F(LoggingTest, ParseLogLevel) {
    EXPECT_EQ(ParseLogLevel("trace"), LogLevel::Trace);
    EXPECT_EQ(ParseLogLevel("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(ParseLogLevel("Warning"), LogLevel::Warn);
    EXPECT_EQ(ParseLogLevel("none"), LogLevel::Off);
    EXPECT_FALSE(ParseLogLevel("invalid").has_value());
    EXPECT_FALSE(ParseLogLevel("").has_value());
}

TEST_F(LoggingTest, LoggerAddRemoveSink) {
    auto& logger = Logger::Instance();
    EXPECT_EQ(logger.SinkCount(), 0u);

    auto sink = std::make_shared<ConsoleSink>();
    logger.AddSink(sink);
    EXPECT_EQ(logger.SinkCount(), 1u);

    logger.RemoveSink(sink);
    EXPECT_EQ(logger.SinkCount(), 0u);
}

TEST_F(LoggingTest, LevelFiltering) {
    std::vector<LogEntry> entries;
    Capture(entries);

    LOG_DEBUG(LogCategory::PROOF) << "hidden";
    LOG_WARN(LogCategory::PROOF) << "shown " << 42;

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message, "shown 42");
    EXPECT_EQ(entries[0].category, LogCategory::PROOF);
    EXPECT_EQ(entries[0].level, LogLevel::Warn);
}

TEST_F(LoggingTest, CategoryFiltering) {
    auto& logger = Logger::Instance();
    logger.EnableCategory(LogCategory::DISPATCH);

    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::DISPATCH));
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::ELGAMAL));

    std::vector<LogEntry> entries;
    Capture(entries);
    LOG_INFO(LogCategory::ELGAMAL) << "filtered";
    LOG_INFO(LogCategory::DISPATCH) << "kept";
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message, "kept");

    logger.DisableCategory(LogCategory::DISPATCH);
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::DISPATCH));

    logger.EnableAllCategories();
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::ELGAMAL));
}

TEST_F(LoggingTest, PrintfStyle) {
    std::vector<LogEntry> entries;
    Capture(entries);

    LogWarnF(LogCategory::BENCH, "%d proofs in %.1f ms", 3, 12.5);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message, "3 proofs in 12.5 ms");
}

TEST_F(LoggingTest, CallbackSinkRespectsOwnLevel) {
    std::vector<LogEntry> entries;
    auto sink = std::make_shared<CallbackSink>(
        [&entries](const LogEntry& entry) { entries.push_back(entry); }, LogLevel::Error);
    Logger::Instance().AddSink(sink);

    Logger::Instance().Log(LogLevel::Warn, LogCategory::DEFAULT, "below sink level");
    Logger::Instance().Log(LogLevel::Error, LogCategory::DEFAULT, "at sink level");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message, "at sink level");
}

TEST_F(LoggingTest, ConsoleSinkFormat) {
    ConsoleSink::Options options;
    options.colors = false;
    options.timestamps = false;
    ConsoleSink sink(options);

    LogEntry entry;
    entry.level = LogLevel::Warn;
    entry.category = LogCategory::TRANSFER;
    entry.message = "insufficient balance";

    std::string line = sink.Format(entry);
    EXPECT_NE(line.find("WARN"), std::string::npos);
    EXPECT_NE(line.find("[transfer]"), std::string::npos);
    EXPECT_NE(line.find("insufficient balance"), std::string::npos);
}

TEST_F(LoggingTest, ScopedLogTimer) {
    Logger::Instance().SetLevel(LogLevel::Debug);
    std::vector<LogEntry> entries;
    Capture(entries);
    {
        ScopedLogTimer timer(LogCategory::BENCH, "sleep");
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        EXPECT_GE(timer.ElapsedMs(), 4.0);
    }
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_NE(entries[0].message.find("sleep took"), std::string::npos);
}

TEST_F(LoggingTest, ScopedLogTimerOverBudgetWarns) {
    std::vector<LogEntry> entries;
    Capture(entries);
    {
        ScopedLogTimer timer(LogCategory::PROOF, "range proof", 1.0);
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].level, LogLevel::Warn);
    EXPECT_NE(entries[0].message.find("budget 1 ms"), std::string::npos);
}

TEST_F(LoggingTest, ConfigureInstallsConsoleSink) {
    auto& logger = Logger::Instance();
    std::vector<LogEntry> entries;
    Capture(entries);

    LogOptions options;
    options.level = LogLevel::Off;
    options.console = true;
    logger.Configure(options);
    EXPECT_EQ(logger.SinkCount(), 2u);

    // Reconfiguring replaces the console sink instead of stacking another
    logger.Configure(options);
    EXPECT_EQ(logger.SinkCount(), 2u);

    options.console = false;
    options.level = LogLevel::Info;
    options.categories = {LogCategory::TRANSFER};
    logger.Configure(options);
    EXPECT_EQ(logger.SinkCount(), 1u);

    LOG_INFO(LogCategory::PROOF) << "filtered";
    LOG_INFO(LogCategory::TRANSFER) << "kept";
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].category, LogCategory::TRANSFER);
}

// ============================================================================
// ThreadPool Tests
// ============================================================================

class ThreadPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        pool_ = std::make_unique<ThreadPool>(4);
    }

    void TearDown() override {
        pool_.reset();
    }

    std::unique_ptr<ThreadPool> pool_;
};

TEST_F(ThreadPoolTest, Construction) {
    EXPECT_TRUE(pool_->IsRunning());
    EXPECT_EQ(pool_->ThreadCount(), 4u);
}

TEST_F(ThreadPoolTest, SubmitReturnsValue) {
    auto future = pool_->Submit([]() { return 42; });
    EXPECT_EQ(future.get(), 42);
}

TEST_F(ThreadPoolTest, MultipleTasks) {
    const int numTasks = 100;
    std::atomic<int> counter{0};

    std::vector<std::future<void>> futures;
    for (int i = 0; i < numTasks; ++i) {
        futures.push_back(pool_->Submit([&counter]() { counter++; }));
    }
    for (auto& f : futures) {
        f.get();
    }
    EXPECT_EQ(counter.load(), numTasks);
}

TEST_F(ThreadPoolTest, ExceptionPropagatesThroughFuture) {
    auto future = pool_->Submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST_F(ThreadPoolTest, WaitDrainsQueue) {
    std::atomic<int> counter{0};
    for (int i = 0; i < 20; ++i) {
        pool_->Submit([&counter]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            counter++;
        });
    }
    pool_->Wait();
    EXPECT_EQ(counter.load(), 20);
    EXPECT_EQ(pool_->PendingTasks(), 0u);
}

TEST_F(ThreadPoolTest, SubmitAfterShutdownThrows) {
    pool_->Shutdown();
    EXPECT_FALSE(pool_->IsRunning());
    EXPECT_THROW(pool_->Submit([]() {}), std::runtime_error);
}

TEST_F(ThreadPoolTest, ParallelForIndexCoversRange) {
    std::vector<int> hits(64, 0);
    ParallelForIndex(*pool_, 0, hits.size(), [&hits](size_t i) { hits[i] += 1; });
    for (int h : hits) {
        EXPECT_EQ(h, 1);
    }
}

TEST_F(ThreadPoolTest, ParallelForIndexRethrows) {
    std::atomic<int> completed{0};
    EXPECT_THROW(
        ParallelForIndex(*pool_, 0, 10, [&completed](size_t i) {
            if (i == 3) {
                throw std::invalid_argument("bad index");
            }
            completed++;
        }),
        std::invalid_argument);
    EXPECT_EQ(completed.load(), 9);
}

TEST(ThreadPoolQueueTest, ParallelForWaitsWhenQueueOverflows) {
    ThreadPool pool(ThreadPool::Config{1, 4, "small"});
    std::atomic<bool> started{false};
    std::atomic<bool> release{false};
    std::atomic<int> ran{0};

    // Hold the only worker so the queue fills up
    auto blocker = pool.Submit([&started, &release]() {
        started.store(true);
        while (!release.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    });
    while (!started.load()) {
        std::this_thread::yield();
    }

    std::thread releaser([&release]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        release.store(true);
    });

    EXPECT_THROW(
        ParallelForChunks(pool, 64, 1, [&ran](size_t, size_t) { ran++; }),
        std::runtime_error);

    // Every chunk that made it into the queue finished before the throw
    const int afterThrow = ran.load();
    EXPECT_EQ(afterThrow, 4);
    EXPECT_EQ(pool.PendingTasks(), 0u);

    releaser.join();
    blocker.get();
    pool.Wait();
    EXPECT_EQ(ran.load(), afterThrow);

    // Still usable afterwards
    EXPECT_EQ(pool.Submit([]() { return 7; }).get(), 7);
}

TEST_F(ThreadPoolTest, ParallelForChunksSplitsRange) {
    std::mutex mutex;
    std::vector<std::pair<size_t, size_t>> runs;
    ParallelForChunks(*pool_, 11, 4, [&](size_t first, size_t last) {
        std::lock_guard<std::mutex> lock(mutex);
        runs.emplace_back(first, last);
    });
    std::sort(runs.begin(), runs.end());

    using Run = std::pair<size_t, size_t>;
    EXPECT_EQ(runs, (std::vector<Run>{{0, 4}, {4, 8}, {8, 11}}));

    runs.clear();
    ParallelForChunks(*pool_, 0, 4, [&](size_t first, size_t last) {
        runs.emplace_back(first, last);
    });
    EXPECT_TRUE(runs.empty());

    EXPECT_THROW(ParallelForChunks(*pool_, 5, 0, [](size_t, size_t) {}), std::invalid_argument);
}

} // namespace
} // namespace util
} // namespace veil
