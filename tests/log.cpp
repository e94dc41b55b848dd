#include <gtest/gtest.h>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "asyncq/log/log.hpp"
#include "asyncq/queue/bounded_async_queue.hpp"

namespace asyncq::log {

class LogTest : public ::testing::Test {
protected:
    std::mutex mutex_;
    std::vector<std::pair<Level, std::string>> records_;
    Level saved_level_ = Level::Warn;

    void SetUp() override {
        saved_level_ = GetLevel();
        SetSink([this](Level level, std::string_view message) {
            std::lock_guard<std::mutex> lock(mutex_);
            records_.emplace_back(level, std::string(message));
        });
    }

    void TearDown() override {
        SetSink(nullptr);
        SetLevel(saved_level_);
    }
};

TEST_F(LogTest, WritesFormattedMessageToSink) {
    SetLevel(Level::Info);

    Write(Level::Info, "{} item(s) in {}", 3, "jobs");

    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].first, Level::Info);
    EXPECT_EQ(records_[0].second, "3 item(s) in jobs");
}

TEST_F(LogTest, FiltersBelowLevel) {
    SetLevel(Level::Warn);

    Write(Level::Debug, "hidden");
    Write(Level::Info, "hidden");
    Write(Level::Error, "shown");

    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].second, "shown");
}

TEST_F(LogTest, OffDisablesEverything) {
    SetLevel(Level::Off);

    Write(Level::Error, "hidden");

    EXPECT_TRUE(records_.empty());
    EXPECT_FALSE(Enabled(Level::Off));
}

TEST_F(LogTest, ParseLevel) {
    EXPECT_EQ(ParseLevel("debug"), Level::Debug);
    EXPECT_EQ(ParseLevel("WARN"), Level::Warn);
    EXPECT_EQ(ParseLevel("warning"), Level::Warn);
    EXPECT_EQ(ParseLevel("off"), Level::Off);
    EXPECT_FALSE(ParseLevel("verbose").has_value());
}

TEST_F(LogTest, QueueReportsThrowingHook) {
    SetLevel(Level::Error);
    queue::QueueOptions<int> options;
    options.name = "jobs";
    options.on_remove = [](const int &) { throw std::runtime_error("boom"); };
    queue::BoundedAsyncQueue<int> queue(options);

    queue.add(1);
    EXPECT_EQ(queue.take(), 1);

    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].first, Level::Error);
    EXPECT_EQ(records_[0].second, "[jobs] on_remove hook threw: boom");
}

TEST_F(LogTest, QueueLogsLifecycleAtDebug) {
    SetLevel(Level::Debug);
    queue::QueueOptions<int> options;
    options.capacity = 2;
    options.name = "jobs";
    queue::BoundedAsyncQueue<int> queue(options);

    queue.add(1);
    queue.close();

    std::lock_guard<std::mutex> lock(mutex_);
    ASSERT_GE(records_.size(), 2u);
    EXPECT_EQ(records_.front().second, "[jobs] created, capacity 2");
    bool close_logged = false;
    for (const auto &record : records_) {
        if (record.second == "[jobs] close, 1 item(s) left") {
            close_logged = true;
        }
    }
    EXPECT_TRUE(close_logged);
}

}  // namespace asyncq::log
