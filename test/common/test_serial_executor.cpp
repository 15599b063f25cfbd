/**
 * @file test_serial_executor.cpp
 * @brief SerialExecutor 测试: 顺序执行、异常传递、关闭
 */

#include <gtest/gtest.h>
#include "common/serial_executor.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace multiocr;

// ==================== 顺序执行测试 ====================

/**
 * @brief 任务按提交顺序执行, 且从不重叠
 */
TEST(SerialExecutorTest, RunsInSubmissionOrder) {
    SerialExecutor executor("order");
    std::vector<int> seen;
    std::atomic<int> active{0};
    std::atomic<bool> overlapped{false};

    std::vector<std::future<void>> futures;
    for (int i = 0; i < 20; ++i) {
        futures.push_back(executor.submit([i, &seen, &active, &overlapped]() {
            if (++active > 1) overlapped = true;
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            seen.push_back(i);
            --active;
        }));
    }
    for (auto& f : futures) f.get();

    ASSERT_EQ(seen.size(), 20u);
    for (int i = 0; i < 20; ++i) EXPECT_EQ(seen[i], i);
    EXPECT_FALSE(overlapped);
}

TEST(SerialExecutorTest, ReturnsValues) {
    SerialExecutor executor("values");
    auto answer = executor.submit([]() { return 42; });
    EXPECT_EQ(answer.get(), 42);
    EXPECT_EQ(executor.name(), "values");
}

TEST(SerialExecutorTest, ExceptionGoesToFuture) {
    SerialExecutor executor("errors");
    auto failing = executor.submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(failing.get(), std::runtime_error);

    // Worker survives a throwing task
    EXPECT_EQ(executor.submit([]() { return 7; }).get(), 7);
}

// ==================== 关闭测试 ====================

/**
 * @brief shutdown 完成已排队的任务, 之后拒绝新任务
 */
TEST(SerialExecutorTest, ShutdownDrainsThenRejects) {
    SerialExecutor executor("drain");
    std::atomic<int> done{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 5; ++i) {
        futures.push_back(executor.submit([&done]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            ++done;
        }));
    }
    executor.shutdown();
    EXPECT_EQ(done.load(), 5);
    EXPECT_EQ(executor.backlog(), 0u);
    EXPECT_THROW(executor.submit([]() {}), std::runtime_error);
    executor.shutdown();
}

TEST(SerialExecutorTest, BacklogCountsRunningTask) {
    SerialExecutor executor("backlog");
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::promise<void> started;

    auto first = executor.submit([gate, &started]() {
        started.set_value();
        gate.wait();
    });
    auto second = executor.submit([]() {});
    started.get_future().wait();
    EXPECT_EQ(executor.backlog(), 2u);

    release.set_value();
    first.get();
    second.get();
}
