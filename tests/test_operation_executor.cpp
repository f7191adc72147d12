#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "OperationExecutor.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <set>
#include <thread>

using namespace nativeio;
using namespace std::chrono_literals;

class OperationExecutorTest : public ::testing::Test {
};

TEST_F(OperationExecutorTest, StartsRequestedWorkers) {
    OperationExecutor executor(3);
    EXPECT_EQ(executor.threadCount(), 3u);
    EXPECT_FALSE(executor.isShutdown());
}

TEST_F(OperationExecutorTest, ZeroThreadsMeansOne) {
    OperationExecutor executor(0);
    EXPECT_EQ(executor.threadCount(), 1u);
}

TEST_F(OperationExecutorTest, RunsSubmittedTask) {
    OperationExecutor executor(2);
    std::promise<int> result;

    executor.submit([&result]() { result.set_value(42); });

    EXPECT_EQ(result.get_future().get(), 42);
}

TEST_F(OperationExecutorTest, RunsTasksConcurrently) {
    OperationExecutor executor(2);
    std::promise<void> firstStarted;
    std::promise<void> secondDone;

    // The first task blocks until the second has run on another worker
    auto secondFuture = secondDone.get_future().share();
    executor.submit([&firstStarted, secondFuture]() {
        firstStarted.set_value();
        secondFuture.wait();
    });
    firstStarted.get_future().wait();
    executor.submit([&secondDone]() { secondDone.set_value(); });

    EXPECT_EQ(secondFuture.wait_for(5s), std::future_status::ready);
}

TEST_F(OperationExecutorTest, ShutdownDrainsQueuedTasks) {
    std::atomic<int> counter{0};
    OperationExecutor executor(1);

    for (int i = 0; i < 100; ++i) {
        executor.submit([&counter]() { counter++; });
    }
    executor.shutdown();

    EXPECT_EQ(counter.load(), 100);
    EXPECT_EQ(executor.queuedCount(), 0u);
    EXPECT_TRUE(executor.isShutdown());
}

TEST_F(OperationExecutorTest, SubmitAfterShutdownThrows) {
    OperationExecutor executor(1);
    executor.shutdown();

    EXPECT_THROW(executor.submit([]() {}), std::runtime_error);
}

TEST_F(OperationExecutorTest, ShutdownIsIdempotent) {
    OperationExecutor executor(2);

    executor.shutdown();
    EXPECT_NO_THROW(executor.shutdown());
}

TEST_F(OperationExecutorTest, FailingTaskDoesNotStopWorker) {
    OperationExecutor executor(1);
    std::promise<void> ran;

    executor.submit([]() { throw std::runtime_error("boom"); });
    executor.submit([&ran]() { ran.set_value(); });

    EXPECT_EQ(ran.get_future().wait_for(5s), std::future_status::ready);
}

TEST_F(OperationExecutorTest, UnknownExceptionDoesNotStopWorker) {
    OperationExecutor executor(1);
    std::promise<void> ran;

    executor.submit([]() { throw 42; });
    executor.submit([&ran]() { ran.set_value(); });

    EXPECT_EQ(ran.get_future().wait_for(5s), std::future_status::ready);
}

TEST_F(OperationExecutorTest, TasksRunOffTheCallingThread) {
    OperationExecutor executor(2);
    std::promise<std::thread::id> worker;

    executor.submit([&worker]() { worker.set_value(std::this_thread::get_id()); });

    EXPECT_NE(worker.get_future().get(), std::this_thread::get_id());
}
