#include <gtest/gtest.h>

#include "test_utils.h"

#include <fanoutbench/executor/executor_factory.h>
#include <fanoutbench/executor/lightweight_executor.h>
#include <fanoutbench/executor/worker_pool_executor.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using namespace FanoutBench;

namespace
{

// Blocks every job that waits on it until open() is called.
class Gate
{
public:
    void wait()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return open_; });
    }

    void open()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

private:
    std::mutex              mutex_;
    std::condition_variable cv_;
    bool                    open_ = false;
};

auto waitFor(const std::function<bool()>& condition, std::chrono::milliseconds timeout) -> bool
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (condition())
        {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return condition();
}

} // namespace

//
// WORKER POOL EXECUTOR TESTS
//

class WorkerPoolExecutorTest : public ::testing::Test
{
protected:
    static auto smallPool(RejectionPolicy rejection) -> WorkerPoolConfig
    {
        WorkerPoolConfig config;
        config.minThreads = 1;
        config.maxThreads = 1;
        config.maxQueue   = 1;
        config.rejection  = rejection;
        return config;
    }

    TestUtils::Watchdog watchdog_{ 30s };
};

TEST_F(WorkerPoolExecutorTest, RejectsInvalidConfig)
{
    WorkerPoolConfig config;
    config.minThreads = 4;
    config.maxThreads = 2;
    EXPECT_THROW(WorkerPoolExecutor{ config }, std::invalid_argument);

    config.minThreads = 0;
    config.maxThreads = 0;
    EXPECT_THROW(WorkerPoolExecutor{ config }, std::invalid_argument);
}

TEST_F(WorkerPoolExecutorTest, SubmitAndAwaitReturnsValue)
{
    WorkerPoolExecutor executor;

    auto handle = executor.submit([] { return 21 * 2; });
    EXPECT_EQ(executor.await(handle, 1000ms), 42);
    EXPECT_EQ(handle.status(), TaskStatus::Done);
}

TEST_F(WorkerPoolExecutorTest, AwaitRethrowsTaskException)
{
    WorkerPoolExecutor executor;

    auto handle = executor.submit([]() -> int { throw std::runtime_error("sub-task failed"); });
    EXPECT_THROW(executor.await(handle, 1000ms), std::runtime_error);
    EXPECT_EQ(handle.status(), TaskStatus::Failed);
}

TEST_F(WorkerPoolExecutorTest, VoidTasks)
{
    WorkerPoolExecutor executor;
    std::atomic<int>   ran{ 0 };

    auto handle = executor.submit([&ran] { ran.fetch_add(1); });
    executor.await(handle, 1000ms);
    EXPECT_EQ(ran.load(), 1);
}

TEST_F(WorkerPoolExecutorTest, AwaitOnEmptyHandleThrows)
{
    WorkerPoolExecutor executor;
    TaskHandle<int>    empty;

    EXPECT_FALSE(empty.valid());
    EXPECT_THROW(executor.await(empty, 10ms), std::invalid_argument);
}

// TEST: A timeout stops the waiter, never the task
TEST_F(WorkerPoolExecutorTest, TimeoutDoesNotCancelTask)
{
    WorkerPoolExecutor executor;
    std::atomic<bool>  finished{ false };

    auto handle = executor.submit(
        [&finished]
        {
            std::this_thread::sleep_for(200ms);
            finished.store(true);
            return 7;
        });

    EXPECT_THROW(executor.await(handle, 20ms), TaskTimeout);
    EXPECT_FALSE(finished.load());

    EXPECT_EQ(executor.await(handle, 2000ms), 7);
    EXPECT_TRUE(finished.load());
}

// TEST: Saturated pool runs the job on the submitting thread
TEST_F(WorkerPoolExecutorTest, CallerRunsWhenSaturated)
{
    WorkerPoolExecutor executor(smallPool(RejectionPolicy::CallerRuns));
    Gate               gate;

    auto blocker = executor.submit([&gate] { gate.wait(); });
    auto queued  = executor.submit([] { return std::this_thread::get_id(); });

    const auto caller = std::this_thread::get_id();
    auto       inline_ = executor.submit([] { return std::this_thread::get_id(); });

    EXPECT_TRUE(inline_.done()) << "caller-runs job completes before submit returns";
    EXPECT_EQ(executor.await(inline_, 10ms), caller);
    EXPECT_EQ(executor.callerRunsCount(), 1u);

    gate.open();
    executor.await(blocker, 2000ms);
    EXPECT_NE(executor.await(queued, 2000ms), std::thread::id());
}

TEST_F(WorkerPoolExecutorTest, AbortPolicyRejectsWhenSaturated)
{
    WorkerPoolExecutor executor(smallPool(RejectionPolicy::Abort));
    Gate               gate;

    auto blocker = executor.submit([&gate] { gate.wait(); });
    auto queued  = executor.submit([] { return 1; });

    EXPECT_THROW((void)executor.submit([] { return 2; }), TaskRejected);

    gate.open();
    executor.await(blocker, 2000ms);
    EXPECT_EQ(executor.await(queued, 2000ms), 1);
}

TEST_F(WorkerPoolExecutorTest, StatsSnapshot)
{
    WorkerPoolConfig config;
    config.minThreads = 2;
    config.maxThreads = 4;
    WorkerPoolExecutor executor(config);

    std::vector<TaskHandle<int>> handles;
    for (int i = 0; i < 20; ++i)
    {
        handles.push_back(executor.submit(
            [i]
            {
                std::this_thread::sleep_for(2ms);
                return i;
            }));
    }
    for (auto& handle : handles)
    {
        (void)executor.await(handle, 2000ms);
    }

    ASSERT_TRUE(waitFor([&] { return executor.inFlightTasks() == 0; }, 2000ms));

    const auto stats = executor.stats();
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->completedTasks, 20u);
    EXPECT_EQ(stats->queueLength, 0u);
    EXPECT_LE(stats->poolSize, 4u);
    EXPECT_GE(stats->poolSize, 1u);
    EXPECT_EQ(stats->activeThreads, 0u);
}

TEST_F(WorkerPoolExecutorTest, IdleWorkersAboveMinimumAreReclaimed)
{
    WorkerPoolConfig config;
    config.minThreads  = 1;
    config.maxThreads  = 4;
    config.idleTimeout = 100ms;
    WorkerPoolExecutor executor(config);
    Gate               gate;

    std::vector<TaskHandle<void>> handles;
    for (int i = 0; i < 4; ++i)
    {
        handles.push_back(executor.submit([&gate] { gate.wait(); }));
    }
    EXPECT_EQ(executor.stats()->poolSize, 4u);

    gate.open();
    for (auto& handle : handles)
    {
        executor.await(handle, 2000ms);
    }

    EXPECT_TRUE(waitFor([&] { return executor.stats()->poolSize == 1u; }, 3000ms));

    // Reclaimed workers are joined, not just forgotten.
    EXPECT_TRUE(waitFor([&] { return executor.threadCount() == 1u; }, 3000ms));
}

// TEST: Reclaim and respawn cycles do not accumulate threads
TEST_F(WorkerPoolExecutorTest, RespawnedWorkersDoNotAccumulate)
{
    WorkerPoolConfig config;
    config.minThreads  = 1;
    config.maxThreads  = 3;
    config.idleTimeout = 20ms;
    WorkerPoolExecutor executor(config);

    for (int round = 0; round < 3; ++round)
    {
        Gate                          gate;
        std::vector<TaskHandle<void>> handles;
        for (int i = 0; i < 3; ++i)
        {
            handles.push_back(executor.submit([&gate] { gate.wait(); }));
        }
        gate.open();
        for (auto& handle : handles)
        {
            executor.await(handle, 2000ms);
        }
        ASSERT_TRUE(waitFor([&] { return executor.stats()->poolSize == 1u; }, 3000ms));
    }

    EXPECT_TRUE(waitFor([&] { return executor.threadCount() == 1u; }, 3000ms));
}

// TEST: A worker awaiting its own sub-task on a one-thread pool still makes progress
TEST_F(WorkerPoolExecutorTest, WaitersHelpRunBacklog)
{
    WorkerPoolExecutor executor(WorkerPoolConfig::fixed(1));

    auto outer = executor.submit(
        [&executor]
        {
            auto inner = executor.submit([] { return 5; });
            return executor.await(inner, 2000ms) * 2;
        });

    EXPECT_EQ(executor.await(outer, 5000ms), 10);
}

// TEST: A task that finishes while its waiter is busy helping past the deadline still times out
TEST_F(WorkerPoolExecutorTest, HelpingPastDeadlineReportsTimeout)
{
    WorkerPoolExecutor executor(WorkerPoolConfig::fixed(1));

    auto first = executor.submit(
        []
        {
            std::this_thread::sleep_for(300ms);
            return 1;
        });
    auto queued = executor.submit(
        []
        {
            std::this_thread::sleep_for(500ms);
            return 2;
        });

    EXPECT_THROW(executor.await(first, 100ms), TaskTimeout);

    // The waiter ran the queued job itself, and the timed-out task was never cancelled.
    EXPECT_EQ(first.status(), TaskStatus::Done);
    EXPECT_EQ(executor.await(queued, 2000ms), 2);
}

TEST_F(WorkerPoolExecutorTest, ShutdownDrainsAndRejectsNewWork)
{
    WorkerPoolExecutor executor;
    std::atomic<int>   done{ 0 };

    for (int i = 0; i < 8; ++i)
    {
        (void)executor.submit(
            [&done]
            {
                std::this_thread::sleep_for(20ms);
                done.fetch_add(1);
            });
    }

    EXPECT_TRUE(executor.shutdown(5000ms));
    EXPECT_EQ(done.load(), 8);
    EXPECT_EQ(executor.inFlightTasks(), 0u);
    EXPECT_THROW((void)executor.submit([] { return 0; }), TaskRejected);
}

TEST_F(WorkerPoolExecutorTest, ShutdownReportsUndrainedWork)
{
    WorkerPoolExecutor executor;
    Gate               gate;

    auto blocker = executor.submit([&gate] { gate.wait(); });
    EXPECT_FALSE(executor.shutdown(50ms));

    gate.open();
    executor.await(blocker, 2000ms);
}

TEST(RejectionPolicyTest, ParsesNames)
{
    EXPECT_EQ(parseRejectionPolicy("abort"), RejectionPolicy::Abort);
    EXPECT_EQ(parseRejectionPolicy("caller_runs"), RejectionPolicy::CallerRuns);
    EXPECT_THROW(parseRejectionPolicy("discard"), std::invalid_argument);
    EXPECT_EQ(toString(RejectionPolicy::CallerRuns), "caller_runs");
}

//
// LIGHTWEIGHT EXECUTOR TESTS
//

class LightweightExecutorTest : public ::testing::Test
{
protected:
    TestUtils::Watchdog watchdog_{ 30s };
};

// TEST: Every submission runs at once, no ceiling
TEST_F(LightweightExecutorTest, RunsEverySubmissionConcurrently)
{
    LightweightExecutor executor;

    const int        tasks = 64;
    std::atomic<int> started{ 0 };
    Gate             gate;

    std::vector<TaskHandle<int>> handles;
    for (int i = 0; i < tasks; ++i)
    {
        handles.push_back(executor.submit(
            [&started, &gate, i]
            {
                started.fetch_add(1);
                gate.wait();
                return i;
            }));
    }

    EXPECT_TRUE(waitFor([&] { return started.load() == tasks; }, 5000ms)) << "all tasks must be running before any finishes";
    EXPECT_EQ(executor.inFlightTasks(), static_cast<std::size_t>(tasks));
    gate.open();

    for (int i = 0; i < tasks; ++i)
    {
        EXPECT_EQ(executor.await(handles[static_cast<std::size_t>(i)], 2000ms), i);
    }
    EXPECT_EQ(executor.peakInFlight(), static_cast<std::size_t>(tasks));
}

TEST_F(LightweightExecutorTest, HasNoStats)
{
    LightweightExecutor executor;
    EXPECT_FALSE(executor.stats().has_value());
    EXPECT_EQ(executor.policy(), ExecutorPolicy::Lightweight);
}

TEST_F(LightweightExecutorTest, AwaitTimesOut)
{
    LightweightExecutor executor;

    auto handle = executor.submit(
        []
        {
            std::this_thread::sleep_for(200ms);
            return 1;
        });
    EXPECT_THROW(executor.await(handle, 10ms), TaskTimeout);
    EXPECT_EQ(executor.await(handle, 2000ms), 1);
}

TEST_F(LightweightExecutorTest, DestructorWaitsForRunningTasks)
{
    auto finished = std::make_shared<std::atomic<int>>(0);
    {
        LightweightExecutor executor;
        for (int i = 0; i < 10; ++i)
        {
            (void)executor.submit(
                [finished]
                {
                    std::this_thread::sleep_for(50ms);
                    finished->fetch_add(1);
                });
        }
    }
    EXPECT_EQ(finished->load(), 10);
}

// TEST: Sequential tasks reuse one idle context instead of starting new ones
TEST_F(LightweightExecutorTest, IdleContextIsReused)
{
    LightweightExecutor executor;

    for (int i = 0; i < 20; ++i)
    {
        auto handle = executor.submit([i] { return i; });
        EXPECT_EQ(executor.await(handle, 2000ms), i);
        ASSERT_TRUE(waitFor([&] { return executor.inFlightTasks() == 0u; }, 2000ms));
    }

    EXPECT_EQ(executor.contextCount(), 1u);
}

TEST_F(LightweightExecutorTest, IdleContextsAreReclaimed)
{
    LightweightExecutor executor;
    Gate                gate;

    std::vector<TaskHandle<void>> handles;
    for (int i = 0; i < 4; ++i)
    {
        handles.push_back(executor.submit([&gate] { gate.wait(); }));
    }
    EXPECT_EQ(executor.contextCount(), 4u);

    gate.open();
    for (auto& handle : handles)
    {
        executor.await(handle, 2000ms);
    }

    EXPECT_TRUE(waitFor([&] { return executor.contextCount() == 0u; }, LightweightExecutor::kIdleTimeout + 3000ms));

    // A new submission after reclaim starts a fresh context.
    auto handle = executor.submit([] { return 7; });
    EXPECT_EQ(executor.await(handle, 2000ms), 7);
}

// TEST: A drained executor no longer holds anything a finished task captured
TEST_F(LightweightExecutorTest, CapturesReleasedBeforeDrainReported)
{
    LightweightExecutor executor;

    std::weak_ptr<int> observer;
    {
        auto captured = std::make_shared<int>(42);
        observer      = captured;

        auto handle = executor.submit([captured] { return *captured; });
        EXPECT_EQ(executor.await(handle, 2000ms), 42);
    }

    EXPECT_TRUE(executor.shutdown(2000ms));
    EXPECT_TRUE(observer.expired());
}

TEST_F(LightweightExecutorTest, ShutdownRejectsNewWork)
{
    LightweightExecutor executor;
    EXPECT_TRUE(executor.shutdown(1000ms));
    EXPECT_THROW((void)executor.submit([] { return 0; }), TaskRejected);
}

//
// EXECUTOR FACTORY TESTS
//

TEST(ExecutorFactoryTest, BuildsRequestedPolicy)
{
    ExecutorConfig config;

    auto pool = makeExecutor(ExecutorPolicy::WorkerPool, config);
    EXPECT_EQ(pool->policy(), ExecutorPolicy::WorkerPool);
    EXPECT_TRUE(pool->stats().has_value());

    auto lightweight = makeExecutor(ExecutorPolicy::Lightweight, config);
    EXPECT_EQ(lightweight->policy(), ExecutorPolicy::Lightweight);
}

// TEST: Unavailable lightweight substrate degrades to a fixed worker pool
TEST(ExecutorFactoryTest, FallsBackToFixedWorkerPool)
{
    ExecutorConfig config;
    config.fallbackThreads = 3;

    auto executor = makeExecutor(ExecutorPolicy::Lightweight,
                                 config,
                                 []() -> std::unique_ptr<Executor>
                                 {
                                     throw SubstrateUnavailable("no task contexts");
                                 });

    ASSERT_NE(executor, nullptr);
    EXPECT_EQ(executor->policy(), ExecutorPolicy::WorkerPool);

    auto* pool = dynamic_cast<WorkerPoolExecutor*>(executor.get());
    ASSERT_NE(pool, nullptr);
    EXPECT_EQ(pool->config().minThreads, 3u);
    EXPECT_EQ(pool->config().maxThreads, 3u);

    auto handle = executor->submit([] { return 11; });
    EXPECT_EQ(executor->await(handle, 1000ms), 11);
}

TEST(ExecutorFactoryTest, OtherConstructionErrorsPropagate)
{
    EXPECT_THROW(makeExecutor(ExecutorPolicy::Lightweight,
                              ExecutorConfig{},
                              []() -> std::unique_ptr<Executor>
                              {
                                  throw std::runtime_error("misconfigured");
                              }),
                 std::runtime_error);
}
