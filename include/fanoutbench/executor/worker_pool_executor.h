#pragma once

#include <fanoutbench/core/errors.h>
#include <fanoutbench/executor/executor.h>
#include <fanoutbench/util/macros.h>
#include <fanoutbench/util/process_info.h>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include <concurrentqueue/blockingconcurrentqueue.h>

namespace FanoutBench
{

//
// RejectionPolicy
//
//   What post() does when every worker is busy and the backlog is full.
//
enum class RejectionPolicy : std::uint8_t
{
    Abort,      // Throw TaskRejected
    CallerRuns, // Run the job on the submitting thread
};

constexpr auto toString(RejectionPolicy policy) -> std::string_view
{
    switch (policy)
    {
        case RejectionPolicy::Abort:
            return "abort";
        case RejectionPolicy::CallerRuns:
            return "caller_runs";
    }
    return "unknown";
}

inline auto parseRejectionPolicy(std::string_view text) -> RejectionPolicy
{
    if (text == "abort")
    {
        return RejectionPolicy::Abort;
    }
    if (text == "caller_runs")
    {
        return RejectionPolicy::CallerRuns;
    }
    throw std::invalid_argument("unknown rejection policy: " + std::string(text));
}

struct WorkerPoolConfig
{
    std::size_t               minThreads  = 2;
    std::size_t               maxThreads  = 2 * processorCount();
    std::size_t               maxQueue    = 4 * processorCount();
    std::chrono::milliseconds idleTimeout = std::chrono::seconds(60);
    RejectionPolicy           rejection   = RejectionPolicy::CallerRuns;

    // Fixed-size pool: every worker is a core worker and is never reclaimed.
    static auto fixed(std::size_t threads) -> WorkerPoolConfig
    {
        WorkerPoolConfig config;
        config.minThreads = threads;
        config.maxThreads = threads;
        config.maxQueue   = SIZE_MAX;
        return config;
    }
};

//
// WorkerPoolExecutor
//
//   Bounded worker pool. Admission order for a new job:
//   1. an idle worker takes it, once the pool has reached minThreads;
//   2. otherwise a new worker is started while below maxThreads;
//   3. otherwise it waits in the backlog while the backlog is below maxQueue;
//   4. otherwise the rejection policy applies.
//   Workers above minThreads exit after idleTimeout without work.
//
//   Hand-off between submitters and workers goes through a moodycamel blocking queue; the
//   counters that drive admission are kept under one mutex so decisions see a consistent view.
//
class WorkerPoolExecutor final : public Executor
{
public:
    explicit WorkerPoolExecutor(WorkerPoolConfig config = {})
    : config_(config)
    {
        if (config_.maxThreads == 0)
        {
            throw std::invalid_argument("worker pool needs at least one thread");
        }
        if (config_.minThreads > config_.maxThreads)
        {
            throw std::invalid_argument("worker pool minThreads exceeds maxThreads");
        }
    }

    ~WorkerPoolExecutor() override
    {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            shuttingDown_ = true;
            drained_.wait(
                lock,
                [this]
                {
                    return isDrained();
                });
        }

        for (auto& thread : workers_)
        {
            if (thread.joinable())
            {
                thread.join();
            }
        }
    }

    auto shutdown(std::chrono::milliseconds drainTimeout) -> bool override
    {
        std::unique_lock<std::mutex> lock(mutex_);
        shuttingDown_ = true;
        return drained_.wait_for(
            lock,
            drainTimeout,
            [this]
            {
                return isDrained();
            });
    }

    auto policy() const noexcept -> ExecutorPolicy override
    {
        return ExecutorPolicy::WorkerPool;
    }

    auto stats() const -> std::optional<ExecutorStats> override
    {
        std::lock_guard<std::mutex> lock(mutex_);

        ExecutorStats stats;
        stats.completedTasks = completed_;
        stats.queueLength    = backlog();
        stats.poolSize       = poolSize_;
        stats.activeThreads  = active_;
        return stats;
    }

    auto inFlightTasks() const -> std::size_t override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_ + active_ + callerActive_;
    }

    auto config() const noexcept -> const WorkerPoolConfig&
    {
        return config_;
    }

    // Joins workers that were reclaimed, then returns the number of threads still held.
    auto threadCount() -> std::size_t
    {
        std::lock_guard<std::mutex> lock(mutex_);
        joinRetired();
        return workers_.size();
    }

    // Number of jobs that ran on a submitting thread because the pool was saturated.
    auto callerRunsCount() const -> std::size_t
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return callerRuns_;
    }

protected:
    HOT_PATH void post(Job job) override
    {
        std::unique_lock<std::mutex> lock(mutex_);

        if (shuttingDown_)
            UNLIKELY
            {
                throw TaskRejected("worker pool is shut down");
            }

        if (poolSize_ >= config_.minThreads && idleWorkers_ > pending_)
        {
            ++pending_;
            queue_.enqueue(std::move(job));
            return;
        }

        if (poolSize_ < config_.maxThreads)
        {
            spawnWorker(std::move(job));
            return;
        }

        if (backlog() < config_.maxQueue)
        {
            ++pending_;
            queue_.enqueue(std::move(job));
            return;
        }

        if (config_.rejection == RejectionPolicy::Abort)
        {
            throw TaskRejected("worker pool is saturated");
        }

        // Caller runs: the submitting thread pays for forward progress.
        ++callerRuns_;
        ++callerActive_;
        lock.unlock();

        job();
        job = nullptr;

        lock.lock();
        --callerActive_;
        ++completed_;
        notifyIfDrained();
    }

    //
    // waitUntil
    //
    //   A waiter that would otherwise block runs backlog jobs itself. Without this a worker
    //   waiting on its own sub-task could sit on the only threads able to run it.
    //   A helped job may run past the deadline. The waiter then returns late, and the task
    //   only counts as finished if it completed before the deadline.
    //
    auto waitUntil(const detail::CompletionState& state, std::chrono::steady_clock::time_point deadline) -> bool override
    {
        for (;;)
        {
            if (state.status() != TaskStatus::Pending)
            {
                return state.finishedBy(deadline);
            }

            const auto now = std::chrono::steady_clock::now();
            if (now >= deadline)
            {
                return false;
            }

            if (tryRunQueuedJob())
            {
                continue;
            }

            if (state.waitUntil(std::min(deadline, now + kHelpSlice)))
            {
                return state.finishedBy(deadline);
            }
        }
    }

private:
    static constexpr auto kPollInterval = std::chrono::milliseconds(50);
    static constexpr auto kHelpSlice    = std::chrono::milliseconds(2);

    // Requires mutex_.
    auto backlog() const -> std::size_t
    {
        return pending_ > idleWorkers_ ? pending_ - idleWorkers_ : 0;
    }

    // Requires mutex_.
    auto isDrained() const -> bool
    {
        return pending_ == 0 && active_ == 0 && callerActive_ == 0;
    }

    // Requires mutex_.
    void notifyIfDrained()
    {
        if (isDrained())
        {
            drained_.notify_all();
        }
    }

    // Requires mutex_. A retired worker has released mutex_ for the last time, so joining
    // it here cannot deadlock.
    void joinRetired()
    {
        for (const auto id : retired_)
        {
            const auto it = std::find_if(workers_.begin(),
                                         workers_.end(),
                                         [id](const std::thread& thread)
                                         {
                                             return thread.get_id() == id;
                                         });
            if (it != workers_.end())
            {
                it->join();
                workers_.erase(it);
            }
        }
        retired_.clear();
    }

    // Requires mutex_.
    void spawnWorker(Job firstJob)
    {
        joinRetired();

        ++poolSize_;
        ++active_;
        try
        {
            workers_.emplace_back(
                [this, job = std::move(firstJob)]() mutable
                {
                    workerLoop(std::move(job));
                });
        }
        catch (...)
        {
            --poolSize_;
            --active_;
            throw;
        }
    }

    void workerLoop(Job firstJob)
    {
        firstJob();
        firstJob = nullptr;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            --active_;
            ++completed_;
            ++idleWorkers_;
            notifyIfDrained();
        }

        auto idleSince = std::chrono::steady_clock::now();
        for (;;)
        {
            Job job;
            if (queue_.wait_dequeue_timed(job, kPollInterval))
            {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    --pending_;
                    --idleWorkers_;
                    ++active_;
                }

                job();
                job = nullptr;

                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    --active_;
                    ++completed_;
                    ++idleWorkers_;
                    notifyIfDrained();
                }
                idleSince = std::chrono::steady_clock::now();
                continue;
            }

            std::lock_guard<std::mutex> lock(mutex_);
            if (pending_ > 0)
            {
                continue;
            }

            const bool idleTooLong = std::chrono::steady_clock::now() - idleSince >= config_.idleTimeout;
            if (shuttingDown_ || (poolSize_ > config_.minThreads && idleTooLong))
            {
                --poolSize_;
                --idleWorkers_;
                retired_.push_back(std::this_thread::get_id());
                return;
            }
        }
    }

    auto tryRunQueuedJob() -> bool
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (backlog() == 0)
            {
                return false;
            }
        }

        Job job;
        if (!queue_.try_dequeue(job))
        {
            return false;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --pending_;
            ++callerActive_;
        }

        job();
        job = nullptr;

        std::lock_guard<std::mutex> lock(mutex_);
        --callerActive_;
        ++completed_;
        notifyIfDrained();
        return true;
    }

    const WorkerPoolConfig config_;

    moodycamel::BlockingConcurrentQueue<Job> queue_;

    mutable std::mutex           mutex_;
    std::condition_variable      drained_;
    std::vector<std::thread>     workers_;
    std::vector<std::thread::id> retired_;

    std::size_t poolSize_     = 0;
    std::size_t idleWorkers_  = 0;
    std::size_t pending_      = 0;
    std::size_t active_       = 0;
    std::size_t callerActive_ = 0;
    std::size_t completed_    = 0;
    std::size_t callerRuns_   = 0;
    bool        shuttingDown_ = false;
};

} // namespace FanoutBench
