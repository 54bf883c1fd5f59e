#pragma once

#include <fanoutbench/core/errors.h>
#include <fanoutbench/executor/executor.h>
#include <fanoutbench/util/macros.h>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <concurrentqueue/blockingconcurrentqueue.h>
#include <fmt/format.h>

namespace FanoutBench
{

//
// LightweightExecutor
//
//   Cheap-task policy: every submission starts immediately. There is no backlog and no
//   ceiling; concurrency is bounded only by what the tasks themselves contend on (typically
//   a BoundedResourcePool).
//
//   Tasks run on a set of reusable execution contexts. A submission is handed to an idle
//   context through a moodycamel queue, or starts a new context when none is idle. Contexts
//   that stay idle for kIdleTimeout are reclaimed, so the set tracks the current load.
//
//   A task counts as finished only after its callable, and everything it captured, has
//   been destroyed. The destructor waits for every task, then stops and joins all contexts.
//
class LightweightExecutor final : public Executor
{
public:
    static constexpr auto kIdleTimeout = std::chrono::milliseconds(1000);

    // Throws SubstrateUnavailable when no execution context can be started on this host.
    LightweightExecutor()
    {
        try
        {
            std::thread probe(
                []
                {
                });
            probe.join();
        }
        catch (const std::system_error& e)
        {
            throw SubstrateUnavailable(fmt::format("lightweight task contexts are unavailable: {}", e.what()));
        }
    }

    ~LightweightExecutor() override
    {
        std::size_t live = 0;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            shuttingDown_ = true;
            drained_.wait(
                lock,
                [this]
                {
                    return inFlight_ == 0;
                });
            live = contexts_;
        }

        // An empty job tells an idle context to exit.
        for (std::size_t i = 0; i < live; ++i)
        {
            queue_.enqueue(Job{});
        }

        for (auto& thread : threads_)
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
                return inFlight_ == 0;
            });
    }

    auto policy() const noexcept -> ExecutorPolicy override
    {
        return ExecutorPolicy::Lightweight;
    }

    auto inFlightTasks() const -> std::size_t override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return inFlight_;
    }

    // Highest number of tasks that were running at the same time.
    auto peakInFlight() const -> std::size_t
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return peakInFlight_;
    }

    // Joins reclaimed contexts, then returns the number of contexts still held.
    auto contextCount() -> std::size_t
    {
        std::lock_guard<std::mutex> lock(mutex_);
        joinRetired();
        return threads_.size();
    }

protected:
    HOT_PATH void post(Job job) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shuttingDown_)
            UNLIKELY
            {
                throw TaskRejected("lightweight executor is shut down");
            }

        ++inFlight_;
        peakInFlight_ = std::max(peakInFlight_, inFlight_);

        if (idle_ > handedOff_)
        {
            ++handedOff_;
            queue_.enqueue(std::move(job));
            return;
        }

        try
        {
            startContext(std::move(job));
        }
        catch (const std::system_error& e)
        {
            --inFlight_;
            notifyIfDrained();
            throw TaskRejected(fmt::format("could not start a task context: {}", e.what()));
        }
    }

private:
    static constexpr auto kPollInterval = std::chrono::milliseconds(50);

    // Requires mutex_.
    void notifyIfDrained()
    {
        if (inFlight_ == 0)
        {
            drained_.notify_all();
        }
    }

    // Requires mutex_. A retired context has released mutex_ for the last time.
    void joinRetired()
    {
        for (const auto id : retired_)
        {
            const auto it = std::find_if(threads_.begin(),
                                         threads_.end(),
                                         [id](const std::thread& thread)
                                         {
                                             return thread.get_id() == id;
                                         });
            if (it != threads_.end())
            {
                it->join();
                threads_.erase(it);
            }
        }
        retired_.clear();
    }

    // Requires mutex_.
    void startContext(Job firstJob)
    {
        joinRetired();

        threads_.emplace_back(
            [this, job = std::move(firstJob)]() mutable
            {
                contextLoop(job);
            });
        ++contexts_;
    }

    void runJob(Job& job)
    {
        job();
        job = nullptr;

        std::lock_guard<std::mutex> lock(mutex_);
        --inFlight_;
        ++idle_;
        notifyIfDrained();
    }

    void contextLoop(Job& firstJob)
    {
        runJob(firstJob);

        auto idleSince = std::chrono::steady_clock::now();
        for (;;)
        {
            Job job;
            if (queue_.wait_dequeue_timed(job, kPollInterval))
            {
                std::unique_lock<std::mutex> lock(mutex_);
                if (!job)
                {
                    retire();
                    return;
                }

                --handedOff_;
                --idle_;
                lock.unlock();

                runJob(job);
                idleSince = std::chrono::steady_clock::now();
                continue;
            }

            std::lock_guard<std::mutex> lock(mutex_);
            if (handedOff_ > 0)
            {
                continue;
            }
            if (std::chrono::steady_clock::now() - idleSince >= kIdleTimeout)
            {
                retire();
                return;
            }
        }
    }

    // Requires mutex_.
    void retire()
    {
        --contexts_;
        --idle_;
        retired_.push_back(std::this_thread::get_id());
    }

    moodycamel::BlockingConcurrentQueue<Job> queue_;

    mutable std::mutex           mutex_;
    std::condition_variable      drained_;
    std::vector<std::thread>     threads_;
    std::vector<std::thread::id> retired_;

    std::size_t contexts_     = 0;
    std::size_t idle_         = 0;
    std::size_t handedOff_    = 0;
    std::size_t inFlight_     = 0;
    std::size_t peakInFlight_ = 0;
    bool        shuttingDown_ = false;
};

} // namespace FanoutBench
