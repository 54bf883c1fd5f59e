#pragma once

#include <fanoutbench/core/errors.h>
#include <fanoutbench/core/types.h>
#include <fanoutbench/executor/task_handle.h>
#include <fanoutbench/util/macros.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <type_traits>
#include <utility>

#include <fmt/format.h>

namespace FanoutBench
{

//
// ExecutorPolicy
//
enum class ExecutorPolicy : std::uint8_t
{
    WorkerPool  = 0, // Bounded worker pool with a backlog queue
    Lightweight = 1, // One cheap execution context per task, no queue, no ceiling
};

constexpr auto toString(ExecutorPolicy policy) -> std::string_view
{
    switch (policy)
    {
        case ExecutorPolicy::WorkerPool:
            return "WorkerPool";
        case ExecutorPolicy::Lightweight:
            return "Lightweight";
    }
    return "Unknown";
}

//
// Executor
//
//   The scheduling substrate: submit work, get a handle, await it with a timeout.
//   Exactly two implementations exist (WorkerPoolExecutor, LightweightExecutor); which one
//   backs a run is decided once, when it is constructed.
//
//   Timeouts never cancel work. A timed-out task keeps running and its result is dropped
//   when the last handle goes away.
//
class Executor
{
public:
    using Job = std::function<void()>;

    Executor() = default;
    virtual ~Executor() = default;

    NO_MOVE_NO_COPY(Executor);

    //
    // submit
    //
    //   Schedules callable and returns a handle to its result. Throws TaskRejected when the
    //   executor no longer accepts work.
    //
    template <typename Callable>
    auto submit(Callable&& callable) -> TaskHandle<std::decay_t<std::invoke_result_t<Callable&>>>
    {
        using Result = std::decay_t<std::invoke_result_t<Callable&>>;

        auto state = std::make_shared<detail::TaskState<Result>>();
        post(
            [state, fn = std::forward<Callable>(callable)]() mutable
            {
                detail::runInto<Result>(*state, fn);
            });
        return TaskHandle<Result>(std::move(state));
    }

    //
    // await
    //
    //   Blocks until the task finishes or timeout elapses. Returns the task's value, rethrows
    //   its exception, or throws TaskTimeout. The task itself is left running on timeout.
    //
    template <typename T>
    auto await(const TaskHandle<T>& handle, std::chrono::milliseconds timeout) -> T
    {
        if (!handle.valid())
        {
            throw std::invalid_argument("await on an empty task handle");
        }

        const auto deadline = std::chrono::steady_clock::now() + timeout;
        if (!waitUntil(*handle.state(), deadline))
        {
            throw TaskTimeout(fmt::format("task did not complete within {}ms", timeout.count()));
        }
        return handle.state()->takeResult();
    }

    // Stops accepting work and waits up to drainTimeout for in-flight work. True if drained.
    virtual auto shutdown(std::chrono::milliseconds drainTimeout) -> bool = 0;

    virtual auto policy() const noexcept -> ExecutorPolicy = 0;

    // Only the bounded worker pool has meaningful stats.
    virtual auto stats() const -> std::optional<ExecutorStats>
    {
        return std::nullopt;
    }

    virtual auto inFlightTasks() const -> std::size_t = 0;

protected:
    virtual void post(Job job) = 0;

    // Wait strategy for await(). Implementations may do useful work while they wait.
    virtual auto waitUntil(const detail::CompletionState& state, std::chrono::steady_clock::time_point deadline) -> bool
    {
        return state.waitUntil(deadline);
    }
};

} // namespace FanoutBench
