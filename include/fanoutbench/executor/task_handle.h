#pragma once

#include <fanoutbench/util/macros.h>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace FanoutBench
{

//
// TaskStatus
//
//   Represents the current state of a submitted task.
//
enum class TaskStatus : std::uint8_t
{
    Pending, // Not finished yet (queued or running)
    Done,    // Finished with a value
    Failed,  // Finished with an exception
};

constexpr auto toString(TaskStatus status) -> std::string_view
{
    switch (status)
    {
        case TaskStatus::Pending:
            return "Pending";
        case TaskStatus::Done:
            return "Done";
        case TaskStatus::Failed:
            return "Failed";
    }
    return "Unknown";
}

namespace detail
{

//
// CompletionState
//
//   The part of a task's shared state that waiters block on. Executors only need this
//   untyped view to implement their wait strategy.
//
class CompletionState
{
public:
    virtual ~CompletionState() = default;

    auto waitUntil(std::chrono::steady_clock::time_point deadline) const -> bool
    {
        std::unique_lock<std::mutex> lock(mutex_);
        return done_.wait_until(
            lock,
            deadline,
            [this]
            {
                return status_ != TaskStatus::Pending;
            });
    }

    auto status() const -> TaskStatus
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return status_;
    }

    // True once the task has finished, and it finished no later than deadline.
    auto finishedBy(std::chrono::steady_clock::time_point deadline) const -> bool
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return status_ != TaskStatus::Pending && completedAt_ <= deadline;
    }

protected:
    template <typename Assign>
    void complete(TaskStatus status, Assign&& assign)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            std::forward<Assign>(assign)();
            status_      = status;
            completedAt_ = std::chrono::steady_clock::now();
        }
        done_.notify_all();
    }

    mutable std::mutex                    mutex_;
    mutable std::condition_variable       done_;
    TaskStatus                            status_ = TaskStatus::Pending;
    std::chrono::steady_clock::time_point completedAt_;
};

//
// TaskState for <T>
//
template <typename T>
class TaskState final : public CompletionState
{
public:
    void setValue(T&& value)
    {
        complete(TaskStatus::Done,
                 [&]
                 {
                     result_ = std::move(value);
                 });
    }

    void setException(std::exception_ptr exception)
    {
        complete(TaskStatus::Failed,
                 [&]
                 {
                     result_ = std::move(exception);
                 });
    }

    // Moves the value out, or rethrows the task's exception. Only valid once finished.
    auto takeResult() -> T
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (std::holds_alternative<std::exception_ptr>(result_))
        {
            std::rethrow_exception(std::get<std::exception_ptr>(result_));
        }
        return std::move(std::get<T>(result_));
    }

private:
    std::variant<std::monostate, T, std::exception_ptr> result_;
};

//
// TaskState for <void>
//
template <>
class TaskState<void> final : public CompletionState
{
public:
    void setValue()
    {
        complete(TaskStatus::Done,
                 []
                 {
                 });
    }

    void setException(std::exception_ptr exception)
    {
        complete(TaskStatus::Failed,
                 [&]
                 {
                     exception_ = std::move(exception);
                 });
    }

    void takeResult()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (exception_)
        {
            std::rethrow_exception(exception_);
        }
    }

private:
    std::exception_ptr exception_;
};

// Runs callable and stores its outcome. Never throws: the exception travels to the waiter.
template <typename T, typename Callable>
void runInto(TaskState<T>& state, Callable& callable) noexcept
{
    try
    {
        if constexpr (std::is_void_v<T>)
        {
            std::invoke(callable);
            state.setValue();
        }
        else
        {
            state.setValue(T(std::invoke(callable)));
        }
    }
    catch (...)
    {
        state.setException(std::current_exception());
    }
}

} // namespace detail

//
// TaskHandle
//
//   Awaitable handle to a submitted task. Copies share the same task. Dropping every handle
//   does not cancel the task; it still runs to completion in the background.
//
template <typename T>
class NO_DISCARD TaskHandle final
{
public:
    using ResultType = T;

    TaskHandle() = default;

    explicit TaskHandle(std::shared_ptr<detail::TaskState<T>> state) noexcept
    : state_(std::move(state))
    {
    }

    auto valid() const noexcept -> bool
    {
        return state_ != nullptr;
    }

    auto done() const -> bool
    {
        return state_ && state_->status() != TaskStatus::Pending;
    }

    auto status() const -> TaskStatus
    {
        return state_ ? state_->status() : TaskStatus::Pending;
    }

    auto state() const noexcept -> const std::shared_ptr<detail::TaskState<T>>&
    {
        return state_;
    }

private:
    std::shared_ptr<detail::TaskState<T>> state_;
};

} // namespace FanoutBench
