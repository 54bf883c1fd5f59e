#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace FanoutBench
{

//
// StopSignal
//
//   Shared, cooperative stop flag. Copies observe the same flag. Nothing is interrupted when it
//   fires; holders check it between iterations, and sleepers in waitFor() wake up early.
//
class StopSignal
{
public:
    StopSignal()
    : state_(std::make_shared<State>())
    {
    }

    auto stopRequested() const -> bool
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->stopped;
    }

    void requestStop()
    {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->stopped = true;
        }
        state_->changed.notify_all();
    }

    void reset()
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->stopped = false;
    }

    // Sleeps for up to duration. Returns true if the stop was requested.
    template <typename Rep, typename Period>
    auto waitFor(std::chrono::duration<Rep, Period> duration) const -> bool
    {
        std::unique_lock<std::mutex> lock(state_->mutex);
        return state_->changed.wait_for(lock, duration, [this] { return state_->stopped; });
    }

private:
    struct State
    {
        std::mutex              mutex;
        std::condition_variable changed;
        bool                    stopped = false;
    };

    std::shared_ptr<State> state_;
};

} // namespace FanoutBench
