#pragma once

#include <fanoutbench/core/errors.h>
#include <fanoutbench/util/logging.h>
#include <fanoutbench/util/macros.h>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace FanoutBench
{

//
// BoundedResourcePool
//
//   Guards a fixed number of reusable handles. Handles are created lazily (at most `size`
//   of them) and reused forever. A borrower gets a Lease, which hands the handle back when it
//   is destroyed, so release happens on every exit path of the borrowing scope.
//
//   INVARIANTS:
//   - A handle is either idle or owned by exactly one Lease.
//   - status().inUse + status().available == status().size.
//
template <typename T>
class BoundedResourcePool final
{
public:
    using Factory = std::function<std::unique_ptr<T>()>;
    using Closer  = std::function<void(T&)>;

    struct Status
    {
        std::size_t size      = 0;
        std::size_t available = 0;
        std::size_t inUse     = 0;
    };

    //
    // Lease
    //
    class Lease final
    {
    public:
        Lease() noexcept = default;

        Lease(Lease&& other) noexcept
        : pool_(std::exchange(other.pool_, nullptr))
        , handle_(std::move(other.handle_))
        {
        }

        auto operator=(Lease&& other) noexcept -> Lease&
        {
            if (this != &other)
            {
                release();
                pool_   = std::exchange(other.pool_, nullptr);
                handle_ = std::move(other.handle_);
            }
            return *this;
        }

        Lease(const Lease&)            = delete;
        Lease& operator=(const Lease&) = delete;

        ~Lease()
        {
            release();
        }

        auto operator->() const noexcept -> T*
        {
            return handle_.get();
        }

        auto operator*() const noexcept -> T&
        {
            return *handle_;
        }

        auto get() const noexcept -> T*
        {
            return handle_.get();
        }

        explicit operator bool() const noexcept
        {
            return handle_ != nullptr;
        }

        // Returns the handle early. Safe to call more than once.
        void release() noexcept
        {
            if (pool_ && handle_)
            {
                pool_->giveBack(std::move(handle_));
            }
            pool_ = nullptr;
        }

    private:
        friend class BoundedResourcePool;

        Lease(BoundedResourcePool* pool, std::unique_ptr<T> handle) noexcept
        : pool_(pool)
        , handle_(std::move(handle))
        {
        }

        BoundedResourcePool* pool_ = nullptr;
        std::unique_ptr<T>   handle_;
    };

    BoundedResourcePool(std::size_t size, Factory factory)
    : size_(size)
    , factory_(std::move(factory))
    {
        if (size_ == 0)
        {
            throw std::invalid_argument("resource pool size must be greater than 0");
        }
        if (!factory_)
        {
            throw std::invalid_argument("resource pool needs a handle factory");
        }
    }

    ~BoundedResourcePool() = default;

    NO_MOVE_NO_COPY(BoundedResourcePool);

    //
    // acquire
    //
    //   Blocks the calling thread until a handle is idle, a new one may be created, or the
    //   timeout elapses (PoolTimeout). A throwing factory leaves the pool unchanged.
    //
    auto acquire(std::chrono::milliseconds timeout) -> Lease
    {
        std::unique_lock<std::mutex> lock(mutex_);

        const bool ready = available_.wait_for(
            lock,
            timeout,
            [this]
            {
                return shutdown_ || !idle_.empty() || created_ < size_;
            });

        if (shutdown_)
        {
            throw PoolTimeout("resource pool is shut down");
        }
        if (!ready)
        {
            throw PoolTimeout(fmt::format("no pooled handle available within {}ms (size {})", timeout.count(), size_));
        }

        if (!idle_.empty())
        {
            auto handle = std::move(idle_.back());
            idle_.pop_back();
            return Lease(this, std::move(handle));
        }

        ++created_;
        lock.unlock();

        std::unique_ptr<T> handle;
        try
        {
            handle = factory_();
        }
        catch (...)
        {
            {
                std::lock_guard<std::mutex> rollback(mutex_);
                --created_;
            }
            available_.notify_one();
            throw;
        }

        if (!handle)
        {
            {
                std::lock_guard<std::mutex> rollback(mutex_);
                --created_;
            }
            available_.notify_one();
            throw std::runtime_error("resource pool factory returned no handle");
        }

        return Lease(this, std::move(handle));
    }

    // Scoped acquisition: borrow, run fn(handle), give the handle back however fn exits.
    template <typename Fn>
    auto with(std::chrono::milliseconds timeout, Fn&& fn) -> decltype(std::forward<Fn>(fn)(std::declval<T&>()))
    {
        auto lease = acquire(timeout);
        return std::forward<Fn>(fn)(*lease);
    }

    auto status() const -> Status
    {
        std::lock_guard<std::mutex> lock(mutex_);

        Status status;
        status.size      = size_;
        status.available = idle_.size() + (size_ - created_);
        status.inUse     = size_ - status.available;
        return status;
    }

    auto size() const noexcept -> std::size_t
    {
        return size_;
    }

    //
    // shutdown
    //
    //   Closes idle handles now and leased ones as they come back. Waiting borrowers are woken
    //   and fail with PoolTimeout.
    //
    void shutdown(Closer closer = {})
    {
        std::vector<std::unique_ptr<T>> idle;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shutdown_ = true;
            closer_   = closer;
            idle.swap(idle_);
        }
        available_.notify_all();

        for (auto& handle : idle)
        {
            if (closer)
            {
                closer(*handle);
            }
        }
    }

private:
    void giveBack(std::unique_ptr<T> handle) noexcept
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (shutdown_)
        {
            auto closer = closer_;
            lock.unlock();
            if (closer)
            {
                try
                {
                    closer(*handle);
                }
                catch (const std::exception& e)
                {
                    logger()->warn("failed to close pooled handle after shutdown: {}", e.what());
                }
            }
            return;
        }

        idle_.push_back(std::move(handle));
        lock.unlock();
        available_.notify_one();
    }

    const std::size_t size_;
    Factory           factory_;
    Closer            closer_;

    mutable std::mutex              mutex_;
    std::condition_variable         available_;
    std::vector<std::unique_ptr<T>> idle_;
    std::size_t                     created_  = 0;
    bool                            shutdown_ = false;
};

} // namespace FanoutBench
