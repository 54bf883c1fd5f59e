#pragma once

#include <fanoutbench/client/api_client.h>
#include <fanoutbench/pool/resource_pool.h>
#include <fanoutbench/util/logging.h>
#include <fanoutbench/util/macros.h>

#include <chrono>
#include <cstddef>
#include <exception>
#include <memory>
#include <string>
#include <utility>

namespace FanoutBench
{

//
// ApiClientPool
//
//   A named BoundedResourcePool of upstream clients. Each sub-fetch borrows one client for
//   the duration of a single call.
//
class ApiClientPool final
{
public:
    using Factory = BoundedResourcePool<IApiClient>::Factory;
    using Status  = BoundedResourcePool<IApiClient>::Status;

    ApiClientPool(std::string name, std::size_t size, std::chrono::milliseconds acquireTimeout, Factory factory)
    : name_(std::move(name))
    , acquireTimeout_(acquireTimeout)
    , pool_(size, std::move(factory))
    {
    }

    // Pool of MockApiClient instances sharing one latency/error profile.
    static auto mock(std::string name, std::size_t size, std::chrono::milliseconds acquireTimeout, std::chrono::milliseconds latency, double errorRate)
        -> std::shared_ptr<ApiClientPool>
    {
        auto clientName = name;
        return std::make_shared<ApiClientPool>(
            std::move(name),
            size,
            acquireTimeout,
            [clientName, latency, errorRate]() -> std::unique_ptr<IApiClient>
            {
                return std::make_unique<MockApiClient>(clientName, latency, errorRate);
            });
    }

    NO_MOVE_NO_COPY(ApiClientPool);

    //
    // withClient
    //
    //   Runs fn(client) on a borrowed client. Throws PoolTimeout if no client frees up in time.
    //   Errors raised by fn are logged here and rethrown to the caller unchanged.
    //
    template <typename Fn>
    auto withClient(Fn&& fn) -> decltype(std::forward<Fn>(fn)(std::declval<IApiClient&>()))
    {
        return pool_.with(
            acquireTimeout_,
            [&](IApiClient& client) -> decltype(auto)
            {
                try
                {
                    return std::forward<Fn>(fn)(client);
                }
                catch (const std::exception& e)
                {
                    logEvent(spdlog::level::err, "pool_client_error", { { "pool", name_ }, { "client", client.name() }, { "error", e.what() } });
                    throw;
                }
            });
    }

    auto status() const -> Status
    {
        return pool_.status();
    }

    void shutdown()
    {
        pool_.shutdown();
    }

    auto name() const noexcept -> const std::string&
    {
        return name_;
    }

private:
    std::string                     name_;
    std::chrono::milliseconds       acquireTimeout_;
    BoundedResourcePool<IApiClient> pool_;
};

} // namespace FanoutBench
