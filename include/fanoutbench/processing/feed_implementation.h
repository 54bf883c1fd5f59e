#pragma once

#include <fanoutbench/client/api_client_pool.h>
#include <fanoutbench/config/bench_config.h>
#include <fanoutbench/core/types.h>
#include <fanoutbench/executor/executor.h>
#include <fanoutbench/executor/executor_factory.h>
#include <fanoutbench/load/load_generator.h>
#include <fanoutbench/metrics/metrics_collector.h>
#include <fanoutbench/processing/batch_driver.h>
#include <fanoutbench/processing/unit_processor.h>
#include <fanoutbench/util/logging.h>
#include <fanoutbench/util/macros.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace FanoutBench
{

constexpr auto implementationName(ExecutorPolicy policy) -> std::string_view
{
    switch (policy)
    {
        case ExecutorPolicy::WorkerPool:
            return "WorkerPoolImplementation";
        case ExecutorPolicy::Lightweight:
            return "LightweightImplementation";
    }
    return "UnknownImplementation";
}

//
// FeedImplementation
//
//   One complete pipeline under comparison: an executor, the two client pools, a UnitProcessor
//   and a BatchDriver. The name follows the requested policy even when the executor fell back
//   to a worker pool; executor().policy() reports what actually runs.
//
//   Destruction drains the executor before anything its tasks may touch goes away.
//
class FeedImplementation final
{
public:
    struct Parts
    {
        std::string               name;
        std::unique_ptr<Executor> executor;
        Source                    primary;
        Source                    secondary;
        TimeoutConfig             timeouts;
        bool                      strict  = false;
        MetricsCollector*         metrics = nullptr;
    };

    explicit FeedImplementation(Parts parts)
    : name_(std::move(parts.name))
    , primaryPool_(parts.primary.pool)
    , secondaryPool_(parts.secondary.pool)
    , executor_(std::move(parts.executor))
    {
        if (!executor_)
        {
            throw std::invalid_argument("feed implementation needs an executor");
        }

        processor_ = std::make_shared<UnitProcessor>(*executor_, std::move(parts.primary), std::move(parts.secondary), parts.timeouts.fetchTimeout, parts.metrics);
        driver_    = std::make_unique<BatchDriver>(*executor_, processor_, BatchDriverConfig{ parts.timeouts.unitTimeout, parts.strict }, parts.metrics);
    }

    // Builds the pipeline for a policy from configuration, with mock upstream clients.
    static auto create(ExecutorPolicy policy, const BenchConfig& config, MetricsCollector* metrics) -> std::unique_ptr<FeedImplementation>
    {
        const auto makePool = [&config](const ClientConfig& client)
        {
            return ApiClientPool::mock(client.name, config.pool.size, config.pool.acquireTimeout, client.latency, client.errorRate);
        };

        Parts parts;
        parts.name      = std::string(implementationName(policy));
        parts.executor  = makeExecutor(policy, config.executor);
        parts.primary   = Source{ config.primary.name, makePool(config.primary) };
        parts.secondary = Source{ config.secondary.name, makePool(config.secondary) };
        parts.timeouts  = config.timeoutsFor(policy);
        parts.strict    = config.strictBatches;
        parts.metrics   = metrics;
        return std::make_unique<FeedImplementation>(std::move(parts));
    }

    ~FeedImplementation()
    {
        driver_.reset();
        executor_.reset();
    }

    NO_MOVE_NO_COPY(FeedImplementation);

    auto processFeedUnits(const std::vector<WorkUnit>& units) -> std::vector<ProcessedUnit>
    {
        return driver_->processBatch(units);
    }

    // Stops accepting work, drains, then closes both client pools. True if the drain finished.
    auto shutdown(std::chrono::milliseconds drainTimeout) -> bool
    {
        const auto drained = executor_->shutdown(drainTimeout);
        primaryPool_->shutdown();
        secondaryPool_->shutdown();
        logEvent(spdlog::level::info, "implementation_shutdown", { { "implementation", name_ }, { "drained", drained } });
        return drained;
    }

    auto loadTarget() -> LoadTarget
    {
        return LoadTarget{ name_,
                           [this](const std::vector<WorkUnit>& units)
                           {
                               return processFeedUnits(units);
                           } };
    }

    auto name() const noexcept -> const std::string&
    {
        return name_;
    }

    auto executor() const noexcept -> Executor&
    {
        return *executor_;
    }

    auto driver() const noexcept -> BatchDriver&
    {
        return *driver_;
    }

private:
    std::string                    name_;
    std::shared_ptr<ApiClientPool> primaryPool_;
    std::shared_ptr<ApiClientPool> secondaryPool_;
    std::unique_ptr<Executor>      executor_;
    std::shared_ptr<UnitProcessor> processor_;
    std::unique_ptr<BatchDriver>   driver_;
};

} // namespace FanoutBench
