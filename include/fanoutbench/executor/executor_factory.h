#pragma once

#include <fanoutbench/core/errors.h>
#include <fanoutbench/executor/executor.h>
#include <fanoutbench/executor/lightweight_executor.h>
#include <fanoutbench/executor/worker_pool_executor.h>
#include <fanoutbench/util/logging.h>
#include <fanoutbench/util/process_info.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace FanoutBench
{

struct ExecutorConfig
{
    WorkerPoolConfig workerPool;
    std::size_t      fallbackThreads = 2 * processorCount();
};

using ExecutorBuilder = std::function<std::unique_ptr<Executor>()>;

//
// makeExecutor
//
//   Builds the executor for a policy, once. When the lightweight substrate cannot be built
//   the caller still gets a working executor: a fixed-size worker pool.
//   `lightweight` replaces the default LightweightExecutor construction (used by tests).
//
inline auto makeExecutor(ExecutorPolicy policy, const ExecutorConfig& config, const ExecutorBuilder& lightweight = {}) -> std::unique_ptr<Executor>
{
    if (policy == ExecutorPolicy::WorkerPool)
    {
        return std::make_unique<WorkerPoolExecutor>(config.workerPool);
    }

    try
    {
        if (lightweight)
        {
            return lightweight();
        }
        return std::make_unique<LightweightExecutor>();
    }
    catch (const SubstrateUnavailable& e)
    {
        logEvent(spdlog::level::warn,
                 "substrate_unavailable",
                 {
                     { "policy", std::string(toString(policy)) },
                     { "error", e.what() },
                     { "fallback_threads", config.fallbackThreads },
                 });
        return std::make_unique<WorkerPoolExecutor>(WorkerPoolConfig::fixed(config.fallbackThreads));
    }
}

} // namespace FanoutBench
