#pragma once

#include <fanoutbench/core/errors.h>
#include <fanoutbench/core/types.h>
#include <fanoutbench/executor/executor.h>
#include <fanoutbench/metrics/metrics_collector.h>
#include <fanoutbench/processing/unit_processor.h>
#include <fanoutbench/util/logging.h>
#include <fanoutbench/util/macros.h>
#include <fanoutbench/util/time_format.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace FanoutBench
{

struct BatchDriverConfig
{
    std::chrono::milliseconds unitTimeout{ 2000 };

    // Report a failed unit as a per-unit failure instead of discarding the whole batch.
    bool strict = false;
};

//
// BatchPerformance
//
//   Payload of the "performance_metrics" event emitted after each completed batch.
//
struct BatchPerformance
{
    std::size_t                  totalUnits      = 0;
    double                       totalDurationMs = 0.0;
    double                       avgDurationMs   = 0.0;
    std::optional<ExecutorStats> executorStats;
};

inline void to_json(nlohmann::json& j, const BatchPerformance& performance)
{
    j = {
        { "total_units", performance.totalUnits },
        { "total_duration_ms", performance.totalDurationMs },
        { "avg_duration_ms", performance.avgDurationMs },
    };
    if (performance.executorStats)
    {
        j["executor_stats"] = *performance.executorStats;
    }
}

//
// BatchDriver
//
//   Submits one task per unit, then awaits each in input order with unitTimeout. Results come
//   back in input order.
//
//   By default a batch is all or nothing: the first await that fails (timeout or error) turns
//   the whole batch into an empty result, logged as "batch_failure". Units the processor itself
//   resolved as failures are not batch failures; they are part of the result.
//
class BatchDriver final
{
public:
    BatchDriver(Executor& executor, std::shared_ptr<UnitProcessor> processor, BatchDriverConfig config = {}, MetricsCollector* metrics = nullptr)
    : executor_(executor)
    , processor_(std::move(processor))
    , config_(config)
    , metrics_(metrics)
    {
        if (!processor_)
        {
            throw std::invalid_argument("batch driver needs a unit processor");
        }
    }

    NO_MOVE_NO_COPY(BatchDriver);

    auto processBatch(const std::vector<WorkUnit>& units) -> std::vector<ProcessedUnit>
    {
        if (units.empty())
        {
            return {};
        }

        const auto start = std::chrono::steady_clock::now();

        std::vector<TaskHandle<ProcessedUnit>> handles;
        handles.reserve(units.size());
        try
        {
            for (const auto& unit : units)
            {
                handles.push_back(executor_.submit(
                    [processor = processor_, unit]
                    {
                        return processor->process(unit);
                    }));
            }
        }
        catch (const std::exception& e)
        {
            if (!config_.strict)
            {
                return failBatch(units.size(), e);
            }
            // Units that never got a task are failed here; submitted ones are still awaited.
        }

        std::vector<ProcessedUnit> results;
        results.reserve(units.size());
        for (std::size_t i = 0; i < units.size(); ++i)
        {
            if (i >= handles.size())
            {
                results.emplace_back(UnitFailure{ FailureKind::ProcessingError, units[i].id, "unit was not scheduled" });
                continue;
            }

            try
            {
                results.push_back(executor_.await(handles[i], config_.unitTimeout));
            }
            catch (const TaskTimeout& e)
            {
                if (!config_.strict)
                {
                    return failBatch(units.size(), e);
                }
                results.emplace_back(UnitFailure{ FailureKind::Timeout, units[i].id, e.what() });
            }
            catch (const std::exception& e)
            {
                if (!config_.strict)
                {
                    return failBatch(units.size(), e);
                }
                results.emplace_back(UnitFailure{ FailureKind::ProcessingError, units[i].id, e.what() });
            }
        }

        reportPerformance(units.size(), elapsedMs(start));
        return results;
    }

    auto config() const noexcept -> const BatchDriverConfig&
    {
        return config_;
    }

    auto failedBatches() const noexcept -> std::size_t
    {
        return failedBatches_.load(std::memory_order_relaxed);
    }

    auto completedBatches() const noexcept -> std::size_t
    {
        return completedBatches_.load(std::memory_order_relaxed);
    }

    auto lastPerformance() const -> std::optional<BatchPerformance>
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastPerformance_;
    }

private:
    auto failBatch(std::size_t unitCount, const std::exception& cause) -> std::vector<ProcessedUnit>
    {
        const BatchFailure failure(cause.what());

        failedBatches_.fetch_add(1, std::memory_order_relaxed);
        if (metrics_)
        {
            metrics_->recordError("batch", failure);
        }
        logEvent(spdlog::level::err, "batch_failure", { { "total_units", unitCount }, { "error", failure.what() } });
        return {};
    }

    void reportPerformance(std::size_t unitCount, double durationMs)
    {
        BatchPerformance performance;
        performance.totalUnits      = unitCount;
        performance.totalDurationMs = durationMs;
        performance.avgDurationMs   = durationMs / static_cast<double>(unitCount);
        performance.executorStats   = executor_.stats();

        logEvent(spdlog::level::info, "performance_metrics", performance);

        completedBatches_.fetch_add(1, std::memory_order_relaxed);
        std::lock_guard<std::mutex> lock(mutex_);
        lastPerformance_ = std::move(performance);
    }

    Executor&                      executor_;
    std::shared_ptr<UnitProcessor> processor_;
    BatchDriverConfig              config_;
    MetricsCollector*              metrics_;

    std::atomic<std::size_t>        failedBatches_{ 0 };
    std::atomic<std::size_t>        completedBatches_{ 0 };
    mutable std::mutex              mutex_;
    std::optional<BatchPerformance> lastPerformance_;
};

} // namespace FanoutBench
