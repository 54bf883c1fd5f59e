#pragma once

#include <fanoutbench/core/types.h>
#include <fanoutbench/metrics/metrics_collector.h>
#include <fanoutbench/processing/feed_implementation.h>
#include <fanoutbench/util/logging.h>
#include <fanoutbench/util/process_info.h>
#include <fanoutbench/util/time_format.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <future>
#include <numeric>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace FanoutBench
{

//
// IterationResult
//
//   One timed batch. A batch that threw has durationMs == -1 and is left out of averages.
//
struct IterationResult
{
    double       durationMs  = -1.0;
    std::int64_t memoryDelta = 0;
    std::size_t  processed   = 0;
    std::size_t  succeeded   = 0;
};

struct BenchmarkResult
{
    std::string                  implementation;
    std::vector<IterationResult> iterations;

    auto validDurations() const -> std::vector<double>
    {
        std::vector<double> durations;
        for (const auto& iteration : iterations)
        {
            if (iteration.durationMs >= 0.0)
            {
                durations.push_back(iteration.durationMs);
            }
        }
        return durations;
    }

    // 0 when every iteration failed.
    auto averageDurationMs() const -> double
    {
        const auto durations = validDurations();
        return durations.empty() ? 0.0 : std::accumulate(durations.begin(), durations.end(), 0.0) / static_cast<double>(durations.size());
    }

    auto averageMemoryDelta() const -> double
    {
        if (iterations.empty())
        {
            return 0.0;
        }
        double total = 0.0;
        for (const auto& iteration : iterations)
        {
            total += static_cast<double>(iteration.memoryDelta);
        }
        return total / static_cast<double>(iterations.size());
    }
};

inline void to_json(nlohmann::json& j, const BenchmarkResult& result)
{
    auto durations = nlohmann::json::array();
    auto memory    = nlohmann::json::array();
    auto processed = nlohmann::json::array();
    auto succeeded = nlohmann::json::array();
    for (const auto& iteration : result.iterations)
    {
        durations.push_back(iteration.durationMs);
        memory.push_back(iteration.memoryDelta);
        processed.push_back(iteration.processed);
        succeeded.push_back(iteration.succeeded);
    }
    j = { { "durations", durations }, { "memory", memory }, { "processed", processed }, { "succeeded", succeeded } };
}

struct WarmupOutcome
{
    bool        completed = false;
    std::string message;
};

//
// warmUp
//
//   Runs one untimed batch and reports whether it finished within timeout. A batch that is
//   still running at the deadline is reported as failed, then waited for, so the timed runs
//   never overlap with it.
//
inline auto warmUp(FeedImplementation& implementation, const std::vector<WorkUnit>& units, std::chrono::milliseconds timeout) -> WarmupOutcome
{
    std::packaged_task<std::vector<ProcessedUnit>()> task([&implementation, &units] { return implementation.processFeedUnits(units); });
    auto                                             result = task.get_future();
    std::thread                                      runner(std::move(task));

    WarmupOutcome outcome;
    if (result.wait_for(timeout) == std::future_status::timeout)
    {
        outcome.message = fmt::format("timed out after {}ms", timeout.count());
        runner.join();
        return outcome;
    }
    runner.join();

    try
    {
        result.get();
        outcome.completed = true;
    }
    catch (const std::exception& e)
    {
        outcome.message = e.what();
    }
    return outcome;
}

//
// runIteration
//
//   Times one full batch and the resident memory it left behind. Batch duration is recorded
//   as timing "benchmark.<implementation>", resident memory under the implementation name.
//
inline auto runIteration(FeedImplementation& implementation, const std::vector<WorkUnit>& units, MetricsCollector& metrics) -> IterationResult
{
    IterationResult result;

    const auto memoryBefore = residentMemoryBytes();
    const auto start        = std::chrono::steady_clock::now();
    try
    {
        const auto processed = implementation.processFeedUnits(units);

        result.durationMs = elapsedMs(start);
        result.processed  = processed.size();
        result.succeeded  = static_cast<std::size_t>(std::count_if(processed.begin(), processed.end(), [](const ProcessedUnit& unit) { return isSuccess(unit); }));
        metrics.recordTiming("benchmark." + implementation.name(), result.durationMs);
    }
    catch (const std::exception& e)
    {
        metrics.recordError(implementation.name(), e);
        logger()->error("benchmark iteration for {} failed: {}", implementation.name(), e.what());
    }
    result.memoryDelta = static_cast<std::int64_t>(residentMemoryBytes()) - static_cast<std::int64_t>(memoryBefore);
    metrics.recordMemory(implementation.name());
    return result;
}

//
// BenchmarkComparison
//
//   Candidate vs baseline. Positive speed improvement means the candidate was faster; the memory
//   difference is baseline minus candidate, in megabytes.
//
struct BenchmarkComparison
{
    double speedImprovement   = 0.0;
    double memoryDifferenceMb = 0.0;
};

inline auto compareBenchmarks(const BenchmarkResult& candidate, const BenchmarkResult& baseline) -> std::optional<BenchmarkComparison>
{
    const auto candidateAvg = candidate.averageDurationMs();
    const auto baselineAvg  = baseline.averageDurationMs();
    if (candidateAvg == 0.0 || baselineAvg == 0.0)
    {
        return std::nullopt;
    }

    BenchmarkComparison comparison;
    comparison.speedImprovement   = (baselineAvg - candidateAvg) / baselineAvg * 100.0;
    comparison.memoryDifferenceMb = (baseline.averageMemoryDelta() - candidate.averageMemoryDelta()) / 1024.0 / 1024.0;
    return comparison;
}

} // namespace FanoutBench
