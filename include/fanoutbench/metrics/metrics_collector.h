#pragma once

#include <fanoutbench/metrics/percentile.h>
#include <fanoutbench/util/macros.h>
#include <fanoutbench/util/process_info.h>
#include <fanoutbench/util/time_format.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <map>
#include <mutex>
#include <numeric>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace FanoutBench
{

struct ErrorSample
{
    std::string              time;
    std::string              message;
    std::vector<std::string> traceHead;
};

struct TimingStats
{
    std::size_t count = 0;
    double      min   = 0.0;
    double      max   = 0.0;
    double      avg   = 0.0;
    double      p95   = 0.0;
    double      p99   = 0.0;
};

struct MemoryStats
{
    std::size_t count = 0;
    double      min   = 0.0;
    double      max   = 0.0;
    double      avg   = 0.0;
};

struct ErrorRate
{
    std::size_t count = 0;
    double      rate  = 0.0;
};

struct MetricsSummary
{
    std::size_t totalOperations = 0;
    std::size_t totalErrors     = 0;
    double      totalDurationMs = 0.0;
};

struct MetricsStatistics
{
    std::map<std::string, TimingStats> timings;
    std::map<std::string, MemoryStats> memory;
    std::map<std::string, ErrorRate>   errorRates;
    MetricsSummary                     summary;
};

//
// MetricsCollector
//
//   Run-scoped store of timing, memory and error samples. The orchestrator owns one instance
//   and hands it out by reference; any number of threads may append concurrently. Every
//   per-key sequence only grows until reset(), which is meant to be called between runs.
//
//   Timings are milliseconds, memory samples are resident bytes.
//
class MetricsCollector final
{
public:
    MetricsCollector() = default;

    NO_MOVE_NO_COPY(MetricsCollector);

    void recordTiming(const std::string& operation, double durationMs)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        timings_[operation].push_back(durationMs);
    }

    template <typename Rep, typename Period>
    void recordTiming(const std::string& operation, std::chrono::duration<Rep, Period> duration)
    {
        recordTiming(operation, std::chrono::duration<double, std::milli>(duration).count());
    }

    // Samples the current resident set size of this process.
    void recordMemory(const std::string& implementation)
    {
        recordMemorySample(implementation, residentMemoryBytes());
    }

    void recordMemorySample(const std::string& implementation, std::uint64_t bytes)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        memory_[implementation].push_back(static_cast<double>(bytes));
    }

    void recordError(const std::string& implementation, const std::exception& error)
    {
        ErrorSample sample;
        sample.time    = currentTimestamp();
        sample.message = error.what();
        collectTrace(error, sample.traceHead);

        std::lock_guard<std::mutex> lock(mutex_);
        errors_[implementation].push_back(std::move(sample));
    }

    void recordError(const std::string& implementation, const std::string& message)
    {
        ErrorSample sample;
        sample.time    = currentTimestamp();
        sample.message = message;
        sample.traceHead.push_back(message);

        std::lock_guard<std::mutex> lock(mutex_);
        errors_[implementation].push_back(std::move(sample));
    }

    //
    // statistics
    //
    //   Derived on demand from a consistent copy of the samples. The error rate of a key is
    //   its error count over the timing samples recorded under the same key, falling back to
    //   all timing samples, then to 1.
    //
    auto statistics() const -> MetricsStatistics
    {
        std::map<std::string, std::vector<double>>      timings;
        std::map<std::string, std::vector<double>>      memory;
        std::map<std::string, std::vector<ErrorSample>> errors;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            timings = timings_;
            memory  = memory_;
            errors  = errors_;
        }

        MetricsStatistics stats;

        std::size_t totalTimingSamples = 0;
        for (auto& [operation, durations] : timings)
        {
            if (durations.empty())
            {
                continue;
            }

            std::sort(durations.begin(), durations.end());

            TimingStats entry;
            entry.count = durations.size();
            entry.min   = durations.front();
            entry.max   = durations.back();
            entry.avg   = std::accumulate(durations.begin(), durations.end(), 0.0) / static_cast<double>(durations.size());
            entry.p95   = percentileOfSorted(durations, 95);
            entry.p99   = percentileOfSorted(durations, 99);
            stats.timings.emplace(operation, entry);

            totalTimingSamples += durations.size();
            stats.summary.totalDurationMs += std::accumulate(durations.begin(), durations.end(), 0.0);
        }
        stats.summary.totalOperations = totalTimingSamples;

        for (const auto& [implementation, samples] : memory)
        {
            if (samples.empty())
            {
                continue;
            }

            const auto [lowest, highest] = std::minmax_element(samples.begin(), samples.end());

            MemoryStats entry;
            entry.count = samples.size();
            entry.min   = *lowest;
            entry.max   = *highest;
            entry.avg   = std::accumulate(samples.begin(), samples.end(), 0.0) / static_cast<double>(samples.size());
            stats.memory.emplace(implementation, entry);
        }

        for (const auto& [implementation, samples] : errors)
        {
            std::size_t denominator = totalTimingSamples;
            if (const auto it = timings.find(implementation); it != timings.end() && !it->second.empty())
            {
                denominator = it->second.size();
            }

            ErrorRate entry;
            entry.count = samples.size();
            entry.rate  = static_cast<double>(samples.size()) / static_cast<double>(std::max<std::size_t>(denominator, 1));
            stats.errorRates.emplace(implementation, entry);

            stats.summary.totalErrors += samples.size();
        }

        return stats;
    }

    auto timingSamples(const std::string& operation) const -> std::vector<double>
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto                  it = timings_.find(operation);
        return it != timings_.end() ? it->second : std::vector<double>{};
    }

    auto errorSamples(const std::string& implementation) const -> std::vector<ErrorSample>
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto                  it = errors_.find(implementation);
        return it != errors_.end() ? it->second : std::vector<ErrorSample>{};
    }

    auto timingSampleCount() const -> std::size_t
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::size_t count = 0;
        for (const auto& [operation, durations] : timings_)
        {
            count += durations.size();
        }
        return count;
    }

    void reset()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        timings_.clear();
        memory_.clear();
        errors_.clear();
    }

    auto snapshot() const -> nlohmann::json;

private:
    // First lines of the nested-exception chain, outermost first.
    static void collectTrace(const std::exception& error, std::vector<std::string>& trace)
    {
        static constexpr std::size_t kTraceDepth = 5;

        trace.emplace_back(error.what());
        if (trace.size() >= kTraceDepth)
        {
            return;
        }

        try
        {
            std::rethrow_if_nested(error);
        }
        catch (const std::exception& nested)
        {
            collectTrace(nested, trace);
        }
        catch (...)
        {
            trace.emplace_back("non-standard exception");
        }
    }

    mutable std::mutex                              mutex_;
    std::map<std::string, std::vector<double>>      timings_;
    std::map<std::string, std::vector<double>>      memory_;
    std::map<std::string, std::vector<ErrorSample>> errors_;
};

//
// JSON conversions
//

inline void to_json(nlohmann::json& j, const TimingStats& stats)
{
    j = { { "count", stats.count }, { "min", stats.min }, { "max", stats.max }, { "avg", stats.avg }, { "p95", stats.p95 }, { "p99", stats.p99 } };
}

inline void to_json(nlohmann::json& j, const MemoryStats& stats)
{
    j = { { "count", stats.count }, { "min", stats.min }, { "max", stats.max }, { "avg", stats.avg } };
}

inline void to_json(nlohmann::json& j, const ErrorRate& rate)
{
    j = { { "count", rate.count }, { "rate", rate.rate } };
}

inline void to_json(nlohmann::json& j, const MetricsSummary& summary)
{
    j = { { "total_operations", summary.totalOperations }, { "total_errors", summary.totalErrors }, { "total_duration_ms", summary.totalDurationMs } };
}

inline void to_json(nlohmann::json& j, const MetricsStatistics& stats)
{
    j = { { "timings", stats.timings }, { "memory_usage", stats.memory }, { "error_rates", stats.errorRates }, { "summary", stats.summary } };
}

inline auto MetricsCollector::snapshot() const -> nlohmann::json
{
    return statistics();
}

} // namespace FanoutBench
