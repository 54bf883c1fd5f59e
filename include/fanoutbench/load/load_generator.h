#pragma once

#include <fanoutbench/core/types.h>
#include <fanoutbench/load/load_profile.h>
#include <fanoutbench/load/stop_signal.h>
#include <fanoutbench/metrics/metrics_collector.h>
#include <fanoutbench/metrics/percentile.h>
#include <fanoutbench/processing/unit_generator.h>
#include <fanoutbench/util/logging.h>
#include <fanoutbench/util/macros.h>
#include <fanoutbench/util/random.h>
#include <fanoutbench/util/time_format.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <functional>
#include <mutex>
#include <numeric>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace FanoutBench
{

//
// LoadState
//
enum class LoadState : std::uint8_t
{
    Idle,
    RampingUp,
    Steady,
    Stopping,
    Reported,
};

constexpr auto toString(LoadState state) -> std::string_view
{
    switch (state)
    {
        case LoadState::Idle:
            return "Idle";
        case LoadState::RampingUp:
            return "RampingUp";
        case LoadState::Steady:
            return "Steady";
        case LoadState::Stopping:
            return "Stopping";
        case LoadState::Reported:
            return "Reported";
    }
    return "Unknown";
}

struct LatencySummary
{
    double min = 0.0;
    double max = 0.0;
    double avg = 0.0;
    double p50 = 0.0;
    double p90 = 0.0;
    double p95 = 0.0;
    double p99 = 0.0;
};

//
// LoadSummary
//
//   Result of one profile run against one implementation. Latencies are milliseconds rounded
//   to two decimals, errorRate is a percentage of totalRequests. A run without a single
//   successful iteration has no latency and serializes as an empty object.
//
struct LoadSummary
{
    double         throughput = 0.0;
    double         errorRate  = 0.0;
    LatencySummary latency;
    std::size_t    totalRequests   = 0;
    std::size_t    totalErrors     = 0;
    std::int64_t   durationSeconds = 0;
    bool           hasLatency      = false;
};

inline void to_json(nlohmann::json& j, const LoadSummary& summary)
{
    if (!summary.hasLatency)
    {
        j = nlohmann::json::object();
        return;
    }

    j = {
        { "throughput", summary.throughput },
        { "error_rate", summary.errorRate },
        { "latency",
          {
              { "min", summary.latency.min },
              { "max", summary.latency.max },
              { "avg", summary.latency.avg },
              { "p50", summary.latency.p50 },
              { "p90", summary.latency.p90 },
              { "p95", summary.latency.p95 },
              { "p99", summary.latency.p99 },
          } },
        { "total_requests", summary.totalRequests },
        { "total_errors", summary.totalErrors },
        { "duration", summary.durationSeconds },
    };
}

//
// LoadTarget
//
//   What the virtual users hammer: a named batch entry point. A throw counts as a failed
//   request; any returned sequence, including an empty one, counts as a success.
//
struct LoadTarget
{
    using BatchFn = std::function<std::vector<ProcessedUnit>(const std::vector<WorkUnit>&)>;

    std::string name;
    BatchFn     processBatch;
};

struct VirtualUser
{
    std::string           id;
    std::vector<WorkUnit> units;
};

struct LoadGeneratorConfig
{
    std::size_t               unitsPerUser = 10;
    std::chrono::milliseconds thinkTimeMax{ 500 };
    std::chrono::milliseconds monitorInterval{ 1000 };
    bool                      printProgress = true;
};

//
// LoadGenerator
//
//   Drives one profile at a time: N virtual users on their own threads, started on a linear
//   ramp, each looping batch -> record -> think until the shared stop signal fires. A monitor
//   on the calling thread prints live throughput and fires the stop once the profile duration
//   has elapsed. Stopping is cooperative; in-flight batches always finish and are counted.
//
//   One run at a time per generator.
//
class LoadGenerator final
{
public:
    explicit LoadGenerator(MetricsCollector& metrics, LoadGeneratorConfig config = {})
    : metrics_(metrics)
    , config_(config)
    {
        if (config_.monitorInterval.count() <= 0)
        {
            throw std::invalid_argument("load generator monitor interval must be positive");
        }
    }

    NO_MOVE_NO_COPY(LoadGenerator);

    auto run(const LoadProfile& profile, const LoadTarget& target) -> LoadSummary
    {
        if (!target.processBatch)
        {
            throw std::invalid_argument("load target has no batch entry point");
        }

        auto expected = state_.load();
        if ((expected != LoadState::Idle && expected != LoadState::Reported) ||
            !state_.compare_exchange_strong(expected, LoadState::RampingUp))
        {
            throw std::logic_error("load generator is already running");
        }

        prepareRun(profile);

        const auto users = createUsers(profile.users);
        RunCounters counters;
        counters.users = users.size();

        logEvent(spdlog::level::info,
                 "load_run_started",
                 {
                     { "implementation", target.name },
                     { "profile", profile.name },
                     { "users", profile.users },
                     { "duration_ms", profile.duration.count() },
                     { "ramp_up_ms", profile.rampUp.count() },
                 });

        const auto start = std::chrono::steady_clock::now();

        std::vector<std::thread> threads;
        threads.reserve(users.size());
        for (std::size_t index = 0; index < users.size(); ++index)
        {
            const auto offset = rampOffset(profile, index, users.size());
            try
            {
                threads.emplace_back(
                    [this, &user = users[index], &target, &counters, index, offset, start]
                    {
                        userLoop(user, target, counters, index, offset, start);
                    });
            }
            catch (const std::system_error& e)
            {
                logEvent(spdlog::level::err, "user_start_failed", { { "user", users[index].id }, { "error", e.what() } });
                stop_.requestStop();
                break;
            }
        }

        monitor(profile, counters, start);

        state_.store(LoadState::Stopping);
        stop_.requestStop();
        for (auto& thread : threads)
        {
            thread.join();
        }

        if (config_.printProgress)
        {
            fmt::print("\n");
        }

        auto summary = summarize(profile, counters);

        logEvent(spdlog::level::info,
                 "load_run_finished",
                 {
                     { "implementation", target.name },
                     { "profile", profile.name },
                     { "total_requests", summary.totalRequests },
                     { "total_errors", summary.totalErrors },
                     { "throughput", summary.throughput },
                 });

        {
            std::lock_guard<std::mutex> lock(mutex_);
            lastSummary_ = summary;
        }
        state_.store(LoadState::Reported);
        return summary;
    }

    // Ends the current run early. The monitor notices on its next wakeup.
    void requestStop()
    {
        stop_.requestStop();
    }

    auto state() const noexcept -> LoadState
    {
        return state_.load();
    }

    auto lastSummary() const -> std::optional<LoadSummary>
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastSummary_;
    }

    auto usersStarted() const noexcept -> std::size_t
    {
        return usersStarted_.load();
    }

    // When each user of the last run entered its loop, relative to the run start.
    auto userStartOffsets() const -> std::vector<std::chrono::milliseconds>
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return startOffsets_;
    }

    auto config() const noexcept -> const LoadGeneratorConfig&
    {
        return config_;
    }

private:
    struct RunCounters
    {
        std::size_t              users = 0;
        std::atomic<std::size_t> requests{ 0 };
        std::atomic<std::size_t> errors{ 0 };
        std::mutex               mutex;
        std::vector<double>      durationsMs;
    };

    static auto rampOffset(const LoadProfile& profile, std::size_t index, std::size_t count) -> std::chrono::milliseconds
    {
        const auto fraction = static_cast<double>(index) / static_cast<double>(count);
        return std::chrono::milliseconds(static_cast<std::int64_t>(static_cast<double>(profile.rampUp.count()) * fraction));
    }

    static auto round2(double value) -> double
    {
        return std::round(value * 100.0) / 100.0;
    }

    void prepareRun(const LoadProfile& profile)
    {
        stop_.reset();
        usersStarted_.store(0);

        std::lock_guard<std::mutex> lock(mutex_);
        startOffsets_.assign(profile.users, std::chrono::milliseconds(0));
        lastSummary_.reset();
    }

    auto createUsers(std::size_t count) const -> std::vector<VirtualUser>
    {
        std::vector<VirtualUser> users;
        users.reserve(count);
        for (std::size_t i = 0; i < count; ++i)
        {
            auto id = "user_" + std::to_string(i);
            users.push_back({ id, generateUnits(config_.unitsPerUser, id, UnitIds::Random) });
        }
        return users;
    }

    void userLoop(const VirtualUser& user, const LoadTarget& target, RunCounters& counters, std::size_t index, std::chrono::milliseconds offset, std::chrono::steady_clock::time_point start)
    {
        if (offset.count() > 0 && stop_.waitFor(offset))
        {
            return;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            startOffsets_[index] = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        }
        if (usersStarted_.fetch_add(1) + 1 == counters.users)
        {
            auto expected = LoadState::RampingUp;
            state_.compare_exchange_strong(expected, LoadState::Steady);
        }

        const auto operation = "load." + target.name;
        while (!stop_.stopRequested())
        {
            runIteration(user, target, counters, operation);

            const auto thinkTime = std::chrono::duration<double, std::milli>(randomUnit() * static_cast<double>(config_.thinkTimeMax.count()));
            stop_.waitFor(thinkTime);
        }
    }

    void runIteration(const VirtualUser& user, const LoadTarget& target, RunCounters& counters, const std::string& operation)
    {
        const auto started = std::chrono::steady_clock::now();
        try
        {
            target.processBatch(user.units);

            const auto durationMs = elapsedMs(started);
            metrics_.recordTiming(operation, durationMs);

            std::lock_guard<std::mutex> lock(counters.mutex);
            counters.durationsMs.push_back(durationMs);
        }
        catch (const std::exception& e)
        {
            counters.errors.fetch_add(1);
            metrics_.recordError(target.name, e);
            logEvent(spdlog::level::warn, "load_request_failed", { { "user", user.id }, { "error", e.what() } });
        }
        counters.requests.fetch_add(1);
    }

    void monitor(const LoadProfile& profile, const RunCounters& counters, std::chrono::steady_clock::time_point start)
    {
        while (true)
        {
            const auto elapsed = std::chrono::steady_clock::now() - start;
            if (elapsed >= profile.duration)
            {
                return;
            }

            if (config_.printProgress)
            {
                const auto seconds   = std::chrono::duration<double>(elapsed).count();
                const auto requests  = counters.requests.load();
                const auto errors    = counters.errors.load();
                const auto remaining = std::chrono::duration<double>(profile.duration - elapsed).count();
                fmt::print("\rRequests: {} | Throughput: {:.2f} req/s | Errors: {:.2f}% | Time remaining: {:.0f}s",
                           requests,
                           seconds > 0.0 ? static_cast<double>(requests) / seconds : 0.0,
                           requests > 0 ? static_cast<double>(errors) * 100.0 / static_cast<double>(requests) : 0.0,
                           remaining);
                std::fflush(stdout);
            }

            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(profile.duration - elapsed);
            if (stop_.waitFor(std::min(config_.monitorInterval, remaining + std::chrono::milliseconds(1))))
            {
                return;
            }
        }
    }

    auto summarize(const LoadProfile& profile, RunCounters& counters) const -> LoadSummary
    {
        LoadSummary summary;
        summary.totalRequests   = counters.requests.load();
        summary.totalErrors     = counters.errors.load();
        summary.durationSeconds = std::chrono::duration_cast<std::chrono::seconds>(profile.duration).count();

        auto& durations = counters.durationsMs;
        if (durations.empty())
        {
            return summary;
        }

        std::sort(durations.begin(), durations.end());

        const auto durationSeconds = std::chrono::duration<double>(profile.duration).count();
        summary.throughput         = durationSeconds > 0.0 ? static_cast<double>(summary.totalRequests) / durationSeconds : 0.0;
        summary.errorRate          = static_cast<double>(summary.totalErrors) * 100.0 / static_cast<double>(summary.totalRequests);

        summary.latency.min = round2(durations.front());
        summary.latency.max = round2(durations.back());
        summary.latency.avg = round2(std::accumulate(durations.begin(), durations.end(), 0.0) / static_cast<double>(durations.size()));
        summary.latency.p50 = round2(percentileOfSorted(durations, 50.0));
        summary.latency.p90 = round2(percentileOfSorted(durations, 90.0));
        summary.latency.p95 = round2(percentileOfSorted(durations, 95.0));
        summary.latency.p99 = round2(percentileOfSorted(durations, 99.0));
        summary.hasLatency  = true;
        return summary;
    }

    MetricsCollector&   metrics_;
    LoadGeneratorConfig config_;
    StopSignal          stop_;

    std::atomic<LoadState>   state_{ LoadState::Idle };
    std::atomic<std::size_t> usersStarted_{ 0 };

    mutable std::mutex                     mutex_;
    std::vector<std::chrono::milliseconds> startOffsets_;
    std::optional<LoadSummary>             lastSummary_;
};

//
// LoadComparison
//
//   Candidate vs baseline for one profile. Positive improvements favour the candidate.
//
struct LoadComparison
{
    double throughputImprovement = 0.0;
    double latencyImprovement    = 0.0;
    double errorRateDifference   = 0.0;
};

inline auto compareLoad(const LoadSummary& candidate, const LoadSummary& baseline) -> std::optional<LoadComparison>
{
    if (!candidate.hasLatency || !baseline.hasLatency || baseline.throughput <= 0.0 || baseline.latency.avg <= 0.0)
    {
        return std::nullopt;
    }

    const auto round2 = [](double value) { return std::round(value * 100.0) / 100.0; };

    LoadComparison comparison;
    comparison.throughputImprovement = round2((candidate.throughput - baseline.throughput) / baseline.throughput * 100.0);
    comparison.latencyImprovement    = round2((baseline.latency.avg - candidate.latency.avg) / baseline.latency.avg * 100.0);
    comparison.errorRateDifference   = round2(candidate.errorRate - baseline.errorRate);
    return comparison;
}

} // namespace FanoutBench
