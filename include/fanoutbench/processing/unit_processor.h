#pragma once

#include <fanoutbench/client/api_client_pool.h>
#include <fanoutbench/core/errors.h>
#include <fanoutbench/core/types.h>
#include <fanoutbench/executor/executor.h>
#include <fanoutbench/metrics/metrics_collector.h>
#include <fanoutbench/util/logging.h>
#include <fanoutbench/util/macros.h>
#include <fanoutbench/util/time_format.h>

#include <chrono>
#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace FanoutBench
{

//
// Source
//
//   A named upstream the processor fetches from, backed by its own client pool.
//
struct Source
{
    std::string                    name;
    std::shared_ptr<ApiClientPool> pool;
};

//
// UnitProcessor
//
//   Turns one WorkUnit into one ProcessedUnit by fanning out two independent sub-fetches
//   ("primary" and "secondary") through the executor and merging their results.
//
//   - Each sub-fetch is awaited with its own fetchTimeout.
//   - Any sub-fetch timeout makes the unit a Timeout failure; the other result is dropped.
//   - Any other sub-fetch error makes it a ProcessingError failure.
//   - Every sub-fetch attempt records its duration; failed ones also record an error.
//   - Every failed unit records an error under "unit".
//
//   Sub-fetch tasks only capture the sources and the metrics pointer, so they may outlive the
//   processor. The metrics collector must outlive the executor.
//
class UnitProcessor final
{
public:
    UnitProcessor(Executor& executor, Source primary, Source secondary, std::chrono::milliseconds fetchTimeout, MetricsCollector* metrics = nullptr)
    : executor_(executor)
    , primary_(std::move(primary))
    , secondary_(std::move(secondary))
    , fetchTimeout_(fetchTimeout)
    , metrics_(metrics)
    {
        if (!primary_.pool || !secondary_.pool)
        {
            throw std::invalid_argument("unit processor sources need a client pool");
        }
    }

    NO_MOVE_NO_COPY(UnitProcessor);

private:
    //
    // makeFetch
    //
    //   Builds the sub-fetch task. Timing is recorded under "fetch.<source>" whether or not the
    //   call succeeds; failures additionally log "api_error" and record an error under the
    //   same key before propagating.
    //
    auto makeFetch(const Source& source, const std::string& unitId) const
    {
        return [source, unitId, metrics = metrics_]() -> SubFetchResult
        {
            const auto operation = "fetch." + source.name;
            const auto start     = std::chrono::steady_clock::now();
            try
            {
                auto result = source.pool->withClient([](IApiClient& client) { return client.fetch(); });

                const auto durationMs = elapsedMs(start);
                if (metrics)
                {
                    metrics->recordTiming(operation, durationMs);
                }
                logEvent(spdlog::level::debug, "api_call", { { "api", source.name }, { "unit_id", unitId }, { "duration_ms", durationMs } });
                return result;
            }
            catch (const std::exception& e)
            {
                const auto durationMs = elapsedMs(start);
                if (metrics)
                {
                    metrics->recordTiming(operation, durationMs);
                    metrics->recordError(operation, e);
                }
                logEvent(spdlog::level::err, "api_error", { { "api", source.name }, { "unit_id", unitId }, { "duration_ms", durationMs }, { "error", e.what() } });
                throw;
            }
        };
    }

public:
    auto process(const WorkUnit& unit) -> ProcessedUnit
    {
        TaskHandle<SubFetchResult> primary;
        TaskHandle<SubFetchResult> secondary;
        try
        {
            primary   = executor_.submit(makeFetch(primary_, unit.id));
            secondary = executor_.submit(makeFetch(secondary_, unit.id));
        }
        catch (const std::exception& e)
        {
            return processingError(unit, e.what());
        }

        auto primaryOutcome   = awaitFetch(primary);
        auto secondaryOutcome = awaitFetch(secondary);

        if (primaryOutcome.timedOut || secondaryOutcome.timedOut)
        {
            const auto& outcome = primaryOutcome.timedOut ? primaryOutcome : secondaryOutcome;
            return timeoutError(unit, outcome.error);
        }
        if (!primaryOutcome.value || !secondaryOutcome.value)
        {
            const auto& outcome = !primaryOutcome.value ? primaryOutcome : secondaryOutcome;
            return processingError(unit, outcome.error);
        }

        UnitSuccess success;
        success.mergedResults.emplace(primary_.name, std::move(*primaryOutcome.value));
        success.mergedResults.emplace(secondary_.name, std::move(*secondaryOutcome.value));
        success.processedAt = currentTimestamp();
        return success;
    }

    auto fetchTimeout() const noexcept -> std::chrono::milliseconds
    {
        return fetchTimeout_;
    }

    auto primary() const noexcept -> const Source&
    {
        return primary_;
    }

    auto secondary() const noexcept -> const Source&
    {
        return secondary_;
    }

private:
    static constexpr const char* kUnitErrorKey = "unit";

    struct FetchOutcome
    {
        std::optional<SubFetchResult> value;
        bool                          timedOut = false;
        std::string                   error;
    };

    auto awaitFetch(const TaskHandle<SubFetchResult>& handle) -> FetchOutcome
    {
        FetchOutcome outcome;
        try
        {
            outcome.value = executor_.await(handle, fetchTimeout_);
        }
        catch (const TaskTimeout& e)
        {
            outcome.timedOut = true;
            outcome.error    = e.what();
        }
        catch (const std::exception& e)
        {
            outcome.error = e.what();
        }
        return outcome;
    }

    auto timeoutError(const WorkUnit& unit, const std::string& message) -> ProcessedUnit
    {
        if (metrics_)
        {
            metrics_->recordError(kUnitErrorKey, TaskTimeout(message));
        }
        logEvent(spdlog::level::err, "timeout_error", { { "unit_id", unit.id }, { "error", message } });
        return UnitFailure{ FailureKind::Timeout, unit.id, message };
    }

    auto processingError(const WorkUnit& unit, const std::string& message) -> ProcessedUnit
    {
        if (metrics_)
        {
            metrics_->recordError(kUnitErrorKey, ProcessingError(message));
        }
        logEvent(spdlog::level::err, "processing_error", { { "unit_id", unit.id }, { "error", message } });
        return UnitFailure{ FailureKind::ProcessingError, unit.id, message };
    }

    Executor&                 executor_;
    Source                    primary_;
    Source                    secondary_;
    std::chrono::milliseconds fetchTimeout_;
    MetricsCollector*         metrics_;
};

} // namespace FanoutBench
