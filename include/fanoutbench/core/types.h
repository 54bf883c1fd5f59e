#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

namespace FanoutBench
{

//
// WorkUnit
//
//   One logical item of work. Created by a generator, then only read.
//
struct WorkUnit
{
    std::string    id;
    std::string    kind;
    std::string    timestamp;
    nlohmann::json metadata = nlohmann::json::object();
};

//
// SubFetchResult
//
//   What an upstream client returns for one sub-fetch. The payload is opaque to the core.
//
struct SubFetchResult
{
    std::string    sourceName;
    std::string    id;
    std::string    timestamp;
    nlohmann::json payload;
};

//
// FailureKind
//
enum class FailureKind : std::uint8_t
{
    Timeout,
    ProcessingError,
};

constexpr auto toString(FailureKind kind) -> std::string_view
{
    switch (kind)
    {
        case FailureKind::Timeout:
            return "Timeout";
        case FailureKind::ProcessingError:
            return "ProcessingError";
    }
    return "Unknown";
}

//
// ProcessedUnit
//
//   Exactly one of Success or Failure. The variant index is the only tag.
//
struct UnitSuccess
{
    std::map<std::string, SubFetchResult> mergedResults;
    std::string                           processedAt;
};

struct UnitFailure
{
    FailureKind kind = FailureKind::ProcessingError;
    std::string unitId;
    std::string message;
};

using ProcessedUnit = std::variant<UnitSuccess, UnitFailure>;

inline auto isSuccess(const ProcessedUnit& unit) -> bool
{
    return std::holds_alternative<UnitSuccess>(unit);
}

//
// ExecutorStats
//
//   Point-in-time snapshot of a bounded worker pool.
//
struct ExecutorStats
{
    std::size_t completedTasks = 0;
    std::size_t queueLength    = 0;
    std::size_t poolSize       = 0;
    std::size_t activeThreads  = 0;
};

//
// JSON conversions
//

inline void to_json(nlohmann::json& j, const WorkUnit& unit)
{
    j = { { "id", unit.id }, { "type", unit.kind }, { "timestamp", unit.timestamp }, { "metadata", unit.metadata } };
}

inline void to_json(nlohmann::json& j, const SubFetchResult& result)
{
    j = { { "id", result.id }, { "timestamp", result.timestamp }, { "source", result.sourceName }, { "data", result.payload } };
}

inline void to_json(nlohmann::json& j, const ExecutorStats& stats)
{
    j = {
        { "completed_tasks", stats.completedTasks },
        { "queue_length", stats.queueLength },
        { "pool_size", stats.poolSize },
        { "active_threads", stats.activeThreads },
    };
}

inline void to_json(nlohmann::json& j, const ProcessedUnit& unit)
{
    if (const auto* success = std::get_if<UnitSuccess>(&unit))
    {
        j = { { "processed_at", success->processedAt }, { "results", success->mergedResults } };
    }
    else
    {
        const auto& failure = std::get<UnitFailure>(unit);
        j                   = { { "error", std::string(toString(failure.kind)) }, { "unit_id", failure.unitId }, { "message", failure.message } };
    }
}

} // namespace FanoutBench
