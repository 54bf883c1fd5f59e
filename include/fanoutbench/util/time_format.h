#pragma once

#include <chrono>
#include <ctime>
#include <string>

#include <fmt/chrono.h>
#include <fmt/format.h>

namespace FanoutBench
{

//
// Time formatting
//
//   Wall-clock timestamps are ISO-8601 with milliseconds and a numeric UTC offset,
//   e.g. 2024-05-01T12:30:45.123+0900.
//

inline auto formatTimestamp(std::chrono::system_clock::time_point time) -> std::string
{
    const auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(time);
    const auto millis  = std::chrono::duration_cast<std::chrono::milliseconds>(time - seconds).count();
    const auto tm      = fmt::localtime(std::chrono::system_clock::to_time_t(time));
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03d}{:%z}", tm, millis, tm);
}

inline auto currentTimestamp() -> std::string
{
    return formatTimestamp(std::chrono::system_clock::now());
}

// Compact local timestamp for result file names.
inline auto fileTimestamp() -> std::string
{
    return fmt::format("{:%Y%m%d_%H%M%S}", fmt::localtime(std::time(nullptr)));
}

inline auto elapsedMs(std::chrono::steady_clock::time_point start) -> double
{
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

} // namespace FanoutBench
