#pragma once

#include <fanoutbench/config/bench_config.h>
#include <fanoutbench/util/logging.h>
#include <fanoutbench/util/process_info.h>
#include <fanoutbench/util/time_format.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>

#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <spdlog/version.h>

namespace FanoutBench
{

//
// environmentInfo
//
//   Build and host facts recorded next to every result document.
//
inline auto environmentInfo() -> nlohmann::json
{
    const auto memory = systemMemory();
    return {
        { "compiler", compilerDescription() },
        { "cxx_standard", static_cast<long>(__cplusplus) },
        { "fmt_version", fmt::format("{}.{}.{}", FMT_VERSION / 10000, FMT_VERSION / 100 % 100, FMT_VERSION % 100) },
        { "spdlog_version", fmt::format("{}.{}.{}", SPDLOG_VER_MAJOR, SPDLOG_VER_MINOR, SPDLOG_VER_PATCH) },
        { "processors", processorCount() },
        { "memory_total_mb", memory.totalBytes / 1024 / 1024 },
        { "memory_available_mb", memory.availableBytes / 1024 / 1024 },
        { "memory_free_mb", memory.freeBytes / 1024 / 1024 },
    };
}

// Creates the log, results and tmp directories. Throws std::filesystem::filesystem_error.
inline void ensureDirectories(const OutputConfig& output)
{
    for (const auto& dir : { output.logDir, output.resultsDir, output.tmpDir })
    {
        std::filesystem::create_directories(dir);
    }
}

// Removes the log, results and tmp directories. Returns the number of entries removed.
inline auto cleanupDirectories(const OutputConfig& output) -> std::uintmax_t
{
    std::uintmax_t removed = 0;
    for (const auto& dir : { output.logDir, output.resultsDir, output.tmpDir })
    {
        std::error_code ec;
        const auto      count = std::filesystem::remove_all(dir, ec);
        if (ec)
        {
            logger()->warn("could not remove {}: {}", dir, ec.message());
            continue;
        }
        removed += count;
    }
    return removed;
}

inline auto makeResultsDocument(const nlohmann::json& configuration, const nlohmann::json& results) -> nlohmann::json
{
    return { { "configuration", configuration }, { "results", results }, { "timestamp", currentTimestamp() } };
}

//
// writeResults
//
//   Writes {configuration, results, timestamp} to <dir>/<prefix>_YYYYmmdd_HHMMSS.json and returns
//   the path. Throws std::runtime_error if the file cannot be written.
//
inline auto writeResults(const std::string& dir, const std::string& prefix, const nlohmann::json& configuration, const nlohmann::json& results)
    -> std::filesystem::path
{
    std::filesystem::create_directories(dir);

    const auto path = std::filesystem::path(dir) / fmt::format("{}_{}.json", prefix, fileTimestamp());
    std::ofstream out(path);
    if (!out.is_open())
    {
        throw std::runtime_error("cannot open results file " + path.string());
    }

    out << makeResultsDocument(configuration, results).dump(2) << '\n';
    if (!out)
    {
        throw std::runtime_error("failed writing results file " + path.string());
    }

    logEvent(spdlog::level::info, "results_saved", { { "path", path.string() } });
    return path;
}

} // namespace FanoutBench
