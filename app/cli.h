#pragma once

#include <fanoutbench/config/bench_config.h>
#include <fanoutbench/report/results_writer.h>
#include <fanoutbench/util/logging.h>

#include <exception>
#include <optional>
#include <string>
#include <vector>

#include <fmt/core.h>

namespace FanoutBench::App
{

struct Cli
{
    std::string              configPath{ "config/fanoutbench.json" };
    bool                     cleanup = false;
    std::vector<std::string> positional;
};

inline auto parseCli(int argc, char** argv) -> Cli
{
    Cli cli{};
    for (int idx = 1; idx < argc; ++idx)
    {
        const std::string arg = argv[idx];
        if (arg == "--config" && idx + 1 < argc)
        {
            cli.configPath = argv[++idx];
        }
        else if (arg == "--cleanup")
        {
            cli.cleanup = true;
        }
        else
        {
            cli.positional.push_back(arg);
        }
    }
    return cli;
}

//
// prepare
//
//   Loads the configuration, handles --cleanup, creates the output directories and points the
//   logger at them. Returns nullopt when the run should stop; exitCode says how.
//
inline auto prepare(const Cli& cli, int& exitCode) -> std::optional<BenchConfig>
{
    auto config = BenchConfig::loadFromFile(cli.configPath);

    if (cli.cleanup)
    {
        const auto removed = cleanupDirectories(config.output);
        fmt::print("Removed {} entries from {}, {} and {}\n", removed, config.output.logDir, config.output.resultsDir, config.output.tmpDir);
        exitCode = 0;
        return std::nullopt;
    }

    try
    {
        ensureDirectories(config.output);
        configureLogging(config.output.logLevel, config.output.logDir);
    }
    catch (const std::exception& e)
    {
        fmt::print(stderr, "Setup failed: {}\n", e.what());
        exitCode = 1;
        return std::nullopt;
    }
    return config;
}

} // namespace FanoutBench::App
