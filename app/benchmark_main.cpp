#include "cli.h"

#include <fanoutbench/benchmark/benchmark_runner.h>
#include <fanoutbench/metrics/metrics_collector.h>
#include <fanoutbench/processing/feed_implementation.h>
#include <fanoutbench/processing/unit_generator.h>
#include <fanoutbench/report/results_writer.h>
#include <fanoutbench/util/process_info.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <map>
#include <memory>
#include <vector>

#include <fmt/core.h>

namespace
{

using namespace FanoutBench;

constexpr auto kDrainTimeout = std::chrono::seconds(30);

void printConfiguration(const BenchConfig& config, std::size_t units)
{
    fmt::print("\nBenchmark Configuration:\n");
    fmt::print("- Test data size: {} units\n", units);
    fmt::print("- Iterations: {}\n", config.benchmark.iterations);
    fmt::print("- Compiler: {}\n", compilerDescription());
    fmt::print("- Available processors: {}\n", processorCount());
    fmt::print("- Total memory: {}MB\n\n", systemMemory().totalBytes / 1024 / 1024);
}

void printImplementationStats(const BenchmarkResult& result)
{
    const auto durations = result.validDurations();
    if (durations.empty())
    {
        fmt::print("  All runs failed\n");
        return;
    }

    const auto [lowest, highest] = std::minmax_element(durations.begin(), durations.end());
    fmt::print("  Duration:\n");
    fmt::print("    Average: {:.2f}ms\n", result.averageDurationMs());
    fmt::print("    Min: {:.2f}ms\n", *lowest);
    fmt::print("    Max: {:.2f}ms\n", *highest);
    fmt::print("  Memory:\n");
    fmt::print("    Average: {:.2f}MB\n", result.averageMemoryDelta() / 1024.0 / 1024.0);
}

auto benchmarkImplementation(FeedImplementation& implementation, const std::vector<WorkUnit>& units, const BenchConfig& config, MetricsCollector& metrics)
    -> BenchmarkResult
{
    BenchmarkResult result;
    result.implementation = implementation.name();

    for (std::size_t i = 0; i < config.benchmark.iterations; ++i)
    {
        fmt::print("  Run {}/{}: ", i + 1, config.benchmark.iterations);
        const auto iteration = runIteration(implementation, units, metrics);
        if (iteration.durationMs < 0.0)
        {
            fmt::print("failed\n");
        }
        else
        {
            fmt::print("{:.2f}ms (Memory: {:.2f}MB, {}/{} units succeeded)\n",
                       iteration.durationMs,
                       static_cast<double>(iteration.memoryDelta) / 1024.0 / 1024.0,
                       iteration.succeeded,
                       iteration.processed);
        }
        result.iterations.push_back(iteration);
    }
    return result;
}

} // namespace

int main(int argc, char** argv)
{
    int        exitCode = 0;
    const auto cli      = App::parseCli(argc, argv);
    const auto config   = App::prepare(cli, exitCode);
    if (!config)
    {
        return exitCode;
    }

    fmt::print("Generating test data...\n");
    const auto units = generateUnits(config->benchmark.units, "test");
    printConfiguration(*config, units.size());

    MetricsCollector metrics;

    std::vector<std::unique_ptr<FeedImplementation>> implementations;
    try
    {
        implementations.push_back(FeedImplementation::create(ExecutorPolicy::Lightweight, *config, &metrics));
        implementations.push_back(FeedImplementation::create(ExecutorPolicy::WorkerPool, *config, &metrics));
    }
    catch (const std::exception& e)
    {
        fmt::print(stderr, "Could not build implementations: {}\n", e.what());
        return 1;
    }

    fmt::print("Warming up implementations...\n");
    const std::vector<WorkUnit> sample(units.begin(), units.begin() + static_cast<std::ptrdiff_t>(std::min(config->benchmark.warmupUnits, units.size())));
    for (auto& implementation : implementations)
    {
        fmt::print("- Warming up {}...", implementation->name());
        const auto outcome = warmUp(*implementation, sample, config->benchmark.warmupTimeout);
        if (outcome.completed)
        {
            fmt::print(" done\n");
        }
        else
        {
            fmt::print(" failed ({})\n", outcome.message);
        }
    }
    fmt::print("\n");

    std::map<std::string, BenchmarkResult> results;
    for (auto& implementation : implementations)
    {
        fmt::print("Running benchmark for {}...\n", implementation->name());
        results[implementation->name()] = benchmarkImplementation(*implementation, units, *config, metrics);
    }

    fmt::print("\nBenchmark Results:\n==================\n");
    for (const auto& [name, result] : results)
    {
        fmt::print("\n{}:\n", name);
        printImplementationStats(result);
    }

    const auto candidate = results.find(std::string(implementationName(ExecutorPolicy::Lightweight)));
    const auto baseline  = results.find(std::string(implementationName(ExecutorPolicy::WorkerPool)));
    if (candidate != results.end() && baseline != results.end())
    {
        if (const auto comparison = compareBenchmarks(candidate->second, baseline->second))
        {
            fmt::print("\nPerformance Comparison:\n======================\n");
            fmt::print("Lightweight tasks vs worker pool:\n");
            fmt::print("  Speed improvement: {:.2f}%\n", comparison->speedImprovement);
            fmt::print("  Memory difference: {:.2f}MB\n", comparison->memoryDifferenceMb);
        }
    }

    for (auto& implementation : implementations)
    {
        if (!implementation->shutdown(kDrainTimeout))
        {
            fmt::print("{} did not drain within {}s\n", implementation->name(), kDrainTimeout.count());
        }
    }

    nlohmann::json configuration = environmentInfo();
    configuration["settings"]    = config->toJson();

    nlohmann::json document = results;
    document["metrics"]     = metrics.snapshot();

    try
    {
        const auto path = writeResults(config->output.resultsDir, "benchmark", configuration, document);
        fmt::print("\nDetailed results saved to: {}\n", path.string());
    }
    catch (const std::exception& e)
    {
        fmt::print(stderr, "Could not save results: {}\n", e.what());
        return 1;
    }
    return 0;
}
