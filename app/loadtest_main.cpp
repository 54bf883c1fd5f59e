#include "cli.h"

#include <fanoutbench/load/load_generator.h>
#include <fanoutbench/metrics/metrics_collector.h>
#include <fanoutbench/processing/feed_implementation.h>
#include <fanoutbench/report/results_writer.h>
#include <fanoutbench/util/process_info.h>

#include <chrono>
#include <exception>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <fmt/core.h>

namespace
{

using namespace FanoutBench;

constexpr auto kDrainTimeout = std::chrono::seconds(30);

using ProfileResults = std::map<std::string, std::map<std::string, LoadSummary>>;

void printConfiguration(const std::vector<LoadProfile>& profiles)
{
    fmt::print("\nLoad Test Configuration:\n");
    fmt::print("- Compiler: {}\n", compilerDescription());
    fmt::print("- Available processors: {}\n", processorCount());
    fmt::print("- Total memory: {}MB\n", systemMemory().totalBytes / 1024 / 1024);
    fmt::print("\nLoad Profiles:\n");
    for (const auto& profile : profiles)
    {
        fmt::print("  {}:\n", profile.name);
        fmt::print("    - Concurrent users: {}\n", profile.users);
        fmt::print("    - Duration: {}s\n", std::chrono::duration_cast<std::chrono::seconds>(profile.duration).count());
        fmt::print("    - Ramp-up time: {}s\n", std::chrono::duration_cast<std::chrono::seconds>(profile.rampUp).count());
    }
    fmt::print("\n");
}

void printProfileResults(const std::string& profile, const std::string& implementation, const LoadSummary& summary)
{
    if (!summary.hasLatency)
    {
        fmt::print("\n{} produced no successful requests for {} profile\n", implementation, profile);
        return;
    }

    fmt::print("\n{} results for {} profile:\n", implementation, profile);
    fmt::print("  Throughput: {:.2f} req/s\n", summary.throughput);
    fmt::print("  Error rate: {:.2f}%\n", summary.errorRate);
    fmt::print("  Latency (ms):\n");
    fmt::print("    Min: {}\n", summary.latency.min);
    fmt::print("    Avg: {}\n", summary.latency.avg);
    fmt::print("    Max: {}\n", summary.latency.max);
    fmt::print("    P50: {}\n", summary.latency.p50);
    fmt::print("    P90: {}\n", summary.latency.p90);
    fmt::print("    P95: {}\n", summary.latency.p95);
    fmt::print("    P99: {}\n", summary.latency.p99);
    fmt::print("  Total requests: {}\n", summary.totalRequests);
    fmt::print("  Total errors: {}\n", summary.totalErrors);
}

void printFinalComparison(const std::vector<LoadProfile>& profiles, const ProfileResults& results)
{
    fmt::print("\nFinal Comparison:\n=================\n");

    const auto candidateName = std::string(implementationName(ExecutorPolicy::Lightweight));
    const auto baselineName  = std::string(implementationName(ExecutorPolicy::WorkerPool));
    for (const auto& profile : profiles)
    {
        fmt::print("\n{} profile:\n", profile.name);

        const auto byProfile = results.find(profile.name);
        if (byProfile == results.end())
        {
            continue;
        }
        const auto candidate = byProfile->second.find(candidateName);
        const auto baseline  = byProfile->second.find(baselineName);
        if (candidate == byProfile->second.end() || baseline == byProfile->second.end())
        {
            continue;
        }

        if (const auto comparison = compareLoad(candidate->second, baseline->second))
        {
            fmt::print("  Throughput improvement: {}%\n", comparison->throughputImprovement);
            fmt::print("  Average latency improvement: {}%\n", comparison->latencyImprovement);
            fmt::print("  Error rate difference: {}%\n", comparison->errorRateDifference);
        }
    }
}

auto selectProfiles(const BenchConfig& config, const std::vector<std::string>& names) -> std::vector<LoadProfile>
{
    if (names.empty())
    {
        return config.profiles;
    }

    std::vector<LoadProfile> selected;
    for (const auto& name : names)
    {
        if (auto profile = config.findProfile(name))
        {
            selected.push_back(*profile);
        }
        else
        {
            fmt::print(stderr, "Unknown load profile '{}', skipping\n", name);
        }
    }
    return selected;
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

    const auto profiles = selectProfiles(*config, cli.positional);
    if (profiles.empty())
    {
        fmt::print(stderr, "No load profiles to run\n");
        return 1;
    }
    printConfiguration(profiles);

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

    LoadGenerator  generator(metrics, config->load);
    ProfileResults results;
    for (const auto& profile : profiles)
    {
        fmt::print("\nRunning {} load profile...\n", profile.name);
        for (auto& implementation : implementations)
        {
            fmt::print("\nTesting {}...\n", implementation->name());
            const auto summary                            = generator.run(profile, implementation->loadTarget());
            results[profile.name][implementation->name()] = summary;
            printProfileResults(profile.name, implementation->name(), summary);
        }
    }

    printFinalComparison(profiles, results);

    for (auto& implementation : implementations)
    {
        if (!implementation->shutdown(kDrainTimeout))
        {
            fmt::print("{} did not drain within {}s\n", implementation->name(), kDrainTimeout.count());
        }
    }

    nlohmann::json profileList = nlohmann::json::array();
    for (const auto& profile : profiles)
    {
        profileList.push_back(detail::profileJson(profile));
    }

    nlohmann::json configuration = environmentInfo();
    configuration["profiles"]    = profileList;
    configuration["settings"]    = config->toJson();

    try
    {
        const auto path = writeResults(config->output.resultsDir, "load_test", configuration, results);
        fmt::print("\nDetailed results saved to: {}\n", path.string());
    }
    catch (const std::exception& e)
    {
        fmt::print(stderr, "Could not save results: {}\n", e.what());
        return 1;
    }
    return 0;
}
