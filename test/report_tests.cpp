#include <gtest/gtest.h>

#include "test_utils.h"

#include <fanoutbench/benchmark/benchmark_runner.h>
#include <fanoutbench/config/bench_config.h>
#include <fanoutbench/metrics/metrics_collector.h>
#include <fanoutbench/processing/feed_implementation.h>
#include <fanoutbench/report/results_writer.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <system_error>

using namespace std::chrono_literals;
using namespace FanoutBench;

namespace
{

// Fast, error-free mock upstreams with a pool wide enough for the unit counts used here.
auto quickConfig() -> BenchConfig
{
    BenchConfig config;
    config.primary.latency                = 1ms;
    config.primary.errorRate              = 0.0;
    config.secondary.latency              = 2ms;
    config.secondary.errorRate            = 0.0;
    config.executor.workerPool.maxThreads = 32;
    config.executor.workerPool.maxQueue   = 4096;
    config.executor.fallbackThreads       = 4;
    return config;
}

} // namespace

//
// RESULTS WRITER TESTS
//

class ResultsWriterTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        root_ = std::filesystem::temp_directory_path() / (std::string("fanoutbench_report_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(root_);

        output_.logDir     = (root_ / "log").string();
        output_.resultsDir = (root_ / "results").string();
        output_.tmpDir     = (root_ / "tmp").string();
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    std::filesystem::path root_;
    OutputConfig          output_;
};

// TEST: The document carries configuration, results and a timestamp, under a prefixed name
TEST_F(ResultsWriterTest, WritesPrefixedDocument)
{
    const nlohmann::json configuration = { { "units", 10 } };
    const nlohmann::json results       = { { "WorkerPoolImplementation", { { "durations", { 1.5 } } } } };

    const auto path = writeResults(output_.resultsDir, "benchmark", configuration, results);

    ASSERT_TRUE(std::filesystem::exists(path));
    EXPECT_EQ(path.extension(), ".json");
    EXPECT_EQ(path.filename().string().rfind("benchmark_", 0), 0u);

    std::ifstream  in(path);
    nlohmann::json document;
    in >> document;

    EXPECT_EQ(document.at("configuration"), configuration);
    EXPECT_EQ(document.at("results"), results);
    EXPECT_FALSE(document.at("timestamp").get<std::string>().empty());
}

TEST_F(ResultsWriterTest, EnsureThenCleanupDirectories)
{
    ensureDirectories(output_);
    EXPECT_TRUE(std::filesystem::is_directory(output_.logDir));
    EXPECT_TRUE(std::filesystem::is_directory(output_.resultsDir));
    EXPECT_TRUE(std::filesystem::is_directory(output_.tmpDir));

    std::ofstream(std::filesystem::path(output_.tmpDir) / "scratch.txt") << "x";

    // Three directories plus the scratch file.
    EXPECT_EQ(cleanupDirectories(output_), 4u);
    EXPECT_FALSE(std::filesystem::exists(output_.logDir));
    EXPECT_FALSE(std::filesystem::exists(output_.resultsDir));
    EXPECT_FALSE(std::filesystem::exists(output_.tmpDir));

    // Nothing left to remove is not an error.
    EXPECT_EQ(cleanupDirectories(output_), 0u);
}

TEST(EnvironmentInfoTest, DescribesBuildAndHost)
{
    const auto info = environmentInfo();

    for (const auto* key : { "compiler", "cxx_standard", "fmt_version", "spdlog_version", "processors", "memory_total_mb", "memory_available_mb", "memory_free_mb" })
    {
        EXPECT_TRUE(info.contains(key)) << key;
    }
    EXPECT_GE(info.at("processors").get<std::size_t>(), 1u);
    EXPECT_GE(info.at("cxx_standard").get<long>(), 202002L);
}

//
// BENCHMARK RESULT TESTS
//

TEST(BenchmarkResultTest, FailedIterationsAreLeftOutOfAverages)
{
    BenchmarkResult result;
    result.implementation = "WorkerPoolImplementation";
    result.iterations     = { { 100.0, 1024, 10, 10 }, { -1.0, 0, 0, 0 }, { 200.0, 2048, 10, 9 } };

    EXPECT_EQ(result.validDurations().size(), 2u);
    EXPECT_DOUBLE_EQ(result.averageDurationMs(), 150.0);
    EXPECT_DOUBLE_EQ(result.averageMemoryDelta(), 1024.0);

    const nlohmann::json j = result;
    EXPECT_EQ(j.at("durations").size(), 3u);
    EXPECT_EQ(j.at("succeeded")[2].get<std::size_t>(), 9u);
}

TEST(BenchmarkResultTest, AllFailedAveragesToZero)
{
    BenchmarkResult result;
    result.iterations = { { -1.0, 0, 0, 0 } };

    EXPECT_DOUBLE_EQ(result.averageDurationMs(), 0.0);
    EXPECT_FALSE(compareBenchmarks(result, result).has_value());
}

// TEST: A faster candidate shows a positive speed improvement
TEST(BenchmarkResultTest, CompareAgainstBaseline)
{
    BenchmarkResult candidate;
    candidate.iterations = { { 50.0, 1024 * 1024, 10, 10 } };
    BenchmarkResult baseline;
    baseline.iterations = { { 100.0, 3 * 1024 * 1024, 10, 10 } };

    const auto comparison = compareBenchmarks(candidate, baseline);
    ASSERT_TRUE(comparison.has_value());
    EXPECT_DOUBLE_EQ(comparison->speedImprovement, 50.0);
    EXPECT_DOUBLE_EQ(comparison->memoryDifferenceMb, 2.0);
}

//
// FEED IMPLEMENTATION TESTS
//

class FeedImplementationTest : public ::testing::TestWithParam<ExecutorPolicy>
{
protected:
    void TearDown() override
    {
        implementation_.reset();
    }

    TestUtils::Watchdog                 watchdog_{ 60s };
    TestUtils::LogCapture               logs_;
    MetricsCollector                    metrics_;
    std::unique_ptr<FeedImplementation> implementation_;
};

// TEST: Every unit of a batch comes back merged from both configured sources
TEST_P(FeedImplementationTest, ProcessesBatchFromConfiguration)
{
    implementation_ = FeedImplementation::create(GetParam(), quickConfig(), &metrics_);

    EXPECT_EQ(implementation_->name(), implementationName(GetParam()));

    const auto results = implementation_->processFeedUnits(TestUtils::makeUnits(20));

    ASSERT_EQ(results.size(), 20u);
    for (const auto& result : results)
    {
        ASSERT_TRUE(isSuccess(result));
        const auto& merged = std::get<UnitSuccess>(result).mergedResults;
        EXPECT_EQ(merged.count("Naver"), 1u);
        EXPECT_EQ(merged.count("Ads"), 1u);
    }
    EXPECT_EQ(implementation_->driver().completedBatches(), 1u);
    EXPECT_EQ(metrics_.timingSamples("fetch.Naver").size(), 20u);
    EXPECT_EQ(metrics_.timingSamples("fetch.Ads").size(), 20u);
}

// TEST: Shutdown drains and closes the upstream pools; later batches degrade to empty
TEST_P(FeedImplementationTest, ShutdownStopsFurtherWork)
{
    implementation_ = FeedImplementation::create(GetParam(), quickConfig(), &metrics_);
    implementation_->processFeedUnits(TestUtils::makeUnits(5));

    EXPECT_TRUE(implementation_->shutdown(5000ms));
    EXPECT_EQ(logs_.countEvent("implementation_shutdown"), 1u);

    EXPECT_TRUE(implementation_->processFeedUnits(TestUtils::makeUnits(5)).empty());
}

// TEST: The load target forwards to the pipeline under the implementation name
TEST_P(FeedImplementationTest, LoadTargetForwardsBatches)
{
    implementation_ = FeedImplementation::create(GetParam(), quickConfig(), &metrics_);

    const auto target = implementation_->loadTarget();
    EXPECT_EQ(target.name, implementation_->name());
    EXPECT_EQ(target.processBatch(TestUtils::makeUnits(3)).size(), 3u);
}

// TEST: Warm-up and a timed iteration both complete and are recorded
TEST_P(FeedImplementationTest, WarmUpThenIteration)
{
    implementation_ = FeedImplementation::create(GetParam(), quickConfig(), &metrics_);
    const auto units = TestUtils::makeUnits(10);

    const auto warmup = warmUp(*implementation_, units, 10000ms);
    EXPECT_TRUE(warmup.completed) << warmup.message;

    const auto iteration = runIteration(*implementation_, units, metrics_);
    EXPECT_GE(iteration.durationMs, 0.0);
    EXPECT_EQ(iteration.processed, 10u);
    EXPECT_EQ(iteration.succeeded, 10u);

    EXPECT_EQ(metrics_.timingSamples("benchmark." + implementation_->name()).size(), 1u);
    EXPECT_EQ(metrics_.statistics().memory.count(implementation_->name()), 1u);
}

INSTANTIATE_TEST_SUITE_P(Policies,
                         FeedImplementationTest,
                         ::testing::Values(ExecutorPolicy::WorkerPool, ExecutorPolicy::Lightweight),
                         [](const ::testing::TestParamInfo<ExecutorPolicy>& info)
                         {
                             return std::string(toString(info.param));
                         });
