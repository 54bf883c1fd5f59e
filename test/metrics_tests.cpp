#include <gtest/gtest.h>

#include <fanoutbench/metrics/metrics_collector.h>
#include <fanoutbench/metrics/percentile.h>

#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using namespace FanoutBench;

//
// PERCENTILE TESTS
//

TEST(PercentileTest, MedianOfOddSequence)
{
    EXPECT_DOUBLE_EQ(percentile({ 10, 20, 30, 40, 50 }, 50), 30.0);
}

TEST(PercentileTest, EmptySequenceIsZero)
{
    for (const double p : { 0.0, 50.0, 95.0, 99.0, 100.0 })
    {
        EXPECT_DOUBLE_EQ(percentile({}, p), 0.0) << "p=" << p;
    }
}

TEST(PercentileTest, SingleSampleIsEveryPercentile)
{
    EXPECT_DOUBLE_EQ(percentile({ 5 }, 99), 5.0);
    EXPECT_DOUBLE_EQ(percentile({ 5 }, 0), 5.0);
}

TEST(PercentileTest, InterpolatesBetweenOrderStatistics)
{
    // k = 0.95 * 4 = 3.8 -> 40 * 0.2 + 50 * 0.8
    EXPECT_NEAR(percentile({ 50, 10, 40, 20, 30 }, 95), 48.0, 1e-9);

    // k = 0.9 * 1 = 0.9 -> 1 * 0.1 + 2 * 0.9
    EXPECT_NEAR(percentile({ 1, 2 }, 90), 1.9, 1e-9);
}

TEST(PercentileTest, ExtremesAreMinAndMax)
{
    EXPECT_DOUBLE_EQ(percentile({ 3, 1, 2 }, 0), 1.0);
    EXPECT_DOUBLE_EQ(percentile({ 3, 1, 2 }, 100), 3.0);
}

//
// METRICS COLLECTOR TESTS
//

class MetricsCollectorTest : public ::testing::Test
{
protected:
    MetricsCollector metrics_;
};

// TEST: Concurrent writers never lose samples
TEST_F(MetricsCollectorTest, ConcurrentAppendKeepsEverySample)
{
    const int writers          = 16;
    const int samplesPerWriter = 1000;

    std::vector<std::thread> threads;
    for (int w = 0; w < writers; ++w)
    {
        threads.emplace_back(
            [this, w]
            {
                for (int i = 0; i < samplesPerWriter; ++i)
                {
                    metrics_.recordTiming("shared", static_cast<double>(w * samplesPerWriter + i));
                }
            });
    }
    for (auto& thread : threads)
    {
        thread.join();
    }

    EXPECT_EQ(metrics_.timingSamples("shared").size(), static_cast<std::size_t>(writers * samplesPerWriter));
    EXPECT_EQ(metrics_.statistics().timings.at("shared").count, static_cast<std::size_t>(writers * samplesPerWriter));
}

TEST_F(MetricsCollectorTest, TimingStatistics)
{
    for (const double sample : { 10.0, 20.0, 30.0, 40.0, 50.0 })
    {
        metrics_.recordTiming("fetch.Naver", sample);
    }

    const auto stats  = metrics_.statistics();
    const auto timing = stats.timings.at("fetch.Naver");
    EXPECT_EQ(timing.count, 5u);
    EXPECT_DOUBLE_EQ(timing.min, 10.0);
    EXPECT_DOUBLE_EQ(timing.max, 50.0);
    EXPECT_DOUBLE_EQ(timing.avg, 30.0);
    EXPECT_NEAR(timing.p95, 48.0, 1e-9);
    EXPECT_NEAR(timing.p99, 49.6, 1e-9);

    EXPECT_EQ(stats.summary.totalOperations, 5u);
    EXPECT_DOUBLE_EQ(stats.summary.totalDurationMs, 150.0);
}

TEST_F(MetricsCollectorTest, ChronoDurationsAreRecordedInMilliseconds)
{
    metrics_.recordTiming("op", 1500us);
    metrics_.recordTiming("op", 2s);

    const auto samples = metrics_.timingSamples("op");
    ASSERT_EQ(samples.size(), 2u);
    EXPECT_DOUBLE_EQ(samples[0], 1.5);
    EXPECT_DOUBLE_EQ(samples[1], 2000.0);
}

TEST_F(MetricsCollectorTest, ErrorRateUsesMatchingTimingKeyFirst)
{
    for (int i = 0; i < 4; ++i)
    {
        metrics_.recordTiming("impl", 1.0);
    }
    metrics_.recordTiming("other", 1.0);
    metrics_.recordError("impl", std::runtime_error("boom"));

    const auto stats = metrics_.statistics();
    EXPECT_EQ(stats.errorRates.at("impl").count, 1u);
    EXPECT_DOUBLE_EQ(stats.errorRates.at("impl").rate, 0.25);
    EXPECT_EQ(stats.summary.totalErrors, 1u);
}

TEST_F(MetricsCollectorTest, ErrorRateFallsBackToAllTimings)
{
    metrics_.recordTiming("a", 1.0);
    metrics_.recordTiming("b", 1.0);
    metrics_.recordError("impl", "first");
    metrics_.recordError("impl", "second");

    EXPECT_DOUBLE_EQ(metrics_.statistics().errorRates.at("impl").rate, 1.0);
}

TEST_F(MetricsCollectorTest, ErrorRateWithoutTimingsDividesByOne)
{
    metrics_.recordError("impl", "first");
    metrics_.recordError("impl", "second");
    metrics_.recordError("impl", "third");

    EXPECT_DOUBLE_EQ(metrics_.statistics().errorRates.at("impl").rate, 3.0);
}

TEST_F(MetricsCollectorTest, ErrorSamplesKeepMessageAndNestedTrace)
{
    try
    {
        try
        {
            throw std::runtime_error("inner");
        }
        catch (const std::exception&)
        {
            std::throw_with_nested(std::runtime_error("outer"));
        }
    }
    catch (const std::exception& e)
    {
        metrics_.recordError("impl", e);
    }

    const auto samples = metrics_.errorSamples("impl");
    ASSERT_EQ(samples.size(), 1u);
    EXPECT_EQ(samples[0].message, "outer");
    ASSERT_EQ(samples[0].traceHead.size(), 2u);
    EXPECT_EQ(samples[0].traceHead[1], "inner");
    EXPECT_FALSE(samples[0].time.empty());
}

TEST_F(MetricsCollectorTest, MemorySamples)
{
    metrics_.recordMemorySample("impl", 1024);
    metrics_.recordMemorySample("impl", 3072);
    metrics_.recordMemory("impl");

    const auto memory = metrics_.statistics().memory.at("impl");
    EXPECT_EQ(memory.count, 3u);
    EXPECT_DOUBLE_EQ(memory.min, 1024.0);
    EXPECT_GT(memory.max, 0.0);
}

TEST_F(MetricsCollectorTest, ResetClearsEverything)
{
    metrics_.recordTiming("op", 1.0);
    metrics_.recordError("impl", "boom");
    metrics_.recordMemorySample("impl", 1);

    metrics_.reset();

    const auto stats = metrics_.statistics();
    EXPECT_TRUE(stats.timings.empty());
    EXPECT_TRUE(stats.memory.empty());
    EXPECT_TRUE(stats.errorRates.empty());
    EXPECT_EQ(metrics_.timingSampleCount(), 0u);
}

TEST_F(MetricsCollectorTest, SnapshotDocumentShape)
{
    metrics_.recordTiming("op", 2.0);
    metrics_.recordError("op", "boom");

    const auto snapshot = metrics_.snapshot();
    ASSERT_TRUE(snapshot.contains("timings"));
    ASSERT_TRUE(snapshot.contains("memory_usage"));
    ASSERT_TRUE(snapshot.contains("error_rates"));
    ASSERT_TRUE(snapshot.contains("summary"));
    EXPECT_EQ(snapshot["timings"]["op"]["count"].get<std::size_t>(), 1u);
    EXPECT_DOUBLE_EQ(snapshot["error_rates"]["op"]["rate"].get<double>(), 1.0);
    EXPECT_EQ(snapshot["summary"]["total_operations"].get<std::size_t>(), 1u);
}
