#pragma once

#include <fanoutbench/executor/executor.h>
#include <fanoutbench/executor/executor_factory.h>
#include <fanoutbench/executor/worker_pool_executor.h>
#include <fanoutbench/load/load_generator.h>
#include <fanoutbench/load/load_profile.h>
#include <fanoutbench/util/logging.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace FanoutBench
{

struct ClientConfig
{
    std::string               name;
    std::chrono::milliseconds latency{ 100 };
    double                    errorRate = 0.01;
};

struct TimeoutConfig
{
    std::chrono::milliseconds fetchTimeout{ 1000 };
    std::chrono::milliseconds unitTimeout{ 2000 };
};

struct PoolConfig
{
    std::size_t               size = 64;
    std::chrono::milliseconds acquireTimeout{ 5000 };
};

struct BenchmarkSettings
{
    std::size_t               units       = 1000;
    std::size_t               iterations  = 3;
    std::size_t               warmupUnits = 10;
    std::chrono::milliseconds warmupTimeout{ 5000 };
};

struct OutputConfig
{
    std::string logDir     = "log";
    std::string resultsDir = "results";
    std::string tmpDir     = "tmp";
    std::string logLevel   = "info";
};

//
// BenchConfig
//
//   Everything a run needs, with defaults matching the reference benchmark. loadFromFile()
//   overlays whatever keys a JSON file provides and keeps defaults for the rest.
//
struct BenchConfig
{
    ExecutorConfig executor;
    ClientConfig   primary{ "Naver", std::chrono::milliseconds(100), 0.01 };
    ClientConfig   secondary{ "Ads", std::chrono::milliseconds(150), 0.01 };
    PoolConfig     pool;
    TimeoutConfig  workerPoolTimeouts{ std::chrono::milliseconds(1000), std::chrono::milliseconds(2000) };
    TimeoutConfig  lightweightTimeouts{ std::chrono::milliseconds(2000), std::chrono::milliseconds(5000) };
    bool           strictBatches = false;

    BenchmarkSettings        benchmark;
    LoadGeneratorConfig      load;
    std::vector<LoadProfile> profiles = defaultLoadProfiles();
    OutputConfig             output;

    auto timeoutsFor(ExecutorPolicy policy) const -> const TimeoutConfig&
    {
        return policy == ExecutorPolicy::WorkerPool ? workerPoolTimeouts : lightweightTimeouts;
    }

    auto findProfile(std::string_view name) const -> std::optional<LoadProfile>
    {
        return findLoadProfile(profiles, name);
    }

    // Throws nlohmann::json::exception on a malformed value, std::invalid_argument when a unit
    // timeout does not exceed its fetch timeout or the monitor interval is not positive.
    static auto fromJson(const nlohmann::json& j) -> BenchConfig;

    // Never throws. A missing or malformed file logs a warning and yields defaults.
    static auto loadFromFile(const std::string& path) -> BenchConfig;

    auto toJson() const -> nlohmann::json;
};

namespace detail
{

template <typename T>
void readValue(const nlohmann::json& section, const char* key, T& target)
{
    if (section.contains(key))
    {
        target = section.at(key).get<T>();
    }
}

inline void readMillis(const nlohmann::json& section, const char* key, std::chrono::milliseconds& target)
{
    if (section.contains(key))
    {
        target = std::chrono::milliseconds(section.at(key).get<std::int64_t>());
    }
}

inline void readClient(const nlohmann::json& section, ClientConfig& client)
{
    readValue(section, "name", client.name);
    readMillis(section, "latency_ms", client.latency);
    readValue(section, "error_rate", client.errorRate);
}

inline void readTimeouts(const nlohmann::json& section, TimeoutConfig& timeouts)
{
    readMillis(section, "fetch_timeout_ms", timeouts.fetchTimeout);
    readMillis(section, "unit_timeout_ms", timeouts.unitTimeout);
}

inline auto readProfile(const nlohmann::json& entry) -> LoadProfile
{
    LoadProfile profile;
    profile.name     = entry.at("name").get<std::string>();
    profile.users    = entry.at("users").get<std::size_t>();
    profile.duration = std::chrono::seconds(entry.at("duration_seconds").get<std::int64_t>());
    profile.rampUp   = std::chrono::seconds(entry.value("ramp_up_seconds", std::int64_t{ 0 }));
    return profile;
}

// A unit waits on its two sub-fetches, so its own timeout must leave room for them.
inline void validateTimeouts(const char* policy, const TimeoutConfig& timeouts)
{
    if (timeouts.fetchTimeout.count() <= 0)
    {
        throw std::invalid_argument(fmt::format("{} fetch_timeout_ms must be positive", policy));
    }
    if (timeouts.unitTimeout <= timeouts.fetchTimeout)
    {
        throw std::invalid_argument(fmt::format("{} unit_timeout_ms ({}) must exceed fetch_timeout_ms ({})",
                                                policy,
                                                timeouts.unitTimeout.count(),
                                                timeouts.fetchTimeout.count()));
    }
}

inline auto profileJson(const LoadProfile& profile) -> nlohmann::json
{
    return {
        { "name", profile.name },
        { "users", profile.users },
        { "duration_seconds", std::chrono::duration_cast<std::chrono::seconds>(profile.duration).count() },
        { "ramp_up_seconds", std::chrono::duration_cast<std::chrono::seconds>(profile.rampUp).count() },
    };
}

} // namespace detail

inline auto BenchConfig::fromJson(const nlohmann::json& j) -> BenchConfig
{
    BenchConfig cfg;

    if (j.contains("executor"))
    {
        const auto& e    = j.at("executor");
        auto&       pool = cfg.executor.workerPool;
        detail::readValue(e, "min_threads", pool.minThreads);
        detail::readValue(e, "max_threads", pool.maxThreads);
        detail::readValue(e, "max_queue", pool.maxQueue);
        detail::readMillis(e, "idle_timeout_ms", pool.idleTimeout);
        if (e.contains("rejection_policy"))
        {
            pool.rejection = parseRejectionPolicy(e.at("rejection_policy").get<std::string>());
        }
        detail::readValue(e, "fallback_threads", cfg.executor.fallbackThreads);
    }
    if (j.contains("clients"))
    {
        const auto& c = j.at("clients");
        if (c.contains("primary"))
        {
            detail::readClient(c.at("primary"), cfg.primary);
        }
        if (c.contains("secondary"))
        {
            detail::readClient(c.at("secondary"), cfg.secondary);
        }
    }
    if (j.contains("pool"))
    {
        detail::readValue(j.at("pool"), "size", cfg.pool.size);
        detail::readMillis(j.at("pool"), "acquire_timeout_ms", cfg.pool.acquireTimeout);
    }
    if (j.contains("timeouts"))
    {
        const auto& t = j.at("timeouts");
        if (t.contains("worker_pool"))
        {
            detail::readTimeouts(t.at("worker_pool"), cfg.workerPoolTimeouts);
        }
        if (t.contains("lightweight"))
        {
            detail::readTimeouts(t.at("lightweight"), cfg.lightweightTimeouts);
        }
    }
    if (j.contains("batch"))
    {
        detail::readValue(j.at("batch"), "strict", cfg.strictBatches);
    }
    if (j.contains("benchmark"))
    {
        const auto& b = j.at("benchmark");
        detail::readValue(b, "units", cfg.benchmark.units);
        detail::readValue(b, "iterations", cfg.benchmark.iterations);
        detail::readValue(b, "warmup_units", cfg.benchmark.warmupUnits);
        detail::readMillis(b, "warmup_timeout_ms", cfg.benchmark.warmupTimeout);
    }
    if (j.contains("load"))
    {
        const auto& l = j.at("load");
        detail::readValue(l, "units_per_user", cfg.load.unitsPerUser);
        detail::readMillis(l, "think_time_max_ms", cfg.load.thinkTimeMax);
        detail::readMillis(l, "monitor_interval_ms", cfg.load.monitorInterval);
        detail::readValue(l, "print_progress", cfg.load.printProgress);
        if (l.contains("profiles"))
        {
            cfg.profiles.clear();
            for (const auto& entry : l.at("profiles"))
            {
                cfg.profiles.push_back(detail::readProfile(entry));
            }
        }
    }
    if (j.contains("output"))
    {
        const auto& o = j.at("output");
        detail::readValue(o, "log_dir", cfg.output.logDir);
        detail::readValue(o, "results_dir", cfg.output.resultsDir);
        detail::readValue(o, "tmp_dir", cfg.output.tmpDir);
        detail::readValue(o, "log_level", cfg.output.logLevel);
    }

    detail::validateTimeouts("worker_pool", cfg.workerPoolTimeouts);
    detail::validateTimeouts("lightweight", cfg.lightweightTimeouts);
    if (cfg.load.monitorInterval.count() <= 0)
    {
        throw std::invalid_argument("load.monitor_interval_ms must be positive");
    }
    return cfg;
}

inline auto BenchConfig::loadFromFile(const std::string& path) -> BenchConfig
{
    try
    {
        std::ifstream ifs(path);
        if (!ifs.is_open())
        {
            logger()->warn("cannot open config file {}, using defaults", path);
            return BenchConfig{};
        }

        nlohmann::json j;
        ifs >> j;
        return fromJson(j);
    }
    catch (const std::exception& e)
    {
        logger()->warn("failed to parse config file {}: {}, using defaults", path, e.what());
        return BenchConfig{};
    }
}

inline auto BenchConfig::toJson() const -> nlohmann::json
{
    const auto& workers = executor.workerPool;

    nlohmann::json profileList = nlohmann::json::array();
    for (const auto& profile : profiles)
    {
        profileList.push_back(detail::profileJson(profile));
    }

    const auto clientJson = [](const ClientConfig& client) -> nlohmann::json
    {
        return { { "name", client.name }, { "latency_ms", client.latency.count() }, { "error_rate", client.errorRate } };
    };
    const auto timeoutJson = [](const TimeoutConfig& timeouts) -> nlohmann::json
    {
        return { { "fetch_timeout_ms", timeouts.fetchTimeout.count() }, { "unit_timeout_ms", timeouts.unitTimeout.count() } };
    };

    return {
        { "executor",
          {
              { "min_threads", workers.minThreads },
              { "max_threads", workers.maxThreads },
              { "max_queue", workers.maxQueue },
              { "idle_timeout_ms", workers.idleTimeout.count() },
              { "rejection_policy", std::string(toString(workers.rejection)) },
              { "fallback_threads", executor.fallbackThreads },
          } },
        { "clients", { { "primary", clientJson(primary) }, { "secondary", clientJson(secondary) } } },
        { "pool", { { "size", pool.size }, { "acquire_timeout_ms", pool.acquireTimeout.count() } } },
        { "timeouts", { { "worker_pool", timeoutJson(workerPoolTimeouts) }, { "lightweight", timeoutJson(lightweightTimeouts) } } },
        { "batch", { { "strict", strictBatches } } },
        { "benchmark",
          {
              { "units", benchmark.units },
              { "iterations", benchmark.iterations },
              { "warmup_units", benchmark.warmupUnits },
              { "warmup_timeout_ms", benchmark.warmupTimeout.count() },
          } },
        { "load",
          {
              { "units_per_user", load.unitsPerUser },
              { "think_time_max_ms", load.thinkTimeMax.count() },
              { "monitor_interval_ms", load.monitorInterval.count() },
              { "profiles", profileList },
          } },
        { "output",
          {
              { "log_dir", output.logDir },
              { "results_dir", output.resultsDir },
              { "tmp_dir", output.tmpDir },
              { "log_level", output.logLevel },
          } },
    };
}

} // namespace FanoutBench
