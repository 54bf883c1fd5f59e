#pragma once

#include <fanoutbench/core/errors.h>
#include <fanoutbench/core/types.h>
#include <fanoutbench/util/random.h>
#include <fanoutbench/util/time_format.h>

#include <array>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <ctime>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

#include <nlohmann/json.hpp>

namespace FanoutBench
{

//
// IApiClient
//
//   The upstream capability a sub-fetch calls. The core depends on this contract only.
//
class IApiClient
{
public:
    virtual ~IApiClient() = default;

    virtual auto name() const -> const std::string& = 0;

    // Returns one result, or throws (SimulatedApiError for the mock).
    virtual auto fetch() -> SubFetchResult = 0;
};

//
// MockApiClient
//
//   Sleeps for a fixed latency, then fails with probability errorRate or returns a small
//   randomly generated catalogue page.
//
class MockApiClient final : public IApiClient
{
public:
    MockApiClient(std::string name, std::chrono::milliseconds latency, double errorRate = 0.01)
    : name_(std::move(name))
    , latency_(latency)
    , errorRate_(errorRate)
    {
    }

    auto name() const -> const std::string& override
    {
        return name_;
    }

    auto fetch() -> SubFetchResult override
    {
        std::this_thread::sleep_for(latency_);

        if (randomUnit() < errorRate_)
        {
            throw SimulatedApiError(name_ + " API Error");
        }

        SubFetchResult result;
        result.sourceName = name_;
        result.id         = randomUuid();
        result.timestamp  = currentTimestamp();
        result.payload    = generatePayload();
        return result;
    }

    auto latency() const noexcept -> std::chrono::milliseconds
    {
        return latency_;
    }

    auto errorRate() const noexcept -> double
    {
        return errorRate_;
    }

private:
    static auto generatePayload() -> nlohmann::json
    {
        nlohmann::json items = nlohmann::json::array();
        for (int i = 0; i < 3; ++i)
        {
            items.push_back(generateItem());
        }

        return {
            { "items", std::move(items) },
            { "metadata", { { "total", 3 }, { "page", 1 }, { "timestamp", static_cast<std::int64_t>(std::time(nullptr)) } } },
        };
    }

    static auto generateItem() -> nlohmann::json
    {
        static constexpr std::array<std::string_view, 3> kCategories = { "Electronics", "Fashion", "Home" };

        return {
            { "id", randomUuid() },
            { "name", "Item " + std::to_string(randomInt(0, 999)) },
            { "price", std::round(randomUnit() * 100.0 * 100.0) / 100.0 },
            { "category", std::string(kCategories[static_cast<std::size_t>(randomInt(0, 2))]) },
        };
    }

    std::string               name_;
    std::chrono::milliseconds latency_;
    double                    errorRate_;
};

} // namespace FanoutBench
