#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace FanoutBench
{

//
// LoadProfile
//
//   A named load shape: how many virtual users, for how long, ramped in over how long.
//
struct LoadProfile
{
    std::string               name;
    std::size_t               users = 0;
    std::chrono::milliseconds duration{ 0 };
    std::chrono::milliseconds rampUp{ 0 };
};

inline auto makeLoadProfile(std::string name, std::size_t users, std::chrono::seconds duration, std::chrono::seconds rampUp) -> LoadProfile
{
    return LoadProfile{ std::move(name), users, duration, rampUp };
}

inline auto defaultLoadProfiles() -> std::vector<LoadProfile>
{
    using std::chrono::seconds;
    return {
        makeLoadProfile("light", 10, seconds(30), seconds(5)),
        makeLoadProfile("medium", 50, seconds(60), seconds(10)),
        makeLoadProfile("heavy", 100, seconds(120), seconds(20)),
    };
}

inline auto findLoadProfile(const std::vector<LoadProfile>& profiles, std::string_view name) -> std::optional<LoadProfile>
{
    for (const auto& profile : profiles)
    {
        if (profile.name == name)
        {
            return profile;
        }
    }
    return std::nullopt;
}

} // namespace FanoutBench
