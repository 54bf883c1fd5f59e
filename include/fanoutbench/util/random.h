#pragma once

#include <cstdint>
#include <random>
#include <string>

#include <fmt/format.h>

namespace FanoutBench
{

//
// Random
//
//   Per-thread generators; nothing here is shared between threads.
//

inline auto threadRng() -> std::mt19937_64&
{
    static thread_local std::mt19937_64 generator(std::random_device{}());
    return generator;
}

// Uniform in [0, 1).
inline auto randomUnit() -> double
{
    std::uniform_real_distribution<double> distribution(0.0, 1.0);
    return distribution(threadRng());
}

// Uniform in [low, high].
inline auto randomInt(int low, int high) -> int
{
    std::uniform_int_distribution<int> distribution(low, high);
    return distribution(threadRng());
}

// RFC 4122 version 4 UUID in canonical text form.
inline auto randomUuid() -> std::string
{
    auto&         rng  = threadRng();
    std::uint64_t high = rng();
    std::uint64_t low  = rng();

    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low  = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                       static_cast<std::uint32_t>(high >> 32),
                       static_cast<std::uint32_t>((high >> 16) & 0xFFFF),
                       static_cast<std::uint32_t>(high & 0xFFFF),
                       static_cast<std::uint32_t>(low >> 48),
                       low & 0xFFFFFFFFFFFFULL);
}

} // namespace FanoutBench
