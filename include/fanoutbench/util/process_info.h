#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>

#include <unistd.h>

namespace FanoutBench
{

//
// Process information
//
//   Linux-only probes used by the metrics collector and the environment report.
//

// Resident set size of this process in bytes, or 0 when /proc is unavailable.
inline auto residentMemoryBytes() -> std::uint64_t
{
    std::ifstream statm("/proc/self/statm");
    std::uint64_t totalPages    = 0;
    std::uint64_t residentPages = 0;
    if (!(statm >> totalPages >> residentPages))
    {
        return 0;
    }

    const auto pageSize = ::sysconf(_SC_PAGESIZE);
    return residentPages * static_cast<std::uint64_t>(pageSize > 0 ? pageSize : 4096);
}

inline auto processorCount() -> std::size_t
{
    const auto count = std::thread::hardware_concurrency();
    return count == 0 ? 1 : count;
}

struct SystemMemory
{
    std::uint64_t totalBytes     = 0;
    std::uint64_t availableBytes = 0;
    std::uint64_t freeBytes      = 0;
};

inline auto systemMemory() -> SystemMemory
{
    SystemMemory  memory;
    std::ifstream meminfo("/proc/meminfo");
    std::string   line;
    while (std::getline(meminfo, line))
    {
        std::istringstream fields(line);
        std::string        key;
        std::uint64_t      kib = 0;
        if (!(fields >> key >> kib))
        {
            continue;
        }

        if (key == "MemTotal:")
        {
            memory.totalBytes = kib * 1024;
        }
        else if (key == "MemAvailable:")
        {
            memory.availableBytes = kib * 1024;
        }
        else if (key == "MemFree:")
        {
            memory.freeBytes = kib * 1024;
        }
    }
    return memory;
}

inline auto compilerDescription() -> std::string
{
#if defined(__clang__)
    return "clang " + std::to_string(__clang_major__) + "." + std::to_string(__clang_minor__) + "." + std::to_string(__clang_patchlevel__);
#elif defined(__GNUC__)
    return "gcc " + std::to_string(__GNUC__) + "." + std::to_string(__GNUC_MINOR__) + "." + std::to_string(__GNUC_PATCHLEVEL__);
#else
    return "unknown";
#endif
}

} // namespace FanoutBench
