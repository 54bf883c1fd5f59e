#include "cli.h"

#include <fanoutbench/fanoutbench.h>

#include <fmt/core.h>

int main(int argc, char** argv)
{
    using namespace FanoutBench;

    const auto cli = App::parseCli(argc, argv);
    if (cli.cleanup)
    {
        int exitCode = 0;
        App::prepare(cli, exitCode);
        return exitCode;
    }

    const auto info = environmentInfo();

    fmt::print("Build Environment:\n");
    fmt::print("  Compiler: {}\n", info["compiler"].get<std::string>());
    fmt::print("  C++ standard: {}\n", info["cxx_standard"].get<long>());
    fmt::print("  fmt: {}\n", info["fmt_version"].get<std::string>());
    fmt::print("  spdlog: {}\n", info["spdlog_version"].get<std::string>());

    fmt::print("\nAvailable Processors:\n");
    fmt::print("  Count: {}\n", processorCount());

    fmt::print("\nMemory Info:\n");
    fmt::print("  Total Memory: {}MB\n", info["memory_total_mb"].get<std::uint64_t>());
    fmt::print("  Available Memory: {}MB\n", info["memory_available_mb"].get<std::uint64_t>());
    fmt::print("  Free Memory: {}MB\n", info["memory_free_mb"].get<std::uint64_t>());
    fmt::print("  Resident (this process): {}KB\n", residentMemoryBytes() / 1024);
    return 0;
}
