#pragma once

#include <fanoutbench/core/types.h>
#include <fanoutbench/util/random.h>
#include <fanoutbench/util/time_format.h>

#include <cstddef>
#include <string>
#include <vector>

namespace FanoutBench
{

enum class UnitIds
{
    Sequential, // "0", "1", ...
    Random,     // UUIDs
};

//
// generateUnits
//
//   Produces `count` work units of kind "test_unit". Metadata carries the sequence number and
//   a batch label that groups every hundred units.
//
inline auto generateUnits(std::size_t count, const std::string& batchPrefix = "test", UnitIds ids = UnitIds::Sequential) -> std::vector<WorkUnit>
{
    std::vector<WorkUnit> units;
    units.reserve(count);

    const auto timestamp = currentTimestamp();
    for (std::size_t i = 0; i < count; ++i)
    {
        WorkUnit unit;
        unit.id        = ids == UnitIds::Sequential ? std::to_string(i) : randomUuid();
        unit.kind      = "test_unit";
        unit.timestamp = timestamp;
        unit.metadata  = { { "sequence", i }, { "batch", batchPrefix + "_" + std::to_string(i / 100) } };
        units.push_back(std::move(unit));
    }
    return units;
}

} // namespace FanoutBench
