#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace FanoutBench
{

//
// percentile
//
//   Linear interpolation between order statistics. With k = (p / 100) * (n - 1) the result is
//   sorted[k] when k is integral, else sorted[floor(k)] * (ceil(k) - k) + sorted[ceil(k)] * (k - floor(k)).
//   An empty input yields 0. `sorted` must be in ascending order.
//
inline auto percentileOfSorted(const std::vector<double>& sorted, double p) -> double
{
    if (sorted.empty())
    {
        return 0.0;
    }

    const double k     = (std::clamp(p, 0.0, 100.0) / 100.0) * static_cast<double>(sorted.size() - 1);
    const double lower = std::floor(k);
    const double upper = std::ceil(k);

    const auto f = static_cast<std::size_t>(lower);
    const auto c = static_cast<std::size_t>(upper);
    if (f == c)
    {
        return sorted[f];
    }
    return sorted[f] * (upper - k) + sorted[c] * (k - lower);
}

inline auto percentile(std::vector<double> values, double p) -> double
{
    std::sort(values.begin(), values.end());
    return percentileOfSorted(values, p);
}

} // namespace FanoutBench
