#pragma once

#include <chrono>
#include <vector>

namespace httpload {

struct LatencyPercentiles {
  std::chrono::nanoseconds p50{0};
  std::chrono::nanoseconds p95{0};
  std::chrono::nanoseconds p99{0};
};

/**
 * @brief Nearest-rank percentile over an ascending sample.
 *
 * index = floor(len * p / 100), clamped to len - 1. No interpolation.
 *
 * @param sorted Durations sorted ascending by the caller.
 * @param p Percentile in [0, 100].
 * @return The selected sample, or zero for an empty input.
 * @throws ValidationException when @p p is outside [0, 100].
 */
std::chrono::nanoseconds
percentile(const std::vector<std::chrono::nanoseconds> &sorted, double p);

// p50/p95/p99 of an ascending sample
LatencyPercentiles
computePercentiles(const std::vector<std::chrono::nanoseconds> &sorted);

} // namespace httpload
