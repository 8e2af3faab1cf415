#include "percentile.hpp"
#include "httpload_exceptions.hpp"
#include <cmath>

namespace httpload {

std::chrono::nanoseconds
percentile(const std::vector<std::chrono::nanoseconds> &sorted, double p) {
  if (std::isnan(p) || p < 0.0 || p > 100.0) {
    throw ValidationException(ErrorCode::INVALID_RANGE,
                              "Percentile must be within [0, 100]",
                              "percentile", std::to_string(p));
  }
  if (sorted.empty()) {
    return std::chrono::nanoseconds{0};
  }

  auto index = static_cast<size_t>(
      std::floor(static_cast<double>(sorted.size()) * p / 100.0));
  if (index >= sorted.size()) {
    index = sorted.size() - 1;
  }
  return sorted[index];
}

LatencyPercentiles
computePercentiles(const std::vector<std::chrono::nanoseconds> &sorted) {
  LatencyPercentiles result;
  result.p50 = percentile(sorted, 50);
  result.p95 = percentile(sorted, 95);
  result.p99 = percentile(sorted, 99);
  return result;
}

} // namespace httpload
