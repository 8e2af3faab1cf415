#pragma once

#include "percentile.hpp"
#include "worker_stats.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

namespace httpload {

// One aggregate/report pass of the trend recorder
struct ReportCycle {
  GlobalSnapshot snapshot; // latencies sorted ascending
  std::chrono::nanoseconds elapsed{0};
  double tps = 0.0;
  double qps = 0.0;
  std::optional<LatencyPercentiles> percentiles; // empty: not enough data
  bool final = false;

  bool hasData() const { return percentiles.has_value(); }
};

// Percentiles are whole milliseconds
struct TrendSample {
  double tps = 0.0;
  double qps = 0.0;
  double p50 = 0.0;
  double p95 = 0.0;
  double p99 = 0.0;
};

struct TrendHistory {
  std::vector<double> tps;
  std::vector<double> qps;
  std::vector<double> p50;
  std::vector<double> p95;
  std::vector<double> p99;

  void append(const TrendSample &sample);

  // Zero-fills buffers that are still empty so charts always have a point
  void ensureNonEmpty();

  bool empty() const;
  size_t size() const { return tps.size(); }
};

struct RunResult {
  ReportCycle finalCycle;
  TrendHistory history;
  uint64_t keepAliveSelections = 0;
  uint64_t noKeepAliveSelections = 0;
  std::chrono::nanoseconds wallTime{0};
};

} // namespace httpload
