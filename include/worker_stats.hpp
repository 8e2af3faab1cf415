#pragma once

#include "request_executor.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace httpload {

/**
 * Per-worker counters. totalRequests == successRequests + failedRequests,
 * and only exchanges that received a response contribute a latency and a
 * status code.
 */
struct WorkerStat {
  uint64_t totalRequests = 0;
  uint64_t successRequests = 0;
  uint64_t failedRequests = 0;
  std::chrono::nanoseconds totalTime{0};
  std::vector<std::chrono::nanoseconds> responseTimes;
  std::map<int, uint64_t> statusCodes;

  void record(const ExecutionResult &result,
              std::chrono::nanoseconds wallTime);
};

// Merged view of every worker at one instant
struct GlobalSnapshot {
  uint64_t totalRequests = 0;
  uint64_t successRequests = 0;
  uint64_t failedRequests = 0;
  std::chrono::nanoseconds totalTime{0};
  std::vector<std::chrono::nanoseconds> responseTimes;
  std::map<int, uint64_t> statusCodes;

  void merge(const WorkerStat &stat);
  void sortLatencies();
};

/**
 * Owns one worker's record. The owning worker and the aggregator are the
 * only users; each holds the slot mutex for one update or one copy.
 */
class WorkerStatsSlot {
public:
  WorkerStatsSlot() = default;
  explicit WorkerStatsSlot(size_t expectedRequests);

  WorkerStatsSlot(const WorkerStatsSlot &) = delete;
  WorkerStatsSlot &operator=(const WorkerStatsSlot &) = delete;

  void record(const ExecutionResult &result,
              std::chrono::nanoseconds wallTime);
  void mergeInto(GlobalSnapshot &snapshot) const;
  WorkerStat snapshot() const;

private:
  mutable std::mutex mutex_;
  WorkerStat stat_;
};

using WorkerStatsSlots = std::vector<std::unique_ptr<WorkerStatsSlot>>;

// Pure fold over worker records; order-independent
GlobalSnapshot aggregate(const std::vector<WorkerStat> &workerStats);

// Aggregates live slots while workers are still recording
class StatsAggregator {
public:
  explicit StatsAggregator(const WorkerStatsSlots &slots);

  GlobalSnapshot collect() const;

private:
  const WorkerStatsSlots &slots_;
};

} // namespace httpload
