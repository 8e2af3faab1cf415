#include "worker_stats.hpp"
#include <algorithm>

namespace httpload {

void WorkerStat::record(const ExecutionResult &result,
                        std::chrono::nanoseconds wallTime) {
  ++totalRequests;
  if (result.success) {
    ++successRequests;
  } else {
    ++failedRequests;
  }

  if (result.responseReceived()) {
    ++statusCodes[result.statusCode];
    responseTimes.push_back(result.latency);
  }

  totalTime += wallTime;
}

void GlobalSnapshot::merge(const WorkerStat &stat) {
  totalRequests += stat.totalRequests;
  successRequests += stat.successRequests;
  failedRequests += stat.failedRequests;
  totalTime += stat.totalTime;
  for (const auto &[code, count] : stat.statusCodes) {
    statusCodes[code] += count;
  }
  responseTimes.insert(responseTimes.end(), stat.responseTimes.begin(),
                       stat.responseTimes.end());
}

void GlobalSnapshot::sortLatencies() {
  std::sort(responseTimes.begin(), responseTimes.end());
}

WorkerStatsSlot::WorkerStatsSlot(size_t expectedRequests) {
  stat_.responseTimes.reserve(expectedRequests);
}

void WorkerStatsSlot::record(const ExecutionResult &result,
                             std::chrono::nanoseconds wallTime) {
  std::lock_guard<std::mutex> lock(mutex_);
  stat_.record(result, wallTime);
}

void WorkerStatsSlot::mergeInto(GlobalSnapshot &snapshot) const {
  std::lock_guard<std::mutex> lock(mutex_);
  snapshot.merge(stat_);
}

WorkerStat WorkerStatsSlot::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stat_;
}

GlobalSnapshot aggregate(const std::vector<WorkerStat> &workerStats) {
  GlobalSnapshot global;
  size_t latencyCount = 0;
  for (const auto &stat : workerStats) {
    latencyCount += stat.responseTimes.size();
  }
  global.responseTimes.reserve(latencyCount);

  for (const auto &stat : workerStats) {
    global.merge(stat);
  }
  return global;
}

StatsAggregator::StatsAggregator(const WorkerStatsSlots &slots)
    : slots_(slots) {}

GlobalSnapshot StatsAggregator::collect() const {
  GlobalSnapshot global;
  for (const auto &slot : slots_) {
    slot->mergeInto(global);
  }
  return global;
}

} // namespace httpload
