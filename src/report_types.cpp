#include "report_sink.hpp"
#include "report_types.hpp"

namespace httpload {

void TrendHistory::append(const TrendSample &sample) {
  tps.push_back(sample.tps);
  qps.push_back(sample.qps);
  p50.push_back(sample.p50);
  p95.push_back(sample.p95);
  p99.push_back(sample.p99);
}

void TrendHistory::ensureNonEmpty() {
  for (auto *buffer : {&tps, &qps, &p50, &p95, &p99}) {
    if (buffer->empty()) {
      buffer->push_back(0.0);
    }
  }
}

bool TrendHistory::empty() const {
  return tps.empty() && qps.empty() && p50.empty() && p95.empty() &&
         p99.empty();
}

void CompositeReportSink::onRunStart(const LoadTestConfig &config,
                                     size_t corpusSize) {
  for (auto *sink : sinks_) {
    sink->onRunStart(config, corpusSize);
  }
}

void CompositeReportSink::onReport(const ReportCycle &cycle) {
  for (auto *sink : sinks_) {
    sink->onReport(cycle);
  }
}

void CompositeReportSink::onRunComplete(const RunResult &result) {
  for (auto *sink : sinks_) {
    sink->onRunComplete(result);
  }
}

} // namespace httpload
