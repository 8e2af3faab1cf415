#include "json_report.hpp"
#include "logger.hpp"
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace httpload {

namespace {

double toMilliseconds(std::chrono::nanoseconds value) {
  return std::chrono::duration<double, std::milli>(value).count();
}

std::string utcTimestamp() {
  std::time_t now = std::time(nullptr);
  std::tm utc{};
  gmtime_r(&now, &utc);
  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

} // namespace

nlohmann::json buildJsonReport(const LoadTestConfig &config,
                               const RunResult &result) {
  const auto &cycle = result.finalCycle;
  const auto &snapshot = cycle.snapshot;

  nlohmann::json report;
  report["generated_at"] = utcTimestamp();

  report["configuration"] = {
      {"url", config.url},
      {"method", config.method},
      {"concurrency", config.concurrency},
      {"total_requests", config.totalRequests},
      {"keepalive_ratio", config.keepAliveRatio},
      {"report_interval_ms", config.reportInterval.count()},
      {"request_timeout_ms", config.transport.requestTimeout.count()}};
  if (config.seed) {
    report["configuration"]["seed"] = *config.seed;
  }

  report["results"] = {
      {"total_requests", snapshot.totalRequests},
      {"success_requests", snapshot.successRequests},
      {"failed_requests", snapshot.failedRequests},
      {"elapsed_seconds", std::chrono::duration<double>(cycle.elapsed).count()},
      {"tps", cycle.tps},
      {"qps", cycle.qps}};

  if (cycle.percentiles) {
    report["latency_ms"] = {{"p50", toMilliseconds(cycle.percentiles->p50)},
                            {"p95", toMilliseconds(cycle.percentiles->p95)},
                            {"p99", toMilliseconds(cycle.percentiles->p99)}};
    if (!snapshot.responseTimes.empty()) {
      report["latency_ms"]["min"] =
          toMilliseconds(snapshot.responseTimes.front());
      report["latency_ms"]["max"] =
          toMilliseconds(snapshot.responseTimes.back());
    }
  } else {
    report["latency_ms"] = nullptr;
  }

  nlohmann::json statusCodes = nlohmann::json::object();
  for (const auto &[code, count] : snapshot.statusCodes) {
    statusCodes[std::to_string(code)] = count;
  }
  report["status_codes"] = statusCodes;

  report["transport_selection"] = {
      {"keep_alive", result.keepAliveSelections},
      {"no_keep_alive", result.noKeepAliveSelections}};

  report["trends"] = {{"tps", result.history.tps},
                      {"qps", result.history.qps},
                      {"p50_ms", result.history.p50},
                      {"p95_ms", result.history.p95},
                      {"p99_ms", result.history.p99}};

  return report;
}

bool writeJsonReport(const std::string &path, const LoadTestConfig &config,
                     const RunResult &result) {
  std::ofstream file(path);
  if (!file.is_open()) {
    REPORT_LOG_ERROR("Cannot open report file {}", path);
    return false;
  }

  file << buildJsonReport(config, result).dump(2) << '\n';
  if (!file) {
    REPORT_LOG_ERROR("Failed to write report file {}", path);
    return false;
  }

  REPORT_LOG_INFO("Report written to {}", path);
  return true;
}

JsonReportSink::JsonReportSink(std::string path) : path_(std::move(path)) {}

void JsonReportSink::onRunStart(const LoadTestConfig &config,
                                size_t /*corpusSize*/) {
  config_ = config;
}

void JsonReportSink::onRunComplete(const RunResult &result) {
  written_ = writeJsonReport(path_, config_, result);
}

} // namespace httpload
