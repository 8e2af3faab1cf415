#pragma once

#include "report_sink.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <mutex>

namespace httpload {

/**
 * Human readable report: a metric table per cycle, the status code
 * breakdown, and trend charts when the run completes.
 */
class ConsoleReporter : public ReportSink {
public:
  explicit ConsoleReporter(std::ostream &out = std::cout, int chartHeight = 10);

  void onRunStart(const LoadTestConfig &config, size_t corpusSize) override;
  void onReport(const ReportCycle &cycle) override;
  void onRunComplete(const RunResult &result) override;

private:
  std::ostream &out_;
  int chartHeight_;
  std::mutex outputMutex_;

  void printTable(const ReportCycle &cycle);
  void printStatusCodes(const ReportCycle &cycle);
  void printChart(const char *title, const std::vector<double> &series,
                  int height);
};

// Single-line progress bar, redrawn at most every 100ms
class ConsoleProgressBar : public ProgressIndicator {
public:
  explicit ConsoleProgressBar(std::ostream &out = std::cerr, int width = 40);

  void start(uint64_t total) override;
  void advance() override;
  void finish() override;

  uint64_t completed() const { return completed_.load(); }

private:
  std::ostream &out_;
  int width_;
  uint64_t total_ = 0;
  std::atomic<uint64_t> completed_{0};
  std::mutex renderMutex_;
  std::chrono::steady_clock::time_point lastRender_;
  std::chrono::steady_clock::time_point started_;

  void render(uint64_t done);
};

} // namespace httpload
