#pragma once

#include "load_config.hpp"
#include "report_types.hpp"
#include <cstdint>
#include <vector>

namespace httpload {

// Consumer of report cycles and of the end-of-run result
class ReportSink {
public:
  virtual ~ReportSink() = default;

  virtual void onRunStart(const LoadTestConfig & /*config*/,
                          size_t /*corpusSize*/) {}
  virtual void onReport(const ReportCycle &cycle) = 0;
  virtual void onRunComplete(const RunResult &result) = 0;
};

// Fans every callback out to several sinks in registration order
class CompositeReportSink : public ReportSink {
public:
  void add(ReportSink &sink) { sinks_.push_back(&sink); }

  void onRunStart(const LoadTestConfig &config, size_t corpusSize) override;
  void onReport(const ReportCycle &cycle) override;
  void onRunComplete(const RunResult &result) override;

private:
  std::vector<ReportSink *> sinks_;
};

// Advanced once per completed request, whatever its outcome
class ProgressIndicator {
public:
  virtual ~ProgressIndicator() = default;

  virtual void start(uint64_t /*total*/) {}
  virtual void advance() = 0;
  virtual void finish() {}
};

class NullProgressIndicator : public ProgressIndicator {
public:
  void advance() override {}
};

} // namespace httpload
