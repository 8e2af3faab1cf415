#pragma once

#include "load_config.hpp"
#include "report_sink.hpp"
#include "report_types.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace httpload {

nlohmann::json buildJsonReport(const LoadTestConfig &config,
                               const RunResult &result);

/**
 * @brief Write the report to @p path, pretty-printed.
 * @return false (after logging) when the file cannot be written.
 */
bool writeJsonReport(const std::string &path, const LoadTestConfig &config,
                     const RunResult &result);

// Writes the final JSON report when the run completes
class JsonReportSink : public ReportSink {
public:
  explicit JsonReportSink(std::string path);

  void onRunStart(const LoadTestConfig &config, size_t corpusSize) override;
  void onReport(const ReportCycle & /*cycle*/) override {}
  void onRunComplete(const RunResult &result) override;

  bool written() const { return written_; }

private:
  std::string path_;
  LoadTestConfig config_;
  bool written_ = false;
};

} // namespace httpload
