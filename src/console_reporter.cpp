#include "console_reporter.hpp"
#include "ascii_chart.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace httpload {

namespace {

long long wholeMilliseconds(std::chrono::nanoseconds value) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(value).count();
}

std::string fixed2(double value) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2) << value;
  return oss.str();
}

void printBorder(std::ostream &out, size_t nameWidth, size_t valueWidth) {
  out << '+' << std::string(nameWidth + 2, '-') << '+'
      << std::string(valueWidth + 2, '-') << "+\n";
}

} // namespace

ConsoleReporter::ConsoleReporter(std::ostream &out, int chartHeight)
    : out_(out), chartHeight_(std::max(chartHeight, 1)) {}

void ConsoleReporter::onRunStart(const LoadTestConfig &config,
                                 size_t corpusSize) {
  std::lock_guard<std::mutex> lock(outputMutex_);
  out_ << "\nTarget URL: " << config.url << '\n'
       << "Concurrency: " << config.concurrency
       << ", Total Requests: " << config.totalRequests << '\n'
       << "Keep-Alive Ratio: " << fixed2(config.keepAliveRatio) << '\n'
       << "HTTP Method: " << config.method << '\n';
  if (!config.corpusFile.empty()) {
    out_ << "Loaded " << corpusSize << " request bodies\n";
  }
  out_ << "======================================" << std::endl;
}

void ConsoleReporter::onReport(const ReportCycle &cycle) {
  std::lock_guard<std::mutex> lock(outputMutex_);

  if (cycle.final) {
    out_ << "\n======================================\n"
         << "Test completed! Final statistics:\n";
  }

  if (!cycle.hasData()) {
    out_ << "\nNot enough data for statistics" << std::endl;
    return;
  }

  printTable(cycle);
  printStatusCodes(cycle);
  out_.flush();
}

void ConsoleReporter::printTable(const ReportCycle &cycle) {
  const auto &snapshot = cycle.snapshot;
  const auto &percentiles = *cycle.percentiles;

  std::vector<std::pair<std::string, std::string>> rows = {
      {"Total Requests", std::to_string(snapshot.totalRequests)},
      {"Success Requests", std::to_string(snapshot.successRequests)},
      {"Failed Requests", std::to_string(snapshot.failedRequests)},
      {"TPS", fixed2(cycle.tps)},
      {"QPS", fixed2(cycle.qps)},
      {"P50", std::to_string(wholeMilliseconds(percentiles.p50)) + " ms"},
      {"P95", std::to_string(wholeMilliseconds(percentiles.p95)) + " ms"},
      {"P99", std::to_string(wholeMilliseconds(percentiles.p99)) + " ms"},
  };

  size_t nameWidth = std::string("METRIC").size();
  size_t valueWidth = std::string("VALUE").size();
  for (const auto &[name, value] : rows) {
    nameWidth = std::max(nameWidth, name.size());
    valueWidth = std::max(valueWidth, value.size());
  }

  out_ << '\n';
  printBorder(out_, nameWidth, valueWidth);
  out_ << "| " << std::left << std::setw(static_cast<int>(nameWidth))
       << "METRIC" << " | " << std::setw(static_cast<int>(valueWidth))
       << "VALUE" << " |\n";
  printBorder(out_, nameWidth, valueWidth);
  for (const auto &[name, value] : rows) {
    out_ << "| " << std::left << std::setw(static_cast<int>(nameWidth)) << name
         << " | " << std::setw(static_cast<int>(valueWidth)) << value
         << " |\n";
  }
  printBorder(out_, nameWidth, valueWidth);
  out_ << std::right;
}

void ConsoleReporter::printStatusCodes(const ReportCycle &cycle) {
  out_ << "\nHTTP Status Code Statistics:\n";
  for (const auto &[code, count] : cycle.snapshot.statusCodes) {
    out_ << "  - " << code << ": " << count << " times\n";
  }
}

void ConsoleReporter::printChart(const char *title,
                                 const std::vector<double> &series,
                                 int height) {
  out_ << title << '\n' << plotAsciiChart(series, height) << '\n';
}

void ConsoleReporter::onRunComplete(const RunResult &result) {
  std::lock_guard<std::mutex> lock(outputMutex_);
  const auto &history = result.history;
  const int percentileHeight = std::max(chartHeight_ / 2, 1);

  out_ << "\nTransport selection: " << result.keepAliveSelections
       << " keep-alive, " << result.noKeepAliveSelections
       << " no-keep-alive\n";

  out_ << '\n';
  printChart("TPS Trend:", history.tps, chartHeight_);
  out_ << '\n';
  printChart("QPS Trend:", history.qps, chartHeight_);
  out_ << "\nResponse Time Trend (ms):\n";
  printChart("P50:", history.p50, percentileHeight);
  printChart("P95:", history.p95, percentileHeight);
  printChart("P99:", history.p99, percentileHeight);
  out_.flush();
}

ConsoleProgressBar::ConsoleProgressBar(std::ostream &out, int width)
    : out_(out), width_(std::max(width, 10)) {}

void ConsoleProgressBar::start(uint64_t total) {
  std::lock_guard<std::mutex> lock(renderMutex_);
  total_ = total;
  completed_ = 0;
  started_ = std::chrono::steady_clock::now();
  lastRender_ = std::chrono::steady_clock::time_point{};
}

void ConsoleProgressBar::advance() {
  uint64_t done = completed_.fetch_add(1) + 1;

  std::unique_lock<std::mutex> lock(renderMutex_, std::try_to_lock);
  if (!lock.owns_lock()) {
    return;
  }
  auto now = std::chrono::steady_clock::now();
  if (done < total_ && now - lastRender_ < std::chrono::milliseconds(100)) {
    return;
  }
  lastRender_ = now;
  render(done);
}

void ConsoleProgressBar::finish() {
  std::lock_guard<std::mutex> lock(renderMutex_);
  render(completed_.load());
  out_ << std::endl;
}

void ConsoleProgressBar::render(uint64_t done) {
  double fraction =
      total_ > 0 ? static_cast<double>(std::min(done, total_)) / total_ : 1.0;
  int filled = static_cast<int>(fraction * width_);
  double seconds = std::chrono::duration<double>(
                       std::chrono::steady_clock::now() - started_)
                       .count();

  out_ << '\r' << std::setw(3) << static_cast<int>(fraction * 100) << "% |"
       << std::string(static_cast<size_t>(filled), '#')
       << std::string(static_cast<size_t>(width_ - filled), ' ') << "| "
       << done << '/' << total_ << " [" << fixed2(seconds) << "s]"
       << std::flush;
}

} // namespace httpload
