#include "trend_recorder.hpp"
#include "httpload_exceptions.hpp"
#include "logger.hpp"
#include <boost/asio/post.hpp>
#include <boost/system/error_code.hpp>

namespace httpload {

namespace {

double wholeMilliseconds(std::chrono::nanoseconds value) {
  return static_cast<double>(
      std::chrono::duration_cast<std::chrono::milliseconds>(value).count());
}

} // namespace

TrendRecorder::TrendRecorder(SnapshotSource source,
                             std::chrono::milliseconds interval,
                             ReportSink &sink)
    : source_(std::move(source)), interval_(interval), sink_(sink),
      timer_(ioc_) {
  if (interval_.count() <= 0) {
    throw ValidationException(ErrorCode::INVALID_RANGE,
                              "Report interval must be positive",
                              "report_interval_ms",
                              std::to_string(interval_.count()));
  }
}

TrendRecorder::~TrendRecorder() {
  if (timerThread_.joinable()) {
    stopping_ = true;
    net::post(ioc_, [this] { timer_.cancel(); });
    timerThread_.join();
  }
}

void TrendRecorder::start(std::chrono::steady_clock::time_point runStart) {
  State expected = State::Idle;
  if (!state_.compare_exchange_strong(expected, State::Running)) {
    throw SystemException(ErrorCode::INVALID_STATE,
                          "TrendRecorder can only be started once",
                          "TrendRecorder");
  }

  runStart_ = runStart;
  timer_.expires_at(runStart_ + interval_);
  arm();
  timerThread_ = std::thread([this] { ioc_.run(); });

  TREND_LOG_DEBUG("Trend recorder running with {}ms interval",
                  interval_.count());
}

void TrendRecorder::arm() {
  timer_.async_wait([this](const boost::system::error_code &ec) {
    if (ec == net::error::operation_aborted || stopping_) {
      return;
    }
    if (ec) {
      TREND_LOG_ERROR("Report timer failed: {}", ec.message());
      return;
    }

    try {
      runCycle(false);
      periodicCycles_++;
    } catch (const std::exception &e) {
      TREND_LOG_ERROR("Periodic report failed: {}", e.what());
    }

    timer_.expires_at(timer_.expiry() + interval_);
    arm();
  });
}

ReportCycle TrendRecorder::stop() {
  std::lock_guard<std::mutex> lock(stopMutex_);

  if (state_ == State::Stopped) {
    return finalCycle_;
  }
  if (state_ == State::Idle) {
    runStart_ = std::chrono::steady_clock::now();
  }

  if (timerThread_.joinable()) {
    stopping_ = true;
    net::post(ioc_, [this] { timer_.cancel(); });
    timerThread_.join();
  }

  // The timer thread has been joined, so the final cycle is the last
  // writer of the history.
  finalCycle_ = runCycle(true);
  state_ = State::Stopped;

  TREND_LOG_DEBUG("Trend recorder stopped after {} periodic cycles",
                  periodicCycles_.load());
  return finalCycle_;
}

ReportCycle TrendRecorder::runCycle(bool final) {
  ReportCycle cycle;
  cycle.final = final;
  cycle.snapshot = source_();
  cycle.elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::steady_clock::now() - runStart_);

  double seconds = std::chrono::duration<double>(cycle.elapsed).count();
  if (seconds <= 0.0) {
    TREND_LOG_DEBUG("Skipping report cycle with no elapsed time");
    return cycle;
  }

  cycle.tps = static_cast<double>(cycle.snapshot.successRequests) / seconds;
  cycle.qps = static_cast<double>(cycle.snapshot.totalRequests) / seconds;

  cycle.snapshot.sortLatencies();
  if (!cycle.snapshot.responseTimes.empty()) {
    LatencyPercentiles percentiles =
        computePercentiles(cycle.snapshot.responseTimes);
    cycle.percentiles = percentiles;

    TrendSample sample;
    sample.tps = cycle.tps;
    sample.qps = cycle.qps;
    sample.p50 = wholeMilliseconds(percentiles.p50);
    sample.p95 = wholeMilliseconds(percentiles.p95);
    sample.p99 = wholeMilliseconds(percentiles.p99);
    history_.append(sample);
  }

  sink_.onReport(cycle);
  return cycle;
}

void TrendRecorder::requireStopped() const {
  if (state_ != State::Stopped) {
    throw SystemException(ErrorCode::INVALID_STATE,
                          "Trend history is only available after stop()",
                          "TrendRecorder");
  }
}

const TrendHistory &TrendRecorder::history() const {
  requireStopped();
  return history_;
}

TrendHistory &TrendRecorder::history() {
  requireStopped();
  return history_;
}

} // namespace httpload
