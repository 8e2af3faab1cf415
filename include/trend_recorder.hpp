#pragma once

#include "report_sink.hpp"
#include "report_types.hpp"
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <functional>
#include <mutex>
#include <thread>

namespace httpload {

namespace net = boost::asio;

/**
 * Periodic aggregate/report loop.
 *
 * Idle -> Running on start(); Running -> Stopped on stop(), which performs
 * exactly one final cycle. The timer runs on its own io_context thread and
 * re-arms at a fixed cadence. History is only handed out once Stopped.
 */
class TrendRecorder {
public:
  enum class State { Idle, Running, Stopped };

  using SnapshotSource = std::function<GlobalSnapshot()>;

  TrendRecorder(SnapshotSource source, std::chrono::milliseconds interval,
                ReportSink &sink);
  ~TrendRecorder();

  TrendRecorder(const TrendRecorder &) = delete;
  TrendRecorder &operator=(const TrendRecorder &) = delete;

  void start(std::chrono::steady_clock::time_point runStart =
                 std::chrono::steady_clock::now());

  // Idempotent; later calls return the same final cycle
  ReportCycle stop();

  State state() const { return state_.load(); }

  /**
   * @throws SystemException unless the recorder is Stopped
   */
  const TrendHistory &history() const;
  TrendHistory &history();

  // Timer firings that produced a report, excluding the final one
  size_t periodicCycles() const { return periodicCycles_.load(); }

private:
  SnapshotSource source_;
  std::chrono::milliseconds interval_;
  ReportSink &sink_;

  net::io_context ioc_;
  net::steady_timer timer_;
  std::thread timerThread_;
  std::atomic<bool> stopping_{false};
  std::atomic<State> state_{State::Idle};
  std::atomic<size_t> periodicCycles_{0};

  std::chrono::steady_clock::time_point runStart_;
  TrendHistory history_;
  ReportCycle finalCycle_;
  std::mutex stopMutex_;

  void arm();
  ReportCycle runCycle(bool final);
  void requireStopped() const;
};

} // namespace httpload
