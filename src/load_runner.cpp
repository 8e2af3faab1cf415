#include "load_runner.hpp"
#include "httpload_exceptions.hpp"
#include "logger.hpp"
#include "trend_recorder.hpp"
#include "work_counter.hpp"
#include "worker.hpp"
#include "worker_stats.hpp"
#include <exception>
#include <random>
#include <thread>
#include <vector>

namespace httpload {

LoadRunner::LoadRunner(LoadTestConfig config, const RequestCorpus &corpus,
                       TransportFactory &transports, ReportSink &sink,
                       ProgressIndicator &progress)
    : config_(std::move(config)), corpus_(corpus), transports_(transports),
      sink_(sink), progress_(progress) {}

uint64_t LoadRunner::workerSeed(size_t workerIndex) const {
  if (config_.seed) {
    return static_cast<uint64_t>(*config_.seed) + workerIndex;
  }
  std::random_device rd;
  return (static_cast<uint64_t>(rd()) << 32) | rd();
}

RunResult LoadRunner::run() {
  auto validation = config_.validate();
  for (const auto &warning : validation.warnings) {
    RUNNER_LOG_WARN(warning);
  }
  if (!validation.isValid) {
    std::string message = "Invalid load test configuration";
    for (const auto &error : validation.errors) {
      message += "; " + error;
    }
    throw ValidationException(ErrorCode::CONFIGURATION_ERROR, message);
  }

  const auto concurrency = static_cast<size_t>(config_.concurrency);
  const auto total = static_cast<uint64_t>(config_.totalRequests);

  WorkCounter counter(total);
  TransportSelector selector(config_.keepAliveRatio);

  WorkerStatsSlots slots;
  slots.reserve(concurrency);
  for (size_t i = 0; i < concurrency; ++i) {
    slots.push_back(std::make_unique<WorkerStatsSlot>(total / concurrency));
  }

  WorkerContext context{counter,  corpus_,     selector,
                        progress_, config_.url, config_.method};

  std::vector<Worker> workers;
  workers.reserve(concurrency);
  for (size_t i = 0; i < concurrency; ++i) {
    workers.emplace_back(i, context, *slots[i],
                         transports_.create(TransportKind::KeepAlive),
                         transports_.create(TransportKind::NoKeepAlive),
                         workerSeed(i));
  }

  StatsAggregator aggregator(slots);
  TrendRecorder recorder([&aggregator] { return aggregator.collect(); },
                         config_.reportInterval, sink_);

  sink_.onRunStart(config_, corpus_.size());
  progress_.start(total);

  RUNNER_LOG_INFO("Starting {} workers for {} requests against {}",
                  concurrency, total, config_.url);

  auto runStart = std::chrono::steady_clock::now();
  recorder.start(runStart);

  std::vector<std::exception_ptr> failures(concurrency);
  std::vector<std::thread> threads;
  threads.reserve(concurrency);
  for (size_t i = 0; i < concurrency; ++i) {
    threads.emplace_back([&workers, &failures, i] {
      try {
        workers[i].run();
      } catch (...) {
        failures[i] = std::current_exception();
      }
    });
  }

  for (auto &thread : threads) {
    thread.join();
  }
  progress_.finish();

  RunResult result;
  result.finalCycle = recorder.stop();
  result.wallTime = std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::steady_clock::now() - runStart);

  for (size_t i = 0; i < failures.size(); ++i) {
    if (!failures[i]) {
      continue;
    }
    try {
      std::rethrow_exception(failures[i]);
    } catch (const LoadTestException &e) {
      RUNNER_LOG_ERROR("Worker {} terminated abnormally: {}", i,
                       e.toLogString());
      throw;
    } catch (const std::exception &e) {
      RUNNER_LOG_ERROR("Worker {} terminated abnormally: {}", i, e.what());
      throw createSystemError(ErrorCode::WORKER_FAILED,
                              "Worker " + std::to_string(i), e.what());
    }
  }

  result.history = std::move(recorder.history());
  result.history.ensureNonEmpty();
  result.keepAliveSelections = selector.keepAliveSelections();
  result.noKeepAliveSelections = selector.noKeepAliveSelections();

  RUNNER_LOG_INFO("Run finished: {} requests, {} succeeded, {} failed",
                  result.finalCycle.snapshot.totalRequests,
                  result.finalCycle.snapshot.successRequests,
                  result.finalCycle.snapshot.failedRequests);

  sink_.onRunComplete(result);
  return result;
}

} // namespace httpload
