#pragma once

#include "report_sink.hpp"
#include "request_corpus.hpp"
#include "request_executor.hpp"
#include "transport_pool.hpp"
#include "work_counter.hpp"
#include "worker_stats.hpp"
#include <cstdint>
#include <memory>
#include <random>
#include <string>

namespace httpload {

// Shared, read-mostly collaborators of every worker
struct WorkerContext {
  WorkCounter &counter;
  const RequestCorpus &corpus;
  TransportSelector &selector;
  ProgressIndicator &progress;
  const std::string &defaultUrl;
  const std::string &method;
};

/**
 * Claims work units until the budget is exhausted. Each worker owns its
 * random engine, its two clients and exactly one stats slot.
 */
class Worker {
public:
  Worker(size_t id, WorkerContext context, WorkerStatsSlot &slot,
         std::unique_ptr<HttpTransport> keepAlive,
         std::unique_ptr<HttpTransport> noKeepAlive, uint64_t seed);

  Worker(const Worker &) = delete;
  Worker &operator=(const Worker &) = delete;
  Worker(Worker &&) = default;

  void run();

  size_t id() const { return id_; }
  uint64_t completed() const { return completed_; }

private:
  size_t id_;
  WorkerContext context_;
  WorkerStatsSlot &slot_;
  std::unique_ptr<HttpTransport> keepAlive_;
  std::unique_ptr<HttpTransport> noKeepAlive_;
  std::mt19937_64 rng_;
  uint64_t completed_ = 0;
};

} // namespace httpload
