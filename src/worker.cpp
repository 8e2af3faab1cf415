#include "worker.hpp"
#include "logger.hpp"
#include <chrono>

namespace httpload {

Worker::Worker(size_t id, WorkerContext context, WorkerStatsSlot &slot,
               std::unique_ptr<HttpTransport> keepAlive,
               std::unique_ptr<HttpTransport> noKeepAlive, uint64_t seed)
    : id_(id), context_(context), slot_(slot),
      keepAlive_(std::move(keepAlive)), noKeepAlive_(std::move(noKeepAlive)),
      rng_(seed) {}

void Worker::run() {
  WORKER_LOG_DEBUG("Worker {} started", id_);

  while (auto index = context_.counter.claimNext()) {
    auto started = std::chrono::steady_clock::now();

    RequestSpec spec = context_.corpus.sample(context_.defaultUrl, rng_);
    TransportKind kind = context_.selector.select(rng_);
    HttpTransport &transport =
        kind == TransportKind::KeepAlive ? *keepAlive_ : *noKeepAlive_;

    ExecutionResult result = transport.execute(spec, context_.method);

    auto wallTime = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - started);
    slot_.record(result, wallTime);
    ++completed_;

    if (!result.success && !result.responseReceived()) {
      WORKER_LOG_DEBUG("Worker {} request #{} failed over {}: {}", id_, *index,
                       transportKindName(kind), result.error);
    }

    context_.progress.advance();
  }

  WORKER_LOG_DEBUG("Worker {} finished after {} requests", id_, completed_);
}

} // namespace httpload
