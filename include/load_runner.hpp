#pragma once

#include "load_config.hpp"
#include "report_sink.hpp"
#include "report_types.hpp"
#include "request_corpus.hpp"
#include "transport_pool.hpp"

namespace httpload {

/**
 * Drives one run: launches the workers and the trend recorder, joins the
 * workers, stops the recorder and hands the result to the sink.
 */
class LoadRunner {
public:
  LoadRunner(LoadTestConfig config, const RequestCorpus &corpus,
             TransportFactory &transports, ReportSink &sink,
             ProgressIndicator &progress);

  /**
   * @throws ValidationException when the configuration is invalid.
   * @throws SystemException when transports cannot be created.
   * Rethrows the first exception that escaped a worker thread, after all
   * threads are joined and the recorder is stopped.
   */
  RunResult run();

  const LoadTestConfig &config() const { return config_; }

private:
  LoadTestConfig config_;
  const RequestCorpus &corpus_;
  TransportFactory &transports_;
  ReportSink &sink_;
  ProgressIndicator &progress_;

  uint64_t workerSeed(size_t workerIndex) const;
};

} // namespace httpload
