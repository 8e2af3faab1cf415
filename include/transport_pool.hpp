#pragma once

#include "load_config.hpp"
#include "request_executor.hpp"
#include <array>
#include <atomic>
#include <cstdint>
#include <curl/curl.h>
#include <memory>
#include <mutex>
#include <random>
#include <string>

namespace httpload {

enum class TransportKind { KeepAlive, NoKeepAlive };

const char *transportKindName(TransportKind kind);

/**
 * Per-request Bernoulli choice between the two transports. Thread-safe; the
 * random engine belongs to the caller.
 */
class TransportSelector {
public:
  explicit TransportSelector(double keepAliveRatio);

  template <typename Engine> TransportKind select(Engine &rng) {
    std::bernoulli_distribution useKeepAlive(keepAliveRatio_);
    if (useKeepAlive(rng)) {
      keepAliveSelections_.fetch_add(1, std::memory_order_relaxed);
      return TransportKind::KeepAlive;
    }
    noKeepAliveSelections_.fetch_add(1, std::memory_order_relaxed);
    return TransportKind::NoKeepAlive;
  }

  double keepAliveRatio() const { return keepAliveRatio_; }
  uint64_t keepAliveSelections() const {
    return keepAliveSelections_.load(std::memory_order_relaxed);
  }
  uint64_t noKeepAliveSelections() const {
    return noKeepAliveSelections_.load(std::memory_order_relaxed);
  }

private:
  double keepAliveRatio_;
  std::atomic<uint64_t> keepAliveSelections_{0};
  std::atomic<uint64_t> noKeepAliveSelections_{0};
};

// Builds per-worker clients for a transport configuration
class TransportFactory {
public:
  virtual ~TransportFactory() = default;
  virtual std::unique_ptr<HttpTransport> create(TransportKind kind) = 0;
};

/**
 * The two libcurl client configurations of a run. Owns libcurl global
 * state and the connection cache shared by all keep-alive clients, so it
 * must outlive every transport it creates.
 */
class TransportPool : public TransportFactory {
public:
  explicit TransportPool(const TransportSettings &settings);
  ~TransportPool() override;

  TransportPool(const TransportPool &) = delete;
  TransportPool &operator=(const TransportPool &) = delete;

  std::unique_ptr<HttpTransport> create(TransportKind kind) override;

  const CurlClientOptions &profile(TransportKind kind) const;

private:
  CurlClientOptions keepAlive_;
  CurlClientOptions noKeepAlive_;
  CURLSH *share_ = nullptr;
  std::array<std::mutex, static_cast<size_t>(CURL_LOCK_DATA_LAST)> shareLocks_;

  static void lockShare(CURL *handle, curl_lock_data data,
                        curl_lock_access access, void *userptr);
  static void unlockShare(CURL *handle, curl_lock_data data, void *userptr);
};

} // namespace httpload
