#include "transport_pool.hpp"
#include "httpload_exceptions.hpp"
#include "logger.hpp"

namespace httpload {

const char *transportKindName(TransportKind kind) {
  switch (kind) {
  case TransportKind::KeepAlive:
    return "keep-alive";
  case TransportKind::NoKeepAlive:
    return "no-keep-alive";
  }
  return "unknown";
}

TransportSelector::TransportSelector(double keepAliveRatio)
    : keepAliveRatio_(keepAliveRatio) {
  if (!(keepAliveRatio >= 0.0 && keepAliveRatio <= 1.0)) {
    throw ValidationException(ErrorCode::INVALID_RANGE,
                              "Keep-alive ratio must be within [0.0, 1.0]",
                              "keepalive_ratio",
                              std::to_string(keepAliveRatio));
  }
}

TransportPool::TransportPool(const TransportSettings &settings) {
  CURLcode rc = curl_global_init(CURL_GLOBAL_ALL);
  if (rc != CURLE_OK) {
    throw createSystemError(ErrorCode::TRANSPORT_INIT_FAILED, "TransportPool",
                            curl_easy_strerror(rc));
  }

  share_ = curl_share_init();
  if (!share_) {
    curl_global_cleanup();
    throw createSystemError(ErrorCode::TRANSPORT_INIT_FAILED, "TransportPool",
                            "curl_share_init returned null");
  }
  curl_share_setopt(share_, CURLSHOPT_LOCKFUNC, &TransportPool::lockShare);
  curl_share_setopt(share_, CURLSHOPT_UNLOCKFUNC, &TransportPool::unlockShare);
  curl_share_setopt(share_, CURLSHOPT_USERDATA, this);
  curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
  if (curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT) !=
      CURLSHE_OK) {
    TRANSPORT_LOG_WARN("libcurl cannot share connections between handles; "
                       "keep-alive reuse is limited to each worker");
  }

  keepAlive_.reuseConnections = true;
  keepAlive_.maxConnections = settings.maxIdleConnections;
  keepAlive_.idleTimeout = settings.idleTimeout;
  keepAlive_.requestTimeout = settings.requestTimeout;
  keepAlive_.userAgent = settings.userAgent;
  keepAlive_.share = share_;

  noKeepAlive_ = keepAlive_;
  noKeepAlive_.reuseConnections = false;
  noKeepAlive_.share = nullptr;

  TRANSPORT_LOG_INFO("Transport pool ready: {} idle connections, {}s idle "
                     "timeout, {}ms request timeout",
                     settings.maxIdleConnections,
                     settings.idleTimeout.count(),
                     settings.requestTimeout.count());
}

TransportPool::~TransportPool() {
  if (share_) {
    CURLSHcode rc = curl_share_cleanup(share_);
    if (rc != CURLSHE_OK) {
      TRANSPORT_LOG_ERROR("curl_share_cleanup failed: {}",
                          curl_share_strerror(rc));
    }
  }
  curl_global_cleanup();
}

std::unique_ptr<HttpTransport> TransportPool::create(TransportKind kind) {
  return std::make_unique<CurlTransport>(profile(kind));
}

const CurlClientOptions &TransportPool::profile(TransportKind kind) const {
  return kind == TransportKind::KeepAlive ? keepAlive_ : noKeepAlive_;
}

void TransportPool::lockShare(CURL * /*handle*/, curl_lock_data data,
                              curl_lock_access /*access*/, void *userptr) {
  auto *pool = static_cast<TransportPool *>(userptr);
  pool->shareLocks_[static_cast<size_t>(data)].lock();
}

void TransportPool::unlockShare(CURL * /*handle*/, curl_lock_data data,
                                void *userptr) {
  auto *pool = static_cast<TransportPool *>(userptr);
  pool->shareLocks_[static_cast<size_t>(data)].unlock();
}

} // namespace httpload
