#include "request_executor.hpp"
#include "httpload_exceptions.hpp"
#include "logger.hpp"
#include <cctype>
#include <optional>

namespace httpload {

namespace {

struct ExchangeTrace {
  std::optional<std::chrono::steady_clock::time_point> firstByte;
};

ExecutionResult failedExchange(std::string error) {
  ExecutionResult result;
  result.error = std::move(error);
  return result;
}

} // namespace

CurlTransport::CurlTransport(CurlClientOptions options)
    : options_(std::move(options)) {
  errorBuffer_[0] = '\0';

  handle_ = curl_easy_init();
  if (!handle_) {
    throw createSystemError(ErrorCode::TRANSPORT_INIT_FAILED, "CurlTransport",
                            "curl_easy_init returned null");
  }

  curl_slist *list = curl_slist_append(nullptr, "Content-Type: application/json");
  // An empty Expect header stops libcurl from waiting on 100-continue.
  if (list) {
    list = curl_slist_append(list, "Expect:");
  }
  if (list && !options_.reuseConnections) {
    list = curl_slist_append(list, "Connection: close");
  }
  if (!list) {
    curl_easy_cleanup(handle_);
    throw createSystemError(ErrorCode::TRANSPORT_INIT_FAILED, "CurlTransport",
                            "curl_slist_append failed");
  }
  headers_.reset(list);
}

CurlTransport::~CurlTransport() {
  if (handle_) {
    curl_easy_cleanup(handle_);
  }
}

bool CurlTransport::isValidMethod(const std::string &method) {
  if (method.empty()) {
    return false;
  }
  static const std::string extra = "!#$%&'*+-.^_`|~";
  for (char c : method) {
    if (!std::isalnum(static_cast<unsigned char>(c)) &&
        extra.find(c) == std::string::npos) {
      return false;
    }
  }
  return true;
}

size_t CurlTransport::onHeader(char * /*buffer*/, size_t size, size_t nitems,
                               void *userdata) {
  auto *trace = static_cast<ExchangeTrace *>(userdata);
  if (!trace->firstByte) {
    trace->firstByte = std::chrono::steady_clock::now();
  }
  return size * nitems;
}

size_t CurlTransport::onBody(char * /*ptr*/, size_t size, size_t nmemb,
                             void * /*userdata*/) {
  return size * nmemb;
}

void CurlTransport::applyOptions(const RequestSpec &spec,
                                 const std::string &method, void *trace) {
  curl_easy_setopt(handle_, CURLOPT_URL, spec.url.c_str());
  curl_easy_setopt(handle_, CURLOPT_ERRORBUFFER, errorBuffer_);
  curl_easy_setopt(handle_, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(handle_, CURLOPT_TIMEOUT_MS,
                   static_cast<long>(options_.requestTimeout.count()));
  curl_easy_setopt(handle_, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(handle_, CURLOPT_MAXREDIRS, 10L);
  curl_easy_setopt(handle_, CURLOPT_USERAGENT, options_.userAgent.c_str());
  curl_easy_setopt(handle_, CURLOPT_HTTPHEADER, headers_.get());

  curl_easy_setopt(handle_, CURLOPT_HEADERFUNCTION, &CurlTransport::onHeader);
  curl_easy_setopt(handle_, CURLOPT_HEADERDATA, trace);
  curl_easy_setopt(handle_, CURLOPT_WRITEFUNCTION, &CurlTransport::onBody);
  curl_easy_setopt(handle_, CURLOPT_WRITEDATA, nullptr);

  if (options_.reuseConnections) {
    if (options_.share) {
      curl_easy_setopt(handle_, CURLOPT_SHARE, options_.share);
    }
    curl_easy_setopt(handle_, CURLOPT_MAXCONNECTS, options_.maxConnections);
    curl_easy_setopt(handle_, CURLOPT_MAXAGE_CONN,
                     static_cast<long>(options_.idleTimeout.count()));
    curl_easy_setopt(handle_, CURLOPT_TCP_KEEPALIVE, 1L);
  } else {
    curl_easy_setopt(handle_, CURLOPT_FRESH_CONNECT, 1L);
    curl_easy_setopt(handle_, CURLOPT_FORBID_REUSE, 1L);
  }

  if (method == "HEAD") {
    curl_easy_setopt(handle_, CURLOPT_NOBODY, 1L);
  } else if (method == "GET" && spec.body.empty()) {
    curl_easy_setopt(handle_, CURLOPT_HTTPGET, 1L);
  } else {
    // The request outlives curl_easy_perform, so the body is not copied.
    curl_easy_setopt(handle_, CURLOPT_POSTFIELDS, spec.body.data());
    curl_easy_setopt(handle_, CURLOPT_POSTFIELDSIZE_LARGE,
                     static_cast<curl_off_t>(spec.body.size()));
    if (method != "POST") {
      curl_easy_setopt(handle_, CURLOPT_CUSTOMREQUEST, method.c_str());
    }
  }
}

ExecutionResult CurlTransport::execute(const RequestSpec &spec,
                                       const std::string &method) {
  if (!isValidMethod(method)) {
    return failedExchange("invalid HTTP method '" + method + "'");
  }
  if (spec.url.empty()) {
    return failedExchange("empty request URL");
  }

  // Reset clears per-request options but keeps the connection cache.
  curl_easy_reset(handle_);
  errorBuffer_[0] = '\0';

  ExchangeTrace trace;
  applyOptions(spec, method, &trace);

  auto start = std::chrono::steady_clock::now();
  CURLcode rc = curl_easy_perform(handle_);
  auto end = std::chrono::steady_clock::now();

  if (rc != CURLE_OK) {
    std::string error = curl_easy_strerror(rc);
    if (errorBuffer_[0] != '\0') {
      error += ": ";
      error += errorBuffer_;
    }
    TRANSPORT_LOG_DEBUG("Request to {} failed: {}", spec.url, error);
    return failedExchange(std::move(error));
  }

  long status = 0;
  curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &status);
  if (status == 0) {
    // Non-HTTP schemes such as file:// complete without a status line.
    return failedExchange("no HTTP response");
  }

  ExecutionResult result;
  result.statusCode = static_cast<int>(status);
  result.success = status >= 200 && status < 300;
  result.latency = std::chrono::duration_cast<std::chrono::nanoseconds>(
      end - trace.firstByte.value_or(start));
  if (!result.success) {
    result.error = "HTTP status " + std::to_string(status);
  }
  return result;
}

} // namespace httpload
