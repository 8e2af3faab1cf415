#pragma once

#include "request_corpus.hpp"
#include <chrono>
#include <curl/curl.h>
#include <memory>
#include <string>

namespace httpload {

// Outcome of one HTTP exchange
struct ExecutionResult {
  bool success = false;
  std::chrono::nanoseconds latency{0};
  int statusCode = 0; // 0 when no response was received
  std::string error;

  bool responseReceived() const { return statusCode != 0; }
};

// One HTTP client bound to a transport configuration. Not thread-safe;
// every worker owns its instances.
class HttpTransport {
public:
  virtual ~HttpTransport() = default;

  /**
   * @brief Perform one exchange and drain the response body.
   *
   * Never throws for request construction or transport failures; those are
   * reported as `{success=false, statusCode=0, latency=0}`.
   */
  virtual ExecutionResult execute(const RequestSpec &spec,
                                  const std::string &method) = 0;
};

struct CurlClientOptions {
  bool reuseConnections = true;
  long maxConnections = 100;
  std::chrono::seconds idleTimeout{30};
  std::chrono::milliseconds requestTimeout{10000};
  std::string userAgent = "httpload/1.0";
  CURLSH *share = nullptr; // connection/DNS cache shared across clients
};

/**
 * libcurl implementation. Latency runs from the first response byte
 * (first header callback) to the end of the body drain, or from request
 * start when no byte was observed.
 */
class CurlTransport : public HttpTransport {
public:
  explicit CurlTransport(CurlClientOptions options);
  ~CurlTransport() override;

  CurlTransport(const CurlTransport &) = delete;
  CurlTransport &operator=(const CurlTransport &) = delete;

  ExecutionResult execute(const RequestSpec &spec,
                          const std::string &method) override;

  const CurlClientOptions &options() const { return options_; }

  static bool isValidMethod(const std::string &method);

private:
  struct SlistDeleter {
    void operator()(curl_slist *list) const { curl_slist_free_all(list); }
  };

  CurlClientOptions options_;
  CURL *handle_ = nullptr;
  std::unique_ptr<curl_slist, SlistDeleter> headers_;
  char errorBuffer_[CURL_ERROR_SIZE];

  void applyOptions(const RequestSpec &spec, const std::string &method,
                    void *trace);
  static size_t onHeader(char *buffer, size_t size, size_t nitems,
                         void *userdata);
  static size_t onBody(char *ptr, size_t size, size_t nmemb, void *userdata);
};

} // namespace httpload
