#pragma once

#include "config_manager.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace httpload {

// Settings shared by both client configurations of the transport pool
struct TransportSettings {
  int maxIdleConnections = 100;
  std::chrono::seconds idleTimeout{30};
  std::chrono::milliseconds requestTimeout{10000};
  std::string userAgent = "httpload/1.0";

  static TransportSettings fromConfig(const ConfigManager &config);
  ConfigValidationResult validate() const;
  bool operator==(const TransportSettings &other) const;
};

struct ReportSettings {
  std::string jsonFile;
  int chartHeight = 10;
  bool showProgress = true;

  static ReportSettings fromConfig(const ConfigManager &config);
  ConfigValidationResult validate() const;
  bool operator==(const ReportSettings &other) const;
};

// Everything one load test run needs
struct LoadTestConfig {
  std::string url = "http://localhost:8080";
  std::string method = "POST";
  std::string corpusFile;
  int concurrency = 10;
  int totalRequests = 100;
  double keepAliveRatio = 0.7;
  std::chrono::milliseconds reportInterval{1000};
  std::optional<unsigned int> seed;

  TransportSettings transport;
  ReportSettings report;

  static LoadTestConfig fromConfig(const ConfigManager &config);
  ConfigValidationResult validate() const;
  bool operator==(const LoadTestConfig &other) const;
};

} // namespace httpload
