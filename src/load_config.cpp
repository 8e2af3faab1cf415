#include "load_config.hpp"
#include <cctype>

namespace httpload {

namespace {

bool hasHttpScheme(const std::string &url) {
  return url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0;
}

bool isTokenChar(char c) {
  static const std::string extra = "!#$%&'*+-.^_`|~";
  return std::isalnum(static_cast<unsigned char>(c)) ||
         extra.find(c) != std::string::npos;
}

} // namespace

// ===== TransportSettings =====

TransportSettings TransportSettings::fromConfig(const ConfigManager &config) {
  TransportSettings settings;

  settings.maxIdleConnections =
      config.getInt("transport.max_idle_connections", 100);
  settings.idleTimeout =
      std::chrono::seconds(config.getInt("transport.idle_timeout_seconds", 30));
  settings.requestTimeout = std::chrono::milliseconds(
      config.getInt("transport.request_timeout_ms", 10000));
  settings.userAgent =
      config.getString("transport.user_agent", "httpload/1.0");

  return settings;
}

ConfigValidationResult TransportSettings::validate() const {
  ConfigValidationResult result;

  if (maxIdleConnections <= 0) {
    result.addError("transport.max_idle_connections must be positive");
  }
  if (idleTimeout.count() <= 0) {
    result.addError("transport.idle_timeout_seconds must be positive");
  }
  if (requestTimeout.count() <= 0) {
    result.addError("transport.request_timeout_ms must be positive");
  }
  if (userAgent.empty()) {
    result.addWarning("transport.user_agent is empty; requests will carry an "
                      "empty User-Agent header");
  }

  return result;
}

bool TransportSettings::operator==(const TransportSettings &other) const {
  return maxIdleConnections == other.maxIdleConnections &&
         idleTimeout == other.idleTimeout &&
         requestTimeout == other.requestTimeout &&
         userAgent == other.userAgent;
}

// ===== ReportSettings =====

ReportSettings ReportSettings::fromConfig(const ConfigManager &config) {
  ReportSettings settings;

  settings.jsonFile = config.getString("report.json_file", "");
  settings.chartHeight = config.getInt("report.chart_height", 10);
  settings.showProgress = config.getBool("report.progress", true);

  return settings;
}

ConfigValidationResult ReportSettings::validate() const {
  ConfigValidationResult result;

  if (chartHeight < 1) {
    result.addError("report.chart_height must be at least 1");
  } else if (chartHeight > 50) {
    result.addWarning("report.chart_height above 50 produces very tall charts");
  }

  return result;
}

bool ReportSettings::operator==(const ReportSettings &other) const {
  return jsonFile == other.jsonFile && chartHeight == other.chartHeight &&
         showProgress == other.showProgress;
}

// ===== LoadTestConfig =====

LoadTestConfig LoadTestConfig::fromConfig(const ConfigManager &config) {
  LoadTestConfig loadConfig;

  loadConfig.url = config.getString("target.url", "http://localhost:8080");
  loadConfig.method = config.getString("target.method", "POST");
  loadConfig.corpusFile = config.getString("target.corpus_file", "");
  loadConfig.concurrency = config.getInt("load.concurrency", 10);
  loadConfig.totalRequests = config.getInt("load.total_requests", 100);
  loadConfig.keepAliveRatio = config.getDouble("load.keepalive_ratio", 0.7);
  loadConfig.reportInterval = std::chrono::milliseconds(
      config.getInt("load.report_interval_ms", 1000));

  int seed = config.getInt("load.seed", -1);
  if (seed >= 0) {
    loadConfig.seed = static_cast<unsigned int>(seed);
  }

  loadConfig.transport = TransportSettings::fromConfig(config);
  loadConfig.report = ReportSettings::fromConfig(config);

  return loadConfig;
}

ConfigValidationResult LoadTestConfig::validate() const {
  ConfigValidationResult result;

  if (url.empty()) {
    result.addError("target.url must not be empty");
  } else if (!hasHttpScheme(url)) {
    result.addWarning("target.url '" + url +
                      "' does not use an http:// or https:// scheme");
  }

  if (method.empty()) {
    result.addError("target.method must not be empty");
  } else {
    for (char c : method) {
      if (!isTokenChar(c)) {
        result.addError("target.method '" + method +
                        "' is not a valid HTTP method token");
        break;
      }
    }
  }

  if (concurrency < 1) {
    result.addError("load.concurrency must be at least 1");
  }
  if (totalRequests < 0) {
    result.addError("load.total_requests must not be negative");
  }
  if (concurrency > 0 && totalRequests >= 0 && concurrency > totalRequests) {
    result.addWarning("load.concurrency (" + std::to_string(concurrency) +
                      ") exceeds load.total_requests (" +
                      std::to_string(totalRequests) +
                      "); some workers will stay idle");
  }
  if (keepAliveRatio < 0.0 || keepAliveRatio > 1.0) {
    result.addError("load.keepalive_ratio must be within [0.0, 1.0]");
  }
  if (reportInterval.count() <= 0) {
    result.addError("load.report_interval_ms must be positive");
  } else if (reportInterval.count() < 100) {
    result.addWarning("load.report_interval_ms below 100 floods the console "
                      "with reports");
  }

  result.merge(transport.validate());
  result.merge(report.validate());

  return result;
}

bool LoadTestConfig::operator==(const LoadTestConfig &other) const {
  return url == other.url && method == other.method &&
         corpusFile == other.corpusFile && concurrency == other.concurrency &&
         totalRequests == other.totalRequests &&
         keepAliveRatio == other.keepAliveRatio &&
         reportInterval == other.reportInterval && seed == other.seed &&
         transport == other.transport && report == other.report;
}

} // namespace httpload
