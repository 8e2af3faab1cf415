#pragma once

#include "transparent_string_hash.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <condition_variable>
#include <fstream>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace httpload {

enum class LogLevel { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3, FATAL = 4 };

enum class LogFormat { TEXT = 0, JSON = 1 };

struct LogConfig {
  LogLevel level = LogLevel::INFO;
  LogFormat format = LogFormat::TEXT;
  bool consoleOutput = true;
  bool fileOutput = false;
  bool asyncLogging = false;
  std::string logFile = "logs/httpload.log";
  size_t maxFileSize = 10 * 1024 * 1024; // 10MB
  int maxBackupFiles = 5;
  bool enableRotation = true;
  StringSet componentFilter; // Empty = all components
};

struct LogMetrics {
  std::atomic<uint64_t> totalMessages{0};
  std::atomic<uint64_t> errorCount{0};
  std::atomic<uint64_t> warningCount{0};
  std::atomic<uint64_t> droppedMessages{0};
  std::chrono::steady_clock::time_point startTime;

  LogMetrics() : startTime(std::chrono::steady_clock::now()) {}

  LogMetrics(const LogMetrics &other)
      : totalMessages(other.totalMessages.load()),
        errorCount(other.errorCount.load()),
        warningCount(other.warningCount.load()),
        droppedMessages(other.droppedMessages.load()),
        startTime(other.startTime) {}

  LogMetrics &operator=(const LogMetrics &other) {
    if (this != &other) {
      totalMessages.store(other.totalMessages.load());
      errorCount.store(other.errorCount.load());
      warningCount.store(other.warningCount.load());
      droppedMessages.store(other.droppedMessages.load());
      startTime = other.startTime;
    }
    return *this;
  }
};

/**
 * Process-wide logger. Console lines go to stderr so that stdout stays
 * reserved for the load report.
 */
class Logger {
public:
  static Logger &getInstance();

  void configure(const LogConfig &config);

  bool isEnabled(LogLevel level, const std::string &component) const;

  void log(LogLevel level, const std::string &component,
           const std::string &message, const LogContext &context = {});
  void debug(const std::string &component, const std::string &message,
             const LogContext &context = {});
  void info(const std::string &component, const std::string &message,
            const LogContext &context = {});
  void warn(const std::string &component, const std::string &message,
            const LogContext &context = {});
  void error(const std::string &component, const std::string &message,
             const LogContext &context = {});
  void fatal(const std::string &component, const std::string &message,
             const LogContext &context = {});

  LogMetrics getMetrics() const;

  void flush();
  void shutdown();

  static LogLevel parseLevel(const std::string &levelStr);
  static LogFormat parseFormat(const std::string &formatStr);

private:
  Logger() = default;
  ~Logger();

  LogConfig config_;
  mutable std::mutex configMutex_;

  std::ofstream fileStream_;
  std::string currentLogFile_;
  size_t currentFileSize_ = 0;
  mutable std::mutex fileMutex_;
  std::mutex consoleMutex_;

  std::queue<std::string> messageQueue_;
  std::thread asyncThread_;
  std::condition_variable asyncCondition_;
  std::mutex asyncMutex_;
  std::atomic<bool> stopAsync_{false};
  std::atomic<bool> asyncStarted_{false};

  LogMetrics metrics_;

  std::string formatTimestamp() const;
  static std::string levelToString(LogLevel level);
  std::string formatMessage(LogFormat format, LogLevel level,
                            const std::string &component,
                            const std::string &message,
                            const LogContext &context) const;
  std::string formatTextMessage(LogLevel level, const std::string &component,
                                const std::string &message,
                                const LogContext &context) const;
  std::string formatJsonMessage(LogLevel level, const std::string &component,
                                const std::string &message,
                                const LogContext &context) const;
  void openLogFile(const std::string &filename);
  void writeLogSync(const std::string &formattedMessage);
  void writeLogAsync(const std::string &formattedMessage);
  void startAsyncWorker();
  void stopAsyncWorker();
  void asyncWorker();
  void rotateLogFile(int maxBackupFiles);
  bool shouldLog(LogLevel level, const std::string &component) const;
  static std::string escapeJson(const std::string &str);
};

} // namespace httpload

#define LOG_DEBUG(component, message, ...)                                     \
  httpload::Logger::getInstance().debug(component, message, ##__VA_ARGS__)
#define LOG_INFO(component, message, ...)                                      \
  httpload::Logger::getInstance().info(component, message, ##__VA_ARGS__)
#define LOG_WARN(component, message, ...)                                      \
  httpload::Logger::getInstance().warn(component, message, ##__VA_ARGS__)
#define LOG_ERROR(component, message, ...)                                     \
  httpload::Logger::getInstance().error(component, message, ##__VA_ARGS__)
#define LOG_FATAL(component, message, ...)                                     \
  httpload::Logger::getInstance().fatal(component, message, ##__VA_ARGS__)

#include "component_logger.hpp"

#define CONFIG_LOG_DEBUG(message, ...)                                         \
  httpload::ConfigLogger::debug(message, ##__VA_ARGS__)
#define CONFIG_LOG_INFO(message, ...)                                          \
  httpload::ConfigLogger::info(message, ##__VA_ARGS__)
#define CONFIG_LOG_WARN(message, ...)                                          \
  httpload::ConfigLogger::warn(message, ##__VA_ARGS__)
#define CONFIG_LOG_ERROR(message, ...)                                         \
  httpload::ConfigLogger::error(message, ##__VA_ARGS__)

#define CORPUS_LOG_DEBUG(message, ...)                                         \
  httpload::CorpusLogger::debug(message, ##__VA_ARGS__)
#define CORPUS_LOG_INFO(message, ...)                                          \
  httpload::CorpusLogger::info(message, ##__VA_ARGS__)
#define CORPUS_LOG_WARN(message, ...)                                          \
  httpload::CorpusLogger::warn(message, ##__VA_ARGS__)
#define CORPUS_LOG_ERROR(message, ...)                                         \
  httpload::CorpusLogger::error(message, ##__VA_ARGS__)

#define TRANSPORT_LOG_DEBUG(message, ...)                                      \
  httpload::TransportLogger::debug(message, ##__VA_ARGS__)
#define TRANSPORT_LOG_INFO(message, ...)                                       \
  httpload::TransportLogger::info(message, ##__VA_ARGS__)
#define TRANSPORT_LOG_WARN(message, ...)                                       \
  httpload::TransportLogger::warn(message, ##__VA_ARGS__)
#define TRANSPORT_LOG_ERROR(message, ...)                                      \
  httpload::TransportLogger::error(message, ##__VA_ARGS__)

#define WORKER_LOG_DEBUG(message, ...)                                         \
  httpload::WorkerLogger::debug(message, ##__VA_ARGS__)
#define WORKER_LOG_INFO(message, ...)                                          \
  httpload::WorkerLogger::info(message, ##__VA_ARGS__)
#define WORKER_LOG_WARN(message, ...)                                          \
  httpload::WorkerLogger::warn(message, ##__VA_ARGS__)
#define WORKER_LOG_ERROR(message, ...)                                         \
  httpload::WorkerLogger::error(message, ##__VA_ARGS__)

#define TREND_LOG_DEBUG(message, ...)                                          \
  httpload::TrendLogger::debug(message, ##__VA_ARGS__)
#define TREND_LOG_INFO(message, ...)                                           \
  httpload::TrendLogger::info(message, ##__VA_ARGS__)
#define TREND_LOG_WARN(message, ...)                                           \
  httpload::TrendLogger::warn(message, ##__VA_ARGS__)
#define TREND_LOG_ERROR(message, ...)                                          \
  httpload::TrendLogger::error(message, ##__VA_ARGS__)

#define RUNNER_LOG_DEBUG(message, ...)                                         \
  httpload::RunnerLogger::debug(message, ##__VA_ARGS__)
#define RUNNER_LOG_INFO(message, ...)                                          \
  httpload::RunnerLogger::info(message, ##__VA_ARGS__)
#define RUNNER_LOG_WARN(message, ...)                                          \
  httpload::RunnerLogger::warn(message, ##__VA_ARGS__)
#define RUNNER_LOG_ERROR(message, ...)                                         \
  httpload::RunnerLogger::error(message, ##__VA_ARGS__)

#define REPORT_LOG_DEBUG(message, ...)                                         \
  httpload::ReportLogger::debug(message, ##__VA_ARGS__)
#define REPORT_LOG_INFO(message, ...)                                          \
  httpload::ReportLogger::info(message, ##__VA_ARGS__)
#define REPORT_LOG_WARN(message, ...)                                          \
  httpload::ReportLogger::warn(message, ##__VA_ARGS__)
#define REPORT_LOG_ERROR(message, ...)                                         \
  httpload::ReportLogger::error(message, ##__VA_ARGS__)
