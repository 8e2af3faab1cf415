#include "logger.hpp"
#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace httpload {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    shutdown();
}

void Logger::configure(const LogConfig& config) {
    bool wantAsync = false;
    {
        std::lock_guard<std::mutex> lock(configMutex_);
        config_ = config;
        wantAsync = config_.asyncLogging;

        std::lock_guard<std::mutex> fileLock(fileMutex_);
        if (fileStream_.is_open()) {
            fileStream_.close();
        }
        if (config_.fileOutput) {
            openLogFile(config_.logFile);
            if (!fileStream_.is_open()) {
                config_.fileOutput = false;
            }
        }
    }

    if (wantAsync) {
        startAsyncWorker();
    } else {
        stopAsyncWorker();
    }
}

bool Logger::isEnabled(LogLevel level, const std::string& component) const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return shouldLog(level, component);
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message,
                 const LogContext& context) {
    std::string formattedMessage;
    bool async = false;
    {
        std::lock_guard<std::mutex> lock(configMutex_);
        if (!shouldLog(level, component)) {
            return;
        }
        formattedMessage = formatMessage(config_.format, level, component, message, context);
        async = config_.asyncLogging && asyncStarted_;
    }

    metrics_.totalMessages++;
    if (level == LogLevel::ERROR || level == LogLevel::FATAL) {
        metrics_.errorCount++;
    } else if (level == LogLevel::WARN) {
        metrics_.warningCount++;
    }

    if (async) {
        writeLogAsync(formattedMessage);
    } else {
        writeLogSync(formattedMessage);
    }
}

void Logger::debug(const std::string& component, const std::string& message,
                   const LogContext& context) {
    log(LogLevel::DEBUG, component, message, context);
}

void Logger::info(const std::string& component, const std::string& message,
                  const LogContext& context) {
    log(LogLevel::INFO, component, message, context);
}

void Logger::warn(const std::string& component, const std::string& message,
                  const LogContext& context) {
    log(LogLevel::WARN, component, message, context);
}

void Logger::error(const std::string& component, const std::string& message,
                   const LogContext& context) {
    log(LogLevel::ERROR, component, message, context);
}

void Logger::fatal(const std::string& component, const std::string& message,
                   const LogContext& context) {
    log(LogLevel::FATAL, component, message, context);
}

LogMetrics Logger::getMetrics() const {
    return metrics_;
}

void Logger::flush() {
    if (asyncStarted_) {
        std::lock_guard<std::mutex> lock(asyncMutex_);
        asyncCondition_.notify_all();
    }

    std::cerr.flush();
    std::lock_guard<std::mutex> lock(fileMutex_);
    if (fileStream_.is_open()) {
        fileStream_.flush();
    }
}

void Logger::shutdown() {
    stopAsyncWorker();

    std::lock_guard<std::mutex> lock(fileMutex_);
    if (fileStream_.is_open()) {
        fileStream_.close();
    }
}

LogLevel Logger::parseLevel(const std::string& levelStr) {
    std::string level = levelStr;
    std::transform(level.begin(), level.end(), level.begin(), ::toupper);

    if (level == "DEBUG")
        return LogLevel::DEBUG;
    if (level == "INFO")
        return LogLevel::INFO;
    if (level == "WARN" || level == "WARNING")
        return LogLevel::WARN;
    if (level == "ERROR")
        return LogLevel::ERROR;
    if (level == "FATAL")
        return LogLevel::FATAL;

    return LogLevel::INFO;
}

LogFormat Logger::parseFormat(const std::string& formatStr) {
    std::string format = formatStr;
    std::transform(format.begin(), format.end(), format.begin(), ::toupper);

    if (format == "JSON")
        return LogFormat::JSON;
    return LogFormat::TEXT;
}

std::string Logger::formatTimestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm localTime{};
    localtime_r(&time_t, &localTime);

    std::ostringstream oss;
    oss << std::put_time(&localTime, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "UNKNOWN";
    }
}

std::string Logger::formatMessage(LogFormat format, LogLevel level, const std::string& component,
                                  const std::string& message,
                                  const LogContext& context) const {
    return format == LogFormat::JSON
        ? formatJsonMessage(level, component, message, context)
        : formatTextMessage(level, component, message, context);
}

std::string Logger::formatTextMessage(LogLevel level, const std::string& component,
                                      const std::string& message,
                                      const LogContext& context) const {
    std::ostringstream oss;
    oss << "[" << formatTimestamp() << "] "
        << "[" << levelToString(level) << "] "
        << "[" << component << "] "
        << message;

    if (!context.empty()) {
        oss << " |";
        for (const auto& [key, value] : context) {
            oss << " " << key << "=" << value;
        }
    }

    return oss.str();
}

std::string Logger::formatJsonMessage(LogLevel level, const std::string& component,
                                      const std::string& message,
                                      const LogContext& context) const {
    std::string levelName = levelToString(level);
    levelName.erase(levelName.find_last_not_of(' ') + 1);

    std::ostringstream oss;
    oss << "{"
        << "\"timestamp\":\"" << formatTimestamp() << "\","
        << "\"level\":\"" << levelName << "\","
        << "\"component\":\"" << escapeJson(component) << "\","
        << "\"message\":\"" << escapeJson(message) << "\"";

    if (!context.empty()) {
        oss << ",\"context\":{";
        bool first = true;
        for (const auto& [key, value] : context) {
            if (!first) oss << ",";
            oss << "\"" << escapeJson(key) << "\":\"" << escapeJson(value) << "\"";
            first = false;
        }
        oss << "}";
    }

    oss << "}";
    return oss.str();
}

std::string Logger::escapeJson(const std::string& str) {
    std::string result;
    result.reserve(str.length() + 20);

    for (char c : str) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    std::ostringstream oss;
                    oss << "\\u" << std::setfill('0') << std::setw(4) << std::hex << static_cast<int>(c);
                    result += oss.str();
                } else {
                    result += c;
                }
                break;
        }
    }

    return result;
}

void Logger::openLogFile(const std::string& filename) {
    currentLogFile_ = filename;

    std::filesystem::path logPath(filename);
    std::error_code ec;
    if (logPath.has_parent_path()) {
        std::filesystem::create_directories(logPath.parent_path(), ec);
    }

    fileStream_.open(currentLogFile_, std::ios::app);
    if (!fileStream_.is_open()) {
        std::cerr << "Failed to open log file: " << filename << std::endl;
        return;
    }

    currentFileSize_ = std::filesystem::exists(currentLogFile_, ec)
        ? static_cast<size_t>(std::filesystem::file_size(currentLogFile_, ec))
        : 0;
}

void Logger::writeLogSync(const std::string& formattedMessage) {
    bool console = false;
    bool file = false;
    bool rotate = false;
    size_t maxFileSize = 0;
    int maxBackupFiles = 0;
    {
        std::lock_guard<std::mutex> lock(configMutex_);
        console = config_.consoleOutput;
        file = config_.fileOutput;
        rotate = config_.enableRotation;
        maxFileSize = config_.maxFileSize;
        maxBackupFiles = config_.maxBackupFiles;
    }

    if (console) {
        std::lock_guard<std::mutex> lock(consoleMutex_);
        std::cerr << formattedMessage << '\n';
    }

    if (file) {
        std::lock_guard<std::mutex> lock(fileMutex_);
        if (fileStream_.is_open()) {
            if (rotate && currentFileSize_ + formattedMessage.length() > maxFileSize) {
                rotateLogFile(maxBackupFiles);
            }

            if (fileStream_.is_open()) {
                fileStream_ << formattedMessage << '\n';
                fileStream_.flush();
                currentFileSize_ += formattedMessage.length() + 1;
            }
        }
    }
}

void Logger::writeLogAsync(const std::string& formattedMessage) {
    std::lock_guard<std::mutex> lock(asyncMutex_);

    if (messageQueue_.size() > 10000) {
        metrics_.droppedMessages++;
        return;
    }

    messageQueue_.push(formattedMessage);
    asyncCondition_.notify_one();
}

void Logger::startAsyncWorker() {
    bool expected = false;
    if (!asyncStarted_.compare_exchange_strong(expected, true)) {
        return;
    }
    stopAsync_ = false;
    asyncThread_ = std::thread(&Logger::asyncWorker, this);
}

void Logger::stopAsyncWorker() {
    if (!asyncStarted_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(asyncMutex_);
        stopAsync_ = true;
    }
    asyncCondition_.notify_all();
    if (asyncThread_.joinable()) {
        asyncThread_.join();
    }
    asyncStarted_ = false;
}

void Logger::asyncWorker() {
    std::unique_lock<std::mutex> lock(asyncMutex_);
    while (true) {
        asyncCondition_.wait(lock, [this] {
            return !messageQueue_.empty() || stopAsync_;
        });

        while (!messageQueue_.empty()) {
            std::string message = std::move(messageQueue_.front());
            messageQueue_.pop();
            lock.unlock();

            writeLogSync(message);

            lock.lock();
        }

        if (stopAsync_) {
            break;
        }
    }
}

void Logger::rotateLogFile(int maxBackupFiles) {
    fileStream_.close();

    std::error_code ec;
    for (int i = maxBackupFiles - 1; i > 0; i--) {
        std::string oldFile = currentLogFile_ + "." + std::to_string(i);
        std::string newFile = currentLogFile_ + "." + std::to_string(i + 1);

        if (std::filesystem::exists(oldFile, ec)) {
            if (i == maxBackupFiles - 1) {
                std::filesystem::remove(newFile, ec);
            }
            std::filesystem::rename(oldFile, newFile, ec);
        }
    }

    if (maxBackupFiles > 0 && std::filesystem::exists(currentLogFile_, ec)) {
        std::filesystem::rename(currentLogFile_, currentLogFile_ + ".1", ec);
    }

    fileStream_.open(currentLogFile_, std::ios::out | std::ios::trunc);
    currentFileSize_ = 0;

    if (!fileStream_.is_open()) {
        std::cerr << "Failed to create new log file after rotation: " << currentLogFile_ << std::endl;
    }
}

bool Logger::shouldLog(LogLevel level, const std::string& component) const {
    if (level < config_.level) {
        return false;
    }

    if (!config_.componentFilter.empty() &&
        config_.componentFilter.find(component) == config_.componentFilter.end()) {
        return false;
    }

    return true;
}

} // namespace httpload
