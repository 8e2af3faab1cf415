#pragma once

#include <chrono>
#include <exception>
#include <sstream>
#include <string>
#include <unordered_map>

namespace httpload {

// Error codes grouped by category
enum class ErrorCode {
    // Validation errors (1000-1999)
    INVALID_INPUT = 1000,
    MISSING_FIELD = 1001,
    INVALID_FORMAT = 1002,
    INVALID_RANGE = 1003,

    // Configuration and IO errors (2000-2999)
    CONFIGURATION_ERROR = 2000,
    CORPUS_FORMAT_ERROR = 2002,

    // Transport and system errors (3000-3999)
    TRANSPORT_INIT_FAILED = 3000,
    INVALID_STATE = 3002,
    WORKER_FAILED = 3003
};

using ErrorContext = std::unordered_map<std::string, std::string>;

const char* getErrorCodeDescription(ErrorCode code);

// Base exception carrying an error code, context and correlation ID
class LoadTestException : public std::exception {
public:
    LoadTestException(ErrorCode code, std::string message, ErrorContext context = {});

    LoadTestException(const LoadTestException& other) = default;
    LoadTestException& operator=(const LoadTestException& other) = default;
    LoadTestException(LoadTestException&& other) noexcept = default;
    LoadTestException& operator=(LoadTestException&& other) noexcept = default;

    virtual ~LoadTestException() = default;

    ErrorCode getCode() const { return errorCode_; }
    const std::string& getMessage() const { return message_; }
    const ErrorContext& getContext() const { return context_; }
    const std::string& getCorrelationId() const { return correlationId_; }
    std::chrono::system_clock::time_point getTimestamp() const { return timestamp_; }

    const char* what() const noexcept override { return message_.c_str(); }

    virtual std::string toLogString() const;

    void addContext(const std::string& key, const std::string& value);

protected:
    ErrorCode errorCode_;
    std::string message_;
    ErrorContext context_;
    std::string correlationId_;
    std::chrono::system_clock::time_point timestamp_;

    static std::string generateCorrelationId();
};

// Invalid configuration values, command line arguments and call arguments
class ValidationException : public LoadTestException {
public:
    ValidationException(ErrorCode code, std::string message,
                        std::string field = "", std::string value = "",
                        ErrorContext context = {});

    const std::string& getField() const { return field_; }
    const std::string& getValue() const { return value_; }

    std::string toLogString() const override;

private:
    std::string field_;
    std::string value_;
};

// Infrastructure failures and misuse of stateful components
class SystemException : public LoadTestException {
public:
    SystemException(ErrorCode code, std::string message,
                    std::string component = "",
                    ErrorContext context = {});

    const std::string& getComponent() const { return component_; }

    std::string toLogString() const override;

private:
    std::string component_;
};

SystemException createSystemError(ErrorCode code,
                                  const std::string& component,
                                  const std::string& details);

} // namespace httpload
