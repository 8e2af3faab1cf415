#include "httpload_exceptions.hpp"
#include <iomanip>
#include <random>
#include <sstream>

namespace httpload {

const char* getErrorCodeDescription(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_INPUT: return "Invalid input provided";
        case ErrorCode::MISSING_FIELD: return "Required field is missing";
        case ErrorCode::INVALID_FORMAT: return "Invalid data format";
        case ErrorCode::INVALID_RANGE: return "Value out of valid range";
        case ErrorCode::CONFIGURATION_ERROR: return "Configuration error";
        case ErrorCode::CORPUS_FORMAT_ERROR: return "Unsupported request corpus format";
        case ErrorCode::TRANSPORT_INIT_FAILED: return "HTTP transport initialisation failed";
        case ErrorCode::INVALID_STATE: return "Operation not valid in current state";
        case ErrorCode::WORKER_FAILED: return "Worker thread terminated abnormally";
    }
    return "Unknown error";
}

std::string LoadTestException::generateCorrelationId() {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    for (int i = 0; i < 8; ++i) {
        ss << std::hex << dis(gen);
    }
    return ss.str();
}

LoadTestException::LoadTestException(ErrorCode code, std::string message, ErrorContext context)
    : errorCode_(code), message_(std::move(message)), context_(std::move(context)),
      correlationId_(generateCorrelationId()), timestamp_(std::chrono::system_clock::now()) {
}

std::string LoadTestException::toLogString() const {
    std::stringstream ss;
    ss << "[" << correlationId_ << "] "
       << "ErrorCode=" << static_cast<int>(errorCode_) << " "
       << "Message=\"" << message_ << "\"";

    if (!context_.empty()) {
        ss << " Context={";
        bool first = true;
        for (const auto& [key, value] : context_) {
            if (!first) ss << ", ";
            ss << key << "=\"" << value << "\"";
            first = false;
        }
        ss << "}";
    }

    return ss.str();
}

void LoadTestException::addContext(const std::string& key, const std::string& value) {
    context_[key] = value;
}

ValidationException::ValidationException(ErrorCode code, std::string message,
                                         std::string field, std::string value,
                                         ErrorContext context)
    : LoadTestException(code, std::move(message), std::move(context)),
      field_(std::move(field)), value_(std::move(value)) {
    if (!field_.empty()) {
        addContext("field", field_);
    }
    if (!value_.empty()) {
        addContext("value", value_);
    }
}

std::string ValidationException::toLogString() const {
    std::stringstream ss;
    ss << "[VALIDATION] " << LoadTestException::toLogString();
    if (!field_.empty()) {
        ss << " Field=\"" << field_ << "\"";
    }
    return ss.str();
}

SystemException::SystemException(ErrorCode code, std::string message,
                                 std::string component, ErrorContext context)
    : LoadTestException(code, std::move(message), std::move(context)),
      component_(std::move(component)) {
    if (!component_.empty()) {
        addContext("component", component_);
    }
}

std::string SystemException::toLogString() const {
    std::stringstream ss;
    ss << "[SYSTEM] " << LoadTestException::toLogString();
    if (!component_.empty()) {
        ss << " Component=\"" << component_ << "\"";
    }
    return ss.str();
}

SystemException createSystemError(ErrorCode code,
                                  const std::string& component,
                                  const std::string& details) {
    ErrorContext context;
    context["details"] = details;
    return SystemException(code, getErrorCodeDescription(code), component, context);
}

} // namespace httpload
