#pragma once

#include "logger.hpp"
#include "transparent_string_hash.hpp"
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

namespace httpload {

template <typename Component> struct ComponentTrait;

template <> struct ComponentTrait<class ConfigManager> {
  static constexpr const char *name = "ConfigManager";
};

template <> struct ComponentTrait<class RequestCorpus> {
  static constexpr const char *name = "RequestCorpus";
};

template <> struct ComponentTrait<class TransportPool> {
  static constexpr const char *name = "TransportPool";
};

template <> struct ComponentTrait<class Worker> {
  static constexpr const char *name = "Worker";
};

template <> struct ComponentTrait<class TrendRecorder> {
  static constexpr const char *name = "TrendRecorder";
};

template <> struct ComponentTrait<class LoadRunner> {
  static constexpr const char *name = "LoadRunner";
};

template <> struct ComponentTrait<class ReportSink> {
  static constexpr const char *name = "Report";
};

/**
 * ComponentLogger - logging front end with the component name resolved at
 * compile time through ComponentTrait.
 *
 * Messages accept `{}` placeholders that are replaced, in order, by the
 * trailing arguments.
 */
template <typename Component> class ComponentLogger {
private:
  static_assert(std::is_class_v<Component>, "Component must be a class type");

  static constexpr const char *component_name = ComponentTrait<Component>::name;

  static Logger &getLogger() { return Logger::getInstance(); }

public:
  template <typename... Args>
  static void debug(const std::string &message, Args &&...args) {
    emit(LogLevel::DEBUG, message, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void info(const std::string &message, Args &&...args) {
    emit(LogLevel::INFO, message, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void warn(const std::string &message, Args &&...args) {
    emit(LogLevel::WARN, message, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void error(const std::string &message, Args &&...args) {
    emit(LogLevel::ERROR, message, std::forward<Args>(args)...);
  }

  static constexpr const char *getComponentName() { return component_name; }

  template <typename... Args>
  static std::string format_message(const std::string &format,
                                    Args &&...args) {
    std::stringstream ss;
    format_impl(ss, format, std::forward<Args>(args)...);
    return ss.str();
  }

private:
  template <typename... Args>
  static void emit(LogLevel level, const std::string &message, Args &&...args) {
    if constexpr (sizeof...(args) > 0) {
      // Skip formatting for filtered messages.
      if (!getLogger().isEnabled(level, component_name)) {
        return;
      }
      getLogger().log(level, component_name,
                      format_message(message, std::forward<Args>(args)...));
    } else {
      getLogger().log(level, component_name, message);
    }
  }

  template <typename T>
  static void stream_value(std::stringstream &ss, T &&value) {
    if constexpr (std::is_arithmetic_v<std::decay_t<T>> ||
                  std::is_convertible_v<T, std::string>) {
      ss << std::forward<T>(value);
    } else {
      ss << "[object]";
    }
  }

  template <typename T, typename... Args>
  static void format_impl(std::stringstream &ss, const std::string &format,
                          T &&arg, Args &&...args) {
    size_t pos = format.find("{}");
    if (pos != std::string::npos) {
      ss << format.substr(0, pos);
      stream_value(ss, std::forward<T>(arg));
      if constexpr (sizeof...(args) > 0) {
        format_impl(ss, format.substr(pos + 2), std::forward<Args>(args)...);
      } else {
        ss << format.substr(pos + 2);
      }
    } else {
      ss << format;
    }
  }

  static void format_impl(std::stringstream &ss, const std::string &format) {
    ss << format;
  }
};

using ConfigLogger = ComponentLogger<class ConfigManager>;
using CorpusLogger = ComponentLogger<class RequestCorpus>;
using TransportLogger = ComponentLogger<class TransportPool>;
using WorkerLogger = ComponentLogger<class Worker>;
using TrendLogger = ComponentLogger<class TrendRecorder>;
using RunnerLogger = ComponentLogger<class LoadRunner>;
using ReportLogger = ComponentLogger<class ReportSink>;

} // namespace httpload
