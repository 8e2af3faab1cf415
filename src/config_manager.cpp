#include "config_manager.hpp"
#include "logger.hpp"
#include <algorithm>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace httpload {

ConfigManager &ConfigManager::getInstance() {
  static ConfigManager instance;
  return instance;
}

bool ConfigManager::loadConfig(const std::string &configPath) {
  std::ifstream file(configPath);
  if (!file.is_open()) {
    CONFIG_LOG_ERROR("Cannot open config file: {}", configPath);
    return false;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  if (!loadFromString(buffer.str())) {
    CONFIG_LOG_ERROR("Rejected config file {}", configPath);
    return false;
  }
  return true;
}

bool ConfigManager::loadFromString(const std::string &jsonText) {
  nlohmann::json jsonConfig;
  try {
    jsonConfig = nlohmann::json::parse(jsonText);
  } catch (const nlohmann::json::exception &e) {
    CONFIG_LOG_ERROR("Failed to parse JSON configuration: {}", e.what());
    return false;
  }

  if (!applyJson(jsonConfig)) {
    CONFIG_LOG_ERROR("Configuration root must be a JSON object");
    return false;
  }

  std::lock_guard<std::mutex> lock(dataMutex_);
  CONFIG_LOG_INFO("Configuration loaded successfully with {} parameters",
                  configData.size());
  return true;
}

bool ConfigManager::applyJson(const nlohmann::json &jsonConfig) {
  if (!jsonConfig.is_object()) {
    return false;
  }

  std::lock_guard<std::mutex> lock(dataMutex_);
  configData.clear();
  flattenJson(jsonConfig, "", 0, 32);
  return true;
}

void ConfigManager::setValue(const std::string &key, const std::string &value) {
  std::lock_guard<std::mutex> lock(dataMutex_);
  configData[key] = value;
}

void ConfigManager::clear() {
  std::lock_guard<std::mutex> lock(dataMutex_);
  configData.clear();
}

std::optional<std::string> ConfigManager::lookup(const std::string &key) const {
  std::lock_guard<std::mutex> lock(dataMutex_);
  if (auto it = configData.find(key); it != configData.end()) {
    return it->second;
  }
  return std::nullopt;
}

std::string ConfigManager::getString(const std::string &key,
                                     const std::string &defaultValue) const {
  return lookup(key).value_or(defaultValue);
}

int ConfigManager::getInt(const std::string &key, int defaultValue) const {
  if (auto value = lookup(key)) {
    try {
      size_t consumed = 0;
      int parsed = std::stoi(*value, &consumed);
      if (consumed == value->size()) {
        return parsed;
      }
      CONFIG_LOG_WARN("Ignoring non-integer value '{}' for {}", *value, key);
    } catch (const std::invalid_argument &) {
      CONFIG_LOG_WARN("Ignoring non-integer value '{}' for {}", *value, key);
    } catch (const std::out_of_range &) {
      CONFIG_LOG_WARN("Integer value '{}' for {} is out of range", *value, key);
    }
  }
  return defaultValue;
}

bool ConfigManager::getBool(const std::string &key, bool defaultValue) const {
  if (auto raw = lookup(key)) {
    std::string value = *raw;
    std::transform(value.begin(), value.end(), value.begin(), ::tolower);
    return value == "true" || value == "1" || value == "yes" || value == "on";
  }
  return defaultValue;
}

double ConfigManager::getDouble(const std::string &key,
                                double defaultValue) const {
  if (auto value = lookup(key)) {
    try {
      size_t consumed = 0;
      double parsed = std::stod(*value, &consumed);
      if (consumed == value->size()) {
        return parsed;
      }
      CONFIG_LOG_WARN("Ignoring non-numeric value '{}' for {}", *value, key);
    } catch (const std::invalid_argument &) {
      CONFIG_LOG_WARN("Ignoring non-numeric value '{}' for {}", *value, key);
    } catch (const std::out_of_range &) {
      CONFIG_LOG_WARN("Numeric value '{}' for {} is out of range", *value, key);
    }
  }
  return defaultValue;
}

StringSet ConfigManager::getStringSet(const std::string &key) const {
  StringSet result;
  auto rawValue = lookup(key);
  if (!rawValue) {
    return result;
  }

  const std::string &raw = *rawValue;
  if (!raw.empty() && raw.front() == '[') {
    try {
      auto arr = nlohmann::json::parse(raw);
      if (arr.is_array()) {
        for (const auto &v : arr) {
          if (v.is_string())
            result.insert(v.get<std::string>());
        }
        return result;
      }
    } catch (const nlohmann::json::exception &) {
      // fall through to CSV parsing
    }
  }

  std::string value = raw;
  if (!value.empty() && value.front() == '[' && value.back() == ']') {
    value = value.substr(1, value.length() - 2);
  }
  std::stringstream ss(value);
  std::string item;
  while (std::getline(ss, item, ',')) {
    item.erase(0, item.find_first_not_of(" \t\""));
    item.erase(item.find_last_not_of(" \t\"") + 1);
    if (!item.empty())
      result.insert(item);
  }
  return result;
}

LogConfig ConfigManager::getLoggingConfig() const {
  LogConfig config;

  config.level = Logger::parseLevel(getString("logging.level", "INFO"));
  config.format = Logger::parseFormat(getString("logging.format", "TEXT"));
  config.consoleOutput = getBool("logging.console_output", true);
  config.fileOutput = getBool("logging.file_output", false);
  config.asyncLogging = getBool("logging.async_logging", false);
  config.logFile = getString("logging.log_file", "logs/httpload.log");
  config.maxFileSize =
      static_cast<size_t>(getInt("logging.max_file_size", 10485760));
  config.maxBackupFiles = getInt("logging.max_backup_files", 5);
  config.enableRotation = getBool("logging.enable_rotation", true);
  config.componentFilter = getStringSet("logging.component_filter");

  return config;
}

void ConfigManager::flattenJson(const nlohmann::json &json,
                                const std::string &prefix, int currentDepth,
                                int maxDepth) {
  if (currentDepth >= maxDepth) {
    configData[prefix.empty() ? "deep_nested" : prefix + ".deep_nested"] =
        json.dump();
    return;
  }

  for (auto it = json.begin(); it != json.end(); ++it) {
    std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();

    if (it->is_object()) {
      flattenJson(*it, key, currentDepth + 1, maxDepth);
    } else if (it->is_array()) {
      configData[key] = it->dump();
    } else if (it->is_string()) {
      configData[key] = it->get<std::string>();
    } else if (it->is_number_integer()) {
      configData[key] = std::to_string(it->get<long long>());
    } else if (it->is_boolean()) {
      configData[key] = it->get<bool>() ? "true" : "false";
    } else {
      configData[key] = it->dump();
    }
  }
}

} // namespace httpload
