#pragma once

#include "logger.hpp"
#include "transparent_string_hash.hpp"
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace httpload {

// Configuration validation result
struct ConfigValidationResult {
  bool isValid = true;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;

  void addError(const std::string &error) {
    isValid = false;
    errors.push_back(error);
  }

  void addWarning(const std::string &warning) { warnings.push_back(warning); }

  void merge(const ConfigValidationResult &other) {
    isValid = isValid && other.isValid;
    errors.insert(errors.end(), other.errors.begin(), other.errors.end());
    warnings.insert(warnings.end(), other.warnings.begin(),
                    other.warnings.end());
  }
};

/**
 * Layered key/value configuration. A JSON file is flattened into
 * dot-separated keys (`load.concurrency`); command line overrides are
 * applied on top with setValue().
 */
class ConfigManager {
public:
  static ConfigManager &getInstance();

  bool loadConfig(const std::string &configPath);
  bool loadFromString(const std::string &jsonText);
  void setValue(const std::string &key, const std::string &value);
  void clear();

  std::string getString(const std::string &key,
                        const std::string &defaultValue = "") const;
  int getInt(const std::string &key, int defaultValue = 0) const;
  bool getBool(const std::string &key, bool defaultValue = false) const;
  double getDouble(const std::string &key, double defaultValue = 0.0) const;
  StringSet getStringSet(const std::string &key) const;

  LogConfig getLoggingConfig() const;

private:
  ConfigManager() = default;

  StringMap<std::string> configData;
  mutable std::mutex dataMutex_;

  bool applyJson(const nlohmann::json &jsonConfig);
  void flattenJson(const nlohmann::json &json, const std::string &prefix,
                   int currentDepth, int maxDepth);
  std::optional<std::string> lookup(const std::string &key) const;
};

} // namespace httpload
