#pragma once

#include "job_registry.hpp"
#include "logger.hpp"
#include <chrono>
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace autoflow {

class ConfigManager;

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

// Scheduler loop tuning
struct SchedulerConfig {
  std::chrono::milliseconds tickInterval{1000};
  int errorBackoffMultiplier = 5;
  std::chrono::milliseconds stopTimeout{5000};
  std::chrono::milliseconds lockTimeout{1000};
  ReenablePolicy reenablePolicy = ReenablePolicy::RESUME_SCHEDULE;

  static SchedulerConfig fromConfig(const ConfigManager &config);
  ConfigValidationResult validate() const;
  bool operator==(const SchedulerConfig &other) const;
};

class ConfigManager {
public:
  static ConfigManager &getInstance();

  bool loadConfig(const std::string &configPath);
  bool loadFromString(const std::string &jsonText);
  bool reloadConfiguration();

  std::string getString(const std::string &key,
                        const std::string &defaultValue = "") const;
  int getInt(const std::string &key, int defaultValue = 0) const;
  bool getBool(const std::string &key, bool defaultValue = false) const;
  double getDouble(const std::string &key, double defaultValue = 0.0) const;
  std::unordered_set<std::string> getStringSet(const std::string &key) const;
  bool hasKey(const std::string &key) const;

  LogConfig getLoggingConfig() const;
  SchedulerConfig getSchedulerConfig() const;

  // Checks the scheduler section and the workflows array
  ConfigValidationResult validateConfiguration() const;

  // Raw JSON as loaded, used for structured sections such as "workflows"
  nlohmann::json getJsonConfig() const;

  // Configuration access with validation
  template <typename T>
  T getValidatedValue(
      const std::string &key, const T &defaultValue,
      const std::function<bool(const T &)> &validator = nullptr) const;

private:
  ConfigManager() = default;

  mutable std::recursive_mutex configMutex_;
  std::unordered_map<std::string, std::string> configData_;
  std::string configFilePath_;
  nlohmann::json rawConfig_ = nlohmann::json::object();

  bool applyJson(const nlohmann::json &jsonConfig);
  void flattenJson(const nlohmann::json &json, const std::string &prefix,
                   int currentDepth, int maxDepth);
};

/**
 * @brief Retrieve a typed configuration value with optional validation.
 *
 * Supported types are std::string, int, bool and double. When the key is
 * absent, or the validator rejects the stored value, @p defaultValue is
 * returned.
 */
template <typename T>
T ConfigManager::getValidatedValue(
    const std::string &key, const T &defaultValue,
    const std::function<bool(const T &)> &validator) const {
  T value;

  if constexpr (std::is_same_v<T, std::string>) {
    value = getString(key, defaultValue);
  } else if constexpr (std::is_same_v<T, int>) {
    value = getInt(key, defaultValue);
  } else if constexpr (std::is_same_v<T, bool>) {
    value = getBool(key, defaultValue);
  } else if constexpr (std::is_same_v<T, double>) {
    value = getDouble(key, defaultValue);
  } else {
    static_assert(std::is_same_v<T, std::string> || std::is_same_v<T, int> ||
                      std::is_same_v<T, bool> || std::is_same_v<T, double>,
                  "Unsupported type for getValidatedValue");
    return defaultValue;
  }

  if (validator && !validator(value)) {
    return defaultValue;
  }

  return value;
}

} // namespace autoflow
