#include "config_manager.hpp"
#include "component_logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace autoflow {

namespace {

const std::unordered_set<std::string> kWorkflowTypes = {
    "email_processing", "crm_followups", "lead_ingestion", "business_hours"};

} // namespace

ConfigManager &ConfigManager::getInstance() {
  static ConfigManager instance;
  return instance;
}

bool ConfigManager::loadConfig(const std::string &configPath) {
  std::scoped_lock lock(configMutex_);
  CONFIG_LOG_INFO("Loading configuration from: {}", configPath);

  std::ifstream file(configPath);
  if (!file.is_open()) {
    CONFIG_LOG_ERROR("Cannot open config file: {}", configPath);
    return false;
  }

  try {
    nlohmann::json jsonConfig;
    file >> jsonConfig;
    if (!applyJson(jsonConfig)) {
      CONFIG_LOG_ERROR("Configuration root must be a JSON object: {}",
                       configPath);
      return false;
    }
  } catch (const nlohmann::json::exception &e) {
    CONFIG_LOG_ERROR("Failed to parse JSON config file {}: {}", configPath,
                     e.what());
    return false;
  }

  configFilePath_ = configPath;
  CONFIG_LOG_INFO("Configuration loaded successfully with {} parameters",
                  configData_.size());
  return true;
}

bool ConfigManager::loadFromString(const std::string &jsonText) {
  std::scoped_lock lock(configMutex_);
  try {
    return applyJson(nlohmann::json::parse(jsonText));
  } catch (const nlohmann::json::exception &e) {
    CONFIG_LOG_ERROR("Failed to parse JSON configuration: {}", e.what());
    return false;
  }
}

bool ConfigManager::reloadConfiguration() {
  std::string path;
  {
    std::scoped_lock lock(configMutex_);
    path = configFilePath_;
  }
  if (path.empty()) {
    CONFIG_LOG_WARN("No configuration file loaded, nothing to reload");
    return false;
  }
  return loadConfig(path);
}

std::string ConfigManager::getString(const std::string &key,
                                     const std::string &defaultValue) const {
  std::scoped_lock lock(configMutex_);
  if (auto it = configData_.find(key); it != configData_.end()) {
    return it->second;
  }
  return defaultValue;
}

int ConfigManager::getInt(const std::string &key, int defaultValue) const {
  std::scoped_lock lock(configMutex_);
  if (auto it = configData_.find(key); it != configData_.end()) {
    try {
      return std::stoi(it->second);
    } catch (const std::invalid_argument &) {
      return defaultValue;
    } catch (const std::out_of_range &) {
      return defaultValue;
    }
  }
  return defaultValue;
}

bool ConfigManager::getBool(const std::string &key, bool defaultValue) const {
  std::scoped_lock lock(configMutex_);
  if (auto it = configData_.find(key); it != configData_.end()) {
    std::string value = it->second;
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) {
                     return static_cast<char>(std::tolower(c));
                   });
    return value == "true" || value == "1" || value == "yes" || value == "on";
  }
  return defaultValue;
}

double ConfigManager::getDouble(const std::string &key,
                                double defaultValue) const {
  std::scoped_lock lock(configMutex_);
  if (auto it = configData_.find(key); it != configData_.end()) {
    try {
      return std::stod(it->second);
    } catch (const std::invalid_argument &) {
      return defaultValue;
    } catch (const std::out_of_range &) {
      return defaultValue;
    }
  }
  return defaultValue;
}

std::unordered_set<std::string>
ConfigManager::getStringSet(const std::string &key) const {
  std::scoped_lock lock(configMutex_);
  std::unordered_set<std::string> result;
  auto it = configData_.find(key);
  if (it == configData_.end()) {
    return result;
  }

  const std::string &raw = it->second;
  if (!raw.empty() && raw.front() == '[') {
    auto arr = nlohmann::json::parse(raw, nullptr, false);
    if (arr.is_array()) {
      for (const auto &v : arr) {
        if (v.is_string()) {
          result.insert(v.get<std::string>());
        }
      }
      return result;
    }
  }

  // Comma separated form: "Scheduler, JobRegistry"
  std::stringstream ss(raw);
  std::string item;
  while (std::getline(ss, item, ',')) {
    item.erase(0, item.find_first_not_of(" \t\""));
    item.erase(item.find_last_not_of(" \t\"") + 1);
    if (!item.empty()) {
      result.insert(item);
    }
  }
  return result;
}

bool ConfigManager::hasKey(const std::string &key) const {
  std::scoped_lock lock(configMutex_);
  return configData_.count(key) > 0;
}

LogConfig ConfigManager::getLoggingConfig() const {
  LogConfig config;

  config.level = Logger::parseLogLevel(getString("logging.level", "INFO"));
  config.format = Logger::parseLogFormat(getString("logging.format", "TEXT"));
  config.consoleOutput = getBool("logging.console_output", true);
  config.fileOutput = getBool("logging.file_output", false);
  config.asyncLogging = getBool("logging.async_logging", false);
  config.logFile = getString("logging.log_file", "logs/autoflow.log");
  config.maxFileSize =
      static_cast<size_t>(getInt("logging.max_file_size", 10485760));
  config.maxBackupFiles = getInt("logging.max_backup_files", 5);
  config.enableRotation = getBool("logging.enable_rotation", true);
  config.componentFilter = getStringSet("logging.component_filter");

  return config;
}

SchedulerConfig ConfigManager::getSchedulerConfig() const {
  return SchedulerConfig::fromConfig(*this);
}

ConfigValidationResult ConfigManager::validateConfiguration() const {
  ConfigValidationResult result;

  result.merge(getSchedulerConfig().validate());

  auto policy = getString("scheduler.reenable_policy", "resume");
  if (!parseReenablePolicy(policy)) {
    result.addError("scheduler.reenable_policy must be 'resume' or "
                    "'reschedule', got '" +
                    policy + "'");
  }

  auto workflows = getJsonConfig().value("workflows", nlohmann::json::array());
  if (!workflows.is_array()) {
    result.addError("workflows must be an array");
    return result;
  }

  for (size_t i = 0; i < workflows.size(); ++i) {
    const auto &entry = workflows[i];
    std::string where = "workflows[" + std::to_string(i) + "]";
    if (!entry.is_object()) {
      result.addError(where + " must be an object");
      continue;
    }
    auto type = entry.find("type");
    if (type == entry.end() || !type->is_string()) {
      result.addError(where + ".type is required");
      continue;
    }
    if (kWorkflowTypes.count(type->get<std::string>()) == 0) {
      result.addError(where + ".type '" + type->get<std::string>() +
                      "' is not a known workflow");
    }
    if (entry.contains("enabled") && !entry["enabled"].is_boolean()) {
      result.addWarning(where + ".enabled is not a boolean, treating as true");
    }
  }

  if (workflows.empty()) {
    result.addWarning("No workflows configured, scheduler will idle");
  }

  return result;
}

nlohmann::json ConfigManager::getJsonConfig() const {
  std::scoped_lock lock(configMutex_);
  return rawConfig_;
}

bool ConfigManager::applyJson(const nlohmann::json &jsonConfig) {
  if (!jsonConfig.is_object()) {
    return false;
  }
  configData_.clear();
  rawConfig_ = jsonConfig;
  flattenJson(jsonConfig, "", 0, 100);
  return true;
}

void ConfigManager::flattenJson(const nlohmann::json &json,
                                const std::string &prefix, int currentDepth,
                                int maxDepth) {
  if (currentDepth >= maxDepth) {
    std::string key = prefix.empty() ? "deep_nested" : prefix + ".deep_nested";
    configData_[key] = json.dump();
    return;
  }

  for (auto it = json.begin(); it != json.end(); ++it) {
    std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();

    if (it->is_object()) {
      flattenJson(*it, key, currentDepth + 1, maxDepth);
    } else if (it->is_array()) {
      // Arrays stay as JSON text; structured readers use getJsonConfig()
      configData_[key] = it->dump();
    } else if (it->is_string()) {
      configData_[key] = it->get<std::string>();
    } else if (it->is_number_integer()) {
      configData_[key] = std::to_string(it->get<long long>());
    } else if (it->is_boolean()) {
      configData_[key] = it->get<bool>() ? "true" : "false";
    } else {
      configData_[key] = it->dump();
    }
  }
}

// ===== SchedulerConfig Implementation =====

SchedulerConfig SchedulerConfig::fromConfig(const ConfigManager &config) {
  SchedulerConfig schedulerConfig;

  schedulerConfig.tickInterval =
      std::chrono::milliseconds(config.getInt("scheduler.tick_interval_ms", 1000));
  schedulerConfig.errorBackoffMultiplier =
      config.getInt("scheduler.error_backoff_multiplier", 5);
  schedulerConfig.stopTimeout =
      std::chrono::milliseconds(config.getInt("scheduler.stop_timeout_ms", 5000));
  schedulerConfig.lockTimeout =
      std::chrono::milliseconds(config.getInt("scheduler.lock_timeout_ms", 1000));

  // Unknown values are reported by ConfigManager::validateConfiguration()
  if (auto policy =
          parseReenablePolicy(config.getString("scheduler.reenable_policy",
                                               "resume"))) {
    schedulerConfig.reenablePolicy = *policy;
  }

  return schedulerConfig;
}

ConfigValidationResult SchedulerConfig::validate() const {
  ConfigValidationResult result;

  if (tickInterval.count() <= 0) {
    result.addError("scheduler.tick_interval_ms must be positive");
  } else if (tickInterval.count() > 60000) {
    result.addWarning("scheduler.tick_interval_ms above one minute delays "
                      "every job by up to a full tick");
  }

  if (errorBackoffMultiplier < 1) {
    result.addError("scheduler.error_backoff_multiplier must be at least 1");
  }

  if (stopTimeout.count() <= 0) {
    result.addError("scheduler.stop_timeout_ms must be positive");
  }

  if (lockTimeout.count() <= 0) {
    result.addError("scheduler.lock_timeout_ms must be positive");
  }

  return result;
}

bool SchedulerConfig::operator==(const SchedulerConfig &other) const {
  return tickInterval == other.tickInterval &&
         errorBackoffMultiplier == other.errorBackoffMultiplier &&
         stopTimeout == other.stopTimeout && lockTimeout == other.lockTimeout &&
         reenablePolicy == other.reenablePolicy;
}

} // namespace autoflow
