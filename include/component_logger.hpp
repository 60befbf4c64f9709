#pragma once

#include "logger.hpp"
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

namespace autoflow {

template <typename Component> struct ComponentTrait;

template <> struct ComponentTrait<class ConfigManager> {
  static constexpr const char *name = "ConfigManager";
};

template <> struct ComponentTrait<class JobRegistry> {
  static constexpr const char *name = "JobRegistry";
};

template <> struct ComponentTrait<class WorkflowScheduler> {
  static constexpr const char *name = "WorkflowScheduler";
};

template <> struct ComponentTrait<class WorkflowBuilder> {
  static constexpr const char *name = "WorkflowBuilder";
};

/**
 * ComponentLogger - Template-based logging front end.
 *
 * The component name is resolved at compile time through ComponentTrait, so
 * a typo in a component name is a build error rather than a silently
 * unfiltered log line. Messages may contain "{}" placeholders that are
 * filled from the trailing arguments in order.
 */
template <typename Component> class ComponentLogger {
private:
  static_assert(std::is_class_v<Component>, "Component must be a class type");

  static constexpr const char *component_name = ComponentTrait<Component>::name;

  static Logger &getLogger() { return Logger::getInstance(); }

public:
  template <typename... Args>
  static void debug(const std::string &message, Args &&...args) {
    getLogger().debug(component_name,
                      format_message(message, std::forward<Args>(args)...));
  }

  template <typename... Args>
  static void info(const std::string &message, Args &&...args) {
    getLogger().info(component_name,
                     format_message(message, std::forward<Args>(args)...));
  }

  template <typename... Args>
  static void warn(const std::string &message, Args &&...args) {
    getLogger().warn(component_name,
                     format_message(message, std::forward<Args>(args)...));
  }

  template <typename... Args>
  static void error(const std::string &message, Args &&...args) {
    getLogger().error(component_name,
                      format_message(message, std::forward<Args>(args)...));
  }

  // Job-specific logging methods

  template <typename... Args>
  static void debugJob(const std::string &message, const std::string &jobId,
                       Args &&...args) {
    getLogger().debugForJob(
        component_name, format_message(message, std::forward<Args>(args)...),
        jobId);
  }

  static void errorJobWithContext(const std::string &message,
                                  const std::string &jobId,
                                  const LogContext &context = {}) {
    getLogger().errorForJob(component_name, message, jobId, context);
  }

private:
  template <typename T>
  static void stream_value(std::stringstream &ss, T &&value) {
    if constexpr (std::is_same_v<std::decay_t<T>, bool>) {
      ss << (value ? "true" : "false");
    } else if constexpr (std::is_arithmetic_v<std::decay_t<T>> ||
                         std::is_convertible_v<T, std::string>) {
      ss << std::forward<T>(value);
    } else {
      ss << "[object]";
    }
  }

  template <typename... Args>
  static std::string format_message(const std::string &format, Args &&...args) {
    if constexpr (sizeof...(args) == 0) {
      return format;
    } else {
      std::stringstream ss;
      format_impl(ss, format, std::forward<Args>(args)...);
      return ss.str();
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
};

using ConfigLogger = ComponentLogger<class ConfigManager>;
using RegistryLogger = ComponentLogger<class JobRegistry>;
using SchedulerLogger = ComponentLogger<class WorkflowScheduler>;
using WorkflowLogger = ComponentLogger<class WorkflowBuilder>;

} // namespace autoflow

#define CONFIG_LOG_INFO(message, ...)                                          \
  autoflow::ConfigLogger::info(message, ##__VA_ARGS__)
#define CONFIG_LOG_WARN(message, ...)                                          \
  autoflow::ConfigLogger::warn(message, ##__VA_ARGS__)
#define CONFIG_LOG_ERROR(message, ...)                                         \
  autoflow::ConfigLogger::error(message, ##__VA_ARGS__)

#define REGISTRY_LOG_DEBUG(message, ...)                                       \
  autoflow::RegistryLogger::debug(message, ##__VA_ARGS__)
#define REGISTRY_LOG_INFO(message, ...)                                        \
  autoflow::RegistryLogger::info(message, ##__VA_ARGS__)
#define REGISTRY_LOG_WARN(message, ...)                                        \
  autoflow::RegistryLogger::warn(message, ##__VA_ARGS__)

#define SCHED_LOG_DEBUG(message, ...)                                          \
  autoflow::SchedulerLogger::debug(message, ##__VA_ARGS__)
#define SCHED_LOG_INFO(message, ...)                                           \
  autoflow::SchedulerLogger::info(message, ##__VA_ARGS__)
#define SCHED_LOG_WARN(message, ...)                                           \
  autoflow::SchedulerLogger::warn(message, ##__VA_ARGS__)
#define SCHED_LOG_ERROR(message, ...)                                          \
  autoflow::SchedulerLogger::error(message, ##__VA_ARGS__)

#define SCHED_LOG_DEBUG_JOB(message, jobId, ...)                               \
  autoflow::SchedulerLogger::debugJob(message, jobId, ##__VA_ARGS__)

#define WORKFLOW_LOG_DEBUG(message, ...)                                       \
  autoflow::WorkflowLogger::debug(message, ##__VA_ARGS__)
#define WORKFLOW_LOG_INFO(message, ...)                                        \
  autoflow::WorkflowLogger::info(message, ##__VA_ARGS__)
#define WORKFLOW_LOG_ERROR(message, ...)                                       \
  autoflow::WorkflowLogger::error(message, ##__VA_ARGS__)
