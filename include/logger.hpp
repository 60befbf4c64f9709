#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>

namespace autoflow {

enum class LogLevel { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3, FATAL = 4 };

enum class LogFormat { TEXT = 0, JSON = 1 };

using LogContext = std::unordered_map<std::string, std::string>;

struct LogConfig {
  LogLevel level = LogLevel::INFO;
  LogFormat format = LogFormat::TEXT;
  bool consoleOutput = true;
  bool fileOutput = false;
  bool asyncLogging = false;
  std::string logFile = "logs/autoflow.log";
  size_t maxFileSize = 10 * 1024 * 1024; // 10MB
  int maxBackupFiles = 5;
  bool enableRotation = true;
  std::unordered_set<std::string> componentFilter; // Empty = all components
  size_t asyncQueueSize = 10000;
};

struct LogMetrics {
  std::atomic<uint64_t> totalMessages{0};
  std::atomic<uint64_t> errorCount{0};
  std::atomic<uint64_t> warningCount{0};
  std::atomic<uint64_t> droppedMessages{0};
  std::chrono::steady_clock::time_point startTime;

  LogMetrics() : startTime(std::chrono::steady_clock::now()) {}

  // Atomics are not copyable, copy their values instead
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

class Logger {
public:
  static Logger &getInstance();

  // Configuration methods
  void configure(const LogConfig &config);
  void setLogLevel(LogLevel level);
  void setLogFormat(LogFormat format);
  void setComponentFilter(const std::unordered_set<std::string> &components);
  void enableRotation(bool enable, size_t maxFileSize = 10 * 1024 * 1024,
                      int maxBackupFiles = 5);

  // Logging methods
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

  // Job-scoped logging, tags the line with job_id
  void logForJob(LogLevel level, const std::string &component,
                 const std::string &message, const std::string &jobId,
                 const LogContext &context = {});
  void debugForJob(const std::string &component, const std::string &message,
                   const std::string &jobId, const LogContext &context = {});
  void errorForJob(const std::string &component, const std::string &message,
                   const std::string &jobId, const LogContext &context = {});

  void logPerformance(const std::string &operation, double durationMs,
                      const LogContext &context = {});

  LogMetrics getMetrics() const;
  void resetMetrics();

  // Control methods
  void flush();
  void shutdown();

  static std::string levelToString(LogLevel level);
  static LogLevel parseLogLevel(const std::string &levelStr);
  static LogFormat parseLogFormat(const std::string &formatStr);

private:
  Logger() = default;
  ~Logger();

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  struct PendingLine {
    std::string text;
    bool console;
    bool file;
  };

  // Configuration
  LogConfig config_;
  mutable std::mutex configMutex_;

  // File handling, guarded by fileMutex_
  std::ofstream fileStream_;
  std::string currentLogFile_;
  size_t currentFileSize_ = 0;
  bool rotationEnabled_ = true;
  size_t maxFileSize_ = 10 * 1024 * 1024;
  int maxBackupFiles_ = 5;
  mutable std::mutex fileMutex_;

  // Async logging
  std::queue<PendingLine> messageQueue_;
  std::thread asyncThread_;
  std::condition_variable asyncCondition_;
  std::mutex asyncMutex_;
  std::atomic<bool> stopAsync_{false};
  std::atomic<bool> asyncStarted_{false};

  LogMetrics metrics_;

  std::string formatTimestamp() const;
  std::string formatTextMessage(LogLevel level, const std::string &component,
                                const std::string &message,
                                const LogContext &context) const;
  std::string formatJsonMessage(LogLevel level, const std::string &component,
                                const std::string &message,
                                const LogContext &context) const;
  void openLogFileLocked(const std::string &filename);
  void writeLogSync(const PendingLine &line);
  void writeLogAsync(PendingLine line, size_t maxQueueSize);
  void startAsyncWorkerLocked();
  void stopAsyncWorker();
  void asyncWorker();
  void rotateLogFile();
};

} // namespace autoflow

// Standard logging macros
#define LOG_INFO(component, message, ...)                                      \
  autoflow::Logger::getInstance().info(component, message, ##__VA_ARGS__)
#define LOG_WARN(component, message, ...)                                      \
  autoflow::Logger::getInstance().warn(component, message, ##__VA_ARGS__)
#define LOG_ERROR(component, message, ...)                                     \
  autoflow::Logger::getInstance().error(component, message, ##__VA_ARGS__)
#define LOG_FATAL(component, message, ...)                                     \
  autoflow::Logger::getInstance().fatal(component, message, ##__VA_ARGS__)

// Include the ComponentLogger template system
#include "component_logger.hpp"
