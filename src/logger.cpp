#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace autoflow {

Logger &Logger::getInstance() {
  static Logger instance;
  return instance;
}

Logger::~Logger() { shutdown(); }

void Logger::configure(const LogConfig &config) {
  std::lock_guard<std::mutex> lock(configMutex_);
  config_ = config;

  {
    std::lock_guard<std::mutex> fileLock(fileMutex_);
    rotationEnabled_ = config.enableRotation;
    maxFileSize_ = config.maxFileSize;
    maxBackupFiles_ = config.maxBackupFiles;

    if (fileStream_.is_open()) {
      fileStream_.close();
    }
    if (config_.fileOutput) {
      openLogFileLocked(config.logFile);
      if (!fileStream_.is_open()) {
        config_.fileOutput = false;
      }
    }
  }

  if (config.asyncLogging && !asyncStarted_) {
    startAsyncWorkerLocked();
  }
}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(configMutex_);
  config_.level = level;
}

void Logger::setLogFormat(LogFormat format) {
  std::lock_guard<std::mutex> lock(configMutex_);
  config_.format = format;
}

void Logger::setComponentFilter(
    const std::unordered_set<std::string> &components) {
  std::lock_guard<std::mutex> lock(configMutex_);
  config_.componentFilter = components;
}

void Logger::enableRotation(bool enable, size_t maxFileSize,
                            int maxBackupFiles) {
  std::lock_guard<std::mutex> lock(configMutex_);
  config_.enableRotation = enable;
  config_.maxFileSize = maxFileSize;
  config_.maxBackupFiles = maxBackupFiles;

  std::lock_guard<std::mutex> fileLock(fileMutex_);
  rotationEnabled_ = enable;
  maxFileSize_ = maxFileSize;
  maxBackupFiles_ = maxBackupFiles;
}

void Logger::log(LogLevel level, const std::string &component,
                 const std::string &message, const LogContext &context) {
  PendingLine line;
  bool async = false;
  size_t maxQueueSize = 0;
  {
    std::lock_guard<std::mutex> lock(configMutex_);
    if (level < config_.level) {
      return;
    }
    if (!config_.componentFilter.empty() &&
        config_.componentFilter.find(component) ==
            config_.componentFilter.end()) {
      return;
    }
    line.text = config_.format == LogFormat::JSON
                    ? formatJsonMessage(level, component, message, context)
                    : formatTextMessage(level, component, message, context);
    line.console = config_.consoleOutput;
    line.file = config_.fileOutput;
    async = config_.asyncLogging && asyncStarted_;
    maxQueueSize = config_.asyncQueueSize;
  }

  metrics_.totalMessages++;
  if (level == LogLevel::ERROR || level == LogLevel::FATAL) {
    metrics_.errorCount++;
  } else if (level == LogLevel::WARN) {
    metrics_.warningCount++;
  }

  if (async) {
    writeLogAsync(std::move(line), maxQueueSize);
  } else {
    writeLogSync(line);
  }
}

void Logger::debug(const std::string &component, const std::string &message,
                   const LogContext &context) {
  log(LogLevel::DEBUG, component, message, context);
}

void Logger::info(const std::string &component, const std::string &message,
                  const LogContext &context) {
  log(LogLevel::INFO, component, message, context);
}

void Logger::warn(const std::string &component, const std::string &message,
                  const LogContext &context) {
  log(LogLevel::WARN, component, message, context);
}

void Logger::error(const std::string &component, const std::string &message,
                   const LogContext &context) {
  log(LogLevel::ERROR, component, message, context);
}

void Logger::fatal(const std::string &component, const std::string &message,
                   const LogContext &context) {
  log(LogLevel::FATAL, component, message, context);
}

void Logger::logForJob(LogLevel level, const std::string &component,
                       const std::string &message, const std::string &jobId,
                       const LogContext &context) {
  LogContext jobContext = context;
  jobContext["job_id"] = jobId;
  log(level, component, message, jobContext);
}

void Logger::debugForJob(const std::string &component,
                         const std::string &message, const std::string &jobId,
                         const LogContext &context) {
  logForJob(LogLevel::DEBUG, component, message, jobId, context);
}

void Logger::errorForJob(const std::string &component,
                         const std::string &message, const std::string &jobId,
                         const LogContext &context) {
  logForJob(LogLevel::ERROR, component, message, jobId, context);
}

void Logger::logPerformance(const std::string &operation, double durationMs,
                            const LogContext &context) {
  auto perfContext = context;
  perfContext["operation"] = operation;
  perfContext["duration_ms"] = std::to_string(durationMs);

  log(LogLevel::DEBUG, "Performance", "Operation completed: " + operation,
      perfContext);
}

LogMetrics Logger::getMetrics() const { return metrics_; }

void Logger::resetMetrics() { metrics_ = LogMetrics(); }

void Logger::flush() {
  if (asyncStarted_) {
    std::unique_lock<std::mutex> lock(asyncMutex_);
    asyncCondition_.notify_all();
  }

  std::lock_guard<std::mutex> lock(fileMutex_);
  if (fileStream_.is_open()) {
    fileStream_.flush();
  }
  std::cout.flush();
}

void Logger::shutdown() {
  stopAsyncWorker();

  std::lock_guard<std::mutex> lock(fileMutex_);
  if (fileStream_.is_open()) {
    fileStream_.close();
  }
}

std::string Logger::levelToString(LogLevel level) {
  switch (level) {
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO ";
  case LogLevel::WARN:
    return "WARN ";
  case LogLevel::ERROR:
    return "ERROR";
  case LogLevel::FATAL:
    return "FATAL";
  default:
    return "UNKNOWN";
  }
}

LogLevel Logger::parseLogLevel(const std::string &levelStr) {
  std::string level = levelStr;
  std::transform(level.begin(), level.end(), level.begin(),
                 [](unsigned char c) {
                   return static_cast<char>(std::toupper(c));
                 });

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

LogFormat Logger::parseLogFormat(const std::string &formatStr) {
  std::string format = formatStr;
  std::transform(format.begin(), format.end(), format.begin(),
                 [](unsigned char c) {
                   return static_cast<char>(std::toupper(c));
                 });

  if (format == "JSON")
    return LogFormat::JSON;
  return LogFormat::TEXT;
}

std::string Logger::formatTimestamp() const {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::tm localTime{};
  localtime_r(&time, &localTime);

  std::ostringstream oss;
  oss << std::put_time(&localTime, "%Y-%m-%d %H:%M:%S");
  oss << "." << std::setfill('0') << std::setw(3) << ms.count();
  return oss.str();
}

std::string Logger::formatTextMessage(LogLevel level,
                                      const std::string &component,
                                      const std::string &message,
                                      const LogContext &context) const {
  std::ostringstream oss;
  oss << "[" << formatTimestamp() << "] "
      << "[" << levelToString(level) << "] "
      << "[" << component << "] " << message;

  if (!context.empty()) {
    oss << " |";
    for (const auto &[key, value] : context) {
      oss << " " << key << "=" << value;
    }
  }

  return oss.str();
}

std::string Logger::formatJsonMessage(LogLevel level,
                                      const std::string &component,
                                      const std::string &message,
                                      const LogContext &context) const {
  std::string levelName = levelToString(level);
  levelName.erase(levelName.find_last_not_of(' ') + 1);

  nlohmann::json json = {{"timestamp", formatTimestamp()},
                         {"level", levelName},
                         {"component", component},
                         {"message", message}};
  if (!context.empty()) {
    json["context"] = context;
  }
  return json.dump();
}

void Logger::openLogFileLocked(const std::string &filename) {
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
                         ? std::filesystem::file_size(currentLogFile_, ec)
                         : 0;
  if (ec) {
    currentFileSize_ = 0;
  }
}

void Logger::writeLogSync(const PendingLine &line) {
  std::lock_guard<std::mutex> lock(fileMutex_);

  if (line.console) {
    std::cout << line.text << std::endl;
  }

  if (line.file && fileStream_.is_open()) {
    if (rotationEnabled_ &&
        currentFileSize_ + line.text.length() > maxFileSize_) {
      rotateLogFile();
    }
    if (fileStream_.is_open()) {
      fileStream_ << line.text << std::endl;
      currentFileSize_ += line.text.length() + 1;
    }
  }
}

void Logger::writeLogAsync(PendingLine line, size_t maxQueueSize) {
  std::lock_guard<std::mutex> lock(asyncMutex_);

  if (messageQueue_.size() >= maxQueueSize) {
    metrics_.droppedMessages++;
    return;
  }

  messageQueue_.push(std::move(line));
  asyncCondition_.notify_one();
}

void Logger::startAsyncWorkerLocked() {
  stopAsync_ = false;
  asyncStarted_ = true;
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
    asyncCondition_.wait(
        lock, [this] { return !messageQueue_.empty() || stopAsync_; });

    while (!messageQueue_.empty()) {
      PendingLine line = std::move(messageQueue_.front());
      messageQueue_.pop();
      lock.unlock();

      writeLogSync(line);

      lock.lock();
    }

    if (stopAsync_) {
      break;
    }
  }
}

void Logger::rotateLogFile() {
  fileStream_.close();

  std::error_code ec;
  for (int i = maxBackupFiles_ - 1; i > 0; i--) {
    std::string oldFile = currentLogFile_ + "." + std::to_string(i);
    std::string newFile = currentLogFile_ + "." + std::to_string(i + 1);

    if (std::filesystem::exists(oldFile, ec)) {
      if (i == maxBackupFiles_ - 1) {
        std::filesystem::remove(newFile, ec);
      }
      std::filesystem::rename(oldFile, newFile, ec);
    }
  }

  if (maxBackupFiles_ > 0 && std::filesystem::exists(currentLogFile_, ec)) {
    std::filesystem::rename(currentLogFile_, currentLogFile_ + ".1", ec);
  }

  fileStream_.open(currentLogFile_, std::ios::out | std::ios::trunc);
  currentFileSize_ = 0;

  if (!fileStream_.is_open()) {
    std::cerr << "Failed to create new log file after rotation: "
              << currentLogFile_ << std::endl;
  }
}

} // namespace autoflow
