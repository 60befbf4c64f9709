#pragma once

#include <chrono>
#include <exception>
#include <string>
#include <unordered_map>

namespace autoflow {

// Error codes organized by category
enum class ErrorCode {
  // Validation errors (1000-1999)
  INVALID_INPUT = 1000,
  MISSING_FIELD = 1001,
  INVALID_FORMAT = 1002,
  INVALID_RANGE = 1003,

  // System errors (3000-3999)
  FILE_ERROR = 3000,
  LOCK_TIMEOUT = 3001,
  CONFIGURATION_ERROR = 3002,
  THREAD_START_FAILED = 3003,
  INTERNAL_ERROR = 3004,

  // Scheduling errors (4000-4999)
  JOB_NOT_FOUND = 4000,
  JOB_EXECUTION_FAILED = 4001,
  EXTERNAL_SERVICE_ERROR = 4002,
  SHUTDOWN_TIMEOUT = 4003
};

// Error context for additional debugging information
using ErrorContext = std::unordered_map<std::string, std::string>;

const char *getErrorCodeDescription(ErrorCode code);
std::string getErrorCategory(ErrorCode code);

// True for failures that are expected to clear on a later attempt
bool isRetryableError(ErrorCode code);

// Base scheduler exception with error context and correlation ID support
class SchedulerException : public std::exception {
public:
  SchedulerException(ErrorCode code, std::string message,
                     ErrorContext context = {});

  SchedulerException(const SchedulerException &other) = default;
  SchedulerException &operator=(const SchedulerException &other) = default;
  SchedulerException(SchedulerException &&other) noexcept = default;
  SchedulerException &operator=(SchedulerException &&other) noexcept = default;

  virtual ~SchedulerException() = default;

  ErrorCode getCode() const { return errorCode_; }
  const std::string &getMessage() const { return message_; }
  const ErrorContext &getContext() const { return context_; }
  const std::string &getCorrelationId() const { return correlationId_; }
  std::chrono::system_clock::time_point getTimestamp() const {
    return timestamp_;
  }

  const char *what() const noexcept override { return message_.c_str(); }

  virtual std::string toLogString() const;
  std::string toJsonString() const;

  void addContext(const std::string &key, const std::string &value);
  void setCorrelationId(const std::string &correlationId);

protected:
  ErrorCode errorCode_;
  std::string message_;
  ErrorContext context_;
  std::string correlationId_;
  std::chrono::system_clock::time_point timestamp_;

  static std::string generateCorrelationId();
};

// Rejected input at an API boundary (bad interval, null callback, ...)
class ValidationException : public SchedulerException {
public:
  ValidationException(ErrorCode code, std::string message,
                      std::string field = "", std::string value = "",
                      ErrorContext context = {});

  const std::string &getField() const { return field_; }
  const std::string &getValue() const { return value_; }

  std::string toLogString() const override;

private:
  std::string field_;
  std::string value_;
};

// Infrastructure failures inside the scheduler itself
class SystemException : public SchedulerException {
public:
  SystemException(ErrorCode code, std::string message,
                  std::string component = "", ErrorContext context = {});

  const std::string &getComponent() const { return component_; }

  std::string toLogString() const override;

private:
  std::string component_;
};

/**
 * Structured failure a job body may throw so the scheduler can log which
 * external operation went wrong. Any other exception type is handled the
 * same way, only with less context.
 */
class JobExecutionException : public SchedulerException {
public:
  JobExecutionException(ErrorCode code, std::string message,
                        std::string jobId = "", std::string operation = "",
                        ErrorContext context = {});

  const std::string &getJobId() const { return jobId_; }
  const std::string &getOperation() const { return operation_; }

  std::string toLogString() const override;

private:
  std::string jobId_;
  std::string operation_;
};

ValidationException createValidationError(const std::string &field,
                                          const std::string &value,
                                          const std::string &reason);

SystemException createSystemError(ErrorCode code, const std::string &component,
                                  const std::string &details);

bool isValidationError(const std::exception &ex);
bool isSystemError(const std::exception &ex);

template <typename ExceptionType>
const ExceptionType *asException(const std::exception &ex) {
  return dynamic_cast<const ExceptionType *>(&ex);
}

} // namespace autoflow
