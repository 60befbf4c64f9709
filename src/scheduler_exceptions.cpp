#include "scheduler_exceptions.hpp"
#include <iomanip>
#include <nlohmann/json.hpp>
#include <random>
#include <sstream>

namespace autoflow {

namespace {

struct ErrorCodeInfo {
  const char *description;
  const char *category;
  bool isRetryable;
};

const std::unordered_map<ErrorCode, ErrorCodeInfo> &getErrorCodeInfo() {
  static const std::unordered_map<ErrorCode, ErrorCodeInfo> errorInfo = {
      // Validation errors
      {ErrorCode::INVALID_INPUT,
       {"Invalid input data or format", "Validation", false}},
      {ErrorCode::MISSING_FIELD,
       {"Required field is missing", "Validation", false}},
      {ErrorCode::INVALID_FORMAT,
       {"Value has an unexpected format", "Validation", false}},
      {ErrorCode::INVALID_RANGE,
       {"Value is outside acceptable range", "Validation", false}},

      // System errors
      {ErrorCode::FILE_ERROR, {"File could not be read or written", "System",
                               false}},
      {ErrorCode::LOCK_TIMEOUT,
       {"Lock acquisition timed out", "System", true}},
      {ErrorCode::CONFIGURATION_ERROR,
       {"Configuration is missing or invalid", "System", false}},
      {ErrorCode::THREAD_START_FAILED,
       {"Background thread could not be started", "System", true}},
      {ErrorCode::INTERNAL_ERROR,
       {"Unexpected internal error", "System", true}},

      // Scheduling errors
      {ErrorCode::JOB_NOT_FOUND, {"Job does not exist", "Scheduling", false}},
      {ErrorCode::JOB_EXECUTION_FAILED,
       {"Job body reported a failure", "Scheduling", true}},
      {ErrorCode::EXTERNAL_SERVICE_ERROR,
       {"External service call failed", "Scheduling", true}},
      {ErrorCode::SHUTDOWN_TIMEOUT,
       {"Scheduler did not stop within its bound", "Scheduling", true}}};
  return errorInfo;
}

} // namespace

const char *getErrorCodeDescription(ErrorCode code) {
  const auto &info = getErrorCodeInfo();
  auto it = info.find(code);
  return (it != info.end()) ? it->second.description : "Unknown error";
}

std::string getErrorCategory(ErrorCode code) {
  const auto &info = getErrorCodeInfo();
  auto it = info.find(code);
  return (it != info.end()) ? it->second.category : "Unknown";
}

bool isRetryableError(ErrorCode code) {
  const auto &info = getErrorCodeInfo();
  auto it = info.find(code);
  return (it != info.end()) ? it->second.isRetryable : false;
}

std::string SchedulerException::generateCorrelationId() {
  static thread_local std::mt19937 gen(std::random_device{}());
  std::uniform_int_distribution<> dis(0, 15);

  std::stringstream ss;
  for (int i = 0; i < 8; ++i) {
    ss << std::hex << dis(gen);
  }
  return ss.str();
}

SchedulerException::SchedulerException(ErrorCode code, std::string message,
                                       ErrorContext context)
    : errorCode_(code), message_(std::move(message)),
      context_(std::move(context)), correlationId_(generateCorrelationId()),
      timestamp_(std::chrono::system_clock::now()) {}

std::string SchedulerException::toLogString() const {
  std::stringstream ss;
  ss << "[" << correlationId_ << "] "
     << "ErrorCode=" << static_cast<int>(errorCode_) << " "
     << "Message=\"" << message_ << "\"";

  if (!context_.empty()) {
    ss << " Context={";
    bool first = true;
    for (const auto &[key, value] : context_) {
      if (!first)
        ss << ", ";
      ss << key << "=\"" << value << "\"";
      first = false;
    }
    ss << "}";
  }

  return ss.str();
}

std::string SchedulerException::toJsonString() const {
  nlohmann::json json = {
      {"correlationId", correlationId_},
      {"errorCode", static_cast<int>(errorCode_)},
      {"category", getErrorCategory(errorCode_)},
      {"message", message_},
      {"timestamp", std::chrono::duration_cast<std::chrono::milliseconds>(
                        timestamp_.time_since_epoch())
                        .count()}};

  if (!context_.empty()) {
    json["context"] = context_;
  }
  return json.dump();
}

void SchedulerException::addContext(const std::string &key,
                                    const std::string &value) {
  context_[key] = value;
}

void SchedulerException::setCorrelationId(const std::string &correlationId) {
  correlationId_ = correlationId;
}

ValidationException::ValidationException(ErrorCode code, std::string message,
                                         std::string field, std::string value,
                                         ErrorContext context)
    : SchedulerException(code, std::move(message), std::move(context)),
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
  ss << "[VALIDATION] " << SchedulerException::toLogString();
  if (!field_.empty()) {
    ss << " Field=\"" << field_ << "\"";
  }
  if (!value_.empty()) {
    ss << " Value=\"" << value_ << "\"";
  }
  return ss.str();
}

SystemException::SystemException(ErrorCode code, std::string message,
                                 std::string component, ErrorContext context)
    : SchedulerException(code, std::move(message), std::move(context)),
      component_(std::move(component)) {
  if (!component_.empty()) {
    addContext("component", component_);
  }
}

std::string SystemException::toLogString() const {
  std::stringstream ss;
  ss << "[SYSTEM] " << SchedulerException::toLogString();
  if (!component_.empty()) {
    ss << " Component=\"" << component_ << "\"";
  }
  return ss.str();
}

JobExecutionException::JobExecutionException(ErrorCode code,
                                             std::string message,
                                             std::string jobId,
                                             std::string operation,
                                             ErrorContext context)
    : SchedulerException(code, std::move(message), std::move(context)),
      jobId_(std::move(jobId)), operation_(std::move(operation)) {
  if (!jobId_.empty()) {
    addContext("job_id", jobId_);
  }
  if (!operation_.empty()) {
    addContext("operation", operation_);
  }
}

std::string JobExecutionException::toLogString() const {
  std::stringstream ss;
  ss << "[JOB] " << SchedulerException::toLogString();
  if (!operation_.empty()) {
    ss << " Operation=\"" << operation_ << "\"";
  }
  return ss.str();
}

ValidationException createValidationError(const std::string &field,
                                          const std::string &value,
                                          const std::string &reason) {
  ErrorContext context;
  context["reason"] = reason;
  return ValidationException(ErrorCode::INVALID_INPUT,
                             "Validation failed: " + reason, field, value,
                             context);
}

SystemException createSystemError(ErrorCode code, const std::string &component,
                                  const std::string &details) {
  ErrorContext context;
  context["details"] = details;
  return SystemException(code, getErrorCodeDescription(code), component,
                         context);
}

bool isValidationError(const std::exception &ex) {
  return dynamic_cast<const ValidationException *>(&ex) != nullptr;
}

bool isSystemError(const std::exception &ex) {
  return dynamic_cast<const SystemException *>(&ex) != nullptr;
}

} // namespace autoflow
