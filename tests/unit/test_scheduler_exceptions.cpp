#include <gtest/gtest.h>
#include "lock_utils.hpp"
#include "scheduler_exceptions.hpp"
#include <chrono>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace autoflow {

// Test fixture for exception tests
class ExceptionTest : public ::testing::Test {};

TEST_F(ExceptionTest, SchedulerExceptionConstruction) {
    std::string testMessage = "Test error message";
    ErrorContext context = {{"key1", "value1"}, {"key2", "value2"}};

    SchedulerException ex(ErrorCode::INTERNAL_ERROR, testMessage, context);

    EXPECT_EQ(ex.getCode(), ErrorCode::INTERNAL_ERROR);
    EXPECT_EQ(ex.getMessage(), testMessage);
    EXPECT_STREQ(ex.what(), testMessage.c_str());

    const auto &returnedContext = ex.getContext();
    EXPECT_EQ(returnedContext.size(), 2u);
    EXPECT_EQ(returnedContext.at("key1"), "value1");

    auto now = std::chrono::system_clock::now();
    auto timeDiff = std::chrono::duration_cast<std::chrono::seconds>(
        now - ex.getTimestamp());
    EXPECT_LT(timeDiff.count(), 5);

    EXPECT_EQ(ex.getCorrelationId().size(), 8u);
}

TEST_F(ExceptionTest, CorrelationIdsDiffer) {
    SchedulerException first(ErrorCode::INTERNAL_ERROR, "a");
    SchedulerException second(ErrorCode::INTERNAL_ERROR, "b");
    EXPECT_NE(first.getCorrelationId(), second.getCorrelationId());

    SchedulerException copy = first;
    EXPECT_EQ(copy.getCorrelationId(), first.getCorrelationId());

    copy.setCorrelationId("req-42");
    EXPECT_EQ(copy.getCorrelationId(), "req-42");
}

TEST_F(ExceptionTest, ValidationExceptionCarriesField) {
    ValidationException ex(ErrorCode::INVALID_RANGE,
                           "Job interval must be positive", "interval", "0");

    EXPECT_EQ(ex.getField(), "interval");
    EXPECT_EQ(ex.getValue(), "0");
    EXPECT_EQ(ex.getContext().at("field"), "interval");

    auto logString = ex.toLogString();
    EXPECT_NE(logString.find("[VALIDATION]"), std::string::npos);
    EXPECT_NE(logString.find("ErrorCode=1003"), std::string::npos);
    EXPECT_NE(logString.find("Field=\"interval\""), std::string::npos);
}

TEST_F(ExceptionTest, JobExecutionExceptionCarriesOperation) {
    JobExecutionException ex(ErrorCode::EXTERNAL_SERVICE_ERROR,
                             "Gmail API quota exceeded", "job-1",
                             "list_messages");

    EXPECT_EQ(ex.getJobId(), "job-1");
    EXPECT_EQ(ex.getOperation(), "list_messages");
    EXPECT_EQ(ex.getContext().at("job_id"), "job-1");
    EXPECT_NE(ex.toLogString().find("[JOB]"), std::string::npos);
    EXPECT_NE(ex.toLogString().find("Operation=\"list_messages\""),
              std::string::npos);
}

TEST_F(ExceptionTest, JsonSerialization) {
    SystemException ex(ErrorCode::LOCK_TIMEOUT, "Registry busy", "JobRegistry");
    ex.addContext("attempt", "2");

    auto json = nlohmann::json::parse(ex.toJsonString());
    EXPECT_EQ(json["errorCode"], 3001);
    EXPECT_EQ(json["category"], "System");
    EXPECT_EQ(json["message"], "Registry busy");
    EXPECT_EQ(json["correlationId"], ex.getCorrelationId());
    EXPECT_EQ(json["context"]["component"], "JobRegistry");
    EXPECT_EQ(json["context"]["attempt"], "2");
    EXPECT_TRUE(json["timestamp"].is_number());
}

TEST_F(ExceptionTest, ErrorCodeMetadata) {
    EXPECT_EQ(getErrorCategory(ErrorCode::INVALID_INPUT), "Validation");
    EXPECT_EQ(getErrorCategory(ErrorCode::LOCK_TIMEOUT), "System");
    EXPECT_EQ(getErrorCategory(ErrorCode::JOB_NOT_FOUND), "Scheduling");

    EXPECT_TRUE(isRetryableError(ErrorCode::LOCK_TIMEOUT));
    EXPECT_TRUE(isRetryableError(ErrorCode::EXTERNAL_SERVICE_ERROR));
    EXPECT_FALSE(isRetryableError(ErrorCode::INVALID_RANGE));
    EXPECT_FALSE(isRetryableError(ErrorCode::JOB_NOT_FOUND));

    EXPECT_STREQ(getErrorCodeDescription(ErrorCode::JOB_NOT_FOUND),
                 "Job does not exist");
}

TEST_F(ExceptionTest, FactoryHelpers) {
    auto validation = createValidationError("callback", "", "must not be null");
    EXPECT_EQ(validation.getCode(), ErrorCode::INVALID_INPUT);
    EXPECT_EQ(validation.getMessage(), "Validation failed: must not be null");
    EXPECT_EQ(validation.getContext().at("reason"), "must not be null");

    auto system = createSystemError(ErrorCode::THREAD_START_FAILED,
                                    "WorkflowScheduler", "EAGAIN");
    EXPECT_EQ(system.getComponent(), "WorkflowScheduler");
    EXPECT_EQ(system.getMessage(), "Background thread could not be started");
    EXPECT_EQ(system.getContext().at("details"), "EAGAIN");
}

TEST_F(ExceptionTest, TypeChecks) {
    ValidationException validation(ErrorCode::INVALID_INPUT, "bad");
    LockTimeoutException lockTimeout("timed out", "JobRegistry");
    std::runtime_error plain("plain");

    EXPECT_TRUE(isValidationError(validation));
    EXPECT_FALSE(isSystemError(validation));
    EXPECT_TRUE(isSystemError(lockTimeout));
    EXPECT_FALSE(isValidationError(plain));

    const auto *asSystem = asException<SystemException>(lockTimeout);
    ASSERT_NE(asSystem, nullptr);
    EXPECT_EQ(asSystem->getCode(), ErrorCode::LOCK_TIMEOUT);
    EXPECT_EQ(asException<ValidationException>(plain), nullptr);
}

} // namespace autoflow
