#include <gtest/gtest.h>
#include "job_registry.hpp"
#include "logger.hpp"
#include "scheduler_exceptions.hpp"
#include "workflow_scheduler.hpp"
#include <chrono>
#include <cstdio>
#include <fstream>
#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace autoflow {

using namespace std::chrono_literals;

// Drives single ticks against a manual clock, no background thread
class WorkflowSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        LogConfig logConfig;
        logConfig.level = LogLevel::FATAL;
        logConfig.consoleOutput = false;
        Logger::getInstance().configure(logConfig);

        start = std::chrono::system_clock::now();
        clock = std::make_shared<ManualClock>(start);
        registry = std::make_shared<JobRegistry>(clock);
        scheduler = std::make_unique<WorkflowScheduler>(registry);
    }

    JobCallback counter(int &count) {
        return [&count](const JobMetadata &) { ++count; };
    }

    TimePoint start;
    std::shared_ptr<ManualClock> clock;
    std::shared_ptr<JobRegistry> registry;
    std::unique_ptr<WorkflowScheduler> scheduler;
};

TEST_F(WorkflowSchedulerTest, NothingRunsBeforeFirstInterval) {
    int runs = 0;
    registry->add("job", "test", counter(runs), 60s);

    EXPECT_EQ(scheduler->runPendingJobs(), 0u);
    clock->advance(59s);
    EXPECT_EQ(scheduler->runPendingJobs(), 0u);
    EXPECT_EQ(runs, 0);
}

TEST_F(WorkflowSchedulerTest, DueJobRunsAndAdvancesByInterval) {
    int runs = 0;
    auto jobId = registry->add("job", "test", counter(runs), 60s);

    clock->advance(60s);
    EXPECT_EQ(scheduler->runPendingJobs(), 1u);
    EXPECT_EQ(runs, 1);

    auto job = registry->get(jobId);
    EXPECT_EQ(job->lastRun, start + 60s);
    EXPECT_EQ(job->nextRun, start + 120s);

    // Same instant again: not due any more
    EXPECT_EQ(scheduler->runPendingJobs(), 0u);
    EXPECT_EQ(runs, 1);
}

TEST_F(WorkflowSchedulerTest, LateTickSchedulesFromActualRun) {
    int runs = 0;
    auto jobId = registry->add("job", "test", counter(runs), 60s);

    clock->advance(90s);
    scheduler->runPendingJobs();

    EXPECT_EQ(registry->get(jobId)->nextRun, start + 150s);
}

TEST_F(WorkflowSchedulerTest, NextRunIgnoresCallbackDuration) {
    auto jobId = registry->add(
        "slow", "test",
        [this](const JobMetadata &) { clock->advance(5s); }, 60s);

    clock->advance(60s);
    scheduler->runPendingJobs();

    EXPECT_EQ(registry->get(jobId)->nextRun, start + 120s);
}

TEST_F(WorkflowSchedulerTest, FailingJobIsIsolatedAndStillAdvances) {
    int healthyRuns = 0;
    auto failing = registry->add(
        "failing", "test",
        [](const JobMetadata &) { throw std::runtime_error("boom"); }, 10s);
    auto healthy = registry->add("healthy", "test", counter(healthyRuns), 10s);

    clock->advance(10s);
    EXPECT_EQ(scheduler->runPendingJobs(), 2u);

    auto job = registry->get(failing);
    EXPECT_EQ(job->failureCount, 1u);
    EXPECT_EQ(job->lastError, "boom");
    EXPECT_EQ(job->nextRun, start + 20s);
    EXPECT_TRUE(job->enabled);
    EXPECT_EQ(healthyRuns, 1);
    EXPECT_EQ(registry->get(healthy)->failureCount, 0u);

    auto status = scheduler->status();
    EXPECT_EQ(status.executedRuns, 2u);
    EXPECT_EQ(status.failedRuns, 1u);
    EXPECT_EQ(status.totalJobs, 2u);
}

TEST_F(WorkflowSchedulerTest, StructuredJobFailureRecordsMessage) {
    auto jobId = registry->add(
        "crm", "crm_followups",
        [](const JobMetadata &) {
            throw JobExecutionException(ErrorCode::EXTERNAL_SERVICE_ERROR,
                                        "CRM API returned 503", "",
                                        "fetch_leads");
        },
        10s);

    clock->advance(10s);
    scheduler->runPendingJobs();

    EXPECT_EQ(registry->get(jobId)->lastError, "CRM API returned 503");
}

TEST_F(WorkflowSchedulerTest, FailureIsLoggedWithJobContext) {
    std::string logFile = ::testing::TempDir() + "autoflow_failure_log.log";
    std::remove(logFile.c_str());
    LogConfig logConfig;
    logConfig.level = LogLevel::ERROR;
    logConfig.consoleOutput = false;
    logConfig.fileOutput = true;
    logConfig.format = LogFormat::JSON;
    logConfig.logFile = logFile;
    Logger::getInstance().configure(logConfig);

    auto jobId = registry->add(
        "CRM Follow-ups - all", "crm_followups",
        [](const JobMetadata &) { throw std::runtime_error("crm offline"); },
        60s);
    clock->advance(60s);
    scheduler->runPendingJobs();

    Logger::getInstance().flush();
    std::ifstream in(logFile);
    std::string line;
    ASSERT_TRUE(static_cast<bool>(std::getline(in, line)));
    auto json = nlohmann::json::parse(line);
    EXPECT_EQ(json["level"], "ERROR");
    EXPECT_EQ(json["component"], "WorkflowScheduler");
    EXPECT_EQ(json["message"], "Job 'CRM Follow-ups - all' failed: crm offline");
    EXPECT_EQ(json["context"]["job_id"], jobId);
    EXPECT_EQ(json["context"]["job_name"], "CRM Follow-ups - all");
    EXPECT_TRUE(json["context"].contains("duration_ms"));

    in.close();
    std::remove(logFile.c_str());
}

TEST_F(WorkflowSchedulerTest, NonStandardExceptionCountsAsFailure) {
    auto jobId = registry->add(
        "odd", "test", [](const JobMetadata &) { throw 42; }, 10s);

    clock->advance(10s);
    EXPECT_NO_THROW(scheduler->runPendingJobs());

    auto job = registry->get(jobId);
    EXPECT_EQ(job->failureCount, 1u);
    EXPECT_TRUE(job->lastError.has_value());
    EXPECT_EQ(job->nextRun, start + 20s);
}

TEST_F(WorkflowSchedulerTest, SuccessClearsPreviousError) {
    bool fail = true;
    auto jobId = registry->add(
        "flaky", "test",
        [&fail](const JobMetadata &) {
            if (fail) {
                throw std::runtime_error("transient");
            }
        },
        10s);

    clock->advance(10s);
    scheduler->runPendingJobs();
    EXPECT_TRUE(registry->get(jobId)->lastError.has_value());

    fail = false;
    clock->advance(10s);
    scheduler->runPendingJobs();

    auto job = registry->get(jobId);
    EXPECT_FALSE(job->lastError.has_value());
    EXPECT_EQ(job->runCount, 2u);
    EXPECT_EQ(job->failureCount, 1u);
}

TEST_F(WorkflowSchedulerTest, DisabledJobNeverRuns) {
    int runs = 0;
    auto jobId = registry->add("job", "test", counter(runs), 10s);
    registry->disable(jobId);

    for (int i = 0; i < 5; ++i) {
        clock->advance(10s);
        scheduler->runPendingJobs();
    }

    EXPECT_EQ(runs, 0);
    EXPECT_FALSE(registry->get(jobId)->lastRun.has_value());
}

TEST_F(WorkflowSchedulerTest, ReenabledJobRunsOnNextTick) {
    int runs = 0;
    auto jobId = registry->add("job", "test", counter(runs), 10s);
    registry->disable(jobId);
    clock->advance(5min);
    scheduler->runPendingJobs();

    registry->enable(jobId);
    EXPECT_EQ(scheduler->runPendingJobs(), 1u);
    EXPECT_EQ(runs, 1);
    EXPECT_EQ(registry->get(jobId)->nextRun, start + 5min + 10s);
}

TEST_F(WorkflowSchedulerTest, JobsRunInRegistrationOrder) {
    std::vector<std::string> order;
    for (const auto *name : {"first", "second", "third"}) {
        std::string jobName = name;
        registry->add(jobName, "test",
                      [&order, jobName](const JobMetadata &) {
                          order.push_back(jobName);
                      },
                      10s);
    }

    clock->advance(10s);
    scheduler->runPendingJobs();

    EXPECT_EQ(order, (std::vector<std::string>{"first", "second", "third"}));
}

TEST_F(WorkflowSchedulerTest, DifferentIntervalsRunIndependently) {
    int fast = 0;
    int slow = 0;
    registry->add("fast", "test", counter(fast), 1s);
    registry->add("slow", "test", counter(slow), 2s);

    clock->advance(1s);
    scheduler->runPendingJobs();
    clock->advance(1s);
    scheduler->runPendingJobs();

    EXPECT_EQ(fast, 2);
    EXPECT_EQ(slow, 1);
}

TEST_F(WorkflowSchedulerTest, CallbackReceivesMetadata) {
    JobMetadata received;
    registry->add("job", "test",
                  [&received](const JobMetadata &metadata) {
                      received = metadata;
                  },
                  10s, {{"source", "webhook"}});

    clock->advance(10s);
    scheduler->runPendingJobs();

    EXPECT_EQ(received["source"], "webhook");
}

TEST_F(WorkflowSchedulerTest, JobMayDisableItself) {
    int runs = 0;
    auto selfId = std::make_shared<JobId>();
    *selfId = registry->add("once", "test",
                            [this, selfId, &runs](const JobMetadata &) {
                                ++runs;
                                registry->disable(*selfId);
                            },
                            10s);

    clock->advance(10s);
    scheduler->runPendingJobs();
    clock->advance(10s);
    scheduler->runPendingJobs();

    EXPECT_EQ(runs, 1);
    EXPECT_FALSE(registry->get(*selfId)->enabled);
}

TEST_F(WorkflowSchedulerTest, JobRemovedEarlierInTickIsSkipped) {
    int victimRuns = 0;
    auto victimId = std::make_shared<JobId>();
    registry->add("remover", "test",
                  [this, victimId](const JobMetadata &) {
                      registry->remove(*victimId);
                  },
                  10s);
    *victimId = registry->add("victim", "test", counter(victimRuns), 10s);

    clock->advance(10s);
    EXPECT_EQ(scheduler->runPendingJobs(), 1u);
    EXPECT_EQ(victimRuns, 0);
    EXPECT_EQ(registry->size(), 1u);
}

TEST_F(WorkflowSchedulerTest, StatusReportsRegistryCounts) {
    int runs = 0;
    registry->add("a", "test", counter(runs), 10s);
    auto b = registry->add("b", "test", counter(runs), 10s);
    registry->disable(b);

    auto status = scheduler->status();
    EXPECT_FALSE(status.running);
    EXPECT_FALSE(status.loopThreadAlive);
    EXPECT_EQ(status.totalJobs, 2u);
    EXPECT_EQ(status.enabledJobs, 1u);
    EXPECT_EQ(status.disabledJobs, 1u);

    auto json = status.toJson();
    EXPECT_EQ(json["running"], false);
    EXPECT_EQ(json["total_jobs"], 2);
    EXPECT_EQ(json["enabled_jobs"], 1);
    EXPECT_EQ(json["disabled_jobs"], 1);
}

TEST_F(WorkflowSchedulerTest, TickCountAdvancesPerTick) {
    scheduler->runPendingJobs();
    scheduler->runPendingJobs();
    EXPECT_EQ(scheduler->status().tickCount, 2u);
}

TEST_F(WorkflowSchedulerTest, ConstructorValidatesArguments) {
    EXPECT_THROW(WorkflowScheduler(nullptr), ValidationException);

    SchedulerConfig badConfig;
    badConfig.tickInterval = 0ms;
    EXPECT_THROW(WorkflowScheduler(registry, badConfig), ValidationException);

    badConfig = SchedulerConfig();
    badConfig.errorBackoffMultiplier = 0;
    EXPECT_THROW(WorkflowScheduler(registry, badConfig), ValidationException);
}

} // namespace autoflow
