#include "workflow_scheduler.hpp"
#include "component_logger.hpp"
#include "scheduler_exceptions.hpp"
#include <optional>
#include <string>
#include <system_error>
#include <utility>

namespace autoflow {

nlohmann::json SchedulerStatus::toJson() const {
  return {{"running", running},
          {"total_jobs", totalJobs},
          {"enabled_jobs", enabledJobs},
          {"disabled_jobs", disabledJobs},
          {"loop_thread_alive", loopThreadAlive},
          {"tick_count", tickCount},
          {"loop_fault_count", loopFaultCount},
          {"executed_runs", executedRuns},
          {"failed_runs", failedRuns}};
}

WorkflowScheduler::WorkflowScheduler(std::shared_ptr<JobRegistry> registry,
                                     SchedulerConfig config)
    : registry_(std::move(registry)), config_(std::move(config)) {
  if (!registry_) {
    throw ValidationException(ErrorCode::INVALID_INPUT,
                              "Scheduler requires a job registry", "registry");
  }
  auto validation = config_.validate();
  if (!validation.isValid) {
    throw ValidationException(ErrorCode::INVALID_RANGE,
                              "Invalid scheduler configuration: " +
                                  validation.errors.front(),
                              "scheduler");
  }
}

WorkflowScheduler::~WorkflowScheduler() {
  stop();
  if (loopThread_.joinable()) {
    if (loopThread_.get_id() == std::this_thread::get_id()) {
      loopThread_.detach();
    } else {
      loopThread_.join();
    }
  }
}

bool WorkflowScheduler::start() {
  std::scoped_lock lifecycle(lifecycleMutex_);
  if (running_) {
    SCHED_LOG_WARN("Workflow scheduler is already running");
    return true;
  }

  // A previous stop() may have timed out while a job was still running
  if (loopThread_.joinable()) {
    SCHED_LOG_WARN("Waiting for previous scheduler loop to finish");
    loopThread_.join();
  }

  SCHED_LOG_INFO("Starting workflow scheduler, tick interval {}ms",
                 config_.tickInterval.count());
  {
    std::scoped_lock lock(loopMutex_);
    running_ = true;
    loopActive_ = true;
  }

  try {
    loopThread_ = std::thread(&WorkflowScheduler::loop, this);
  } catch (const std::system_error &e) {
    {
      std::scoped_lock lock(loopMutex_);
      running_ = false;
      loopActive_ = false;
    }
    SCHED_LOG_ERROR("Failed to start scheduler thread: {}", e.what());
    return false;
  }

  SCHED_LOG_INFO("Workflow scheduler started with {} jobs", registry_->size());
  return true;
}

bool WorkflowScheduler::stop() { return stop(config_.stopTimeout); }

bool WorkflowScheduler::stop(std::chrono::milliseconds timeout) {
  // Called from inside a job: the loop exits once this tick unwinds
  if (loopThreadId_.load() == std::this_thread::get_id()) {
    {
      std::scoped_lock lock(loopMutex_);
      running_ = false;
    }
    wakeCondition_.notify_all();
    SCHED_LOG_INFO("Stop requested from a running job");
    return true;
  }

  std::scoped_lock lifecycle(lifecycleMutex_);
  {
    std::scoped_lock lock(loopMutex_);
    if (!running_) {
      return true;
    }
    running_ = false;
  }
  wakeCondition_.notify_all();

  bool exited = false;
  {
    std::unique_lock<std::mutex> lock(loopMutex_);
    exited = loopExitCondition_.wait_for(lock, timeout,
                                         [this] { return !loopActive_; });
  }

  if (!exited) {
    SCHED_LOG_ERROR("Scheduler loop did not exit within {}ms, a job is still "
                    "running",
                    timeout.count());
    return false;
  }

  if (loopThread_.joinable()) {
    loopThread_.join();
  }
  SCHED_LOG_INFO("Workflow scheduler stopped");
  return true;
}

SchedulerStatus WorkflowScheduler::status() const {
  SchedulerStatus status;
  auto counts = registry_->counts();

  status.running = running_;
  status.totalJobs = counts.total;
  status.enabledJobs = counts.enabled;
  status.disabledJobs = counts.disabled;
  status.loopThreadAlive = loopActive_;
  status.tickCount = tickCount_;
  status.loopFaultCount = loopFaultCount_;
  status.executedRuns = executedRuns_;
  status.failedRuns = failedRuns_;
  return status;
}

size_t WorkflowScheduler::runPendingJobs() {
  std::scoped_lock tick(tickMutex_);
  auto now = registry_->clock()->now();
  ++tickCount_;

  size_t executed = 0;
  for (const auto &jobId : registry_->dueJobs(now)) {
    // Skipped when removed or disabled by an earlier job in this tick
    auto dispatch = registry_->beginRun(jobId, now);
    if (!dispatch) {
      continue;
    }
    executeJob(*dispatch);
    ++executed;
  }
  return executed;
}

void WorkflowScheduler::loop() {
  loopThreadId_ = std::this_thread::get_id();
  SCHED_LOG_DEBUG("Scheduler loop running");

  while (running_) {
    auto wait = config_.tickInterval;
    try {
      runPendingJobs();
    } catch (const SchedulerException &e) {
      ++loopFaultCount_;
      wait = config_.tickInterval * config_.errorBackoffMultiplier;
      SCHED_LOG_ERROR("Scheduler tick failed, backing off {}ms: {}",
                      wait.count(), e.toLogString());
    } catch (const std::exception &e) {
      ++loopFaultCount_;
      wait = config_.tickInterval * config_.errorBackoffMultiplier;
      SCHED_LOG_ERROR("Scheduler tick failed, backing off {}ms: {}",
                      wait.count(), e.what());
    }

    std::unique_lock<std::mutex> lock(loopMutex_);
    wakeCondition_.wait_for(lock, wait, [this] { return !running_; });
  }

  loopThreadId_ = std::thread::id();
  {
    std::scoped_lock lock(loopMutex_);
    loopActive_ = false;
  }
  loopExitCondition_.notify_all();
  SCHED_LOG_DEBUG("Scheduler loop exited");
}

void WorkflowScheduler::executeJob(const JobDispatch &dispatch) {
  SCHED_LOG_DEBUG_JOB("Executing job '{}'", dispatch.id, dispatch.name);

  std::optional<std::string> error;
  std::string detail;
  auto started = std::chrono::steady_clock::now();
  try {
    dispatch.callback->run(*dispatch.metadata);
  } catch (const SchedulerException &e) {
    error = e.getMessage();
    detail = e.toLogString();
  } catch (const std::exception &e) {
    error = e.what();
    detail = e.what();
  } catch (...) {
    // Non-standard exceptions count as failures too
    error = "unknown exception";
    detail = "non-standard exception";
  }
  auto elapsed = std::chrono::duration_cast<Duration>(
      std::chrono::steady_clock::now() - started);

  ++executedRuns_;
  if (error) {
    ++failedRuns_;
    SchedulerLogger::errorJobWithContext(
        "Job '" + dispatch.name + "' failed: " + detail, dispatch.id,
        {{"job_name", dispatch.name},
         {"duration_ms", std::to_string(elapsed.count())}});
  }

  Logger::getInstance().logPerformance(
      "job:" + dispatch.name, static_cast<double>(elapsed.count()),
      {{"job_id", dispatch.id}, {"success", error ? "false" : "true"}});

  registry_->completeRun(dispatch, elapsed, error);
}

} // namespace autoflow
