#include "job_registry.hpp"
#include "component_logger.hpp"
#include "lock_utils.hpp"
#include "scheduler_exceptions.hpp"

#include <algorithm>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <utility>

namespace autoflow {

namespace {

// from + interval, clamped to TimePoint::max() instead of overflowing
TimePoint addInterval(TimePoint from, Duration interval) {
  auto headroom =
      std::chrono::duration_cast<Duration>(TimePoint::max() - from);
  if (interval >= headroom) {
    return TimePoint::max();
  }
  return from + interval;
}

} // namespace

std::string reenablePolicyToString(ReenablePolicy policy) {
  switch (policy) {
  case ReenablePolicy::RESUME_SCHEDULE:
    return "resume";
  case ReenablePolicy::RESCHEDULE_FROM_NOW:
    return "reschedule";
  default:
    return "unknown";
  }
}

std::optional<ReenablePolicy> parseReenablePolicy(const std::string &value) {
  if (value == "resume") {
    return ReenablePolicy::RESUME_SCHEDULE;
  }
  if (value == "reschedule") {
    return ReenablePolicy::RESCHEDULE_FROM_NOW;
  }
  return std::nullopt;
}

JobRegistry::JobRegistry(std::shared_ptr<Clock> clock,
                         ReenablePolicy reenablePolicy,
                         std::chrono::milliseconds lockTimeout)
    : clock_(clock ? std::move(clock) : makeSystemClock()),
      reenablePolicy_(reenablePolicy), lockTimeout_(lockTimeout) {}

JobId JobRegistry::add(const std::string &name, const std::string &jobType,
                       std::shared_ptr<Runnable> callback, Duration interval,
                       JobMetadata metadata, bool enabled) {
  if (interval.count() <= 0) {
    throw ValidationException(ErrorCode::INVALID_RANGE,
                              "Job interval must be positive", "interval",
                              std::to_string(interval.count()),
                              {{"job_name", name}});
  }
  if (interval > MAX_JOB_INTERVAL) {
    throw ValidationException(
        ErrorCode::INVALID_RANGE,
        "Job interval must not exceed " +
            std::to_string(MAX_JOB_INTERVAL.count()) + "ms",
        "interval", std::to_string(interval.count()), {{"job_name", name}});
  }
  if (!callback) {
    throw ValidationException(ErrorCode::INVALID_INPUT,
                              "Job callback must not be null", "callback", "",
                              {{"job_name", name}});
  }
  if (metadata.is_null()) {
    metadata = JobMetadata::object();
  }
  if (!metadata.is_object()) {
    throw ValidationException(ErrorCode::INVALID_INPUT,
                              "Job metadata must be a JSON object", "metadata",
                              metadata.dump(), {{"job_name", name}});
  }

  auto job = std::make_shared<Job>();
  job->name = name;
  job->jobType = jobType;
  job->callback = std::move(callback);
  job->interval = interval;
  job->metadata = std::make_shared<const JobMetadata>(std::move(metadata));
  job->enabled = enabled;
  job->state = JobState::SCHEDULED;

  auto now = clock_->now();
  job->createdAt = now;
  job->nextRun = addInterval(now, interval);

  {
    std::scoped_lock lock(mutex_);
    job->id = generateJobIdLocked();
    jobs_.push_back(job);
    index_.emplace(job->id, job);
  }

  REGISTRY_LOG_INFO("Added job '{}' ({}) with id {}, interval {}ms", name,
                    jobType, job->id, interval.count());
  return job->id;
}

JobId JobRegistry::add(const std::string &name, const std::string &jobType,
                       JobCallback callback, Duration interval,
                       JobMetadata metadata, bool enabled) {
  std::shared_ptr<Runnable> runnable;
  if (callback) {
    runnable = std::make_shared<FunctionRunnable>(std::move(callback));
  }
  return add(name, jobType, std::move(runnable), interval, std::move(metadata),
             enabled);
}

bool JobRegistry::remove(const JobId &jobId) {
  std::string name;
  {
    std::scoped_lock lock(mutex_);
    auto it = index_.find(jobId);
    if (it == index_.end()) {
      REGISTRY_LOG_DEBUG("Remove requested for unknown job {}", jobId);
      return false;
    }
    name = it->second->name;
    jobs_.erase(std::remove(jobs_.begin(), jobs_.end(), it->second),
                jobs_.end());
    index_.erase(it);
  }

  REGISTRY_LOG_INFO("Removed job '{}' ({})", name, jobId);
  return true;
}

bool JobRegistry::enable(const JobId &jobId) {
  std::scoped_lock lock(mutex_);
  auto job = findLocked(jobId);
  if (!job) {
    REGISTRY_LOG_DEBUG("Enable requested for unknown job {}", jobId);
    return false;
  }

  if (!job->enabled &&
      reenablePolicy_ == ReenablePolicy::RESCHEDULE_FROM_NOW) {
    job->nextRun = addInterval(clock_->now(), job->interval);
  }
  job->enabled = true;
  REGISTRY_LOG_INFO("Enabled job '{}' ({})", job->name, jobId);
  return true;
}

bool JobRegistry::disable(const JobId &jobId) {
  std::scoped_lock lock(mutex_);
  auto job = findLocked(jobId);
  if (!job) {
    REGISTRY_LOG_DEBUG("Disable requested for unknown job {}", jobId);
    return false;
  }

  job->enabled = false;
  REGISTRY_LOG_INFO("Disabled job '{}' ({})", job->name, jobId);
  return true;
}

size_t JobRegistry::clear() {
  size_t removed = 0;
  {
    std::scoped_lock lock(mutex_);
    removed = jobs_.size();
    jobs_.clear();
    index_.clear();
  }
  if (removed > 0) {
    REGISTRY_LOG_INFO("Cleared {} jobs", removed);
  }
  return removed;
}

std::vector<JobSnapshot> JobRegistry::list() const {
  std::scoped_lock lock(mutex_);
  std::vector<JobSnapshot> result;
  result.reserve(jobs_.size());
  for (const auto &job : jobs_) {
    result.push_back(job->snapshot());
  }
  return result;
}

std::optional<JobSnapshot> JobRegistry::get(const JobId &jobId) const {
  std::scoped_lock lock(mutex_);
  auto job = findLocked(jobId);
  if (!job) {
    return std::nullopt;
  }
  return job->snapshot();
}

size_t JobRegistry::size() const {
  std::scoped_lock lock(mutex_);
  return jobs_.size();
}

RegistryCounts JobRegistry::counts() const {
  std::scoped_lock lock(mutex_);
  RegistryCounts counts;
  counts.total = jobs_.size();
  for (const auto &job : jobs_) {
    if (job->enabled) {
      ++counts.enabled;
    }
  }
  counts.disabled = counts.total - counts.enabled;
  return counts;
}

std::vector<JobId> JobRegistry::dueJobs(TimePoint now) const {
  ScopedTimedLock<std::timed_mutex> lock(mutex_, lockTimeout_, "JobRegistry");
  std::vector<JobId> due;
  for (const auto &job : jobs_) {
    if (job->isDue(now)) {
      due.push_back(job->id);
    }
  }
  return due;
}

std::optional<JobDispatch> JobRegistry::beginRun(const JobId &jobId,
                                                 TimePoint now) {
  ScopedTimedLock<std::timed_mutex> lock(mutex_, lockTimeout_, "JobRegistry");
  auto job = findLocked(jobId);
  if (!job || !job->isDue(now)) {
    return std::nullopt;
  }

  job->lastRun = now;
  job->state = JobState::RUNNING;

  JobDispatch dispatch;
  dispatch.id = job->id;
  dispatch.name = job->name;
  dispatch.callback = job->callback;
  dispatch.metadata = job->metadata;
  dispatch.attemptTime = now;
  return dispatch;
}

void JobRegistry::completeRun(const JobDispatch &dispatch, Duration elapsed,
                              const std::optional<std::string> &error) {
  std::scoped_lock lock(mutex_);
  auto job = findLocked(dispatch.id);
  if (!job) {
    return;
  }

  job->state = JobState::SCHEDULED;
  job->nextRun = addInterval(dispatch.attemptTime, job->interval);
  job->lastDuration = elapsed;
  ++job->runCount;
  if (error) {
    ++job->failureCount;
    job->lastError = *error;
  } else {
    job->lastError.reset();
  }
}

std::shared_ptr<Job> JobRegistry::findLocked(const JobId &jobId) const {
  auto it = index_.find(jobId);
  return it == index_.end() ? nullptr : it->second;
}

JobId JobRegistry::generateJobIdLocked() {
  JobId id;
  do {
    id = boost::uuids::to_string(boost::uuids::random_generator()());
  } while (index_.count(id) > 0);
  return id;
}

} // namespace autoflow
