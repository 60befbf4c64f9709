#pragma once

#include "clock.hpp"
#include "job_models.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace autoflow {

/**
 * What enable() does to a job that is already past its due time.
 *
 * RESUME_SCHEDULE keeps the stored next run, so a job disabled for longer
 * than its interval fires on the first tick after being re-enabled.
 * RESCHEDULE_FROM_NOW pushes the next run to now + interval.
 */
enum class ReenablePolicy { RESUME_SCHEDULE, RESCHEDULE_FROM_NOW };

// Longest accepted job interval, about a century. Next run arithmetic on
// system_clock time points overflows well before Duration::max().
inline constexpr Duration MAX_JOB_INTERVAL =
    std::chrono::hours(24 * 366 * 100);

std::string reenablePolicyToString(ReenablePolicy policy);
std::optional<ReenablePolicy> parseReenablePolicy(const std::string &value);

struct RegistryCounts {
  size_t total = 0;
  size_t enabled = 0;
  size_t disabled = 0;
};

// What the scheduler needs to invoke a due job outside the registry lock
struct JobDispatch {
  JobId id;
  std::string name;
  std::shared_ptr<Runnable> callback;
  std::shared_ptr<const JobMetadata> metadata;
  TimePoint attemptTime;
};

/**
 * Thread-safe store of scheduled jobs.
 *
 * Jobs are kept in insertion order. Every schedule field is read and written
 * under one mutex, and job bodies are never invoked while it is held, so a
 * callback may call back into the registry.
 */
class JobRegistry {
public:
  explicit JobRegistry(
      std::shared_ptr<Clock> clock = makeSystemClock(),
      ReenablePolicy reenablePolicy = ReenablePolicy::RESUME_SCHEDULE,
      std::chrono::milliseconds lockTimeout = std::chrono::milliseconds(1000));

  JobRegistry(const JobRegistry &) = delete;
  JobRegistry &operator=(const JobRegistry &) = delete;

  /**
   * Register a job. The first run is due one interval from now.
   * @throws ValidationException for an interval outside (0, MAX_JOB_INTERVAL],
   *         a null callback or metadata that is not a JSON object
   */
  JobId add(const std::string &name, const std::string &jobType,
            std::shared_ptr<Runnable> callback, Duration interval,
            JobMetadata metadata = JobMetadata::object(), bool enabled = true);

  JobId add(const std::string &name, const std::string &jobType,
            JobCallback callback, Duration interval,
            JobMetadata metadata = JobMetadata::object(), bool enabled = true);

  // Each returns false when the id is unknown
  bool remove(const JobId &jobId);
  bool enable(const JobId &jobId);
  bool disable(const JobId &jobId);

  // Removes every job, returns how many were removed
  size_t clear();

  std::vector<JobSnapshot> list() const;
  std::optional<JobSnapshot> get(const JobId &jobId) const;
  size_t size() const;
  RegistryCounts counts() const;

  std::shared_ptr<Clock> clock() const { return clock_; }
  ReenablePolicy reenablePolicy() const { return reenablePolicy_; }
  std::chrono::milliseconds lockTimeout() const { return lockTimeout_; }

  // dueJobs() and beginRun() take the lock with a timeout and throw
  // LockTimeoutException when it cannot be acquired.

  // Ids of jobs that are enabled and due at `now`, in insertion order
  std::vector<JobId> dueJobs(TimePoint now) const;

  // Re-checks the job is still registered, enabled and due, then marks it
  // running with last run = `now`. Empty when the job must be skipped.
  std::optional<JobDispatch> beginRun(const JobId &jobId, TimePoint now);

  // Records the outcome and sets next run = last run + interval. A job
  // removed while running is ignored. Waits for the lock without a timeout
  // so an attempt that already ran is always recorded.
  void completeRun(const JobDispatch &dispatch, Duration elapsed,
                   const std::optional<std::string> &error);

private:
  std::shared_ptr<Job> findLocked(const JobId &jobId) const;
  JobId generateJobIdLocked();

  std::shared_ptr<Clock> clock_;
  ReenablePolicy reenablePolicy_;
  std::chrono::milliseconds lockTimeout_;

  mutable std::timed_mutex mutex_;
  std::vector<std::shared_ptr<Job>> jobs_;
  std::unordered_map<JobId, std::shared_ptr<Job>> index_;
};

} // namespace autoflow
