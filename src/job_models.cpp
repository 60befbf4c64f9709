#include "job_models.hpp"
#include <utility>

namespace autoflow {

std::string jobStateToString(JobState state) {
  switch (state) {
  case JobState::SCHEDULED:
    return "scheduled";
  case JobState::RUNNING:
    return "running";
  default:
    return "unknown";
  }
}

FunctionRunnable::FunctionRunnable(JobCallback callback)
    : callback_(std::move(callback)) {}

void FunctionRunnable::run(const JobMetadata &metadata) {
  if (callback_) {
    callback_(metadata);
  }
}

nlohmann::json JobSnapshot::toJson() const {
  nlohmann::json json = {{"id", id},
                         {"name", name},
                         {"type", jobType},
                         {"interval_ms", interval.count()},
                         {"enabled", enabled},
                         {"state", jobStateToString(state)},
                         {"created_at", formatTimePoint(createdAt)},
                         {"next_run", formatTimePoint(nextRun)},
                         {"metadata", metadata},
                         {"run_count", runCount},
                         {"failure_count", failureCount},
                         {"last_duration_ms", lastDuration.count()}};

  json["last_run"] =
      lastRun ? nlohmann::json(formatTimePoint(*lastRun)) : nlohmann::json();
  json["last_error"] = lastError ? nlohmann::json(*lastError) : nlohmann::json();
  return json;
}

JobSnapshot Job::snapshot() const {
  JobSnapshot snap;
  snap.id = id;
  snap.name = name;
  snap.jobType = jobType;
  snap.interval = interval;
  snap.enabled = enabled;
  snap.state = state;
  snap.createdAt = createdAt;
  snap.lastRun = lastRun;
  snap.nextRun = nextRun;
  snap.metadata = metadata ? *metadata : JobMetadata::object();
  snap.runCount = runCount;
  snap.failureCount = failureCount;
  snap.lastError = lastError;
  snap.lastDuration = lastDuration;
  return snap;
}

} // namespace autoflow
