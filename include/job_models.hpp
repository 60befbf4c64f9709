#pragma once

#include "clock.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace autoflow {

using JobId = std::string;

// Invocation parameters handed to a job body; always a JSON object
using JobMetadata = nlohmann::json;

enum class JobState { SCHEDULED, RUNNING };

std::string jobStateToString(JobState state);

/**
 * Unit of work wrapped by a job. Implementations signal failure by throwing;
 * returning normally counts as success.
 */
class Runnable {
public:
  virtual ~Runnable() = default;
  virtual void run(const JobMetadata &metadata) = 0;
};

using JobCallback = std::function<void(const JobMetadata &)>;

// Adapts a plain callable to the Runnable interface
class FunctionRunnable : public Runnable {
public:
  explicit FunctionRunnable(JobCallback callback);

  void run(const JobMetadata &metadata) override;

private:
  JobCallback callback_;
};

// Point-in-time copy of a job, safe to hold after the job is removed
struct JobSnapshot {
  JobId id;
  std::string name;
  std::string jobType;
  Duration interval{0};
  bool enabled = true;
  JobState state = JobState::SCHEDULED;
  TimePoint createdAt;
  std::optional<TimePoint> lastRun;
  TimePoint nextRun;
  JobMetadata metadata = JobMetadata::object();

  uint64_t runCount = 0;
  uint64_t failureCount = 0;
  std::optional<std::string> lastError;
  Duration lastDuration{0};

  nlohmann::json toJson() const;
};

// Registry-owned job record. Mutable fields are guarded by the registry lock.
struct Job {
  JobId id;
  std::string name;
  std::string jobType;
  std::shared_ptr<Runnable> callback;
  Duration interval{0};
  std::shared_ptr<const JobMetadata> metadata;
  TimePoint createdAt;

  bool enabled = true;
  JobState state = JobState::SCHEDULED;
  std::optional<TimePoint> lastRun;
  TimePoint nextRun;

  uint64_t runCount = 0;
  uint64_t failureCount = 0;
  std::optional<std::string> lastError;
  Duration lastDuration{0};

  bool isDue(TimePoint now) const { return enabled && nextRun <= now; }
  JobSnapshot snapshot() const;
};

} // namespace autoflow
