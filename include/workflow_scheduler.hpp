#pragma once

#include "config_manager.hpp"
#include "job_registry.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <thread>

namespace autoflow {

struct SchedulerStatus {
  bool running = false;
  size_t totalJobs = 0;
  size_t enabledJobs = 0;
  size_t disabledJobs = 0;

  bool loopThreadAlive = false;
  uint64_t tickCount = 0;
  uint64_t loopFaultCount = 0;
  uint64_t executedRuns = 0;
  uint64_t failedRuns = 0;

  nlohmann::json toJson() const;
};

/**
 * Runs due jobs of a JobRegistry on one background thread.
 *
 * Every tick captures the registry clock once, then executes each enabled
 * job whose next run is at or before that instant, one at a time in
 * registration order. A throwing job is logged and counted, and its next run
 * still advances by its interval. Faults in the tick itself make the loop
 * back off for errorBackoffMultiplier ticks before retrying.
 */
class WorkflowScheduler {
public:
  explicit WorkflowScheduler(std::shared_ptr<JobRegistry> registry,
                             SchedulerConfig config = SchedulerConfig());
  // Stops the loop and joins it, even past a stop() that timed out
  ~WorkflowScheduler();

  WorkflowScheduler(const WorkflowScheduler &) = delete;
  WorkflowScheduler &operator=(const WorkflowScheduler &) = delete;

  // Returns true when the loop is running afterwards. Idempotent.
  bool start();

  // Waits up to config().stopTimeout for the loop to exit
  bool stop();

  // False when the loop did not exit in time. It still exits on its own
  // once the running job returns.
  bool stop(std::chrono::milliseconds timeout);

  bool isRunning() const { return running_.load(); }
  SchedulerStatus status() const;

  // One tick on the calling thread. Returns the number of jobs executed.
  size_t runPendingJobs();

  std::shared_ptr<JobRegistry> registry() const { return registry_; }
  const SchedulerConfig &config() const { return config_; }

private:
  void loop();
  void executeJob(const JobDispatch &dispatch);

  std::shared_ptr<JobRegistry> registry_;
  SchedulerConfig config_;

  std::atomic<bool> running_{false};
  std::atomic<bool> loopActive_{false};

  // Serializes start/stop
  std::mutex lifecycleMutex_;
  // Guards the loop sleep and loop exit handshakes
  std::mutex loopMutex_;
  std::condition_variable wakeCondition_;
  std::condition_variable loopExitCondition_;
  // Keeps ticks from overlapping when runPendingJobs() is called externally
  std::mutex tickMutex_;

  std::thread loopThread_;
  std::atomic<std::thread::id> loopThreadId_{};

  std::atomic<uint64_t> tickCount_{0};
  std::atomic<uint64_t> loopFaultCount_{0};
  std::atomic<uint64_t> executedRuns_{0};
  std::atomic<uint64_t> failedRuns_{0};
};

} // namespace autoflow
