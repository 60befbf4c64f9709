#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace autoflow {

using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;

// Time source for due-time decisions and job timestamps
class Clock {
public:
  virtual ~Clock() = default;
  virtual TimePoint now() const = 0;
};

class SystemClock : public Clock {
public:
  TimePoint now() const override { return std::chrono::system_clock::now(); }
};

/**
 * Clock that only moves when told to. Lets callers drive the scheduler
 * through hours of simulated time without sleeping.
 */
class ManualClock : public Clock {
public:
  explicit ManualClock(TimePoint start = std::chrono::system_clock::now());

  TimePoint now() const override;
  void set(TimePoint timePoint);
  void advance(Duration delta);

private:
  mutable std::mutex mutex_;
  TimePoint current_;
};

std::shared_ptr<Clock> makeSystemClock();

// ISO-8601 local time with millisecond precision
std::string formatTimePoint(TimePoint timePoint);

// Local hour of day in [0, 23]
int localHourOf(TimePoint timePoint);

} // namespace autoflow
