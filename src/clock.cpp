#include "clock.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace autoflow {

ManualClock::ManualClock(TimePoint start) : current_(start) {}

TimePoint ManualClock::now() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_;
}

void ManualClock::set(TimePoint timePoint) {
  std::lock_guard<std::mutex> lock(mutex_);
  current_ = timePoint;
}

void ManualClock::advance(Duration delta) {
  std::lock_guard<std::mutex> lock(mutex_);
  current_ += delta;
}

std::shared_ptr<Clock> makeSystemClock() {
  return std::make_shared<SystemClock>();
}

std::string formatTimePoint(TimePoint timePoint) {
  auto time = std::chrono::system_clock::to_time_t(timePoint);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                timePoint.time_since_epoch()) %
            1000;
  if (ms.count() < 0) {
    ms += std::chrono::milliseconds(1000);
  }

  std::tm localTime{};
  localtime_r(&time, &localTime);

  std::ostringstream oss;
  oss << std::put_time(&localTime, "%Y-%m-%dT%H:%M:%S") << "."
      << std::setfill('0') << std::setw(3) << ms.count();
  return oss.str();
}

int localHourOf(TimePoint timePoint) {
  auto time = std::chrono::system_clock::to_time_t(timePoint);
  std::tm localTime{};
  localtime_r(&time, &localTime);
  return localTime.tm_hour;
}

} // namespace autoflow
