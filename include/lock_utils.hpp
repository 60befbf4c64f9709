#pragma once

#include "scheduler_exceptions.hpp"
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>

namespace autoflow {

/**
 * @brief Exception thrown when lock acquisition times out
 */
class LockTimeoutException : public SystemException {
public:
  LockTimeoutException(const std::string &message, const std::string &lockName)
      : SystemException(ErrorCode::LOCK_TIMEOUT, message, "LockUtils",
                        {{"lock", lockName}}) {}
};

/**
 * @brief RAII lock helper with a bounded wait
 *
 * Throws LockTimeoutException instead of blocking forever when the mutex
 * cannot be acquired within the timeout.
 */
template <typename Mutex> class ScopedTimedLock {
public:
  using mutex_type = Mutex;

  /**
   * @brief Construct lock with timeout
   * @param mutex The mutex to lock
   * @param timeout Maximum time to wait for lock acquisition
   * @param lockName Optional name for diagnostics
   */
  explicit ScopedTimedLock(
      Mutex &mutex,
      std::chrono::milliseconds timeout = std::chrono::milliseconds(5000),
      const std::string &lockName = "")
      : mutex_(mutex), locked_(false),
        lockName_(lockName.empty() ? generateLockName() : lockName) {
    if constexpr (std::is_same_v<Mutex, std::mutex> ||
                  std::is_same_v<Mutex, std::recursive_mutex>) {
      // Plain mutexes have no try_lock_for, poll instead
      auto endTime = std::chrono::steady_clock::now() + timeout;
      while (std::chrono::steady_clock::now() < endTime) {
        if (mutex_.try_lock()) {
          locked_ = true;
          break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
      }
    } else {
      locked_ = mutex_.try_lock_for(timeout);
    }

    if (!locked_) {
      throw LockTimeoutException("Failed to acquire lock '" + lockName_ +
                                     "' within " +
                                     std::to_string(timeout.count()) + "ms",
                                 lockName_);
    }
  }

  ~ScopedTimedLock() {
    if (locked_) {
      mutex_.unlock();
    }
  }

  ScopedTimedLock(const ScopedTimedLock &) = delete;
  ScopedTimedLock &operator=(const ScopedTimedLock &) = delete;
  ScopedTimedLock(ScopedTimedLock &&) = delete;
  ScopedTimedLock &operator=(ScopedTimedLock &&) = delete;

  bool owns_lock() const { return locked_; }
  const std::string &getLockName() const { return lockName_; }

private:
  Mutex &mutex_;
  bool locked_;
  std::string lockName_;

  std::string generateLockName() const {
    return "lock_" + std::to_string(reinterpret_cast<std::uintptr_t>(&mutex_));
  }
};

} // namespace autoflow
