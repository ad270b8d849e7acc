#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Central fault aggregator & escalation helper.
 *
 *  © 2025 RollStart contributors — MIT-licensed.
 */

#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace rollstart::core {

  /**
 * @class ErrorMonitor
 * @brief Scheduler, stores and sinks call `notifyFailure()`; we call the registered
 *        escalation callback exactly once per unique error.
 *
 * * Thread-safe (mutex-protected vector).
 * * Debounces duplicate failures so SystemCoordinator doesn’t get spammed.
 * * Domain rule violations are not faults and never arrive here.
 */
  class ErrorMonitor {
  public:
    ErrorMonitor() = default;
    virtual ~ErrorMonitor() = default;

    /// Register a lambda that escalates a fault to SystemCoordinator.
    void registerEscalation(std::function<void(const std::string&)> cb);

    /// Called by subsystems on fault; will forward to the escalation callback.
    virtual void notifyFailure(const std::string& message);

    /// Unique failures seen so far, oldest first.
    std::vector<std::string> failures() const;

  private:
    void forwardIfNew(const std::string& message);

    std::function<void(const std::string&)> escalation_{};
    std::vector<std::string> seen_; ///< de-dupe list
    mutable std::mutex mtx_;
  };

} // namespace rollstart::core
