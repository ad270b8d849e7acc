/* @file ErrorMonitor.cpp
 * @brief de-duplicating fault escalation
 *
 * © 2025 RollStart contributors — MIT-licensed.
 */

#include <algorithm>
#include <iostream>

#include "core/ErrorMonitor.hpp"

namespace rollstart {
  namespace core {

    void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
      std::lock_guard<std::mutex> lock(mtx_);
      escalation_ = std::move(cb);
    }

    void ErrorMonitor::notifyFailure(const std::string& message) {
      std::cerr << message << '\n';
      forwardIfNew(message);
    }

    std::vector<std::string> ErrorMonitor::failures() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return seen_;
    }

    void ErrorMonitor::forwardIfNew(const std::string& message) {
      std::function<void(const std::string&)> escalate;
      {
        std::lock_guard<std::mutex> lock(mtx_);
        if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
          return;
        seen_.push_back(message);
        escalate = escalation_;
      }
      // outside the lock: the callback may call back into us
      if (escalate)
        escalate(message);
    }

  } // namespace core
} // namespace rollstart
