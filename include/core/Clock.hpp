#pragma once
/** @file  Clock.hpp
 *  @brief "Now" for recorded signal times. Never drives a transition on its own.
 *
 *  © 2025 RollStart contributors — MIT-licensed.
 */

#include <chrono>

#include "core/TimeUtil.hpp"

namespace rollstart::core {

  class Clock {
  public:
    virtual ~Clock() = default;
    virtual TimePoint now() const = 0;
  };

  class SystemClock : public Clock {
  public:
    TimePoint now() const override {
      return std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    }
  };

} // namespace rollstart::core
