#pragma once
/** @file  FakeClock.hpp
 *  @brief Clock derivative whose "now" is set by the test.
 *
 *  © 2025 RollStart contributors — MIT-licensed.
 */

#include <mutex>

#include "core/Clock.hpp"
#include "core/TimeUtil.hpp"

namespace rollstart {
  namespace test {

    class FakeClock : public rollstart::core::Clock {
    public:
      explicit FakeClock(core::TimePoint start = {}) : now_(start) {}

      core::TimePoint now() const override {
        std::lock_guard<std::mutex> lock(mtx_);
        return now_;
      }

      void set(core::TimePoint t) {
        std::lock_guard<std::mutex> lock(mtx_);
        now_ = t;
      }

      void advance(std::chrono::seconds by) {
        std::lock_guard<std::mutex> lock(mtx_);
        now_ += by;
      }

    private:
      mutable std::mutex mtx_;
      core::TimePoint now_;
    };

  } // namespace test
} // namespace rollstart
