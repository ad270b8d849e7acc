#pragma once
/** @file  TimeUtil.hpp
 *  @brief Second-resolution UTC time points and their text forms.
 *
 *  © 2025 RollStart contributors — MIT-licensed.
 */

#include <chrono>
#include <string>

namespace rollstart {
  namespace core {

    using TimePoint = std::chrono::sys_seconds;
    using Minutes = std::chrono::minutes;

    /// "2025-06-14T10:05:00Z"
    std::string toIso(TimePoint t);

    /// Parses "YYYY-MM-DDTHH:MM[:SS][Z]" as UTC; throws ScheduleError(InvalidArgument).
    TimePoint parseIso(const std::string& text);

    /// Combines a "YYYY-MM-DD" date with a "HH:MM" time of day (UTC).
    TimePoint atTimeOfDay(const std::string& date, const std::string& hhmm);

  } // namespace core
} // namespace rollstart
