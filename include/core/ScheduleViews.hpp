#pragma once
/** @file  ScheduleViews.hpp
 *  @brief Read-only projections of a StartSchedule: status summary, timeline, countdown.
 *
 *  © 2025 RollStart contributors — MIT-licensed.
 */

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "core/StartSchedule.hpp"
#include "protocols/SequenceProfile.hpp"

namespace rollstart::core {

  struct ScheduleStatusSummary {
    std::string scheduleId;
    std::string regattaId;
    std::string scheduleName;
    std::string scheduledDate;
    ScheduleStatus status{ ScheduleStatus::Draft };
    std::string sequenceType;
    int startIntervalMinutes{ 0 };
    TimePoint firstWarningTime{};
    int totalFleets{ 0 };
    int fleetsStarted{ 0 };
    int fleetsPending{ 0 };
    int fleetsInSequence{ 0 };
    int fleetsRecalled{ 0 }; ///< entries with at least one general recall
    int fleetsPostponed{ 0 };
    int fleetsAbandoned{ 0 };
    std::optional<TimePoint> nextWarningTime;
    std::optional<std::string> nextFleet;
  };

  enum class TimelinePhase { Completed, Active, Upcoming, Pending, Postponed, Abandoned };

  const char* toString(TimelinePhase phase);

  struct TimelineRow {
    std::string entryId;
    std::string fleetName;
    std::string classFlag;
    int startOrder{ 0 };
    int raceNumber{ 0 };
    FleetStatus status{ FleetStatus::Pending };
    std::optional<TimePoint> effectiveWarningTime; ///< actual if signaled, planned otherwise
    std::optional<TimePoint> effectiveStartTime;
    TimelinePhase phase{ TimelinePhase::Pending };
  };

  enum class CountdownPhase { Warning, Preparatory, Final, Start };

  const char* toString(CountdownPhase phase);

  struct Countdown {
    std::string entryId;
    CountdownPhase phase{ CountdownPhase::Warning };
    std::chrono::seconds remaining{ 0 };
    std::chrono::seconds total{ 0 };
  };

  ScheduleStatusSummary summarize(const StartSchedule& schedule);

  std::vector<TimelineRow> projectTimeline(const StartSchedule& schedule,
                                           const protocols::SequenceProfile& profile);

  /// Countdown to the start gun of an entry in sequence; nullopt before its warning.
  std::optional<Countdown> countdown(const FleetStartEntry& entry,
                                     const protocols::SequenceProfile& profile, TimePoint now);

} // namespace rollstart::core
