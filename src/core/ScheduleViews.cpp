/* @file ScheduleViews.cpp
 * @brief status summary, timeline and countdown projections
 *
 * © 2025 RollStart contributors — MIT-licensed.
 */

#include <algorithm>

#include "core/ScheduleViews.hpp"
#include "core/TimelineCalculator.hpp"

using rollstart::protocols::SequenceProfile;
using rollstart::protocols::Stage;

namespace rollstart::core {

  const char* toString(TimelinePhase phase) {
    switch (phase) {
    case TimelinePhase::Completed:
      return "completed";
    case TimelinePhase::Active:
      return "active";
    case TimelinePhase::Upcoming:
      return "upcoming";
    case TimelinePhase::Pending:
      return "pending";
    case TimelinePhase::Postponed:
      return "postponed";
    case TimelinePhase::Abandoned:
      return "abandoned";
    default:
      return "unknown";
    }
  }

  const char* toString(CountdownPhase phase) {
    switch (phase) {
    case CountdownPhase::Warning:
      return "warning";
    case CountdownPhase::Preparatory:
      return "preparatory";
    case CountdownPhase::Final:
      return "final";
    case CountdownPhase::Start:
      return "start";
    default:
      return "unknown";
    }
  }

  ScheduleStatusSummary summarize(const StartSchedule& schedule) {
    ScheduleStatusSummary out;
    out.scheduleId = schedule.id;
    out.regattaId = schedule.regattaId;
    out.scheduleName = schedule.name;
    out.scheduledDate = schedule.scheduledDate;
    out.status = schedule.status;
    out.sequenceType = schedule.sequenceType;
    out.startIntervalMinutes = schedule.startIntervalMinutes;
    out.firstWarningTime = schedule.firstWarningTime;
    out.totalFleets = static_cast<int>(schedule.entries.size());

    for (const auto& e : schedule.entries) {
      if (e.recallCount > 0)
        ++out.fleetsRecalled;

      switch (e.status) {
      case FleetStatus::Started:
        ++out.fleetsStarted;
        break;
      case FleetStatus::Pending:
        ++out.fleetsPending;
        if (!out.nextFleet) {
          out.nextFleet = e.fleetName;
          out.nextWarningTime = e.plannedWarningTime;
        }
        break;
      case FleetStatus::Postponed:
        ++out.fleetsPostponed;
        break;
      case FleetStatus::Abandoned:
        ++out.fleetsAbandoned;
        break;
      default:
        if (isInSequence(e.status))
          ++out.fleetsInSequence;
        break;
      }
    }
    return out;
  }

  std::vector<TimelineRow> projectTimeline(const StartSchedule& schedule,
                                           const SequenceProfile& profile) {
    std::vector<TimelineRow> rows;
    rows.reserve(schedule.entries.size());
    bool upcomingSeen = false;

    for (const auto& e : schedule.entries) {
      TimelineRow row;
      row.entryId = e.id;
      row.fleetName = e.fleetName;
      row.classFlag = e.classFlag;
      row.startOrder = e.startOrder;
      row.raceNumber = e.raceNumber;
      row.status = e.status;
      row.effectiveWarningTime = e.actualWarningTime ? e.actualWarningTime : e.plannedWarningTime;
      row.effectiveStartTime = effectiveStart(e, profile);

      if (e.status == FleetStatus::Started) {
        row.phase = TimelinePhase::Completed;
      } else if (isInSequence(e.status)) {
        row.phase = TimelinePhase::Active;
      } else if (e.status == FleetStatus::Postponed) {
        row.phase = TimelinePhase::Postponed;
      } else if (e.status == FleetStatus::Abandoned) {
        row.phase = TimelinePhase::Abandoned;
      } else if (!upcomingSeen) {
        row.phase = TimelinePhase::Upcoming;
        upcomingSeen = true;
      } else {
        row.phase = TimelinePhase::Pending;
      }
      rows.push_back(std::move(row));
    }
    return rows;
  }

  std::optional<Countdown> countdown(const FleetStartEntry& entry, const SequenceProfile& profile,
                                     TimePoint now) {
    if (!entry.actualWarningTime || !isInSequence(entry.status))
      return std::nullopt;

    using std::chrono::seconds;
    Countdown out;
    out.entryId = entry.id;
    out.total = profile.warningOffset;

    const seconds elapsed = now - *entry.actualWarningTime;
    if (elapsed >= out.total) {
      out.phase = CountdownPhase::Start;
      out.remaining = seconds::zero();
      return out;
    }

    out.remaining = out.total - std::max(elapsed, seconds::zero());
    const seconds finalWindow = profile.hasStage(Stage::OneMinute)
                                    ? seconds{ profile.offsetOf(Stage::OneMinute) }
                                    : seconds{ 60 };

    if (out.remaining <= finalWindow)
      out.phase = CountdownPhase::Final;
    else if (profile.hasStage(Stage::Preparatory) &&
             out.remaining <= seconds{ profile.offsetOf(Stage::Preparatory) })
      out.phase = CountdownPhase::Preparatory;
    else
      out.phase = CountdownPhase::Warning;
    return out;
  }

} // namespace rollstart::core
