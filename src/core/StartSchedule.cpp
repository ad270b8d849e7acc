/* @file StartSchedule.cpp
 * @brief enum names and aggregate helpers
 *
 * © 2025 RollStart contributors — MIT-licensed.
 */

#include <algorithm>

#include "core/StartSchedule.hpp"

namespace rollstart::core {

  const char* toString(ScheduleStatus s) {
    switch (s) {
    case ScheduleStatus::Draft:
      return "draft";
    case ScheduleStatus::Ready:
      return "ready";
    case ScheduleStatus::Active:
      return "active";
    case ScheduleStatus::Completed:
      return "completed";
    default:
      return "unknown";
    }
  }

  const char* toString(FleetStatus s) {
    switch (s) {
    case FleetStatus::Pending:
      return "pending";
    case FleetStatus::Warning:
      return "warning";
    case FleetStatus::Preparatory:
      return "preparatory";
    case FleetStatus::OneMinute:
      return "one_minute";
    case FleetStatus::Started:
      return "started";
    case FleetStatus::GeneralRecall:
      return "general_recall";
    case FleetStatus::Postponed:
      return "postponed";
    case FleetStatus::Abandoned:
      return "abandoned";
    default:
      return "unknown";
    }
  }

  const char* toString(IntervalPolicy p) {
    return p == IntervalPolicy::Add ? "add" : "replace";
  }

  std::optional<ScheduleStatus> scheduleStatusFromString(std::string_view text) {
    for (auto s : { ScheduleStatus::Draft, ScheduleStatus::Ready, ScheduleStatus::Active,
                    ScheduleStatus::Completed }) {
      if (text == toString(s))
        return s;
    }
    return std::nullopt;
  }

  std::optional<FleetStatus> fleetStatusFromString(std::string_view text) {
    for (std::uint8_t i = 0; i < static_cast<std::uint8_t>(FleetStatus::Count); ++i) {
      const auto s = static_cast<FleetStatus>(i);
      if (text == toString(s))
        return s;
    }
    return std::nullopt;
  }

  std::optional<IntervalPolicy> intervalPolicyFromString(std::string_view text) {
    if (text == "replace")
      return IntervalPolicy::Replace;
    if (text == "add")
      return IntervalPolicy::Add;
    return std::nullopt;
  }

  void FleetStartEntry::clearActualTimes() {
    actualWarningTime.reset();
    actualPrepTime.reset();
    actualOneMinuteTime.reset();
    actualStartTime.reset();
  }

  FleetStartEntry* StartSchedule::findEntry(const std::string& entryId) {
    auto it = std::find_if(entries.begin(), entries.end(),
                           [&](const FleetStartEntry& e) { return e.id == entryId; });
    return it == entries.end() ? nullptr : &*it;
  }

  const FleetStartEntry* StartSchedule::findEntry(const std::string& entryId) const {
    auto it = std::find_if(entries.begin(), entries.end(),
                           [&](const FleetStartEntry& e) { return e.id == entryId; });
    return it == entries.end() ? nullptr : &*it;
  }

  void StartSchedule::compactStartOrder() {
    int order = 1;
    for (auto& e : entries)
      e.startOrder = order++;
  }

} // namespace rollstart::core
