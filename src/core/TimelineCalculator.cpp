/* @file TimelineCalculator.cpp
 * @brief rolling-chain planned times
 *
 * © 2025 RollStart contributors — MIT-licensed.
 */

#include <algorithm>

#include "core/TimelineCalculator.hpp"

using rollstart::protocols::SequenceProfile;
using rollstart::protocols::Stage;

namespace rollstart::core {

  TimePoint chainedWarning(TimePoint previousStart, std::optional<int> customIntervalMinutes,
                           const TimelineOptions& options) {
    if (!customIntervalMinutes)
      return previousStart;

    const Minutes custom{ *customIntervalMinutes };
    if (options.policy == IntervalPolicy::Add)
      return previousStart + custom;

    // start-to-start gap; never warn before the previous gun
    return std::max(previousStart + custom - options.defaultInterval, previousStart);
  }

  void planFromWarning(FleetStartEntry& entry, TimePoint warning, const SequenceProfile& profile) {
    const TimePoint start = warning + profile.warningOffset;
    entry.plannedWarningTime = warning;
    entry.plannedStartTime = start;
    entry.plannedPrepTime.reset();
    entry.plannedOneMinuteTime.reset();
    if (profile.hasStage(Stage::Preparatory))
      entry.plannedPrepTime = start - profile.offsetOf(Stage::Preparatory);
    if (profile.hasStage(Stage::OneMinute))
      entry.plannedOneMinuteTime = start - profile.offsetOf(Stage::OneMinute);
  }

  std::optional<TimePoint> effectiveStart(const FleetStartEntry& entry,
                                          const SequenceProfile& profile) {
    if (entry.actualStartTime)
      return entry.actualStartTime;
    if (entry.actualWarningTime)
      return *entry.actualWarningTime + profile.warningOffset;
    return entry.plannedStartTime;
  }

  std::vector<FleetStartEntry> recomputeTimeline(std::vector<FleetStartEntry> entries,
                                                 TimePoint firstWarningTime,
                                                 const SequenceProfile& profile,
                                                 const TimelineOptions& options) {
    std::stable_sort(entries.begin(), entries.end(),
                     [](const FleetStartEntry& a, const FleetStartEntry& b) {
                       return a.startOrder < b.startOrder;
                     });

    std::optional<TimePoint> previousStart;
    std::optional<int> previousCustom;

    for (auto& entry : entries) {
      switch (entry.status) {
      case FleetStatus::Postponed:
      case FleetStatus::Abandoned:
      case FleetStatus::GeneralRecall:
        continue;

      case FleetStatus::Pending: {
        TimePoint warning = previousStart
                                ? chainedWarning(*previousStart, previousCustom, options)
                                : firstWarningTime;
        if (entry.anchorWarningTime && *entry.anchorWarningTime > warning)
          warning = *entry.anchorWarningTime;
        planFromWarning(entry, warning, profile);
        previousStart = entry.plannedStartTime;
        previousCustom = entry.customIntervalMinutes;
        break;
      }

      default:
        if (auto start = effectiveStart(entry, profile)) {
          previousStart = start;
          previousCustom = entry.customIntervalMinutes;
        }
        break;
      }
    }
    return entries;
  }

} // namespace rollstart::core
