#pragma once
/** @file  TimelineCalculator.hpp
 *  @brief Pure planned-time computation for the rolling start chain.
 *
 *  © 2025 RollStart contributors — MIT-licensed.
 */

#include <optional>
#include <vector>

#include "core/StartSchedule.hpp"
#include "protocols/SequenceProfile.hpp"

namespace rollstart::core {

  struct TimelineOptions {
    Minutes defaultInterval{ 5 }; ///< StartSchedule::startIntervalMinutes
    IntervalPolicy policy{ IntervalPolicy::Replace };
  };

  /**
   * @brief Recompute planned signal times of every `Pending` entry.
   *
   * Entries are walked in `startOrder`. The first chained entry warns at
   * \p firstWarningTime, every later one at its predecessor's start (rolling chain)
   * unless the predecessor carries a custom interval. Postponed, abandoned and
   * recalled entries are skipped; entries already signaled anchor the chain with
   * their effective start and are returned untouched.
   */
  std::vector<FleetStartEntry> recomputeTimeline(std::vector<FleetStartEntry> entries,
                                                 TimePoint firstWarningTime,
                                                 const protocols::SequenceProfile& profile,
                                                 const TimelineOptions& options);

  /// Warning time of the entry after one starting at \p previousStart.
  TimePoint chainedWarning(TimePoint previousStart, std::optional<int> customIntervalMinutes,
                           const TimelineOptions& options);

  /// Actual start, else actual warning + sequence length, else planned start.
  std::optional<TimePoint> effectiveStart(const FleetStartEntry& entry,
                                          const protocols::SequenceProfile& profile);

  /// Fill planned times from a warning time.
  void planFromWarning(FleetStartEntry& entry, TimePoint warning,
                       const protocols::SequenceProfile& profile);

} // namespace rollstart::core
