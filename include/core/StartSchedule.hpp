#pragma once
/** @file  StartSchedule.hpp
 *  @brief Aggregate root (StartSchedule) and its owned FleetStartEntry records.
 *
 *  © 2025 RollStart contributors — MIT-licensed.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/TimeUtil.hpp"
#include "protocols/SequenceProfile.hpp"

namespace rollstart {
  namespace core {

    enum class ScheduleStatus : std::uint8_t { Draft, Ready, Active, Completed, Count };

    enum class FleetStatus : std::uint8_t {
      Pending,
      Warning,
      Preparatory,
      OneMinute,
      Started,
      GeneralRecall,
      Postponed,
      Abandoned,
      Count
    };
    static_assert(static_cast<std::uint8_t>(FleetStatus::Count) == 8,
                  "FleetStatus count changed please update the transition table");

    /// How `customIntervalMinutes` bends the rolling chain.
    enum class IntervalPolicy : std::uint8_t {
      Replace, ///< custom interval is the start-to-start gap
      Add      ///< custom interval is dead time after the rolling chain
    };

    const char* toString(ScheduleStatus s);
    const char* toString(FleetStatus s);
    const char* toString(IntervalPolicy p);
    std::optional<ScheduleStatus> scheduleStatusFromString(std::string_view text);
    std::optional<FleetStatus> fleetStatusFromString(std::string_view text);
    std::optional<IntervalPolicy> intervalPolicyFromString(std::string_view text);

    /// warning, preparatory or one_minute: the fleet is mid-sequence.
    inline bool isInSequence(FleetStatus s) {
      return s == FleetStatus::Warning || s == FleetStatus::Preparatory ||
             s == FleetStatus::OneMinute;
    }

    /**
 * @struct FleetStartEntry
 * @brief One fleet's slot in the rolling start.
 *
 *  * planned* times are derived and rewritten by the timeline while `Pending`.
 *  * actual* times are written once by the matching signal; recall/postpone clear them.
 */
    struct FleetStartEntry {
      std::string id;
      std::string scheduleId;
      std::string fleetName;
      std::string classFlag;
      int startOrder{ 0 };
      int raceNumber{ 1 };

      std::optional<TimePoint> plannedWarningTime;
      std::optional<TimePoint> plannedPrepTime;
      std::optional<TimePoint> plannedOneMinuteTime;
      std::optional<TimePoint> plannedStartTime;

      std::optional<TimePoint> actualWarningTime;
      std::optional<TimePoint> actualPrepTime;
      std::optional<TimePoint> actualOneMinuteTime;
      std::optional<TimePoint> actualStartTime;

      FleetStatus status{ FleetStatus::Pending };
      int recallCount{ 0 };
      std::optional<TimePoint> lastRecallAt;
      std::string recallNotes;
      std::vector<std::string> ocsBoatIds; ///< individual recall (OCS) boats

      std::optional<int> customIntervalMinutes; ///< gap to the next entry
      std::optional<TimePoint> anchorWarningTime; ///< set by resume()

      void clearActualTimes();

      bool operator==(const FleetStartEntry&) const = default;
    };

    /**
 * @struct StartSchedule
 * @brief Ordered fleets plus global sequence configuration.
 *
 *  * `entries` is kept sorted by `startOrder`, which is dense (1..n) and unique.
 *  * `version` is the optimistic-concurrency token owned by the store.
 */
    struct StartSchedule {
      std::string id;
      std::string regattaId;
      std::string name;
      std::string scheduledDate; ///< YYYY-MM-DD
      std::string sequenceType{ "5-4-1-go" };
      std::optional<protocols::SequenceProfile> customProfile; ///< offsets for "custom"
      int startIntervalMinutes{ 5 };
      IntervalPolicy intervalPolicy{ IntervalPolicy::Replace };
      TimePoint firstWarningTime{};
      std::optional<TimePoint> actualFirstWarningTime;
      ScheduleStatus status{ ScheduleStatus::Draft };
      std::string notes;

      std::vector<FleetStartEntry> entries;
      int nextEntrySeq{ 1 };
      std::uint64_t version{ 0 };

      FleetStartEntry* findEntry(const std::string& entryId);
      const FleetStartEntry* findEntry(const std::string& entryId) const;

      /// Renumber `startOrder` 1..n following the vector order.
      void compactStartOrder();

      bool operator==(const StartSchedule&) const = default;
    };

    /// Input of `Scheduler::createSchedule`.
    struct ScheduleConfig {
      std::string regattaId;
      std::string name;
      std::string scheduledDate;
      std::string sequenceType{ "5-4-1-go" };
      std::optional<protocols::SequenceProfile> customProfile;
      int startIntervalMinutes{ 5 };
      std::optional<IntervalPolicy> intervalPolicy; ///< scheduler default when unset
      TimePoint firstWarningTime{};
      std::string notes;
    };

    /// Partial edit of a draft schedule; unset fields are left alone.
    struct ScheduleUpdate {
      std::optional<std::string> name;
      std::optional<std::string> scheduledDate; ///< moves firstWarningTime unless that is set too
      std::optional<std::string> sequenceType;
      std::optional<protocols::SequenceProfile> customProfile;
      std::optional<int> startIntervalMinutes;
      std::optional<IntervalPolicy> intervalPolicy;
      std::optional<TimePoint> firstWarningTime;
      std::optional<std::string> notes;
    };

    /// Input of `Scheduler::addFleets`.
    struct FleetSpec {
      std::string fleetName;
      std::string classFlag;
      int raceNumber{ 1 };
      std::optional<int> customIntervalMinutes;
    };

    /// Partial edit of a draft entry; unset fields are left alone.
    struct FleetUpdate {
      std::optional<std::string> fleetName;
      std::optional<std::string> classFlag;
      std::optional<int> raceNumber;
      std::optional<int> customIntervalMinutes;
      bool clearCustomInterval{ false };
    };

  } // namespace core
} // namespace rollstart
