#pragma once
/** @file  ScheduleEvent.hpp
 *  @brief Domain event emitted once per externally observable change, and its sink interface.
 *
 *  © 2025 RollStart contributors — MIT-licensed.
 */

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "core/TimeUtil.hpp"

namespace rollstart::core {

  enum class EventType : std::uint8_t {
    ScheduleCreated,
    ScheduleUpdated,
    FleetsAdded,
    FleetUpdated,
    FleetRemoved,
    FleetsReordered,
    ScheduleReady,
    SequenceStarted,
    WarningSignaled,
    PreparatorySignaled,
    OneMinuteSignaled,
    StartSignaled,
    GeneralRecall,
    IndividualRecall,
    Postponed,
    Resumed,
    Abandoned,
    ScheduleCompleted,
    ScheduleDeleted,
    Count
  };
  static_assert(static_cast<std::uint8_t>(EventType::Count) == 19,
                "EventType count changed please update toString() and the committee log");

  const char* toString(EventType type);

  /// `{eventType, scheduleId, entryId, timestamp, details}`; entryId is empty for schedule events.
  struct ScheduleEvent {
    EventType type{ EventType::ScheduleCreated };
    std::string scheduleId;
    std::string entryId;
    TimePoint timestamp{};
    nlohmann::json details = nlohmann::json::object();
  };

  /**
 * @class EventSink
 * @brief Receiver of committed events (committee log, broadcast channel).
 *
 *  * Called after the command has committed, still under its schedule lock.
 *  * A throwing sink is reported to ErrorMonitor; the command still succeeds.
 */
  class EventSink {
  public:
    virtual ~EventSink() = default;
    virtual void publish(const ScheduleEvent& event) = 0;
  };

} // namespace rollstart::core
