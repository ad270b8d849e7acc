/* @file ScheduleEvent.cpp
 * @brief event type names
 *
 * © 2025 RollStart contributors — MIT-licensed.
 */

#include "core/ScheduleEvent.hpp"

const char* rollstart::core::toString(EventType type) {
  switch (type) {
  case EventType::ScheduleCreated:
    return "ScheduleCreated";
  case EventType::ScheduleUpdated:
    return "ScheduleUpdated";
  case EventType::FleetsAdded:
    return "FleetsAdded";
  case EventType::FleetUpdated:
    return "FleetUpdated";
  case EventType::FleetRemoved:
    return "FleetRemoved";
  case EventType::FleetsReordered:
    return "FleetsReordered";
  case EventType::ScheduleReady:
    return "ScheduleReady";
  case EventType::SequenceStarted:
    return "SequenceStarted";
  case EventType::WarningSignaled:
    return "WarningSignaled";
  case EventType::PreparatorySignaled:
    return "PreparatorySignaled";
  case EventType::OneMinuteSignaled:
    return "OneMinuteSignaled";
  case EventType::StartSignaled:
    return "StartSignaled";
  case EventType::GeneralRecall:
    return "GeneralRecall";
  case EventType::IndividualRecall:
    return "IndividualRecall";
  case EventType::Postponed:
    return "Postponed";
  case EventType::Resumed:
    return "Resumed";
  case EventType::Abandoned:
    return "Abandoned";
  case EventType::ScheduleCompleted:
    return "ScheduleCompleted";
  case EventType::ScheduleDeleted:
    return "ScheduleDeleted";
  default:
    return "Unknown";
  }
}
