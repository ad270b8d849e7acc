#pragma once
/** @file  ScheduleJson.hpp
 *  @brief nlohmann::json conversions for the aggregate and its read views.
 *
 *  © 2025 RollStart contributors — MIT-licensed.
 */

#include <nlohmann/json.hpp>

#include "core/ScheduleViews.hpp"
#include "core/StartSchedule.hpp"
#include "protocols/SequenceProfile.hpp"

namespace rollstart::protocols {
  void to_json(nlohmann::json& j, const SequenceProfile& p);
  void from_json(const nlohmann::json& j, SequenceProfile& p);
} // namespace rollstart::protocols

namespace rollstart::core {

  // Times travel as ISO-8601 UTC strings, absent optionals as null.
  void to_json(nlohmann::json& j, const FleetStartEntry& e);
  void from_json(const nlohmann::json& j, FleetStartEntry& e);

  void to_json(nlohmann::json& j, const StartSchedule& s);
  void from_json(const nlohmann::json& j, StartSchedule& s);

  void to_json(nlohmann::json& j, const ScheduleStatusSummary& s);
  void to_json(nlohmann::json& j, const TimelineRow& r);
  void to_json(nlohmann::json& j, const Countdown& c);

} // namespace rollstart::core
