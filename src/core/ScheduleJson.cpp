/* @file ScheduleJson.cpp
 * @brief JSON mapping used by the file store and the console responses
 *
 * © 2025 RollStart contributors — MIT-licensed.
 */

#include "core/ScheduleJson.hpp"
#include "core/ScheduleError.hpp"

using nlohmann::json;

namespace {

  using rollstart::core::TimePoint;

  json timeOrNull(const std::optional<TimePoint>& t) {
    return t ? json(rollstart::core::toIso(*t)) : json(nullptr);
  }

  std::optional<TimePoint> optionalTime(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null())
      return std::nullopt;
    return rollstart::core::parseIso(j.at(key).get<std::string>());
  }

  template <typename T> std::optional<T> optionalValue(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null())
      return std::nullopt;
    return j.at(key).get<T>();
  }

  template <typename T> json valueOrNull(const std::optional<T>& v) {
    return v ? json(*v) : json(nullptr);
  }

  std::optional<int> minutesOf(const std::optional<rollstart::core::Minutes>& m) {
    if (!m)
      return std::nullopt;
    return static_cast<int>(m->count());
  }

} // namespace

namespace rollstart::protocols {

  void to_json(json& j, const SequenceProfile& p) {
    j = json{ { "name", p.name },
              { "warning", p.warningOffset.count() },
              { "preparatory", valueOrNull(minutesOf(p.prepOffset)) },
              { "oneMinute", valueOrNull(minutesOf(p.oneMinuteOffset)) } };
  }

  void from_json(const json& j, SequenceProfile& p) {
    p.name = j.value("name", std::string{});
    p.warningOffset = core::Minutes{ j.at("warning").get<int>() };
    p.prepOffset.reset();
    p.oneMinuteOffset.reset();
    if (auto prep = optionalValue<int>(j, "preparatory"))
      p.prepOffset = core::Minutes{ *prep };
    if (auto one = optionalValue<int>(j, "oneMinute"))
      p.oneMinuteOffset = core::Minutes{ *one };
  }

} // namespace rollstart::protocols

namespace rollstart::core {

  void to_json(json& j, const FleetStartEntry& e) {
    j = json{ { "id", e.id },
              { "scheduleId", e.scheduleId },
              { "fleetName", e.fleetName },
              { "classFlag", e.classFlag },
              { "startOrder", e.startOrder },
              { "raceNumber", e.raceNumber },
              { "status", toString(e.status) },
              { "plannedWarningTime", timeOrNull(e.plannedWarningTime) },
              { "plannedPrepTime", timeOrNull(e.plannedPrepTime) },
              { "plannedOneMinuteTime", timeOrNull(e.plannedOneMinuteTime) },
              { "plannedStartTime", timeOrNull(e.plannedStartTime) },
              { "actualWarningTime", timeOrNull(e.actualWarningTime) },
              { "actualPrepTime", timeOrNull(e.actualPrepTime) },
              { "actualOneMinuteTime", timeOrNull(e.actualOneMinuteTime) },
              { "actualStartTime", timeOrNull(e.actualStartTime) },
              { "recallCount", e.recallCount },
              { "lastRecallAt", timeOrNull(e.lastRecallAt) },
              { "recallNotes", e.recallNotes },
              { "ocsBoatIds", e.ocsBoatIds },
              { "customIntervalMinutes", valueOrNull(e.customIntervalMinutes) },
              { "anchorWarningTime", timeOrNull(e.anchorWarningTime) } };
  }

  void from_json(const json& j, FleetStartEntry& e) {
    e.id = j.at("id").get<std::string>();
    e.scheduleId = j.at("scheduleId").get<std::string>();
    e.fleetName = j.at("fleetName").get<std::string>();
    e.classFlag = j.value("classFlag", std::string{});
    e.startOrder = j.at("startOrder").get<int>();
    e.raceNumber = j.value("raceNumber", 1);

    const auto statusText = j.at("status").get<std::string>();
    auto status = fleetStatusFromString(statusText);
    if (!status)
      throw ScheduleError(ErrorCode::InvalidArgument, "[ScheduleJson] unknown fleet status: " + statusText);
    e.status = *status;

    e.plannedWarningTime = optionalTime(j, "plannedWarningTime");
    e.plannedPrepTime = optionalTime(j, "plannedPrepTime");
    e.plannedOneMinuteTime = optionalTime(j, "plannedOneMinuteTime");
    e.plannedStartTime = optionalTime(j, "plannedStartTime");
    e.actualWarningTime = optionalTime(j, "actualWarningTime");
    e.actualPrepTime = optionalTime(j, "actualPrepTime");
    e.actualOneMinuteTime = optionalTime(j, "actualOneMinuteTime");
    e.actualStartTime = optionalTime(j, "actualStartTime");
    e.recallCount = j.value("recallCount", 0);
    e.lastRecallAt = optionalTime(j, "lastRecallAt");
    e.recallNotes = j.value("recallNotes", std::string{});
    e.ocsBoatIds = j.value("ocsBoatIds", std::vector<std::string>{});
    e.customIntervalMinutes = optionalValue<int>(j, "customIntervalMinutes");
    e.anchorWarningTime = optionalTime(j, "anchorWarningTime");
  }

  void to_json(json& j, const StartSchedule& s) {
    j = json{ { "id", s.id },
              { "regattaId", s.regattaId },
              { "name", s.name },
              { "scheduledDate", s.scheduledDate },
              { "sequenceType", s.sequenceType },
              { "customProfile", s.customProfile ? json(*s.customProfile) : json(nullptr) },
              { "startIntervalMinutes", s.startIntervalMinutes },
              { "intervalPolicy", toString(s.intervalPolicy) },
              { "firstWarningTime", toIso(s.firstWarningTime) },
              { "actualFirstWarningTime", timeOrNull(s.actualFirstWarningTime) },
              { "status", toString(s.status) },
              { "notes", s.notes },
              { "entries", s.entries },
              { "nextEntrySeq", s.nextEntrySeq },
              { "version", s.version } };
  }

  void from_json(const json& j, StartSchedule& s) {
    s.id = j.at("id").get<std::string>();
    s.regattaId = j.at("regattaId").get<std::string>();
    s.name = j.at("name").get<std::string>();
    s.scheduledDate = j.value("scheduledDate", std::string{});
    s.sequenceType = j.at("sequenceType").get<std::string>();
    s.customProfile = optionalValue<protocols::SequenceProfile>(j, "customProfile");
    s.startIntervalMinutes = j.value("startIntervalMinutes", 5);

    const auto policyText = j.value("intervalPolicy", std::string{ "replace" });
    auto policy = intervalPolicyFromString(policyText);
    if (!policy)
      throw ScheduleError(ErrorCode::InvalidArgument, "[ScheduleJson] unknown interval policy: " + policyText);
    s.intervalPolicy = *policy;

    s.firstWarningTime = parseIso(j.at("firstWarningTime").get<std::string>());
    s.actualFirstWarningTime = optionalTime(j, "actualFirstWarningTime");

    const auto statusText = j.at("status").get<std::string>();
    auto status = scheduleStatusFromString(statusText);
    if (!status)
      throw ScheduleError(ErrorCode::InvalidArgument, "[ScheduleJson] unknown schedule status: " + statusText);
    s.status = *status;

    s.notes = j.value("notes", std::string{});
    s.entries = j.value("entries", std::vector<FleetStartEntry>{});
    s.nextEntrySeq = j.value("nextEntrySeq", static_cast<int>(s.entries.size()) + 1);
    s.version = j.value("version", std::uint64_t{ 0 });
  }

  void to_json(json& j, const ScheduleStatusSummary& s) {
    j = json{ { "scheduleId", s.scheduleId },
              { "regattaId", s.regattaId },
              { "scheduleName", s.scheduleName },
              { "scheduledDate", s.scheduledDate },
              { "status", toString(s.status) },
              { "sequenceType", s.sequenceType },
              { "startIntervalMinutes", s.startIntervalMinutes },
              { "firstWarningTime", toIso(s.firstWarningTime) },
              { "totalFleets", s.totalFleets },
              { "fleetsStarted", s.fleetsStarted },
              { "fleetsPending", s.fleetsPending },
              { "fleetsInSequence", s.fleetsInSequence },
              { "fleetsRecalled", s.fleetsRecalled },
              { "fleetsPostponed", s.fleetsPostponed },
              { "fleetsAbandoned", s.fleetsAbandoned },
              { "nextWarningTime", timeOrNull(s.nextWarningTime) },
              { "nextFleet", valueOrNull(s.nextFleet) } };
  }

  void to_json(json& j, const TimelineRow& r) {
    j = json{ { "entryId", r.entryId },
              { "fleetName", r.fleetName },
              { "classFlag", r.classFlag },
              { "startOrder", r.startOrder },
              { "raceNumber", r.raceNumber },
              { "status", toString(r.status) },
              { "effectiveWarningTime", timeOrNull(r.effectiveWarningTime) },
              { "effectiveStartTime", timeOrNull(r.effectiveStartTime) },
              { "timelineStatus", toString(r.phase) } };
  }

  void to_json(json& j, const Countdown& c) {
    j = json{ { "entryId", c.entryId },
              { "phase", toString(c.phase) },
              { "secondsRemaining", c.remaining.count() },
              { "totalSeconds", c.total.count() } };
  }

} // namespace rollstart::core
