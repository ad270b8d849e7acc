/* @file AppConfig.cpp
 * @brief schema checks for the JSON config
 *
 * © 2025 RollStart contributors — MIT-licensed.
 */

#include <nlohmann/json.hpp>

// RollStart headers
#include "core/AppConfig.hpp"
#include "core/ScheduleError.hpp"

using namespace rollstart::core;
using nlohmann::json;
using rollstart::protocols::SequenceProfile;

namespace {

  [[noreturn]] void bad(const std::string& key, const std::string& why) {
    throw ScheduleError(ErrorCode::InvalidArgument, "[AppConfig] " + key + ": " + why);
  }

  const json* section(const json& j, const char* key) {
    if (!j.contains(key))
      return nullptr;
    const json& s = j.at(key);
    if (!s.is_object())
      bad(key, "expected an object");
    return &s;
  }

  long long nonNegative(const json& s, const char* key, const std::string& where,
                        long long fallback) {
    if (!s.contains(key) || s.at(key).is_null())
      return fallback;
    const json& v = s.at(key);
    if (!v.is_number_integer() || v.get<long long>() < 0)
      bad(where + "." + key, "expected a non-negative integer");
    return v.get<long long>();
  }

  std::string text(const json& s, const char* key, const std::string& where,
                   const std::string& fallback) {
    if (!s.contains(key) || s.at(key).is_null())
      return fallback;
    if (!s.at(key).is_string())
      bad(where + "." + key, "expected a string");
    return s.at(key).get<std::string>();
  }

  std::optional<Minutes> offset(const json& s, const char* key, const std::string& where) {
    if (!s.contains(key) || s.at(key).is_null())
      return std::nullopt;
    if (!s.at(key).is_number_integer())
      bad(where + "." + key, "expected minutes or null");
    return Minutes{ s.at(key).get<int>() };
  }

} // namespace

AppConfig AppConfig::fromJson(const json& j) {
  if (!j.is_object())
    bad("<root>", "expected an object");

  AppConfig cfg;

  if (const json* s = section(j, "scheduler")) {
    cfg.scheduler.lockTimeout = std::chrono::milliseconds{ nonNegative(
        *s, "lockTimeoutMs", "scheduler", cfg.scheduler.lockTimeout.count()) };
    cfg.scheduler.conflictRetries = static_cast<int>(
        nonNegative(*s, "conflictRetries", "scheduler", cfg.scheduler.conflictRetries));
    cfg.scheduler.autoAdvanceTolerance = std::chrono::seconds{ nonNegative(
        *s, "autoAdvanceToleranceSec", "scheduler", cfg.scheduler.autoAdvanceTolerance.count()) };

    const std::string policy =
        text(*s, "intervalPolicy", "scheduler", toString(cfg.scheduler.intervalPolicy));
    const auto parsed = intervalPolicyFromString(policy);
    if (!parsed)
      bad("scheduler.intervalPolicy", "expected \"replace\" or \"add\", got \"" + policy + "\"");
    cfg.scheduler.intervalPolicy = *parsed;
  }

  if (const json* s = section(j, "store"))
    cfg.storePath = text(*s, "path", "store", cfg.storePath);

  if (const json* s = section(j, "committeeLog")) {
    cfg.committeeLogPath = text(*s, "path", "committeeLog", cfg.committeeLogPath);
    cfg.committeeLogCapacity = static_cast<std::size_t>(nonNegative(
        *s, "capacity", "committeeLog", static_cast<long long>(cfg.committeeLogCapacity)));
    if (cfg.committeeLogCapacity == 0)
      bad("committeeLog.capacity", "must be at least 1");
  }

  if (const json* s = section(j, "sequences")) {
    for (const auto& [name, body] : s->items()) {
      const std::string where = "sequences." + name;
      if (!body.is_object())
        bad(where, "expected an object");
      if (!body.contains("warning") || !body.at("warning").is_number_integer())
        bad(where + ".warning", "expected minutes");

      SequenceProfile profile;
      profile.name = name;
      profile.warningOffset = Minutes{ body.at("warning").get<int>() };
      profile.prepOffset = offset(body, "preparatory", where);
      profile.oneMinuteOffset = offset(body, "oneMinute", where);
      cfg.sequences.push_back(std::move(profile));
    }
  }

  return cfg;
}
