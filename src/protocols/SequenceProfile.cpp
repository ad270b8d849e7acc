/* @file SequenceProfile.cpp
 * @brief offset validation and stage ordering
 *
 * © 2025 RollStart contributors — MIT-licensed.
 */

#include "protocols/SequenceProfile.hpp"
#include "core/ScheduleError.hpp"

using namespace rollstart::protocols;
using rollstart::core::ErrorCode;
using rollstart::core::Minutes;
using rollstart::core::ScheduleError;

const char* rollstart::protocols::toString(Stage stage) {
  switch (stage) {
  case Stage::Warning:
    return "warning";
  case Stage::Preparatory:
    return "preparatory";
  case Stage::OneMinute:
    return "one_minute";
  case Stage::Start:
    return "start";
  default:
    return "unknown";
  }
}

void SequenceProfile::validate() const {
  auto fail = [this](const std::string& why) {
    throw ScheduleError(ErrorCode::InvalidSequenceType,
                        "[SequenceProfile] '" + name + "' invalid: " + why);
  };

  if (warningOffset <= Minutes::zero())
    fail("warning offset must be positive");

  Minutes previous = warningOffset;
  if (prepOffset) {
    if (*prepOffset <= Minutes::zero())
      fail("preparatory offset must be positive");
    if (*prepOffset >= previous)
      fail("preparatory offset must be below the warning offset");
    previous = *prepOffset;
  }
  if (oneMinuteOffset) {
    if (*oneMinuteOffset <= Minutes::zero())
      fail("one-minute offset must be positive");
    if (*oneMinuteOffset >= previous)
      fail(prepOffset ? "one-minute offset must be below the preparatory offset"
                      : "one-minute offset must be below the warning offset");
  }
}

std::vector<Stage> SequenceProfile::stages() const {
  std::vector<Stage> out{ Stage::Warning };
  if (prepOffset)
    out.push_back(Stage::Preparatory);
  if (oneMinuteOffset)
    out.push_back(Stage::OneMinute);
  out.push_back(Stage::Start);
  return out;
}

bool SequenceProfile::hasStage(Stage stage) const {
  switch (stage) {
  case Stage::Preparatory:
    return prepOffset.has_value();
  case Stage::OneMinute:
    return oneMinuteOffset.has_value();
  default:
    return true;
  }
}

Minutes SequenceProfile::offsetOf(Stage stage) const {
  switch (stage) {
  case Stage::Warning:
    return warningOffset;
  case Stage::Preparatory:
    return prepOffset.value_or(Minutes::zero());
  case Stage::OneMinute:
    return oneMinuteOffset.value_or(Minutes::zero());
  default:
    return Minutes::zero();
  }
}
