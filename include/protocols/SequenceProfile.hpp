#pragma once
/** @file  SequenceProfile.hpp
 *  @brief Signal offsets of a named start sequence ("5-4-1-go", ...).
 *
 *  © 2025 RollStart contributors — MIT-licensed.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/TimeUtil.hpp"

namespace rollstart::protocols {

  /// Signals of one fleet's sequence, in firing order.
  enum class Stage : std::uint8_t { Warning, Preparatory, OneMinute, Start };

  const char* toString(Stage stage);

  /**
 * @struct SequenceProfile
 * @brief Minutes-before-start of each signal. No state; looked up by name.
 *
 *  * `warningOffset` is also the sequence length (warning to start gun).
 *  * Preparatory and one-minute signals are optional ("5-1-go" has no prep).
 */
  struct SequenceProfile {
    std::string name;
    core::Minutes warningOffset{ 5 };
    std::optional<core::Minutes> prepOffset;
    std::optional<core::Minutes> oneMinuteOffset;

    /// Throw `ScheduleError(InvalidSequenceType)` unless every present offset is at least one
    /// minute and the offsets strictly decrease.
    void validate() const;

    /// Warning, present optional stages, Start.
    std::vector<Stage> stages() const;

    bool hasStage(Stage stage) const;

    /// Minutes before the start gun at which \p stage fires (Start = 0).
    core::Minutes offsetOf(Stage stage) const;

    bool operator==(const SequenceProfile&) const = default;
  };

} // namespace rollstart::protocols
