#pragma once
/** @file  Transitions.hpp
 *  @brief The per-entry transition table. Every command is checked here and nowhere else.
 *
 *  © 2025 RollStart contributors — MIT-licensed.
 */

#include <cstdint>
#include <optional>

#include "core/StartSchedule.hpp"
#include "protocols/SequenceProfile.hpp"

namespace rollstart::core {

  enum class EntryCommand : std::uint8_t {
    SignalWarning,
    SignalPreparatory,
    SignalOneMinute,
    SignalStart,
    GeneralRecall,
    IndividualRecall,
    Postpone,
    Resume,
    Abandon,
    Count
  };

  const char* toString(EntryCommand cmd);

  /// Signal command that fires \p stage.
  EntryCommand commandFor(protocols::Stage stage);

  /// Status an entry holds once \p stage has been signaled.
  FleetStatus statusAfter(protocols::Stage stage);

  /**
   * @brief Status reached by applying \p cmd to an entry in \p from.
   *
   * Signal legality follows the profile's stages: a signal is legal only from the
   * status of the stage right before it. General recall answers `Pending`, the
   * state the entry settles in once it has been re-queued.
   *
   * @return std::nullopt when the command is illegal for \p from.
   */
  std::optional<FleetStatus> nextStatus(FleetStatus from, EntryCommand cmd,
                                        const protocols::SequenceProfile& profile);

} // namespace rollstart::core
