/* @file Transitions.cpp
 * @brief transition table for FleetStartEntry
 *
 * © 2025 RollStart contributors — MIT-licensed.
 */

#include "core/Transitions.hpp"

using rollstart::protocols::SequenceProfile;
using rollstart::protocols::Stage;

namespace rollstart::core {

  const char* toString(EntryCommand cmd) {
    switch (cmd) {
    case EntryCommand::SignalWarning:
      return "signalWarning";
    case EntryCommand::SignalPreparatory:
      return "signalPreparatory";
    case EntryCommand::SignalOneMinute:
      return "signalOneMinute";
    case EntryCommand::SignalStart:
      return "signalStart";
    case EntryCommand::GeneralRecall:
      return "generalRecall";
    case EntryCommand::IndividualRecall:
      return "individualRecall";
    case EntryCommand::Postpone:
      return "postpone";
    case EntryCommand::Resume:
      return "resume";
    case EntryCommand::Abandon:
      return "abandon";
    default:
      return "unknown";
    }
  }

  EntryCommand commandFor(Stage stage) {
    switch (stage) {
    case Stage::Warning:
      return EntryCommand::SignalWarning;
    case Stage::Preparatory:
      return EntryCommand::SignalPreparatory;
    case Stage::OneMinute:
      return EntryCommand::SignalOneMinute;
    default:
      return EntryCommand::SignalStart;
    }
  }

  FleetStatus statusAfter(Stage stage) {
    switch (stage) {
    case Stage::Warning:
      return FleetStatus::Warning;
    case Stage::Preparatory:
      return FleetStatus::Preparatory;
    case Stage::OneMinute:
      return FleetStatus::OneMinute;
    default:
      return FleetStatus::Started;
    }
  }

  namespace {

    std::optional<FleetStatus> signalTransition(FleetStatus from, Stage stage,
                                                const SequenceProfile& profile) {
      if (!profile.hasStage(stage))
        return std::nullopt;

      if (stage == Stage::Warning)
        return from == FleetStatus::Pending ? std::optional{ FleetStatus::Warning } : std::nullopt;

      // the stage right before `stage` in this profile decides the legal source status
      const auto stages = profile.stages();
      for (std::size_t i = 1; i < stages.size(); ++i) {
        if (stages[i] == stage)
          return from == statusAfter(stages[i - 1]) ? std::optional{ statusAfter(stage) }
                                                    : std::nullopt;
      }
      return std::nullopt;
    }

  } // namespace

  std::optional<FleetStatus> nextStatus(FleetStatus from, EntryCommand cmd,
                                        const SequenceProfile& profile) {
    switch (cmd) {
    case EntryCommand::SignalWarning:
      return signalTransition(from, Stage::Warning, profile);
    case EntryCommand::SignalPreparatory:
      return signalTransition(from, Stage::Preparatory, profile);
    case EntryCommand::SignalOneMinute:
      return signalTransition(from, Stage::OneMinute, profile);
    case EntryCommand::SignalStart:
      return signalTransition(from, Stage::Start, profile);
    case EntryCommand::GeneralRecall:
      if (isInSequence(from))
        return FleetStatus::Pending;
      return std::nullopt;
    case EntryCommand::IndividualRecall:
      if (from == FleetStatus::Started)
        return FleetStatus::Started;
      return std::nullopt;
    case EntryCommand::Postpone:
      if (from == FleetStatus::Pending || from == FleetStatus::Warning ||
          from == FleetStatus::Preparatory)
        return FleetStatus::Postponed;
      return std::nullopt;
    case EntryCommand::Resume:
      if (from == FleetStatus::Postponed)
        return FleetStatus::Pending;
      return std::nullopt;
    case EntryCommand::Abandon:
      if (from != FleetStatus::Abandoned && from != FleetStatus::GeneralRecall)
        return FleetStatus::Abandoned;
      return std::nullopt;
    default:
      return std::nullopt;
    }
  }

} // namespace rollstart::core
