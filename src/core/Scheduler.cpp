/* @file Scheduler.cpp
 * @brief rolling start state machine: command validation, recall/postpone recovery,
 *        timeline recompute, optimistic commit and event emission
 *
 * © 2025 RollStart contributors — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <chrono>
#include <iostream>
#include <set>
#include <stdexcept>

#include <nlohmann/json.hpp>

// RollStart headers
#include "core/Clock.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/ScheduleError.hpp"
#include "core/Scheduler.hpp"
#include "core/SequenceRegistry.hpp"
#include "core/TimelineCalculator.hpp"
#include "core/Transitions.hpp"
#include "io/ScheduleStore.hpp"

using namespace rollstart::core;
using rollstart::protocols::SequenceProfile;
using rollstart::protocols::Stage;

namespace {

  FleetStartEntry& requireEntry(StartSchedule& s, const std::string& entryId) {
    FleetStartEntry* entry = s.findEntry(entryId);
    if (entry == nullptr)
      throw ScheduleError(ErrorCode::EntryNotFound,
                          "[Scheduler] no entry " + entryId + " in schedule " + s.id);
    return *entry;
  }

  std::size_t indexOf(const StartSchedule& s, const std::string& entryId) {
    auto it = std::find_if(s.entries.begin(), s.entries.end(),
                           [&](const FleetStartEntry& e) { return e.id == entryId; });
    return static_cast<std::size_t>(it - s.entries.begin());
  }

  const FleetStartEntry* firstPending(const StartSchedule& s) {
    for (const auto& e : s.entries) {
      if (e.status == FleetStatus::Pending)
        return &e;
    }
    return nullptr;
  }

  ScheduleError illegal(const FleetStartEntry& entry, EntryCommand cmd,
                        const std::string& why = {}) {
    std::string msg = std::string("[Scheduler] ") + toString(cmd) + " is illegal for " +
                      entry.fleetName + " (" + entry.id + ") in status " + toString(entry.status);
    if (!why.empty())
      msg += ": " + why;
    return ScheduleError(ErrorCode::InvalidTransition, msg);
  }

  void requireDraft(const StartSchedule& s, const char* what) {
    if (s.status != ScheduleStatus::Draft)
      throw ScheduleError(ErrorCode::ScheduleNotReady,
                          std::string("[Scheduler] ") + what + " needs a draft schedule; " + s.id +
                              " is " + toString(s.status));
  }

  /// Entry-level recovery commands need a schedule past draft.
  void requireConfigured(const StartSchedule& s, const FleetStartEntry& entry, EntryCommand cmd) {
    if (s.status == ScheduleStatus::Draft)
      throw ScheduleError(ErrorCode::ScheduleNotReady, std::string("[Scheduler] ") +
                                                           toString(cmd) + " on " + entry.id +
                                                           ": schedule " + s.id + " is draft");
  }

  /// Names are echoed in JSON replies and the store; reject what nlohmann cannot encode.
  void requireUtf8(const std::string& text, const char* what) {
    try {
      (void)nlohmann::json(text).dump();
    } catch (const nlohmann::json::type_error&) {
      throw ScheduleError(ErrorCode::InvalidArgument,
                          std::string("[Scheduler] ") + what + " is not valid UTF-8");
    }
  }

  void validateFleet(const std::string& fleetName, const std::string& classFlag, int raceNumber,
                     const std::optional<int>& customInterval) {
    if (fleetName.empty())
      throw ScheduleError(ErrorCode::InvalidArgument, "[Scheduler] fleet name must not be empty");
    requireUtf8(fleetName, "fleet name");
    requireUtf8(classFlag, "class flag");
    if (raceNumber < 1)
      throw ScheduleError(ErrorCode::InvalidArgument,
                          "[Scheduler] race number must be positive for " + fleetName);
    if (customInterval && *customInterval <= 0)
      throw ScheduleError(ErrorCode::InvalidArgument,
                          "[Scheduler] custom interval must be positive for " + fleetName);
  }

  std::optional<TimePoint> lastSignalTime(const FleetStartEntry& e) {
    std::optional<TimePoint> last;
    for (const auto& t : { e.actualWarningTime, e.actualPrepTime, e.actualOneMinuteTime,
                           e.actualStartTime }) {
      if (t && (!last || *t > *last))
        last = t;
    }
    return last;
  }

  EventType eventFor(Stage stage) {
    switch (stage) {
    case Stage::Warning:
      return EventType::WarningSignaled;
    case Stage::Preparatory:
      return EventType::PreparatorySignaled;
    case Stage::OneMinute:
      return EventType::OneMinuteSignaled;
    default:
      return EventType::StartSignaled;
    }
  }

} // namespace

Scheduler::Scheduler(std::shared_ptr<io::ScheduleStore> store,
                     std::shared_ptr<const SequenceRegistry> registry,
                     std::shared_ptr<const Clock> clock, std::shared_ptr<ErrorMonitor> errorMonitor,
                     SchedulerOptions options)
    : store_(std::move(store)), registry_(std::move(registry)), clock_(std::move(clock)),
      errorMonitor_(std::move(errorMonitor)), options_(options) {
  if (!store_ || !registry_ || !clock_ || !errorMonitor_)
    throw std::invalid_argument("[Scheduler] store, registry, clock and error monitor are required");
  if (options_.conflictRetries < 0 || options_.lockTimeout.count() < 0)
    throw std::invalid_argument("[Scheduler] retries and lock timeout must not be negative");
}

Scheduler::~Scheduler() = default;

void Scheduler::addSink(std::shared_ptr<EventSink> sink) {
  if (!sink)
    throw std::invalid_argument("[Scheduler] event sink is nullptr");
  std::lock_guard<std::mutex> lock(sinksMtx_);
  sinks_.push_back(std::move(sink));
}

// -------------------------------------------------------------------
// commit plumbing
// -------------------------------------------------------------------

Scheduler::ScheduleLock Scheduler::acquire(const std::string& scheduleId) {
  ScheduleLock held;
  {
    std::lock_guard<std::mutex> lock(locksMtx_);
    auto& slot = locks_[scheduleId];
    if (!slot)
      slot = std::make_shared<std::timed_mutex>();
    held.mutex = slot;
  }

  held.guard = std::unique_lock<std::timed_mutex>(*held.mutex, std::defer_lock);
  const bool acquired = options_.lockTimeout.count() == 0
                            ? held.guard.try_lock()
                            : held.guard.try_lock_for(options_.lockTimeout);
  if (!acquired)
    throw ScheduleError(ErrorCode::ScheduleBusy,
                        "[Scheduler] schedule " + scheduleId + " is busy with another command");
  return held;
}

std::uint64_t Scheduler::commit(const StartSchedule& schedule) {
  try {
    return store_->save(schedule);
  } catch (const ScheduleError&) {
    throw;
  } catch (const std::runtime_error& e) {
    errorMonitor_->notifyFailure(std::string("[Scheduler] store write failed: ") + e.what());
    throw;
  }
}

StartSchedule Scheduler::mutate(const std::string& scheduleId, const Mutation& fn) {
  const auto held = acquire(scheduleId);

  Events events;
  StartSchedule committed;
  for (int attempt = 0;; ++attempt) {
    auto current = store_->load(scheduleId);
    if (!current)
      throw ScheduleError(ErrorCode::ScheduleNotFound, "[Scheduler] no schedule " + scheduleId);

    StartSchedule working = std::move(*current);
    events.clear();
    fn(working, events);

    try {
      working.version = commit(working);
      committed = std::move(working);
      break;
    } catch (const ScheduleError& e) {
      if (e.code() != ErrorCode::PersistenceConflict)
        throw;
      if (attempt >= options_.conflictRetries) {
        errorMonitor_->notifyFailure("[Scheduler] persistence conflict on " + scheduleId +
                                     " after " + std::to_string(attempt + 1) + " attempt(s)");
        throw;
      }
      std::cerr << "[Scheduler] persistence conflict on " << scheduleId << ", reapplying\n";
    }
  }

  // still under the schedule lock: sinks see this schedule's events in commit order
  publish(events);
  return committed;
}

FleetStartEntry Scheduler::mutateEntry(const std::string& entryId,
                                       const std::function<void(StartSchedule&, Events&)>& fn) {
  const StartSchedule committed = mutate(scheduleIdOf(entryId), fn);
  const FleetStartEntry* entry = committed.findEntry(entryId);
  if (entry == nullptr)
    throw ScheduleError(ErrorCode::EntryNotFound, "[Scheduler] entry " + entryId + " vanished");
  return *entry;
}

std::string Scheduler::scheduleIdOf(const std::string& entryId) const {
  auto scheduleId = store_->scheduleIdForEntry(entryId);
  if (!scheduleId)
    throw ScheduleError(ErrorCode::EntryNotFound, "[Scheduler] no entry " + entryId);
  return *scheduleId;
}

void Scheduler::publish(const Events& events) {
  std::vector<std::shared_ptr<EventSink>> sinks;
  {
    std::lock_guard<std::mutex> lock(sinksMtx_);
    sinks = sinks_;
  }
  for (const auto& event : events) {
    for (const auto& sink : sinks) {
      try {
        sink->publish(event);
      } catch (const std::exception& e) {
        errorMonitor_->notifyFailure(std::string("[Scheduler] event sink failed on ") +
                                     toString(event.type) + ": " + e.what());
      }
    }
  }
}

SequenceProfile Scheduler::profileFor(const StartSchedule& schedule) const {
  return registry_->resolve(schedule.sequenceType, schedule.customProfile);
}

void Scheduler::recompute(StartSchedule& s) const {
  const TimelineOptions opts{ Minutes{ s.startIntervalMinutes }, s.intervalPolicy };
  s.entries = recomputeTimeline(std::move(s.entries), s.firstWarningTime, profileFor(s), opts);
}

void Scheduler::checkCompletion(StartSchedule& s, TimePoint now, Events& events) const {
  if (s.status != ScheduleStatus::Active)
    return;
  const bool open = std::any_of(s.entries.begin(), s.entries.end(), [](const FleetStartEntry& e) {
    return e.status == FleetStatus::Pending || isInSequence(e.status);
  });
  if (open)
    return;
  s.status = ScheduleStatus::Completed;
  events.push_back(scheduleEvent(EventType::ScheduleCompleted, s, now));
}

ScheduleEvent Scheduler::scheduleEvent(EventType type, const StartSchedule& s, TimePoint at) const {
  ScheduleEvent ev;
  ev.type = type;
  ev.scheduleId = s.id;
  ev.timestamp = at;
  ev.details["regattaId"] = s.regattaId;
  ev.details["scheduleName"] = s.name;
  ev.details["scheduleStatus"] = toString(s.status);
  return ev;
}

ScheduleEvent Scheduler::entryEvent(EventType type, const StartSchedule& s,
                                    const FleetStartEntry& e, TimePoint at) const {
  ScheduleEvent ev = scheduleEvent(type, s, at);
  ev.entryId = e.id;
  ev.details["fleetName"] = e.fleetName;
  ev.details["classFlag"] = e.classFlag;
  ev.details["raceNumber"] = e.raceNumber;
  ev.details["startOrder"] = e.startOrder;
  ev.details["status"] = toString(e.status);
  return ev;
}

// -------------------------------------------------------------------
// schedule commands
// -------------------------------------------------------------------

StartSchedule Scheduler::createSchedule(const ScheduleConfig& config) {
  if (config.regattaId.empty() || config.name.empty())
    throw ScheduleError(ErrorCode::InvalidArgument,
                        "[Scheduler] regatta id and schedule name are required");
  requireUtf8(config.regattaId, "regatta id");
  requireUtf8(config.name, "schedule name");
  requireUtf8(config.notes, "schedule notes");
  if (config.startIntervalMinutes <= 0)
    throw ScheduleError(ErrorCode::InvalidArgument, "[Scheduler] start interval must be positive");

  StartSchedule s;
  s.regattaId = config.regattaId;
  s.name = config.name;
  s.scheduledDate = config.scheduledDate;
  s.sequenceType = config.sequenceType;
  if (s.sequenceType == SequenceRegistry::kCustom)
    s.customProfile = config.customProfile;
  s.startIntervalMinutes = config.startIntervalMinutes;
  s.intervalPolicy = config.intervalPolicy.value_or(options_.intervalPolicy);
  s.firstWarningTime = config.firstWarningTime;
  s.notes = config.notes;
  s.status = ScheduleStatus::Draft;

  (void)profileFor(s); // InvalidSequenceType surfaces before anything is stored

  do {
    s.id = "S" + std::to_string(nextScheduleSeq_++);
  } while (store_->contains(s.id));

  const auto held = acquire(s.id);
  s.version = commit(s);
  publish({ scheduleEvent(EventType::ScheduleCreated, s, clock_->now()) });
  return s;
}

StartSchedule Scheduler::updateSchedule(const std::string& scheduleId,
                                       const ScheduleUpdate& update) {
  if (update.name) {
    if (update.name->empty())
      throw ScheduleError(ErrorCode::InvalidArgument, "[Scheduler] schedule name is required");
    requireUtf8(*update.name, "schedule name");
  }
  if (update.notes)
    requireUtf8(*update.notes, "schedule notes");
  if (update.startIntervalMinutes && *update.startIntervalMinutes <= 0)
    throw ScheduleError(ErrorCode::InvalidArgument, "[Scheduler] start interval must be positive");
  if (update.customProfile && update.sequenceType &&
      *update.sequenceType != SequenceRegistry::kCustom)
    throw ScheduleError(ErrorCode::InvalidSequenceType,
                        "[Scheduler] custom offsets given for sequence " + *update.sequenceType);

  return mutate(scheduleId, [&](StartSchedule& s, Events& events) {
    requireDraft(s, "updateSchedule");
    std::vector<std::string> changed;

    if (update.name) {
      s.name = *update.name;
      changed.push_back("name");
    }
    if (update.scheduledDate) {
      const TimePoint midnight = atTimeOfDay(*update.scheduledDate, "00:00");
      const auto timeOfDay =
          s.firstWarningTime - std::chrono::floor<std::chrono::days>(s.firstWarningTime);
      if (!update.firstWarningTime)
        s.firstWarningTime = midnight + timeOfDay;
      s.scheduledDate = *update.scheduledDate;
      changed.push_back("scheduledDate");
    }
    if (update.firstWarningTime) {
      s.firstWarningTime = *update.firstWarningTime;
      changed.push_back("firstWarningTime");
    }
    if (update.customProfile) {
      s.sequenceType = SequenceRegistry::kCustom;
      s.customProfile = update.customProfile;
      changed.push_back("customProfile");
    }
    if (update.sequenceType) {
      s.sequenceType = *update.sequenceType;
      changed.push_back("sequenceType");
    }
    if (s.sequenceType != SequenceRegistry::kCustom)
      s.customProfile.reset();
    if (update.startIntervalMinutes) {
      s.startIntervalMinutes = *update.startIntervalMinutes;
      changed.push_back("startIntervalMinutes");
    }
    if (update.intervalPolicy) {
      s.intervalPolicy = *update.intervalPolicy;
      changed.push_back("intervalPolicy");
    }
    if (update.notes) {
      s.notes = *update.notes;
      changed.push_back("notes");
    }

    recompute(s); // InvalidSequenceType from profileFor() rolls the edit back
    ScheduleEvent ev = scheduleEvent(EventType::ScheduleUpdated, s, clock_->now());
    ev.details["changed"] = changed;
    events.push_back(std::move(ev));
  });
}

std::vector<FleetStartEntry> Scheduler::addFleets(const std::string& scheduleId,
                                                  const std::vector<FleetSpec>& fleets) {
  if (fleets.empty())
    throw ScheduleError(ErrorCode::InvalidArgument, "[Scheduler] no fleets to add");
  for (const auto& f : fleets)
    validateFleet(f.fleetName, f.classFlag, f.raceNumber, f.customIntervalMinutes);

  std::vector<std::string> addedIds;
  const StartSchedule committed = mutate(scheduleId, [&](StartSchedule& s, Events& events) {
    requireDraft(s, "addFleets");
    addedIds.clear();
    const TimePoint now = clock_->now();

    for (const auto& f : fleets) {
      FleetStartEntry e;
      e.id = s.id + "-E" + std::to_string(s.nextEntrySeq++);
      e.scheduleId = s.id;
      e.fleetName = f.fleetName;
      e.classFlag = f.classFlag;
      e.raceNumber = f.raceNumber;
      e.customIntervalMinutes = f.customIntervalMinutes;
      e.startOrder = static_cast<int>(s.entries.size()) + 1;
      addedIds.push_back(e.id);
      s.entries.push_back(std::move(e));
    }
    recompute(s);
    for (const auto& id : addedIds)
      events.push_back(entryEvent(EventType::FleetsAdded, s, *s.findEntry(id), now));
  });

  std::vector<FleetStartEntry> out;
  for (const auto& id : addedIds)
    out.push_back(*committed.findEntry(id));
  return out;
}

std::vector<FleetStartEntry> Scheduler::reorderFleets(const std::string& scheduleId,
                                                      const std::vector<std::string>& orderedIds) {
  const StartSchedule committed = mutate(scheduleId, [&](StartSchedule& s, Events& events) {
    requireDraft(s, "reorderFleets");

    std::set<std::string> seen;
    for (const auto& id : orderedIds) {
      if (!seen.insert(id).second)
        throw ScheduleError(ErrorCode::DuplicateStartOrder,
                            "[Scheduler] entry " + id + " listed twice in new order");
      if (s.findEntry(id) == nullptr)
        throw ScheduleError(ErrorCode::EntryNotFound,
                            "[Scheduler] no entry " + id + " in schedule " + s.id);
    }
    if (orderedIds.size() != s.entries.size())
      throw ScheduleError(ErrorCode::InvalidArgument,
                          "[Scheduler] new order names " + std::to_string(orderedIds.size()) +
                              " of " + std::to_string(s.entries.size()) + " fleets");

    std::vector<FleetStartEntry> reordered;
    reordered.reserve(s.entries.size());
    for (const auto& id : orderedIds)
      reordered.push_back(*s.findEntry(id));
    s.entries = std::move(reordered);
    s.compactStartOrder();
    recompute(s);

    ScheduleEvent ev = scheduleEvent(EventType::FleetsReordered, s, clock_->now());
    ev.details["order"] = orderedIds;
    events.push_back(std::move(ev));
  });
  return committed.entries;
}

void Scheduler::removeFleet(const std::string& entryId) {
  mutate(scheduleIdOf(entryId), [&](StartSchedule& s, Events& events) {
    requireDraft(s, "removeFleet");
    const FleetStartEntry removed = requireEntry(s, entryId);
    s.entries.erase(s.entries.begin() + static_cast<std::ptrdiff_t>(indexOf(s, entryId)));
    s.compactStartOrder();
    recompute(s);
    events.push_back(entryEvent(EventType::FleetRemoved, s, removed, clock_->now()));
  });
}

FleetStartEntry Scheduler::updateFleet(const std::string& entryId, const FleetUpdate& update) {
  return mutateEntry(entryId, [&](StartSchedule& s, Events& events) {
    requireDraft(s, "updateFleet");
    auto& e = requireEntry(s, entryId);
    if (update.fleetName)
      e.fleetName = *update.fleetName;
    if (update.classFlag)
      e.classFlag = *update.classFlag;
    if (update.raceNumber)
      e.raceNumber = *update.raceNumber;
    if (update.clearCustomInterval)
      e.customIntervalMinutes.reset();
    else if (update.customIntervalMinutes)
      e.customIntervalMinutes = update.customIntervalMinutes;
    validateFleet(e.fleetName, e.classFlag, e.raceNumber, e.customIntervalMinutes);

    recompute(s);
    events.push_back(entryEvent(EventType::FleetUpdated, s, requireEntry(s, entryId), clock_->now()));
  });
}

StartSchedule Scheduler::markReady(const std::string& scheduleId) {
  return mutate(scheduleId, [&](StartSchedule& s, Events& events) {
    if (s.status != ScheduleStatus::Draft)
      throw ScheduleError(ErrorCode::InvalidTransition,
                          "[Scheduler] markReady: schedule " + s.id + " is already " +
                              toString(s.status));
    if (s.entries.empty())
      throw ScheduleError(ErrorCode::ScheduleNotReady,
                          "[Scheduler] markReady: schedule " + s.id + " has no fleets");

    std::set<int> orders;
    for (const auto& e : s.entries) {
      if (!orders.insert(e.startOrder).second)
        throw ScheduleError(ErrorCode::DuplicateStartOrder,
                            "[Scheduler] start order " + std::to_string(e.startOrder) +
                                " used twice in " + s.id);
    }

    s.compactStartOrder();
    s.status = ScheduleStatus::Ready;
    recompute(s);
    events.push_back(scheduleEvent(EventType::ScheduleReady, s, clock_->now()));
  });
}

FleetStartEntry Scheduler::startSequence(const std::string& scheduleId) {
  std::string firstId;
  const StartSchedule committed = mutate(scheduleId, [&](StartSchedule& s, Events& events) {
    if (s.status == ScheduleStatus::Draft)
      throw ScheduleError(ErrorCode::ScheduleNotReady,
                          "[Scheduler] startSequence: schedule " + s.id + " is not ready");
    if (s.status != ScheduleStatus::Ready)
      throw ScheduleError(ErrorCode::InvalidTransition,
                          "[Scheduler] startSequence: schedule " + s.id + " is already " +
                              toString(s.status));
    const FleetStartEntry* first = firstPending(s);
    if (first == nullptr)
      throw ScheduleError(ErrorCode::InvalidTransition,
                          "[Scheduler] startSequence: schedule " + s.id + " has no pending fleet");
    firstId = first->id;

    const TimePoint now = clock_->now();
    s.status = ScheduleStatus::Active;
    s.actualFirstWarningTime = now;
    events.push_back(scheduleEvent(EventType::SequenceStarted, s, now));
    signal(s, firstId, Stage::Warning, now, events);
  });
  return *committed.findEntry(firstId);
}

void Scheduler::deleteSchedule(const std::string& scheduleId) {
  const auto held = acquire(scheduleId);

  auto current = store_->load(scheduleId);
  if (!current)
    throw ScheduleError(ErrorCode::ScheduleNotFound, "[Scheduler] no schedule " + scheduleId);
  if (current->status == ScheduleStatus::Active)
    throw ScheduleError(ErrorCode::InvalidTransition,
                        "[Scheduler] schedule " + scheduleId + " is active and cannot be deleted");

  try {
    store_->remove(scheduleId, current->version);
  } catch (const ScheduleError&) {
    throw;
  } catch (const std::runtime_error& e) {
    errorMonitor_->notifyFailure(std::string("[Scheduler] store delete failed: ") + e.what());
    throw;
  }

  publish({ scheduleEvent(EventType::ScheduleDeleted, *current, clock_->now()) });

  // late waiters still hold the old mutex and will find no schedule
  std::lock_guard<std::mutex> lock(locksMtx_);
  locks_.erase(scheduleId);
}

// -------------------------------------------------------------------
// signals
// -------------------------------------------------------------------

void Scheduler::signal(StartSchedule& s, const std::string& entryId, Stage stage, TimePoint now,
                       Events& events) const {
  const EntryCommand cmd = commandFor(stage);
  auto& entry = requireEntry(s, entryId);

  if (s.status != ScheduleStatus::Active)
    throw illegal(entry, cmd, std::string("schedule is ") + toString(s.status));

  const SequenceProfile profile = profileFor(s);
  const auto next = nextStatus(entry.status, cmd, profile);
  if (!next)
    throw illegal(entry, cmd,
                  profile.hasStage(stage) ? std::string{}
                                          : "sequence " + profile.name + " has no such signal");

  if (stage == Stage::Warning) {
    for (const auto& other : s.entries) {
      if (isInSequence(other.status))
        throw illegal(entry, cmd, other.fleetName + " is still in its sequence");
    }
    if (firstPending(s) != &entry)
      throw illegal(entry, cmd, "another fleet is ahead in the start order");
  }

  if (auto last = lastSignalTime(entry); last && now < *last)
    throw illegal(entry, cmd, "clock reads " + toIso(now) + ", before the previous signal at " +
                                  toIso(*last));

  entry.status = *next;
  switch (stage) {
  case Stage::Warning:
    entry.actualWarningTime = now;
    break;
  case Stage::Preparatory:
    entry.actualPrepTime = now;
    break;
  case Stage::OneMinute:
    entry.actualOneMinuteTime = now;
    break;
  case Stage::Start:
    entry.actualStartTime = now;
    break;
  }
  events.push_back(entryEvent(eventFor(stage), s, entry, now));

  if (stage == Stage::Start) {
    recompute(s); // `entry` is not used past this point
    autoAdvance(s, entryId, now, events);
    checkCompletion(s, now, events);
  }
}

void Scheduler::autoAdvance(StartSchedule& s, const std::string& startedId, TimePoint startTime,
                            Events& events) const {
  const FleetStartEntry* next = firstPending(s);
  if (next == nullptr || !next->plannedWarningTime)
    return;

  const auto gap = *next->plannedWarningTime > startTime ? *next->plannedWarningTime - startTime
                                                         : startTime - *next->plannedWarningTime;
  if (gap > options_.autoAdvanceTolerance)
    return;

  signal(s, next->id, Stage::Warning, startTime, events);
  events.back().details["autoAdvanced"] = true;
  events.back().details["chainedFrom"] = startedId;
}

FleetStartEntry Scheduler::signalWarning(const std::string& entryId) {
  return mutateEntry(entryId, [&](StartSchedule& s, Events& events) {
    signal(s, entryId, Stage::Warning, clock_->now(), events);
  });
}

FleetStartEntry Scheduler::signalPreparatory(const std::string& entryId) {
  return mutateEntry(entryId, [&](StartSchedule& s, Events& events) {
    signal(s, entryId, Stage::Preparatory, clock_->now(), events);
  });
}

FleetStartEntry Scheduler::signalOneMinute(const std::string& entryId) {
  return mutateEntry(entryId, [&](StartSchedule& s, Events& events) {
    signal(s, entryId, Stage::OneMinute, clock_->now(), events);
  });
}

FleetStartEntry Scheduler::signalStart(const std::string& entryId) {
  return mutateEntry(entryId, [&](StartSchedule& s, Events& events) {
    signal(s, entryId, Stage::Start, clock_->now(), events);
  });
}

// -------------------------------------------------------------------
// recalls, postponement, abandonment
// -------------------------------------------------------------------

FleetStartEntry Scheduler::generalRecall(const std::string& entryId, const std::string& reason) {
  return mutateEntry(entryId, [&](StartSchedule& s, Events& events) {
    auto& entry = requireEntry(s, entryId);
    const auto next = nextStatus(entry.status, EntryCommand::GeneralRecall, profileFor(s));
    if (!next)
      throw illegal(entry, EntryCommand::GeneralRecall);

    const TimePoint now = clock_->now();
    const FleetStatus recalledFrom = entry.status;
    const int previousOrder = entry.startOrder;
    const std::size_t previousIndex = indexOf(s, entryId);

    FleetStartEntry recalled = std::move(entry);
    s.entries.erase(s.entries.begin() + static_cast<std::ptrdiff_t>(previousIndex));

    recalled.clearActualTimes();
    recalled.anchorWarningTime.reset();
    recalled.status = *next;
    recalled.recallCount += 1;
    recalled.lastRecallAt = now;
    recalled.recallNotes = reason;

    // behind the last fleet still waiting; everyone else keeps their relative order
    auto lastPending = std::find_if(s.entries.rbegin(), s.entries.rend(),
                                    [](const FleetStartEntry& e) {
                                      return e.status == FleetStatus::Pending;
                                    });
    const std::size_t insertAt =
        lastPending == s.entries.rend()
            ? previousIndex
            : static_cast<std::size_t>(s.entries.rend() - lastPending);
    s.entries.insert(s.entries.begin() + static_cast<std::ptrdiff_t>(insertAt),
                     std::move(recalled));
    s.compactStartOrder();
    recompute(s);

    const auto& requeued = requireEntry(s, entryId);
    ScheduleEvent ev = entryEvent(EventType::GeneralRecall, s, requeued, now);
    ev.details["recalledFrom"] = toString(recalledFrom);
    ev.details["previousStartOrder"] = previousOrder;
    ev.details["recallCount"] = requeued.recallCount;
    ev.details["reason"] = reason;
    events.push_back(std::move(ev));
  });
}

FleetStartEntry Scheduler::individualRecall(const std::string& entryId,
                                            const std::vector<std::string>& boatIds) {
  if (boatIds.empty() || std::any_of(boatIds.begin(), boatIds.end(),
                                     [](const std::string& b) { return b.empty(); }))
    throw ScheduleError(ErrorCode::InvalidArgument,
                        "[Scheduler] individual recall needs at least one boat id");

  return mutateEntry(entryId, [&](StartSchedule& s, Events& events) {
    auto& entry = requireEntry(s, entryId);
    if (!nextStatus(entry.status, EntryCommand::IndividualRecall, profileFor(s)))
      throw illegal(entry, EntryCommand::IndividualRecall);

    for (const auto& boat : boatIds) {
      if (std::find(entry.ocsBoatIds.begin(), entry.ocsBoatIds.end(), boat) ==
          entry.ocsBoatIds.end())
        entry.ocsBoatIds.push_back(boat);
    }
    std::string notes = "Individual recall: ";
    for (std::size_t i = 0; i < entry.ocsBoatIds.size(); ++i)
      notes += (i ? ", " : "") + entry.ocsBoatIds[i];
    entry.recallNotes = notes;

    ScheduleEvent ev = entryEvent(EventType::IndividualRecall, s, entry, clock_->now());
    ev.details["boatIds"] = boatIds;
    events.push_back(std::move(ev));
  });
}

FleetStartEntry Scheduler::postpone(const std::string& entryId, const std::string& reason) {
  return mutateEntry(entryId, [&](StartSchedule& s, Events& events) {
    auto& entry = requireEntry(s, entryId);
    requireConfigured(s, entry, EntryCommand::Postpone);
    if (s.status == ScheduleStatus::Completed)
      throw illegal(entry, EntryCommand::Postpone, "schedule is completed");
    const auto next = nextStatus(entry.status, EntryCommand::Postpone, profileFor(s));
    if (!next)
      throw illegal(entry, EntryCommand::Postpone);

    const TimePoint now = clock_->now();
    const FleetStatus postponedFrom = entry.status;
    entry.status = *next;
    entry.clearActualTimes();

    ScheduleEvent ev = entryEvent(EventType::Postponed, s, entry, now);
    ev.details["postponedFrom"] = toString(postponedFrom);
    ev.details["reason"] = reason;
    events.push_back(std::move(ev));

    recompute(s);
    checkCompletion(s, now, events);
  });
}

FleetStartEntry Scheduler::resume(const std::string& entryId, TimePoint newWarningTime,
                                  const std::string& reason) {
  return mutateEntry(entryId, [&](StartSchedule& s, Events& events) {
    auto& entry = requireEntry(s, entryId);
    requireConfigured(s, entry, EntryCommand::Resume);
    const auto next = nextStatus(entry.status, EntryCommand::Resume, profileFor(s));
    if (!next)
      throw illegal(entry, EntryCommand::Resume);

    // a resumed fleet never goes ahead of fleets that already took their warning
    const std::size_t from = indexOf(s, entryId);
    FleetStartEntry resumed = std::move(entry);
    s.entries.erase(s.entries.begin() + static_cast<std::ptrdiff_t>(from));
    std::size_t insertAt = from;
    for (std::size_t i = 0; i < s.entries.size(); ++i) {
      const FleetStatus st = s.entries[i].status;
      if ((st == FleetStatus::Started || isInSequence(st)) && i + 1 > insertAt)
        insertAt = i + 1;
    }

    const bool firstChained =
        std::all_of(s.entries.begin(), s.entries.begin() + static_cast<std::ptrdiff_t>(insertAt),
                    [](const FleetStartEntry& e) {
                      return e.status == FleetStatus::Postponed ||
                             e.status == FleetStatus::Abandoned;
                    });

    resumed.status = *next;
    if (firstChained) {
      s.firstWarningTime = newWarningTime;
      resumed.anchorWarningTime.reset();
    } else {
      resumed.anchorWarningTime = newWarningTime;
    }
    s.entries.insert(s.entries.begin() + static_cast<std::ptrdiff_t>(insertAt), std::move(resumed));
    s.compactStartOrder();

    const bool reactivated = s.status == ScheduleStatus::Completed;
    if (reactivated)
      s.status = ScheduleStatus::Active;
    recompute(s);

    ScheduleEvent ev = entryEvent(EventType::Resumed, s, requireEntry(s, entryId), clock_->now());
    ev.details["newWarningTime"] = toIso(newWarningTime);
    ev.details["reactivated"] = reactivated;
    ev.details["reason"] = reason;
    events.push_back(std::move(ev));
  });
}

FleetStartEntry Scheduler::abandon(const std::string& entryId, const std::string& reason) {
  return mutateEntry(entryId, [&](StartSchedule& s, Events& events) {
    auto& entry = requireEntry(s, entryId);
    requireConfigured(s, entry, EntryCommand::Abandon);
    const auto next = nextStatus(entry.status, EntryCommand::Abandon, profileFor(s));
    if (!next)
      throw illegal(entry, EntryCommand::Abandon);

    const TimePoint now = clock_->now();
    const FleetStatus abandonedFrom = entry.status;
    entry.status = *next;
    entry.anchorWarningTime.reset();

    ScheduleEvent ev = entryEvent(EventType::Abandoned, s, entry, now);
    ev.details["abandonedFrom"] = toString(abandonedFrom);
    ev.details["reason"] = reason;
    events.push_back(std::move(ev));

    recompute(s);
    checkCompletion(s, now, events);
  });
}

// -------------------------------------------------------------------
// queries
// -------------------------------------------------------------------

StartSchedule Scheduler::getSchedule(const std::string& scheduleId) const {
  auto s = store_->load(scheduleId);
  if (!s)
    throw ScheduleError(ErrorCode::ScheduleNotFound, "[Scheduler] no schedule " + scheduleId);
  return *s;
}

FleetStartEntry Scheduler::getEntry(const std::string& entryId) const {
  const StartSchedule s = getSchedule(scheduleIdOf(entryId));
  const FleetStartEntry* e = s.findEntry(entryId);
  if (e == nullptr)
    throw ScheduleError(ErrorCode::EntryNotFound, "[Scheduler] no entry " + entryId);
  return *e;
}

std::vector<StartSchedule> Scheduler::listSchedules(const std::string& regattaId) const {
  return store_->listByRegatta(regattaId);
}

ScheduleStatusSummary Scheduler::getStatusSummary(const std::string& scheduleId) const {
  return summarize(getSchedule(scheduleId));
}

std::vector<TimelineRow> Scheduler::getTimeline(const std::string& scheduleId) const {
  const StartSchedule s = getSchedule(scheduleId);
  return projectTimeline(s, profileFor(s));
}

std::optional<Countdown> Scheduler::countdown(const std::string& entryId) const {
  const StartSchedule s = getSchedule(scheduleIdOf(entryId));
  const FleetStartEntry* e = s.findEntry(entryId);
  if (e == nullptr)
    throw ScheduleError(ErrorCode::EntryNotFound, "[Scheduler] no entry " + entryId);
  return rollstart::core::countdown(*e, profileFor(s), clock_->now());
}
