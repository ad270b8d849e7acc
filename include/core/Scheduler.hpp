#pragma once
/** @file  Scheduler.hpp
 *  @brief Rolling multi-class start state machine (public command API).
 *
 *  © 2025 RollStart contributors — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/ScheduleEvent.hpp"
#include "core/ScheduleViews.hpp"
#include "core/StartSchedule.hpp"
#include "protocols/SequenceProfile.hpp"

namespace rollstart::io {
  class ScheduleStore;
} // namespace rollstart::io

namespace rollstart::core {

  class Clock;
  class ErrorMonitor;
  class SequenceRegistry;

  struct SchedulerOptions {
    std::chrono::milliseconds lockTimeout{ 250 }; ///< 0 = fail at once when busy
    int conflictRetries{ 1 };                     ///< reload + reapply on PersistenceConflict
    std::chrono::seconds autoAdvanceTolerance{ 0 };
    IntervalPolicy intervalPolicy{ IntervalPolicy::Replace }; ///< default for new schedules
  };

  /**
 * @class Scheduler
 * @brief Validates commands against the transition table, mutates one aggregate,
 *        recomputes the timeline, persists, then emits events.
 *
 *  * Single writer per schedule: commands on one schedule are serialized by a
 *    per-schedule timed mutex and fail with `ScheduleBusy` after `lockTimeout`.
 *    Different schedules never share a lock.
 *  * Every command works on a copy and commits with one `ScheduleStore::save()`;
 *    a throw anywhere leaves the stored aggregate untouched.
 *  * Events are published before the schedule lock is released, so sinks see one
 *    schedule's events in commit order. A sink must not command the same schedule.
 *  * Queries read the last committed snapshot without taking the command lock.
 *  * The clock only stamps `actual*Time`; nothing fires on elapsed time alone.
 */
  class Scheduler {
  public:
    Scheduler(std::shared_ptr<io::ScheduleStore> store,
              std::shared_ptr<const SequenceRegistry> registry, std::shared_ptr<const Clock> clock,
              std::shared_ptr<ErrorMonitor> errorMonitor, SchedulerOptions options = {});
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /// Sinks receive every committed event in commit order.
    void addSink(std::shared_ptr<EventSink> sink);

    //---schedule commands------------------------------------------------
    StartSchedule createSchedule(const ScheduleConfig& config);
    /// Draft only; re-validates the sequence and replans every entry.
    StartSchedule updateSchedule(const std::string& scheduleId, const ScheduleUpdate& update);
    std::vector<FleetStartEntry> addFleets(const std::string& scheduleId,
                                           const std::vector<FleetSpec>& fleets);
    std::vector<FleetStartEntry> reorderFleets(const std::string& scheduleId,
                                               const std::vector<std::string>& orderedIds);
    void removeFleet(const std::string& entryId);
    FleetStartEntry updateFleet(const std::string& entryId, const FleetUpdate& update);
    StartSchedule markReady(const std::string& scheduleId);
    /// Activates the schedule and signals the first pending fleet's warning.
    FleetStartEntry startSequence(const std::string& scheduleId);
    void deleteSchedule(const std::string& scheduleId);

    //---entry commands---------------------------------------------------
    FleetStartEntry signalWarning(const std::string& entryId);
    FleetStartEntry signalPreparatory(const std::string& entryId);
    FleetStartEntry signalOneMinute(const std::string& entryId);
    /// Starts the fleet and warns the next pending one when its plan chains from this gun.
    FleetStartEntry signalStart(const std::string& entryId);
    /// Re-queues the fleet after the last pending one and replans everyone not started.
    FleetStartEntry generalRecall(const std::string& entryId, const std::string& reason = {});
    FleetStartEntry individualRecall(const std::string& entryId,
                                     const std::vector<std::string>& boatIds);
    FleetStartEntry postpone(const std::string& entryId, const std::string& reason = {});
    FleetStartEntry resume(const std::string& entryId, TimePoint newWarningTime,
                           const std::string& reason = {});
    FleetStartEntry abandon(const std::string& entryId, const std::string& reason = {});

    //---queries----------------------------------------------------------
    StartSchedule getSchedule(const std::string& scheduleId) const;
    FleetStartEntry getEntry(const std::string& entryId) const;
    std::vector<StartSchedule> listSchedules(const std::string& regattaId) const;
    ScheduleStatusSummary getStatusSummary(const std::string& scheduleId) const;
    std::vector<TimelineRow> getTimeline(const std::string& scheduleId) const;
    std::optional<Countdown> countdown(const std::string& entryId) const;
    protocols::SequenceProfile profileFor(const StartSchedule& schedule) const;

    const SchedulerOptions& options() const { return options_; }

  private:
    using Events = std::vector<ScheduleEvent>;
    using Mutation = std::function<void(StartSchedule&, Events&)>;

    /// Keeps the schedule's mutex alive for as long as it is held.
    struct ScheduleLock {
      std::shared_ptr<std::timed_mutex> mutex;
      std::unique_lock<std::timed_mutex> guard;
    };

    StartSchedule mutate(const std::string& scheduleId, const Mutation& fn);
    FleetStartEntry mutateEntry(const std::string& entryId,
                                const std::function<void(StartSchedule&, Events&)>& fn);
    ScheduleLock acquire(const std::string& scheduleId);
    std::uint64_t commit(const StartSchedule& schedule);
    std::string scheduleIdOf(const std::string& entryId) const;
    void publish(const Events& events);

    void signal(StartSchedule& s, const std::string& entryId, protocols::Stage stage,
                TimePoint now, Events& events) const;
    void autoAdvance(StartSchedule& s, const std::string& startedId, TimePoint startTime,
                     Events& events) const;
    void recompute(StartSchedule& s) const;
    void checkCompletion(StartSchedule& s, TimePoint now, Events& events) const;

    ScheduleEvent scheduleEvent(EventType type, const StartSchedule& s, TimePoint at) const;
    ScheduleEvent entryEvent(EventType type, const StartSchedule& s, const FleetStartEntry& e,
                             TimePoint at) const;

    std::shared_ptr<io::ScheduleStore> store_;
    std::shared_ptr<const SequenceRegistry> registry_;
    std::shared_ptr<const Clock> clock_;
    std::shared_ptr<ErrorMonitor> errorMonitor_;
    SchedulerOptions options_;

    std::mutex locksMtx_;
    std::unordered_map<std::string, std::shared_ptr<std::timed_mutex>> locks_;

    std::mutex sinksMtx_;
    std::vector<std::shared_ptr<EventSink>> sinks_;

    std::atomic<std::uint64_t> nextScheduleSeq_{ 1 };
  };

} // namespace rollstart::core
