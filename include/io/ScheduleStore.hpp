#pragma once
/** @file  ScheduleStore.hpp
 *  @brief Persistence port for the StartSchedule aggregate (schedule + entries saved together).
 *
 *  © 2025 RollStart contributors — MIT-licensed.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/StartSchedule.hpp"

namespace rollstart::io {

  /**
 * @class ScheduleStore
 * @brief Atomic load/save of one aggregate keyed by schedule id.
 *
 *  * `save()` is optimistic: it commits only if `schedule.version` equals the stored
 *    version (0 = create) and throws `ScheduleError(PersistenceConflict)` otherwise.
 *  * Implementations are safe to call from several threads.
 */
  class ScheduleStore {
  public:
    virtual ~ScheduleStore() = default;

    virtual std::optional<core::StartSchedule> load(const std::string& scheduleId) const = 0;

    /// Commit \p schedule; returns the new version.
    virtual std::uint64_t save(const core::StartSchedule& schedule) = 0;

    virtual void remove(const std::string& scheduleId, std::uint64_t expectedVersion) = 0;

    virtual bool contains(const std::string& scheduleId) const = 0;

    virtual std::optional<std::string> scheduleIdForEntry(const std::string& entryId) const = 0;

    virtual std::vector<core::StartSchedule> listByRegatta(const std::string& regattaId) const = 0;
  };

} // namespace rollstart::io
