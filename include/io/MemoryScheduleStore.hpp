#pragma once
/** @file  MemoryScheduleStore.hpp
 *  @brief Lock-protected in-process ScheduleStore.
 *
 *  © 2025 RollStart contributors — MIT-licensed.
 */

#include <map>
#include <mutex>
#include <unordered_map>

#include "io/ScheduleStore.hpp"

namespace rollstart::io {

  /** @class MemoryScheduleStore
 *  @brief Map of <scheduleId → StartSchedule> plus an entry → schedule index.
 *
 *  * A commit is applied in place and handed to `persist()`; when a subclass throws,
 *    the previous record is put back, so the store is unchanged.
 */
  class MemoryScheduleStore : public ScheduleStore {
  public:
    using ScheduleMap = std::map<std::string, core::StartSchedule>;

    MemoryScheduleStore() = default;
    ~MemoryScheduleStore() override = default;

    std::optional<core::StartSchedule> load(const std::string& scheduleId) const override;
    std::uint64_t save(const core::StartSchedule& schedule) override;
    void remove(const std::string& scheduleId, std::uint64_t expectedVersion) override;
    bool contains(const std::string& scheduleId) const override;
    std::optional<std::string> scheduleIdForEntry(const std::string& entryId) const override;
    std::vector<core::StartSchedule> listByRegatta(const std::string& regattaId) const override;

  protected:
    /// Durable write of the whole state, pending change included; throw to abort the commit.
    virtual void persist(const ScheduleMap& schedules);

    /// Replace contents without persisting (used when loading from disk).
    void seed(ScheduleMap schedules);

  private:
    void reindex(const core::StartSchedule* before, const core::StartSchedule* after);
    void rebuildIndex();

    mutable std::mutex mtx_;
    ScheduleMap schedules_;
    std::unordered_map<std::string, std::string> entryIndex_; ///< entryId → scheduleId
  };

} // namespace rollstart::io
