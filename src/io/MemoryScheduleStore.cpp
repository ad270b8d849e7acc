/* @file MemoryScheduleStore.cpp
 * @brief versioned in-memory aggregate store
 *
 * © 2025 RollStart contributors — MIT-licensed.
 */

#include <algorithm>
#include <optional>

#include "io/MemoryScheduleStore.hpp"
#include "core/ScheduleError.hpp"

using namespace rollstart::io;
using rollstart::core::ErrorCode;
using rollstart::core::ScheduleError;
using rollstart::core::StartSchedule;

std::optional<StartSchedule> MemoryScheduleStore::load(const std::string& scheduleId) const {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = schedules_.find(scheduleId);
  if (it == schedules_.end())
    return std::nullopt;
  return it->second;
}

std::uint64_t MemoryScheduleStore::save(const StartSchedule& schedule) {
  std::lock_guard<std::mutex> lock(mtx_);

  auto it = schedules_.find(schedule.id);
  const std::uint64_t stored = it == schedules_.end() ? 0 : it->second.version;

  if (schedule.version != stored) {
    throw ScheduleError(ErrorCode::PersistenceConflict,
                        "[ScheduleStore] schedule " + schedule.id + " changed since it was read (v" +
                            std::to_string(schedule.version) + " vs v" + std::to_string(stored) +
                            ")");
  }

  std::optional<StartSchedule> previous;
  if (it != schedules_.end())
    previous = std::move(it->second);
  StartSchedule& committed = schedules_[schedule.id] = schedule;
  committed.version = stored + 1;

  try {
    persist(schedules_);
  } catch (...) {
    if (previous)
      committed = std::move(*previous);
    else
      schedules_.erase(schedule.id);
    throw;
  }

  reindex(previous ? &*previous : nullptr, &committed);
  return stored + 1;
}

void MemoryScheduleStore::remove(const std::string& scheduleId, std::uint64_t expectedVersion) {
  std::lock_guard<std::mutex> lock(mtx_);

  auto it = schedules_.find(scheduleId);
  if (it == schedules_.end())
    throw ScheduleError(ErrorCode::ScheduleNotFound, "[ScheduleStore] no schedule " + scheduleId);
  if (it->second.version != expectedVersion)
    throw ScheduleError(ErrorCode::PersistenceConflict,
                        "[ScheduleStore] schedule " + scheduleId + " changed since it was read");

  StartSchedule removed = std::move(it->second);
  schedules_.erase(it);

  try {
    persist(schedules_);
  } catch (...) {
    schedules_.emplace(scheduleId, std::move(removed));
    throw;
  }

  reindex(&removed, nullptr);
}

bool MemoryScheduleStore::contains(const std::string& scheduleId) const {
  std::lock_guard<std::mutex> lock(mtx_);
  return schedules_.count(scheduleId) != 0;
}

std::optional<std::string> MemoryScheduleStore::scheduleIdForEntry(const std::string& entryId) const {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = entryIndex_.find(entryId);
  if (it == entryIndex_.end())
    return std::nullopt;
  return it->second;
}

std::vector<StartSchedule> MemoryScheduleStore::listByRegatta(const std::string& regattaId) const {
  std::lock_guard<std::mutex> lock(mtx_);
  std::vector<StartSchedule> out;
  for (const auto& [id, schedule] : schedules_) {
    if (schedule.regattaId == regattaId)
      out.push_back(schedule);
  }
  std::stable_sort(out.begin(), out.end(), [](const StartSchedule& a, const StartSchedule& b) {
    return a.scheduledDate < b.scheduledDate;
  });
  return out;
}

void MemoryScheduleStore::persist(const ScheduleMap&) {}

void MemoryScheduleStore::seed(ScheduleMap schedules) {
  std::lock_guard<std::mutex> lock(mtx_);
  schedules_ = std::move(schedules);
  rebuildIndex();
}

void MemoryScheduleStore::reindex(const StartSchedule* before, const StartSchedule* after) {
  if (before != nullptr) {
    for (const auto& entry : before->entries)
      entryIndex_.erase(entry.id);
  }
  if (after != nullptr) {
    for (const auto& entry : after->entries)
      entryIndex_[entry.id] = after->id;
  }
}

void MemoryScheduleStore::rebuildIndex() {
  entryIndex_.clear();
  for (const auto& [id, schedule] : schedules_) {
    for (const auto& entry : schedule.entries)
      entryIndex_[entry.id] = id;
  }
}
