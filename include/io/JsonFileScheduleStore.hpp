#pragma once
/** @file  JsonFileScheduleStore.hpp
 *  @brief MemoryScheduleStore mirrored to one JSON document on disk.
 *
 *  © 2025 RollStart contributors — MIT-licensed.
 */

#include <string>

#include "io/MemoryScheduleStore.hpp"

namespace rollstart::io {

  /**
 * @class JsonFileScheduleStore
 * @brief Loads the file on construction and rewrites it on every commit.
 *
 *  * Writes go to `<path>.tmp` first and are moved over `<path>` with rename(2),
 *    so a crash never leaves a half-written store.
 *  * Throws `std::runtime_error` when the file cannot be read, parsed or written.
 */
  class JsonFileScheduleStore : public MemoryScheduleStore {
  public:
    /// @param path  Store file; created on the first commit when missing.
    explicit JsonFileScheduleStore(std::string path);

    const std::string& path() const { return path_; }

  protected:
    void persist(const ScheduleMap& schedules) override;

  private:
    std::string path_;
  };

} // namespace rollstart::io
