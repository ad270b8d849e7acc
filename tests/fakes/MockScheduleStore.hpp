#pragma once
/** @file  MockScheduleStore.hpp
 *  @brief gmock ScheduleStore that falls through to a real in-memory store.
 *
 *  © 2025 RollStart contributors — MIT-licensed.
 */

#include <gmock/gmock.h>

#include "io/MemoryScheduleStore.hpp"

namespace rollstart {
  namespace test {

    /// Override single calls with EXPECT_CALL; everything else hits `real`.
    class MockScheduleStore : public rollstart::io::ScheduleStore {
    public:
      MockScheduleStore() {
        using ::testing::Invoke;
        ON_CALL(*this, load).WillByDefault(Invoke(&real, &io::MemoryScheduleStore::load));
        ON_CALL(*this, save).WillByDefault(Invoke(&real, &io::MemoryScheduleStore::save));
        ON_CALL(*this, remove).WillByDefault(Invoke(&real, &io::MemoryScheduleStore::remove));
        ON_CALL(*this, contains).WillByDefault(Invoke(&real, &io::MemoryScheduleStore::contains));
        ON_CALL(*this, scheduleIdForEntry)
            .WillByDefault(Invoke(&real, &io::MemoryScheduleStore::scheduleIdForEntry));
        ON_CALL(*this, listByRegatta)
            .WillByDefault(Invoke(&real, &io::MemoryScheduleStore::listByRegatta));
      }

      MOCK_METHOD(std::optional<core::StartSchedule>, load, (const std::string&),
                  (const, override));
      MOCK_METHOD(std::uint64_t, save, (const core::StartSchedule&), (override));
      MOCK_METHOD(void, remove, (const std::string&, std::uint64_t), (override));
      MOCK_METHOD(bool, contains, (const std::string&), (const, override));
      MOCK_METHOD(std::optional<std::string>, scheduleIdForEntry, (const std::string&),
                  (const, override));
      MOCK_METHOD(std::vector<core::StartSchedule>, listByRegatta, (const std::string&),
                  (const, override));

      io::MemoryScheduleStore real;
    };

  } // namespace test
} // namespace rollstart
