// STL headers
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

// RollStart headers
#include "core/CommitteeLog.hpp"
#include "core/TimeUtil.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace rollstart::test {

  using namespace rollstart::core;
  using ::testing::HasSubstr;

  namespace {

    ScheduleEvent fleetEvent(EventType type) {
      ScheduleEvent e;
      e.type = type;
      e.scheduleId = "S1";
      e.entryId = "S1-E2";
      e.timestamp = parseIso("2025-06-14T10:05:00Z");
      e.details["regattaId"] = "R1";
      e.details["scheduleName"] = "Day 1";
      e.details["fleetName"] = "ILCA 6";
      e.details["classFlag"] = "ILCA";
      e.details["raceNumber"] = 3;
      return e;
    }

    std::vector<std::string> readLines(const std::string& path) {
      std::ifstream in(path);
      std::vector<std::string> lines;
      for (std::string line; std::getline(in, line);)
        lines.push_back(line);
      return lines;
    }

  } // namespace

  TEST(committee_log, header_lists_all_columns) {
    EXPECT_STREQ(CommitteeLog::csvHeader(),
                 "timestamp,scheduleId,entryId,regattaId,raceNumber,category,eventType,title,"
                 "flags,soundSignals,description");
  }

  TEST(committee_log, warning_row_flies_class_flag) {
    EXPECT_EQ(CommitteeLog::formatRow(fleetEvent(EventType::WarningSignaled)),
              "2025-06-14T10:05:00Z,S1,S1-E2,R1,3,signal,WarningSignaled,Warning Signal: ILCA 6,"
              "ILCA,1,Race 3 - ILCA 6");
  }

  TEST(committee_log, flags_and_sounds_per_signal) {
    struct Case {
      EventType type;
      const char* category;
      const char* flags;
      const char* sounds;
    };
    const Case cases[] = {
      { EventType::PreparatorySignaled, "signal", ",P,", ",1," },
      { EventType::OneMinuteSignaled, "signal", ",,", ",1," },
      { EventType::StartSignaled, "timing", ",,", ",1," },
      { EventType::GeneralRecall, "signal", ",First Substitute,", ",2," },
      { EventType::Postponed, "signal", ",AP,", ",2," },
      { EventType::Abandoned, "signal", ",N,", ",3," },
    };
    for (const auto& c : cases) {
      const std::string row = CommitteeLog::formatRow(fleetEvent(c.type));
      EXPECT_THAT(row, HasSubstr(std::string(",") + c.category + "," + toString(c.type) + ","))
          << row;
      EXPECT_THAT(row, HasSubstr(std::string(c.flags) + (c.sounds + 1))) << row;
    }
  }

  TEST(committee_log, individual_recall_lists_boats_and_quotes_commas) {
    auto e = fleetEvent(EventType::IndividualRecall);
    e.details["boatIds"] = nlohmann::json::array({ "GBR 12", "FRA 7" });
    EXPECT_EQ(CommitteeLog::formatRow(e),
              "2025-06-14T10:05:00Z,S1,S1-E2,R1,3,signal,IndividualRecall,"
              "Individual Recall: ILCA 6,X,1,\"Individual recall for boats: GBR 12, FRA 7\"");
  }

  TEST(committee_log, reason_becomes_description) {
    auto e = fleetEvent(EventType::Postponed);
    e.details["reason"] = "wind \"shift\"";
    EXPECT_THAT(CommitteeLog::formatRow(e), HasSubstr(",AP,2,\"wind \"\"shift\"\"\""));
  }

  TEST(committee_log, schedule_events_use_schedule_category) {
    ScheduleEvent e;
    e.type = EventType::ScheduleReady;
    e.scheduleId = "S1";
    e.timestamp = parseIso("2025-06-14T09:00:00Z");
    e.details["regattaId"] = "R1";
    e.details["scheduleName"] = "Day 1";
    EXPECT_EQ(CommitteeLog::formatRow(e),
              "2025-06-14T09:00:00Z,S1,,R1,,schedule,ScheduleReady,ScheduleReady: Day 1,,0,");
  }

  TEST(committee_log, run_writes_header_once_and_rows_in_order) {
    const auto path = (std::filesystem::temp_directory_path() / "rollstart_committee.csv").string();
    std::filesystem::remove(path);

    {
      CommitteeLog log;
      log.startNewRun(path);
      EXPECT_TRUE(log.running());
      log.publish(fleetEvent(EventType::WarningSignaled));
      log.publish(fleetEvent(EventType::StartSignaled));
      log.finishRun();
      EXPECT_FALSE(log.running());
      EXPECT_EQ(log.droppedEvents(), 0u);
    }
    {
      CommitteeLog log;
      log.startNewRun(path); // existing file: no second header
      log.log(fleetEvent(EventType::Abandoned));
    } // destructor finishes the run

    const auto lines = readLines(path);
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], CommitteeLog::csvHeader());
    EXPECT_THAT(lines[1], HasSubstr("WarningSignaled"));
    EXPECT_THAT(lines[2], HasSubstr("StartSignaled"));
    EXPECT_THAT(lines[3], HasSubstr("Abandoned"));

    std::filesystem::remove(path);
  }

  TEST(committee_log, events_outside_a_run_are_dropped) {
    CommitteeLog log(4);
    log.log(fleetEvent(EventType::WarningSignaled));
    EXPECT_EQ(log.droppedEvents(), 1u);
    EXPECT_THROW(CommitteeLog(0), std::invalid_argument);
    EXPECT_THROW(log.startNewRun("/nonexistent-dir/rollstart/log.csv"), std::runtime_error);
    EXPECT_FALSE(log.running());
  }

} // namespace rollstart::test
