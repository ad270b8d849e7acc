// STL headers
#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>

// RollStart headers
#include "core/AppConfig.hpp"
#include "core/ConfigLoader.hpp"
#include "core/ScheduleError.hpp"

// GTest headers
#include <gtest/gtest.h>

namespace rollstart::test {

  using namespace rollstart::core;
  using nlohmann::json;

  TEST(app_config, empty_object_gives_defaults) {
    const AppConfig cfg = AppConfig::fromJson(json::object());
    EXPECT_EQ(cfg.scheduler.lockTimeout, std::chrono::milliseconds{ 250 });
    EXPECT_EQ(cfg.scheduler.conflictRetries, 1);
    EXPECT_EQ(cfg.scheduler.autoAdvanceTolerance, std::chrono::seconds{ 0 });
    EXPECT_EQ(cfg.scheduler.intervalPolicy, IntervalPolicy::Replace);
    EXPECT_TRUE(cfg.storePath.empty());
    EXPECT_EQ(cfg.committeeLogPath, "committee_log.csv");
    EXPECT_EQ(cfg.committeeLogCapacity, 256u);
    EXPECT_TRUE(cfg.sequences.empty());
  }

  TEST(app_config, reads_every_section) {
    const json j = json::parse(R"({
      "scheduler": { "lockTimeoutMs": 0, "conflictRetries": 3,
                     "autoAdvanceToleranceSec": 5, "intervalPolicy": "add" },
      "store": { "path": "schedules.json" },
      "committeeLog": { "path": "", "capacity": 16 },
      "sequences": { "club-4-1": { "warning": 4, "preparatory": null, "oneMinute": 1 } }
    })");

    const AppConfig cfg = AppConfig::fromJson(j);
    EXPECT_EQ(cfg.scheduler.lockTimeout, std::chrono::milliseconds{ 0 });
    EXPECT_EQ(cfg.scheduler.conflictRetries, 3);
    EXPECT_EQ(cfg.scheduler.autoAdvanceTolerance, std::chrono::seconds{ 5 });
    EXPECT_EQ(cfg.scheduler.intervalPolicy, IntervalPolicy::Add);
    EXPECT_EQ(cfg.storePath, "schedules.json");
    EXPECT_TRUE(cfg.committeeLogPath.empty());
    EXPECT_EQ(cfg.committeeLogCapacity, 16u);

    ASSERT_EQ(cfg.sequences.size(), 1u);
    EXPECT_EQ(cfg.sequences[0].name, "club-4-1");
    EXPECT_EQ(cfg.sequences[0].warningOffset, Minutes{ 4 });
    EXPECT_FALSE(cfg.sequences[0].prepOffset);
    EXPECT_EQ(cfg.sequences[0].oneMinuteOffset, Minutes{ 1 });
  }

  TEST(app_config, schema_violations_are_invalid_argument) {
    for (const char* text : { R"({"scheduler": 5})",
                              R"({"scheduler": {"lockTimeoutMs": -1}})",
                              R"({"scheduler": {"conflictRetries": "two"}})",
                              R"({"scheduler": {"intervalPolicy": "stretch"}})",
                              R"({"committeeLog": {"capacity": 0}})",
                              R"({"sequences": {"x": {"preparatory": 2}}})" }) {
      try {
        AppConfig::fromJson(json::parse(text));
        ADD_FAILURE() << "accepted " << text;
      } catch (const ScheduleError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidArgument) << text;
      }
    }
  }

  TEST(config_loader, parses_file_and_reports_bad_paths) {
    const auto path = (std::filesystem::temp_directory_path() / "rollstart_config_test.json").string();
    {
      std::ofstream out(path);
      out << R"({"store": {"path": "s.json"}})";
    }
    const json j = ConfigLoader(path).load();
    EXPECT_EQ(AppConfig::fromJson(j).storePath, "s.json");

    {
      std::ofstream out(path);
      out << "[1, 2";
    }
    EXPECT_THROW(ConfigLoader(path).load(), std::runtime_error);

    {
      std::ofstream out(path);
      out << "[1, 2]";
    }
    EXPECT_THROW(ConfigLoader(path).load(), std::runtime_error);

    std::filesystem::remove(path);
    EXPECT_THROW(ConfigLoader(path).load(), std::runtime_error);
    EXPECT_THROW(ConfigLoader(""), std::invalid_argument);
  }

} // namespace rollstart::test
