// STL headers
#include <string>
#include <vector>

// RollStart headers
#include "core/ScheduleViews.hpp"
#include "core/SequenceRegistry.hpp"
#include "core/TimelineCalculator.hpp"

// GTest headers
#include <gtest/gtest.h>

namespace rollstart::test {

  using namespace rollstart::core;
  using protocols::SequenceProfile;

  namespace {

    TimePoint at(const std::string& hhmm) { return atTimeOfDay("2025-06-14", hhmm); }

    std::vector<FleetStartEntry> fleets(std::initializer_list<const char*> names) {
      std::vector<FleetStartEntry> out;
      int order = 1;
      for (const char* n : names) {
        FleetStartEntry e;
        e.id = std::string("S1-") + n;
        e.scheduleId = "S1";
        e.fleetName = n;
        e.startOrder = order++;
        out.push_back(e);
      }
      return out;
    }

  } // namespace

  class TimelineTest : public ::testing::Test {
  protected:
    SequenceRegistry registry;
    SequenceProfile profile = registry.create("5-4-1-go");
    TimelineOptions options{};
  };

  TEST_F(TimelineTest, rolling_chain_from_first_warning) {
    const auto out = recomputeTimeline(fleets({ "A", "B", "C" }), at("10:00"), profile, options);
    ASSERT_EQ(out.size(), 3u);

    EXPECT_EQ(out[0].plannedWarningTime, at("10:00"));
    EXPECT_EQ(out[0].plannedPrepTime, at("10:01"));
    EXPECT_EQ(out[0].plannedOneMinuteTime, at("10:04"));
    EXPECT_EQ(out[0].plannedStartTime, at("10:05"));
    EXPECT_EQ(out[1].plannedWarningTime, at("10:05"));
    EXPECT_EQ(out[1].plannedStartTime, at("10:10"));
    EXPECT_EQ(out[2].plannedWarningTime, at("10:10"));
    EXPECT_EQ(out[2].plannedStartTime, at("10:15"));
  }

  TEST_F(TimelineTest, planned_times_are_monotonic) {
    auto entries = fleets({ "A", "B", "C", "D", "E" });
    entries[1].customIntervalMinutes = 2;
    entries[2].customIntervalMinutes = 12;
    entries[3].customIntervalMinutes = 1;

    for (auto policy : { IntervalPolicy::Replace, IntervalPolicy::Add }) {
      options.policy = policy;
      const auto out = recomputeTimeline(entries, at("09:00"), profile, options);
      for (std::size_t i = 0; i < out.size(); ++i) {
        EXPECT_LE(*out[i].plannedWarningTime, *out[i].plannedStartTime);
        if (i + 1 < out.size())
          EXPECT_LE(*out[i].plannedStartTime, *out[i + 1].plannedWarningTime)
              << toString(policy) << " at " << i;
      }
    }
  }

  TEST_F(TimelineTest, custom_interval_replace_policy_is_start_to_start_gap) {
    auto entries = fleets({ "A", "B", "C" });
    entries[0].customIntervalMinutes = 10;
    const auto out = recomputeTimeline(entries, at("10:00"), profile, options);

    // A starts 10:05; 10 min start-to-start puts B's gun at 10:15
    EXPECT_EQ(out[1].plannedWarningTime, at("10:10"));
    EXPECT_EQ(out[1].plannedStartTime, at("10:15"));
    EXPECT_EQ(out[2].plannedWarningTime, at("10:15"));
  }

  TEST_F(TimelineTest, custom_interval_replace_never_warns_before_previous_gun) {
    auto entries = fleets({ "A", "B" });
    entries[0].customIntervalMinutes = 2;
    const auto out = recomputeTimeline(entries, at("10:00"), profile, options);
    EXPECT_EQ(out[1].plannedWarningTime, at("10:05"));
  }

  TEST_F(TimelineTest, custom_interval_add_policy_inserts_dead_time) {
    options.policy = IntervalPolicy::Add;
    auto entries = fleets({ "A", "B" });
    entries[0].customIntervalMinutes = 10;
    const auto out = recomputeTimeline(entries, at("10:00"), profile, options);
    EXPECT_EQ(out[1].plannedWarningTime, at("10:15"));
    EXPECT_EQ(out[1].plannedStartTime, at("10:20"));
  }

  TEST_F(TimelineTest, skips_postponed_and_abandoned_entries) {
    auto entries = fleets({ "A", "B", "C" });
    entries[0].status = FleetStatus::Postponed;
    entries[1].status = FleetStatus::Abandoned;
    const auto out = recomputeTimeline(entries, at("10:00"), profile, options);

    EXPECT_FALSE(out[0].plannedWarningTime);
    EXPECT_FALSE(out[1].plannedWarningTime);
    EXPECT_EQ(out[2].plannedWarningTime, at("10:00"));
  }

  TEST_F(TimelineTest, signaled_entries_keep_times_and_anchor_the_chain) {
    auto entries = recomputeTimeline(fleets({ "A", "B", "C" }), at("10:00"), profile, options);
    entries[0].status = FleetStatus::Started;
    entries[0].actualWarningTime = at("10:02");
    entries[0].actualStartTime = at("10:07");
    entries[1].status = FleetStatus::Warning;
    entries[1].actualWarningTime = at("10:07");

    const auto out = recomputeTimeline(entries, at("10:00"), profile, options);
    EXPECT_EQ(out[0], entries[0]);
    EXPECT_EQ(out[1], entries[1]);
    // B's effective start is its actual warning + 5
    EXPECT_EQ(out[2].plannedWarningTime, at("10:12"));
  }

  TEST_F(TimelineTest, anchor_holds_an_entry_back) {
    auto entries = fleets({ "A", "B", "C" });
    entries[1].anchorWarningTime = at("10:30");
    const auto out = recomputeTimeline(entries, at("10:00"), profile, options);
    EXPECT_EQ(out[1].plannedWarningTime, at("10:30"));
    EXPECT_EQ(out[2].plannedWarningTime, at("10:35"));

    entries[1].anchorWarningTime = at("09:00");
    const auto early = recomputeTimeline(entries, at("10:00"), profile, options);
    EXPECT_EQ(early[1].plannedWarningTime, at("10:05"));
  }

  TEST_F(TimelineTest, sorts_by_start_order) {
    auto entries = fleets({ "A", "B" });
    std::swap(entries[0], entries[1]);
    const auto out = recomputeTimeline(entries, at("10:00"), profile, options);
    EXPECT_EQ(out[0].fleetName, "A");
    EXPECT_EQ(out[0].plannedWarningTime, at("10:00"));
  }

  TEST_F(TimelineTest, five_one_go_leaves_prep_unplanned) {
    const SequenceProfile noPrep = registry.create("5-1-go");
    const auto out = recomputeTimeline(fleets({ "A" }), at("10:00"), noPrep, options);
    EXPECT_FALSE(out[0].plannedPrepTime);
    EXPECT_EQ(out[0].plannedOneMinuteTime, at("10:04"));
  }

  TEST(schedule_views, countdown_phases_follow_profile) {
    SequenceRegistry registry;
    const auto profile = registry.create("5-4-1-go");
    FleetStartEntry e;
    e.id = "S1-E1";
    e.status = FleetStatus::Warning;
    e.actualWarningTime = at("10:00");

    auto cd = countdown(e, profile, at("10:00") + std::chrono::seconds{ 30 });
    ASSERT_TRUE(cd);
    EXPECT_EQ(cd->phase, CountdownPhase::Warning);
    EXPECT_EQ(cd->remaining, std::chrono::seconds{ 270 });
    EXPECT_EQ(cd->total, std::chrono::seconds{ 300 });

    cd = countdown(e, profile, at("10:02"));
    EXPECT_EQ(cd->phase, CountdownPhase::Preparatory);

    cd = countdown(e, profile, at("10:04") + std::chrono::seconds{ 10 });
    EXPECT_EQ(cd->phase, CountdownPhase::Final);
    EXPECT_EQ(cd->remaining, std::chrono::seconds{ 50 });

    cd = countdown(e, profile, at("10:06"));
    EXPECT_EQ(cd->phase, CountdownPhase::Start);
    EXPECT_EQ(cd->remaining, std::chrono::seconds{ 0 });

    e.status = FleetStatus::Pending;
    EXPECT_FALSE(countdown(e, profile, at("10:01")));
  }

  TEST(schedule_views, timeline_marks_next_pending_as_upcoming) {
    StartSchedule s;
    s.id = "S1";
    s.entries = fleets({ "A", "B", "C", "D" });
    s.entries[0].status = FleetStatus::Started;
    s.entries[1].status = FleetStatus::Postponed;

    SequenceRegistry registry;
    const auto rows = projectTimeline(s, registry.create("5-4-1-go"));
    ASSERT_EQ(rows.size(), 4u);
    EXPECT_EQ(rows[0].phase, TimelinePhase::Completed);
    EXPECT_EQ(rows[1].phase, TimelinePhase::Postponed);
    EXPECT_EQ(rows[2].phase, TimelinePhase::Upcoming);
    EXPECT_EQ(rows[3].phase, TimelinePhase::Pending);

    const auto summary = summarize(s);
    EXPECT_EQ(summary.totalFleets, 4);
    EXPECT_EQ(summary.fleetsStarted, 1);
    EXPECT_EQ(summary.fleetsPostponed, 1);
    EXPECT_EQ(summary.fleetsPending, 2);
    EXPECT_EQ(summary.nextFleet, "C");
  }

} // namespace rollstart::test
