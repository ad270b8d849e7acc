// STL headers
#include <chrono>
#include <cstring>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

// System headers
#include <unistd.h> // pipe

// RollStart headers
#include "core/AppConfig.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/RingBuffer.hpp"
#include "core/Scheduler.hpp"
#include "core/SystemCoordinator.hpp"
#include "io/LineChannel.hpp"
#include "protocols/Response.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace rollstart::test {

  using namespace rollstart::core;
  using ::testing::ElementsAre;
  using ::testing::HasSubstr;

  TEST(error_monitor, escalates_each_unique_failure_once) {
    ErrorMonitor monitor;
    std::vector<std::string> escalated;
    monitor.registerEscalation([&](const std::string& msg) { escalated.push_back(msg); });

    monitor.notifyFailure("[Scheduler] store write failed: EIO");
    monitor.notifyFailure("[Scheduler] store write failed: EIO");
    monitor.notifyFailure("[CommitteeLog] flush failed");

    EXPECT_THAT(escalated, ElementsAre("[Scheduler] store write failed: EIO",
                                       "[CommitteeLog] flush failed"));
    EXPECT_EQ(monitor.failures(), escalated);
  }

  TEST(error_monitor, records_without_escalation_callback) {
    ErrorMonitor monitor;
    monitor.notifyFailure("[Scheduler] persistence conflict on S1 after 2 attempt(s)");
    EXPECT_EQ(monitor.failures().size(), 1u);
  }

  TEST(ring_buffer, bounded_fifo_with_close) {
    RingBuffer<int> buf(2);
    EXPECT_EQ(buf.capacity(), 2u);
    EXPECT_TRUE(buf.tryPush(1));
    EXPECT_TRUE(buf.tryPush(2));
    EXPECT_FALSE(buf.tryPush(3)); // full
    EXPECT_EQ(buf.size(), 2u);

    EXPECT_EQ(buf.pop(), 1);
    EXPECT_TRUE(buf.tryPush(4)); // wraps
    buf.close();
    EXPECT_FALSE(buf.tryPush(5));
    EXPECT_EQ(buf.pop(), 2);
    EXPECT_EQ(buf.pop(), 4);
    EXPECT_FALSE(buf.pop());
    EXPECT_THROW(RingBuffer<int>(0), std::invalid_argument);
  }

  TEST(ring_buffer, pop_wakes_on_push_from_other_thread) {
    RingBuffer<std::string> buf(4);
    std::thread producer([&] {
      std::this_thread::sleep_for(std::chrono::milliseconds{ 20 });
      buf.tryPush("warning");
    });
    EXPECT_EQ(buf.pop(), "warning");
    producer.join();
  }

  //---SystemCoordinator--------------------------------------------------

  namespace {

    AppConfig quietConfig() {
      AppConfig cfg;
      cfg.committeeLogPath.clear();
      return cfg;
    }

    /// Feeds \p script to a coordinator over pipes and returns every reply line.
    std::vector<protocols::Response> serve(SystemCoordinator& coord, const std::string& script,
                                           bool* result) {
      int in[2];
      int out[2];
      EXPECT_EQ(0, ::pipe(in));
      EXPECT_EQ(0, ::pipe(out));
      EXPECT_EQ(static_cast<ssize_t>(script.size()), ::write(in[1], script.data(), script.size()));
      ::close(in[1]);

      {
        io::LineChannel console(in[0], out[1], true);
        *result = coord.run(console, std::chrono::milliseconds{ 50 });
      }

      std::vector<protocols::Response> replies;
      io::LineChannel reader(out[0], -1, true);
      while (auto line = reader.readLine(std::chrono::milliseconds{ 50 })) {
        auto r = protocols::Response::fromWire(*line);
        EXPECT_TRUE(r) << *line;
        if (r)
          replies.push_back(*r);
      }
      return replies;
    }

  } // namespace

  TEST(system_coordinator, serves_console_until_quit) {
    SystemCoordinator coord(quietConfig());
    EXPECT_EQ(coord.state(), SystemState::BOOT);
    coord.initialize();
    EXPECT_EQ(coord.state(), SystemState::IDLE);

    const std::string script = "# morning briefing\n"
                               "create-schedule R1 Saturday 2025-06-14 10:00\n"
                               "\n"
                               "add-fleet S1 Laser\n"
                               "ready S1\n"
                               "postpone S1-E1 \"fog\n"
                               "ready S1\n"
                               "quit\n"
                               "list R1\n";
    bool clean = false;
    const auto replies = serve(coord, script, &clean);

    EXPECT_TRUE(clean);
    EXPECT_EQ(coord.state(), SystemState::FINISHED);
    ASSERT_EQ(replies.size(), 6u); // comment and blank line get no reply; nothing after quit
    EXPECT_EQ(replies[0].result.at("id"), "S1");
    EXPECT_EQ(replies[2].result.at("status"), "ready");
    EXPECT_EQ(replies[3].error, "InvalidArgument");
    EXPECT_THAT(replies[3].message, HasSubstr("unterminated quote"));
    EXPECT_EQ(replies[4].error, "InvalidTransition");
    EXPECT_TRUE(replies[5].ok);

    EXPECT_EQ(coord.scheduler()->listSchedules("R1").size(), 1u);
  }

  TEST(system_coordinator, non_utf8_fleet_name_does_not_end_the_session) {
    SystemCoordinator coord(quietConfig());
    coord.initialize();

    const std::string script = "create-schedule R1 Sat 2025-06-14 10:00\n"
                               "add-fleet S1 \xffLaser\n"
                               "show S1\n"
                               "quit\n";
    bool clean = false;
    const auto replies = serve(coord, script, &clean);

    EXPECT_TRUE(clean);
    EXPECT_EQ(coord.state(), SystemState::FINISHED);
    ASSERT_EQ(replies.size(), 4u);
    EXPECT_EQ(replies[1].error, "InvalidArgument");
    EXPECT_THAT(replies[1].message, HasSubstr("UTF-8"));
    EXPECT_TRUE(replies[2].ok);
    EXPECT_TRUE(replies[2].result.at("entries").empty());
    EXPECT_TRUE(coord.errorMonitor()->failures().empty());
  }

  TEST(system_coordinator, escalation_ends_in_error_state) {
    SystemCoordinator coord(quietConfig());
    coord.initialize();
    coord.errorMonitor()->notifyFailure("[Scheduler] store write failed: EIO");
    EXPECT_EQ(coord.state(), SystemState::ERROR);
  }

  TEST(system_coordinator, store_fault_is_answered_then_reported) {
    const auto path =
        (std::filesystem::temp_directory_path() / "rollstart_coordinator_store.json").string();
    std::filesystem::remove(path);
    // a directory squatting on the temp name makes every store write fail
    std::filesystem::create_directory(path + ".tmp");

    AppConfig cfg = quietConfig();
    cfg.storePath = path;
    SystemCoordinator coord(cfg);
    coord.initialize();

    bool clean = true;
    const auto replies = serve(coord, "create-schedule R1 Saturday 2025-06-14 10:00\n", &clean);

    EXPECT_FALSE(clean);
    EXPECT_EQ(coord.state(), SystemState::ERROR);
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(replies[0].error, "InternalError");
    EXPECT_FALSE(coord.errorMonitor()->failures().empty());

    std::filesystem::remove(path + ".tmp");
    std::filesystem::remove(path);
  }

  TEST(system_coordinator, lifecycle_order_is_enforced) {
    SystemCoordinator coord(quietConfig());
    int fds[2];
    ASSERT_EQ(0, ::pipe(fds));
    io::LineChannel console(fds[0], fds[1], true);
    EXPECT_THROW(coord.run(console), std::runtime_error);
    coord.initialize();
    EXPECT_THROW(coord.initialize(), std::runtime_error);
    EXPECT_STREQ(toString(SystemState::RUNNING), "RUNNING");
  }

} // namespace rollstart::test
