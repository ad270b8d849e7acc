// STL headers
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>

// System headers
#include <unistd.h> // pipe

// RollStart headers
#include "io/FileLogger.hpp"
#include "io/LineChannel.hpp"

// GTest headers
#include <gtest/gtest.h>

namespace {

  struct PipePair {
    int toChannel[2]{ -1, -1 };   // test writes [1], channel reads [0]
    int fromChannel[2]{ -1, -1 }; // channel writes [1], test reads [0]

    PipePair() {
      EXPECT_EQ(0, ::pipe(toChannel));
      EXPECT_EQ(0, ::pipe(fromChannel));
    }
    ~PipePair() {
      for (int fd : { toChannel[1], fromChannel[0] }) {
        if (fd >= 0)
          ::close(fd);
      }
    }
    void send(const char* text) const {
      ASSERT_EQ(static_cast<ssize_t>(std::strlen(text)), ::write(toChannel[1], text, std::strlen(text)));
    }
    void hangUp() {
      ::close(toChannel[1]);
      toChannel[1] = -1;
    }
  };

  std::string slurp(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }

} // namespace

TEST(line_channel, reads_lines_and_strips_cr) {
  PipePair p;
  rollstart::io::LineChannel chan(p.toChannel[0], p.fromChannel[1], true);

  p.send("status S1\r\nready S1\npart");
  auto line = chan.readLine(std::chrono::milliseconds{ 100 });
  ASSERT_TRUE(line);
  EXPECT_EQ(*line, "status S1");

  line = chan.readLine(std::chrono::milliseconds{ 100 });
  ASSERT_TRUE(line);
  EXPECT_EQ(*line, "ready S1");

  // no terminator yet: times out
  EXPECT_FALSE(chan.readLine(std::chrono::milliseconds{ 20 }));
  EXPECT_FALSE(chan.eof());

  p.send("ial\n");
  line = chan.readLine(std::chrono::milliseconds{ 100 });
  ASSERT_TRUE(line);
  EXPECT_EQ(*line, "partial");
}

TEST(line_channel, returns_unterminated_tail_at_eof) {
  PipePair p;
  rollstart::io::LineChannel chan(p.toChannel[0], p.fromChannel[1], true);

  p.send("quit");
  p.hangUp();

  auto line = chan.readLine(std::chrono::milliseconds{ 100 });
  ASSERT_TRUE(line);
  EXPECT_EQ(*line, "quit");
  EXPECT_TRUE(chan.eof());
  EXPECT_FALSE(chan.readLine(std::chrono::milliseconds{ 10 }));
}

TEST(line_channel, writes_newline_terminated_replies) {
  PipePair p;
  rollstart::io::LineChannel chan(p.toChannel[0], p.fromChannel[1], true);

  ASSERT_TRUE(chan.writeLine("{\"ok\":true}"));
  ASSERT_TRUE(chan.writeLine("second\n"));

  char buf[64] = { 0 };
  ssize_t n = ::read(p.fromChannel[0], buf, sizeof(buf) - 1);
  ASSERT_GT(n, 0);
  EXPECT_STREQ(buf, "{\"ok\":true}\nsecond\n");

  chan.close();
  EXPECT_FALSE(chan.writeLine("after close"));
}

TEST(line_channel, move_transfers_descriptors) {
  PipePair p;
  rollstart::io::LineChannel a(p.toChannel[0], p.fromChannel[1], true);
  rollstart::io::LineChannel b(std::move(a));

  EXPECT_FALSE(a.writeLine("x"));
  EXPECT_TRUE(b.writeLine("y"));
}

TEST(file_logger, appends_and_flushes) {
  const auto path = (std::filesystem::temp_directory_path() / "rollstart_file_logger.csv").string();
  std::filesystem::remove(path);

  {
    rollstart::io::FileLogger log;
    ASSERT_TRUE(log.open(path));
    EXPECT_TRUE(log.write("a,b\n"));
    EXPECT_TRUE(log.flush());
    EXPECT_EQ(slurp(path), "a,b\n");
    EXPECT_TRUE(log.write("c,d\n"));
  } // destructor flushes

  rollstart::io::FileLogger again;
  ASSERT_TRUE(again.open(path));
  EXPECT_TRUE(again.write("e,f\n"));
  again.close();
  EXPECT_FALSE(again.isOpen());
  EXPECT_EQ(slurp(path), "a,b\nc,d\ne,f\n");

  std::filesystem::remove(path);
}

TEST(file_logger, open_fails_for_missing_directory) {
  rollstart::io::FileLogger log;
  EXPECT_FALSE(log.open("/nonexistent-dir/rollstart/log.csv"));
  EXPECT_FALSE(log.isOpen());
}
