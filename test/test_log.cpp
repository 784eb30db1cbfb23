#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include "Params.h"
#include "fakes/CaptureSink.h"

class LogTest : public ::testing::Test {
protected:
  CaptureSink sink;

  void SetUp() override {
    logger::setSink(&sink);
    logger::setLevel(LogLevel::INFO);
  }

  void TearDown() override {
    logger::setSink(nullptr);
    logger::setLevel(LogLevel::INFO);
  }
};

TEST_F(LogTest, FormatsMessageAndTag) {
  logger::log(LogLevel::INFO, "auto", "tick %d: %s %.1f", 7, "front", 12.5f);

  const std::vector<CaptureSink::Line> lines = sink.lines();
  ASSERT_EQ(1u, lines.size());
  EXPECT_EQ(LogLevel::INFO, lines[0].level);
  EXPECT_EQ("auto", lines[0].tag);
  EXPECT_EQ("tick 7: front 12.5", lines[0].msg);
}

TEST_F(LogTest, MessagesBelowLevelAreDropped) {
  logger::log(LogLevel::DEBUG, "t", "hidden");
  logger::log(LogLevel::WARN, "t", "shown");

  logger::setLevel(LogLevel::ERROR);
  logger::log(LogLevel::WARN, "t", "hidden too");
  logger::log(LogLevel::ERROR, "t", "also shown");

  const std::vector<CaptureSink::Line> lines = sink.lines();
  ASSERT_EQ(2u, lines.size());
  EXPECT_EQ("shown", lines[0].msg);
  EXPECT_EQ("also shown", lines[1].msg);
  EXPECT_EQ(LogLevel::ERROR, logger::level());
}

TEST_F(LogTest, LongMessagesAreTruncatedToLineBuffer) {
  const std::string big(LOG_LINE_BYTES * 2, 'x');
  logger::log(LogLevel::INFO, "t", "%s", big.c_str());

  const std::vector<CaptureSink::Line> lines = sink.lines();
  ASSERT_EQ(1u, lines.size());
  EXPECT_EQ(LOG_LINE_BYTES - 1, lines[0].msg.size());
}

TEST_F(LogTest, NullTagBecomesEmpty) {
  logger::log(LogLevel::INFO, nullptr, "x");
  ASSERT_EQ(1u, sink.lines().size());
  EXPECT_EQ("", sink.lines()[0].tag);
}

TEST_F(LogTest, NoSinkIsANoOp) {
  logger::setSink(nullptr);
  logger::log(LogLevel::ERROR, "t", "dropped");
  EXPECT_TRUE(sink.lines().empty());
}

TEST_F(LogTest, ConcurrentWritersDeliverEveryLine) {
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; t++) {
    threads.emplace_back([t]() {
      for (int i = 0; i < 250; i++) {
        logger::log(LogLevel::INFO, "w", "thread %d line %d", t, i);
      }
    });
  }
  for (std::thread& t : threads) t.join();

  EXPECT_EQ(1000u, sink.lines().size());
}

TEST(LogNames, LevelNames) {
  EXPECT_STREQ("D", logger::levelName(LogLevel::DEBUG));
  EXPECT_STREQ("I", logger::levelName(LogLevel::INFO));
  EXPECT_STREQ("W", logger::levelName(LogLevel::WARN));
  EXPECT_STREQ("E", logger::levelName(LogLevel::ERROR));
}
