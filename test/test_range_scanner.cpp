#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "fakes/FakeHardware.h"
#include "sensors/RangeScanner.h"

using ::testing::Each;
using ::testing::ElementsAre;
using ::testing::Eq;

class RangeScannerTest : public ::testing::Test {
protected:
  FakeAngle head;
  FakeRange range{ &head };
  FakeClock clock;
  RangeScanner scanner{ head, range, clock };
};

TEST_F(RangeScannerTest, SetScanAngleClampsToLimits) {
  EXPECT_EQ(85, scanner.setScanAngle(120));
  EXPECT_EQ(85, head.last());

  EXPECT_EQ(-85, scanner.setScanAngle(-200));
  EXPECT_EQ(-85, head.last());
  EXPECT_EQ(-85, scanner.currentAngle());

  EXPECT_EQ(30, scanner.setScanAngle(30));
  EXPECT_TRUE(clock.sleeps().empty());
}

TEST_F(RangeScannerTest, SweepWritesEveryStepAndDelaysAfterEach) {
  scanner.begin(0);
  head.clear();

  scanner.sweepTo(20);

  EXPECT_THAT(head.history(), ElementsAre(0, 5, 10, 15, 20));
  EXPECT_EQ(5u, clock.sleeps().size());
  EXPECT_THAT(clock.sleeps(), Each(Eq(SCAN_STEP_DELAY_MS)));
  EXPECT_EQ(20, scanner.currentAngle());
}

TEST_F(RangeScannerTest, FinalStepLandsExactlyOnTarget) {
  scanner.begin(0);
  head.clear();

  scanner.sweepTo(12);
  EXPECT_THAT(head.history(), ElementsAre(0, 5, 10, 12));

  head.clear();
  scanner.sweepTo(-3, 10, 15);
  EXPECT_THAT(head.history(), ElementsAre(12, 2, -3));
  EXPECT_EQ(15u, clock.sleeps().back());
}

TEST_F(RangeScannerTest, SweepTargetIsClamped) {
  scanner.begin(80);
  head.clear();

  scanner.sweepTo(170);

  EXPECT_EQ(std::vector<int>({ 80, 85 }), head.history());
  EXPECT_EQ(85, scanner.currentAngle());
}

TEST_F(RangeScannerTest, SweepToCurrentAngleWritesOnce) {
  scanner.begin(0);
  head.clear();
  clock.clear();

  scanner.sweepTo(0);

  EXPECT_EQ(std::vector<int>({ 0 }), head.history());
  EXPECT_EQ(1u, clock.sleeps().size());
}

TEST_F(RangeScannerTest, FullSweepAcrossRange) {
  scanner.begin(85);
  head.clear();

  scanner.sweepTo(-85);

  const std::vector<int> h = head.history();
  ASSERT_EQ(35u, h.size());
  EXPECT_EQ(85, h.front());
  EXPECT_EQ(-85, h.back());
  for (int deg : h) {
    EXPECT_GE(deg, -85);
    EXPECT_LE(deg, 85);
  }
}

TEST_F(RangeScannerTest, ReadTagsAngleAndValidity) {
  scanner.begin(-40);
  range.push(37.5f);
  range.pushFailure();

  const ScanReading ok = scanner.readDistanceCm();
  EXPECT_TRUE(ok.valid);
  EXPECT_FLOAT_EQ(37.5f, ok.distance_cm);
  EXPECT_EQ(-40, ok.angle_deg);

  const ScanReading bad = scanner.readDistanceCm();
  EXPECT_FALSE(bad.valid);
  EXPECT_EQ(-40, bad.angle_deg);
}

TEST_F(RangeScannerTest, ConcurrentReadsAreSerialized) {
  range.setBusyUs(50);

  auto reader = [this]() {
    for (int i = 0; i < 100; i++) {
      (void)scanner.readDistanceCm();
    }
  };

  std::thread t1(reader);
  std::thread t2(reader);
  t1.join();
  t2.join();

  EXPECT_EQ(200, range.calls());
  EXPECT_EQ(1, range.maxInFlight());
}
