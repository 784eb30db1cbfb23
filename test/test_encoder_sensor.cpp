#include <gtest/gtest.h>

#include <atomic>
#include <thread>

#include "sensors/EncoderSensor.h"

namespace {

// Accepted edges are spaced past the 5 ms debounce window
constexpr uint32_t EDGE_GAP_US = 6000;

}  // namespace

TEST(EncoderSensorTest, PhaseLevelSetsDirection) {
  EncoderSensor enc;

  EXPECT_TRUE(enc.onPulseEdge(false, 0));
  EXPECT_EQ(1, enc.getCount());
  EXPECT_EQ(1, enc.lastDirection());

  EXPECT_TRUE(enc.onPulseEdge(true, EDGE_GAP_US));
  EXPECT_TRUE(enc.onPulseEdge(true, 2 * EDGE_GAP_US));
  EXPECT_EQ(-1, enc.getCount());
  EXPECT_EQ(-1, enc.lastDirection());
}

TEST(EncoderSensorTest, InvertDirectionFlipsSign) {
  EncoderSensor::Config cfg;
  cfg.invert_direction = true;
  EncoderSensor enc(cfg);

  enc.onPulseEdge(false, 0);
  EXPECT_EQ(-1, enc.getCount());
  EXPECT_EQ(-1, enc.lastDirection());
}

TEST(EncoderSensorTest, EdgesInsideDebounceWindowAreRejected) {
  EncoderSensor enc;

  EXPECT_TRUE(enc.onPulseEdge(false, 10000));
  EXPECT_FALSE(enc.onPulseEdge(false, 11000));
  EXPECT_FALSE(enc.onPulseEdge(false, 14999));

  // Exactly one window after the last accepted edge
  EXPECT_TRUE(enc.onPulseEdge(false, 15000));

  EXPECT_EQ(2, enc.getCount());
  EXPECT_EQ(2u, enc.rejectedEdges());
}

TEST(EncoderSensorTest, DebounceSurvivesMicrosRollover) {
  EncoderSensor enc;

  EXPECT_TRUE(enc.onPulseEdge(false, 0xFFFFF000UL));
  EXPECT_FALSE(enc.onPulseEdge(false, 0x00000100UL));   // 4352 us later
  EXPECT_TRUE(enc.onPulseEdge(false, 0x00001000UL));    // 8192 us later
  EXPECT_EQ(2, enc.getCount());
}

TEST(EncoderSensorTest, DistanceFromCount) {
  EncoderSensor enc;

  uint32_t t = 0;
  for (int i = 0; i < 500; i++) {
    enc.onPulseEdge(false, t);
    t += EDGE_GAP_US;
  }

  EXPECT_EQ(500, enc.getCount());
  EXPECT_FLOAT_EQ(1.0f, enc.revolutions());
  EXPECT_NEAR(20.42f, enc.distanceCm(), 1e-4);

  for (int i = 0; i < 750; i++) {
    enc.onPulseEdge(true, t);
    t += EDGE_GAP_US;
  }
  EXPECT_NEAR(-10.21f, enc.distanceCm(), 1e-4);
}

TEST(EncoderSensorTest, ConcurrentReadersSeeEveryUpdate) {
  EncoderSensor enc;
  const int N = 20000;

  std::atomic<bool> done(false);
  std::atomic<bool> went_backwards(false);

  auto reader = [&]() {
    int32_t prev = 0;
    while (!done.load()) {
      const int32_t c = enc.getCount();
      if (c < prev) went_backwards.store(true);
      prev = c;
      (void)enc.distanceCm();
    }
  };

  std::thread r1(reader);
  std::thread r2(reader);

  std::thread producer([&]() {
    uint32_t t = 0;
    for (int i = 0; i < N; i++) {
      enc.onPulseEdge(false, t);
      t += EDGE_GAP_US;
    }
  });

  producer.join();
  done.store(true);
  r1.join();
  r2.join();

  EXPECT_EQ(N, enc.getCount());
  EXPECT_FALSE(went_backwards.load());
}

TEST(EncoderSensorTest, FirstSampleIsBaselineOnly) {
  EncoderSensor enc;
  enc.onPulseEdge(false, 0);

  enc.sample(1000);

  const EncoderSensor::State& s = enc.getState();
  EXPECT_EQ(1, s.count);
  EXPECT_EQ(0, s.delta_counts);
  EXPECT_FALSE(s.valid_speed);
  EXPECT_EQ(1000u, s.last_sample_ms);
}

TEST(EncoderSensorTest, SampleDerivesRpmAndSpeed) {
  EncoderSensor enc;
  enc.sample(0);

  uint32_t t = 0;
  for (int i = 0; i < 250; i++) {
    enc.onPulseEdge(false, t);
    t += EDGE_GAP_US;
  }
  enc.sample(500);

  const EncoderSensor::State& s = enc.getState();
  EXPECT_EQ(250, s.count);
  EXPECT_EQ(250, s.delta_counts);
  EXPECT_TRUE(s.valid_speed);
  EXPECT_NEAR(60.0f, s.rpm, 1e-3);
  EXPECT_NEAR(20.42f, s.speed_cmps, 1e-3);
  EXPECT_NEAR(10.21f, s.distance_cm, 1e-4);
}

TEST(EncoderSensorTest, ResetRebasesCountAndOdometry) {
  EncoderSensor enc;
  enc.onPulseEdge(false, 0);
  enc.sample(10);

  enc.reset(100);

  EXPECT_EQ(100, enc.getCount());
  EXPECT_EQ(100, enc.getState().count);
  EXPECT_FALSE(enc.getState().valid_speed);
}
