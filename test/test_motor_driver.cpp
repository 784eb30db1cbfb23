#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <thread>
#include <vector>

#include "fakes/DriveRig.h"

namespace {

int indexOf(const std::vector<std::string>& v, const std::string& s, size_t from = 0) {
  for (size_t i = from; i < v.size(); i++) {
    if (v[i] == s) return (int)i;
  }
  return -1;
}

}  // namespace

TEST(MotorDriverTest, BeginLeavesDriverDisabledAndDeEnergized) {
  MotorRig rig;

  EXPECT_FALSE(rig.motors.isEnabled());
  EXPECT_TRUE(rig.allPwmZero());
  EXPECT_TRUE(rig.allEnablesLow());
}

TEST(MotorDriverTest, DisabledDriverHoldsOutputsAtZero) {
  MotorRig rig;

  rig.motors.setChannelSpeed(MotorDriver::CHANNEL_A, 0.5f);
  rig.motors.setChannelSpeed(MotorDriver::CHANNEL_B, -0.5f);

  EXPECT_TRUE(rig.allPwmZero());
  EXPECT_FLOAT_EQ(0.0f, rig.motors.speedCmd(MotorDriver::CHANNEL_A));
  EXPECT_FLOAT_EQ(0.0f, rig.motors.speedCmd(MotorDriver::CHANNEL_B));
}

TEST(MotorDriverTest, PositiveNegativeAndZeroMapping) {
  MotorRig rig;
  rig.motors.enable();

  rig.motors.setChannelSpeed(MotorDriver::CHANNEL_A, 0.4f);
  EXPECT_FLOAT_EQ(0.4f, rig.a_fwd.value());
  EXPECT_FLOAT_EQ(0.0f, rig.a_rev.value());

  rig.motors.setChannelSpeed(MotorDriver::CHANNEL_A, -0.6f);
  EXPECT_FLOAT_EQ(0.0f, rig.a_fwd.value());
  EXPECT_FLOAT_EQ(0.6f, rig.a_rev.value());

  rig.motors.setChannelSpeed(MotorDriver::CHANNEL_A, 0.0f);
  EXPECT_FLOAT_EQ(0.0f, rig.a_fwd.value());
  EXPECT_FLOAT_EQ(0.0f, rig.a_rev.value());

  // Channel B untouched
  EXPECT_EQ(0.0f, rig.b_fwd.value());
  EXPECT_EQ(0.0f, rig.b_rev.value());
}

TEST(MotorDriverTest, OutOfRangeSpeedIsClamped) {
  MotorRig rig;
  rig.motors.enable();

  rig.motors.setChannelSpeed(MotorDriver::CHANNEL_B, 1.7f);
  EXPECT_FLOAT_EQ(1.0f, rig.b_fwd.value());
  EXPECT_FLOAT_EQ(1.0f, rig.motors.speedCmd(MotorDriver::CHANNEL_B));

  rig.motors.setChannelSpeed(MotorDriver::CHANNEL_B, -3.0f);
  EXPECT_FLOAT_EQ(1.0f, rig.b_rev.value());
  EXPECT_FLOAT_EQ(0.0f, rig.b_fwd.value());
  EXPECT_FLOAT_EQ(-1.0f, rig.motors.speedCmd(MotorDriver::CHANNEL_B));
}

TEST(MotorDriverTest, ReleasedOutputIsWrittenBeforeDrivenOutput) {
  MotorRig rig;
  rig.motors.enable();
  rig.motors.setChannelSpeed(MotorDriver::CHANNEL_A, 0.5f);
  rig.events.clear();

  rig.motors.setChannelSpeed(MotorDriver::CHANNEL_A, -0.5f);

  const std::vector<std::string> ev = rig.events.snapshot();
  ASSERT_EQ(2u, ev.size());
  EXPECT_EQ("Af=0.00", ev[0]);
  EXPECT_EQ("Ar=0.50", ev[1]);
}

TEST(MotorDriverTest, EnableAlwaysWritesAllFourLines) {
  MotorRig rig;

  rig.motors.enable();
  rig.motors.enable();

  EXPECT_TRUE(rig.motors.isEnabled());
  EXPECT_EQ(2, rig.a_en_r.trueWrites());
  EXPECT_EQ(2, rig.a_en_l.trueWrites());
  EXPECT_EQ(2, rig.b_en_r.trueWrites());
  EXPECT_EQ(2, rig.b_en_l.trueWrites());
}

TEST(MotorDriverTest, DisableZeroesPwmBeforeDroppingEnables) {
  MotorRig rig;
  rig.motors.enable();
  rig.motors.setChannelSpeed(MotorDriver::CHANNEL_A, 0.8f);
  rig.motors.setChannelSpeed(MotorDriver::CHANNEL_B, -0.8f);
  rig.events.clear();

  rig.motors.disable();

  const std::vector<std::string> ev = rig.events.snapshot();
  const int last_pwm = std::max(std::max(indexOf(ev, "Af=0.00"), indexOf(ev, "Ar=0.00")),
                                std::max(indexOf(ev, "Bf=0.00"), indexOf(ev, "Br=0.00")));
  const int first_en = indexOf(ev, "AenR=0");

  ASSERT_GE(last_pwm, 0);
  ASSERT_GE(first_en, 0);
  EXPECT_LT(last_pwm, first_en);

  EXPECT_TRUE(rig.allPwmZero());
  EXPECT_TRUE(rig.allEnablesLow());
  EXPECT_FALSE(rig.motors.isEnabled());
}

TEST(MotorDriverTest, InvertedChannelSwapsOutputsButReportsCommand) {
  MotorRig rig(true, false);
  rig.motors.enable();

  rig.motors.setChannelSpeed(MotorDriver::CHANNEL_A, 0.5f);

  EXPECT_FLOAT_EQ(0.0f, rig.a_fwd.value());
  EXPECT_FLOAT_EQ(0.5f, rig.a_rev.value());
  EXPECT_FLOAT_EQ(0.5f, rig.motors.speedCmd(MotorDriver::CHANNEL_A));
}

TEST(MotorDriverTest, FailedPwmWriteLatchesFault) {
  MotorRig rig;
  rig.motors.enable();
  EXPECT_FALSE(rig.motors.outputFault());

  rig.b_fwd.setFail(true);
  rig.motors.setChannelSpeed(MotorDriver::CHANNEL_B, 0.3f);
  EXPECT_TRUE(rig.motors.outputFault());

  rig.b_fwd.setFail(false);
  rig.motors.setChannelSpeed(MotorDriver::CHANNEL_B, 0.2f);
  EXPECT_TRUE(rig.motors.outputFault());

  rig.motors.clearFault();
  EXPECT_FALSE(rig.motors.outputFault());
}

TEST(MotorDriverTest, ConcurrentCallersNeverDriveBothSides) {
  MotorRig rig;
  rig.motors.enable();

  auto hammer = [&rig](float sign) {
    for (int i = 0; i < 2000; i++) {
      rig.motors.setChannelSpeed(MotorDriver::CHANNEL_A, sign * (0.1f + 0.0004f * i));
    }
  };

  std::thread t1(hammer, 1.0f);
  std::thread t2(hammer, -1.0f);
  t1.join();
  t2.join();

  EXPECT_EQ(0, rig.a_fwd.violations());
  EXPECT_EQ(0, rig.a_rev.violations());
  EXPECT_FALSE(rig.a_fwd.value() > 0.0f && rig.a_rev.value() > 0.0f);
}
