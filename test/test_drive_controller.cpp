#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "fakes/DriveRig.h"

class DriveControllerTest : public ::testing::Test {
protected:
  MotorRig rig;
  DriveState state;
  DriveController drive{ rig.motors, state };

  void SetUp() override { drive.enable(); }

  void expectChannels(float left, float right) {
    EXPECT_FLOAT_EQ(left, drive.speedCmdLeft());
    EXPECT_FLOAT_EQ(right, drive.speedCmdRight());
  }
};

TEST_F(DriveControllerTest, DirectionalPrimitivesMapToChannels) {
  drive.forward(0.5f);
  expectChannels(0.5f, 0.5f);
  EXPECT_EQ(DriveController::Motion::FORWARD, drive.motion());

  drive.backward(0.5f);
  expectChannels(-0.5f, -0.5f);
  EXPECT_EQ(DriveController::Motion::BACKWARD, drive.motion());

  drive.left(0.5f);
  expectChannels(-0.5f, 0.5f);
  EXPECT_EQ(DriveController::Motion::LEFT, drive.motion());

  drive.right(0.5f);
  expectChannels(0.5f, -0.5f);
  EXPECT_EQ(DriveController::Motion::RIGHT, drive.motion());

  drive.stop();
  expectChannels(0.0f, 0.0f);
  EXPECT_EQ(DriveController::Motion::STOP, drive.motion());
  EXPECT_TRUE(rig.allPwmZero());
}

TEST_F(DriveControllerTest, LeftPivotDrivesPhysicalOutputs) {
  drive.left(0.3f);

  EXPECT_FLOAT_EQ(0.0f, rig.a_fwd.value());
  EXPECT_FLOAT_EQ(0.3f, rig.a_rev.value());
  EXPECT_FLOAT_EQ(0.3f, rig.b_fwd.value());
  EXPECT_FLOAT_EQ(0.0f, rig.b_rev.value());
}

TEST_F(DriveControllerTest, DefaultSpeedIsPointThree) {
  EXPECT_FLOAT_EQ(0.3f, state.speed());
  EXPECT_FALSE(state.autoEnabled());
}

TEST_F(DriveControllerTest, SpeedStepsOnGridAndSaturatesHigh) {
  EXPECT_NEAR(0.4f, drive.increaseSpeed(), 1e-6);
  EXPECT_NEAR(0.5f, drive.increaseSpeed(), 1e-6);

  for (int i = 0; i < 10; i++) drive.increaseSpeed();

  EXPECT_FLOAT_EQ(1.0f, state.speed());
  EXPECT_FLOAT_EQ(1.0f, drive.increaseSpeed());
}

TEST_F(DriveControllerTest, SpeedSaturatesAtZero) {
  for (int i = 0; i < 3; i++) drive.decreaseSpeed();
  EXPECT_FLOAT_EQ(0.0f, state.speed());

  EXPECT_FLOAT_EQ(0.0f, drive.decreaseSpeed());
  EXPECT_NEAR(0.1f, drive.increaseSpeed(), 1e-6);
}

TEST_F(DriveControllerTest, RepeatedStepsDoNotDriftOffGrid) {
  for (int i = 0; i < 50; i++) {
    drive.increaseSpeed();
    drive.decreaseSpeed();
  }
  EXPECT_NEAR(0.3f, state.speed(), 1e-6);

  for (int i = 0; i < 20; i++) drive.decreaseSpeed();
  for (int i = 0; i < 7; i++) drive.increaseSpeed();
  EXPECT_NEAR(0.7f, state.speed(), 1e-6);
}

TEST_F(DriveControllerTest, ConcurrentSpeedStepsAreNotLost) {
  state.current_speed.store(0.0f);

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; t++) {
    threads.emplace_back([this]() {
      drive.increaseSpeed();
      drive.increaseSpeed();
    });
  }
  for (std::thread& t : threads) t.join();

  EXPECT_NEAR(0.8f, state.speed(), 1e-6);
}

TEST_F(DriveControllerTest, DisableStopsAndReportsStop) {
  drive.forward(0.6f);
  drive.disable();

  EXPECT_FALSE(drive.isEnabled());
  EXPECT_EQ(DriveController::Motion::STOP, drive.motion());
  EXPECT_TRUE(rig.allPwmZero());
  EXPECT_TRUE(rig.allEnablesLow());
}

TEST_F(DriveControllerTest, FaultPassThrough) {
  rig.a_fwd.setFail(true);
  drive.forward(0.2f);
  EXPECT_TRUE(drive.outputFault());

  drive.clearFault();
  EXPECT_FALSE(drive.outputFault());
}

TEST(DriveControllerNames, MotionNames) {
  EXPECT_STREQ("FORWARD", DriveController::motionName(DriveController::Motion::FORWARD));
  EXPECT_STREQ("STOP", DriveController::motionName(DriveController::Motion::STOP));
}
