#include "mode_controller.hpp"
#include "fakes.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace std::chrono_literals;

class ModeControllerTest : public ::testing::Test {
protected:
    ModeControllerTest() : controller(frames, locator, actuator, audio, fastTiming(), 0.7) {}

    FakeFrameSource frames;
    FakeFaceLocator locator;
    RecordingActuator actuator;
    FakeAudioLooper audio;
    ModeController controller;
};

TEST_F(ModeControllerTest, StartsIdle) {
    EXPECT_EQ(controller.mode(), Mode::Idle);
    ControllerStatus s = controller.status();
    EXPECT_TRUE(s.cameraAvailable);
    EXPECT_TRUE(s.arduinoConnected);
    EXPECT_FALSE(s.trackingActive);
    EXPECT_FALSE(s.alertMode);
    EXPECT_DOUBLE_EQ(s.smoothingFactor, 0.7);
}

TEST_F(ModeControllerTest, TrackingSendsSmoothedCoordinatesEveryOtherFrame) {
    locator.setFace(320);
    ASSERT_TRUE(controller.startTracking());
    EXPECT_EQ(controller.mode(), Mode::Tracking);

    ASSERT_TRUE(waitUntil([&] { return actuator.coordinateCount() >= 3; }));
    controller.stopTracking();

    auto commands = actuator.commands();
    for (const auto& c : commands) {
        EXPECT_EQ(c, "320");
    }
    // One send per two frames
    EXPECT_EQ(commands.size(), controller.frameCount() / 2);
}

TEST_F(ModeControllerTest, NoFaceMeansNoCommands) {
    locator.setFace(std::nullopt);
    ASSERT_TRUE(controller.startTracking());
    ASSERT_TRUE(waitUntil([&] { return controller.frameCount() >= 10; }));
    controller.stopTracking();
    EXPECT_TRUE(actuator.commands().empty());
}

TEST_F(ModeControllerTest, NoCameraIdlesWithoutCommands) {
    frames.available = false;
    ASSERT_TRUE(controller.startTracking());
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(frames.captures.load(), 0);
    EXPECT_EQ(controller.frameCount(), 0u);
    EXPECT_TRUE(controller.status().trackingActive);
    EXPECT_FALSE(controller.status().cameraAvailable);
    controller.stopTracking();
}

TEST_F(ModeControllerTest, SecondStartTrackingIsRejected) {
    ASSERT_TRUE(controller.startTracking());
    EXPECT_FALSE(controller.startTracking());
    EXPECT_FALSE(controller.startTracking());

    ASSERT_TRUE(waitUntil([&] { return frames.captures >= 20; }));
    controller.stopTracking();

    // Only one loop ever read frames
    EXPECT_EQ(frames.readerCount(), 1u);
}

TEST_F(ModeControllerTest, TrackingCanRestartAfterStop) {
    ASSERT_TRUE(controller.startTracking());
    controller.stopTracking();
    EXPECT_FALSE(controller.status().trackingActive);
    EXPECT_TRUE(controller.startTracking());
    EXPECT_TRUE(controller.status().trackingActive);
}

TEST_F(ModeControllerTest, StopTrackingWhenIdleIsHarmless) {
    controller.stopTracking();
    controller.stopTracking();
    EXPECT_EQ(controller.mode(), Mode::Idle);
}

TEST_F(ModeControllerTest, AlertSuppressesTrackingSends) {
    ASSERT_TRUE(controller.startTracking());
    ASSERT_TRUE(waitUntil([&] { return actuator.coordinateCount() >= 2; }));

    ASSERT_TRUE(controller.startAlert());
    size_t coordinatesAtAlert = actuator.coordinateCount();
    int framesAtAlert = frames.captures;

    // Tracking keeps reading frames but the servo only gets SPIN
    ASSERT_TRUE(waitUntil([&] { return actuator.spinCount() >= 3 && frames.captures >= framesAtAlert + 10; }));
    EXPECT_EQ(actuator.coordinateCount(), coordinatesAtAlert);
    EXPECT_EQ(controller.mode(), Mode::Alert);

    ASSERT_TRUE(controller.stopAlert());
    EXPECT_TRUE(waitUntil([&] { return actuator.coordinateCount() > coordinatesAtAlert; }));
    controller.stopTracking();
}

TEST_F(ModeControllerTest, AlertLoopsServoAndAudio) {
    ASSERT_TRUE(controller.startAlert());
    EXPECT_TRUE(controller.status().alertMode);
    EXPECT_FALSE(controller.status().trackingActive);

    ASSERT_TRUE(waitUntil([&] { return audio.isPlaying(); }));
    ASSERT_TRUE(waitUntil([&] { return actuator.spinCount() >= 2; }));

    ASSERT_TRUE(controller.stopAlert());
    EXPECT_FALSE(audio.isPlaying());
    EXPECT_FALSE(controller.status().alertMode);
    EXPECT_EQ(controller.mode(), Mode::Idle);

    // Nothing more goes out once stopped
    size_t spins = actuator.spinCount();
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(actuator.spinCount(), spins);
}

TEST_F(ModeControllerTest, SecondStartAlertIsRejected) {
    ASSERT_TRUE(controller.startAlert());
    EXPECT_FALSE(controller.startAlert());
    ASSERT_TRUE(waitUntil([&] { return audio.isPlaying(); }));
    controller.stopAlert();
    EXPECT_EQ(audio.starts.load(), 1);
}

TEST_F(ModeControllerTest, StopAlertForcesAudioOff) {
    ASSERT_TRUE(controller.startAlert());
    ASSERT_TRUE(waitUntil([&] { return audio.isPlaying(); }));
    int stopsBefore = audio.stops;

    ASSERT_TRUE(controller.stopAlert());
    EXPECT_FALSE(audio.isPlaying());
    EXPECT_GT(audio.stops.load(), stopsBefore);
}

TEST_F(ModeControllerTest, StopAlertRightAfterStartLeavesAudioOff) {
    for (int i = 0; i < 20; i++) {
        ASSERT_TRUE(controller.startAlert());
        ASSERT_TRUE(controller.stopAlert());
        EXPECT_FALSE(audio.isPlaying()) << "iteration " << i;
    }
}

TEST_F(ModeControllerTest, StopAlertReturnsWhileAudioStartIsStuck) {
    audio.blockStart = true;
    ASSERT_TRUE(controller.startAlert());
    ASSERT_TRUE(waitUntil([&] { return audio.starts.load() == 1; }));

    auto begin = std::chrono::steady_clock::now();
    EXPECT_TRUE(controller.stopAlert());
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 2s);
    EXPECT_EQ(controller.mode(), Mode::Idle);
    EXPECT_TRUE(controller.status().audioActive);

    // The stuck loop still owns the looper
    EXPECT_FALSE(controller.startAlert());

    audio.blockStart = false;
    ASSERT_TRUE(waitUntil([&] { return !controller.status().audioActive; }));
    EXPECT_FALSE(audio.isPlaying());

    ASSERT_TRUE(controller.startAlert());
    EXPECT_TRUE(controller.stopAlert());
}

TEST_F(ModeControllerTest, StopAlertWhenIdleSucceeds) {
    EXPECT_TRUE(controller.stopAlert());
    EXPECT_FALSE(audio.isPlaying());
    EXPECT_EQ(controller.mode(), Mode::Idle);
}

TEST_F(ModeControllerTest, AlertWithoutAudioStillSpins) {
    audio.canPlay = false;
    ASSERT_TRUE(controller.startAlert());
    ASSERT_TRUE(waitUntil([&] { return actuator.spinCount() >= 2; }));
    EXPECT_TRUE(controller.status().alertMode);
    EXPECT_TRUE(controller.stopAlert());
}

TEST_F(ModeControllerTest, StopTrackingLeavesAlertAlone) {
    ASSERT_TRUE(controller.startTracking());
    ASSERT_TRUE(controller.startAlert());
    controller.stopTracking();

    ControllerStatus s = controller.status();
    EXPECT_FALSE(s.trackingActive);
    EXPECT_TRUE(s.alertMode);
    ASSERT_TRUE(waitUntil([&] { return audio.isPlaying(); }));

    controller.stopAlert();
    EXPECT_EQ(controller.mode(), Mode::Idle);
}

TEST_F(ModeControllerTest, TrackingSurvivesAlertToggle) {
    ASSERT_TRUE(controller.startTracking());
    ControllerStatus s = controller.status();
    EXPECT_TRUE(s.trackingActive);
    EXPECT_FALSE(s.alertMode);

    ASSERT_TRUE(controller.startAlert());
    s = controller.status();
    EXPECT_TRUE(s.trackingActive);
    EXPECT_TRUE(s.alertMode);

    ASSERT_TRUE(controller.stopAlert());
    s = controller.status();
    EXPECT_TRUE(s.trackingActive);
    EXPECT_FALSE(s.alertMode);
    EXPECT_EQ(controller.mode(), Mode::Tracking);

    size_t coordinates = actuator.coordinateCount();
    EXPECT_TRUE(waitUntil([&] { return actuator.coordinateCount() > coordinates; }));
}

TEST_F(ModeControllerTest, SpinOnceSendsOneCommand) {
    EXPECT_TRUE(controller.spinOnce());
    EXPECT_EQ(actuator.commands(), std::vector<std::string>{"SPIN"});
    EXPECT_EQ(controller.mode(), Mode::Idle);

    actuator.result = false;
    EXPECT_FALSE(controller.spinOnce());
}

TEST_F(ModeControllerTest, SmoothingFactorValidation) {
    controller.setSmoothingFactor(0.5);
    EXPECT_DOUBLE_EQ(controller.smoothingFactor(), 0.5);
    EXPECT_THROW(controller.setSmoothingFactor(1.5), std::invalid_argument);
    EXPECT_DOUBLE_EQ(controller.status().smoothingFactor, 0.5);
}

TEST_F(ModeControllerTest, ShutdownStopsEverything) {
    ASSERT_TRUE(controller.startTracking());
    ASSERT_TRUE(controller.startAlert());
    ASSERT_TRUE(waitUntil([&] { return audio.isPlaying(); }));

    controller.shutdown();
    EXPECT_EQ(controller.mode(), Mode::Idle);
    EXPECT_FALSE(audio.isPlaying());
    controller.shutdown();
}

TEST(ModeNames, Names) {
    EXPECT_STREQ(modeName(Mode::Idle), "idle");
    EXPECT_STREQ(modeName(Mode::Tracking), "tracking");
    EXPECT_STREQ(modeName(Mode::Alert), "alert");
}
