#include <gtest/gtest.h>
#include "gesture_controller.hpp"
#include "gesture_errors.hpp"
#include "landmark_reader.hpp"
#include "synthetic_hand.hpp"
#include <limits>
#include <sstream>
#include <vector>

using namespace controller;
using gesture::Action;
using landmarks::LandmarkFrame;
using landmarks::SyntheticHand;

namespace {

class RecordingKeySender : public keys::KeySender {
public:
    bool send(Action action) override {
        sent.push_back(action);
        return !fail;
    }
    std::string name() const override { return "recording"; }

    std::vector<Action> sent;
    bool fail = false;
};

LandmarkFrame hand_frame(double t, const SyntheticHand& hand) {
    LandmarkFrame frame;
    frame.timestamp = t;
    frame.has_hand = true;
    frame.landmarks = hand.build();
    return frame;
}

LandmarkFrame pointing_frame(double t, double angle) {
    return hand_frame(t, SyntheticHand::pointing(angle));
}

LandmarkFrame empty_frame(double t) {
    LandmarkFrame frame;
    frame.timestamp = t;
    return frame;
}

} // namespace

class GestureControllerTest : public ::testing::Test {
protected:
    gesture::GestureConfig gesture_cfg_;
    ControllerConfig cfg_;
    RecordingKeySender sender_;
    GestureController controller_{gesture_cfg_, cfg_, sender_};
};

TEST_F(GestureControllerTest, RightPointRespectsCooldown) {
    EXPECT_EQ(controller_.process(pointing_frame(0.0, 0.0)), Action::RIGHT);
    EXPECT_EQ(controller_.process(pointing_frame(0.02, 0.0)), Action::NONE);
    EXPECT_EQ(controller_.process(pointing_frame(0.10, 0.0)), Action::RIGHT);

    ASSERT_EQ(sender_.sent.size(), 2u);
    EXPECT_EQ(sender_.sent[0], Action::RIGHT);
    EXPECT_EQ(sender_.sent[1], Action::RIGHT);

    const auto& stats = controller_.get_stats();
    EXPECT_EQ(stats.frames_received, 3u);
    EXPECT_EQ(stats.frames_evaluated, 3u);
    EXPECT_EQ(stats.emitted_count(Action::RIGHT), 2u);
    EXPECT_EQ(stats.total_emitted(), 2u);
}

TEST_F(GestureControllerTest, FistSendsDown) {
    EXPECT_EQ(controller_.process(hand_frame(0.0, SyntheticHand::fist())), Action::DOWN);
    EXPECT_TRUE(controller_.last_raw().is_roll());
    ASSERT_EQ(sender_.sent.size(), 1u);
    EXPECT_EQ(sender_.sent[0], Action::DOWN);
}

TEST_F(GestureControllerTest, LostHandKeepsLastDirection) {
    EXPECT_EQ(controller_.process(pointing_frame(0.0, 180.0)), Action::LEFT);
    EXPECT_EQ(controller_.process(empty_frame(0.2)), Action::LEFT);
    EXPECT_EQ(controller_.stabilizer().stable_action(), Action::LEFT);
    EXPECT_EQ(controller_.get_stats().frames_without_hand, 1u);
    EXPECT_TRUE(controller_.last_raw().is_ambiguous());
}

TEST_F(GestureControllerTest, PointingDownIsNotADirection) {
    EXPECT_EQ(controller_.process(pointing_frame(0.0, 270.0)), Action::NONE);
    EXPECT_TRUE(controller_.last_raw().is_direction());
    EXPECT_TRUE(sender_.sent.empty());
}

TEST_F(GestureControllerTest, InvalidFrameCountsAndContinues) {
    LandmarkFrame bad = pointing_frame(0.0, 90.0);
    bad.landmarks.resize(5);

    EXPECT_EQ(controller_.process(bad), Action::NONE);
    EXPECT_EQ(controller_.get_stats().invalid_frames, 1u);
    EXPECT_EQ(controller_.process(pointing_frame(0.1, 90.0)), Action::UP);
}

TEST_F(GestureControllerTest, NonFiniteTimestampIsRejected) {
    LandmarkFrame frame = pointing_frame(std::numeric_limits<double>::quiet_NaN(), 90.0);

    EXPECT_EQ(controller_.process(frame), Action::NONE);
    EXPECT_EQ(controller_.get_stats().invalid_frames, 1u);
    EXPECT_EQ(controller_.get_stats().frames_evaluated, 0u);
    EXPECT_TRUE(sender_.sent.empty());
}

TEST_F(GestureControllerTest, SwitchingDirectionsSendsBoth) {
    EXPECT_EQ(controller_.process(pointing_frame(0.0, 180.0)), Action::LEFT);
    EXPECT_EQ(controller_.process(pointing_frame(0.01, 0.0)), Action::RIGHT);
    ASSERT_EQ(sender_.sent.size(), 2u);
    EXPECT_EQ(sender_.sent[0], Action::LEFT);
    EXPECT_EQ(sender_.sent[1], Action::RIGHT);
}

TEST_F(GestureControllerTest, SendFailureIsCounted) {
    sender_.fail = true;
    EXPECT_EQ(controller_.process(pointing_frame(0.0, 90.0)), Action::UP);
    EXPECT_EQ(controller_.get_stats().send_failures, 1u);
    EXPECT_EQ(controller_.get_stats().emitted_count(Action::UP), 1u);
}

TEST_F(GestureControllerTest, ResetStats) {
    controller_.process(pointing_frame(0.0, 90.0));
    controller_.reset_stats();
    EXPECT_EQ(controller_.get_stats().frames_received, 0u);
    EXPECT_EQ(controller_.get_stats().total_emitted(), 0u);
    EXPECT_EQ(controller_.stabilizer().get_stats().frames_evaluated, 0u);
}

TEST_F(GestureControllerTest, RunConsumesStream) {
    std::ostringstream stream;
    stream << landmarks::to_json_line(pointing_frame(0.0, 90.0)) << "\n";
    stream << landmarks::to_json_line(pointing_frame(0.01, 90.0)) << "\n";
    stream << "not json\n";
    stream << landmarks::to_json_line(hand_frame(0.2, SyntheticHand::fist())) << "\n";

    std::istringstream in(stream.str());
    landmarks::LandmarkReader reader(in);

    EXPECT_EQ(controller_.run(reader), 4u);
    ASSERT_EQ(sender_.sent.size(), 2u);
    EXPECT_EQ(sender_.sent[0], Action::UP);
    EXPECT_EQ(sender_.sent[1], Action::DOWN);
    EXPECT_EQ(controller_.get_stats().frames_without_hand, 1u);
}

TEST(GestureControllerConfigTest, SkipFramesEvaluatesEveryOtherFrame) {
    gesture::GestureConfig gesture_cfg;
    ControllerConfig cfg;
    cfg.skip_frames = 1;
    RecordingKeySender sender;
    GestureController controller(gesture_cfg, cfg, sender);

    EXPECT_EQ(controller.process(pointing_frame(0.0, 90.0)), Action::NONE);
    EXPECT_EQ(controller.process(pointing_frame(0.1, 90.0)), Action::UP);
    EXPECT_EQ(controller.process(pointing_frame(0.2, 90.0)), Action::NONE);
    EXPECT_EQ(controller.process(pointing_frame(0.3, 90.0)), Action::UP);

    EXPECT_EQ(controller.get_stats().frames_skipped, 2u);
    EXPECT_EQ(controller.get_stats().frames_evaluated, 2u);
}

TEST(GestureControllerConfigTest, LargestSkipFramesSkipsWithoutOverflow) {
    gesture::GestureConfig gesture_cfg;
    ControllerConfig cfg;
    cfg.skip_frames = std::numeric_limits<int>::max();
    RecordingKeySender sender;
    GestureController controller(gesture_cfg, cfg, sender);

    for (int i = 0; i < 10; ++i)
        EXPECT_EQ(controller.process(pointing_frame(0.1 * i, 90.0)), Action::NONE);
    EXPECT_EQ(controller.get_stats().frames_skipped, 10u);
    EXPECT_EQ(controller.get_stats().frames_evaluated, 0u);
    EXPECT_TRUE(sender.sent.empty());
}

TEST(GestureControllerConfigTest, RejectsInvalidConfiguration) {
    RecordingKeySender sender;
    gesture::GestureConfig gesture_cfg;
    ControllerConfig cfg;
    cfg.skip_frames = -1;
    EXPECT_THROW(GestureController c(gesture_cfg, cfg, sender), gesture::ConfigurationError);

    cfg = ControllerConfig();
    gesture_cfg.angular_threshold_degrees = 50.0;
    EXPECT_THROW(GestureController c(gesture_cfg, cfg, sender), gesture::ConfigurationError);
}

TEST(KeyCodeTest, ArrowKeys) {
    EXPECT_LT(keys::action_to_keycode(Action::NONE), 0);
    EXPECT_NE(keys::action_to_keycode(Action::LEFT), keys::action_to_keycode(Action::RIGHT));
    EXPECT_NE(keys::action_to_keycode(Action::UP), keys::action_to_keycode(Action::DOWN));
}

TEST(LoggingKeySenderTest, PrintsSentKey) {
    std::ostringstream out;
    keys::LoggingKeySender sender(out);
    EXPECT_TRUE(sender.send(Action::UP));
    EXPECT_EQ(out.str().rfind("Sent key: up at ", 0), 0u);
}
