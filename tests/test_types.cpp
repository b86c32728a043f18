#include <gtest/gtest.h>
#include <string>
#include "types.hpp"

// Frame and AnnotatedFrame defaults
class FrameTest : public ::testing::Test {
protected:
    Frame frame;
    AnnotatedFrame annotated;
};

TEST_F(FrameTest, DefaultConstruction) {
    EXPECT_EQ(frame.sequence, 0u);
    EXPECT_TRUE(frame.image.empty());
    EXPECT_FALSE(annotated.overlay_applied);
    EXPECT_FALSE(annotated.poses.has_value());
    EXPECT_FALSE(annotated.feedback.has_value());
}

TEST_F(FrameTest, SharesPixelBufferOnCopy) {
    frame.image = cv::Mat(4, 4, CV_8UC3, cv::Scalar(1, 2, 3));
    Frame copy = frame;
    EXPECT_EQ(copy.image.data, frame.image.data);
}

TEST(KeypointNameTest, CocoOrdering) {
    EXPECT_STREQ(keypoint_name(kNose), "nose");
    EXPECT_STREQ(keypoint_name(kLeftShoulder), "left_shoulder");
    EXPECT_STREQ(keypoint_name(kRightAnkle), "right_ankle");
    EXPECT_STREQ(keypoint_name(-1), "unknown");
    EXPECT_STREQ(keypoint_name(kKeypointCount), "unknown");
}

TEST(SessionStateTest, Names) {
    EXPECT_STREQ(to_string(SessionState::Idle), "Idle");
    EXPECT_STREQ(to_string(SessionState::Streaming), "Streaming");
    EXPECT_STREQ(to_string(SessionState::Recording), "Recording");
    EXPECT_STREQ(to_string(SessionState::Stopping), "Stopping");
}

TEST(SessionStateTest, ValidTransitions) {
    EXPECT_TRUE(is_valid_transition(SessionState::Idle, SessionState::Streaming));
    EXPECT_TRUE(is_valid_transition(SessionState::Streaming, SessionState::Recording));
    EXPECT_TRUE(is_valid_transition(SessionState::Recording, SessionState::Streaming));
    EXPECT_TRUE(is_valid_transition(SessionState::Streaming, SessionState::Stopping));
    EXPECT_TRUE(is_valid_transition(SessionState::Stopping, SessionState::Idle));
}

TEST(SessionStateTest, RecordingOnlyFromStreaming) {
    EXPECT_FALSE(is_valid_transition(SessionState::Idle, SessionState::Recording));
    EXPECT_FALSE(is_valid_transition(SessionState::Stopping, SessionState::Recording));
    EXPECT_FALSE(is_valid_transition(SessionState::Recording, SessionState::Recording));
    EXPECT_FALSE(is_valid_transition(SessionState::Idle, SessionState::Stopping));
    EXPECT_FALSE(is_valid_transition(SessionState::Streaming, SessionState::Idle));
}

TEST(SessionStateTest, StopWhileRecordingPassesThroughStreaming) {
    EXPECT_FALSE(is_valid_transition(SessionState::Recording, SessionState::Stopping));
    EXPECT_FALSE(is_valid_transition(SessionState::Recording, SessionState::Idle));
    EXPECT_TRUE(is_valid_transition(SessionState::Recording, SessionState::Streaming));
    EXPECT_TRUE(is_valid_transition(SessionState::Streaming, SessionState::Stopping));
}

TEST(ErrorKindTest, Names) {
    EXPECT_STREQ(to_string(ErrorKind::None), "None");
    EXPECT_STREQ(to_string(ErrorKind::InvalidTransition), "InvalidTransition");
    EXPECT_STREQ(to_string(ErrorKind::ConversionTimeout), "ConversionTimeout");
    EXPECT_STREQ(to_string(ErrorKind::ToolMissing), "ToolMissing");
    EXPECT_STREQ(to_string(ErrorKind::UploadFailure), "UploadFailure");
}

TEST(ErrorInfoTest, EmptyUntilKindSet) {
    ErrorInfo info;
    EXPECT_TRUE(info.empty());
    info.kind = ErrorKind::DeviceFailure;
    EXPECT_FALSE(info.empty());
}

TEST(FormatWallTimeTest, CustomFormat) {
    std::string s = format_wall_time(WallClock::now(), "%Y%m%d_%H%M%S");
    ASSERT_EQ(s.size(), 15u);
    EXPECT_EQ(s[8], '_');
}
