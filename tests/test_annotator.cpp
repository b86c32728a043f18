#include <gtest/gtest.h>
#include "annotator.hpp"
#include "test_doubles.hpp"

namespace {
std::vector<PersonPose> one_person(const cv::Mat& image) {
    FixedPoseEstimator estimator;
    return estimator.estimate(image);
}

bool differs(const cv::Mat& a, const cv::Mat& b) {
    cv::Mat diff;
    cv::absdiff(a, b, diff);
    return cv::countNonZero(diff.reshape(1)) > 0;
}
}  // namespace

TEST(AnnotatorFactoryTest, ZeroSelectsBasicOverlay) {
    auto annotator = createAnnotator(0, 0.5f);
    ASSERT_NE(annotator, nullptr);
    EXPECT_EQ(annotator->name(), "basic");
    EXPECT_EQ(annotator->exerciseId(), 0);
    EXPECT_TRUE(annotator->exercisePhase().empty());
}

TEST(AnnotatorFactoryTest, UnknownExerciseFallsBackToBasic) {
    auto annotator = createAnnotator(99, 0.5f);
    ASSERT_NE(annotator, nullptr);
    EXPECT_EQ(annotator->name(), "basic");
}

TEST(AnnotatorFactoryTest, KnownExerciseSelectsFeedbackAnnotator) {
    auto annotator = createAnnotator(1, 0.5f);
    ASSERT_NE(annotator, nullptr);
    EXPECT_EQ(annotator->name(), "exercise");
    EXPECT_EQ(annotator->exerciseId(), 1);
    EXPECT_EQ(annotator->exercisePhase(), "start");
}

TEST(BasicPoseOverlayTest, DrawsOnCanvasWithoutFeedback) {
    cv::Mat original = make_image(0, 320, 240);
    cv::Mat canvas = original.clone();
    BasicPoseOverlay overlay;

    OverlayContext ctx;
    ctx.sequence = 7;
    ctx.fps = 15.0;
    auto fb = overlay.annotate(canvas, one_person(canvas), ctx);

    EXPECT_FALSE(fb.has_value());
    EXPECT_TRUE(differs(original, canvas));
    EXPECT_EQ(canvas.size(), original.size());
}

TEST(BasicPoseOverlayTest, HudDrawnEvenWithoutPersons) {
    cv::Mat original = make_image(0, 320, 240);
    cv::Mat canvas = original.clone();
    BasicPoseOverlay overlay;
    overlay.annotate(canvas, {}, OverlayContext{});
    EXPECT_TRUE(differs(original, canvas));
}

TEST(BasicPoseOverlayTest, RecordingIndicator) {
    cv::Mat idle = make_image(0, 320, 240);
    cv::Mat recording = idle.clone();
    BasicPoseOverlay overlay;

    OverlayContext ctx;
    overlay.annotate(idle, {}, ctx);
    ctx.recording = true;
    overlay.annotate(recording, {}, ctx);

    EXPECT_TRUE(differs(idle, recording));
}

TEST(ExerciseFeedbackAnnotatorTest, ReturnsFeedbackForTrackedPerson) {
    ExerciseFeedbackAnnotator annotator(1);
    ASSERT_TRUE(annotator.ready());

    cv::Mat canvas = make_image(0, 640, 480);
    auto fb = annotator.annotate(canvas, one_person(canvas), OverlayContext{});

    ASSERT_TRUE(fb.has_value());
    EXPECT_EQ(fb->exercise_id, 1);
    EXPECT_EQ(fb->exercise_name, "Holding up the Sky");
    EXPECT_EQ(fb->current_phase, "start");
    EXPECT_EQ(fb->pose_quality.size(), 4u);
}

TEST(ExerciseFeedbackAnnotatorTest, NoPersonNoFeedback) {
    ExerciseFeedbackAnnotator annotator(3);
    cv::Mat canvas = make_image(0, 640, 480);
    EXPECT_FALSE(annotator.annotate(canvas, {}, OverlayContext{}).has_value());
}

TEST(ExerciseFeedbackAnnotatorTest, EndSessionCompletesExerciseOnce) {
    ExerciseFeedbackAnnotator annotator(1);
    cv::Mat canvas = make_image(0, 640, 480);
    annotator.annotate(canvas, one_person(canvas), OverlayContext{});

    annotator.endSession();
    annotator.endSession();
    auto summary = annotator.sessionSummary();
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->exercises_attempted, 1);
    EXPECT_EQ(summary->exercises_completed, 1);
    EXPECT_FALSE(annotator.ready());
}

TEST(BasicPoseOverlayTest, NoSessionSummary) {
    BasicPoseOverlay overlay;
    overlay.endSession();
    EXPECT_FALSE(overlay.sessionSummary().has_value());
}
