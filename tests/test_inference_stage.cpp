#include <gtest/gtest.h>
#include <chrono>
#include "inference_stage.hpp"
#include "test_doubles.hpp"

using namespace std::chrono_literals;

class InferenceStageTest : public ::testing::Test {
protected:
    FrameDeliveryBuffer delivery;
    MetricsRegistry metrics;
};

TEST_F(InferenceStageTest, AppliesOverlayAndKeepsMetadata) {
    InferenceStage stage(std::make_unique<FixedPoseEstimator>(), nullptr, delivery, metrics);
    EXPECT_TRUE(stage.modelAvailable());
    EXPECT_EQ(stage.annotatorName(), "basic");

    Frame f = make_frame(3, 0);
    AnnotatedFrame out = stage.process(f, OverlayContext{});

    EXPECT_EQ(out.sequence, 3u);
    EXPECT_EQ(out.t_capture, f.t_capture);
    EXPECT_TRUE(out.overlay_applied);
    ASSERT_TRUE(out.poses.has_value());
    EXPECT_EQ(out.poses->size(), 1u);
    EXPECT_NE(out.image.data, f.image.data);
    EXPECT_EQ(stage.lastPersonCount(), 1u);
    EXPECT_EQ(stage.failures(), 0u);
}

TEST_F(InferenceStageTest, OverlayDisabledPassesRawImage) {
    InferenceStage stage(std::make_unique<FixedPoseEstimator>(), nullptr, delivery, metrics, false);
    Frame f = make_frame(1);
    AnnotatedFrame out = stage.process(f, OverlayContext{});
    EXPECT_FALSE(out.overlay_applied);
    EXPECT_EQ(out.image.data, f.image.data);
    EXPECT_TRUE(out.poses.has_value());
}

TEST_F(InferenceStageTest, EstimatorFailureForwardsRawFrame) {
    auto estimator = std::make_unique<FailingPoseEstimator>();
    FailingPoseEstimator* raw = estimator.get();
    InferenceStage stage(std::move(estimator), nullptr, delivery, metrics);

    Frame f = make_frame(9);
    AnnotatedFrame out = stage.process(f, OverlayContext{});

    EXPECT_EQ(raw->calls.load(), 1);
    EXPECT_EQ(out.sequence, 9u);
    EXPECT_FALSE(out.overlay_applied);
    EXPECT_FALSE(out.poses.has_value());
    EXPECT_EQ(out.image.data, f.image.data);
    EXPECT_EQ(stage.failures(), 1u);
    EXPECT_EQ(metrics.inference_failures(), 1u);
}

TEST_F(InferenceStageTest, MissingModelIsDegradedNotFatal) {
    InferenceStage stage(nullptr, nullptr, delivery, metrics);
    EXPECT_FALSE(stage.modelAvailable());
    AnnotatedFrame out = stage.process(make_frame(2), OverlayContext{});
    EXPECT_FALSE(out.overlay_applied);
    EXPECT_FALSE(out.image.empty());
    EXPECT_EQ(stage.failures(), 1u);
}

TEST_F(InferenceStageTest, WorkerPublishesEverySubmittedFrameWhenIdle) {
    InferenceStage stage(std::make_unique<FailingPoseEstimator>(), nullptr, delivery, metrics);
    stage.start();
    for (uint64_t s = 1; s <= 5; ++s) {
        stage.submit(make_frame(s), OverlayContext{s, 0.0, false});
        ASSERT_TRUE(stage.waitIdle(2000ms));
        ASSERT_NE(delivery.latest(), nullptr);
        EXPECT_EQ(delivery.latest()->sequence, s);
    }
    stage.stop();
    EXPECT_EQ(stage.processed(), 5u);
    EXPECT_EQ(stage.dropped(), 0u);
}

TEST_F(InferenceStageTest, SlowEstimatorDropsStalePendingFrames) {
    InferenceStage stage(std::make_unique<FixedPoseEstimator>(100ms), nullptr, delivery, metrics);
    stage.start();

    int accepted = 0;
    for (uint64_t s = 1; s <= 20; ++s) {
        if (stage.submit(make_frame(s), OverlayContext{})) accepted++;
    }
    ASSERT_TRUE(stage.waitIdle(5000ms));
    stage.stop();

    EXPECT_GT(stage.dropped(), 0u);
    EXPECT_EQ(stage.processed() + stage.dropped(), 20u);
    EXPECT_EQ(metrics.frames_dropped(), stage.dropped());
    // The newest frame always survives.
    ASSERT_NE(delivery.latest(), nullptr);
    EXPECT_EQ(delivery.latest()->sequence, 20u);
    EXPECT_LT(accepted, 20);
}

TEST_F(InferenceStageTest, ExerciseAnnotatorReportsPhase) {
    InferenceStage stage(std::make_unique<FixedPoseEstimator>(), createAnnotator(1, 0.5f), delivery,
                         metrics);
    EXPECT_EQ(stage.annotatorName(), "exercise");
    EXPECT_EQ(stage.exerciseId(), 1);

    AnnotatedFrame out = stage.process(make_frame(1), OverlayContext{});
    ASSERT_TRUE(out.feedback.has_value());
    EXPECT_EQ(out.feedback->exercise_id, 1);
    EXPECT_EQ(stage.exercisePhase(), out.feedback->current_phase);
}

TEST_F(InferenceStageTest, StopIsIdempotent) {
    InferenceStage stage(nullptr, nullptr, delivery, metrics);
    stage.start();
    EXPECT_TRUE(stage.running());
    stage.stop();
    stage.stop();
    EXPECT_FALSE(stage.running());
}

TEST_F(InferenceStageTest, OutputCallbackSeesFramesBeforePublish) {
    InferenceStage stage(std::make_unique<FixedPoseEstimator>(), nullptr, delivery, metrics);
    std::mutex mu;
    std::vector<uint64_t> seen;
    std::vector<bool> published_before;
    std::vector<bool> recording_flags;
    stage.setOutputCallback([&](const AnnotatedFrame& frame, const OverlayContext& ctx) {
        std::lock_guard<std::mutex> lk(mu);
        seen.push_back(frame.sequence);
        published_before.push_back(delivery.latest_sequence() >= frame.sequence);
        recording_flags.push_back(ctx.recording);
        EXPECT_TRUE(frame.overlay_applied);
    });
    stage.start();

    stage.submit(make_frame(1), OverlayContext{1, 0.0, true});
    ASSERT_TRUE(stage.waitIdle(2000ms));
    stage.submit(make_frame(2), OverlayContext{2, 0.0, false});
    ASSERT_TRUE(stage.waitIdle(2000ms));
    stage.stop();

    std::lock_guard<std::mutex> lk(mu);
    EXPECT_EQ(seen, (std::vector<uint64_t>{1, 2}));
    EXPECT_EQ(published_before, (std::vector<bool>{false, false}));
    EXPECT_EQ(recording_flags, (std::vector<bool>{true, false}));
}

TEST_F(InferenceStageTest, ExerciseSummaryEndsWithSession) {
    InferenceStage stage(std::make_unique<FixedPoseEstimator>(), createAnnotator(2, 0.5f), delivery,
                         metrics);
    stage.process(make_frame(1), OverlayContext{});
    auto live = stage.exerciseSummary();
    ASSERT_TRUE(live.has_value());
    EXPECT_EQ(live->exercises_completed, 0);

    auto final_summary = stage.endExerciseSession();
    ASSERT_TRUE(final_summary.has_value());
    EXPECT_EQ(final_summary->exercises_attempted, 1);
    EXPECT_EQ(final_summary->exercises_completed, 1);
    EXPECT_EQ(stage.exerciseId(), 0);
}
