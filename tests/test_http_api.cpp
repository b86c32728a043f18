#include <gtest/gtest.h>
#include <string>
#include "http_api.hpp"

using nlohmann::json;

TEST(Base64Test, EncodesWithPadding) {
    auto enc = [](const std::string& s) {
        return base64_encode(reinterpret_cast<const unsigned char*>(s.data()), s.size());
    };
    EXPECT_EQ(enc(""), "");
    EXPECT_EQ(enc("f"), "Zg==");
    EXPECT_EQ(enc("fo"), "Zm8=");
    EXPECT_EQ(enc("foo"), "Zm9v");
    EXPECT_EQ(enc("foobar"), "Zm9vYmFy");
}

TEST(Base64Test, BinaryBytes) {
    const unsigned char jpeg_magic[] = {0xFF, 0xD8, 0xFF, 0xE0};
    EXPECT_EQ(base64_encode(jpeg_magic, sizeof(jpeg_magic)), "/9j/4A==");
}

TEST(UserAgentTest, DetectsMobileClients) {
    EXPECT_TRUE(is_mobile_user_agent(
        "Mozilla/5.0 (iPhone; CPU iPhone OS 17_0 like Mac OS X) AppleWebKit/605.1.15 Mobile/15E148"));
    EXPECT_TRUE(is_mobile_user_agent("Mozilla/5.0 (Linux; Android 14) Chrome/120.0 MOBILE Safari"));
    EXPECT_FALSE(is_mobile_user_agent("Mozilla/5.0 (X11; Linux x86_64) Firefox/121.0"));
    EXPECT_FALSE(is_mobile_user_agent(""));
}

TEST(HttpStatusTest, MapsErrorKinds) {
    TransitionResult r;
    r.ok = true;
    EXPECT_EQ(http_status_for(r), 200);

    r.ok = false;
    r.error = ErrorKind::InvalidTransition;
    EXPECT_EQ(http_status_for(r), 409);
    r.error = ErrorKind::DeviceFailure;
    EXPECT_EQ(http_status_for(r), 503);
    r.error = ErrorKind::ConversionFailure;
    EXPECT_EQ(http_status_for(r), 404);
    r.error = ErrorKind::RecordingWriteFailure;
    EXPECT_EQ(http_status_for(r), 500);
    r.error = ErrorKind::ConversionTimeout;
    EXPECT_EQ(http_status_for(r), 500);
}

TEST(TransitionJsonTest, CarriesErrorAndJob) {
    TransitionResult r;
    r.ok = false;
    r.error = ErrorKind::InvalidTransition;
    r.state = SessionState::Streaming;
    r.message = "NotRecording: session is Streaming";
    json j = transition_to_json(r);
    EXPECT_FALSE(j["success"].get<bool>());
    EXPECT_EQ(j["state"], "Streaming");
    EXPECT_EQ(j["error"], "InvalidTransition");
    EXPECT_FALSE(j.contains("job_id"));

    TransitionResult ok;
    ok.ok = true;
    ok.job_id = 7;
    ok.state = SessionState::Idle;
    j = transition_to_json(ok);
    EXPECT_TRUE(j["success"].get<bool>());
    EXPECT_EQ(j["job_id"], 7);
    EXPECT_FALSE(j.contains("error"));
}

TEST(StatusJsonTest, IdleStatusHasNullSections) {
    SessionStatus s;
    json j = status_to_json(s);
    EXPECT_EQ(j["state"], "Idle");
    EXPECT_FALSE(j["is_running"].get<bool>());
    EXPECT_FALSE(j["is_recording"].get<bool>());
    EXPECT_TRUE(j["recording"].is_null());
    EXPECT_TRUE(j["last_job"].is_null());
    EXPECT_TRUE(j["last_error"].is_null());
    EXPECT_FALSE(j["exercise_tracking"]["enabled"].get<bool>());
    EXPECT_TRUE(j["exercise_tracking"]["summary"].is_null());
}

TEST(StatusJsonTest, DualRecordingAndExerciseSummary) {
    SessionStatus s;
    s.state = SessionState::Recording;
    RecordingSummary rec;
    rec.id = 1;
    rec.path = "recordings/a.mp4";
    rec.frames_written = 10;
    rec.annotated_path = "recordings/a_annotated.mp4";
    rec.annotated_frames = 8;
    s.recording = rec;
    ExerciseSessionSummary summary;
    summary.exercises_attempted = 1;
    summary.average_form_score = 85.0;
    summary.recommendations = {"Focus on the mind-body connection"};
    s.exercise_summary = summary;

    json j = status_to_json(s);
    EXPECT_EQ(j["recording"]["annotated_path"], "recordings/a_annotated.mp4");
    EXPECT_EQ(j["recording"]["annotated_frames_written"], 8);
    EXPECT_EQ(j["exercise_tracking"]["summary"]["exercises_attempted"], 1);
    EXPECT_DOUBLE_EQ(j["exercise_tracking"]["summary"]["average_form_score"].get<double>(), 85.0);
    EXPECT_EQ(j["exercise_tracking"]["summary"]["recommendations"].size(), 1u);
}

TEST(StatusJsonTest, SingleRecordingHasNoAnnotatedPath) {
    SessionStatus s;
    RecordingSummary rec;
    rec.path = "recordings/a.mp4";
    s.recording = rec;
    json j = status_to_json(s);
    EXPECT_FALSE(j["recording"].contains("annotated_path"));
}

TEST(StatusJsonTest, RecordingStatus) {
    SessionStatus s;
    s.state = SessionState::Recording;
    s.capture_fps = 14.5;
    s.frames_captured = 120;
    s.jobs_in_flight = 1;
    RecordingSummary rec;
    rec.id = 3;
    rec.path = "recordings/a.mp4";
    rec.frames_written = 100;
    rec.write_error = true;
    rec.error_message = "frame 42 not written";
    s.recording = rec;
    s.last_error = ErrorInfo{ErrorKind::RecordingWriteFailure, "frame 42 not written", WallClock::now()};

    json j = status_to_json(s);
    EXPECT_EQ(j["state"], "Recording");
    EXPECT_TRUE(j["is_running"].get<bool>());
    EXPECT_TRUE(j["is_recording"].get<bool>());
    EXPECT_TRUE(j["conversion_in_flight"].get<bool>());
    EXPECT_EQ(j["frames_captured"], 120);
    EXPECT_EQ(j["recording"]["frames_written"], 100);
    EXPECT_EQ(j["recording"]["error_message"], "frame 42 not written");
    EXPECT_EQ(j["last_error"]["kind"], "RecordingWriteFailure");
    EXPECT_FALSE(j["last_error"]["at"].get<std::string>().empty());
}

TEST(JobJsonTest, SucceededJobHasArtifact) {
    JobReport r;
    r.id = 4;
    r.recording_path = "recordings/a.mp4";
    r.state = JobState::Succeeded;
    r.conversion.success = true;
    r.conversion.output_path = "recordings/a_web.mp4";
    r.conversion.input_size = 4000;
    r.conversion.output_size = 1000;
    r.conversion.compression_ratio = 4.0;
    r.artifact_id = "artifact-1";
    r.url = "https://store.example/artifact-1";
    r.queued_at = WallClock::now();

    json j = job_to_json(r);
    EXPECT_EQ(j["state"], "succeeded");
    EXPECT_EQ(j["conversion"]["output"], "recordings/a_web.mp4");
    EXPECT_DOUBLE_EQ(j["conversion"]["compression_ratio"].get<double>(), 4.0);
    EXPECT_EQ(j["url"], "https://store.example/artifact-1");
    EXPECT_FALSE(j.contains("error"));
    EXPECT_EQ(j["finished_at"], "");
}

TEST(JobJsonTest, FailedJobHasError) {
    JobReport r;
    r.state = JobState::Failed;
    r.error = ErrorInfo{ErrorKind::ConversionTimeout, "encoder exceeded 300s and was killed", {}};
    json j = job_to_json(r);
    EXPECT_EQ(j["state"], "failed");
    EXPECT_EQ(j["error"]["kind"], "ConversionTimeout");
    EXPECT_FALSE(j.contains("conversion"));
    EXPECT_FALSE(j.contains("url"));
}

TEST(PoseJsonTest, KeypointsSerialized) {
    PersonPose p;
    p.person_id = 2;
    p.score = 0.8f;
    p.bbox = cv::Rect(1, 2, 30, 40);
    Keypoint k;
    k.name = "nose";
    k.x = 5.0f;
    k.y = 6.0f;
    k.confidence = 0.9f;
    p.keypoints.push_back(k);

    json j = poses_to_json({p});
    ASSERT_EQ(j.size(), 1u);
    EXPECT_EQ(j[0]["person_id"], 2);
    EXPECT_EQ(j[0]["bbox"], json({1, 2, 30, 40}));
    EXPECT_EQ(j[0]["keypoints"][0]["name"], "nose");
    EXPECT_FALSE(j[0]["keypoints"][0].contains("z"));
    EXPECT_TRUE(poses_to_json({}).is_array());
}

TEST(FeedbackJsonTest, QualityAsObject) {
    ExerciseFeedback fb;
    fb.exercise_id = 1;
    fb.exercise_name = "Holding up the Sky";
    fb.current_phase = "hold";
    fb.form_score = 80.0;
    fb.corrections = {"Raise arms higher overhead"};
    fb.pose_quality = {{"stability", 95.0}};

    json j = feedback_to_json(fb);
    EXPECT_EQ(j["current_phase"], "hold");
    EXPECT_EQ(j["corrections"][0], "Raise arms higher overhead");
    EXPECT_DOUBLE_EQ(j["pose_quality"]["stability"].get<double>(), 95.0);
}
