#include "annotator.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>

#include <opencv2/imgproc.hpp>

namespace {
const std::pair<int, int> kSkeleton[] = {
    {kNose, kLeftEye},           {kNose, kRightEye},        {kLeftEye, kLeftEar},
    {kRightEye, kRightEar},      {kLeftShoulder, kRightShoulder}, {kLeftShoulder, kLeftHip},
    {kRightShoulder, kRightHip}, {kLeftHip, kRightHip},     {kLeftShoulder, kLeftElbow},
    {kLeftElbow, kLeftWrist},    {kRightShoulder, kRightElbow}, {kRightElbow, kRightWrist},
    {kLeftHip, kLeftKnee},       {kLeftKnee, kLeftAnkle},   {kRightHip, kRightKnee},
    {kRightKnee, kRightAnkle},
};

cv::Scalar region_color(int idx) {
  if (idx <= kRightEar) return cv::Scalar(255, 255, 0);    // head
  if (idx <= kRightWrist) return cv::Scalar(0, 255, 0);    // upper body
  return cv::Scalar(255, 0, 0);                            // lower body
}

cv::Scalar score_color(double score) {
  if (score > 80) return cv::Scalar(0, 255, 0);
  if (score > 60) return cv::Scalar(0, 255, 255);
  return cv::Scalar(0, 0, 255);
}
}  // namespace

void BasicPoseOverlay::drawPose(cv::Mat& canvas, const PersonPose& pose) const {
  const auto& kps = pose.keypoints;
  for (size_t i = 0; i < kps.size(); ++i) {
    if (kps[i].confidence <= threshold_) continue;
    cv::Point p(static_cast<int>(kps[i].x), static_cast<int>(kps[i].y));
    cv::circle(canvas, p, 6, region_color(static_cast<int>(i)), cv::FILLED);
    cv::putText(canvas, std::to_string(i), p + cv::Point(8, 0), cv::FONT_HERSHEY_SIMPLEX, 0.3,
                cv::Scalar(255, 255, 255), 1);
  }
  for (const auto& [a, b] : kSkeleton) {
    if (static_cast<size_t>(std::max(a, b)) >= kps.size()) continue;
    if (kps[a].confidence <= threshold_ || kps[b].confidence <= threshold_) continue;
    if (kps[a].x <= 0 || kps[a].y <= 0 || kps[b].x <= 0 || kps[b].y <= 0) continue;
    cv::line(canvas, cv::Point(static_cast<int>(kps[a].x), static_cast<int>(kps[a].y)),
             cv::Point(static_cast<int>(kps[b].x), static_cast<int>(kps[b].y)),
             cv::Scalar(0, 0, 255), 3);
  }
}

void BasicPoseOverlay::drawHud(cv::Mat& canvas, size_t persons, const OverlayContext& ctx) const {
  cv::putText(canvas, "Baduanjin Live Analysis", cv::Point(10, 30), cv::FONT_HERSHEY_SIMPLEX,
              0.8, cv::Scalar(0, 255, 255), 2);
  cv::putText(canvas, fmt::format("FPS: {:.1f}", ctx.fps), cv::Point(10, 60),
              cv::FONT_HERSHEY_SIMPLEX, 0.6, cv::Scalar(0, 255, 0), 2);
  cv::putText(canvas, fmt::format("Persons: {}", persons), cv::Point(10, 85),
              cv::FONT_HERSHEY_SIMPLEX, 0.6, cv::Scalar(255, 255, 255), 2);
  cv::putText(canvas, fmt::format("Frame: {}", ctx.sequence), cv::Point(10, 110),
              cv::FONT_HERSHEY_SIMPLEX, 0.6, cv::Scalar(255, 255, 255), 2);
  if (ctx.recording) {
    cv::circle(canvas, cv::Point(18, 130), 6, cv::Scalar(0, 0, 255), cv::FILLED);
    cv::putText(canvas, "REC", cv::Point(30, 137), cv::FONT_HERSHEY_SIMPLEX, 0.8,
                cv::Scalar(0, 0, 255), 2);
  }
}

std::optional<ExerciseFeedback> BasicPoseOverlay::annotate(cv::Mat& canvas,
                                                           const std::vector<PersonPose>& poses,
                                                           const OverlayContext& ctx) {
  for (const auto& p : poses) drawPose(canvas, p);
  drawHud(canvas, poses.size(), ctx);
  return std::nullopt;
}

ExerciseFeedbackAnnotator::ExerciseFeedbackAnnotator(int exercise_id, float keypoint_threshold)
    : base_(keypoint_threshold), tracker_(keypoint_threshold) {
  tracker_.startExercise(exercise_id);
}

ExerciseFeedbackAnnotator::~ExerciseFeedbackAnnotator() { endSession(); }

void ExerciseFeedbackAnnotator::endSession() {
  if (tracker_.currentExercise() == 0) return;
  auto average = tracker_.endExercise();
  ExerciseSessionSummary s = tracker_.summary();
  spdlog::info("Exercise session: {} attempted, {} completed, average form {:.1f} (last {:.1f})",
               s.exercises_attempted, s.exercises_completed, s.average_form_score,
               average.value_or(0.0));
}

std::optional<ExerciseFeedback> ExerciseFeedbackAnnotator::annotate(
    cv::Mat& canvas, const std::vector<PersonPose>& poses, const OverlayContext& ctx) {
  base_.annotate(canvas, poses, ctx);
  auto fb = tracker_.process(poses);
  if (fb) drawPanel(canvas, *fb);
  return fb;
}

void ExerciseFeedbackAnnotator::drawPanel(cv::Mat& canvas, const ExerciseFeedback& fb) const {
  const cv::Rect panel = cv::Rect(10, 160, 490, 160) & cv::Rect(0, 0, canvas.cols, canvas.rows);
  if (panel.area() > 0) {
    cv::Mat roi = canvas(panel);
    cv::Mat dark(roi.size(), roi.type(), cv::Scalar::all(0));
    cv::addWeighted(dark, 0.7, roi, 0.3, 0.0, roi);
  }

  int y = 180;
  cv::putText(canvas, "Exercise: " + fb.exercise_name, cv::Point(15, y), cv::FONT_HERSHEY_SIMPLEX,
              0.6, cv::Scalar(0, 255, 255), 2);
  y += 25;
  cv::putText(canvas, "Phase: " + fb.current_phase, cv::Point(15, y), cv::FONT_HERSHEY_SIMPLEX,
              0.5, cv::Scalar(255, 255, 255), 1);
  y += 25;
  int progress = static_cast<int>(300.0 * fb.completion_percentage / 100.0);
  cv::rectangle(canvas, cv::Point(15, y), cv::Point(315, y + 10), cv::Scalar(100, 100, 100),
                cv::FILLED);
  cv::rectangle(canvas, cv::Point(15, y), cv::Point(15 + progress, y + 10),
                cv::Scalar(0, 255, 0), cv::FILLED);
  cv::putText(canvas, fmt::format("{:.1f}%", fb.completion_percentage), cv::Point(325, y + 8),
              cv::FONT_HERSHEY_SIMPLEX, 0.4, cv::Scalar(255, 255, 255), 1);
  y += 25;
  cv::putText(canvas, fmt::format("Form Score: {:.1f}", fb.form_score), cv::Point(15, y),
              cv::FONT_HERSHEY_SIMPLEX, 0.6, score_color(fb.form_score), 2);
  y += 25;
  for (size_t i = 0; i < fb.feedback_messages.size() && i < 2; ++i, y += 20) {
    cv::putText(canvas, "- " + fb.feedback_messages[i], cv::Point(15, y),
                cv::FONT_HERSHEY_SIMPLEX, 0.4, cv::Scalar(255, 255, 255), 1);
  }
  for (size_t i = 0; i < fb.corrections.size() && i < 2; ++i, y += 20) {
    cv::putText(canvas, "! " + fb.corrections[i], cv::Point(15, y), cv::FONT_HERSHEY_SIMPLEX, 0.4,
                cv::Scalar(0, 100, 255), 1);
  }
}

std::unique_ptr<FrameAnnotator> createAnnotator(int exercise_id, float keypoint_threshold) {
  if (exercise_id != 0) {
    auto annotator = std::make_unique<ExerciseFeedbackAnnotator>(exercise_id, keypoint_threshold);
    if (annotator->ready()) return annotator;
    spdlog::warn("Exercise tracking unavailable for id {}, using basic overlay", exercise_id);
  }
  return std::make_unique<BasicPoseOverlay>(keypoint_threshold);
}
