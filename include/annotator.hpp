#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "exercise_tracker.hpp"
#include "types.hpp"

// Per-frame context the overlay HUD needs besides the poses.
struct OverlayContext {
  uint64_t sequence{0};
  double fps{0.0};
  bool recording{false};
};

// Draws inference results onto a frame. Exactly one annotator is active per
// session; it is called only from the inference worker.
class FrameAnnotator {
public:
  virtual ~FrameAnnotator() = default;
  virtual std::optional<ExerciseFeedback> annotate(cv::Mat& canvas,
                                                   const std::vector<PersonPose>& poses,
                                                   const OverlayContext& ctx) = 0;
  virtual std::string name() const = 0;
  virtual int exerciseId() const { return 0; }
  virtual std::string exercisePhase() const { return {}; }
  // nullopt when the annotator does no exercise tracking.
  virtual std::optional<ExerciseSessionSummary> sessionSummary() const { return std::nullopt; }
  // Closes out the active exercise. Idempotent.
  virtual void endSession() {}
};

class BasicPoseOverlay : public FrameAnnotator {
public:
  explicit BasicPoseOverlay(float keypoint_threshold = 0.5f) : threshold_(keypoint_threshold) {}

  std::optional<ExerciseFeedback> annotate(cv::Mat& canvas, const std::vector<PersonPose>& poses,
                                           const OverlayContext& ctx) override;
  std::string name() const override { return "basic"; }

  void drawPose(cv::Mat& canvas, const PersonPose& pose) const;
  void drawHud(cv::Mat& canvas, size_t persons, const OverlayContext& ctx) const;

private:
  float threshold_;
};

class ExerciseFeedbackAnnotator : public FrameAnnotator {
public:
  ExerciseFeedbackAnnotator(int exercise_id, float keypoint_threshold = 0.5f);
  ~ExerciseFeedbackAnnotator() override;

  bool ready() const { return tracker_.currentExercise() != 0; }

  std::optional<ExerciseFeedback> annotate(cv::Mat& canvas, const std::vector<PersonPose>& poses,
                                           const OverlayContext& ctx) override;
  std::string name() const override { return "exercise"; }
  int exerciseId() const override { return tracker_.currentExercise(); }
  std::string exercisePhase() const override { return tracker_.currentPhase(); }
  std::optional<ExerciseSessionSummary> sessionSummary() const override {
    return tracker_.summary();
  }
  void endSession() override;

  const ExerciseTracker& tracker() const { return tracker_; }

private:
  BasicPoseOverlay base_;
  ExerciseTracker tracker_;

  void drawPanel(cv::Mat& canvas, const ExerciseFeedback& fb) const;
};

// Exercise annotator when exercise_id names a catalogue entry, basic otherwise.
std::unique_ptr<FrameAnnotator> createAnnotator(int exercise_id, float keypoint_threshold);
