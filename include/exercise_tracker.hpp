#pragma once

#include <deque>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

struct ExerciseDefinition {
  int id{0};
  std::string name;
  std::string description;
  std::vector<std::string> phases;
};

// The eight Baduanjin exercises, ids 1..8.
const std::vector<ExerciseDefinition>& exercise_catalogue();
const ExerciseDefinition* find_exercise(int id);

struct ExerciseSessionSummary {
  int exercises_attempted{0};
  int exercises_completed{0};
  double average_form_score{0.0};
  double movement_consistency{0.0};
  std::vector<std::string> recommendations;
};

// Scores one person's form against the active exercise and advances the phase
// with elapsed time. Owned by a single annotator; not thread-safe.
class ExerciseTracker {
public:
  static constexpr double kCycleSeconds = 20.0;
  static constexpr int kMinConfidentKeypoints = 8;

  explicit ExerciseTracker(float confidence_threshold = 0.5f);

  bool startExercise(int exercise_id, TimePoint now = Clock::now());
  // Returns the average of the last ten form scores, or nullopt if idle.
  std::optional<double> endExercise();

  std::optional<ExerciseFeedback> process(const std::vector<PersonPose>& poses,
                                          TimePoint now = Clock::now());

  int currentExercise() const { return current_ ? current_->id : 0; }
  const std::string& currentPhase() const { return phase_; }
  ExerciseSessionSummary summary() const;

private:
  struct Analysis {
    double score{100.0};
    std::vector<std::string> messages;
    std::vector<std::string> corrections;
  };

  float threshold_;
  const ExerciseDefinition* current_{nullptr};
  std::string phase_{"ready"};
  TimePoint started_{};

  std::deque<std::vector<cv::Point2f>> torso_history_;  // shoulders + hips per frame
  std::vector<double> exercise_scores_;
  std::vector<double> session_scores_;
  int attempted_{0};
  int completed_{0};

  void updatePhase(TimePoint now);
  double completion(TimePoint now) const;
  double torsoMovement() const;
  Analysis analyze(const std::vector<Keypoint>& kp) const;
};

std::vector<std::pair<std::string, double>> pose_quality_metrics(const std::vector<Keypoint>& kp);
