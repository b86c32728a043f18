#include "exercise_tracker.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <numeric>

namespace {
const std::vector<ExerciseDefinition> kCatalogue = {
    {1, "Holding up the Sky", "Raise both hands above head, palms up",
     {"start", "lift", "hold", "lower"}},
    {2, "Drawing the Bow", "Simulate drawing a bow alternating left and right",
     {"start", "draw_left", "draw_right"}},
    {3, "Single Arm Raise", "Alternately raise single arms overhead",
     {"start", "left_raise", "right_raise"}},
    {4, "Look Back", "Turn head left and right while keeping body stable",
     {"start", "look_left", "look_right"}},
    {5, "Sway Head and Tail", "Swaying movements to release tension",
     {"start", "sway_left", "sway_right"}},
    {6, "Reach Down", "Bend forward and reach toward feet",
     {"start", "forward_bend", "touch_feet", "return"}},
    {7, "Clench Fists", "Punch forward with focused intent", {"start", "punch_left", "punch_right"}},
    {8, "Heel Raises", "Rise on toes and gently drop on heels", {"start", "toe_raise", "heel_drop"}},
};

constexpr size_t kTorsoHistory = 50;
constexpr size_t kFluidityWindow = 5;

bool contains(const std::string& s, const char* needle) { return s.find(needle) != std::string::npos; }

double clamp_score(double v) { return std::clamp(v, 0.0, 100.0); }
}  // namespace

const std::vector<ExerciseDefinition>& exercise_catalogue() { return kCatalogue; }

const ExerciseDefinition* find_exercise(int id) {
  for (const auto& e : kCatalogue) {
    if (e.id == id) return &e;
  }
  return nullptr;
}

ExerciseTracker::ExerciseTracker(float confidence_threshold) : threshold_(confidence_threshold) {}

bool ExerciseTracker::startExercise(int exercise_id, TimePoint now) {
  const ExerciseDefinition* def = find_exercise(exercise_id);
  if (!def) {
    spdlog::warn("Unknown exercise id {}", exercise_id);
    return false;
  }
  current_ = def;
  phase_ = def->phases.front();
  started_ = now;
  torso_history_.clear();
  exercise_scores_.clear();
  attempted_++;
  spdlog::info("Exercise tracking started: {} ({})", def->name, def->id);
  return true;
}

std::optional<double> ExerciseTracker::endExercise() {
  if (!current_) return std::nullopt;
  double avg = 0.0;
  if (!exercise_scores_.empty()) {
    size_t n = std::min<size_t>(10, exercise_scores_.size());
    avg = std::accumulate(exercise_scores_.end() - static_cast<long>(n), exercise_scores_.end(),
                          0.0) /
          static_cast<double>(n);
    completed_++;
  }
  spdlog::info("Exercise completed: {} (score {:.1f})", current_->name, avg);
  current_ = nullptr;
  phase_ = "ready";
  return avg;
}

double ExerciseTracker::completion(TimePoint now) const {
  double elapsed = std::chrono::duration<double>(now - started_).count();
  return std::min(100.0, std::max(0.0, elapsed / kCycleSeconds * 100.0));
}

void ExerciseTracker::updatePhase(TimePoint now) {
  const auto& phases = current_->phases;
  double elapsed = std::chrono::duration<double>(now - started_).count();
  double per_phase = kCycleSeconds / static_cast<double>(phases.size());
  size_t idx = static_cast<size_t>(std::max(0.0, elapsed) / per_phase) % phases.size();
  phase_ = phases[idx];
}

double ExerciseTracker::torsoMovement() const {
  if (torso_history_.size() < 2) return 0.0;
  size_t n = std::min(kFluidityWindow, torso_history_.size());
  auto begin = torso_history_.end() - static_cast<long>(n);
  double total = 0.0;
  int steps = 0;
  for (auto it = begin; it + 1 != torso_history_.end(); ++it) {
    const auto& a = *it;
    const auto& b = *(it + 1);
    double movement = 0.0;
    for (size_t j = 0; j < a.size() && j < b.size(); ++j) {
      movement += std::hypot(a[j].x - b[j].x, a[j].y - b[j].y);
    }
    total += movement;
    steps++;
  }
  return steps ? total / steps : 0.0;
}

ExerciseTracker::Analysis ExerciseTracker::analyze(const std::vector<Keypoint>& kp) const {
  Analysis a;
  const std::string& phase = phase_;
  auto y = [&](int i) { return static_cast<double>(kp[i].y); };
  auto x = [&](int i) { return static_cast<double>(kp[i].x); };
  // Positive when the wrist is above the shoulder (image y grows downward).
  const double left_arm_height = y(kLeftShoulder) - y(kLeftWrist);
  const double right_arm_height = y(kRightShoulder) - y(kRightWrist);

  switch (current_->id) {
    case 1:
      if (phase == "hold") {
        if (left_arm_height < 100 || right_arm_height < 100) {
          a.score -= 20;
          a.corrections.push_back("Raise arms higher overhead");
        }
        if (std::abs(left_arm_height - right_arm_height) > 50) {
          a.score -= 15;
          a.corrections.push_back("Keep arms at equal height");
        }
        if (std::abs(y(kLeftShoulder) - y(kRightShoulder)) > 20) {
          a.score -= 10;
          a.corrections.push_back("Keep shoulders level");
        }
        a.messages.push_back("Hold this position with palms facing up");
      } else if (phase == "lift" || phase == "lower") {
        a.messages.push_back("Smooth " + phase + " movement - breathe naturally");
      }
      break;
    case 2:
      if (contains(phase, "draw")) {
        bool left = contains(phase, "left");
        int wrist = left ? kLeftWrist : kRightWrist;
        int shoulder = left ? kLeftShoulder : kRightShoulder;
        if (std::abs(x(wrist) - x(shoulder)) < 80) {
          a.score -= 20;
          a.corrections.push_back(left ? "Extend left arm further" : "Extend right arm further");
        }
        a.messages.push_back(left ? "Draw the bow with your left arm"
                                  : "Draw the bow with your right arm");
        double hip_center = (x(kLeftHip) + x(kRightHip)) / 2.0;
        double shoulder_center = (x(kLeftShoulder) + x(kRightShoulder)) / 2.0;
        if (std::abs(hip_center - shoulder_center) > 30) {
          a.score -= 15;
          a.corrections.push_back("Keep torso straight and stable");
        }
      }
      break;
    case 3:
      if (contains(phase, "raise")) {
        bool left = contains(phase, "left");
        double up = left ? left_arm_height : right_arm_height;
        double down = left ? right_arm_height : left_arm_height;
        if (up < 100) {
          a.score -= 25;
          a.corrections.push_back(left ? "Raise left arm higher" : "Raise right arm higher");
        }
        if (down > -20) {
          a.score -= 20;
          a.corrections.push_back(left ? "Press right arm down firmly"
                                       : "Press left arm down firmly");
        }
        a.messages.push_back(left ? "Left arm up, right arm pressed down"
                                  : "Right arm up, left arm pressed down");
      }
      break;
    case 4:
      if (std::abs(y(kLeftShoulder) - y(kRightShoulder)) > 15) {
        a.score -= 20;
        a.corrections.push_back("Keep shoulders level while turning head");
      }
      if (contains(phase, "look")) {
        a.messages.push_back(std::string("Look far to the ") +
                             (contains(phase, "left") ? "left" : "right") +
                             ", keep shoulders still");
      }
      break;
    case 5:
      if (contains(phase, "sway")) {
        a.messages.push_back("Move fluidly like water, release tension");
        if (torso_history_.size() > kFluidityWindow && torsoMovement() < 10.0) {
          a.score -= 15;
          a.corrections.push_back("Move more fluidly, avoid stiffness");
        }
      }
      break;
    case 6:
      if (phase == "forward_bend") {
        if (y(kLeftHip) - y(kLeftWrist) < 50) {
          a.messages.push_back("Bend only to your comfortable limit");
        } else {
          a.score -= 10;
          a.corrections.push_back("Don't force the stretch");
        }
        a.messages.push_back("Reach down gently, keep knees soft");
      } else if (phase == "return") {
        a.messages.push_back("Rise slowly, vertebra by vertebra");
      }
      break;
    case 7:
      if (contains(phase, "punch")) {
        if (std::abs(x(kLeftHip) - x(kRightHip)) < 60) {
          a.score -= 20;
          a.corrections.push_back("Widen your stance for better stability");
        }
        a.messages.push_back(std::string("Punch ") + (contains(phase, "left") ? "left" : "right") +
                             " with power and focus");
      }
      break;
    case 8:
      if (phase == "toe_raise") {
        if (std::abs(x(kLeftAnkle) - x(kRightAnkle)) > 100) {
          a.score -= 15;
          a.corrections.push_back("Keep feet closer together");
        }
        a.messages.push_back("Rise gently on toes, maintain balance");
      } else if (phase == "heel_drop") {
        a.messages.push_back("Drop gently, feel the vibration through spine");
      }
      break;
    default:
      a.score = 50.0;
      a.messages.push_back("Exercise not implemented");
      break;
  }
  a.score = clamp_score(a.score);
  return a;
}

std::optional<ExerciseFeedback> ExerciseTracker::process(const std::vector<PersonPose>& poses,
                                                         TimePoint now) {
  if (!current_ || poses.empty()) return std::nullopt;

  updatePhase(now);

  ExerciseFeedback fb;
  fb.exercise_id = current_->id;
  fb.exercise_name = current_->name;
  fb.current_phase = phase_;

  const auto& kp = poses.front().keypoints;
  int confident = static_cast<int>(std::count_if(
      kp.begin(), kp.end(), [this](const Keypoint& k) { return k.confidence > threshold_; }));
  if (kp.size() < static_cast<size_t>(kKeypointCount) || confident < kMinConfidentKeypoints) {
    fb.feedback_messages.push_back("Pose not clearly detected");
    fb.corrections.push_back("Position yourself in clear view of camera");
    return fb;
  }

  torso_history_.push_back({{kp[kLeftShoulder].x, kp[kLeftShoulder].y},
                            {kp[kRightShoulder].x, kp[kRightShoulder].y},
                            {kp[kLeftHip].x, kp[kLeftHip].y},
                            {kp[kRightHip].x, kp[kRightHip].y}});
  if (torso_history_.size() > kTorsoHistory) torso_history_.pop_front();

  Analysis a = analyze(kp);
  fb.form_score = a.score;
  fb.feedback_messages = std::move(a.messages);
  fb.corrections = std::move(a.corrections);
  fb.completion_percentage = completion(now);
  fb.pose_quality = pose_quality_metrics(kp);

  exercise_scores_.push_back(fb.form_score);
  session_scores_.push_back(fb.form_score);
  return fb;
}

ExerciseSessionSummary ExerciseTracker::summary() const {
  ExerciseSessionSummary s;
  s.exercises_attempted = attempted_;
  s.exercises_completed = completed_;
  if (!session_scores_.empty()) {
    double mean = std::accumulate(session_scores_.begin(), session_scores_.end(), 0.0) /
                  static_cast<double>(session_scores_.size());
    s.average_form_score = mean;
    if (session_scores_.size() >= 5) {
      double var = 0.0;
      for (double v : session_scores_) var += (v - mean) * (v - mean);
      var /= static_cast<double>(session_scores_.size());
      s.movement_consistency = std::max(0.0, 100.0 - var);
    }
    if (mean < 60) {
      s.recommendations.push_back("Focus on basic posture and alignment");
      s.recommendations.push_back("Practice slower movements for better control");
    } else if (mean < 80) {
      s.recommendations.push_back("Work on consistency between repetitions");
      s.recommendations.push_back("Pay attention to breathing coordination");
    } else {
      s.recommendations.push_back("Excellent form! Try increasing hold duration");
      s.recommendations.push_back("Focus on the mind-body connection");
    }
  }
  if (attempted_ < 3) {
    s.recommendations.push_back("Try completing more exercises for a full session");
  }
  return s;
}

std::vector<std::pair<std::string, double>> pose_quality_metrics(const std::vector<Keypoint>& kp) {
  std::vector<std::pair<std::string, double>> m;
  if (kp.size() < static_cast<size_t>(kKeypointCount)) return m;

  double shoulder_diff = std::abs(kp[kLeftShoulder].y - kp[kRightShoulder].y);
  double hip_diff = std::abs(kp[kLeftHip].y - kp[kRightHip].y);
  double left_spine = std::abs(kp[kLeftShoulder].x - kp[kLeftHip].x);
  double right_spine = std::abs(kp[kRightShoulder].x - kp[kRightHip].x);
  double shoulder_center = (kp[kLeftShoulder].x + kp[kRightShoulder].x) / 2.0;
  double hip_center = (kp[kLeftHip].x + kp[kRightHip].x) / 2.0;

  m.emplace_back("shoulder_alignment", clamp_score(100.0 - shoulder_diff * 2.0));
  m.emplace_back("hip_alignment", clamp_score(100.0 - hip_diff * 2.0));
  m.emplace_back("spine_alignment", clamp_score(100.0 - std::abs(left_spine - right_spine)));
  m.emplace_back("stability", clamp_score(100.0 - std::abs(shoulder_center - hip_center) * 2.0));
  return m;
}
