#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

using Clock = std::chrono::steady_clock;
using TimePoint = std::chrono::time_point<Clock>;
using WallClock = std::chrono::system_clock;

// One raw camera sample. The capture loop owns it until it is handed to the
// inference stage.
struct Frame {
  uint64_t sequence{};
  TimePoint t_capture{};
  WallClock::time_point wall_capture{};
  cv::Mat image;  // BGR
};

// COCO-17 ordering as produced by YOLO pose models.
enum KeypointIndex : int {
  kNose = 0,
  kLeftEye,
  kRightEye,
  kLeftEar,
  kRightEar,
  kLeftShoulder,
  kRightShoulder,
  kLeftElbow,
  kRightElbow,
  kLeftWrist,
  kRightWrist,
  kLeftHip,
  kRightHip,
  kLeftKnee,
  kRightKnee,
  kLeftAnkle,
  kRightAnkle,
  kKeypointCount
};

const char* keypoint_name(int index);

struct Keypoint {
  std::string name;
  float x{0.0f};
  float y{0.0f};
  std::optional<float> z;
  float confidence{0.0f};
};

struct PersonPose {
  int person_id{0};
  std::vector<Keypoint> keypoints;  // ordered by KeypointIndex
  float score{0.0f};
  cv::Rect bbox;
};

struct ExerciseFeedback {
  int exercise_id{0};
  std::string exercise_name;
  std::string current_phase;
  double completion_percentage{0.0};
  double form_score{0.0};
  std::vector<std::string> feedback_messages;
  std::vector<std::string> corrections;
  std::vector<std::pair<std::string, double>> pose_quality;
};

// Immutable once published.
struct AnnotatedFrame {
  uint64_t sequence{};
  TimePoint t_capture{};
  WallClock::time_point wall_capture{};
  cv::Mat image;  // overlay when overlay_applied, otherwise the raw frame
  bool overlay_applied{false};
  std::optional<std::vector<PersonPose>> poses;
  std::optional<ExerciseFeedback> feedback;
  double inference_ms{0.0};
};

enum class SessionState { Idle, Streaming, Recording, Stopping };

const char* to_string(SessionState s);

enum class ErrorKind {
  None,
  InvalidTransition,
  DeviceFailure,
  InferenceDegraded,
  RecordingWriteFailure,
  ConversionFailure,
  ConversionTimeout,
  ToolMissing,
  UploadFailure
};

const char* to_string(ErrorKind k);

struct ErrorInfo {
  ErrorKind kind{ErrorKind::None};
  std::string message;
  WallClock::time_point at{};

  bool empty() const { return kind == ErrorKind::None; }
};

struct TransitionResult {
  bool ok{false};
  ErrorKind error{ErrorKind::None};
  std::string message;
  SessionState state{SessionState::Idle};
  uint64_t job_id{0};  // set when the operation queued a conversion job
};

// Transitions the control API performs. stop() while recording goes through
// Streaming so the recording is finalized first. Stopping -> Idle is internal,
// as is the capture loop's own abort on device failure.
bool is_valid_transition(SessionState from, SessionState to);

std::string format_wall_time(WallClock::time_point tp, const char* fmt = "%Y-%m-%dT%H:%M:%S");
