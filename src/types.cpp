#include "types.hpp"

#include <ctime>

namespace {
const char* const kKeypointNames[kKeypointCount] = {
    "nose",          "left_eye",       "right_eye",  "left_ear",    "right_ear",
    "left_shoulder", "right_shoulder", "left_elbow", "right_elbow", "left_wrist",
    "right_wrist",   "left_hip",       "right_hip",  "left_knee",   "right_knee",
    "left_ankle",    "right_ankle"};
}

const char* keypoint_name(int index) {
  if (index < 0 || index >= kKeypointCount) return "unknown";
  return kKeypointNames[index];
}

const char* to_string(SessionState s) {
  switch (s) {
    case SessionState::Idle:
      return "Idle";
    case SessionState::Streaming:
      return "Streaming";
    case SessionState::Recording:
      return "Recording";
    case SessionState::Stopping:
      return "Stopping";
  }
  return "Unknown";
}

const char* to_string(ErrorKind k) {
  switch (k) {
    case ErrorKind::None:
      return "None";
    case ErrorKind::InvalidTransition:
      return "InvalidTransition";
    case ErrorKind::DeviceFailure:
      return "DeviceFailure";
    case ErrorKind::InferenceDegraded:
      return "InferenceDegraded";
    case ErrorKind::RecordingWriteFailure:
      return "RecordingWriteFailure";
    case ErrorKind::ConversionFailure:
      return "ConversionFailure";
    case ErrorKind::ConversionTimeout:
      return "ConversionTimeout";
    case ErrorKind::ToolMissing:
      return "ToolMissing";
    case ErrorKind::UploadFailure:
      return "UploadFailure";
  }
  return "Unknown";
}

bool is_valid_transition(SessionState from, SessionState to) {
  switch (from) {
    case SessionState::Idle:
      return to == SessionState::Streaming;
    case SessionState::Streaming:
      return to == SessionState::Recording || to == SessionState::Stopping;
    case SessionState::Recording:
      return to == SessionState::Streaming;
    case SessionState::Stopping:
      return to == SessionState::Idle;
  }
  return false;
}

std::string format_wall_time(WallClock::time_point tp, const char* fmt) {
  std::time_t t = WallClock::to_time_t(tp);
  std::tm tm_buf{};
  localtime_r(&t, &tm_buf);
  char buf[64];
  size_t n = std::strftime(buf, sizeof(buf), fmt, &tm_buf);
  return std::string(buf, n);
}
