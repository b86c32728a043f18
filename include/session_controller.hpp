#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "conversion_stage.hpp"
#include "frame_delivery_buffer.hpp"
#include "frame_source.hpp"
#include "inference_stage.hpp"
#include "metrics.hpp"
#include "pose_estimator.hpp"
#include "recording_manager.hpp"
#include "types.hpp"
#include "util.hpp"

using PoseEstimatorFactory = std::function<std::unique_ptr<PoseEstimator>()>;

struct SessionOptions {
  std::optional<int> exercise_id;  // falls back to inference.exercise_id
};

struct RecordingSummary {
  uint64_t id{0};
  std::string path;
  uint64_t frames_written{0};
  double elapsed_sec{0.0};
  bool write_error{false};
  std::string error_message;
  std::string annotated_path;  // set when recording.source is both
  uint64_t annotated_frames{0};
};

struct SessionStatus {
  SessionState state{SessionState::Idle};
  double capture_fps{0.0};
  uint64_t frames_captured{0};
  uint64_t frames_dropped{0};
  uint64_t inference_failures{0};
  size_t persons_detected{0};
  uint64_t latest_sequence{0};
  std::optional<RecordingSummary> recording;
  size_t jobs_in_flight{0};
  std::optional<JobReport> last_job;
  ErrorInfo last_error;
  bool exercise_tracking{false};
  std::optional<ExerciseSessionSummary> exercise_summary;
  int exercise_id{0};
  std::string exercise_name;
  std::string exercise_phase;
  bool camera_available{false};
  bool model_available{false};
  double session_uptime_sec{0.0};
};

// The single owner of one device's session. Control operations are totally
// ordered by transition_mu_; the capture loop never takes it and only moves the
// state with a compare-exchange when it aborts on repeated camera failures.
class SessionController {
public:
  SessionController(AppConfig config, MetricsRegistry& metrics, FrameSourceFactory source_factory,
                    PoseEstimatorFactory estimator_factory,
                    std::shared_ptr<EncoderRunner> encoder, std::shared_ptr<ArtifactStore> store,
                    VideoSinkFactory sink_factory = nullptr);
  ~SessionController();

  SessionController(const SessionController&) = delete;
  SessionController& operator=(const SessionController&) = delete;

  TransitionResult start(const SessionOptions& opts = {});
  TransitionResult startRecording(const std::string& path = {});
  TransitionResult stopRecording();
  TransitionResult stop();

  SessionStatus status() const;
  SessionState state() const { return state_.load(); }

  // Re-dispatches conversion and upload for an existing file in any state.
  TransitionResult exportRecording(const std::string& path);
  std::vector<RecordingInfo> listRecordings() const;

  // Live while a session runs, final once stop() has ended the exercise.
  // nullopt when no session has tracked an exercise.
  std::optional<ExerciseSessionSummary> exerciseSummary() const;

  const FrameDeliveryBuffer& deliveryBuffer() const { return delivery_; }
  ConversionUploadStage& conversion() { return *conversion_; }
  const AppConfig& config() const { return cfg_; }

private:
  AppConfig cfg_;
  MetricsRegistry& metrics_;
  FrameSourceFactory source_factory_;
  PoseEstimatorFactory estimator_factory_;

  std::mutex transition_mu_;
  std::atomic<SessionState> state_{SessionState::Idle};
  std::atomic<bool> running_{false};
  std::thread loop_thread_;

  std::unique_ptr<FrameSource> source_;
  std::unique_ptr<InferenceStage> inference_;
  FrameDeliveryBuffer delivery_;
  RecordingManager recording_;            // clean camera frames
  RecordingManager annotated_recording_;  // inference output, appended by the worker
  // Annotated frames captured before this sequence belong to an earlier recording.
  std::atomic<uint64_t> recording_first_seq_{0};

  // Global across sessions so delivered sequence numbers never go backwards.
  std::atomic<uint64_t> next_sequence_{1};
  std::atomic<uint64_t> session_frames_{0};
  std::atomic<double> fps_{0.0};
  std::atomic<bool> camera_ok_{false};

  mutable std::mutex stats_mu_;
  int exercise_id_{0};
  std::string exercise_name_;
  TimePoint session_started_{};

  mutable std::mutex error_mu_;
  ErrorInfo last_error_;

  // Declared last: destroyed first, joining conversion workers whose
  // completion callback touches the members above.
  std::unique_ptr<ConversionUploadStage> conversion_;

  void captureLoop();
  void abortOnDeviceFailure(int failures);
  TransitionResult finishRecording();
  void endExerciseSession();
  void recordError(ErrorKind kind, const std::string& message);
  TransitionResult fail(ErrorKind kind, std::string message) const;
};
