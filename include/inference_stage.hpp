#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include "annotator.hpp"
#include "frame_delivery_buffer.hpp"
#include "metrics.hpp"
#include "pose_estimator.hpp"
#include "types.hpp"

// Runs pose estimation and overlay on a dedicated worker and publishes every
// result to the delivery buffer.
//
// The hand-off is a single pending slot: submit() never waits for inference.
// A frame submitted while another is still pending replaces it (the older one
// is dropped), so at most one frame is in flight and one is waiting.
class InferenceStage {
public:
  // Sees every processed frame on the worker, before it is published.
  using OutputCallback = std::function<void(const AnnotatedFrame&, const OverlayContext&)>;

  InferenceStage(std::unique_ptr<PoseEstimator> estimator,
                 std::unique_ptr<FrameAnnotator> annotator, FrameDeliveryBuffer& delivery,
                 MetricsRegistry& metrics, bool overlay_enabled = true);
  ~InferenceStage();

  InferenceStage(const InferenceStage&) = delete;
  InferenceStage& operator=(const InferenceStage&) = delete;

  // Must be set before start().
  void setOutputCallback(OutputCallback cb) { on_output_ = std::move(cb); }

  void start();
  void stop();
  bool running() const { return running_.load(); }

  // Returns false when an older pending frame was dropped to make room.
  bool submit(Frame frame, const OverlayContext& ctx);

  // Synchronous path used by the worker. Never throws: an estimator or overlay
  // failure yields the raw frame with overlay_applied == false.
  AnnotatedFrame process(Frame frame, const OverlayContext& ctx);

  // Blocks until nothing is pending or in flight, or the timeout expires.
  bool waitIdle(std::chrono::milliseconds timeout);

  bool modelAvailable() const { return estimator_ != nullptr; }
  uint64_t processed() const { return processed_.load(); }
  uint64_t dropped() const { return dropped_.load(); }
  uint64_t failures() const { return failures_.load(); }
  size_t lastPersonCount() const { return last_persons_.load(); }

  std::string annotatorName() const { return annotator_ ? annotator_->name() : "none"; }
  int exerciseId() const;
  std::string exercisePhase() const;
  std::optional<ExerciseSessionSummary> exerciseSummary() const;
  // Ends the active exercise and returns the final summary. Call after stop().
  std::optional<ExerciseSessionSummary> endExerciseSession();

private:
  struct Pending {
    Frame frame;
    OverlayContext ctx;
  };

  std::unique_ptr<PoseEstimator> estimator_;
  std::unique_ptr<FrameAnnotator> annotator_;
  FrameDeliveryBuffer& delivery_;
  MetricsRegistry& metrics_;
  bool overlay_enabled_;
  OutputCallback on_output_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::optional<Pending> pending_;
  bool busy_{false};

  std::atomic<bool> running_{false};
  std::thread worker_;

  std::atomic<uint64_t> processed_{0};
  std::atomic<uint64_t> dropped_{0};
  std::atomic<uint64_t> failures_{0};
  std::atomic<size_t> last_persons_{0};

  mutable std::mutex annotator_mu_;

  void run();
  void recordFailure(uint64_t sequence, const char* what);
};
