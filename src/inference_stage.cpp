#include "inference_stage.hpp"

#include <spdlog/spdlog.h>

#include <chrono>

using namespace std::chrono;

InferenceStage::InferenceStage(std::unique_ptr<PoseEstimator> estimator,
                               std::unique_ptr<FrameAnnotator> annotator,
                               FrameDeliveryBuffer& delivery, MetricsRegistry& metrics,
                               bool overlay_enabled)
    : estimator_(std::move(estimator)),
      annotator_(std::move(annotator)),
      delivery_(delivery),
      metrics_(metrics),
      overlay_enabled_(overlay_enabled) {
  if (!annotator_) annotator_ = std::make_unique<BasicPoseOverlay>();
}

InferenceStage::~InferenceStage() { stop(); }

void InferenceStage::start() {
  if (running_.exchange(true)) return;
  worker_ = std::thread(&InferenceStage::run, this);
  spdlog::info("Inference stage started (estimator={}, overlay={})",
               estimator_ ? estimator_->name() : "none", annotator_->name());
}

void InferenceStage::stop() {
  if (!running_.exchange(false)) return;
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();
  {
    std::lock_guard<std::mutex> lk(mu_);
    pending_.reset();
  }
  idle_cv_.notify_all();
  spdlog::info("Inference stage stopped: processed={} dropped={} failures={}", processed_.load(),
               dropped_.load(), failures_.load());
}

bool InferenceStage::submit(Frame frame, const OverlayContext& ctx) {
  bool replaced = false;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (pending_) {
      replaced = true;
      spdlog::debug("Inference busy, dropping frame {}", pending_->frame.sequence);
    }
    pending_ = Pending{std::move(frame), ctx};
  }
  if (replaced) {
    dropped_.fetch_add(1);
    metrics_.inc_dropped();
  }
  cv_.notify_one();
  return !replaced;
}

void InferenceStage::run() {
  while (true) {
    Pending job;
    {
      std::unique_lock<std::mutex> lk(mu_);
      cv_.wait(lk, [&] { return pending_.has_value() || !running_; });
      if (!running_) break;
      job = std::move(*pending_);
      pending_.reset();
      busy_ = true;
    }

    AnnotatedFrame out = process(std::move(job.frame), job.ctx);
    if (on_output_) on_output_(out, job.ctx);
    delivery_.publish(std::move(out));

    {
      std::lock_guard<std::mutex> lk(mu_);
      busy_ = false;
    }
    idle_cv_.notify_all();
  }
  std::lock_guard<std::mutex> lk(mu_);
  busy_ = false;
}

bool InferenceStage::waitIdle(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lk(mu_);
  return idle_cv_.wait_for(lk, timeout, [&] { return !pending_ && !busy_; });
}

void InferenceStage::recordFailure(uint64_t sequence, const char* what) {
  uint64_t n = failures_.fetch_add(1) + 1;
  metrics_.inc_inference_failure();
  // First failure and then every 100th, so a missing model does not flood the log.
  if (n == 1 || n % 100 == 0) {
    spdlog::warn("Inference degraded on frame {} ({} total): {}", sequence, n, what);
  }
}

AnnotatedFrame InferenceStage::process(Frame frame, const OverlayContext& ctx) {
  AnnotatedFrame out;
  out.sequence = frame.sequence;
  out.t_capture = frame.t_capture;
  out.wall_capture = frame.wall_capture;
  out.image = frame.image;

  auto t0 = Clock::now();
  if (!estimator_) {
    recordFailure(frame.sequence, "no pose model loaded");
    processed_.fetch_add(1);
    return out;
  }

  std::vector<PersonPose> poses;
  try {
    poses = estimator_->estimate(frame.image);
  } catch (const std::exception& e) {
    recordFailure(frame.sequence, e.what());
    processed_.fetch_add(1);
    return out;
  }
  out.inference_ms = duration<double, std::milli>(Clock::now() - t0).count();
  metrics_.add_inference(out.inference_ms);
  last_persons_.store(poses.size());

  if (overlay_enabled_) {
    try {
      cv::Mat canvas = frame.image.clone();
      std::lock_guard<std::mutex> lk(annotator_mu_);
      out.feedback = annotator_->annotate(canvas, poses, ctx);
      out.image = canvas;
      out.overlay_applied = true;
    } catch (const std::exception& e) {
      recordFailure(frame.sequence, e.what());
      out.image = frame.image;
      out.feedback.reset();
    }
  }
  out.poses = std::move(poses);
  processed_.fetch_add(1);
  return out;
}

int InferenceStage::exerciseId() const {
  std::lock_guard<std::mutex> lk(annotator_mu_);
  return annotator_->exerciseId();
}

std::string InferenceStage::exercisePhase() const {
  std::lock_guard<std::mutex> lk(annotator_mu_);
  return annotator_->exercisePhase();
}

std::optional<ExerciseSessionSummary> InferenceStage::exerciseSummary() const {
  std::lock_guard<std::mutex> lk(annotator_mu_);
  return annotator_->sessionSummary();
}

std::optional<ExerciseSessionSummary> InferenceStage::endExerciseSession() {
  std::lock_guard<std::mutex> lk(annotator_mu_);
  annotator_->endSession();
  return annotator_->sessionSummary();
}
