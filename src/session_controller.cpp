#include "session_controller.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <filesystem>

#include "annotator.hpp"
#include "exercise_tracker.hpp"

using namespace std::chrono;

SessionController::SessionController(AppConfig config, MetricsRegistry& metrics,
                                     FrameSourceFactory source_factory,
                                     PoseEstimatorFactory estimator_factory,
                                     std::shared_ptr<EncoderRunner> encoder,
                                     std::shared_ptr<ArtifactStore> store,
                                     VideoSinkFactory sink_factory)
    : cfg_(std::move(config)),
      metrics_(metrics),
      source_factory_(std::move(source_factory)),
      estimator_factory_(std::move(estimator_factory)),
      recording_(cfg_.recording, metrics, sink_factory),
      annotated_recording_(cfg_.recording, metrics, std::move(sink_factory)) {
  if (!source_factory_) {
    CameraConfig cam = cfg_.camera;
    source_factory_ = [cam] { return createFrameSource(cam); };
  }
  conversion_ = std::make_unique<ConversionUploadStage>(cfg_.conversion, std::move(encoder),
                                                        std::move(store), metrics_);
  conversion_->setCompletionCallback([this](const JobReport& report) {
    if (!report.error.empty()) recordError(report.error.kind, report.error.message);
  });
}

SessionController::~SessionController() {
  if (state_.load() != SessionState::Idle) stop();
  if (loop_thread_.joinable()) loop_thread_.join();
}

void SessionController::recordError(ErrorKind kind, const std::string& message) {
  std::lock_guard<std::mutex> lk(error_mu_);
  last_error_ = ErrorInfo{kind, message, WallClock::now()};
}

TransitionResult SessionController::fail(ErrorKind kind, std::string message) const {
  TransitionResult r;
  r.ok = false;
  r.error = kind;
  r.message = std::move(message);
  r.state = state_.load();
  return r;
}

TransitionResult SessionController::start(const SessionOptions& opts) {
  std::lock_guard<std::mutex> lk(transition_mu_);
  SessionState cur = state_.load();
  if (!is_valid_transition(cur, SessionState::Streaming)) {
    spdlog::warn("start() rejected: session is {}", to_string(cur));
    return fail(ErrorKind::InvalidTransition,
                fmt::format("AlreadyActive: session is {}", to_string(cur)));
  }
  // A loop that ended itself on device failure is reaped here.
  if (loop_thread_.joinable()) loop_thread_.join();

  auto source = source_factory_();
  if (!source || !source->open()) {
    std::string what = source ? source->describe() : std::string("no frame source");
    camera_ok_ = false;
    recordError(ErrorKind::DeviceFailure, "camera unavailable: " + what);
    spdlog::error("Cannot start session: camera unavailable ({})", what);
    return fail(ErrorKind::DeviceFailure, "camera unavailable: " + what);
  }
  camera_ok_ = true;

  std::unique_ptr<PoseEstimator> estimator = estimator_factory_ ? estimator_factory_() : nullptr;
  if (!estimator) spdlog::warn("No pose model available, frames will be forwarded raw");

  const int requested = opts.exercise_id.value_or(cfg_.inference.exercise_id);
  auto annotator = createAnnotator(requested, cfg_.inference.keypoint_threshold);
  const int active_exercise = annotator->exerciseId();

  {
    std::lock_guard<std::mutex> g(stats_mu_);
    inference_ = std::make_unique<InferenceStage>(std::move(estimator), std::move(annotator),
                                                  delivery_, metrics_,
                                                  cfg_.inference.enable_overlay);
    exercise_id_ = active_exercise;
    const ExerciseDefinition* def = find_exercise(active_exercise);
    exercise_name_ = def ? def->name : std::string();
    session_started_ = Clock::now();
  }
  inference_->setOutputCallback([this](const AnnotatedFrame& frame, const OverlayContext& ctx) {
    if (ctx.recording && frame.sequence >= recording_first_seq_.load())
      annotated_recording_.append(frame);
  });
  inference_->start();
  source_ = std::move(source);
  // The previous session's last frame must not be served as this one's.
  delivery_.reset();
  session_frames_ = 0;
  fps_ = 0.0;
  metrics_.set_fps(0.0);

  running_ = true;
  state_ = SessionState::Streaming;
  loop_thread_ = std::thread(&SessionController::captureLoop, this);

  spdlog::info("Session started on {} (exercise {})", source_->describe(),
               active_exercise != 0 ? exercise_name_ : std::string("none"));
  TransitionResult r;
  r.ok = true;
  r.state = SessionState::Streaming;
  r.message = "streaming started";
  return r;
}

TransitionResult SessionController::startRecording(const std::string& path) {
  std::lock_guard<std::mutex> lk(transition_mu_);
  SessionState cur = state_.load();
  if (!is_valid_transition(cur, SessionState::Recording)) {
    spdlog::warn("startRecording() rejected: session is {}", to_string(cur));
    return fail(ErrorKind::InvalidTransition,
                fmt::format("NotStreaming: session is {}", to_string(cur)));
  }

  const RecordingSource source = cfg_.recording.source;
  RecordingManager& primary =
      source == RecordingSource::Annotated ? annotated_recording_ : recording_;
  std::string err;
  if (!primary.start(path, &err)) {
    recordError(ErrorKind::RecordingWriteFailure, err);
    return fail(ErrorKind::RecordingWriteFailure, err);
  }
  if (source == RecordingSource::Both) {
    auto raw = recording_.snapshot();
    if (!raw || !annotated_recording_.start(annotated_recording_path(raw->path), &err)) {
      recording_.finalize();
      recordError(ErrorKind::RecordingWriteFailure, err);
      return fail(ErrorKind::RecordingWriteFailure, err);
    }
  }
  recording_first_seq_ = next_sequence_.load();

  SessionState expected = SessionState::Streaming;
  if (!state_.compare_exchange_strong(expected, SessionState::Recording)) {
    // The capture loop aborted in between; nothing was recorded.
    recording_.finalize();
    annotated_recording_.finalize();
    return fail(ErrorKind::InvalidTransition,
                fmt::format("NotStreaming: session is {}", to_string(expected)));
  }

  auto job = primary.snapshot();
  TransitionResult r;
  r.ok = true;
  r.state = SessionState::Recording;
  r.message = job ? fmt::format("recording {} frames to {}", to_string(source), job->path)
                  : "recording started";
  if (source == RecordingSource::Both) {
    if (auto annotated = annotated_recording_.snapshot()) r.message += " and " + annotated->path;
  }
  return r;
}

TransitionResult SessionController::finishRecording() {
  TransitionResult r;
  r.ok = true;
  r.state = state_.load();
  std::optional<RecordingJob> jobs[] = {recording_.finalize(), annotated_recording_.finalize()};
  if (!jobs[0] && !jobs[1]) {
    r.message = "no active recording";
    return r;
  }

  for (const auto& job : jobs) {
    if (!job) continue;
    if (job->write_error) {
      recordError(ErrorKind::RecordingWriteFailure, job->error_message);
      r.error = ErrorKind::RecordingWriteFailure;
    }
    const uint64_t id = conversion_->dispatch(*job);
    if (r.job_id == 0) r.job_id = id;
    if (!r.message.empty()) r.message += "; ";
    r.message += fmt::format("recording saved: {} ({} frames); conversion job #{} queued",
                             job->path, job->frames_written, id);
    if (job->write_error) r.message += "; write errors: " + job->error_message;
  }
  return r;
}

void SessionController::endExerciseSession() {
  std::lock_guard<std::mutex> g(stats_mu_);
  if (!inference_) return;
  if (auto summary = inference_->endExerciseSession()) {
    spdlog::info("Session summary: {} exercise(s) attempted, average form score {:.1f}",
                 summary->exercises_attempted, summary->average_form_score);
  }
}

std::optional<ExerciseSessionSummary> SessionController::exerciseSummary() const {
  std::lock_guard<std::mutex> g(stats_mu_);
  return inference_ ? inference_->exerciseSummary() : std::nullopt;
}

TransitionResult SessionController::stopRecording() {
  std::lock_guard<std::mutex> lk(transition_mu_);
  SessionState expected = SessionState::Recording;
  if (!state_.compare_exchange_strong(expected, SessionState::Streaming)) {
    spdlog::warn("stopRecording() rejected: session is {}", to_string(expected));
    return fail(ErrorKind::InvalidTransition,
                fmt::format("NotRecording: session is {}", to_string(expected)));
  }
  return finishRecording();
}

TransitionResult SessionController::stop() {
  std::lock_guard<std::mutex> lk(transition_mu_);
  SessionState cur = state_.load();
  if (cur != SessionState::Recording && !is_valid_transition(cur, SessionState::Stopping)) {
    spdlog::debug("stop() ignored: session is {}", to_string(cur));
    return fail(ErrorKind::InvalidTransition,
                fmt::format("NotActive: session is {}", to_string(cur)));
  }

  TransitionResult r;
  r.ok = true;
  if (cur == SessionState::Recording) {
    SessionState expected = SessionState::Recording;
    if (state_.compare_exchange_strong(expected, SessionState::Streaming)) {
      r = finishRecording();
    }
  }

  SessionState expected = SessionState::Streaming;
  if (!state_.compare_exchange_strong(expected, SessionState::Stopping)) {
    // The capture loop aborted concurrently and drives the session to Idle itself.
    if (loop_thread_.joinable()) loop_thread_.join();
    return fail(ErrorKind::InvalidTransition, "NotActive: session ended on device failure");
  }

  running_ = false;
  if (source_) source_->interrupt();
  if (loop_thread_.joinable()) loop_thread_.join();
  if (inference_) inference_->stop();
  if (source_) source_->close();
  endExerciseSession();

  state_ = SessionState::Idle;
  spdlog::info("Session stopped after {} frames", session_frames_.load());

  r.ok = true;
  r.state = SessionState::Idle;
  r.message = r.job_id != 0 ? "session stopped; " + r.message : "session stopped";
  return r;
}

void SessionController::abortOnDeviceFailure(int failures) {
  SessionState cur = state_.load();
  while (cur == SessionState::Streaming || cur == SessionState::Recording) {
    if (state_.compare_exchange_weak(cur, SessionState::Stopping)) break;
  }
  // stop() already owns the teardown.
  if (cur != SessionState::Streaming && cur != SessionState::Recording) return;

  const std::string message =
      fmt::format("camera read failed {} times in a row ({})", failures, source_->describe());
  spdlog::error("Aborting session: {}", message);
  running_ = false;
  camera_ok_ = false;

  if (cur == SessionState::Recording) {
    for (auto job : {recording_.finalize(), annotated_recording_.finalize()}) {
      if (job) conversion_->dispatch(*job);
    }
  }
  inference_->stop();
  source_->close();
  endExerciseSession();
  recordError(ErrorKind::DeviceFailure, message);
  state_ = SessionState::Idle;
}

void SessionController::captureLoop() {
  const double period_ms = 1000.0 / static_cast<double>(std::max(1, cfg_.camera.fps));
  const int max_failures = std::max(1, cfg_.camera.max_consecutive_failures);
  const auto summary_every = seconds(std::max(1, cfg_.logging.summary_interval_sec));

  int consecutive_failures = 0;
  int frames_in_window = 0;
  auto window_start = Clock::now();
  auto last_summary = window_start;

  while (running_) {
    auto t0 = Clock::now();
    cv::Mat image;
    bool ok = source_->read(image) && !image.empty();
    if (!running_) break;

    if (!ok) {
      ++consecutive_failures;
      spdlog::warn("Camera read failed ({}/{})", consecutive_failures, max_failures);
      if (consecutive_failures >= max_failures) {
        abortOnDeviceFailure(consecutive_failures);
        return;
      }
      std::this_thread::sleep_for(milliseconds(static_cast<int>(period_ms)));
      continue;
    }
    consecutive_failures = 0;

    Frame frame;
    frame.sequence = next_sequence_.fetch_add(1);
    frame.t_capture = t0;
    frame.wall_capture = WallClock::now();
    frame.image = image;
    metrics_.add_capture(duration<double, std::milli>(Clock::now() - t0).count());
    metrics_.inc_captured();
    session_frames_.fetch_add(1);

    const bool recording = state_.load() == SessionState::Recording;
    if (recording) recording_.append(frame);

    OverlayContext ctx{frame.sequence, fps_.load(), recording};
    inference_->submit(std::move(frame), ctx);

    frames_in_window++;
    auto now = Clock::now();
    double win_secs = duration<double>(now - window_start).count();
    if (win_secs >= 1.0) {
      fps_ = frames_in_window / win_secs;
      metrics_.set_fps(fps_.load());
      frames_in_window = 0;
      window_start = now;
    }
    if (now - last_summary >= summary_every) {
      spdlog::info("Capture: {} frames, {:.1f} fps, inference dropped {} failed {}",
                   session_frames_.load(), fps_.load(), inference_->dropped(),
                   inference_->failures());
      last_summary = now;
    }

    double elapsed = duration<double, std::milli>(Clock::now() - t0).count();
    double to_sleep = period_ms - elapsed;
    if (to_sleep > 0) std::this_thread::sleep_for(milliseconds(static_cast<int>(to_sleep)));
  }
}

SessionStatus SessionController::status() const {
  SessionStatus s;
  s.state = state_.load();
  s.capture_fps = fps_.load();
  s.frames_captured = session_frames_.load();
  s.latest_sequence = delivery_.latest_sequence();
  s.camera_available = camera_ok_.load();

  {
    std::lock_guard<std::mutex> lk(stats_mu_);
    if (inference_) {
      s.frames_dropped = inference_->dropped();
      s.inference_failures = inference_->failures();
      s.persons_detected = inference_->lastPersonCount();
      s.model_available = inference_->modelAvailable();
      s.exercise_phase = inference_->exercisePhase();
    }
    if (inference_) s.exercise_summary = inference_->exerciseSummary();
    s.exercise_id = exercise_id_;
    s.exercise_name = exercise_name_;
    s.exercise_tracking = exercise_id_ != 0;
    if (s.state != SessionState::Idle)
      s.session_uptime_sec = duration<double>(Clock::now() - session_started_).count();
  }

  auto job = recording_.snapshot();
  auto annotated = annotated_recording_.snapshot();
  if (!job) {
    job = annotated;
    annotated.reset();
  }
  if (job) {
    RecordingSummary rec;
    rec.id = job->id;
    rec.path = job->path;
    rec.frames_written = job->frames_written;
    rec.elapsed_sec = duration<double>(WallClock::now() - job->started_at).count();
    rec.write_error = job->write_error;
    rec.error_message = job->error_message;
    if (annotated) {
      rec.annotated_path = annotated->path;
      rec.annotated_frames = annotated->frames_written;
    }
    s.recording = rec;
  }

  s.jobs_in_flight = conversion_->inFlight();
  s.last_job = conversion_->lastReport();
  {
    std::lock_guard<std::mutex> lk(error_mu_);
    s.last_error = last_error_;
  }
  return s;
}

TransitionResult SessionController::exportRecording(const std::string& path) {
  std::error_code ec;
  if (path.empty() || !std::filesystem::is_regular_file(path, ec)) {
    spdlog::warn("Export rejected, no such recording: {}", path);
    return fail(ErrorKind::ConversionFailure, "recording not found: " + path);
  }
  TransitionResult r;
  r.ok = true;
  r.state = state_.load();
  r.job_id = conversion_->dispatchPath(path);
  r.message = fmt::format("conversion job #{} queued for {}", r.job_id, path);
  return r;
}

std::vector<RecordingInfo> SessionController::listRecordings() const {
  return list_recordings(cfg_.recording.directory, cfg_.conversion.output_suffix);
}
