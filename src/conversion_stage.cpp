#include "conversion_stage.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;
using namespace std::chrono;

const char* to_string(ConversionMethod m) {
  switch (m) {
    case ConversionMethod::Default:
      return "default";
    case ConversionMethod::Duplicate:
      return "duplicate";
    case ConversionMethod::Blend:
      return "blend";
  }
  return "default";
}

ConversionMethod parse_conversion_method(const std::string& name) {
  if (name == "default") return ConversionMethod::Default;
  if (name == "duplicate") return ConversionMethod::Duplicate;
  if (name == "blend") return ConversionMethod::Blend;
  throw std::runtime_error("unknown conversion method: " + name);
}

const char* to_string(JobState s) {
  switch (s) {
    case JobState::Pending:
      return "pending";
    case JobState::Converting:
      return "converting";
    case JobState::Uploading:
      return "uploading";
    case JobState::Succeeded:
      return "succeeded";
    case JobState::Failed:
      return "failed";
  }
  return "unknown";
}

std::vector<std::string> build_encoder_args(const ConversionConfig& cfg, const std::string& input,
                                            const std::string& output) {
  std::vector<std::string> args{cfg.encoder,  "-i",       input,        "-c:v",
                                "libx264",    "-profile:v", "baseline", "-level",
                                "3.0",        "-pix_fmt", "yuv420p",    "-movflags",
                                "+faststart", "-preset",  "ultrafast",  "-crf",
                                "28"};
  const std::string fps = std::to_string(cfg.target_fps);
  switch (cfg.method) {
    case ConversionMethod::Blend:
      args.insert(args.end(), {"-vf", "minterpolate=fps=" + fps + ":mi_mode=blend"});
      break;
    case ConversionMethod::Duplicate:
    case ConversionMethod::Default:
      args.insert(args.end(), {"-r", fps});
      break;
  }
  args.insert(args.end(), {"-y", output});
  return args;
}

seconds compute_timeout(const ConversionConfig& cfg, uintmax_t input_bytes) {
  double mb = static_cast<double>(input_bytes) / (1024.0 * 1024.0);
  double t = cfg.timeout_sec + cfg.timeout_per_mb_sec * mb;
  t = std::clamp(t, static_cast<double>(cfg.timeout_sec),
                 static_cast<double>(std::max(cfg.timeout_sec, cfg.max_timeout_sec)));
  return seconds(static_cast<long long>(t));
}

std::string converted_path_for(const std::string& input, const std::string& suffix) {
  fs::path p(input);
  return (p.parent_path() / (p.stem().string() + suffix + ".mp4")).string();
}

ConversionUploadStage::ConversionUploadStage(ConversionConfig config,
                                             std::shared_ptr<EncoderRunner> runner,
                                             std::shared_ptr<ArtifactStore> store,
                                             MetricsRegistry& metrics)
    : config_(std::move(config)),
      runner_(std::move(runner)),
      store_(std::move(store)),
      metrics_(metrics) {
  if (!runner_) runner_ = std::make_shared<SubprocessRunner>();
}

ConversionUploadStage::~ConversionUploadStage() {
  std::list<Worker> workers;
  {
    std::lock_guard<std::mutex> lk(mu_);
    workers.swap(workers_);
  }
  if (!workers.empty()) {
    spdlog::info("Waiting for {} conversion job(s) to finish", in_flight_.load());
  }
  for (auto& w : workers) {
    if (w.thread.joinable()) w.thread.join();
  }
}

void ConversionUploadStage::setCompletionCallback(CompletionCallback cb) {
  std::lock_guard<std::mutex> lk(mu_);
  on_complete_ = std::move(cb);
}

uint64_t ConversionUploadStage::dispatch(const RecordingJob& job) {
  JobReport report;
  report.recording_path = job.path;
  report.frames_written = job.frames_written;
  report.recording_write_error = job.write_error;
  return enqueue(std::move(report));
}

uint64_t ConversionUploadStage::dispatchPath(const std::string& path) {
  JobReport report;
  report.recording_path = path;
  return enqueue(std::move(report));
}

uint64_t ConversionUploadStage::enqueue(JobReport report) {
  std::lock_guard<std::mutex> lk(mu_);
  reapFinished();
  report.id = next_id_++;
  report.state = JobState::Pending;
  report.queued_at = WallClock::now();
  history_.push_back(report);
  while (history_.size() > kHistoryLimit) history_.pop_front();

  in_flight_.fetch_add(1);
  auto done = std::make_shared<std::atomic<bool>>(false);
  workers_.push_back(Worker{std::thread([this, report, done]() mutable {
                              runJob(std::move(report));
                              done->store(true);
                            }),
                            done});
  spdlog::info("Conversion job #{} queued for {} ({} fps, {})", report.id, report.recording_path,
               config_.target_fps, to_string(config_.method));
  return report.id;
}

void ConversionUploadStage::reapFinished() {
  for (auto it = workers_.begin(); it != workers_.end();) {
    if (it->done->load()) {
      it->thread.join();
      it = workers_.erase(it);
    } else {
      ++it;
    }
  }
}

void ConversionUploadStage::update(const JobReport& report) {
  std::lock_guard<std::mutex> lk(mu_);
  for (auto& r : history_) {
    if (r.id == report.id) {
      r = report;
      return;
    }
  }
}

ConversionResult ConversionUploadStage::convert(const std::string& input_path) const {
  ConversionResult result;
  result.input_path = input_path;
  result.output_path = converted_path_for(input_path, config_.output_suffix);

  std::error_code ec;
  if (!fs::is_regular_file(input_path, ec)) {
    result.error = ErrorKind::ConversionFailure;
    result.reason = "input file not found: " + input_path;
    spdlog::error("Conversion skipped: {}", result.reason);
    return result;
  }
  result.input_size = fs::file_size(input_path, ec);

  const std::string log_path = result.output_path + ".log";
  const auto timeout = compute_timeout(config_, result.input_size);
  auto args = build_encoder_args(config_, input_path, result.output_path);

  spdlog::info("Converting {} ({:.1f} MB) -> {} [{} @ {} fps, timeout {}s]", input_path,
               static_cast<double>(result.input_size) / (1024.0 * 1024.0), result.output_path,
               to_string(config_.method), config_.target_fps, timeout.count());

  auto t0 = steady_clock::now();
  ProcessOutcome outcome = runner_->run(args, timeout, log_path);
  result.elapsed_sec = duration<double>(steady_clock::now() - t0).count();

  switch (outcome.kind) {
    case ProcessOutcome::Kind::ToolMissing:
      result.error = ErrorKind::ToolMissing;
      result.reason = outcome.message;
      break;
    case ProcessOutcome::Kind::TimedOut:
      result.error = ErrorKind::ConversionTimeout;
      result.reason = outcome.message;
      break;
    case ProcessOutcome::Kind::SpawnFailed:
      result.error = ErrorKind::ConversionFailure;
      result.reason = outcome.message;
      break;
    case ProcessOutcome::Kind::Exited:
      if (outcome.exit_code != 0) {
        result.error = ErrorKind::ConversionFailure;
        std::string tail = read_tail(log_path, 512);
        result.reason = fmt::format("encoder exited with code {}{}{}", outcome.exit_code,
                                    tail.empty() ? "" : ": ", tail);
      }
      break;
  }

  if (result.error == ErrorKind::None) {
    if (!fs::is_regular_file(result.output_path, ec)) {
      result.error = ErrorKind::ConversionFailure;
      result.reason = "encoder reported success but produced no output";
    } else {
      result.output_size = fs::file_size(result.output_path, ec);
      if (result.output_size < config_.min_output_bytes) {
        result.error = ErrorKind::ConversionFailure;
        result.reason = fmt::format("output too small ({} bytes)", result.output_size);
      }
    }
  }

  if (result.error != ErrorKind::None) {
    // Partial output and the encoder log stay on disk for inspection.
    spdlog::error("Conversion of {} failed [{}] after {:.1f}s: {}", input_path,
                  to_string(result.error), result.elapsed_sec, result.reason);
    return result;
  }

  result.success = true;
  result.compression_ratio = result.output_size > 0 ? static_cast<double>(result.input_size) /
                                                          static_cast<double>(result.output_size)
                                                    : 0.0;
  fs::remove(log_path, ec);
  spdlog::info("Conversion done in {:.1f}s: {} ({} -> {} bytes, ratio {:.2f})", result.elapsed_sec,
               result.output_path, result.input_size, result.output_size,
               result.compression_ratio);
  return result;
}

void ConversionUploadStage::runJob(JobReport report) {
  report.state = JobState::Converting;
  update(report);

  report.conversion = convert(report.recording_path);
  metrics_.inc_conversion(report.conversion.success);

  if (!report.conversion.success) {
    report.state = JobState::Failed;
    report.error = ErrorInfo{report.conversion.error, report.conversion.reason, WallClock::now()};
  } else if (!store_) {
    report.state = JobState::Succeeded;
  } else {
    report.state = JobState::Uploading;
    update(report);
    try {
      report.artifact_id = store_->store(report.conversion.output_path);
      report.url = store_->fetchUrl(report.artifact_id);
      report.state = JobState::Succeeded;
      spdlog::info("Job #{} uploaded: {}", report.id, report.url);
    } catch (const std::exception& e) {
      metrics_.inc_upload_failure();
      report.state = JobState::Failed;
      report.error = ErrorInfo{ErrorKind::UploadFailure, e.what(), WallClock::now()};
      spdlog::error("Job #{} upload failed: {}", report.id, e.what());
    }
  }
  report.finished_at = WallClock::now();

  CompletionCallback cb;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (auto& r : history_) {
      if (r.id == report.id) r = report;
    }
    last_ = report;
    cb = on_complete_;
  }
  if (cb) cb(report);

  {
    std::lock_guard<std::mutex> lk(mu_);
    in_flight_.fetch_sub(1);
  }
  idle_cv_.notify_all();
}

std::optional<JobReport> ConversionUploadStage::lastReport() const {
  std::lock_guard<std::mutex> lk(mu_);
  return last_;
}

std::optional<JobReport> ConversionUploadStage::report(uint64_t id) const {
  std::lock_guard<std::mutex> lk(mu_);
  for (const auto& r : history_) {
    if (r.id == id) return r;
  }
  return std::nullopt;
}

std::vector<JobReport> ConversionUploadStage::history() const {
  std::lock_guard<std::mutex> lk(mu_);
  return {history_.begin(), history_.end()};
}

bool ConversionUploadStage::waitForIdle(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lk(mu_);
  return idle_cv_.wait_for(lk, timeout, [&] { return in_flight_.load() == 0; });
}
