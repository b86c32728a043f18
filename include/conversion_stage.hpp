#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "artifact_store.hpp"
#include "metrics.hpp"
#include "recording_manager.hpp"
#include "subprocess.hpp"
#include "types.hpp"

// duplicate favors speed, blend favors smoothness.
enum class ConversionMethod { Default, Duplicate, Blend };

const char* to_string(ConversionMethod m);
// Throws std::runtime_error for unknown names.
ConversionMethod parse_conversion_method(const std::string& name);

struct ConversionConfig {
  std::string encoder = "ffmpeg";
  int target_fps = 30;
  ConversionMethod method = ConversionMethod::Blend;
  int timeout_sec = 300;
  double timeout_per_mb_sec = 2.0;
  int max_timeout_sec = 1800;
  uintmax_t min_output_bytes = 1024;
  std::string output_suffix = "_web";
};

std::vector<std::string> build_encoder_args(const ConversionConfig& cfg, const std::string& input,
                                            const std::string& output);

// clamp(base + per_mb * MB, base, max)
std::chrono::seconds compute_timeout(const ConversionConfig& cfg, uintmax_t input_bytes);

// <dir>/<stem><suffix>.mp4
std::string converted_path_for(const std::string& input, const std::string& suffix);

struct ConversionResult {
  bool success{false};
  std::string input_path;
  std::string output_path;
  uintmax_t input_size{0};
  uintmax_t output_size{0};
  double compression_ratio{0.0};
  double elapsed_sec{0.0};
  ErrorKind error{ErrorKind::None};
  std::string reason;
};

enum class JobState { Pending, Converting, Uploading, Succeeded, Failed };

const char* to_string(JobState s);

struct JobReport {
  uint64_t id{0};
  std::string recording_path;
  uint64_t frames_written{0};
  bool recording_write_error{false};
  JobState state{JobState::Pending};
  ErrorInfo error;
  ConversionResult conversion;
  std::string artifact_id;
  std::string url;
  WallClock::time_point queued_at{};
  WallClock::time_point finished_at{};

  bool finished() const { return state == JobState::Succeeded || state == JobState::Failed; }
};

// Normalizes the frame rate of finalized recordings with the external encoder,
// then hands the output to the artifact store. One worker thread per job; a
// failed job is reported and never retried here.
class ConversionUploadStage {
public:
  using CompletionCallback = std::function<void(const JobReport&)>;

  static constexpr size_t kHistoryLimit = 20;

  ConversionUploadStage(ConversionConfig config, std::shared_ptr<EncoderRunner> runner,
                        std::shared_ptr<ArtifactStore> store, MetricsRegistry& metrics);
  // Waits for in-flight jobs; each is bounded by its encoder timeout.
  ~ConversionUploadStage();

  ConversionUploadStage(const ConversionUploadStage&) = delete;
  ConversionUploadStage& operator=(const ConversionUploadStage&) = delete;

  void setCompletionCallback(CompletionCallback cb);

  // Returns the job id immediately.
  uint64_t dispatch(const RecordingJob& job);
  uint64_t dispatchPath(const std::string& path);

  // Synchronous conversion without upload.
  ConversionResult convert(const std::string& input_path) const;

  size_t inFlight() const { return in_flight_.load(); }
  std::optional<JobReport> lastReport() const;
  std::optional<JobReport> report(uint64_t id) const;
  std::vector<JobReport> history() const;

  bool waitForIdle(std::chrono::milliseconds timeout);

  const ConversionConfig& config() const { return config_; }

private:
  struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  ConversionConfig config_;
  std::shared_ptr<EncoderRunner> runner_;
  std::shared_ptr<ArtifactStore> store_;
  MetricsRegistry& metrics_;

  mutable std::mutex mu_;
  std::condition_variable idle_cv_;
  std::deque<JobReport> history_;
  std::optional<JobReport> last_;
  std::list<Worker> workers_;
  CompletionCallback on_complete_;
  uint64_t next_id_{1};
  std::atomic<size_t> in_flight_{0};

  uint64_t enqueue(JobReport report);
  void runJob(JobReport report);
  void update(const JobReport& report);
  void reapFinished();
};
