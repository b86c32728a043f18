#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <opencv2/videoio.hpp>

#include "metrics.hpp"
#include "types.hpp"

// Which frames a recording keeps: the clean camera frames, the inference
// output with its overlay, or both side by side in two files.
enum class RecordingSource { Raw, Annotated, Both };

const char* to_string(RecordingSource s);
// Throws std::runtime_error for unknown names.
RecordingSource parse_recording_source(const std::string& name);

struct RecordingConfig {
  std::string directory = "recordings";
  std::string codec = "mp4v";  // fourcc, tried before the fallbacks
  double fps = 15.0;           // nominal rate written into the container
  bool write_timestamps = true;  // <path>.frames.csv sidecar
  RecordingSource source = RecordingSource::Raw;
};

// Destination of recorded frames. Owned exclusively by RecordingManager.
class VideoSink {
public:
  virtual ~VideoSink() = default;
  virtual bool open(const std::string& path, const std::string& fourcc, double fps,
                    cv::Size size) = 0;
  virtual bool write(const cv::Mat& frame) = 0;
  virtual void release() = 0;
};

class OpenCvVideoSink : public VideoSink {
public:
  bool open(const std::string& path, const std::string& fourcc, double fps,
            cv::Size size) override;
  bool write(const cv::Mat& frame) override;
  void release() override;

private:
  cv::VideoWriter writer_;
  cv::Size size_;
};

using VideoSinkFactory = std::function<std::unique_ptr<VideoSink>()>;

struct RecordingJob {
  uint64_t id{0};
  std::string path;
  WallClock::time_point started_at{};
  WallClock::time_point stopped_at{};
  double target_fps{0.0};
  double actual_fps{0.0};
  uint64_t frames_written{0};
  uint64_t first_sequence{0};
  uint64_t last_sequence{0};
  std::string codec;
  cv::Size frame_size;
  bool write_error{false};
  std::string error_message;
};

struct RecordingInfo {
  std::string name;
  std::string path;
  uintmax_t size_bytes{0};
  std::string modified;
  std::optional<std::string> converted_path;
  uintmax_t converted_size{0};
};

// Appends frames of the active recording in strict capture order. A write
// failure marks the job and writing continues best-effort.
class RecordingManager {
public:
  RecordingManager(RecordingConfig config, MetricsRegistry& metrics,
                   VideoSinkFactory sink_factory = nullptr);
  ~RecordingManager();

  RecordingManager(const RecordingManager&) = delete;
  RecordingManager& operator=(const RecordingManager&) = delete;

  // Empty path selects default_recording_path(), bumped with a counter while
  // a file of that name is already on disk. False if already active or the
  // directory cannot be created.
  bool start(const std::string& path, std::string* error = nullptr);

  // Frames with a sequence not newer than the last appended one are rejected.
  bool append(const Frame& frame);
  bool append(const AnnotatedFrame& frame);

  std::optional<RecordingJob> finalize();

  bool active() const;
  std::optional<RecordingJob> snapshot() const;

  const RecordingConfig& config() const { return config_; }

private:
  RecordingConfig config_;
  MetricsRegistry& metrics_;
  VideoSinkFactory sink_factory_;

  mutable std::mutex mu_;
  bool active_{false};
  bool sink_open_{false};
  bool open_failed_{false};
  bool has_frames_{false};
  RecordingJob job_;
  std::unique_ptr<VideoSink> sink_;
  std::ofstream timestamps_;
  uint64_t next_id_{1};
  uint64_t rejected_{0};

  bool openSink(const cv::Size& size);
  void markWriteError(const std::string& message);
};

// <directory>/posecast_<YYYYmmdd_HHMMSS>_<job_id>.mp4
std::string default_recording_path(const std::string& directory, uint64_t job_id,
                                   WallClock::time_point now = WallClock::now());

// <stem>_annotated.mp4 beside path, for the overlay copy of a recording.
std::string annotated_recording_path(const std::string& path);

// Maps a client-supplied recording name onto <directory>/<name>. Only bare
// *.mp4 file names are accepted: no directory part, no leading dot.
std::optional<std::string> resolve_recording_name(const std::string& directory,
                                                  const std::string& name);

// Sources (*.mp4 not ending in the converted suffix), newest first, each paired
// with its converted sibling when one exists.
std::vector<RecordingInfo> list_recordings(const std::string& directory,
                                           const std::string& converted_suffix = "_web");
