#include "recording_manager.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <stdexcept>

#include <opencv2/imgproc.hpp>

namespace fs = std::filesystem;
using namespace std::chrono;

namespace {
// First of path, path_2.mp4, path_3.mp4, ... with neither the video nor its
// sidecar on disk.
std::string unused_path(const std::string& path) {
  std::error_code ec;
  auto taken = [&ec](const fs::path& p) {
    return fs::exists(p, ec) || fs::exists(p.string() + ".frames.csv", ec);
  };
  fs::path candidate(path);
  const fs::path base = candidate.parent_path() / candidate.stem();
  const std::string ext = candidate.extension().string();
  for (int n = 2; taken(candidate); ++n) {
    candidate = base.string() + "_" + std::to_string(n) + ext;
  }
  return candidate.string();
}
}  // namespace

const char* to_string(RecordingSource s) {
  switch (s) {
    case RecordingSource::Raw:
      return "raw";
    case RecordingSource::Annotated:
      return "annotated";
    case RecordingSource::Both:
      return "both";
  }
  return "raw";
}

RecordingSource parse_recording_source(const std::string& name) {
  if (name == "raw") return RecordingSource::Raw;
  if (name == "annotated") return RecordingSource::Annotated;
  if (name == "both") return RecordingSource::Both;
  throw std::runtime_error("unknown recording source: " + name);
}

bool OpenCvVideoSink::open(const std::string& path, const std::string& fourcc, double fps,
                           cv::Size size) {
  if (fourcc.size() != 4) return false;
  int code = cv::VideoWriter::fourcc(fourcc[0], fourcc[1], fourcc[2], fourcc[3]);
  writer_.open(path, code, fps, size);
  size_ = size;
  return writer_.isOpened();
}

bool OpenCvVideoSink::write(const cv::Mat& frame) {
  if (!writer_.isOpened() || frame.empty()) return false;
  if (frame.size() != size_) {
    cv::Mat resized;
    cv::resize(frame, resized, size_);
    writer_.write(resized);
  } else {
    writer_.write(frame);
  }
  return true;
}

void OpenCvVideoSink::release() { writer_.release(); }

RecordingManager::RecordingManager(RecordingConfig config, MetricsRegistry& metrics,
                                   VideoSinkFactory sink_factory)
    : config_(std::move(config)), metrics_(metrics), sink_factory_(std::move(sink_factory)) {
  if (!sink_factory_) sink_factory_ = [] { return std::make_unique<OpenCvVideoSink>(); };
}

RecordingManager::~RecordingManager() {
  if (active()) finalize();
}

bool RecordingManager::start(const std::string& path, std::string* error) {
  std::lock_guard<std::mutex> lk(mu_);
  if (active_) {
    if (error) *error = "recording already active: " + job_.path;
    return false;
  }

  const uint64_t id = next_id_++;
  std::string target = path.empty() ? unused_path(default_recording_path(config_.directory, id))
                                    : path;
  fs::path directory = fs::path(target).parent_path();
  std::error_code ec;
  if (!directory.empty() && !fs::exists(directory, ec)) {
    fs::create_directories(directory, ec);
    if (ec) {
      if (error) *error = fmt::format("cannot create {}: {}", directory.string(), ec.message());
      spdlog::error("Recording directory unavailable: {} ({})", directory.string(), ec.message());
      return false;
    }
    spdlog::info("Created recording directory: {}", directory.string());
  }

  job_ = RecordingJob{};
  job_.id = id;
  job_.path = target;
  job_.started_at = WallClock::now();
  job_.target_fps = config_.fps;
  sink_ = sink_factory_();
  sink_open_ = false;
  open_failed_ = false;
  has_frames_ = false;
  rejected_ = 0;

  if (config_.write_timestamps) {
    timestamps_.open(target + ".frames.csv", std::ios::out | std::ios::trunc);
    if (timestamps_.is_open()) {
      timestamps_ << "sequence,capture_ts_ms,written_ts_ms\n";
    } else {
      spdlog::warn("Cannot open timestamp sidecar for {}", target);
    }
  }

  active_ = true;
  spdlog::info("Recording #{} started: {} @ {:.1f} fps", job_.id, target, config_.fps);
  return true;
}

bool RecordingManager::openSink(const cv::Size& size) {
  std::vector<std::string> codecs;
  for (const std::string& c : {config_.codec, std::string("mp4v"), std::string("XVID"),
                               std::string("MJPG")}) {
    if (std::find(codecs.begin(), codecs.end(), c) == codecs.end()) codecs.push_back(c);
  }
  for (size_t i = 0; i < codecs.size(); ++i) {
    if (sink_->open(job_.path, codecs[i], config_.fps, size)) {
      job_.codec = codecs[i];
      job_.frame_size = size;
      spdlog::info("Video writer open: {} ({}x{}, codec {})", job_.path, size.width,
                   size.height, codecs[i]);
      return true;
    }
    spdlog::warn("Codec {} unavailable for {}", codecs[i], job_.path);
  }
  return false;
}

void RecordingManager::markWriteError(const std::string& message) {
  metrics_.inc_write_failure();
  if (!job_.write_error) {
    spdlog::warn("Recording #{} write failure: {}", job_.id, message);
    job_.error_message = message;
  }
  job_.write_error = true;
}

bool RecordingManager::append(const Frame& frame) {
  std::lock_guard<std::mutex> lk(mu_);
  if (!active_) return false;
  if (has_frames_ && frame.sequence <= job_.last_sequence) {
    ++rejected_;
    spdlog::debug("Recording #{} rejected out-of-order frame {} (last {})", job_.id,
                  frame.sequence, job_.last_sequence);
    return false;
  }

  if (!sink_open_ && !open_failed_) {
    sink_open_ = openSink(frame.image.size());
    if (!sink_open_) {
      open_failed_ = true;
      spdlog::error("No video codec could open {}", job_.path);
    }
  }

  // Order is tracked even for failed writes so later frames stay ordered.
  if (!has_frames_) job_.first_sequence = frame.sequence;
  job_.last_sequence = frame.sequence;
  has_frames_ = true;

  if (!sink_open_) {
    markWriteError("video writer could not be opened");
    return false;
  }
  if (!sink_->write(frame.image)) {
    markWriteError(fmt::format("frame {} not written", frame.sequence));
    return false;
  }
  ++job_.frames_written;

  if (timestamps_.is_open()) {
    auto capture_ms = duration_cast<milliseconds>(frame.wall_capture.time_since_epoch()).count();
    auto written_ms = duration_cast<milliseconds>(WallClock::now().time_since_epoch()).count();
    timestamps_ << frame.sequence << "," << capture_ms << "," << written_ms << "\n";
  }
  return true;
}

bool RecordingManager::append(const AnnotatedFrame& frame) {
  Frame f;
  f.sequence = frame.sequence;
  f.t_capture = frame.t_capture;
  f.wall_capture = frame.wall_capture;
  f.image = frame.image;
  return append(f);
}

std::optional<RecordingJob> RecordingManager::finalize() {
  std::lock_guard<std::mutex> lk(mu_);
  if (!active_) return std::nullopt;

  if (sink_) {
    if (sink_open_) sink_->release();
    sink_.reset();
  }
  if (timestamps_.is_open()) {
    timestamps_.flush();
    timestamps_.close();
  }

  job_.stopped_at = WallClock::now();
  double secs = duration<double>(job_.stopped_at - job_.started_at).count();
  job_.actual_fps = secs > 0.0 ? static_cast<double>(job_.frames_written) / secs : 0.0;
  active_ = false;

  if (job_.write_error) {
    spdlog::warn("Recording #{} finalized with errors: {} frames in {:.1f}s ({})", job_.id,
                 job_.frames_written, secs, job_.error_message);
  } else {
    spdlog::info("Recording #{} finalized: {} ({} frames in {:.1f}s, {:.1f} fps)", job_.id,
                 job_.path, job_.frames_written, secs, job_.actual_fps);
  }
  if (rejected_ > 0) spdlog::warn("Recording #{} rejected {} out-of-order frames", job_.id, rejected_);
  return job_;
}

bool RecordingManager::active() const {
  std::lock_guard<std::mutex> lk(mu_);
  return active_;
}

std::optional<RecordingJob> RecordingManager::snapshot() const {
  std::lock_guard<std::mutex> lk(mu_);
  if (!active_) return std::nullopt;
  return job_;
}

std::string default_recording_path(const std::string& directory, uint64_t job_id,
                                   WallClock::time_point now) {
  return (fs::path(directory) / fmt::format("posecast_{}_{}.mp4",
                                            format_wall_time(now, "%Y%m%d_%H%M%S"), job_id))
      .string();
}

std::string annotated_recording_path(const std::string& path) {
  fs::path p(path);
  return (p.parent_path() / (p.stem().string() + "_annotated" + p.extension().string())).string();
}

std::optional<std::string> resolve_recording_name(const std::string& directory,
                                                  const std::string& name) {
  if (name.empty() || name.front() == '.') return std::nullopt;
  for (char c : {'/', '\\', '\0'}) {
    if (name.find(c) != std::string::npos) return std::nullopt;
  }
  fs::path p(name);
  if (p.has_parent_path() || p.extension() != ".mp4")
    return std::nullopt;
  return (fs::path(directory) / p).string();
}

std::vector<RecordingInfo> list_recordings(const std::string& directory,
                                           const std::string& converted_suffix) {
  std::vector<RecordingInfo> out;
  std::error_code ec;
  if (!fs::is_directory(directory, ec)) return out;

  std::vector<std::pair<fs::file_time_type, RecordingInfo>> found;
  for (const auto& entry : fs::directory_iterator(directory, ec)) {
    if (!entry.is_regular_file(ec) || entry.path().extension() != ".mp4") continue;
    std::string stem = entry.path().stem().string();
    if (stem.size() >= converted_suffix.size() &&
        stem.compare(stem.size() - converted_suffix.size(), converted_suffix.size(),
                     converted_suffix) == 0)
      continue;

    RecordingInfo info;
    info.name = entry.path().filename().string();
    info.path = entry.path().string();
    info.size_bytes = entry.file_size(ec);
    auto mtime = entry.last_write_time(ec);
    auto sys_time = time_point_cast<WallClock::duration>(mtime - fs::file_time_type::clock::now() +
                                                         WallClock::now());
    info.modified = format_wall_time(sys_time);

    fs::path converted = entry.path().parent_path() / (stem + converted_suffix + ".mp4");
    if (fs::exists(converted, ec)) {
      info.converted_path = converted.string();
      info.converted_size = fs::file_size(converted, ec);
    }
    found.emplace_back(mtime, std::move(info));
  }

  std::sort(found.begin(), found.end(),
            [](const auto& a, const auto& b) { return a.first > b.first; });
  for (auto& f : found) out.push_back(std::move(f.second));
  return out;
}
