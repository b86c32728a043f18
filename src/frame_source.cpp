#include "frame_source.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace {
bool is_device_index(const std::string& uri) {
  return !uri.empty() &&
         std::all_of(uri.begin(), uri.end(), [](unsigned char c) { return std::isdigit(c); });
}
}  // namespace

CameraFrameSource::CameraFrameSource(CameraConfig cfg) : cfg_(std::move(cfg)) {}

CameraFrameSource::~CameraFrameSource() { close(); }

bool CameraFrameSource::open() {
  if (cap_.isOpened()) return true;
  bool ok = is_device_index(cfg_.uri) ? cap_.open(std::stoi(cfg_.uri)) : cap_.open(cfg_.uri);
  if (!ok) {
    spdlog::error("Cannot open camera '{}'", cfg_.uri);
    return false;
  }
  cap_.set(cv::CAP_PROP_FRAME_WIDTH, cfg_.width);
  cap_.set(cv::CAP_PROP_FRAME_HEIGHT, cfg_.height);
  cap_.set(cv::CAP_PROP_FPS, cfg_.fps);
  // Keep the driver queue short so reads return the freshest frame.
  cap_.set(cv::CAP_PROP_BUFFERSIZE, 1);

  spdlog::info("Camera '{}' opened ({}x{} @ ~{} fps requested, {}x{} reported)", cfg_.uri,
               cfg_.width, cfg_.height, cfg_.fps,
               static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_WIDTH)),
               static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_HEIGHT)));
  return true;
}

bool CameraFrameSource::read(cv::Mat& out) {
  if (!cap_.isOpened()) return false;
  if (!cap_.read(out)) return false;
  return !out.empty();
}

void CameraFrameSource::close() {
  if (cap_.isOpened()) {
    cap_.release();
    spdlog::info("Camera '{}' released", cfg_.uri);
  }
}

std::string CameraFrameSource::describe() const { return "camera:" + cfg_.uri; }

std::unique_ptr<FrameSource> createFrameSource(const CameraConfig& cfg) {
  return std::make_unique<CameraFrameSource>(cfg);
}
