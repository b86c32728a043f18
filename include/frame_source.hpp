#pragma once
#include <functional>
#include <memory>
#include <string>

#include <opencv2/videoio.hpp>

struct CameraConfig {
  std::string uri{"0"};  // device index or file/stream URI
  int width{640};
  int height{480};
  int fps{30};
  int max_consecutive_failures{3};
};

// Owns the physical camera. Not reentrant: only the capture loop calls read().
class FrameSource {
public:
  virtual ~FrameSource() = default;

  virtual bool open() = 0;
  // Blocks for at most about one frame interval. Returns false on read failure.
  virtual bool read(cv::Mat& out) = 0;
  virtual void close() = 0;
  // Unblocks a pending read() so the capture loop can observe a stop request.
  virtual void interrupt() {}
  virtual std::string describe() const = 0;
};

class CameraFrameSource : public FrameSource {
public:
  explicit CameraFrameSource(CameraConfig cfg);
  ~CameraFrameSource() override;

  bool open() override;
  bool read(cv::Mat& out) override;
  void close() override;
  std::string describe() const override;

private:
  CameraConfig cfg_;
  cv::VideoCapture cap_;
};

using FrameSourceFactory = std::function<std::unique_ptr<FrameSource>()>;

std::unique_ptr<FrameSource> createFrameSource(const CameraConfig& cfg);
