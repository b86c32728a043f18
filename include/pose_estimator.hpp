#pragma once

#include <memory>
#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/dnn.hpp>

#include "types.hpp"

struct InferenceConfig {
  std::string model_path = "models/yolov8n-pose.onnx";
  float confidence_threshold = 0.5f;
  float nms_threshold = 0.45f;
  float keypoint_threshold = 0.5f;
  cv::Size input_size{640, 640};
  int max_persons = 5;
  bool enable_overlay = true;
  bool symmetry_correction = true;
  int exercise_id = 0;  // 0 = basic overlay only
};

// Opaque pose-estimation capability. Implementations throw std::exception on
// failure and keep no state the caller relies on between calls.
class PoseEstimator {
public:
  virtual ~PoseEstimator() = default;
  virtual std::vector<PersonPose> estimate(const cv::Mat& bgr) = 0;
  virtual std::string name() const = 0;
};

// YOLOv8-pose ONNX model run through OpenCV DNN.
// Output layout: [1, 56, N] = 4 box + 1 score + 17 * (x, y, conf).
class YoloPoseEstimator : public PoseEstimator {
public:
  explicit YoloPoseEstimator(const InferenceConfig& config);

  bool initialize();
  std::vector<PersonPose> estimate(const cv::Mat& bgr) override;
  std::string name() const override { return "yolo-pose"; }

private:
  InferenceConfig config_;
  cv::dnn::Net net_;
  bool ready_{false};

  std::vector<PersonPose> postprocess(const cv::Mat& output, const cv::Size& original_size) const;
};

// Mirrors a weak left/right limb point across the shoulder midline when its
// partner is confident. No-op unless both shoulders are confident.
void apply_symmetry_correction(PersonPose& pose, float threshold = 0.5f);

// Returns nullptr when the model cannot be loaded; callers degrade to raw frames.
std::unique_ptr<PoseEstimator> createPoseEstimator(const InferenceConfig& config);
