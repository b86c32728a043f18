#include "pose_estimator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <stdexcept>

#include <opencv2/imgproc.hpp>

namespace {
constexpr int kBoxFields = 5;  // cx, cy, w, h, score
constexpr int kKeypointFields = 3;

// Limb pairs eligible for mirroring, left index first.
const std::pair<int, int> kSymmetricPairs[] = {
    {kLeftWrist, kRightWrist},
    {kLeftElbow, kRightElbow},
    {kLeftKnee, kRightKnee},
    {kLeftAnkle, kRightAnkle},
};
}  // namespace

YoloPoseEstimator::YoloPoseEstimator(const InferenceConfig& config) : config_(config) {}

bool YoloPoseEstimator::initialize() {
  if (!std::filesystem::exists(config_.model_path)) {
    spdlog::warn("Pose model not found: {}", config_.model_path);
    return false;
  }
  try {
    net_ = cv::dnn::readNetFromONNX(config_.model_path);
  } catch (const cv::Exception& e) {
    spdlog::error("Failed to load pose model {}: {}", config_.model_path, e.what());
    return false;
  }
  if (net_.empty()) {
    spdlog::error("Pose model {} loaded as an empty network", config_.model_path);
    return false;
  }
  net_.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
  net_.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);
  ready_ = true;
  spdlog::info("Pose model loaded: {} (input {}x{})", config_.model_path,
               config_.input_size.width, config_.input_size.height);
  return true;
}

std::vector<PersonPose> YoloPoseEstimator::estimate(const cv::Mat& bgr) {
  if (!ready_) throw std::runtime_error("pose model not initialized");
  if (bgr.empty()) throw std::invalid_argument("empty frame");

  cv::Mat blob;
  cv::dnn::blobFromImage(bgr, blob, 1.0 / 255.0, config_.input_size, cv::Scalar(), true, false);
  net_.setInput(blob);
  cv::Mat output = net_.forward();
  return postprocess(output, bgr.size());
}

std::vector<PersonPose> YoloPoseEstimator::postprocess(const cv::Mat& output,
                                                       const cv::Size& original_size) const {
  const int expected_fields = kBoxFields + kKeypointCount * kKeypointFields;
  if (output.dims != 3 || output.size[1] != expected_fields) {
    throw std::runtime_error("unexpected pose model output shape");
  }
  const int candidates = output.size[2];
  // [56, N] -> [N, 56] so each row is one candidate
  cv::Mat rows = cv::Mat(expected_fields, candidates, CV_32F, const_cast<float*>(output.ptr<float>()))
                     .t();

  const float scale_x =
      static_cast<float>(original_size.width) / static_cast<float>(config_.input_size.width);
  const float scale_y =
      static_cast<float>(original_size.height) / static_cast<float>(config_.input_size.height);

  std::vector<cv::Rect> boxes;
  std::vector<float> scores;
  std::vector<int> row_index;

  for (int i = 0; i < candidates; ++i) {
    const float* r = rows.ptr<float>(i);
    float score = r[4];
    if (score < config_.confidence_threshold) continue;

    float x = (r[0] - r[2] / 2.0f) * scale_x;
    float y = (r[1] - r[3] / 2.0f) * scale_y;
    float w = r[2] * scale_x;
    float h = r[3] * scale_y;
    cv::Rect box(static_cast<int>(x), static_cast<int>(y), static_cast<int>(w),
                 static_cast<int>(h));
    box &= cv::Rect(0, 0, original_size.width, original_size.height);
    if (box.area() <= 0) continue;

    boxes.push_back(box);
    scores.push_back(score);
    row_index.push_back(i);
  }

  std::vector<int> keep;
  cv::dnn::NMSBoxes(boxes, scores, config_.confidence_threshold, config_.nms_threshold, keep);

  std::vector<PersonPose> persons;
  for (int idx : keep) {
    if (static_cast<int>(persons.size()) >= config_.max_persons) break;
    const float* r = rows.ptr<float>(row_index[idx]);

    PersonPose person;
    person.person_id = static_cast<int>(persons.size());
    person.score = scores[idx];
    person.bbox = boxes[idx];
    person.keypoints.reserve(kKeypointCount);
    for (int k = 0; k < kKeypointCount; ++k) {
      const float* kp = r + kBoxFields + k * kKeypointFields;
      Keypoint p;
      p.name = keypoint_name(k);
      p.x = kp[0] * scale_x;
      p.y = kp[1] * scale_y;
      p.confidence = kp[2];
      person.keypoints.push_back(std::move(p));
    }
    if (config_.symmetry_correction) apply_symmetry_correction(person, config_.keypoint_threshold);
    persons.push_back(std::move(person));
  }
  return persons;
}

void apply_symmetry_correction(PersonPose& pose, float threshold) {
  auto& kps = pose.keypoints;
  if (kps.size() < static_cast<size_t>(kKeypointCount)) return;
  if (kps[kLeftShoulder].confidence <= threshold || kps[kRightShoulder].confidence <= threshold) {
    return;
  }
  const float x_sym = (kps[kLeftShoulder].x + kps[kRightShoulder].x) / 2.0f;

  for (const auto& [left, right] : kSymmetricPairs) {
    Keypoint& l = kps[left];
    Keypoint& r = kps[right];
    const float c_l = l.confidence;
    const float c_r = r.confidence;
    const float total = c_l + c_r;

    if (c_l > threshold && c_r < threshold) {
      float alpha = total > 0.0f ? c_r / total : 0.0f;
      r.x = alpha * r.x + (1.0f - alpha) * (2.0f * x_sym - l.x);
      r.y = alpha * r.y + (1.0f - alpha) * l.y;
    } else if (c_r > threshold && c_l < threshold) {
      float alpha = total > 0.0f ? c_l / total : 0.0f;
      l.x = alpha * l.x + (1.0f - alpha) * (2.0f * x_sym - r.x);
      l.y = alpha * l.y + (1.0f - alpha) * r.y;
    }
  }
}

std::unique_ptr<PoseEstimator> createPoseEstimator(const InferenceConfig& config) {
  auto estimator = std::make_unique<YoloPoseEstimator>(config);
  if (!estimator->initialize()) {
    spdlog::warn("Pose estimation unavailable, frames will be forwarded without overlay");
    return nullptr;
  }
  return estimator;
}
