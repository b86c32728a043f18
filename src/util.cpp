#include "util.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <stdexcept>

AppConfig load_config(const std::string& path) {
  YAML::Node y = YAML::LoadFile(path);
  AppConfig c{};

  if (y["camera"]) {
    auto n = y["camera"];
    if (n["uri"]) c.camera.uri = n["uri"].as<std::string>();
    if (n["width"]) c.camera.width = n["width"].as<int>();
    if (n["height"]) c.camera.height = n["height"].as<int>();
    if (n["fps"]) c.camera.fps = n["fps"].as<int>();
    if (n["max_consecutive_failures"])
      c.camera.max_consecutive_failures = n["max_consecutive_failures"].as<int>();
  }

  if (y["inference"]) {
    auto n = y["inference"];
    if (n["model_path"]) c.inference.model_path = n["model_path"].as<std::string>();
    if (n["confidence_threshold"])
      c.inference.confidence_threshold = n["confidence_threshold"].as<float>();
    if (n["nms_threshold"]) c.inference.nms_threshold = n["nms_threshold"].as<float>();
    if (n["keypoint_threshold"])
      c.inference.keypoint_threshold = n["keypoint_threshold"].as<float>();
    if (n["input_width"] && n["input_height"]) {
      c.inference.input_size = cv::Size(n["input_width"].as<int>(), n["input_height"].as<int>());
    }
    if (n["max_persons"]) c.inference.max_persons = n["max_persons"].as<int>();
    if (n["enable_overlay"]) c.inference.enable_overlay = n["enable_overlay"].as<bool>();
    if (n["symmetry_correction"])
      c.inference.symmetry_correction = n["symmetry_correction"].as<bool>();
    if (n["exercise_id"]) c.inference.exercise_id = n["exercise_id"].as<int>();
  }

  if (y["recording"]) {
    auto n = y["recording"];
    if (n["directory"]) c.recording.directory = n["directory"].as<std::string>();
    if (n["codec"]) c.recording.codec = n["codec"].as<std::string>();
    if (n["fps"]) c.recording.fps = n["fps"].as<double>();
    if (n["write_timestamps"]) c.recording.write_timestamps = n["write_timestamps"].as<bool>();
    if (n["source"]) c.recording.source = parse_recording_source(n["source"].as<std::string>());
    if (c.recording.codec.size() != 4)
      throw std::runtime_error("recording.codec must be a four character code: " +
                               c.recording.codec);
  }

  if (y["conversion"]) {
    auto n = y["conversion"];
    if (n["encoder"]) c.conversion.encoder = n["encoder"].as<std::string>();
    if (n["target_fps"]) c.conversion.target_fps = n["target_fps"].as<int>();
    if (n["method"]) c.conversion.method = parse_conversion_method(n["method"].as<std::string>());
    if (n["timeout_sec"]) c.conversion.timeout_sec = n["timeout_sec"].as<int>();
    if (n["timeout_per_mb_sec"])
      c.conversion.timeout_per_mb_sec = n["timeout_per_mb_sec"].as<double>();
    if (n["max_timeout_sec"]) c.conversion.max_timeout_sec = n["max_timeout_sec"].as<int>();
    if (n["min_output_bytes"])
      c.conversion.min_output_bytes = n["min_output_bytes"].as<uintmax_t>();
    if (n["output_suffix"]) c.conversion.output_suffix = n["output_suffix"].as<std::string>();
    if (c.conversion.target_fps <= 0)
      throw std::runtime_error("conversion.target_fps must be positive");
  }

  if (y["export"]) {
    auto n = y["export"];
    if (n["directory"]) c.export_cfg.directory = n["directory"].as<std::string>();
    if (n["base_url"]) c.export_cfg.base_url = n["base_url"].as<std::string>();
  }

  if (y["server"]) {
    auto n = y["server"];
    if (n["host"]) c.server.host = n["host"].as<std::string>();
    if (n["port"]) c.server.port = n["port"].as<int>();
    if (n["jpeg_quality"]) c.server.jpeg_quality = n["jpeg_quality"].as<int>();
    if (n["mobile_jpeg_quality"])
      c.server.mobile_jpeg_quality = n["mobile_jpeg_quality"].as<int>();
  }

  if (y["logging"]) {
    auto n = y["logging"];
    if (n["level"]) c.logging.level = n["level"].as<std::string>();
    if (n["summary_interval_sec"])
      c.logging.summary_interval_sec = n["summary_interval_sec"].as<int>();
  }

  return c;
}

bool apply_log_level(const std::string& level) {
  if (level == "debug") {
    spdlog::set_level(spdlog::level::debug);
  } else if (level == "info") {
    spdlog::set_level(spdlog::level::info);
  } else if (level == "warn") {
    spdlog::set_level(spdlog::level::warn);
  } else if (level == "error") {
    spdlog::set_level(spdlog::level::err);
  } else {
    return false;
  }
  return true;
}
