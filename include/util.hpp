#pragma once
#include <string>

#include "artifact_store.hpp"
#include "conversion_stage.hpp"
#include "frame_source.hpp"
#include "pose_estimator.hpp"
#include "recording_manager.hpp"

struct ServerConfig {
  std::string host = "0.0.0.0";
  int port = 5001;
  int jpeg_quality = 80;
  int mobile_jpeg_quality = 50;
};

struct LoggingConfig {
  std::string level = "info";
  int summary_interval_sec = 30;
};

struct AppConfig {
  CameraConfig camera;
  InferenceConfig inference;
  RecordingConfig recording;
  ConversionConfig conversion;
  ExportConfig export_cfg;
  ServerConfig server;
  LoggingConfig logging;
};

// Missing keys keep their defaults. Throws on unreadable YAML or invalid values.
AppConfig load_config(const std::string& path);

// debug | info | warn | error. Returns false for anything else.
bool apply_log_level(const std::string& level);
