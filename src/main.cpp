#include <httplib.h>
#include <signal.h>
#include <spdlog/spdlog.h>

#include <CLI/CLI.hpp>
#include <iostream>
#include <memory>
#include <string>

#include "artifact_store.hpp"
#include "http_api.hpp"
#include "metrics.hpp"
#include "pose_estimator.hpp"
#include "session_controller.hpp"
#include "subprocess.hpp"
#include "util.hpp"

namespace {
httplib::Server* g_server = nullptr;

void handle_signal(int) {
  if (g_server) g_server->stop();
}
}  // namespace

int main(int argc, char** argv) {
  CLI::App cli_app{"PoseCast-Edge: live pose streaming, recording and export for edge cameras"};

  std::string cfg_path = "configs/config.yaml";
  cli_app.add_option("-c,--config", cfg_path, "Configuration file path")->check(CLI::ExistingFile);

  int port_override = 0;
  cli_app.add_option("-p,--port", port_override, "HTTP port (overrides server.port)")
      ->check(CLI::Range(1, 65535));

  bool show_version = false;
  cli_app.add_flag("-v,--version", show_version, "Show version information");

  try {
    cli_app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return cli_app.exit(e);
  }

  if (show_version) {
    std::cout << "PoseCast-Edge v1.0.0" << std::endl;
    std::cout << "YOLOv8-pose overlay, polled frame delivery, ffmpeg frame-rate normalization"
              << std::endl;
    return 0;
  }

  spdlog::set_pattern("[%H:%M:%S.%e] %^[%l]%$ %v");
  spdlog::info("PoseCast-Edge starting (config: {})", cfg_path);

  AppConfig app;
  try {
    app = load_config(cfg_path);
  } catch (const std::exception& e) {
    spdlog::error("Invalid configuration {}: {}", cfg_path, e.what());
    return 1;
  }
  if (!apply_log_level(app.logging.level)) {
    spdlog::warn("Unknown log level '{}', keeping info", app.logging.level);
  }
  if (port_override > 0) app.server.port = port_override;

  if (!find_executable(app.conversion.encoder)) {
    spdlog::warn("Encoder '{}' not found on PATH; conversions will report ToolMissing",
                 app.conversion.encoder);
  }

  MetricsRegistry metrics;
  InferenceConfig inference_cfg = app.inference;
  SessionController session(
      app, metrics, nullptr, [inference_cfg] { return createPoseEstimator(inference_cfg); },
      std::make_shared<SubprocessRunner>(),
      std::make_shared<DirectoryArtifactStore>(app.export_cfg));

  httplib::Server svr;
  register_routes(svr, session, metrics, app.server);

  g_server = &svr;
  signal(SIGINT, handle_signal);
  signal(SIGTERM, handle_signal);

  spdlog::info("HTTP server listening on {}:{}", app.server.host, app.server.port);
  if (!svr.listen(app.server.host, app.server.port)) {
    spdlog::error("Cannot listen on {}:{}", app.server.host, app.server.port);
    g_server = nullptr;
    return 1;
  }
  g_server = nullptr;

  if (session.state() != SessionState::Idle) session.stop();
  spdlog::info("Shutdown complete.");
  return 0;
}
