#include "http_api.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <optional>

#include <opencv2/imgcodecs.hpp>

#include "exercise_tracker.hpp"

using nlohmann::json;

namespace {
const char* kJson = "application/json";

void set_common_headers(httplib::Response& res) {
  res.set_header("Cache-Control", "no-cache, no-store, must-revalidate");
  res.set_header("Access-Control-Allow-Origin", "*");
}

void reply(httplib::Response& res, int status, const json& body) {
  set_common_headers(res);
  res.status = status;
  res.set_content(body.dump(), kJson);
}

// Empty body is an empty object; anything else must be a JSON object.
bool parse_body(const httplib::Request& req, httplib::Response& res, json& out) {
  if (req.body.empty()) {
    out = json::object();
    return true;
  }
  out = json::parse(req.body, nullptr, false);
  if (out.is_discarded() || !out.is_object()) {
    reply(res, 400, {{"success", false}, {"error", "malformed JSON body"}});
    return false;
  }
  return true;
}

// Clients name recordings; they never choose where on disk they go.
std::optional<std::string> recording_path_from(const json& name, const std::string& directory) {
  if (!name.is_string()) return std::nullopt;
  auto resolved = resolve_recording_name(directory, name.get<std::string>());
  if (!resolved) spdlog::warn("Rejected recording name from client: {}", name.dump());
  return resolved;
}

std::string iso(WallClock::time_point tp) {
  return tp.time_since_epoch().count() == 0 ? std::string() : format_wall_time(tp);
}
}  // namespace

std::string base64_encode(const unsigned char* data, size_t len) {
  static const char* table = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  std::string out;
  out.reserve(((len + 2) / 3) * 4);
  size_t i = 0;
  for (; i + 2 < len; i += 3) {
    uint32_t n = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
    out.push_back(table[(n >> 18) & 63]);
    out.push_back(table[(n >> 12) & 63]);
    out.push_back(table[(n >> 6) & 63]);
    out.push_back(table[n & 63]);
  }
  if (i < len) {
    uint32_t n = data[i] << 16;
    if (i + 1 < len) n |= data[i + 1] << 8;
    out.push_back(table[(n >> 18) & 63]);
    out.push_back(table[(n >> 12) & 63]);
    out.push_back(i + 1 < len ? table[(n >> 6) & 63] : '=');
    out.push_back('=');
  }
  return out;
}

bool is_mobile_user_agent(const std::string& user_agent) {
  std::string ua = user_agent;
  std::transform(ua.begin(), ua.end(), ua.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ua.find("mobile") != std::string::npos;
}

int http_status_for(const TransitionResult& r) {
  if (r.ok) return 200;
  switch (r.error) {
    case ErrorKind::InvalidTransition:
      return 409;
    case ErrorKind::DeviceFailure:
      return 503;
    case ErrorKind::ConversionFailure:
      return 404;
    default:
      return 500;
  }
}

json transition_to_json(const TransitionResult& r) {
  json j{{"success", r.ok}, {"state", to_string(r.state)}, {"message", r.message}};
  if (r.error != ErrorKind::None) j["error"] = to_string(r.error);
  if (r.job_id != 0) j["job_id"] = r.job_id;
  return j;
}

json job_to_json(const JobReport& r) {
  json j{{"id", r.id},
         {"recording", r.recording_path},
         {"frames_written", r.frames_written},
         {"state", to_string(r.state)},
         {"queued_at", iso(r.queued_at)},
         {"finished_at", iso(r.finished_at)}};
  if (!r.error.empty()) j["error"] = {{"kind", to_string(r.error.kind)}, {"message", r.error.message}};
  if (r.conversion.success) {
    j["conversion"] = {{"output", r.conversion.output_path},
                       {"input_size", r.conversion.input_size},
                       {"output_size", r.conversion.output_size},
                       {"compression_ratio", r.conversion.compression_ratio},
                       {"elapsed_sec", r.conversion.elapsed_sec}};
  }
  if (!r.artifact_id.empty()) {
    j["artifact_id"] = r.artifact_id;
    j["url"] = r.url;
  }
  return j;
}

json exercise_summary_to_json(const ExerciseSessionSummary& s) {
  return {{"exercises_attempted", s.exercises_attempted},
          {"exercises_completed", s.exercises_completed},
          {"average_form_score", s.average_form_score},
          {"movement_consistency", s.movement_consistency},
          {"recommendations", s.recommendations}};
}

json status_to_json(const SessionStatus& s) {
  json j{{"state", to_string(s.state)},
         {"is_running", s.state == SessionState::Streaming || s.state == SessionState::Recording},
         {"is_recording", s.state == SessionState::Recording},
         {"capture_fps", s.capture_fps},
         {"frames_captured", s.frames_captured},
         {"frames_dropped", s.frames_dropped},
         {"inference_failures", s.inference_failures},
         {"persons_detected", s.persons_detected},
         {"latest_sequence", s.latest_sequence},
         {"jobs_in_flight", s.jobs_in_flight},
         {"conversion_in_flight", s.jobs_in_flight > 0},
         {"camera_available", s.camera_available},
         {"model_available", s.model_available},
         {"session_uptime_sec", s.session_uptime_sec}};

  j["exercise_tracking"] = {{"enabled", s.exercise_tracking},
                            {"exercise_id", s.exercise_id},
                            {"exercise_name", s.exercise_name},
                            {"phase", s.exercise_phase}};
  j["exercise_tracking"]["summary"] =
      s.exercise_summary ? exercise_summary_to_json(*s.exercise_summary) : json(nullptr);
  if (s.recording) {
    j["recording"] = {{"id", s.recording->id},
                      {"path", s.recording->path},
                      {"frames_written", s.recording->frames_written},
                      {"elapsed_sec", s.recording->elapsed_sec},
                      {"write_error", s.recording->write_error}};
    if (s.recording->write_error) j["recording"]["error_message"] = s.recording->error_message;
    if (!s.recording->annotated_path.empty()) {
      j["recording"]["annotated_path"] = s.recording->annotated_path;
      j["recording"]["annotated_frames_written"] = s.recording->annotated_frames;
    }
  } else {
    j["recording"] = nullptr;
  }
  j["last_job"] = s.last_job ? job_to_json(*s.last_job) : json(nullptr);
  if (s.last_error.empty()) {
    j["last_error"] = nullptr;
  } else {
    j["last_error"] = {{"kind", to_string(s.last_error.kind)},
                       {"message", s.last_error.message},
                       {"at", iso(s.last_error.at)}};
  }
  return j;
}

json poses_to_json(const std::vector<PersonPose>& poses) {
  json arr = json::array();
  for (const auto& p : poses) {
    json kps = json::array();
    for (const auto& k : p.keypoints) {
      json kj{{"name", k.name}, {"x", k.x}, {"y", k.y}, {"confidence", k.confidence}};
      if (k.z) kj["z"] = *k.z;
      kps.push_back(kj);
    }
    arr.push_back({{"person_id", p.person_id},
                   {"score", p.score},
                   {"bbox", {p.bbox.x, p.bbox.y, p.bbox.width, p.bbox.height}},
                   {"keypoints", kps}});
  }
  return arr;
}

json feedback_to_json(const ExerciseFeedback& fb) {
  json quality = json::object();
  for (const auto& [name, value] : fb.pose_quality) quality[name] = value;
  return {{"exercise_id", fb.exercise_id},
          {"exercise_name", fb.exercise_name},
          {"current_phase", fb.current_phase},
          {"completion_percentage", fb.completion_percentage},
          {"form_score", fb.form_score},
          {"feedback_messages", fb.feedback_messages},
          {"corrections", fb.corrections},
          {"pose_quality", quality}};
}

void register_routes(httplib::Server& svr, SessionController& session, MetricsRegistry& metrics,
                     const ServerConfig& cfg) {
  svr.Get("/healthz", [](const httplib::Request&, httplib::Response& res) {
    res.set_content("{\"status\":\"ok\"}", kJson);
  });

  svr.Get("/metrics", [&metrics](const httplib::Request&, httplib::Response& res) {
    res.set_content(metrics.prometheus_text(metrics.snapshot()), "text/plain; version=0.0.4");
  });

  svr.Post("/api/start", [&session](const httplib::Request& req, httplib::Response& res) {
    json body;
    if (!parse_body(req, res, body)) return;
    SessionOptions opts;
    if (body.contains("exercise_id") && body["exercise_id"].is_number_integer())
      opts.exercise_id = body["exercise_id"].get<int>();
    auto r = session.start(opts);
    reply(res, http_status_for(r), transition_to_json(r));
  });

  svr.Post("/api/stop", [&session](const httplib::Request&, httplib::Response& res) {
    auto r = session.stop();
    json j = transition_to_json(r);
    if (r.ok) {
      auto summary = session.exerciseSummary();
      j["exercise_summary"] = summary ? exercise_summary_to_json(*summary) : json(nullptr);
    }
    reply(res, http_status_for(r), j);
  });

  svr.Post("/api/recording/start", [&session](const httplib::Request& req,
                                              httplib::Response& res) {
    json body;
    if (!parse_body(req, res, body)) return;
    std::string path;
    if (body.contains("name")) {
      auto resolved = recording_path_from(body["name"], session.config().recording.directory);
      if (!resolved) {
        reply(res, 400, {{"success", false}, {"error", "\"name\" must be a bare *.mp4 file name"}});
        return;
      }
      path = *resolved;
    }
    auto r = session.startRecording(path);
    reply(res, http_status_for(r), transition_to_json(r));
  });

  svr.Post("/api/recording/stop", [&session](const httplib::Request&, httplib::Response& res) {
    auto r = session.stopRecording();
    reply(res, http_status_for(r), transition_to_json(r));
  });

  svr.Get("/api/status", [&session](const httplib::Request&, httplib::Response& res) {
    json j = status_to_json(session.status());
    j["success"] = true;
    reply(res, 200, j);
  });

  svr.Get("/api/current-frame", [&session, cfg](const httplib::Request& req,
                                                httplib::Response& res) {
    SessionState st = session.state();
    if (st != SessionState::Streaming && st != SessionState::Recording) {
      reply(res, 200, {{"success", false}, {"error", "not streaming"}, {"state", to_string(st)}});
      return;
    }
    auto frame = session.deliveryBuffer().latest();
    if (!frame) {
      reply(res, 200, {{"success", false}, {"error", "no frame available yet"}});
      return;
    }

    const bool mobile = is_mobile_user_agent(req.get_header_value("User-Agent"));
    const int quality = mobile ? cfg.mobile_jpeg_quality : cfg.jpeg_quality;
    std::vector<unsigned char> jpeg;
    if (!cv::imencode(".jpg", frame->image, jpeg, {cv::IMWRITE_JPEG_QUALITY, quality})) {
      spdlog::warn("JPEG encoding failed for frame {}", frame->sequence);
      reply(res, 500, {{"success", false}, {"error", "frame encoding failed"}});
      return;
    }

    json j{{"success", true},
           {"image", base64_encode(jpeg.data(), jpeg.size())},
           {"sequence", frame->sequence},
           {"timestamp", format_wall_time(frame->wall_capture)},
           {"overlay_applied", frame->overlay_applied},
           {"inference_ms", frame->inference_ms},
           {"is_recording", st == SessionState::Recording},
           {"quality", quality}};
    j["pose_data"] = frame->poses ? poses_to_json(*frame->poses) : json::array();
    j["exercise_feedback"] = frame->feedback ? feedback_to_json(*frame->feedback) : json(nullptr);
    reply(res, 200, j);
  });

  svr.Get("/api/pose", [&session](const httplib::Request&, httplib::Response& res) {
    auto frame = session.deliveryBuffer().latest();
    if (!frame) {
      reply(res, 200, {{"success", false}, {"error", "no frame available yet"}});
      return;
    }
    reply(res, 200,
          {{"success", true},
           {"sequence", frame->sequence},
           {"timestamp", format_wall_time(frame->wall_capture)},
           {"pose_data", frame->poses ? poses_to_json(*frame->poses) : json::array()}});
  });

  svr.Get("/api/recordings", [&session](const httplib::Request&, httplib::Response& res) {
    json list = json::array();
    for (const auto& r : session.listRecordings()) {
      json item{{"name", r.name}, {"path", r.path}, {"size", r.size_bytes}, {"modified", r.modified}};
      if (r.converted_path) {
        item["converted_path"] = *r.converted_path;
        item["converted_size"] = r.converted_size;
      }
      list.push_back(item);
    }
    json jobs = json::array();
    for (const auto& job : session.conversion().history()) jobs.push_back(job_to_json(job));
    reply(res, 200, {{"success", true}, {"recordings", list}, {"jobs", jobs}});
  });

  svr.Post("/api/recordings/export", [&session](const httplib::Request& req,
                                                httplib::Response& res) {
    json body;
    if (!parse_body(req, res, body)) return;
    auto resolved = body.contains("name") ? recording_path_from(body["name"],
                                                                session.config().recording.directory)
                                          : std::nullopt;
    if (!resolved) {
      reply(res, 400, {{"success", false}, {"error", "\"name\" must be a bare *.mp4 file name"}});
      return;
    }
    auto r = session.exportRecording(*resolved);
    reply(res, http_status_for(r), transition_to_json(r));
  });

  svr.Get("/api/exercises/summary", [&session](const httplib::Request&, httplib::Response& res) {
    auto summary = session.exerciseSummary();
    if (!summary) {
      reply(res, 200, {{"success", false}, {"error", "no exercise has been tracked"}});
      return;
    }
    reply(res, 200, {{"success", true}, {"summary", exercise_summary_to_json(*summary)}});
  });

  svr.Get("/api/exercises", [](const httplib::Request&, httplib::Response& res) {
    json list = json::array();
    for (const auto& e : exercise_catalogue()) {
      list.push_back({{"id", e.id},
                      {"name", e.name},
                      {"description", e.description},
                      {"phases", e.phases}});
    }
    reply(res, 200, {{"success", true}, {"exercises", list}});
  });
}
