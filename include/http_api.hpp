#pragma once
#include <string>

#include <nlohmann/json.hpp>

#include "metrics.hpp"
#include "session_controller.hpp"
#include "util.hpp"

namespace httplib {
class Server;
}

// Binds the command surface (start/stop, recording, status, frame polling,
// exports) to one SessionController.
void register_routes(httplib::Server& svr, SessionController& session, MetricsRegistry& metrics,
                     const ServerConfig& cfg);

nlohmann::json status_to_json(const SessionStatus& s);
nlohmann::json transition_to_json(const TransitionResult& r);
nlohmann::json job_to_json(const JobReport& r);
nlohmann::json poses_to_json(const std::vector<PersonPose>& poses);
nlohmann::json feedback_to_json(const ExerciseFeedback& fb);
nlohmann::json exercise_summary_to_json(const ExerciseSessionSummary& s);

// 200 on success, 409 for a rejected transition, 503 for device failures,
// 404 for a missing recording and 500 for other failures.
int http_status_for(const TransitionResult& r);

std::string base64_encode(const unsigned char* data, size_t len);

bool is_mobile_user_agent(const std::string& user_agent);
