#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

struct ProcessOutcome {
  enum class Kind { Exited, TimedOut, ToolMissing, SpawnFailed };
  Kind kind{Kind::SpawnFailed};
  int exit_code{-1};
  std::string message;
};

const char* to_string(ProcessOutcome::Kind k);

// Runs the external encoder. argv[0] is the executable (bare name resolved on
// PATH, or a path).
class EncoderRunner {
public:
  virtual ~EncoderRunner() = default;
  virtual ProcessOutcome run(const std::vector<std::string>& argv, std::chrono::seconds timeout,
                             const std::string& log_path) = 0;
};

// fork/exec runner. The child gets its own process group so a timeout kills
// the encoder together with anything it spawned. stdout/stderr go to log_path.
class SubprocessRunner : public EncoderRunner {
public:
  ProcessOutcome run(const std::vector<std::string>& argv, std::chrono::seconds timeout,
                     const std::string& log_path) override;
};

// Absolute path of an executable, or nullopt if it is not on PATH / not executable.
std::optional<std::string> find_executable(const std::string& name);

// Last max_bytes of a text file, trimmed to whole lines. Empty if unreadable.
std::string read_tail(const std::string& path, size_t max_bytes = 1024);
