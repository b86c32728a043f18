#include "subprocess.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;
using namespace std::chrono;

const char* to_string(ProcessOutcome::Kind k) {
  switch (k) {
    case ProcessOutcome::Kind::Exited:
      return "exited";
    case ProcessOutcome::Kind::TimedOut:
      return "timed_out";
    case ProcessOutcome::Kind::ToolMissing:
      return "tool_missing";
    case ProcessOutcome::Kind::SpawnFailed:
      return "spawn_failed";
  }
  return "unknown";
}

namespace {
bool is_executable(const fs::path& p) {
  std::error_code ec;
  return fs::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
}
}  // namespace

std::optional<std::string> find_executable(const std::string& name) {
  if (name.empty()) return std::nullopt;
  if (name.find('/') != std::string::npos) {
    if (is_executable(name)) return name;
    return std::nullopt;
  }
  const char* path_env = std::getenv("PATH");
  std::stringstream ss(path_env ? path_env : "/usr/local/bin:/usr/bin:/bin");
  std::string dir;
  while (std::getline(ss, dir, ':')) {
    if (dir.empty()) continue;
    fs::path candidate = fs::path(dir) / name;
    if (is_executable(candidate)) return candidate.string();
  }
  return std::nullopt;
}

std::string read_tail(const std::string& path, size_t max_bytes) {
  std::ifstream in(path, std::ios::binary | std::ios::ate);
  if (!in) return {};
  std::streamoff size = in.tellg();
  std::streamoff start = size > static_cast<std::streamoff>(max_bytes)
                             ? size - static_cast<std::streamoff>(max_bytes)
                             : 0;
  in.seekg(start);
  std::string tail((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (start > 0) {
    auto nl = tail.find('\n');
    if (nl != std::string::npos) tail.erase(0, nl + 1);
  }
  while (!tail.empty() && (tail.back() == '\n' || tail.back() == '\r')) tail.pop_back();
  return tail;
}

ProcessOutcome SubprocessRunner::run(const std::vector<std::string>& argv,
                                     std::chrono::seconds timeout, const std::string& log_path) {
  ProcessOutcome outcome;
  if (argv.empty()) {
    outcome.message = "empty command line";
    return outcome;
  }

  auto exe = find_executable(argv[0]);
  if (!exe) {
    outcome.kind = ProcessOutcome::Kind::ToolMissing;
    outcome.message = fmt::format("encoder not found: {}", argv[0]);
    return outcome;
  }

  std::vector<char*> cargs;
  cargs.reserve(argv.size() + 1);
  for (const auto& a : argv) cargs.push_back(const_cast<char*>(a.c_str()));
  cargs.push_back(nullptr);

  int log_fd = ::open(log_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (log_fd < 0) {
    spdlog::warn("Cannot open encoder log {}: {}", log_path, std::strerror(errno));
  }

  pid_t pid = ::fork();
  if (pid < 0) {
    outcome.message = fmt::format("fork failed: {}", std::strerror(errno));
    if (log_fd >= 0) ::close(log_fd);
    return outcome;
  }

  if (pid == 0) {
    ::setpgid(0, 0);
    int null_fd = ::open("/dev/null", O_RDONLY);
    if (null_fd >= 0) {
      ::dup2(null_fd, STDIN_FILENO);
      if (null_fd != STDIN_FILENO) ::close(null_fd);
    }
    if (log_fd >= 0) {
      ::dup2(log_fd, STDOUT_FILENO);
      ::dup2(log_fd, STDERR_FILENO);
    }
    ::execv(exe->c_str(), cargs.data());
    ::_exit(127);
  }

  ::setpgid(pid, pid);
  if (log_fd >= 0) ::close(log_fd);
  spdlog::debug("Encoder started (pid {}, timeout {}s): {}", pid, timeout.count(), *exe);

  const auto deadline = steady_clock::now() + timeout;
  int status = 0;
  while (true) {
    pid_t r = ::waitpid(pid, &status, WNOHANG);
    if (r == pid) break;
    if (r < 0 && errno != EINTR) {
      outcome.message = fmt::format("waitpid failed: {}", std::strerror(errno));
      return outcome;
    }
    if (steady_clock::now() >= deadline) {
      ::kill(-pid, SIGKILL);
      ::kill(pid, SIGKILL);
      while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
      }
      outcome.kind = ProcessOutcome::Kind::TimedOut;
      outcome.message = fmt::format("encoder exceeded {}s and was killed", timeout.count());
      return outcome;
    }
    std::this_thread::sleep_for(milliseconds(100));
  }

  if (WIFEXITED(status)) {
    outcome.kind = ProcessOutcome::Kind::Exited;
    outcome.exit_code = WEXITSTATUS(status);
    if (outcome.exit_code == 127) {
      outcome.kind = ProcessOutcome::Kind::SpawnFailed;
      outcome.message = fmt::format("exec of {} failed", *exe);
    }
  } else if (WIFSIGNALED(status)) {
    outcome.kind = ProcessOutcome::Kind::Exited;
    outcome.exit_code = 128 + WTERMSIG(status);
    outcome.message = fmt::format("encoder terminated by signal {}", WTERMSIG(status));
  }
  return outcome;
}
