#pragma once
#include <string>
#include <vector>

namespace fleet {
namespace ipc {

/// Outcome of one synchronous child process run
struct ProcessResult {
  bool started{false}; // false: spawn itself failed, see launch_error
  int exit_code{-1};   // 128 + signal when the child was signalled
  bool signaled{false};
  std::string stdout_text;
  std::string stderr_text;
  std::string launch_error;
};

/// Runs external commands to completion and captures their output
class ProcessRunner {
public:
  virtual ~ProcessRunner() = default;

  /// Run args[0] (looked up in PATH) with args, blocking until it exits.
  /// The child inherits the environment and working directory.
  virtual ProcessResult run(const std::vector<std::string> &args);
};

/// Join argv for diagnostics: "tmux kill-window -t fleet:web"
std::string join_command(const std::vector<std::string> &args);

} // namespace ipc
} // namespace fleet
