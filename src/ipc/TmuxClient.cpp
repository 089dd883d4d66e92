#include "tmux-fleet/ipc/TmuxClient.hpp"
#include "tmux-fleet/Logger.hpp"

#include <algorithm>
#include <sstream>

namespace fleet {
namespace ipc {

namespace {

std::string trim(const std::string &s) {
  const char *ws = " \t\r\n";
  auto begin = s.find_first_not_of(ws);
  if (begin == std::string::npos)
    return "";
  auto end = s.find_last_not_of(ws);
  return s.substr(begin, end - begin + 1);
}

// "=name" makes tmux match the session (or window) name exactly instead of
// by prefix or index
std::string exact_session(const std::string &session) { return "=" + session; }

// Status text for an unexpected exit of a probing command
std::string lookup_failure(const ProcessResult &proc, const std::string &verb) {
  if (!proc.started)
    return proc.launch_error;
  std::string detail = trim(proc.stderr_text);
  if (!detail.empty())
    return detail;
  return fmt::format("tmux {} exited with code {}", verb, proc.exit_code);
}

} // namespace

TmuxClient::TmuxClient(std::string tmux_binary)
    : tmux_binary_(std::move(tmux_binary)),
      owned_runner_(std::make_unique<ProcessRunner>()),
      runner_(owned_runner_.get()) {}

TmuxClient::TmuxClient(std::string tmux_binary, ProcessRunner &runner)
    : tmux_binary_(std::move(tmux_binary)), runner_(&runner) {}

std::vector<std::string>
TmuxClient::command(std::vector<std::string> args) const {
  args.insert(args.begin(), tmux_binary_);
  return args;
}

Result<bool> TmuxClient::session_exists(const std::string &session) {
  auto proc =
      runner_->run(command({"has-session", "-t", exact_session(session)}));
  if (proc.started && proc.exit_code == 0)
    return true;
  if (proc.started && proc.exit_code == 1)
    return false;

  LOG_ERROR("TMUX", "HAS_SESSION", "Lookup of session '{}' failed (exit {})",
            session, proc.exit_code);
  return make_error(ErrorKind::ExternalToolError, "{}",
                    lookup_failure(proc, "has-session"));
}

Result<std::vector<std::string>>
TmuxClient::list_windows(const std::string &session) {
  auto proc = runner_->run(command({"list-windows", "-t",
                                    exact_session(session), "-F",
                                    "#{window_name}"}));
  std::vector<std::string> names;
  if (proc.started && proc.exit_code == 1)
    return names;
  if (!proc.started || proc.exit_code != 0) {
    LOG_ERROR("TMUX", "LIST_WINDOWS",
              "Listing windows of '{}' failed (exit {})", session,
              proc.exit_code);
    return make_error(ErrorKind::ExternalToolError, "{}",
                      lookup_failure(proc, "list-windows"));
  }

  std::istringstream lines(proc.stdout_text);
  std::string line;
  while (std::getline(lines, line)) {
    line = trim(line);
    if (!line.empty())
      names.push_back(line);
  }
  return names;
}

Result<bool> TmuxClient::window_exists(const std::string &session,
                                       const std::string &window) {
  auto names = list_windows(session);
  if (!names)
    return names.error();
  const auto &list = names.value();
  return std::find(list.begin(), list.end(), window) != list.end();
}

Status TmuxClient::run(const std::vector<std::string> &args) {
  auto argv = command(args);
  auto proc = runner_->run(argv);
  if (proc.started && proc.exit_code == 0)
    return ok_status();

  std::string detail;
  if (!proc.started) {
    detail = proc.launch_error;
  } else {
    detail = trim(proc.stderr_text);
    if (detail.empty())
      detail = fmt::format("exit code {}", proc.exit_code);
  }
  LOG_WARN("TMUX", "RUN", "{} failed: {}", join_command(argv), detail);
  return make_error(ErrorKind::ExternalToolError, "tmux command failed ({}): {}",
                    join_command(argv), detail);
}

Status TmuxClient::create_session(const std::string &session,
                                  const std::string &window,
                                  const std::string &working_dir,
                                  const std::string &command) {
  return run({"new-session", "-d", "-s", session, "-n", window, "-c",
              working_dir, command});
}

Status TmuxClient::create_window(const std::string &session,
                                 const std::string &window,
                                 const std::string &working_dir,
                                 const std::string &command) {
  return run({"new-window", "-t", exact_session(session) + ":", "-n", window,
              "-c", working_dir, command});
}

Status TmuxClient::kill_window(const std::string &session,
                               const std::string &window) {
  return run({"kill-window", "-t", exact_session(session) + ":=" + window});
}

Status TmuxClient::kill_session(const std::string &session) {
  return run({"kill-session", "-t", exact_session(session)});
}

} // namespace ipc
} // namespace fleet
