#include "tmux-fleet/lifecycle/LifecycleController.hpp"
#include "tmux-fleet/Logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <system_error>
#include <unistd.h>

namespace fleet {

namespace fs = std::filesystem;

namespace {

bool is_shell_safe(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
         (c >= '0' && c <= '9') ||
         (c != '\0' && std::strchr("_./=:,+@%-", c) != nullptr);
}

bool is_missing_session(const Error &error) {
  return error.message.find(ipc::kNoSuchSessionMarker) != std::string::npos ||
         error.message.find(ipc::kNoServerMarker) != std::string::npos;
}

// Every read error is reported, including EISDIR on a directory
Result<std::string> read_whole_file(const fs::path &path) {
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    return make_error(ErrorKind::IOFailure, "failed to read {}: {}",
                      path.string(), std::strerror(errno));
  }

  std::string content;
  char buffer[4096];
  while (true) {
    ssize_t n = ::read(fd, buffer, sizeof(buffer));
    if (n > 0) {
      content.append(buffer, static_cast<size_t>(n));
      continue;
    }
    if (n < 0 && errno == EINTR)
      continue;
    if (n < 0) {
      int err = errno;
      ::close(fd);
      return make_error(ErrorKind::IOFailure, "failed to read {}: {}",
                        path.string(), std::strerror(err));
    }
    break;
  }
  ::close(fd);
  return content;
}

} // namespace

std::string shell_quote(const std::string &s) {
  if (!s.empty() && std::all_of(s.begin(), s.end(), is_shell_safe))
    return s;

  std::string quoted = "'";
  for (char c : s) {
    if (c == '\'')
      quoted += "'\\''";
    else
      quoted += c;
  }
  quoted += "'";
  return quoted;
}

LifecycleController::LifecycleController(FleetConfig config,
                                         ipc::MultiplexerClient &mux,
                                         std::ostream &out)
    : LifecycleController(std::move(config), mux, out,
                          &storage::unix_time_now) {}

LifecycleController::LifecycleController(FleetConfig config,
                                         ipc::MultiplexerClient &mux,
                                         std::ostream &out,
                                         storage::BackupLogStore::Clock clock)
    : config_(std::move(config)), mux_(mux), out_(out),
      dirs_(config_.working_dir, config_.artifact_name, config_.log_file_name,
            config_.backup_dir_name),
      backups_(config_.backup_dir(), std::move(clock)) {}

std::string LifecycleController::launch_command(const std::string &name,
                                                Port port) const {
  return fmt::format("{}={} ./{} --name {} --port {} > {} 2>&1",
                     config_.instance_env_var, shell_quote(name),
                     shell_quote(config_.artifact_name), shell_quote(name),
                     port, shell_quote(config_.log_file_name));
}

Status LifecycleController::start(const std::string &name, Port port) {
  auto valid = validate_name(name);
  if (!valid)
    return valid.error();

  const std::string &session = config_.session_name;

  if (!dirs_.artifact_exists()) {
    return make_error(ErrorKind::NotFound, "{} not found in {}",
                      config_.artifact_name, dirs_.root().string());
  }

  fs::path dir = dirs_.directory_for(name);
  if (dirs_.exists(name)) {
    return make_error(ErrorKind::PreconditionFailed,
                      "directory {} already exists", dir.string());
  }

  auto has_session = mux_.session_exists(session);
  if (!has_session.ok())
    return has_session.error();
  const bool session_exists = has_session.value();

  if (session_exists) {
    auto has_window = mux_.window_exists(session, name);
    if (!has_window.ok())
      return has_window.error();
    if (has_window.value()) {
      return make_error(ErrorKind::PreconditionFailed,
                        "tmux window '{}' already exists in session '{}'",
                        name, session);
    }
  }

  auto prepared = dirs_.prepare(name);
  if (!prepared)
    return prepared;

  const std::string command = launch_command(name, port);
  LOG_INFO("LIFECYCLE", name, "Launching in {}: {}", dir.string(), command);

  Status launched = session_exists
                        ? mux_.create_window(session, name, dir.string(),
                                             command)
                        : mux_.create_session(session, name, dir.string(),
                                              command);
  if (!launched) {
    dirs_.remove_best_effort(name);
    return launched;
  }

  out_ << fmt::format("Started '{}' on port {} in tmux session '{}'.\n", name,
                      port, session);
  return ok_status();
}

Status LifecycleController::stop(const std::string &name) {
  auto valid = validate_name(name);
  if (!valid)
    return valid.error();

  const std::string &session = config_.session_name;

  if (!dirs_.exists(name)) {
    return make_error(ErrorKind::NotFound, "directory {} does not exist",
                      dirs_.directory_for(name).string());
  }

  auto has_session = mux_.session_exists(session);
  if (!has_session.ok())
    return has_session.error();
  if (!has_session.value()) {
    return make_error(ErrorKind::NotFound, "tmux session '{}' not found",
                      session);
  }

  auto has_window = mux_.window_exists(session, name);
  if (!has_window.ok())
    return has_window.error();
  if (!has_window.value()) {
    return make_error(ErrorKind::NotFound,
                      "tmux window '{}' not found in session '{}'", name,
                      session);
  }

  // Directory stays in place if this fails, so stop can be retried
  auto killed = mux_.kill_window(session, name);
  if (!killed)
    return killed;
  LOG_INFO("LIFECYCLE", name, "Killed window {}:{}", session, name);

  auto backup = retire_directory(name);
  if (!backup)
    return backup.error();

  out_ << fmt::format("Stopped '{}'. Logs moved to {}.\n", name,
                      backup.value().string());
  return ok_status();
}

Status LifecycleController::stop_all() {
  const std::string &session = config_.session_name;

  auto has_session = mux_.session_exists(session);
  if (!has_session.ok())
    return has_session.error();
  if (has_session.value()) {
    auto killed = kill_session_tolerant();
    if (!killed)
      return killed;
  }

  auto names = dirs_.list_instance_directories();
  if (!names)
    return names.error();

  for (const auto &name : names.value()) {
    auto backup = retire_directory(name);
    if (!backup)
      return backup.error();
  }

  // A window may have been respawned while directories were processed
  auto still_there = mux_.session_exists(session);
  if (!still_there.ok())
    return still_there.error();
  if (still_there.value()) {
    LOG_WARN("LIFECYCLE", "STOP_ALL", "Session '{}' still alive, killing again",
             session);
    auto killed = kill_session_tolerant();
    if (!killed)
      return killed;
  }

  LOG_INFO("LIFECYCLE", "STOP_ALL", "Retired {} instance directories",
           names.value().size());
  out_ << "Stopped all instances.\n";
  return ok_status();
}

Status LifecycleController::collect_all() {
  const std::string &session = config_.session_name;

  auto has_session = mux_.session_exists(session);
  if (!has_session.ok())
    return has_session.error();
  if (!has_session.value())
    return ok_status();

  auto windows = mux_.list_windows(session);
  if (!windows)
    return windows.error();
  std::vector<std::string> names = std::move(windows).value();
  std::sort(names.begin(), names.end());

  // Buffered so a read failure prints nothing
  std::string report;
  bool first = true;
  for (const auto &name : names) {
    if (!first)
      report += '\n';
    first = false;

    report += fmt::format("=== server: {} ===\n", name);

    fs::path log_path = dirs_.log_path_for(name);
    std::error_code ec;
    auto log_status = fs::status(log_path, ec);
    // A window without a directory simply has no log yet
    if (ec && ec != std::errc::no_such_file_or_directory &&
        ec != std::errc::not_a_directory) {
      return make_error(ErrorKind::IOFailure, "failed to inspect {}: {}",
                        log_path.string(), ec.message());
    }
    if (!fs::exists(log_status))
      continue;

    auto content = read_whole_file(log_path);
    if (!content)
      return content.error();
    const std::string &text = content.value();
    if (!text.empty()) {
      report += text;
      if (text.back() != '\n')
        report += '\n';
    }
  }

  out_ << report;
  return ok_status();
}

Result<fs::path> LifecycleController::retire_directory(const std::string &name) {
  auto backup = backups_.archive(name, dirs_.log_path_for(name));
  if (!backup)
    return backup;

  // Log is safe in the backup area before the directory goes
  auto removed = dirs_.remove(name);
  if (!removed)
    return removed.error();

  LOG_INFO("LIFECYCLE", name, "Retired instance, log at {}",
           backup.value().string());
  return backup;
}

Status LifecycleController::kill_session_tolerant() {
  auto killed = mux_.kill_session(config_.session_name);
  if (!killed && !is_missing_session(killed.error()))
    return killed;
  if (!killed) {
    LOG_DEBUG("LIFECYCLE", "STOP_ALL", "Session already gone: {}",
              killed.error().message);
  }
  return ok_status();
}

} // namespace fleet
