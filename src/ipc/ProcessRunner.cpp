#include "tmux-fleet/ipc/ProcessRunner.hpp"
#include "tmux-fleet/Logger.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <functional>
#include <spawn.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char **environ;

namespace fleet {
namespace ipc {

namespace {

// Drain fd until EOF, then close it
void read_fd(int fd, std::string &out) {
  char buffer[4096];
  while (true) {
    ssize_t n = read(fd, buffer, sizeof(buffer));
    if (n > 0) {
      out.append(buffer, static_cast<size_t>(n));
      continue;
    }
    if (n < 0 && errno == EINTR)
      continue;
    break;
  }
  close(fd);
}

void close_pipe(int fds[2]) {
  if (fds[0] >= 0)
    close(fds[0]);
  if (fds[1] >= 0)
    close(fds[1]);
}

} // namespace

std::string join_command(const std::vector<std::string> &args) {
  std::string joined;
  for (size_t i = 0; i < args.size(); ++i) {
    if (i > 0)
      joined += ' ';
    joined += args[i];
  }
  return joined;
}

ProcessResult ProcessRunner::run(const std::vector<std::string> &args) {
  ProcessResult result;
  if (args.empty()) {
    result.launch_error = "empty command";
    return result;
  }

  int stdout_pipe[2] = {-1, -1};
  int stderr_pipe[2] = {-1, -1};
  if (pipe2(stdout_pipe, O_CLOEXEC) != 0) {
    result.launch_error = std::string("pipe failed: ") + strerror(errno);
    return result;
  }
  if (pipe2(stderr_pipe, O_CLOEXEC) != 0) {
    result.launch_error = std::string("pipe failed: ") + strerror(errno);
    close_pipe(stdout_pipe);
    return result;
  }

  // dup2 clears FD_CLOEXEC on the targets, the pipe originals close on exec
  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null",
                                   O_RDONLY, 0);
  posix_spawn_file_actions_adddup2(&actions, stdout_pipe[1], STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&actions, stderr_pipe[1], STDERR_FILENO);

  std::vector<char *> argv;
  argv.reserve(args.size() + 1);
  for (const auto &arg : args) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(nullptr);

  pid_t pid;
  int status = posix_spawnp(&pid, argv[0], &actions, nullptr, argv.data(),
                            environ);
  posix_spawn_file_actions_destroy(&actions);

  close(stdout_pipe[1]);
  close(stderr_pipe[1]);

  if (status != 0) {
    close(stdout_pipe[0]);
    close(stderr_pipe[0]);
    result.launch_error = fmt::format("failed to launch {}: {}", args[0],
                                      strerror(status));
    LOG_ERROR("PROCESS", "SPAWN", "{}", result.launch_error);
    return result;
  }
  result.started = true;

  std::thread stdout_thread(read_fd, stdout_pipe[0],
                            std::ref(result.stdout_text));
  std::thread stderr_thread(read_fd, stderr_pipe[0],
                            std::ref(result.stderr_text));

  int wait_status = 0;
  pid_t waited;
  do {
    waited = waitpid(pid, &wait_status, 0);
  } while (waited < 0 && errno == EINTR);

  stdout_thread.join();
  stderr_thread.join();

  if (waited < 0) {
    result.launch_error = std::string("waitpid failed: ") + strerror(errno);
    return result;
  }

  if (WIFEXITED(wait_status)) {
    result.exit_code = WEXITSTATUS(wait_status);
  } else if (WIFSIGNALED(wait_status)) {
    result.signaled = true;
    result.exit_code = 128 + WTERMSIG(wait_status);
  }

  LOG_DEBUG("PROCESS", "RUN", "{} -> exit {}", join_command(args),
            result.exit_code);
  return result;
}

} // namespace ipc
} // namespace fleet
