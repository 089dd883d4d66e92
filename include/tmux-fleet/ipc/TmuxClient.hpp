#pragma once
#include "tmux-fleet/ipc/MultiplexerClient.hpp"
#include "tmux-fleet/ipc/ProcessRunner.hpp"
#include <memory>
#include <string>
#include <vector>

namespace fleet {
namespace ipc {

/// MultiplexerClient backed by the tmux command line
class TmuxClient : public MultiplexerClient {
public:
  explicit TmuxClient(std::string tmux_binary = "tmux");

  /// Use a caller-owned runner (tests)
  TmuxClient(std::string tmux_binary, ProcessRunner &runner);

  Result<bool> session_exists(const std::string &session) override;
  Result<bool> window_exists(const std::string &session,
                             const std::string &window) override;
  Result<std::vector<std::string>>
  list_windows(const std::string &session) override;

  Status create_session(const std::string &session, const std::string &window,
                        const std::string &working_dir,
                        const std::string &command) override;
  Status create_window(const std::string &session, const std::string &window,
                       const std::string &working_dir,
                       const std::string &command) override;
  Status kill_window(const std::string &session,
                     const std::string &window) override;
  Status kill_session(const std::string &session) override;

  /// Run "tmux <args...>"; any non-zero exit is an ExternalToolError
  Status run(const std::vector<std::string> &args);

private:
  std::vector<std::string> command(std::vector<std::string> args) const;

  std::string tmux_binary_;
  std::unique_ptr<ProcessRunner> owned_runner_;
  ProcessRunner *runner_;
};

} // namespace ipc
} // namespace fleet
