#pragma once
#include "tmux-fleet/Result.hpp"
#include <string>
#include <vector>

namespace fleet {
namespace ipc {

/// Diagnostic tmux prints when the target session vanished under us
constexpr const char *kNoSuchSessionMarker = "can't find session";

/// Diagnostic tmux prints when the server exited with its last session
constexpr const char *kNoServerMarker = "no server running";

/// Session/window primitives of the terminal multiplexer. Nothing is
/// cached: every answer comes from the multiplexer itself.
class MultiplexerClient {
public:
  virtual ~MultiplexerClient() = default;

  virtual Result<bool> session_exists(const std::string &session) = 0;

  virtual Result<bool> window_exists(const std::string &session,
                                     const std::string &window) = 0;

  /// Window names in tmux order; empty when the session is absent
  virtual Result<std::vector<std::string>>
  list_windows(const std::string &session) = 0;

  /// Create a detached session whose first window runs command
  virtual Status create_session(const std::string &session,
                                const std::string &window,
                                const std::string &working_dir,
                                const std::string &command) = 0;

  /// Add a window running command to an existing session
  virtual Status create_window(const std::string &session,
                               const std::string &window,
                               const std::string &working_dir,
                               const std::string &command) = 0;

  virtual Status kill_window(const std::string &session,
                             const std::string &window) = 0;

  virtual Status kill_session(const std::string &session) = 0;
};

} // namespace ipc
} // namespace fleet
