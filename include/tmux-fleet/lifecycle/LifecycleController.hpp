#pragma once
#include "tmux-fleet/FleetConfig.hpp"
#include "tmux-fleet/Result.hpp"
#include "tmux-fleet/Validator.hpp"
#include "tmux-fleet/ipc/MultiplexerClient.hpp"
#include "tmux-fleet/storage/BackupLogStore.hpp"
#include "tmux-fleet/storage/InstanceDirectoryManager.hpp"
#include <filesystem>
#include <ostream>
#include <string>

namespace fleet {

/// Starts, stops and inspects server instances. Each instance is a directory
/// under the working directory plus a same-named window in one tmux session.
///
/// Operations fail fast on the first violated precondition. The only
/// compensation performed is undoing a directory created earlier in the same
/// call. Confirmations and collected logs go to the output stream.
class LifecycleController {
public:
  LifecycleController(FleetConfig config, ipc::MultiplexerClient &mux,
                      std::ostream &out);

  /// Same, with a fixed clock for backup record names (tests)
  LifecycleController(FleetConfig config, ipc::MultiplexerClient &mux,
                      std::ostream &out, storage::BackupLogStore::Clock clock);

  /// Stage the artifact into <cwd>/<name> and launch it in a new window
  Status start(const std::string &name, Port port);

  /// Kill the window, archive the log and remove the directory
  Status stop(const std::string &name);

  /// Kill the session and archive/remove every instance directory
  Status stop_all();

  /// Print every window's log, sorted by name. No mutation.
  Status collect_all();

  /// Shell command run inside the instance window
  std::string launch_command(const std::string &name, Port port) const;

  const FleetConfig &config() const { return config_; }

private:
  // Archive <name>'s log and remove its directory
  Result<std::filesystem::path> retire_directory(const std::string &name);

  // kill-session, ignoring "session already gone"
  Status kill_session_tolerant();

  FleetConfig config_;
  ipc::MultiplexerClient &mux_;
  std::ostream &out_;
  storage::InstanceDirectoryManager dirs_;
  storage::BackupLogStore backups_;
};

/// Quote s for /bin/sh when it holds anything beyond [A-Za-z0-9_./=:,+@%-]
std::string shell_quote(const std::string &s);

} // namespace fleet
