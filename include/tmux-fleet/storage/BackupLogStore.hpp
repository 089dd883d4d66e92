#pragma once
#include "tmux-fleet/Result.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

namespace fleet {
namespace storage {

/// Archive of captured instance output: <backup_dir>/out_<name>_<unixts>.log.
/// Records are never overwritten; a taken timestamp is bumped by one second
/// until the name is free.
class BackupLogStore {
public:
  using Clock = std::function<std::int64_t()>;

  explicit BackupLogStore(std::filesystem::path backup_dir);
  BackupLogStore(std::filesystem::path backup_dir, Clock clock);

  const std::filesystem::path &directory() const { return backup_dir_; }

  /// Create the backup directory if missing
  Status ensure_directory() const;

  /// Path of the record for name at timestamp (no collision check)
  std::filesystem::path record_path(const std::string &name,
                                    std::int64_t timestamp) const;

  /// First free record path for name, starting at the current time
  Result<std::filesystem::path> next_free_path(const std::string &name) const;

  /// Move log_file into a new record, or create an empty record when
  /// log_file does not exist. Returns the record path.
  Result<std::filesystem::path>
  archive(const std::string &name,
          const std::filesystem::path &log_file) const;

private:
  std::filesystem::path backup_dir_;
  Clock clock_;
};

/// Seconds since the Unix epoch
std::int64_t unix_time_now();

} // namespace storage
} // namespace fleet
