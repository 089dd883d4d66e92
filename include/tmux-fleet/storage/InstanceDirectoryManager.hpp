#pragma once
#include "tmux-fleet/Result.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace fleet {
namespace storage {

/// Per-instance working directories under the fleet working directory:
/// <root>/<name>/ holding a copy of the server artifact and its log file.
class InstanceDirectoryManager {
public:
  /// backup_dir_name is never listed as an instance, even when it looks
  /// like one
  InstanceDirectoryManager(std::filesystem::path root,
                           std::string artifact_name,
                           std::string log_file_name,
                           std::string backup_dir_name = ".backup");

  const std::filesystem::path &root() const { return root_; }

  std::filesystem::path artifact_source() const;
  std::filesystem::path directory_for(const std::string &name) const;
  std::filesystem::path log_path_for(const std::string &name) const;

  bool artifact_exists() const;

  /// True when anything (file, dir, link) occupies <root>/<name>
  bool exists(const std::string &name) const;

  /// Create <root>/<name> and copy the artifact into it. The directory is
  /// created with a single create-if-absent call; if the copy fails the
  /// directory is removed again.
  Status prepare(const std::string &name) const;

  /// Remove <root>/<name> recursively
  Status remove(const std::string &name) const;

  /// Remove <root>/<name>, logging instead of reporting failures
  void remove_best_effort(const std::string &name) const;

  /// Directories under root whose names are valid instance names, sorted.
  /// The artifact and the backup directory are skipped.
  Result<std::vector<std::string>> list_instance_directories() const;

private:
  std::filesystem::path root_;
  std::string artifact_name_;
  std::string log_file_name_;
  std::string backup_dir_name_;
};

} // namespace storage
} // namespace fleet
