#include "tmux-fleet/storage/InstanceDirectoryManager.hpp"
#include "tmux-fleet/Logger.hpp"
#include "tmux-fleet/Validator.hpp"

#include <algorithm>
#include <system_error>

namespace fleet {
namespace storage {

namespace fs = std::filesystem;

InstanceDirectoryManager::InstanceDirectoryManager(fs::path root,
                                                   std::string artifact_name,
                                                   std::string log_file_name,
                                                   std::string backup_dir_name)
    : root_(std::move(root)), artifact_name_(std::move(artifact_name)),
      log_file_name_(std::move(log_file_name)),
      backup_dir_name_(std::move(backup_dir_name)) {}

fs::path InstanceDirectoryManager::artifact_source() const {
  return root_ / artifact_name_;
}

fs::path InstanceDirectoryManager::directory_for(const std::string &name) const {
  return root_ / name;
}

fs::path InstanceDirectoryManager::log_path_for(const std::string &name) const {
  return directory_for(name) / log_file_name_;
}

bool InstanceDirectoryManager::artifact_exists() const {
  std::error_code ec;
  return fs::exists(artifact_source(), ec);
}

bool InstanceDirectoryManager::exists(const std::string &name) const {
  std::error_code ec;
  return fs::exists(fs::symlink_status(directory_for(name), ec));
}

Status InstanceDirectoryManager::prepare(const std::string &name) const {
  fs::path dir = directory_for(name);
  std::error_code ec;

  if (!fs::create_directory(dir, ec)) {
    if (!ec) {
      // Someone else created it between our check and now
      return make_error(ErrorKind::PreconditionFailed,
                        "directory {} already exists", dir.string());
    }
    return make_error(ErrorKind::IOFailure, "failed to create directory {}: {}",
                      dir.string(), ec.message());
  }

  fs::path target = dir / artifact_name_;
  fs::copy_file(artifact_source(), target, fs::copy_options::none, ec);
  if (!ec) {
    auto perms = fs::status(artifact_source(), ec).permissions();
    if (!ec)
      fs::permissions(target, perms, fs::perm_options::replace, ec);
  }
  if (ec) {
    std::string reason = ec.message();
    remove_best_effort(name);
    return make_error(ErrorKind::IOFailure, "failed to copy {} into {}: {}",
                      artifact_name_, dir.string(), reason);
  }

  LOG_DEBUG("DIRS", name, "Staged {} into {}", artifact_name_, dir.string());
  return ok_status();
}

Status InstanceDirectoryManager::remove(const std::string &name) const {
  fs::path dir = directory_for(name);
  std::error_code ec;
  fs::remove_all(dir, ec);
  if (ec) {
    return make_error(ErrorKind::IOFailure, "failed to remove directory {}: {}",
                      dir.string(), ec.message());
  }
  LOG_DEBUG("DIRS", name, "Removed {}", dir.string());
  return ok_status();
}

void InstanceDirectoryManager::remove_best_effort(
    const std::string &name) const {
  auto status = remove(name);
  if (!status) {
    LOG_WARN("DIRS", name, "Cleanup failed: {}", status.error().message);
  }
}

Result<std::vector<std::string>>
InstanceDirectoryManager::list_instance_directories() const {
  std::vector<std::string> names;
  std::error_code ec;
  fs::directory_iterator it(root_, ec);
  if (ec) {
    return make_error(ErrorKind::IOFailure, "failed to list {}: {}",
                      root_.string(), ec.message());
  }

  for (fs::directory_iterator end; it != end; it.increment(ec)) {
    if (ec)
      break;
    std::error_code type_ec;
    if (!it->is_directory(type_ec))
      continue;
    std::string name = it->path().filename().string();
    if (name == backup_dir_name_ || name == artifact_name_)
      continue;
    if (is_instance_name(name))
      names.push_back(name);
  }
  if (ec) {
    return make_error(ErrorKind::IOFailure, "failed to list {}: {}",
                      root_.string(), ec.message());
  }

  std::sort(names.begin(), names.end());
  return names;
}

} // namespace storage
} // namespace fleet
