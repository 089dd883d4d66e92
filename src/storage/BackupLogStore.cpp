#include "tmux-fleet/storage/BackupLogStore.hpp"
#include "tmux-fleet/Logger.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <system_error>
#include <unistd.h>

namespace fleet {
namespace storage {

namespace fs = std::filesystem;

std::int64_t unix_time_now() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

BackupLogStore::BackupLogStore(fs::path backup_dir)
    : BackupLogStore(std::move(backup_dir), &unix_time_now) {}

BackupLogStore::BackupLogStore(fs::path backup_dir, Clock clock)
    : backup_dir_(std::move(backup_dir)), clock_(std::move(clock)) {}

Status BackupLogStore::ensure_directory() const {
  std::error_code ec;
  fs::create_directories(backup_dir_, ec);
  if (ec) {
    return make_error(ErrorKind::IOFailure,
                      "failed to create backup directory {}: {}",
                      backup_dir_.string(), ec.message());
  }
  if (!fs::is_directory(backup_dir_, ec)) {
    return make_error(ErrorKind::IOFailure, "{} is not a directory",
                      backup_dir_.string());
  }
  return ok_status();
}

fs::path BackupLogStore::record_path(const std::string &name,
                                     std::int64_t timestamp) const {
  return backup_dir_ / fmt::format("out_{}_{}.log", name, timestamp);
}

Result<fs::path> BackupLogStore::next_free_path(const std::string &name) const {
  std::int64_t timestamp = clock_();
  fs::path candidate = record_path(name, timestamp);
  std::error_code ec;
  while (fs::exists(fs::symlink_status(candidate, ec))) {
    ++timestamp;
    candidate = record_path(name, timestamp);
  }
  if (ec && ec != std::errc::no_such_file_or_directory) {
    return make_error(ErrorKind::IOFailure, "failed to inspect {}: {}",
                      candidate.string(), ec.message());
  }
  return candidate;
}

Result<fs::path> BackupLogStore::archive(const std::string &name,
                                         const fs::path &log_file) const {
  auto status = ensure_directory();
  if (!status)
    return status.error();

  auto free_path = next_free_path(name);
  if (!free_path)
    return free_path;
  fs::path dest = std::move(free_path).value();

  std::error_code ec;
  auto log_status = fs::symlink_status(log_file, ec);
  if (ec && ec != std::errc::no_such_file_or_directory) {
    return make_error(ErrorKind::IOFailure, "failed to inspect {}: {}",
                      log_file.string(), ec.message());
  }
  if (fs::exists(log_status)) {
    fs::rename(log_file, dest, ec);
    if (ec == std::errc::cross_device_link) {
      // Backup area on another filesystem: copy, then drop the source
      ec.clear();
      fs::copy_file(log_file, dest, fs::copy_options::none, ec);
      if (!ec)
        fs::remove(log_file, ec);
    }
    if (ec) {
      return make_error(ErrorKind::IOFailure, "failed to move {} to {}: {}",
                        log_file.string(), dest.string(), ec.message());
    }
    LOG_INFO("BACKUP", name, "Archived {} to {}", log_file.string(),
             dest.string());
    return dest;
  }

  // O_EXCL: never clobber a record created since the free path was chosen
  int fd = ::open(dest.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
  if (fd < 0) {
    return make_error(ErrorKind::IOFailure, "failed to create {}: {}",
                      dest.string(), std::strerror(errno));
  }
  ::close(fd);
  LOG_INFO("BACKUP", name, "No output captured, created empty {}",
           dest.string());
  return dest;
}

} // namespace storage
} // namespace fleet
