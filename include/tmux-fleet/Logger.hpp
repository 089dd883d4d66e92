#pragma once
#include <fmt/format.h>
#include <memory>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace fleet {

/// Where the console sink writes. fleetctl keeps stdout for command output,
/// fleet-server writes everything to stdout so tmux captures it.
enum class ConsoleStream { Stdout, Stderr };

/// Centralized logging with component and context prefixes
class FleetLogger {
public:
  static FleetLogger &instance();

  // Initialize console sink and, when log_file is not empty, a rotating file
  // sink next to it
  void init(const std::string &log_file = "",
            spdlog::level::level_enum level = spdlog::level::warn,
            ConsoleStream stream = ConsoleStream::Stderr,
            const std::string &pattern = "") {
    std::lock_guard<std::mutex> lock(mutex_);

    // If already initialized, just update level
    if (logger_) {
      logger_->set_level(level);
      logger_->flush_on(level);
      return;
    }

    try {
      std::vector<spdlog::sink_ptr> sinks;
      if (stream == ConsoleStream::Stdout) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
      } else {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
      }

      if (!log_file.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file, 1024 * 1024 * 10, 3); // 10MB, 3 files
        file_sink->set_level(spdlog::level::trace);
        sinks.push_back(file_sink);
      }

      logger_ =
          std::make_shared<spdlog::logger>("fleet", sinks.begin(), sinks.end());
      logger_->set_level(level);
      logger_->flush_on(level);
      if (!pattern.empty()) {
        logger_->set_pattern(pattern, spdlog::pattern_time_type::utc);
      }

      // Don't register if already exists
      if (!spdlog::get("fleet")) {
        spdlog::register_logger(logger_);
      }
    } catch (const spdlog::spdlog_ex &ex) {
      fmt::print(stderr, "Log initialization failed: {}\n", ex.what());
    }
  }

  // Drop the logger so that a later init() recreates the sinks (tests).
  void shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    spdlog::drop("fleet");
    logger_.reset();
  }

  template <typename... Args>
  void trace(const std::string &component, const std::string &context,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::trace, component, context, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void debug(const std::string &component, const std::string &context,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::debug, component, context, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(const std::string &component, const std::string &context,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::info, component, context, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warn(const std::string &component, const std::string &context,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::warn, component, context, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(const std::string &component, const std::string &context,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::err, component, context, fmt_str,
        std::forward<Args>(args)...);
  }

private:
  FleetLogger() = default;

  template <typename... Args>
  void log(spdlog::level::level_enum level, const std::string &component,
           const std::string &context, const std::string &fmt_str,
           Args &&...args) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!logger_)
      return;

    // Format:  [component] [context] message
    std::string prefix = fmt::format("[{}] [{}] ", component, context);
    std::string full_msg = prefix + fmt::format(fmt::runtime(fmt_str),
                                                std::forward<Args>(args)...);
    logger_->log(level, full_msg);
  }

  std::shared_ptr<spdlog::logger> logger_;
  std::mutex mutex_;
};

/// Parse a level name as accepted by --log-level; unknown names map to info
spdlog::level::level_enum parse_log_level(const std::string &level);

// Convenience macros
#define LOG_TRACE(component, ctx, ...)                                         \
  fleet::FleetLogger::instance().trace(component, ctx, __VA_ARGS__)
#define LOG_DEBUG(component, ctx, ...)                                         \
  fleet::FleetLogger::instance().debug(component, ctx, __VA_ARGS__)
#define LOG_INFO(component, ctx, ...)                                          \
  fleet::FleetLogger::instance().info(component, ctx, __VA_ARGS__)
#define LOG_WARN(component, ctx, ...)                                          \
  fleet::FleetLogger::instance().warn(component, ctx, __VA_ARGS__)
#define LOG_ERROR(component, ctx, ...)                                         \
  fleet::FleetLogger::instance().error(component, ctx, __VA_ARGS__)

} // namespace fleet
