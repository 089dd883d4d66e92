#include "tmux-fleet/Logger.hpp"

namespace fleet {

// Single definition shared by the library and both executables
FleetLogger &FleetLogger::instance() {
  static FleetLogger logger;
  return logger;
}

spdlog::level::level_enum parse_log_level(const std::string &level) {
  if (level == "trace")
    return spdlog::level::trace;
  if (level == "debug")
    return spdlog::level::debug;
  if (level == "warn")
    return spdlog::level::warn;
  if (level == "error")
    return spdlog::level::err;
  if (level == "off")
    return spdlog::level::off;
  return spdlog::level::info;
}

} // namespace fleet
