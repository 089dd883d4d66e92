#pragma once

#include "tmux-fleet/Result.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace fleet {

/// Environment variable naming a config file when --config is not given
constexpr const char *kConfigEnvVar = "TMUX_FLEET_CONFIG";

/// Config file picked up from the working directory when present
constexpr const char *kDefaultConfigFile = "tmux-fleet.yaml";

struct FleetConfig {
  std::string session_name{"fleet"};
  std::string artifact_name{"fleet-server"};
  std::string log_file_name{"out.log"};
  std::string backup_dir_name{".backup"};
  std::string tmux_binary{"tmux"};
  std::string instance_env_var{"INSTANCE_NAME"};

  // fleetctl's own diagnostics
  std::string tool_log_file;
  std::string tool_log_level{"warn"};

  // Not read from YAML: the directory instances live in
  std::filesystem::path working_dir;

  std::filesystem::path artifact_path() const {
    return working_dir / artifact_name;
  }
  std::filesystem::path backup_dir() const {
    return working_dir / backup_dir_name;
  }

  /// Check names that end up in tmux targets and file paths
  Status validate() const;

  /// Parse a YAML document on top of the defaults
  static Result<FleetConfig> from_yaml_string(const std::string &yaml);

  /// Parse a YAML file on top of the defaults
  static Result<FleetConfig> load_file(const std::filesystem::path &path);

  /// Resolve the config for a fleetctl run: explicit path, then
  /// $TMUX_FLEET_CONFIG, then ./tmux-fleet.yaml, then defaults.
  /// working_dir is set to the current directory.
  static Result<FleetConfig>
  resolve(const std::optional<std::string> &explicit_path);
};

} // namespace fleet
