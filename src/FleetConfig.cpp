#include "tmux-fleet/FleetConfig.hpp"
#include "tmux-fleet/Logger.hpp"
#include "tmux-fleet/Validator.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <set>
#include <utility>
#include <system_error>
#include <yaml-cpp/yaml.h>

namespace fleet {

namespace fs = std::filesystem;

namespace {

const std::set<std::string> kKnownKeys = {
    "session",     "artifact",         "log_file", "backup_dir",
    "tmux_binary", "instance_env_var", "logging"};

// Assign node to out when present; a non-scalar is a type error
Status read_string(const YAML::Node &parent, const std::string &key,
                   std::string &out) {
  const YAML::Node node = parent[key];
  if (!node)
    return ok_status();
  if (!node.IsScalar()) {
    return make_error(ErrorKind::InvalidInput,
                      "config key '{}' must be a string", key);
  }
  out = node.as<std::string>();
  return ok_status();
}

bool is_plain_file_name(const std::string &name) {
  return !name.empty() && name != "." && name != ".." &&
         name.find('/') == std::string::npos;
}

// [A-Za-z_][A-Za-z0-9_]*, the shell's variable name syntax
bool is_env_var_name(const std::string &name) {
  if (name.empty() || std::isdigit(static_cast<unsigned char>(name[0])))
    return false;
  return std::all_of(name.begin(), name.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
  });
}

Status apply_yaml(const YAML::Node &root, FleetConfig &config) {
  if (!root || root.IsNull())
    return ok_status();
  if (!root.IsMap()) {
    return make_error(ErrorKind::InvalidInput,
                      "config root must be a mapping");
  }

  for (const auto &kv : root) {
    auto key = kv.first.as<std::string>();
    if (!kKnownKeys.count(key)) {
      LOG_WARN("CONFIG", "LOAD", "Ignoring unknown config key: {}", key);
    }
  }

  const std::pair<const char *, std::string *> string_fields[] = {
      {"session", &config.session_name},
      {"artifact", &config.artifact_name},
      {"log_file", &config.log_file_name},
      {"backup_dir", &config.backup_dir_name},
      {"tmux_binary", &config.tmux_binary},
      {"instance_env_var", &config.instance_env_var}};

  for (const auto &[key, field] : string_fields) {
    auto status = read_string(root, key, *field);
    if (!status)
      return status;
  }

  const YAML::Node logging = root["logging"];
  if (logging) {
    if (!logging.IsMap()) {
      return make_error(ErrorKind::InvalidInput,
                        "config key 'logging' must be a mapping");
    }
    auto status = read_string(logging, "file", config.tool_log_file);
    if (!status)
      return status;
    status = read_string(logging, "level", config.tool_log_level);
    if (!status)
      return status;
  }

  return config.validate();
}

} // namespace

Status FleetConfig::validate() const {
  if (session_name.empty() ||
      session_name.find_first_of(":.") != std::string::npos) {
    return make_error(ErrorKind::InvalidInput,
                      "session name '{}' must be non-empty and contain no "
                      "':' or '.'",
                      session_name);
  }
  if (!is_plain_file_name(artifact_name)) {
    return make_error(ErrorKind::InvalidInput,
                      "artifact '{}' must be a plain file name", artifact_name);
  }
  if (!is_plain_file_name(log_file_name)) {
    return make_error(ErrorKind::InvalidInput,
                      "log_file '{}' must be a plain file name", log_file_name);
  }
  if (!is_plain_file_name(backup_dir_name)) {
    return make_error(ErrorKind::InvalidInput,
                      "backup_dir '{}' must be a plain file name",
                      backup_dir_name);
  }
  // stop_all retires every directory named like an instance
  if (is_instance_name(artifact_name)) {
    return make_error(ErrorKind::InvalidInput,
                      "artifact '{}' must not look like an instance name",
                      artifact_name);
  }
  if (is_instance_name(backup_dir_name)) {
    return make_error(ErrorKind::InvalidInput,
                      "backup_dir '{}' must not look like an instance name",
                      backup_dir_name);
  }
  if (artifact_name == backup_dir_name) {
    return make_error(ErrorKind::InvalidInput,
                      "artifact and backup_dir must differ");
  }
  if (tmux_binary.empty()) {
    return make_error(ErrorKind::InvalidInput, "tmux_binary must not be empty");
  }
  if (!is_env_var_name(instance_env_var)) {
    return make_error(ErrorKind::InvalidInput,
                      "instance_env_var '{}' is not a valid variable name",
                      instance_env_var);
  }
  return ok_status();
}

Result<FleetConfig> FleetConfig::from_yaml_string(const std::string &yaml) {
  FleetConfig config;
  try {
    auto status = apply_yaml(YAML::Load(yaml), config);
    if (!status)
      return status.error();
  } catch (const YAML::Exception &ex) {
    return make_error(ErrorKind::InvalidInput, "invalid config: {}",
                      ex.what());
  }
  return config;
}

Result<FleetConfig> FleetConfig::load_file(const fs::path &path) {
  LOG_DEBUG("CONFIG", "LOAD", "Loading config from: {}", path.string());

  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    return make_error(ErrorKind::InvalidInput, "config file {} not found",
                      path.string());
  }

  FleetConfig config;
  try {
    auto status = apply_yaml(YAML::LoadFile(path.string()), config);
    if (!status)
      return status.error();
  } catch (const YAML::Exception &ex) {
    return make_error(ErrorKind::InvalidInput, "invalid config {}: {}",
                      path.string(), ex.what());
  }
  return config;
}

Result<FleetConfig>
FleetConfig::resolve(const std::optional<std::string> &explicit_path) {
  std::error_code ec;
  fs::path cwd = fs::current_path(ec);
  if (ec) {
    return make_error(ErrorKind::IOFailure,
                      "cannot determine working directory: {}", ec.message());
  }

  std::optional<fs::path> source;
  if (explicit_path) {
    source = *explicit_path;
  } else if (const char *env = std::getenv(kConfigEnvVar);
             env != nullptr && *env != '\0') {
    source = env;
  } else if (fs::is_regular_file(cwd / kDefaultConfigFile, ec)) {
    source = cwd / kDefaultConfigFile;
  }

  Result<FleetConfig> loaded =
      source ? load_file(*source) : Result<FleetConfig>(FleetConfig{});
  if (!loaded)
    return loaded;

  FleetConfig config = std::move(loaded).value();
  config.working_dir = cwd;
  return config;
}

} // namespace fleet
