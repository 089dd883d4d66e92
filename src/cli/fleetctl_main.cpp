#include "tmux-fleet/FleetConfig.hpp"
#include "tmux-fleet/Logger.hpp"
#include "tmux-fleet/Validator.hpp"
#include "tmux-fleet/ipc/TmuxClient.hpp"
#include "tmux-fleet/lifecycle/LifecycleController.hpp"
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

using namespace fleet;

namespace {

void print_usage(std::ostream &os) {
  os << "Usage: fleetctl [--config <path>] [--log-level <level>] <command> "
        "[options]\n\n";
  os << "Manage local web server instances, one tmux window each.\n\n";
  os << "Commands:\n";
  os << "  start --name <name> --port <port>   Start a new server instance\n";
  os << "  stop --name <name>                  Stop a running instance\n";
  os << "  stop_all                            Stop all running instances\n";
  os << "  collect_all                         Print combined logs of all "
        "active instances\n";
  os << "\nOptions:\n";
  os << "  --name <name>        Unique instance name [a-z]{1,32}\n";
  os << "  --port <port>        Port the instance binds\n";
  os << "  --config <path>      YAML config (default: $" << kConfigEnvVar
     << " or ./" << kDefaultConfigFile << ")\n";
  os << "  --log-level <level>  trace|debug|info|warn|error|off\n";
  os << "  -h, --help           Show this help\n";
}

struct CommandLine {
  std::string command;
  std::optional<std::string> config_path;
  std::optional<std::string> log_level;
  std::map<std::string, std::string> flags;
};

bool is_help(const std::string &arg) { return arg == "--help" || arg == "-h"; }

// Accepts "--key value" and "--key=value". Returns false and sets error on
// unknown flags or a missing value.
bool take_flag(const std::vector<std::string> &args, size_t &i,
               const std::set<std::string> &allowed,
               std::map<std::string, std::string> &out, std::string &error) {
  const std::string &arg = args[i];
  std::string key = arg;
  std::optional<std::string> value;
  auto eq = arg.find('=');
  if (eq != std::string::npos) {
    key = arg.substr(0, eq);
    value = arg.substr(eq + 1);
  }

  if (key.rfind("--", 0) != 0 || !allowed.count(key)) {
    error = "unrecognized argument: " + arg;
    return false;
  }
  if (!value) {
    if (i + 1 >= args.size()) {
      error = "argument " + key + ": expected one argument";
      return false;
    }
    value = args[++i];
  }
  out[key] = *value;
  return true;
}

const std::map<std::string, std::set<std::string>> kCommandFlags = {
    {"start", {"--name", "--port"}},
    {"stop", {"--name"}},
    {"stop_all", {}},
    {"collect_all", {}}};

const std::map<std::string, std::vector<std::string>> kRequiredFlags = {
    {"start", {"--name", "--port"}}, {"stop", {"--name"}}};

// Returns an exit code when parsing ends the run (help/usage errors)
std::optional<int> parse_command_line(int argc, char **argv,
                                      CommandLine &cmd) {
  std::vector<std::string> args(argv + 1, argv + argc);
  const std::set<std::string> global_flags = {"--config", "--log-level"};
  std::map<std::string, std::string> flags;
  std::string error;

  for (size_t i = 0; i < args.size(); ++i) {
    const std::string &arg = args[i];
    if (is_help(arg)) {
      print_usage(std::cout);
      return 0;
    }

    if (cmd.command.empty() && arg.rfind("--", 0) != 0) {
      cmd.command = arg;
      if (!kCommandFlags.count(cmd.command)) {
        std::cerr << "Unknown command: " << cmd.command << "\n\n";
        print_usage(std::cerr);
        return 1;
      }
      continue;
    }

    std::set<std::string> allowed = global_flags;
    if (!cmd.command.empty()) {
      const auto &own = kCommandFlags.at(cmd.command);
      allowed.insert(own.begin(), own.end());
    }
    if (!take_flag(args, i, allowed, flags, error)) {
      std::cerr << "ERROR: " << error << "\n";
      print_usage(std::cerr);
      return 1;
    }
  }

  if (cmd.command.empty()) {
    print_usage(std::cerr);
    return 1;
  }

  auto required = kRequiredFlags.find(cmd.command);
  if (required != kRequiredFlags.end()) {
    for (const auto &flag : required->second) {
      if (!flags.count(flag)) {
        std::cerr << "ERROR: " << cmd.command << ": the following argument is "
                  << "required: " << flag << "\n";
        return 1;
      }
    }
  }

  if (flags.count("--config"))
    cmd.config_path = flags["--config"];
  if (flags.count("--log-level"))
    cmd.log_level = flags["--log-level"];
  cmd.flags = std::move(flags);
  return std::nullopt;
}

int report(const Status &status) {
  if (status)
    return 0;
  const Error &error = status.error();
  LOG_DEBUG("MAIN", error_kind_name(error.kind), "{}", error.message);
  std::cerr << "ERROR: " << error.message << "\n";
  return 1;
}

int cmd_start(LifecycleController &controller, const CommandLine &cmd) {
  auto name = validate_name(cmd.flags.at("--name"));
  if (!name)
    return report(name.error());
  auto port = validate_port(cmd.flags.at("--port"));
  if (!port)
    return report(port.error());
  return report(controller.start(name.value(), port.value()));
}

int cmd_stop(LifecycleController &controller, const CommandLine &cmd) {
  auto name = validate_name(cmd.flags.at("--name"));
  if (!name)
    return report(name.error());
  return report(controller.stop(name.value()));
}

} // namespace

int main(int argc, char **argv) {
  CommandLine cmd;
  if (auto exit_code = parse_command_line(argc, argv, cmd)) {
    return *exit_code;
  }

  // Console-only until the config names a log file and level
  FleetLogger::instance().init(
      "", parse_log_level(cmd.log_level.value_or("warn")),
      ConsoleStream::Stderr);

  auto config = FleetConfig::resolve(cmd.config_path);
  if (!config) {
    std::cerr << "ERROR: " << config.error().message << "\n";
    return 1;
  }

  const std::string level =
      cmd.log_level ? *cmd.log_level : config.value().tool_log_level;
  FleetLogger::instance().shutdown();
  FleetLogger::instance().init(config.value().tool_log_file,
                               parse_log_level(level), ConsoleStream::Stderr);
  LOG_DEBUG("MAIN", cmd.command, "Working directory {}, session '{}'",
            config.value().working_dir.string(),
            config.value().session_name);

  ipc::TmuxClient tmux(config.value().tmux_binary);
  LifecycleController controller(config.value(), tmux, std::cout);

  if (cmd.command == "start") {
    return cmd_start(controller, cmd);
  } else if (cmd.command == "stop") {
    return cmd_stop(controller, cmd);
  } else if (cmd.command == "stop_all") {
    return report(controller.stop_all());
  } else {
    return report(controller.collect_all());
  }
}
