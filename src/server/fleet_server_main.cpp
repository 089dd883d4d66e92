#include "tmux-fleet/Logger.hpp"
#include "tmux-fleet/Validator.hpp"
#include "tmux-fleet/server/InstanceHttpServer.hpp"
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <unistd.h>

using namespace fleet;

static volatile std::sig_atomic_t g_running = 1;
static volatile std::sig_atomic_t g_signal = 0;

void signal_handler(int sig) {
  g_signal = sig;
  g_running = 0;
}

void print_usage() {
  std::cout << "Usage: fleet-server [--name <name>] [--port <port>] "
               "[--bind <addr>]\n\n";
  std::cout << "Minimal multi-instance web app\n\n";
  std::cout << "  --name <name>   Unique instance name [a-z]{1,32} "
               "(default: $INSTANCE_NAME or 'server')\n";
  std::cout << "  --port <port>   HTTP port (default: $PORT or 8000)\n";
  std::cout << "  --bind <addr>   IPv4 address to listen on (default: "
               "0.0.0.0)\n";
}

static std::string env_or(const char *key, const std::string &fallback) {
  const char *value = std::getenv(key);
  return (value && *value) ? std::string(value) : fallback;
}

int main(int argc, char **argv) {
  std::string name = env_or("INSTANCE_NAME", "server");
  std::string port_text = env_or("PORT", "8000");
  std::string bind_address = "0.0.0.0";

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else if (arg == "--name" && i + 1 < argc) {
      name = argv[++i];
    } else if (arg == "--port" && i + 1 < argc) {
      port_text = argv[++i];
    } else if (arg == "--bind" && i + 1 < argc) {
      bind_address = argv[++i];
    } else {
      std::cerr << "ERROR: unrecognized argument: " << arg << "\n";
      print_usage();
      return 2;
    }
  }

  if (!is_instance_name(name)) {
    std::cerr << "ERROR: --name must be 1..32 lowercase Latin letters [a-z]\n";
    return 2;
  }
  auto port = validate_port(port_text);
  if (!port || port.value() < 0 || port.value() > 65535) {
    std::cerr << "ERROR: --port must be an integer in 0..65535\n";
    return 2;
  }

  // stdout is redirected into the instance log by fleetctl
  FleetLogger::instance().init("", spdlog::level::info, ConsoleStream::Stdout,
                               "%Y-%m-%dT%H:%M:%SZ [%l] %v");

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);
  // tmux kill-window hangs up the pane
  std::signal(SIGHUP, signal_handler);

  server::InstanceHttpServer http(name);
  if (!http.start(bind_address, static_cast<uint16_t>(port.value()))) {
    LOG_ERROR("WEB", name, "Could not start HTTP server");
    return 1;
  }

  LOG_INFO("WEB", name, "starting HTTP on port {}, pid={}", http.port(),
           getpid());
  LOG_INFO("WEB", name, "try: curl http://localhost:{}/whoami", http.port());

  while (g_running && http.is_running()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (g_signal != 0) {
    LOG_INFO("WEB", name, "received signal {}, shutting down...",
             static_cast<int>(g_signal));
  }
  http.stop();
  LOG_INFO("WEB", name, "server stopped");
  return 0;
}
