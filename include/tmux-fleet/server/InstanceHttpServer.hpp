#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>

namespace fleet {
namespace server {

struct HttpResponse {
  int status{200};
  std::string content_type;
  std::string body;
};

/// Minimal HTTP/1.0 responder run by every fleet instance.
///   GET / and /whoami          -> JSON description of the instance
///   GET /health, /healthcheck  -> "OK"
///   anything else              -> 404
class InstanceHttpServer {
public:
  explicit InstanceHttpServer(std::string instance_name);
  ~InstanceHttpServer();

  InstanceHttpServer(const InstanceHttpServer &) = delete;
  InstanceHttpServer &operator=(const InstanceHttpServer &) = delete;

  // Bind and listen, then serve on a background thread. Returns false if
  // the socket could not be bound.
  bool start(const std::string &bind_address, uint16_t port);

  // Stop accepting and join the thread.
  void stop();

  bool is_running() const { return running_; }

  // Bound port (useful if started with 0 to pick ephemeral port)
  uint16_t port() const { return bound_port_; }

  // Route one request; no socket involved
  HttpResponse handle(const std::string &method, const std::string &path,
                      const std::string &client) const;

private:
  void run_loop();
  void serve_client(int client_socket, const std::string &client);

  std::string instance_name_;
  std::string host_;
  std::string started_at_;
  std::chrono::steady_clock::time_point started_;

  std::atomic<bool> running_{false};
  std::thread server_thread_;
  int listen_fd_{-1};
  uint16_t bound_port_{0};
};

/// Current UTC time as ISO-8601 with microseconds and +00:00 offset
std::string utc_timestamp_iso();

} // namespace server
} // namespace fleet
