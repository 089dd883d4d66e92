#include "tmux-fleet/server/InstanceHttpServer.hpp"
#include "tmux-fleet/Logger.hpp"
#include <nlohmann/json.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cmath>
#include <cstring>
#include <ctime>
#include <sstream>

using json = nlohmann::ordered_json;

namespace fleet {
namespace server {

namespace {
constexpr int BACKLOG = 16;
constexpr size_t MAX_HEADER_READ = 64 * 1024; // 64 KB

// Read until "\r\n\r\n" or until limit. Any body is ignored.
bool read_http_headers(int fd, std::string &out_headers) {
  out_headers.clear();
  char buf[1024];
  while (out_headers.size() < MAX_HEADER_READ) {
    ssize_t r = recv(fd, buf, sizeof(buf), 0);
    if (r < 0 && errno == EINTR)
      continue;
    if (r <= 0)
      return false;
    out_headers.append(buf, static_cast<size_t>(r));
    auto pos = out_headers.find("\r\n\r\n");
    if (pos != std::string::npos) {
      out_headers.resize(pos + 4);
      return true;
    }
  }
  return false;
}

const char *reason_phrase(int status) {
  switch (status) {
  case 200:
    return "OK";
  case 400:
    return "Bad Request";
  case 404:
    return "Not Found";
  case 405:
    return "Method Not Allowed";
  default:
    return "";
  }
}

void send_http_response(int fd, const HttpResponse &response) {
  std::ostringstream resp;
  resp << "HTTP/1.0 " << response.status << " "
       << reason_phrase(response.status) << "\r\n";
  resp << "Server: fleet-server/1.0\r\n";
  resp << "Content-Type: " << response.content_type << "\r\n";
  resp << "Content-Length: " << response.body.size() << "\r\n";
  resp << "Connection: close\r\n";
  resp << "\r\n";
  resp << response.body;
  std::string s = resp.str();
  size_t sent = 0;
  while (sent < s.size()) {
    ssize_t w = send(fd, s.data() + sent, s.size() - sent, MSG_NOSIGNAL);
    if (w < 0 && errno == EINTR)
      continue;
    if (w <= 0)
      break;
    sent += static_cast<size_t>(w);
  }
}

std::string local_hostname() {
  char buf[256] = {0};
  if (gethostname(buf, sizeof(buf) - 1) != 0)
    return "unknown";
  return buf;
}

} // namespace

std::string utc_timestamp_iso() {
  auto now = std::chrono::system_clock::now();
  std::time_t secs = std::chrono::system_clock::to_time_t(now);
  auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                    now.time_since_epoch())
                    .count() %
                1000000;
  std::tm tm{};
  gmtime_r(&secs, &tm);
  return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:06}+00:00",
                     tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                     tm.tm_min, tm.tm_sec, micros);
}

InstanceHttpServer::InstanceHttpServer(std::string instance_name)
    : instance_name_(std::move(instance_name)), host_(local_hostname()),
      started_at_(utc_timestamp_iso()),
      started_(std::chrono::steady_clock::now()) {}

InstanceHttpServer::~InstanceHttpServer() { stop(); }

HttpResponse InstanceHttpServer::handle(const std::string &method,
                                        const std::string &path,
                                        const std::string &client) const {
  if (method != "GET") {
    return {405, "text/plain; charset=utf-8", "Method not allowed"};
  }

  if (path == "/" || path == "/whoami") {
    double uptime = std::chrono::duration<double>(
                        std::chrono::steady_clock::now() - started_)
                        .count();
    json payload;
    payload["message"] = fmt::format("Hello from instance '{}'",
                                     instance_name_);
    payload["instance"] = instance_name_;
    payload["pid"] = static_cast<int>(getpid());
    payload["port"] = bound_port_;
    payload["host"] = host_;
    payload["started_at"] = started_at_;
    payload["uptime_sec"] = std::round(uptime * 1000.0) / 1000.0;
    payload["path"] = path;
    payload["client"] = client;
    return {200, "application/json; charset=utf-8", payload.dump(2)};
  }

  if (path == "/health" || path == "/healthcheck") {
    return {200, "text/plain; charset=utf-8", "OK"};
  }

  return {404, "text/plain; charset=utf-8", "Not found"};
}

bool InstanceHttpServer::start(const std::string &bind_address,
                               uint16_t port) {
  if (running_) {
    return true;
  }

  listen_fd_ = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (listen_fd_ < 0) {
    LOG_ERROR("WEB", instance_name_, "Failed to create socket: {}",
              strerror(errno));
    return false;
  }

  // Allow immediate reuse
  int opt = 1;
  setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

  struct sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (inet_pton(AF_INET, bind_address.c_str(), &addr.sin_addr) != 1) {
    LOG_ERROR("WEB", instance_name_, "Invalid bind address: {}", bind_address);
    close(listen_fd_);
    listen_fd_ = -1;
    return false;
  }

  if (bind(listen_fd_, reinterpret_cast<struct sockaddr *>(&addr),
           sizeof(addr)) < 0) {
    LOG_ERROR("WEB", instance_name_, "bind {}:{} failed: {}", bind_address,
              port, strerror(errno));
    close(listen_fd_);
    listen_fd_ = -1;
    return false;
  }

  if (listen(listen_fd_, BACKLOG) < 0) {
    LOG_ERROR("WEB", instance_name_, "listen failed: {}", strerror(errno));
    close(listen_fd_);
    listen_fd_ = -1;
    return false;
  }

  // If port was 0, query assigned port
  struct sockaddr_in sin;
  socklen_t len = sizeof(sin);
  if (getsockname(listen_fd_, reinterpret_cast<struct sockaddr *>(&sin),
                  &len) == 0) {
    bound_port_ = ntohs(sin.sin_port);
  } else {
    bound_port_ = port;
  }

  running_ = true;
  server_thread_ = std::thread(&InstanceHttpServer::run_loop, this);
  return true;
}

void InstanceHttpServer::stop() {
  if (running_.exchange(false) && listen_fd_ >= 0) {
    // Unblocks accept() in the server thread
    shutdown(listen_fd_, SHUT_RDWR);
  }

  if (server_thread_.joinable()) {
    server_thread_.join();
  }

  if (listen_fd_ >= 0) {
    close(listen_fd_);
    listen_fd_ = -1;
  }
}

void InstanceHttpServer::run_loop() {
  while (running_) {
    struct sockaddr_in client_addr;
    socklen_t client_len = sizeof(client_addr);
    int client_socket =
        accept4(listen_fd_, reinterpret_cast<struct sockaddr *>(&client_addr),
                &client_len, SOCK_CLOEXEC);
    if (client_socket < 0) {
      if (!running_)
        break;
      if (errno == EINTR)
        continue;
      LOG_WARN("WEB", instance_name_, "accept failed: {}", strerror(errno));
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
      continue;
    }

    char client_ip[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &client_addr.sin_addr, client_ip, sizeof(client_ip));
    serve_client(client_socket, client_ip);
    close(client_socket);
  }

  // Serving thread may also end on its own after a fatal accept error
  running_ = false;
}

void InstanceHttpServer::serve_client(int client_socket,
                                      const std::string &client) {
  std::string headers;
  if (!read_http_headers(client_socket, headers)) {
    LOG_WARN("WEB", instance_name_, "Failed to read HTTP headers from {}",
             client);
    return;
  }

  std::istringstream hs(headers);
  std::string request_line;
  std::getline(hs, request_line);
  if (!request_line.empty() && request_line.back() == '\r')
    request_line.pop_back();

  std::string method, path, proto;
  {
    std::istringstream rl(request_line);
    rl >> method >> path >> proto;
  }

  if (method.empty() || path.empty()) {
    send_http_response(client_socket,
                       {400, "text/plain; charset=utf-8", "Bad request"});
    LOG_WARN("WEB", instance_name_, "Malformed request line from {}", client);
    return;
  }

  HttpResponse response = handle(method, path, client);
  send_http_response(client_socket, response);

  if (response.status == 200) {
    LOG_INFO("WEB", instance_name_, "{} {} -> 200 ({} bytes)", method, path,
             response.body.size());
  } else {
    LOG_WARN("WEB", instance_name_, "{} {} -> {}", method, path,
             response.status);
  }
}

} // namespace server
} // namespace fleet
