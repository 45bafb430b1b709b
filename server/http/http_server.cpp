#include "server/http/http_server.h"

#include "control/config_store.h"
#include "proxy/proxy_gateway.h"
#include "server/http/control_api.h"
#include "server/logging/log_buffer.h"
#include "server/logging/logger.h"

#include <nlohmann/json.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstring>
#include <string>
#include <utility>

#include <openssl/err.h>
#include <openssl/ssl.h>

using json = nlohmann::json;

namespace enginectl {

namespace {

std::string StatusText(int status) {
  switch (status) {
  case 200:
    return "OK";
  case 201:
    return "Created";
  case 204:
    return "No Content";
  case 400:
    return "Bad Request";
  case 401:
    return "Unauthorized";
  case 403:
    return "Forbidden";
  case 404:
    return "Not Found";
  case 409:
    return "Conflict";
  case 413:
    return "Payload Too Large";
  case 429:
    return "Too Many Requests";
  case 500:
    return "Internal Server Error";
  case 502:
    return "Bad Gateway";
  case 503:
    return "Service Unavailable";
  case 504:
    return "Gateway Timeout";
  default:
    return status < 400 ? "OK" : "Error";
  }
}

std::string BuildResponse(const std::string &body, int status = 200,
                          const std::string &content_type = "application/json",
                          const std::string &extra_headers = "") {
  std::string headers =
      "HTTP/1.1 " + std::to_string(status) + " " + StatusText(status) + "\r\n";
  headers += "Content-Type: " + content_type + "\r\n";
  headers += "Access-Control-Allow-Origin: *\r\n";
  if (!extra_headers.empty()) {
    headers += extra_headers;
  }
  headers += "Connection: close\r\n";
  headers += "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n";
  return headers + body;
}

std::string BuildErrorBody(const std::string &error) {
  return json({{"error", error}}).dump();
}

// Case-insensitive Content-Length lookup within the header block.
std::size_t ParseContentLength(const std::string &request,
                               std::size_t header_end) {
  std::string lowered = request.substr(0, header_end);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  auto cl_pos = lowered.find("\r\ncontent-length:");
  if (cl_pos == std::string::npos) {
    return 0;
  }
  auto val_start = cl_pos + 17; // strlen("\r\ncontent-length:")
  while (val_start < header_end && request[val_start] == ' ') {
    ++val_start;
  }
  auto val_end = request.find("\r\n", val_start);
  if (val_end == std::string::npos || val_end > header_end) {
    val_end = header_end;
  }
  try {
    return static_cast<std::size_t>(
        std::stoull(request.substr(val_start, val_end - val_start)));
  } catch (const std::exception &) {
    return 0;
  }
}

struct ProxyRoute {
  const char *path;
  ProxyEndpoint endpoint;
};

constexpr ProxyRoute kProxyRoutes[] = {
    {"/api/v1/chat/completions", ProxyEndpoint::kChatCompletions},
    {"/api/v1/completions", ProxyEndpoint::kCompletions},
    {"/api/v1/embeddings", ProxyEndpoint::kEmbeddings},
    {"/api/v1/responses", ProxyEndpoint::kResponses},
    {"/api/v1/messages", ProxyEndpoint::kMessages},
};

constexpr const char *kPassthroughRoutes[] = {
    "/api/v1/messages/count_tokens",
    "/api/v1/rerank",
    "/api/v1/reranking",
};

} // namespace

// Writes a streamed proxy response straight to the client socket.
class HttpServer::SessionSink : public StreamSink {
public:
  SessionSink(HttpServer *server, ClientSession *session)
      : server_(server), session_(session) {}

  bool Begin(int status, const std::string &content_type) override {
    std::string head = "HTTP/1.1 " + std::to_string(status) + " " +
                       StatusText(status) + "\r\n";
    head += "Content-Type: " + content_type + "\r\n";
    head += "Cache-Control: no-cache\r\n";
    head += "Access-Control-Allow-Origin: *\r\n";
    head += "Connection: close\r\n\r\n";
    open_ = server_->SendAll(*session_, head);
    return open_;
  }

  bool Write(const std::string &chunk) override {
    if (!open_) {
      return false;
    }
    open_ = server_->SendAll(*session_, chunk);
    return open_;
  }

private:
  HttpServer *server_;
  ClientSession *session_;
  bool open_{false};
};

HttpServer::HttpServer(std::string host, int port, ControlApi *api,
                       ProxyGateway *gateway, MetricsRegistry *metrics,
                       TlsConfig tls_config, int num_workers)
    : host_(std::move(host)), port_(port), api_(api), gateway_(gateway),
      metrics_(metrics), num_workers_(num_workers > 0 ? num_workers : 8) {
  if (tls_config.enabled) {
    if (tls_config.cert_path.empty() || tls_config.key_path.empty()) {
      log::Warn("http", "TLS enabled without cert/key; falling back to HTTP");
    } else {
      SSL_load_error_strings();
      OpenSSL_add_ssl_algorithms();
      ssl_ctx_ = SSL_CTX_new(TLS_server_method());
      if (!ssl_ctx_) {
        log::Error("http", "failed to initialize TLS context");
      } else {
        SSL_CTX_set_ecdh_auto(ssl_ctx_, 1);
        if (SSL_CTX_use_certificate_file(ssl_ctx_, tls_config.cert_path.c_str(),
                                         SSL_FILETYPE_PEM) <= 0) {
          log::Error("http", "failed to load TLS certificate",
                     "path=" + tls_config.cert_path);
          SSL_CTX_free(ssl_ctx_);
          ssl_ctx_ = nullptr;
        } else if (SSL_CTX_use_PrivateKey_file(ssl_ctx_,
                                               tls_config.key_path.c_str(),
                                               SSL_FILETYPE_PEM) <= 0) {
          log::Error("http", "failed to load TLS key",
                     "path=" + tls_config.key_path);
          SSL_CTX_free(ssl_ctx_);
          ssl_ctx_ = nullptr;
        } else {
          tls_enabled_ = true;
          log::Info("http", "TLS enabled", "cert=" + tls_config.cert_path);
        }
      }
    }
  }
}

HttpServer::~HttpServer() {
  Stop();
  if (ssl_ctx_) {
    SSL_CTX_free(ssl_ctx_);
    ssl_ctx_ = nullptr;
  }
}

void HttpServer::Start() {
  if (running_) {
    return;
  }
  running_ = true;
  for (int i = 0; i < num_workers_; ++i) {
    workers_.emplace_back(&HttpServer::WorkerLoop, this);
  }
  accept_thread_ = std::thread(&HttpServer::Run, this);
}

void HttpServer::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  // Closing the listening socket unblocks accept() in Run().
  int fd = server_fd_.exchange(-1);
  if (fd >= 0) {
    ::shutdown(fd, SHUT_RDWR);
    ::close(fd);
  }
  queue_cv_.notify_all();
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  for (auto &w : workers_) {
    if (w.joinable()) {
      w.join();
    }
  }
  workers_.clear();
  std::lock_guard<std::mutex> lock(queue_mutex_);
  while (!client_queue_.empty()) {
    auto session = std::move(client_queue_.front());
    client_queue_.pop();
    CloseSession(session);
  }
}

void HttpServer::WorkerLoop() {
  while (true) {
    ClientSession session;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait(lock,
                     [this] { return !client_queue_.empty() || !running_; });
      if (!running_ && client_queue_.empty()) {
        return;
      }
      session = std::move(client_queue_.front());
      client_queue_.pop();
    }
    if (session.fd >= 0) {
      HandleClient(session);
      CloseSession(session);
    }
  }
}

void HttpServer::Run() {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    log::Error("http", "socket() failed", std::strerror(errno));
    return;
  }

  int opt = 1;
  ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

  sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(port_));
  addr.sin_addr.s_addr = inet_addr(host_.c_str());

  if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
    log::Error("http", "bind() failed",
               host_ + ":" + std::to_string(port_) + " " + std::strerror(errno));
    ::close(fd);
    return;
  }

  if (::listen(fd, 128) < 0) {
    log::Error("http", "listen() failed", std::strerror(errno));
    ::close(fd);
    return;
  }

  server_fd_.store(fd);
  log::Info("http", "listening", host_ + ":" + std::to_string(port_));

  while (running_) {
    sockaddr_in client_addr;
    socklen_t client_len = sizeof(client_addr);
    int client_fd =
        ::accept(fd, reinterpret_cast<sockaddr *>(&client_addr), &client_len);
    if (client_fd < 0) {
      break; // closed by Stop()
    }
    if (!running_) {
      ::close(client_fd);
      break;
    }
    ClientSession session;
    session.fd = client_fd;
    if (tls_enabled_) {
      SSL *ssl = SSL_new(ssl_ctx_);
      if (!ssl) {
        ::close(client_fd);
        continue;
      }
      SSL_set_fd(ssl, client_fd);
      if (SSL_accept(ssl) != 1) {
        SSL_free(ssl);
        ::close(client_fd);
        continue;
      }
      session.ssl = ssl;
    }
    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      client_queue_.push(std::move(session));
    }
    queue_cv_.notify_one();
  }

  int expected = fd;
  if (server_fd_.compare_exchange_strong(expected, -1)) {
    ::close(fd);
  }
}

void HttpServer::HandleClient(ClientSession &session) {
  // Decrements connections and records latency on every exit path.
  auto req_start = std::chrono::steady_clock::now();
  struct ConnectionGuard {
    MetricsRegistry *metrics;
    std::chrono::steady_clock::time_point start;
    ~ConnectionGuard() {
      if (metrics) {
        auto elapsed = std::chrono::steady_clock::now() - start;
        double ms = std::chrono::duration<double, std::milli>(elapsed).count();
        metrics->RecordLatency(ms);
        metrics->DecrementConnections();
      }
    }
  } guard{metrics_, req_start};
  if (metrics_) {
    metrics_->IncrementConnections();
  }

  constexpr std::size_t kInitialBuf = 4096;
  constexpr std::size_t kMaxRequest = 16 * 1024 * 1024;
  std::string request;
  request.resize(kInitialBuf);
  std::size_t total = 0;
  std::size_t header_end_pos = std::string::npos;

  // Phase 1: read until the end of the header block.
  while (header_end_pos == std::string::npos) {
    if (total >= request.size()) {
      if (request.size() >= kMaxRequest) {
        SendAll(session, BuildResponse(BuildErrorBody("request_too_large"), 413));
        return;
      }
      request.resize(std::min(request.size() * 2, kMaxRequest));
    }
    ssize_t bytes = Receive(session, &request[total], request.size() - total);
    if (bytes <= 0) {
      return;
    }
    total += static_cast<std::size_t>(bytes);
    request.resize(total);
    header_end_pos = request.find("\r\n\r\n");
    if (header_end_pos == std::string::npos) {
      request.resize(std::max(total + kInitialBuf, total * 2));
    }
  }

  // Phase 2: read the rest of the body.
  std::size_t body_start = header_end_pos + 4;
  std::size_t content_length = ParseContentLength(request, header_end_pos);
  if (content_length > kMaxRequest) {
    SendAll(session, BuildResponse(BuildErrorBody("request_too_large"), 413));
    return;
  }
  std::size_t needed = body_start + content_length;
  if (needed > total) {
    request.resize(needed);
    while (total < needed) {
      ssize_t bytes = Receive(session, &request[total], needed - total);
      if (bytes <= 0) {
        return;
      }
      total += static_cast<std::size_t>(bytes);
    }
  }
  request.resize(std::min(total, needed));

  std::string headers = request.substr(0, header_end_pos);
  std::string body = request.substr(body_start);
  auto first_line_end = headers.find("\r\n");
  std::string first_line = headers.substr(0, first_line_end);
  auto method_end = first_line.find(' ');
  if (method_end == std::string::npos) {
    SendAll(session, BuildResponse(BuildErrorBody("bad_request"), 400));
    return;
  }
  auto path_end = first_line.find(' ', method_end + 1);
  std::string method = first_line.substr(0, method_end);
  std::string target =
      first_line.substr(method_end + 1, path_end == std::string::npos
                                            ? std::string::npos
                                            : path_end - method_end - 1);

  int status = 500;
  try {
    status = Dispatch(session, method, target, body);
  } catch (const std::exception &ex) {
    log::Error("http", "request failed", method + " " + target + " " + ex.what());
    SendAll(session, BuildResponse(BuildErrorBody(ex.what()), 500));
  }

  if (access_log_ && access_store_ &&
      access_store_->GetSettings().request_logging &&
      target.compare(0, 5, "/api/") == 0) {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::steady_clock::now() - req_start)
                       .count();
    access_log_->Add("http", method + " " + target + " " +
                                 std::to_string(status) + " " +
                                 std::to_string(elapsed) + "ms");
  }
}

void HttpServer::SetAccessLog(const ConfigStore *store, LogBuffer *log_buffer) {
  access_store_ = store;
  access_log_ = log_buffer;
}

int HttpServer::Dispatch(ClientSession &session, const std::string &method,
                         const std::string &target, const std::string &body) {
  std::string path = target;
  std::string query;
  auto qpos = target.find('?');
  if (qpos != std::string::npos) {
    path = target.substr(0, qpos);
    query = target.substr(qpos + 1);
  }

  if (method == "GET" && (path == "/healthz" || path == "/livez")) {
    SendAll(session, BuildResponse(json({{"status", "ok"}}).dump()));
    return 200;
  }

  // CORS preflight.
  if (method == "OPTIONS") {
    std::string cors_headers =
        "HTTP/1.1 204 No Content\r\n"
        "Access-Control-Allow-Origin: *\r\n"
        "Access-Control-Allow-Methods: GET, POST, PUT, DELETE, OPTIONS\r\n"
        "Access-Control-Allow-Headers: Content-Type, Authorization\r\n"
        "Access-Control-Max-Age: 86400\r\n"
        "Content-Length: 0\r\n\r\n";
    SendAll(session, cors_headers);
    return 204;
  }

  if (method == "GET" && path == "/metrics") {
    std::string metrics_body = metrics_ ? metrics_->RenderPrometheus() : "";
    SendAll(session,
            BuildResponse(metrics_body, 200, "text/plain; version=0.0.4"));
    return 200;
  }

  if (method == "POST" && gateway_) {
    for (const auto &route : kPassthroughRoutes) {
      if (path == route) {
        auto response = gateway_->Passthrough(path.substr(4), body);
        SendAll(session,
                BuildResponse(response.body, response.status, response.content_type));
        return response.status;
      }
    }
    for (const auto &route : kProxyRoutes) {
      if (path == route.path) {
        SessionSink sink(this, &session);
        auto response = gateway_->Handle(route.endpoint, body, &sink);
        if (!response.streamed) {
          SendAll(session, BuildResponse(response.body, response.status,
                                         response.content_type));
        }
        return response.status;
      }
    }
  }

  if (api_) {
    ApiRequest api_request;
    api_request.method = method;
    api_request.path = UrlDecode(path);
    api_request.query = ParseQuery(query);
    api_request.body = body;
    if (auto reply = api_->Handle(api_request)) {
      SendAll(session, BuildResponse(reply->body, reply->status));
      return reply->status;
    }
  }

  SendAll(session, BuildResponse(BuildErrorBody("not_found"), 404));
  return 404;
}

bool HttpServer::SendAll(ClientSession &session, const std::string &payload) {
  const char *data = payload.c_str();
  std::size_t remaining = payload.size();
  while (remaining > 0) {
    int sent = 0;
    if (session.ssl) {
      sent = SSL_write(session.ssl, data, static_cast<int>(remaining));
      if (sent <= 0) {
        int err = SSL_get_error(session.ssl, sent);
        if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
          continue;
        }
        return false;
      }
    } else {
      sent = static_cast<int>(::send(session.fd, data, remaining, MSG_NOSIGNAL));
      if (sent <= 0) {
        if (errno == EINTR) {
          continue;
        }
        return false;
      }
    }
    data += sent;
    remaining -= static_cast<std::size_t>(sent);
  }
  return true;
}

ssize_t HttpServer::Receive(ClientSession &session, char *buffer,
                            std::size_t length) {
  if (session.ssl) {
    while (true) {
      int received = SSL_read(session.ssl, buffer, static_cast<int>(length));
      if (received > 0) {
        return received;
      }
      int err = SSL_get_error(session.ssl, received);
      if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
        continue;
      }
      return -1;
    }
  }
  while (true) {
    ssize_t received = ::recv(session.fd, buffer, length, 0);
    if (received < 0 && errno == EINTR) {
      continue;
    }
    return received;
  }
}

void HttpServer::CloseSession(ClientSession &session) {
  if (session.ssl) {
    SSL_shutdown(session.ssl);
    SSL_free(session.ssl);
    session.ssl = nullptr;
  }
  if (session.fd >= 0) {
    ::close(session.fd);
    session.fd = -1;
  }
}

} // namespace enginectl
