#pragma once

#include "server/metrics/metrics.h"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include <openssl/ssl.h>
#include <sys/types.h>

namespace enginectl {

class ConfigStore;
class ControlApi;
class LogBuffer;
class ProxyGateway;

class HttpServer {
public:
  struct TlsConfig {
    bool enabled{false};
    std::string cert_path;
    std::string key_path;
  };

  HttpServer(std::string host, int port, ControlApi *api, ProxyGateway *gateway,
             MetricsRegistry *metrics, TlsConfig tls_config,
             int num_workers = 8);
  ~HttpServer();

  void Start();
  void Stop();

  // One LogBuffer line per /api request while the requestLogging setting
  // is on.
  void SetAccessLog(const ConfigStore *store, LogBuffer *log_buffer);

private:
  struct ClientSession {
    int fd{-1};
    SSL *ssl{nullptr};
  };

  class SessionSink;

  void Run();
  void HandleClient(ClientSession &session);
  // Returns the status sent to the client.
  int Dispatch(ClientSession &session, const std::string &method,
               const std::string &target, const std::string &body);

  bool SendAll(ClientSession &session, const std::string &payload);
  ssize_t Receive(ClientSession &session, char *buffer, std::size_t length);
  void CloseSession(ClientSession &session);

  std::string host_;
  int port_;
  ControlApi *api_;
  ProxyGateway *gateway_;
  MetricsRegistry *metrics_;
  const ConfigStore *access_store_{nullptr};
  LogBuffer *access_log_{nullptr};
  bool tls_enabled_{false};
  SSL_CTX *ssl_ctx_{nullptr};
  std::atomic<bool> running_{false};
  std::atomic<int> server_fd_{-1};
  int num_workers_;
  std::thread accept_thread_;
  std::vector<std::thread> workers_;
  std::queue<ClientSession> client_queue_;
  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;

  void WorkerLoop();
};

} // namespace enginectl
