#pragma once

#include "net/http_client.h"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <vector>

namespace enginectl {

// One entry of the engine's GET /models listing.
struct EngineModel {
  std::string id;
  std::string status; // "loaded", "loading", "unloaded", ...
  std::vector<std::string> args;
};

nlohmann::json ToJson(const EngineModel &model);

struct EngineHealth {
  bool reachable{false};
  int status_code{0};
  std::string status;

  // 200 with status "ok" or "no slot available" (busy but serving).
  bool Ready() const {
    return reachable && status_code == 200 &&
           (status == "ok" || status == "no slot available");
  }
};

// Streaming upstream response body.
class EngineResponseStream {
public:
  virtual ~EngineResponseStream() = default;
  virtual int Status() const = 0;
  virtual std::string ContentType() const = 0;
  // Next raw body piece; false once the body ends.
  virtual bool Next(std::string *chunk) = 0;
};

// Typed calls against the engine's HTTP API. Transport failures surface as
// ConnectionError; HTTP error statuses are returned.
class EngineClient {
public:
  virtual ~EngineClient() = default;

  virtual EngineHealth Health() = 0;
  virtual std::vector<EngineModel> ListModels() = 0;
  virtual bool UnloadModel(const std::string &model_id) = 0;

  // POST `path` (e.g. "/v1/chat/completions") with a JSON body.
  virtual HttpResponse Forward(const std::string &path,
                               const std::string &body) = 0;
  virtual std::unique_ptr<EngineResponseStream>
  ForwardStream(const std::string &path, const std::string &body) = 0;
};

class HttpEngineClient : public EngineClient {
public:
  // base_url: "http://127.0.0.1:8080"
  explicit HttpEngineClient(std::string base_url, int io_timeout_sec = 600);

  EngineHealth Health() override;
  std::vector<EngineModel> ListModels() override;
  bool UnloadModel(const std::string &model_id) override;
  HttpResponse Forward(const std::string &path,
                       const std::string &body) override;
  std::unique_ptr<EngineResponseStream>
  ForwardStream(const std::string &path, const std::string &body) override;

  const std::string &BaseUrl() const { return base_url_; }

private:
  std::string base_url_;
  HttpClient client_;
  HttpClient probe_client_; // short timeouts for health and model listing
};

// Parses the body of GET /models ({"data": [...]}). Malformed input yields an
// empty list.
std::vector<EngineModel> ParseEngineModels(const std::string &body);

} // namespace enginectl
