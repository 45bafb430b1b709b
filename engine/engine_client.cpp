#include "engine/engine_client.h"

#include "server/logging/logger.h"

using json = nlohmann::json;

namespace enginectl {

namespace {

class HttpEngineStream : public EngineResponseStream {
public:
  explicit HttpEngineStream(std::unique_ptr<HttpStream> stream)
      : stream_(std::move(stream)) {}

  int Status() const override { return stream_->Status(); }
  std::string ContentType() const override {
    return stream_->Head().Header("content-type");
  }
  bool Next(std::string *chunk) override { return stream_->Next(chunk); }

private:
  std::unique_ptr<HttpStream> stream_;
};

} // namespace

json ToJson(const EngineModel &model) {
  return {{"id", model.id},
          {"status", {{"value", model.status}, {"args", model.args}}}};
}

std::vector<EngineModel> ParseEngineModels(const std::string &body) {
  std::vector<EngineModel> models;
  json parsed = json::parse(body, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object() || !parsed.contains("data") ||
      !parsed["data"].is_array()) {
    return models;
  }
  for (const auto &item : parsed["data"]) {
    if (!item.is_object()) {
      continue;
    }
    EngineModel model;
    model.id = item.value("id", "");
    if (item.contains("status") && item["status"].is_object()) {
      const auto &status = item["status"];
      model.status = status.value("value", "");
      if (status.contains("args") && status["args"].is_array()) {
        for (const auto &arg : status["args"]) {
          if (arg.is_string()) {
            model.args.push_back(arg.get<std::string>());
          } else {
            model.args.push_back(arg.dump());
          }
        }
      }
    }
    models.push_back(std::move(model));
  }
  return models;
}

HttpEngineClient::HttpEngineClient(std::string base_url, int io_timeout_sec)
    : base_url_(std::move(base_url)), client_(io_timeout_sec), probe_client_(5) {}

EngineHealth HttpEngineClient::Health() {
  EngineHealth health;
  try {
    auto response = probe_client_.Get(base_url_ + "/health");
    health.reachable = true;
    health.status_code = response.status;
    json body = json::parse(response.body, nullptr, false);
    if (!body.is_discarded() && body.is_object() && body.contains("status") &&
        body["status"].is_string()) {
      health.status = body["status"].get<std::string>();
    }
  } catch (const std::exception &e) {
    log::Debug("engine_client", "health probe failed", e.what());
  }
  return health;
}

std::vector<EngineModel> HttpEngineClient::ListModels() {
  auto response = probe_client_.Get(base_url_ + "/models");
  if (response.status != 200) {
    log::Warn("engine_client", "model listing failed",
              "status=" + std::to_string(response.status));
    return {};
  }
  return ParseEngineModels(response.body);
}

bool HttpEngineClient::UnloadModel(const std::string &model_id) {
  auto response = client_.Post(base_url_ + "/models/unload",
                               json({{"model", model_id}}).dump());
  if (response.status < 200 || response.status >= 300) {
    log::Warn("engine_client", "unload rejected",
              "model=" + model_id + " status=" + std::to_string(response.status));
    return false;
  }
  return true;
}

HttpResponse HttpEngineClient::Forward(const std::string &path,
                                       const std::string &body) {
  return client_.Post(base_url_ + path, body);
}

std::unique_ptr<EngineResponseStream>
HttpEngineClient::ForwardStream(const std::string &path,
                                const std::string &body) {
  auto stream = client_.OpenStream("POST", base_url_ + path, body,
                                   {{"Accept", "text/event-stream"}});
  return std::make_unique<HttpEngineStream>(std::move(stream));
}

} // namespace enginectl
