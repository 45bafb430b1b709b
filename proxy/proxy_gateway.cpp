#include "proxy/proxy_gateway.h"

#include "control/config_store.h"
#include "control/model_resolver.h"
#include "control/restart_orchestrator.h"
#include "proxy/request_rewriter.h"
#include "server/logging/log_buffer.h"
#include "server/logging/logger.h"
#include "server/metrics/metrics.h"

#include <cmath>
#include <thread>

using json = nlohmann::json;

namespace enginectl {

namespace {

std::string ErrorBody(const std::string &message, const std::string &type,
                      const std::string &code) {
  return json{{"error", {{"message", message}, {"type", type}, {"code", code}}}}
      .dump();
}

double RoundTenths(double value) { return std::round(value * 10.0) / 10.0; }

std::string StringField(const json &object, const char *key) {
  auto it = object.find(key);
  if (it == object.end() || !it->is_string()) {
    return "";
  }
  return it->get<std::string>();
}

json RequestMessages(ProxyEndpoint endpoint, const json &body) {
  switch (endpoint) {
  case ProxyEndpoint::kChatCompletions:
  case ProxyEndpoint::kMessages: {
    auto it = body.find("messages");
    return it == body.end() ? json() : *it;
  }
  case ProxyEndpoint::kResponses: {
    auto it = body.find("input");
    if (it == body.end() || it->is_null()) {
      return json();
    }
    if (it->is_array()) {
      return *it;
    }
    return json::array({{{"role", "user"}, {"content", *it}}});
  }
  default:
    return json();
  }
}

std::string RequestPrompt(ProxyEndpoint endpoint, const json &body) {
  const char *key = nullptr;
  if (endpoint == ProxyEndpoint::kCompletions) {
    key = "prompt";
  } else if (endpoint == ProxyEndpoint::kEmbeddings) {
    key = "input";
  } else {
    return "";
  }
  auto it = body.find(key);
  if (it == body.end() || it->is_null()) {
    return "";
  }
  return it->is_string() ? it->get<std::string>() : it->dump();
}

int64_t ElapsedMs(std::chrono::steady_clock::time_point since) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - since)
      .count();
}

double TokensPerSecond(int completion_tokens, int64_t duration_ms) {
  return duration_ms > 0 ? completion_tokens / (duration_ms / 1000.0) : 0.0;
}

} // namespace

ProxyGateway::ProxyGateway(EngineClient *engine,
                           RestartOrchestrator *orchestrator,
                           const ConfigStore *store,
                           const ModelResolver *resolver,
                           ConversationLog *conversations, LogBuffer *log_buffer,
                           MetricsRegistry *metrics, ProxyOptions options)
    : engine_(engine), orchestrator_(orchestrator), store_(store),
      resolver_(resolver), conversations_(conversations),
      log_buffer_(log_buffer), metrics_(metrics ? metrics : &GlobalMetrics()),
      options_(options) {}

void ProxyGateway::Log(ProxyEndpoint endpoint, const std::string &message) {
  log::Info("proxy", message, std::string("endpoint=") + EndpointName(endpoint));
  if (log_buffer_) {
    log_buffer_->Add("proxy", message);
  }
}

ProxyResponse ProxyGateway::Handle(ProxyEndpoint endpoint,
                                   const std::string &request_body,
                                   StreamSink *sink) {
  auto started = std::chrono::steady_clock::now();
  ConversationRecord record;
  record.endpoint = EndpointName(endpoint);

  json original = json::parse(request_body, nullptr, false);
  if (original.is_discarded() || !original.is_object()) {
    record.model = "unknown";
    record.request_body = request_body;
    return Fail(endpoint, 400,
                ErrorBody("Request body must be a JSON object",
                          "invalid_request_error", "invalid_json"),
                "invalid JSON body", std::move(record), started);
  }

  std::string requested_model = StringField(original, "model");
  auto stream_flag = original.find("stream");
  bool wants_stream = stream_flag != original.end() && stream_flag->is_boolean() &&
                      stream_flag->get<bool>();
  bool stream = wants_stream && sink != nullptr;

  record.model = requested_model.empty() ? "unknown" : requested_model;
  record.stream = stream;
  record.messages = RequestMessages(endpoint, original);
  record.prompt = RequestPrompt(endpoint, original);
  record.request_body = original;

  json body = original;
  if (wants_stream && !stream) {
    body["stream"] = false;
  }
  std::string engine_model = requested_model;

  if (auto resolved = resolver_->Resolve(requested_model)) {
    if (resolved->IsPreset()) {
      const Preset &preset = resolved->preset;
      auto model_path = resolver_->ResolvePath(*resolved);
      if (!model_path) {
        return Fail(endpoint, 404,
                    ErrorBody("Model for preset \"" + preset.id +
                                  "\" is not downloaded",
                              "invalid_request_error", "model_not_downloaded"),
                    "model not downloaded", std::move(record), started);
      }
      engine_model = *model_path;
      body["model"] = engine_model;
      ApplyPresetDefaults(preset, &body);

      auto compat = orchestrator_->CheckCompatibility(preset);
      if (!compat.compatible) {
        std::string reasons;
        for (const auto &reason : compat.reasons) {
          reasons += (reasons.empty() ? "" : ", ") + reason;
        }
        Log(endpoint, "Restarting server for preset \"" + preset.id + "\": " + reasons);
        auto result = orchestrator_->RestartForPreset(preset);
        if (!result.success) {
          return Fail(endpoint, 503,
                      ErrorBody("Server restart failed: " + result.error,
                                "server_error", "restart_failed"),
                      "restart failed: " + result.error, std::move(record),
                      started);
        }
      }
      log::Debug("proxy", "preset resolved",
                 "preset=" + preset.id + " model=" + engine_model);
    } else {
      engine_model = resolved->relative_path;
      body["model"] = engine_model;
    }
  }

  if (SupportsReasoningEffort(endpoint) && store_) {
    InjectReasoningEffort(store_->GetSettings(), &body);
  }

  const std::string path = EndpointPath(endpoint);
  const std::string label = EndpointName(endpoint);
  const bool has_messages = body.contains("messages") && body["messages"].is_array();

  Attempt attempt = Send(path, body.dump(), stream, label);

  auto sanitize_and_retry = [&]() {
    json sanitized = body;
    int changed = SanitizeMessages(&sanitized["messages"]);
    Log(endpoint, "Template rejected content with thinking; retrying with " +
                      std::to_string(changed) + " sanitized message(s)");
    metrics_->RecordRetry(RetryKind::kSanitize);
    attempt = Send(path, sanitized.dump(), stream, label);
  };

  if (attempt.outcome == UpstreamOutcome::kLoadFailure) {
    Log(endpoint, "Model load failure for " + engine_model +
                      ", attempting to free memory");
    if (UnloadOtherModels(engine_model) > 0) {
      metrics_->RecordRetry(RetryKind::kEviction);
      attempt = Send(path, body.dump(), stream, label);
      if (attempt.outcome == UpstreamOutcome::kTemplateIncompatible &&
          has_messages) {
        sanitize_and_retry();
      }
    }
  } else if (attempt.outcome == UpstreamOutcome::kTemplateIncompatible &&
             has_messages) {
    sanitize_and_retry();
  }

  if (attempt.outcome == UpstreamOutcome::kConnectionError) {
    json error = {{"error", "Failed to reach llama server"},
                  {"details", attempt.error}};
    return Fail(endpoint, 502, error.dump(), attempt.error, std::move(record),
                started);
  }
  if (attempt.outcome != UpstreamOutcome::kOk) {
    Log(endpoint, "Request failed for model " + record.model + " (" +
                      OutcomeName(attempt.outcome) + "): " + attempt.body);
    auto response = Fail(endpoint, attempt.status, attempt.body, attempt.body,
                         std::move(record), started);
    if (!attempt.content_type.empty()) {
      response.content_type = attempt.content_type;
    }
    return response;
  }

  if (stream && attempt.stream) {
    return RelayStream(endpoint, &attempt, sink, std::move(record), started);
  }
  return Finish(endpoint, attempt, std::move(record), started);
}

ProxyResponse ProxyGateway::Passthrough(const std::string &path,
                                        const std::string &request_body) {
  Attempt attempt = Send(path, request_body, false, path);
  ProxyResponse response;
  if (attempt.outcome == UpstreamOutcome::kConnectionError) {
    response.status = 502;
    response.body = json{{"error", "Failed to reach llama server"},
                         {"details", attempt.error}}
                        .dump();
    return response;
  }
  response.status = attempt.status;
  response.body = std::move(attempt.body);
  if (!attempt.content_type.empty()) {
    response.content_type = attempt.content_type;
  }
  return response;
}

ProxyGateway::Attempt ProxyGateway::SendOnce(const std::string &path,
                                             const std::string &payload,
                                             bool stream) {
  Attempt attempt;
  if (stream) {
    auto upstream = engine_->ForwardStream(path, payload);
    attempt.status = upstream->Status();
    attempt.content_type = upstream->ContentType();
    if (attempt.status >= 200 && attempt.status < 300) {
      attempt.outcome = UpstreamOutcome::kOk;
      attempt.stream = std::move(upstream);
      return attempt;
    }
    std::string chunk;
    while (upstream->Next(&chunk)) {
      attempt.body += chunk;
    }
  } else {
    auto response = engine_->Forward(path, payload);
    attempt.status = response.status;
    attempt.body = std::move(response.body);
    auto content_type = response.headers.find("content-type");
    if (content_type != response.headers.end()) {
      attempt.content_type = content_type->second;
    }
  }
  attempt.outcome = ClassifyResponse(attempt.status, attempt.body);
  return attempt;
}

ProxyGateway::Attempt ProxyGateway::Send(const std::string &path,
                                         const std::string &payload,
                                         bool stream, const std::string &label) {
  for (int attempt = 0;; ++attempt) {
    try {
      return SendOnce(path, payload, stream);
    } catch (const ConnectionError &ex) {
      if (attempt >= options_.connect_retries) {
        log::Error("proxy", label + ": engine unreachable", ex.what());
        Attempt failed;
        failed.outcome = UpstreamOutcome::kConnectionError;
        failed.error = ex.what();
        return failed;
      }
      auto delay = options_.retry_base_delay * (1LL << attempt);
      log::Warn("proxy", label + ": connection failed, retrying",
                "attempt=" + std::to_string(attempt + 1) + "/" +
                    std::to_string(options_.connect_retries + 1) +
                    " delay_ms=" + std::to_string(delay.count()) +
                    " error=" + ex.what());
      metrics_->RecordRetry(RetryKind::kConnection);
      std::this_thread::sleep_for(delay);
    }
  }
}

int ProxyGateway::UnloadOtherModels(const std::string &keep_model) {
  std::vector<EngineModel> models;
  try {
    models = engine_->ListModels();
  } catch (const std::exception &ex) {
    log::Warn("proxy", "cannot list engine models for eviction", ex.what());
    return 0;
  }

  int unloaded = 0;
  for (const auto &model : models) {
    if (model.status != "loaded" || model.id == keep_model) {
      continue;
    }
    if (log_buffer_) {
      log_buffer_->Add("models", "Auto-unloading " + model.id +
                                     " to make room for " + keep_model);
    }
    log::Info("proxy", "unloading model", "model=" + model.id);
    try {
      if (!engine_->UnloadModel(model.id)) {
        log::Warn("proxy", "engine refused unload", "model=" + model.id);
      }
    } catch (const std::exception &ex) {
      log::Warn("proxy", "unload failed", "model=" + model.id + " error=" + ex.what());
    }
    ++unloaded;
  }
  if (unloaded > 0) {
    metrics_->RecordEviction(unloaded);
  }
  return unloaded;
}

ProxyResponse ProxyGateway::RelayStream(
    ProxyEndpoint endpoint, Attempt *attempt, StreamSink *sink,
    ConversationRecord record, std::chrono::steady_clock::time_point started) {
  StreamAccounting accounting(endpoint, record.model);
  std::string content_type =
      attempt->content_type.empty() ? "text/event-stream" : attempt->content_type;

  bool client_open = sink->Begin(attempt->status, content_type);
  std::string chunk;
  while (client_open && attempt->stream->Next(&chunk)) {
    accounting.Feed(chunk);
    if (!sink->Write(chunk)) {
      client_open = false;
    }
  }
  accounting.Finish();
  attempt->stream.reset();
  if (!client_open) {
    log::Info("proxy", "client disconnected mid-stream",
              std::string("endpoint=") + EndpointName(endpoint));
  }

  const TokenUsage &usage = accounting.Usage();
  int64_t duration = ElapsedMs(started);
  double tps = TokensPerSecond(usage.completion_tokens, duration);

  record.status = attempt->status;
  if (!usage.model.empty()) {
    record.model = usage.model;
  }
  record.duration_ms = duration;
  record.prompt_tokens = usage.prompt_tokens;
  record.completion_tokens = usage.completion_tokens;
  record.tokens_per_second = RoundTenths(tps);
  record.response = usage.text;
  record.error = client_open ? "" : "client disconnected";
  record.request_body = nullptr;

  metrics_->RecordRequest(EndpointName(endpoint), true, usage.prompt_tokens,
                          usage.completion_tokens);
  metrics_->RecordLatency(static_cast<double>(duration));
  if (conversations_) {
    conversations_->Record(std::move(record));
  }

  ProxyResponse response;
  response.status = attempt->status;
  response.content_type = content_type;
  response.streamed = true;
  return response;
}

ProxyResponse ProxyGateway::Finish(ProxyEndpoint endpoint, const Attempt &attempt,
                                   ConversationRecord record,
                                   std::chrono::steady_clock::time_point started) {
  json data = json::parse(attempt.body, nullptr, false);
  int64_t duration = ElapsedMs(started);
  TokenUsage usage;
  if (!data.is_discarded()) {
    usage = ExtractUsage(endpoint, data);
  }
  double tps = TokensPerSecond(usage.completion_tokens, duration);

  record.status = attempt.status;
  if (!usage.model.empty()) {
    record.model = usage.model;
  }
  record.duration_ms = duration;
  record.prompt_tokens = usage.prompt_tokens;
  record.completion_tokens = usage.completion_tokens;
  record.tokens_per_second = RoundTenths(tps);
  record.response = usage.text;
  record.request_body = nullptr;

  metrics_->RecordRequest(EndpointName(endpoint), true, usage.prompt_tokens,
                          usage.completion_tokens);
  metrics_->RecordLatency(static_cast<double>(duration));
  if (conversations_) {
    conversations_->Record(std::move(record));
  }

  ProxyResponse response;
  response.status = attempt.status;
  if (data.is_object()) {
    data["_enginectl"] = {{"duration", duration},
                          {"tokensPerSecond", RoundTenths(tps)}};
    response.body = data.dump();
  } else {
    response.body = attempt.body;
    if (!attempt.content_type.empty()) {
      response.content_type = attempt.content_type;
    }
  }
  return response;
}

ProxyResponse ProxyGateway::Fail(ProxyEndpoint endpoint, int status,
                                 std::string body, const std::string &error,
                                 ConversationRecord record,
                                 std::chrono::steady_clock::time_point started) {
  int64_t duration = ElapsedMs(started);
  record.status = status;
  record.duration_ms = duration;
  record.error = error;

  metrics_->RecordRequest(EndpointName(endpoint), false, 0, 0);
  metrics_->RecordLatency(static_cast<double>(duration));
  if (conversations_) {
    conversations_->Record(std::move(record));
  }

  ProxyResponse response;
  response.status = status;
  response.body = std::move(body);
  return response;
}

} // namespace enginectl
