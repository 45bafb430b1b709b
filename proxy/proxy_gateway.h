#pragma once

#include "engine/engine_client.h"
#include "proxy/response_classifier.h"
#include "proxy/stream_accounting.h"
#include "server/logging/conversation_log.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace enginectl {

class ConfigStore;
class LogBuffer;
class MetricsRegistry;
class ModelResolver;
class RestartOrchestrator;

// Client side of a streamed response.
class StreamSink {
public:
  virtual ~StreamSink() = default;
  // Sends the response head. Called once, before the first Write.
  virtual bool Begin(int status, const std::string &content_type) = 0;
  // Returns false once the client has gone away.
  virtual bool Write(const std::string &chunk) = 0;
};

struct ProxyResponse {
  int status{200};
  std::string body;
  std::string content_type{"application/json"};
  // True when the body was already delivered through the StreamSink.
  bool streamed{false};
};

struct ProxyOptions {
  int connect_retries{3};
  std::chrono::milliseconds retry_base_delay{1000};
};

// OpenAI/Anthropic-compatible front for the engine. Resolves the model,
// relaunches the engine when the preset needs other launch settings, and
// recovers from the engine's known transient failures before answering.
class ProxyGateway {
public:
  ProxyGateway(EngineClient *engine, RestartOrchestrator *orchestrator,
               const ConfigStore *store, const ModelResolver *resolver,
               ConversationLog *conversations, LogBuffer *log_buffer = nullptr,
               MetricsRegistry *metrics = nullptr, ProxyOptions options = {});

  // Streams through `sink` when the request asks for it and a sink is given;
  // otherwise the request is forced to non-streaming.
  ProxyResponse Handle(ProxyEndpoint endpoint, const std::string &request_body,
                       StreamSink *sink);

  // Plain forward (count_tokens, rerank) with connection retries only.
  ProxyResponse Passthrough(const std::string &path,
                            const std::string &request_body);

private:
  struct Attempt {
    UpstreamOutcome outcome{UpstreamOutcome::kConnectionError};
    int status{0};
    std::string body;
    std::string content_type;
    std::unique_ptr<EngineResponseStream> stream; // set for 2xx streams
    std::string error;                            // connection failures
  };

  // One logical upstream call with connection-level backoff.
  Attempt Send(const std::string &path, const std::string &payload, bool stream,
               const std::string &label);
  Attempt SendOnce(const std::string &path, const std::string &payload,
                   bool stream);
  // Unloads every loaded engine model except `keep_model`. Returns the count.
  int UnloadOtherModels(const std::string &keep_model);

  ProxyResponse RelayStream(ProxyEndpoint endpoint, Attempt *attempt,
                            StreamSink *sink, ConversationRecord record,
                            std::chrono::steady_clock::time_point started);
  ProxyResponse Finish(ProxyEndpoint endpoint, const Attempt &attempt,
                       ConversationRecord record,
                       std::chrono::steady_clock::time_point started);
  ProxyResponse Fail(ProxyEndpoint endpoint, int status, std::string body,
                     const std::string &error, ConversationRecord record,
                     std::chrono::steady_clock::time_point started);
  void Log(ProxyEndpoint endpoint, const std::string &message);

  EngineClient *engine_;
  RestartOrchestrator *orchestrator_;
  const ConfigStore *store_;
  const ModelResolver *resolver_;
  ConversationLog *conversations_;
  LogBuffer *log_buffer_;
  MetricsRegistry *metrics_;
  ProxyOptions options_;
};

} // namespace enginectl
