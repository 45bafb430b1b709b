#pragma once

#include <map>
#include <optional>
#include <string>

namespace enginectl {

class ConfigStore;
class ConversationLog;
class EngineClient;
class EngineProcess;
class LogBuffer;
class ModelResolver;
class ModelScanner;
class ProxyGateway;
class RestartOrchestrator;

struct ApiRequest {
  std::string method;
  std::string path; // decoded, without query string
  std::map<std::string, std::string> query;
  std::string body;
};

struct ApiReply {
  int status{200};
  std::string body;
};

// Management API under /api (presets, settings, engine lifecycle, logs,
// model listings). Transport-free so it can be driven directly.
class ControlApi {
public:
  struct Services {
    ConfigStore *store{nullptr};
    ModelScanner *scanner{nullptr};
    ModelResolver *resolver{nullptr};
    RestartOrchestrator *orchestrator{nullptr};
    EngineProcess *engine_process{nullptr};
    EngineClient *engine{nullptr};
    ProxyGateway *gateway{nullptr};
    LogBuffer *log_buffer{nullptr};
    ConversationLog *conversations{nullptr};
    int engine_port{8080};
  };

  explicit ControlApi(Services services);

  // nullopt when no route matches.
  std::optional<ApiReply> Handle(const ApiRequest &request);

private:
  ApiReply GetStatus();
  ApiReply GetSettings();
  ApiReply UpdateSettings(const std::string &body);
  ApiReply ListPresets();
  ApiReply CreatePreset(const std::string &body);
  ApiReply UpdatePreset(const std::string &id, const std::string &body);
  ApiReply DeletePreset(const std::string &id);
  ApiReply ActivatePreset(const std::string &id);
  ApiReply StartServer();
  ApiReply StopServer();
  ApiReply ListModels();
  ApiReply ListAliases();
  ApiReply SetAlias(const std::string &model_name, const std::string &body);
  ApiReply RemoveAlias(const std::string &model_name);
  ApiReply LoadModel(const std::string &body);
  ApiReply UnloadModel(const std::string &body);
  ApiReply GetLogs(const std::map<std::string, std::string> &query);
  ApiReply GetLogFilters();
  ApiReply AddLogFilter(const std::string &body);
  ApiReply RemoveLogFilter(const std::string &body);
  ApiReply GetConversations(const std::map<std::string, std::string> &query);
  ApiReply ClearConversations();
  ApiReply ReplayConversation(const std::string &id);
  ApiReply OpenAiModels();
  ApiReply OpenAiModel(const std::string &model_id);

  bool SaveStore();

  Services services_;
};

// Decodes %XX escapes and '+' (query strings only).
std::string UrlDecode(const std::string &text, bool plus_as_space = false);

// Splits "a=1&b=2" into decoded pairs.
std::map<std::string, std::string> ParseQuery(const std::string &query);

} // namespace enginectl
