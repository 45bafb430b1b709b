#include "server/http/control_api.h"

#include "control/config_store.h"
#include "control/model_resolver.h"
#include "control/model_scanner.h"
#include "control/restart_orchestrator.h"
#include "engine/engine_client.h"
#include "engine/engine_process.h"
#include "proxy/proxy_gateway.h"
#include "server/logging/conversation_log.h"
#include "server/logging/log_buffer.h"
#include "server/logging/logger.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iterator>
#include <regex>
#include <sstream>

using json = nlohmann::json;

namespace enginectl {

namespace {

// Engine output and stored request bodies may carry invalid UTF-8.
std::string Dump(const json &body) {
  return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

ApiReply Reply(const json &body, int status = 200) {
  return {status, Dump(body)};
}

ApiReply ErrorReply(int status, const std::string &message) {
  return {status, Dump(json({{"error", message}}))};
}

bool StartsWith(const std::string &value, const std::string &prefix) {
  return value.compare(0, prefix.size(), prefix) == 0;
}

bool EndsWith(const std::string &value, const std::string &suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Parses a JSON object body; nullopt for anything else.
std::optional<json> ParseObject(const std::string &body) {
  json parsed = json::parse(body.empty() ? "{}" : body, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    return std::nullopt;
  }
  return parsed;
}

std::string StringField(const json &object, const char *key) {
  auto it = object.find(key);
  if (it == object.end() || !it->is_string()) {
    return "";
  }
  return it->get<std::string>();
}

std::size_t LimitParam(const std::map<std::string, std::string> &query,
                       std::size_t fallback) {
  auto it = query.find("limit");
  if (it == query.end()) {
    return fallback;
  }
  try {
    long long value = std::stoll(it->second);
    return value > 0 ? static_cast<std::size_t>(value) : fallback;
  } catch (const std::exception &) {
    return fallback;
  }
}

int64_t UnixSeconds(const std::string &iso_timestamp) {
  if (!iso_timestamp.empty()) {
    std::tm tm{};
    std::istringstream in(iso_timestamp);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (!in.fail()) {
      return static_cast<int64_t>(timegm(&tm));
    }
  }
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

json OptionalString(const std::optional<std::string> &value) {
  return value ? json(*value) : json();
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

} // namespace

std::string UrlDecode(const std::string &text, bool plus_as_space) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '%' && i + 2 < text.size()) {
      int hi = HexValue(text[i + 1]);
      int lo = HexValue(text[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
        continue;
      }
    }
    out.push_back(plus_as_space && c == '+' ? ' ' : c);
  }
  return out;
}

std::map<std::string, std::string> ParseQuery(const std::string &query) {
  std::map<std::string, std::string> params;
  std::size_t start = 0;
  while (start <= query.size()) {
    auto end = query.find('&', start);
    if (end == std::string::npos) {
      end = query.size();
    }
    std::string pair = query.substr(start, end - start);
    if (!pair.empty()) {
      auto eq = pair.find('=');
      if (eq == std::string::npos) {
        params[UrlDecode(pair, true)] = "";
      } else {
        params[UrlDecode(pair.substr(0, eq), true)] =
            UrlDecode(pair.substr(eq + 1), true);
      }
    }
    start = end + 1;
  }
  return params;
}

ControlApi::ControlApi(Services services) : services_(services) {}

bool ControlApi::SaveStore() {
  if (!services_.store->Save()) {
    log::Error("api", "failed to persist config store",
               "path=" + services_.store->Path());
    return false;
  }
  return true;
}

std::optional<ApiReply> ControlApi::Handle(const ApiRequest &request) {
  const std::string &method = request.method;
  const std::string &path = request.path;

  if (method == "GET" && path == "/api/status") {
    return GetStatus();
  }
  if (path == "/api/settings") {
    if (method == "GET") {
      return GetSettings();
    }
    if (method == "POST") {
      return UpdateSettings(request.body);
    }
  }

  if (path == "/api/presets") {
    if (method == "GET") {
      return ListPresets();
    }
    if (method == "POST") {
      return CreatePreset(request.body);
    }
  }
  static const std::string kPresetPrefix = "/api/presets/";
  if (StartsWith(path, kPresetPrefix)) {
    std::string rest = path.substr(kPresetPrefix.size());
    static const std::string kActivate = "/activate";
    if (method == "POST" && EndsWith(rest, kActivate)) {
      return ActivatePreset(rest.substr(0, rest.size() - kActivate.size()));
    }
    if (!rest.empty() && rest.find('/') == std::string::npos) {
      if (method == "PUT") {
        return UpdatePreset(rest, request.body);
      }
      if (method == "DELETE") {
        return DeletePreset(rest);
      }
    }
  }

  if (method == "POST" && path == "/api/server/start") {
    return StartServer();
  }
  if (method == "POST" && path == "/api/server/stop") {
    return StopServer();
  }

  if (method == "GET" && path == "/api/models") {
    return ListModels();
  }
  if (method == "GET" && path == "/api/models/aliases") {
    return ListAliases();
  }
  static const std::string kAliasPrefix = "/api/models/aliases/";
  if (StartsWith(path, kAliasPrefix) && path.size() > kAliasPrefix.size()) {
    std::string model_name = path.substr(kAliasPrefix.size());
    if (method == "PUT") {
      return SetAlias(model_name, request.body);
    }
    if (method == "DELETE") {
      return RemoveAlias(model_name);
    }
  }
  if (method == "POST" && path == "/api/models/load") {
    return LoadModel(request.body);
  }
  if (method == "POST" && path == "/api/models/unload") {
    return UnloadModel(request.body);
  }

  if (method == "GET" && path == "/api/logs") {
    return GetLogs(request.query);
  }
  if (path == "/api/logs/filters") {
    if (method == "GET") {
      return GetLogFilters();
    }
    if (method == "POST") {
      return AddLogFilter(request.body);
    }
    if (method == "DELETE") {
      return RemoveLogFilter(request.body);
    }
  }
  if (path == "/api/llm-logs") {
    if (method == "GET") {
      return GetConversations(request.query);
    }
    if (method == "DELETE") {
      return ClearConversations();
    }
  }
  static const std::string kLlmLogPrefix = "/api/llm-logs/";
  static const std::string kReplay = "/replay";
  if (method == "POST" && StartsWith(path, kLlmLogPrefix) &&
      EndsWith(path, kReplay) &&
      path.size() > kLlmLogPrefix.size() + kReplay.size()) {
    return ReplayConversation(path.substr(
        kLlmLogPrefix.size(), path.size() - kLlmLogPrefix.size() - kReplay.size()));
  }

  if (method == "GET" && path == "/api/v1/models") {
    return OpenAiModels();
  }
  static const std::string kModelPrefix = "/api/v1/models/";
  if (method == "GET" && StartsWith(path, kModelPrefix) &&
      path.size() > kModelPrefix.size()) {
    return OpenAiModel(path.substr(kModelPrefix.size()));
  }
  return std::nullopt;
}

ApiReply ControlApi::GetStatus() {
  EngineState state = services_.orchestrator->State().Committed();
  bool running = services_.engine_process && services_.engine_process->IsRunning();
  bool healthy = services_.engine && services_.engine->Health().Ready();

  json current_preset;
  if (state.active_preset_id) {
    if (auto preset = services_.store->GetPreset(*state.active_preset_id)) {
      current_preset = ToJson(*preset);
    }
  }
  return Reply({{"apiRunning", true},
                {"llamaRunning", running},
                {"llamaHealthy", healthy},
                {"llamaPort", services_.engine_port},
                {"modelsDir", services_.resolver->ModelsDir()},
                {"mode", ModeName(state.mode)},
                {"currentPreset", current_preset},
                {"serverConfig", ToJson(state.runtime)},
                {"restarting", services_.orchestrator->IsRestarting()}});
}

ApiReply ControlApi::GetSettings() {
  Settings defaults;
  nlohmann::ordered_json body = {
      {"settings", ToJson(services_.store->GetSettings())},
      {"defaults",
       {{"contextSize", defaults.context_size}, {"modelsMax", defaults.models_max}}}};
  return {200, body.dump()};
}

ApiReply ControlApi::UpdateSettings(const std::string &body) {
  auto update = nlohmann::ordered_json::parse(body.empty() ? "{}" : body, nullptr,
                                              false);
  if (update.is_discarded() || !update.is_object()) {
    return ErrorReply(400, "Request body must be a JSON object");
  }
  Settings updated;
  std::string error;
  if (!ApplySettingsUpdate(services_.store->GetSettings(), update, &updated,
                           &error)) {
    return ErrorReply(400, error);
  }
  services_.store->SetSettings(updated);
  if (!SaveStore()) {
    return ErrorReply(500, "Failed to save settings");
  }
  if (services_.log_buffer) {
    services_.log_buffer->SetCustomFilters(updated.log_filters);
    services_.log_buffer->Add("manager", "Settings updated: " + update.dump());
  }
  nlohmann::ordered_json reply = {
      {"success", true},
      {"settings", ToJson(updated)},
      {"message", "Settings saved. Restart the server for changes to take effect."}};
  return {200, reply.dump()};
}

ApiReply ControlApi::ListPresets() {
  EngineState state = services_.orchestrator->State().Committed();
  json presets = json::array();
  for (const auto &preset : services_.store->Presets()) {
    presets.push_back(ToJson(preset));
  }
  return Reply({{"presets", presets},
                {"currentPreset", OptionalString(state.active_preset_id)},
                {"mode", ModeName(state.mode)}});
}

ApiReply ControlApi::CreatePreset(const std::string &body) {
  auto request = ParseObject(body);
  if (!request) {
    return ErrorReply(400, "Request body must be a JSON object");
  }
  std::string id = StringField(*request, "id");
  std::string name = StringField(*request, "name");
  std::string model_path = StringField(*request, "modelPath");
  std::string hf_repo = StringField(*request, "hfRepo");
  if (id.empty() || name.empty() || (model_path.empty() && hf_repo.empty())) {
    return ErrorReply(400, "Missing required fields: id, name, and either "
                           "modelPath or hfRepo");
  }
  if (services_.store->HasPreset(id)) {
    return ErrorReply(409, "Preset with ID '" + id +
                               "' already exists. Use PUT to update or choose "
                               "a different ID.");
  }

  Preset preset;
  try {
    preset = PresetFromJson(*request);
  } catch (const json::exception &ex) {
    return ErrorReply(400, std::string("Invalid preset: ") + ex.what());
  }
  if (!hf_repo.empty()) {
    preset.model_path.clear();
  } else {
    auto resolved = services_.scanner->ResolveModelFile(model_path);
    if (!resolved) {
      return ErrorReply(404, "Model file not found: " + model_path);
    }
    preset.model_path = *resolved;
  }
  if (preset.description.empty()) {
    preset.description = "Preset for " + name;
  }
  preset.auto_generated = false;
  preset.created_at = CurrentIsoTimestamp();

  if (services_.store->AddPreset(preset) != StoreStatus::kOk) {
    return ErrorReply(409, "Preset with ID '" + id + "' already exists");
  }
  if (!SaveStore()) {
    return ErrorReply(500, "Failed to save preset");
  }
  log::Info("api", "preset created",
            "preset=" + id + " model=" + (hf_repo.empty() ? preset.model_path : hf_repo));
  if (services_.log_buffer) {
    services_.log_buffer->Add("presets", "Created preset: " + name);
  }
  return Reply({{"success", true}, {"preset", ToJson(preset)}});
}

ApiReply ControlApi::UpdatePreset(const std::string &id, const std::string &body) {
  auto existing = services_.store->GetPreset(id);
  if (!existing) {
    return ErrorReply(404, "Preset '" + id + "' not found");
  }
  auto updates = ParseObject(body);
  if (!updates) {
    return ErrorReply(400, "Request body must be a JSON object");
  }

  std::string model_path = StringField(*updates, "modelPath");
  if (!model_path.empty()) {
    auto resolved = services_.scanner->ResolveModelFile(model_path);
    if (!resolved) {
      return ErrorReply(404, "Model file not found: " + model_path);
    }
    (*updates)["modelPath"] = *resolved;
  }

  std::string new_id = StringField(*updates, "id");
  if (new_id.empty()) {
    new_id = id;
  }
  json merged = ToJson(*existing);
  for (auto it = updates->begin(); it != updates->end(); ++it) {
    merged[it.key()] = it.value();
  }
  merged["id"] = new_id;

  Preset updated;
  try {
    updated = PresetFromJson(merged);
  } catch (const json::exception &ex) {
    return ErrorReply(400, std::string("Invalid preset: ") + ex.what());
  }

  switch (services_.store->UpdatePreset(id, updated)) {
  case StoreStatus::kOk:
    break;
  case StoreStatus::kNotFound:
    return ErrorReply(404, "Preset '" + id + "' not found");
  case StoreStatus::kInvalid:
    return ErrorReply(400, "ID must contain only lowercase letters, numbers, "
                           "and hyphens");
  case StoreStatus::kConflict:
    return ErrorReply(409, "Preset '" + new_id + "' already exists");
  }
  if (!SaveStore()) {
    return ErrorReply(500, "Failed to save preset");
  }

  if (new_id != id) {
    log::Info("api", "preset renamed", "from=" + id + " to=" + new_id);
    return Reply({{"success", true},
                  {"preset", ToJson(updated)},
                  {"renamed", true},
                  {"oldId", id}});
  }
  log::Info("api", "preset updated", "preset=" + id);
  return Reply({{"success", true}, {"preset", ToJson(updated)}});
}

ApiReply ControlApi::DeletePreset(const std::string &id) {
  if (!services_.store->HasPreset(id)) {
    return ErrorReply(404, "Preset '" + id + "' not found");
  }
  EngineState state = services_.orchestrator->State().Committed();
  if (state.active_preset_id && *state.active_preset_id == id) {
    return ErrorReply(400, "Cannot delete preset '" + id +
                               "' while it is active. Switch to router mode "
                               "or another preset first.");
  }
  services_.store->RemovePreset(id);
  if (!SaveStore()) {
    return ErrorReply(500, "Failed to save config");
  }
  log::Info("api", "preset deleted", "preset=" + id);
  return Reply({{"success", true}});
}

ApiReply ControlApi::ActivatePreset(const std::string &id) {
  auto preset = services_.store->GetPreset(id);
  if (!preset) {
    return ErrorReply(404, "Preset '" + id + "' not found");
  }
  if (services_.log_buffer) {
    services_.log_buffer->Add("presets", "Activating preset: " + preset->name);
  }
  auto result = services_.orchestrator->ActivatePreset(*preset);
  if (!result.success) {
    return ErrorReply(500, result.error);
  }
  return Reply({{"success", true}, {"mode", "single"}, {"preset", ToJson(*preset)}});
}

ApiReply ControlApi::StartServer() {
  auto result = services_.orchestrator->StartRouter();
  if (!result.success) {
    return ErrorReply(500, result.error);
  }
  EngineState state = services_.orchestrator->State().Committed();
  return Reply({{"success", true},
                {"mode", ModeName(state.mode)},
                {"serverConfig", ToJson(state.runtime)}});
}

ApiReply ControlApi::StopServer() {
  bool was_running =
      services_.engine_process && services_.engine_process->IsRunning();
  auto result = services_.orchestrator->StopEngine();
  if (!result.success) {
    return ErrorReply(500, result.error);
  }
  if (!was_running) {
    return Reply({{"success", true}, {"message", "Server not running"}});
  }
  return Reply({{"success", true}});
}

ApiReply ControlApi::ListModels() {
  std::vector<EngineModel> engine_models;
  try {
    engine_models = services_.engine->ListModels();
  } catch (const std::exception &ex) {
    log::Debug("api", "engine model listing unavailable", ex.what());
  }
  EngineState state = services_.orchestrator->State().Committed();

  json presets = json::array();
  for (const auto &preset : services_.store->Presets()) {
    json entry = ToJson(preset);
    entry["status"] = PresetStatusName(
        services_.resolver->GetStatus(preset, engine_models, state));
    entry["resolvedPath"] =
        OptionalString(services_.resolver->ResolvePresetPath(preset));
    presets.push_back(std::move(entry));
  }
  json server_models = json::array();
  for (const auto &model : engine_models) {
    server_models.push_back(ToJson(model));
  }
  json local_models = json::array();
  for (const auto &model : services_.scanner->Scan()) {
    local_models.push_back(ToJson(model));
  }
  return Reply({{"models", presets},
                {"serverModels", server_models},
                {"localModels", local_models},
                {"modelsDir", services_.resolver->ModelsDir()},
                {"mode", ModeName(state.mode)},
                {"currentPreset", OptionalString(state.active_preset_id)}});
}

ApiReply ControlApi::ListAliases() {
  return Reply({{"aliases", services_.store->Aliases()}});
}

ApiReply ControlApi::SetAlias(const std::string &model_name,
                              const std::string &body) {
  auto request = ParseObject(body);
  if (!request) {
    return ErrorReply(400, "Request body must be a JSON object");
  }
  services_.store->SetAlias(model_name, StringField(*request, "alias"));
  if (!SaveStore()) {
    return ErrorReply(500, "Failed to save aliases");
  }
  return Reply({{"success", true}, {"aliases", services_.store->Aliases()}});
}

ApiReply ControlApi::RemoveAlias(const std::string &model_name) {
  if (services_.store->RemoveAlias(model_name) && !SaveStore()) {
    return ErrorReply(500, "Failed to save aliases");
  }
  return Reply({{"success", true}, {"aliases", services_.store->Aliases()}});
}

ApiReply ControlApi::LoadModel(const std::string &body) {
  auto request = ParseObject(body);
  std::string model = request ? StringField(*request, "model") : "";
  if (model.empty()) {
    return ErrorReply(400, "Missing model parameter");
  }

  std::string engine_model = model;
  std::string display_name = model;
  json preset_id;
  if (auto resolved = services_.resolver->Resolve(model)) {
    if (resolved->IsPreset()) {
      auto path = services_.resolver->ResolvePath(*resolved);
      if (!path) {
        return Reply({{"error", "Preset \"" + model +
                                    "\" references a model that is not "
                                    "downloaded yet."},
                      {"preset", resolved->preset.id},
                      {"hfRepo", resolved->preset.hf_repo}},
                     404);
      }
      engine_model = *path;
      display_name = resolved->preset.name;
      preset_id = resolved->preset.id;
    } else {
      engine_model = services_.resolver->ResolvePath(*resolved).value_or(
          resolved->relative_path);
    }
  } else {
    std::error_code ec;
    if (!std::filesystem::exists(
            std::filesystem::path(services_.resolver->ModelsDir()) / model, ec)) {
      return ErrorReply(404, "Model not found: " + model +
                                 ". Check preset ID or file path.");
    }
  }

  if (services_.log_buffer) {
    services_.log_buffer->Add("models", "Loading model: " + display_name + " (" +
                                            engine_model + ")");
  }
  json warmup = {{"model", engine_model},
                 {"messages", json::array({{{"role", "user"}, {"content", "hi"}}})},
                 {"max_tokens", 1}};
  try {
    auto response = services_.engine->Forward("/v1/chat/completions", warmup.dump());
    if (response.status < 200 || response.status >= 300) {
      if (services_.log_buffer) {
        services_.log_buffer->Add("models", "Failed to load model: " + response.body);
      }
      return ErrorReply(response.status, "Failed to load model: " + response.body);
    }
  } catch (const ConnectionError &ex) {
    return ErrorReply(500, ex.what());
  }
  if (services_.log_buffer) {
    services_.log_buffer->Add("models", "Model loaded: " + display_name);
  }
  return Reply({{"success", true},
                {"model", engine_model},
                {"preset", preset_id},
                {"displayName", display_name}});
}

ApiReply ControlApi::UnloadModel(const std::string &body) {
  auto request = ParseObject(body);
  std::string model = request ? StringField(*request, "model") : "";
  if (model.empty()) {
    return ErrorReply(400, "Missing model parameter");
  }
  if (services_.log_buffer) {
    services_.log_buffer->Add("models", "Unloading model: " + model);
  }
  try {
    auto response = services_.engine->Forward("/models/unload",
                                              json({{"model", model}}).dump());
    if (response.status >= 200 && response.status < 300) {
      json reply = {{"success", true}};
      json data = json::parse(response.body, nullptr, false);
      if (!data.is_discarded() && data.is_object()) {
        for (auto it = data.begin(); it != data.end(); ++it) {
          reply[it.key()] = it.value();
        }
      }
      return Reply(reply);
    }
    if (response.status == 404) {
      return Reply({{"success", true},
                    {"message", "The engine unloads models automatically when "
                                "a slot is needed."}});
    }
    return ErrorReply(response.status, response.body);
  } catch (const ConnectionError &ex) {
    return ErrorReply(500, ex.what());
  }
}

ApiReply ControlApi::GetLogs(const std::map<std::string, std::string> &query) {
  json logs = json::array();
  if (services_.log_buffer) {
    for (const auto &line : services_.log_buffer->Snapshot(LimitParam(query, 100))) {
      logs.push_back(ToJson(line));
    }
  }
  return Reply({{"logs", logs}});
}

ApiReply ControlApi::GetLogFilters() {
  return Reply({{"defaultFilters", LogBuffer::DefaultFilters()},
                {"customFilters", services_.store->GetSettings().log_filters}});
}

ApiReply ControlApi::AddLogFilter(const std::string &body) {
  auto request = ParseObject(body);
  std::string pattern = request ? StringField(*request, "pattern") : "";
  if (pattern.empty()) {
    return ErrorReply(400, "Missing or invalid pattern");
  }
  try {
    std::regex validate(pattern);
  } catch (const std::regex_error &ex) {
    return ErrorReply(400, std::string("Invalid regex pattern: ") + ex.what());
  }
  Settings settings = services_.store->GetSettings();
  auto &filters = settings.log_filters;
  if (std::find(filters.begin(), filters.end(), pattern) != filters.end()) {
    return Reply({{"success", true},
                  {"message", "Filter already exists"},
                  {"filters", filters}});
  }
  filters.push_back(pattern);
  services_.store->SetSettings(settings);
  if (!SaveStore()) {
    return ErrorReply(500, "Failed to save filters");
  }
  if (services_.log_buffer) {
    services_.log_buffer->SetCustomFilters(filters);
  }
  return Reply({{"success", true}, {"filters", filters}});
}

ApiReply ControlApi::RemoveLogFilter(const std::string &body) {
  auto request = ParseObject(body);
  std::string pattern = request ? StringField(*request, "pattern") : "";
  if (pattern.empty()) {
    return ErrorReply(400, "Missing pattern");
  }
  Settings settings = services_.store->GetSettings();
  auto &filters = settings.log_filters;
  auto it = std::find(filters.begin(), filters.end(), pattern);
  if (it == filters.end()) {
    return ErrorReply(404, "Filter not found");
  }
  filters.erase(it);
  services_.store->SetSettings(settings);
  if (!SaveStore()) {
    return ErrorReply(500, "Failed to save filters");
  }
  if (services_.log_buffer) {
    services_.log_buffer->SetCustomFilters(filters);
  }
  return Reply({{"success", true}, {"filters", filters}});
}

ApiReply
ControlApi::GetConversations(const std::map<std::string, std::string> &query) {
  json logs = json::array();
  if (services_.conversations) {
    auto records = services_.conversations->Snapshot();
    std::size_t limit = LimitParam(query, 50);
    std::size_t first = records.size() > limit ? records.size() - limit : 0;
    for (std::size_t i = first; i < records.size(); ++i) {
      logs.push_back(ToJson(records[i]));
    }
  }
  return Reply({{"logs", logs}});
}

ApiReply ControlApi::ClearConversations() {
  if (services_.conversations) {
    services_.conversations->Clear();
  }
  return Reply({{"success", true}});
}

ApiReply ControlApi::ReplayConversation(const std::string &id) {
  if (!services_.conversations || !services_.gateway) {
    return ErrorReply(404, "Log entry '" + id + "' not found");
  }
  auto record = services_.conversations->Find(id);
  if (!record) {
    return ErrorReply(404, "Log entry '" + id + "' not found");
  }
  if (record->request_body.is_null()) {
    return ErrorReply(400, "Log entry '" + id + "' has no stored request body");
  }
  auto endpoint = EndpointFromName(record->endpoint);
  if (!endpoint) {
    return ErrorReply(400, "Endpoint '" + record->endpoint + "' cannot be replayed");
  }
  std::string body = record->request_body.is_string()
                         ? record->request_body.get<std::string>()
                         : record->request_body.dump();
  log::Info("api", "replaying request", "id=" + id + " endpoint=" + record->endpoint);
  auto response = services_.gateway->Handle(*endpoint, body, nullptr);
  return {response.status, response.body};
}

ApiReply ControlApi::OpenAiModels() {
  std::vector<EngineModel> engine_models;
  try {
    engine_models = services_.engine->ListModels();
  } catch (const std::exception &ex) {
    log::Debug("api", "engine model listing unavailable", ex.what());
  }
  EngineState state = services_.orchestrator->State().Committed();
  int default_context = services_.store->GetSettings().context_size;

  json data = json::array();
  for (const auto &preset : services_.store->Presets()) {
    json entry = {
        {"id", preset.id},
        {"object", "model"},
        {"created", UnixSeconds(preset.created_at)},
        {"owned_by", "enginectl"},
        {"meta",
         {{"name", preset.name},
          {"description", preset.description},
          {"modelPath", preset.model_path.empty() ? json() : json(preset.model_path)},
          {"hfRepo", preset.hf_repo.empty() ? json() : json(preset.hf_repo)},
          {"context", preset.context},
          {"autoGenerated", preset.auto_generated}}},
        {"n_ctx", preset.context > 0 ? preset.context
                                     : (default_context > 0 ? default_context : 8192)},
        {"displayName", preset.name.empty() ? preset.id : preset.name},
        {"status", PresetStatusName(services_.resolver->GetStatus(
                       preset, engine_models, state))},
        {"alias", preset.name != preset.id ? json(preset.name) : json()}};
    data.push_back(std::move(entry));
  }
  return Reply({{"object", "list"}, {"data", data}});
}

ApiReply ControlApi::OpenAiModel(const std::string &model_id) {
  std::vector<EngineModel> engine_models;
  try {
    engine_models = services_.engine->ListModels();
  } catch (const ConnectionError &ex) {
    return Reply({{"error", "Failed to reach llama server"}, {"details", ex.what()}},
                 502);
  }
  auto it = std::find_if(engine_models.begin(), engine_models.end(),
                         [&](const EngineModel &m) { return m.id == model_id; });
  if (it == engine_models.end()) {
    return Reply({{"error",
                   {{"message", "Model '" + model_id + "' not found"},
                    {"type", "invalid_request_error"},
                    {"code", "model_not_found"}}}},
                 404);
  }

  json n_ctx;
  auto ctx_arg = std::find(it->args.begin(), it->args.end(), "--ctx-size");
  if (ctx_arg != it->args.end() && std::next(ctx_arg) != it->args.end()) {
    try {
      n_ctx = std::stoi(*std::next(ctx_arg));
    } catch (const std::exception &) {
      n_ctx = nullptr;
    }
  }
  if (n_ctx.is_null()) {
    n_ctx = services_.store->GetSettings().context_size;
  }
  auto aliases = services_.store->Aliases();
  auto alias = aliases.find(model_id);
  return Reply({{"id", it->id},
                {"object", "model"},
                {"created", UnixSeconds("")},
                {"owned_by", "llamacpp"},
                {"n_ctx", n_ctx},
                {"displayName", it->id},
                {"status", it->status.empty() ? "unknown" : it->status},
                {"alias", alias == aliases.end() ? json() : json(alias->second)}});
}

} // namespace enginectl
