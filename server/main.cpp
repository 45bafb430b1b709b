#include "control/config_store.h"
#include "control/model_resolver.h"
#include "control/model_scanner.h"
#include "control/restart_orchestrator.h"
#include "engine/engine_client.h"
#include "engine/script_engine_process.h"
#include "proxy/proxy_gateway.h"
#include "server/http/control_api.h"
#include "server/http/http_server.h"
#include "server/logging/conversation_log.h"
#include "server/logging/log_buffer.h"
#include "server/logging/logger.h"
#include "server/metrics/metrics.h"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace {

struct ServerConfig {
  std::string host{"0.0.0.0"};
  int http_port{3001};
  int workers{8};
  bool tls_enabled{false};
  std::string tls_cert_path;
  std::string tls_key_path;

  std::string engine_host{"127.0.0.1"};
  int engine_port{8080};
  std::string router_script{"scripts/start-llama.sh"};
  std::string preset_script{"scripts/start-preset.sh"};
  std::string process_name{"llama-server"};
  std::vector<std::string> container_command;
  std::string working_dir;
  int stop_timeout_ms{10000};
  int health_timeout_ms{60000};
  int health_interval_ms{500};
  int lock_wait_timeout_ms{60000};

  int connect_retries{3};
  int retry_base_delay_ms{1000};

  std::string models_dir;
  bool migrate_on_start{true};

  std::string store_path{"data/enginectl.json"};

  std::string log_format{"text"};
  std::string log_level{"info"};
  std::string conversation_log;
  bool conversation_content{false};
};

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

std::vector<std::string> SplitWords(const std::string &text) {
  std::vector<std::string> words;
  std::istringstream in(text);
  std::string word;
  while (in >> word) {
    words.push_back(word);
  }
  return words;
}

int ParseIntOr(const char *text, int fallback) {
  try {
    return std::stoi(text);
  } catch (const std::exception &) {
    return fallback;
  }
}

std::string DefaultModelsDir() {
  const char *home = std::getenv("HOME");
  return std::string(home ? home : ".") + "/models";
}

void LoadYaml(const std::string &config_path, ServerConfig *cfg) {
  YAML::Node config = YAML::LoadFile(config_path);

  if (auto server = config["server"]) {
    if (server["host"]) cfg->host = server["host"].as<std::string>();
    if (server["http_port"]) cfg->http_port = server["http_port"].as<int>();
    if (server["workers"]) cfg->workers = server["workers"].as<int>();
    if (auto tls = server["tls"]) {
      if (tls["enabled"]) cfg->tls_enabled = tls["enabled"].as<bool>();
      if (tls["cert_path"]) cfg->tls_cert_path = tls["cert_path"].as<std::string>();
      if (tls["key_path"]) cfg->tls_key_path = tls["key_path"].as<std::string>();
    }
  }

  if (auto engine = config["engine"]) {
    if (engine["host"]) cfg->engine_host = engine["host"].as<std::string>();
    if (engine["port"]) cfg->engine_port = engine["port"].as<int>();
    if (engine["router_script"]) cfg->router_script = engine["router_script"].as<std::string>();
    if (engine["preset_script"]) cfg->preset_script = engine["preset_script"].as<std::string>();
    if (engine["process_name"]) cfg->process_name = engine["process_name"].as<std::string>();
    if (engine["working_dir"]) cfg->working_dir = engine["working_dir"].as<std::string>();
    if (engine["container_command"]) {
      auto node = engine["container_command"];
      cfg->container_command.clear();
      if (node.IsSequence()) {
        for (const auto &item : node) {
          cfg->container_command.push_back(item.as<std::string>());
        }
      } else {
        cfg->container_command = SplitWords(node.as<std::string>());
      }
    }
    if (engine["stop_timeout_ms"]) cfg->stop_timeout_ms = engine["stop_timeout_ms"].as<int>();
    if (engine["health_timeout_ms"]) cfg->health_timeout_ms = engine["health_timeout_ms"].as<int>();
    if (engine["health_interval_ms"]) cfg->health_interval_ms = engine["health_interval_ms"].as<int>();
    if (engine["lock_wait_timeout_ms"]) cfg->lock_wait_timeout_ms = engine["lock_wait_timeout_ms"].as<int>();
  }

  if (auto proxy = config["proxy"]) {
    if (proxy["connect_retries"]) cfg->connect_retries = proxy["connect_retries"].as<int>();
    if (proxy["retry_base_delay_ms"]) cfg->retry_base_delay_ms = proxy["retry_base_delay_ms"].as<int>();
  }

  if (auto models = config["models"]) {
    if (models["dir"]) cfg->models_dir = models["dir"].as<std::string>();
    if (models["migrate_on_start"]) cfg->migrate_on_start = models["migrate_on_start"].as<bool>();
  }

  if (config["store"] && config["store"]["path"]) {
    cfg->store_path = config["store"]["path"].as<std::string>();
  }

  if (auto logging = config["logging"]) {
    if (logging["format"]) cfg->log_format = logging["format"].as<std::string>();
    if (logging["level"]) cfg->log_level = logging["level"].as<std::string>();
    if (logging["conversation_log"]) cfg->conversation_log = logging["conversation_log"].as<std::string>();
    if (logging["conversation_content"]) cfg->conversation_content = logging["conversation_content"].as<bool>();
  }
}

void ApplyEnvOverrides(ServerConfig *cfg) {
  if (const char *env_models = std::getenv("ENGINECTL_MODELS_DIR")) {
    cfg->models_dir = env_models;
  }
  if (const char *env_engine_port = std::getenv("ENGINECTL_ENGINE_PORT")) {
    cfg->engine_port = ParseIntOr(env_engine_port, cfg->engine_port);
  }
  if (const char *env_port = std::getenv("ENGINECTL_HTTP_PORT")) {
    cfg->http_port = ParseIntOr(env_port, cfg->http_port);
  }
  if (const char *env_store = std::getenv("ENGINECTL_STORE_PATH")) {
    cfg->store_path = env_store;
  }
  if (const char *env_format = std::getenv("ENGINECTL_LOG_FORMAT")) {
    cfg->log_format = env_format;
  }
  if (const char *env_level = std::getenv("ENGINECTL_LOG_LEVEL")) {
    cfg->log_level = env_level;
  }
  if (const char *env_container = std::getenv("ENGINECTL_CONTAINER_COMMAND")) {
    cfg->container_command = SplitWords(env_container);
  }
}

} // namespace

static std::atomic<bool> g_running{true};

void SignalHandler(int) { g_running = false; }

int main(int argc, char **argv) {
  std::string config_path = "config/enginectl.yaml";
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    }
  }

  ServerConfig cfg;
  if (std::filesystem::exists(config_path)) {
    try {
      LoadYaml(config_path, &cfg);
    } catch (const YAML::Exception &e) {
      std::cerr << "Error parsing config file " << config_path << ": "
                << e.what() << std::endl;
    }
  }
  ApplyEnvOverrides(&cfg);
  if (cfg.models_dir.empty()) {
    cfg.models_dir = DefaultModelsDir();
  }

  enginectl::log::SetJsonMode(ToLower(cfg.log_format) == "json");
  enginectl::log::SetMinLevel(enginectl::log::ParseLevel(cfg.log_level));

  auto &metrics = enginectl::GlobalMetrics();

  enginectl::ConfigStore store(cfg.store_path);
  if (!store.Load()) {
    enginectl::log::Error("main", "config store unreadable, using defaults",
                          "path=" + cfg.store_path);
  }

  enginectl::LogBuffer log_buffer;
  log_buffer.SetCustomFilters(store.GetSettings().log_filters);

  enginectl::ConversationLog conversations(cfg.conversation_log,
                                           cfg.conversation_content);

  enginectl::ModelScanner scanner(cfg.models_dir);
  if (cfg.migrate_on_start) {
    int created = scanner.MigrateExistingModels(store);
    if (created > 0) {
      enginectl::log::Info("main", "created presets for local models",
                           "count=" + std::to_string(created));
      if (!store.Save()) {
        enginectl::log::Error("main", "failed to persist migrated presets",
                              "path=" + store.Path());
      }
    }
  }
  enginectl::ModelResolver resolver(&store, cfg.models_dir, &log_buffer);

  enginectl::HttpEngineClient engine_client(
      "http://" + cfg.engine_host + ":" + std::to_string(cfg.engine_port));

  enginectl::ScriptEngineProcess::Options process_options;
  process_options.stop_timeout = std::chrono::milliseconds(cfg.stop_timeout_ms);
  process_options.process_name = cfg.process_name;
  process_options.port = cfg.engine_port;
  process_options.container_command = cfg.container_command;
  enginectl::ScriptEngineProcess engine_process(process_options, &engine_client,
                                                &log_buffer);
  engine_process.SetExitCallback([&metrics](int) { metrics.SetEngineUp(false); });

  enginectl::RestartOptions restart_options;
  restart_options.router_script = cfg.router_script;
  restart_options.preset_script = cfg.preset_script;
  restart_options.working_dir = cfg.working_dir;
  restart_options.models_dir = cfg.models_dir;
  restart_options.engine_port = cfg.engine_port;
  restart_options.lock_wait = std::chrono::milliseconds(cfg.lock_wait_timeout_ms);
  restart_options.health_timeout = std::chrono::milliseconds(cfg.health_timeout_ms);
  restart_options.health_interval =
      std::chrono::milliseconds(cfg.health_interval_ms);
  enginectl::RestartOrchestrator orchestrator(&engine_process, &store,
                                              restart_options, &log_buffer,
                                              &metrics);

  enginectl::ProxyOptions proxy_options;
  proxy_options.connect_retries = cfg.connect_retries;
  proxy_options.retry_base_delay =
      std::chrono::milliseconds(cfg.retry_base_delay_ms);
  enginectl::ProxyGateway gateway(&engine_client, &orchestrator, &store,
                                  &resolver, &conversations, &log_buffer,
                                  &metrics, proxy_options);

  enginectl::ControlApi::Services services;
  services.store = &store;
  services.scanner = &scanner;
  services.resolver = &resolver;
  services.orchestrator = &orchestrator;
  services.engine_process = &engine_process;
  services.engine = &engine_client;
  services.gateway = &gateway;
  services.log_buffer = &log_buffer;
  services.conversations = &conversations;
  services.engine_port = cfg.engine_port;
  enginectl::ControlApi api(services);

  enginectl::HttpServer::TlsConfig tls_config;
  tls_config.enabled = cfg.tls_enabled;
  tls_config.cert_path = cfg.tls_cert_path;
  tls_config.key_path = cfg.tls_key_path;
  enginectl::HttpServer server(cfg.host, cfg.http_port, &api, &gateway, &metrics,
                               tls_config, cfg.workers);
  server.SetAccessLog(&store, &log_buffer);

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  server.Start();
  enginectl::log::Info("main", "enginectl listening",
                       cfg.host + ":" + std::to_string(cfg.http_port) +
                           (tls_config.enabled ? " tls=on" : "") +
                           " models_dir=" + cfg.models_dir);

  if (store.GetSettings().auto_start) {
    log_buffer.Add("manager", "Auto-starting llama-server in router mode");
    auto result = orchestrator.StartRouter();
    if (!result.success) {
      enginectl::log::Error("main", "router auto-start failed", result.error);
    }
  }

  while (g_running) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  enginectl::log::Info("main", "shutting down");
  server.Stop();
  auto stopped = orchestrator.StopEngine();
  if (!stopped.success) {
    enginectl::log::Error("main", "engine stop failed", stopped.error);
  }
  return 0;
}
