#include "control/restart_orchestrator.h"

#include "server/logging/log_buffer.h"
#include "server/logging/logger.h"
#include "server/metrics/metrics.h"

#include <algorithm>
#include <sstream>
#include <thread>

namespace enginectl {

namespace {

std::string FormatNumber(double value) {
  std::ostringstream out;
  out << value;
  return out.str();
}

bool Contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

double ElapsedMs(std::chrono::steady_clock::time_point since) {
  return std::chrono::duration<double, std::milli>(
             std::chrono::steady_clock::now() - since)
      .count();
}

} // namespace

EngineRuntimeConfig ComputePresetRuntime(const Preset &preset,
                                         const Settings &settings) {
  EngineRuntimeConfig runtime;
  if (preset.context > 0) {
    runtime.context = preset.context;
  } else if (settings.context_size > 0) {
    runtime.context = settings.context_size;
  }
  runtime.gpu_layers = preset.config.gpu_layers.value_or(settings.gpu_layers);
  runtime.flash_attn = preset.config.flash_attn.value_or(settings.flash_attn);
  runtime.reasoning_format = preset.config.reasoning_format;
  runtime.models_max = 1;

  std::string switches = preset.config.extra_switches.empty()
                             ? std::string("--jinja")
                             : preset.config.extra_switches;
  if (!Contains(switches, "--jinja")) {
    switches = "--jinja " + switches;
  }
  if (runtime.flash_attn && !Contains(switches, "--flash-attn")) {
    switches += " --flash-attn";
  }
  if (runtime.reasoning_format && !Contains(switches, "--reasoning-format")) {
    switches += " --reasoning-format " + *runtime.reasoning_format;
  }
  runtime.extra_switches = switches;
  return runtime;
}

EngineRuntimeConfig ComputeRouterRuntime(const Settings &settings) {
  EngineRuntimeConfig runtime;
  if (settings.context_size > 0) {
    runtime.context = settings.context_size;
  }
  runtime.gpu_layers = settings.gpu_layers;
  runtime.flash_attn = settings.flash_attn;
  runtime.models_max = settings.models_max > 0 ? settings.models_max : 2;
  runtime.reasoning_format.reset();
  runtime.extra_switches = "--jinja";
  return runtime;
}

std::map<std::string, std::string>
BuildPresetEnvironment(const Preset &preset, const EngineRuntimeConfig &runtime,
                       const RestartOptions &options) {
  return {
      {"PORT", std::to_string(options.engine_port)},
      {"MODELS_DIR", options.models_dir},
      {"HF_REPO", preset.hf_repo},
      {"MODEL_PATH", preset.hf_repo.empty() ? preset.model_path : ""},
      {"CONTEXT", std::to_string(runtime.context)},
      {"GPU_LAYERS", std::to_string(runtime.gpu_layers)},
      {"TEMP", FormatNumber(preset.config.temp)},
      {"TOP_P", FormatNumber(preset.config.top_p)},
      {"TOP_K", std::to_string(preset.config.top_k)},
      {"MIN_P", FormatNumber(preset.config.min_p)},
      {"CHAT_TEMPLATE_KWARGS", preset.config.chat_template_kwargs},
      {"EXTRA_SWITCHES", runtime.extra_switches},
  };
}

std::map<std::string, std::string>
BuildRouterEnvironment(const Settings &settings,
                       const EngineRuntimeConfig &runtime,
                       const RestartOptions &options) {
  return {
      {"MODELS_DIR", options.models_dir},
      {"MODELS_MAX", std::to_string(runtime.models_max)},
      {"CONTEXT", std::to_string(runtime.context)},
      {"PORT", std::to_string(options.engine_port)},
      {"NO_WARMUP", settings.no_warmup ? "1" : ""},
      {"FLASH_ATTN", runtime.flash_attn ? "1" : ""},
      {"GPU_LAYERS", std::to_string(runtime.gpu_layers)},
  };
}

class RestartOrchestrator::RestartGuard {
public:
  explicit RestartGuard(RestartOrchestrator *owner) : owner_(owner) {}
  ~RestartGuard() { owner_->ReleaseRestartSlot(); }
  RestartGuard(const RestartGuard &) = delete;
  RestartGuard &operator=(const RestartGuard &) = delete;

private:
  RestartOrchestrator *owner_;
};

RestartOrchestrator::RestartOrchestrator(EngineProcess *engine,
                                         const ConfigStore *store,
                                         RestartOptions options,
                                         LogBuffer *log_buffer,
                                         MetricsRegistry *metrics)
    : engine_(engine), store_(store), options_(std::move(options)),
      log_buffer_(log_buffer), metrics_(metrics ? metrics : &GlobalMetrics()),
      state_(EngineState::Router(ComputeRouterRuntime(
          store ? store->GetSettings() : Settings{}))) {}

bool RestartOrchestrator::AcquireRestartSlot(bool *waited) {
  std::unique_lock<std::mutex> lock(restart_mutex_);
  *waited = restarting_;
  if (restarting_) {
    log::Info("orchestrator", "restart in progress; waiting");
  }
  auto deadline = std::chrono::steady_clock::now() + options_.lock_wait;
  while (restarting_) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return false;
    }
    auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    restart_cv_.wait_for(lock, std::min(options_.lock_poll, remaining));
  }
  restarting_ = true;
  return true;
}

void RestartOrchestrator::ReleaseRestartSlot() {
  {
    std::lock_guard<std::mutex> lock(restart_mutex_);
    restarting_ = false;
  }
  restart_cv_.notify_all();
}

bool RestartOrchestrator::IsRestarting() const {
  std::lock_guard<std::mutex> lock(restart_mutex_);
  return restarting_;
}

CompatibilityResult
RestartOrchestrator::CheckCompatibility(const Preset &preset) const {
  return checker_.IsCompatible(&preset);
}

RestartResult RestartOrchestrator::RestartForPreset(const Preset &preset) {
  bool waited = false;
  if (!AcquireRestartSlot(&waited)) {
    log::Error("orchestrator", "timed out waiting for concurrent restart",
               "preset=" + preset.id);
    return {false, "Timeout waiting for concurrent restart"};
  }
  RestartGuard guard(this);
  if (checker_.IsCompatible(&preset).compatible) {
    log::Info("orchestrator", "engine already compatible",
              "preset=" + preset.id + (waited ? " waited=1" : ""));
    return {true, ""};
  }
  return LaunchPreset(preset);
}

RestartResult RestartOrchestrator::ActivatePreset(const Preset &preset) {
  bool waited = false;
  if (!AcquireRestartSlot(&waited)) {
    return {false, "Timeout waiting for concurrent restart"};
  }
  RestartGuard guard(this);
  return LaunchPreset(preset);
}

RestartResult RestartOrchestrator::StartRouter() {
  bool waited = false;
  if (!AcquireRestartSlot(&waited)) {
    return {false, "Timeout waiting for concurrent restart"};
  }
  RestartGuard guard(this);
  return LaunchRouter();
}

RestartResult RestartOrchestrator::StopEngine() {
  bool waited = false;
  if (!AcquireRestartSlot(&waited)) {
    return {false, "Timeout waiting for concurrent restart"};
  }
  RestartGuard guard(this);
  try {
    engine_->Stop();
  } catch (const std::exception &ex) {
    log::Error("orchestrator", "engine stop failed", ex.what());
    return {false, ex.what()};
  }
  state_.Commit(EngineState::Router(state_.Runtime()));
  PublishState();
  metrics_->SetEngineUp(false);
  if (log_buffer_) {
    log_buffer_->Add("server", "llama-server stopped");
  }
  return {true, ""};
}

bool RestartOrchestrator::WaitForHealthy() {
  auto deadline = std::chrono::steady_clock::now() + options_.health_timeout;
  while (true) {
    if (engine_->IsHealthy()) {
      return true;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(options_.health_interval);
  }
}

void RestartOrchestrator::PublishState() {
  EngineState committed = state_.Committed();
  metrics_->SetSingleMode(committed.mode == EngineMode::kSingle);
}

RestartResult RestartOrchestrator::LaunchPreset(const Preset &preset) {
  auto started = std::chrono::steady_clock::now();
  log::Info("orchestrator", "restarting engine for preset", "preset=" + preset.id);
  if (log_buffer_) {
    log_buffer_->Add("server",
                     "Restarting llama-server for preset \"" + preset.id + "\"");
  }

  try {
    engine_->Stop();

    Settings settings = store_ ? store_->GetSettings() : Settings{};
    EngineRuntimeConfig runtime = ComputePresetRuntime(preset, settings);

    LaunchParams params;
    params.script = options_.preset_script;
    params.env = BuildPresetEnvironment(preset, runtime, options_);
    params.working_dir = options_.working_dir;
    params.description = "preset " + preset.id;

    state_.SetPending(EngineState::Single(runtime, preset.id));
    log::Info("orchestrator", "launching preset",
              "preset=" + preset.id + " context=" +
                  std::to_string(runtime.context) + " switches=\"" +
                  runtime.extra_switches + "\"");
    if (log_buffer_) {
      log_buffer_->Add("server", "Restarting for preset \"" + preset.id +
                                     "\" with context=" +
                                     std::to_string(runtime.context));
    }

    if (!engine_->Start(params)) {
      state_.DiscardPending();
      metrics_->RecordRestart(false, ElapsedMs(started));
      log::Error("orchestrator", "engine launch failed", "preset=" + preset.id);
      return {false, "Failed to start llama-server"};
    }
    metrics_->SetEngineUp(true);

    if (!WaitForHealthy()) {
      state_.DiscardPending();
      metrics_->RecordRestart(false, ElapsedMs(started));
      log::Error("orchestrator", "engine failed health check after restart",
                 "preset=" + preset.id);
      if (log_buffer_) {
        log_buffer_->Add("server", "Server restart failed: health check timeout");
      }
      return {false, "Server health check timeout"};
    }

    state_.CommitPending();
    PublishState();
    double elapsed = ElapsedMs(started);
    metrics_->RecordRestart(true, elapsed);
    log::Info("orchestrator", "engine restarted",
              "preset=" + preset.id + " ms=" + FormatNumber(elapsed));
    if (log_buffer_) {
      log_buffer_->Add("server", "Server restarted successfully for preset \"" +
                                     preset.id + "\"");
    }
    return {true, ""};
  } catch (const std::exception &ex) {
    state_.DiscardPending();
    metrics_->RecordRestart(false, ElapsedMs(started));
    log::Error("orchestrator", "restart failed", "preset=" + preset.id +
                                                   " error=" + ex.what());
    if (log_buffer_) {
      log_buffer_->Add("server", std::string("Server restart failed: ") + ex.what());
    }
    return {false, ex.what()};
  }
}

RestartResult RestartOrchestrator::LaunchRouter() {
  auto started = std::chrono::steady_clock::now();
  try {
    engine_->Stop();

    Settings settings = store_ ? store_->GetSettings() : Settings{};
    EngineRuntimeConfig runtime = ComputeRouterRuntime(settings);

    LaunchParams params;
    params.script = options_.router_script;
    params.env = BuildRouterEnvironment(settings, runtime, options_);
    params.working_dir = options_.working_dir;
    params.description = "router";

    state_.SetPending(EngineState::Router(runtime));
    log::Info("orchestrator", "starting engine in router mode",
              "context=" + std::to_string(runtime.context) + " gpu_layers=" +
                  std::to_string(runtime.gpu_layers) +
                  " models_max=" + std::to_string(runtime.models_max));
    if (log_buffer_) {
      log_buffer_->Add("server", "Starting llama-server in router mode");
    }

    if (!engine_->Start(params)) {
      state_.DiscardPending();
      metrics_->RecordRestart(false, ElapsedMs(started));
      return {false, "Failed to start llama-server"};
    }
    metrics_->SetEngineUp(true);

    if (!WaitForHealthy()) {
      state_.DiscardPending();
      metrics_->RecordRestart(false, ElapsedMs(started));
      log::Error("orchestrator", "router failed health check");
      if (log_buffer_) {
        log_buffer_->Add("server", "Server start failed: health check timeout");
      }
      return {false, "Server health check timeout"};
    }

    state_.CommitPending();
    PublishState();
    metrics_->RecordRestart(true, ElapsedMs(started));
    if (log_buffer_) {
      log_buffer_->Add("server", "llama-server started in router mode");
    }
    return {true, ""};
  } catch (const std::exception &ex) {
    state_.DiscardPending();
    metrics_->RecordRestart(false, ElapsedMs(started));
    log::Error("orchestrator", "router start failed", ex.what());
    return {false, ex.what()};
  }
}

} // namespace enginectl
