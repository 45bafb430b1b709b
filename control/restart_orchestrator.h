#pragma once

#include "control/compatibility.h"
#include "control/config_store.h"
#include "control/orchestrator_state.h"
#include "control/preset.h"
#include "engine/engine_process.h"

#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>

namespace enginectl {

class LogBuffer;
class MetricsRegistry;

struct RestartResult {
  bool success{false};
  std::string error;
};

struct RestartOptions {
  std::string router_script{"scripts/start-llama.sh"};
  std::string preset_script{"scripts/start-preset.sh"};
  std::string working_dir;
  std::string models_dir;
  int engine_port{8080};
  std::chrono::milliseconds lock_wait{60000};
  std::chrono::milliseconds lock_poll{500};
  std::chrono::milliseconds health_timeout{60000};
  std::chrono::milliseconds health_interval{500};
};

// Launch config for running `preset` alone. Preset values win over settings;
// extra switches always carry --jinja plus any flag implied by the values.
EngineRuntimeConfig ComputePresetRuntime(const Preset &preset,
                                         const Settings &settings);
EngineRuntimeConfig ComputeRouterRuntime(const Settings &settings);

// Environment handed to the preset launch script.
std::map<std::string, std::string>
BuildPresetEnvironment(const Preset &preset, const EngineRuntimeConfig &runtime,
                       const RestartOptions &options);
std::map<std::string, std::string>
BuildRouterEnvironment(const Settings &settings,
                       const EngineRuntimeConfig &runtime,
                       const RestartOptions &options);

// Serialises engine relaunches. At most one restart, router start or stop
// runs at a time; the others wait a bounded time for it. The committed
// EngineState only changes once a launch passes its health check.
class RestartOrchestrator {
public:
  RestartOrchestrator(EngineProcess *engine, const ConfigStore *store,
                      RestartOptions options, LogBuffer *log_buffer = nullptr,
                      MetricsRegistry *metrics = nullptr);

  // Relaunches the engine in single mode for `preset`. When another restart
  // is in flight and leaves the engine compatible with `preset`, returns
  // success without relaunching.
  RestartResult RestartForPreset(const Preset &preset);
  // Same launch sequence, never short-circuits.
  RestartResult ActivatePreset(const Preset &preset);
  RestartResult StartRouter();
  RestartResult StopEngine();

  bool IsRestarting() const;
  CompatibilityResult CheckCompatibility(const Preset &preset) const;

  const OrchestratorState &State() const { return state_; }
  const RestartOptions &Options() const { return options_; }

private:
  class RestartGuard;

  // Returns false when the wait bound expires. *waited reports whether
  // another restart held the slot on entry.
  bool AcquireRestartSlot(bool *waited);
  void ReleaseRestartSlot();

  RestartResult LaunchPreset(const Preset &preset);
  RestartResult LaunchRouter();
  bool WaitForHealthy();
  void PublishState();

  EngineProcess *engine_;
  const ConfigStore *store_;
  RestartOptions options_;
  LogBuffer *log_buffer_;
  MetricsRegistry *metrics_;

  OrchestratorState state_;
  CompatibilityChecker checker_{&state_};

  mutable std::mutex restart_mutex_;
  std::condition_variable restart_cv_;
  bool restarting_{false};
};

} // namespace enginectl
