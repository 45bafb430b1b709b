#pragma once

#include <nlohmann/json.hpp>

#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace enginectl {

// What the running engine was launched with.
struct EngineRuntimeConfig {
  int context{8192};
  int gpu_layers{99};
  bool flash_attn{false};
  int models_max{2};
  std::optional<std::string> reasoning_format;
  std::string extra_switches{"--jinja"};
};

enum class EngineMode { kRouter, kSingle };

const char *ModeName(EngineMode mode);

// Runtime config plus mode. active_preset_id is set iff mode == kSingle; use
// the factories to keep it that way.
struct EngineState {
  EngineRuntimeConfig runtime;
  EngineMode mode{EngineMode::kRouter};
  std::optional<std::string> active_preset_id;

  static EngineState Router(const EngineRuntimeConfig &runtime);
  static EngineState Single(const EngineRuntimeConfig &runtime,
                            const std::string &preset_id);
};

nlohmann::json ToJson(const EngineRuntimeConfig &runtime);
nlohmann::json ToJson(const EngineState &state);

// The orchestrator's state: the committed state (last launch that passed its
// health check) and, while a restart is in flight, the pending candidate.
// Readers only ever see committed values.
class OrchestratorState {
public:
  OrchestratorState() = default;
  explicit OrchestratorState(EngineState initial) : committed_(std::move(initial)) {}

  EngineState Committed() const;
  EngineRuntimeConfig Runtime() const;
  std::optional<EngineState> Pending() const;

  void SetPending(EngineState candidate);
  // Pending becomes committed. No-op without a pending state.
  void CommitPending();
  void DiscardPending();
  // Replaces the committed state directly and clears any pending one.
  void Commit(EngineState state);

private:
  mutable std::mutex mutex_;
  EngineState committed_;
  std::optional<EngineState> pending_;
};

} // namespace enginectl
