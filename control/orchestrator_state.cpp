#include "control/orchestrator_state.h"

namespace enginectl {

const char *ModeName(EngineMode mode) {
  switch (mode) {
  case EngineMode::kRouter:
    return "router";
  case EngineMode::kSingle:
    return "single";
  }
  return "unknown";
}

EngineState EngineState::Router(const EngineRuntimeConfig &runtime) {
  EngineState state;
  state.runtime = runtime;
  state.mode = EngineMode::kRouter;
  return state;
}

EngineState EngineState::Single(const EngineRuntimeConfig &runtime,
                                const std::string &preset_id) {
  EngineState state;
  state.runtime = runtime;
  state.mode = EngineMode::kSingle;
  state.active_preset_id = preset_id;
  return state;
}

nlohmann::json ToJson(const EngineRuntimeConfig &runtime) {
  return {{"context", runtime.context},
          {"gpuLayers", runtime.gpu_layers},
          {"flashAttn", runtime.flash_attn},
          {"modelsMax", runtime.models_max},
          {"reasoningFormat", runtime.reasoning_format
                                  ? nlohmann::json(*runtime.reasoning_format)
                                  : nlohmann::json()},
          {"extraSwitches", runtime.extra_switches}};
}

nlohmann::json ToJson(const EngineState &state) {
  return {{"mode", ModeName(state.mode)},
          {"currentPreset", state.active_preset_id
                                ? nlohmann::json(*state.active_preset_id)
                                : nlohmann::json()},
          {"serverConfig", ToJson(state.runtime)}};
}

EngineState OrchestratorState::Committed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return committed_;
}

EngineRuntimeConfig OrchestratorState::Runtime() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return committed_.runtime;
}

std::optional<EngineState> OrchestratorState::Pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_;
}

void OrchestratorState::SetPending(EngineState candidate) {
  std::lock_guard<std::mutex> lock(mutex_);
  pending_ = std::move(candidate);
}

void OrchestratorState::CommitPending() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (pending_) {
    committed_ = std::move(*pending_);
    pending_.reset();
  }
}

void OrchestratorState::DiscardPending() {
  std::lock_guard<std::mutex> lock(mutex_);
  pending_.reset();
}

void OrchestratorState::Commit(EngineState state) {
  std::lock_guard<std::mutex> lock(mutex_);
  committed_ = std::move(state);
  pending_.reset();
}

} // namespace enginectl
