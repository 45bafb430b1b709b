#include <catch2/catch.hpp>

#include "control/compatibility.h"

using namespace enginectl;

namespace {

EngineRuntimeConfig Runtime(int context) {
  EngineRuntimeConfig runtime;
  runtime.context = context;
  return runtime;
}

} // namespace

TEST_CASE("Preset without overrides is compatible", "[compatibility]") {
  Preset preset;
  preset.context = 0;
  auto result = CompatibilityChecker::Check(preset, Runtime(4096));
  REQUIRE(result.compatible);
  REQUIRE(result.reasons.empty());
}

TEST_CASE("Context mismatch names both values", "[compatibility]") {
  Preset preset;
  preset.context = 8192;
  auto result = CompatibilityChecker::Check(preset, Runtime(4096));
  REQUIRE_FALSE(result.compatible);
  REQUIRE(result.reasons.size() == 1);
  REQUIRE(result.reasons[0] == "Context 8192 != current 4096");

  preset.context = 4096;
  REQUIRE(CompatibilityChecker::Check(preset, Runtime(4096)).compatible);
}

TEST_CASE("Launch overrides are compared only when set", "[compatibility]") {
  EngineRuntimeConfig runtime = Runtime(8192);
  runtime.gpu_layers = 99;
  runtime.flash_attn = false;

  Preset preset;
  preset.config.gpu_layers = 99;
  preset.config.flash_attn = false;
  REQUIRE(CompatibilityChecker::Check(preset, runtime).compatible);

  preset.config.gpu_layers = 20;
  preset.config.flash_attn = true;
  auto result = CompatibilityChecker::Check(preset, runtime);
  REQUIRE(result.reasons.size() == 2);
  REQUIRE(result.reasons[0] == "GPU layers 20 != current 99");
  REQUIRE(result.reasons[1] == "Flash attention true != current false");
}

TEST_CASE("Reasoning format must match the running engine",
          "[compatibility]") {
  Preset preset;
  preset.config.reasoning_format = "deepseek";
  auto result = CompatibilityChecker::Check(preset, Runtime(8192));
  REQUIRE_FALSE(result.compatible);
  REQUIRE(result.reasons[0] == "Reasoning format \"deepseek\" != current \"none\"");

  EngineRuntimeConfig runtime = Runtime(8192);
  runtime.reasoning_format = "deepseek";
  REQUIRE(CompatibilityChecker::Check(preset, runtime).compatible);
}

TEST_CASE("Sampling parameters never force a restart", "[compatibility]") {
  Preset preset;
  preset.config.temp = 1.5;
  preset.config.top_k = 1;
  preset.config.chat_template_kwargs = "{\"reasoning_effort\":\"low\"}";
  REQUIRE(CompatibilityChecker::Check(preset, Runtime(8192)).compatible);
}

TEST_CASE("Checker reads the committed orchestrator state", "[compatibility]") {
  OrchestratorState state(EngineState::Router(Runtime(4096)));
  CompatibilityChecker checker(&state);

  REQUIRE(checker.IsCompatible(nullptr).compatible);

  Preset preset;
  preset.context = 8192;
  REQUIRE_FALSE(checker.IsCompatible(&preset).compatible);

  state.SetPending(EngineState::Single(Runtime(8192), "wide"));
  REQUIRE_FALSE(checker.IsCompatible(&preset).compatible);

  state.CommitPending();
  REQUIRE(checker.IsCompatible(&preset).compatible);
}

TEST_CASE("OrchestratorState discards failed candidates", "[compatibility]") {
  OrchestratorState state(EngineState::Router(Runtime(4096)));
  state.SetPending(EngineState::Single(Runtime(8192), "wide"));
  REQUIRE(state.Pending().has_value());
  state.DiscardPending();
  REQUIRE_FALSE(state.Pending().has_value());
  REQUIRE(state.Committed().mode == EngineMode::kRouter);
  REQUIRE(state.Runtime().context == 4096);

  state.CommitPending();
  REQUIRE(state.Runtime().context == 4096);

  state.Commit(EngineState::Single(Runtime(2048), "small"));
  REQUIRE(state.Committed().active_preset_id == std::string("small"));
  REQUIRE(std::string(ModeName(state.Committed().mode)) == "single");
}
