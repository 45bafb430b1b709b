#include <catch2/catch.hpp>

#include "control/model_resolver.h"
#include "server/logging/log_buffer.h"
#include "tests/unit/test_support.h"

using namespace enginectl;
using enginectl::testing::TempDir;

namespace {

struct ResolverFixture {
  TempDir models{"models"};
  TempDir data{"data"};
  ConfigStore store{data.Str() + "/config.json"};
  LogBuffer log_buffer;

  ResolverFixture() {
    REQUIRE(store.Load());
    Preset local;
    local.id = "tiny";
    local.model_path = models.Str() + "/tiny/tiny-Q4_K_M.gguf";
    REQUIRE(store.AddPreset(local) == StoreStatus::kOk);
  }

  ModelResolver Resolver() { return ModelResolver(&store, models.Str() + "/", &log_buffer); }
};

EngineModel Loaded(const std::string &id, const std::string &status = "loaded") {
  EngineModel model;
  model.id = id;
  model.status = status;
  return model;
}

} // namespace

TEST_CASE("ModelResolver prefers exact preset ids", "[model_resolver]") {
  ResolverFixture fx;
  auto resolver = fx.Resolver();
  auto resolved = resolver.Resolve("qwen3");
  REQUIRE(resolved.has_value());
  REQUIRE(resolved->IsPreset());
  REQUIRE(resolved->preset.id == "qwen3");
  REQUIRE(resolver.ResolvePath(*resolved) ==
          std::string("Unsloth/Qwen3-Coder-30B-A3B-Instruct-GGUF:Q5_K_M"));
}

TEST_CASE("ModelResolver rejects empty and unknown ids", "[model_resolver]") {
  ResolverFixture fx;
  auto resolver = fx.Resolver();
  REQUIRE_FALSE(resolver.Resolve("").has_value());
  REQUIRE_FALSE(resolver.Resolve("no-such-model").has_value());
  REQUIRE_FALSE(resolver.Resolve("missing.gguf").has_value());
}

TEST_CASE("ModelResolver accepts direct files with a deprecation notice",
          "[model_resolver]") {
  ResolverFixture fx;
  fx.models.Touch("family/direct.gguf");
  auto resolver = fx.Resolver();

  auto resolved = resolver.Resolve("family/direct.gguf");
  REQUIRE(resolved.has_value());
  REQUIRE_FALSE(resolved->IsPreset());
  REQUIRE(resolved->relative_path == "family/direct.gguf");
  REQUIRE(resolved->path == (fx.models.Path() / "family/direct.gguf").string());
  REQUIRE(resolver.ResolvePath(*resolved) == std::string("family"));

  auto lines = fx.log_buffer.Snapshot();
  REQUIRE_FALSE(lines.empty());
  REQUIRE(lines.back().message.find("DEPRECATION") != std::string::npos);
}

TEST_CASE("ModelResolver matches presets by model file name",
          "[model_resolver]") {
  ResolverFixture fx;
  auto resolver = fx.Resolver();
  auto by_name = resolver.Resolve("tiny-Q4_K_M.gguf");
  REQUIRE(by_name.has_value());
  REQUIRE(by_name->preset.id == "tiny");

  auto by_suffix = resolver.Resolve("elsewhere/tiny-Q4_K_M.gguf");
  REQUIRE(by_suffix.has_value());
  REQUIRE(by_suffix->preset.id == "tiny");
}

TEST_CASE("ModelResolver resolution is stable across calls",
          "[model_resolver]") {
  ResolverFixture fx;
  auto resolver = fx.Resolver();
  auto first = resolver.Resolve("tiny");
  auto second = resolver.Resolve("tiny");
  REQUIRE(first.has_value());
  REQUIRE(second.has_value());
  REQUIRE(resolver.ResolvePath(*first) == resolver.ResolvePath(*second));
  REQUIRE(resolver.ResolvePath(*first) == std::string("tiny"));
}

TEST_CASE("ResolvePresetPath handles files outside the model root",
          "[model_resolver]") {
  ResolverFixture fx;
  auto resolver = fx.Resolver();
  Preset outside;
  outside.model_path = "/opt/other/model.gguf";
  REQUIRE(resolver.ResolvePresetPath(outside) == std::string("model.gguf"));

  Preset both = outside;
  both.model_path = fx.models.Str() + "/top.gguf";
  both.hf_repo = "org/repo:Q4";
  REQUIRE(resolver.ResolvePresetPath(both) == std::string("top.gguf"));

  Preset none;
  REQUIRE_FALSE(resolver.ResolvePresetPath(none).has_value());
}

TEST_CASE("GetStatus derives load state from the engine listing",
          "[model_resolver]") {
  ResolverFixture fx;
  auto resolver = fx.Resolver();
  Preset tiny = *fx.store.GetPreset("tiny");
  EngineState router = EngineState::Router(EngineRuntimeConfig{});

  REQUIRE(resolver.GetStatus(tiny, {}, router) == PresetStatus::kAvailable);
  REQUIRE(resolver.GetStatus(tiny, {Loaded("tiny")}, router) ==
          PresetStatus::kLoaded);
  REQUIRE(resolver.GetStatus(tiny, {Loaded("tiny", "loading")}, router) ==
          PresetStatus::kLoading);
  REQUIRE(resolver.GetStatus(tiny, {Loaded("other")}, router) ==
          PresetStatus::kAvailable);

  Preset wide = tiny;
  wide.context = 65536;
  REQUIRE(resolver.GetStatus(wide, {Loaded("tiny")}, router) ==
          PresetStatus::kAvailable);

  Preset sourceless;
  sourceless.id = "empty";
  REQUIRE(resolver.GetStatus(sourceless, {Loaded("x")}, router) ==
          PresetStatus::kNotDownloaded);

  EngineState single = EngineState::Single(EngineRuntimeConfig{}, "empty");
  REQUIRE(resolver.GetStatus(sourceless, {Loaded("x")}, single) ==
          PresetStatus::kLoaded);
  REQUIRE(std::string(PresetStatusName(PresetStatus::kNotDownloaded)) ==
          "not_downloaded");
}
