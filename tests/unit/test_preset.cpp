#include <catch2/catch.hpp>

#include "control/preset.h"

#include <nlohmann/json.hpp>

using namespace enginectl;
using json = nlohmann::json;

TEST_CASE("GeneratePresetId strips quantisation and extension", "[preset]") {
  REQUIRE(GeneratePresetId("Qwen3-Coder-30B-A3B-Instruct-Q5_K_M.gguf") ==
          "qwen3-coder-30b-a3b-instruct");
  REQUIRE(GeneratePresetId("Llama-3.2-3B-Instruct-BF16.gguf") ==
          "llama-3.2-3b-instruct");
  REQUIRE(GeneratePresetId("tiny_model_v2.gguf") == "tiny-model-v2");
}

TEST_CASE("GeneratePresetId handles repositories and split files",
          "[preset]") {
  REQUIRE(GeneratePresetId("unsloth/gpt-oss-120b-GGUF:Q5_K_M") == "gpt-oss-120b");
  REQUIRE(GeneratePresetId("model-00001-of-00003.gguf") == "model");
}

TEST_CASE("ExtractModelName keeps case and optionally the quantisation",
          "[preset]") {
  const std::string file = "Qwen3-Coder-30B-A3B-Instruct-Q5_K_M.gguf";
  REQUIRE(ExtractModelName(file) == "Qwen3-Coder-30B-A3B-Instruct");
  REQUIRE(ExtractModelName(file, true) == "Qwen3-Coder-30B-A3B-Instruct Q5_K_M");
  REQUIRE(ExtractModelName("my_model.gguf") == "my model");
}

TEST_CASE("ParseSplitPart recognises shard names", "[preset]") {
  auto part = ParseSplitPart("model-00002-of-00004.gguf");
  REQUIRE(part.has_value());
  REQUIRE(part->part == 2);
  REQUIRE(part->total == 4);
  REQUIRE(part->base_name == "model.gguf");

  REQUIRE_FALSE(ParseSplitPart("model.gguf").has_value());
  REQUIRE_FALSE(ParseSplitPart("model-2-of-4.gguf").has_value());
}

TEST_CASE("IsValidPresetId accepts lower-case ids only", "[preset]") {
  REQUIRE(IsValidPresetId("qwen3-coder"));
  REQUIRE(IsValidPresetId("gpt120"));
  REQUIRE_FALSE(IsValidPresetId(""));
  REQUIRE_FALSE(IsValidPresetId("Qwen3"));
  REQUIRE_FALSE(IsValidPresetId("qwen 3"));
  REQUIRE_FALSE(IsValidPresetId("qwen2.5"));
}

TEST_CASE("PresetFromJson tolerates missing keys and nulls", "[preset]") {
  json j = {{"id", "qwen3"},
            {"modelPath", nullptr},
            {"hfRepo", "Unsloth/Qwen3-GGUF:Q5_K_M"},
            {"context", "32768"}};
  Preset preset = PresetFromJson(j);
  REQUIRE(preset.id == "qwen3");
  REQUIRE(preset.name == "qwen3");
  REQUIRE(preset.model_path.empty());
  REQUIRE(preset.hf_repo == "Unsloth/Qwen3-GGUF:Q5_K_M");
  REQUIRE(preset.context == 32768);
  REQUIRE(preset.config.extra_switches == "--jinja");
  REQUIRE_FALSE(preset.config.reasoning_format.has_value());
  REQUIRE(preset.HasModelSource());
}

TEST_CASE("PresetFromJson reads the config block", "[preset]") {
  json j = {{"id", "gpt"},
            {"name", "GPT"},
            {"context", -5},
            {"config",
             {{"temp", 1.0},
              {"topK", 0},
              {"chatTemplateKwargs", {{"reasoning_effort", "high"}}},
              {"reasoningFormat", ""},
              {"gpuLayers", 40},
              {"flashAttn", true},
              {"extraSwitches", "--jinja --mlock"}}}};
  Preset preset = PresetFromJson(j);
  REQUIRE(preset.context == 0);
  REQUIRE(preset.config.temp == 1.0);
  REQUIRE(preset.config.top_k == 0);
  REQUIRE(ParseTemplateKwargs(preset.config.chat_template_kwargs)["reasoning_effort"] ==
          "high");
  REQUIRE_FALSE(preset.config.reasoning_format.has_value());
  REQUIRE(preset.config.gpu_layers == 40);
  REQUIRE(preset.config.flash_attn == true);
  REQUIRE(preset.config.extra_switches == "--jinja --mlock");
}

TEST_CASE("Preset JSON keeps optional fields out when unset", "[preset]") {
  Preset preset;
  preset.id = "local";
  preset.name = "Local";
  preset.model_path = "/models/local.gguf";
  json j = ToJson(preset);
  REQUIRE(j["hfRepo"].is_null());
  REQUIRE(j["modelPath"] == "/models/local.gguf");
  REQUIRE(j["config"]["reasoningFormat"].is_null());
  REQUIRE_FALSE(j["config"].contains("gpuLayers"));
  REQUIRE_FALSE(j.contains("autoGenerated"));

  Preset back = PresetFromJson(j);
  REQUIRE(back.model_path == preset.model_path);
  REQUIRE(back.config.extra_switches == "--jinja");
}

TEST_CASE("ParseTemplateKwargs rejects non-objects", "[preset]") {
  REQUIRE(ParseTemplateKwargs("").empty());
  REQUIRE(ParseTemplateKwargs("  ").empty());
  REQUIRE(ParseTemplateKwargs("[1,2]").empty());
  REQUIRE(ParseTemplateKwargs("{broken").empty());
  REQUIRE(ParseTemplateKwargs("{\"a\":1}")["a"] == 1);
}

TEST_CASE("DefaultPresets ship the seeded models", "[preset]") {
  auto presets = DefaultPresets();
  REQUIRE(presets.size() == 3);
  REQUIRE(presets[0].id == "gpt120");
  REQUIRE(presets[0].context == 131072);
  REQUIRE(presets[0].config.reasoning_format == std::string("deepseek"));
  for (const auto &preset : presets) {
    REQUIRE(preset.HasModelSource());
  }
}

TEST_CASE("CurrentIsoTimestamp is UTC with milliseconds", "[preset]") {
  auto ts = CurrentIsoTimestamp();
  REQUIRE(ts.size() == 24);
  REQUIRE(ts[10] == 'T');
  REQUIRE(ts.back() == 'Z');
}
