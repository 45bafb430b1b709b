#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace enginectl {

// Sampling defaults and launch overrides carried by a preset.
struct PresetConfig {
  double temp{0.7};
  double top_p{1.0};
  int top_k{20};
  double min_p{0.0};
  // JSON object text merged into every request's chat_template_kwargs.
  std::string chat_template_kwargs;
  std::optional<std::string> reasoning_format; // never holds ""
  std::optional<int> gpu_layers;
  std::optional<bool> flash_attn;
  std::string extra_switches{"--jinja"};
};

// A named, durable engine launch configuration. When both model sources are
// set, hf_repo is what the engine is launched with.
struct Preset {
  std::string id;
  std::string name;
  std::string description;
  std::string model_path; // absolute local .gguf path, empty when unset
  std::string hf_repo;    // "org/repo:QUANT", empty when unset
  int context{0};         // 0 = engine default
  PresetConfig config;
  bool auto_generated{false};
  std::string created_at;

  bool HasModelSource() const { return !model_path.empty() || !hf_repo.empty(); }
};

nlohmann::json ToJson(const Preset &preset);
// Tolerant of missing keys and JSON nulls. Throws nlohmann::json::exception
// when a present key has the wrong type.
Preset PresetFromJson(const nlohmann::json &j);

// Parses Preset::config.chat_template_kwargs; returns an empty object when the
// text is blank or not a JSON object.
nlohmann::json ParseTemplateKwargs(const std::string &text);

// "model-00002-of-00004.gguf" -> {2, 4, "model.gguf"}.
struct SplitPart {
  int part{0};
  int total{0};
  std::string base_name;
};
std::optional<SplitPart> ParseSplitPart(const std::string &filename);

// Preset id from a file name or "org/repo:QUANT": quantisation, extension
// and split suffixes removed, lower-case, '-' separated.
std::string GeneratePresetId(const std::string &source);

// Human-readable name from the same inputs; keeps case. With
// include_quantization the first stripped quantisation tag is appended.
std::string ExtractModelName(const std::string &source,
                             bool include_quantization = false);

// Preset ids given to presets renamed through the API.
bool IsValidPresetId(const std::string &id);

// Presets seeded into a fresh store.
std::vector<Preset> DefaultPresets();

std::string CurrentIsoTimestamp();

} // namespace enginectl
