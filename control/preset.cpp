#include "control/preset.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <regex>

using json = nlohmann::json;

namespace enginectl {

namespace {

const std::vector<std::regex> &QuantizationPatterns() {
  static const std::vector<std::regex> kPatterns = [] {
    const auto flags = std::regex::ECMAScript | std::regex::icase;
    return std::vector<std::regex>{
        std::regex("-IQ\\d_[A-Z]+$", flags), std::regex("-IQ\\d[A-Z]+$", flags),
        std::regex("-Q\\d_K_[A-Z]+$", flags), std::regex("-Q\\d_K$", flags),
        std::regex("-Q\\d_[A-Z]+$", flags),   std::regex("-Q\\d[A-Z]+$", flags),
        std::regex("-Q\\d$", flags),          std::regex("-F\\d\\d$", flags),
        std::regex("-F\\d$", flags),          std::regex("-FP\\d\\d$", flags),
        std::regex("-BF16$", flags),          std::regex("-GGUF$", flags),
    };
  }();
  return kPatterns;
}

const std::regex &SplitSuffixPattern() {
  static const std::regex kPattern("-\\d{5}-of-\\d{5}$", std::regex::icase);
  return kPattern;
}

// "org/repo:QUANT" -> "repo"; plain names pass through.
std::string RepoBaseName(const std::string &input) {
  std::string name = input;
  if (input.find('/') != std::string::npos) {
    name = input.substr(input.rfind('/') + 1);
    auto colon = name.find(':');
    if (colon != std::string::npos) {
      name = name.substr(0, colon);
    }
  }
  static const std::regex kExtension("\\.gguf$", std::regex::icase);
  return std::regex_replace(name, kExtension, "");
}

std::string StripTrailingHyphens(std::string name) {
  while (!name.empty() && name.back() == '-') {
    name.pop_back();
  }
  return name;
}

double NumberOr(const json &j, const char *key, double fallback) {
  if (!j.contains(key) || j[key].is_null()) {
    return fallback;
  }
  if (j[key].is_string()) {
    try {
      return std::stod(j[key].get<std::string>());
    } catch (const std::exception &) {
      return fallback;
    }
  }
  return j[key].get<double>();
}

std::string StringOr(const json &j, const char *key,
                     const std::string &fallback = {}) {
  if (!j.contains(key) || j[key].is_null()) {
    return fallback;
  }
  return j[key].get<std::string>();
}

} // namespace

std::string CurrentIsoTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch())
                .count() %
            1000;
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  char out[40];
  std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(ms));
  return out;
}

json ToJson(const Preset &preset) {
  json config;
  config["temp"] = preset.config.temp;
  config["topP"] = preset.config.top_p;
  config["topK"] = preset.config.top_k;
  config["minP"] = preset.config.min_p;
  config["chatTemplateKwargs"] = preset.config.chat_template_kwargs;
  config["reasoningFormat"] = preset.config.reasoning_format
                                  ? json(*preset.config.reasoning_format)
                                  : json();
  if (preset.config.gpu_layers) {
    config["gpuLayers"] = *preset.config.gpu_layers;
  }
  if (preset.config.flash_attn) {
    config["flashAttn"] = *preset.config.flash_attn;
  }
  config["extraSwitches"] = preset.config.extra_switches;

  json j;
  j["id"] = preset.id;
  j["name"] = preset.name;
  j["description"] = preset.description;
  j["modelPath"] = preset.model_path.empty() ? json() : json(preset.model_path);
  j["hfRepo"] = preset.hf_repo.empty() ? json() : json(preset.hf_repo);
  j["context"] = preset.context;
  j["config"] = config;
  if (preset.auto_generated) {
    j["autoGenerated"] = true;
  }
  if (!preset.created_at.empty()) {
    j["createdAt"] = preset.created_at;
  }
  return j;
}

Preset PresetFromJson(const json &j) {
  Preset preset;
  preset.id = StringOr(j, "id");
  preset.name = StringOr(j, "name", preset.id);
  preset.description = StringOr(j, "description");
  preset.model_path = StringOr(j, "modelPath");
  preset.hf_repo = StringOr(j, "hfRepo");
  preset.context = static_cast<int>(NumberOr(j, "context", 0));
  if (preset.context < 0) {
    preset.context = 0;
  }
  preset.auto_generated =
      j.contains("autoGenerated") && j["autoGenerated"].is_boolean() &&
      j["autoGenerated"].get<bool>();
  preset.created_at = StringOr(j, "createdAt");

  if (j.contains("config") && j["config"].is_object()) {
    const json &c = j["config"];
    preset.config.temp = NumberOr(c, "temp", 0.7);
    preset.config.top_p = NumberOr(c, "topP", 1.0);
    preset.config.top_k = static_cast<int>(NumberOr(c, "topK", 20));
    preset.config.min_p = NumberOr(c, "minP", 0.0);
    if (c.contains("chatTemplateKwargs") && c["chatTemplateKwargs"].is_object()) {
      preset.config.chat_template_kwargs = c["chatTemplateKwargs"].dump();
    } else {
      preset.config.chat_template_kwargs = StringOr(c, "chatTemplateKwargs");
    }
    auto reasoning = StringOr(c, "reasoningFormat");
    if (!reasoning.empty()) {
      preset.config.reasoning_format = reasoning;
    }
    if (c.contains("gpuLayers") && c["gpuLayers"].is_number()) {
      preset.config.gpu_layers = c["gpuLayers"].get<int>();
    }
    if (c.contains("flashAttn") && c["flashAttn"].is_boolean()) {
      preset.config.flash_attn = c["flashAttn"].get<bool>();
    }
    preset.config.extra_switches = StringOr(c, "extraSwitches", "--jinja");
  }
  return preset;
}

json ParseTemplateKwargs(const std::string &text) {
  if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
    return json::object();
  }
  json parsed = json::parse(text, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    return json::object();
  }
  return parsed;
}

std::optional<SplitPart> ParseSplitPart(const std::string &filename) {
  static const std::regex kSplit("-(\\d{5})-of-(\\d{5})\\.gguf$",
                                 std::regex::icase);
  std::smatch match;
  if (!std::regex_search(filename, match, kSplit)) {
    return std::nullopt;
  }
  SplitPart part;
  part.part = std::stoi(match[1].str());
  part.total = std::stoi(match[2].str());
  part.base_name = std::regex_replace(filename, kSplit, ".gguf");
  return part;
}

std::string GeneratePresetId(const std::string &source) {
  std::string name = RepoBaseName(source);
  for (const auto &pattern : QuantizationPatterns()) {
    name = std::regex_replace(name, pattern, "");
  }
  name = std::regex_replace(name, SplitSuffixPattern(), "");
  std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  static const std::regex kSeparators("[_\\s]+");
  static const std::regex kDoubleHyphen("--+");
  name = std::regex_replace(name, kSeparators, "-");
  name = std::regex_replace(name, kDoubleHyphen, "-");
  return StripTrailingHyphens(name);
}

std::string ExtractModelName(const std::string &source,
                             bool include_quantization) {
  std::string name = RepoBaseName(source);
  std::string quant_suffix;
  for (const auto &pattern : QuantizationPatterns()) {
    std::smatch match;
    if (std::regex_search(name, match, pattern)) {
      if (include_quantization && quant_suffix.empty()) {
        quant_suffix = match[0].str();
        if (!quant_suffix.empty() && quant_suffix.front() == '-') {
          quant_suffix.front() = ' ';
        }
      }
      name = std::regex_replace(name, pattern, "");
    }
  }
  name = std::regex_replace(name, SplitSuffixPattern(), "");
  std::replace(name.begin(), name.end(), '_', ' ');
  name = StripTrailingHyphens(name);
  if (include_quantization && !quant_suffix.empty()) {
    name += quant_suffix;
  }
  return name;
}

bool IsValidPresetId(const std::string &id) {
  static const std::regex kId("^[a-z0-9-]+$");
  return std::regex_match(id, kId);
}

std::vector<Preset> DefaultPresets() {
  std::vector<Preset> presets;

  Preset gpt;
  gpt.id = "gpt120";
  gpt.name = "GPT-OSS 120B";
  gpt.description = "Large reasoning model with high effort mode";
  gpt.hf_repo = "Unsloth/gpt-oss-120b-GGUF:Q5_K_M";
  gpt.context = 131072;
  gpt.config.chat_template_kwargs = "{\"reasoning_effort\": \"high\"}";
  gpt.config.reasoning_format = "deepseek";
  gpt.config.temp = 1.0;
  gpt.config.top_p = 1.0;
  gpt.config.top_k = 0;
  gpt.config.min_p = 0.0;
  presets.push_back(gpt);

  Preset qwen3;
  qwen3.id = "qwen3";
  qwen3.name = "Qwen3 Coder 30B-A3B";
  qwen3.description = "Fast MoE coding model with 30B total / 3B active params";
  qwen3.hf_repo = "Unsloth/Qwen3-Coder-30B-A3B-Instruct-GGUF:Q5_K_M";
  qwen3.config.reasoning_format = "deepseek";
  presets.push_back(qwen3);

  Preset qwen25;
  qwen25.id = "qwen2.5";
  qwen25.name = "Qwen 2.5 Coder 32B";
  qwen25.description = "Dense 32B coding model, high quality";
  qwen25.hf_repo = "Qwen/Qwen2.5-Coder-32B-Instruct-GGUF:Q5_K_M";
  qwen25.config.reasoning_format = "deepseek";
  presets.push_back(qwen25);

  return presets;
}

} // namespace enginectl
