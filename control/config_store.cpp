#include "control/config_store.h"

#include "server/logging/logger.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;

namespace enginectl {

namespace {

bool IsEffort(const std::string &value) {
  return value == "low" || value == "medium" || value == "high";
}

// Accepts numbers and numeric strings.
std::optional<int> AsInt(const ordered_json &value) {
  if (value.is_number()) {
    return value.get<int>();
  }
  if (value.is_string()) {
    try {
      return std::stoi(value.get<std::string>());
    } catch (const std::exception &) {
      return std::nullopt;
    }
  }
  return std::nullopt;
}

// Loose truthiness for boolean settings.
bool AsBool(const ordered_json &value) {
  if (value.is_boolean()) {
    return value.get<bool>();
  }
  if (value.is_number()) {
    return value.get<double>() != 0.0;
  }
  if (value.is_string()) {
    return !value.get<std::string>().empty();
  }
  return false;
}

ordered_json ToOrdered(const json &j) { return ordered_json::parse(j.dump()); }
json FromOrdered(const ordered_json &j) { return json::parse(j.dump()); }

} // namespace

ordered_json ToJson(const Settings &settings) {
  ordered_json j;
  j["contextSize"] = settings.context_size;
  j["modelsMax"] = settings.models_max;
  j["autoStart"] = settings.auto_start;
  j["noWarmup"] = settings.no_warmup;
  j["flashAttn"] = settings.flash_attn;
  j["gpuLayers"] = settings.gpu_layers;
  j["requestLogging"] = settings.request_logging;
  j["defaultReasoningEffort"] = settings.default_reasoning_effort
                                    ? ordered_json(*settings.default_reasoning_effort)
                                    : ordered_json();
  ordered_json efforts = ordered_json::object();
  for (const auto &[pattern, effort] : settings.model_reasoning_effort) {
    efforts[pattern] = effort;
  }
  j["modelReasoningEffort"] = efforts;
  j["logFilters"] = settings.log_filters;
  return j;
}

bool ApplySettingsUpdate(const Settings &current, const ordered_json &update,
                         Settings *out, std::string *error) {
  if (!update.is_object()) {
    *error = "Settings body must be a JSON object";
    return false;
  }
  Settings next = current;
  if (update.contains("contextSize")) {
    auto size = AsInt(update["contextSize"]);
    if (!size || *size < 512 || *size > 262144) {
      *error = "Context size must be between 512 and 262144";
      return false;
    }
    next.context_size = *size;
  }
  if (update.contains("modelsMax")) {
    auto max = AsInt(update["modelsMax"]);
    if (!max || *max < 1 || *max > 10) {
      *error = "Max models must be between 1 and 10";
      return false;
    }
    next.models_max = *max;
  }
  if (update.contains("gpuLayers")) {
    auto layers = AsInt(update["gpuLayers"]);
    if (!layers || *layers < 0 || *layers > 999) {
      *error = "GPU layers must be between 0 and 999";
      return false;
    }
    next.gpu_layers = *layers;
  }
  if (update.contains("autoStart")) {
    next.auto_start = AsBool(update["autoStart"]);
  }
  if (update.contains("noWarmup")) {
    next.no_warmup = AsBool(update["noWarmup"]);
  }
  if (update.contains("flashAttn")) {
    next.flash_attn = AsBool(update["flashAttn"]);
  }
  if (update.contains("requestLogging")) {
    next.request_logging = AsBool(update["requestLogging"]);
  }
  if (update.contains("defaultReasoningEffort")) {
    const auto &value = update["defaultReasoningEffort"];
    if (value.is_null()) {
      next.default_reasoning_effort.reset();
    } else if (value.is_string() && IsEffort(value.get<std::string>())) {
      next.default_reasoning_effort = value.get<std::string>();
    } else {
      *error = "defaultReasoningEffort must be null, \"low\", \"medium\", or "
               "\"high\"";
      return false;
    }
  }
  if (update.contains("modelReasoningEffort")) {
    const auto &value = update["modelReasoningEffort"];
    if (!value.is_object()) {
      *error = "modelReasoningEffort must be an object mapping model patterns "
               "to effort levels";
      return false;
    }
    next.model_reasoning_effort.clear();
    for (auto it = value.begin(); it != value.end(); ++it) {
      if (!it.value().is_string() || !IsEffort(it.value().get<std::string>())) {
        *error = "Invalid effort for pattern \"" + it.key() +
                 "\". Must be \"low\", \"medium\", or \"high\"";
        return false;
      }
      next.model_reasoning_effort.emplace_back(it.key(),
                                               it.value().get<std::string>());
    }
  }
  if (update.contains("logFilters")) {
    const auto &value = update["logFilters"];
    if (!value.is_array()) {
      *error = "logFilters must be an array of patterns";
      return false;
    }
    next.log_filters.clear();
    for (const auto &item : value) {
      if (item.is_string() && !item.get<std::string>().empty()) {
        next.log_filters.push_back(item.get<std::string>());
      }
    }
  }
  *out = std::move(next);
  return true;
}

ConfigStore::ConfigStore(std::string path) : path_(std::move(path)) {}

void ConfigStore::EnsureParentDir() const {
  auto parent = std::filesystem::path(path_).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
  }
}

void ConfigStore::ParseDocument(const ordered_json &doc) {
  presets_.clear();
  aliases_.clear();
  settings_ = Settings{};
  extras_ = ordered_json::object();

  ordered_json presets = ordered_json::object();
  if (doc.contains("customPresets") && doc["customPresets"].is_object()) {
    log::Warn("config_store", "migrating legacy customPresets into presets");
    presets = doc["customPresets"];
  }
  if (doc.contains("presets") && doc["presets"].is_object()) {
    // "presets" wins over "customPresets" on id collisions.
    for (auto it = doc["presets"].begin(); it != doc["presets"].end(); ++it) {
      presets[it.key()] = it.value();
    }
  }
  for (auto it = presets.begin(); it != presets.end(); ++it) {
    if (!it.value().is_object()) {
      continue;
    }
    try {
      Preset preset = PresetFromJson(FromOrdered(it.value()));
      preset.id = it.key();
      presets_.push_back(std::move(preset));
    } catch (const json::exception &e) {
      log::Warn("config_store", "skipping malformed preset",
                "id=" + it.key() + " error=" + e.what());
    }
  }

  if (doc.contains("modelAliases") && doc["modelAliases"].is_object()) {
    for (auto it = doc["modelAliases"].begin(); it != doc["modelAliases"].end();
         ++it) {
      if (it.value().is_string()) {
        aliases_[it.key()] = it.value().get<std::string>();
      }
    }
  }

  presets_seeded_ = doc.contains("presetsSeeded") && AsBool(doc["presetsSeeded"]);

  Settings parsed;
  std::string error;
  ordered_json known = ordered_json::object();
  for (const char *key :
       {"contextSize", "modelsMax", "autoStart", "noWarmup", "flashAttn",
        "gpuLayers", "requestLogging", "defaultReasoningEffort",
        "modelReasoningEffort", "logFilters"}) {
    if (doc.contains(key)) {
      known[key] = doc[key];
    }
  }
  if (ApplySettingsUpdate(Settings{}, known, &parsed, &error)) {
    settings_ = parsed;
  } else {
    log::Warn("config_store", "ignoring invalid stored settings", error);
  }

  for (auto it = doc.begin(); it != doc.end(); ++it) {
    if (it.key() == "presets" || it.key() == "customPresets" ||
        it.key() == "modelAliases" || it.key() == "presetsSeeded" ||
        known.contains(it.key())) {
      continue;
    }
    extras_[it.key()] = it.value();
  }
}

bool ConfigStore::Load() {
  bool needs_save = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ifstream input(path_);
    if (input.good()) {
      std::stringstream buffer;
      buffer << input.rdbuf();
      ordered_json doc = ordered_json::parse(buffer.str(), nullptr, false);
      if (doc.is_discarded() || !doc.is_object()) {
        log::Error("config_store", "cannot parse config store", "path=" + path_);
        return false;
      }
      ParseDocument(doc);
      needs_save = doc.contains("customPresets");
    } else {
      needs_save = true;
    }

    if (!presets_seeded_) {
      if (presets_.empty()) {
        presets_ = DefaultPresets();
        log::Info("config_store", "seeded default presets",
                  "count=" + std::to_string(presets_.size()));
      }
      presets_seeded_ = true;
      needs_save = true;
    }
  }
  if (needs_save && !Save()) {
    log::Warn("config_store", "cannot write config store", "path=" + path_);
  }
  return true;
}

ordered_json ConfigStore::BuildDocument() const {
  ordered_json doc = extras_;
  ordered_json settings = ToJson(settings_);
  for (auto it = settings.begin(); it != settings.end(); ++it) {
    doc[it.key()] = it.value();
  }
  ordered_json presets = ordered_json::object();
  for (const auto &preset : presets_) {
    presets[preset.id] = ToOrdered(ToJson(preset));
  }
  doc["presets"] = presets;
  ordered_json aliases = ordered_json::object();
  for (const auto &[name, alias] : aliases_) {
    aliases[name] = alias;
  }
  doc["modelAliases"] = aliases;
  doc["presetsSeeded"] = presets_seeded_;
  return doc;
}

bool ConfigStore::Save() const {
  std::string payload;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    payload = BuildDocument().dump(2);
  }
  EnsureParentDir();
  std::string tmp_path = path_ + ".tmp";
  {
    std::ofstream output(tmp_path, std::ios::trunc);
    if (!output.good()) {
      return false;
    }
    output << payload << "\n";
    if (!output.good()) {
      return false;
    }
  }
  std::error_code ec;
  std::filesystem::rename(tmp_path, path_, ec);
  if (ec) {
    log::Error("config_store", "cannot replace config store",
               "path=" + path_ + " error=" + ec.message());
    return false;
  }
  return true;
}

std::vector<Preset>::iterator ConfigStore::FindLocked(const std::string &id) {
  return std::find_if(presets_.begin(), presets_.end(),
                      [&](const Preset &p) { return p.id == id; });
}

std::vector<Preset>::const_iterator
ConfigStore::FindLocked(const std::string &id) const {
  return std::find_if(presets_.begin(), presets_.end(),
                      [&](const Preset &p) { return p.id == id; });
}

std::vector<Preset> ConfigStore::Presets() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return presets_;
}

std::optional<Preset> ConfigStore::GetPreset(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = FindLocked(id);
  if (it == presets_.end()) {
    return std::nullopt;
  }
  return *it;
}

bool ConfigStore::HasPreset(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return FindLocked(id) != presets_.end();
}

StoreStatus ConfigStore::AddPreset(const Preset &preset) {
  if (preset.id.empty()) {
    return StoreStatus::kInvalid;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (FindLocked(preset.id) != presets_.end()) {
    return StoreStatus::kConflict;
  }
  presets_.push_back(preset);
  return StoreStatus::kOk;
}

StoreStatus ConfigStore::UpdatePreset(const std::string &id,
                                      const Preset &updated) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = FindLocked(id);
  if (it == presets_.end()) {
    return StoreStatus::kNotFound;
  }
  if (!updated.id.empty() && updated.id != id) {
    if (!IsValidPresetId(updated.id)) {
      return StoreStatus::kInvalid;
    }
    if (FindLocked(updated.id) != presets_.end()) {
      return StoreStatus::kConflict;
    }
  }
  *it = updated;
  if (it->id.empty()) {
    it->id = id;
  }
  return StoreStatus::kOk;
}

StoreStatus ConfigStore::RemovePreset(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = FindLocked(id);
  if (it == presets_.end()) {
    return StoreStatus::kNotFound;
  }
  presets_.erase(it);
  return StoreStatus::kOk;
}

std::string ConfigStore::EnsureUniqueId(const std::string &base) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (FindLocked(base) == presets_.end()) {
    return base;
  }
  int suffix = 2;
  while (FindLocked(base + "-" + std::to_string(suffix)) != presets_.end()) {
    ++suffix;
  }
  return base + "-" + std::to_string(suffix);
}

Settings ConfigStore::GetSettings() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return settings_;
}

void ConfigStore::SetSettings(const Settings &settings) {
  std::lock_guard<std::mutex> lock(mutex_);
  settings_ = settings;
}

std::map<std::string, std::string> ConfigStore::Aliases() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return aliases_;
}

void ConfigStore::SetAlias(const std::string &model_name,
                           const std::string &alias) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (alias.empty()) {
    aliases_.erase(model_name);
  } else {
    aliases_[model_name] = alias;
  }
}

bool ConfigStore::RemoveAlias(const std::string &model_name) {
  std::lock_guard<std::mutex> lock(mutex_);
  return aliases_.erase(model_name) > 0;
}

} // namespace enginectl
