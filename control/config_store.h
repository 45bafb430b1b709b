#pragma once

#include "control/preset.h"

#include <nlohmann/json.hpp>

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace enginectl {

// Operator-tunable settings persisted alongside presets.
struct Settings {
  int context_size{8192};
  int models_max{2};
  bool auto_start{true};
  bool no_warmup{false};
  bool flash_attn{false};
  int gpu_layers{99};
  bool request_logging{false};
  std::optional<std::string> default_reasoning_effort;
  // Glob pattern -> effort, tried in insertion order.
  std::vector<std::pair<std::string, std::string>> model_reasoning_effort;
  std::vector<std::string> log_filters;
};

nlohmann::ordered_json ToJson(const Settings &settings);

// Validates a partial update (only the keys present are touched) against
// `current`. On success writes the merged settings to *out; otherwise sets
// *error and leaves *out untouched.
bool ApplySettingsUpdate(const Settings &current,
                         const nlohmann::ordered_json &update, Settings *out,
                         std::string *error);

enum class StoreStatus { kOk, kNotFound, kConflict, kInvalid };

// Durable JSON document holding presets, model aliases and settings. Keys
// the store does not know about are preserved across Save().
class ConfigStore {
public:
  explicit ConfigStore(std::string path);

  // Reads the document, migrating the legacy "customPresets" key and seeding
  // DefaultPresets() once. A missing file is created. Returns false when the
  // file exists but cannot be parsed; in-memory defaults stay in place.
  bool Load();
  bool Save() const;

  const std::string &Path() const { return path_; }

  std::vector<Preset> Presets() const;
  std::optional<Preset> GetPreset(const std::string &id) const;
  bool HasPreset(const std::string &id) const;

  // kConflict when the id is taken.
  StoreStatus AddPreset(const Preset &preset);
  // Replaces preset `id`. When updated.id differs the preset is renamed:
  // kInvalid for a malformed id, kConflict when the new id is taken.
  StoreStatus UpdatePreset(const std::string &id, const Preset &updated);
  StoreStatus RemovePreset(const std::string &id);

  // base, base-2, base-3, ... whichever is free first.
  std::string EnsureUniqueId(const std::string &base) const;

  Settings GetSettings() const;
  void SetSettings(const Settings &settings);

  std::map<std::string, std::string> Aliases() const;
  // An empty alias removes the entry.
  void SetAlias(const std::string &model_name, const std::string &alias);
  bool RemoveAlias(const std::string &model_name);

private:
  void EnsureParentDir() const;
  void ParseDocument(const nlohmann::ordered_json &doc);
  nlohmann::ordered_json BuildDocument() const;
  std::vector<Preset>::iterator FindLocked(const std::string &id);
  std::vector<Preset>::const_iterator FindLocked(const std::string &id) const;

  std::string path_;
  mutable std::mutex mutex_;
  std::vector<Preset> presets_; // insertion order
  std::map<std::string, std::string> aliases_;
  Settings settings_;
  bool presets_seeded_{false};
  nlohmann::ordered_json extras_ = nlohmann::ordered_json::object();
};

} // namespace enginectl
