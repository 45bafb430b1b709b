#pragma once

#include "control/compatibility.h"
#include "control/config_store.h"
#include "control/preset.h"
#include "engine/engine_client.h"

#include <optional>
#include <string>
#include <vector>

namespace enginectl {

class LogBuffer;

struct ResolvedModel {
  enum class Kind { kPreset, kFile };
  Kind kind{Kind::kPreset};
  Preset preset;             // kPreset
  std::string path;          // kFile: absolute path
  std::string relative_path; // kFile: the id as given by the client

  bool IsPreset() const { return kind == Kind::kPreset; }
};

enum class PresetStatus { kLoaded, kLoading, kAvailable, kNotDownloaded };

const char *PresetStatusName(PresetStatus status);

// Maps inbound model identifiers onto presets or raw model files and derives
// the identifier the engine knows the model by.
class ModelResolver {
public:
  ModelResolver(const ConfigStore *store, std::string models_dir,
                LogBuffer *log_buffer = nullptr);

  // Resolution order: exact preset id, existing .gguf file (absolute or under
  // the model root, deprecated), preset whose model file name the id equals
  // or ends with. Empty ids and misses yield nullopt.
  std::optional<ResolvedModel> Resolve(const std::string &model_id) const;

  // The engine-side model id: first path segment below the model root for
  // local files, the hf repo otherwise. nullopt means "not downloaded".
  std::optional<std::string> ResolvePath(const ResolvedModel &resolved) const;
  std::optional<std::string> ResolvePresetPath(const Preset &preset) const;

  // Load status of a preset given the engine's model listing.
  PresetStatus GetStatus(const Preset &preset,
                         const std::vector<EngineModel> &engine_models,
                         const EngineState &engine_state) const;

  const std::string &ModelsDir() const { return models_dir_; }

private:
  std::string FirstSegmentBelowRoot(const std::string &path) const;

  const ConfigStore *store_;
  std::string models_dir_;
  LogBuffer *log_buffer_;
};

} // namespace enginectl
