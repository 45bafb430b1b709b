#pragma once

#include "control/config_store.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace enginectl {

// A model found under the model root. Split models are reported once, with
// `path` pointing at the first part.
struct LocalModel {
  std::string name;     // path relative to the model root
  std::string path;     // absolute path of the file the engine loads
  uint64_t size{0};     // bytes, summed over parts
  int64_t modified{0};  // seconds since epoch, newest part
  bool is_split{false};
  int part_count{0};
  int parts_found{0};
  bool incomplete{false};
  std::string first_part_name; // relative path of part 1 (split only)
};

nlohmann::json ToJson(const LocalModel &model);

class ModelScanner {
public:
  explicit ModelScanner(std::string models_dir);

  const std::string &ModelsDir() const { return models_dir_; }

  // Recursive .gguf scan. Missing root yields an empty list.
  std::vector<LocalModel> Scan() const;

  // Absolute path for a (possibly relative) model reference. Falls back to the
  // first split part ("<base>-00001-of-NNNNN.gguf") when the file itself does
  // not exist. nullopt when neither exists.
  std::optional<std::string> ResolveModelFile(const std::string &model_path) const;

  // Builds a preset for a model source with a unique id in `store`.
  static Preset MakeDefaultPreset(const ConfigStore &store,
                                  const std::string &model_path,
                                  const std::string &hf_repo,
                                  const std::string &filename);

  // Creates and stores a preset unless one already points at the same
  // model_path / hf_repo. Returns the new preset.
  static std::optional<Preset> AutoCreatePreset(ConfigStore &store,
                                                const std::string &model_path,
                                                const std::string &hf_repo,
                                                const std::string &filename);

  // Auto-creates presets for every complete, non-mmproj model on disk.
  // Returns the number created.
  int MigrateExistingModels(ConfigStore &store) const;

private:
  std::string models_dir_;
};

} // namespace enginectl
