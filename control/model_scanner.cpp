#include "control/model_scanner.h"

#include "server/logging/logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <map>

namespace fs = std::filesystem;

namespace enginectl {

namespace {

bool EndsWithGguf(const std::string &name) {
  if (name.size() < 5) {
    return false;
  }
  std::string ext = name.substr(name.size() - 5);
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext == ".gguf";
}

bool IsMmproj(const std::string &filename) {
  std::string lowered = filename;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered.rfind("mmproj-", 0) == 0 || lowered.rfind("mmproj_", 0) == 0;
}

int64_t ModifiedSeconds(const fs::path &path) {
  std::error_code ec;
  auto ftime = fs::last_write_time(path, ec);
  if (ec) {
    return 0;
  }
  auto sys = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
      ftime - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
  return std::chrono::duration_cast<std::chrono::seconds>(
             sys.time_since_epoch())
      .count();
}

struct SplitGroup {
  LocalModel model;
  std::map<int, fs::path> parts;
};

} // namespace

nlohmann::json ToJson(const LocalModel &model) {
  nlohmann::json j;
  j["name"] = model.name;
  j["path"] = model.path;
  j["size"] = model.size;
  j["modified"] = model.modified;
  if (model.is_split) {
    j["isSplit"] = true;
    j["partCount"] = model.part_count;
    j["firstPartName"] = model.first_part_name;
    if (model.incomplete) {
      j["incomplete"] = true;
      j["partsFound"] = model.parts_found;
    }
  }
  return j;
}

ModelScanner::ModelScanner(std::string models_dir)
    : models_dir_(std::move(models_dir)) {}

std::vector<LocalModel> ModelScanner::Scan() const {
  std::vector<LocalModel> models;
  std::error_code ec;
  fs::path root(models_dir_);
  if (!fs::is_directory(root, ec)) {
    return models;
  }
  std::map<std::string, SplitGroup> splits;
  fs::recursive_directory_iterator it(
      root, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    log::Warn("models", "cannot scan models directory",
              "dir=" + models_dir_ + " error=" + ec.message());
    return models;
  }
  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      break;
    }
    const auto &entry = *it;
    std::error_code entry_ec;
    if (!entry.is_regular_file(entry_ec)) {
      continue;
    }
    std::string filename = entry.path().filename().string();
    if (!EndsWithGguf(filename)) {
      continue;
    }
    std::string relative = fs::relative(entry.path(), root, entry_ec).generic_string();
    uint64_t size = entry.file_size(entry_ec);
    int64_t modified = ModifiedSeconds(entry.path());

    auto split = ParseSplitPart(filename);
    if (!split) {
      LocalModel model;
      model.name = relative;
      model.path = entry.path().string();
      model.size = size;
      model.modified = modified;
      models.push_back(std::move(model));
      continue;
    }
    std::string parent = fs::path(relative).parent_path().generic_string();
    std::string base =
        parent.empty() ? split->base_name : parent + "/" + split->base_name;
    auto &group = splits[base];
    group.model.name = base;
    group.model.is_split = true;
    group.model.part_count = split->total;
    group.model.size += size;
    group.model.modified = std::max(group.model.modified, modified);
    group.parts[split->part] = entry.path();
  }

  for (auto &[base, group] : splits) {
    LocalModel model = group.model;
    const fs::path &first = group.parts.begin()->second;
    model.path = first.string();
    model.first_part_name = fs::relative(first, root, ec).generic_string();
    model.parts_found = static_cast<int>(group.parts.size());
    model.incomplete = model.parts_found != model.part_count;
    models.push_back(std::move(model));
  }
  std::sort(models.begin(), models.end(),
            [](const LocalModel &a, const LocalModel &b) { return a.name < b.name; });
  return models;
}

std::optional<std::string>
ModelScanner::ResolveModelFile(const std::string &model_path) const {
  if (model_path.empty()) {
    return std::nullopt;
  }
  fs::path full = fs::path(model_path).is_absolute()
                      ? fs::path(model_path)
                      : fs::path(models_dir_) / model_path;
  std::error_code ec;
  if (fs::exists(full, ec)) {
    return full.string();
  }
  std::string stem = full.filename().string();
  if (EndsWithGguf(stem)) {
    stem = stem.substr(0, stem.size() - 5);
  }
  fs::path dir = full.parent_path();
  if (!fs::is_directory(dir, ec)) {
    return std::nullopt;
  }
  for (const auto &entry : fs::directory_iterator(dir, ec)) {
    std::string name = entry.path().filename().string();
    auto split = ParseSplitPart(name);
    if (split && split->part == 1 && name.rfind(stem, 0) == 0) {
      return entry.path().string();
    }
  }
  return std::nullopt;
}

Preset ModelScanner::MakeDefaultPreset(const ConfigStore &store,
                                       const std::string &model_path,
                                       const std::string &hf_repo,
                                       const std::string &filename) {
  std::string source = !hf_repo.empty()    ? hf_repo
                       : !filename.empty() ? filename
                                           : fs::path(model_path).filename().string();
  Preset preset;
  preset.id = store.EnsureUniqueId(GeneratePresetId(source));
  preset.name = ExtractModelName(source, true);
  preset.description = "Auto-generated preset for " + ExtractModelName(source);
  preset.model_path = model_path;
  preset.hf_repo = hf_repo;
  preset.auto_generated = true;
  preset.created_at = CurrentIsoTimestamp();
  return preset;
}

std::optional<Preset> ModelScanner::AutoCreatePreset(ConfigStore &store,
                                                     const std::string &model_path,
                                                     const std::string &hf_repo,
                                                     const std::string &filename) {
  for (const auto &existing : store.Presets()) {
    if ((!model_path.empty() && existing.model_path == model_path) ||
        (!hf_repo.empty() && existing.hf_repo == hf_repo)) {
      log::Debug("presets", "preset already exists for model",
                 "model=" + (hf_repo.empty() ? filename : hf_repo) +
                     " preset=" + existing.id);
      return std::nullopt;
    }
  }
  Preset preset = MakeDefaultPreset(store, model_path, hf_repo, filename);
  if (store.AddPreset(preset) != StoreStatus::kOk) {
    return std::nullopt;
  }
  if (!store.Save()) {
    log::Warn("presets", "cannot persist auto-created preset", "id=" + preset.id);
  }
  log::Info("presets", "auto-created preset", "id=" + preset.id);
  return preset;
}

int ModelScanner::MigrateExistingModels(ConfigStore &store) const {
  int created = 0;
  for (const auto &model : Scan()) {
    if (model.incomplete) {
      continue;
    }
    if (IsMmproj(fs::path(model.path).filename().string())) {
      continue;
    }
    if (AutoCreatePreset(store, model.path, "", model.name)) {
      ++created;
    }
  }
  if (created > 0) {
    log::Info("presets", "created presets for existing models",
              "count=" + std::to_string(created));
  }
  return created;
}

} // namespace enginectl
