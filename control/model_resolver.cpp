#include "control/model_resolver.h"

#include "server/logging/log_buffer.h"
#include "server/logging/logger.h"

#include <filesystem>

namespace fs = std::filesystem;

namespace enginectl {

namespace {

bool EndsWith(const std::string &value, const std::string &suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string FirstSegment(const std::string &relative) {
  auto slash = relative.find('/');
  return slash == std::string::npos ? relative : relative.substr(0, slash);
}

std::string BaseName(const std::string &path) {
  auto slash = path.find_last_of('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

} // namespace

const char *PresetStatusName(PresetStatus status) {
  switch (status) {
  case PresetStatus::kLoaded:
    return "loaded";
  case PresetStatus::kLoading:
    return "loading";
  case PresetStatus::kAvailable:
    return "available";
  case PresetStatus::kNotDownloaded:
    return "not_downloaded";
  }
  return "available";
}

ModelResolver::ModelResolver(const ConfigStore *store, std::string models_dir,
                             LogBuffer *log_buffer)
    : store_(store), models_dir_(std::move(models_dir)), log_buffer_(log_buffer) {
  while (models_dir_.size() > 1 && models_dir_.back() == '/') {
    models_dir_.pop_back();
  }
}

std::optional<ResolvedModel>
ModelResolver::Resolve(const std::string &model_id) const {
  if (model_id.empty()) {
    return std::nullopt;
  }

  if (auto preset = store_->GetPreset(model_id)) {
    ResolvedModel resolved;
    resolved.kind = ResolvedModel::Kind::kPreset;
    resolved.preset = std::move(*preset);
    return resolved;
  }

  fs::path full = model_id.front() == '/' ? fs::path(model_id)
                                          : fs::path(models_dir_) / model_id;
  std::error_code ec;
  if (EndsWith(full.string(), ".gguf") && fs::exists(full, ec)) {
    log::Warn("resolver", "direct file path used as model id; create a preset",
              "model=" + model_id);
    if (log_buffer_) {
      log_buffer_->Add("models", "DEPRECATION: Direct file path \"" + model_id +
                                     "\" used. Create a preset for better "
                                     "configuration.");
    }
    ResolvedModel resolved;
    resolved.kind = ResolvedModel::Kind::kFile;
    resolved.path = full.string();
    resolved.relative_path = model_id;
    return resolved;
  }

  for (auto &preset : store_->Presets()) {
    if (preset.model_path.empty()) {
      continue;
    }
    std::string file_name = BaseName(preset.model_path);
    if (!file_name.empty() &&
        (model_id == file_name || EndsWith(model_id, file_name))) {
      ResolvedModel resolved;
      resolved.kind = ResolvedModel::Kind::kPreset;
      resolved.preset = std::move(preset);
      return resolved;
    }
  }

  log::Debug("resolver", "model not found", "model=" + model_id);
  return std::nullopt;
}

std::string ModelResolver::FirstSegmentBelowRoot(const std::string &path) const {
  std::string prefix = models_dir_ + "/";
  std::string relative = path;
  if (path.rfind(prefix, 0) == 0) {
    relative = path.substr(prefix.size());
  } else if (!path.empty() && path.front() == '/') {
    // Outside the model root: the engine can only know it by file name.
    relative = BaseName(path);
  }
  return FirstSegment(relative);
}

std::optional<std::string>
ModelResolver::ResolvePath(const ResolvedModel &resolved) const {
  if (resolved.kind == ResolvedModel::Kind::kFile) {
    std::string segment = FirstSegmentBelowRoot(resolved.relative_path);
    if (segment.empty()) {
      return std::nullopt;
    }
    return segment;
  }
  return ResolvePresetPath(resolved.preset);
}

std::optional<std::string>
ModelResolver::ResolvePresetPath(const Preset &preset) const {
  if (!preset.model_path.empty()) {
    std::string segment = FirstSegmentBelowRoot(preset.model_path);
    if (!segment.empty()) {
      return segment;
    }
  }
  if (!preset.hf_repo.empty()) {
    return preset.hf_repo;
  }
  return std::nullopt;
}

PresetStatus ModelResolver::GetStatus(const Preset &preset,
                                      const std::vector<EngineModel> &engine_models,
                                      const EngineState &engine_state) const {
  if (engine_models.empty()) {
    return PresetStatus::kAvailable;
  }
  if (engine_state.active_preset_id && *engine_state.active_preset_id == preset.id) {
    return PresetStatus::kLoaded;
  }
  auto model_path = ResolvePresetPath(preset);
  if (!model_path) {
    return PresetStatus::kNotDownloaded;
  }
  bool compatible =
      CompatibilityChecker::Check(preset, engine_state.runtime).compatible;
  for (const auto &model : engine_models) {
    const std::string &id = model.id;
    bool matches = id == *model_path || EndsWith(id, *model_path) ||
                   (!id.empty() && EndsWith(*model_path, id)) ||
                   BaseName(id) == BaseName(*model_path);
    if (!matches) {
      continue;
    }
    if (model.status == "loaded") {
      return compatible ? PresetStatus::kLoaded : PresetStatus::kAvailable;
    }
    if (model.status == "loading") {
      return PresetStatus::kLoading;
    }
  }
  return PresetStatus::kAvailable;
}

} // namespace enginectl
