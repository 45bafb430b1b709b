#include <catch2/catch.hpp>

#include "control/model_scanner.h"
#include "tests/unit/test_support.h"

using namespace enginectl;
using enginectl::testing::TempDir;

TEST_CASE("ModelScanner lists gguf files recursively", "[model_scanner]") {
  TempDir models("models");
  models.Touch("b-model-Q4_K_M.gguf", "12345");
  models.Touch("family/a-model.gguf");
  models.Touch("notes.txt");

  ModelScanner scanner(models.Str());
  auto found = scanner.Scan();
  REQUIRE(found.size() == 2);
  REQUIRE(found[0].name == "b-model-Q4_K_M.gguf");
  REQUIRE(found[0].size == 5);
  REQUIRE(found[1].name == "family/a-model.gguf");
  REQUIRE_FALSE(found[1].is_split);
  REQUIRE(found[1].modified > 0);
}

TEST_CASE("ModelScanner tolerates a missing root", "[model_scanner]") {
  ModelScanner scanner("/nonexistent/enginectl/models");
  REQUIRE(scanner.Scan().empty());
}

TEST_CASE("ModelScanner groups split models", "[model_scanner]") {
  TempDir models("models");
  models.Touch("big-00001-of-00003.gguf", "aa");
  models.Touch("big-00002-of-00003.gguf", "bb");
  models.Touch("big-00003-of-00003.gguf", "cc");
  models.Touch("partial-00001-of-00002.gguf");

  ModelScanner scanner(models.Str());
  auto found = scanner.Scan();
  REQUIRE(found.size() == 2);

  const auto &big = found[0];
  REQUIRE(big.name == "big.gguf");
  REQUIRE(big.is_split);
  REQUIRE(big.part_count == 3);
  REQUIRE(big.parts_found == 3);
  REQUIRE_FALSE(big.incomplete);
  REQUIRE(big.size == 6);
  REQUIRE(big.first_part_name == "big-00001-of-00003.gguf");
  REQUIRE(big.path == (models.Path() / "big-00001-of-00003.gguf").string());

  const auto &partial = found[1];
  REQUIRE(partial.incomplete);
  REQUIRE(partial.parts_found == 1);
  REQUIRE(ToJson(partial)["incomplete"] == true);
}

TEST_CASE("ResolveModelFile falls back to the first split part",
          "[model_scanner]") {
  TempDir models("models");
  std::string plain = models.Touch("plain.gguf");
  std::string first = models.Touch("sub/big-00001-of-00002.gguf");
  models.Touch("sub/big-00002-of-00002.gguf");

  ModelScanner scanner(models.Str());
  REQUIRE(scanner.ResolveModelFile("plain.gguf") == plain);
  REQUIRE(scanner.ResolveModelFile(plain) == plain);
  REQUIRE(scanner.ResolveModelFile("sub/big.gguf") == first);
  REQUIRE_FALSE(scanner.ResolveModelFile("missing.gguf").has_value());
  REQUIRE_FALSE(scanner.ResolveModelFile("").has_value());
}

TEST_CASE("MigrateExistingModels creates presets once", "[model_scanner]") {
  TempDir models("models");
  TempDir data("data");
  models.Touch("Qwen3-Coder-30B-A3B-Instruct-Q5_K_M.gguf");
  models.Touch("mmproj-vision.gguf");
  models.Touch("partial-00001-of-00002.gguf");

  ConfigStore store(data.Str() + "/config.json");
  REQUIRE(store.Load());
  ModelScanner scanner(models.Str());

  REQUIRE(scanner.MigrateExistingModels(store) == 1);
  auto preset = store.GetPreset("qwen3-coder-30b-a3b-instruct");
  REQUIRE(preset.has_value());
  REQUIRE(preset->auto_generated);
  REQUIRE(preset->name == "Qwen3-Coder-30B-A3B-Instruct Q5_K_M");
  REQUIRE(preset->description ==
          "Auto-generated preset for Qwen3-Coder-30B-A3B-Instruct");
  REQUIRE_FALSE(preset->created_at.empty());

  REQUIRE(scanner.MigrateExistingModels(store) == 0);
}

TEST_CASE("AutoCreatePreset deduplicates by repository", "[model_scanner]") {
  TempDir data("data");
  ConfigStore store(data.Str() + "/config.json");
  REQUIRE(store.Load());

  auto created = ModelScanner::AutoCreatePreset(
      store, "", "unsloth/gpt-oss-20b-GGUF:Q4_K_M", "");
  REQUIRE(created.has_value());
  REQUIRE(created->id == "gpt-oss-20b");
  REQUIRE(created->hf_repo == "unsloth/gpt-oss-20b-GGUF:Q4_K_M");

  REQUIRE_FALSE(ModelScanner::AutoCreatePreset(
                    store, "", "unsloth/gpt-oss-20b-GGUF:Q4_K_M", "")
                    .has_value());
}

TEST_CASE("MakeDefaultPreset picks a free id", "[model_scanner]") {
  TempDir data("data");
  ConfigStore store(data.Str() + "/config.json");
  REQUIRE(store.Load());
  Preset taken;
  taken.id = "tiny";
  REQUIRE(store.AddPreset(taken) == StoreStatus::kOk);

  Preset preset =
      ModelScanner::MakeDefaultPreset(store, "/m/tiny.gguf", "", "tiny.gguf");
  REQUIRE(preset.id == "tiny-2");
  REQUIRE(preset.model_path == "/m/tiny.gguf");
}
