#include "manifest/loader.hpp"

#include "../common/assertions.hpp"
#include "../common/manifest_fixtures.hpp"
#include "../common/temp_dir.hpp"

#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

namespace {

using modlist::core::logging::Logger;
using modlist::core::logging::LogLevel;
using modlist::manifest::LoadManifest;
using modlist::manifest::LoadResult;
using modlist::manifest::ValidationOptions;
using modlist::tests::common::AssertContains;
using modlist::tests::common::AssertNotContains;
using modlist::tests::common::ContainsIssue;
using modlist::tests::common::Fail;
using modlist::tests::common::FailWithReport;

} // namespace

int main() {
  const fs::path temp_root = modlist::tests::common::CreateUniqueTempDir("modlist-loader-smoke");

  {
    const fs::path manifest_path = temp_root / "mods.json";
    modlist::tests::common::WriteFixtureFile(manifest_path, R"json(
{
  "version": "1.20.1",
  "mods": [
    {"name": "SeedcrackerX", "source": "https://github.com/19MisterX98/SeedcrackerX",
     "version": "1.20", "file": "seedcrackerX-2.14.jar"},
    {"name": "Sodium", "source": "https://example.com/sodium.jar"}
  ]
}
)json");

    std::ostringstream log_sink;
    Logger logger(LogLevel::kDebug, log_sink);
    LoadResult result;
    std::string error;
    if (!LoadManifest(manifest_path.string(), ValidationOptions{}, logger, result, error)) {
      FailWithReport("LoadManifest failed: " + error, result.report);
    }
    if (!result.report.valid || result.manifest.mods.size() != 2U ||
        result.manifest.version != "1.20.1") {
      FailWithReport("unexpected load result", result.report);
    }

    const std::string log_text = log_sink.str();
    AssertContains(log_text, "level=INFO logger=\"modlist\" msg=\"loaded manifest\"");
    AssertContains(log_text, "game_version=\"1.20.1\" mods=\"2 mods\"");
    AssertContains(log_text, "level=DEBUG logger=\"SeedcrackerX\" msg=\"mod entry\"");
    AssertContains(log_text, "level=DEBUG logger=\"Sodium\" msg=\"mod entry\"");
    AssertContains(log_text, "level=WARN logger=\"modlist\" msg=\"'1.20' differs from manifest "
                             "version '1.20.1'\" path=\"mods[0].version\"");
  }

  {
    std::ostringstream log_sink;
    Logger logger(LogLevel::kInfo, log_sink);
    LoadResult result;
    std::string error;
    const std::string path =
        modlist::tests::common::RequireManifestPath("empty_1_20_1.json").string();
    if (!LoadManifest(path, ValidationOptions{}, logger, result, error)) {
      Fail("LoadManifest failed for empty mod list: " + error);
    }
    AssertContains(log_sink.str(), "mods=\"0 mods\"");
    AssertNotContains(log_sink.str(), "level=DEBUG");
  }

  {
    std::ostringstream log_sink;
    Logger logger(LogLevel::kInfo, log_sink);
    LoadResult result;
    std::string error;
    const std::string path =
        modlist::tests::common::RequireManifestPath("invalid_entries.json").string();
    if (LoadManifest(path, ValidationOptions{}, logger, result, error)) {
      Fail("LoadManifest must reject invalid_entries.json");
    }
    AssertContains(error, "invalid manifest: ");
    AssertContains(error, "(5 issues)");
    if (result.report.valid || !result.manifest.mods.empty()) {
      Fail("rejected load must not populate the manifest model");
    }
    if (!ContainsIssue(result.report, "mods[1].source", "must be a valid URI")) {
      FailWithReport("missing source issue in load report", result.report);
    }
    const std::string log_text = log_sink.str();
    AssertContains(log_text, "level=ERROR logger=\"modlist\" msg=\"invalid manifest\"");
    AssertContains(log_text, "path=\"mods[2]\"");
    AssertNotContains(log_text, "loaded manifest");
  }

  {
    std::ostringstream log_sink;
    Logger logger(LogLevel::kInfo, log_sink);
    LoadResult result;
    std::string error;
    const fs::path empty_path = temp_root / "empty.json";
    modlist::tests::common::WriteFixtureFile(empty_path, "");
    if (LoadManifest(empty_path.string(), ValidationOptions{}, logger, result, error)) {
      Fail("LoadManifest must reject an empty file");
    }
    if (!ContainsIssue(result.report, "$", "manifest file is empty")) {
      FailWithReport("missing empty-file issue", result.report);
    }
    AssertContains(error, "(1 issue)");
  }

  {
    std::ostringstream log_sink;
    Logger logger(LogLevel::kInfo, log_sink);
    LoadResult result;
    std::string error;
    const fs::path missing_path = temp_root / "missing" / "mods.json";
    if (LoadManifest(missing_path.string(), ValidationOptions{}, logger, result, error)) {
      Fail("LoadManifest must fail for a missing file");
    }
    AssertContains(error, "unable to read manifest file");
    AssertContains(log_sink.str(), "msg=\"manifest read failed\"");
  }

  modlist::tests::common::RemovePathBestEffort(temp_root);
  std::cout << "manifest_loader_smoke: ok\n";
  return 0;
}
