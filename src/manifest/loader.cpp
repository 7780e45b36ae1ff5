#include "manifest/loader.hpp"

#include "core/fs_utils.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace modlist::manifest {

bool LoadManifest(const std::string& manifest_path, const ValidationOptions& options,
                  core::logging::Logger& logger, LoadResult& result, std::string& error) {
  result = LoadResult{};
  error.clear();

  std::string contents;
  if (!core::ReadTextFile(fs::path(manifest_path), contents, error)) {
    error = "unable to read manifest file: " + manifest_path;
    logger.Error("manifest read failed", {{"path", manifest_path}});
    return false;
  }

  ValidateManifestContents(contents, result.report, options);

  for (const ValidationIssue& warning : result.report.warnings) {
    logger.Warn(warning.message, {{"path", warning.path}});
  }

  if (!result.report.valid) {
    for (const ValidationIssue& issue : result.report.issues) {
      logger.Error(issue.message, {{"path", issue.path}});
    }
    const std::string count = std::to_string(result.report.issues.size());
    logger.Error("invalid manifest", {{"file", manifest_path}, {"issues", count}});
    error = "invalid manifest: " + manifest_path + " (" + count +
            (result.report.issues.size() == 1U ? " issue)" : " issues)");
    return false;
  }

  if (!ParseManifestText(contents, result.manifest, error)) {
    logger.Error("manifest parse failed", {{"file", manifest_path}, {"error", error}});
    return false;
  }

  for (const ModEntry& entry : result.manifest.mods) {
    core::logging::Logger mod_logger = logger.Child(entry.name);
    mod_logger.Debug("mod entry", {{"source", entry.source},
                                   {"version", entry.version.value_or("-")},
                                   {"file", entry.file.value_or("-")}});
  }

  const std::string count_label = CountLabel(result.manifest.mods.size());
  logger.Info("loaded manifest", {{"file", manifest_path},
                                  {"game_version", result.manifest.version},
                                  {"mods", count_label}});
  return true;
}

} // namespace modlist::manifest
