#pragma once

#include "core/logging/logger.hpp"
#include "manifest/model.hpp"
#include "manifest/validator.hpp"

#include <string>

namespace modlist::manifest {

struct LoadResult {
  ValidationReport report;
  Manifest manifest;
};

// Validate-then-parse entry point for consumers of mods.json.
//
// Contract:
// - Returns false and sets `error` when the file cannot be read or the
//   document fails validation; `result.report` still carries every issue.
// - On success `result.manifest` is populated and `result.report.valid` is
//   true (warnings may be present).
// - Issues are logged at error level, warnings at warn level, each mod at
//   debug level under a logger named after the mod, and a one-line summary
//   at info level.
bool LoadManifest(const std::string& manifest_path, const ValidationOptions& options,
                  core::logging::Logger& logger, LoadResult& result, std::string& error);

} // namespace modlist::manifest
