#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace modlist::manifest {

struct ValidationIssue {
  std::string path;
  std::string message;
};

// `issues` decide validity. `warnings` are advisory findings on documents
// that still conform to the schema.
struct ValidationReport {
  bool valid = false;
  std::vector<ValidationIssue> issues;
  std::vector<ValidationIssue> warnings;
};

// How to treat a finding the schema itself does not constrain.
enum class PolicyLevel {
  kIgnore,
  kWarn,
  kError,
};

struct ValidationOptions {
  // Two entries sharing the same `name`.
  PolicyLevel duplicate_names = PolicyLevel::kWarn;
  // A mod `version` that differs from the manifest `version`.
  PolicyLevel version_mismatch = PolicyLevel::kWarn;
};

// Validates manifest JSON text against the mods.json schema contract.
//
// Contract:
// - Returns true when validation completed (even if the document is invalid).
// - Populates `report.valid`, `report.issues` and `report.warnings`.
// - Every violation is reported, not just the first one.
// - On parse errors, emits a single issue under path `$`.
bool ValidateManifestText(std::string_view json_text, ValidationReport& report, std::string& error,
                          const ValidationOptions& options = {});

// Loads and validates a manifest file.
//
// Contract:
// - Returns false if file I/O fails and sets `error`.
// - Otherwise returns true and populates `report`.
bool ValidateManifestFile(const std::string& manifest_path, ValidationReport& report,
                          std::string& error, const ValidationOptions& options = {});

// Validates the bytes of a manifest file already read by the caller. An empty
// file becomes a single `$` issue rather than a JSON parse error.
void ValidateManifestContents(std::string_view file_contents, ValidationReport& report,
                              const ValidationOptions& options = {});

// "mods[3].source: must be a valid URI (...)"
std::string FormatIssue(const ValidationIssue& issue);

} // namespace modlist::manifest
