#include "manifest/validator.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"
#include "core/uri.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace modlist::manifest {

namespace {

using JsonValue = core::json::Value;
using JsonParser = core::json::Parser;

void AddIssue(ValidationReport& report, std::string path, std::string message) {
  report.issues.push_back({.path = std::move(path), .message = std::move(message)});
}

void AddWarning(ValidationReport& report, std::string path, std::string message) {
  report.warnings.push_back({.path = std::move(path), .message = std::move(message)});
}

void AddFinding(ValidationReport& report, PolicyLevel level, std::string path,
                std::string message) {
  switch (level) {
  case PolicyLevel::kIgnore:
    return;
  case PolicyLevel::kWarn:
    AddWarning(report, std::move(path), std::move(message));
    return;
  case PolicyLevel::kError:
    AddIssue(report, std::move(path), std::move(message));
    return;
  }
}

bool IsString(const JsonValue* value) {
  return value != nullptr && value->type == JsonValue::Type::kString;
}

const char* TypeName(JsonValue::Type type) {
  switch (type) {
  case JsonValue::Type::kObject:
    return "object";
  case JsonValue::Type::kArray:
    return "array";
  case JsonValue::Type::kString:
    return "string";
  case JsonValue::Type::kNumber:
    return "number";
  case JsonValue::Type::kBool:
    return "boolean";
  case JsonValue::Type::kNull:
    return "null";
  }
  return "value";
}

std::string ModPath(std::size_t index) {
  return "mods[" + std::to_string(index) + "]";
}

// Returns the field when it is present and a string; reports otherwise.
const JsonValue* RequireString(const JsonValue& object_value, std::string_view key,
                               const std::string& path, std::string_view hint,
                               ValidationReport& report) {
  const JsonValue* field = core::json::Find(object_value, key);
  if (field == nullptr) {
    AddIssue(report, path, "is required; " + std::string(hint));
    return nullptr;
  }
  if (!IsString(field)) {
    AddIssue(report, path, std::string("must be a string (got ") + TypeName(field->type) + ")");
    return nullptr;
  }
  return field;
}

const JsonValue* OptionalString(const JsonValue& object_value, std::string_view key,
                                const std::string& path, ValidationReport& report) {
  const JsonValue* field = core::json::Find(object_value, key);
  if (field == nullptr) {
    return nullptr;
  }
  if (!IsString(field)) {
    AddIssue(report, path,
             std::string("must be a string when provided (got ") + TypeName(field->type) + ")");
    return nullptr;
  }
  return field;
}

void ValidateSource(const JsonValue& entry, const std::string& base_path,
                    ValidationReport& report) {
  const std::string path = base_path + ".source";
  const JsonValue* source =
      RequireString(entry, "source", path, "example: \"https://github.com/owner/repo\"", report);
  if (source == nullptr) {
    return;
  }

  core::uri::UriParts parts;
  std::string uri_error;
  if (!core::uri::ParseUri(source->string_value, parts, uri_error)) {
    AddIssue(report, path, "must be a valid URI (" + uri_error + ")");
  }
}

struct ModSummary {
  std::size_t index = 0;
  const JsonValue* name = nullptr;
  const JsonValue* version = nullptr;
};

void ValidateModEntry(const JsonValue& entry, std::size_t index, ValidationReport& report,
                      ModSummary& summary) {
  const std::string base_path = ModPath(index);
  summary.index = index;

  if (entry.type != JsonValue::Type::kObject) {
    AddIssue(report, base_path,
             std::string("must be an object (got ") + TypeName(entry.type) + ")");
    return;
  }

  summary.name =
      RequireString(entry, "name", base_path + ".name", "example: \"SeedcrackerX\"", report);
  if (summary.name != nullptr && summary.name->string_value.empty()) {
    AddWarning(report, base_path + ".name", "is empty");
  }

  ValidateSource(entry, base_path, report);

  summary.version = OptionalString(entry, "version", base_path + ".version", report);
  if (summary.version != nullptr && summary.version->string_value.empty()) {
    AddWarning(report, base_path + ".version", "is empty");
  }

  const JsonValue* file = OptionalString(entry, "file", base_path + ".file", report);
  if (file != nullptr && file->string_value.empty()) {
    AddWarning(report, base_path + ".file", "is empty");
  }
}

void CheckDuplicateNames(const std::vector<ModSummary>& summaries, PolicyLevel level,
                         ValidationReport& report) {
  if (level == PolicyLevel::kIgnore) {
    return;
  }

  std::map<std::string, std::size_t> first_seen;
  for (const ModSummary& summary : summaries) {
    if (summary.name == nullptr) {
      continue;
    }
    const std::string& name = summary.name->string_value;
    const auto [it, inserted] = first_seen.emplace(name, summary.index);
    if (!inserted) {
      AddFinding(report, level, ModPath(summary.index) + ".name",
                 "duplicates " + ModPath(it->second) + ".name ('" + name + "')");
    }
  }
}

void CheckVersionMismatch(const JsonValue* manifest_version,
                          const std::vector<ModSummary>& summaries, PolicyLevel level,
                          ValidationReport& report) {
  if (level == PolicyLevel::kIgnore || manifest_version == nullptr) {
    return;
  }

  for (const ModSummary& summary : summaries) {
    if (summary.version == nullptr) {
      continue;
    }
    if (summary.version->string_value != manifest_version->string_value) {
      AddFinding(report, level, ModPath(summary.index) + ".version",
                 "'" + summary.version->string_value + "' differs from manifest version '" +
                     manifest_version->string_value + "'");
    }
  }
}

void ValidateManifestObject(const JsonValue& root, const ValidationOptions& options,
                            ValidationReport& report) {
  if (root.type != JsonValue::Type::kObject) {
    AddIssue(report, "$",
             std::string("root JSON value must be an object (got ") + TypeName(root.type) + ")");
    return;
  }

  const JsonValue* version =
      RequireString(root, "version", "version", "example: \"1.20.1\"", report);

  const JsonValue* mods = core::json::Find(root, "mods");
  if (mods == nullptr) {
    AddIssue(report, "mods", "is required; use [] for an empty mod list");
    return;
  }
  if (mods->type != JsonValue::Type::kArray) {
    AddIssue(report, "mods",
             std::string("must be an array (got ") + TypeName(mods->type) + ")");
    return;
  }

  std::vector<ModSummary> summaries;
  summaries.reserve(mods->array_value.size());
  for (std::size_t i = 0; i < mods->array_value.size(); ++i) {
    ModSummary summary;
    ValidateModEntry(mods->array_value[i], i, report, summary);
    summaries.push_back(summary);
  }

  CheckDuplicateNames(summaries, options.duplicate_names, report);
  CheckVersionMismatch(version, summaries, options.version_mismatch, report);
}

void ValidateContents(std::string_view contents, const ValidationOptions& options,
                      ValidationReport& report) {
  report = ValidationReport{};

  JsonValue root;
  JsonParser parser(contents);
  std::string parse_error;
  if (!parser.Parse(root, parse_error)) {
    AddIssue(report, "$", parse_error + " (fix JSON syntax and validate again)");
    report.valid = false;
    return;
  }

  ValidateManifestObject(root, options, report);
  report.valid = report.issues.empty();
}

} // namespace

bool ValidateManifestText(std::string_view json_text, ValidationReport& report, std::string& error,
                          const ValidationOptions& options) {
  error.clear();
  ValidateContents(json_text, options, report);
  return true;
}

bool ValidateManifestFile(const std::string& manifest_path, ValidationReport& report,
                          std::string& error, const ValidationOptions& options) {
  std::string contents;
  if (!core::ReadTextFile(fs::path(manifest_path), contents, error)) {
    error = "unable to read manifest file: " + manifest_path;
    return false;
  }

  ValidateManifestContents(contents, report, options);
  return true;
}

void ValidateManifestContents(std::string_view file_contents, ValidationReport& report,
                              const ValidationOptions& options) {
  if (file_contents.empty()) {
    report = ValidationReport{};
    AddIssue(report, "$", "manifest file is empty; provide a JSON object with version and mods");
    report.valid = false;
    return;
  }
  ValidateContents(file_contents, options, report);
}

std::string FormatIssue(const ValidationIssue& issue) {
  return issue.path + ": " + issue.message;
}

} // namespace modlist::manifest
