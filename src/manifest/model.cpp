#include "manifest/model.hpp"

#include "core/fs_utils.hpp"
#include "core/uri.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace modlist::manifest {

namespace {

using JsonValue = core::json::Value;
using JsonParser = core::json::Parser;

std::optional<std::string> ReadStringField(const JsonValue& object_value, std::string_view key) {
  const JsonValue* value = core::json::Find(object_value, key);
  if (value == nullptr || value->type != JsonValue::Type::kString) {
    return std::nullopt;
  }
  return value->string_value;
}

bool IsKnownTopLevelKey(std::string_view key) {
  return key == "version" || key == "mods";
}

std::optional<ModEntry> ParseModEntry(const JsonValue& entry) {
  if (entry.type != JsonValue::Type::kObject) {
    return std::nullopt;
  }

  std::optional<std::string> name = ReadStringField(entry, "name");
  std::optional<std::string> source = ReadStringField(entry, "source");
  if (!name.has_value() || !source.has_value()) {
    return std::nullopt;
  }

  ModEntry parsed;
  parsed.name = std::move(name.value());
  parsed.source = std::move(source.value());
  parsed.version = ReadStringField(entry, "version");
  parsed.file = ReadStringField(entry, "file");
  return parsed;
}

void ParseManifestRoot(const JsonValue& root, Manifest& manifest) {
  manifest.version = ReadStringField(root, "version").value_or("");

  if (const JsonValue* mods = core::json::Find(root, "mods");
      mods != nullptr && mods->type == JsonValue::Type::kArray) {
    manifest.mods.reserve(mods->array_value.size());
    for (const JsonValue& entry : mods->array_value) {
      if (std::optional<ModEntry> parsed = ParseModEntry(entry); parsed.has_value()) {
        manifest.mods.push_back(std::move(parsed.value()));
      }
    }
  }

  for (const auto& [key, value] : root.object_value) {
    if (!IsKnownTopLevelKey(key)) {
      manifest.extra_fields.emplace_back(key, value);
    }
  }
}

} // namespace

bool ParseManifestText(std::string_view json_text, Manifest& manifest, std::string& error) {
  manifest = Manifest{};
  error.clear();

  JsonValue root;
  JsonParser parser(json_text);
  std::string parse_error;
  if (!parser.Parse(root, parse_error)) {
    error = "invalid manifest JSON: " + parse_error;
    return false;
  }
  if (root.type != JsonValue::Type::kObject) {
    error = "manifest root must be a JSON object";
    return false;
  }

  ParseManifestRoot(root, manifest);
  return true;
}

bool LoadManifestModelFile(const std::string& manifest_path, Manifest& manifest,
                           std::string& error) {
  std::string contents;
  if (!core::ReadTextFile(fs::path(manifest_path), contents, error)) {
    error = "unable to read manifest file: " + manifest_path;
    return false;
  }
  return ParseManifestText(contents, manifest, error);
}

std::string CountLabel(std::size_t mod_count) {
  if (mod_count == 1U) {
    return "1 mod";
  }
  return std::to_string(mod_count) + " mods";
}

const ModEntry* FindMod(const Manifest& manifest, std::string_view name) {
  for (const ModEntry& entry : manifest.mods) {
    if (entry.name == name) {
      return &entry;
    }
  }
  return nullptr;
}

std::string SuggestedFileName(const ModEntry& entry) {
  if (entry.file.has_value() && !entry.file->empty()) {
    return entry.file.value();
  }

  core::uri::UriParts parts;
  std::string error;
  if (!core::uri::ParseUri(entry.source, parts, error)) {
    return "";
  }
  std::string segment = core::uri::LastPathSegment(parts);
  // Decoded %2F / %5C or dot segments would escape the mods directory.
  if (segment == "." || segment == ".." ||
      segment.find_first_of("/\\") != std::string::npos) {
    return "";
  }
  return segment;
}

} // namespace modlist::manifest
