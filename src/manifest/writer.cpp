#include "manifest/writer.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"
#include "core/json_utils.hpp"

namespace modlist::manifest {

namespace {

using JsonValue = core::json::Value;

JsonValue MakeObject() {
  JsonValue value;
  value.type = JsonValue::Type::kObject;
  return value;
}

JsonValue ToValue(const ModEntry& entry) {
  JsonValue object_value = MakeObject();
  core::json::Set(object_value, "name", core::json::MakeString(entry.name));
  core::json::Set(object_value, "source", core::json::MakeString(entry.source));
  if (entry.version.has_value()) {
    core::json::Set(object_value, "version", core::json::MakeString(entry.version.value()));
  }
  if (entry.file.has_value()) {
    core::json::Set(object_value, "file", core::json::MakeString(entry.file.value()));
  }
  return object_value;
}

JsonValue ToValue(const Manifest& manifest) {
  JsonValue root = MakeObject();
  core::json::Set(root, "version", core::json::MakeString(manifest.version));

  JsonValue mods;
  mods.type = JsonValue::Type::kArray;
  mods.array_value.reserve(manifest.mods.size());
  for (const ModEntry& entry : manifest.mods) {
    mods.array_value.push_back(ToValue(entry));
  }
  core::json::Set(root, "mods", std::move(mods));

  for (const auto& [key, value] : manifest.extra_fields) {
    if (key == "version" || key == "mods") {
      continue;
    }
    core::json::Set(root, key, value);
  }
  return root;
}

} // namespace

std::string ToJson(const ModEntry& entry, int indent) {
  return core::json::Serialize(ToValue(entry), indent);
}

std::string ToJson(const Manifest& manifest, int indent) {
  return core::json::Serialize(ToValue(manifest), indent);
}

bool WriteManifestFile(const std::filesystem::path& manifest_path, const Manifest& manifest,
                       std::string& error) {
  return core::WriteTextFileAtomic(manifest_path, ToJson(manifest), error);
}

} // namespace modlist::manifest
