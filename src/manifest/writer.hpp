#pragma once

#include "manifest/model.hpp"

#include <filesystem>
#include <string>

namespace modlist::manifest {

inline constexpr int kDefaultManifestIndent = 4;

// Canonical key order: name, source, then version and file when set.
std::string ToJson(const ModEntry& entry, int indent = 0);

// Canonical key order: version, mods, then extra fields in their original
// order. No trailing newline.
std::string ToJson(const Manifest& manifest, int indent = kDefaultManifestIndent);

// Serializes with the default indent and publishes the file atomically,
// creating the parent directory when missing.
bool WriteManifestFile(const std::filesystem::path& manifest_path, const Manifest& manifest,
                       std::string& error);

} // namespace modlist::manifest
