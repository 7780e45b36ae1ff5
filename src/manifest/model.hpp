#pragma once

#include "core/json_dom.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace modlist::manifest {

struct ModEntry {
  std::string name;
  std::string source;
  // Game version the installed file targets; may differ from the manifest's.
  std::optional<std::string> version;
  // Local file name of the installed jar.
  std::optional<std::string> file;

  bool operator==(const ModEntry& other) const = default;
};

// Parsed mods.json.
//
// Unknown top-level members are kept in `extra_fields` (document order) so a
// rewrite does not drop data this library does not understand. Unknown
// members inside mod entries are not kept.
struct Manifest {
  std::string version;
  std::vector<ModEntry> mods;
  std::vector<std::pair<std::string, core::json::Value>> extra_fields;
};

// Builds a Manifest from JSON text.
//
// Lenient by design, like any model parser behind a strict validator:
// - hard errors only for invalid JSON or a non-object root;
// - mod entries that are not objects or lack a string name/source are skipped;
// - optional fields with the wrong type are treated as unset.
bool ParseManifestText(std::string_view json_text, Manifest& manifest, std::string& error);

bool LoadManifestModelFile(const std::string& manifest_path, Manifest& manifest,
                           std::string& error);

// "1 mod", "3 mods", "0 mods".
std::string CountLabel(std::size_t mod_count);

// First entry named `name`, or nullptr.
const ModEntry* FindMod(const Manifest& manifest, std::string_view name);

// The recorded file name when set, otherwise the decoded last path segment of
// the source URI. Empty when neither yields a name.
std::string SuggestedFileName(const ModEntry& entry);

} // namespace modlist::manifest
