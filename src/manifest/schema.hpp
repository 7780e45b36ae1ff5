#pragma once

#include <string_view>

namespace modlist::manifest {

inline constexpr std::string_view kDefaultManifestFileName = "mods.json";
inline constexpr std::string_view kManifestSchemaFileName = "mods.schema.json";

// Draft-07 JSON Schema for mods.json. This is the same document shipped as
// schemas/mods.schema.json; the validator implements exactly these rules.
std::string_view ManifestSchemaJson();

} // namespace modlist::manifest
