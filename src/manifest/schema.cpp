#include "manifest/schema.hpp"

namespace modlist::manifest {

namespace {

constexpr std::string_view kManifestSchemaJson = R"json(
{
    "$schema": "http://json-schema.org/draft-07/schema#",
    "title": "Mod list",
    "description": "Mods to install for one game version.",
    "type": "object",
    "properties": {
        "version": {
            "type": "string",
            "description": "Game version targeted by every mod in the list."
        },
        "mods": {
            "type": "array",
            "description": "Mods in install order.",
            "items": {
                "type": "object",
                "properties": {
                    "name": {
                        "type": "string",
                        "description": "Human readable mod name."
                    },
                    "source": {
                        "type": "string",
                        "format": "uri",
                        "description": "Where the mod is downloaded from."
                    },
                    "version": {
                        "type": "string",
                        "description": "Game version the installed file was built for."
                    },
                    "file": {
                        "type": "string",
                        "description": "Local file name of the installed mod."
                    }
                },
                "required": ["name", "source"]
            }
        }
    },
    "required": ["version", "mods"]
}
)json";

} // namespace

std::string_view ManifestSchemaJson() {
  return kManifestSchemaJson;
}

} // namespace modlist::manifest
