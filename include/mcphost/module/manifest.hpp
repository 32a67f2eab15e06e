#pragma once
#include "../error.hpp"
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcphost {

constexpr const char* kManifestFileName = "module.json";
constexpr int kDefaultLoadOrder = 100;

/// Declarative description of a module, immutable once parsed.
struct ModuleManifest {
    std::string name;
    std::string version;
    std::string description;
    std::string entry;                      // "builtin:<id>" or "shared:<path>"
    std::vector<std::string> required;
    std::vector<std::string> optional;
    int load_order = kDefaultLoadOrder;     // lower starts first among unordered modules
    nlohmann::json defaults = nlohmann::json::object();
    std::filesystem::path directory;        // where module.json was found, if anywhere
};

void to_json(nlohmann::json& j, const ModuleManifest& m);

struct EntryRef {
    enum class Kind { Builtin, Shared };
    Kind kind;
    std::string target;                     // catalog id or library path
};

/// Parse and validate a manifest object. Throws ManifestError naming the
/// offending field.
ModuleManifest parse_manifest(const nlohmann::json& j,
                              const std::filesystem::path& directory = {});

/// Read `<directory>/module.json`. Throws ManifestError.
ModuleManifest read_manifest(const std::filesystem::path& directory);

/// Split an entry reference. Throws ManifestError for unknown schemes.
EntryRef parse_entry(const std::string& entry);

/// Shared-library path of an entry, resolved against the manifest directory.
std::filesystem::path resolve_library_path(const ModuleManifest& manifest, const EntryRef& ref);

} // namespace mcphost
