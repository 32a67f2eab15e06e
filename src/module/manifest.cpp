#include "mcphost/module/manifest.hpp"
#include "mcphost/codec.hpp"
#include <fstream>
#include <sstream>

namespace mcphost {

namespace {

std::string required_string(const nlohmann::json& j, const char* field) {
    auto it = j.find(field);
    if (it == j.end()) {
        throw ManifestError(std::string("Manifest is missing required field '") + field + "'");
    }
    if (!it->is_string() || it->get_ref<const std::string&>().empty()) {
        throw ManifestError(std::string("Manifest field '") + field + "' must be a non-empty string");
    }
    return it->get<std::string>();
}

std::vector<std::string> name_list(const nlohmann::json& j, const char* field) {
    std::vector<std::string> out;
    auto it = j.find(field);
    if (it == j.end() || it->is_null()) return out;
    if (!it->is_array()) {
        throw ManifestError(std::string("Manifest field '") + field + "' must be an array of module names");
    }
    for (const auto& item : *it) {
        if (!item.is_string() || item.get_ref<const std::string&>().empty()) {
            throw ManifestError(std::string("Manifest field '") + field + "' must contain only module names");
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

} // anonymous namespace

void to_json(nlohmann::json& j, const ModuleManifest& m) {
    j = {
        {"name", m.name},
        {"version", m.version},
        {"description", m.description},
        {"entry", m.entry},
        {"requires", m.required},
        {"optional", m.optional},
        {"load_order", m.load_order},
        {"defaults", m.defaults}
    };
}

ModuleManifest parse_manifest(const nlohmann::json& j, const std::filesystem::path& directory) {
    if (!j.is_object()) {
        throw ManifestError("Manifest must be a JSON object");
    }

    ModuleManifest m;
    m.name = required_string(j, "name");
    if (m.name.find(':') != std::string::npos) {
        throw ManifestError("Module name '" + m.name + "' must not contain ':'");
    }
    m.version = required_string(j, "version");
    m.entry = required_string(j, "entry");
    parse_entry(m.entry);

    if (auto it = j.find("description"); it != j.end() && !it->is_null()) {
        if (!it->is_string()) throw ManifestError("Manifest field 'description' must be a string");
        m.description = it->get<std::string>();
    }

    m.required = name_list(j, "requires");
    m.optional = name_list(j, "optional");

    if (auto it = j.find("load_order"); it != j.end() && !it->is_null()) {
        if (!it->is_number_integer()) {
            throw ManifestError("Manifest field 'load_order' must be an integer");
        }
        m.load_order = it->get<int>();
    }

    if (auto it = j.find("defaults"); it != j.end() && !it->is_null()) {
        if (!it->is_object()) throw ManifestError("Manifest field 'defaults' must be an object");
        m.defaults = *it;
    }

    m.directory = directory;
    return m;
}

ModuleManifest read_manifest(const std::filesystem::path& directory) {
    const auto path = directory / kManifestFileName;
    std::ifstream in(path);
    if (!in) {
        throw ManifestError("Cannot read manifest " + path.string());
    }
    std::ostringstream buf;
    buf << in.rdbuf();

    nlohmann::json j;
    try {
        j = Codec::parse_json(buf.str());
    } catch (const McpParseError& e) {
        throw ManifestError("Manifest " + path.string() + " is not valid JSON: " + e.what());
    }
    try {
        return parse_manifest(j, directory);
    } catch (const ManifestError& e) {
        throw ManifestError(path.string() + ": " + e.what());
    }
}

EntryRef parse_entry(const std::string& entry) {
    auto sep = entry.find(':');
    if (sep == std::string::npos || sep + 1 >= entry.size()) {
        throw ManifestError("Entry '" + entry + "' must be 'builtin:<id>' or 'shared:<path>'");
    }
    const std::string scheme = entry.substr(0, sep);
    const std::string target = entry.substr(sep + 1);
    if (scheme == "builtin") return {EntryRef::Kind::Builtin, target};
    if (scheme == "shared") return {EntryRef::Kind::Shared, target};
    throw ManifestError("Unknown entry scheme '" + scheme + "' in '" + entry + "'");
}

std::filesystem::path resolve_library_path(const ModuleManifest& manifest, const EntryRef& ref) {
    std::filesystem::path p(ref.target);
    if (p.is_absolute() || manifest.directory.empty()) return p;
    return manifest.directory / p;
}

} // namespace mcphost
