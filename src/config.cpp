#include "mcphost/config.hpp"
#include "mcphost/codec.hpp"
#include "mcphost/error.hpp"
#include "mcphost/version.hpp"
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace mcphost {

namespace {

const nlohmann::json* section(const nlohmann::json& j, const char* key, const std::string& where) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return nullptr;
    if (!it->is_object()) throw ConfigError(where + key + ": expected object");
    return &*it;
}

void read(const nlohmann::json& j, const char* key, const std::string& where, std::string& out) {
    auto it = j.find(key);
    if (it == j.end()) return;
    if (!it->is_string()) throw ConfigError(where + key + ": expected string");
    out = it->get<std::string>();
}

void read(const nlohmann::json& j, const char* key, const std::string& where,
          std::optional<std::string>& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    if (!it->is_string()) throw ConfigError(where + key + ": expected string");
    out = it->get<std::string>();
}

void read(const nlohmann::json& j, const char* key, const std::string& where,
          std::vector<std::string>& out) {
    auto it = j.find(key);
    if (it == j.end()) return;
    if (!it->is_array()) throw ConfigError(where + key + ": expected array of strings");
    out.clear();
    for (const auto& v : *it) {
        if (!v.is_string()) throw ConfigError(where + key + ": expected array of strings");
        out.push_back(v.get<std::string>());
    }
}

void read(const nlohmann::json& j, const char* key, const std::string& where,
          std::chrono::milliseconds& out) {
    auto it = j.find(key);
    if (it == j.end()) return;
    if (!it->is_number_integer() || it->get<int64_t>() < 0) {
        throw ConfigError(where + key + ": expected non-negative integer (milliseconds)");
    }
    out = std::chrono::milliseconds(it->get<int64_t>());
}

void read(const nlohmann::json& j, const char* key, const std::string& where, double& out) {
    auto it = j.find(key);
    if (it == j.end()) return;
    if (!it->is_number() || it->get<double>() < 0) {
        throw ConfigError(where + key + ": expected non-negative number");
    }
    out = it->get<double>();
}

void parse_transport(const nlohmann::json& j, TransportConfig& t) {
    const std::string where = "transport.";

    std::string type = t.type == TransportType::Http ? "http" : "stdio";
    read(j, "type", where, type);
    if (type == "stdio") t.type = TransportType::Stdio;
    else if (type == "http") t.type = TransportType::Http;
    else throw ConfigError("transport.type: expected \"stdio\" or \"http\", got \"" + type + "\"");

    read(j, "host", where, t.host);
    if (auto it = j.find("port"); it != j.end()) {
        if (!it->is_number_integer() || it->get<int64_t>() < 0
            || it->get<int64_t>() > std::numeric_limits<uint16_t>::max()) {
            throw ConfigError("transport.port: expected integer in 0..65535");
        }
        t.port = static_cast<uint16_t>(it->get<int64_t>());
    }
    read(j, "path", where, t.path);
    if (t.path.empty() || t.path.front() != '/') {
        throw ConfigError("transport.path: must start with '/'");
    }
    read(j, "allowed_origins", where, t.allowed_origins);
    read(j, "allowed_hosts", where, t.allowed_hosts);
    read(j, "session_timeout_ms", where, t.session_timeout);
    read(j, "sweep_interval_ms", where, t.sweep_interval);
    if (t.sweep_interval.count() == 0) {
        throw ConfigError("transport.sweep_interval_ms: must be greater than zero");
    }
    read(j, "keepalive_ms", where, t.keepalive);

    if (const auto* rl = section(j, "rate_limit", where)) {
        read(*rl, "capacity", where + "rate_limit.", t.rate_limit.capacity);
        read(*rl, "refill_per_second", where + "rate_limit.", t.rate_limit.refill_per_second);
    }
}

void parse_modules(const nlohmann::json& j, ModulesConfig& m) {
    const std::string where = "modules.";
    std::string dir = m.dir.string();
    read(j, "dir", where, dir);
    m.dir = dir;
    read(j, "enabled", where, m.enabled);
    read(j, "required", where, m.required);
    read(j, "start_timeout_ms", where, m.start_timeout);
    read(j, "stop_timeout_ms", where, m.stop_timeout);
    if (const auto* overrides = section(j, "config", where)) {
        for (const auto& [name, value] : overrides->items()) {
            if (!value.is_object()) {
                throw ConfigError("modules.config." + name + ": expected object");
            }
        }
        m.config = *overrides;
    }
}

} // anonymous namespace

HttpServerTransport::Options ServerConfig::http_options() const {
    HttpServerTransport::Options o;
    o.host = transport.host;
    o.port = transport.port;
    o.mcp_path = transport.path;
    o.allowed_origins = transport.allowed_origins;
    o.allowed_hosts = transport.allowed_hosts;
    o.keepalive = transport.keepalive;
    o.sessions.session_timeout = transport.session_timeout;
    o.sessions.sweep_interval = transport.sweep_interval;
    o.rate_limit = transport.rate_limit;
    return o;
}

ToolRegistry::Options ServerConfig::registry_options() const {
    ToolRegistry::Options o;
    o.call_timeout = call_timeout;
    return o;
}

ModuleLoader::Options ServerConfig::loader_options() const {
    ModuleLoader::Options o;
    o.start_timeout = modules.start_timeout;
    o.stop_timeout = modules.stop_timeout;
    return o;
}

ServerConfig parse_config(const nlohmann::json& j) {
    if (!j.is_object()) throw ConfigError("config: expected a JSON object");

    ServerConfig cfg;
    cfg.server.version = LIBRARY_VERSION;

    if (const auto* server = section(j, "server", "")) {
        read(*server, "name", "server.", cfg.server.name);
        read(*server, "version", "server.", cfg.server.version);
        read(*server, "instructions", "server.", cfg.instructions);
    }

    if (auto it = j.find("log_level"); it != j.end()) {
        if (!it->is_string()) throw ConfigError("log_level: expected string");
        try {
            cfg.log_level = log_level_from_string(it->get<std::string>());
        } catch (const std::invalid_argument& e) {
            throw ConfigError(std::string("log_level: ") + e.what());
        }
    }

    if (const auto* transport = section(j, "transport", "")) {
        parse_transport(*transport, cfg.transport);
    }

    if (const auto* tools = section(j, "tools", "")) {
        read(*tools, "call_timeout_ms", "tools.", cfg.call_timeout);
    }

    if (const auto* modules = section(j, "modules", "")) {
        parse_modules(*modules, cfg.modules);
    }

    return cfg;
}

ServerConfig load_config(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw ConfigError("Cannot read config file: " + path.string());
    std::ostringstream buf;
    buf << in.rdbuf();

    nlohmann::json j;
    try {
        j = Codec::parse_json(buf.str());
    } catch (const McpParseError& e) {
        throw ConfigError(path.string() + ": " + e.what());
    }

    ServerConfig cfg = parse_config(j);
    if (cfg.modules.dir.is_relative()) {
        cfg.modules.dir = path.parent_path() / cfg.modules.dir;
    }
    apply_environment(cfg);
    return cfg;
}

void apply_environment(ServerConfig& config) {
    const char* level = std::getenv("MCPHOST_LOG_LEVEL");
    if (!level || !*level) return;
    try {
        config.log_level = log_level_from_string(level);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(std::string("MCPHOST_LOG_LEVEL: ") + e.what());
    }
}

ConfigProvider make_config_provider(nlohmann::json overrides) {
    return [overrides = std::move(overrides)](const ModuleManifest& manifest) {
        nlohmann::json merged = manifest.defaults.is_object()
            ? manifest.defaults : nlohmann::json::object();
        auto it = overrides.find(manifest.name);
        if (it != overrides.end()) merged.merge_patch(*it);
        return merged;
    };
}

} // namespace mcphost
