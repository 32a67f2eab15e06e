#pragma once
#include "types.hpp"
#include "tool_registry.hpp"
#include "module/module_loader.hpp"
#include "transport/http_transport.hpp"
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcphost {

enum class TransportType { Stdio, Http };

struct TransportConfig {
    TransportType type = TransportType::Stdio;
    std::string host = "127.0.0.1";
    uint16_t port = 8080;
    std::string path = "/mcp";
    std::vector<std::string> allowed_origins;
    std::vector<std::string> allowed_hosts;
    std::chrono::milliseconds session_timeout{30 * 60 * 1000};
    std::chrono::milliseconds sweep_interval{60 * 1000};
    std::chrono::milliseconds keepalive{15000};
    RateLimiter::Options rate_limit;
};

struct ModulesConfig {
    std::filesystem::path dir = "modules";
    std::vector<std::string> enabled;    // empty = everything discovered
    std::vector<std::string> required;   // startup aborts if one of these fails
    std::chrono::milliseconds start_timeout{10000};
    std::chrono::milliseconds stop_timeout{30000};
    nlohmann::json config = nlohmann::json::object();  // per-module overrides by name
};

struct ServerConfig {
    Implementation server{"mcphost", std::nullopt, "0.0.0"};
    std::optional<std::string> instructions;
    LogLevel log_level = LogLevel::Info;
    TransportConfig transport;
    std::chrono::milliseconds call_timeout{30000};
    ModulesConfig modules;

    [[nodiscard]] HttpServerTransport::Options http_options() const;
    [[nodiscard]] ToolRegistry::Options registry_options() const;
    [[nodiscard]] ModuleLoader::Options loader_options() const;
};

/// Build a config from its JSON form. Absent keys keep their defaults.
/// Throws ConfigError naming the offending key.
ServerConfig parse_config(const nlohmann::json& j);

/// Read and parse a config file. A relative `modules.dir` is taken
/// relative to the file. Environment overrides are applied last.
ServerConfig load_config(const std::filesystem::path& path);

/// MCPHOST_LOG_LEVEL replaces `log_level` when set.
void apply_environment(ServerConfig& config);

/// Manifest defaults merge-patched with `overrides[manifest.name]`.
ConfigProvider make_config_provider(nlohmann::json overrides);

} // namespace mcphost
