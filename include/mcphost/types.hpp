#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace mcphost {

// ---------- Content ----------

/// Tool output is text; machine-readable output goes in structured content.
struct TextContent {
    std::string text;

    bool operator==(const TextContent& o) const { return text == o.text; }
};

// ---------- Tool ----------

/// Public description of a tool. Carries no handler, so copies of it are
/// safe to hand to introspection tooling.
struct ToolDefinition {
    std::string name;                         // "module:tool"
    std::optional<std::string> title;
    std::optional<std::string> description;
    nlohmann::json input_schema = nlohmann::json{{"type", "object"}};
    std::optional<nlohmann::json> output_schema;
    std::optional<nlohmann::json> annotations;

    bool operator==(const ToolDefinition& o) const {
        return name == o.name && title == o.title && description == o.description
               && input_schema == o.input_schema && output_schema == o.output_schema
               && annotations == o.annotations;
    }
};

struct CallToolResult {
    std::vector<TextContent> content;
    std::optional<nlohmann::json> structured_content;
    bool is_error = false;

    bool operator==(const CallToolResult& o) const {
        return content == o.content && structured_content == o.structured_content
               && is_error == o.is_error;
    }

    /// Single text block result.
    static CallToolResult text(std::string s) {
        CallToolResult r;
        r.content.push_back(TextContent{std::move(s)});
        return r;
    }
};

// ---------- Handshake ----------

/// Only the tools capability is ever advertised.
struct ServerCapabilities {
    std::optional<nlohmann::json> tools;
};

struct Implementation {
    std::string name;
    std::optional<std::string> title;
    std::string version;

    bool operator==(const Implementation& o) const {
        return name == o.name && title == o.title && version == o.version;
    }
};

/// What a client declares in `initialize`.
struct InitializeParams {
    std::string protocol_version;
    nlohmann::json capabilities = nlohmann::json::object();
    Implementation client_info;
};

struct InitializeResult {
    std::string protocol_version;
    ServerCapabilities capabilities;
    Implementation server_info;
    std::optional<std::string> instructions;
};

// ---------- Logging ----------

enum class LogLevel {
    Debug, Info, Notice, Warning, Error, Critical, Alert, Emergency
};

std::string log_level_to_string(LogLevel level);
LogLevel log_level_from_string(const std::string& s);

// ---------- JSON serialization ----------

void to_json(nlohmann::json& j, const TextContent& t);

void to_json(nlohmann::json& j, const ToolDefinition& t);
void from_json(const nlohmann::json& j, ToolDefinition& t);

void to_json(nlohmann::json& j, const CallToolResult& t);

void to_json(nlohmann::json& j, const ServerCapabilities& t);

void to_json(nlohmann::json& j, const Implementation& t);
void from_json(const nlohmann::json& j, Implementation& t);

void from_json(const nlohmann::json& j, InitializeParams& t);

void to_json(nlohmann::json& j, const InitializeResult& t);

void to_json(nlohmann::json& j, LogLevel level);
void from_json(const nlohmann::json& j, LogLevel& level);

} // namespace mcphost
