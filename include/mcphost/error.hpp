#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace mcphost {

class McpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Bytes that are not JSON at all.
class McpParseError : public McpError {
public:
    using McpError::McpError;
};

/// Valid JSON that is not a valid JSON-RPC message. Keeps the id when
/// one could be read so the error response can echo it.
class McpInvalidRequestError : public McpError {
public:
    nlohmann::json id;
    McpInvalidRequestError(const std::string& msg, nlohmann::json id = nullptr)
        : McpError(msg), id(std::move(id)) {}
};

class McpProtocolError : public McpError {
public:
    int code;
    std::optional<nlohmann::json> data;
    McpProtocolError(int code, const std::string& msg,
                     std::optional<nlohmann::json> data = std::nullopt)
        : McpError(msg), code(code), data(std::move(data)) {}
};

class McpTransportError : public McpError {
public:
    using McpError::McpError;
};

class McpTimeoutError : public McpError {
public:
    using McpError::McpError;
};

class ToolRegistrationError : public McpError {
public:
    std::string tool;
    ToolRegistrationError(const std::string& msg, std::string tool)
        : McpError(msg), tool(std::move(tool)) {}
};

/// Name lacks the "module:tool" namespace separator.
class InvalidToolNameError : public ToolRegistrationError {
public:
    using ToolRegistrationError::ToolRegistrationError;
};

/// Name already taken and no override was requested.
class ToolCollisionError : public ToolRegistrationError {
public:
    std::string existing_owner;
    ToolCollisionError(const std::string& msg, std::string tool, std::string existing_owner)
        : ToolRegistrationError(msg, std::move(tool)), existing_owner(std::move(existing_owner)) {}
};

class ManifestError : public McpError {
public:
    using McpError::McpError;
};

class ConfigError : public McpError {
public:
    using McpError::McpError;
};

class PluginLoadError : public McpError {
public:
    using McpError::McpError;
};

enum class ErrorKind {
    ParseFailure,
    MalformedRequest,
    UnknownMethod,
    InvalidParameters,
    Internal,
    NotInitialized,
    ToolNotFound,
    ToolInvalidParameters,
    ToolExecutionFailure,
    ToolTimeout,
    SessionInvalid,
    RateLimited,
    OriginRejected,
    ModuleMissingDependency,
    ModuleCircularDependency,
    ModuleStartFailure,
    ModuleStopTimeout,
    ModuleLoadFailure,
};

namespace error {
    constexpr int ParseError               = -32700;
    constexpr int InvalidRequest           = -32600;
    constexpr int MethodNotFound           = -32601;
    constexpr int InvalidParams            = -32602;
    constexpr int InternalError            = -32603;
    constexpr int ToolNotFound             = -32000;
    constexpr int ToolExecutionFailed      = -32001;
    constexpr int InvalidToolParams        = -32002;
    constexpr int NotInitialized           = -32003;
    constexpr int ToolTimeout              = -32004;
    constexpr int SessionInvalid           = -32005;
    constexpr int RateLimited              = -32006;
    constexpr int OriginRejected           = -32007;
    constexpr int ModuleMissingDependency  = -32010;
    constexpr int ModuleCircularDependency = -32011;
    constexpr int ModuleStartFailure       = -32012;
    constexpr int ModuleStopTimeout        = -32013;
    constexpr int ModuleLoadFailure        = -32014;
} // namespace error

/// Kebab-case name used in `data.kind` of every structured error.
std::string to_string(ErrorKind kind);

/// Fixed JSON-RPC code of a kind.
int error_code(ErrorKind kind);

} // namespace mcphost
