#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string_view>

namespace mcphost {

class Codec {
public:
    /// Parse raw JSON bytes into a message.
    /// Throws McpParseError on invalid JSON and McpInvalidRequestError when
    /// the JSON is not a well-formed JSON-RPC 2.0 message.
    [[nodiscard]] static JsonRpcMessage parse(std::string_view raw);

    /// Parse raw bytes into a JSON value without JSON-RPC validation.
    [[nodiscard]] static nlohmann::json parse_json(std::string_view raw);

    /// Serialize a message to JSON string.
    [[nodiscard]] static std::string serialize(const JsonRpcMessage& msg);

private:
    static JsonRpcMessage parse_object(const nlohmann::json& j);
};

} // namespace mcphost
