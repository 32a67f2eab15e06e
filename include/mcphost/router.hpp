#pragma once
#include "json_rpc.hpp"
#include "telemetry.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <unordered_map>
#include <string>
#include <string_view>
#include <mutex>

namespace mcphost {

using RequestHandler = std::function<HandlerResult(const nlohmann::json& params)>;
using NotificationHandler = std::function<void(const nlohmann::json& params)>;

/// Protocol core: method table, initialized state and the error boundary.
/// No exception escapes dispatch() or handle_raw().
class Router {
public:
    static constexpr const char* kInitializeMethod = "initialize";

    explicit Router(std::shared_ptr<ITelemetrySink> telemetry = nullptr);

    /// Register a request handler for a method.
    void on_request(const std::string& method, RequestHandler handler);

    /// Register a notification handler.
    void on_notification(const std::string& method, NotificationHandler handler);

    /// Dispatch an incoming message. Returns a response for requests only.
    /// Every method other than `initialize` fails with not-initialized
    /// until an `initialize` request has succeeded.
    [[nodiscard]] std::optional<JsonRpcMessage> dispatch(const JsonRpcMessage& msg);

    /// Parse, dispatch and serialize one wire message. Malformed input
    /// yields a serialized error response.
    [[nodiscard]] std::optional<std::string> handle_raw(std::string_view raw);

    [[nodiscard]] bool is_initialized() const { return initialized_.load(); }
    [[nodiscard]] bool has_handler(const std::string& method) const;

    /// Error responses for input the codec rejected.
    [[nodiscard]] static JsonRpcResponse parse_error_response(const McpParseError& e);
    [[nodiscard]] static JsonRpcResponse invalid_request_response(const McpInvalidRequestError& e);

private:
    JsonRpcResponse dispatch_request(const JsonRpcRequest& req);
    void dispatch_notification(const JsonRpcNotification& notif);

    std::shared_ptr<ITelemetrySink> telemetry_;
    std::atomic<bool> initialized_{false};

    mutable std::mutex mutex_;
    std::unordered_map<std::string, RequestHandler> request_handlers_;
    std::unordered_map<std::string, NotificationHandler> notification_handlers_;
};

} // namespace mcphost
