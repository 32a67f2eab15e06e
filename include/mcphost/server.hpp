#pragma once
#include "types.hpp"
#include "json_rpc.hpp"
#include "telemetry.hpp"
#include "tool_registry.hpp"
#include "transport/transport.hpp"
#include "transport/http_transport.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mcphost {

/// Binds the protocol methods (initialize, tools/list, tools/call, ping)
/// to a tool registry and serves them over a transport.
class McpServer {
public:
    struct Options {
        Implementation server_info;
        std::optional<std::string> instructions;
    };

    /// Rows of the module status listing for /health.
    using ModuleStatusProvider = std::function<nlohmann::json()>;
    /// Loader counters reported under "metrics" in /health.
    using MetricsProvider = std::function<nlohmann::json()>;

    McpServer(Options opts, std::shared_ptr<ToolRegistry> registry,
              std::shared_ptr<ITelemetrySink> telemetry = nullptr);
    ~McpServer();

    // Non-copyable, non-movable
    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    ToolRegistry& tools();

    /// Dispatch one parsed message. Never throws.
    [[nodiscard]] std::optional<JsonRpcMessage> handle(const JsonRpcMessage& msg);

    /// Parse, dispatch and serialize one wire message.
    [[nodiscard]] std::optional<std::string> handle_raw(std::string_view raw);

    [[nodiscard]] bool is_initialized() const;

    void set_module_status_provider(ModuleStatusProvider provider);
    void set_metrics_provider(MetricsProvider provider);

    /// `{status, tools, modules[]}`, plus `metrics` when a provider is set.
    /// Status is "degraded" when any module is not running.
    [[nodiscard]] nlohmann::json health() const;

    // ---- Transport ----

    /// Blocks until the transport ends or shutdown() is called.
    void serve(std::unique_ptr<ITransport> transport);
    void serve_stdio();
    void serve_http(HttpServerTransport::Options opts);
    void shutdown();

    [[nodiscard]] bool is_running() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mcphost
