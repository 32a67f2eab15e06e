#include "mcphost/server.hpp"
#include "mcphost/codec.hpp"
#include "mcphost/router.hpp"
#include "mcphost/error.hpp"
#include "mcphost/version.hpp"
#include "mcphost/transport/stdio_transport.hpp"
#include "mcphost/transport/http_transport.hpp"

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <string>

namespace mcphost {

// ----------- McpServer::Impl -----------

struct McpServer::Impl {
    Options opts;
    std::shared_ptr<ToolRegistry> registry;
    std::shared_ptr<ITelemetrySink> telemetry;
    Router router;

    // Transport reference for sending outbound messages
    ITransport* transport{nullptr};
    std::mutex transport_mutex;

    std::atomic<bool> running{false};
    std::atomic<bool> shutdown_requested{false};

    mutable std::mutex status_mutex;
    ModuleStatusProvider module_status;
    MetricsProvider metrics;

    Impl(Options o, std::shared_ptr<ToolRegistry> r, std::shared_ptr<ITelemetrySink> t)
        : opts(std::move(o))
        , registry(std::move(r))
        , telemetry(t ? std::move(t) : null_telemetry())
        , router(telemetry) {
        if (!registry) throw std::invalid_argument("McpServer requires a tool registry");
    }

    void send_message(const JsonRpcMessage& msg) {
        std::lock_guard<std::mutex> lock(transport_mutex);
        if (!transport) return;
        try {
            transport->send(msg);
        } catch (const McpTransportError& e) {
            telemetry->event(LogLevel::Warning, "rpc.send_failed", {{"error", e.what()}});
        }
    }

    void send_notification(const std::string& method,
                           std::optional<nlohmann::json> params = std::nullopt) {
        JsonRpcNotification notif;
        notif.method = method;
        notif.params = std::move(params);
        send_message(notif);
    }

    void setup_handlers() {
        // initialize
        router.on_request("initialize", [this](const nlohmann::json& params) -> HandlerResult {
            auto init = params.get<InitializeParams>();
            telemetry->event(LogLevel::Info, "rpc.client", {
                {"name", init.client_info.name},
                {"version", init.client_info.version},
                {"protocolVersion", init.protocol_version}
            });

            InitializeResult result;
            result.protocol_version = PROTOCOL_VERSION;
            result.capabilities.tools = nlohmann::json{{"listChanged", true}};
            result.server_info = opts.server_info;
            result.instructions = opts.instructions;

            nlohmann::json j;
            to_json(j, result);
            return j;
        });

        // notifications/initialized
        router.on_notification("notifications/initialized", [this](const nlohmann::json&) {
            telemetry->event(LogLevel::Debug, "rpc.client_ready");
        });

        // notifications/cancelled; handlers observe cancellation only through their timeout
        router.on_notification("notifications/cancelled", [this](const nlohmann::json& params) {
            telemetry->event(LogLevel::Info, "rpc.cancel_requested", {
                {"requestId", params.value("requestId", nlohmann::json())},
                {"reason", params.value("reason", std::string{})}
            });
        });

        // ping
        router.on_request("ping", [](const nlohmann::json&) -> HandlerResult {
            return nlohmann::json::object();
        });

        // tools/list
        router.on_request("tools/list", [this](const nlohmann::json&) -> HandlerResult {
            nlohmann::json tools = nlohmann::json::array();
            for (const auto& def : registry->list()) {
                tools.push_back(def);
            }
            return nlohmann::json{{"tools", std::move(tools)}};
        });

        // tools/call
        router.on_request("tools/call", [this](const nlohmann::json& params) -> HandlerResult {
            if (!params.is_object() || !params.contains("name") || !params.at("name").is_string()) {
                return make_error(ErrorKind::InvalidParameters,
                                  "Missing required parameter 'name'",
                                  {{"method", "tools/call"}, {"missing", nlohmann::json::array({"name"})}});
            }
            std::string name = params.at("name").get<std::string>();
            nlohmann::json arguments = params.value("arguments", nlohmann::json::object());
            if (arguments.is_null()) arguments = nlohmann::json::object();
            if (!arguments.is_object()) {
                return make_error(ErrorKind::InvalidParameters,
                                  "'arguments' must be an object",
                                  {{"method", "tools/call"}, {"actual", json_type_name(arguments)}});
            }
            return registry->call(name, arguments);
        });
    }

    void on_tools_changed() {
        if (!router.is_initialized()) return;
        send_notification("notifications/tools/list_changed");
    }
};

McpServer::McpServer(Options opts, std::shared_ptr<ToolRegistry> registry,
                     std::shared_ptr<ITelemetrySink> telemetry)
    : impl_(std::make_unique<Impl>(std::move(opts), std::move(registry), std::move(telemetry))) {
    impl_->setup_handlers();
    impl_->registry->set_change_listener([impl = impl_.get()] { impl->on_tools_changed(); });
}

McpServer::~McpServer() {
    impl_->registry->set_change_listener(nullptr);
    shutdown();
}

ToolRegistry& McpServer::tools() {
    return *impl_->registry;
}

std::optional<JsonRpcMessage> McpServer::handle(const JsonRpcMessage& msg) {
    return impl_->router.dispatch(msg);
}

std::optional<std::string> McpServer::handle_raw(std::string_view raw) {
    return impl_->router.handle_raw(raw);
}

bool McpServer::is_initialized() const {
    return impl_->router.is_initialized();
}

void McpServer::set_module_status_provider(ModuleStatusProvider provider) {
    std::lock_guard<std::mutex> lock(impl_->status_mutex);
    impl_->module_status = std::move(provider);
}

void McpServer::set_metrics_provider(MetricsProvider provider) {
    std::lock_guard<std::mutex> lock(impl_->status_mutex);
    impl_->metrics = std::move(provider);
}

nlohmann::json McpServer::health() const {
    nlohmann::json modules = nlohmann::json::array();
    nlohmann::json metrics;
    {
        std::lock_guard<std::mutex> lock(impl_->status_mutex);
        if (impl_->module_status) modules = impl_->module_status();
        if (impl_->metrics) metrics = impl_->metrics();
    }
    bool degraded = false;
    for (const auto& m : modules) {
        if (m.value("state", std::string{}) != "running") degraded = true;
    }
    nlohmann::json doc = {
        {"status", degraded ? "degraded" : "ok"},
        {"tools", impl_->registry->size()},
        {"modules", std::move(modules)}
    };
    if (!metrics.is_null()) doc["metrics"] = std::move(metrics);
    return doc;
}

void McpServer::serve(std::unique_ptr<ITransport> transport) {
    if (impl_->shutdown_requested) return;
    impl_->running = true;

    auto* t = transport.get();
    {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        // A shutdown() racing this call has nothing to stop yet.
        if (impl_->shutdown_requested) {
            impl_->running = false;
            return;
        }
        impl_->transport = t;
    }

    try {
        t->start(
            [this](const JsonRpcMessage& msg) { return impl_->router.dispatch(msg); },
            [this](std::exception_ptr ep) {
                try {
                    if (ep) std::rethrow_exception(ep);
                } catch (const std::exception& e) {
                    impl_->telemetry->event(LogLevel::Error, "transport.error", {{"error", e.what()}});
                }
            });
    } catch (...) {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        impl_->transport = nullptr;
        impl_->running = false;
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        impl_->transport = nullptr;
    }
    impl_->running = false;
}

void McpServer::serve_stdio() {
    serve(std::make_unique<StdioTransport>());
}

void McpServer::serve_http(HttpServerTransport::Options opts) {
    auto transport = std::make_unique<HttpServerTransport>(std::move(opts), impl_->telemetry);
    transport->set_health_provider([this] { return health(); });
    serve(std::move(transport));
}

void McpServer::shutdown() {
    impl_->shutdown_requested = true;
    std::lock_guard<std::mutex> lock(impl_->transport_mutex);
    if (impl_->transport) {
        impl_->transport->shutdown();
    }
}

bool McpServer::is_running() const {
    return impl_->running;
}

} // namespace mcphost
