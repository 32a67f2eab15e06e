/// mcphost server: loads modules from a directory and serves their tools.
/// Usage: ./mcphost_server [config.json]
/// Logs JSON lines to stderr; with the stdio transport stdout carries the protocol.

#include <mcphost/mcphost.hpp>
#include <csignal>
#include <cstdio>
#include <pthread.h>
#include <atomic>
#include <thread>

namespace {

mcphost::ServerConfig load(int argc, char** argv) {
    if (argc > 1) return mcphost::load_config(argv[1]);
    mcphost::ServerConfig config;
    mcphost::apply_environment(config);
    return config;
}

} // anonymous namespace

int main(int argc, char** argv) {
    if (argc > 2) {
        std::fprintf(stderr, "usage: %s [config.json]\n", argv[0]);
        return 2;
    }

    mcphost::ServerConfig config;
    try {
        config = load(argc, argv);
    } catch (const mcphost::ConfigError& e) {
        std::fprintf(stderr, "mcphost: %s\n", e.what());
        return 2;
    }

    // Signals are taken by a dedicated thread; every other thread inherits the mask.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    auto telemetry = std::make_shared<mcphost::StderrTelemetry>(config.log_level);
    auto registry = std::make_shared<mcphost::ToolRegistry>(
        config.registry_options(), std::make_shared<mcphost::JsonSchemaValidator>(), telemetry);

    auto catalog = std::make_shared<mcphost::ModuleCatalog>();
    mcphost::modules::register_builtin_modules(*catalog);

    mcphost::ModuleLoader loader(registry, catalog, config.loader_options(),
                                 mcphost::make_config_provider(config.modules.config), telemetry);

    mcphost::McpServer server({config.server, config.instructions}, registry, telemetry);
    server.set_module_status_provider([&loader] {
        nlohmann::json rows = nlohmann::json::array();
        for (const auto& status : loader.status()) rows.push_back(status);
        return rows;
    });
    server.set_metrics_provider([&loader] { return nlohmann::json(loader.metrics()); });

    auto report = loader.load_directory(config.modules.dir, config.modules.enabled);
    telemetry->event(report.ok() ? mcphost::LogLevel::Info : mcphost::LogLevel::Warning,
                     "modules.loaded", nlohmann::json(report));

    auto missing = report.missing_required(config.modules.required);
    if (!missing.empty()) {
        telemetry->event(mcphost::LogLevel::Critical, "startup.aborted",
                         {{"missing_required", missing}});
        loader.stop_all();
        return 1;
    }

    std::atomic<bool> serving{true};
    std::thread signal_thread([&] {
        int sig = 0;
        sigwait(&signals, &sig);
        if (serving.load()) {
            telemetry->event(mcphost::LogLevel::Notice, "server.signal", {{"signal", sig}});
            server.shutdown();
        }
    });

    int rc = 0;
    try {
        if (config.transport.type == mcphost::TransportType::Http) {
            server.serve_http(config.http_options());
        } else {
            server.serve_stdio();
        }
    } catch (const mcphost::McpTransportError& e) {
        telemetry->event(mcphost::LogLevel::Critical, "server.transport_failed", {{"error", e.what()}});
        rc = 1;
    }

    // Wake the signal thread if serving ended on its own (EOF on stdin).
    serving = false;
    pthread_kill(signal_thread.native_handle(), SIGTERM);
    signal_thread.join();

    auto stopped = loader.stop_all();
    telemetry->event(stopped.ok() ? mcphost::LogLevel::Info : mcphost::LogLevel::Warning,
                     "modules.stopped", nlohmann::json(stopped));
    return rc;
}
