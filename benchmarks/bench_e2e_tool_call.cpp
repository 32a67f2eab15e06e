#include <benchmark/benchmark.h>
#include "mcphost/server.hpp"
#include "mcphost/transport/stdio_transport.hpp"
#include "mcphost/modules/builtin.hpp"
#include "mcphost/module/module_loader.hpp"
#include <unistd.h>
#include <stdexcept>
#include <string>
#include <thread>

using namespace mcphost;

// A server with the builtin modules on one end of two pipes; the benchmark
// writes request lines and reads reply lines on the other end.
struct E2EFixture {
    int c2s[2], s2c[2];  // client->server and server->client pipes
    std::shared_ptr<ToolRegistry> registry;
    std::unique_ptr<ModuleLoader> loader;
    std::unique_ptr<McpServer> server;
    std::thread server_thread;
    std::string pending;

    /// `extra_tools` are registered before initialize, so no list_changed
    /// notification interleaves with the replies.
    explicit E2EFixture(int extra_tools = 0) {
        if (pipe(c2s) < 0 || pipe(s2c) < 0) throw std::runtime_error("pipe failed");

        registry = std::make_shared<ToolRegistry>();
        auto catalog = std::make_shared<ModuleCatalog>();
        modules::register_builtin_modules(*catalog);
        loader = std::make_unique<ModuleLoader>(registry, catalog, ModuleLoader::Options{});

        std::vector<ModuleManifest> manifests(2);
        manifests[0].name = "math";
        manifests[0].version = "1.0.0";
        manifests[0].entry = "builtin:math";
        manifests[1].name = "echo";
        manifests[1].version = "1.0.0";
        manifests[1].entry = "builtin:echo";
        if (!loader->load_all(std::move(manifests)).ok()) {
            throw std::runtime_error("builtin modules failed to load");
        }

        for (int i = 0; i < extra_tools; ++i) {
            ToolDefinition def;
            def.name = "bench:tool_" + std::to_string(i);
            def.description = "Benchmark tool " + std::to_string(i);
            registry->register_tool(def, [](const nlohmann::json&, const CancelToken&) {
                return CallToolResult::text("ok");
            });
        }

        server = std::make_unique<McpServer>(
            McpServer::Options{{"bench-server", std::nullopt, "1.0"}, std::nullopt}, registry);
        auto transport = std::make_unique<StdioTransport>(c2s[0], s2c[1]);
        server_thread = std::thread([this, t = std::move(transport)]() mutable {
            server->serve(std::move(t));
        });

        roundtrip(R"({"jsonrpc":"2.0","id":0,"method":"initialize","params":{"protocolVersion":"2025-06-18","capabilities":{},"clientInfo":{"name":"bench-client","version":"1.0"}}})");
    }

    ~E2EFixture() {
        close(c2s[1]);
        if (server_thread.joinable()) server_thread.join();
        loader->stop_all();
        close(s2c[0]);
    }

    std::string roundtrip(const std::string& request) {
        std::string line = request + "\n";
        const char* p = line.data();
        size_t left = line.size();
        while (left > 0) {
            ssize_t n = write(c2s[1], p, left);
            if (n <= 0) throw std::runtime_error("write failed");
            p += n;
            left -= static_cast<size_t>(n);
        }
        while (true) {
            auto nl = pending.find('\n');
            if (nl != std::string::npos) {
                std::string reply = pending.substr(0, nl);
                pending.erase(0, nl + 1);
                return reply;
            }
            char buf[8192];
            ssize_t n = read(s2c[0], buf, sizeof(buf));
            if (n <= 0) throw std::runtime_error("server closed the pipe");
            pending.append(buf, static_cast<size_t>(n));
        }
    }
};

static void BM_ToolCallStdio(benchmark::State& state) {
    E2EFixture fixture;
    const std::string call =
        R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"echo:echo","arguments":{"message":"hello benchmark"}}})";

    for (auto _ : state) {
        auto reply = fixture.roundtrip(call);
        benchmark::DoNotOptimize(reply);
    }

    state.SetLabel("stdio tools/call roundtrip");
}
BENCHMARK(BM_ToolCallStdio)->MinTime(2.0)->UseRealTime();

static void BM_MathAddStdio(benchmark::State& state) {
    E2EFixture fixture;
    const std::string call =
        R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"math:add","arguments":{"a":40,"b":2}}})";

    for (auto _ : state) {
        auto reply = fixture.roundtrip(call);
        benchmark::DoNotOptimize(reply);
    }
}
BENCHMARK(BM_MathAddStdio)->MinTime(2.0)->UseRealTime();

static void BM_ListToolsStdio(benchmark::State& state) {
    E2EFixture fixture(95);

    const std::string list = R"({"jsonrpc":"2.0","id":4,"method":"tools/list"})";
    for (auto _ : state) {
        auto reply = fixture.roundtrip(list);
        benchmark::DoNotOptimize(reply);
    }

    state.SetLabel("99 tools");
}
BENCHMARK(BM_ListToolsStdio)->MinTime(2.0)->UseRealTime();
