#include <benchmark/benchmark.h>
#include "mcphost/router.hpp"
#include "mcphost/server.hpp"
#include "mcphost/tool_registry.hpp"
#include "mcphost/types.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace mcphost;

// Router with N methods registered, already past initialize
static std::unique_ptr<Router> make_router(int n_methods) {
    auto router = std::make_unique<Router>();
    for (int i = 0; i < n_methods; ++i) {
        router->on_request("method_" + std::to_string(i),
            [](const nlohmann::json&) -> HandlerResult {
                return nlohmann::json{{"result", "ok"}};
            });
    }
    router->on_request("initialize", [](const nlohmann::json&) -> HandlerResult {
        return nlohmann::json::object();
    });
    router->on_request("ping", [](const nlohmann::json&) -> HandlerResult {
        return nlohmann::json::object();
    });

    JsonRpcRequest init;
    init.id = RequestId{int64_t{0}};
    init.method = "initialize";
    benchmark::DoNotOptimize(router->dispatch(init));
    return router;
}

static ToolDefinition add_definition(const std::string& name) {
    ToolDefinition def;
    def.name = name;
    def.input_schema = {
        {"type", "object"},
        {"properties", {{"a", {{"type", "number"}}}, {"b", {{"type", "number"}}}}},
        {"required", {"a", "b"}},
        {"additionalProperties", false}
    };
    return def;
}

static ToolHandler add_handler() {
    return [](const nlohmann::json& args, const CancelToken&) {
        return CallToolResult::text(std::to_string(args.at("a").get<int64_t>() +
                                                   args.at("b").get<int64_t>()));
    };
}

static void BM_DispatchKnownMethod(benchmark::State& state) {
    auto router = make_router(1);

    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "ping";

    for (auto _ : state) {
        auto resp = router->dispatch(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchKnownMethod)->MinTime(1.0);

static void BM_DispatchUnknownMethod(benchmark::State& state) {
    auto router = make_router(1);

    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "not_registered_method";

    for (auto _ : state) {
        auto resp = router->dispatch(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchUnknownMethod)->MinTime(1.0);

static void BM_DispatchBeforeInitialize(benchmark::State& state) {
    Router router;
    router.on_request("ping", [](const nlohmann::json&) -> HandlerResult {
        return nlohmann::json::object();
    });

    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "ping";

    for (auto _ : state) {
        auto resp = router.dispatch(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchBeforeInitialize)->MinTime(1.0);

static void BM_Dispatch100Methods(benchmark::State& state) {
    auto router = make_router(100);

    std::vector<JsonRpcRequest> requests;
    for (int i = 0; i < 100; ++i) {
        JsonRpcRequest req;
        req.id = RequestId{int64_t{i}};
        req.method = "method_" + std::to_string(i);
        requests.push_back(req);
    }

    int i = 0;
    for (auto _ : state) {
        auto resp = router->dispatch(requests[i % 100]);
        benchmark::DoNotOptimize(resp);
        ++i;
    }
}
BENCHMARK(BM_Dispatch100Methods)->MinTime(1.0);

// ---- Tool registry ----

// Handlers run inline: measures lookup and validation, not thread startup.
static void BM_RegistryCallInline(benchmark::State& state) {
    ToolRegistry registry(ToolRegistry::Options{std::chrono::milliseconds(0)});
    registry.register_tool(add_definition("math:add"), add_handler());
    const nlohmann::json args = {{"a", 2}, {"b", 3}};

    for (auto _ : state) {
        auto result = registry.call("math:add", args);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_RegistryCallInline)->MinTime(1.0);

static void BM_RegistryCallWithDeadline(benchmark::State& state) {
    ToolRegistry registry;
    registry.register_tool(add_definition("math:add"), add_handler());
    const nlohmann::json args = {{"a", 2}, {"b", 3}};

    for (auto _ : state) {
        auto result = registry.call("math:add", args);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_RegistryCallWithDeadline)->MinTime(1.0)->UseRealTime();

static void BM_RegistryRejectArguments(benchmark::State& state) {
    ToolRegistry registry;
    registry.register_tool(add_definition("math:add"), add_handler());
    const nlohmann::json args = {{"a", "two"}, {"c", 3}};

    for (auto _ : state) {
        auto result = registry.call("math:add", args);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_RegistryRejectArguments)->MinTime(1.0);

static void BM_RegistryList(benchmark::State& state) {
    ToolRegistry registry;
    for (int i = 0; i < state.range(0); ++i) {
        registry.register_tool(add_definition("bench:tool_" + std::to_string(i)), add_handler());
    }

    for (auto _ : state) {
        auto tools = registry.list();
        benchmark::DoNotOptimize(tools);
    }
}
BENCHMARK(BM_RegistryList)->Arg(10)->Arg(100)->Arg(1000);

// ---- Whole server, raw message in and out ----

static void BM_ServerHandleRawToolCall(benchmark::State& state) {
    auto registry = std::make_shared<ToolRegistry>(ToolRegistry::Options{std::chrono::milliseconds(0)});
    registry->register_tool(add_definition("math:add"), add_handler());
    McpServer server(McpServer::Options{{"bench-server", std::nullopt, "1.0"}, std::nullopt}, registry);
    benchmark::DoNotOptimize(server.handle_raw(
        R"({"jsonrpc":"2.0","id":0,"method":"initialize","params":{"protocolVersion":"2025-06-18","capabilities":{},"clientInfo":{"name":"bench","version":"1"}}})"));

    const std::string call =
        R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"math:add","arguments":{"a":2,"b":3}}})";
    for (auto _ : state) {
        auto reply = server.handle_raw(call);
        benchmark::DoNotOptimize(reply);
    }
    state.SetBytesProcessed(state.iterations() * call.size());
}
BENCHMARK(BM_ServerHandleRawToolCall)->MinTime(1.0);
