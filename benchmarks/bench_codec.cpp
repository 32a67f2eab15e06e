#include <benchmark/benchmark.h>
#include "mcphost/codec.hpp"
#include "mcphost/error.hpp"
#include "mcphost/module/manifest.hpp"
#include "mcphost/router.hpp"
#include "mcphost/schema_validator.hpp"
#include <string>

using namespace mcphost;

namespace {

const std::string kManifest = R"({
  "name": "hello",
  "version": "1.1.0",
  "description": "Greets people",
  "entry": "builtin:hello",
  "requires": ["store"],
  "optional": ["echo"],
  "load_order": 30,
  "defaults": {"greeting": "Hello", "limits": {"max_names": 16, "tags": ["a", "b", "c"]}}
})";

nlohmann::json greet_schema() {
    return {
        {"type", "object"},
        {"properties", {
            {"name", {{"type", "string"}, {"minLength", 1}, {"maxLength", 64}}},
            {"times", {{"type", "integer"}, {"minimum", 1}, {"maximum", 10}}},
            {"style", {{"enum", {"plain", "loud", "polite"}}}},
            {"tags", {{"type", "array"}, {"items", {{"type", "string"}}}, {"maxItems", 8}}}
        }},
        {"required", {"name"}},
        {"additionalProperties", false}
    };
}

// tools/list reply for `n` tools spread over ten modules
std::string tools_list_reply(int n) {
    nlohmann::json tools = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        tools.push_back({
            {"name", "module_" + std::to_string(i % 10) + ":tool_" + std::to_string(i)},
            {"inputSchema", greet_schema()}
        });
    }
    return nlohmann::json{{"jsonrpc", "2.0"}, {"id", 1}, {"result", {{"tools", tools}}}}.dump();
}

} // anonymous namespace

// ---- Manifests ----

static void BM_ParseManifest(benchmark::State& state) {
    for (auto _ : state) {
        auto manifest = parse_manifest(Codec::parse_json(kManifest), "/srv/modules/hello");
        benchmark::DoNotOptimize(manifest);
    }
    state.SetBytesProcessed(state.iterations() * kManifest.size());
}
BENCHMARK(BM_ParseManifest);

static void BM_RejectManifest(benchmark::State& state) {
    const auto doc = Codec::parse_json(R"({"name":"Bad Name","version":"1","entry":"ftp:x"})");
    for (auto _ : state) {
        try {
            auto manifest = parse_manifest(doc);
            benchmark::DoNotOptimize(manifest);
        } catch (const ManifestError& e) {
            benchmark::DoNotOptimize(e.what());
        }
    }
}
BENCHMARK(BM_RejectManifest);

// ---- Wire messages ----

static void BM_ParseToolCall(benchmark::State& state) {
    const std::string raw =
        R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"hello:greet","arguments":{"name":"Ada","times":2,"tags":["x","y"]}}})";
    for (auto _ : state) {
        auto msg = Codec::parse(raw);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * raw.size());
}
BENCHMARK(BM_ParseToolCall);

static void BM_ParseToolsListReply(benchmark::State& state) {
    const std::string raw = tools_list_reply(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto msg = Codec::parse(raw);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * raw.size());
}
BENCHMARK(BM_ParseToolsListReply)->Arg(10)->Arg(100);

// ---- Error replies, wire in to wire out ----

static void BM_NotInitializedReply(benchmark::State& state) {
    Router router;
    router.on_request("tools/list", [](const nlohmann::json&) -> HandlerResult {
        return nlohmann::json{{"tools", nlohmann::json::array()}};
    });
    const std::string raw = R"({"jsonrpc":"2.0","id":7,"method":"tools/list"})";
    for (auto _ : state) {
        auto reply = router.handle_raw(raw);
        benchmark::DoNotOptimize(reply);
    }
}
BENCHMARK(BM_NotInitializedReply);

static void BM_MalformedRequestReply(benchmark::State& state) {
    Router router;
    const std::string raw = R"({"jsonrpc":"2.0","id":18446744073709551615,"method":"ping"})";
    for (auto _ : state) {
        auto reply = router.handle_raw(raw);
        benchmark::DoNotOptimize(reply);
    }
}
BENCHMARK(BM_MalformedRequestReply);

static void BM_ParseErrorReply(benchmark::State& state) {
    Router router;
    const std::string raw = "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":";
    for (auto _ : state) {
        auto reply = router.handle_raw(raw);
        benchmark::DoNotOptimize(reply);
    }
}
BENCHMARK(BM_ParseErrorReply);

// ---- Schema validation ----

static void BM_ValidateArguments(benchmark::State& state) {
    JsonSchemaValidator validator;
    const auto schema = greet_schema();
    const nlohmann::json args = {{"name", "Ada"}, {"times", 3}, {"style", "polite"}, {"tags", {"x", "y"}}};
    for (auto _ : state) {
        auto issues = validator.validate(schema, args);
        benchmark::DoNotOptimize(issues);
    }
}
BENCHMARK(BM_ValidateArguments);

static void BM_ValidateArgumentsWithIssues(benchmark::State& state) {
    JsonSchemaValidator validator;
    const auto schema = greet_schema();
    const nlohmann::json args = {{"times", 40}, {"style", "rude"}, {"tags", {1, 2}}, {"extra", true}};
    for (auto _ : state) {
        auto issues = validator.validate(schema, args);
        benchmark::DoNotOptimize(issues);
    }
}
BENCHMARK(BM_ValidateArgumentsWithIssues);
