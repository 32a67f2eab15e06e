#include <gtest/gtest.h>
#include "mcphost/tool_registry.hpp"
#include "mcphost/error.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace mcphost;

namespace {

ToolDefinition make_tool(const std::string& name, nlohmann::json schema = {{"type", "object"}}) {
    ToolDefinition def;
    def.name = name;
    def.input_schema = std::move(schema);
    return def;
}

ToolHandler text_handler(const std::string& text) {
    return [text](const nlohmann::json&, const CancelToken&) {
        return CallToolResult::text(text);
    };
}

const JsonRpcError& as_error(const HandlerResult& r) {
    return std::get<JsonRpcError>(r);
}

} // anonymous namespace

TEST(ToolRegistry, RegisterAndList) {
    ToolRegistry registry;
    registry.register_tool(make_tool("math:add"), text_handler("ok"));
    registry.register_tool(make_tool("echo:echo"), text_handler("ok"));

    EXPECT_EQ(registry.size(), 2u);
    auto names = registry.names();
    EXPECT_EQ(names, (std::vector<std::string>{"echo:echo", "math:add"}));
    EXPECT_EQ(registry.owner_of("math:add"), "math");
    ASSERT_TRUE(registry.get("echo:echo").has_value());
    EXPECT_FALSE(registry.get("echo:nope").has_value());
}

TEST(ToolRegistry, RejectsUnnamespacedNames) {
    ToolRegistry registry;
    EXPECT_THROW(registry.register_tool(make_tool("add"), text_handler("x")), InvalidToolNameError);
    EXPECT_THROW(registry.register_tool(make_tool(":add"), text_handler("x")), InvalidToolNameError);
    EXPECT_THROW(registry.register_tool(make_tool("math:"), text_handler("x")), InvalidToolNameError);
    EXPECT_THROW(registry.register_tool(make_tool("math: add"), text_handler("x")), InvalidToolNameError);
    EXPECT_EQ(registry.size(), 0u);
}

TEST(ToolRegistry, RejectsMissingHandler) {
    ToolRegistry registry;
    EXPECT_THROW(registry.register_tool(make_tool("a:b"), ToolHandler{}), ToolRegistrationError);
}

TEST(ToolRegistry, CollisionNamesExistingOwner) {
    ToolRegistry registry;
    ToolEntry first;
    first.definition = make_tool("shared:run");
    first.handler = text_handler("first");
    first.owner = "alpha";
    registry.register_tool(std::move(first));

    ToolEntry second;
    second.definition = make_tool("shared:run");
    second.handler = text_handler("second");
    second.owner = "beta";
    try {
        registry.register_tool(std::move(second));
        FAIL() << "expected ToolCollisionError";
    } catch (const ToolCollisionError& e) {
        EXPECT_EQ(e.tool, "shared:run");
        EXPECT_EQ(e.existing_owner, "alpha");
        EXPECT_NE(std::string(e.what()).find("alpha"), std::string::npos);
    }

    // The first registration is untouched.
    auto result = registry.call("shared:run", nlohmann::json::object());
    ASSERT_TRUE(std::holds_alternative<nlohmann::json>(result));
    EXPECT_EQ(std::get<nlohmann::json>(result)["content"][0]["text"], "first");
}

TEST(ToolRegistry, OverrideReplacesHandler) {
    ToolRegistry registry;
    registry.register_tool(make_tool("a:b"), text_handler("old"));
    registry.register_tool(make_tool("a:b"), text_handler("new"), true);

    auto result = registry.call("a:b", nlohmann::json::object());
    EXPECT_EQ(std::get<nlohmann::json>(result)["content"][0]["text"], "new");
    EXPECT_EQ(registry.size(), 1u);
}

TEST(ToolRegistry, UnregisterAndOwnerSweep) {
    ToolRegistry registry;
    registry.register_tool(make_tool("m:one"), text_handler("1"));
    registry.register_tool(make_tool("m:two"), text_handler("2"));
    registry.register_tool(make_tool("n:three"), text_handler("3"));

    EXPECT_TRUE(registry.unregister_tool("m:one"));
    EXPECT_FALSE(registry.unregister_tool("m:one"));
    EXPECT_EQ(registry.names_owned_by("m"), std::vector<std::string>{"m:two"});

    EXPECT_EQ(registry.unregister_owner("m"), 1u);
    EXPECT_EQ(registry.unregister_owner("m"), 0u);
    EXPECT_EQ(registry.names(), std::vector<std::string>{"n:three"});
}

TEST(ToolRegistry, ChangeListenerFiresOnMutation) {
    ToolRegistry registry;
    int changes = 0;
    registry.set_change_listener([&] { ++changes; });

    registry.register_tool(make_tool("a:b"), text_handler("x"));
    registry.unregister_tool("a:b");
    registry.unregister_tool("a:b");  // no-op
    registry.unregister_owner("a");   // no-op
    EXPECT_EQ(changes, 2);
}

TEST(ToolRegistry, CallUnknownListsAvailable) {
    ToolRegistry registry;
    registry.register_tool(make_tool("math:add"), text_handler("x"));

    auto result = registry.call("math:divide", nlohmann::json::object());
    ASSERT_TRUE(std::holds_alternative<JsonRpcError>(result));
    const auto& err = as_error(result);
    EXPECT_EQ(err.code, error::ToolNotFound);
    EXPECT_EQ((*err.data)["kind"], "tool-not-found");
    EXPECT_EQ((*err.data)["tool"], "math:divide");
    EXPECT_EQ((*err.data)["available"], nlohmann::json::array({"math:add"}));
}

TEST(ToolRegistry, InvalidArgumentsNeverReachHandler) {
    ToolRegistry registry;
    std::atomic<int> calls{0};
    nlohmann::json schema = {
        {"type", "object"},
        {"properties", {{"a", {{"type", "number"}}}, {"b", {{"type", "number"}}}}},
        {"required", {"a", "b"}}
    };
    registry.register_tool(make_tool("math:add", schema),
                           [&calls](const nlohmann::json&, const CancelToken&) {
                               ++calls;
                               return CallToolResult::text("x");
                           });

    auto result = registry.call("math:add", {{"a", 2}});
    ASSERT_TRUE(std::holds_alternative<JsonRpcError>(result));
    const auto& err = as_error(result);
    EXPECT_EQ(err.code, error::InvalidToolParams);
    EXPECT_EQ(err.message, "Invalid arguments for tool math:add: required property 'b' is missing");
    EXPECT_EQ((*err.data)["missing"], nlohmann::json::array({"b"}));
    EXPECT_EQ((*err.data)["errors"][0]["path"], "b");
    EXPECT_EQ((*err.data)["schema"], schema);
    EXPECT_EQ(calls.load(), 0);
}

TEST(ToolRegistry, HandlerExceptionBecomesExecutionFailure) {
    ToolRegistry registry;
    registry.register_tool(make_tool("fs:read"),
                           [](const nlohmann::json&, const CancelToken&) -> CallToolResult {
                               try {
                                   throw std::runtime_error("disk unplugged");
                               } catch (...) {
                                   std::throw_with_nested(std::runtime_error("read failed"));
                               }
                           });

    auto result = registry.call("fs:read", nlohmann::json::object());
    ASSERT_TRUE(std::holds_alternative<JsonRpcError>(result));
    const auto& err = as_error(result);
    EXPECT_EQ(err.code, error::ToolExecutionFailed);
    EXPECT_EQ((*err.data)["cause"], "read failed");
    ASSERT_EQ((*err.data)["trace"].size(), 2u);
    EXPECT_EQ((*err.data)["trace"][1], "disk unplugged");
}

TEST(ToolRegistry, TimeoutAbandonsWaitAndCancels) {
    ToolRegistry registry;
    auto observed_cancel = std::make_shared<std::atomic<bool>>(false);
    registry.register_tool(make_tool("slow:op"),
                           [observed_cancel](const nlohmann::json&, const CancelToken& cancel) {
                               auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
                               while (!cancel.cancelled() && std::chrono::steady_clock::now() < deadline) {
                                   std::this_thread::sleep_for(std::chrono::milliseconds(5));
                               }
                               observed_cancel->store(cancel.cancelled());
                               return CallToolResult::text("late");
                           });

    auto start = std::chrono::steady_clock::now();
    auto result = registry.call("slow:op", nlohmann::json::object(), std::chrono::milliseconds(50));
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(std::holds_alternative<JsonRpcError>(result));
    EXPECT_EQ(as_error(result).code, error::ToolTimeout);
    EXPECT_EQ((*as_error(result).data)["timeout_ms"], 50);
    EXPECT_LT(elapsed, std::chrono::seconds(2));

    for (int i = 0; i < 200 && !observed_cancel->load(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_TRUE(observed_cancel->load());
}

TEST(ToolRegistry, SuccessfulCallSerializesResult) {
    ToolRegistry registry;
    registry.register_tool(make_tool("echo:echo"),
                           [](const nlohmann::json& args, const CancelToken&) {
                               auto r = CallToolResult::text(args.at("message").get<std::string>());
                               r.structured_content = nlohmann::json{{"echo", args.at("message")}};
                               return r;
                           });
    auto result = registry.call("echo:echo", {{"message", "hi"}});
    ASSERT_TRUE(std::holds_alternative<nlohmann::json>(result));
    auto j = std::get<nlohmann::json>(result);
    EXPECT_EQ(j["content"][0]["text"], "hi");
    EXPECT_EQ(j["structuredContent"]["echo"], "hi");
}

TEST(ToolRegistry, ConcurrentReadersSeeConsistentSnapshots) {
    ToolRegistry registry;
    registry.register_tool(make_tool("base:tool"), text_handler("x"));

    std::atomic<bool> stop{false};
    std::atomic<int> failures{0};
    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&] {
            while (!stop.load()) {
                auto list = registry.list();
                if (list.empty()) ++failures;
                auto r = registry.call("base:tool", nlohmann::json::object());
                if (!std::holds_alternative<nlohmann::json>(r)) ++failures;
            }
        });
    }

    for (int i = 0; i < 200; ++i) {
        std::string name = "dyn:t" + std::to_string(i);
        registry.register_tool(make_tool(name), text_handler("y"));
        registry.unregister_tool(name);
    }
    stop = true;
    for (auto& t : readers) t.join();

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(registry.size(), 1u);
}
