#include <gtest/gtest.h>
#include "mcphost/types.hpp"
#include <nlohmann/json.hpp>

using namespace mcphost;

// ---- Content ----

TEST(TextContent, Serialize) {
    TextContent tc;
    tc.text = "Hello, world!";

    nlohmann::json j;
    to_json(j, tc);
    EXPECT_EQ(j["type"], "text");
    EXPECT_EQ(j["text"], "Hello, world!");
}

// ---- ToolDefinition ----

TEST(ToolDefinition, OptionalFieldsOmitted) {
    ToolDefinition def;
    def.name = "math:add";

    nlohmann::json j;
    to_json(j, def);
    EXPECT_EQ(j["name"], "math:add");
    EXPECT_EQ(j["inputSchema"]["type"], "object");
    EXPECT_FALSE(j.contains("description"));
    EXPECT_FALSE(j.contains("outputSchema"));
}

TEST(ToolDefinition, FullRoundTrip) {
    ToolDefinition def;
    def.name = "hello:greet";
    def.title = "Greet";
    def.description = "Say hello";
    def.input_schema = {{"type", "object"},
                        {"properties", {{"name", {{"type", "string"}}}}},
                        {"required", {"name"}}};
    def.annotations = nlohmann::json{{"readOnlyHint", true}};

    nlohmann::json j;
    to_json(j, def);
    EXPECT_EQ(j.get<ToolDefinition>(), def);
}

TEST(ToolDefinition, MissingSchemaDefaultsToObject) {
    auto def = nlohmann::json{{"name", "a:b"}}.get<ToolDefinition>();
    EXPECT_EQ(def.input_schema, (nlohmann::json{{"type", "object"}}));
}

TEST(ToolDefinition, NonObjectSchemaRejected) {
    auto j = nlohmann::json{{"name", "a:b"}, {"inputSchema", "string"}};
    EXPECT_THROW(j.get<ToolDefinition>(), std::invalid_argument);
}

// ---- CallToolResult ----

TEST(CallToolResult, TextHelper) {
    auto r = CallToolResult::text("5");
    nlohmann::json j;
    to_json(j, r);
    ASSERT_EQ(j["content"].size(), 1u);
    EXPECT_EQ(j["content"][0]["text"], "5");
    EXPECT_FALSE(j.contains("isError"));
    EXPECT_FALSE(j.contains("structuredContent"));
}

TEST(CallToolResult, StructuredAndError) {
    CallToolResult r = CallToolResult::text("bad input");
    r.structured_content = nlohmann::json{{"result", 1}};
    r.is_error = true;

    nlohmann::json j;
    to_json(j, r);
    EXPECT_EQ(j["isError"], true);
    EXPECT_EQ(j["structuredContent"]["result"], 1);
    EXPECT_EQ(j["content"][0], (nlohmann::json{{"type", "text"}, {"text", "bad input"}}));
}

// ---- Handshake ----

TEST(InitializeParams, Lenient) {
    auto p = nlohmann::json{{"protocolVersion", "2025-06-18"},
                            {"clientInfo", {{"name", "cli"}}}}.get<InitializeParams>();
    EXPECT_EQ(p.protocol_version, "2025-06-18");
    EXPECT_EQ(p.client_info.name, "cli");
    EXPECT_EQ(p.client_info.version, "");
    EXPECT_TRUE(p.capabilities.is_object());
}

TEST(InitializeResult, Serialize) {
    InitializeResult r;
    r.protocol_version = "2025-06-18";
    r.capabilities.tools = nlohmann::json{{"listChanged", true}};
    r.server_info = Implementation{"mcphost", std::nullopt, "0.3.0"};
    r.instructions = "Use namespaced tools";

    nlohmann::json j;
    to_json(j, r);
    EXPECT_EQ(j["serverInfo"]["name"], "mcphost");
    EXPECT_EQ(j["capabilities"]["tools"]["listChanged"], true);
    EXPECT_EQ(j["capabilities"].size(), 1u);
    EXPECT_EQ(j["instructions"], "Use namespaced tools");
    EXPECT_FALSE(j["serverInfo"].contains("title"));
}

// ---- LogLevel ----

TEST(LogLevel, Names) {
    EXPECT_EQ(log_level_to_string(LogLevel::Warning), "warning");
    EXPECT_EQ(log_level_from_string("debug"), LogLevel::Debug);
    EXPECT_THROW(log_level_from_string("verbose"), std::invalid_argument);
}
