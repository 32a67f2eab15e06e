#include <gtest/gtest.h>
#include "mcphost/json_rpc.hpp"
#include "mcphost/error.hpp"

using namespace mcphost;

TEST(JsonRpcRequest, ConstructAndSerialize) {
    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "tools/list";
    req.params = nlohmann::json::object();

    nlohmann::json j;
    to_json(j, req);
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["id"], 1);
    EXPECT_EQ(j["method"], "tools/list");
    EXPECT_TRUE(j["params"].is_object());
}

TEST(JsonRpcResponse, ResultDefaultsToEmptyObject) {
    JsonRpcResponse resp;
    resp.id = RequestId{int64_t{3}};

    nlohmann::json j;
    to_json(j, resp);
    EXPECT_EQ(j["result"], nlohmann::json::object());
    EXPECT_FALSE(j.contains("error"));
}

TEST(JsonRpcResponse, WithError) {
    JsonRpcResponse resp;
    resp.id = RequestId{std::string("x")};
    resp.error = JsonRpcError{error::MethodNotFound, "Method not found", std::nullopt};

    nlohmann::json j;
    to_json(j, resp);
    EXPECT_EQ(j["id"], "x");
    EXPECT_EQ(j["error"]["code"], -32601);
    EXPECT_FALSE(j.contains("result"));
}

TEST(JsonRpcNotification, Serialize) {
    JsonRpcNotification notif;
    notif.method = "notifications/tools/list_changed";

    nlohmann::json j;
    to_json(j, notif);
    EXPECT_EQ(j["method"], "notifications/tools/list_changed");
    EXPECT_FALSE(j.contains("id"));
}

TEST(RequestId, FromJson) {
    RequestId id;
    from_json(nlohmann::json(5), id);
    EXPECT_EQ(std::get<int64_t>(id), 5);
    from_json(nlohmann::json("abc"), id);
    EXPECT_EQ(std::get<std::string>(id), "abc");
    from_json(nlohmann::json(nullptr), id);
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(id));
    EXPECT_THROW(from_json(nlohmann::json::array(), id), std::invalid_argument);
}

TEST(MakeError, CodeFollowsKind) {
    EXPECT_EQ(make_error(ErrorKind::NotInitialized, "x").code, error::NotInitialized);
    EXPECT_EQ(make_error(ErrorKind::SessionInvalid, "x").code, error::SessionInvalid);
    EXPECT_EQ(make_error(ErrorKind::ModuleCircularDependency, "x").code, error::ModuleCircularDependency);
    EXPECT_EQ(make_error(ErrorKind::UnknownMethod, "x").code, error::MethodNotFound);
}

TEST(MakeError, KindAlwaysInData) {
    auto e = make_error(ErrorKind::ToolNotFound, "missing", {{"tool", "a:b"}});
    ASSERT_TRUE(e.data.has_value());
    EXPECT_EQ((*e.data)["kind"], "tool-not-found");
    EXPECT_EQ((*e.data)["tool"], "a:b");
    EXPECT_EQ(error_kind_of(e), "tool-not-found");
}

TEST(MakeError, NonObjectDataIsWrapped) {
    auto e = make_error(ErrorKind::Internal, "boom", nlohmann::json("details"));
    EXPECT_EQ((*e.data)["detail"], "details");
    EXPECT_EQ((*e.data)["kind"], "internal-error");
}

TEST(ErrorKind, NamesAreKebabCase) {
    EXPECT_EQ(to_string(ErrorKind::ModuleMissingDependency), "module-missing-dependency");
    EXPECT_EQ(to_string(ErrorKind::ToolInvalidParameters), "tool-invalid-parameters");
    EXPECT_EQ(to_string(ErrorKind::OriginRejected), "origin-rejected");
}

TEST(JsonRpcError, NoKindWithoutData) {
    JsonRpcError e{-1, "plain", std::nullopt};
    EXPECT_FALSE(error_kind_of(e).has_value());
}
