#include "mcphost/modules/builtin.hpp"
#include <functional>

namespace mcphost {
namespace modules {

namespace {

const nlohmann::json kOperandsSchema = {
    {"type", "object"},
    {"properties", {
        {"a", {{"type", "number"}, {"description", "Left operand"}}},
        {"b", {{"type", "number"}, {"description", "Right operand"}}}
    }},
    {"required", {"a", "b"}},
    {"additionalProperties", false}
};

/// Integer operands stay integers so 2 + 3 prints as "5".
CallToolResult arithmetic(const nlohmann::json& args,
                          const std::function<int64_t(int64_t, int64_t)>& on_int,
                          const std::function<double(double, double)>& on_double) {
    const auto& a = args.at("a");
    const auto& b = args.at("b");
    nlohmann::json value;
    if (a.is_number_integer() && b.is_number_integer()) {
        value = on_int(a.get<int64_t>(), b.get<int64_t>());
    } else {
        value = on_double(a.get<double>(), b.get<double>());
    }
    auto result = CallToolResult::text(value.dump());
    result.structured_content = nlohmann::json{{"result", value}};
    return result;
}

class MathModule : public StatelessModule {
protected:
    void register_tools(ModuleContext& ctx) override {
        add(ctx, "add", "Add two numbers",
            [](int64_t x, int64_t y) { return x + y; },
            [](double x, double y) { return x + y; });
        add(ctx, "subtract", "Subtract b from a",
            [](int64_t x, int64_t y) { return x - y; },
            [](double x, double y) { return x - y; });
        add(ctx, "multiply", "Multiply two numbers",
            [](int64_t x, int64_t y) { return x * y; },
            [](double x, double y) { return x * y; });
    }

private:
    static void add(ModuleContext& ctx, const std::string& op, const std::string& description,
                    std::function<int64_t(int64_t, int64_t)> on_int,
                    std::function<double(double, double)> on_double) {
        ToolDefinition def;
        def.name = ctx.name() + ":" + op;
        def.description = description;
        def.input_schema = kOperandsSchema;
        def.annotations = nlohmann::json{{"readOnlyHint", true}, {"idempotentHint", true}};
        ctx.tools().register_tool(std::move(def),
            [on_int, on_double](const nlohmann::json& args, const CancelToken&) {
                return arithmetic(args, on_int, on_double);
            });
    }
};

} // anonymous namespace

std::unique_ptr<Module> make_math_module() {
    return std::make_unique<MathModule>();
}

} // namespace modules
} // namespace mcphost
