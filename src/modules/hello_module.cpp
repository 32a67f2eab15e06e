#include "mcphost/modules/builtin.hpp"
#include "mcphost/error.hpp"

namespace mcphost {
namespace modules {

namespace {

class HelloState : public ModuleInstance {
public:
    HelloState(std::string greeting, std::shared_ptr<EchoService> echo)
        : greeting_(std::move(greeting)), echo_(std::move(echo)) {}

    std::string greet(const std::string& name) {
        ++greetings_;
        std::string text = greeting_ + ", " + name + "!";
        return echo_ ? echo_->echo(text) : text;
    }

    uint64_t greetings() const { return greetings_.load(); }
    bool uses_echo() const { return echo_ != nullptr; }

    void close() { closed_ = true; }
    bool closed() const { return closed_.load(); }

private:
    const std::string greeting_;
    const std::shared_ptr<EchoService> echo_;
    std::atomic<uint64_t> greetings_{0};
    std::atomic<bool> closed_{false};
};

class HelloModule : public Module {
public:
    ModuleKind kind() const override { return ModuleKind::Stateful; }

    std::shared_ptr<ModuleInstance> start(ModuleContext& ctx) override {
        const auto& config = ctx.config();
        std::string greeting = "Hello";
        if (config.contains("greeting")) {
            if (!config.at("greeting").is_string()) {
                throw ConfigError("hello: 'greeting' must be a string");
            }
            greeting = config.at("greeting").get<std::string>();
        }

        auto echo = std::dynamic_pointer_cast<EchoService>(ctx.dependency("echo"));
        if (!echo) {
            ctx.telemetry().event(LogLevel::Info, "hello.echo_unavailable", {{"module", ctx.name()}});
        }
        auto state = std::make_shared<HelloState>(std::move(greeting), std::move(echo));

        ToolDefinition def;
        def.name = ctx.name() + ":greet";
        def.description = "Greet someone by name";
        def.input_schema = {
            {"type", "object"},
            {"properties", {
                {"name", {{"type", "string"}, {"minLength", 1}}}
            }},
            {"required", {"name"}}
        };
        ctx.tools().register_tool(std::move(def),
            [state](const nlohmann::json& args, const CancelToken&) {
                auto result = CallToolResult::text(state->greet(args.at("name").get<std::string>()));
                result.structured_content = nlohmann::json{{"greetings", state->greetings()}};
                return result;
            });
        return state;
    }

    void stop(const std::shared_ptr<ModuleInstance>& instance) override {
        if (auto state = std::dynamic_pointer_cast<HelloState>(instance)) state->close();
    }

    ModuleHealth status(const std::shared_ptr<ModuleInstance>& instance) const override {
        auto state = std::dynamic_pointer_cast<HelloState>(instance);
        if (!state || state->closed()) return {HealthStatus::Stopped, nlohmann::json::object()};
        return {HealthStatus::Ok, {{"greetings", state->greetings()}, {"echo", state->uses_echo()}}};
    }
};

} // anonymous namespace

std::unique_ptr<Module> make_hello_module() {
    return std::make_unique<HelloModule>();
}

} // namespace modules
} // namespace mcphost
