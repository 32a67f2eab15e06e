#include "mcphost/modules/builtin.hpp"

namespace mcphost {
namespace modules {

std::string EchoService::echo(const std::string& message) {
    ++count_;
    return message;
}

namespace {

class EchoModule : public Module {
public:
    ModuleKind kind() const override { return ModuleKind::Stateful; }

    std::shared_ptr<ModuleInstance> start(ModuleContext& ctx) override {
        auto service = std::make_shared<EchoService>();

        ToolDefinition def;
        def.name = ctx.name() + ":echo";
        def.description = "Return the message unchanged";
        def.input_schema = {
            {"type", "object"},
            {"properties", {
                {"message", {{"type", "string"}, {"description", "Text to echo"}}}
            }},
            {"required", {"message"}}
        };

        // The handler holds the service so a call racing stop() still has it.
        ctx.tools().register_tool(std::move(def),
            [service](const nlohmann::json& args, const CancelToken&) {
                return CallToolResult::text(service->echo(args.at("message").get<std::string>()));
            });
        return service;
    }

    void stop(const std::shared_ptr<ModuleInstance>&) override {}

    ModuleHealth status(const std::shared_ptr<ModuleInstance>& instance) const override {
        auto service = std::dynamic_pointer_cast<EchoService>(instance);
        if (!service) return {HealthStatus::Stopped, nlohmann::json::object()};
        return {HealthStatus::Ok, {{"echoes", service->count()}}};
    }
};

} // anonymous namespace

std::unique_ptr<Module> make_echo_module() {
    return std::make_unique<EchoModule>();
}

} // namespace modules
} // namespace mcphost
