#pragma once
#include "../telemetry.hpp"
#include "../tool_registry.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcphost {

enum class ModuleKind { Stateless, Stateful };

enum class HealthStatus { Ok, Degraded, Error, Stopped };

std::string to_string(HealthStatus status);

struct ModuleHealth {
    HealthStatus status = HealthStatus::Ok;
    nlohmann::json detail = nlohmann::json::object();
};

void to_json(nlohmann::json& j, const ModuleHealth& h);

/// Live state returned by a stateful module's start(). The loader only
/// stores it and hands it back to stop() and status(), or to dependents.
class ModuleInstance {
public:
    virtual ~ModuleInstance() = default;
};

/// Everything a module sees while starting.
class ModuleContext {
public:
    using Dependencies = std::map<std::string, std::shared_ptr<ModuleInstance>>;

    ModuleContext(std::string name, nlohmann::json config, Dependencies dependencies,
                  IToolRegistrar& tools, ITelemetrySink& telemetry)
        : name_(std::move(name)), config_(std::move(config))
        , dependencies_(std::move(dependencies)), tools_(tools), telemetry_(telemetry) {}

    const std::string& name() const { return name_; }
    const nlohmann::json& config() const { return config_; }

    /// Instance of a declared dependency. Null for an absent optional
    /// dependency and for stateless dependencies.
    std::shared_ptr<ModuleInstance> dependency(const std::string& name) const {
        auto it = dependencies_.find(name);
        return it == dependencies_.end() ? nullptr : it->second;
    }

    bool has_dependency(const std::string& name) const {
        return dependencies_.count(name) > 0;
    }

    /// Tools registered here are owned by this module and go away on stop.
    IToolRegistrar& tools() { return tools_; }
    ITelemetrySink& telemetry() { return telemetry_; }

private:
    std::string name_;
    nlohmann::json config_;
    Dependencies dependencies_;
    IToolRegistrar& tools_;
    ITelemetrySink& telemetry_;
};

/// Lifecycle contract every module implements.
class Module {
public:
    virtual ~Module() = default;

    [[nodiscard]] virtual ModuleKind kind() const = 0;

    /// Register tools and build state. Stateless modules return null.
    /// Throwing marks the module failed.
    virtual std::shared_ptr<ModuleInstance> start(ModuleContext& ctx) = 0;

    virtual void stop(const std::shared_ptr<ModuleInstance>& instance) = 0;

    [[nodiscard]] virtual ModuleHealth status(const std::shared_ptr<ModuleInstance>& instance) const = 0;
};

/// Base for modules that only contribute tools.
class StatelessModule : public Module {
public:
    ModuleKind kind() const override { return ModuleKind::Stateless; }

    std::shared_ptr<ModuleInstance> start(ModuleContext& ctx) override {
        register_tools(ctx);
        return nullptr;
    }

    void stop(const std::shared_ptr<ModuleInstance>&) override {}

    ModuleHealth status(const std::shared_ptr<ModuleInstance>&) const override {
        return {};
    }

protected:
    virtual void register_tools(ModuleContext& ctx) = 0;
};

using ModuleFactory = std::function<std::unique_ptr<Module>()>;

/// Statically linked modules, looked up by the id in a "builtin:<id>" entry.
class ModuleCatalog {
public:
    /// Replaces any factory already registered under `id`.
    void add(const std::string& id, ModuleFactory factory);

    [[nodiscard]] bool contains(const std::string& id) const;
    [[nodiscard]] std::vector<std::string> ids() const;

    /// Throws PluginLoadError for unknown ids or a factory returning null.
    [[nodiscard]] std::unique_ptr<Module> create(const std::string& id) const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, ModuleFactory> factories_;
};

// ---- Shared-library module ABI ----

/// Symbols a shared-library module exports with C linkage:
///   int            mcphost_module_abi_version();
///   mcphost::Module* mcphost_module_create();
///   void           mcphost_module_destroy(mcphost::Module*);
constexpr const char* kModuleAbiVersionSymbol = "mcphost_module_abi_version";
constexpr const char* kModuleCreateSymbol     = "mcphost_module_create";
constexpr const char* kModuleDestroySymbol    = "mcphost_module_destroy";

using ModuleAbiVersionFn = int (*)();
using ModuleCreateFn     = Module* (*)();
using ModuleDestroyFn    = void (*)(Module*);

} // namespace mcphost
