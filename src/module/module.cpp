#include "mcphost/module/module.hpp"
#include "mcphost/error.hpp"

namespace mcphost {

std::string to_string(HealthStatus status) {
    switch (status) {
        case HealthStatus::Ok:       return "ok";
        case HealthStatus::Degraded: return "degraded";
        case HealthStatus::Error:    return "error";
        case HealthStatus::Stopped:  return "stopped";
    }
    return "error";
}

void to_json(nlohmann::json& j, const ModuleHealth& h) {
    j = {{"status", to_string(h.status)}, {"detail", h.detail}};
}

void ModuleCatalog::add(const std::string& id, ModuleFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    factories_[id] = std::move(factory);
}

bool ModuleCatalog::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return factories_.count(id) > 0;
}

std::vector<std::string> ModuleCatalog::ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    for (const auto& [id, factory] : factories_) out.push_back(id);
    return out;
}

std::unique_ptr<Module> ModuleCatalog::create(const std::string& id) const {
    ModuleFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = factories_.find(id);
        if (it == factories_.end()) {
            throw PluginLoadError("No builtin module '" + id + "'");
        }
        factory = it->second;
    }
    auto module = factory();
    if (!module) {
        throw PluginLoadError("Builtin module factory '" + id + "' returned null");
    }
    return module;
}

} // namespace mcphost
