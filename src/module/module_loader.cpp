#include "mcphost/module/module_loader.hpp"
#include "mcphost/module/shared_library.hpp"
#include "mcphost/error.hpp"
#include "mcphost/timed_call.hpp"
#include "mcphost/version.hpp"
#include <algorithm>
#include <chrono>
#include <set>

namespace mcphost {

namespace {

using Clock = std::chrono::steady_clock;

double elapsed_ms(Clock::time_point since) {
    return std::chrono::duration<double, std::milli>(Clock::now() - since).count();
}

bool is_live(ModuleState s) {
    return s == ModuleState::Running || s == ModuleState::Degraded;
}

std::string describe_exception(const std::exception_ptr& error) {
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "non-standard exception";
    }
}

} // anonymous namespace

std::string to_string(ModuleState state) {
    switch (state) {
        case ModuleState::Stopped:  return "stopped";
        case ModuleState::Starting: return "starting";
        case ModuleState::Running:  return "running";
        case ModuleState::Degraded: return "degraded";
        case ModuleState::Failed:   return "failed";
        case ModuleState::Stopping: return "stopping";
    }
    return "failed";
}

void to_json(nlohmann::json& j, const ModuleStatus& s) {
    j = {
        {"name", s.name},
        {"version", s.version},
        {"description", s.description},
        {"state", to_string(s.state)},
        {"health", s.health},
        {"tools", s.tools}
    };
    if (s.last_error) j["last_error"] = *s.last_error;
}

std::vector<std::string> LoadReport::missing_required(const std::vector<std::string>& required) const {
    std::vector<std::string> out;
    for (const auto& name : required) {
        if (std::find(succeeded.begin(), succeeded.end(), name) == succeeded.end()) {
            out.push_back(name);
        }
    }
    return out;
}

void LoadReport::merge(LoadReport other) {
    for (auto& s : other.succeeded) succeeded.push_back(std::move(s));
    for (auto& f : other.failed) failed.push_back(std::move(f));
}

void to_json(nlohmann::json& j, const LoadReport& r) {
    j = {{"succeeded", r.succeeded}, {"failed", r.failed}};
}

void to_json(nlohmann::json& j, const LoaderMetrics& m) {
    j = {
        {"starts", m.starts},
        {"stops", m.stops},
        {"last_start_ms", m.last_start_ms},
        {"last_stop_ms", m.last_stop_ms},
        {"module_start_ms", m.module_start_ms},
        {"module_stop_ms", m.module_stop_ms},
        {"resolver", {
            {"resolutions", m.resolutions},
            {"cycles_detected", m.cycles_detected},
            {"last_resolution_ms", m.last_resolution_ms}
        }}
    };
}

// ---------- internals ----------

struct ModuleLoader::Record {
    ModuleManifest manifest;
    std::shared_ptr<Module> module;             // null until the entry resolves
    std::shared_ptr<const void> library;        // set for shared-library modules
    std::shared_ptr<ModuleInstance> instance;
    std::shared_ptr<ScopedRegistrar> registrar;
    ModuleState state = ModuleState::Stopped;
    std::optional<nlohmann::json> config;       // fixed at first start, reused on reload
    std::optional<std::string> last_error;
};

/// Registrar handed to one start() call. Stamps the module as owner and
/// stops accepting registrations once revoked.
class ModuleLoader::ScopedRegistrar : public IToolRegistrar {
public:
    ScopedRegistrar(std::shared_ptr<ToolRegistry> registry, std::string owner,
                    std::shared_ptr<const void> keepalive)
        : registry_(std::move(registry)), owner_(std::move(owner))
        , keepalive_(std::move(keepalive)) {}

    void register_tool(ToolDefinition def, ToolHandler handler, bool override_existing) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (revoked_) {
            throw ToolRegistrationError(
                "Module '" + owner_ + "' may no longer register tools", def.name);
        }
        ToolEntry entry;
        entry.definition = std::move(def);
        entry.handler = std::move(handler);
        entry.owner = owner_;
        entry.keepalive = keepalive_;
        registry_->register_tool(std::move(entry), override_existing);
    }

    bool unregister_tool(const std::string& name) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (registry_->owner_of(name) != owner_) return false;
        return registry_->unregister_tool(name);
    }

    /// After this returns no further tool can appear under this owner.
    void revoke() {
        std::lock_guard<std::mutex> lock(mutex_);
        revoked_ = true;
    }

private:
    std::shared_ptr<ToolRegistry> registry_;
    std::string owner_;
    std::shared_ptr<const void> keepalive_;
    std::mutex mutex_;
    bool revoked_ = false;
};

ModuleLoader::ModuleLoader(std::shared_ptr<ToolRegistry> registry,
                           std::shared_ptr<const ModuleCatalog> catalog,
                           Options opts,
                           ConfigProvider config,
                           std::shared_ptr<ITelemetrySink> telemetry)
    : registry_(std::move(registry))
    , catalog_(catalog ? std::move(catalog) : std::make_shared<const ModuleCatalog>())
    , opts_(opts)
    , config_(config ? std::move(config)
                     : ConfigProvider([](const ModuleManifest& m) { return m.defaults; }))
    , telemetry_(telemetry ? std::move(telemetry) : null_telemetry()) {
    if (!registry_) {
        throw McpError("ModuleLoader requires a tool registry");
    }
}

ModuleLoader::~ModuleLoader() {
    stop_all();
}

void ModuleLoader::set_state(const std::string& name, ModuleState state,
                             std::optional<std::string> error) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = records_.find(name);
    if (it == records_.end()) return;
    it->second->state = state;
    if (error) it->second->last_error = std::move(error);
}

DependencyGraph ModuleLoader::graph_locked() const {
    DependencyGraph graph;
    std::lock_guard<std::mutex> lock(state_mutex_);
    for (const auto& [name, rec] : records_) {
        if (!rec->module) continue;
        graph.add({name, rec->manifest.required, rec->manifest.optional,
                   rec->manifest.load_order});
    }
    return graph;
}

std::optional<ModuleFailure> ModuleLoader::resolve_code(Record& rec) {
    const auto& m = rec.manifest;
    std::shared_ptr<Module> module;
    std::shared_ptr<const void> library;

    try {
        auto ref = parse_entry(m.entry);
        if (ref.kind == EntryRef::Kind::Builtin) {
            module = catalog_->create(ref.target);
        } else {
            auto lib = SharedLibrary::open(resolve_library_path(m, ref));

            auto abi = reinterpret_cast<ModuleAbiVersionFn>(lib->symbol(kModuleAbiVersionSymbol));
            if (!abi) {
                throw PluginLoadError(std::string("missing symbol ") + kModuleAbiVersionSymbol);
            }
            if (abi() != MODULE_ABI_VERSION) {
                throw PluginLoadError("module ABI version " + std::to_string(abi()) +
                                      " does not match host version " +
                                      std::to_string(MODULE_ABI_VERSION));
            }
            auto create = reinterpret_cast<ModuleCreateFn>(lib->symbol(kModuleCreateSymbol));
            auto destroy = reinterpret_cast<ModuleDestroyFn>(lib->symbol(kModuleDestroySymbol));
            if (!create || !destroy) {
                throw PluginLoadError(std::string("missing symbol ") +
                                      (create ? kModuleDestroySymbol : kModuleCreateSymbol));
            }
            Module* raw = create();
            if (!raw) throw PluginLoadError("module factory returned null");
            // The deleter keeps the library mapped until the object is gone.
            module = std::shared_ptr<Module>(raw, [lib, destroy](Module* p) { destroy(p); });
            library = lib;
        }
    } catch (const std::exception& e) {
        telemetry_->event(LogLevel::Error, "module.load_failed",
                          {{"module", m.name}, {"entry", m.entry}, {"error", e.what()}});
        return ModuleFailure{m.name, ErrorKind::ModuleLoadFailure,
                             "Cannot load module '" + m.name + "': " + e.what(),
                             {{"module", m.name}, {"entry", m.entry}}};
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    rec.module = std::move(module);
    rec.library = std::move(library);
    return std::nullopt;
}

std::optional<ModuleFailure> ModuleLoader::start_locked(const std::string& name) {
    std::shared_ptr<Record> rec;
    ModuleContext::Dependencies deps;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        auto it = records_.find(name);
        if (it == records_.end()) {
            return ModuleFailure{name, ErrorKind::ModuleLoadFailure,
                                 "Unknown module '" + name + "'", {{"module", name}}};
        }
        rec = it->second;
        if (is_live(rec->state)) return std::nullopt;
        if (!rec->module) {
            return ModuleFailure{name, ErrorKind::ModuleLoadFailure,
                                 "Module '" + name + "' has no loaded code", {{"module", name}}};
        }

        for (const auto& dep : rec->manifest.required) {
            auto d = records_.find(dep);
            if (d == records_.end() || !is_live(d->second->state)) {
                rec->state = ModuleState::Failed;
                rec->last_error = "required dependency '" + dep + "' is not running";
                return ModuleFailure{
                    name, ErrorKind::ModuleMissingDependency,
                    "Module '" + name + "' requires '" + dep + "', which is not running",
                    {{"module", name}, {"dependency", dep}}};
            }
            deps[dep] = d->second->instance;
        }
        for (const auto& dep : rec->manifest.optional) {
            auto d = records_.find(dep);
            if (d != records_.end() && is_live(d->second->state)) {
                deps[dep] = d->second->instance;
            } else {
                deps[dep] = nullptr;
            }
        }
        rec->state = ModuleState::Starting;
    }

    for (const auto& dep : rec->manifest.optional) {
        if (!deps[dep]) {
            telemetry_->event(LogLevel::Debug, "module.optional_dependency_absent",
                              {{"module", name}, {"dependency", dep}});
        }
    }

    if (!rec->config) {
        try {
            rec->config = config_(rec->manifest);
        } catch (const std::exception& e) {
            set_state(name, ModuleState::Failed, std::string("configuration: ") + e.what());
            return ModuleFailure{name, ErrorKind::ModuleStartFailure,
                                 "Cannot configure module '" + name + "': " + e.what(),
                                 {{"module", name}}};
        }
    }

    const auto started_at = Clock::now();
    auto registrar = std::make_shared<ScopedRegistrar>(registry_, name, rec->library);
    auto ctx = std::make_shared<ModuleContext>(name, *rec->config, std::move(deps),
                                               *registrar, *telemetry_);
    auto module = rec->module;
    auto telemetry = telemetry_;
    auto result = run_with_timeout<std::shared_ptr<ModuleInstance>>(
        [module, ctx, registrar, telemetry]() { return module->start(*ctx); },
        opts_.start_timeout);

    if (!result.ok()) {
        registrar->revoke();
        registry_->unregister_owner(name);

        std::string why = result.timed_out
            ? "start timed out after " + std::to_string(opts_.start_timeout.count()) + "ms"
            : describe_exception(result.error);
        set_state(name, ModuleState::Failed, why);
        telemetry_->event(LogLevel::Error,
                          result.timed_out ? "module.start_timeout" : "module.start_failed",
                          {{"module", name}, {"error", why}});

        nlohmann::json detail = {{"module", name}, {"cause", why}};
        if (result.timed_out) detail["timeout_ms"] = opts_.start_timeout.count();
        return ModuleFailure{name, ErrorKind::ModuleStartFailure,
                             "Module '" + name + "' failed to start: " + why, std::move(detail)};
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        rec->instance = std::move(*result.value);
        rec->registrar = registrar;
        rec->state = ModuleState::Running;
        rec->last_error.reset();
        start_order_.push_back(name);
        metrics_.module_start_ms[name] = elapsed_ms(started_at);
    }
    telemetry_->event(LogLevel::Info, "module.started",
                      {{"module", name}, {"version", rec->manifest.version},
                       {"tools", registry_->names_owned_by(name)}});
    return std::nullopt;
}

std::optional<ModuleFailure> ModuleLoader::stop_locked(const std::string& name) {
    std::shared_ptr<Record> rec;
    ModuleState prior;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        auto it = records_.find(name);
        if (it == records_.end()) {
            return ModuleFailure{name, ErrorKind::ModuleLoadFailure,
                                 "Unknown module '" + name + "'", {{"module", name}}};
        }
        rec = it->second;
        prior = rec->state;
        if (prior == ModuleState::Stopped) return std::nullopt;
        rec->state = is_live(prior) ? ModuleState::Stopping : ModuleState::Stopped;
    }

    const auto stopping_at = Clock::now();
    TimedResult<bool> result;
    result.value = true;
    if (is_live(prior)) {
        auto module = rec->module;
        auto instance = rec->instance;
        result = run_with_timeout<bool>(
            [module, instance]() { module->stop(instance); return true; },
            opts_.stop_timeout);
    }

    std::shared_ptr<ScopedRegistrar> registrar;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        registrar = std::move(rec->registrar);
        rec->instance.reset();
        rec->state = ModuleState::Stopped;
        start_order_.erase(std::remove(start_order_.begin(), start_order_.end(), name),
                           start_order_.end());
        if (is_live(prior)) metrics_.module_stop_ms[name] = elapsed_ms(stopping_at);
    }
    if (registrar) registrar->revoke();
    registry_->unregister_owner(name);

    if (result.timed_out) {
        std::string why = "stop timed out after " + std::to_string(opts_.stop_timeout.count()) + "ms";
        set_state(name, ModuleState::Stopped, why);
        telemetry_->event(LogLevel::Error, "module.stop_timeout", {{"module", name}, {"error", why}});
        return ModuleFailure{name, ErrorKind::ModuleStopTimeout,
                             "Module '" + name + "' " + why,
                             {{"module", name}, {"timeout_ms", opts_.stop_timeout.count()}}};
    }
    if (result.error) {
        std::string why = describe_exception(result.error);
        set_state(name, ModuleState::Stopped, "stop failed: " + why);
        telemetry_->event(LogLevel::Error, "module.stop_failed", {{"module", name}, {"error", why}});
        return ModuleFailure{name, ErrorKind::Internal,
                             "Module '" + name + "' failed to stop cleanly: " + why,
                             {{"module", name}, {"cause", why}}};
    }
    telemetry_->event(LogLevel::Info, "module.stopped", {{"module", name}});
    return std::nullopt;
}

// ---------- public operations ----------

LoadReport ModuleLoader::load_directory(const std::filesystem::path& dir,
                                        const std::vector<std::string>& enabled) {
    LoadReport report;
    std::vector<ModuleManifest> manifests;

    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        report.failed.push_back({dir.string(), ErrorKind::ModuleLoadFailure,
                                 "Modules directory not found: " + dir.string(),
                                 {{"path", dir.string()}}});
        return report;
    }

    std::vector<std::filesystem::path> candidates;
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        if (entry.is_directory() &&
            std::filesystem::exists(entry.path() / kManifestFileName)) {
            candidates.push_back(entry.path());
        }
    }
    std::sort(candidates.begin(), candidates.end());

    auto wanted = [&](const std::string& name) {
        return enabled.empty() ||
               std::find(enabled.begin(), enabled.end(), name) != enabled.end();
    };

    std::set<std::string> seen;
    for (const auto& path : candidates) {
        const std::string dirname = path.filename().string();
        try {
            auto manifest = read_manifest(path);
            if (!wanted(manifest.name)) continue;
            seen.insert(manifest.name);
            manifests.push_back(std::move(manifest));
        } catch (const ManifestError& e) {
            if (!wanted(dirname)) continue;
            seen.insert(dirname);
            telemetry_->event(LogLevel::Error, "module.manifest_invalid",
                              {{"path", path.string()}, {"error", e.what()}});
            report.failed.push_back({dirname, ErrorKind::ModuleLoadFailure, e.what(),
                                     {{"module", dirname}, {"path", path.string()}}});
        }
    }

    for (const auto& name : enabled) {
        if (seen.count(name)) continue;
        report.failed.push_back({name, ErrorKind::ModuleLoadFailure,
                                 "No manifest found for module '" + name + "' in " + dir.string(),
                                 {{"module", name}, {"path", dir.string()}}});
    }

    report.merge(load_all(std::move(manifests)));
    return report;
}

LoadReport ModuleLoader::load_all(std::vector<ModuleManifest> manifests) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    const auto batch_at = Clock::now();
    LoadReport report;
    std::set<std::string> fresh;

    for (auto& manifest : manifests) {
        const std::string name = manifest.name;
        bool duplicate = fresh.count(name) > 0;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            auto it = records_.find(name);
            if (it != records_.end() && it->second->state != ModuleState::Failed
                && it->second->state != ModuleState::Stopped) {
                duplicate = true;
            }
        }
        if (duplicate) {
            report.failed.push_back({name, ErrorKind::ModuleLoadFailure,
                                     "Module '" + name + "' is already loaded", {{"module", name}}});
            continue;
        }

        auto rec = std::make_shared<Record>();
        rec->manifest = std::move(manifest);
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            records_[name] = rec;
        }
        if (auto failure = resolve_code(*rec)) {
            set_state(name, ModuleState::Failed, failure->message);
            report.failed.push_back(std::move(*failure));
            continue;
        }
        fresh.insert(name);
    }

    const auto resolve_at = Clock::now();
    auto resolution = graph_locked().resolve();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        ++metrics_.resolutions;
        metrics_.cycles_detected += resolution.cycles;
        metrics_.last_resolution_ms = elapsed_ms(resolve_at);
    }

    for (auto& failure : resolution.failed) {
        if (!fresh.count(failure.module)) continue;
        set_state(failure.module, ModuleState::Failed, failure.message);
        telemetry_->event(LogLevel::Error, "module.dependency_failed",
                          {{"module", failure.module}, {"kind", to_string(failure.kind)},
                           {"error", failure.message}});
        report.failed.push_back(std::move(failure));
    }
    for (const auto& [module, dep] : resolution.missing_optional) {
        if (!fresh.count(module)) continue;
        telemetry_->event(LogLevel::Warning, "module.optional_dependency_missing",
                          {{"module", module}, {"dependency", dep}});
    }

    for (const auto& name : resolution.order) {
        if (!fresh.count(name)) continue;
        if (auto failure = start_locked(name)) {
            report.failed.push_back(std::move(*failure));
        } else {
            report.succeeded.push_back(name);
        }
    }

    double took;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        took = elapsed_ms(batch_at);
        ++metrics_.starts;
        metrics_.last_start_ms = took;
    }
    telemetry_->event(report.ok() ? LogLevel::Info : LogLevel::Warning, "module.batch_loaded",
                      {{"succeeded", report.succeeded}, {"failed", report.failed.size()},
                       {"duration_ms", took}});
    return report;
}

std::optional<ModuleFailure> ModuleLoader::start(const std::string& name) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    std::shared_ptr<Record> rec;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        auto it = records_.find(name);
        if (it != records_.end()) rec = it->second;
    }
    if (!rec) {
        return ModuleFailure{name, ErrorKind::ModuleLoadFailure,
                             "Unknown module '" + name + "'", {{"module", name}}};
    }
    if (!rec->module) {
        if (auto failure = resolve_code(*rec)) {
            set_state(name, ModuleState::Failed, failure->message);
            return failure;
        }
    }
    return start_locked(name);
}

std::optional<ModuleFailure> ModuleLoader::stop(const std::string& name) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    return stop_locked(name);
}

LoadReport ModuleLoader::stop_all() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    const auto batch_at = Clock::now();
    std::vector<std::string> order;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        order.assign(start_order_.rbegin(), start_order_.rend());
    }
    LoadReport report;
    for (const auto& name : order) {
        if (auto failure = stop_locked(name)) {
            report.failed.push_back(std::move(*failure));
        } else {
            report.succeeded.push_back(name);
        }
    }
    std::lock_guard<std::mutex> lock(state_mutex_);
    ++metrics_.stops;
    metrics_.last_stop_ms = elapsed_ms(batch_at);
    return report;
}

std::optional<ModuleFailure> ModuleLoader::reload(const std::string& name) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    std::shared_ptr<Record> rec;
    std::vector<std::string> dependents;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        auto it = records_.find(name);
        if (it == records_.end()) {
            return ModuleFailure{name, ErrorKind::ModuleLoadFailure,
                                 "Unknown module '" + name + "'", {{"module", name}}};
        }
        rec = it->second;

        DependencyGraph all;
        for (const auto& [n, r] : records_) {
            all.add({n, r->manifest.required, r->manifest.optional, r->manifest.load_order});
        }
        auto affected = all.dependents_of(name);
        for (const auto& n : start_order_) {
            if (affected.count(n)) dependents.push_back(n);
        }
    }

    for (auto it = dependents.rbegin(); it != dependents.rend(); ++it) {
        if (auto failure = stop_locked(*it)) {
            telemetry_->event(LogLevel::Warning, "module.reload_stop_failed",
                              {{"module", *it}, {"error", failure->message}});
        }
    }
    if (auto failure = stop_locked(name)) {
        telemetry_->event(LogLevel::Warning, "module.reload_stop_failed",
                          {{"module", name}, {"error", failure->message}});
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        rec->module.reset();
        rec->library.reset();
    }
    if (auto failure = resolve_code(*rec)) {
        set_state(name, ModuleState::Failed, failure->message);
        return failure;
    }

    auto failure = start_locked(name);
    if (!failure) {
        for (const auto& d : dependents) {
            if (auto f = start_locked(d)) {
                telemetry_->event(LogLevel::Warning, "module.reload_restart_failed",
                                  {{"module", d}, {"error", f->message}});
            }
        }
        telemetry_->event(LogLevel::Info, "module.reloaded",
                          {{"module", name}, {"restarted_dependents", dependents}});
    }
    return failure;
}

ModuleStatus ModuleLoader::describe(const std::string& name) const {
    std::shared_ptr<Record> rec;
    std::shared_ptr<Module> module;
    std::shared_ptr<ModuleInstance> instance;
    ModuleStatus out;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        rec = records_.at(name);
        module = rec->module;
        instance = rec->instance;
        out.name = name;
        out.version = rec->manifest.version;
        out.description = rec->manifest.description;
        out.state = rec->state;
        out.last_error = rec->last_error;
    }
    out.tools = registry_->names_owned_by(name);

    if (!is_live(out.state) || !module) {
        out.health.status = out.state == ModuleState::Failed ? HealthStatus::Error
                                                             : HealthStatus::Stopped;
        return out;
    }

    auto result = run_with_timeout<ModuleHealth>(
        [module, instance]() { return module->status(instance); }, opts_.status_timeout);
    if (result.timed_out) {
        out.health = {HealthStatus::Error, {{"reason", "status timed out"}}};
    } else if (result.error) {
        out.health = {HealthStatus::Error, {{"reason", describe_exception(result.error)}}};
    } else {
        out.health = *result.value;
    }

    ModuleState next = out.health.status == HealthStatus::Ok ? ModuleState::Running
                                                             : ModuleState::Degraded;
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (is_live(rec->state) && rec->state != next) {
        rec->state = next;
    }
    out.state = rec->state;
    return out;
}

std::vector<ModuleStatus> ModuleLoader::status() const {
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        for (const auto& [name, rec] : records_) names.push_back(name);
    }
    std::vector<ModuleStatus> out;
    out.reserve(names.size());
    for (const auto& name : names) out.push_back(describe(name));
    return out;
}

std::optional<ModuleStatus> ModuleLoader::status(const std::string& name) const {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!records_.count(name)) return std::nullopt;
    }
    return describe(name);
}

std::vector<std::string> ModuleLoader::running() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return start_order_;
}

bool ModuleLoader::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return records_.count(name) > 0;
}

LoaderMetrics ModuleLoader::metrics() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return metrics_;
}

} // namespace mcphost
