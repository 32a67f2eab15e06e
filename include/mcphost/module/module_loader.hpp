#pragma once
#include "dependency_graph.hpp"
#include "manifest.hpp"
#include "module.hpp"
#include "../telemetry.hpp"
#include "../tool_registry.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcphost {

enum class ModuleState { Stopped, Starting, Running, Degraded, Failed, Stopping };

std::string to_string(ModuleState state);

/// One row of the operational status listing.
struct ModuleStatus {
    std::string name;
    std::string version;
    std::string description;
    ModuleState state = ModuleState::Stopped;
    ModuleHealth health;
    std::optional<std::string> last_error;
    std::vector<std::string> tools;
};

void to_json(nlohmann::json& j, const ModuleStatus& s);

/// Outcome of a batch operation. Individual failures never abort a batch.
struct LoadReport {
    std::vector<std::string> succeeded;
    std::vector<ModuleFailure> failed;

    [[nodiscard]] bool ok() const { return failed.empty(); }

    /// Names from `required` that did not succeed.
    [[nodiscard]] std::vector<std::string>
    missing_required(const std::vector<std::string>& required) const;

    void merge(LoadReport other);
};

void to_json(nlohmann::json& j, const LoadReport& r);

/// Lifecycle and dependency-resolution counters. Durations are in
/// milliseconds; the per-module maps keep the latest time for each module.
struct LoaderMetrics {
    uint64_t starts = 0;        // load_all batches
    uint64_t stops = 0;         // stop_all batches
    double last_start_ms = 0;
    double last_stop_ms = 0;
    std::map<std::string, double> module_start_ms;
    std::map<std::string, double> module_stop_ms;
    uint64_t resolutions = 0;
    uint64_t cycles_detected = 0;
    double last_resolution_ms = 0;
};

void to_json(nlohmann::json& j, const LoaderMetrics& m);

/// Supplies the configuration a module starts with.
using ConfigProvider = std::function<nlohmann::json(const ModuleManifest& manifest)>;

/// Reads manifests, orders modules by dependency, and drives their
/// lifecycle. Every lifecycle operation is serialized; failures are
/// returned as values and never thrown.
class ModuleLoader {
public:
    struct Options {
        std::chrono::milliseconds start_timeout{10000};
        std::chrono::milliseconds stop_timeout{30000};
        std::chrono::milliseconds status_timeout{1000};
    };

    ModuleLoader(std::shared_ptr<ToolRegistry> registry,
                 std::shared_ptr<const ModuleCatalog> catalog,
                 Options opts,
                 ConfigProvider config = nullptr,
                 std::shared_ptr<ITelemetrySink> telemetry = nullptr);
    ~ModuleLoader();

    ModuleLoader(const ModuleLoader&) = delete;
    ModuleLoader& operator=(const ModuleLoader&) = delete;

    /// Discover `<dir>/*/module.json` and load them. A non-empty `enabled`
    /// restricts the set; enabled names with no manifest are reported failed.
    LoadReport load_directory(const std::filesystem::path& dir,
                              const std::vector<std::string>& enabled = {});

    /// Resolve code, order by dependency and start each module.
    LoadReport load_all(std::vector<ModuleManifest> manifests);

    /// Start a loaded module that is stopped or failed.
    std::optional<ModuleFailure> start(const std::string& name);

    /// Stop a running module. The module ends up stopped even on timeout.
    std::optional<ModuleFailure> stop(const std::string& name);

    /// Stop everything in reverse start order.
    LoadReport stop_all();

    /// Stop the module (and its running dependents), reload its code and
    /// start it again with the configuration it had.
    std::optional<ModuleFailure> reload(const std::string& name);

    [[nodiscard]] std::vector<ModuleStatus> status() const;
    [[nodiscard]] std::optional<ModuleStatus> status(const std::string& name) const;

    /// Names of running modules in the order they were started.
    [[nodiscard]] std::vector<std::string> running() const;

    [[nodiscard]] bool contains(const std::string& name) const;

    [[nodiscard]] LoaderMetrics metrics() const;

private:
    struct Record;
    class ScopedRegistrar;

    std::optional<ModuleFailure> resolve_code(Record& rec);
    std::optional<ModuleFailure> start_locked(const std::string& name);
    std::optional<ModuleFailure> stop_locked(const std::string& name);
    ModuleStatus describe(const std::string& name) const;
    void set_state(const std::string& name, ModuleState state,
                   std::optional<std::string> error = std::nullopt);
    DependencyGraph graph_locked() const;

    std::shared_ptr<ToolRegistry> registry_;
    std::shared_ptr<const ModuleCatalog> catalog_;
    Options opts_;
    ConfigProvider config_;
    std::shared_ptr<ITelemetrySink> telemetry_;

    // Held for the whole of every load/start/stop/reload.
    std::mutex lifecycle_mutex_;

    // Guards records_, start_order_ and metrics_ for readers.
    mutable std::mutex state_mutex_;
    std::map<std::string, std::shared_ptr<Record>> records_;
    std::vector<std::string> start_order_;
    LoaderMetrics metrics_;
};

} // namespace mcphost
