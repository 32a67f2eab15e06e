#pragma once
#include "json_rpc.hpp"
#include "schema_validator.hpp"
#include "telemetry.hpp"
#include "timed_call.hpp"
#include "types.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcphost {

/// Tool handlers get the validated arguments and a token that is cancelled
/// when the caller stops waiting. Long-running handlers should poll it.
using ToolHandler = std::function<CallToolResult(const nlohmann::json& arguments,
                                                 const CancelToken& cancel)>;

/// What modules publish tools through. Kept pure virtual so shared-library
/// modules need no link-time symbols from the host.
class IToolRegistrar {
public:
    virtual ~IToolRegistrar() = default;

    /// Throws InvalidToolNameError or ToolCollisionError.
    virtual void register_tool(ToolDefinition def, ToolHandler handler,
                               bool override_existing = false) = 0;

    /// Returns false if no tool had that name.
    virtual bool unregister_tool(const std::string& name) = 0;
};

struct ToolEntry {
    ToolDefinition definition;
    ToolHandler handler;
    std::string owner;                       // module that registered it
    std::shared_ptr<const void> keepalive;   // e.g. the shared library holding the handler code
};

class ToolRegistry : public IToolRegistrar {
public:
    struct Options {
        std::chrono::milliseconds call_timeout{30000};
    };

    using ChangeListener = std::function<void()>;

    ToolRegistry();
    explicit ToolRegistry(Options opts,
                          std::shared_ptr<ISchemaValidator> validator = nullptr,
                          std::shared_ptr<ITelemetrySink> telemetry = nullptr);

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    // ---- Mutation (serialized) ----

    /// Owner defaults to the namespace part of the name.
    void register_tool(ToolDefinition def, ToolHandler handler,
                       bool override_existing = false) override;
    void register_tool(ToolEntry entry, bool override_existing = false);
    bool unregister_tool(const std::string& name) override;

    /// Remove every tool registered by `owner`. Returns how many went.
    size_t unregister_owner(const std::string& owner);

    // ---- Reads (lock-free snapshots) ----

    [[nodiscard]] std::optional<ToolDefinition> get(const std::string& name) const;
    [[nodiscard]] std::vector<ToolDefinition> list() const;
    [[nodiscard]] std::vector<std::string> names() const;
    [[nodiscard]] std::vector<std::string> names_owned_by(const std::string& owner) const;
    [[nodiscard]] std::optional<std::string> owner_of(const std::string& name) const;
    [[nodiscard]] size_t size() const;

    // ---- Invocation ----

    /// Validate and run a tool under the configured timeout. Never throws;
    /// every failure comes back as a structured JsonRpcError.
    [[nodiscard]] HandlerResult call(const std::string& name, const nlohmann::json& arguments) const;
    [[nodiscard]] HandlerResult call(const std::string& name, const nlohmann::json& arguments,
                                     std::chrono::milliseconds timeout) const;

    /// Called after every successful mutation, outside the write lock.
    void set_change_listener(ChangeListener listener);

    [[nodiscard]] std::chrono::milliseconds call_timeout() const { return opts_.call_timeout; }

    /// True for names of the form "module:tool" with both parts non-empty.
    [[nodiscard]] static bool is_namespaced(const std::string& name);

private:
    using Map = std::map<std::string, ToolEntry>;

    std::shared_ptr<const Map> snapshot() const;
    void publish(std::shared_ptr<const Map> next);
    void notify_changed();

    Options opts_;
    std::shared_ptr<ISchemaValidator> validator_;
    std::shared_ptr<ITelemetrySink> telemetry_;

    std::mutex write_mutex_;
    std::shared_ptr<const Map> tools_;

    mutable std::mutex listener_mutex_;
    ChangeListener listener_;
};

} // namespace mcphost
