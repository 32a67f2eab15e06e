#include "mcphost/tool_registry.hpp"
#include "mcphost/error.hpp"
#include <algorithm>
#include <cctype>
#include <typeinfo>

namespace mcphost {

namespace {

constexpr size_t kMaxTraceDepth = 5;

std::string namespace_of(const std::string& name) {
    auto sep = name.find(':');
    return sep == std::string::npos ? std::string{} : name.substr(0, sep);
}

void collect_trace(const std::exception& e, nlohmann::json& trace) {
    if (trace.size() >= kMaxTraceDepth) return;
    trace.push_back(e.what());
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& nested) {
        collect_trace(nested, trace);
    } catch (...) {
        trace.push_back("non-standard exception");
    }
}

JsonRpcError execution_failure(const std::string& tool, std::exception_ptr error) {
    nlohmann::json data = {{"tool", tool}};
    std::string cause = "unknown error";
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        cause = e.what();
        nlohmann::json trace = nlohmann::json::array();
        collect_trace(e, trace);
        data["type"] = typeid(e).name();
        data["trace"] = std::move(trace);
    } catch (...) {
        data["type"] = "unknown";
        data["trace"] = nlohmann::json::array();
    }
    data["cause"] = cause;
    return make_error(ErrorKind::ToolExecutionFailure,
                      "Tool execution failed: " + tool + ": " + cause, std::move(data));
}

} // anonymous namespace

ToolRegistry::ToolRegistry()
    : ToolRegistry(Options{}) {
}

ToolRegistry::ToolRegistry(Options opts,
                           std::shared_ptr<ISchemaValidator> validator,
                           std::shared_ptr<ITelemetrySink> telemetry)
    : opts_(opts)
    , validator_(validator ? std::move(validator) : std::make_shared<JsonSchemaValidator>())
    , telemetry_(telemetry ? std::move(telemetry) : null_telemetry())
    , tools_(std::make_shared<const Map>()) {
}

bool ToolRegistry::is_namespaced(const std::string& name) {
    auto sep = name.find(':');
    if (sep == std::string::npos || sep == 0 || sep + 1 >= name.size()) return false;
    return std::none_of(name.begin(), name.end(),
                        [](unsigned char c) { return std::isspace(c) != 0; });
}

std::shared_ptr<const ToolRegistry::Map> ToolRegistry::snapshot() const {
    return std::atomic_load(&tools_);
}

void ToolRegistry::publish(std::shared_ptr<const Map> next) {
    std::atomic_store(&tools_, std::move(next));
}

void ToolRegistry::register_tool(ToolDefinition def, ToolHandler handler, bool override_existing) {
    ToolEntry entry;
    entry.owner = namespace_of(def.name);
    entry.definition = std::move(def);
    entry.handler = std::move(handler);
    register_tool(std::move(entry), override_existing);
}

void ToolRegistry::register_tool(ToolEntry entry, bool override_existing) {
    const std::string name = entry.definition.name;
    if (!is_namespaced(name)) {
        throw InvalidToolNameError(
            "Tool name '" + name + "' must be namespaced as 'module:tool'", name);
    }
    if (!entry.handler) {
        throw ToolRegistrationError("Tool '" + name + "' has no handler", name);
    }
    if (entry.owner.empty()) entry.owner = namespace_of(name);

    std::optional<std::string> replaced_owner;
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        auto current = snapshot();
        auto it = current->find(name);
        if (it != current->end()) {
            if (!override_existing) {
                throw ToolCollisionError(
                    "Tool '" + name + "' is already registered by '" + it->second.owner + "'",
                    name, it->second.owner);
            }
            replaced_owner = it->second.owner;
        }
        auto next = std::make_shared<Map>(*current);
        (*next)[name] = entry;
        publish(std::move(next));
    }

    if (replaced_owner) {
        telemetry_->event(LogLevel::Warning, "tool.replaced",
                          {{"tool", name}, {"previous_owner", *replaced_owner},
                           {"owner", entry.owner}});
    } else {
        telemetry_->event(LogLevel::Debug, "tool.registered",
                          {{"tool", name}, {"owner", entry.owner}});
    }
    notify_changed();
}

bool ToolRegistry::unregister_tool(const std::string& name) {
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        auto current = snapshot();
        if (current->find(name) == current->end()) return false;
        auto next = std::make_shared<Map>(*current);
        next->erase(name);
        publish(std::move(next));
    }
    telemetry_->event(LogLevel::Debug, "tool.unregistered", {{"tool", name}});
    notify_changed();
    return true;
}

size_t ToolRegistry::unregister_owner(const std::string& owner) {
    size_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        auto next = std::make_shared<Map>(*snapshot());
        for (auto it = next->begin(); it != next->end();) {
            if (it->second.owner == owner) {
                it = next->erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        if (removed == 0) return 0;
        publish(std::move(next));
    }
    telemetry_->event(LogLevel::Debug, "tool.owner_unregistered",
                      {{"owner", owner}, {"count", removed}});
    notify_changed();
    return removed;
}

std::optional<ToolDefinition> ToolRegistry::get(const std::string& name) const {
    auto current = snapshot();
    auto it = current->find(name);
    if (it == current->end()) return std::nullopt;
    return it->second.definition;
}

std::vector<ToolDefinition> ToolRegistry::list() const {
    auto current = snapshot();
    std::vector<ToolDefinition> out;
    out.reserve(current->size());
    for (const auto& [name, entry] : *current) {
        out.push_back(entry.definition);
    }
    return out;
}

std::vector<std::string> ToolRegistry::names() const {
    auto current = snapshot();
    std::vector<std::string> out;
    out.reserve(current->size());
    for (const auto& [name, entry] : *current) out.push_back(name);
    return out;
}

std::vector<std::string> ToolRegistry::names_owned_by(const std::string& owner) const {
    auto current = snapshot();
    std::vector<std::string> out;
    for (const auto& [name, entry] : *current) {
        if (entry.owner == owner) out.push_back(name);
    }
    return out;
}

std::optional<std::string> ToolRegistry::owner_of(const std::string& name) const {
    auto current = snapshot();
    auto it = current->find(name);
    if (it == current->end()) return std::nullopt;
    return it->second.owner;
}

size_t ToolRegistry::size() const {
    return snapshot()->size();
}

HandlerResult ToolRegistry::call(const std::string& name, const nlohmann::json& arguments) const {
    return call(name, arguments, opts_.call_timeout);
}

HandlerResult ToolRegistry::call(const std::string& name, const nlohmann::json& arguments,
                                 std::chrono::milliseconds timeout) const {
    auto current = snapshot();
    auto it = current->find(name);
    if (it == current->end()) {
        nlohmann::json available = nlohmann::json::array();
        for (const auto& [n, entry] : *current) available.push_back(n);
        return make_error(ErrorKind::ToolNotFound, "Tool not found: " + name,
                          {{"tool", name}, {"available", std::move(available)}});
    }
    // Copy so the handler (and whatever keeps its code mapped) outlives a
    // concurrent unregister and an abandoned wait.
    ToolEntry entry = it->second;
    current.reset();

    auto issues = validator_->validate(entry.definition.input_schema, arguments);
    if (!issues.empty()) {
        nlohmann::json missing = nlohmann::json::array();
        for (const auto& issue : issues) {
            if (issue.actual == "missing") missing.push_back(issue.path);
        }
        return make_error(ErrorKind::ToolInvalidParameters,
                          "Invalid arguments for tool " + name + ": " + issues.front().message,
                          {{"tool", name},
                           {"errors", issues},
                           {"missing", std::move(missing)},
                           {"schema", entry.definition.input_schema}});
    }

    CancelToken token;
    auto handler = entry.handler;
    auto keepalive = entry.keepalive;
    auto result = run_with_timeout<CallToolResult>(
        [handler, keepalive, arguments, token]() { return handler(arguments, token); },
        timeout, token);

    if (result.timed_out) {
        telemetry_->event(LogLevel::Warning, "tool.timeout",
                          {{"tool", name}, {"timeout_ms", timeout.count()}});
        return make_error(ErrorKind::ToolTimeout,
                          "Tool " + name + " timed out after " +
                              std::to_string(timeout.count()) + "ms",
                          {{"tool", name}, {"timeout_ms", timeout.count()}});
    }
    if (result.error) {
        auto err = execution_failure(name, result.error);
        telemetry_->event(LogLevel::Error, "tool.failed",
                          {{"tool", name}, {"cause", err.data->at("cause")}});
        return err;
    }

    nlohmann::json j;
    to_json(j, *result.value);
    return j;
}

void ToolRegistry::set_change_listener(ChangeListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener_ = std::move(listener);
}

void ToolRegistry::notify_changed() {
    ChangeListener listener;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listener = listener_;
    }
    if (listener) listener();
}

} // namespace mcphost
