#pragma once
#include "../error.hpp"
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcphost {

/// A module that could not be loaded, started or stopped.
struct ModuleFailure {
    std::string module;
    ErrorKind kind;
    std::string message;
    nlohmann::json detail = nlohmann::json::object();
};

void to_json(nlohmann::json& j, const ModuleFailure& f);

struct DependencyNode {
    std::string name;
    std::vector<std::string> required;
    std::vector<std::string> optional;
    int load_order = 100;
};

struct DependencyResolution {
    /// Start order: every dependency before its dependents, load_order then
    /// name breaking ties among modules that are ready at the same time.
    std::vector<std::string> order;
    std::vector<ModuleFailure> failed;
    /// (module, optional dependency) pairs that will be passed as null.
    std::vector<std::pair<std::string, std::string>> missing_optional;
    /// Distinct cycles broken while ordering.
    size_t cycles = 0;
};

/// Directed "depends on" graph over module names.
class DependencyGraph {
public:
    /// Replaces a node with the same name.
    void add(DependencyNode node);

    [[nodiscard]] bool contains(const std::string& name) const;
    [[nodiscard]] size_t size() const { return nodes_.size(); }

    /// Topologically sort the graph. Missing required dependencies and
    /// cycles fail only the modules involved and whatever requires them.
    [[nodiscard]] DependencyResolution resolve() const;

    /// Modules that depend on `name`, directly or transitively.
    [[nodiscard]] std::set<std::string> dependents_of(const std::string& name) const;

private:
    std::vector<std::string> kahn(const std::set<std::string>& viable,
                                  std::set<std::string>& leftover) const;
    std::vector<std::string> find_cycle(const std::string& start,
                                        const std::set<std::string>& leftover) const;
    std::vector<std::string> edges_within(const DependencyNode& node,
                                          const std::set<std::string>& viable) const;

    std::map<std::string, DependencyNode> nodes_;
};

} // namespace mcphost
