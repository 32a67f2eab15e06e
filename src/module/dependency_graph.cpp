#include "mcphost/module/dependency_graph.hpp"
#include <algorithm>
#include <queue>
#include <tuple>

namespace mcphost {

namespace {

std::string join_path(const std::vector<std::string>& path) {
    std::string out;
    for (const auto& p : path) {
        if (!out.empty()) out += " -> ";
        out += p;
    }
    return out;
}

} // anonymous namespace

void to_json(nlohmann::json& j, const ModuleFailure& f) {
    j = {{"module", f.module}, {"kind", to_string(f.kind)}, {"message", f.message},
         {"detail", f.detail}};
}

void DependencyGraph::add(DependencyNode node) {
    auto name = node.name;
    nodes_[name] = std::move(node);
}

bool DependencyGraph::contains(const std::string& name) const {
    return nodes_.count(name) > 0;
}

std::vector<std::string> DependencyGraph::edges_within(const DependencyNode& node,
                                                       const std::set<std::string>& viable) const {
    std::vector<std::string> out;
    for (const auto& d : node.required) {
        if (viable.count(d)) out.push_back(d);
    }
    for (const auto& d : node.optional) {
        if (viable.count(d)) out.push_back(d);
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

std::vector<std::string> DependencyGraph::kahn(const std::set<std::string>& viable,
                                               std::set<std::string>& leftover) const {
    std::map<std::string, size_t> indegree;
    std::map<std::string, std::vector<std::string>> dependents;
    for (const auto& name : viable) {
        auto deps = edges_within(nodes_.at(name), viable);
        indegree[name] = deps.size();
        for (const auto& d : deps) dependents[d].push_back(name);
    }

    using Ready = std::tuple<int, std::string>;
    std::priority_queue<Ready, std::vector<Ready>, std::greater<Ready>> ready;
    for (const auto& [name, deg] : indegree) {
        if (deg == 0) ready.emplace(nodes_.at(name).load_order, name);
    }

    std::vector<std::string> order;
    while (!ready.empty()) {
        auto [hint, name] = ready.top();
        ready.pop();
        order.push_back(name);
        for (const auto& d : dependents[name]) {
            if (--indegree[d] == 0) ready.emplace(nodes_.at(d).load_order, d);
        }
    }

    leftover.clear();
    for (const auto& [name, deg] : indegree) {
        if (deg > 0) leftover.insert(name);
    }
    return order;
}

// Every leftover node still waits on some other leftover node, so following
// those edges must eventually revisit a node.
std::vector<std::string> DependencyGraph::find_cycle(const std::string& start,
                                                     const std::set<std::string>& leftover) const {
    std::vector<std::string> path;
    std::map<std::string, size_t> position;
    std::string current = start;
    while (position.find(current) == position.end()) {
        position[current] = path.size();
        path.push_back(current);
        auto deps = edges_within(nodes_.at(current), leftover);
        if (deps.empty()) return {};
        current = deps.front();
    }
    std::vector<std::string> cycle(path.begin() + static_cast<long>(position[current]), path.end());
    cycle.push_back(current);
    return cycle;
}

DependencyResolution DependencyGraph::resolve() const {
    DependencyResolution out;
    std::map<std::string, ModuleFailure> failed;

    for (const auto& [name, node] : nodes_) {
        std::vector<std::string> missing;
        for (const auto& d : node.required) {
            if (!nodes_.count(d)) missing.push_back(d);
        }
        if (!missing.empty()) {
            failed[name] = ModuleFailure{
                name, ErrorKind::ModuleMissingDependency,
                "Module '" + name + "' requires missing dependency '" + missing.front() + "'",
                {{"module", name}, {"dependency", missing.front()}, {"missing", missing}}};
        }
    }

    // Fail everything that requires a failed module, until nothing changes.
    auto propagate = [&]() {
        bool changed = true;
        while (changed) {
            changed = false;
            for (const auto& [name, node] : nodes_) {
                if (failed.count(name)) continue;
                for (const auto& d : node.required) {
                    auto it = failed.find(d);
                    if (it == failed.end()) continue;
                    failed[name] = ModuleFailure{
                        name, ErrorKind::ModuleMissingDependency,
                        "Module '" + name + "' requires '" + d + "', which failed to resolve",
                        {{"module", name}, {"dependency", d},
                         {"cause", to_string(it->second.kind)}}};
                    changed = true;
                    break;
                }
            }
        }
    };
    propagate();

    auto viable_set = [&]() {
        std::set<std::string> viable;
        for (const auto& [name, node] : nodes_) {
            if (!failed.count(name)) viable.insert(name);
        }
        return viable;
    };

    std::set<std::string> leftover;
    auto order = kahn(viable_set(), leftover);
    while (!leftover.empty()) {
        auto cycle = find_cycle(*leftover.begin(), leftover);
        if (cycle.empty()) {
            cycle.assign(leftover.begin(), leftover.end());
            cycle.push_back(cycle.front());
        }
        ++out.cycles;
        const std::string path = join_path(cycle);
        for (size_t i = 0; i + 1 < cycle.size(); ++i) {
            failed[cycle[i]] = ModuleFailure{
                cycle[i], ErrorKind::ModuleCircularDependency,
                "Circular dependency: " + path,
                {{"module", cycle[i]}, {"cycle", cycle}}};
        }
        propagate();
        order = kahn(viable_set(), leftover);
    }

    out.order = std::move(order);
    for (auto& [name, failure] : failed) out.failed.push_back(std::move(failure));

    const auto viable = viable_set();
    for (const auto& name : out.order) {
        for (const auto& d : nodes_.at(name).optional) {
            if (!viable.count(d)) out.missing_optional.emplace_back(name, d);
        }
    }
    return out;
}

std::set<std::string> DependencyGraph::dependents_of(const std::string& name) const {
    std::set<std::string> out;
    std::vector<std::string> frontier{name};
    while (!frontier.empty()) {
        auto current = frontier.back();
        frontier.pop_back();
        for (const auto& [n, node] : nodes_) {
            if (out.count(n) || n == name) continue;
            bool depends = std::find(node.required.begin(), node.required.end(), current) != node.required.end()
                || std::find(node.optional.begin(), node.optional.end(), current) != node.optional.end();
            if (depends) {
                out.insert(n);
                frontier.push_back(n);
            }
        }
    }
    return out;
}

} // namespace mcphost
