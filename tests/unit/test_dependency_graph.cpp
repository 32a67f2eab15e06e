#include <gtest/gtest.h>
#include "mcphost/module/dependency_graph.hpp"
#include <algorithm>

using namespace mcphost;

namespace {

DependencyNode node(std::string name, std::vector<std::string> required = {},
                    std::vector<std::string> optional = {}, int load_order = 100) {
    return DependencyNode{std::move(name), std::move(required), std::move(optional), load_order};
}

size_t index_of(const std::vector<std::string>& order, const std::string& name) {
    return static_cast<size_t>(std::find(order.begin(), order.end(), name) - order.begin());
}

const ModuleFailure* failure_for(const DependencyResolution& r, const std::string& name) {
    for (const auto& f : r.failed) {
        if (f.module == name) return &f;
    }
    return nullptr;
}

} // anonymous namespace

TEST(DependencyGraph, EmptyGraph) {
    DependencyGraph g;
    auto r = g.resolve();
    EXPECT_TRUE(r.order.empty());
    EXPECT_TRUE(r.failed.empty());
    EXPECT_EQ(r.cycles, 0u);
}

TEST(DependencyGraph, DependenciesStartFirst) {
    DependencyGraph g;
    g.add(node("app", {"db", "cache"}));
    g.add(node("cache", {"db"}));
    g.add(node("db"));

    auto r = g.resolve();
    ASSERT_EQ(r.order.size(), 3u);
    EXPECT_EQ(r.order, (std::vector<std::string>{"db", "cache", "app"}));
    EXPECT_TRUE(r.failed.empty());
}

TEST(DependencyGraph, LoadOrderBreaksTies) {
    DependencyGraph g;
    g.add(node("zeta", {}, {}, 1));
    g.add(node("alpha", {}, {}, 50));
    g.add(node("beta", {}, {}, 50));

    auto r = g.resolve();
    EXPECT_EQ(r.order, (std::vector<std::string>{"zeta", "alpha", "beta"}));
}

TEST(DependencyGraph, LoadOrderNeverOverridesDependencies) {
    DependencyGraph g;
    g.add(node("first", {"late"}, {}, 1));
    g.add(node("late", {}, {}, 999));

    auto r = g.resolve();
    EXPECT_EQ(r.order, (std::vector<std::string>{"late", "first"}));
}

TEST(DependencyGraph, MissingRequiredFailsOnlyDependents) {
    DependencyGraph g;
    g.add(node("a", {"b"}));
    g.add(node("c"));

    auto r = g.resolve();
    EXPECT_EQ(r.order, std::vector<std::string>{"c"});
    const auto* f = failure_for(r, "a");
    ASSERT_NE(f, nullptr);
    EXPECT_EQ(f->kind, ErrorKind::ModuleMissingDependency);
    EXPECT_EQ(f->message, "Module 'a' requires missing dependency 'b'");
    EXPECT_EQ(f->detail["dependency"], "b");
}

TEST(DependencyGraph, FailurePropagatesThroughRequiredChain) {
    DependencyGraph g;
    g.add(node("top", {"mid"}));
    g.add(node("mid", {"gone"}));

    auto r = g.resolve();
    EXPECT_TRUE(r.order.empty());
    const auto* f = failure_for(r, "top");
    ASSERT_NE(f, nullptr);
    EXPECT_EQ(f->kind, ErrorKind::ModuleMissingDependency);
    EXPECT_EQ(f->detail["dependency"], "mid");
}

TEST(DependencyGraph, CycleFailsMembersAndDependents) {
    DependencyGraph g;
    g.add(node("a", {"b"}));
    g.add(node("b", {"a"}));
    g.add(node("c", {"a"}));
    g.add(node("free"));

    auto r = g.resolve();
    EXPECT_EQ(r.order, std::vector<std::string>{"free"});

    const auto* fa = failure_for(r, "a");
    ASSERT_NE(fa, nullptr);
    EXPECT_EQ(fa->kind, ErrorKind::ModuleCircularDependency);
    EXPECT_EQ(fa->message, "Circular dependency: a -> b -> a");
    EXPECT_EQ(fa->detail["cycle"], (nlohmann::json{"a", "b", "a"}));

    ASSERT_NE(failure_for(r, "b"), nullptr);
    EXPECT_EQ(failure_for(r, "b")->kind, ErrorKind::ModuleCircularDependency);
    ASSERT_NE(failure_for(r, "c"), nullptr);
    EXPECT_EQ(failure_for(r, "c")->kind, ErrorKind::ModuleMissingDependency);
}

TEST(DependencyGraph, SelfDependencyIsACycle) {
    DependencyGraph g;
    g.add(node("loop", {"loop"}));

    auto r = g.resolve();
    ASSERT_EQ(r.failed.size(), 1u);
    EXPECT_EQ(r.failed[0].kind, ErrorKind::ModuleCircularDependency);
    EXPECT_EQ(r.failed[0].message, "Circular dependency: loop -> loop");
}

TEST(DependencyGraph, CountsEachDisjointCycle) {
    DependencyGraph g;
    g.add(node("a", {"b"}));
    g.add(node("b", {"a"}));
    g.add(node("x", {"y"}));
    g.add(node("y", {"x"}));
    g.add(node("free"));

    auto r = g.resolve();
    EXPECT_EQ(r.cycles, 2u);
    EXPECT_EQ(r.order, std::vector<std::string>{"free"});
    EXPECT_EQ(r.failed.size(), 4u);
}

TEST(DependencyGraph, OptionalDependencyOrdersWhenPresent) {
    DependencyGraph g;
    g.add(node("hello", {}, {"echo"}, 1));
    g.add(node("echo", {}, {}, 50));

    auto r = g.resolve();
    EXPECT_LT(index_of(r.order, "echo"), index_of(r.order, "hello"));
    EXPECT_TRUE(r.missing_optional.empty());
}

TEST(DependencyGraph, AbsentOptionalIsReportedNotFailed) {
    DependencyGraph g;
    g.add(node("hello", {}, {"echo"}));

    auto r = g.resolve();
    EXPECT_EQ(r.order, std::vector<std::string>{"hello"});
    EXPECT_TRUE(r.failed.empty());
    ASSERT_EQ(r.missing_optional.size(), 1u);
    EXPECT_EQ(r.missing_optional[0], std::make_pair(std::string("hello"), std::string("echo")));
}

TEST(DependencyGraph, FailedOptionalDoesNotPropagate) {
    DependencyGraph g;
    g.add(node("hello", {}, {"echo"}));
    g.add(node("echo", {"missing"}));

    auto r = g.resolve();
    EXPECT_EQ(r.order, std::vector<std::string>{"hello"});
    ASSERT_EQ(r.missing_optional.size(), 1u);
    EXPECT_NE(failure_for(r, "echo"), nullptr);
    EXPECT_EQ(failure_for(r, "hello"), nullptr);
}

TEST(DependencyGraph, DependentsOfIsTransitive) {
    DependencyGraph g;
    g.add(node("base"));
    g.add(node("mid", {"base"}));
    g.add(node("top", {}, {"mid"}));
    g.add(node("other"));

    auto deps = g.dependents_of("base");
    EXPECT_EQ(deps, (std::set<std::string>{"mid", "top"}));
    EXPECT_TRUE(g.dependents_of("other").empty());
}

TEST(DependencyGraph, AddReplacesNode) {
    DependencyGraph g;
    g.add(node("a", {"missing"}));
    g.add(node("a"));
    EXPECT_EQ(g.size(), 1u);
    EXPECT_TRUE(g.resolve().failed.empty());
}
