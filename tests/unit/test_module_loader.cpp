#include <gtest/gtest.h>
#include "mcphost/module/module_loader.hpp"
#include "mcphost/modules/builtin.hpp"
#include <atomic>
#include <thread>

using namespace mcphost;

namespace {

/// Shared record of what the scripted modules saw.
struct Journal {
    std::mutex mutex;
    std::vector<std::string> events;
    std::map<std::string, bool> dependency_present;

    void add(const std::string& e) {
        std::lock_guard<std::mutex> lock(mutex);
        events.push_back(e);
    }
    std::vector<std::string> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return events;
    }
};

class ScriptedState : public ModuleInstance {
public:
    std::atomic<bool> healthy{true};
};

/// Stateful module whose behaviour is driven by its config:
///   fail: throw from start, start_ms / stop_ms: sleep, tool: register "<name>:ping".
class ScriptedModule : public Module {
public:
    explicit ScriptedModule(std::shared_ptr<Journal> journal) : journal_(std::move(journal)) {}

    ModuleKind kind() const override { return ModuleKind::Stateful; }

    std::shared_ptr<ModuleInstance> start(ModuleContext& ctx) override {
        const auto& cfg = ctx.config();
        if (cfg.value("start_ms", 0) > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(cfg.value("start_ms", 0)));
        }
        if (cfg.value("fail", false)) {
            throw std::runtime_error("scripted refused to start");
        }
        {
            std::lock_guard<std::mutex> lock(journal_->mutex);
            for (const auto& dep : {"base", "extra"}) {
                if (ctx.has_dependency(dep)) {
                    journal_->dependency_present[ctx.name() + "->" + dep] = ctx.dependency(dep) != nullptr;
                }
            }
        }
        if (cfg.value("tool", true)) {
            ToolDefinition def;
            def.name = ctx.name() + ":ping";
            ctx.tools().register_tool(def, [](const nlohmann::json&, const CancelToken&) {
                return CallToolResult::text("pong");
            });
        }
        journal_->add("start " + ctx.name());
        stop_ms_ = cfg.value("stop_ms", 0);
        name_ = ctx.name();
        state_ = std::make_shared<ScriptedState>();
        return state_;
    }

    void stop(const std::shared_ptr<ModuleInstance>&) override {
        if (stop_ms_ > 0) std::this_thread::sleep_for(std::chrono::milliseconds(stop_ms_));
        journal_->add("stop " + name_);
    }

    ModuleHealth status(const std::shared_ptr<ModuleInstance>& instance) const override {
        auto state = std::dynamic_pointer_cast<ScriptedState>(instance);
        if (state && state->healthy.load()) return {HealthStatus::Ok, nlohmann::json::object()};
        return {HealthStatus::Degraded, {{"reason", "unhealthy"}}};
    }

    std::shared_ptr<ScriptedState> state_;

private:
    std::shared_ptr<Journal> journal_;
    int stop_ms_ = 0;
    std::string name_;
};

ModuleManifest manifest(const std::string& name, std::vector<std::string> required = {},
                        std::vector<std::string> optional = {},
                        nlohmann::json defaults = nlohmann::json::object()) {
    ModuleManifest m;
    m.name = name;
    m.version = "1.0.0";
    m.entry = "builtin:scripted";
    m.required = std::move(required);
    m.optional = std::move(optional);
    m.defaults = std::move(defaults);
    return m;
}

const ModuleFailure* failure_for(const LoadReport& r, const std::string& name) {
    for (const auto& f : r.failed) {
        if (f.module == name) return &f;
    }
    return nullptr;
}

class ModuleLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        journal_ = std::make_shared<Journal>();
        registry_ = std::make_shared<ToolRegistry>();
        auto catalog = std::make_shared<ModuleCatalog>();
        auto journal = journal_;
        catalog->add("scripted", [journal] { return std::make_unique<ScriptedModule>(journal); });
        modules::register_builtin_modules(*catalog);
        catalog_ = catalog;
        make_loader(ModuleLoader::Options{});
    }

    void make_loader(ModuleLoader::Options opts) {
        loader_ = std::make_unique<ModuleLoader>(registry_, catalog_, opts);
    }

    std::shared_ptr<Journal> journal_;
    std::shared_ptr<ToolRegistry> registry_;
    std::shared_ptr<const ModuleCatalog> catalog_;
    std::unique_ptr<ModuleLoader> loader_;
};

} // anonymous namespace

TEST_F(ModuleLoaderTest, StartsInDependencyOrder) {
    auto report = loader_->load_all({manifest("top", {"base"}), manifest("base")});
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.succeeded, (std::vector<std::string>{"base", "top"}));
    EXPECT_EQ(journal_->snapshot(), (std::vector<std::string>{"start base", "start top"}));
    EXPECT_EQ(loader_->running(), (std::vector<std::string>{"base", "top"}));
    EXPECT_TRUE(journal_->dependency_present["top->base"]);
    EXPECT_EQ(registry_->owner_of("top:ping"), "top");
}

TEST_F(ModuleLoaderTest, MissingRequiredDependencyIsReported) {
    auto report = loader_->load_all({manifest("X", {"Y"}), manifest("Z")});
    EXPECT_EQ(report.succeeded, std::vector<std::string>{"Z"});

    const auto* f = failure_for(report, "X");
    ASSERT_NE(f, nullptr);
    EXPECT_EQ(f->kind, ErrorKind::ModuleMissingDependency);
    EXPECT_EQ(f->detail["module"], "X");
    EXPECT_EQ(f->detail["dependency"], "Y");

    auto status = loader_->status("X");
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->state, ModuleState::Failed);
    EXPECT_FALSE(registry_->get("X:ping").has_value());
    EXPECT_EQ(report.missing_required({"X", "Z"}), std::vector<std::string>{"X"});
}

TEST_F(ModuleLoaderTest, AbsentOptionalDependencyPassedAsNull) {
    auto report = loader_->load_all({manifest("solo", {}, {"extra"})});
    EXPECT_TRUE(report.ok());
    ASSERT_EQ(journal_->dependency_present.count("solo->extra"), 1u);
    EXPECT_FALSE(journal_->dependency_present["solo->extra"]);
}

TEST_F(ModuleLoaderTest, CircularDependencyFailsBoth) {
    auto report = loader_->load_all({manifest("a", {"b"}), manifest("b", {"a"}), manifest("c")});
    EXPECT_EQ(report.succeeded, std::vector<std::string>{"c"});
    ASSERT_NE(failure_for(report, "a"), nullptr);
    EXPECT_EQ(failure_for(report, "a")->kind, ErrorKind::ModuleCircularDependency);
    ASSERT_NE(failure_for(report, "b"), nullptr);
}

TEST_F(ModuleLoaderTest, StartFailureIsContained) {
    auto report = loader_->load_all({manifest("bad", {}, {}, {{"fail", true}}),
                                     manifest("good"),
                                     manifest("needs_bad", {"bad"})});
    EXPECT_EQ(report.succeeded, std::vector<std::string>{"good"});

    const auto* bad = failure_for(report, "bad");
    ASSERT_NE(bad, nullptr);
    EXPECT_EQ(bad->kind, ErrorKind::ModuleStartFailure);
    EXPECT_NE(bad->message.find("scripted refused to start"), std::string::npos);

    const auto* dependent = failure_for(report, "needs_bad");
    ASSERT_NE(dependent, nullptr);
    EXPECT_EQ(dependent->kind, ErrorKind::ModuleMissingDependency);

    auto status = loader_->status("bad");
    EXPECT_EQ(status->state, ModuleState::Failed);
    EXPECT_EQ(status->health.status, HealthStatus::Error);
    ASSERT_TRUE(status->last_error.has_value());
}

TEST_F(ModuleLoaderTest, StartTimeoutFailsModule) {
    ModuleLoader::Options opts;
    opts.start_timeout = std::chrono::milliseconds(50);
    make_loader(opts);

    auto report = loader_->load_all({manifest("sluggish", {}, {}, {{"start_ms", 300}})});
    const auto* f = failure_for(report, "sluggish");
    ASSERT_NE(f, nullptr);
    EXPECT_EQ(f->kind, ErrorKind::ModuleStartFailure);
    EXPECT_EQ(f->detail["timeout_ms"], 50);

    // The abandoned start must not leave tools behind once it finishes.
    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    EXPECT_FALSE(registry_->get("sluggish:ping").has_value());
}

TEST_F(ModuleLoaderTest, StopRemovesToolsAndReverseOrder) {
    ASSERT_TRUE(loader_->load_all({manifest("base"), manifest("top", {"base"})}).ok());
    ASSERT_TRUE(registry_->get("top:ping").has_value());

    auto report = loader_->stop_all();
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.succeeded, (std::vector<std::string>{"top", "base"}));
    EXPECT_EQ(registry_->size(), 0u);
    EXPECT_TRUE(loader_->running().empty());

    auto events = journal_->snapshot();
    ASSERT_EQ(events.size(), 4u);
    EXPECT_EQ(events[2], "stop top");
    EXPECT_EQ(events[3], "stop base");
}

TEST_F(ModuleLoaderTest, StopTimeoutStillStops) {
    ModuleLoader::Options opts;
    opts.stop_timeout = std::chrono::milliseconds(30);
    make_loader(opts);

    ASSERT_TRUE(loader_->load_all({manifest("stubborn", {}, {}, {{"stop_ms", 200}})}).ok());
    auto failure = loader_->stop("stubborn");
    ASSERT_TRUE(failure.has_value());
    EXPECT_EQ(failure->kind, ErrorKind::ModuleStopTimeout);
    EXPECT_EQ(loader_->status("stubborn")->state, ModuleState::Stopped);
    EXPECT_FALSE(registry_->get("stubborn:ping").has_value());
    std::this_thread::sleep_for(std::chrono::milliseconds(250));
}

TEST_F(ModuleLoaderTest, RestartAfterStop) {
    ASSERT_TRUE(loader_->load_all({manifest("m")}).ok());
    EXPECT_FALSE(loader_->stop("m").has_value());
    EXPECT_FALSE(loader_->start("m").has_value());
    EXPECT_TRUE(registry_->get("m:ping").has_value());
    EXPECT_EQ(loader_->status("m")->state, ModuleState::Running);
}

TEST_F(ModuleLoaderTest, UnknownModuleOperations) {
    EXPECT_TRUE(loader_->start("ghost").has_value());
    EXPECT_TRUE(loader_->stop("ghost").has_value());
    EXPECT_TRUE(loader_->reload("ghost").has_value());
    EXPECT_FALSE(loader_->status("ghost").has_value());
}

TEST_F(ModuleLoaderTest, DuplicateLoadRejected) {
    ASSERT_TRUE(loader_->load_all({manifest("m")}).ok());
    auto report = loader_->load_all({manifest("m")});
    ASSERT_EQ(report.failed.size(), 1u);
    EXPECT_EQ(report.failed[0].kind, ErrorKind::ModuleLoadFailure);
}

TEST_F(ModuleLoaderTest, UnknownBuiltinIsLoadFailure) {
    auto m = manifest("nope");
    m.entry = "builtin:does-not-exist";
    auto report = loader_->load_all({m});
    ASSERT_EQ(report.failed.size(), 1u);
    EXPECT_EQ(report.failed[0].kind, ErrorKind::ModuleLoadFailure);
    EXPECT_EQ(loader_->status("nope")->state, ModuleState::Failed);
}

TEST_F(ModuleLoaderTest, ReloadRestartsDependents) {
    ASSERT_TRUE(loader_->load_all({manifest("base"), manifest("top", {"base"})}).ok());
    EXPECT_FALSE(loader_->reload("base").has_value());

    auto events = journal_->snapshot();
    std::vector<std::string> tail(events.begin() + 2, events.end());
    EXPECT_EQ(tail, (std::vector<std::string>{"stop top", "stop base", "start base", "start top"}));
    EXPECT_EQ(loader_->running(), (std::vector<std::string>{"base", "top"}));
}

TEST_F(ModuleLoaderTest, UnhealthyModuleReportsDegraded) {
    ScriptedModule* scripted = nullptr;
    auto catalog = std::make_shared<ModuleCatalog>();
    auto journal = journal_;
    catalog->add("scripted", [journal, &scripted] {
        auto m = std::make_unique<ScriptedModule>(journal);
        scripted = m.get();
        return m;
    });
    loader_ = std::make_unique<ModuleLoader>(registry_, catalog, ModuleLoader::Options{});

    ASSERT_TRUE(loader_->load_all({manifest("wobbly")}).ok());
    ASSERT_NE(scripted, nullptr);
    EXPECT_EQ(loader_->status("wobbly")->state, ModuleState::Running);

    scripted->state_->healthy = false;
    auto status = loader_->status("wobbly");
    EXPECT_EQ(status->state, ModuleState::Degraded);
    EXPECT_EQ(status->health.status, HealthStatus::Degraded);

    scripted->state_->healthy = true;
    EXPECT_EQ(loader_->status("wobbly")->state, ModuleState::Running);
}

TEST_F(ModuleLoaderTest, ConfigProviderOverridesDefaults) {
    loader_ = std::make_unique<ModuleLoader>(
        registry_, catalog_, ModuleLoader::Options{},
        [](const ModuleManifest& m) {
            auto cfg = m.defaults;
            if (m.name == "quiet") cfg["tool"] = false;
            return cfg;
        });
    ASSERT_TRUE(loader_->load_all({manifest("quiet"), manifest("loud")}).ok());
    EXPECT_FALSE(registry_->get("quiet:ping").has_value());
    EXPECT_TRUE(registry_->get("loud:ping").has_value());
}

TEST_F(ModuleLoaderTest, BuiltinHelloUsesEchoWhenPresent) {
    auto echo = manifest("echo");
    echo.entry = "builtin:echo";
    auto hello = manifest("hello", {}, {"echo"}, {{"greeting", "Hi"}});
    hello.entry = "builtin:hello";
    ASSERT_TRUE(loader_->load_all({hello, echo}).ok());

    auto result = registry_->call("hello:greet", {{"name", "Ada"}});
    ASSERT_TRUE(std::holds_alternative<nlohmann::json>(result));
    EXPECT_EQ(std::get<nlohmann::json>(result)["content"][0]["text"], "Hi, Ada!");

    auto status = loader_->status("hello");
    EXPECT_EQ(status->health.detail["echo"], true);
    EXPECT_EQ(status->health.detail["greetings"], 1);

    auto echo_status = loader_->status("echo");
    EXPECT_EQ(echo_status->health.detail["echoes"], 1);
}

TEST_F(ModuleLoaderTest, BuiltinHelloRejectsBadGreeting) {
    auto hello = manifest("hello", {}, {}, {{"greeting", 7}});
    hello.entry = "builtin:hello";
    auto report = loader_->load_all({hello});
    ASSERT_EQ(report.failed.size(), 1u);
    EXPECT_EQ(report.failed[0].kind, ErrorKind::ModuleStartFailure);
}

TEST_F(ModuleLoaderTest, LoadDirectoryMissing) {
    auto report = loader_->load_directory("/nonexistent/mcphost/modules");
    ASSERT_EQ(report.failed.size(), 1u);
    EXPECT_EQ(report.failed[0].kind, ErrorKind::ModuleLoadFailure);
}

TEST_F(ModuleLoaderTest, StatusSerializes) {
    ASSERT_TRUE(loader_->load_all({manifest("m")}).ok());
    nlohmann::json j = loader_->status();
    ASSERT_EQ(j.size(), 1u);
    EXPECT_EQ(j[0]["name"], "m");
    EXPECT_EQ(j[0]["state"], "running");
    EXPECT_EQ(j[0]["health"]["status"], "ok");
    EXPECT_EQ(j[0]["tools"], nlohmann::json::array({"m:ping"}));
}

TEST_F(ModuleLoaderTest, MetricsStartEmpty) {
    auto m = loader_->metrics();
    EXPECT_EQ(m.starts, 0u);
    EXPECT_EQ(m.stops, 0u);
    EXPECT_EQ(m.resolutions, 0u);
    EXPECT_TRUE(m.module_start_ms.empty());
}

TEST_F(ModuleLoaderTest, MetricsTrackStartsAndStops) {
    ASSERT_TRUE(loader_->load_all({manifest("base", {}, {}, {{"start_ms", 20}}),
                                   manifest("top", {"base"}, {}, {{"stop_ms", 20}})}).ok());
    auto m = loader_->metrics();
    EXPECT_EQ(m.starts, 1u);
    EXPECT_EQ(m.resolutions, 1u);
    EXPECT_EQ(m.cycles_detected, 0u);
    ASSERT_EQ(m.module_start_ms.size(), 2u);
    EXPECT_GE(m.module_start_ms["base"], 15.0);
    EXPECT_GE(m.last_start_ms, m.module_start_ms["base"]);
    EXPECT_TRUE(m.module_stop_ms.empty());

    loader_->stop_all();
    m = loader_->metrics();
    EXPECT_EQ(m.stops, 1u);
    ASSERT_EQ(m.module_stop_ms.size(), 2u);
    EXPECT_GE(m.module_stop_ms["top"], 15.0);
    EXPECT_GE(m.last_stop_ms, m.module_stop_ms["top"]);
}

TEST_F(ModuleLoaderTest, MetricsCountCycles) {
    auto report = loader_->load_all({manifest("a", {"b"}), manifest("b", {"a"}), manifest("c")});
    EXPECT_EQ(report.succeeded, std::vector<std::string>{"c"});

    ASSERT_TRUE(loader_->load_all({manifest("d")}).ok());
    auto m = loader_->metrics();
    EXPECT_EQ(m.starts, 2u);
    EXPECT_EQ(m.resolutions, 2u);
    // The failed pair is still in the graph on the second pass.
    EXPECT_EQ(m.cycles_detected, 2u);
    EXPECT_EQ(m.module_start_ms.count("a"), 0u);
}

TEST_F(ModuleLoaderTest, MetricsSerialize) {
    ASSERT_TRUE(loader_->load_all({manifest("m")}).ok());
    nlohmann::json j = loader_->metrics();
    EXPECT_EQ(j["starts"], 1);
    EXPECT_EQ(j["stops"], 0);
    EXPECT_TRUE(j["module_start_ms"].contains("m"));
    EXPECT_EQ(j["resolver"]["resolutions"], 1);
    EXPECT_TRUE(j["resolver"]["last_resolution_ms"].is_number());
}
