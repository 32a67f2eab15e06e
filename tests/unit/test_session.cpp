#include <gtest/gtest.h>
#include "mcphost/session.hpp"
#include "mcphost/error.hpp"
#include <atomic>
#include <regex>
#include <set>
#include <thread>

using namespace mcphost;

namespace {

SessionManager::Options short_lived(std::chrono::milliseconds timeout) {
    SessionManager::Options o;
    o.session_timeout = timeout;
    o.sweep_interval = std::chrono::milliseconds(10);
    return o;
}

Implementation client() {
    return Implementation{"test-client", std::nullopt, "1.0"};
}

} // anonymous namespace

TEST(SessionManager, CreateAndAcquire) {
    SessionManager mgr(SessionManager::Options{});
    auto s = mgr.create(client(), {{"roots", nlohmann::json::object()}});
    ASSERT_NE(s, nullptr);
    EXPECT_EQ(mgr.size(), 1u);
    EXPECT_TRUE(mgr.valid(s->id()));
    EXPECT_EQ(mgr.acquire(s->id()), s);
    EXPECT_EQ(s->client_info().name, "test-client");
    EXPECT_TRUE(s->client_capabilities().contains("roots"));
    EXPECT_LE(s->created_at(), s->last_activity());
}

TEST(SessionManager, IdsAreUuidV4AndUnique) {
    std::regex uuid("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i) {
        auto id = SessionManager::generate_id();
        EXPECT_TRUE(std::regex_match(id, uuid)) << id;
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 200u);
}

TEST(SessionManager, UnknownIdIsInvalid) {
    SessionManager mgr(SessionManager::Options{});
    EXPECT_FALSE(mgr.valid("nope"));
    EXPECT_FALSE(mgr.touch("nope"));
    EXPECT_EQ(mgr.acquire("nope"), nullptr);
}

TEST(SessionManager, IdleSessionExpires) {
    SessionManager mgr(short_lived(std::chrono::milliseconds(50)));
    auto s = mgr.create(client());
    auto id = s->id();
    auto channel = s->open_channel();

    std::this_thread::sleep_for(std::chrono::milliseconds(120));
    EXPECT_FALSE(mgr.valid(id));
    EXPECT_EQ(mgr.acquire(id), nullptr);
    EXPECT_EQ(mgr.size(), 0u);
    EXPECT_TRUE(s->is_closed());
    EXPECT_FALSE(channel->is_open());
}

TEST(SessionManager, TouchExtendsLifetime) {
    SessionManager mgr(short_lived(std::chrono::milliseconds(150)));
    auto id = mgr.create(client())->id();
    for (int i = 0; i < 5; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(60));
        ASSERT_TRUE(mgr.touch(id)) << "iteration " << i;
    }
    EXPECT_TRUE(mgr.valid(id));
}

TEST(SessionManager, ValidDoesNotExtend) {
    SessionManager mgr(short_lived(std::chrono::milliseconds(100)));
    auto id = mgr.create(client())->id();
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    EXPECT_TRUE(mgr.valid(id));
    std::this_thread::sleep_for(std::chrono::milliseconds(80));
    EXPECT_FALSE(mgr.valid(id));
}

TEST(SessionManager, DestroyClosesChannels) {
    SessionManager mgr(SessionManager::Options{});
    auto s = mgr.create(client());
    auto c1 = s->open_channel();
    auto c2 = s->open_channel();
    EXPECT_EQ(s->channel_count(), 2u);

    EXPECT_TRUE(mgr.destroy(s->id()));
    EXPECT_FALSE(mgr.destroy(s->id()));
    EXPECT_FALSE(c1->is_open());
    EXPECT_FALSE(c2->is_open());
    EXPECT_EQ(s->open_channel(), nullptr);
    EXPECT_FALSE(mgr.valid(s->id()));
}

TEST(SessionManager, SweepEvictsOnlyIdle) {
    SessionManager mgr(short_lived(std::chrono::milliseconds(80)));
    auto idle = mgr.create(client());
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    auto fresh = mgr.create(client());
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    EXPECT_EQ(mgr.sweep(), 1u);
    EXPECT_TRUE(idle->is_closed());
    EXPECT_FALSE(fresh->is_closed());
    EXPECT_EQ(mgr.size(), 1u);
}

TEST(SessionManager, BackgroundSweeper) {
    SessionManager mgr(short_lived(std::chrono::milliseconds(30)));
    mgr.start_sweeper();
    auto s = mgr.create(client());
    for (int i = 0; i < 100 && mgr.size() > 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(mgr.size(), 0u);
    EXPECT_TRUE(s->is_closed());
    mgr.stop_sweeper();
}

TEST(SessionManager, SweeperNeverEvictsActiveSession) {
    SessionManager::Options o;
    o.session_timeout = std::chrono::milliseconds(40);
    o.sweep_interval = std::chrono::milliseconds(1);
    SessionManager mgr(o);
    mgr.start_sweeper();

    auto s = mgr.create(client());
    auto channel = s->open_channel();
    std::atomic<int> misses{0};
    std::thread toucher([&] {
        auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(400);
        while (std::chrono::steady_clock::now() < until) {
            if (!mgr.acquire(s->id())) ++misses;
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
    });
    toucher.join();
    mgr.stop_sweeper();

    EXPECT_EQ(misses.load(), 0);
    EXPECT_TRUE(mgr.valid(s->id()));
    EXPECT_FALSE(s->is_closed());
    EXPECT_TRUE(channel->is_open());
}

TEST(SessionManager, ZeroSweepIntervalStillSweepsAndStops) {
    SessionManager::Options o;
    o.session_timeout = std::chrono::milliseconds(20);
    o.sweep_interval = std::chrono::milliseconds(0);
    SessionManager mgr(o);
    mgr.start_sweeper();
    auto s = mgr.create(client());
    for (int i = 0; i < 100 && mgr.size() > 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(mgr.size(), 0u);
    EXPECT_TRUE(s->is_closed());
    mgr.stop_sweeper();
}

TEST(SessionManager, SessionLimit) {
    SessionManager::Options o;
    o.max_sessions = 2;
    SessionManager mgr(o);
    mgr.create(client());
    auto second = mgr.create(client());
    EXPECT_THROW(mgr.create(client()), McpError);
    mgr.destroy(second->id());
    EXPECT_NO_THROW(mgr.create(client()));
}

TEST(Session, BroadcastReachesOpenChannels) {
    SessionManager mgr(SessionManager::Options{});
    auto s = mgr.create(client());
    auto a = s->open_channel();
    auto b = s->open_channel();
    s->remove_channel(b);

    EXPECT_EQ(s->broadcast("hello"), 1u);
    EXPECT_EQ(a->pop(std::chrono::milliseconds(10)), "hello");
    EXPECT_FALSE(b->pop(std::chrono::milliseconds(10)).has_value());
}
