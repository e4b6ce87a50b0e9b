#include <gtest/gtest.h>
#include <managers/session_registry.hpp>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

static SessionRegistry::SpawnFn spawn_named(const std::string& name) {
    return [name]() { return Result<TerminalHandle>::Ok(TerminalHandle{name}); };
}

TEST(SessionRegistry, CreateThenGetReturnsSameSession) {
    SessionRegistry reg;
    bool created = false;
    auto a = reg.create_or_get("c1", "/repo", SessionMode::Normal, spawn_named("t-1"), &created);
    ASSERT_TRUE(a.is_ok());
    EXPECT_TRUE(created);

    auto b = reg.create_or_get("c1", "/repo", SessionMode::Auto, spawn_named("t-2"), &created);
    ASSERT_TRUE(b.is_ok());
    EXPECT_FALSE(created);
    EXPECT_EQ(b.value.handle.name, "t-1");
    EXPECT_EQ(b.value.mode, SessionMode::Normal);
    EXPECT_EQ(reg.size(), 1u);
}

TEST(SessionRegistry, FailedSpawnCreatesNothing) {
    SessionRegistry reg;
    auto r = reg.create_or_get("c1", "/repo", SessionMode::Normal, []() {
        return Result<TerminalHandle>::Err("timeout");
    });
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(reg.size(), 0u);
    EXPECT_FALSE(reg.find("c1").has_value());
}

TEST(SessionRegistry, ConcurrentCreateSpawnsOnce) {
    SessionRegistry reg;
    std::atomic<int> spawns{0};
    auto slow_spawn = [&]() {
        ++spawns;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return Result<TerminalHandle>::Ok(TerminalHandle{"only"});
    };

    std::vector<std::thread> threads;
    std::vector<std::string> names(8);
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i]() {
            auto r = reg.create_or_get("same", "/repo", SessionMode::Normal, slow_spawn);
            if (r.is_ok()) names[i] = r.value.handle.name;
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(spawns.load(), 1);
    EXPECT_EQ(reg.size(), 1u);
    for (const auto& n : names) EXPECT_EQ(n, "only");
}

TEST(SessionRegistry, SetRequestReturnsReplaced) {
    SessionRegistry reg;
    reg.create_or_get("c1", "/repo", SessionMode::Normal, spawn_named("t"));

    std::optional<OutstandingRequest> replaced;
    EXPECT_TRUE(reg.set_request("c1", {"thread", "r1"}, &replaced));
    EXPECT_FALSE(replaced.has_value());

    EXPECT_TRUE(reg.set_request("c1", {"thread", "r2"}, &replaced));
    ASSERT_TRUE(replaced.has_value());
    EXPECT_EQ(replaced->request_id, "r1");
    EXPECT_EQ(reg.find("c1")->request->request_id, "r2");

    EXPECT_FALSE(reg.set_request("missing", {"thread", "r3"}));
}

TEST(SessionRegistry, RecordEmissionClearsMatchingRequestOnly) {
    SessionRegistry reg;
    auto rec = reg.create_or_get("c1", "/repo", SessionMode::Normal, spawn_named("t")).value;
    reg.set_request("c1", {"thread", "r2"});

    // A tick that started for an older request must not clear the new one
    EXPECT_FALSE(reg.record_emission("c1", rec.generation, "r1", "old", "screen"));
    EXPECT_TRUE(reg.find("c1")->request.has_value());

    EXPECT_TRUE(reg.record_emission("c1", rec.generation, "r2", "answer", "screen"));
    auto after = reg.find("c1");
    EXPECT_FALSE(after->request.has_value());
    EXPECT_EQ(after->last_emitted, "answer");
    EXPECT_EQ(after->last_snapshot, "screen");
}

TEST(SessionRegistry, RecordEmissionRejectsRecreatedSession) {
    SessionRegistry reg;
    auto old_rec = reg.create_or_get("c1", "/repo", SessionMode::Normal, spawn_named("t1")).value;
    reg.remove("c1");
    auto new_rec = reg.create_or_get("c1", "/repo", SessionMode::Normal, spawn_named("t2")).value;
    reg.set_request("c1", {"thread", "r1"});

    EXPECT_NE(old_rec.generation, new_rec.generation);
    EXPECT_FALSE(reg.record_emission("c1", old_rec.generation, "r1", "x", "s"));
    EXPECT_TRUE(reg.record_emission("c1", new_rec.generation, "r1", "x", "s"));
}

TEST(SessionRegistry, RemoveDropsAllState) {
    SessionRegistry reg;
    reg.create_or_get("c1", "/repo", SessionMode::Normal, spawn_named("t1"));
    reg.set_request("c1", {"thread", "r1"});

    auto removed = reg.remove("c1");
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(removed->handle.name, "t1");
    EXPECT_FALSE(reg.find("c1").has_value());
    EXPECT_TRUE(reg.with_requests().empty());
    EXPECT_FALSE(reg.remove("c1").has_value());

    // The freed slot is reused without leaking the old record's state
    reg.create_or_get("c2", "/repo", SessionMode::Normal, spawn_named("t2"));
    auto c2 = reg.find("c2");
    ASSERT_TRUE(c2.has_value());
    EXPECT_FALSE(c2->request.has_value());
    EXPECT_EQ(reg.size(), 1u);
}

TEST(SessionRegistry, RemoveIfExpiredChecksCurrentActivity) {
    using namespace std::chrono_literals;
    SessionRegistry reg;
    reg.create_or_get("c1", "/repo", SessionMode::Normal, spawn_named("t-1"));
    auto now = SessionClock::now();
    reg.touch("c1", now - 2h);
    auto listed = reg.find("c1");
    ASSERT_TRUE(listed.has_value());

    // Activity lands after the listing was taken
    reg.touch("c1", now);
    EXPECT_FALSE(reg.remove_if_expired("c1", listed->generation, now, 30min).has_value());
    EXPECT_TRUE(reg.find("c1").has_value());

    reg.touch("c1", now - 2h);
    EXPECT_FALSE(reg.remove_if_expired("c1", listed->generation + 1, now, 30min).has_value());
    auto removed = reg.remove_if_expired("c1", listed->generation, now, 30min);
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(removed->handle.name, "t-1");
    EXPECT_EQ(reg.size(), 0u);
}

TEST(SessionRegistry, TickClaimIsExclusive) {
    SessionRegistry reg;
    auto rec = reg.create_or_get("c1", "/repo", SessionMode::Normal, spawn_named("t")).value;

    EXPECT_TRUE(reg.try_begin_tick("c1").has_value());
    EXPECT_FALSE(reg.try_begin_tick("c1").has_value());
    reg.end_tick("c1", rec.generation);
    EXPECT_TRUE(reg.try_begin_tick("c1").has_value());
}

TEST(SessionRegistry, DecisionNoticeOncePerEpisode) {
    SessionRegistry reg;
    auto rec = reg.create_or_get("c1", "/repo", SessionMode::Normal, spawn_named("t")).value;

    EXPECT_TRUE(reg.mark_decision_notified("c1", rec.generation));
    EXPECT_FALSE(reg.mark_decision_notified("c1", rec.generation));
    reg.clear_decision_notified("c1");
    EXPECT_TRUE(reg.mark_decision_notified("c1", rec.generation));
}

TEST(SessionRegistry, WithRequestsFiltersIdleSessions) {
    SessionRegistry reg;
    reg.create_or_get("a", "/repo", SessionMode::Normal, spawn_named("ta"));
    reg.create_or_get("b", "/repo", SessionMode::Normal, spawn_named("tb"));
    reg.set_request("b", {"thread", "r1"});

    auto pending = reg.with_requests();
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].id, "b");
    EXPECT_EQ(reg.all().size(), 2u);
}
