#include <gtest/gtest.h>
#include <core/config.hpp>
#include <core/types.hpp>
#include <core/credentials.hpp>
#include <platform/platform.hpp>
#include <cstdlib>
#include <filesystem>

TEST(Config, EmptyDocumentGivesDefaults) {
    auto r = Config::parse("");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& c = r.value;
    EXPECT_EQ(c.agent().command, "claude");
    EXPECT_EQ(c.agent().exit_directive, "/exit");
    EXPECT_EQ(c.tmux().scrollback_lines, 500);
    EXPECT_EQ(c.timing().poll_interval_ms, 800);
    EXPECT_EQ(c.timing().reap_interval_secs, 300);
    EXPECT_EQ(c.timing().session_ttl_minutes, 30);
    EXPECT_EQ(c.timing().ready_stable_count, 3);
    EXPECT_EQ(c.delivery().chunk_bytes, 3800);
    EXPECT_FALSE(c.delivery().notify_superseded);
    EXPECT_EQ(c.workers(), 4);
    EXPECT_TRUE(c.channels().empty());
}

TEST(Config, OverridesAndChannels) {
    auto r = Config::parse(
        "agent:\n"
        "  command: /opt/claude\n"
        "  args: --verbose --model opus\n"
        "timing:\n"
        "  poll_interval_ms: 400\n"
        "  session_ttl_minutes: 10\n"
        "delivery:\n"
        "  chunk_bytes: 2000\n"
        "  notify_superseded: true\n"
        "workers: 8\n"
        "channels:\n"
        "  api:\n"
        "    working_dir: /srv/api\n"
        "    prefix: api-bot\n"
        "  web: /srv/web\n");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& c = r.value;

    EXPECT_EQ(c.agent().command, "/opt/claude");
    ASSERT_EQ(c.agent().args.size(), 3u);
    EXPECT_EQ(c.agent().args[2], "opus");
    EXPECT_EQ(c.timing().poll_interval_ms, 400);
    EXPECT_EQ(c.timing().session_ttl_minutes, 10);
    EXPECT_EQ(c.delivery().chunk_bytes, 2000);
    EXPECT_TRUE(c.delivery().notify_superseded);
    EXPECT_EQ(c.workers(), 8);

    const auto* api = c.find_channel("api");
    ASSERT_NE(api, nullptr);
    EXPECT_EQ(api->working_dir, "/srv/api");
    EXPECT_EQ(api->prefix, "api-bot");

    const auto* web = c.find_channel("web");
    ASSERT_NE(web, nullptr);
    EXPECT_EQ(web->working_dir, "/srv/web");
    EXPECT_EQ(web->prefix, "web");

    EXPECT_EQ(c.find_channel("missing"), nullptr);
}

TEST(Config, ValuesClamped) {
    auto r = Config::parse(
        "timing:\n"
        "  poll_interval_ms: 1\n"
        "  ready_stable_count: 0\n"
        "delivery:\n"
        "  chunk_bytes: 2\n"
        "workers: 0\n");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.timing().poll_interval_ms, 50);
    EXPECT_EQ(r.value.timing().ready_stable_count, 1);
    EXPECT_EQ(r.value.delivery().chunk_bytes, 16);
    EXPECT_EQ(r.value.workers(), 1);
}

TEST(Config, MalformedYamlIsError) {
    auto r = Config::parse("agent: [unclosed\n");
    EXPECT_TRUE(r.is_err());
    EXPECT_FALSE(r.error.empty());
}

TEST(Config, UnconvertibleValueFallsBackToDefault) {
    auto r = Config::parse("timing:\n  poll_interval_ms: fast\n");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.timing().poll_interval_ms, 800);
}

TEST(Config, MissingFileIsError) {
    auto r = Config::load_file("/nonexistent/agentmux/config.yaml");
    EXPECT_TRUE(r.is_err());
}

TEST(SessionModeNames, ParseAndName) {
    EXPECT_EQ(parse_mode("auto"), SessionMode::Auto);
    EXPECT_EQ(parse_mode("yolo"), SessionMode::Dangerous);
    EXPECT_FALSE(parse_mode("turbo").has_value());
    EXPECT_STREQ(mode_name(SessionMode::Normal), "normal");
}

// ── Credentials ─────────────────────────────────────────────

class CredentialsTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = platform::temp_file("agentmux_creds");
        setenv("AGENTMUX_CREDENTIALS", path_.c_str(), 1);
    }
    void TearDown() override {
        unsetenv("AGENTMUX_CREDENTIALS");
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
    std::filesystem::path path_;
};

TEST_F(CredentialsTest, SetGetRemove) {
    auto& creds = CredentialManager::instance();
    ASSERT_TRUE(creds.set("AGENTMUX_TEST_TOKEN", "abc=def").is_ok());

    auto got = creds.get("AGENTMUX_TEST_TOKEN");
    ASSERT_TRUE(got.is_ok());
    EXPECT_EQ(got.value, "abc=def");
    EXPECT_EQ(creds.all().at("AGENTMUX_TEST_TOKEN"), "abc=def");

    ASSERT_TRUE(creds.remove("AGENTMUX_TEST_TOKEN").is_ok());
    EXPECT_TRUE(creds.get("AGENTMUX_TEST_TOKEN").is_err());
    EXPECT_TRUE(creds.remove("AGENTMUX_TEST_TOKEN").is_err());
}

TEST_F(CredentialsTest, StoreIsOwnerOnly) {
    ASSERT_TRUE(CredentialManager::instance().set("K", "v").is_ok());
    auto perms = std::filesystem::status(path_).permissions();
    EXPECT_EQ(perms & std::filesystem::perms::group_read, std::filesystem::perms::none);
    EXPECT_EQ(perms & std::filesystem::perms::others_read, std::filesystem::perms::none);
}

TEST_F(CredentialsTest, EnvironmentFallback) {
    setenv("AGENTMUX_TEST_ONLY_IN_ENV", "from-env", 1);
    auto got = CredentialManager::instance().get("AGENTMUX_TEST_ONLY_IN_ENV");
    unsetenv("AGENTMUX_TEST_ONLY_IN_ENV");
    ASSERT_TRUE(got.is_ok());
    EXPECT_EQ(got.value, "from-env");
    EXPECT_TRUE(CredentialManager::instance().all().empty());
}

TEST_F(CredentialsTest, RejectsKeyWithEquals) {
    EXPECT_TRUE(CredentialManager::instance().set("A=B", "v").is_err());
}
