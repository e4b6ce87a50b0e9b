#include <gtest/gtest.h>
#include <terminal/agent_process.hpp>
#include "fake_terminal.hpp"

static TimingConfig fast_timing() {
    TimingConfig t;
    t.ready_interval_ms = 1;
    t.ready_timeout_secs = 1;
    t.ready_stable_count = 3;
    t.submit_delay_ms = 0;
    t.kill_grace_ms = 0;
    return t;
}

static RetryPolicy policy(int attempts) {
    RetryPolicy p;
    p.max_attempts = attempts;
    p.interval_ms = 1;
    p.stable_threshold = 3;
    return p;
}

TEST(AgentProcess, CommandLineAddsBypassFlagOnlyWhenDangerous) {
    FakeTerminalDriver driver;
    AgentProcess agent(driver, AgentConfig{}, fast_timing());

    auto normal = agent.command_line(false);
    ASSERT_EQ(normal.size(), 1u);
    EXPECT_EQ(normal[0], "claude");

    auto dangerous = agent.command_line(true);
    ASSERT_EQ(dangerous.size(), 2u);
    EXPECT_EQ(dangerous[1], "--dangerously-skip-permissions");
}

TEST(AgentProcess, ReadyAfterThreeStablePrompts) {
    FakeTerminalDriver driver;
    AgentProcess agent(driver, AgentConfig{}, fast_timing());
    driver.create({"t", "/repo", {"claude"}, {}});
    driver.play("t", {"booting", ">", ">", ">"});

    EXPECT_EQ(agent.wait_ready({"t"}, policy(4)), SpawnError::None);
}

TEST(AgentProcess, BoxedPromptWithHintLineIsReady) {
    FakeTerminalDriver driver;
    AgentProcess agent(driver, AgentConfig{}, fast_timing());
    driver.create({"t", "/repo", {"claude"}, {}});
    driver.set_screen("t",
        "╭──────────────────╮\n"
        "│ >                │\n"
        "╰──────────────────╯\n"
        "  ? for shortcuts\n");

    EXPECT_EQ(agent.wait_ready({"t"}, policy(3)), SpawnError::None);
}

TEST(AgentProcess, TransientPromptDoesNotCountAsReady) {
    FakeTerminalDriver driver;
    AgentProcess agent(driver, AgentConfig{}, fast_timing());
    driver.create({"t", "/repo", {"claude"}, {}});
    // prompt, redraw, prompt, prompt: never three in a row within 4 polls
    driver.play("t", {">", "loading", ">", ">", "loading"});

    EXPECT_EQ(agent.wait_ready({"t"}, policy(4)), SpawnError::Timeout);
}

TEST(AgentProcess, FirstRunPromptAnsweredAndCounterReset) {
    FakeTerminalDriver driver;
    AgentProcess agent(driver, AgentConfig{}, fast_timing());
    driver.create({"t", "/repo", {"claude"}, {}});
    driver.play("t", {
        "Do you trust the files in this folder?\n❯ 1. Yes, I trust this folder\n>",
        ">", ">", ">",
    });

    EXPECT_EQ(agent.wait_ready({"t"}, policy(10)), SpawnError::None);
    auto inputs = driver.inputs_for("t");
    ASSERT_EQ(inputs.size(), 2u);
    EXPECT_EQ(inputs[0], "key:1");
    EXPECT_EQ(inputs[1], "key:Enter");
}

TEST(AgentProcess, ProcessExitWhileBootingIsProcessError) {
    FakeTerminalDriver driver;
    AgentProcess agent(driver, AgentConfig{}, fast_timing());
    driver.create({"t", "/repo", {"claude"}, {}});
    driver.vanish("t");

    EXPECT_EQ(agent.wait_ready({"t"}, policy(5)), SpawnError::ProcessError);
}

TEST(AgentProcess, SpawnTimeoutDestroysTerminal) {
    FakeTerminalDriver driver;
    driver.initial_screen = "still loading";
    AgentProcess agent(driver, AgentConfig{}, fast_timing());
    agent.set_retry_policy(policy(3));

    auto r = agent.spawn("t", "/repo", false);
    EXPECT_EQ(r.error, SpawnError::Timeout);
    EXPECT_FALSE(r.ok());
    EXPECT_FALSE(driver.exists({"t"}));
}

TEST(AgentProcess, SpawnCreateFailureIsProcessError) {
    FakeTerminalDriver driver;
    driver.fail_create = true;
    AgentProcess agent(driver, AgentConfig{}, fast_timing());

    auto r = agent.spawn("t", "/repo", false);
    EXPECT_EQ(r.error, SpawnError::ProcessError);
    EXPECT_FALSE(r.message.empty());
}

TEST(AgentProcess, SpawnPassesDirectoryCommandAndEnv) {
    FakeTerminalDriver driver;
    AgentProcess agent(driver, AgentConfig{}, fast_timing());

    auto r = agent.spawn("t", "/srv/app", true, {{"ANTHROPIC_API_KEY", "k"}});
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.handle.name, "t");
    ASSERT_EQ(driver.created.size(), 1u);
    EXPECT_EQ(driver.created[0].working_dir, "/srv/app");
    EXPECT_EQ(driver.created[0].command.back(), "--dangerously-skip-permissions");
    EXPECT_EQ(driver.created[0].env.at("ANTHROPIC_API_KEY"), "k");
}

TEST(AgentProcess, SendTextTypesThenSubmits) {
    FakeTerminalDriver driver;
    AgentProcess agent(driver, AgentConfig{}, fast_timing());
    driver.create({"t", "/repo", {"claude"}, {}});

    ASSERT_TRUE(agent.send_text({"t"}, "fix bug").is_ok());
    auto inputs = driver.inputs_for("t");
    ASSERT_EQ(inputs.size(), 2u);
    EXPECT_EQ(inputs[0], "text:fix bug");
    EXPECT_EQ(inputs[1], "key:Enter");
}

TEST(AgentProcess, SendTextToMissingTerminalFails) {
    FakeTerminalDriver driver;
    AgentProcess agent(driver, AgentConfig{}, fast_timing());
    EXPECT_TRUE(agent.send_text({"nope"}, "hi").is_err());
}

TEST(AgentProcess, KillSendsExitDirectiveThenDestroys) {
    FakeTerminalDriver driver;
    AgentProcess agent(driver, AgentConfig{}, fast_timing());
    driver.create({"t", "/repo", {"claude"}, {}});

    agent.kill({"t"});
    auto inputs = driver.inputs_for("t");
    ASSERT_EQ(inputs.size(), 2u);
    EXPECT_EQ(inputs[0], "text:/exit");
    EXPECT_EQ(inputs[1], "key:Enter");
    EXPECT_FALSE(driver.exists({"t"}));
}

TEST(AgentProcess, RetryPolicyFromTiming) {
    TimingConfig t;
    auto p = RetryPolicy::from_timing(t);
    EXPECT_EQ(p.interval_ms, 500);
    EXPECT_EQ(p.max_attempts, 120);
    EXPECT_EQ(p.stable_threshold, 3);
}
