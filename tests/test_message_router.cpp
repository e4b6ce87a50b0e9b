#include <gtest/gtest.h>
#include <managers/message_router.hpp>
#include <managers/session_controller.hpp>
#include <managers/transcriber.hpp>
#include "fake_terminal.hpp"

static Config router_config() {
    auto r = Config::parse(
        "timing:\n"
        "  ready_interval_ms: 1\n"
        "  ready_timeout_secs: 1\n"
        "  submit_delay_ms: 0\n"
        "  kill_grace_ms: 0\n"
        "channels:\n"
        "  backend:\n"
        "    working_dir: /srv/backend\n"
        "    prefix: be\n"
        "  docs: /srv/docs\n");
    EXPECT_TRUE(r.is_ok()) << r.error;
    return r.value;
}

class FakeTranscriber : public Transcriber {
public:
    Result<std::string> transcribe(const std::string& audio_bytes) override {
        ++calls;
        if (audio_bytes == "bad") return Result<std::string>::Err("unreadable");
        return Result<std::string>::Ok("spoken words");
    }
    int calls = 0;
};

class RouterTest : public ::testing::Test {
protected:
    RouterTest()
        : config(router_config()),
          controller(config, driver, sink),
          router(config, controller, &transcriber) {}

    InboundMessage msg(const std::string& text, const std::string& channel = "backend",
                       const std::string& conversation = "t1") {
        InboundMessage m;
        m.channel = channel;
        m.conversation_id = conversation;
        m.text = text;
        m.target = "thread";
        m.request_id = "m" + std::to_string(++counter);
        return m;
    }

    FakeTerminalDriver driver;
    RecordingSink sink;
    FakeTranscriber transcriber;
    Config config;
    SessionController controller;
    MessageRouter router;
    int counter = 0;
};

TEST(ParseMessageText, StripsMentionsAndFlags) {
    auto p = parse_message_text("<@U12AB> fix the login bug --auto");
    EXPECT_EQ(p.text, "fix the login bug");
    EXPECT_EQ(p.mode, SessionMode::Auto);
}

TEST(ParseMessageText, DangerousWinsOverAuto) {
    EXPECT_EQ(parse_message_text("go --auto --yolo").mode, SessionMode::Dangerous);
    EXPECT_EQ(parse_message_text("--DANGEROUS go").mode, SessionMode::Dangerous);
    EXPECT_EQ(parse_message_text("--DANGEROUS go").text, "go");
}

TEST(ParseMessageText, PlainTextIsNormal) {
    auto p = parse_message_text("  what does main do?  ");
    EXPECT_EQ(p.text, "what does main do?");
    EXPECT_EQ(p.mode, SessionMode::Normal);
}

TEST_F(RouterTest, UnknownChannelRejected) {
    EXPECT_EQ(router.route(msg("hello", "random")), RouteOutcome::UnknownChannel);
    EXPECT_EQ(driver.create_calls.load(), 0);
}

TEST_F(RouterTest, FirstMessageSpawnsInChannelRepository) {
    EXPECT_EQ(router.route(msg("<@U1> fix it")), RouteOutcome::Submitted);
    ASSERT_EQ(driver.created.size(), 1u);
    EXPECT_EQ(driver.created[0].working_dir, "/srv/backend");
    EXPECT_EQ(driver.created[0].name.rfind("be-", 0), 0u);
    EXPECT_EQ(driver.inputs_for(driver.last_created())[0], "text:fix it");
}

TEST_F(RouterTest, ScalarChannelUsesNameAsPrefix) {
    router.route(msg("hi", "docs", "t2"));
    EXPECT_EQ(driver.last_created().rfind("docs-", 0), 0u);
}

TEST_F(RouterTest, YesAndNoAnswerPendingPrompt) {
    router.route(msg("clean up"));
    std::string name = driver.last_created();

    EXPECT_EQ(router.route(msg("YES")), RouteOutcome::Decided);
    EXPECT_EQ(driver.inputs_for(name).back(), "key:y");
    EXPECT_EQ(router.route(msg("n")), RouteOutcome::Decided);
    EXPECT_EQ(driver.inputs_for(name).back(), "key:n");
}

TEST_F(RouterTest, YesWithoutSessionIsOrdinaryText) {
    EXPECT_EQ(router.route(msg("yes")), RouteOutcome::Submitted);
    EXPECT_EQ(driver.inputs_for(driver.last_created())[0], "text:yes");
}

TEST_F(RouterTest, EndTerminatesSession) {
    router.route(msg("start"));
    std::string name = driver.last_created();

    EXPECT_EQ(router.route(msg("/end")), RouteOutcome::Terminated);
    EXPECT_FALSE(driver.exists({name}));
    EXPECT_FALSE(controller.registry().find("t1").has_value());
}

TEST_F(RouterTest, EmptyMessageIgnored) {
    EXPECT_EQ(router.route(msg("<@U1>   ")), RouteOutcome::Ignored);
    EXPECT_EQ(driver.create_calls.load(), 0);
}

TEST_F(RouterTest, AudioTranscriptAppended) {
    auto m = msg("also");
    m.attachments.push_back({"audio/mp4", "voice-bytes"});
    m.attachments.push_back({"image/png", "pixels"});

    EXPECT_EQ(router.route(m), RouteOutcome::Submitted);
    EXPECT_EQ(transcriber.calls, 1);
    EXPECT_EQ(driver.inputs_for(driver.last_created())[0], "text:also spoken words");
}

TEST_F(RouterTest, AudioOnlyMessageUsesTranscript) {
    auto m = msg("<@U1>");
    m.attachments.push_back({"audio/webm", "voice-bytes"});
    EXPECT_EQ(router.route(m), RouteOutcome::Submitted);
    EXPECT_EQ(driver.inputs_for(driver.last_created())[0], "text:spoken words");
}

TEST_F(RouterTest, FailedTranscriptionLeavesTextAlone) {
    auto m = msg("");
    m.attachments.push_back({"audio/mp4", "bad"});
    EXPECT_EQ(router.route(m), RouteOutcome::Ignored);
}

TEST_F(RouterTest, SpawnFailureReported) {
    driver.fail_create = true;
    EXPECT_EQ(router.route(msg("fix it")), RouteOutcome::StartFailed);
}

TEST_F(RouterTest, DangerousFlagSpawnsWithBypass) {
    router.route(msg("refactor --dangerous"));
    ASSERT_EQ(driver.created.size(), 1u);
    EXPECT_EQ(driver.created[0].command.back(), "--dangerously-skip-permissions");
    EXPECT_EQ(driver.inputs_for(driver.last_created())[0], "text:refactor");
}
