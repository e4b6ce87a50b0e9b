#include <gtest/gtest.h>
#include <cli/console_sink.hpp>
#include <sstream>

static Delivery response(const std::string& conv, const std::string& text) {
    Delivery d;
    d.conversation_id = conv;
    d.target = "console";
    d.request_id = "r1";
    d.kind = DeliveryKind::Response;
    d.chunks = {text};
    return d;
}

TEST(ConsoleSink, WritesThroughWhenNotHeld) {
    std::ostringstream out;
    ConsoleSink sink(out);
    sink.deliver(response("c1", "Fixed it."));
    EXPECT_NE(out.str().find("c1 [response]"), std::string::npos);
    EXPECT_NE(out.str().find("      Fixed it.\n"), std::string::npos);
    EXPECT_FALSE(sink.flush_pending());
}

TEST(ConsoleSink, HeldOutputWaitsForFlush) {
    std::ostringstream out;
    ConsoleSink sink(out);
    sink.hold_output(true);
    sink.deliver(response("c1", "first"));
    sink.deliver(response("c2", "second"));
    EXPECT_TRUE(out.str().empty());

    EXPECT_TRUE(sink.flush_pending());
    std::string text = out.str();
    size_t first = text.find("first");
    size_t second = text.find("second");
    ASSERT_NE(first, std::string::npos);
    ASSERT_NE(second, std::string::npos);
    EXPECT_LT(first, second);

    EXPECT_FALSE(sink.flush_pending());
    EXPECT_EQ(out.str(), text);
}

TEST(ConsoleSink, ReleasingHoldWritesPending) {
    std::ostringstream out;
    ConsoleSink sink(out);
    sink.hold_output(true);
    sink.deliver(response("c1", "late answer"));
    sink.hold_output(false);
    EXPECT_NE(out.str().find("late answer"), std::string::npos);

    sink.deliver(response("c1", "direct"));
    EXPECT_NE(out.str().find("direct"), std::string::npos);
}

TEST(ConsoleSink, DecisionPromptShowsReplyHint) {
    std::ostringstream out;
    ConsoleSink sink(out);
    Delivery d = response("c7", "Do you want to proceed?");
    d.kind = DeliveryKind::DecisionPrompt;
    sink.deliver(d);
    EXPECT_NE(out.str().find("reply 'yes c7' or 'no c7'"), std::string::npos);
}

TEST(ConsoleSink, RenderSeparatesChunks) {
    Delivery d = response("c1", "one");
    d.chunks.push_back("two");
    EXPECT_EQ(render_delivery(d), "one\n---\ntwo");
}
