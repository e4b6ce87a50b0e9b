#include <gtest/gtest.h>
#include <screen/chunker.hpp>
#include <string>

static std::string join(const std::vector<std::string>& chunks) {
    std::string out;
    for (const auto& c : chunks) out += c;
    return out;
}

TEST(Chunker, ShortTextIsOneChunk) {
    auto chunks = chunk_text("hello", 3800);
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0], "hello");
}

TEST(Chunker, EmptyTextIsOneEmptyChunk) {
    auto chunks = chunk_text("", 10);
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0], "");
}

TEST(Chunker, PrefersNewlinePastHalfBudget) {
    // newline at index 7 of a 10-byte budget
    std::string text = "aaaaaaa\nbbbbbbbbbb";
    auto chunks = chunk_text(text, 10);
    ASSERT_GE(chunks.size(), 2u);
    EXPECT_EQ(chunks[0], "aaaaaaa");
    EXPECT_EQ(chunks[1][0], '\n');
    EXPECT_EQ(join(chunks), text);
}

TEST(Chunker, IgnoresNewlineBeforeHalfBudget) {
    std::string text = "aa\nbbbbbbbbbbbbbbbbbb";
    auto chunks = chunk_text(text, 10);
    EXPECT_EQ(chunks[0], "aa\nbbbbbbb");
    EXPECT_EQ(join(chunks), text);
}

TEST(Chunker, NeverSplitsMultibyteCharacter) {
    std::string text;
    for (int i = 0; i < 20; ++i) text += "é";   // 2 bytes each
    auto chunks = chunk_text("x" + text, 8);
    for (const auto& c : chunks) {
        EXPECT_LE(c.size(), 8u);
        ASSERT_FALSE(c.empty());
        EXPECT_NE(static_cast<unsigned char>(c[0]) & 0xC0, 0x80);
    }
    EXPECT_EQ(join(chunks), "x" + text);
}

TEST(Chunker, RoundTripAndBudgetOnLongResponse) {
    std::string text;
    for (int i = 0; i < 500; ++i) {
        text += "line " + std::to_string(i) + " ⏺ some words to make it longer\n";
    }
    const size_t budget = 3800;
    auto chunks = chunk_text(text, budget);
    EXPECT_GT(chunks.size(), 1u);
    for (const auto& c : chunks) EXPECT_LE(c.size(), budget);
    EXPECT_EQ(join(chunks), text);
}
