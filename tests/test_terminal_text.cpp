#include <gtest/gtest.h>

#include <string>

#include "utils/terminal_text.hpp"

using compass::utils::AppendOutput;
using compass::utils::CleanAnsi;
using compass::utils::DecodeChunk;

TEST(TerminalText, DecodeAcceptsCompleteUtf8) {
    const std::string text = "caf\xc3\xa9 \xe2\x9c\x93";
    const auto decoded = DecodeChunk(text.data(), text.size());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, text);
}

TEST(TerminalText, DecodeDropsSplitMultibyteSequence) {
    // "é" is 0xC3 0xA9; a read boundary between the two bytes yields two
    // chunks that are invalid on their own, and both are dropped.
    const std::string first = "abc\xc3";
    const std::string second = "\xa9xyz";
    EXPECT_EQ(DecodeChunk(first.data(), first.size()), std::nullopt);
    EXPECT_EQ(DecodeChunk(second.data(), second.size()), std::nullopt);
}

TEST(TerminalText, DecodeRejectsOverlongAndSurrogates) {
    const std::string overlong = "\xc0\xaf";
    const std::string surrogate = "\xed\xa0\x80";
    EXPECT_FALSE(DecodeChunk(overlong.data(), overlong.size()).has_value());
    EXPECT_FALSE(DecodeChunk(surrogate.data(), surrogate.size()).has_value());
}

TEST(TerminalText, CleanAnsiStripsEscapes) {
    EXPECT_EQ(CleanAnsi("\x1b[1;32mok\x1b[0m"), "ok");
    EXPECT_EQ(CleanAnsi("\x1b]0;title\x07rest"), "rest");
    EXPECT_EQ(CleanAnsi("\x1b(Bplain"), "plain");
    EXPECT_EQ(CleanAnsi("no escapes"), "no escapes");
}

TEST(TerminalText, AppendOutputNormalizesTerminalText) {
    std::string buffer = "start\n";
    AppendOutput(buffer, "line one\r\nline\ttwo\x07\r\n");
    EXPECT_EQ(buffer, "start\nline one\nline\ttwo\n");
}
