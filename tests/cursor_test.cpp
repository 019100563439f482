#include <gtest/gtest.h>
#include "lmm/cursor.hpp"

using lmm::detail::cursor;
using lmm::detail::decode_utf8;

TEST(Cursor, DecodesAsciiAndMultibyte){
    std::string s = "a\xC3\xA9\xE4\xB8\xAD\xF0\x9F\x98\x80";
    auto a = decode_utf8(s, 0);
    EXPECT_EQ(a.cp, U'a'); EXPECT_EQ(a.len8, 1u); EXPECT_EQ(a.len16, 1u);
    auto e = decode_utf8(s, 1);
    EXPECT_EQ(e.cp, 0xE9u); EXPECT_EQ(e.len8, 2u); EXPECT_EQ(e.len16, 1u);
    auto zh = decode_utf8(s, 3);
    EXPECT_EQ(zh.cp, 0x4E2Du); EXPECT_EQ(zh.len8, 3u); EXPECT_EQ(zh.len16, 1u);
    auto smile = decode_utf8(s, 6);
    EXPECT_EQ(smile.cp, 0x1F600u); EXPECT_EQ(smile.len8, 4u); EXPECT_EQ(smile.len16, 2u);
}

TEST(Cursor, MalformedBytesCountAsOneUnit){
    // stray continuation, truncated sequence, overlong lead, encoded surrogate
    for(std::string s : { std::string("\x80"), std::string("\xE4\xB8"), std::string("\xC0\xAF"), std::string("\xED\xA0\x80") }){
        auto c = decode_utf8(s, 0);
        EXPECT_EQ(c.cp, 0xFFFDu);
        EXPECT_EQ(c.len8, 1u);
        EXPECT_EQ(c.len16, 1u);
    }
}

TEST(Cursor, AdvanceCharKeepsColumnsInStep){
    cursor c("\xC3\xA9x\xF0\x9F\x98\x80y");
    c.advance_char();
    EXPECT_EQ(c.pos.col8, 2u); EXPECT_EQ(c.pos.col16, 1u); EXPECT_EQ(c.pos.col32, 1u);
    c.advance_char();
    c.advance_char();
    EXPECT_EQ(c.pos.col8, 7u); EXPECT_EQ(c.pos.col16, 4u); EXPECT_EQ(c.pos.col32, 3u);
    c.advance_char();
    EXPECT_TRUE(c.eof());
    c.advance_char(); // no-op at end
    EXPECT_EQ(c.pos.col32, 4u);
}

TEST(Cursor, NewlineResetsColumns){
    cursor c("ab\ncd");
    c.advance_to(3);
    EXPECT_EQ(c.pos.line, 1u);
    EXPECT_EQ(c.pos.col8, 0u);
    EXPECT_EQ(c.pos.col16, 0u);
    EXPECT_EQ(c.pos.col32, 0u);
    EXPECT_TRUE(c.at_line_start());
    EXPECT_EQ(c.line(), "cd");
}

TEST(Cursor, AdvanceLineAndRestOfLine){
    cursor c("hello world\nnext\n");
    c.advance_to(6);
    EXPECT_EQ(c.rest_of_line(), "world");
    EXPECT_EQ(c.offset_in_line(), 6u);
    c.advance_line();
    EXPECT_EQ(c.pos.line, 1u);
    EXPECT_EQ(c.line(), "next");
    c.advance_line();
    EXPECT_TRUE(c.eof());
    EXPECT_EQ(c.line(), "");
    EXPECT_EQ(c.rest_of_line(), "");
}

TEST(Cursor, AdvanceToClampsAtEnd){
    cursor c("abc");
    c.advance_to(100);
    EXPECT_TRUE(c.eof());
    EXPECT_EQ(c.p, 3u);
    EXPECT_EQ(c.pos.col8, 3u);
}
