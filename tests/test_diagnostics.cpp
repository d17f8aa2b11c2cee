#include <gtest/gtest.h>
#include <ember/diagnostics.hpp>

#include <string>

namespace {

TEST(Diagnostics, ScanError) {
    auto r = ember::scan("1 +\n  @");
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(ember::format_diagnostic(r.errors[0]), "[line 2:3] Error: Unexpected character '@'.");
    EXPECT_EQ(ember::error_kind_name(r.errors[0].kind), "UNEXPECTED_CHARACTER");
}

TEST(Diagnostics, NonPrintableCharacter) {
    auto r = ember::scan(std::string("1 \x01"));
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].message, "Unexpected character (byte 0x01).");
}

TEST(Diagnostics, ParseErrorAtEnd) {
    try {
        ember::parse(ember::scan("(1").tokens);
        FAIL() << "expected a parse error";
    } catch (const ember::ParseError& e) {
        EXPECT_EQ(ember::format_diagnostic(e),
                  "[line 1:3] Error at end: Expected RIGHT_PAREN but found end of input.");
        EXPECT_EQ(ember::error_kind_name(e.kind()), "UNEXPECTED_TOKEN");
    }
}

TEST(Diagnostics, ParseErrorAtToken) {
    try {
        ember::parse(ember::scan("1 +\n  * 2").tokens);
        FAIL() << "expected a parse error";
    } catch (const ember::ParseError& e) {
        EXPECT_EQ(ember::format_diagnostic(e),
                  "[line 2:3] Error at '*': Expected expression but found STAR '*'.");
    }
}

TEST(Diagnostics, ParseErrorStaysOnOneLine) {
    try {
        ember::parse(ember::scan("1 \"a\nb\"").tokens);
        FAIL() << "expected a parse error";
    } catch (const ember::ParseError& e) {
        std::string msg = ember::format_diagnostic(e);
        EXPECT_EQ(msg.find('\n'), std::string::npos);
        EXPECT_EQ(msg, "[line 1:3] Error at '\"a\\nb\"': Expected EOF but found STRING '\"a\\nb\"'.");
    }
}

TEST(Diagnostics, EscapesControlCharacters) {
    EXPECT_EQ(ember::escape("a\r\n\tb"), "a\\r\\n\\tb");
    EXPECT_EQ(ember::escape("plain"), "plain");

    auto r = ember::scan("/* one\ntwo */");
    ASSERT_EQ(r.tokens.size(), 2u);
    std::string dump = ember::format_token(r.tokens[0]);
    EXPECT_EQ(dump.find('\n'), std::string::npos);
    EXPECT_EQ(dump, "COMMENT '/* one\\ntwo */' one\\ntwo @1:1");
}

TEST(Diagnostics, NestingTooDeep) {
    try {
        ember::parse(ember::scan(std::string(300, '(') + "1").tokens);
        FAIL() << "expected a parse error";
    } catch (const ember::ParseError& e) {
        EXPECT_EQ(ember::error_kind_name(e.kind()), "NESTING_TOO_DEEP");
        EXPECT_EQ(ember::format_diagnostic(e),
                  "[line 1:257] Error at '(': Expression nested deeper than 256 levels at LEFT_PAREN '('.");
    }
}

TEST(Diagnostics, TokenDump) {
    auto r = ember::scan("12.5 x");
    ASSERT_EQ(r.tokens.size(), 3u);
    EXPECT_EQ(ember::format_token(r.tokens[0]), "NUMBER '12.5' 12.5 @1:1");
    EXPECT_EQ(ember::format_token(r.tokens[1]), "IDENT 'x' @1:6");
    EXPECT_EQ(ember::format_token(r.tokens[2]), "EOF '' @1:7");
}

} // namespace
