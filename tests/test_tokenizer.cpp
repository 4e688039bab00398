/*
 * Tokenizer tests - AI-CmdGuard
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <ai-cmdguard/lex/shell_tokenizer.hpp>

using namespace cmdguard;

static std::vector<ShellTokenKind> kinds_of(const ShellTokenStream& ts) {
    std::vector<ShellTokenKind> kinds;
    for (auto &t : ts) kinds.push_back(t.kind);
    return kinds;
}

TEST(TokenizerBasic, QuotedAndOperators) {
    auto r = tokenize("echo \"hello world\" && ls -l | grep cpp");
    ASSERT_TRUE(r.ok());
    std::vector<ShellTokenKind> expected = {
        ShellTokenKind::Unquoted, ShellTokenKind::DoubleQuoted, ShellTokenKind::Operator,
        ShellTokenKind::Unquoted, ShellTokenKind::Unquoted, ShellTokenKind::Operator,
        ShellTokenKind::Unquoted, ShellTokenKind::Unquoted };
    EXPECT_EQ(kinds_of(r.tokens), expected);
    EXPECT_EQ(r.tokens[1].text, "hello world");
    EXPECT_EQ(r.tokens[2].text, "&&");
    EXPECT_EQ(r.tokens[5].text, "|");
}

TEST(TokenizerQuotes, EmptySingleQuotedToken) {
    auto r = tokenize("echo ''");
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(r.tokens.size(), 2u);
    EXPECT_EQ(r.tokens[1].kind, ShellTokenKind::SingleQuoted);
    EXPECT_EQ(r.tokens[1].text, "");
}

TEST(TokenizerQuotes, SingleQuoteInsideDouble) {
    auto r = tokenize("echo \"it's\"");
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(r.tokens.size(), 2u);
    EXPECT_EQ(r.tokens[1], (ShellToken{ShellTokenKind::DoubleQuoted, "it's"}));
}

TEST(TokenizerQuotes, QuoteSplitsAdjacentText) {
    auto r = tokenize("pre'mid'post");
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(r.tokens.size(), 3u);
    EXPECT_EQ(r.tokens[0], (ShellToken{ShellTokenKind::Unquoted, "pre"}));
    EXPECT_EQ(r.tokens[1], (ShellToken{ShellTokenKind::SingleQuoted, "mid"}));
    EXPECT_EQ(r.tokens[2], (ShellToken{ShellTokenKind::Unquoted, "post"}));
}

TEST(TokenizerErrors, UnclosedQuotes) {
    auto s = tokenize("echo 'unclosed");
    ASSERT_FALSE(s.ok());
    EXPECT_EQ(*s.error, ParseError::UnclosedSingleQuote);
    EXPECT_STREQ(to_string(*s.error), "Unclosed single quote");

    auto d = tokenize("echo \"unclosed");
    ASSERT_FALSE(d.ok());
    EXPECT_EQ(*d.error, ParseError::UnclosedDoubleQuote);
    EXPECT_STREQ(to_string(*d.error), "Unclosed double quote");
}

TEST(TokenizerEscape, BackslashKeepsNextCharacter) {
    auto r = tokenize("echo a\\ b \\'x");
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(r.tokens.size(), 3u);
    EXPECT_EQ(r.tokens[1].text, "a\\ b");
    EXPECT_EQ(r.tokens[2].text, "\\'x");
    EXPECT_EQ(r.tokens[2].kind, ShellTokenKind::Unquoted);
}

TEST(TokenizerEscape, BackslashIsLiteralInSingleQuotes) {
    auto r = tokenize("echo 'a\\'");
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(r.tokens.size(), 2u);
    EXPECT_EQ(r.tokens[1], (ShellToken{ShellTokenKind::SingleQuoted, "a\\"}));
}

TEST(TokenizerOperators, GreedyTwoCharOperators) {
    auto r = tokenize("a>>b||c<<d&e;f<g");
    ASSERT_TRUE(r.ok());
    std::vector<std::string> texts;
    for (auto &t : r.tokens) texts.push_back(t.text);
    std::vector<std::string> expected = {"a",">>","b","||","c","<<","d","&","e",";","f","<","g"};
    EXPECT_EQ(texts, expected);
}

TEST(TokenizerOperators, QuotedOperatorsStayText) {
    auto r = tokenize("echo 'a | b; c'");
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(r.tokens.size(), 2u);
    EXPECT_TRUE(r.tokens[1].is_quoted());
}

TEST(TokenizerWhitespace, TabsAndNewlinesSplit) {
    auto r = tokenize("  ls\t-la\n/tmp\r\n");
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(r.tokens.size(), 3u);
    EXPECT_EQ(r.tokens[2].text, "/tmp");
    EXPECT_TRUE(tokenize("").tokens.empty());
}
