#include <gtest/gtest.h>
#include <ai-cmdguard/validate/quoting.hpp>

using namespace cmdguard;

TEST(QuotePath, QuotesOnlyWhenNeeded) {
    EXPECT_EQ(QuotingCorrector::quote_path_if_needed("plain.txt"), "plain.txt");
    EXPECT_EQ(QuotingCorrector::quote_path_if_needed("/var/log/syslog"), "/var/log/syslog");
    EXPECT_EQ(QuotingCorrector::quote_path_if_needed("my file.txt"), "'my file.txt'");
    EXPECT_EQ(QuotingCorrector::quote_path_if_needed("file$1.txt"), "'file$1.txt'");
    EXPECT_EQ(QuotingCorrector::quote_path_if_needed("a*b"), "'a*b'");
}

TEST(QuotePath, AlreadyQuotedIsUnchanged) {
    EXPECT_EQ(QuotingCorrector::quote_path_if_needed("'my file.txt'"), "'my file.txt'");
    EXPECT_EQ(QuotingCorrector::quote_path_if_needed("\"my file.txt\""), "\"my file.txt\"");
}

TEST(QuotePath, SingleQuoteInsideUsesDoubleQuotes) {
    EXPECT_EQ(QuotingCorrector::quote_path_if_needed("it's here"), "\"it's here\"");
    EXPECT_EQ(QuotingCorrector::quote_path_if_needed("it's \"x\""), "\"it's \\\"x\\\"\"");
}

TEST(NeedsQuoting, SpecialCharacters) {
    for (const char* p : {"a b", "a\tb", "a?b", "[x]", "(x)", "{x}", "$x", "`x`", "a|b", "a&b", "a;b", "a<b", "a>b", "a\\b"}) {
        EXPECT_TRUE(QuotingCorrector::needs_quoting(p)) << p;
    }
    EXPECT_FALSE(QuotingCorrector::needs_quoting("report-2024_v1.txt"));
    EXPECT_FALSE(QuotingCorrector::needs_quoting("~/notes.md"));
}

TEST(QuotingAnalyze, InjectionShapes) {
    QuotingCorrector qc;
    for (const char* cmd : {"echo hi; echo $HOME", "cat file | $SHELL", "echo `ls $DIR`"}) {
        auto a = qc.analyze(cmd);
        EXPECT_TRUE(a.needs_correction) << cmd;
        ASSERT_FALSE(a.issues.empty()) << cmd;
        EXPECT_EQ(a.issues[0].kind, QuotingIssue::Kind::InjectionRisk);
        EXPECT_TRUE(a.issues[0].is_serious());
    }
}

TEST(QuotingAnalyze, CleanCommandUntouched) {
    QuotingCorrector qc;
    auto a = qc.analyze("ls -la /tmp && echo done");
    EXPECT_FALSE(a.needs_correction);
    EXPECT_TRUE(a.issues.empty());
    EXPECT_EQ(a.corrected_command, "ls -la /tmp && echo done");
}

TEST(QuotingGuidelines, FiveRules) {
    auto g = QuotingCorrector::quoting_guidelines();
    ASSERT_EQ(g.size(), 5u);
    EXPECT_NE(g[2].find("spaces"), std::string::npos);
}

TEST(QuotingAnalyze, ReportsTheMatchedShape) {
    QuotingCorrector qc;
    auto sep = qc.analyze("cd /tmp; rm $TARGET; ls");
    ASSERT_EQ(sep.issues.size(), 1u);
    EXPECT_EQ(sep.issues[0].detail, "; rm $");

    auto pipe = qc.analyze("cat list |  $PAGER");
    ASSERT_EQ(pipe.issues.size(), 1u);
    EXPECT_EQ(pipe.issues[0].detail, "|  $");

    auto tick = qc.analyze("echo `ls $DIR` done");
    ASSERT_EQ(tick.issues.size(), 1u);
    EXPECT_EQ(tick.issues[0].detail, "`ls $DIR`");
}

TEST(QuotingAnalyze, ShapesDoNotSpanLines) {
    QuotingCorrector qc;
    EXPECT_TRUE(qc.analyze("cd /tmp;\necho $HOME").issues.empty());
    EXPECT_TRUE(qc.analyze("echo `date\n$X`").issues.empty());
    EXPECT_TRUE(qc.analyze("echo $HOME; ls").issues.empty());
}

TEST(QuotingAnalyze, VeryLongCommand) {
    QuotingCorrector qc;
    std::string cmd = "echo hi; " + std::string(100000, 'a') + " $X";
    auto a = qc.analyze(cmd);
    ASSERT_EQ(a.issues.size(), 1u);
    EXPECT_EQ(a.issues[0].kind, QuotingIssue::Kind::InjectionRisk);
    EXPECT_TRUE(qc.analyze("echo " + std::string(100000, 'a')).issues.empty());
}
