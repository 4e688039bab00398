#include <gtest/gtest.h>
#include <ai-cmdguard/ai/command_reply.hpp>
#include <ai-cmdguard/ai/llm.hpp>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace cmdguard::ai;

TEST(ExtractCommand, CommandPrefix) {
    EXPECT_EQ(extract_command("Command: ls -la\n\nLists all files."), std::optional<std::string>("ls -la"));
    EXPECT_EQ(extract_command("Sure!\nCommand:   df -h  \nShows disk usage"), std::optional<std::string>("df -h"));
    EXPECT_FALSE(extract_command("Command: (none)\n\nThat is a question about history.").has_value());
}

TEST(ExtractCommand, ExecutingMarker) {
    EXPECT_EQ(extract_command("Executing: `uptime`"), std::optional<std::string>("uptime"));
    EXPECT_EQ(extract_command("Executing: **\"free -m\"**"), std::optional<std::string>("free -m"));
}

TEST(ExtractCommand, BacktickLine) {
    EXPECT_EQ(extract_command("Try this:\n  `ls -la /tmp`\nIt lists files."), std::optional<std::string>("ls -la /tmp"));
    EXPECT_FALSE(extract_command("Use `frobnicate --all` for that.\n`frobnicate now`").has_value());
}

TEST(ExtractCommand, FencedBlock) {
    EXPECT_EQ(extract_command("Here you go:\n```bash\ngit status\n```\n"), std::optional<std::string>("git status"));
    EXPECT_FALSE(extract_command("```\na\nb\nc\n```").has_value());
    EXPECT_FALSE(extract_command("```ls```\nand\n```pwd```").has_value());
    EXPECT_FALSE(extract_command("no command here").has_value());
}

TEST(ExtractCodeBlock, MultiLineBlock) {
    auto block = extract_code_block("Steps:\n```sh\nmkdir a\ncd a\ntouch b\n```");
    ASSERT_TRUE(block.has_value());
    EXPECT_EQ(*block, "mkdir a\ncd a\ntouch b");
}

TEST(ExtractExplanation, AfterCommandLine) {
    EXPECT_EQ(extract_explanation("Command: ls\n\nLists files."), "Lists files.");
    EXPECT_EQ(extract_explanation("Command: ls"), "");
    EXPECT_EQ(extract_explanation("  Just prose.  "), "Just prose.");
}

TEST(CommandPrompt, MentionsFormatShellAndRequest) {
    auto p = build_command_prompt("show disk usage", "zsh");
    EXPECT_NE(p.find("Command: "), std::string::npos);
    EXPECT_NE(p.find("Command: (none)"), std::string::npos);
    EXPECT_NE(p.find("zsh"), std::string::npos);
    EXPECT_NE(p.find("Request: show disk usage"), std::string::npos);
}

TEST(StubLLM, CannedReplyWithoutFile) {
    LLMConfig cfg;
    StubLLMClient client(cfg);
    auto r = client.complete("anything");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->source, "stub_plain");
    EXPECT_FALSE(extract_command(r->text).has_value());
}

TEST(StubLLM, ReturnsStubFile) {
    auto path = std::filesystem::temp_directory_path() / ("ai_cmdguard_stub_" + std::to_string(getpid()));
    { std::ofstream out(path); out << "Command: ls --hidden\n\nShows hidden files."; }
    LLMConfig cfg; cfg.stub_file = path.string();
    auto client = make_llm(cfg);
    auto r = client->complete("list hidden files");
    std::filesystem::remove(path);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->source, "stub_file");
    EXPECT_EQ(extract_command(r->text), std::optional<std::string>("ls --hidden"));
}

TEST(LLMFactory, ProviderSelection) {
    LLMConfig cfg;
    cfg.provider = "ollama";
    auto ollama = make_llm(cfg);
    EXPECT_NE(dynamic_cast<OllamaLLMClient*>(ollama.get()), nullptr);
    cfg.provider = "something-else";
    auto stub = make_llm(cfg);
    EXPECT_NE(dynamic_cast<StubLLMClient*>(stub.get()), nullptr);
}

TEST(LLMFactory, ConfigFromAppConfig) {
    cmdguard::AppConfig app;
    app.model = "llama3"; app.ai_timeout = 42; app.stub_file = "/tmp/x";
    auto lc = llm_config_from(app);
    EXPECT_EQ(lc.provider, "ollama");
    EXPECT_EQ(lc.model, "llama3");
    EXPECT_EQ(lc.endpoint, "http://localhost:11434");
    EXPECT_EQ(lc.timeout_seconds, 42);
    EXPECT_EQ(lc.stub_file, "/tmp/x");
}

TEST(Json, EscapeAndField) {
    EXPECT_EQ(json_escape("a\"b\\c\nd\te"), "a\\\"b\\\\c\\nd\\te");
    std::string body = R"({"model":"mistral","created_at":"x","response":"Command: ls\n\nok <dir> \"q\"","done":true})";
    EXPECT_EQ(json_string_field(body, "response"), std::optional<std::string>("Command: ls\n\nok <dir> \"q\""));
    EXPECT_FALSE(json_string_field(body, "missing").has_value());
    EXPECT_FALSE(json_string_field(R"({"response":"unterminated)", "response").has_value());
}
