#include <gtest/gtest.h>
#include <ai-cmdguard/config/config.hpp>
#include <ai-cmdguard/util/log.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

using namespace cmdguard;
namespace fs = std::filesystem;

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_path = fs::temp_directory_path() / ("ai_cmdguard_rc_" + std::to_string(getpid()) + "_" +
                 ::testing::UnitTest::GetInstance()->current_test_info()->name());
        cmdguard::log::set_sink(&m_log);
    }
    void TearDown() override {
        cmdguard::log::set_sink(nullptr);
        std::error_code ec; fs::remove(m_path, ec);
    }
    void write(const std::string& content) { std::ofstream out(m_path); out << content; }

    fs::path m_path;
    std::ostringstream m_log;
};

TEST_F(ConfigFileTest, ReadsAllKeys) {
    write("# comment\n"
          "provider=stub\n"
          "model = llama3\n"
          "ollama_url=https://ai.local:8443\n"
          "ai_timeout=30\n"
          "stub_file=/tmp/reply.txt\n"
          "auto_execute=yes\n"
          "dry_run=on\n"
          "safety_level=HIGH\n"
          "debug=0\n");
    AppConfig cfg;
    ASSERT_TRUE(load_config_file(m_path.string(), cfg));
    EXPECT_EQ(cfg.provider, "stub");
    EXPECT_EQ(cfg.model, "llama3");
    EXPECT_EQ(cfg.ollama_url, "https://ai.local:8443");
    EXPECT_EQ(cfg.ai_timeout, 30);
    EXPECT_EQ(cfg.stub_file, "/tmp/reply.txt");
    EXPECT_TRUE(cfg.exec.auto_execute);
    EXPECT_TRUE(cfg.exec.dry_run);
    EXPECT_EQ(cfg.exec.safety_level, SafetyLevel::High);
    EXPECT_FALSE(cfg.debug);
    EXPECT_FALSE(validate_config(cfg).has_value());
}

TEST_F(ConfigFileTest, MissingFileLeavesDefaults) {
    AppConfig cfg;
    EXPECT_FALSE(load_config_file((m_path.string() + ".missing"), cfg));
    EXPECT_EQ(cfg.model, "mistral");
    auto loaded = load_config(m_path.string() + ".missing");
    EXPECT_EQ(loaded.ollama_url, "http://localhost:11434");
    EXPECT_NE(m_log.str().find("[WARN]"), std::string::npos);
}

TEST_F(ConfigFileTest, InvalidValuesFallBackToDefaults) {
    write("model=llama3\nai_timeout=9999\n");
    auto cfg = load_config(m_path.string());
    EXPECT_EQ(cfg.model, "mistral");
    EXPECT_EQ(cfg.ai_timeout, 120);
    EXPECT_NE(m_log.str().find("Using safe defaults"), std::string::npos);
}

TEST_F(ConfigFileTest, NonNumericTimeoutWarns) {
    write("ai_timeout=soon\n");
    auto cfg = load_config(m_path.string());
    EXPECT_EQ(cfg.ai_timeout, 120);
    EXPECT_NE(m_log.str().find("Invalid ai_timeout"), std::string::npos);
}

TEST_F(ConfigFileTest, UnknownSafetyLevelKeepsCurrent) {
    write("safety_level=extreme\n");
    auto cfg = load_config(m_path.string());
    EXPECT_EQ(cfg.exec.safety_level, SafetyLevel::Medium);
    EXPECT_NE(m_log.str().find("Unknown safety_level"), std::string::npos);
}

TEST(ConfigValidate, Rules) {
    AppConfig cfg;
    EXPECT_FALSE(validate_config(cfg).has_value());
    cfg.ai_timeout = 0; EXPECT_TRUE(validate_config(cfg).has_value());
    cfg.ai_timeout = 600; EXPECT_FALSE(validate_config(cfg).has_value());
    cfg.ai_timeout = 601; EXPECT_TRUE(validate_config(cfg).has_value());
    cfg = AppConfig{}; cfg.ollama_url = "ftp://host"; EXPECT_TRUE(validate_config(cfg).has_value());
    cfg = AppConfig{}; cfg.model = "  "; EXPECT_TRUE(validate_config(cfg).has_value());
}

TEST(ConfigParse, Booleans) {
    for (auto v : {"1", "true", "on", "yes", "TRUE", " Yes "}) EXPECT_TRUE(parse_bool(v)) << v;
    for (auto v : {"0", "false", "off", "no", "", "maybe"}) EXPECT_FALSE(parse_bool(v)) << v;
}

TEST(ConfigParse, SafetyLevels) {
    EXPECT_EQ(parse_safety_level("low"), SafetyLevel::Low);
    EXPECT_EQ(parse_safety_level("Medium"), SafetyLevel::Medium);
    EXPECT_EQ(parse_safety_level("HIGH"), SafetyLevel::High);
    EXPECT_FALSE(parse_safety_level("extreme").has_value());
    EXPECT_STREQ(to_string(SafetyLevel::High), "high");
}

TEST(ConfigPath, EnvironmentOverride) {
    setenv("AI_CMDGUARD_CONFIG", "/etc/cmdguard.rc", 1);
    EXPECT_EQ(default_config_path(), "/etc/cmdguard.rc");
    unsetenv("AI_CMDGUARD_CONFIG");
    const char* home = std::getenv("HOME");
    if (home && *home) EXPECT_EQ(default_config_path(), std::string(home) + "/.ai-cmdguardrc");
}

TEST(Log, DebugOnlyWhenEnabled) {
    std::ostringstream out;
    cmdguard::log::set_sink(&out);
    cmdguard::log::set_debug(false);
    cmdguard::log::debug("hidden");
    cmdguard::log::warn("shown");
    cmdguard::log::ai("status");
    cmdguard::log::set_debug(true);
    cmdguard::log::debug("visible");
    cmdguard::log::set_debug(false);
    cmdguard::log::set_sink(nullptr);
    EXPECT_EQ(out.str(), "[WARN] shown\n[AI] status\n[DEBUG] visible\n");
}
