#include <gtest/gtest.h>
#include <ai-cmdguard/exec/shell_runner.hpp>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace cmdguard;

TEST(ShellRunner, ExitStatus) {
    EXPECT_EQ(run_shell_command("true"), 0);
    EXPECT_EQ(run_shell_command("exit 3"), 3);
    EXPECT_EQ(run_shell_command("false || exit 0"), 0);
}

TEST(ShellRunner, CommandNotFound) {
    EXPECT_EQ(run_shell_command("ai_cmdguard_no_such_command_xyz 2>/dev/null"), 127);
}

TEST(ShellRunner, KilledBySignal) {
    EXPECT_EQ(run_shell_command("kill -TERM $$"), 128 + 15);
}

TEST(ShellRunner, RedirectOut) {
    auto path = std::filesystem::temp_directory_path() / ("ai_cmdguard_out_" + std::to_string(getpid()) + ".txt");
    int st = run_shell_command("echo 'hello world' > " + path.string());
    EXPECT_EQ(st, 0);
    std::ifstream in(path); std::string line; std::getline(in, line);
    EXPECT_EQ(line, "hello world");
    std::filesystem::remove(path);
}
