/*
 * AI-CmdGuard Shell runner (POSIX)
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <ai-cmdguard/exec/shell_runner.hpp>
#include <ai-cmdguard/util/log.hpp>
#include <unistd.h>
#include <sys/wait.h>
#include <csignal>
#include <cerrno>
#include <cstdio>
#include <iostream>

namespace cmdguard {

int run_shell_command(const std::string& command) {
    std::cout.flush();
    pid_t pid = fork();
    if (pid < 0) { perror("fork"); return 1; }
    if (pid == 0) {
        std::signal(SIGINT, SIG_DFL);
        execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        perror("execl"); _exit(127);
    }
    log::debug("Started pid " + std::to_string(pid) + ": " + command);
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) { perror("waitpid"); return 1; }
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return 1;
}

} // namespace cmdguard
