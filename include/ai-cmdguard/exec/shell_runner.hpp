/*
 * AI-CmdGuard Shell runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Runs an accepted command through /bin/sh -c in a child process and waits
 * for it. Callers must only pass commands whose ExecutionMode can_execute().
 */
#pragma once
#include <string>

namespace cmdguard {

// Exit status of the command; 127 when the shell could not be started,
// 128+N when the child was killed by signal N, 1 when fork fails.
int run_shell_command(const std::string& command);

} // namespace cmdguard
