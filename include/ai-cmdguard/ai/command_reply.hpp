/*
 * AI-CmdGuard Command reply parser
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * The model is asked to answer with
 *
 *   Command: <one shell command line>
 *
 *   <explanation>
 *
 * and "Command: (none)" when nothing should run. Older reply shapes
 * (an "Executing:" marker, a backticked line, one fenced block) are still
 * recognised.
 */
#pragma once
#include <string>
#include <optional>

namespace cmdguard::ai {

std::string build_command_prompt(const std::string& request, const std::string& shell);

// The command to validate, or nothing for "(none)" and unrecognised replies.
std::optional<std::string> extract_command(const std::string& response);

// Text after the "Command:" line, or the whole reply without one.
std::string extract_explanation(const std::string& response);

// Contents of the only fenced block of the reply (language tag dropped).
std::optional<std::string> extract_code_block(const std::string& response);

} // namespace cmdguard::ai
