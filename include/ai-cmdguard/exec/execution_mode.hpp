/*
 * AI-CmdGuard Execution Mode Resolver
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Maps (Configuration, ValidationResult) to the single behaviour the CLI
 *   is allowed to take with a command:
 *     - dry_run                  -> DryRunOnly, whatever the verdict
 *     - Valid / Rewritten        -> Safe with auto_execute, RequiresConfirmation otherwise
 *     - Invalid                  -> Blocked("Command validation failed: ...")
 *     - Sensitive                -> RequiresConfirmation(reasons), or Blocked on
 *                                   high safety level with a dangerous pattern
 *   A Sensitive command never resolves to Safe.
 *
 * License (MIT):
 *   Permission is hereby granted, free of charge, to any person obtaining a copy of this
 *   software and associated documentation files (the "Software"), to deal in the Software
 *   without restriction, including without limitation the rights to use, copy, modify, merge,
 *   publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons
 *   to whom the Software is furnished to do so, subject to the following conditions:
 *
 *   The above copyright notice and this permission notice shall be included in all copies or
 *   substantial portions of the Software.
 *
 *   THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED,
 *   INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR
 *   PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE
 *   FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR
 *   OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER
 *   DEALINGS IN THE SOFTWARE.
 */
#pragma once
#include <string>
#include <vector>
#include <optional>
#include "ai-cmdguard/config/config.hpp"
#include "ai-cmdguard/validate/validation_result.hpp"

namespace cmdguard {

struct ExecutionMode {
    enum class Kind { SuggestOnly, Safe, RequiresConfirmation, DryRunOnly, Blocked };
    Kind kind = Kind::SuggestOnly;
    std::vector<std::string> reasons;   // RequiresConfirmation
    std::string reason;                 // Blocked

    static ExecutionMode suggest_only() { return {}; }
    static ExecutionMode safe() { return {Kind::Safe, {}, {}}; }
    static ExecutionMode requires_confirmation(std::vector<std::string> reasons) { return {Kind::RequiresConfirmation, std::move(reasons), {}}; }
    static ExecutionMode dry_run_only() { return {Kind::DryRunOnly, {}, {}}; }
    static ExecutionMode blocked(std::string reason) { return {Kind::Blocked, {}, std::move(reason)}; }

    bool can_execute() const { return kind == Kind::Safe || kind == Kind::RequiresConfirmation; }
    bool requires_confirmation() const { return kind == Kind::RequiresConfirmation; }
    bool is_dry_run() const { return kind == Kind::DryRunOnly; }
    bool is_blocked() const { return kind == Kind::Blocked; }

    // "DRY RUN: " or "BLOCKED (<reason>): "
    std::optional<std::string> display_prefix() const;
    std::vector<std::string> confirmation_reasons() const;
    std::optional<std::string> block_reason() const;

    bool operator==(const ExecutionMode&) const = default;
};

const char* to_string(ExecutionMode::Kind k);

ExecutionMode resolve(const Configuration& config, const ValidationResult& verdict);

// A command ready to be presented: the mode decides what the user may do.
struct ExecutableCommand {
    std::string command;
    std::string explanation;
    ExecutionMode mode;
    std::vector<std::string> warnings;

    void add_warning(std::string w) { warnings.push_back(std::move(w)); }
    std::optional<std::string> execution_instructions() const;
};

} // namespace cmdguard
