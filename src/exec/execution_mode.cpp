/*
 * AI-CmdGuard Execution Mode Resolver
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <ai-cmdguard/exec/execution_mode.hpp>
#include <algorithm>

namespace cmdguard {

std::optional<std::string> ExecutionMode::display_prefix() const {
    switch (kind) {
        case Kind::DryRunOnly: return std::string("DRY RUN: ");
        case Kind::Blocked: return "BLOCKED (" + reason + "): ";
        default: return std::nullopt;
    }
}

std::vector<std::string> ExecutionMode::confirmation_reasons() const {
    if (kind != Kind::RequiresConfirmation) return {};
    return reasons;
}

std::optional<std::string> ExecutionMode::block_reason() const {
    if (kind != Kind::Blocked) return std::nullopt;
    return reason;
}

const char* to_string(ExecutionMode::Kind k) {
    switch (k) {
        case ExecutionMode::Kind::SuggestOnly: return "SuggestOnly";
        case ExecutionMode::Kind::Safe: return "Safe";
        case ExecutionMode::Kind::RequiresConfirmation: return "RequiresConfirmation";
        case ExecutionMode::Kind::DryRunOnly: return "DryRunOnly";
        case ExecutionMode::Kind::Blocked: return "Blocked";
    }
    return "?";
}

ExecutionMode resolve(const Configuration& config, const ValidationResult& verdict) {
    if (config.dry_run) return ExecutionMode::dry_run_only();

    switch (verdict.kind) {
        case ValidationResult::Kind::Valid:
        case ValidationResult::Kind::Rewritten:
            if (config.auto_execute) return ExecutionMode::safe();
            return ExecutionMode::requires_confirmation({"auto-execute: off"});

        case ValidationResult::Kind::Invalid: {
            std::string msg = "Command validation failed: ";
            for (size_t i=0;i<verdict.errors.size();++i) {
                if (i) msg += ", ";
                msg += to_string(verdict.errors[i]);
            }
            return ExecutionMode::blocked(msg);
        }

        case ValidationResult::Kind::Sensitive: {
            std::vector<std::string> reasons;
            reasons.reserve(verdict.warnings.size());
            for (auto &w : verdict.warnings) reasons.push_back(to_string(w));
            bool dangerous = std::any_of(verdict.warnings.begin(), verdict.warnings.end(),
                [](const SecurityWarning& w){ return w.kind == SecurityWarning::Kind::DangerousPattern; });
            if (config.safety_level == SafetyLevel::High && dangerous)
                return ExecutionMode::blocked("Command blocked due to high safety level");
            return ExecutionMode::requires_confirmation(std::move(reasons));
        }
    }
    return ExecutionMode::suggest_only();
}

std::optional<std::string> ExecutableCommand::execution_instructions() const {
    switch (mode.kind) {
        case ExecutionMode::Kind::SuggestOnly: return std::string("Copy and paste the command above to execute it manually");
        case ExecutionMode::Kind::DryRunOnly: return std::string("This is a dry run. Remove --dry-run flag to execute");
        case ExecutionMode::Kind::Blocked: return "Command blocked: " + mode.reason;
        case ExecutionMode::Kind::RequiresConfirmation: return std::string("Use --auto-execute to run without confirmation");
        case ExecutionMode::Kind::Safe: return std::nullopt;
    }
    return std::nullopt;
}

} // namespace cmdguard
