/*
 * AI-CmdGuard Sensitive Pattern Table
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Severity levels and the severity-tagged regex table the risk classifier
 *   runs against the unquoted surface of a command. The default tables are
 *   plain data: extend them here, not in the classifier.
 */
#pragma once
#include <string>
#include <vector>
#include <optional>
#include <regex>

namespace cmdguard {

enum class Severity {
    Warning,     // show warning, allow execution
    Dangerous,   // require explicit confirmation
    Blocked      // never execute
};

// Total order used for aggregation. Do not compare Severity values directly.
inline int severity_rank(Severity s) {
    switch (s) {
        case Severity::Warning: return 1;
        case Severity::Dangerous: return 2;
        case Severity::Blocked: return 3;
    }
    return 0;
}

inline const char* to_string(Severity s) {
    switch (s) {
        case Severity::Warning: return "warning";
        case Severity::Dangerous: return "dangerous";
        case Severity::Blocked: return "blocked";
    }
    return "?";
}

struct SensitivePattern {
    std::regex pattern;
    Severity severity;
    std::string description;
    std::optional<std::string> suggestion;

    // "description - suggestion", or the description alone
    std::string message() const { return suggestion ? description + " - " + *suggestion : description; }
};

// Ordered table used by RiskClassifier (fork bombs, pipe-to-shell, rm, chmod,
// chown, dd, mkfs, fdisk, raw device writes).
std::vector<SensitivePattern> default_sensitive_patterns();

// Broader family probes, used by RiskClassifier::is_fork_bomb / is_pipe_to_shell.
std::vector<std::regex> default_fork_bomb_patterns();
std::vector<std::regex> default_pipe_to_shell_patterns();

} // namespace cmdguard
