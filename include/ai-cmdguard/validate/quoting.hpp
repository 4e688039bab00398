/*
 * AI-CmdGuard Quoting Corrector
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Path quoting used by the existence-check rewrites, and detection of
 *   injection shapes that survive quoting (separator followed by a variable,
 *   pipe into a variable, backticks around a variable).
 */
#pragma once
#include <string>
#include <vector>

namespace cmdguard {

struct QuotingIssue {
    enum class Kind {
        UnquotedSpaces,
        UnquotedSpecialChars,
        ImproperVariableQuoting,
        AmbiguousGlobbing,
        InjectionRisk,
        InconsistentQuoting
    };
    Kind kind;
    std::string detail;   // matched text for AmbiguousGlobbing / InjectionRisk

    // InjectionRisk and AmbiguousGlobbing make a command invalid
    bool is_serious() const { return kind == Kind::InjectionRisk || kind == Kind::AmbiguousGlobbing; }
};

struct QuotingAnalysis {
    bool needs_correction = false;
    std::string corrected_command;
    std::vector<QuotingIssue> issues;
    std::vector<std::string> corrections;   // fix notes for applied corrections
};

class QuotingCorrector {
public:
    // Linear scans only, so arbitrarily long input is safe.
    QuotingAnalysis analyze(const std::string& command) const;

    static bool needs_quoting(const std::string& path);
    // 'path' or "path" (when the path holds a single quote); unchanged when
    // already quoted or when no quoting is needed
    static std::string quote_path_if_needed(const std::string& path);

    static std::vector<std::string> quoting_guidelines();
};

} // namespace cmdguard
