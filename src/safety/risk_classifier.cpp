/*
 * AI-CmdGuard Risk Classifier Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: See header for overview.
 */
#include <ai-cmdguard/safety/risk_classifier.hpp>
#include <ai-cmdguard/lex/shell_tokenizer.hpp>
#include <algorithm>
#include <cctype>

namespace cmdguard {

static std::string trim(const std::string& s){ size_t a=0; while(a<s.size() && std::isspace((unsigned char)s[a])) ++a; size_t b=s.size(); while(b>a && std::isspace((unsigned char)s[b-1])) --b; return s.substr(a,b-a); }

static SafetyResult too_long() {
    return {SafetyVerdict::Blocked, {{Severity::Blocked, "Command too long to analyze - split it into smaller commands"}}};
}

RiskClassifier::RiskClassifier() : RiskClassifier(default_sensitive_patterns()) {}

RiskClassifier::RiskClassifier(std::vector<SensitivePattern> patterns,
                               std::vector<std::regex> fork_bomb_patterns,
                               std::vector<std::regex> pipe_to_shell_patterns)
    : m_patterns(std::move(patterns)), m_fork_bomb(std::move(fork_bomb_patterns)), m_pipe_to_shell(std::move(pipe_to_shell_patterns)) {}

std::string RiskClassifier::unquoted_surface(const ShellTokenStream& tokens) {
    std::string out;
    for (auto &t : tokens) {
        if (t.is_quoted()) continue;
        if (!out.empty()) out.push_back(' ');
        out += t.text;
    }
    return out;
}

SafetyResult RiskClassifier::classify(const std::string& command) const {
    if (command.size() > kMaxCommandLength) return too_long();
    if (trim(command) == "(none)") return {};
    auto tk = tokenize(command);
    if (!tk.ok()) return scan(command); // fail-open: unclosed quote, scan everything
    return classify(tk.tokens);
}

SafetyResult RiskClassifier::classify(const ShellTokenStream& tokens) const {
    std::string surface = unquoted_surface(tokens);
    if (trim(surface).empty()) return {};
    return scan(surface);
}

SafetyResult RiskClassifier::scan(const std::string& text) const {
    if (text.size() > kMaxScanLength) return too_long();
    SafetyResult r;
    int worst = 0;
    for (auto &p : m_patterns) {
        if (!std::regex_search(text, p.pattern)) continue;
        r.findings.push_back({p.severity, p.message()});
        worst = std::max(worst, severity_rank(p.severity));
    }
    if (r.findings.empty()) r.verdict = SafetyVerdict::Safe;
    else if (worst >= severity_rank(Severity::Blocked)) r.verdict = SafetyVerdict::Blocked;
    else if (worst >= severity_rank(Severity::Dangerous)) r.verdict = SafetyVerdict::RequiresConfirmation;
    else r.verdict = SafetyVerdict::Warning;
    return r;
}

bool RiskClassifier::is_fork_bomb(const std::string& text) const {
    if (text.size() > kMaxScanLength) return false;
    return std::any_of(m_fork_bomb.begin(), m_fork_bomb.end(), [&](const std::regex& re){ return std::regex_search(text, re); });
}

bool RiskClassifier::is_pipe_to_shell(const std::string& text) const {
    if (text.size() > kMaxScanLength) return false;
    return std::any_of(m_pipe_to_shell.begin(), m_pipe_to_shell.end(), [&](const std::regex& re){ return std::regex_search(text, re); });
}

const char* to_string(SafetyVerdict v) {
    switch (v) {
        case SafetyVerdict::Safe: return "safe";
        case SafetyVerdict::Warning: return "warning";
        case SafetyVerdict::RequiresConfirmation: return "requires-confirmation";
        case SafetyVerdict::Blocked: return "blocked";
    }
    return "?";
}

} // namespace cmdguard
