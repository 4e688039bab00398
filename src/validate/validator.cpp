/*
 * AI-CmdGuard Command Validator Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: See header for the pipeline order.
 */
#include <ai-cmdguard/validate/validator.hpp>
#include <algorithm>
#include <cctype>

namespace cmdguard {

namespace {

std::string trim(const std::string& s){ size_t a=0; while(a<s.size() && std::isspace((unsigned char)s[a])) ++a; size_t b=s.size(); while(b>a && std::isspace((unsigned char)s[b-1])) --b; return s.substr(a,b-a); }

bool contains(const std::string& s, const char* what) { return s.find(what) != std::string::npos; }

// regex replace with a callback; std::regex_replace would interpret '$' in paths
template <typename Fn>
std::string replace_matches(const std::string& input, const std::regex& re, Fn&& fn, bool all) {
    std::string out; std::size_t last = 0;
    for (std::sregex_iterator it(input.begin(), input.end(), re), end; it != end; ++it) {
        const std::smatch& m = *it;
        std::size_t pos = static_cast<std::size_t>(m[0].first - input.begin());
        out.append(input, last, pos - last);
        out += fn(m);
        last = pos + static_cast<std::size_t>(m.length(0));
        if (!all) break;
    }
    out.append(input, last, std::string::npos);
    return out;
}

// backslash escapes in a bare word are kept as written; quoting would make them literal
std::string quote_arg(const std::string& path) {
    if (path.find('\\') != std::string::npos && path.front() != '\'' && path.front() != '"') return path;
    return QuotingCorrector::quote_path_if_needed(path);
}

// quoted path plus the whitespace the greedy path group swallowed
std::string quote_keep_trailing(const std::string& raw) {
    std::string path = trim(raw);
    std::size_t end = raw.find_last_not_of(" \t\r\n");
    std::string tail = end == std::string::npos ? std::string() : raw.substr(end + 1);
    return quote_arg(path) + tail;
}

SecurityWarning to_warning(const Finding& f) {
    // Warning and Blocked surface as DangerousPattern, Dangerous as DataLoss
    switch (f.severity) {
        case Severity::Dangerous: return {SecurityWarning::Kind::DataLoss, f.message};
        case Severity::Warning:
        case Severity::Blocked: return {SecurityWarning::Kind::DangerousPattern, f.message};
    }
    return {SecurityWarning::Kind::DangerousPattern, f.message};
}

const char* const kPathArg = R"re(('[^']*'|"(?:[^"\\]|\\.)*"|(?:[^\s&|;\\]|\\.)+))re";

} // namespace

CommandValidator::CommandValidator() : CommandValidator(RiskClassifier(), default_flag_rules(), default_placeholder_rules()) {}

CommandValidator::CommandValidator(RiskClassifier classifier, FlagRules flags, std::vector<PlaceholderRule> placeholders)
    : m_classifier(std::move(classifier)), m_flags(std::move(flags)), m_placeholders(std::move(placeholders)),
      m_test_spaces(R"re(\b(test\s+-[fd])\s+([^'"&|;<>]+(?:\s+[^'"&|;<>]+)+))re"),
      m_stat_spaces(R"re(\b(stat)\s+([^'"&|;<>]+(?:\s+[^'"&|;<>]+)+))re"),
      m_test_word(R"re(\b(test\s+-[fd])\s+((?:[^'"&|;<>\s\\]|\\.)+))re"),
      m_stat_word(R"re(\b(stat)\s+((?:[^'"&|;<>\s\\]|\\.)+))re"),
      m_test_f(std::string(R"re(\btest\s+-f\s+)re") + kPathArg),
      m_test_d(std::string(R"re(\btest\s+-d\s+)re") + kPathArg),
      m_bracket_f(R"re(\[\s*-f\s+([^\]]+)\s*\])re"),
      m_bracket_d(R"re(\[\s*-d\s+([^\]]+)\s*\])re"),
      m_stat(std::string(R"re(\bstat\s+)re") + kPathArg),
      m_ls_trailing(std::string(R"re(\bls\s+)re") + kPathArg + R"re(\s*$)re") {}

std::vector<SecurityWarning> CommandValidator::security_warnings(const std::string& command) const {
    auto res = m_classifier.classify(command);
    std::vector<SecurityWarning> out;
    if (res.is_safe()) return out;
    out.reserve(res.findings.size());
    for (auto &f : res.findings) out.push_back(to_warning(f));
    return out;
}

std::vector<std::string> CommandValidator::find_placeholders(const std::string& command) const {
    std::vector<std::string> found;
    for (auto &rule : m_placeholders) {
        for (std::sregex_iterator it(command.begin(), command.end(), rule.pattern), end; it != end; ++it) {
            std::string text = it->size() > 1 && (*it)[1].matched ? it->str(1) : it->str(0);
            if (std::find(found.begin(), found.end(), text) == found.end()) found.push_back(text);
        }
    }
    return found;
}

std::string CommandValidator::quote_unquoted_paths(const std::string& command) const {
    // multi-word paths: test -f my file.txt -> test -f 'my file.txt'
    auto multi = [&](const std::smatch& m) -> std::string {
        std::string path = m.str(2);
        std::string p = trim(path);
        if (p.empty() || p.front()=='-' || p.ends_with("&&") || p.ends_with("||") || p.ends_with("|")) return m.str(0);
        return m.str(1) + " " + quote_keep_trailing(path);
    };
    std::string result = replace_matches(command, m_test_spaces, multi, true);
    result = replace_matches(result, m_stat_spaces, multi, true);
    // single words with metacharacters: test -f file$1.txt -> test -f 'file$1.txt'
    auto word = [&](const std::smatch& m) -> std::string {
        std::string path = m.str(2);
        if (path.front()=='-') return m.str(0);
        return m.str(1) + " " + quote_arg(path);
    };
    result = replace_matches(result, m_test_word, word, true);
    result = replace_matches(result, m_stat_word, word, true);
    return result;
}

std::string CommandValidator::standardize_existence_checks(const std::string& command) const {
    const std::string suffix = kExistsSuffix;
    if (contains(command, kExistsSuffix)) return command;

    std::string result = quote_unquoted_paths(command);

    if (contains(result, "test -f ") && !contains(result, kExistsSuffix)) {
        result = replace_matches(result, m_test_f, [&](const std::smatch& m){ return "test -f " + m.str(1) + " " + suffix; }, false);
    }
    if (contains(result, "test -d ") && !contains(result, kExistsSuffix)) {
        result = replace_matches(result, m_test_d, [&](const std::smatch& m){ return "test -d " + m.str(1) + " " + suffix; }, false);
    }
    // [ -f X ] / [ -d X ] -> test form
    result = replace_matches(result, m_bracket_f, [&](const std::smatch& m){
        return "test -f " + quote_arg(trim(m.str(1))) + " " + suffix; }, true);
    result = replace_matches(result, m_bracket_d, [&](const std::smatch& m){
        return "test -d " + quote_arg(trim(m.str(1))) + " " + suffix; }, true);
    // stat X without an existing && chain
    if (!contains(result, "&&")) {
        result = replace_matches(result, m_stat, [&](const std::smatch& m) -> std::string {
            std::string path = m.str(1);
            if (path.front()=='-') return m.str(0);
            return "stat " + quote_arg(path) + " >/dev/null 2>&1 " + suffix;
        }, true);
    }
    // trailing bare ls X
    if (!contains(result, "ls -")) {
        result = replace_matches(result, m_ls_trailing, [&](const std::smatch& m){
            return "test -f " + quote_arg(m.str(1)) + " " + suffix; }, true);
    }
    return result;
}

std::vector<std::string> CommandValidator::detect_hallucinated_flags(const std::string& command) const {
    std::vector<std::string> found;
    for (auto &flag : m_flags.hallucinated) {
        if (contains_flag(command, flag)) found.push_back(flag);
    }
    return found;
}

std::string CommandValidator::rewrite_common_mistakes(const std::string& command) const {
    std::string result = command;
    for (auto &[wrong, right] : m_flags.rewrites) {
        if (contains_flag(result, wrong)) result = replace_flag(result, wrong, right);
    }
    return result;
}

std::optional<std::string> CommandValidator::check_quote_balance(const std::string& command) const {
    bool in_single=false, in_double=false, escaped=false;
    for (char c : command) {
        if (escaped) { escaped=false; continue; }
        if (c=='\\' && !in_single) { escaped=true; continue; }
        if (c=='\'' && !in_double) in_single = !in_single;
        else if (c=='"' && !in_single) in_double = !in_double;
    }
    if (in_single) return std::string("Unclosed single quote");
    if (in_double) return std::string("Unclosed double quote");
    return std::nullopt;
}

ValidationResult CommandValidator::validate(const std::string& command) const {
    std::string trimmed = trim(command);
    if (trimmed == "(none)") return ValidationResult::valid(trimmed);
    if (trimmed.empty()) return ValidationResult::invalid(trimmed, {ValidationError::syntax("Empty command")});
    if (trimmed.size() > kMaxCommandLength) return ValidationResult::invalid(trimmed, {ValidationError::syntax("Command too long")});

    // dangerous commands are reported as they are, never auto-fixed
    auto warnings = security_warnings(trimmed);
    if (!warnings.empty()) return ValidationResult::sensitive(trimmed, std::move(warnings));

    auto placeholders = find_placeholders(trimmed);
    if (!placeholders.empty()) {
        std::vector<ValidationError> errors;
        for (auto &p : placeholders) errors.push_back(ValidationError::placeholder(p));
        return ValidationResult::invalid(trimmed, std::move(errors));
    }

    std::vector<std::string> fixes;
    std::string cmd = standardize_existence_checks(trimmed);
    if (cmd != trimmed) fixes.emplace_back(kStandardizedFix);

    auto quoting = m_quoting.analyze(cmd);
    if (quoting.needs_correction) {
        cmd = quoting.corrected_command;
        fixes.insert(fixes.end(), quoting.corrections.begin(), quoting.corrections.end());
        std::vector<ValidationError> errors;
        for (auto &issue : quoting.issues) {
            if (issue.kind == QuotingIssue::Kind::InjectionRisk) errors.push_back(ValidationError::quoting("Injection risk: " + issue.detail));
            else if (issue.kind == QuotingIssue::Kind::AmbiguousGlobbing) errors.push_back(ValidationError::quoting("Ambiguous globbing: " + issue.detail));
        }
        if (!errors.empty()) return ValidationResult::invalid(cmd, std::move(errors));
    }

    auto flags = detect_hallucinated_flags(cmd);
    if (!flags.empty()) {
        std::string rewritten = rewrite_common_mistakes(cmd);
        auto remaining = detect_hallucinated_flags(rewritten);
        if (!remaining.empty()) {
            std::vector<ValidationError> errors;
            for (auto &f : remaining) errors.push_back(ValidationError::hallucinated_flag(f));
            return ValidationResult::invalid(cmd, std::move(errors));
        }
        for (auto &f : flags) fixes.push_back("Fixed hallucinated flag: " + f);
        cmd = std::move(rewritten);
    }

    if (auto issue = check_quote_balance(cmd)) return ValidationResult::invalid(cmd, {ValidationError::quoting(*issue)});

    if (!fixes.empty()) return ValidationResult::rewritten(cmd, std::move(fixes));
    return ValidationResult::valid(cmd);
}

} // namespace cmdguard
