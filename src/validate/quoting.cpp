/*
 * AI-CmdGuard Quoting Corrector
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <ai-cmdguard/validate/quoting.hpp>
#include <optional>

namespace cmdguard {

namespace {

bool is_space(char c) { return c==' ' || c=='\t' || c=='\n' || c=='\r' || c=='\v' || c=='\f'; }

// first line on which check() fires; '.' in these shapes never spans a newline
template <typename Fn>
std::optional<std::string> first_line_hit(const std::string& cmd, Fn check) {
    std::size_t start = 0;
    while (true) {
        std::size_t nl = cmd.find('\n', start);
        if (auto hit = check(cmd.substr(start, nl == std::string::npos ? std::string::npos : nl - start))) return hit;
        if (nl == std::string::npos) return std::nullopt;
        start = nl + 1;
    }
}

// first ';' through the last '$' after it
std::optional<std::string> separator_then_variable_on_line(const std::string& cmd) {
    std::size_t semi = cmd.find(';');
    if (semi == std::string::npos) return std::nullopt;
    std::size_t dollar = cmd.rfind('$');
    if (dollar == std::string::npos || dollar < semi) return std::nullopt;
    return cmd.substr(semi, dollar - semi + 1);
}

// '|', optional blanks, '$'
std::optional<std::string> pipe_into_variable(const std::string& cmd) {
    for (std::size_t pipe = cmd.find('|'); pipe != std::string::npos; pipe = cmd.find('|', pipe + 1)) {
        std::size_t i = pipe + 1;
        while (i < cmd.size() && is_space(cmd[i])) ++i;
        if (i < cmd.size() && cmd[i] == '$') return cmd.substr(pipe, i - pipe + 1);
    }
    return std::nullopt;
}

// first backtick through the last one, with a '$' in between
std::optional<std::string> backticks_around_variable_on_line(const std::string& cmd) {
    std::size_t open = cmd.find('`');
    std::size_t close = cmd.rfind('`');
    if (open == std::string::npos || close == open) return std::nullopt;
    std::size_t dollar = cmd.find('$', open + 1);
    if (dollar == std::string::npos || dollar > close) return std::nullopt;
    return cmd.substr(open, close - open + 1);
}

std::optional<std::string> separator_then_variable(const std::string& cmd) {
    return first_line_hit(cmd, separator_then_variable_on_line);
}

std::optional<std::string> backticks_around_variable(const std::string& cmd) {
    return first_line_hit(cmd, backticks_around_variable_on_line);
}

} // namespace

QuotingAnalysis QuotingCorrector::analyze(const std::string& command) const {
    QuotingAnalysis a;
    // Automatic quoting of space separated words stays off: it cannot tell
    // flags from paths. The corrected command is the input.
    a.corrected_command = command;
    for (auto check : {separator_then_variable, pipe_into_variable, backticks_around_variable}) {
        if (auto hit = check(command)) a.issues.push_back({QuotingIssue::Kind::InjectionRisk, std::move(*hit)});
    }
    a.needs_correction = !a.issues.empty() || a.corrected_command != command;
    return a;
}

bool QuotingCorrector::needs_quoting(const std::string& path) {
    static const std::string kSpecial = " \t*?[](){}$`\"'\\|&;<>";
    return path.find_first_of(kSpecial) != std::string::npos;
}

std::string QuotingCorrector::quote_path_if_needed(const std::string& path) {
    if (path.size() >= 2) {
        char f = path.front(), b = path.back();
        if ((f=='\'' && b=='\'') || (f=='"' && b=='"')) return path;
    }
    if (!needs_quoting(path)) return path;
    if (path.find('\'') == std::string::npos) return "'" + path + "'";
    std::string out = "\"";
    for (char c : path) { if (c=='"') out += "\\\""; else out.push_back(c); }
    out += "\"";
    return out;
}

std::vector<std::string> QuotingCorrector::quoting_guidelines() {
    return {
        "Use single quotes for literal strings (no variable expansion)",
        "Use double quotes when you need variable expansion",
        "Always quote paths with spaces or special characters",
        "Quote variables to prevent word splitting: \"$var\" not $var",
        "Avoid mixing single and double quotes unnecessarily",
    };
}

} // namespace cmdguard
