/*
 * AI-CmdGuard Shell Tokenizer Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: Converts a command line into ShellTokenStream (unquoted words,
 *              quoted runs, operators). See header for details.
 */
#include <ai-cmdguard/lex/shell_tokenizer.hpp>

namespace cmdguard {

ShellTokenizer::ShellTokenizer(std::string input) : m_input(std::move(input)) {}

char ShellTokenizer::peek() const { return eof() ? '\0' : m_input[m_pos]; }
char ShellTokenizer::get() { return eof() ? '\0' : m_input[m_pos++]; }
bool ShellTokenizer::eof() const { return m_pos >= m_input.size(); }

bool ShellTokenizer::is_operator_char(char c) const { return c=='|'||c=='&'||c==';'||c=='>'||c=='<'; }

void ShellTokenizer::flush(ShellTokenKind kind) {
    m_tokens.push_back({kind, m_current});
    m_current.clear();
}

void ShellTokenizer::flush_unquoted() {
    if (!m_current.empty()) flush(ShellTokenKind::Unquoted);
}

void ShellTokenizer::lex_operator(char first) {
    std::string op(1, first);
    char next = peek();
    if ((first=='|' && next=='|') || (first=='&' && next=='&') || (first=='>' && next=='>') || (first=='<' && next=='<')) {
        op.push_back(get());
    }
    m_tokens.push_back({ShellTokenKind::Operator, op});
}

TokenizeResult ShellTokenizer::run() {
    while (!eof()) {
        char c = get();
        // backslash stays in the token, it only protects the next character
        if (c=='\\' && !m_escaped && !m_in_single) {
            m_escaped = true;
            m_current.push_back(c);
            continue;
        }
        if (c=='\'' && !m_escaped && !m_in_double) {
            if (m_in_single) { flush(ShellTokenKind::SingleQuoted); m_in_single = false; }
            else { flush_unquoted(); m_in_single = true; }
        } else if (c=='"' && !m_escaped && !m_in_single) {
            if (m_in_double) { flush(ShellTokenKind::DoubleQuoted); m_in_double = false; }
            else { flush_unquoted(); m_in_double = true; }
        } else if ((c==' '||c=='\t'||c=='\n'||c=='\r') && !m_in_single && !m_in_double && !m_escaped) {
            flush_unquoted();
        } else if (is_operator_char(c) && !m_in_single && !m_in_double && !m_escaped) {
            flush_unquoted();
            lex_operator(c);
        } else {
            m_current.push_back(c);
        }
        m_escaped = false;
    }
    TokenizeResult result;
    if (m_in_single) { result.error = ParseError::UnclosedSingleQuote; return result; }
    if (m_in_double) { result.error = ParseError::UnclosedDoubleQuote; return result; }
    flush_unquoted();
    result.tokens = std::move(m_tokens);
    return result;
}

TokenizeResult tokenize(const std::string& command) {
    ShellTokenizer tk(command);
    return tk.run();
}

} // namespace cmdguard
