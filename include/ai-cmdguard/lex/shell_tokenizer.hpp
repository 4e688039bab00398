/*
 * AI-CmdGuard Shell Tokenizer Module
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Splits a candidate command line into ShellToken values. Tracks single
 *   quotes, double quotes and backslash escapes so that quoted text ends up in
 *   its own token, and captures the operators |, ||, &, &&, ;, >, >>, <, <<.
 *   This is not a shell parser: no expansion, no grammar, only the structure
 *   the risk classifier needs to tell exposed text from quoted text.
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
#include <optional>
#include <cstddef>
#include "ai-cmdguard/lex/shell_token.hpp"

namespace cmdguard {

struct TokenizeResult {
    ShellTokenStream tokens;           // valid only when error is empty
    std::optional<ParseError> error;

    bool ok() const { return !error.has_value(); }
};

class ShellTokenizer {
public:
    explicit ShellTokenizer(std::string input);
    TokenizeResult run();
private:
    char peek() const;
    char get();
    bool eof() const;
    void flush(ShellTokenKind kind);
    void flush_unquoted();
    bool is_operator_char(char c) const;
    void lex_operator(char first);

    std::string m_input;
    std::size_t m_pos = 0;
    std::string m_current;
    ShellTokenStream m_tokens;
    bool m_in_single = false;
    bool m_in_double = false;
    bool m_escaped = false;
};

// Convenience wrapper: ShellTokenizer(command).run()
TokenizeResult tokenize(const std::string& command);

} // namespace cmdguard
