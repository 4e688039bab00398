/*
 * AI-CmdGuard Shell Token Definitions
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Defines the token kinds produced by the quote-aware shell tokenizer. The
 *   kind records whether the text was exposed to the shell (unquoted words and
 *   operators) or protected by single/double quotes. Only exposed tokens are
 *   ever inspected by the risk classifier.
 *
 * License (MIT): (see full text in shell_tokenizer.hpp header or duplicate below)
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

namespace cmdguard {

enum class ShellTokenKind {
    Unquoted,
    SingleQuoted,
    DoubleQuoted,
    Operator
};

struct ShellToken {
    ShellTokenKind kind;
    std::string text;

    bool is_quoted() const { return kind == ShellTokenKind::SingleQuoted || kind == ShellTokenKind::DoubleQuoted; }
    bool operator==(const ShellToken&) const = default;
};

using ShellTokenStream = std::vector<ShellToken>;

// Tokenizer failure. Only unclosed quotes are reported.
enum class ParseError {
    UnclosedSingleQuote,
    UnclosedDoubleQuote
};

inline const char* to_string(ParseError e) {
    switch (e) {
        case ParseError::UnclosedSingleQuote: return "Unclosed single quote";
        case ParseError::UnclosedDoubleQuote: return "Unclosed double quote";
    }
    return "Parse error";
}

} // namespace cmdguard
