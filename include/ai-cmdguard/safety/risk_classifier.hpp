/*
 * AI-CmdGuard Risk Classifier
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Classifies a candidate command by running the sensitive pattern table
 *   against its unquoted surface: the text of every Unquoted and Operator
 *   token joined by single spaces. Quoted text is never scanned. When the
 *   command cannot be tokenized (unclosed quote) the whole raw string is
 *   scanned instead, so dangerous substrings are still caught.
 *
 *   A classifier is immutable after construction and may be shared between
 *   threads.
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
#include <cstddef>
#include <string>
#include <vector>
#include <regex>
#include "ai-cmdguard/lex/shell_token.hpp"
#include "ai-cmdguard/safety/sensitive_pattern.hpp"

namespace cmdguard {

// Longest command the classifier and validator will examine. Longer input is
// blocked outright: std::regex backtracking grows the stack with input size.
inline constexpr std::size_t kMaxCommandLength = 4096;
// The unquoted surface re-joins tokens with spaces, so it may grow past the
// command itself.
inline constexpr std::size_t kMaxScanLength = 2 * kMaxCommandLength;

enum class SafetyVerdict {
    Safe,
    Warning,               // only Warning-severity matches
    RequiresConfirmation,  // at least one Dangerous match
    Blocked                // at least one Blocked match
};

struct Finding {
    Severity severity;
    std::string message;   // description[ - suggestion]

    bool operator==(const Finding&) const = default;
};

struct SafetyResult {
    SafetyVerdict verdict = SafetyVerdict::Safe;
    std::vector<Finding> findings;   // table order

    bool is_safe() const { return verdict == SafetyVerdict::Safe; }
};

class RiskClassifier {
public:
    RiskClassifier();
    explicit RiskClassifier(std::vector<SensitivePattern> patterns,
                            std::vector<std::regex> fork_bomb_patterns = default_fork_bomb_patterns(),
                            std::vector<std::regex> pipe_to_shell_patterns = default_pipe_to_shell_patterns());

    // Tokenizes first; falls back to the raw string on unclosed quotes.
    SafetyResult classify(const std::string& command) const;
    // Scans the unquoted surface of an already tokenized command.
    SafetyResult classify(const ShellTokenStream& tokens) const;
    // Runs the table against arbitrary text, no quote handling.
    // Text over kMaxScanLength is Blocked without running the table.
    SafetyResult scan(const std::string& text) const;

    // Both return false for text over kMaxScanLength.
    bool is_fork_bomb(const std::string& text) const;
    bool is_pipe_to_shell(const std::string& text) const;

    const std::vector<SensitivePattern>& patterns() const { return m_patterns; }

    static std::string unquoted_surface(const ShellTokenStream& tokens);
private:
    std::vector<SensitivePattern> m_patterns;
    std::vector<std::regex> m_fork_bomb;
    std::vector<std::regex> m_pipe_to_shell;
};

const char* to_string(SafetyVerdict v);

} // namespace cmdguard
