/*
 * AI-CmdGuard Command Validator
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Runs a model-proposed command through a fixed pipeline and returns one
 *   ValidationResult:
 *     1. "(none)" sentinel          -> Valid("(none)")
 *        empty or over kMaxCommandLength -> Invalid (SyntaxError)
 *     2. risk classifier            -> Sensitive (never rewritten)
 *     3. placeholder detection      -> Invalid
 *     4. existence-check idioms     -> rewrite to test ... && echo 'exists' || echo 'not found'
 *     5. injection shapes           -> Invalid
 *     6. hallucinated flags         -> rewrite, or Invalid when unrepairable
 *     7. quote balance              -> Invalid
 *   then Rewritten when any fix was applied, Valid otherwise.
 *
 *   validate() is pure and deterministic. All tables are built at
 *   construction and never modified, so one validator may serve any number
 *   of threads.
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
#include <vector>
#include <optional>
#include <regex>
#include "ai-cmdguard/safety/risk_classifier.hpp"
#include "ai-cmdguard/validate/flag_rules.hpp"
#include "ai-cmdguard/validate/quoting.hpp"
#include "ai-cmdguard/validate/validation_result.hpp"

namespace cmdguard {

inline constexpr const char* kExistsSuffix = "&& echo 'exists' || echo 'not found'";
inline constexpr const char* kStandardizedFix = "Standardized file existence check format";

class CommandValidator {
public:
    CommandValidator();
    CommandValidator(RiskClassifier classifier, FlagRules flags, std::vector<PlaceholderRule> placeholders);

    ValidationResult validate(const std::string& command) const;

    // Individual pipeline stages, exposed for callers and tests.
    std::vector<SecurityWarning> security_warnings(const std::string& command) const;
    std::vector<std::string> find_placeholders(const std::string& command) const;
    std::string standardize_existence_checks(const std::string& command) const;
    std::vector<std::string> detect_hallucinated_flags(const std::string& command) const;
    std::string rewrite_common_mistakes(const std::string& command) const;
    // "Unclosed single quote" / "Unclosed double quote", or nothing
    std::optional<std::string> check_quote_balance(const std::string& command) const;

    const RiskClassifier& classifier() const { return m_classifier; }
private:
    std::string quote_unquoted_paths(const std::string& command) const;

    RiskClassifier m_classifier;
    FlagRules m_flags;
    std::vector<PlaceholderRule> m_placeholders;
    QuotingCorrector m_quoting;

    // existence-check rewrites
    std::regex m_test_spaces;
    std::regex m_stat_spaces;
    std::regex m_test_word;
    std::regex m_stat_word;
    std::regex m_test_f;
    std::regex m_test_d;
    std::regex m_bracket_f;
    std::regex m_bracket_d;
    std::regex m_stat;
    std::regex m_ls_trailing;
};

} // namespace cmdguard
