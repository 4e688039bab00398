// Rule data for the validator: hallucinated flags, their rewrites and the
// placeholder shapes that make a command unusable.
#pragma once
#include <string>
#include <vector>
#include <utility>
#include <regex>

namespace cmdguard {

struct FlagRules {
    std::vector<std::string> hallucinated;                          // flags that do not exist
    std::vector<std::pair<std::string, std::string>> rewrites;      // applied in order
};

struct PlaceholderRule {
    std::string name;     // short label, e.g. "path-to"
    std::regex pattern;   // reported text is capture group 1 when present, else the match
};

FlagRules default_flag_rules();
std::vector<PlaceholderRule> default_placeholder_rules();

// Whole-flag search: the match must start at the beginning of the command or
// after whitespace/quote and end before whitespace, '=', a quote, an operator
// or the end of the command. "--all" does not match inside "--allow".
bool contains_flag(const std::string& command, const std::string& flag);
std::string replace_flag(const std::string& command, const std::string& flag, const std::string& replacement);

} // namespace cmdguard
