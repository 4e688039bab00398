#include <ai-cmdguard/validate/flag_rules.hpp>
#include <cctype>

namespace cmdguard {

FlagRules default_flag_rules() {
    FlagRules r;
    r.hallucinated = {
        "--hidden",
        "--recursivee",        // typo
        "--all",
        "--long",
        "--list",
        "--detailed",
        "--case-insensitive",
        "--ignore-case",
    };
    // --recursivee before --recursive; ls, then grep, find, cp/mv/rm
    r.rewrites = {
        {"--hidden", "-a"},
        {"--all", "-a"},
        {"--long", "-l"},
        {"--list", "-l"},
        {"--detailed", "-la"},
        {"--recursivee", "-r"},
        {"--recursive", "-r"},
        {"--ignore-case", "-i"},
        {"--case-insensitive", "-i"},
        {"--name", "-name"},
        {"--type", "-type"},
        {"--force", "-f"},
    };
    return r;
}

std::vector<PlaceholderRule> default_placeholder_rules() {
    std::vector<PlaceholderRule> v;
    v.push_back({"path-to", std::regex(R"re(/path/to/)re")});
    v.push_back({"angle", std::regex(R"re(<[^<>\s]+>)re")});
    // only UPPER_CASE brackets/braces: [ -f x ] and ${VAR} stay legal
    v.push_back({"bracket", std::regex(R"re(\[[A-Z_][A-Z_]*\])re")});
    v.push_back({"brace", std::regex(R"re((?:^|[^$])(\{[A-Z_][A-Z_]*\}))re")});
    v.push_back({"your-file", std::regex(R"re(your_?file)re")});
    v.push_back({"example", std::regex(R"re(\bexample\.)re")});
    v.push_back({"filename", std::regex(R"re(\bfilename\b)re")});
    v.push_back({"dirname", std::regex(R"re(\bdirname\b)re")});
    return v;
}

static bool is_flag_start_boundary(char c) { return std::isspace((unsigned char)c) || c=='\'' || c=='"'; }
static bool is_flag_end_boundary(char c) {
    return std::isspace((unsigned char)c) || c=='=' || c=='\'' || c=='"' || c==';' || c=='|' || c=='&' || c=='>' || c=='<';
}

static std::size_t find_flag(const std::string& command, const std::string& flag, std::size_t from) {
    std::size_t pos = command.find(flag, from);
    while (pos != std::string::npos) {
        std::size_t end = pos + flag.size();
        bool start_ok = pos == 0 || is_flag_start_boundary(command[pos-1]);
        bool end_ok = end == command.size() || is_flag_end_boundary(command[end]);
        if (start_ok && end_ok) return pos;
        pos = command.find(flag, pos + 1);
    }
    return std::string::npos;
}

bool contains_flag(const std::string& command, const std::string& flag) {
    return !flag.empty() && find_flag(command, flag, 0) != std::string::npos;
}

std::string replace_flag(const std::string& command, const std::string& flag, const std::string& replacement) {
    if (flag.empty()) return command;
    std::string out; std::size_t last = 0;
    std::size_t pos = find_flag(command, flag, 0);
    while (pos != std::string::npos) {
        out.append(command, last, pos - last);
        out += replacement;
        last = pos + flag.size();
        pos = find_flag(command, flag, last);
    }
    out.append(command, last, std::string::npos);
    return out;
}

} // namespace cmdguard
