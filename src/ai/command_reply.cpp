#include <ai-cmdguard/ai/command_reply.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>

namespace cmdguard::ai {

static std::string trim(const std::string& s){ size_t a=0; while(a<s.size() && std::isspace((unsigned char)s[a])) ++a; size_t b=s.size(); while(b>a && std::isspace((unsigned char)s[b-1])) --b; return s.substr(a,b-a); }
static std::string first_line(const std::string& s){ auto nl=s.find('\n'); return nl==std::string::npos ? s : s.substr(0,nl); }

static bool looks_like_shell_command(const std::string& cmd) {
    static const std::array<const char*, 35> kCommon = {
        "ls","find","mkdir","cat","grep","cp","mv","rm","chmod","ps","kill","git","ping","curl","wget",
        "df","du","free","top","htop","whoami","hostname","uptime","uname","which","echo","touch",
        "head","tail","wc","sort","uniq","awk","sed","test"
    };
    std::istringstream iss(cmd); std::string first; iss >> first;
    return std::any_of(kCommon.begin(), kCommon.end(), [&](const char* c){ return first == c; });
}

std::string build_command_prompt(const std::string& request, const std::string& shell) {
    std::ostringstream p;
    p << "You are a shell command assistant for " << (shell.empty() ? "sh" : shell) << ".\n"
      << "Answer the request with exactly one command line.\n\n"
      << "REQUIRED FORMAT:\n"
      << "- Start with \"Command: \" followed by the command on the same line\n"
      << "- For multiple operations, use shell operators (&&, ||, |) in ONE command line\n"
      << "- For non-executable requests, use \"Command: (none)\" followed by explanation\n"
      << "- Use real flags only and never leave placeholders such as <file> or /path/to/\n"
      << "- Quote paths with spaces or special characters\n"
      << "- To check whether a file exists use: test -f FILE && echo 'exists' || echo 'not found'\n"
      << "- After the command line leave an empty line and give a short explanation\n\n"
      << "Request: " << request << "\n";
    return p.str();
}

std::optional<std::string> extract_command(const std::string& response) {
    // 1. "Command: " prefix
    if (auto start = response.find("Command: "); start != std::string::npos) {
        std::string cmd = trim(first_line(response.substr(start + 9)));
        if (cmd == "(none)") return std::nullopt;
        if (!cmd.empty()) return cmd;
    }
    // 2. "Executing:" marker
    if (auto start = response.rfind("Executing:"); start != std::string::npos) {
        std::string cmd = trim(first_line(response.substr(start + 10)));
        auto strip = [](char c){ return c=='`' || c=='*' || c=='"' || c=='\''; };
        while (!cmd.empty() && strip(cmd.front())) cmd.erase(cmd.begin());
        while (!cmd.empty() && strip(cmd.back())) cmd.pop_back();
        if (!cmd.empty() && cmd != "(none)") return cmd;
    }
    // 3. single backticked line
    std::istringstream iss(response); std::string line;
    while (std::getline(iss, line)) {
        std::string t = trim(line);
        if (t.size() > 2 && t.front()=='`' && t.back()=='`' && t.rfind("```",0)!=0) {
            std::string cmd = t.substr(1, t.size()-2);
            if (cmd != "(none)" && looks_like_shell_command(cmd)) return cmd;
        }
    }
    // 4. exactly one short fenced block
    if (auto block = extract_code_block(response)) {
        long lines = std::count(block->begin(), block->end(), '\n') + 1;
        if (lines < 3 && *block != "(none)" && !block->empty()) return block;
    }
    return std::nullopt;
}

std::optional<std::string> extract_code_block(const std::string& response) {
    auto open = response.find("```"); if (open == std::string::npos) return std::nullopt;
    auto close = response.find("```", open + 3); if (close == std::string::npos) return std::nullopt;
    if (response.find("```", close + 3) != std::string::npos) return std::nullopt;
    std::string block = response.substr(open + 3, close - open - 3);
    if (auto nl = block.find('\n'); nl != std::string::npos) block = block.substr(nl + 1);
    return trim(block);
}

std::string extract_explanation(const std::string& response) {
    auto start = response.find("Command: ");
    if (start == std::string::npos) return trim(response);
    auto nl = response.find('\n', start);
    if (nl == std::string::npos) return {};
    return trim(response.substr(nl + 1));
}

} // namespace cmdguard::ai
