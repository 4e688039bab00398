/*
 * AI-CmdGuard Sensitive Pattern Table
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <ai-cmdguard/safety/sensitive_pattern.hpp>

namespace cmdguard {

namespace {

SensitivePattern make(const char* re, Severity sev, const char* desc, const char* suggestion) {
    return SensitivePattern{std::regex(re), sev, desc, suggestion ? std::optional<std::string>(suggestion) : std::nullopt};
}

} // namespace

std::vector<SensitivePattern> default_sensitive_patterns() {
    std::vector<SensitivePattern> t;
    t.reserve(16);
    // Fork bombs
    t.push_back(make(R"re(:\(\)\s*\{.*:\s*\|.*:\s*&.*\}.*:)re", Severity::Blocked,
        "Fork bomb detected - this will consume all system resources", "Fork bombs are never safe to execute"));
    t.push_back(make(R"re(bomb\(\)\s*\{.*bomb.*\|.*bomb.*&.*\}.*bomb)re", Severity::Blocked,
        "Fork bomb pattern detected", "This pattern creates infinite processes"));
    // Pipe-to-shell
    t.push_back(make(R"re((curl|wget|fetch)\s+[^|]*\|\s*(sh|bash|zsh|fish))re", Severity::Dangerous,
        "Pipe-to-shell detected - executing remote code", "Download and inspect the script before executing"));
    t.push_back(make(R"re((curl|wget|fetch).*-s.*\|\s*(sh|bash|zsh|fish))re", Severity::Dangerous,
        "Silent download piped to shell - very dangerous", "Remove -s flag and inspect the script first"));
    // rm: the exact root wipe first, then the broader family
    t.push_back(make(R"re(rm\s+-rf\s+/\s*$)re", Severity::Blocked,
        "rm -rf / will destroy your entire system", "This command is never safe"));
    t.push_back(make(R"re(rm\s+(-[rf]*\s+)*(/|\*|~|\$HOME))re", Severity::Dangerous,
        "Dangerous rm command on system/home directories", "Be very careful with recursive deletions"));
    // Permissions and ownership
    t.push_back(make(R"re(chmod\s+777)re", Severity::Warning,
        "chmod 777 makes files world-writable (security risk)", "Use more restrictive permissions like 755 or 644"));
    t.push_back(make(R"re(chmod\s+-R\s+777)re", Severity::Dangerous,
        "Recursive chmod 777 is a major security risk", "Use specific permissions for specific files"));
    t.push_back(make(R"re(chown\s+-R\s+[^/]*\s+/)re", Severity::Dangerous,
        "Recursive chown on system directory", "Be very careful changing ownership of system files"));
    // Disk level
    t.push_back(make(R"re(dd\s+.*of=/dev/)re", Severity::Dangerous,
        "dd command writing to device - can destroy data", "Double-check the output device path"));
    t.push_back(make(R"re(dd\s+.*if=/dev/zero.*of=)re", Severity::Dangerous,
        "dd command overwriting with zeros - will destroy data", "Ensure you have the correct output path"));
    t.push_back(make(R"re(mkfs\.)re", Severity::Dangerous,
        "mkfs command creates new filesystem, destroying existing data", "Backup data before creating new filesystem"));
    t.push_back(make(R"re(fdisk\s+)re", Severity::Dangerous,
        "fdisk modifies disk partitions", "Backup partition table before making changes"));
    t.push_back(make(R"re(>\s*/dev/(sd[a-z]|nvme[0-9]))re", Severity::Dangerous,
        "Writing directly to disk device", "This can destroy data on the disk"));
    t.push_back(make(R"re(cat\s+.*>\s*/dev/(sd[a-z]|nvme[0-9]))re", Severity::Dangerous,
        "Writing file content directly to disk device", "This will overwrite disk data"));
    return t;
}

std::vector<std::regex> default_fork_bomb_patterns() {
    return {
        std::regex(R"re(:\(\)\s*\{.*:\s*\|.*:\s*&.*\}.*:)re"),
        std::regex(R"re(:\(\)\{.*\|\s*:\s*&.*\})re"),
        std::regex(R"re(bomb\(\)\s*\{.*bomb.*\|.*bomb.*&.*\})re"),
        // any name(){ ... | ... & }
        std::regex(R"re(\w+\(\)\s*\{.*\w+.*\|.*\w+.*&.*\})re"),
    };
}

std::vector<std::regex> default_pipe_to_shell_patterns() {
    return {
        std::regex(R"re((curl|wget|fetch)\s+[^|]*\|\s*(sh|bash|zsh|fish))re"),
        std::regex(R"re((curl|wget|fetch).*\|\s*(sh|bash|zsh|fish))re"),
        std::regex(R"re((curl|wget)\s+-[sL]*\s+[^|]*\|\s*(sh|bash))re"),
        std::regex(R"re((curl|wget).*-o\s*-.*\|\s*(sh|bash))re"),
    };
}

} // namespace cmdguard
