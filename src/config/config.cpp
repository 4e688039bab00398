/*
 * AI-CmdGuard Configuration loader
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <ai-cmdguard/config/config.hpp>
#include <ai-cmdguard/util/log.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <exception>

namespace cmdguard {

static std::string trim(const std::string& s){ size_t a=0; while(a<s.size() && std::isspace((unsigned char)s[a])) ++a; size_t b=s.size(); while(b>a && std::isspace((unsigned char)s[b-1])) --b; return s.substr(a,b-a); }
static std::string lower(std::string s){ std::transform(s.begin(),s.end(),s.begin(),[](unsigned char c){ return std::tolower(c); }); return s; }

std::optional<SafetyLevel> parse_safety_level(const std::string& s) {
    std::string v = lower(trim(s));
    if (v == "low") return SafetyLevel::Low;
    if (v == "medium") return SafetyLevel::Medium;
    if (v == "high") return SafetyLevel::High;
    return std::nullopt;
}

const char* to_string(SafetyLevel level) {
    switch (level) {
        case SafetyLevel::Low: return "low";
        case SafetyLevel::Medium: return "medium";
        case SafetyLevel::High: return "high";
    }
    return "medium";
}

bool parse_bool(const std::string& value) {
    std::string v = lower(trim(value));
    return v=="1" || v=="true" || v=="on" || v=="yes";
}

std::string default_config_path() {
    if (const char* p = std::getenv("AI_CMDGUARD_CONFIG"); p && *p) return p;
    const char* home = std::getenv("HOME");
    if (!home || !*home) return {};
    return std::string(home) + "/.ai-cmdguardrc";
}

bool load_config_file(const std::string& path, AppConfig& cfg) {
    std::ifstream in(path); if (!in) return false;
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0]=='#') continue;
        auto eq = line.find('='); if (eq == std::string::npos) continue;
        auto key = trim(line.substr(0, eq)); auto val = trim(line.substr(eq + 1));
        if (key=="provider") cfg.provider = val;
        else if (key=="model") cfg.model = val;
        else if (key=="ollama_url") cfg.ollama_url = val;
        else if (key=="stub_file") cfg.stub_file = val;
        else if (key=="debug") cfg.debug = parse_bool(val);
        else if (key=="auto_execute") cfg.exec.auto_execute = parse_bool(val);
        else if (key=="dry_run") cfg.exec.dry_run = parse_bool(val);
        else if (key=="safety_level") {
            if (auto lvl = parse_safety_level(val)) cfg.exec.safety_level = *lvl;
            else log::warn("Unknown safety_level '" + val + "', keeping " + to_string(cfg.exec.safety_level));
        }
        else if (key=="ai_timeout") {
            try { cfg.ai_timeout = std::stoi(val); }
            catch (const std::exception&) { log::warn("Invalid ai_timeout '" + val + "'"); cfg.ai_timeout = 0; }
        }
        else log::debug("Ignoring unknown config key '" + key + "'");
    }
    return true;
}

std::optional<std::string> validate_config(const AppConfig& cfg) {
    if (cfg.ai_timeout < 1) return std::string("ai_timeout must be greater than 0");
    if (cfg.ai_timeout > 600) return std::string("ai_timeout cannot exceed 600 seconds");
    if (cfg.ollama_url.rfind("http://",0)!=0 && cfg.ollama_url.rfind("https://",0)!=0)
        return std::string("ollama_url must start with http:// or https://");
    if (trim(cfg.model).empty()) return std::string("model name cannot be empty");
    return std::nullopt;
}

AppConfig load_config(const std::string& path) {
    AppConfig cfg;
    std::string p = path.empty() ? default_config_path() : path;
    if (p.empty()) return cfg;
    if (!load_config_file(p, cfg)) {
        // an explicit path that cannot be read deserves a warning, a missing default does not
        if (!path.empty()) log::warn("Cannot read config file " + p + ", using defaults");
        return cfg;
    }
    log::debug("Loaded config from " + p);
    if (auto err = validate_config(cfg)) {
        log::warn("Invalid configuration detected: " + *err + ". Using safe defaults.");
        return AppConfig{};
    }
    return cfg;
}

} // namespace cmdguard
