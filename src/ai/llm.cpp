#include <ai-cmdguard/ai/llm.hpp>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <optional>

namespace cmdguard::ai {

LLMConfig llm_config_from(const AppConfig& cfg) {
    LLMConfig lc;
    lc.provider = cfg.provider;
    lc.model = cfg.model;
    lc.endpoint = cfg.ollama_url;
    lc.stub_file = cfg.stub_file;
    lc.timeout_seconds = cfg.ai_timeout;
    return lc;
}

std::optional<LLMCompletion> StubLLMClient::complete(const std::string&) {
    if (!m_cfg.stub_file.empty()) {
        std::ifstream in(m_cfg.stub_file);
        if (in) {
            std::ostringstream oss; oss << in.rdbuf();
            std::string data = oss.str();
            if (!data.empty()) return LLMCompletion{data, "stub_file"};
        }
    }
    return LLMCompletion{"Command: (none)\n\nNo language model configured. Set provider=ollama in ~/.ai-cmdguardrc.", "stub_plain"};
}

std::unique_ptr<LLMClient> make_llm(const LLMConfig& cfg) {
    if (cfg.provider == "ollama") return std::make_unique<OllamaLLMClient>(cfg);
    return std::make_unique<StubLLMClient>(cfg);
}

std::string json_escape(const std::string& in) {
    std::string out; out.reserve(in.size()+16);
    for (char c : in) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if ((unsigned char)c < 0x20) { char buf[8]; std::snprintf(buf, sizeof(buf), "\\u%04x", (unsigned)(unsigned char)c); out += buf; }
                else out.push_back(c);
        }
    }
    return out;
}

static void append_utf8(std::string& out, unsigned cp) {
    if (cp < 0x80) out.push_back(static_cast<char>(cp));
    else if (cp < 0x800) { out.push_back(static_cast<char>(0xC0 | (cp >> 6))); out.push_back(static_cast<char>(0x80 | (cp & 0x3F))); }
    else { out.push_back(static_cast<char>(0xE0 | (cp >> 12))); out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F))); out.push_back(static_cast<char>(0x80 | (cp & 0x3F))); }
}

std::optional<std::string> json_string_field(const std::string& json, const std::string& key) {
    size_t pos = json.find("\"" + key + "\""); if (pos == std::string::npos) return std::nullopt;
    pos = json.find(':', pos); if (pos == std::string::npos) return std::nullopt;
    ++pos; while (pos < json.size() && (json[pos]==' ' || json[pos]=='\t' || json[pos]=='\n')) ++pos;
    if (pos >= json.size() || json[pos] != '"') return std::nullopt;
    ++pos;
    std::string text; bool esc = false;
    for (size_t i=pos;i<json.size();++i) {
        char c = json[i];
        if (esc) {
            esc = false;
            switch (c) {
                case 'n': text += '\n'; break;
                case 'r': text += '\r'; break;
                case 't': text += '\t'; break;
                case 'u':
                    if (i + 4 < json.size()) {
                        unsigned cp = 0;
                        std::istringstream hex(json.substr(i+1, 4)); hex >> std::hex >> cp;
                        if (!hex.fail()) { append_utf8(text, cp); i += 4; break; }
                    }
                    text += 'u'; break;
                default: text.push_back(c);
            }
            continue;
        }
        if (c == '\\') { esc = true; continue; }
        if (c == '"') return text;
        text.push_back(c);
    }
    return std::nullopt; // unterminated string
}

} // namespace cmdguard::ai
