#pragma once
#include <string>
#include <optional>
#include <memory>
#include "ai-cmdguard/config/config.hpp"

namespace cmdguard::ai {

struct LLMConfig {
    std::string provider = "stub";   // ollama | stub
    std::string model;               // model id
    std::string endpoint;            // base URL of the server (ollama)
    std::string stub_file;           // local file with a canned reply (offline)
    int timeout_seconds = 120;       // network timeout
};

LLMConfig llm_config_from(const AppConfig& cfg);

// Response from LLM completion.
struct LLMCompletion {
    std::string text;                // raw model text
    std::string source;              // stub_file|stub_plain|ollama|error
};

class LLMClient {
public:
    virtual ~LLMClient() = default;
    virtual std::optional<LLMCompletion> complete(const std::string& prompt) = 0;
};

// Stub implementation: if stub_file is set returns its contents; otherwise a
// "Command: (none)" reply explaining that no model is configured.
class StubLLMClient : public LLMClient {
public:
    explicit StubLLMClient(const LLMConfig& cfg) : m_cfg(cfg) {}
    std::optional<LLMCompletion> complete(const std::string& prompt) override;
private:
    LLMConfig m_cfg;
};

// Ollama client (POST <endpoint>/api/generate, non streaming). Richiede libcurl.
class OllamaLLMClient : public LLMClient {
public:
    explicit OllamaLLMClient(const LLMConfig& cfg) : m_cfg(cfg) {}
    std::optional<LLMCompletion> complete(const std::string& prompt) override;
private:
    LLMConfig m_cfg;
};

// "ollama" -> OllamaLLMClient, anything else -> StubLLMClient
std::unique_ptr<LLMClient> make_llm(const LLMConfig& cfg);

// JSON helpers shared by the HTTP clients
std::string json_escape(const std::string& in);
// Value of the first "key":"..." string field, unescaped; nothing when absent
std::optional<std::string> json_string_field(const std::string& json, const std::string& key);

} // namespace cmdguard::ai
